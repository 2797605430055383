#ifndef LMS_CAST_LOG_HPP
#define LMS_CAST_LOG_HPP

#include <atomic>
#include <cstdio>
#include <string_view>
#include <utility>

#include <fmt/format.h>

namespace utils::log
{

enum class level
{
    debug,
    info,
    warn,
    error
};

level current_level();

void set_level(level lvl);

// Accepts "debug", "info", "warn" or "error"; throws std::invalid_argument otherwise
level parse_level(std::string_view name);

namespace detail
{

void write(level lvl, std::string_view line);

} // namespace detail

template<typename... Args>
void debug(std::string_view format, Args&&... args)
{
    if(current_level() <= level::debug)
        detail::write(level::debug, fmt::format(fmt::runtime(format), std::forward<Args>(args)...));
}

template<typename... Args>
void info(std::string_view format, Args&&... args)
{
    if(current_level() <= level::info)
        detail::write(level::info, fmt::format(fmt::runtime(format), std::forward<Args>(args)...));
}

template<typename... Args>
void warn(std::string_view format, Args&&... args)
{
    if(current_level() <= level::warn)
        detail::write(level::warn, fmt::format(fmt::runtime(format), std::forward<Args>(args)...));
}

template<typename... Args>
void error(std::string_view format, Args&&... args)
{
    detail::write(level::error, fmt::format(fmt::runtime(format), std::forward<Args>(args)...));
}

} // namespace utils::log

#endif
