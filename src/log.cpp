#include "log.hpp"

#include <mutex>
#include <stdexcept>
#include <string>

namespace utils::log
{

static std::atomic<level> g_level {level::info};

static std::mutex g_write_mutex;

level current_level()
{
    return g_level.load();
}

void set_level(level lvl)
{
    g_level.store(lvl);
}

level parse_level(std::string_view name)
{
    if(name == "debug")
        return level::debug;
    if(name == "info")
        return level::info;
    if(name == "warn")
        return level::warn;
    if(name == "error")
        return level::error;

    throw std::invalid_argument {"Unknown log level: " + std::string {name}};
}

void detail::write(level lvl, std::string_view line)
{
    std::lock_guard<std::mutex> lock {g_write_mutex};
    switch(lvl)
    {
        case level::debug:
            fmt::print("[DEBUG] {}\n", line);
            break;
        case level::info:
            fmt::print("{}\n", line);
            break;
        case level::warn:
            fmt::print(stderr, "[WARN] {}\n", line);
            break;
        case level::error:
            fmt::print(stderr, "[ERROR] {}\n", line);
            break;
    }
    std::fflush(lvl >= level::warn ? stderr : stdout);
}

} // namespace utils::log
