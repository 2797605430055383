#include "config.hpp"

#include <charconv>
#include <cstdlib>
#include <fstream>

#include <fmt/format.h>

#include "log.hpp"

namespace utils
{

static uint16_t to_port(int64_t value, const char* key)
{
    if(value < 1 || value > 65535)
        throw config_error {fmt::format("{} must be between 1 and 65535, got {}", key, value)};
    return static_cast<uint16_t>(value);
}

static int64_t to_positive(int64_t value, const char* key)
{
    if(value <= 0)
        throw config_error {fmt::format("{} must be positive, got {}", key, value)};
    return value;
}

template<typename T>
static void read_value(const json& section, const char* name, const char* key, T& out)
{
    if(!section.contains(name))
        return;

    try {
        out = section.at(name).get<T>();
    } catch(const json::exception& e) {
        throw config_error {fmt::format("Invalid value for {}: {}", key, e.what())};
    }
}

static const json& section(const json& doc, const char* name)
{
    static const json empty = json::object();
    if(!doc.contains(name))
        return empty;

    const json& sec = doc.at(name);
    if(!sec.is_object())
        throw config_error {fmt::format("{} has to be an object", name)};
    return sec;
}

uint16_t parse_port(const std::string& text)
{
    int64_t value = 0;
    const auto [end, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
    if(ec != std::errc {} || end != text.data() + text.size())
        throw config_error {fmt::format("Invalid port '{}'", text)};
    return to_port(value, "port");
}

relay_config parse_config(const json& doc)
{
    if(!doc.is_object())
        throw config_error {"Configuration has to be a JSON object"};

    relay_config config;
    int64_t number = 0;

    const json& cast = section(doc, "chromecast");
    read_value(cast, "ip", "chromecast.ip", config.chromecast.ip);
    read_value(cast, "name", "chromecast.name", config.chromecast.name);
    read_value(cast, "enabled", "chromecast.enabled", config.chromecast.enabled);
    number = config.chromecast.port;
    read_value(cast, "port", "chromecast.port", number);
    config.chromecast.port = to_port(number, "chromecast.port");

    const json& lms = section(doc, "lms");
    read_value(lms, "host", "lms.host", config.lms.host);
    number = config.lms.port;
    read_value(lms, "port", "lms.port", number);
    config.lms.port = to_port(number, "lms.port");
    if(config.lms.host.empty())
        throw config_error {"lms.host must not be empty"};

    const json& player = section(doc, "player");
    read_value(player, "id", "player.id", config.player.id);
    read_value(player, "name", "player.name", config.player.name);

    const json& receiver = section(doc, "receiver");
    read_value(receiver, "app_id", "receiver.app_id", config.receiver.app_id);
    read_value(receiver, "namespace", "receiver.namespace", config.receiver.nspace);
    read_value(receiver, "url", "receiver.url", config.receiver.url);
    if(config.receiver.app_id.empty())
        throw config_error {"receiver.app_id must not be empty"};
    if(config.receiver.nspace.rfind("urn:x-cast:", 0) != 0)
        throw config_error {"receiver.namespace has to start with urn:x-cast:"};

    const json& timing = section(doc, "timing");
    const auto read_ms = [&timing](const char* name, const char* key, std::chrono::milliseconds& out) {
        int64_t ms = out.count();
        read_value(timing, name, key, ms);
        out = std::chrono::milliseconds {to_positive(ms, key)};
    };
    read_ms("poll_interval_ms", "timing.poll_interval_ms", config.timing.poll_interval);
    read_ms("pause_timeout_ms", "timing.pause_timeout_ms", config.timing.pause_timeout);
    read_ms("heartbeat_interval_ms", "timing.heartbeat_interval_ms", config.timing.heartbeat_interval);
    read_ms("launch_timeout_ms", "timing.launch_timeout_ms", config.timing.launch_timeout);
    read_ms("http_timeout_ms", "timing.http_timeout_ms", config.timing.http_timeout);

    const json& artwork = section(doc, "artwork");
    number = config.artwork.ttl.count();
    read_value(artwork, "ttl_hours", "artwork.ttl_hours", number);
    config.artwork.ttl = std::chrono::hours {to_positive(number, "artwork.ttl_hours")};
    number = static_cast<int64_t>(config.artwork.max_images);
    read_value(artwork, "max_images", "artwork.max_images", number);
    config.artwork.max_images = static_cast<size_t>(to_positive(number, "artwork.max_images"));
    read_value(artwork, "audiodb_key", "artwork.audiodb_key", config.artwork.audiodb_key);
    read_value(artwork, "fanart_key", "artwork.fanart_key", config.artwork.fanart_key);

    const json& ssl = section(doc, "ssl");
    read_value(ssl, "cert", "ssl.cert", config.ssl.cert);
    read_value(ssl, "key", "ssl.key", config.ssl.key);

    number = config.control_port;
    read_value(doc, "control_port", "control_port", number);
    config.control_port = to_port(number, "control_port");

    read_value(doc, "log_level", "log_level", config.log_level);
    try {
        log::parse_level(config.log_level);
    } catch(const std::invalid_argument& e) {
        throw config_error {e.what()};
    }

    return config;
}

relay_config load_config(const std::string& path)
{
    std::ifstream ifs {path};
    if(!ifs.is_open())
    {
        log::info("No configuration at {}, using defaults", path);
        return relay_config {};
    }

    json doc;
    try {
        doc = json::parse(ifs);
    } catch(const json::parse_error& e) {
        throw config_error {fmt::format("Malformed configuration {}: {}", path, e.what())};
    }

    return parse_config(doc);
}

void apply_env_overrides(relay_config& config, const env_lookup& lookup)
{
    if(const char* host = lookup("LMS_HOST"); host && *host)
        config.lms.host = host;
    if(const char* port = lookup("LMS_PORT"); port && *port)
        config.lms.port = parse_port(port);
    if(const char* ip = lookup("CHROMECAST_IP"); ip && *ip)
        config.chromecast.ip = ip;
    if(const char* port = lookup("CONTROL_PORT"); port && *port)
        config.control_port = parse_port(port);
    if(const char* timeout = lookup("PAUSE_TIMEOUT"); timeout && *timeout)
    {
        const std::string text {timeout};
        int64_t ms = 0;
        const auto [end, ec] = std::from_chars(text.data(), text.data() + text.size(), ms);
        if(ec != std::errc {} || end != text.data() + text.size())
            throw config_error {fmt::format("Invalid PAUSE_TIMEOUT '{}'", text)};
        config.timing.pause_timeout = std::chrono::milliseconds {to_positive(ms, "PAUSE_TIMEOUT")};
    }
}

void apply_env_overrides(relay_config& config)
{
    apply_env_overrides(config, [](const char* name) -> const char* { return std::getenv(name); });
}

} // namespace utils
