#ifndef LMS_CAST_CONFIG_HPP
#define LMS_CAST_CONFIG_HPP

#include <chrono>
#include <cstdint>
#include <functional>
#include <stdexcept>
#include <string>

#include <nlohmann/json.hpp>

using nlohmann::json;

namespace utils
{

class config_error : public std::runtime_error
{
public:
    using std::runtime_error::runtime_error;
};

struct relay_config
{
    struct
    {
        std::string ip;
        uint16_t port = 8009;
        std::string name;
        bool enabled = true;
    } chromecast;

    struct
    {
        std::string host = "localhost";
        uint16_t port = 9000;
    } lms;

    struct
    {
        std::string id;
        std::string name;
    } player;

    struct
    {
        std::string app_id = "5C3F0A3C";
        std::string nspace = "urn:x-cast:com.lmscast.nowplaying";
        std::string url;
    } receiver;

    struct
    {
        std::chrono::milliseconds poll_interval {2000};
        std::chrono::milliseconds pause_timeout {5000};
        std::chrono::milliseconds heartbeat_interval {5000};
        std::chrono::milliseconds launch_timeout {10000};
        std::chrono::milliseconds http_timeout {5000};
    } timing;

    struct
    {
        std::chrono::hours ttl {6};
        size_t max_images = 10;
        std::string audiodb_key = "2";      // Free test key of TheAudioDB
        std::string fanart_key;
    } artwork;

    struct
    {
        std::string cert = "./cert.pem";
        std::string key = "./key.pem";
    } ssl;

    uint16_t control_port = 5770;

    std::string log_level = "info";
};

using env_lookup = std::function<const char*(const char*)>;

// Missing keys keep their defaults, throws config_error on invalid values
relay_config parse_config(const json& doc);

// A missing file yields the defaults, throws config_error if it can not be parsed
relay_config load_config(const std::string& path);

// LMS_HOST, LMS_PORT, CHROMECAST_IP, PAUSE_TIMEOUT and CONTROL_PORT
void apply_env_overrides(relay_config& config, const env_lookup& lookup);

void apply_env_overrides(relay_config& config);

// Throws config_error unless text is a number in [1, 65535]
uint16_t parse_port(const std::string& text);

} // namespace utils

#endif
