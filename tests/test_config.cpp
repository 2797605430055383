// Tests for configuration parsing and environment overrides.
#include "config.hpp"

#include <cstdio>
#include <fstream>
#include <map>
#include <string>

#include <gtest/gtest.h>

using namespace std::chrono_literals;

namespace
{

utils::env_lookup make_env(std::map<std::string, std::string> values)
{
    return [values = std::move(values)](const char* name) -> const char* {
        auto it = values.find(name);
        return it == values.end() ? nullptr : it->second.c_str();
    };
}

} // namespace

TEST(ConfigTest, EmptyDocumentYieldsDefaults) {
    const utils::relay_config config = utils::parse_config(json::object());

    EXPECT_TRUE(config.chromecast.ip.empty());
    EXPECT_EQ(config.chromecast.port, 8009);
    EXPECT_TRUE(config.chromecast.enabled);
    EXPECT_EQ(config.lms.port, 9000);
    EXPECT_EQ(config.timing.poll_interval, 2000ms);
    EXPECT_EQ(config.timing.pause_timeout, 5000ms);
    EXPECT_EQ(config.timing.heartbeat_interval, 5000ms);
    EXPECT_EQ(config.timing.launch_timeout, 10000ms);
    EXPECT_EQ(config.timing.http_timeout, 5000ms);
    EXPECT_EQ(config.artwork.ttl, 6h);
    EXPECT_EQ(config.artwork.max_images, 10u);
    EXPECT_EQ(config.log_level, "info");
}

TEST(ConfigTest, ReadsAllSections) {
    const json doc = json::parse(R"({
        "chromecast": {"ip": "192.168.0.50", "name": "Living Room TV", "enabled": false},
        "lms": {"host": "192.168.0.19", "port": 9002},
        "player": {"id": "00:04:20:12:34:56", "name": "Kitchen"},
        "receiver": {"app_id": "ABCD1234", "namespace": "urn:x-cast:org.example.np", "url": "http://x/r.html"},
        "timing": {"poll_interval_ms": 1000, "pause_timeout_ms": 8000},
        "artwork": {"ttl_hours": 12, "max_images": 4, "fanart_key": "secret"},
        "ssl": {"cert": "/etc/lms_cast/cert.pem", "key": "/etc/lms_cast/key.pem"},
        "control_port": 8080,
        "log_level": "debug"
    })");

    const utils::relay_config config = utils::parse_config(doc);

    EXPECT_EQ(config.chromecast.ip, "192.168.0.50");
    EXPECT_EQ(config.chromecast.name, "Living Room TV");
    EXPECT_FALSE(config.chromecast.enabled);
    EXPECT_EQ(config.lms.host, "192.168.0.19");
    EXPECT_EQ(config.lms.port, 9002);
    EXPECT_EQ(config.player.id, "00:04:20:12:34:56");
    EXPECT_EQ(config.receiver.app_id, "ABCD1234");
    EXPECT_EQ(config.receiver.nspace, "urn:x-cast:org.example.np");
    EXPECT_EQ(config.timing.poll_interval, 1000ms);
    EXPECT_EQ(config.timing.pause_timeout, 8000ms);
    EXPECT_EQ(config.artwork.ttl, 12h);
    EXPECT_EQ(config.artwork.max_images, 4u);
    EXPECT_EQ(config.artwork.fanart_key, "secret");
    EXPECT_EQ(config.ssl.key, "/etc/lms_cast/key.pem");
    EXPECT_EQ(config.control_port, 8080);
    EXPECT_EQ(config.log_level, "debug");
}

TEST(ConfigTest, RejectsInvalidValues) {
    EXPECT_THROW(utils::parse_config(json::array()), utils::config_error);
    EXPECT_THROW(utils::parse_config(json {{"lms", {{"port", 0}}}}), utils::config_error);
    EXPECT_THROW(utils::parse_config(json {{"lms", {{"port", 70000}}}}), utils::config_error);
    EXPECT_THROW(utils::parse_config(json {{"lms", {{"port", "9000"}}}}), utils::config_error);
    EXPECT_THROW(utils::parse_config(json {{"lms", "192.168.0.19"}}), utils::config_error);
    EXPECT_THROW(utils::parse_config(json {{"timing", {{"pause_timeout_ms", -1}}}}), utils::config_error);
    EXPECT_THROW(utils::parse_config(json {{"receiver", {{"namespace", "com.example"}}}}), utils::config_error);
    EXPECT_THROW(utils::parse_config(json {{"log_level", "verbose"}}), utils::config_error);
}

TEST(ConfigTest, EnvironmentOverridesFile) {
    utils::relay_config config = utils::parse_config(json {{"lms", {{"host", "192.168.0.19"}}}});

    utils::apply_env_overrides(config, make_env({
        {"LMS_HOST", "10.0.0.7"},
        {"LMS_PORT", "9100"},
        {"CHROMECAST_IP", "10.0.0.50"},
        {"PAUSE_TIMEOUT", "3000"},
        {"CONTROL_PORT", "8081"}
    }));

    EXPECT_EQ(config.lms.host, "10.0.0.7");
    EXPECT_EQ(config.lms.port, 9100);
    EXPECT_EQ(config.chromecast.ip, "10.0.0.50");
    EXPECT_EQ(config.timing.pause_timeout, 3000ms);
    EXPECT_EQ(config.control_port, 8081);
}

TEST(ConfigTest, EmptyEnvironmentValuesAreIgnored) {
    utils::relay_config config;

    utils::apply_env_overrides(config, make_env({{"LMS_HOST", ""}}));

    EXPECT_EQ(config.lms.host, "localhost");
}

TEST(ConfigTest, RejectsInvalidEnvironmentValues) {
    utils::relay_config config;

    EXPECT_THROW(utils::apply_env_overrides(config, make_env({{"LMS_PORT", "90a"}})), utils::config_error);
    EXPECT_THROW(utils::apply_env_overrides(config, make_env({{"PAUSE_TIMEOUT", "0"}})), utils::config_error);
}

TEST(ConfigTest, ParsesPorts) {
    EXPECT_EQ(utils::parse_port("9000"), 9000);
    EXPECT_EQ(utils::parse_port("65535"), 65535);
    EXPECT_THROW(utils::parse_port("0"), utils::config_error);
    EXPECT_THROW(utils::parse_port("65536"), utils::config_error);
    EXPECT_THROW(utils::parse_port(""), utils::config_error);
    EXPECT_THROW(utils::parse_port("-1"), utils::config_error);
}

TEST(ConfigTest, MissingFileYieldsDefaults) {
    const utils::relay_config config = utils::load_config("/nonexistent/lms_cast.json");

    EXPECT_EQ(config.lms.port, 9000);
}

TEST(ConfigTest, MalformedFileThrows) {
    const std::string path = ::testing::TempDir() + "lms_cast_malformed.json";
    {
        std::ofstream out {path};
        out << "{\"lms\": {";
    }

    EXPECT_THROW(utils::load_config(path), utils::config_error);
    std::remove(path.c_str());
}
