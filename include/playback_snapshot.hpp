#ifndef LMS_PLAYBACK_SNAPSHOT_HPP
#define LMS_PLAYBACK_SNAPSHOT_HPP

#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json.hpp>

using nlohmann::json;

namespace lms
{

// Playback source unreachable or its answer is unusable
class upstream_unavailable : public std::runtime_error
{
public:
    using std::runtime_error::runtime_error;
};

enum class transport_mode
{
    play,
    pause,
    stop
};

const char* to_string(transport_mode mode);

// Unknown modes are treated as stop
transport_mode parse_mode(std::string_view mode);

struct server_address
{
    std::string host;
    uint16_t port = 9000;

    std::string base_url() const
    {
        return "http://" + host + ":" + std::to_string(port);
    }
};

struct track_info
{
    std::string title;
    std::string artist;
    std::string album;
    std::string coverid;
    std::string artwork_url;
    std::string artwork_track_id;
    double duration = 0.0;      // Seconds, 0 when unknown (radio streams)
};

// Normalized view of one player status answer
struct playback_snapshot
{
    transport_mode mode = transport_mode::stop;
    std::optional<track_info> current;  // Head of the queue
    size_t queue_length = 0;
    double elapsed = 0.0;
    int volume = 0;                     // 0 - 100
    bool muted = false;

    bool has_track() const
    {
        return current.has_value();
    }
};

struct player_info
{
    std::string id;
    std::string name;
    bool connected = true;
};

// Throws upstream_unavailable when result is not a status object
playback_snapshot parse_status(const json& result);

std::vector<player_info> parse_players(const json& result);

} // namespace lms

#endif
