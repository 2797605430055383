#include "now_playing.hpp"

#include <cmath>

namespace relay
{

const char* display_state(lms::transport_mode mode)
{
    switch(mode)
    {
        case lms::transport_mode::play:
            return "playing";
        case lms::transport_mode::pause:
            return "paused";
        case lms::transport_mode::stop:
            return "stopped";
    }
    return "stopped";
}

std::string resolve_artwork_url(const lms::track_info& track, const lms::server_address& server)
{
    if(!track.artwork_url.empty())
    {
        if(track.artwork_url.rfind("http://", 0) == 0 || track.artwork_url.rfind("https://", 0) == 0)
            return track.artwork_url;
        if(track.artwork_url.front() == '/')
            return server.base_url() + track.artwork_url;
        return server.base_url() + "/" + track.artwork_url;
    }

    if(!track.artwork_track_id.empty())
        return server.base_url() + "/music/" + track.artwork_track_id + "/cover.jpg";

    if(!track.coverid.empty())
        return server.base_url() + "/music/" + track.coverid + "/cover.jpg";

    return {};
}

std::optional<json> build_now_playing(const lms::playback_snapshot& snapshot,
    const std::vector<std::string>& artist_images, const lms::server_address& server)
{
    if(!snapshot.current)
        return std::nullopt;

    const lms::track_info& track = *snapshot.current;

    std::string one_line = track.title;
    if(!track.artist.empty())
        one_line += " - " + track.artist;

    json image_keys = json::array();
    if(!track.coverid.empty())
        image_keys.push_back(track.coverid);

    std::string image_url = resolve_artwork_url(track, server);

    json payload {
        {"state", display_state(snapshot.mode)},
        {"seek_position", static_cast<int64_t>(std::floor(snapshot.elapsed))},
        {"output", {
            {"volume", {
                {"type", "number"},
                {"min", 0},
                {"max", 100},
                {"value", snapshot.volume},
                {"is_muted", snapshot.muted}
            }}
        }},
        {"now_playing", {
            {"one_line", {{"line1", one_line}}},
            {"two_line", {{"line1", track.title}, {"line2", track.artist}}},
            {"three_line", {{"line1", track.title}, {"line2", track.artist}, {"line3", track.album}}},
            {"length", static_cast<int64_t>(std::lround(track.duration))},
            {"image_keys", image_keys}
        }},
        {"image_url", image_url.empty() ? json(nullptr) : json(image_url)},
        {"image_data", nullptr},
        {"artist_images", artist_images}
    };

    return json {{"type", "NOW_PLAYING"}, {"payload", std::move(payload)}};
}

json make_pause_notice()
{
    return json {{"type", "PAUSE"}, {"payload", json::object()}};
}

} // namespace relay
