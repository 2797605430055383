#ifndef RELAY_NOW_PLAYING_HPP
#define RELAY_NOW_PLAYING_HPP

#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "playback_snapshot.hpp"

using nlohmann::json;

namespace relay
{

// "playing", "paused" or "stopped"
const char* display_state(lms::transport_mode mode);

// Artwork of the head track, empty when the track has none
std::string resolve_artwork_url(const lms::track_info& track, const lms::server_address& server);

// NOW_PLAYING message for the receiver app, nullopt when nothing is queued
std::optional<json> build_now_playing(const lms::playback_snapshot& snapshot,
    const std::vector<std::string>& artist_images, const lms::server_address& server);

json make_pause_notice();

} // namespace relay

#endif
