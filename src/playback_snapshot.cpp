#include "playback_snapshot.hpp"

#include <algorithm>
#include <cmath>
#include <cstdlib>
#include <initializer_list>

namespace lms
{

const char* to_string(transport_mode mode)
{
    switch(mode)
    {
        case transport_mode::play:
            return "play";
        case transport_mode::pause:
            return "pause";
        case transport_mode::stop:
            return "stop";
    }
    return "stop";
}

transport_mode parse_mode(std::string_view mode)
{
    if(mode == "play")
        return transport_mode::play;
    if(mode == "pause")
        return transport_mode::pause;
    return transport_mode::stop;
}

// Numbers arrive as json numbers or as numeric strings depending on the server version.
// Non finite values count as missing.
static std::optional<double> as_number(const json& value)
{
    if(value.is_number())
    {
        double number = value.get<double>();
        if(std::isfinite(number))
            return number;
        return std::nullopt;
    }
    if(value.is_string())
    {
        const std::string& str = value.get_ref<const std::string&>();
        if(str.empty())
            return std::nullopt;
        char* end = nullptr;
        double parsed = std::strtod(str.c_str(), &end);
        if(end != nullptr && *end == '\0' && std::isfinite(parsed))
            return parsed;
        return std::nullopt;
    }
    if(value.is_boolean())
        return value.get<bool>() ? 1.0 : 0.0;
    return std::nullopt;
}

static std::string as_string(const json& obj, const char* key)
{
    if(!obj.contains(key))
        return {};
    const json& value = obj[key];
    if(value.is_string())
        return value.get<std::string>();
    if(value.is_number_integer())
        return std::to_string(value.get<int64_t>());
    return {};
}

static const json* first_of(const json& obj, std::initializer_list<const char*> aliases)
{
    for(const char* key : aliases)
    {
        if(obj.contains(key) && !obj[key].is_null())
            return &obj[key];
    }
    return nullptr;
}

// All field alias handling of the status answer lives here
static void resolve_mixer(const json& result, playback_snapshot& snapshot)
{
    snapshot.volume = 0;
    snapshot.muted = false;

    if(const json* volume = first_of(result, {"mixer volume", "mixer_volume", "volume"}))
    {
        if(auto level = as_number(*volume))
        {
            // Muted players report their level negated
            if(*level < 0)
                snapshot.muted = true;
            snapshot.volume = static_cast<int>(std::lround(std::clamp(std::fabs(*level), 0.0, 100.0)));
        }
    }

    if(const json* muting = first_of(result, {"mixer muting", "mixer_muting", "muting", "mute"}))
    {
        if(auto flag = as_number(*muting))
            snapshot.muted = snapshot.muted || *flag != 0.0;
    }
}

static track_info parse_track(const json& item)
{
    track_info track;
    track.title = as_string(item, "title");
    if(track.title.empty())
        track.title = "Unknown";

    track.artist = as_string(item, "artist");
    if(track.artist.empty())
        track.artist = as_string(item, "trackartist");
    if(track.artist.empty())
        track.artist = as_string(item, "albumartist");

    track.album = as_string(item, "album");
    track.coverid = as_string(item, "coverid");
    track.artwork_url = as_string(item, "artwork_url");
    track.artwork_track_id = as_string(item, "artwork_track_id");

    if(item.contains("duration"))
        track.duration = as_number(item["duration"]).value_or(0.0);

    return track;
}

playback_snapshot parse_status(const json& result)
{
    if(!result.is_object())
        throw upstream_unavailable {"Status answer is not an object"};

    if(result.contains("error"))
        throw upstream_unavailable {"Status answer reports an error: " + result["error"].dump()};

    playback_snapshot snapshot;
    snapshot.mode = parse_mode(as_string(result, "mode"));

    if(result.contains("time"))
        snapshot.elapsed = as_number(result["time"]).value_or(0.0);

    if(result.contains("playlist_loop") && result["playlist_loop"].is_array())
    {
        const json& queue = result["playlist_loop"];
        snapshot.queue_length = queue.size();
        if(!queue.empty() && queue[0].is_object())
            snapshot.current = parse_track(queue[0]);
    }

    if(snapshot.current && snapshot.current->duration <= 0.0 && result.contains("duration"))
        snapshot.current->duration = as_number(result["duration"]).value_or(0.0);

    resolve_mixer(result, snapshot);
    return snapshot;
}

std::vector<player_info> parse_players(const json& result)
{
    std::vector<player_info> players;
    if(!result.is_object() || !result.contains("players_loop") || !result["players_loop"].is_array())
        return players;

    for(const auto& entry : result["players_loop"])
    {
        if(!entry.is_object())
            continue;

        player_info player;
        player.id = as_string(entry, "playerid");
        if(player.id.empty())
            continue;
        player.name = as_string(entry, "name");
        if(entry.contains("connected"))
            player.connected = as_number(entry["connected"]).value_or(1.0) != 0.0;
        players.push_back(std::move(player));
    }

    return players;
}

} // namespace lms
