#include "artist_images.hpp"

#include <algorithm>
#include <cctype>
#include <initializer_list>
#include <unordered_set>

#include "log.hpp"
#include "utils.hpp"

namespace artwork
{

static void append_string(const json& obj, const char* key, std::vector<std::string>& dest)
{
    if(obj.contains(key) && obj[key].is_string() && !obj[key].get_ref<const std::string&>().empty())
        dest.push_back(obj[key].get<std::string>());
}

static json get_json(const http::client& client, const std::string& location)
{
    http::response res = client.get(location);
    if(res.get_code() != 200)
        throw http::http_error {"Status " + std::to_string(res.get_code()) + " from " + location};
    return json::parse(res.get_body());
}

std::vector<std::string> parse_audiodb(const json& answer)
{
    std::vector<std::string> images;
    if(!answer.is_object() || !answer.contains("artists") || !answer["artists"].is_array() || answer["artists"].empty())
        return images;

    const json& artist = answer["artists"][0];
    if(!artist.is_object())
        return images;

    // Backgrounds first, portraits are a fallback for the receiver layout
    for(const char* key : {"strArtistFanart", "strArtistFanart2", "strArtistFanart3", "strArtistFanart4",
        "strArtistWideThumb", "strArtistThumb"})
        append_string(artist, key, images);

    return images;
}

std::vector<std::string> parse_deezer(const json& answer)
{
    std::vector<std::string> images;
    if(!answer.is_object() || !answer.contains("data") || !answer["data"].is_array() || answer["data"].empty())
        return images;

    const json& artist = answer["data"][0];
    if(artist.is_object())
    {
        append_string(artist, "picture_xl", images);
        if(images.empty())
            append_string(artist, "picture_big", images);
    }

    return images;
}

std::string parse_musicbrainz_id(const json& answer)
{
    if(!answer.is_object() || !answer.contains("artists") || !answer["artists"].is_array() || answer["artists"].empty())
        return {};

    const json& artist = answer["artists"][0];
    return artist.is_object() ? artist.value("id", "") : std::string {};
}

std::vector<std::string> parse_fanart(const json& answer)
{
    std::vector<std::string> images;
    if(!answer.is_object())
        return images;

    for(const char* section : {"artistbackground", "artistthumb"})
    {
        if(!answer.contains(section) || !answer[section].is_array())
            continue;
        for(const auto& item : answer[section])
        {
            if(item.is_object())
                append_string(item, "url", images);
        }
    }

    return images;
}

std::vector<std::string> merge_images(const std::vector<std::vector<std::string>>& lists, size_t cap)
{
    std::vector<std::string> merged;
    std::unordered_set<std::string> seen;
    for(const auto& list : lists)
    {
        for(const auto& image : list)
        {
            if(merged.size() >= cap)
                return merged;
            if(seen.insert(image).second)
                merged.push_back(image);
        }
    }
    return merged;
}

std::vector<std::string> audiodb_provider::lookup(const std::string& artist) const
{
    return parse_audiodb(get_json(m_client, "https://www.theaudiodb.com/api/v1/json/" + m_api_key +
        "/search.php?s=" + utils::url_encode(artist)));
}

std::vector<std::string> deezer_provider::lookup(const std::string& artist) const
{
    return parse_deezer(get_json(m_client, "https://api.deezer.com/search/artist?limit=1&q=" + utils::url_encode(artist)));
}

std::vector<std::string> fanart_provider::lookup(const std::string& artist) const
{
    if(m_api_key.empty())
        return {};

    std::string mbid = parse_musicbrainz_id(get_json(m_client,
        "https://musicbrainz.org/ws/2/artist/?fmt=json&limit=1&query=" + utils::url_encode("artist:\"" + artist + "\"")));
    if(mbid.empty())
        return {};

    return parse_fanart(get_json(m_client, "https://webservice.fanart.tv/v3/music/" + mbid + "?api_key=" + m_api_key));
}

artist_image_cache::artist_image_cache(utils::scheduler& sched, std::vector<std::unique_ptr<image_provider>> providers,
    cache_options options)
    : m_scheduler {sched},
      m_providers {std::make_shared<const std::vector<std::unique_ptr<image_provider>>>(std::move(providers))},
      m_options {options}
{}

std::string artist_image_cache::make_key(const std::string& artist)
{
    size_t begin = artist.find_first_not_of(" \t");
    size_t end = artist.find_last_not_of(" \t");
    if(begin == std::string::npos)
        return {};

    std::string key = artist.substr(begin, end - begin + 1);
    std::transform(key.begin(), key.end(), key.begin(), [](unsigned char c)
    {
        return std::tolower(c);
    });
    return key;
}

std::optional<std::vector<std::string>> artist_image_cache::peek(const std::string& artist) const
{
    auto it = m_entries.find(make_key(artist));
    if(it == m_entries.end() || it->second.loading || it->second.expires <= m_scheduler.now())
        return std::nullopt;
    return it->second.images;
}

void artist_image_cache::get(const std::string& artist, images_callback done)
{
    const std::string key = make_key(artist);
    if(key.empty())
    {
        done({});
        return;
    }

    if(m_entries.find(key) == m_entries.end())
        prune();

    entry& e = m_entries[key];
    if(e.loading)
    {
        e.waiters.push_back(std::move(done));
        return;
    }
    if(e.expires > m_scheduler.now())
    {
        done(e.images);
        return;
    }

    e.loading = true;
    e.waiters.push_back(std::move(done));

    const std::string name = artist;
    const size_t cap = m_options.max_images;
    m_scheduler.offload([this, key, name, cap, providers = m_providers]()
    {
        std::vector<std::vector<std::string>> results;
        size_t failures = 0;
        for(const auto& provider : *providers)
        {
            try {
                results.push_back(provider->lookup(name));
            } catch(const std::exception& e) {
                utils::log::warn("[Artwork] {} lookup for '{}' failed: {}", provider->name(), name, e.what());
                results.emplace_back();
                ++failures;
            }
        }

        auto images = merge_images(results, cap);
        const bool failed = !providers->empty() && failures == providers->size();
        m_scheduler.post([this, key, images = std::move(images), failed]() mutable
        {
            this->finish(key, std::move(images), failed);
        });
    });
}

void artist_image_cache::prune()
{
    const auto now = m_scheduler.now();
    for(auto it = m_entries.begin(); it != m_entries.end(); )
    {
        if(!it->second.loading && it->second.expires <= now)
            it = m_entries.erase(it);
        else
            ++it;
    }
}

void artist_image_cache::finish(const std::string& key, std::vector<std::string> images, bool failed)
{
    auto it = m_entries.find(key);
    if(it == m_entries.end())
        return;

    utils::log::debug("[Artwork] {} image(s) for '{}'", images.size(), key);

    entry& e = it->second;
    e.loading = false;
    e.images = std::move(images);
    e.expires = m_scheduler.now() + (failed ? m_options.failure_ttl : m_options.ttl);

    std::vector<images_callback> waiters;
    waiters.swap(e.waiters);
    const std::vector<std::string> result = e.images;
    for(auto& waiter : waiters)
        waiter(result);
}

} // namespace artwork
