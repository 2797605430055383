#ifndef ARTWORK_ARTIST_IMAGES_HPP
#define ARTWORK_ARTIST_IMAGES_HPP

#include <chrono>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include <nlohmann/json.hpp>

#include "http/client.hpp"
#include "scheduler.hpp"

using nlohmann::json;

namespace artwork
{

class image_provider
{
public:
    virtual ~image_provider() = default;

    virtual const char* name() const = 0;

    // Blocking lookup of background images for an artist, may throw
    virtual std::vector<std::string> lookup(const std::string& artist) const = 0;
};

std::vector<std::string> parse_audiodb(const json& answer);

std::vector<std::string> parse_deezer(const json& answer);

// Empty when the answer holds no artist
std::string parse_musicbrainz_id(const json& answer);

std::vector<std::string> parse_fanart(const json& answer);

// Keeps the order of the lists, drops repeated urls, stops at cap
std::vector<std::string> merge_images(const std::vector<std::vector<std::string>>& lists, size_t cap);

class audiodb_provider : public image_provider
{
public:

    audiodb_provider(const http::client& client, std::string api_key)
        : m_client {client}, m_api_key {std::move(api_key)}
    {}

    const char* name() const override
    {
        return "theaudiodb";
    }

    std::vector<std::string> lookup(const std::string& artist) const override;

private:

    const http::client& m_client;

    std::string m_api_key;

};

class deezer_provider : public image_provider
{
public:

    explicit deezer_provider(const http::client& client)
        : m_client {client}
    {}

    const char* name() const override
    {
        return "deezer";
    }

    std::vector<std::string> lookup(const std::string& artist) const override;

private:

    const http::client& m_client;

};

// Needs a fanart.tv api key, looks up the MusicBrainz id first
class fanart_provider : public image_provider
{
public:

    fanart_provider(const http::client& client, std::string api_key)
        : m_client {client}, m_api_key {std::move(api_key)}
    {}

    const char* name() const override
    {
        return "fanart.tv";
    }

    std::vector<std::string> lookup(const std::string& artist) const override;

private:

    const http::client& m_client;

    std::string m_api_key;

};

struct cache_options
{
    std::chrono::milliseconds ttl = std::chrono::hours {6};
    size_t max_images = 10;
    std::chrono::milliseconds failure_ttl = std::chrono::minutes {1};    // When every provider failed
};

// Per artist cache of merged provider results. Lookups for an artist that is
// already being fetched join the outstanding fetch.
class artist_image_cache
{
public:

    using images_callback = std::function<void(const std::vector<std::string>&)>;

    artist_image_cache() = delete;
    artist_image_cache(const artist_image_cache&) = delete;
    artist_image_cache& operator=(const artist_image_cache&) = delete;
    artist_image_cache(artist_image_cache&&) = delete;
    artist_image_cache& operator=(artist_image_cache&&) = delete;
    ~artist_image_cache() = default;

    artist_image_cache(utils::scheduler& sched, std::vector<std::unique_ptr<image_provider>> providers,
        cache_options options = {});

    void get(const std::string& artist, images_callback done);

    // Cached images if fresh, nullopt otherwise. Never starts a fetch.
    std::optional<std::vector<std::string>> peek(const std::string& artist) const;

    // Number of artists held, fresh, expired or loading
    size_t size() const
    {
        return m_entries.size();
    }

private:

    struct entry
    {
        std::vector<std::string> images;
        std::chrono::steady_clock::time_point expires;
        bool loading = false;
        std::vector<images_callback> waiters;
    };

    static std::string make_key(const std::string& artist);

    void finish(const std::string& key, std::vector<std::string> images, bool failed);

    // Drops expired entries that have no fetch outstanding
    void prune();

    utils::scheduler& m_scheduler;

    std::shared_ptr<const std::vector<std::unique_ptr<image_provider>>> m_providers;

    cache_options m_options;

    std::unordered_map<std::string, entry> m_entries;

};

} // namespace artwork

#endif
