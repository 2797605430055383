#ifndef RELAY_PLAYBACK_BRIDGE_HPP
#define RELAY_PLAYBACK_BRIDGE_HPP

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>

#include "artist_images.hpp"
#include "cast_controller.hpp"
#include "lms_source.hpp"
#include "scheduler.hpp"

namespace relay
{

struct bridge_options
{
    std::chrono::milliseconds poll_interval {2000};
    std::chrono::milliseconds pause_timeout {5000};
    bool enabled = true;
};

struct bridge_status
{
    bool running = false;
    bool enabled = false;
    bool casting = false;
    std::string active_player;
    std::string preferred_player_id;
    std::string preferred_player_name;
    std::optional<lms::transport_mode> last_mode;
    lms::server_address server;
};

// Mirrors the transport state of a polled player onto a cast session
class playback_bridge
{
public:

    playback_bridge() = delete;
    playback_bridge(const playback_bridge&) = delete;
    playback_bridge& operator=(const playback_bridge&) = delete;
    playback_bridge(playback_bridge&&) = delete;
    playback_bridge& operator=(playback_bridge&&) = delete;
    ~playback_bridge();

    // images may be null, Now-Playing messages then carry no artist images
    playback_bridge(utils::scheduler& sched, lms::playback_source& source, googlecast::cast_controller& controller,
        artwork::artist_image_cache* images, bridge_options options = {});

    // Polls right away and then every poll interval
    void start();

    void stop();

    // One poll tick. Skipped while the previous tick still waits for the source.
    void poll();

    void set_preferred_player(std::string id, std::string name);

    void set_enabled(bool enabled);

    bool enabled() const
    {
        return m_options.enabled;
    }

    // Switches the playback source, the auto selected player is dropped
    void set_server(lms::server_address address);

    bridge_status status() const;

private:

    void schedule_poll();

    void fetch_status(uint64_t tick);

    void handle_status(uint64_t tick, std::optional<lms::playback_snapshot> snapshot);

    void decide(const lms::playback_snapshot& snapshot);

    void start_casting(const lms::playback_snapshot& snapshot);

    void stop_casting();

    void arm_pause_timer();

    void cancel_pause_timer();

    void publish(const lms::playback_snapshot& snapshot, bool entering_pause);

    googlecast::cast_target target() const;

    utils::scheduler& m_scheduler;

    lms::playback_source& m_source;

    googlecast::cast_controller& m_controller;

    artwork::artist_image_cache* m_images;

    bridge_options m_options;

    bool m_running = false;

    std::optional<utils::timer_id> m_poll_timer;

    std::optional<utils::timer_id> m_pause_timer;

    uint64_t m_tick = 0;                        // Results of older ticks are dropped

    bool m_tick_in_flight = false;

    std::chrono::steady_clock::time_point m_tick_started;

    uint64_t m_cast_epoch = 0;                  // Bumped by every stop, invalidates running cast attempts

    bool m_cast_in_flight = false;

    bool m_cast_wanted = false;                 // Play was observed and no stop decided since

    std::string m_current_player;

    std::string m_preferred_id;

    std::string m_preferred_name;

    std::optional<lms::transport_mode> m_last_mode;

};

} // namespace relay

#endif
