#include "playback_bridge.hpp"

#include <utility>

#include "log.hpp"
#include "now_playing.hpp"

namespace relay
{

playback_bridge::playback_bridge(utils::scheduler& sched, lms::playback_source& source,
    googlecast::cast_controller& controller, artwork::artist_image_cache* images, bridge_options options)
    : m_scheduler {sched}, m_source {source}, m_controller {controller}, m_images {images}, m_options {options}
{}

playback_bridge::~playback_bridge()
{
    if(m_poll_timer)
        m_scheduler.cancel(*m_poll_timer);
    if(m_pause_timer)
        m_scheduler.cancel(*m_pause_timer);
}

void playback_bridge::start()
{
    if(m_running)
        return;

    m_running = true;
    utils::log::info("[Relay] Polling every {} ms, pause timeout {} ms", m_options.poll_interval.count(),
        m_options.pause_timeout.count());
    poll();
    schedule_poll();
}

void playback_bridge::stop()
{
    if(!m_running)
        return;

    m_running = false;
    ++m_tick;
    m_tick_in_flight = false;
    if(m_poll_timer)
    {
        m_scheduler.cancel(*m_poll_timer);
        m_poll_timer.reset();
    }
    stop_casting();
}

void playback_bridge::schedule_poll()
{
    m_poll_timer = m_scheduler.schedule(m_options.poll_interval, [this]() {
        m_poll_timer.reset();
        if(!m_running)
            return;
        poll();
        schedule_poll();
    });
}

void playback_bridge::poll()
{
    if(!m_options.enabled || !m_controller.configured())
    {
        cancel_pause_timer();
        if(m_controller.casting() || m_cast_wanted)
        {
            utils::log::info("[Relay] Casting disabled or no device configured, stopping cast");
            stop_casting();
        }
        return;
    }

    // A tick that never got an answer is given up after three intervals
    if(m_tick_in_flight && m_scheduler.now() - m_tick_started < m_options.poll_interval * 3)
    {
        utils::log::debug("[Relay] Previous poll still running, skipping tick");
        return;
    }

    const uint64_t tick = ++m_tick;
    m_tick_in_flight = true;
    m_tick_started = m_scheduler.now();

    if(!m_preferred_id.empty() && m_preferred_id != m_current_player)
    {
        utils::log::info("[Relay] Switching to preferred player {} ({})", m_preferred_name, m_preferred_id);
        m_current_player = m_preferred_id;
    }

    if(!m_current_player.empty())
    {
        fetch_status(tick);
        return;
    }

    m_source.fetch_players([this, tick](std::optional<std::vector<lms::player_info>> players) {
        if(tick != m_tick)
            return;

        if(!players || players->empty())
        {
            m_tick_in_flight = false;
            if(players)
                utils::log::debug("[Relay] No players available");
            return;
        }

        m_current_player = players->front().id;
        utils::log::info("[Relay] Auto-selected player {} ({})", players->front().name, m_current_player);
        fetch_status(tick);
    });
}

void playback_bridge::fetch_status(uint64_t tick)
{
    m_source.fetch_status(m_current_player, [this, tick](std::optional<lms::playback_snapshot> snapshot) {
        handle_status(tick, std::move(snapshot));
    });
}

void playback_bridge::handle_status(uint64_t tick, std::optional<lms::playback_snapshot> snapshot)
{
    if(tick != m_tick)
        return;

    m_tick_in_flight = false;
    if(!snapshot)
    {
        utils::log::debug("[Relay] No status for player {}, skipping tick", m_current_player);
        return;
    }

    decide(*snapshot);
}

void playback_bridge::decide(const lms::playback_snapshot& snapshot)
{
    using lms::transport_mode;

    const bool has_track = snapshot.has_track();
    const bool entering_pause = snapshot.mode == transport_mode::pause && m_last_mode != transport_mode::pause;
    if(m_last_mode != snapshot.mode)
        utils::log::debug("[Relay] Player {} is now {}", m_current_player, lms::to_string(snapshot.mode));
    m_last_mode = snapshot.mode;

    if(snapshot.mode == transport_mode::play && has_track)
    {
        cancel_pause_timer();
        if(!m_controller.casting())
        {
            if(m_cast_wanted)
                utils::log::warn("[Relay] Cast session lost, relaunching");
            else
                utils::log::info("[Relay] Playback started, starting cast");
            start_casting(snapshot);
            return;
        }

        if(m_controller.current_target() != target())
        {
            utils::log::info("[Relay] Active player changed to {}, updating receiver", m_current_player);
            start_casting(snapshot);
            return;
        }
    }
    else if(snapshot.mode == transport_mode::stop || (snapshot.mode != transport_mode::play && !has_track))
    {
        cancel_pause_timer();
        if(m_controller.casting() || m_cast_wanted)
        {
            utils::log::info("[Relay] Playback stopped, stopping cast");
            stop_casting();
        }
        return;
    }
    else if(snapshot.mode == transport_mode::pause)
    {
        if(m_controller.casting() && !m_pause_timer)
        {
            utils::log::info("[Relay] Playback paused, stopping cast in {} ms unless resumed",
                m_options.pause_timeout.count());
            arm_pause_timer();
        }
    }

    if(m_controller.casting() && has_track)
        publish(snapshot, entering_pause);
}

void playback_bridge::start_casting(const lms::playback_snapshot& snapshot)
{
    m_cast_wanted = true;
    if(m_cast_in_flight)
        return;

    m_cast_in_flight = true;
    const uint64_t epoch = m_cast_epoch;
    m_controller.cast(target(), [this, epoch, snapshot](bool ok) {
        m_cast_in_flight = false;
        if(epoch != m_cast_epoch && !m_cast_wanted)
        {
            // Stop was decided while the launch was running and play never came back
            if(ok)
                m_controller.stop();
            return;
        }

        if(!ok)
        {
            utils::log::warn("[Relay] Cast failed, retrying on next play");
            return;
        }

        utils::log::info("[Relay] Casting player {}", m_current_player);
        publish(snapshot, false);
    });
}

void playback_bridge::stop_casting()
{
    ++m_cast_epoch;
    m_cast_wanted = false;
    cancel_pause_timer();
    if(!m_controller.stop())
        utils::log::warn("[Relay] Stopping the receiver app failed");
}

void playback_bridge::arm_pause_timer()
{
    m_pause_timer = m_scheduler.schedule(m_options.pause_timeout, [this]() {
        m_pause_timer.reset();
        utils::log::info("[Relay] Pause timeout reached, stopping cast");
        stop_casting();
    });
}

void playback_bridge::cancel_pause_timer()
{
    if(!m_pause_timer)
        return;

    m_scheduler.cancel(*m_pause_timer);
    m_pause_timer.reset();
}

void playback_bridge::publish(const lms::playback_snapshot& snapshot, bool entering_pause)
{
    if(entering_pause)
    {
        m_controller.send_app_message(make_pause_notice());
        return;
    }

    std::vector<std::string> images;
    if(m_images && snapshot.current && !snapshot.current->artist.empty())
    {
        if(auto cached = m_images->peek(snapshot.current->artist))
            images = std::move(*cached);
        else
            m_images->get(snapshot.current->artist, [](const std::vector<std::string>&) {});
    }

    if(auto message = build_now_playing(snapshot, images, m_source.address()))
    {
        if(!m_controller.send_app_message(*message))
            utils::log::debug("[Relay] Now playing update not delivered");
    }
}

googlecast::cast_target playback_bridge::target() const
{
    const auto address = m_source.address();
    return googlecast::cast_target {address.host, address.port, m_current_player};
}

void playback_bridge::set_preferred_player(std::string id, std::string name)
{
    utils::log::info("[Relay] Preferred player set to {} ({})", name, id);
    m_preferred_id = std::move(id);
    m_preferred_name = std::move(name);
}

void playback_bridge::set_enabled(bool enabled)
{
    if(m_options.enabled == enabled)
        return;

    m_options.enabled = enabled;
    utils::log::info("[Relay] Casting {}", enabled ? "enabled" : "disabled");
    if(!enabled)
        stop_casting();
}

void playback_bridge::set_server(lms::server_address address)
{
    utils::log::info("[Relay] Using server {}:{}", address.host, address.port);
    m_source.set_address(std::move(address));
    m_current_player.clear();
    m_last_mode.reset();
    // Results of the old server are dropped
    ++m_tick;
    m_tick_in_flight = false;
}

bridge_status playback_bridge::status() const
{
    bridge_status out;
    out.running = m_running;
    out.enabled = m_options.enabled;
    out.casting = m_controller.casting();
    out.active_player = m_current_player;
    out.preferred_player_id = m_preferred_id;
    out.preferred_player_name = m_preferred_name;
    out.last_mode = m_last_mode;
    out.server = m_source.address();
    return out;
}

} // namespace relay
