#ifndef CONTROL_API_HPP
#define CONTROL_API_HPP

#include <chrono>
#include <string>

#include <nlohmann/json.hpp>

#include "http/request.hpp"
#include "http/response.hpp"
#include "playback_bridge.hpp"
#include "receiver_session.hpp"
#include "scheduler.hpp"

using nlohmann::json;

namespace control
{

// Runtime reconfiguration of device, player and server over http
class control_api
{
public:

    control_api() = delete;
    control_api(const control_api&) = delete;
    control_api& operator=(const control_api&) = delete;
    control_api(control_api&&) = delete;
    control_api& operator=(control_api&&) = delete;
    ~control_api() = default;

    control_api(utils::scheduler& sched, googlecast::receiver_session& session, relay::playback_bridge& bridge,
        std::chrono::milliseconds timeout = std::chrono::milliseconds {5000});

    // Has to run on the scheduler
    http::response handle(const http::request& req);

    // Callable from any thread, runs handle() on the scheduler and waits for it
    http::response dispatch(const http::request& req);

    void set_device_name(std::string name)
    {
        m_device_name = std::move(name);
    }

    json status() const;

private:

    http::response post_chromecast(const http::request& req);

    http::response delete_chromecast();

    http::response post_player(const http::request& req);

    http::response post_lms(const http::request& req);

    utils::scheduler& m_scheduler;

    googlecast::receiver_session& m_session;

    relay::playback_bridge& m_bridge;

    std::chrono::milliseconds m_timeout;

    std::string m_device_name;

};

} // namespace control

#endif
