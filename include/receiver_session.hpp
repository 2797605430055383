#ifndef RECEIVER_SESSION_HPP
#define RECEIVER_SESSION_HPP

#include <chrono>
#include <exception>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <variant>
#include <vector>

#include "cast_controller.hpp"
#include "cast_transport.hpp"
#include "scheduler.hpp"

namespace googlecast
{

// Custom receiver application identity
struct receiver_app
{
    std::string app_id;
    std::string nspace;
    std::string url;            // Static page the receiver app serves, informational
};

enum class session_phase
{
    disconnected,
    connecting,
    connected,
    launch_pending,
    app_ready,
    casting
};

const char* to_string(session_phase phase);

struct session_status
{
    session_phase phase = session_phase::disconnected;
    std::optional<device_endpoint> device;
    std::string transport_id;
    std::optional<cast_target> target;
};

// Drives a Chromecast from Disconnected to Casting for one custom receiver app
class receiver_session : public cast_controller
{
public:

    // Null on success, otherwise one of the errors of cast_errors.hpp
    using launch_callback = std::function<void(std::exception_ptr)>;

    receiver_session() = delete;
    receiver_session(const receiver_session&) = delete;
    receiver_session& operator=(const receiver_session&) = delete;
    receiver_session(receiver_session&&) = delete;
    receiver_session& operator=(receiver_session&&) = delete;
    ~receiver_session() override;

    receiver_session(cast_transport& transport, utils::scheduler& sched, receiver_app app,
        std::chrono::milliseconds launch_timeout = std::chrono::milliseconds {10000});

    // Stops a cast to the previous device before switching
    void set_device(std::optional<device_endpoint> device);

    std::optional<device_endpoint> device() const
    {
        return m_device;
    }

    // Throws connection_error
    void connect();

    // Concurrent callers share one outstanding LAUNCH
    void ensure_launched(launch_callback done);

    void cast(const cast_target& target, cast_callback done) override;

    bool stop() override;

    void disconnect();

    bool casting() const override
    {
        return std::holds_alternative<casting_state>(m_state);
    }

    bool configured() const override
    {
        return m_device.has_value();
    }

    std::optional<cast_target> current_target() const override;

    bool send_app_message(const json& message) override;

    void on_receiver_message(const json& frame);

    session_phase phase() const;

    session_status status() const;

private:

    struct app_binding
    {
        std::string transport_id;
        std::string session_id;
        channel_ptr connection;
        channel_ptr app;
    };

    struct pending_launch
    {
        uint64_t request_id = 0;
        std::optional<utils::timer_id> timer;
        std::vector<launch_callback> waiters;
    };

    struct disconnected_state {};
    struct connecting_state {};
    struct connected_state {};
    struct launch_pending_state { std::shared_ptr<pending_launch> launch; };
    struct app_ready_state { app_binding app; };
    struct casting_state { app_binding app; cast_target target; };

    // Alternatives are declared in session_phase order
    using state = std::variant<disconnected_state, connecting_state, connected_state,
        launch_pending_state, app_ready_state, casting_state>;

    const app_binding* binding() const;

    void handle_status(const json& frame);

    void bind(const std::string& transport_id, const std::string& session_id);

    void release_binding();

    bool send_params(const cast_target& target);

    std::shared_ptr<pending_launch> take_pending();

    void fail_launch(std::exception_ptr err);

    void handle_launch_timeout(uint64_t request_id);

    void handle_transport_lost(const std::string& reason);

    cast_transport& m_transport;

    utils::scheduler& m_scheduler;

    receiver_app m_app;

    std::chrono::milliseconds m_launch_timeout;

    std::optional<device_endpoint> m_device;

    state m_state {disconnected_state {}};

};

} // namespace googlecast

#endif
