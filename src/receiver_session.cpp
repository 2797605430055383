#include "receiver_session.hpp"

#include <utility>

#include "cast_errors.hpp"
#include "log.hpp"

namespace googlecast
{

const char* to_string(session_phase phase)
{
    switch(phase)
    {
        case session_phase::disconnected:
            return "disconnected";
        case session_phase::connecting:
            return "connecting";
        case session_phase::connected:
            return "connected";
        case session_phase::launch_pending:
            return "launch_pending";
        case session_phase::app_ready:
            return "app_ready";
        case session_phase::casting:
            return "casting";
    }
    return "unknown";
}

static std::string describe(std::exception_ptr err)
{
    try {
        std::rethrow_exception(err);
    } catch(const launch_timeout& e) {
        return std::string {"launch timeout: "} + e.what();
    } catch(const launch_error& e) {
        return std::string {"launch error: "} + e.what();
    } catch(const connection_error& e) {
        return std::string {"connection error: "} + e.what();
    } catch(const std::exception& e) {
        return e.what();
    }
}

receiver_session::receiver_session(cast_transport& transport, utils::scheduler& sched, receiver_app app,
    std::chrono::milliseconds launch_timeout)
    : m_transport {transport}, m_scheduler {sched}, m_app {std::move(app)}, m_launch_timeout {launch_timeout}
{
    m_transport.on_disconnect([this](const std::string& reason)
    {
        this->handle_transport_lost(reason);
    });
}

receiver_session::~receiver_session()
{
    m_transport.on_disconnect(nullptr);
    if(auto pending = take_pending(); pending && pending->timer)
        m_scheduler.cancel(*pending->timer);
}

void receiver_session::set_device(std::optional<device_endpoint> device)
{
    if(m_device == device)
        return;

    if(casting())
        stop();
    else
        disconnect();

    m_device = std::move(device);
    if(m_device)
        utils::log::info("[Chromecast] Device set to {}:{}", m_device->ip, m_device->port);
    else
        utils::log::info("[Chromecast] Device cleared");
}

void receiver_session::connect()
{
    if(m_transport.connected())
        return;

    if(!m_device)
        throw connection_error {"No Chromecast configured"};

    m_state = connecting_state {};
    try {
        m_transport.connect(*m_device);
    } catch(...) {
        m_state = disconnected_state {};
        throw;
    }
    m_state = connected_state {};

    m_transport.receiver_channel()->on_message([this](const json& frame)
    {
        this->on_receiver_message(frame);
    });
}

void receiver_session::ensure_launched(launch_callback done)
{
    try {
        connect();
    } catch(const std::exception&) {
        done(std::current_exception());
        return;
    }

    if(binding() != nullptr)
    {
        done(nullptr);
        return;
    }

    if(auto* pending = std::get_if<launch_pending_state>(&m_state))
    {
        pending->launch->waiters.push_back(std::move(done));
        return;
    }

    auto launch = std::make_shared<pending_launch>();
    launch->request_id = m_transport.next_request_id();

    try {
        m_transport.receiver_channel()->send(json {
            {"type", "LAUNCH"},
            {"appId", m_app.app_id},
            {"requestId", launch->request_id}
        });
    } catch(const std::exception&) {
        done(std::current_exception());
        return;
    }

    utils::log::info("[Chromecast] Launching receiver app {}...", m_app.app_id);

    const uint64_t request_id = launch->request_id;
    launch->timer = m_scheduler.schedule(m_launch_timeout, [this, request_id]()
    {
        this->handle_launch_timeout(request_id);
    });
    launch->waiters.push_back(std::move(done));
    m_state = launch_pending_state {std::move(launch)};
}

void receiver_session::cast(const cast_target& target, cast_callback done)
{
    if(auto* current = std::get_if<casting_state>(&m_state); current && current->target == target)
    {
        done(true);
        return;
    }

    ensure_launched([this, target, done = std::move(done)](std::exception_ptr err)
    {
        if(err)
        {
            utils::log::error("[Chromecast] Cast failed, {}", describe(err));
            done(false);
            return;
        }
        done(this->send_params(target));
    });
}

bool receiver_session::send_params(const cast_target& target)
{
    if(auto* current = std::get_if<casting_state>(&m_state); current && current->target == target)
        return true;

    try {
        const app_binding* bound = binding();
        if(bound == nullptr)
            throw channel_unavailable {"Receiver app channel is not bound"};

        app_binding app = *bound;
        app.app->send(json {
            {"type", "SET_LMS_PARAMS"},
            {"host", target.host},
            {"port", target.port},
            {"player", target.player}
        });

        m_state = casting_state {std::move(app), target};
        utils::log::info("[Chromecast] Casting player {} from {}:{}", target.player, target.host, target.port);
        return true;
    } catch(const std::exception& e) {
        if(auto* current = std::get_if<casting_state>(&m_state))
            m_state = app_ready_state {std::move(current->app)};
        utils::log::error("[Chromecast] Unable to start cast: {}", e.what());
        return false;
    }
}

bool receiver_session::stop()
{
    const auto* current = std::get_if<casting_state>(&m_state);
    if(current == nullptr)
        return true;

    utils::log::info("[Chromecast] Stopping cast...");
    try {
        channel_ptr receiver = m_transport.receiver_channel();
        if(!receiver)
            throw channel_unavailable {"Receiver channel is not open"};

        receiver->send(json {
            {"type", "STOP"},
            {"requestId", m_transport.next_request_id()},
            {"sessionId", current->app.session_id}
        });
    } catch(const std::exception& e) {
        utils::log::warn("[Chromecast] STOP not delivered: {}", e.what());
    }

    disconnect();
    utils::log::info("[Chromecast] Cast stopped");
    return true;
}

void receiver_session::disconnect()
{
    std::shared_ptr<pending_launch> pending = take_pending();
    release_binding();
    m_transport.disconnect();
    m_state = disconnected_state {};

    if(!pending)
        return;

    if(pending->timer)
        m_scheduler.cancel(*pending->timer);
    for(auto& waiter : pending->waiters)
        waiter(std::make_exception_ptr(connection_error {"Disconnected"}));
}

std::optional<cast_target> receiver_session::current_target() const
{
    if(const auto* current = std::get_if<casting_state>(&m_state))
        return current->target;
    return std::nullopt;
}

bool receiver_session::send_app_message(const json& message)
{
    const auto* current = std::get_if<casting_state>(&m_state);
    if(current == nullptr)
        return false;

    try {
        current->app.app->send(message);
        return true;
    } catch(const std::exception& e) {
        utils::log::warn("[Chromecast] Unable to send {}: {}", message.value("type", "message"), e.what());
        return false;
    }
}

void receiver_session::on_receiver_message(const json& frame)
{
    if(!frame.is_object())
        return;

    const std::string type = frame.value("type", "");
    if(type == "RECEIVER_STATUS")
    {
        handle_status(frame);
    }
    else if(type == "LAUNCH_ERROR")
    {
        std::string reason = "Launch failed";
        if(frame.contains("reason") && frame["reason"].is_string())
            reason = frame["reason"].get<std::string>();

        if(std::holds_alternative<launch_pending_state>(m_state))
        {
            utils::log::error("[Chromecast] Device rejected launch: {}", reason);
            fail_launch(std::make_exception_ptr(launch_error {reason}));
        }
    }
}

void receiver_session::handle_status(const json& frame)
{
    const json* found = nullptr;
    if(frame.contains("status") && frame["status"].is_object())
    {
        const json& status = frame["status"];
        if(status.contains("applications") && status["applications"].is_array())
        {
            for(const auto& app : status["applications"])
            {
                if(app.is_object() && app.value("appId", "") == m_app.app_id)
                {
                    found = &app;
                    break;
                }
            }
        }
    }

    uint64_t request_id = 0;
    if(frame.contains("requestId") && frame["requestId"].is_number_unsigned())
        request_id = frame["requestId"].get<uint64_t>();

    if(found == nullptr)
    {
        if(binding() != nullptr)
            utils::log::info("[Chromecast] Receiver app is no longer running");
        release_binding();

        if(auto* pending = std::get_if<launch_pending_state>(&m_state))
        {
            // Replies to requests older than the LAUNCH describe the device before it
            if(request_id == 0 || request_id >= pending->launch->request_id)
                fail_launch(std::make_exception_ptr(launch_error {"App not running"}));
        }
        else if(m_transport.connected())
        {
            m_state = connected_state {};
        }
        return;
    }

    const std::string transport_id = found->value("transportId", "");
    if(transport_id.empty())
        return;

    std::shared_ptr<pending_launch> pending = take_pending();

    const app_binding* bound = binding();
    if(bound == nullptr || bound->transport_id != transport_id)
        bind(transport_id, found->value("sessionId", ""));

    if(!pending)
        return;

    if(pending->timer)
        m_scheduler.cancel(*pending->timer);

    std::exception_ptr result;
    if(binding() != nullptr)
        utils::log::info("[Chromecast] Receiver app running (transport {})", transport_id);
    else
        result = std::make_exception_ptr(channel_unavailable {"Unable to bind receiver app channels"});

    for(auto& waiter : pending->waiters)
        waiter(result);
}

void receiver_session::bind(const std::string& transport_id, const std::string& session_id)
{
    release_binding();

    app_binding app;
    app.transport_id = transport_id;
    app.session_id = session_id;
    try {
        app.connection = m_transport.create_channel(source_id, transport_id, namespace_connection);
        app.app = m_transport.create_channel(source_id, transport_id, m_app.nspace);
        app.connection->send(json {{"type", "CONNECT"}});
    } catch(const std::exception& e) {
        utils::log::error("[Chromecast] Unable to connect to receiver app: {}", e.what());
        if(app.connection)
            app.connection->close();
        if(app.app)
            app.app->close();
        return;
    }

    app.app->on_message([](const json& msg)
    {
        utils::log::debug("[Chromecast] Receiver app: {}", msg.dump());
    });

    utils::log::debug("[Chromecast] Bound receiver app channels to {}", transport_id);
    m_state = app_ready_state {std::move(app)};
}

void receiver_session::release_binding()
{
    app_binding* bound = nullptr;
    if(auto* ready = std::get_if<app_ready_state>(&m_state))
        bound = &ready->app;
    else if(auto* current = std::get_if<casting_state>(&m_state))
        bound = &current->app;

    if(bound == nullptr)
        return;

    if(bound->connection)
        bound->connection->close();
    if(bound->app)
        bound->app->close();

    m_state = connected_state {};
}

const receiver_session::app_binding* receiver_session::binding() const
{
    if(const auto* ready = std::get_if<app_ready_state>(&m_state))
        return &ready->app;
    if(const auto* current = std::get_if<casting_state>(&m_state))
        return &current->app;
    return nullptr;
}

std::shared_ptr<receiver_session::pending_launch> receiver_session::take_pending()
{
    std::shared_ptr<pending_launch> pending;
    if(auto* launching = std::get_if<launch_pending_state>(&m_state))
    {
        pending = std::move(launching->launch);
        m_state = connected_state {};
    }
    return pending;
}

void receiver_session::fail_launch(std::exception_ptr err)
{
    std::shared_ptr<pending_launch> pending = take_pending();
    if(!pending)
        return;

    if(!m_transport.connected())
        m_state = disconnected_state {};
    if(pending->timer)
        m_scheduler.cancel(*pending->timer);

    for(auto& waiter : pending->waiters)
        waiter(err);
}

void receiver_session::handle_launch_timeout(uint64_t request_id)
{
    auto* launching = std::get_if<launch_pending_state>(&m_state);
    if(launching == nullptr || launching->launch->request_id != request_id)
        return;

    // The timer fired, there is nothing left to cancel
    launching->launch->timer.reset();

    utils::log::error("[Chromecast] No status from receiver app within {} ms", m_launch_timeout.count());
    fail_launch(std::make_exception_ptr(launch_timeout {"App did not start within " +
        std::to_string(m_launch_timeout.count()) + " ms"}));
}

void receiver_session::handle_transport_lost(const std::string& reason)
{
    std::shared_ptr<pending_launch> pending = take_pending();
    release_binding();
    m_state = disconnected_state {};

    if(!pending)
        return;

    if(pending->timer)
        m_scheduler.cancel(*pending->timer);
    for(auto& waiter : pending->waiters)
        waiter(std::make_exception_ptr(connection_error {reason}));
}

session_phase receiver_session::phase() const
{
    return static_cast<session_phase>(m_state.index());
}

session_status receiver_session::status() const
{
    session_status st;
    st.phase = phase();
    st.device = m_device;
    if(const app_binding* bound = binding())
        st.transport_id = bound->transport_id;
    st.target = current_target();
    return st;
}

} // namespace googlecast
