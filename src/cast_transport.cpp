#include "cast_transport.hpp"

#include <algorithm>
#include <utility>

#include "cast_errors.hpp"
#include "log.hpp"

namespace googlecast
{

channel::channel(cast_transport* transport, channel_key key)
    : m_transport {transport}, m_key {std::move(key)}
{}

void channel::send(const json& message) const
{
    if(m_transport == nullptr)
        throw channel_unavailable {"Channel " + m_key.nspace + " to " + m_key.destination_id + " is closed"};

    m_transport->send(m_key, message);
}

void channel::close()
{
    if(m_transport != nullptr)
    {
        cast_transport* transport = m_transport;
        m_transport = nullptr;
        transport->release(this);
    }
    m_handler = nullptr;
}

bool channel::matches(const cast_message& msg) const
{
    return msg.namespace_() == m_key.nspace && msg.source_id() == m_key.destination_id &&
        (msg.destination_id() == m_key.source_id || msg.destination_id() == "*");
}

void channel::deliver(const json& message) const
{
    // The handler may close this channel while it runs
    message_handler handler = m_handler;
    if(handler)
        handler(message);
}

cast_transport::cast_transport(utils::scheduler& sched, link_factory factory, std::chrono::milliseconds heartbeat_interval)
    : m_scheduler {sched}, m_factory {std::move(factory)}, m_heartbeat_interval {heartbeat_interval}
{
    GOOGLE_PROTOBUF_VERIFY_VERSION;
}

cast_transport::~cast_transport()
{
    teardown();
}

void cast_transport::connect(const device_endpoint& endpoint)
{
    if(m_link)
    {
        if(m_endpoint && *m_endpoint == endpoint)
            return;
        disconnect();
    }

    utils::log::info("[Chromecast] Connecting to {}:{}...", endpoint.ip, endpoint.port);

    const uint64_t generation = ++m_generation;
    link_events events;
    events.on_message = [this, generation](cast_message&& msg)
    {
        auto shared = std::make_shared<cast_message>(std::move(msg));
        m_scheduler.post([this, generation, shared]()
        {
            this->handle_message(generation, std::move(*shared));
        });
    };
    events.on_closed = [this, generation](const std::string& reason)
    {
        m_scheduler.post([this, generation, reason]()
        {
            this->handle_closed(generation, reason);
        });
    };

    m_link = m_factory(endpoint, std::move(events));
    if(!m_link)
        throw connection_error {"Unable to open connection to " + endpoint.ip};
    m_endpoint = endpoint;

    m_connection = create_channel(source_id, receiver_id, namespace_connection);
    m_heartbeat = create_channel(source_id, receiver_id, namespace_heartbeat);
    m_receiver = create_channel(source_id, receiver_id, namespace_receiver);

    m_heartbeat->on_message([this](const json& msg)
    {
        if(msg.value("type", "") != "PING")
            return;
        try {
            m_heartbeat->send(json {{"type", "PONG"}});
        } catch(const std::exception& e) {
            utils::log::warn("[Chromecast] Failed to answer PING: {}", e.what());
        }
    });
    m_connection->on_message([this, generation](const json& msg)
    {
        if(msg.value("type", "") == "CLOSE")
            handle_closed(generation, "Device closed the connection");
    });

    try {
        m_connection->send(json {{"type", "CONNECT"}});
        m_receiver->send(json {{"type", "GET_STATUS"}, {"requestId", next_request_id()}});
    } catch(const std::exception& e) {
        teardown();
        throw connection_error {std::string {"Connection setup failed: "} + e.what()};
    }

    schedule_heartbeat();
    utils::log::info("[Chromecast] Connected to {}:{}", endpoint.ip, endpoint.port);
}

void cast_transport::disconnect()
{
    if(!m_link)
    {
        teardown();
        return;
    }

    if(m_connection && m_connection->is_open())
    {
        try {
            m_connection->send(json {{"type", "CLOSE"}});
        } catch(const std::exception& e) {
            utils::log::debug("[Chromecast] CLOSE not delivered: {}", e.what());
        }
    }

    teardown();
    utils::log::info("[Chromecast] Disconnected");
}

channel_ptr cast_transport::create_channel(std::string source, std::string destination, std::string nspace)
{
    if(!m_link)
        throw channel_unavailable {"Not connected"};

    auto ch = std::make_shared<channel>(this, channel_key {std::move(source), std::move(destination), std::move(nspace)});
    m_channels.push_back(ch);
    return ch;
}

void cast_transport::send(const channel_key& key, const json& message)
{
    if(!m_link)
        throw channel_unavailable {"Not connected"};

    cast_message msg;
    msg.set_protocol_version(cast_message::CASTV2_1_0);
    msg.set_source_id(key.source_id);
    msg.set_destination_id(key.destination_id);
    msg.set_namespace_(key.nspace);
    msg.set_payload_type(cast_message::STRING);
    msg.set_payload_utf8(message.dump());

    utils::log::debug("[Chromecast] -> {} {} {}", key.destination_id, key.nspace, msg.payload_utf8());
    m_link->send(msg);
}

void cast_transport::release(const channel* ch)
{
    m_channels.erase(std::remove_if(m_channels.begin(), m_channels.end(), [ch](const channel_ptr& p)
    {
        return p.get() == ch;
    }), m_channels.end());
}

void cast_transport::handle_message(uint64_t generation, cast_message&& msg)
{
    if(generation != m_generation || !m_link)
        return;

    if(msg.payload_type() != cast_message::STRING)
        return;

    json payload;
    try {
        payload = json::parse(msg.payload_utf8());
    } catch(const json::parse_error& e) {
        utils::log::warn("[Chromecast] Dropping malformed frame on {}: {}", msg.namespace_(), e.what());
        return;
    }

    utils::log::debug("[Chromecast] <- {} {} {}", msg.source_id(), msg.namespace_(), msg.payload_utf8());

    // Handlers may open or close channels while we dispatch
    std::vector<channel_ptr> targets;
    for(const auto& ch : m_channels)
    {
        if(ch->matches(msg))
            targets.push_back(ch);
    }

    for(const auto& ch : targets)
    {
        if(generation != m_generation)
            break;
        if(ch->is_open())
            ch->deliver(payload);
    }
}

void cast_transport::handle_closed(uint64_t generation, const std::string& reason)
{
    if(generation != m_generation || !m_link)
        return;

    utils::log::warn("[Chromecast] Connection lost: {}", reason);
    teardown();

    if(m_on_disconnect)
        m_on_disconnect(reason);
}

void cast_transport::schedule_heartbeat()
{
    m_heartbeat_timer = m_scheduler.schedule(m_heartbeat_interval, [this]()
    {
        m_heartbeat_timer.reset();
        if(!m_link)
            return;

        try {
            m_heartbeat->send(json {{"type", "PING"}});
        } catch(const std::exception& e) {
            utils::log::warn("[Chromecast] Heartbeat failed: {}", e.what());
        }
        schedule_heartbeat();
    });
}

void cast_transport::teardown()
{
    ++m_generation;

    if(m_heartbeat_timer)
    {
        m_scheduler.cancel(*m_heartbeat_timer);
        m_heartbeat_timer.reset();
    }

    std::vector<channel_ptr> channels;
    channels.swap(m_channels);
    for(auto& ch : channels)
    {
        ch->m_transport = nullptr;
        ch->m_handler = nullptr;
    }

    m_connection.reset();
    m_heartbeat.reset();
    m_receiver.reset();
    m_link.reset();
    m_endpoint.reset();
}

} // namespace googlecast
