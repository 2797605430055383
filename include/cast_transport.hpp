#ifndef CAST_TRANSPORT_HPP
#define CAST_TRANSPORT_HPP

#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "cast_link.hpp"
#include "scheduler.hpp"

using nlohmann::json;

namespace googlecast
{

inline constexpr const char* source_id = "sender-0";
inline constexpr const char* receiver_id = "receiver-0";

inline constexpr const char* namespace_connection = "urn:x-cast:com.google.cast.tp.connection";
inline constexpr const char* namespace_heartbeat = "urn:x-cast:com.google.cast.tp.heartbeat";
inline constexpr const char* namespace_receiver = "urn:x-cast:com.google.cast.receiver";

struct channel_key
{
    std::string source_id;
    std::string destination_id;
    std::string nspace;
};

class cast_transport;

// Logical (source, destination, namespace) stream multiplexed on the transport socket
class channel
{
public:

    using message_handler = std::function<void(const json&)>;

    channel() = delete;
    channel(const channel&) = delete;
    channel& operator=(const channel&) = delete;
    channel(channel&&) = delete;
    channel& operator=(channel&&) = delete;
    ~channel() = default;

    channel(cast_transport* transport, channel_key key);

    // Throws channel_unavailable when the channel was closed and send_error on write failure
    void send(const json& message) const;

    void on_message(message_handler handler)
    {
        m_handler = std::move(handler);
    }

    // Detaches the channel from the transport. Later sends throw channel_unavailable.
    void close();

    bool is_open() const
    {
        return m_transport != nullptr;
    }

    const channel_key& key() const
    {
        return m_key;
    }

private:

    friend class cast_transport;

    bool matches(const cast_message& msg) const;

    void deliver(const json& message) const;

    cast_transport* m_transport;

    channel_key m_key;

    message_handler m_handler;

};

using channel_ptr = std::shared_ptr<channel>;

class cast_transport
{
public:

    using disconnect_handler = std::function<void(const std::string& reason)>;

    cast_transport() = delete;
    cast_transport(const cast_transport&) = delete;
    cast_transport& operator=(const cast_transport&) = delete;
    cast_transport(cast_transport&&) = delete;
    cast_transport& operator=(cast_transport&&) = delete;
    ~cast_transport();

    cast_transport(utils::scheduler& sched, link_factory factory,
        std::chrono::milliseconds heartbeat_interval = std::chrono::milliseconds {5000});

    // No-op while connected to the same endpoint. Throws connection_error.
    void connect(const device_endpoint& endpoint);

    // Safe to call repeatedly and without a connection
    void disconnect();

    bool connected() const
    {
        return m_link != nullptr;
    }

    std::optional<device_endpoint> endpoint() const
    {
        return m_endpoint;
    }

    // Throws channel_unavailable when not connected
    channel_ptr create_channel(std::string source, std::string destination, std::string nspace);

    channel_ptr connection_channel() const
    {
        return m_connection;
    }

    channel_ptr receiver_channel() const
    {
        return m_receiver;
    }

    uint64_t next_request_id()
    {
        return ++m_request_id;
    }

    // Called after a peer close or socket error, not after disconnect()
    void on_disconnect(disconnect_handler handler)
    {
        m_on_disconnect = std::move(handler);
    }

private:

    friend class channel;

    void send(const channel_key& key, const json& message);

    void release(const channel* ch);

    void handle_message(uint64_t generation, cast_message&& msg);

    void handle_closed(uint64_t generation, const std::string& reason);

    void schedule_heartbeat();

    void teardown();

    utils::scheduler& m_scheduler;

    link_factory m_factory;

    std::chrono::milliseconds m_heartbeat_interval;

    std::unique_ptr<cast_link> m_link {nullptr};

    std::optional<device_endpoint> m_endpoint;

    std::vector<channel_ptr> m_channels;

    channel_ptr m_connection;

    channel_ptr m_heartbeat;

    channel_ptr m_receiver;

    std::optional<utils::timer_id> m_heartbeat_timer;

    disconnect_handler m_on_disconnect;

    uint64_t m_generation = 0;                  // Identifies the current link, stale events are dropped

    uint64_t m_request_id = 0;                  // Up counting id to identify requests and responses

};

} // namespace googlecast

#endif
