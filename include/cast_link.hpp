#ifndef CAST_LINK_HPP
#define CAST_LINK_HPP

#include <cstdint>
#include <functional>
#include <memory>
#include <string>

#include "cast_channel.pb.h"

namespace googlecast
{

using cast_message = cast_channel::CastMessage;

struct device_endpoint
{
    std::string ip;
    uint16_t port = 8009;

    bool operator==(const device_endpoint& other) const
    {
        return ip == other.ip && port == other.port;
    }

    bool operator!=(const device_endpoint& other) const
    {
        return !(*this == other);
    }
};

// Callbacks of a link. They may be invoked from any thread.
struct link_events
{
    std::function<void(cast_message&&)> on_message;
    std::function<void(const std::string& reason)> on_closed;
};

// One framed byte stream to a device. Closing happens on destruction.
class cast_link
{
public:
    virtual ~cast_link() = default;

    // Throws send_error
    virtual void send(const cast_message& msg) = 0;
};

// Opens a link or throws connection_error
using link_factory = std::function<std::unique_ptr<cast_link>(const device_endpoint&, link_events)>;

} // namespace googlecast

#endif
