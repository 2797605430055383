#ifndef CAST_CONTROLLER_HPP
#define CAST_CONTROLLER_HPP

#include <cstdint>
#include <functional>
#include <optional>
#include <string>

#include <nlohmann/json.hpp>

using nlohmann::json;

namespace googlecast
{

// Playback zone the receiver app is told to mirror
struct cast_target
{
    std::string host;
    uint16_t port = 9000;
    std::string player;

    bool operator==(const cast_target& other) const
    {
        return host == other.host && port == other.port && player == other.player;
    }

    bool operator!=(const cast_target& other) const
    {
        return !(*this == other);
    }
};

class cast_controller
{
public:

    using cast_callback = std::function<void(bool)>;

    virtual ~cast_controller() = default;

    // Never throws. done(false) means "not casting" and is safe to retry.
    virtual void cast(const cast_target& target, cast_callback done) = 0;

    virtual bool stop() = 0;

    virtual bool casting() const = 0;

    // False while no device is set up to cast to
    virtual bool configured() const = 0;

    virtual std::optional<cast_target> current_target() const = 0;

    // Sends on the custom namespace of the running app, false when not casting
    virtual bool send_app_message(const json& message) = 0;
};

} // namespace googlecast

#endif
