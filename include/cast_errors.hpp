#ifndef CAST_ERRORS_HPP
#define CAST_ERRORS_HPP

#include <stdexcept>
#include <string>

namespace googlecast
{

// Socket level failure: connect refused, tls handshake, peer closed
class connection_error : public std::runtime_error
{
public:
    using std::runtime_error::runtime_error;
};

// No confirming RECEIVER_STATUS within the launch timeout
class launch_timeout : public std::runtime_error
{
public:
    using std::runtime_error::runtime_error;
};

// Device rejected the launch or the app vanished while launching
class launch_error : public std::runtime_error
{
public:
    using std::runtime_error::runtime_error;
};

// Operation needs a channel that is not bound (yet)
class channel_unavailable : public std::runtime_error
{
public:
    using std::runtime_error::runtime_error;
};

// Write failed on an otherwise open channel
class send_error : public std::runtime_error
{
public:
    using std::runtime_error::runtime_error;
};

} // namespace googlecast

#endif
