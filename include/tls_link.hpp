#ifndef TLS_LINK_HPP
#define TLS_LINK_HPP

#include <atomic>
#include <future>
#include <mutex>
#include <string>
#include <string_view>

#include "socketwrapper.hpp"

#include "cast_link.hpp"

namespace googlecast
{

// CASTV2 framing (4 byte big endian length + protobuf) on a tls connection
class tls_link : public cast_link
{
public:

    tls_link() = delete;
    tls_link(const tls_link&) = delete;
    tls_link& operator=(const tls_link&) = delete;
    tls_link(tls_link&&) = delete;
    tls_link& operator=(tls_link&&) = delete;
    ~tls_link() override;

    tls_link(const device_endpoint& endpoint, link_events events, std::string_view cert_path, std::string_view key_path);

    void send(const cast_message& msg) override;

    static link_factory factory(std::string cert_path, std::string key_path);

private:

    void read_loop();

    void read_exact(char* dest, size_t len);

    link_events m_events;

    std::atomic<bool> m_keep;

    std::mutex m_send_mutex;

    net::tls_connection<net::ip_version::v4> m_sock;

    std::future<void> m_receiver;

};

} // namespace googlecast

#endif
