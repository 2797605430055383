#include "http/socket_client.hpp"

#include <array>
#include <charconv>
#include <sys/socket.h>
#include <sys/time.h>

#include "socketwrapper.hpp"

#include "log.hpp"
#include "utils.hpp"

namespace http
{

static constexpr size_t max_response_size = 4 * 1024 * 1024;

// Reads until the peer closes or the announced body is complete
template<typename Connection>
static std::string read_response(Connection& conn)
{
    std::string raw;
    std::array<char, 4096> buffer;
    size_t expected = std::string::npos;
    while(raw.size() < max_response_size)
    {
        size_t br = 0;
        try {
            br = conn.read(net::span {buffer.data(), buffer.size()});
        } catch(std::runtime_error&) {
            // Tls peers often tear the session down without close_notify
            if(raw.empty() || (expected != std::string::npos && raw.size() < expected))
                throw;
            break;
        }
        if(br == 0)
            break;
        raw.append(buffer.data(), br);

        if(expected == std::string::npos)
        {
            size_t header_end = raw.find("\r\n\r\n");
            if(header_end != std::string::npos)
            {
                response head;
                head.parse(std::string_view {raw.data(), header_end + 4});
                std::string length = head.get_header("Content-Length");
                size_t content_length;
                if(!length.empty() && std::from_chars(length.data(), length.data() + length.size(), content_length).ec == std::errc {})
                    expected = header_end + 4 + content_length;
            }
        }
        if(expected != std::string::npos && raw.size() >= expected)
            break;
    }
    return raw;
}

template<typename Connection>
static void apply_timeout(Connection& conn, std::chrono::milliseconds timeout)
{
    timeval tv {};
    tv.tv_sec = static_cast<time_t>(timeout.count() / 1000);
    tv.tv_usec = static_cast<suseconds_t>((timeout.count() % 1000) * 1000);
    if(setsockopt(conn.get(), SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv)) != 0
        || setsockopt(conn.get(), SOL_SOCKET, SO_SNDTIMEO, &tv, sizeof(tv)) != 0)
        throw std::runtime_error {"Unable to set socket timeout"};
}

template<typename Connection>
static std::string exchange(Connection& conn, std::chrono::milliseconds timeout, std::string payload)
{
    apply_timeout(conn, timeout);
    for(size_t bs = 0; bs < payload.size(); )
        bs += conn.send(net::span {payload.data() + bs, payload.size() - bs});
    return read_response(conn);
}

response socket_client::send(const url& target, request& req) const
{
    req.set_header("Host", target.host);
    req.set_header("Connection", "close");
    req.set_header("Accept", "application/json");
    req.set_header("User-Agent", "lms_cast/1.0");

    std::string raw;
    try {
        std::string addr = utils::resolve_ipv4(target.host);
        if(target.scheme == "https")
        {
            net::tls_connection<net::ip_version::v4> conn {m_cert_path, m_key_path, addr, target.port};
            raw = exchange(conn, m_timeout, req.to_string());
        }
        else
        {
            net::tcp_connection<net::ip_version::v4> conn {addr, target.port};
            raw = exchange(conn, m_timeout, req.to_string());
        }
    } catch(const std::exception& e) {
        throw http_error {req.get_method() + " " + target.host + target.resource + " failed: " + e.what()};
    }

    response res;
    try {
        res.parse(raw);
    } catch(std::invalid_argument& e) {
        throw http_error {"Malformed response from " + target.host + ": " + e.what()};
    }

    utils::log::debug("[HTTP] {} {}{} -> {}", req.get_method(), target.host, target.resource, res.get_code());
    return res;
}

} // namespace http
