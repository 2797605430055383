#ifndef HTTP_WEBSERVER_HPP
#define HTTP_WEBSERVER_HPP

#include <atomic>
#include <cstdint>
#include <functional>

#include "socketwrapper.hpp"

#include "http/request.hpp"
#include "http/response.hpp"

namespace http
{

// Plain http server handling one connection at a time
class webserver
{
public:

    using handler = std::function<response(const request&)>;

    webserver() = delete;
    webserver(const webserver&) = delete;
    webserver& operator=(const webserver&) = delete;
    webserver(webserver&&) = default;
    webserver& operator=(webserver&&) = default;
    ~webserver() = default;

    webserver(uint16_t port, handler on_request)
        : m_acceptor {"0.0.0.0", port}, m_handler {std::move(on_request)}
    {}

    // Serves until run_condition is false and the next connection was accepted
    void serve(std::atomic<bool>& run_condition);

private:

    void handle_connection(net::tcp_connection<net::ip_version::v4>&& conn);

    net::tcp_acceptor<net::ip_version::v4> m_acceptor;

    handler m_handler;

};

} // namespace http

#endif
