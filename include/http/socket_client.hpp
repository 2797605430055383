#ifndef HTTP_SOCKET_CLIENT_HPP
#define HTTP_SOCKET_CLIENT_HPP

#include <chrono>
#include <string>

#include "http/client.hpp"

namespace http
{

// One tcp or tls connection per request, tls uses the given certificate and key.
// Reads and writes stalling longer than the timeout fail the request.
class socket_client : public client
{
public:

    socket_client(std::string cert_path, std::string key_path,
        std::chrono::milliseconds timeout = std::chrono::milliseconds {5000})
        : m_cert_path {std::move(cert_path)}, m_key_path {std::move(key_path)}, m_timeout {timeout}
    {}

    response send(const url& target, request& req) const override;

private:

    std::string m_cert_path;

    std::string m_key_path;

    std::chrono::milliseconds m_timeout;

};

} // namespace http

#endif
