#ifndef HTTP_CLIENT_HPP
#define HTTP_CLIENT_HPP

#include <cstdint>
#include <stdexcept>
#include <string>

#include "http/request.hpp"
#include "http/response.hpp"

namespace http
{

class http_error : public std::runtime_error
{
public:
    using std::runtime_error::runtime_error;
};

struct url
{
    std::string scheme;
    std::string host;
    uint16_t port = 80;
    std::string resource;       // Path plus query, always starts with '/'
};

// Accepts http:// and https:// locations, throws std::invalid_argument otherwise
url parse_url(const std::string& location);

// Blocking HTTP/1.0 client. Throws http_error on transport failures, any
// status code is returned.
class client
{
public:

    virtual ~client() = default;

    response get(const std::string& location) const;

    response post(const std::string& location, std::string body, const std::string& content_type) const;

    virtual response send(const url& target, request& req) const = 0;
};

} // namespace http

#endif
