#include "http/client.hpp"

#include <charconv>
#include <stdexcept>
#include <string_view>

namespace http
{

url parse_url(const std::string& location)
{
    url result;

    size_t scheme_end = location.find("://");
    if(scheme_end == std::string::npos)
        throw std::invalid_argument {"Not an absolute url: " + location};

    result.scheme = location.substr(0, scheme_end);
    if(result.scheme == "http")
        result.port = 80;
    else if(result.scheme == "https")
        result.port = 443;
    else
        throw std::invalid_argument {"Unsupported scheme: " + result.scheme};

    std::string_view view {location};
    view.remove_prefix(scheme_end + 3);

    size_t path_start = view.find('/');
    std::string_view authority = view.substr(0, path_start);
    result.resource = (path_start == std::string_view::npos) ? "/" : std::string {view.substr(path_start)};

    size_t colon = authority.find(':');
    result.host = std::string {authority.substr(0, colon)};
    if(colon != std::string_view::npos)
    {
        std::string_view port_view = authority.substr(colon + 1);
        auto res = std::from_chars(port_view.data(), port_view.data() + port_view.size(), result.port);
        if(res.ec != std::errc {} || res.ptr != port_view.data() + port_view.size() || result.port == 0)
            throw std::invalid_argument {"Invalid port in url: " + location};
    }

    if(result.host.empty())
        throw std::invalid_argument {"Missing host in url: " + location};

    return result;
}

response client::get(const std::string& location) const
{
    url target = parse_url(location);
    request req {"GET", target.resource};
    return send(target, req);
}

response client::post(const std::string& location, std::string body, const std::string& content_type) const
{
    url target = parse_url(location);
    request req {"POST", target.resource};
    req.set_header("Content-Type", content_type);
    req.set_body(std::move(body));
    return send(target, req);
}

} // namespace http
