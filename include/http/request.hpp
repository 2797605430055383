#ifndef HTTP_REQUEST_HPP
#define HTTP_REQUEST_HPP

#include <map>
#include <string>
#include <string_view>

namespace http
{

class request
{

public:

    request() = default;
    request(const request& other) = default;
    request(request&& other) noexcept = default;
    request& operator=(const request& other) = default;
    request& operator=(request&& other) noexcept = default;

    // Outgoing request for the given method and resource (path plus optional query)
    request(std::string method, std::string resource);

    // Throws std::invalid_argument on malformed input
    void parse(std::string_view request);

    std::string to_string() const;

    bool check_header(const std::string& key) const;

    std::string get_header(const std::string& key) const;

    void set_header(const std::string& key, const std::string& value);

    void set_body(std::string body);

    const std::string& get_method() const { return m_method; }

    const std::string& get_resource() const { return m_resource; }

    const std::string& get_protocol() const { return m_protocol; }

    const std::string& get_path() const { return m_path; }

    const std::string& get_body() const { return m_body; }

    const std::map<std::string, std::string>& get_params() const { return m_query_params; }

    std::string get_param(const std::string& key) const;

    static std::string url_decode(std::string_view value);

private:

    void parse_requestline(std::string_view requestline);

    static void parse_params(std::string_view param_string, std::map<std::string, std::string>& param_container);

    std::string m_method;       /// http method used by this request (e.g. post, get, ...)
    std::string m_protocol = "HTTP/1.0";
    std::string m_resource;     /// resource addressed by this request
    std::string m_path;         /// path of the resource addressed by this request
    std::string m_body;

    std::map<std::string, std::string> m_query_params; /// contains names and values of the query string
    std::map<std::string, std::string> m_headers; /// contains names and values of the http request headers

};

} // namespace http

#endif
