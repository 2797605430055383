#include "http/request.hpp"

#include <cctype>
#include <charconv>
#include <stdexcept>

namespace http
{

// Header names are matched case insensitively by storing them in canonical form
static std::string canonical_header(std::string_view name)
{
    std::string result {name};
    bool upper = true;
    for(auto& c : result)
    {
        c = upper ? std::toupper(static_cast<unsigned char>(c)) : std::tolower(static_cast<unsigned char>(c));
        upper = (c == '-');
    }
    return result;
}

request::request(std::string method, std::string resource)
    : m_method {std::move(method)}, m_resource {std::move(resource)}
{
    size_t pos_q = m_resource.find('?');
    m_path = m_resource.substr(0, pos_q);
    if(pos_q != std::string::npos)
        parse_params(std::string_view {m_resource}.substr(pos_q + 1), m_query_params);
}

void request::parse(std::string_view request)
{
    size_t pos_q = request.find("\r\n");
    if(pos_q == std::string_view::npos)
        throw std::invalid_argument {"invalid_request"};
    parse_requestline(request.substr(0, pos_q));

    /* Parse resource to path and params */
    m_query_params.clear();
    if((pos_q = m_resource.find('?')) == std::string::npos)
    {
        m_path = m_resource;
    }
    else
    {
        m_path = m_resource.substr(0, pos_q);
        parse_params(std::string_view {m_resource}.substr(pos_q + 1), m_query_params);
    }

    /* Read and parse request headers */
    m_headers.clear();
    size_t start_pos = request.find("\r\n") + 2;
    while(true)
    {
        size_t end_pos = request.find("\r\n", start_pos);
        if(end_pos == std::string_view::npos)
            throw std::invalid_argument {"invalid_request"};
        if(end_pos == start_pos)
        {
            start_pos += 2;
            break;
        }

        std::string_view headerline = request.substr(start_pos, end_pos - start_pos);
        size_t mid_pos = headerline.find(':');
        if(mid_pos == std::string_view::npos)
            throw std::invalid_argument {"invalid_request"};

        std::string_view value = headerline.substr(mid_pos + 1);
        while(!value.empty() && value.front() == ' ')
            value.remove_prefix(1);
        m_headers[canonical_header(headerline.substr(0, mid_pos))] = std::string {value};

        start_pos = end_pos + 2;
    }

    /* Body is limited by Content-Length if present */
    std::string_view body = request.substr(start_pos);
    if(check_header("Content-Length"))
    {
        std::string hdr = get_header("Content-Length");
        size_t length = 0;
        auto res = std::from_chars(hdr.data(), hdr.data() + hdr.size(), length);
        if(res.ec == std::errc {} && length < body.size())
            body = body.substr(0, length);
    }
    m_body = std::string {body};
}

std::string request::to_string() const
{
    std::string request;
    (((((request += m_method) += " ") += m_resource) += " ") += m_protocol) += "\r\n";

    for(const auto& it : m_headers)
        (((request += it.first) += ": ") += it.second) += "\r\n";

    request += "\r\n";
    request += m_body;

    return request;
}

void request::set_body(std::string body)
{
    m_body = std::move(body);
    m_headers["Content-Length"] = std::to_string(m_body.size());
}

void request::set_header(const std::string& key, const std::string& value)
{
    m_headers[canonical_header(key)] = value;
}

void request::parse_requestline(std::string_view requestline)
{
    size_t last_index = 0, vec_index = 0;
    std::string_view tmp_store[3];
    for(size_t i = 0; i < requestline.size() && vec_index < 3; i++)
    {
        if(requestline[i] == ' ' || i + 1 == requestline.size())
        {
            size_t end = (requestline[i] == ' ') ? i : i + 1;
            tmp_store[vec_index] = requestline.substr(last_index, end - last_index);
            last_index = i + 1;
            vec_index++;
        }
    }

    if(vec_index != 3)
        throw std::invalid_argument {"invalid_requestline"};

    m_method = std::string {tmp_store[0]};
    m_resource = std::string {tmp_store[1]};
    m_protocol = std::string {tmp_store[2]};
}

void request::parse_params(std::string_view param_string, std::map<std::string, std::string>& param_container)
{
    size_t offset = 0;
    for(size_t i = 0; i <= param_string.length(); i++)
    {
        if(i == param_string.length() || param_string[i] == '&' || param_string[i] == '#')
        {
            std::string_view param = param_string.substr(offset, i - offset);
            size_t pos = param.find('=');
            if(pos != std::string_view::npos)
                param_container[url_decode(param.substr(0, pos))] = url_decode(param.substr(pos + 1));
            offset = i + 1;
            if(i < param_string.length() && param_string[i] == '#')
                break;
        }
    }
}

std::string request::url_decode(std::string_view value)
{
    std::string decoded;
    decoded.reserve(value.size());
    for(size_t i = 0; i < value.size(); ++i)
    {
        if(value[i] == '+')
        {
            decoded += ' ';
        }
        else if(value[i] == '%' && i + 2 < value.size())
        {
            unsigned int code = 0;
            auto res = std::from_chars(value.data() + i + 1, value.data() + i + 3, code, 16);
            if(res.ec == std::errc {} && res.ptr == value.data() + i + 3)
            {
                decoded += static_cast<char>(code);
                i += 2;
            }
            else
            {
                decoded += value[i];
            }
        }
        else
        {
            decoded += value[i];
        }
    }
    return decoded;
}

bool request::check_header(const std::string& key) const
{
    return m_headers.find(canonical_header(key)) != m_headers.end();
}

std::string request::get_header(const std::string& key) const
{
    auto it = m_headers.find(canonical_header(key));
    return (it == m_headers.end()) ? "" : it->second;
}

std::string request::get_param(const std::string& key) const
{
    try {
        return m_query_params.at(key);
    } catch(std::out_of_range& e) {
        return "";
    }
}

} // namespace http
