#include <http/response.hpp>

#include <algorithm>
#include <cctype>
#include <charconv>
#include <stdexcept>

namespace http
{

static std::string get_http_phrase(int status_code)
{
    switch(status_code)
    {
        case 200: return "OK";
        case 204: return "No Content";
        case 400: return "Bad Request";
        case 404: return "Not Found";
        case 405: return "Method Not Allowed";
        case 500: return "Internal Server Error";
        case 503: return "Service Unavailable";
        default: return "Unknown";
    }
}

static std::string lower(std::string_view value)
{
    std::string result {value};
    std::transform(result.begin(), result.end(), result.begin(), [](unsigned char c)
    {
        return std::tolower(c);
    });
    return result;
}

void response::parse(std::string_view raw)
{
    size_t line_end = raw.find("\r\n");
    if(line_end == std::string_view::npos)
        throw std::invalid_argument {"invalid_response"};

    /* Status line: HTTP/1.x <code> <phrase> */
    std::string_view status_line = raw.substr(0, line_end);
    size_t sp1 = status_line.find(' ');
    if(sp1 == std::string_view::npos || status_line.substr(0, 5) != "HTTP/")
        throw std::invalid_argument {"invalid_statusline"};

    size_t sp2 = status_line.find(' ', sp1 + 1);
    std::string_view code = status_line.substr(sp1 + 1, (sp2 == std::string_view::npos) ? std::string_view::npos : sp2 - sp1 - 1);
    auto res = std::from_chars(code.data(), code.data() + code.size(), m_code);
    if(res.ec != std::errc {})
        throw std::invalid_argument {"invalid_statusline"};
    m_phrase = (sp2 == std::string_view::npos) ? std::string {} : std::string {status_line.substr(sp2 + 1)};

    /* Headers until the empty line */
    m_headers.clear();
    size_t start_pos = line_end + 2;
    while(true)
    {
        size_t end_pos = raw.find("\r\n", start_pos);
        if(end_pos == std::string_view::npos)
            throw std::invalid_argument {"invalid_headers"};
        if(end_pos == start_pos)
        {
            start_pos += 2;
            break;
        }

        std::string_view headerline = raw.substr(start_pos, end_pos - start_pos);
        size_t mid_pos = headerline.find(':');
        if(mid_pos != std::string_view::npos)
        {
            std::string_view value = headerline.substr(mid_pos + 1);
            while(!value.empty() && value.front() == ' ')
                value.remove_prefix(1);
            m_headers[lower(headerline.substr(0, mid_pos))] = std::string {value};
        }
        start_pos = end_pos + 2;
    }

    std::string_view body = raw.substr(start_pos);
    std::string length = get_header("Content-Length");
    size_t content_length = 0;
    if(!length.empty() && std::from_chars(length.data(), length.data() + length.size(), content_length).ec == std::errc {}
        && content_length < body.size())
        body = body.substr(0, content_length);
    m_body = std::string {body};
}

std::string response::to_string() const
{
    std::string response;

    /* Begin with response line */
    const int code = (m_code == 0) ? 200 : m_code;
    response.append("HTTP/1.1 " + std::to_string(code) + " " + (m_phrase.empty() ? get_http_phrase(code) : m_phrase) + "\r\n");

    /* Append all headers to response */
    bool has_type = false;
    for(const auto& it : m_headers)
    {
        has_type = has_type || it.first == "content-type";
        response.append(it.first + ": " + it.second + "\r\n");
    }
    if(!has_type)
        response.append("content-type: application/json\r\n");

    /* Append body to response line */
    response.append("\r\n");
    response.append(m_body);

    return response;
}

void response::set_header(const std::string& key, const std::string& value)
{
    m_headers[lower(key)] = value;
}

std::string response::get_header(const std::string& key) const
{
    auto it = m_headers.find(lower(key));
    return (it == m_headers.end()) ? "" : it->second;
}

void response::set_body(std::string body)
{
    m_body = std::move(body);
    set_header("Content-Length", std::to_string(m_body.size()));
}

} // namespace http
