#ifndef HTTP_RESPONSE_HPP
#define HTTP_RESPONSE_HPP

#include <map>
#include <string>
#include <string_view>

namespace http
{

class response
{
public:

    response() = default;

    // Throws std::invalid_argument when the status line or headers are malformed
    void parse(std::string_view raw);

    std::string to_string() const;

    void set_header(const std::string& key, const std::string& value);

    std::string get_header(const std::string& key) const;

    void set_code(int code)
    {
        m_code = code;
    }

    void set_code(int code, std::string&& phrase)
    {
        m_code = code; m_phrase = std::move(phrase);
    }

    void set_body(std::string body);

    int get_code() const
    {
        return m_code;
    }

    const std::string& get_body() const
    {
        return m_body;
    }

private:

    int m_code = 0;
    std::string m_phrase;
    std::string m_body;

    std::map<std::string, std::string> m_headers;

};

} // namespace http

#endif
