#include "http/webserver.hpp"

#include <array>
#include <cctype>
#include <charconv>
#include <string>

#include "log.hpp"

namespace http
{

static constexpr size_t max_request_size = 64 * 1024;

static void send_response(net::tcp_connection<net::ip_version::v4>& conn, const response& res)
{
    std::string out = res.to_string();
    size_t bs = 0;
    while(bs < out.size())
        bs += conn.send(net::span {out.data() + bs, out.size() - bs});
}

static response make_error(int code, std::string phrase)
{
    response res;
    res.set_code(code, std::move(phrase));
    res.set_header("Connection", "close");
    return res;
}

// Reads until the header block and the announced body are complete
static std::string read_request(net::tcp_connection<net::ip_version::v4>& conn)
{
    std::string raw;
    std::array<char, 4096> buffer;
    size_t expected = std::string::npos;
    while(raw.size() < max_request_size)
    {
        const size_t n = conn.read(net::span {buffer});
        if(n == 0)
            break;
        raw.append(buffer.data(), n);

        const size_t header_end = raw.find("\r\n\r\n");
        if(header_end == std::string::npos)
            continue;

        if(expected == std::string::npos)
        {
            size_t length = 0;
            std::string lower = raw.substr(0, header_end);
            for(auto& c : lower)
                c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
            const size_t pos = lower.find("content-length:");
            if(pos != std::string::npos)
            {
                size_t start = lower.find_first_not_of(' ', pos + 15);
                size_t end = lower.find("\r\n", pos);
                if(start != std::string::npos)
                    std::from_chars(lower.data() + start, lower.data() + end, length);
            }
            expected = header_end + 4 + length;
        }

        if(raw.size() >= expected)
            break;
    }

    return raw;
}

void webserver::handle_connection(net::tcp_connection<net::ip_version::v4>&& conn)
{
    request req;
    try {
        req.parse(read_request(conn));
    } catch(const std::exception& e) {
        utils::log::debug("[Control] Rejecting request: {}", e.what());
        send_response(conn, make_error(400, "Bad Request"));
        return;
    }

    response res;
    try {
        res = m_handler(req);
    } catch(const std::exception& e) {
        utils::log::error("[Control] {} {} failed: {}", req.get_method(), req.get_path(), e.what());
        res = make_error(500, "Internal Server Error");
    }

    res.set_header("Connection", "close");
    res.set_header("Access-Control-Allow-Origin", "*");
    res.set_header("Access-Control-Allow-Methods", "OPTIONS, GET, POST, DELETE");
    send_response(conn, res);
}

void webserver::serve(std::atomic<bool>& run_condition)
{
    utils::log::info("[Control] Webserver serving ...");
    while(run_condition.load())
    {
        try {
            auto conn = m_acceptor.accept();
            if(!run_condition.load())
                break;
            handle_connection(std::move(conn));
        } catch(const std::runtime_error& e) {
            utils::log::debug("[Control] Connection dropped: {}", e.what());
        }
    }

    utils::log::info("[Control] Webserver closing");
}

} // namespace http
