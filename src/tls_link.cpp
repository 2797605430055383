#include "tls_link.hpp"

#include <array>
#include <cstring>
#include <stdexcept>
#include <vector>

#include <arpa/inet.h>
#include <sys/socket.h>

#include "cast_errors.hpp"
#include "log.hpp"

namespace googlecast
{

// Larger frames than this are not sent by receivers and indicate a broken stream
static constexpr uint32_t max_frame_size = 64 * 1024;

tls_link::tls_link(const device_endpoint& endpoint, link_events events, std::string_view cert_path, std::string_view key_path)
    : m_events {std::move(events)}, m_keep {true}, m_sock {cert_path, key_path, endpoint.ip, endpoint.port}
{
    m_receiver = std::async(std::launch::async, [this]()
    {
        this->read_loop();
    });
}

tls_link::~tls_link()
{
    m_keep = false;

    // Unblocks the pending read of the receiver thread
    ::shutdown(m_sock.get(), SHUT_RDWR);
    if(m_receiver.valid())
        m_receiver.wait();
}

void tls_link::send(const cast_message& msg)
{
    uint32_t len = msg.ByteSizeLong();

    std::vector<char> data;
    data.resize(4 + len);
    uint32_t be_len = htonl(len);
    std::memcpy(data.data(), &be_len, sizeof(be_len));

    if(!msg.SerializeToArray(&data[4], len))
        throw send_error {"Unable to serialize cast message"};

    std::lock_guard<std::mutex> lock {m_send_mutex};
    try {
        for(size_t bs = 0; bs < data.size(); )
            bs += m_sock.send(net::span {data.data() + bs, data.size() - bs});
    } catch(std::runtime_error& e) {
        throw send_error {e.what()};
    }
}

link_factory tls_link::factory(std::string cert_path, std::string key_path)
{
    return [cert_path = std::move(cert_path), key_path = std::move(key_path)](const device_endpoint& endpoint, link_events events)
        -> std::unique_ptr<cast_link>
    {
        try {
            return std::make_unique<tls_link>(endpoint, std::move(events), cert_path, key_path);
        } catch(std::runtime_error& e) {
            throw connection_error {"Unable to connect to " + endpoint.ip + ": " + e.what()};
        }
    };
}

void tls_link::read_exact(char* dest, size_t len)
{
    for(size_t br = 0; br < len; )
    {
        size_t n = m_sock.read(net::span {dest + br, len - br});
        if(n == 0)
            throw std::runtime_error {"Connection closed by peer"};
        br += n;
    }
}

void tls_link::read_loop()
{
    std::vector<char> buffer;
    while(m_keep)
    {
        try {
            // Read raw protobuf from the wire
            std::array<char, 4> header;
            read_exact(header.data(), header.size());

            uint32_t len;
            std::memcpy(&len, header.data(), sizeof(len));
            len = ntohl(len);
            if(len > max_frame_size)
                throw std::runtime_error {"Frame of " + std::to_string(len) + " bytes exceeds limit"};

            buffer.resize(len);
            read_exact(buffer.data(), len);

            if(cast_message msg; len > 0 && msg.ParseFromArray(buffer.data(), len))
                m_events.on_message(std::move(msg));
            else
                utils::log::warn("[Chromecast] Dropping unparsable frame of {} bytes", len);
        } catch(std::runtime_error& e) {
            if(m_keep)
                m_events.on_closed(e.what());
            return;
        }
    }
}

} // namespace googlecast
