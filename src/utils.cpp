#include <utils.hpp>

#include <array>
#include <bitset>
#include <memory>
#include <stdexcept>
#include <ifaddrs.h>
#include <sys/socket.h>
#include <netdb.h>
#include <net/if.h>
#include <netinet/in.h>
#include <arpa/inet.h>
#include <cctype>
#include <csignal>

namespace utils
{

const char* error_msg = "Unable to get local ip address";

std::string get_local_ipaddr()
{
    ifaddrs* addrs;
    if (getifaddrs(&addrs))
        throw std::runtime_error {error_msg};

    std::unique_ptr<ifaddrs, decltype(&freeifaddrs)> guard {addrs, &freeifaddrs};

    for (ifaddrs* curr_addr = addrs; curr_addr != nullptr; curr_addr = curr_addr->ifa_next)
    {
        if(curr_addr->ifa_addr == nullptr || curr_addr->ifa_addr->sa_family != AF_INET)
            continue;

        std::array<char, NI_MAXHOST> host;
        int s = getnameinfo(curr_addr->ifa_addr, sizeof(sockaddr_in), host.data(), NI_MAXHOST, nullptr, 0, NI_NUMERICHOST);
        if(s != 0)
            throw std::runtime_error {error_msg};

        std::bitset<sizeof(unsigned int) * 8> flags {curr_addr->ifa_flags};
        if (flags.test(IFF_UP) && !flags.test(IFF_LOOPBACK))
            return host.data();
    }

    throw std::runtime_error {error_msg};
}

std::string resolve_ipv4(const std::string& host)
{
    in_addr probe;
    if(inet_pton(AF_INET, host.c_str(), &probe) == 1)
        return host;

    addrinfo hints {};
    hints.ai_family = AF_INET;
    hints.ai_socktype = SOCK_STREAM;

    addrinfo* result = nullptr;
    if(int rc = getaddrinfo(host.c_str(), nullptr, &hints, &result); rc != 0 || result == nullptr)
        throw std::runtime_error {"Unable to resolve " + host + ": " + gai_strerror(rc)};

    std::unique_ptr<addrinfo, decltype(&freeaddrinfo)> guard {result, &freeaddrinfo};

    std::array<char, INET_ADDRSTRLEN> buffer;
    const auto* addr = reinterpret_cast<const sockaddr_in*>(result->ai_addr);
    if(inet_ntop(AF_INET, &addr->sin_addr, buffer.data(), buffer.size()) == nullptr)
        throw std::runtime_error {"Unable to resolve " + host};

    return buffer.data();
}

void ignore_broken_pipe()
{
    struct sigaction action {};
    action.sa_handler = SIG_IGN;
    sigemptyset(&action.sa_mask);
    if(sigaction(SIGPIPE, &action, nullptr) != 0)
        throw std::runtime_error {"Unable to ignore SIGPIPE"};
}

std::string url_encode(std::string_view value)
{
    static constexpr const char* hex = "0123456789ABCDEF";

    std::string encoded;
    encoded.reserve(value.size());
    for(unsigned char c : value)
    {
        if(std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == '~')
        {
            encoded += static_cast<char>(c);
        }
        else
        {
            encoded += '%';
            encoded += hex[c >> 4];
            encoded += hex[c & 0x0F];
        }
    }

    return encoded;
}

} // utils
