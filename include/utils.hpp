#ifndef LMS_CAST_UTILS_HPP
#define LMS_CAST_UTILS_HPP

#include <string>
#include <string_view>

namespace utils
{

// First non-loopback IPv4 address of this host
std::string get_local_ipaddr();

// Resolves a host name or dotted address to a dotted IPv4 address
std::string resolve_ipv4(const std::string& host);

// Writes to a reset peer fail with EPIPE instead of raising SIGPIPE
void ignore_broken_pipe();

// Percent-encodes everything except RFC 3986 unreserved characters
std::string url_encode(std::string_view value);

} // namespace utils

#endif
