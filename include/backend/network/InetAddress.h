#pragma once

#include <netinet/in.h>
#include <optional>
#include <string>

namespace backend {
namespace network {

// IPv4 endpoint, stored in network byte order.
class InetAddress {
public:
    // Wildcard address, or 127.0.0.1 when loopbackOnly.
    explicit InetAddress(uint16_t port = 0, bool loopbackOnly = false);
    explicit InetAddress(const struct sockaddr_in& addr) : addr_(addr) {}

    // nullopt unless ip is a dotted-quad IPv4 address
    static std::optional<InetAddress> Parse(const std::string& ip, uint16_t port);

    std::string toIpPort() const;
    uint16_t toPort() const { return ntohs(addr_.sin_port); }

    const struct sockaddr* rawAddr() const { return reinterpret_cast<const struct sockaddr*>(&addr_); }
    socklen_t length() const { return static_cast<socklen_t>(sizeof addr_); }

private:
    struct sockaddr_in addr_;
};

} // namespace network
} // namespace backend
