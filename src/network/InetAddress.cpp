#include "backend/network/InetAddress.h"

#include <arpa/inet.h>
#include <cstring>

namespace backend {
namespace network {

namespace {

struct sockaddr_in MakeAddr(uint32_t hostOrderIp, uint16_t port) {
    struct sockaddr_in addr;
    std::memset(&addr, 0, sizeof addr);
    addr.sin_family = AF_INET;
    addr.sin_addr.s_addr = htonl(hostOrderIp);
    addr.sin_port = htons(port);
    return addr;
}

} // namespace

InetAddress::InetAddress(uint16_t port, bool loopbackOnly)
    : addr_(MakeAddr(loopbackOnly ? INADDR_LOOPBACK : INADDR_ANY, port)) {
}

std::optional<InetAddress> InetAddress::Parse(const std::string& ip, uint16_t port) {
    struct sockaddr_in addr = MakeAddr(INADDR_ANY, port);
    if (::inet_pton(AF_INET, ip.c_str(), &addr.sin_addr) != 1) {
        return std::nullopt;
    }
    return InetAddress(addr);
}

std::string InetAddress::toIpPort() const {
    char ip[INET_ADDRSTRLEN] = "";
    ::inet_ntop(AF_INET, &addr_.sin_addr, ip, sizeof ip);
    return std::string(ip) + ":" + std::to_string(toPort());
}

} // namespace network
} // namespace backend
