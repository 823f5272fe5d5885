#include "backend/network/Socket.h"
#include "backend/common/Logger.h"

#include <unistd.h>
#include <cerrno>
#include <cstring>

namespace backend {
namespace network {

int Socket::OpenNonblocking() {
    const int fd = ::socket(AF_INET, SOCK_STREAM | SOCK_NONBLOCK | SOCK_CLOEXEC, IPPROTO_TCP);
    if (fd < 0) {
        LOG_ERROR << "socket failed: " << std::strerror(errno);
    }
    return fd;
}

Socket::~Socket() {
    if (fd_ >= 0) {
        ::close(fd_);
    }
}

bool Socket::Bind(const InetAddress& addr) {
    if (::bind(fd_, addr.rawAddr(), addr.length()) == 0) {
        return true;
    }
    LOG_ERROR << "bind " << addr.toIpPort() << ": " << std::strerror(errno);
    return false;
}

bool Socket::Listen() {
    if (::listen(fd_, SOMAXCONN) == 0) {
        return true;
    }
    LOG_ERROR << "listen fd=" << fd_ << ": " << std::strerror(errno);
    return false;
}

int Socket::Accept(InetAddress* peer) {
    struct sockaddr_in addr;
    socklen_t len = sizeof addr;
    const int conn = ::accept4(fd_, reinterpret_cast<struct sockaddr*>(&addr), &len,
                               SOCK_NONBLOCK | SOCK_CLOEXEC);
    if (conn >= 0) {
        *peer = InetAddress(addr);
    }
    return conn;
}

InetAddress Socket::LocalAddress() const {
    struct sockaddr_in addr;
    std::memset(&addr, 0, sizeof addr);
    socklen_t len = sizeof addr;
    if (::getsockname(fd_, reinterpret_cast<struct sockaddr*>(&addr), &len) != 0) {
        LOG_ERROR << "getsockname fd=" << fd_ << ": " << std::strerror(errno);
    }
    return InetAddress(addr);
}

void Socket::ShutdownWrite() {
    if (::shutdown(fd_, SHUT_WR) != 0) {
        LOG_DEBUG << "shutdown fd=" << fd_ << ": " << std::strerror(errno);
    }
}

void Socket::SetFlag(int level, int name, bool on, const char* what) {
    const int value = on ? 1 : 0;
    if (::setsockopt(fd_, level, name, &value, sizeof value) != 0) {
        LOG_WARN << "setsockopt " << what << " fd=" << fd_ << ": " << std::strerror(errno);
    }
}

} // namespace network
} // namespace backend
