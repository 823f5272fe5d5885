#include "backend/network/Acceptor.h"
#include "backend/network/EventLoop.h"
#include "backend/common/Logger.h"

#include <fcntl.h>
#include <unistd.h>
#include <cerrno>
#include <cstring>

namespace backend {
namespace network {

namespace {

int OpenReserveFd() {
    return ::open("/dev/null", O_RDONLY | O_CLOEXEC);
}

} // namespace

Acceptor::Acceptor(EventLoop* loop, const InetAddress& addr, bool reusePort)
    : socket_(Socket::OpenNonblocking()),
      channel_(loop, socket_.fd()),
      bound_(false),
      listening_(false),
      reserveFd_(OpenReserveFd()) {
    if (socket_.fd() >= 0) {
        socket_.SetReuseAddr(true);
        if (reusePort) {
            socket_.SetReusePort(true);
        }
        bound_ = socket_.Bind(addr);
    }
    channel_.SetReadCallback([this]() { OnReadable(); });
}

Acceptor::~Acceptor() {
    if (listening_) {
        channel_.Remove();
    }
    if (reserveFd_ >= 0) {
        ::close(reserveFd_);
    }
}

bool Acceptor::Listen() {
    if (!bound_ || !socket_.Listen()) {
        return false;
    }
    listening_ = true;
    channel_.EnableReading();
    return true;
}

void Acceptor::OnReadable() {
    InetAddress peer;
    const int fd = socket_.Accept(&peer);
    if (fd >= 0) {
        if (onAccept_) {
            onAccept_(fd, peer);
        } else {
            ::close(fd);
        }
        return;
    }

    const int err = errno;
    if (err == EAGAIN || err == EINTR || err == ECONNABORTED) {
        return;
    }
    LOG_ERROR << "accept on " << LocalAddress().toIpPort() << ": " << std::strerror(err);
    if (err == EMFILE) {
        ShedOneConnection();
    }
}

// Level-triggered epoll keeps reporting the pending connection, so take it
// with the reserved descriptor and close it at once.
void Acceptor::ShedOneConnection() {
    if (reserveFd_ < 0) {
        return;
    }
    ::close(reserveFd_);
    const int fd = ::accept(socket_.fd(), nullptr, nullptr);
    if (fd >= 0) {
        ::close(fd);
    }
    reserveFd_ = OpenReserveFd();
}

} // namespace network
} // namespace backend
