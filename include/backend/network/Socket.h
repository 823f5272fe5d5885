#pragma once

#include "backend/common/noncopyable.h"
#include "backend/network/InetAddress.h"

#include <sys/socket.h>

namespace backend {
namespace network {

// Owns a TCP socket fd; closes it on destruction. Failures are logged and
// reported through the return value.
class Socket : backend::common::noncopyable {
public:
    explicit Socket(int fd) : fd_(fd) {}
    ~Socket();

    // Non-blocking, close-on-exec IPv4 stream socket; -1 on failure.
    static int OpenNonblocking();

    int fd() const { return fd_; }

    bool Bind(const InetAddress& addr);
    bool Listen();
    // Connected fd (non-blocking, close-on-exec), or -1 with errno set.
    int Accept(InetAddress* peer);
    InetAddress LocalAddress() const;
    void ShutdownWrite();

    void SetReuseAddr(bool on) { SetFlag(SOL_SOCKET, SO_REUSEADDR, on, "SO_REUSEADDR"); }
    void SetReusePort(bool on) { SetFlag(SOL_SOCKET, SO_REUSEPORT, on, "SO_REUSEPORT"); }
    void SetKeepAlive(bool on) { SetFlag(SOL_SOCKET, SO_KEEPALIVE, on, "SO_KEEPALIVE"); }

private:
    void SetFlag(int level, int name, bool on, const char* what);

    const int fd_;
};

} // namespace network
} // namespace backend
