#pragma once

#include "backend/common/noncopyable.h"
#include "backend/network/Channel.h"
#include "backend/network/InetAddress.h"
#include "backend/network/Socket.h"

#include <functional>

namespace backend {
namespace network {

class EventLoop;

// Listening socket of a TcpServer. Binding happens in the constructor so
// that the chosen port is known before Listen().
class Acceptor : backend::common::noncopyable {
public:
    using NewConnectionCallback = std::function<void(int fd, const InetAddress& peer)>;

    Acceptor(EventLoop* loop, const InetAddress& addr, bool reusePort);
    ~Acceptor();

    void SetNewConnectionCallback(NewConnectionCallback cb) { onAccept_ = std::move(cb); }

    bool Bound() const { return bound_; }
    bool Listen();
    InetAddress LocalAddress() const { return socket_.LocalAddress(); }

private:
    void OnReadable();
    void ShedOneConnection();

    Socket socket_;
    Channel channel_;
    NewConnectionCallback onAccept_;
    bool bound_;
    bool listening_;
    // Held open so one slot can be freed when accept hits EMFILE.
    int reserveFd_;
};

} // namespace network
} // namespace backend
