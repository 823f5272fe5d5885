#pragma once

#include "backend/common/noncopyable.h"
#include "backend/network/Callbacks.h"
#include "backend/network/InetAddress.h"
#include "backend/network/TimerQueue.h"

#include <map>
#include <memory>
#include <string>

namespace backend {
namespace network {

class Acceptor;
class EventLoop;
class EventLoopThreadPool;

// Accepts on one address from the base loop and hands each connection to a
// worker loop. Configure before Start(); everything else runs on the base loop.
class TcpServer : backend::common::noncopyable {
public:
    enum Option {
        kNoReusePort,
        kReusePort,
    };

    TcpServer(EventLoop* loop, const InetAddress& listenAddr, const std::string& name,
              Option option = kNoReusePort);
    ~TcpServer();

    const std::string& name() const { return name_; }
    // Bound address; a requested port 0 shows the kernel's choice.
    const std::string& hostport() const { return hostport_; }
    uint16_t port() const { return port_; }

    void SetThreadNum(int numThreads);
    // 0 means no limit. Connections over the limit are closed on accept.
    void SetMaxConnections(int maxConnections) { maxConnections_ = maxConnections; }
    // 0 disables. Sweeps every sweepIntervalSec seconds.
    void SetIdleTimeout(double idleSec, double sweepIntervalSec = 1.0);

    void SetConnectionCallback(ConnectionCallback cb) { onConnection_ = std::move(cb); }
    void SetMessageCallback(MessageCallback cb) { onMessage_ = std::move(cb); }

    // Listens and starts the workers. False when the address could not be
    // bound or listened on; calling it again returns the first result.
    bool Start();

private:
    void OnNewConnection(int fd, const InetAddress& peer);
    void OnConnectionClosed(const TcpConnectionPtr& conn);
    void SweepIdle();

    EventLoop* loop_;
    const std::string name_;
    std::string hostport_;
    uint16_t port_;
    std::unique_ptr<Acceptor> acceptor_;
    std::unique_ptr<EventLoopThreadPool> workers_;

    ConnectionCallback onConnection_;
    MessageCallback onMessage_;

    bool started_;
    bool listening_;
    uint64_t nextConnId_;
    std::map<std::string, TcpConnectionPtr> connections_;

    int maxConnections_;
    double idleSec_;
    double sweepIntervalSec_;
    TimerId sweepTimer_;
};

} // namespace network
} // namespace backend
