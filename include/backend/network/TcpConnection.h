#pragma once

#include "backend/common/noncopyable.h"
#include "backend/network/Buffer.h"
#include "backend/network/Callbacks.h"
#include "backend/network/InetAddress.h"

#include <any>
#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <string>

namespace backend {
namespace network {

class Channel;
class EventLoop;
class Socket;

// An accepted connection. Shared between its TcpServer and any pending
// work; all socket I/O happens on the owning loop.
class TcpConnection : backend::common::noncopyable,
                      public std::enable_shared_from_this<TcpConnection> {
public:
    TcpConnection(EventLoop* loop, std::string name, int fd, const InetAddress& peer);
    ~TcpConnection();

    EventLoop* getLoop() const { return loop_; }
    const std::string& name() const { return name_; }
    const InetAddress& peerAddress() const { return peer_; }
    bool connected() const { return state_ == kConnected; }

    // Per-connection protocol state.
    void SetContext(std::any context) { context_ = std::move(context); }
    std::any* GetMutableContext() { return &context_; }

    // Thread safe. Send is ignored once Shutdown or ForceClose was called.
    void Send(const std::string& data);
    // Half-closes after the queued output has been written.
    void Shutdown();
    void ForceClose();

    std::chrono::steady_clock::time_point LastActiveTime() const;

    void SetConnectionCallback(ConnectionCallback cb) { onConnection_ = std::move(cb); }
    void SetMessageCallback(MessageCallback cb) { onMessage_ = std::move(cb); }
    void SetCloseCallback(CloseCallback cb) { onClose_ = std::move(cb); }

    // Called by TcpServer on the connection's loop.
    void ConnectEstablished();
    void ConnectDestroyed();

private:
    enum State { kConnecting, kConnected, kDisconnecting, kDisconnected };

    void OnReadable();
    void OnWritable();
    void OnClosed();

    void WriteInLoop(const std::string& data);
    void FinishShutdownInLoop();
    void Touch();

    EventLoop* loop_;
    const std::string name_;
    std::atomic<State> state_;
    std::unique_ptr<Socket> socket_;
    std::unique_ptr<Channel> channel_;
    const InetAddress peer_;

    ConnectionCallback onConnection_;
    MessageCallback onMessage_;
    CloseCallback onClose_;

    Buffer input_;
    Buffer output_;
    std::any context_;

    // steady_clock ticks; written on the I/O loop, read by the idle sweep.
    std::atomic<std::int64_t> lastActive_;
};

} // namespace network
} // namespace backend
