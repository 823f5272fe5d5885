#include "backend/network/TcpConnection.h"
#include "backend/network/Channel.h"
#include "backend/network/EventLoop.h"
#include "backend/network/Socket.h"
#include "backend/common/Logger.h"

#include <unistd.h>
#include <cerrno>
#include <cstring>

namespace backend {
namespace network {

namespace {

std::int64_t NowTicks() {
    return std::chrono::steady_clock::now().time_since_epoch().count();
}

} // namespace

TcpConnection::TcpConnection(EventLoop* loop, std::string name, int fd, const InetAddress& peer)
    : loop_(loop),
      name_(std::move(name)),
      state_(kConnecting),
      socket_(new Socket(fd)),
      channel_(new Channel(loop, fd)),
      peer_(peer),
      lastActive_(NowTicks()) {
    channel_->SetReadCallback([this]() { OnReadable(); });
    channel_->SetWriteCallback([this]() { OnWritable(); });
    channel_->SetCloseCallback([this]() { OnClosed(); });
    socket_->SetKeepAlive(true);
    LOG_DEBUG << "TcpConnection[" << name_ << "] fd=" << fd << " from " << peer_.toIpPort();
}

TcpConnection::~TcpConnection() {
    LOG_DEBUG << "TcpConnection[" << name_ << "] released";
}

void TcpConnection::ConnectEstablished() {
    state_ = kConnected;
    Touch();
    channel_->Tie(shared_from_this());
    channel_->EnableReading();
    if (onConnection_) {
        onConnection_(shared_from_this());
    }
}

void TcpConnection::ConnectDestroyed() {
    // Reached without OnClosed when the server itself goes away.
    if (state_ != kDisconnected) {
        state_ = kDisconnected;
        channel_->DisableAll();
        if (onConnection_) {
            onConnection_(shared_from_this());
        }
    }
    channel_->Remove();
}

void TcpConnection::OnReadable() {
    int err = 0;
    const ssize_t n = input_.ReadFd(channel_->fd(), &err);
    if (n > 0) {
        Touch();
        if (onMessage_) {
            onMessage_(shared_from_this(), &input_);
        }
        return;
    }
    if (n < 0 && (err == EAGAIN || err == EINTR)) {
        return;
    }
    if (n < 0) {
        LOG_DEBUG << "TcpConnection[" << name_ << "] read: " << std::strerror(err);
    }
    OnClosed();
}

void TcpConnection::OnWritable() {
    if (!channel_->IsWriting()) {
        return;
    }
    const ssize_t n = ::write(channel_->fd(), output_.Peek(), output_.ReadableBytes());
    if (n < 0) {
        if (errno != EAGAIN && errno != EINTR) {
            LOG_DEBUG << "TcpConnection[" << name_ << "] write: " << std::strerror(errno);
        }
        return;
    }
    Touch();
    output_.Retrieve(static_cast<size_t>(n));
    if (output_.ReadableBytes() == 0) {
        channel_->DisableWriting();
        if (state_ == kDisconnecting) {
            FinishShutdownInLoop();
        }
    }
}

void TcpConnection::OnClosed() {
    if (state_ == kDisconnected) {
        return;
    }
    state_ = kDisconnected;
    channel_->DisableAll();

    TcpConnectionPtr self(shared_from_this());
    LOG_DEBUG << "TcpConnection[" << name_ << "] closed";
    if (onConnection_) {
        onConnection_(self);
    }
    if (onClose_) {
        onClose_(self);
    }
}

void TcpConnection::Send(const std::string& data) {
    if (state_ != kConnected) {
        return;
    }
    if (loop_->IsInLoopThread()) {
        WriteInLoop(data);
        return;
    }
    TcpConnectionPtr self(shared_from_this());
    loop_->QueueInLoop([self, data]() { self->WriteInLoop(data); });
}

void TcpConnection::WriteInLoop(const std::string& data) {
    if (state_ == kDisconnected) {
        return;
    }
    size_t written = 0;
    // Write straight to the socket unless earlier output is still queued.
    if (!channel_->IsWriting() && output_.ReadableBytes() == 0) {
        const ssize_t n = ::write(channel_->fd(), data.data(), data.size());
        if (n >= 0) {
            written = static_cast<size_t>(n);
            Touch();
        } else if (errno != EAGAIN) {
            LOG_DEBUG << "TcpConnection[" << name_ << "] write: " << std::strerror(errno);
            // The peer is gone; OnReadable will see it.
            return;
        }
    }
    if (written < data.size()) {
        output_.Append(data.data() + written, data.size() - written);
        if (!channel_->IsWriting()) {
            channel_->EnableWriting();
        }
    }
}

void TcpConnection::Shutdown() {
    State expected = kConnected;
    if (!state_.compare_exchange_strong(expected, kDisconnecting)) {
        return;
    }
    TcpConnectionPtr self(shared_from_this());
    loop_->RunInLoop([self]() {
        if (!self->channel_->IsWriting()) {
            self->FinishShutdownInLoop();
        }
    });
}

void TcpConnection::FinishShutdownInLoop() {
    socket_->ShutdownWrite();
}

void TcpConnection::ForceClose() {
    const State s = state_;
    if (s != kConnected && s != kDisconnecting) {
        return;
    }
    TcpConnectionPtr self(shared_from_this());
    loop_->QueueInLoop([self]() { self->OnClosed(); });
}

void TcpConnection::Touch() {
    lastActive_.store(NowTicks(), std::memory_order_relaxed);
}

std::chrono::steady_clock::time_point TcpConnection::LastActiveTime() const {
    return std::chrono::steady_clock::time_point(
        std::chrono::steady_clock::duration(lastActive_.load(std::memory_order_relaxed)));
}

} // namespace network
} // namespace backend
