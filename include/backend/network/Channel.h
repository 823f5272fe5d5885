#pragma once

#include "backend/common/noncopyable.h"

#include <cstdint>
#include <functional>
#include <memory>

namespace backend {
namespace network {

class EventLoop;
class Epoller;

// Interest set and callbacks for one fd inside one EventLoop. The fd is
// owned elsewhere. All calls happen on the loop's thread.
class Channel : backend::common::noncopyable {
public:
    using Callback = std::function<void()>;

    Channel(EventLoop* loop, int fd);
    ~Channel();

    void SetReadCallback(Callback cb) { onReadable_ = std::move(cb); }
    void SetWriteCallback(Callback cb) { onWritable_ = std::move(cb); }
    void SetCloseCallback(Callback cb) { onHangup_ = std::move(cb); }

    // Callbacks are skipped once owner has been destroyed, and owner is
    // held alive while they run.
    void Tie(const std::shared_ptr<void>& owner);

    void EnableReading();
    void EnableWriting();
    void DisableWriting();
    void DisableAll();
    bool IsWriting() const;

    // Drops the fd from the loop's epoll set.
    void Remove();

    // Runs the callbacks for the events the last epoll_wait reported.
    void Dispatch();

    int fd() const { return fd_; }

private:
    friend class Epoller;

    void SetInterest(uint32_t interest);
    void DispatchReady();

    EventLoop* loop_;
    const int fd_;
    uint32_t interest_;
    uint32_t ready_;
    bool inEpoll_;

    std::weak_ptr<void> owner_;
    bool tied_;

    Callback onReadable_;
    Callback onWritable_;
    Callback onHangup_;
};

} // namespace network
} // namespace backend
