#pragma once

#include "backend/common/noncopyable.h"
#include "backend/network/Callbacks.h"
#include "backend/network/TimerQueue.h"

#include <atomic>
#include <functional>
#include <memory>
#include <mutex>
#include <thread>
#include <vector>

namespace backend {
namespace network {

class Channel;
class Epoller;

// Reactor owned by the thread that constructs it; at most one per thread.
// Quit, RunInLoop, QueueInLoop and the timer calls are safe from any thread.
class EventLoop : backend::common::noncopyable {
public:
    using Functor = std::function<void()>;

    EventLoop();
    ~EventLoop();

    // Runs until Quit(). Work queued before Quit() still runs.
    void Loop();
    // Async-signal-safe.
    void Quit();

    void RunInLoop(Functor cb);
    void QueueInLoop(Functor cb);

    TimerId RunAfter(double delaySec, TimerCallback cb);
    TimerId RunEvery(double intervalSec, TimerCallback cb);
    void Cancel(TimerId timerId);

    bool IsInLoopThread() const { return threadId_ == std::this_thread::get_id(); }
    static EventLoop* GetEventLoopOfCurrentThread();

    // Used by Channel.
    void UpdateChannel(Channel* channel);
    void RemoveChannel(Channel* channel);

private:
    void Notify();
    void DrainNotify();
    void RunQueued();
    TimerId ScheduleTimer(TimerCallback cb, double delaySec, double intervalSec);

    std::atomic<bool> quit_;
    std::atomic<bool> runningQueued_;
    const std::thread::id threadId_;

    std::unique_ptr<Epoller> epoller_;
    std::vector<Channel*> ready_;

    const int notifyFd_;
    std::unique_ptr<Channel> notifyChannel_;
    std::unique_ptr<TimerQueue> timers_;
    std::atomic<TimerId> nextTimerId_;

    std::mutex mutex_;
    std::vector<Functor> queued_;
};

} // namespace network
} // namespace backend
