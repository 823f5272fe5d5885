#include "backend/network/EventLoop.h"
#include "backend/network/Channel.h"
#include "backend/network/Epoller.h"
#include "backend/common/Logger.h"

#include <sys/eventfd.h>
#include <unistd.h>
#include <cerrno>
#include <cstring>

namespace backend {
namespace network {

namespace {

thread_local EventLoop* t_currentLoop = nullptr;

// Upper bound on one epoll_wait; timers and wakeups end it earlier.
const int kWaitMs = 10000;

int CreateNotifyFd() {
    int fd = ::eventfd(0, EFD_NONBLOCK | EFD_CLOEXEC);
    if (fd < 0) {
        LOG_FATAL << "eventfd failed: " << std::strerror(errno);
    }
    return fd;
}

TimerQueue::Clock::duration SecondsToDuration(double sec) {
    return std::chrono::duration_cast<TimerQueue::Clock::duration>(
        std::chrono::duration<double>(sec > 0.0 ? sec : 0.0));
}

} // namespace

EventLoop* EventLoop::GetEventLoopOfCurrentThread() {
    return t_currentLoop;
}

EventLoop::EventLoop()
    : quit_(false),
      runningQueued_(false),
      threadId_(std::this_thread::get_id()),
      epoller_(new Epoller),
      notifyFd_(CreateNotifyFd()),
      notifyChannel_(new Channel(this, notifyFd_)),
      nextTimerId_(1) {
    if (t_currentLoop != nullptr) {
        LOG_FATAL << "EventLoop " << t_currentLoop << " already runs in thread " << threadId_;
    }
    t_currentLoop = this;

    notifyChannel_->SetReadCallback([this]() { DrainNotify(); });
    notifyChannel_->EnableReading();
    timers_.reset(new TimerQueue(this));
}

EventLoop::~EventLoop() {
    timers_.reset();
    notifyChannel_->Remove();
    ::close(notifyFd_);
    t_currentLoop = nullptr;
}

void EventLoop::Loop() {
    LOG_DEBUG << "EventLoop " << this << " running";
    while (!quit_) {
        ready_.clear();
        epoller_->Wait(kWaitMs, &ready_);
        for (Channel* channel : ready_) {
            channel->Dispatch();
        }
        RunQueued();
    }
    // Pick up anything queued between the last pass and Quit().
    RunQueued();
    LOG_DEBUG << "EventLoop " << this << " stopped";
}

void EventLoop::Quit() {
    quit_ = true;
    if (!IsInLoopThread()) {
        Notify();
    }
}

void EventLoop::RunInLoop(Functor cb) {
    if (IsInLoopThread()) {
        cb();
        return;
    }
    QueueInLoop(std::move(cb));
}

void EventLoop::QueueInLoop(Functor cb) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        queued_.push_back(std::move(cb));
    }
    // From inside RunQueued the new functor would otherwise wait a full epoll_wait.
    if (!IsInLoopThread() || runningQueued_) {
        Notify();
    }
}

TimerId EventLoop::ScheduleTimer(TimerCallback cb, double delaySec, double intervalSec) {
    const TimerId id = nextTimerId_++;
    const TimerQueue::Clock::time_point when = TimerQueue::Clock::now() + SecondsToDuration(delaySec);
    const TimerQueue::Clock::duration interval = SecondsToDuration(intervalSec);
    RunInLoop([this, cb = std::move(cb), when, interval, id]() mutable {
        timers_->Add(std::move(cb), when, interval, id);
    });
    return id;
}

TimerId EventLoop::RunAfter(double delaySec, TimerCallback cb) {
    return ScheduleTimer(std::move(cb), delaySec, 0.0);
}

TimerId EventLoop::RunEvery(double intervalSec, TimerCallback cb) {
    return ScheduleTimer(std::move(cb), intervalSec, intervalSec);
}

void EventLoop::Cancel(TimerId timerId) {
    RunInLoop([this, timerId]() { timers_->Cancel(timerId); });
}

void EventLoop::UpdateChannel(Channel* channel) {
    epoller_->Sync(channel);
}

void EventLoop::RemoveChannel(Channel* channel) {
    epoller_->Forget(channel);
}

void EventLoop::Notify() {
    const uint64_t one = 1;
    if (::write(notifyFd_, &one, sizeof one) != static_cast<ssize_t>(sizeof one) && errno != EAGAIN) {
        LOG_ERROR << "EventLoop wakeup write failed: " << std::strerror(errno);
    }
}

void EventLoop::DrainNotify() {
    uint64_t count = 0;
    if (::read(notifyFd_, &count, sizeof count) != static_cast<ssize_t>(sizeof count) && errno != EAGAIN) {
        LOG_ERROR << "EventLoop wakeup read failed: " << std::strerror(errno);
    }
}

void EventLoop::RunQueued() {
    std::vector<Functor> batch;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        batch.swap(queued_);
    }
    runningQueued_ = true;
    for (Functor& fn : batch) {
        fn();
    }
    runningQueued_ = false;
}

} // namespace network
} // namespace backend
