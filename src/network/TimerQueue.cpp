#include "backend/network/TimerQueue.h"
#include "backend/network/EventLoop.h"
#include "backend/common/Logger.h"

#include <sys/timerfd.h>
#include <unistd.h>
#include <cerrno>
#include <cstring>
#include <vector>

namespace backend {
namespace network {

namespace {

int CreateTimerfd() {
    int fd = ::timerfd_create(CLOCK_MONOTONIC, TFD_NONBLOCK | TFD_CLOEXEC);
    if (fd < 0) {
        LOG_FATAL << "timerfd_create failed: " << std::strerror(errno);
    }
    return fd;
}

} // namespace

TimerQueue::TimerQueue(EventLoop* loop)
    : timerfd_(CreateTimerfd()),
      timerfd_channel_(loop, timerfd_),
      running_callbacks_(false) {
    timerfd_channel_.SetReadCallback([this]() { HandleRead(); });
    timerfd_channel_.EnableReading();
}

TimerQueue::~TimerQueue() {
    timerfd_channel_.Remove();
    ::close(timerfd_);
}

TimerId TimerQueue::Add(TimerCallback cb, Clock::time_point when, Clock::duration interval, TimerId id) {
    const bool earliestChanged = timers_.empty() || Key(when, id) < timers_.begin()->first;
    timers_.emplace(Key(when, id), Entry{std::move(cb), interval});
    active_[id] = when;
    if (earliestChanged) {
        ResetTimerfd();
    }
    return id;
}

void TimerQueue::Cancel(TimerId id) {
    auto it = active_.find(id);
    if (it != active_.end()) {
        timers_.erase(Key(it->second, id));
        active_.erase(it);
        return;
    }
    if (running_callbacks_) {
        cancelled_while_running_.insert(id);
    }
}

void TimerQueue::ResetTimerfd() {
    struct itimerspec when;
    std::memset(&when, 0, sizeof when);
    if (!timers_.empty()) {
        auto delta = timers_.begin()->first.first - Clock::now();
        auto ns = std::chrono::duration_cast<std::chrono::nanoseconds>(delta).count();
        // zero disarms the timerfd, so overdue timers get the smallest positive value
        if (ns < 1000) ns = 1000;
        when.it_value.tv_sec = static_cast<time_t>(ns / 1000000000LL);
        when.it_value.tv_nsec = static_cast<long>(ns % 1000000000LL);
    }
    if (::timerfd_settime(timerfd_, 0, &when, nullptr) != 0) {
        LOG_ERROR << "timerfd_settime failed: " << std::strerror(errno);
    }
}

void TimerQueue::HandleRead() {
    uint64_t howmany = 0;
    ssize_t n = ::read(timerfd_, &howmany, sizeof howmany);
    if (n != sizeof howmany && errno != EAGAIN) {
        LOG_ERROR << "TimerQueue::HandleRead reads " << n << " bytes instead of 8";
    }

    const Clock::time_point now = Clock::now();
    std::vector<std::pair<TimerId, Entry>> expired;
    auto end = timers_.upper_bound(Key(now, UINT64_MAX));
    for (auto it = timers_.begin(); it != end; ++it) {
        expired.emplace_back(it->first.second, std::move(it->second));
        active_.erase(it->first.second);
    }
    timers_.erase(timers_.begin(), end);

    running_callbacks_ = true;
    cancelled_while_running_.clear();
    for (auto& e : expired) {
        e.second.callback();
    }
    running_callbacks_ = false;

    for (auto& e : expired) {
        const TimerId id = e.first;
        if (e.second.interval > Clock::duration::zero() && cancelled_while_running_.count(id) == 0) {
            const Clock::time_point next = now + e.second.interval;
            timers_.emplace(Key(next, id), std::move(e.second));
            active_[id] = next;
        }
    }
    cancelled_while_running_.clear();
    ResetTimerfd();
}

} // namespace network
} // namespace backend
