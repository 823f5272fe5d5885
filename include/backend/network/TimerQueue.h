#pragma once

#include "backend/common/noncopyable.h"
#include "backend/network/Callbacks.h"
#include "backend/network/Channel.h"

#include <chrono>
#include <cstdint>
#include <map>
#include <set>
#include <utility>

namespace backend {
namespace network {

class EventLoop;

using TimerId = std::uint64_t;

// Timers of one EventLoop, driven by a single timerfd. Timers due at the same
// instant fire in the order they were added. Not thread safe; EventLoop
// marshals calls into its own thread.
class TimerQueue : backend::common::noncopyable {
public:
    using Clock = std::chrono::steady_clock;

    explicit TimerQueue(EventLoop* loop);
    ~TimerQueue();

    // interval of zero means one-shot
    TimerId Add(TimerCallback cb, Clock::time_point when, Clock::duration interval, TimerId id);
    void Cancel(TimerId id);

    size_t size() const { return timers_.size(); }

private:
    using Key = std::pair<Clock::time_point, TimerId>;
    struct Entry {
        TimerCallback callback;
        Clock::duration interval;
    };

    void HandleRead();
    void ResetTimerfd();

    const int timerfd_;
    Channel timerfd_channel_;
    std::map<Key, Entry> timers_;
    std::map<TimerId, Clock::time_point> active_;
    // Repeating timers cancelled from inside their own callback.
    std::set<TimerId> cancelled_while_running_;
    bool running_callbacks_;
};

} // namespace network
} // namespace backend
