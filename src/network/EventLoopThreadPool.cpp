#include "backend/network/EventLoopThreadPool.h"
#include "backend/network/EventLoop.h"
#include "backend/common/Logger.h"

#include <pthread.h>

namespace backend {
namespace network {

EventLoopThreadPool::EventLoopThreadPool(EventLoop* baseLoop, const std::string& name)
    : baseLoop_(baseLoop),
      name_(name),
      numThreads_(0),
      next_(0) {
}

EventLoopThreadPool::~EventLoopThreadPool() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (EventLoop* loop : loops_) {
            if (loop) loop->Quit();
        }
    }
    for (std::thread& t : threads_) {
        t.join();
    }
}

void EventLoopThreadPool::Start() {
    if (!threads_.empty() || numThreads_ <= 0) {
        return;
    }
    loops_.assign(static_cast<size_t>(numThreads_), nullptr);
    for (size_t i = 0; i < loops_.size(); ++i) {
        threads_.emplace_back([this, i]() { WorkerMain(i); });
    }

    std::unique_lock<std::mutex> lock(mutex_);
    ready_.wait(lock, [this]() {
        for (EventLoop* loop : loops_) {
            if (loop == nullptr) return false;
        }
        return true;
    });
    LOG_DEBUG << "EventLoopThreadPool[" << name_ << "] started " << loops_.size() << " workers";
}

void EventLoopThreadPool::WorkerMain(size_t index) {
    // Linux caps thread names at 15 characters.
    const std::string threadName = (name_ + "-io" + std::to_string(index)).substr(0, 15);
    ::pthread_setname_np(::pthread_self(), threadName.c_str());

    EventLoop loop;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        loops_[index] = &loop;
    }
    ready_.notify_one();

    loop.Loop();

    std::lock_guard<std::mutex> lock(mutex_);
    loops_[index] = nullptr;
}

EventLoop* EventLoopThreadPool::GetNextLoop() {
    if (loops_.empty()) {
        return baseLoop_;
    }
    EventLoop* loop = loops_[next_];
    next_ = (next_ + 1) % loops_.size();
    return loop;
}

} // namespace network
} // namespace backend
