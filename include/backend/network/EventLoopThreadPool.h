#pragma once

#include "backend/common/noncopyable.h"

#include <condition_variable>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace backend {
namespace network {

class EventLoop;

// Worker threads that each run their own EventLoop. Destruction quits the
// loops and joins the threads.
class EventLoopThreadPool : backend::common::noncopyable {
public:
    EventLoopThreadPool(EventLoop* baseLoop, const std::string& name);
    ~EventLoopThreadPool();

    void SetThreadNum(int numThreads) { numThreads_ = numThreads; }
    // Returns once every worker loop is running.
    void Start();

    // Round robin over the workers, or the base loop when there are none.
    EventLoop* GetNextLoop();

    size_t size() const { return loops_.size(); }

private:
    void WorkerMain(size_t index);

    EventLoop* baseLoop_;
    const std::string name_;
    int numThreads_;
    size_t next_;

    std::mutex mutex_;
    std::condition_variable ready_;
    std::vector<std::thread> threads_;
    std::vector<EventLoop*> loops_;
};

} // namespace network
} // namespace backend
