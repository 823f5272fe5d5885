#include "backend/network/Channel.h"
#include "backend/network/EventLoop.h"
#include "backend/network/EventLoopThreadPool.h"
#include "backend/common/Logger.h"

#include <unistd.h>
#include <cassert>
#include <chrono>
#include <memory>
#include <set>
#include <thread>

using namespace backend::network;
using namespace backend::common;

EventLoop* g_loop;

void testQuitFromAnotherThread() {
    EventLoop loop;
    g_loop = &loop;
    assert(EventLoop::GetEventLoopOfCurrentThread() == &loop);

    bool ranInLoop = false;
    loop.RunInLoop([&ranInLoop]() { ranInLoop = true; });
    assert(ranInLoop);

    bool queued = false;
    loop.QueueInLoop([&queued]() { queued = true; });

    std::thread t([]() {
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
        LOG_INFO << "Quitting main loop from thread";
        g_loop->Quit();
    });

    loop.Loop();
    t.join();
    assert(queued);
    LOG_INFO << "Quit from thread PASS";
}

void testThreadPoolRoundRobin() {
    EventLoop base;
    EventLoopThreadPool pool(&base, "rr");
    pool.SetThreadNum(3);
    pool.Start();
    assert(pool.size() == 3);

    std::set<EventLoop*> loops;
    EventLoop* first = pool.GetNextLoop();
    loops.insert(first);
    loops.insert(pool.GetNextLoop());
    loops.insert(pool.GetNextLoop());
    assert(loops.size() == 3);
    assert(loops.count(&base) == 0);
    assert(pool.GetNextLoop() == first);

    EventLoopThreadPool empty(&base, "none");
    empty.Start();
    assert(empty.GetNextLoop() == &base);
    LOG_INFO << "Thread pool PASS";
}

void testChannelDispatch() {
    EventLoop loop;
    int fds[2];
    assert(::pipe(fds) == 0);

    int reads = 0;
    Channel channel(&loop, fds[0]);
    channel.SetReadCallback([&]() {
        char c;
        assert(::read(fds[0], &c, 1) == 1);
        ++reads;
        loop.Quit();
    });
    channel.EnableReading();
    assert(::write(fds[1], "x", 1) == 1);
    loop.Loop();
    assert(reads == 1);

    // Once the tied owner is gone the callbacks are skipped.
    std::shared_ptr<int> owner = std::make_shared<int>(0);
    channel.Tie(owner);
    owner.reset();
    assert(::write(fds[1], "y", 1) == 1);
    loop.RunAfter(0.05, [&]() { loop.Quit(); });
    loop.Loop();
    assert(reads == 1);

    channel.Remove();
    ::close(fds[0]);
    ::close(fds[1]);
    LOG_INFO << "Channel dispatch PASS";
}

int main() {
    Logger::Instance().SetLevel(LogLevel::INFO);
    testQuitFromAnotherThread();
    testThreadPoolRoundRobin();
    testChannelDispatch();
    return 0;
}
