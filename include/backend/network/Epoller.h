#pragma once

#include "backend/common/noncopyable.h"

#include <sys/epoll.h>
#include <vector>

namespace backend {
namespace network {

class Channel;

// The epoll instance behind one EventLoop. Registration state lives in
// each Channel, so no fd table is kept here.
class Epoller : backend::common::noncopyable {
public:
    Epoller();
    ~Epoller();

    // Blocks for at most timeoutMs and appends the channels that became ready.
    void Wait(int timeoutMs, std::vector<Channel*>* ready);

    // Brings the epoll set in line with channel's interest.
    void Sync(Channel* channel);
    void Forget(Channel* channel);

private:
    void Control(int op, Channel* channel);

    int epfd_;
    std::vector<struct epoll_event> events_;
};

} // namespace network
} // namespace backend
