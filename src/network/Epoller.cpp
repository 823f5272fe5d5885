#include "backend/network/Epoller.h"
#include "backend/network/Channel.h"
#include "backend/common/Logger.h"

#include <unistd.h>
#include <cerrno>
#include <cstring>

namespace backend {
namespace network {

namespace {

const size_t kInitialEvents = 32;

const char* OpName(int op) {
    switch (op) {
        case EPOLL_CTL_ADD: return "ADD";
        case EPOLL_CTL_MOD: return "MOD";
        case EPOLL_CTL_DEL: return "DEL";
        default: return "?";
    }
}

} // namespace

Epoller::Epoller()
    : epfd_(::epoll_create1(EPOLL_CLOEXEC)),
      events_(kInitialEvents) {
    if (epfd_ < 0) {
        LOG_FATAL << "epoll_create1 failed: " << std::strerror(errno);
    }
}

Epoller::~Epoller() {
    ::close(epfd_);
}

void Epoller::Wait(int timeoutMs, std::vector<Channel*>* ready) {
    const int n = ::epoll_wait(epfd_, events_.data(), static_cast<int>(events_.size()), timeoutMs);
    if (n < 0) {
        if (errno != EINTR) {
            LOG_ERROR << "epoll_wait failed: " << std::strerror(errno);
        }
        return;
    }
    for (int i = 0; i < n; ++i) {
        Channel* channel = static_cast<Channel*>(events_[i].data.ptr);
        channel->ready_ = events_[i].events;
        ready->push_back(channel);
    }
    if (static_cast<size_t>(n) == events_.size()) {
        events_.resize(events_.size() * 2);
    }
}

void Epoller::Sync(Channel* channel) {
    if (channel->interest_ == 0) {
        Forget(channel);
    } else if (channel->inEpoll_) {
        Control(EPOLL_CTL_MOD, channel);
    } else {
        Control(EPOLL_CTL_ADD, channel);
        channel->inEpoll_ = true;
    }
}

void Epoller::Forget(Channel* channel) {
    if (channel->inEpoll_) {
        Control(EPOLL_CTL_DEL, channel);
        channel->inEpoll_ = false;
    }
}

void Epoller::Control(int op, Channel* channel) {
    struct epoll_event ev;
    std::memset(&ev, 0, sizeof ev);
    ev.events = channel->interest_;
    ev.data.ptr = channel;
    if (::epoll_ctl(epfd_, op, channel->fd(), &ev) < 0) {
        LOG_ERROR << "epoll_ctl " << OpName(op) << " fd=" << channel->fd()
                  << ": " << std::strerror(errno);
    }
}

} // namespace network
} // namespace backend
