#include "backend/network/Channel.h"
#include "backend/network/EventLoop.h"
#include "backend/common/Logger.h"

#include <sys/epoll.h>

namespace backend {
namespace network {

namespace {

const uint32_t kReadable = EPOLLIN | EPOLLPRI | EPOLLRDHUP;
const uint32_t kWritable = EPOLLOUT;

} // namespace

Channel::Channel(EventLoop* loop, int fd)
    : loop_(loop),
      fd_(fd),
      interest_(0),
      ready_(0),
      inEpoll_(false),
      tied_(false) {
}

Channel::~Channel() {
    if (inEpoll_) {
        LOG_WARN << "Channel for fd " << fd_ << " destroyed while still registered";
    }
}

void Channel::Tie(const std::shared_ptr<void>& owner) {
    owner_ = owner;
    tied_ = true;
}

void Channel::EnableReading() { SetInterest(interest_ | kReadable); }
void Channel::EnableWriting() { SetInterest(interest_ | kWritable); }
void Channel::DisableWriting() { SetInterest(interest_ & ~kWritable); }
void Channel::DisableAll() { SetInterest(0); }

bool Channel::IsWriting() const {
    return (interest_ & kWritable) != 0;
}

void Channel::SetInterest(uint32_t interest) {
    interest_ = interest;
    loop_->UpdateChannel(this);
}

void Channel::Remove() {
    interest_ = 0;
    loop_->RemoveChannel(this);
}

void Channel::Dispatch() {
    if (!tied_) {
        DispatchReady();
        return;
    }
    std::shared_ptr<void> guard = owner_.lock();
    if (guard) {
        DispatchReady();
    }
}

void Channel::DispatchReady() {
    // A hangup with nothing left to read; otherwise read first and let the
    // reader see EOF or the socket error itself.
    if ((ready_ & EPOLLHUP) && !(ready_ & EPOLLIN)) {
        if (onHangup_) onHangup_();
        return;
    }
    if ((ready_ & (kReadable | EPOLLERR)) && onReadable_) {
        onReadable_();
    }
    if ((ready_ & kWritable) && onWritable_) {
        onWritable_();
    }
}

} // namespace network
} // namespace backend
