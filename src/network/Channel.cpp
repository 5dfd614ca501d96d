#include "relay/network/Channel.h"
#include "relay/network/EventLoop.h"

#include <sys/epoll.h>

namespace relay {
namespace network {

const int Channel::kNoneEvent = 0;
const int Channel::kReadEvent = EPOLLIN | EPOLLPRI;
const int Channel::kWriteEvent = EPOLLOUT;

Channel::Channel(EventLoop* loop, int fd)
    : loop_(loop),
      fd_(fd),
      events_(0),
      revents_(0),
      index_(-1) {
}

Channel::~Channel() = default;

void Channel::Update() {
    loop_->UpdateChannel(this);
}

void Channel::Remove() {
    loop_->RemoveChannel(this);
}

void Channel::ClearCallbacks() {
    read_callback_ = nullptr;
    write_callback_ = nullptr;
    close_callback_ = nullptr;
    error_callback_ = nullptr;
}

void Channel::HandleEvent(std::chrono::system_clock::time_point receive_time) {
    // Callbacks may clear each other; copy before invoking so the std::function
    // being executed is never destroyed under itself.
    if ((revents_ & EPOLLHUP) && !(revents_ & EPOLLIN)) {
        if (close_callback_) {
            EventCallback cb = close_callback_;
            cb();
        }
    }

    if (revents_ & EPOLLERR) {
        if (error_callback_) {
            EventCallback cb = error_callback_;
            cb();
        }
    }

    if (revents_ & (EPOLLIN | EPOLLPRI | EPOLLRDHUP)) {
        if (read_callback_) {
            ReadEventCallback cb = read_callback_;
            cb(receive_time);
        }
    }

    if (revents_ & EPOLLOUT) {
        if (write_callback_) {
            EventCallback cb = write_callback_;
            cb();
        }
    }
}

} // namespace network
} // namespace relay
