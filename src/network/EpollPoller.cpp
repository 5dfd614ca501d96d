#include "relay/network/EpollPoller.h"
#include "relay/network/Channel.h"
#include "relay/common/Logger.h"

#include <unistd.h>

#include <cerrno>
#include <cstring>

namespace relay {
namespace network {

namespace {

// Channel::index() values.
const int kNew = -1;     // never registered
const int kAdded = 1;    // in the epoll set
const int kParked = 2;   // known, but taken out while it has no interest

} // namespace

EpollPoller::EpollPoller()
    : epollfd_(::epoll_create1(EPOLL_CLOEXEC)),
      events_(kInitEventListSize) {
    if (epollfd_ < 0) {
        LOG_FATAL << "epoll_create1 failed errno=" << errno;
    }
}

EpollPoller::~EpollPoller() {
    if (epollfd_ >= 0) ::close(epollfd_);
}

std::chrono::system_clock::time_point EpollPoller::Poll(int timeout_ms, ChannelList* active_channels) {
    const int n = ::epoll_wait(epollfd_, events_.data(), static_cast<int>(events_.size()), timeout_ms);
    const int savedErrno = errno;
    const auto now = std::chrono::system_clock::now();

    if (n < 0) {
        if (savedErrno != EINTR) LOG_ERROR << "epoll_wait errno=" << savedErrno;
        return now;
    }
    for (int i = 0; i < n; ++i) {
        Channel* channel = static_cast<Channel*>(events_[i].data.ptr);
        channel->set_revents(static_cast<int>(events_[i].events));
        active_channels->push_back(channel);
    }
    // A full batch suggests more were ready; grow for the next round.
    if (static_cast<size_t>(n) == events_.size()) {
        events_.resize(events_.size() * 2);
    }
    return now;
}

void EpollPoller::UpdateChannel(Channel* channel) {
    switch (channel->index()) {
    case kAdded:
        if (channel->IsNoneEvent()) {
            Control(EPOLL_CTL_DEL, channel);
            channel->set_index(kParked);
        } else {
            Control(EPOLL_CTL_MOD, channel);
        }
        break;
    default:
        if (channel->IsNoneEvent()) {
            channel->set_index(kParked);
            break;
        }
        Control(EPOLL_CTL_ADD, channel);
        channel->set_index(kAdded);
        break;
    }
}

void EpollPoller::RemoveChannel(Channel* channel) {
    if (channel->index() == kAdded) {
        Control(EPOLL_CTL_DEL, channel);
    }
    channel->set_index(kNew);
}

void EpollPoller::Control(int operation, Channel* channel) {
    struct epoll_event event;
    std::memset(&event, 0, sizeof(event));
    event.events = static_cast<uint32_t>(channel->events());
    event.data.ptr = channel;
    if (::epoll_ctl(epollfd_, operation, channel->fd(), &event) < 0) {
        if (operation == EPOLL_CTL_DEL) {
            LOG_ERROR << "epoll_ctl DEL fd=" << channel->fd() << " errno=" << errno;
        } else {
            LOG_FATAL << "epoll_ctl op=" << operation << " fd=" << channel->fd() << " errno=" << errno;
        }
    }
}

} // namespace network
} // namespace relay
