#pragma once

#include "relay/common/noncopyable.h"

#include <sys/epoll.h>

#include <chrono>
#include <vector>

namespace relay {
namespace network {

class Channel;

/// Level-triggered epoll set of one EventLoop. Only that loop's thread touches it.
class EpollPoller : relay::common::noncopyable {
public:
    using ChannelList = std::vector<Channel*>;

    EpollPoller();
    ~EpollPoller();

    // Waits up to timeout_ms and appends the ready channels. Returns the wake-up time.
    std::chrono::system_clock::time_point Poll(int timeout_ms, ChannelList* active_channels);

    // Adds, modifies or parks channel according to its interest set.
    void UpdateChannel(Channel* channel);
    void RemoveChannel(Channel* channel);

private:
    static const int kInitEventListSize = 16;

    void Control(int operation, Channel* channel);

    int epollfd_;
    std::vector<struct epoll_event> events_;
};

} // namespace network
} // namespace relay
