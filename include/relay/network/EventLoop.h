#pragma once

#include <atomic>
#include <functional>
#include <memory>
#include <mutex>
#include <thread>
#include <vector>

#include "relay/common/noncopyable.h"
#include "relay/network/Channel.h"
#include "relay/network/EpollPoller.h"

namespace relay {
namespace network {

/// One loop per thread. Everything touching a loop's channels runs on that thread;
/// other threads hand work over with RunInLoop/QueueInLoop.
class EventLoop : relay::common::noncopyable {
public:
    using Functor = std::function<void()>;

    EventLoop();
    ~EventLoop();

    // Runs until Quit(). A quit loop stays quit.
    void Loop();
    void Quit();

    // Runs cb now when called on the loop thread, otherwise queues it.
    void RunInLoop(Functor cb);
    // Always deferred to the end of the current (or next) iteration.
    void QueueInLoop(Functor cb);

    void UpdateChannel(Channel* channel) { poller_.UpdateChannel(channel); }
    void RemoveChannel(Channel* channel) { poller_.RemoveChannel(channel); }

    bool IsInLoopThread() const { return thread_id_ == std::this_thread::get_id(); }

    static EventLoop* GetEventLoopOfCurrentThread();

private:
    void WakeUp();
    void DrainWakeUp();
    void RunQueued();

    std::atomic_bool quit_{false};
    std::atomic_bool running_queued_{false};

    const std::thread::id thread_id_;
    EpollPoller poller_;

    // eventfd that QueueInLoop pokes to interrupt epoll_wait
    int wakeup_fd_;
    std::unique_ptr<Channel> wakeup_channel_;

    EpollPoller::ChannelList active_channels_;

    std::mutex mutex_;
    std::vector<Functor> queued_;
};

} // namespace network
} // namespace relay
