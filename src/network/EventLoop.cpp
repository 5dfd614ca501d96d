#include "relay/network/EventLoop.h"
#include "relay/common/Logger.h"

#include <sys/eventfd.h>
#include <unistd.h>

#include <cerrno>
#include <cstdint>

namespace relay {
namespace network {

namespace {

thread_local EventLoop* t_loopInThisThread = nullptr;

// Upper bound on one epoll_wait; queued work always wakes the loop earlier.
const int kPollTimeMs = 10000;

} // namespace

EventLoop* EventLoop::GetEventLoopOfCurrentThread() {
    return t_loopInThisThread;
}

EventLoop::EventLoop()
    : thread_id_(std::this_thread::get_id()),
      wakeup_fd_(::eventfd(0, EFD_NONBLOCK | EFD_CLOEXEC)) {
    if (wakeup_fd_ < 0) {
        LOG_FATAL << "eventfd failed errno=" << errno;
    }
    if (t_loopInThisThread) {
        LOG_FATAL << "Another EventLoop " << t_loopInThisThread << " exists in thread " << thread_id_;
    } else {
        t_loopInThisThread = this;
    }

    wakeup_channel_.reset(new Channel(this, wakeup_fd_));
    wakeup_channel_->SetReadCallback([this](std::chrono::system_clock::time_point) { DrainWakeUp(); });
    wakeup_channel_->EnableReading();
    LOG_DEBUG << "EventLoop " << this << " created in thread " << thread_id_;
}

EventLoop::~EventLoop() {
    wakeup_channel_->DisableAll();
    wakeup_channel_->Remove();
    ::close(wakeup_fd_);
    if (t_loopInThisThread == this) {
        t_loopInThisThread = nullptr;
    }
}

void EventLoop::Loop() {
    LOG_DEBUG << "EventLoop " << this << " running";
    while (!quit_) {
        active_channels_.clear();
        const auto receiveTime = poller_.Poll(kPollTimeMs, &active_channels_);
        for (Channel* channel : active_channels_) {
            channel->HandleEvent(receiveTime);
        }
        RunQueued();
    }
    LOG_DEBUG << "EventLoop " << this << " stopped";
}

void EventLoop::Quit() {
    quit_ = true;
    if (!IsInLoopThread()) {
        WakeUp();
    }
}

void EventLoop::RunInLoop(Functor cb) {
    if (IsInLoopThread()) {
        cb();
    } else {
        QueueInLoop(std::move(cb));
    }
}

void EventLoop::QueueInLoop(Functor cb) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        queued_.push_back(std::move(cb));
    }
    // Work queued while RunQueued is draining would otherwise wait a full poll.
    if (!IsInLoopThread() || running_queued_) {
        WakeUp();
    }
}

void EventLoop::WakeUp() {
    const uint64_t one = 1;
    if (::write(wakeup_fd_, &one, sizeof one) != static_cast<ssize_t>(sizeof one)) {
        LOG_ERROR << "EventLoop::WakeUp write failed errno=" << errno;
    }
}

void EventLoop::DrainWakeUp() {
    uint64_t count = 0;
    if (::read(wakeup_fd_, &count, sizeof count) != static_cast<ssize_t>(sizeof count)) {
        LOG_ERROR << "EventLoop::DrainWakeUp read failed errno=" << errno;
    }
}

void EventLoop::RunQueued() {
    std::vector<Functor> batch;
    running_queued_ = true;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        batch.swap(queued_);
    }
    for (const Functor& fn : batch) {
        fn();
    }
    running_queued_ = false;
}

} // namespace network
} // namespace relay
