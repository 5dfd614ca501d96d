#include "relay/network/EventLoopThreadPool.h"
#include "relay/network/EventLoop.h"
#include "relay/network/EventLoopThread.h"
#include "relay/common/Logger.h"

namespace relay {
namespace network {

EventLoopThreadPool::EventLoopThreadPool(EventLoop* baseLoop, const std::string& threadPrefix)
    : baseLoop_(baseLoop), threadPrefix_(threadPrefix) {
}

// EventLoopThread joins its thread on destruction.
EventLoopThreadPool::~EventLoopThreadPool() = default;

void EventLoopThreadPool::Start(int numThreads) {
    for (int i = 0; i < numThreads; ++i) {
        threads_.emplace_back(new EventLoopThread(threadPrefix_ + "-io" + std::to_string(i)));
        loops_.push_back(threads_.back()->StartLoop());
    }
    LOG_DEBUG << "EventLoopThreadPool " << threadPrefix_ << " running " << loops_.size() << " I/O loops";
}

EventLoop* EventLoopThreadPool::GetNextLoop() {
    if (loops_.empty()) return baseLoop_;
    EventLoop* loop = loops_[next_];
    next_ = (next_ + 1) % loops_.size();
    return loop;
}

} // namespace network
} // namespace relay
