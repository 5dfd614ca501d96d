#pragma once

#include "relay/common/noncopyable.h"

#include <memory>
#include <string>
#include <vector>

namespace relay {
namespace network {

class EventLoop;
class EventLoopThread;

/// I/O loops that accepted connections are spread over. With no threads every
/// connection stays on the base loop.
class EventLoopThreadPool : relay::common::noncopyable {
public:
    EventLoopThreadPool(EventLoop* baseLoop, const std::string& threadPrefix);
    ~EventLoopThreadPool();

    // Spawns numThreads loops. Call once, from the base loop's thread.
    void Start(int numThreads);

    // Round robin over the spawned loops, or the base loop when there are none.
    EventLoop* GetNextLoop();

    size_t size() const { return loops_.size(); }

private:
    EventLoop* baseLoop_;
    const std::string threadPrefix_;
    size_t next_{0};
    std::vector<std::unique_ptr<EventLoopThread>> threads_;
    std::vector<EventLoop*> loops_;
};

} // namespace network
} // namespace relay
