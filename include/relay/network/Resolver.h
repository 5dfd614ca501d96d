#pragma once

#include "relay/common/noncopyable.h"
#include "relay/network/InetAddress.h"

#include <condition_variable>
#include <cstdint>
#include <deque>
#include <functional>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace relay {
namespace network {

class EventLoop;

/// Runs blocking getaddrinfo() on worker threads and hands results back to the
/// requesting loop.
class Resolver : relay::common::noncopyable {
public:
    struct Result {
        int error{0};           // getaddrinfo() code, 0 on success
        std::string errorText;  // "[Errno <code>] <reason>" when error != 0
        std::vector<InetAddress> addresses;
    };
    using Callback = std::function<void(const Result&)>;

    explicit Resolver(int numThreads = 4);
    ~Resolver();

    // Thread safe. cb runs on loop's thread. Lookups still queued at Stop() are dropped.
    void Resolve(EventLoop* loop, const std::string& host, uint16_t port, Callback cb);
    void Stop();

    static Result ResolveBlocking(const std::string& host, uint16_t port);

private:
    struct Job {
        EventLoop* loop;
        std::string host;
        uint16_t port;
        Callback cb;
    };

    void ThreadMain();

    std::mutex mutex_;
    std::condition_variable cond_;
    std::deque<Job> jobs_;
    bool stop_{false};
    std::vector<std::thread> threads_;
};

} // namespace network
} // namespace relay
