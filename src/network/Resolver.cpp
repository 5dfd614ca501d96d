#include "relay/network/Resolver.h"
#include "relay/network/EventLoop.h"
#include "relay/common/Logger.h"

#include <netdb.h>
#include <sys/socket.h>

#include <cerrno>
#include <cstring>

namespace relay {
namespace network {

Resolver::Resolver(int numThreads) {
    if (numThreads < 1) numThreads = 1;
    for (int i = 0; i < numThreads; ++i) {
        threads_.emplace_back([this]() { ThreadMain(); });
    }
}

Resolver::~Resolver() {
    Stop();
}

void Resolver::Stop() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (stop_ && threads_.empty()) return;
        stop_ = true;
        if (!jobs_.empty()) {
            LOG_WARN << "Resolver stopping with " << jobs_.size() << " pending lookups";
            jobs_.clear();
        }
    }
    cond_.notify_all();
    for (auto& t : threads_) {
        if (t.joinable()) t.join();
    }
    threads_.clear();
}

void Resolver::Resolve(EventLoop* loop, const std::string& host, uint16_t port, Callback cb) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (stop_) {
            LOG_WARN << "Resolver stopped, dropping lookup of " << host;
            return;
        }
        jobs_.push_back(Job{loop, host, port, std::move(cb)});
    }
    cond_.notify_one();
}

void Resolver::ThreadMain() {
    while (true) {
        Job job;
        {
            std::unique_lock<std::mutex> lock(mutex_);
            cond_.wait(lock, [this]() { return stop_ || !jobs_.empty(); });
            if (stop_) return;
            job = std::move(jobs_.front());
            jobs_.pop_front();
        }

        Result result = ResolveBlocking(job.host, job.port);
        job.loop->QueueInLoop([cb = std::move(job.cb), result = std::move(result)]() { cb(result); });
    }
}

Resolver::Result Resolver::ResolveBlocking(const std::string& host, uint16_t port) {
    Result result;

    addrinfo hints;
    std::memset(&hints, 0, sizeof(hints));
    hints.ai_family = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;
    hints.ai_flags = AI_NUMERICSERV;

    addrinfo* res = nullptr;
    const std::string service = std::to_string(port);
    const int gai = ::getaddrinfo(host.c_str(), service.c_str(), &hints, &res);
    if (gai != 0) {
        result.error = gai;
        const int code = (gai == EAI_SYSTEM) ? errno : gai;
        const char* reason = (gai == EAI_SYSTEM) ? std::strerror(errno) : ::gai_strerror(gai);
        result.errorText = "[Errno " + std::to_string(code) + "] " + reason;
        LOG_DEBUG << "Resolver: " << host << " -> " << result.errorText;
        return result;
    }

    for (addrinfo* ai = res; ai != nullptr; ai = ai->ai_next) {
        if (ai->ai_family != AF_INET && ai->ai_family != AF_INET6) continue;
        result.addresses.emplace_back(ai->ai_addr, ai->ai_addrlen);
    }
    ::freeaddrinfo(res);

    if (result.addresses.empty()) {
        result.error = EAI_NONAME;
        result.errorText = "[Errno " + std::to_string(EAI_NONAME) + "] " + ::gai_strerror(EAI_NONAME);
    }
    return result;
}

} // namespace network
} // namespace relay
