#pragma once

#include "relay/common/noncopyable.h"
#include "relay/network/InetAddress.h"
#include "relay/network/Resolver.h"
#include "relay/protocol/HttpResponseContext.h"
#include "relay/protocol/Url.h"
#include "relay/service/FetchOutcome.h"

#include <atomic>
#include <cstddef>
#include <functional>
#include <memory>
#include <string>
#include <vector>

struct ssl_st;

namespace relay {
namespace network {
class Channel;
class EventLoop;
class TlsContext;
} // namespace network

namespace service {

/// Asynchronous single-shot HTTP GET driven by an EventLoop.
///
/// resolve -> connect (each address in turn) -> TLS handshake (https) -> send ->
/// read until the response is framed -> decode Content-Encoding. One timerfd
/// covers the whole exchange. Nothing is retried and redirects are returned as-is.
class UpstreamFetcher : relay::common::noncopyable {
public:
    static const char* const kUserAgent;

    struct Options {
        double timeoutSec{60.0};  // <= 0 disables the deadline
    };

    using Callback = std::function<void(FetchOutcome)>;

    // resolver and tls must outlive every fetch. tls may be nullptr, then https fails.
    UpstreamFetcher(relay::network::Resolver* resolver,
                    relay::network::TlsContext* tls,
                    Options options);

    const Options& options() const { return options_; }

    // Thread safe. cb runs exactly once, on loop's thread.
    void Fetch(relay::network::EventLoop* loop, const std::string& url, Callback cb);

    // The request head sent for url.
    std::string BuildRequest(const relay::protocol::Url& url) const;

private:
    enum class State { kResolving, kConnecting, kHandshaking, kSending, kReading, kDone };

    struct FetchContext {
        relay::network::EventLoop* loop{nullptr};
        Callback cb;
        relay::protocol::Url url;
        std::string rawUrl;

        State state{State::kResolving};
        std::atomic<bool> finished{false};

        int sockfd{-1};
        int timerfd{-1};
        std::shared_ptr<relay::network::Channel> connChannel;
        std::shared_ptr<relay::network::Channel> timerChannel;
        ssl_st* ssl{nullptr};

        std::vector<relay::network::InetAddress> addresses;
        size_t nextAddress{0};

        std::string out;
        size_t outOffset{0};
        relay::protocol::HttpResponseContext response;
    };
    using FetchContextPtr = std::shared_ptr<FetchContext>;

    void Start(const FetchContextPtr& ctx);
    bool ArmTimer(const FetchContextPtr& ctx);
    void OnResolved(const FetchContextPtr& ctx, const relay::network::Resolver::Result& result);
    void ConnectNext(const FetchContextPtr& ctx);
    void OnConnected(const FetchContextPtr& ctx);
    void OnWritable(const FetchContextPtr& ctx);
    void OnReadable(const FetchContextPtr& ctx);
    void OnTimeout(const FetchContextPtr& ctx);

    void StartTls(const FetchContextPtr& ctx);
    void ContinueHandshake(const FetchContextPtr& ctx);
    void SendRequest(const FetchContextPtr& ctx);
    void ReadPlain(const FetchContextPtr& ctx);
    void ReadTls(const FetchContextPtr& ctx);
    void OnPeerClosed(const FetchContextPtr& ctx);
    void Complete(const FetchContextPtr& ctx);

    void Finish(const FetchContextPtr& ctx, FetchOutcome outcome);
    bool CleanUp(const FetchContextPtr& ctx);
    void CloseSocket(const FetchContextPtr& ctx);

    relay::network::Resolver* resolver_;
    relay::network::TlsContext* tls_;
    Options options_;
};

} // namespace service
} // namespace relay
