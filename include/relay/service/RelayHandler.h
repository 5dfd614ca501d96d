#pragma once

#include "relay/protocol/HttpResponse.h"
#include "relay/service/FetchOutcome.h"
#include "relay/service/ProxyRequest.h"

#include <functional>
#include <string>

namespace relay {
namespace network {
class EventLoop;
} // namespace network

namespace service {

class UpstreamFetcher;

/// The download relay: one upstream GET per call, outcome mapped to the reply.
class RelayHandler {
public:
    using Responder = std::function<void(relay::protocol::HttpResponse)>;

    explicit RelayHandler(UpstreamFetcher* fetcher);

    // done runs exactly once, on loop's thread.
    void Handle(relay::network::EventLoop* loop, const ProxyRequest& req, Responder done);

    // Pure mapping from a fetch outcome to the client response.
    static relay::protocol::HttpResponse BuildResponse(const FetchOutcome& outcome);

    static void LogRequest(const ProxyRequest& req);
    static void LogOutcome(const FetchOutcome& outcome);

    // First 100 characters (UTF-8 aware) followed by "...".
    static std::string UrlPreview(const std::string& url);

private:
    UpstreamFetcher* fetcher_;
};

} // namespace service
} // namespace relay
