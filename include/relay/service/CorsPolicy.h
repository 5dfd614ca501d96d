#pragma once

#include "relay/protocol/HttpResponse.h"

#include <string>
#include <vector>

namespace relay {
namespace protocol {
class HttpRequest;
} // namespace protocol

namespace service {

// Cross-origin policy applied to every route. Built once at startup and never
// mutated afterwards.
class CorsPolicy {
public:
    struct Options {
        bool allowAllOrigins{true};
        std::vector<std::string> allowOrigins;  // used when allowAllOrigins is false
        std::vector<std::string> allowMethods{"DELETE", "GET", "HEAD", "OPTIONS", "PATCH", "POST", "PUT"};
        bool allowAllHeaders{true};
        int maxAgeSec{600};
    };

    // Any origin, any method, any request header.
    static const CorsPolicy& AllowAll();

    explicit CorsPolicy(Options options);

    // OPTIONS carrying both Origin and Access-Control-Request-Method.
    bool isPreflight(const relay::protocol::HttpRequest& req) const;

    // Answer for a preflight. Rejected preflights get 400 with the reason.
    relay::protocol::HttpResponse preflightResponse(const relay::protocol::HttpRequest& req) const;

    // Decorates the response to an actual request. No Origin, no change.
    void apply(const relay::protocol::HttpRequest& req, relay::protocol::HttpResponse* resp) const;

    const Options& options() const { return options_; }

private:
    bool originAllowed(const std::string& origin) const;
    bool methodAllowed(const std::string& method) const;

    Options options_;
    std::string allowMethodsValue_;
};

} // namespace service
} // namespace relay
