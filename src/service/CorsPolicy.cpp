#include "relay/service/CorsPolicy.h"
#include "relay/protocol/HttpRequest.h"

#include <algorithm>
#include <utility>

namespace relay {
namespace service {

using relay::protocol::HttpRequest;
using relay::protocol::HttpResponse;

const CorsPolicy& CorsPolicy::AllowAll() {
    static const CorsPolicy policy{Options()};
    return policy;
}

CorsPolicy::CorsPolicy(Options options) : options_(std::move(options)) {
    for (const auto& m : options_.allowMethods) {
        if (!allowMethodsValue_.empty()) allowMethodsValue_ += ", ";
        allowMethodsValue_ += m;
    }
}

bool CorsPolicy::isPreflight(const HttpRequest& req) const {
    return req.getMethod() == HttpRequest::kOptions &&
           req.hasHeader("Origin") &&
           req.hasHeader("Access-Control-Request-Method");
}

bool CorsPolicy::originAllowed(const std::string& origin) const {
    if (options_.allowAllOrigins) return true;
    return std::find(options_.allowOrigins.begin(), options_.allowOrigins.end(), origin) !=
           options_.allowOrigins.end();
}

bool CorsPolicy::methodAllowed(const std::string& method) const {
    return std::find(options_.allowMethods.begin(), options_.allowMethods.end(), method) !=
           options_.allowMethods.end();
}

HttpResponse CorsPolicy::preflightResponse(const HttpRequest& req) const {
    const std::string origin = req.getHeader("Origin");
    const std::string requestedMethod = req.getHeader("Access-Control-Request-Method");
    const std::string requestedHeaders = req.getHeader("Access-Control-Request-Headers");

    HttpResponse resp;
    resp.setHeader("Access-Control-Allow-Origin", options_.allowAllOrigins ? std::string("*") : origin);
    if (!options_.allowAllOrigins) resp.setHeader("Vary", "Origin");
    resp.setHeader("Access-Control-Allow-Methods", allowMethodsValue_);
    resp.setHeader("Access-Control-Max-Age", std::to_string(options_.maxAgeSec));
    if (options_.allowAllHeaders && req.hasHeader("Access-Control-Request-Headers")) {
        resp.setHeader("Access-Control-Allow-Headers", requestedHeaders);
    }

    std::string failures;
    if (!originAllowed(origin)) failures += "origin";
    if (!methodAllowed(requestedMethod)) failures += failures.empty() ? "method" : ", method";

    resp.setContentType("text/plain; charset=utf-8");
    if (!failures.empty()) {
        resp.setStatusCode(HttpResponse::k400BadRequest);
        resp.setBody("Disallowed CORS " + failures);
        return resp;
    }
    resp.setStatusCode(HttpResponse::k200Ok);
    resp.setBody("OK");
    return resp;
}

void CorsPolicy::apply(const HttpRequest& req, HttpResponse* resp) const {
    if (!req.hasHeader("Origin")) return;
    const std::string origin = req.getHeader("Origin");

    // A wildcard is not honoured for credentialed (cookie) requests; echo the origin instead.
    if (options_.allowAllOrigins && !req.hasHeader("Cookie")) {
        resp->setHeader("Access-Control-Allow-Origin", "*");
        return;
    }
    if (!originAllowed(origin)) return;
    resp->setHeader("Access-Control-Allow-Origin", origin);
    const std::string vary = resp->getHeader("Vary");
    resp->setHeader("Vary", vary.empty() ? std::string("Origin") : vary + ", Origin");
}

} // namespace service
} // namespace relay
