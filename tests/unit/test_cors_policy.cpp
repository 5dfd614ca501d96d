#include "relay/service/CorsPolicy.h"
#include "relay/protocol/HttpRequest.h"
#include "relay/protocol/HttpResponse.h"
#include "relay/common/Logger.h"

#include <cassert>
#include <cstring>
#include <string>

using namespace relay::service;
using namespace relay::protocol;
using namespace relay::common;

static HttpRequest makeRequest(const char* method, const std::string& path) {
    HttpRequest req;
    req.setMethod(method, method + std::strlen(method));
    req.setPath(path.data(), path.data() + path.size());
    req.setVersion(HttpRequest::kHttp11);
    return req;
}

void testPreflightDetection() {
    const CorsPolicy& cors = CorsPolicy::AllowAll();

    HttpRequest req = makeRequest("OPTIONS", "/proxy-download");
    assert(!cors.isPreflight(req));
    req.setHeader("Origin", "https://app.example");
    assert(!cors.isPreflight(req));
    req.setHeader("Access-Control-Request-Method", "POST");
    assert(cors.isPreflight(req));

    HttpRequest post = makeRequest("POST", "/proxy-download");
    post.setHeader("Origin", "https://app.example");
    post.setHeader("Access-Control-Request-Method", "POST");
    assert(!cors.isPreflight(post));
    LOG_INFO << "Preflight Detection PASS";
}

void testPreflightResponse() {
    const CorsPolicy& cors = CorsPolicy::AllowAll();
    HttpRequest req = makeRequest("OPTIONS", "/anything/at/all");
    req.setHeader("Origin", "https://app.example");
    req.setHeader("Access-Control-Request-Method", "POST");
    req.setHeader("Access-Control-Request-Headers", "content-type, x-custom");

    HttpResponse resp = cors.preflightResponse(req);
    assert(resp.statusCode() == 200);
    assert(resp.body() == "OK");
    assert(resp.getHeader("Content-Type") == "text/plain; charset=utf-8");
    assert(resp.getHeader("Access-Control-Allow-Origin") == "*");
    assert(resp.getHeader("Access-Control-Allow-Methods") == "DELETE, GET, HEAD, OPTIONS, PATCH, POST, PUT");
    assert(resp.getHeader("Access-Control-Max-Age") == "600");
    assert(resp.getHeader("Access-Control-Allow-Headers") == "content-type, x-custom");

    HttpRequest bare = makeRequest("OPTIONS", "/proxy-download");
    bare.setHeader("Origin", "null");
    bare.setHeader("Access-Control-Request-Method", "GET");
    HttpResponse resp2 = cors.preflightResponse(bare);
    assert(resp2.statusCode() == 200);
    assert(resp2.getHeader("Access-Control-Allow-Headers").empty());
    LOG_INFO << "Preflight Response PASS";
}

void testApplyToActualRequests() {
    const CorsPolicy& cors = CorsPolicy::AllowAll();

    HttpRequest noOrigin = makeRequest("POST", "/proxy-download");
    HttpResponse untouched;
    cors.apply(noOrigin, &untouched);
    assert(untouched.headers().empty());

    HttpRequest withOrigin = makeRequest("POST", "/proxy-download");
    withOrigin.setHeader("Origin", "https://app.example");
    HttpResponse resp;
    resp.setContentType("application/json");
    cors.apply(withOrigin, &resp);
    assert(resp.getHeader("Access-Control-Allow-Origin") == "*");
    assert(resp.getHeader("Vary").empty());

    withOrigin.setHeader("Cookie", "session=1");
    HttpResponse credentialed;
    cors.apply(withOrigin, &credentialed);
    assert(credentialed.getHeader("Access-Control-Allow-Origin") == "https://app.example");
    assert(credentialed.getHeader("Vary") == "Origin");
    LOG_INFO << "Apply To Actual Requests PASS";
}

void testRestrictedPolicy() {
    CorsPolicy::Options options;
    options.allowAllOrigins = false;
    options.allowOrigins = {"https://ok.example"};
    options.allowMethods = {"POST"};
    CorsPolicy cors(options);

    HttpRequest req = makeRequest("OPTIONS", "/proxy-download");
    req.setHeader("Origin", "https://evil.example");
    req.setHeader("Access-Control-Request-Method", "DELETE");
    HttpResponse rejected = cors.preflightResponse(req);
    assert(rejected.statusCode() == 400);
    assert(rejected.body() == "Disallowed CORS origin, method");

    req.setHeader("Origin", "https://ok.example");
    req.setHeader("Access-Control-Request-Method", "POST");
    HttpResponse accepted = cors.preflightResponse(req);
    assert(accepted.statusCode() == 200);
    assert(accepted.getHeader("Access-Control-Allow-Origin") == "https://ok.example");
    assert(accepted.getHeader("Access-Control-Allow-Methods") == "POST");

    HttpRequest actual = makeRequest("POST", "/proxy-download");
    actual.setHeader("Origin", "https://evil.example");
    HttpResponse resp;
    cors.apply(actual, &resp);
    assert(resp.getHeader("Access-Control-Allow-Origin").empty());
    LOG_INFO << "Restricted Policy PASS";
}

int main() {
    Logger::Instance().SetLevel(LogLevel::INFO);
    testPreflightDetection();
    testPreflightResponse();
    testApplyToActualRequests();
    testRestrictedPolicy();
    return 0;
}
