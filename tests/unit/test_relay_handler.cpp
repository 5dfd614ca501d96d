#include "relay/service/RelayHandler.h"
#include "relay/common/Logger.h"

#include <cassert>
#include <string>
#include <utility>
#include <vector>

using namespace relay::service;
using namespace relay::protocol;
using namespace relay::common;

void testSuccessResponse() {
    std::string bytes = "PK";
    bytes.push_back('\0');
    bytes.push_back('\x03');
    HttpResponse resp = RelayHandler::BuildResponse(FetchOutcome::Success(bytes, "application/zip"));
    assert(resp.statusCode() == 200);
    assert(resp.body() == bytes);
    assert(resp.getHeader("Content-Type") == "application/zip");
    assert(resp.getHeader("Cache-Control") == "no-cache");

    HttpResponse untyped = RelayHandler::BuildResponse(FetchOutcome::Success("raw", ""));
    assert(untyped.getHeader("Content-Type") == "application/octet-stream");

    HttpResponse text = RelayHandler::BuildResponse(FetchOutcome::Success("hi", "text/plain"));
    assert(text.getHeader("Content-Type") == "text/plain; charset=utf-8");

    HttpResponse latin = RelayHandler::BuildResponse(FetchOutcome::Success("hi", "text/csv; Charset=latin-1"));
    assert(latin.getHeader("Content-Type") == "text/csv; Charset=latin-1");

    HttpResponse empty = RelayHandler::BuildResponse(FetchOutcome::Success("", "application/json"));
    assert(empty.statusCode() == 200);
    assert(empty.body().empty());
    LOG_INFO << "Success Response PASS";
}

void testUpstreamErrorResponse() {
    HttpResponse forbidden = RelayHandler::BuildResponse(FetchOutcome::UpstreamError(403));
    assert(forbidden.statusCode() == 403);
    assert(forbidden.getHeader("Content-Type") == "application/json");
    assert(forbidden.body() == "{\"error\": \"HTTP 403\"}");
    assert(forbidden.getHeader("Cache-Control").empty());

    HttpResponse created = RelayHandler::BuildResponse(FetchOutcome::UpstreamError(201));
    assert(created.statusCode() == 201);
    assert(created.body() == "{\"error\": \"HTTP 201\"}");

    HttpResponse moved = RelayHandler::BuildResponse(FetchOutcome::UpstreamError(302));
    assert(moved.statusCode() == 302);
    assert(moved.body() == "{\"error\": \"HTTP 302\"}");
    LOG_INFO << "Upstream Error Response PASS";
}

void testTimeoutAndFetchError() {
    HttpResponse timeout = RelayHandler::BuildResponse(FetchOutcome::Timeout());
    assert(timeout.statusCode() == 500);
    assert(timeout.getHeader("Content-Type") == "application/json");
    assert(timeout.body() == "{\"error\": \"Request timeout\"}");

    HttpResponse dns = RelayHandler::BuildResponse(
        FetchOutcome::FetchError("[Errno -2] Name or service not known"));
    assert(dns.statusCode() == 500);
    assert(dns.body() == "{\"error\": \"Proxy error\", \"message\": \"[Errno -2] Name or service not known\"}");

    // Quotes in the message are not escaped.
    HttpResponse quoted = RelayHandler::BuildResponse(FetchOutcome::FetchError("Invalid URL 'x\"y'"));
    assert(quoted.body() == "{\"error\": \"Proxy error\", \"message\": \"Invalid URL 'x\"y'\"}");
    LOG_INFO << "Timeout And Fetch Error PASS";
}

void testUrlPreview() {
    assert(RelayHandler::UrlPreview("") == "...");
    assert(RelayHandler::UrlPreview("https://s3/x") == "https://s3/x...");

    const std::string exact(100, 'a');
    assert(RelayHandler::UrlPreview(exact) == exact + "...");

    const std::string longUrl = "https://bucket.s3.amazonaws.com/" + std::string(200, 'b');
    const std::string preview = RelayHandler::UrlPreview(longUrl);
    assert(preview == longUrl.substr(0, 100) + "...");

    // Multi-byte characters count once and are never split.
    std::string wide;
    for (int i = 0; i < 120; ++i) wide += "\xc3\xa9";
    const std::string widePreview = RelayHandler::UrlPreview(wide);
    assert(widePreview.size() == 200 + 3);
    assert(widePreview.compare(0, 200, wide, 0, 200) == 0);
    LOG_INFO << "URL Preview PASS";
}

void testLogLines() {
    std::vector<std::pair<LogLevel, std::string>> lines;
    Logger::Instance().SetSink([&lines](LogLevel level, const std::string& msg) {
        lines.emplace_back(level, msg);
    });

    ProxyRequest req;
    req.url = "https://syftbox.example/" + std::string(150, 'u');
    req.key = "datasites/alice@example.org/public/data.csv";
    RelayHandler::LogRequest(req);
    RelayHandler::LogOutcome(FetchOutcome::Success("12345", "text/csv"));
    RelayHandler::LogOutcome(FetchOutcome::UpstreamError(404));
    RelayHandler::LogOutcome(FetchOutcome::Timeout());
    RelayHandler::LogOutcome(FetchOutcome::FetchError("All connection attempts failed"));
    Logger::Instance().SetSink({});

    assert(lines.size() == 6);
    assert(lines[0].second == "Proxying download: datasites/alice@example.org/public/data.csv");
    assert(lines[1].second == "  URL: " + req.url.substr(0, 100) + "...");
    assert(lines[2].first == LogLevel::INFO);
    assert(lines[2].second == "  \u2705 Success: 5 bytes");
    assert(lines[3].first == LogLevel::ERROR);
    assert(lines[3].second == "  \u274c Error: HTTP 404");
    assert(lines[4].second == "  \u274c Request timeout");
    assert(lines[5].second == "  \u274c Error: All connection attempts failed");
    LOG_INFO << "Log Lines PASS";
}

int main() {
    Logger::Instance().SetLevel(LogLevel::INFO);
    testSuccessResponse();
    testUpstreamErrorResponse();
    testTimeoutAndFetchError();
    testUrlPreview();
    testLogLines();
    return 0;
}
