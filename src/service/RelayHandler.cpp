#include "relay/service/RelayHandler.h"
#include "relay/service/UpstreamFetcher.h"
#include "relay/common/Logger.h"

#include <strings.h>

#include <cctype>
#include <utility>

namespace relay {
namespace service {

using relay::protocol::HttpResponse;

namespace {

const size_t kUrlPreviewChars = 100;
const char* const kDefaultContentType = "application/octet-stream";

// Text media types without a charset parameter get utf-8 appended.
std::string NormalizeContentType(const std::string& contentType) {
    if (contentType.empty()) return kDefaultContentType;
    if (::strncasecmp(contentType.c_str(), "text/", 5) != 0) return contentType;
    std::string lower = contentType;
    for (auto& c : lower) c = static_cast<char>(::tolower(static_cast<unsigned char>(c)));
    if (lower.find("charset=") != std::string::npos) return contentType;
    return contentType + "; charset=utf-8";
}

HttpResponse JsonError(int status, std::string body) {
    HttpResponse resp;
    resp.setStatusCode(status);
    resp.setContentType("application/json");
    resp.setBody(std::move(body));
    return resp;
}

} // namespace

RelayHandler::RelayHandler(UpstreamFetcher* fetcher) : fetcher_(fetcher) {
}

void RelayHandler::Handle(relay::network::EventLoop* loop, const ProxyRequest& req, Responder done) {
    LogRequest(req);
    fetcher_->Fetch(loop, req.url, [done = std::move(done)](FetchOutcome outcome) {
        LogOutcome(outcome);
        done(BuildResponse(outcome));
    });
}

HttpResponse RelayHandler::BuildResponse(const FetchOutcome& outcome) {
    switch (outcome.kind) {
        case FetchOutcome::Kind::kSuccess: {
            HttpResponse resp;
            resp.setStatusCode(HttpResponse::k200Ok);
            resp.setContentType(NormalizeContentType(outcome.contentType));
            resp.setHeader("Cache-Control", "no-cache");
            resp.setBody(outcome.body);
            return resp;
        }
        case FetchOutcome::Kind::kUpstreamError:
            return JsonError(outcome.status, "{\"error\": \"HTTP " + std::to_string(outcome.status) + "\"}");
        case FetchOutcome::Kind::kTimeout:
            return JsonError(HttpResponse::k500InternalServerError, "{\"error\": \"Request timeout\"}");
        case FetchOutcome::Kind::kFetchError:
        default:
            // Embedded verbatim, not escaped.
            return JsonError(HttpResponse::k500InternalServerError,
                             "{\"error\": \"Proxy error\", \"message\": \"" + outcome.message + "\"}");
    }
}

void RelayHandler::LogRequest(const ProxyRequest& req) {
    LOG_INFO << "Proxying download: " << req.key;
    LOG_INFO << "  URL: " << UrlPreview(req.url);
}

void RelayHandler::LogOutcome(const FetchOutcome& outcome) {
    switch (outcome.kind) {
        case FetchOutcome::Kind::kSuccess:
            LOG_INFO << "  ✅ Success: " << outcome.body.size() << " bytes";
            break;
        case FetchOutcome::Kind::kUpstreamError:
            LOG_ERROR << "  ❌ Error: HTTP " << outcome.status;
            break;
        case FetchOutcome::Kind::kTimeout:
            LOG_ERROR << "  ❌ Request timeout";
            break;
        case FetchOutcome::Kind::kFetchError:
            LOG_ERROR << "  ❌ Error: " << outcome.message;
            break;
    }
}

std::string RelayHandler::UrlPreview(const std::string& url) {
    size_t chars = 0;
    size_t i = 0;
    while (i < url.size()) {
        // Count only UTF-8 lead bytes.
        if ((static_cast<unsigned char>(url[i]) & 0xC0) != 0x80) {
            if (chars == kUrlPreviewChars) break;
            ++chars;
        }
        ++i;
    }
    return url.substr(0, i) + "...";
}

} // namespace service
} // namespace relay
