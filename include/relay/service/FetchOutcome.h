#pragma once

#include <string>
#include <utility>

namespace relay {
namespace service {

// Result of one upstream fetch. Exactly one of the four kinds; the fields that
// do not belong to the kind stay empty.
struct FetchOutcome {
    enum class Kind {
        kSuccess,        // upstream answered 200
        kUpstreamError,  // upstream answered with another status
        kTimeout,        // total deadline expired
        kFetchError,     // anything else: bad URL, DNS, connect, TLS, framing, decoding
    };

    Kind kind{Kind::kFetchError};
    int status{0};
    std::string contentType;  // empty when the upstream sent none
    std::string body;
    std::string message;

    static FetchOutcome Success(std::string body, std::string contentType) {
        FetchOutcome o;
        o.kind = Kind::kSuccess;
        o.status = 200;
        o.body = std::move(body);
        o.contentType = std::move(contentType);
        return o;
    }

    static FetchOutcome UpstreamError(int status) {
        FetchOutcome o;
        o.kind = Kind::kUpstreamError;
        o.status = status;
        return o;
    }

    static FetchOutcome Timeout() {
        FetchOutcome o;
        o.kind = Kind::kTimeout;
        return o;
    }

    static FetchOutcome FetchError(std::string message) {
        FetchOutcome o;
        o.kind = Kind::kFetchError;
        o.message = std::move(message);
        return o;
    }
};

} // namespace service
} // namespace relay
