#pragma once

#include <cstddef>
#include <string>
#include <utility>
#include <vector>

namespace relay {
namespace protocol {

// Incremental HTTP/1.x response parser for upstream fetches.
// - Body framing: Transfer-Encoding: chunked, Content-Length, or read until close.
// - Interim 1xx responses are skipped; 204/304 carry no body.
// - The de-chunked body is collected in body().
class HttpResponseContext {
public:
    enum ParseState { kExpectStatusLine, kExpectHeaders, kExpectBody, kGotAll, kError };

    enum class Error {
        kNone,
        kMalformed,          // not a valid HTTP/1.x response
        kNoResponse,         // peer closed before a status line arrived
        kIncompleteBody,     // peer closed in the middle of the body
    };

    // Returns true once the response is complete.
    bool feed(const char* data, size_t len);
    // The peer closed the stream. Returns true when that completes the response.
    bool finishOnClose();

    bool gotAll() const { return state_ == kGotAll; }
    bool hasError() const { return state_ == kError; }
    Error error() const { return error_; }

    void reset();

    int statusCode() const { return statusCode_; }
    const std::string& reasonPhrase() const { return reason_; }
    // First matching field, case-insensitive; empty when absent.
    std::string getHeader(const std::string& field) const;
    bool hasHeader(const std::string& field) const;
    const std::vector<std::pair<std::string, std::string>>& headers() const { return headers_; }

    const std::string& body() const { return body_; }
    std::string& mutableBody() { return body_; }

    bool needsCloseToFinish() const { return needsCloseToFinish_; }

private:
    static bool IEquals(const std::string& a, const std::string& b);
    static bool HeaderContainsTokenCI(const std::string& v, const std::string& token);

    bool fail(Error e);
    bool parseStatusLine(const std::string& line);
    bool parseHeaderLine(const std::string& line);
    bool beginBody();
    bool consumeChunked();

    ParseState state_{kExpectStatusLine};
    Error error_{Error::kNone};
    std::string pending_;  // unconsumed input

    int httpMajor_{1};
    int httpMinor_{1};
    int statusCode_{0};
    std::string reason_;
    std::vector<std::pair<std::string, std::string>> headers_;
    std::string body_;

    bool chunked_{false};
    size_t bodyRemaining_{0};
    bool needsCloseToFinish_{false};

    // chunked parsing
    bool expectingChunkSize_{true};
    size_t chunkRemaining_{0};
    bool trailer_{false};
};

} // namespace protocol
} // namespace relay
