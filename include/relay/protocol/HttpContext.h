#pragma once

#include "relay/network/Buffer.h"
#include "relay/protocol/HttpRequest.h"

#include <chrono>

namespace relay {
namespace protocol {

/// Incremental HTTP/1.x request parser. Consumes exactly one request from the
/// buffer and leaves any pipelined bytes after it untouched.
class HttpContext {
public:
    enum HttpRequestParseState {
        kExpectRequestLine,
        kExpectHeaders,
        kExpectBody,
        kGotAll,
    };

    HttpContext()
        : state_(kExpectRequestLine) {}

    // return false if some error
    bool parseRequest(relay::network::Buffer* buf, std::chrono::system_clock::time_point receiveTime);

    bool gotAll() const { return state_ == kGotAll; }
    void reset() {
        state_ = kExpectRequestLine;
        HttpRequest dummy;
        request_.swap(dummy);
        chunked_ = false;
        bodyRemaining_ = 0;
        chunkSize_ = 0;
        expectingChunkSize_ = true;
        inTrailer_ = false;
    }

    const HttpRequest& request() const { return request_; }
    HttpRequest& request() { return request_; }

private:
    bool processRequestLine(const char* begin, const char* end);
    bool beginBody();
    // Returns false on a framing error; sets *needMore when the buffer runs dry.
    bool parseChunkedBody(relay::network::Buffer* buf, bool* needMore);

    HttpRequestParseState state_;
    HttpRequest request_;

    bool chunked_{false};
    size_t bodyRemaining_{0};
    size_t chunkSize_{0};
    bool expectingChunkSize_{true};
    bool inTrailer_{false};
};

} // namespace protocol
} // namespace relay
