#include "relay/protocol/HttpContext.h"
#include "relay/network/Buffer.h"

#include <algorithm>
#include <cctype>
#include <climits>
#include <cstdlib>

namespace relay {
namespace protocol {

namespace {

// 16 hex digits fill a 64-bit size.
const size_t kMaxChunkSizeDigits = 16;

std::string ToLowerCopy(const std::string& s) {
    std::string out;
    out.reserve(s.size());
    for (unsigned char c : s) out.push_back(static_cast<char>(std::tolower(c)));
    return out;
}

bool AllDigits(const std::string& s) {
    if (s.empty()) return false;
    for (unsigned char c : s) {
        if (!std::isdigit(c)) return false;
    }
    return true;
}

} // namespace

bool HttpContext::processRequestLine(const char* begin, const char* end) {
    bool succeed = false;
    const char* start = begin;
    const char* space = std::find(start, end, ' ');
    if (space != end && request_.setMethod(start, space)) {
        start = space + 1;
        space = std::find(start, end, ' ');
        if (space != end && space != start) {
            const char* question = std::find(start, space, '?');
            if (question != space) {
                request_.setPath(start, question);
                request_.setQuery(question, space);
            } else {
                request_.setPath(start, space);
            }
            start = space + 1;
            succeed = end - start == 8 && std::equal(start, end - 1, "HTTP/1.");
            if (succeed) {
                if (*(end - 1) == '1') {
                    request_.setVersion(HttpRequest::kHttp11);
                } else if (*(end - 1) == '0') {
                    request_.setVersion(HttpRequest::kHttp10);
                } else {
                    succeed = false;
                }
            }
        }
    }
    return succeed;
}

bool HttpContext::beginBody() {
    chunked_ = false;
    bodyRemaining_ = 0;
    chunkSize_ = 0;
    expectingChunkSize_ = true;
    inTrailer_ = false;

    const std::string te = request_.getHeader("Transfer-Encoding");
    if (!te.empty()) {
        if (ToLowerCopy(te).find("chunked") == std::string::npos) return false;
        chunked_ = true;
    } else if (request_.hasHeader("Content-Length")) {
        const std::string cl = request_.getHeader("Content-Length");
        if (!AllDigits(cl)) return false;
        bodyRemaining_ = static_cast<size_t>(std::strtoull(cl.c_str(), nullptr, 10));
    }

    state_ = (chunked_ || bodyRemaining_ > 0) ? kExpectBody : kGotAll;
    return true;
}

bool HttpContext::parseChunkedBody(relay::network::Buffer* buf, bool* needMore) {
    while (true) {
        if (inTrailer_) {
            // Trailer fields are dropped up to the blank line.
            const char* t = buf->FindCRLF();
            if (!t) {
                *needMore = true;
                return true;
            }
            const bool blank = (t == buf->Peek());
            buf->RetrieveUntil(t + 2);
            if (blank) {
                state_ = kGotAll;
                return true;
            }
            continue;
        }

        if (expectingChunkSize_) {
            const char* crlf = buf->FindCRLF();
            if (!crlf) {
                *needMore = true;
                return true;
            }
            std::string line(buf->Peek(), crlf);
            buf->RetrieveUntil(crlf + 2);

            const size_t semi = line.find(';');
            if (semi != std::string::npos) line.resize(semi);
            while (!line.empty() && std::isspace(static_cast<unsigned char>(line.back()))) line.pop_back();
            if (line.empty() || line.size() > kMaxChunkSizeDigits ||
                !std::isxdigit(static_cast<unsigned char>(line[0]))) {
                return false;
            }

            char* endp = nullptr;
            const unsigned long long sz = std::strtoull(line.c_str(), &endp, 16);
            if (*endp != '\0' || sz == ULLONG_MAX) return false;
            chunkSize_ = static_cast<size_t>(sz);
            expectingChunkSize_ = false;
            if (chunkSize_ == 0) {
                inTrailer_ = true;
                continue;
            }
        }

        if (buf->ReadableBytes() < 2 || buf->ReadableBytes() - 2 < chunkSize_) {
            *needMore = true;
            return true;
        }
        request_.appendBody(buf->Peek(), chunkSize_);
        buf->Retrieve(chunkSize_);
        const char* p = buf->Peek();
        if (p[0] != '\r' || p[1] != '\n') return false;
        buf->Retrieve(2);
        expectingChunkSize_ = true;
    }
}

// return false if any error
bool HttpContext::parseRequest(relay::network::Buffer* buf, std::chrono::system_clock::time_point receiveTime) {
    (void)receiveTime;
    bool ok = true;
    bool hasMore = true;
    while (hasMore && ok) {
        if (state_ == kExpectRequestLine) {
            const char* crlf = buf->FindCRLF();
            if (!crlf) break;
            if (crlf == buf->Peek()) {
                // Tolerate stray CRLF between pipelined requests.
                buf->Retrieve(2);
                continue;
            }
            ok = processRequestLine(buf->Peek(), crlf);
            if (ok) {
                buf->RetrieveUntil(crlf + 2);
                state_ = kExpectHeaders;
            }
        } else if (state_ == kExpectHeaders) {
            const char* crlf = buf->FindCRLF();
            if (!crlf) break;
            if (crlf == buf->Peek()) {
                buf->Retrieve(2);
                ok = beginBody();
                hasMore = (state_ == kExpectBody);
                continue;
            }
            const char* colon = std::find(buf->Peek(), crlf, ':');
            if (colon == crlf || colon == buf->Peek()) {
                ok = false;
                break;
            }
            request_.addHeader(buf->Peek(), colon, crlf);
            buf->RetrieveUntil(crlf + 2);
        } else if (state_ == kExpectBody) {
            if (chunked_) {
                bool needMore = false;
                ok = parseChunkedBody(buf, &needMore);
                hasMore = false;
            } else {
                const size_t n = std::min(bodyRemaining_, buf->ReadableBytes());
                if (n > 0) {
                    request_.appendBody(buf->Peek(), n);
                    buf->Retrieve(n);
                    bodyRemaining_ -= n;
                }
                if (bodyRemaining_ == 0) {
                    state_ = kGotAll;
                }
                hasMore = false;
            }
        } else {
            hasMore = false;
        }
    }
    return ok;
}

} // namespace protocol
} // namespace relay
