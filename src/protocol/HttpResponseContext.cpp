#include "relay/protocol/HttpResponseContext.h"

#include <algorithm>
#include <cctype>
#include <climits>
#include <cstdlib>

namespace relay {
namespace protocol {

namespace {

bool isWs(unsigned char c) {
    return c == ' ' || c == '\t' || c == '\r' || c == '\n';
}

std::string ToLowerCopy(const std::string& s) {
    std::string out;
    out.reserve(s.size());
    for (unsigned char c : s) out.push_back(static_cast<char>(std::tolower(c)));
    return out;
}

// Pops one CRLF- (or bare LF-) terminated line off the front of buf.
bool TakeLine(std::string* buf, std::string* line) {
    const size_t lf = buf->find('\n');
    if (lf == std::string::npos) return false;
    size_t end = lf;
    if (end > 0 && (*buf)[end - 1] == '\r') --end;
    line->assign(*buf, 0, end);
    buf->erase(0, lf + 1);
    return true;
}

bool AllDigits(const std::string& s) {
    if (s.empty()) return false;
    for (unsigned char c : s) {
        if (!std::isdigit(c)) return false;
    }
    return true;
}

} // namespace

bool HttpResponseContext::IEquals(const std::string& a, const std::string& b) {
    return ToLowerCopy(a) == ToLowerCopy(b);
}

bool HttpResponseContext::HeaderContainsTokenCI(const std::string& v, const std::string& token) {
    return ToLowerCopy(v).find(ToLowerCopy(token)) != std::string::npos;
}

void HttpResponseContext::reset() {
    state_ = kExpectStatusLine;
    error_ = Error::kNone;
    pending_.clear();
    httpMajor_ = 1;
    httpMinor_ = 1;
    statusCode_ = 0;
    reason_.clear();
    headers_.clear();
    body_.clear();
    chunked_ = false;
    bodyRemaining_ = 0;
    needsCloseToFinish_ = false;
    expectingChunkSize_ = true;
    chunkRemaining_ = 0;
    trailer_ = false;
}

std::string HttpResponseContext::getHeader(const std::string& field) const {
    for (const auto& kv : headers_) {
        if (IEquals(kv.first, field)) return kv.second;
    }
    return std::string();
}

bool HttpResponseContext::hasHeader(const std::string& field) const {
    for (const auto& kv : headers_) {
        if (IEquals(kv.first, field)) return true;
    }
    return false;
}

bool HttpResponseContext::fail(Error e) {
    state_ = kError;
    error_ = e;
    return false;
}

bool HttpResponseContext::parseStatusLine(const std::string& line) {
    // HTTP/1.1 200 OK
    if (line.compare(0, 5, "HTTP/") != 0) return false;
    const size_t sp1 = line.find(' ');
    if (sp1 == std::string::npos) return false;
    const std::string ver = line.substr(5, sp1 - 5);
    if (ver.size() != 3 || ver[1] != '.' || !std::isdigit(static_cast<unsigned char>(ver[0])) ||
        !std::isdigit(static_cast<unsigned char>(ver[2]))) {
        return false;
    }
    httpMajor_ = ver[0] - '0';
    httpMinor_ = ver[2] - '0';
    if (httpMajor_ != 1) return false;

    const size_t sp2 = line.find(' ', sp1 + 1);
    const std::string code = (sp2 == std::string::npos) ? line.substr(sp1 + 1) : line.substr(sp1 + 1, sp2 - sp1 - 1);
    if (code.size() != 3 || !AllDigits(code)) return false;
    statusCode_ = std::atoi(code.c_str());
    if (statusCode_ < 100) return false;
    reason_ = (sp2 == std::string::npos) ? std::string() : line.substr(sp2 + 1);
    return true;
}

bool HttpResponseContext::parseHeaderLine(const std::string& line) {
    const size_t colon = line.find(':');
    if (colon == std::string::npos || colon == 0) return false;
    std::string key = line.substr(0, colon);
    if (isWs(static_cast<unsigned char>(key.back()))) return false;
    std::string val = line.substr(colon + 1);
    while (!val.empty() && (val.front() == ' ' || val.front() == '\t')) val.erase(val.begin());
    while (!val.empty() && (val.back() == ' ' || val.back() == '\t')) val.pop_back();
    headers_.emplace_back(std::move(key), std::move(val));
    return true;
}

bool HttpResponseContext::beginBody() {
    const std::string te = getHeader("Transfer-Encoding");

    chunked_ = false;
    needsCloseToFinish_ = false;
    bodyRemaining_ = 0;

    if (statusCode_ == 204 || statusCode_ == 304) {
        state_ = kGotAll;
        return true;
    }
    if (!te.empty() && HeaderContainsTokenCI(te, "chunked")) {
        chunked_ = true;
        expectingChunkSize_ = true;
        chunkRemaining_ = 0;
        trailer_ = false;
    } else if (hasHeader("Content-Length")) {
        // Repeated identical values are tolerated ("10, 10").
        std::string cl = getHeader("Content-Length");
        const size_t comma = cl.find(',');
        if (comma != std::string::npos) {
            std::string first = cl.substr(0, comma);
            while (!first.empty() && isWs(static_cast<unsigned char>(first.back()))) first.pop_back();
            cl = first;
        }
        if (!AllDigits(cl)) return false;
        bodyRemaining_ = static_cast<size_t>(std::strtoull(cl.c_str(), nullptr, 10));
    } else {
        needsCloseToFinish_ = true;
    }

    state_ = (!chunked_ && !needsCloseToFinish_ && bodyRemaining_ == 0) ? kGotAll : kExpectBody;
    return true;
}

bool HttpResponseContext::consumeChunked() {
    while (state_ == kExpectBody) {
        if (trailer_) {
            std::string line;
            if (!TakeLine(&pending_, &line)) return true;
            if (line.empty()) {
                state_ = kGotAll;
            }
            continue;
        }

        if (expectingChunkSize_) {
            std::string line;
            if (!TakeLine(&pending_, &line)) return true;
            const size_t semi = line.find(';');
            if (semi != std::string::npos) line.resize(semi);
            while (!line.empty() && isWs(static_cast<unsigned char>(line.front()))) line.erase(line.begin());
            while (!line.empty() && isWs(static_cast<unsigned char>(line.back()))) line.pop_back();
            if (line.empty() || line.size() > 16 || !std::isxdigit(static_cast<unsigned char>(line[0]))) {
                return fail(Error::kMalformed);
            }
            char* endp = nullptr;
            const unsigned long long n = std::strtoull(line.c_str(), &endp, 16);
            if (*endp != '\0' || n == ULLONG_MAX) return fail(Error::kMalformed);
            chunkRemaining_ = static_cast<size_t>(n);
            expectingChunkSize_ = false;
            if (chunkRemaining_ == 0) {
                trailer_ = true;
            }
            continue;
        }

        if (chunkRemaining_ > 0) {
            const size_t take = std::min(chunkRemaining_, pending_.size());
            if (take == 0) return true;
            body_.append(pending_, 0, take);
            pending_.erase(0, take);
            chunkRemaining_ -= take;
            if (chunkRemaining_ > 0) return true;
        }

        // CRLF after chunk data.
        if (pending_.size() < 2) {
            if (pending_.size() == 1 && pending_[0] != '\r' && pending_[0] != '\n') {
                return fail(Error::kMalformed);
            }
            if (pending_ == "\n") {
                pending_.clear();
                expectingChunkSize_ = true;
                continue;
            }
            return true;
        }
        if (pending_[0] == '\r' && pending_[1] == '\n') {
            pending_.erase(0, 2);
        } else if (pending_[0] == '\n') {
            pending_.erase(0, 1);
        } else {
            return fail(Error::kMalformed);
        }
        expectingChunkSize_ = true;
    }
    return true;
}

bool HttpResponseContext::feed(const char* data, size_t len) {
    if (state_ == kError) return false;
    if (state_ == kGotAll) return true;
    if (data && len > 0) pending_.append(data, len);

    while (state_ != kError && state_ != kGotAll) {
        if (state_ == kExpectStatusLine) {
            std::string line;
            if (!TakeLine(&pending_, &line)) {
                // A status line can never be this long; give up early on garbage.
                if (pending_.size() > 8192) return fail(Error::kMalformed);
                return false;
            }
            if (!parseStatusLine(line)) return fail(Error::kMalformed);
            headers_.clear();
            state_ = kExpectHeaders;
        } else if (state_ == kExpectHeaders) {
            std::string line;
            if (!TakeLine(&pending_, &line)) return false;
            if (!line.empty()) {
                if (!parseHeaderLine(line)) return fail(Error::kMalformed);
                continue;
            }
            if (statusCode_ / 100 == 1) {
                // Interim response; the real one follows.
                statusCode_ = 0;
                reason_.clear();
                headers_.clear();
                state_ = kExpectStatusLine;
                continue;
            }
            if (!beginBody()) return fail(Error::kMalformed);
        } else if (state_ == kExpectBody) {
            if (chunked_) {
                if (!consumeChunked()) return false;
                if (state_ != kGotAll) return false;
            } else if (needsCloseToFinish_) {
                body_.append(pending_);
                pending_.clear();
                return false;
            } else {
                const size_t take = std::min(bodyRemaining_, pending_.size());
                body_.append(pending_, 0, take);
                pending_.erase(0, take);
                bodyRemaining_ -= take;
                if (bodyRemaining_ > 0) return false;
                state_ = kGotAll;
            }
        }
    }
    return state_ == kGotAll;
}

bool HttpResponseContext::finishOnClose() {
    switch (state_) {
        case kGotAll:
            return true;
        case kError:
            return false;
        case kExpectStatusLine:
            if (statusCode_ == 0 && pending_.empty()) return fail(Error::kNoResponse);
            return fail(Error::kMalformed);
        case kExpectHeaders:
            return fail(Error::kMalformed);
        case kExpectBody:
            if (needsCloseToFinish_) {
                body_.append(pending_);
                pending_.clear();
                state_ = kGotAll;
                return true;
            }
            return fail(Error::kIncompleteBody);
    }
    return false;
}

} // namespace protocol
} // namespace relay
