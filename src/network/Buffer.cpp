#include "relay/network/Buffer.h"

#include <errno.h>
#include <unistd.h>

namespace relay {
namespace network {

namespace {

// Consumed bytes are dropped once they pass this size and outweigh what is left.
const size_t kCompactThreshold = 4096;
const size_t kReadChunk = 65536;

} // namespace

const char* Buffer::FindCRLF() const {
    const size_t pos = data_.find("\r\n", readerIndex_);
    return pos == std::string::npos ? nullptr : data_.data() + pos;
}

void Buffer::Retrieve(size_t len) {
    if (len < ReadableBytes()) {
        readerIndex_ += len;
    } else {
        RetrieveAll();
    }
}

void Buffer::RetrieveAll() {
    data_.clear();
    readerIndex_ = 0;
}

std::string Buffer::RetrieveAllAsString() {
    std::string result = data_.substr(readerIndex_);
    RetrieveAll();
    return result;
}

void Buffer::Append(const char* data, size_t len) {
    Compact();
    data_.append(data, len);
}

void Buffer::Compact() {
    if (readerIndex_ > kCompactThreshold && readerIndex_ > ReadableBytes()) {
        data_.erase(0, readerIndex_);
        readerIndex_ = 0;
    }
}

ssize_t Buffer::ReadFd(int fd, int* savedErrno) {
    char chunk[kReadChunk];
    const ssize_t n = ::read(fd, chunk, sizeof chunk);
    if (n < 0) {
        *savedErrno = errno;
    } else if (n > 0) {
        Append(chunk, static_cast<size_t>(n));
    }
    return n;
}

} // namespace network
} // namespace relay
