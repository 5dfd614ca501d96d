#pragma once

#include <cstddef>
#include <string>
#include <sys/types.h> // for ssize_t

namespace relay {
namespace network {

/// Byte queue for connection input and output. Reads consume from the front,
/// writes append at the back; consumed space is reclaimed lazily on append.
class Buffer {
public:
    size_t ReadableBytes() const { return data_.size() - readerIndex_; }

    const char* Peek() const { return data_.data() + readerIndex_; }

    // First "\r\n" in the readable bytes, nullptr when there is none yet.
    const char* FindCRLF() const;

    void Retrieve(size_t len);
    void RetrieveUntil(const char* end) { Retrieve(static_cast<size_t>(end - Peek())); }
    void RetrieveAll();
    std::string RetrieveAllAsString();

    void Append(const std::string& str) { Append(str.data(), str.size()); }
    void Append(const char* data, size_t len);

    // One read(2) from fd. Returns its result; errno goes to *savedErrno on failure.
    ssize_t ReadFd(int fd, int* savedErrno);

private:
    void Compact();

    std::string data_;
    size_t readerIndex_{0};
};

} // namespace network
} // namespace relay
