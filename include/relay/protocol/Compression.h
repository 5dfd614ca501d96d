#pragma once

#include <cstddef>
#include <cstdint>
#include <string>

namespace relay {
namespace protocol {

// Content-Encoding codecs backed by zlib.
class Compression {
public:
    enum class Encoding {
        kIdentity,
        kGzip,
        kDeflate,
        kUnknown,
    };

    // Maps a Content-Encoding value ("gzip", "x-gzip", "deflate", "identity", empty).
    static Encoding ParseContentEncoding(const std::string& v);

    // Decompress whole buffer. Deflate accepts both zlib-wrapped and raw streams.
    static bool Decompress(Encoding enc, const uint8_t* data, size_t len, std::string* out);
    static bool Decompress(Encoding enc, const std::string& in, std::string* out);

    static bool Compress(Encoding enc, const uint8_t* data, size_t len, std::string* out);
    static bool Compress(Encoding enc, const std::string& in, std::string* out);
};

} // namespace protocol
} // namespace relay
