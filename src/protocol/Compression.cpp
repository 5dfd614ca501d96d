#include "relay/protocol/Compression.h"

#include <zlib.h>

#include <cctype>
#include <cstring>

namespace relay {
namespace protocol {

namespace {

std::string TrimLower(const std::string& s) {
    size_t b = 0;
    size_t e = s.size();
    while (b < e && std::isspace(static_cast<unsigned char>(s[b]))) ++b;
    while (e > b && std::isspace(static_cast<unsigned char>(s[e - 1]))) --e;
    std::string out;
    out.reserve(e - b);
    for (size_t i = b; i < e; ++i) out.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(s[i]))));
    return out;
}

bool InflateAll(const uint8_t* data, size_t len, int windowBits, std::string* out) {
    out->clear();
    z_stream zs;
    std::memset(&zs, 0, sizeof(zs));
    zs.next_in = const_cast<Bytef*>(reinterpret_cast<const Bytef*>(data));
    zs.avail_in = static_cast<uInt>(len);
    if (inflateInit2(&zs, windowBits) != Z_OK) return false;

    char buf[16384];
    int ret = Z_OK;
    while (ret != Z_STREAM_END) {
        zs.next_out = reinterpret_cast<Bytef*>(buf);
        zs.avail_out = sizeof(buf);
        ret = inflate(&zs, Z_NO_FLUSH);
        if (ret != Z_OK && ret != Z_STREAM_END) {
            inflateEnd(&zs);
            return false;
        }
        const size_t produced = sizeof(buf) - zs.avail_out;
        if (produced) out->append(buf, buf + produced);
        if (ret == Z_OK && zs.avail_in == 0 && produced == 0) {
            // Truncated stream.
            inflateEnd(&zs);
            return false;
        }
    }
    inflateEnd(&zs);
    return true;
}

bool DeflateAll(const uint8_t* data, size_t len, int windowBits, std::string* out) {
    out->clear();
    z_stream zs;
    std::memset(&zs, 0, sizeof(zs));
    zs.next_in = const_cast<Bytef*>(reinterpret_cast<const Bytef*>(data));
    zs.avail_in = static_cast<uInt>(len);
    if (deflateInit2(&zs, Z_DEFAULT_COMPRESSION, Z_DEFLATED, windowBits, 8, Z_DEFAULT_STRATEGY) != Z_OK) return false;

    char buf[16384];
    int ret = Z_OK;
    while (ret != Z_STREAM_END) {
        zs.next_out = reinterpret_cast<Bytef*>(buf);
        zs.avail_out = sizeof(buf);
        ret = deflate(&zs, Z_FINISH);
        if (ret != Z_OK && ret != Z_STREAM_END) {
            deflateEnd(&zs);
            return false;
        }
        const size_t produced = sizeof(buf) - zs.avail_out;
        if (produced) out->append(buf, buf + produced);
    }
    deflateEnd(&zs);
    return true;
}

} // namespace

Compression::Encoding Compression::ParseContentEncoding(const std::string& v) {
    const std::string lv = TrimLower(v);
    if (lv.empty() || lv == "identity") return Encoding::kIdentity;
    if (lv == "gzip" || lv == "x-gzip") return Encoding::kGzip;
    if (lv == "deflate") return Encoding::kDeflate;
    return Encoding::kUnknown;
}

bool Compression::Decompress(Encoding enc, const uint8_t* data, size_t len, std::string* out) {
    if (!out) return false;
    if (len == 0 && enc != Encoding::kUnknown) {
        out->clear();
        return true;
    }
    switch (enc) {
        case Encoding::kIdentity:
            out->assign(reinterpret_cast<const char*>(data), len);
            return true;
        case Encoding::kGzip:
            return InflateAll(data, len, 16 + MAX_WBITS, out);
        case Encoding::kDeflate:
            // Servers disagree on whether "deflate" carries the zlib header.
            return InflateAll(data, len, MAX_WBITS, out) || InflateAll(data, len, -MAX_WBITS, out);
        case Encoding::kUnknown:
            break;
    }
    return false;
}

bool Compression::Decompress(Encoding enc, const std::string& in, std::string* out) {
    return Decompress(enc, reinterpret_cast<const uint8_t*>(in.data()), in.size(), out);
}

bool Compression::Compress(Encoding enc, const uint8_t* data, size_t len, std::string* out) {
    if (!out) return false;
    switch (enc) {
        case Encoding::kIdentity:
            out->assign(reinterpret_cast<const char*>(data), len);
            return true;
        case Encoding::kGzip:
            return DeflateAll(data, len, 16 + MAX_WBITS, out);
        case Encoding::kDeflate:
            return DeflateAll(data, len, MAX_WBITS, out);
        case Encoding::kUnknown:
            break;
    }
    return false;
}

bool Compression::Compress(Encoding enc, const std::string& in, std::string* out) {
    return Compress(enc, reinterpret_cast<const uint8_t*>(in.data()), in.size(), out);
}

} // namespace protocol
} // namespace relay
