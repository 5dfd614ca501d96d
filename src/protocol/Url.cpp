#include "relay/protocol/Url.h"

#include <cctype>
#include <cstdio>
#include <cstdlib>

namespace relay {
namespace protocol {

namespace {

std::string ToLowerCopy(const std::string& s) {
    std::string out;
    out.reserve(s.size());
    for (unsigned char c : s) out.push_back(static_cast<char>(std::tolower(c)));
    return out;
}

std::string Trim(const std::string& s) {
    size_t b = 0;
    size_t e = s.size();
    while (b < e && std::isspace(static_cast<unsigned char>(s[b]))) ++b;
    while (e > b && std::isspace(static_cast<unsigned char>(s[e - 1]))) --e;
    return s.substr(b, e - b);
}

// RFC 3986 scheme: ALPHA *( ALPHA / DIGIT / "+" / "-" / "." ) followed by ':'.
std::string ExtractScheme(const std::string& s) {
    const size_t colon = s.find(':');
    if (colon == std::string::npos || colon == 0) return std::string();
    if (!std::isalpha(static_cast<unsigned char>(s[0]))) return std::string();
    for (size_t i = 1; i < colon; ++i) {
        const unsigned char c = static_cast<unsigned char>(s[i]);
        if (!std::isalnum(c) && c != '+' && c != '-' && c != '.') return std::string();
    }
    return s.substr(0, colon);
}

// Percent-encode bytes that may not appear raw in a request target.
std::string EscapeTarget(const std::string& s) {
    static const char* hex = "0123456789ABCDEF";
    std::string out;
    out.reserve(s.size());
    for (unsigned char c : s) {
        if (c <= 0x20 || c >= 0x7F || c == '"' || c == '<' || c == '>' || c == '`' ||
            c == '{' || c == '}' || c == '|' || c == '\\' || c == '^') {
            out.push_back('%');
            out.push_back(hex[c >> 4]);
            out.push_back(hex[c & 0xF]);
        } else {
            out.push_back(static_cast<char>(c));
        }
    }
    return out;
}

} // namespace

std::string Url::hostHeader() const {
    std::string h = isIpv6Literal() ? "[" + host + "]" : host;
    if (!hasDefaultPort()) {
        h += ":" + std::to_string(port);
    }
    return h;
}

bool Url::Parse(const std::string& raw, Url* out, std::string* error) {
    const std::string s = Trim(raw);

    const std::string scheme = ToLowerCopy(ExtractScheme(s));
    if (scheme.empty()) {
        *error = "Request URL is missing an 'http://' or 'https://' protocol.";
        return false;
    }
    if (scheme != "http" && scheme != "https") {
        *error = "Request URL has an unsupported protocol '" + scheme + "://'.";
        return false;
    }

    std::string rest = s.substr(scheme.size() + 1);
    if (rest.compare(0, 2, "//") != 0) {
        *error = "Invalid URL '" + raw + "': missing host";
        return false;
    }
    rest.erase(0, 2);

    const size_t hash = rest.find('#');
    if (hash != std::string::npos) rest.resize(hash);

    const size_t authEnd = rest.find_first_of("/?");
    std::string authority = rest.substr(0, authEnd);
    std::string target = (authEnd == std::string::npos) ? std::string() : rest.substr(authEnd);

    // Credentials are never forwarded.
    const size_t at = authority.rfind('@');
    if (at != std::string::npos) authority.erase(0, at + 1);

    std::string host;
    std::string portStr;
    if (!authority.empty() && authority[0] == '[') {
        const size_t close = authority.find(']');
        if (close == std::string::npos) {
            *error = "Invalid URL '" + raw + "': invalid IPv6 address";
            return false;
        }
        host = authority.substr(1, close - 1);
        const std::string after = authority.substr(close + 1);
        if (!after.empty()) {
            if (after[0] != ':') {
                *error = "Invalid URL '" + raw + "': invalid IPv6 address";
                return false;
            }
            portStr = after.substr(1);
        }
    } else {
        const size_t colon = authority.rfind(':');
        if (colon != std::string::npos) {
            host = authority.substr(0, colon);
            portStr = authority.substr(colon + 1);
        } else {
            host = authority;
        }
    }

    if (host.empty()) {
        *error = "Invalid URL '" + raw + "': missing host";
        return false;
    }

    uint16_t port = (scheme == "https") ? 443 : 80;
    if (!portStr.empty()) {
        bool digits = portStr.size() <= 5;
        for (unsigned char c : portStr) {
            if (!std::isdigit(c)) digits = false;
        }
        const long v = digits ? std::strtol(portStr.c_str(), nullptr, 10) : -1;
        if (v < 0 || v > 65535) {
            *error = "Invalid port: '" + portStr + "'";
            return false;
        }
        port = static_cast<uint16_t>(v);
    }

    if (target.empty() || target[0] == '?') {
        target = "/" + target;
    }

    out->scheme = scheme;
    out->host = ToLowerCopy(host);
    out->port = port;
    out->target = EscapeTarget(target);
    return true;
}

} // namespace protocol
} // namespace relay
