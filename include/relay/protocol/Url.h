#pragma once

#include <cstdint>
#include <string>

namespace relay {
namespace protocol {

/// Absolute http/https URL split into the parts needed to issue a request.
struct Url {
    std::string scheme;  // "http" or "https", lowercase
    std::string host;    // lowercase; IPv6 literals without brackets
    uint16_t port{0};    // explicit port or the scheme default
    std::string target;  // path + query, never empty, fragment dropped

    bool isHttps() const { return scheme == "https"; }
    bool isIpv6Literal() const { return host.find(':') != std::string::npos; }
    bool hasDefaultPort() const { return port == (isHttps() ? 443 : 80); }

    // Host header value: brackets for IPv6, port only when non-default.
    std::string hostHeader() const;

    // On failure returns false and sets *error to a human readable reason.
    static bool Parse(const std::string& raw, Url* out, std::string* error);
};

} // namespace protocol
} // namespace relay
