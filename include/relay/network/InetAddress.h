#pragma once

#include <netinet/in.h>
#include <sys/socket.h>

#include <cstdint>
#include <string>

namespace relay {
namespace network {

/// IPv4 or IPv6 socket address.
class InetAddress {
public:
    explicit InetAddress(uint16_t port = 0, bool loopbackOnly = false);
    // ip is a numeric IPv4 or IPv6 literal; valid() reports whether it parsed.
    InetAddress(const std::string& ip, uint16_t port);
    InetAddress(const struct sockaddr* addr, socklen_t len);

    bool valid() const { return valid_; }
    sa_family_t family() const { return addr_.ss_family; }
    std::string toIp() const;
    std::string toIpPort() const;
    uint16_t toPort() const;

    const struct sockaddr* getSockAddr() const { return reinterpret_cast<const struct sockaddr*>(&addr_); }
    socklen_t getSockLen() const;
    void setSockAddr(const struct sockaddr* addr, socklen_t len);

private:
    struct sockaddr_storage addr_;
    bool valid_{true};
};

} // namespace network
} // namespace relay
