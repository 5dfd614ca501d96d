#include "relay/network/InetAddress.h"

#include <arpa/inet.h>

#include <cstdio>
#include <cstring>

namespace relay {
namespace network {

InetAddress::InetAddress(uint16_t port, bool loopbackOnly) {
    std::memset(&addr_, 0, sizeof addr_);
    auto* in = reinterpret_cast<struct sockaddr_in*>(&addr_);
    in->sin_family = AF_INET;
    in->sin_addr.s_addr = htonl(loopbackOnly ? INADDR_LOOPBACK : INADDR_ANY);
    in->sin_port = htons(port);
}

InetAddress::InetAddress(const std::string& ip, uint16_t port) {
    std::memset(&addr_, 0, sizeof addr_);
    auto* in = reinterpret_cast<struct sockaddr_in*>(&addr_);
    if (::inet_pton(AF_INET, ip.c_str(), &in->sin_addr) == 1) {
        in->sin_family = AF_INET;
        in->sin_port = htons(port);
        return;
    }
    std::memset(&addr_, 0, sizeof addr_);
    auto* in6 = reinterpret_cast<struct sockaddr_in6*>(&addr_);
    if (::inet_pton(AF_INET6, ip.c_str(), &in6->sin6_addr) == 1) {
        in6->sin6_family = AF_INET6;
        in6->sin6_port = htons(port);
        return;
    }
    in->sin_family = AF_INET;
    in->sin_port = htons(port);
    valid_ = false;
}

InetAddress::InetAddress(const struct sockaddr* addr, socklen_t len) {
    setSockAddr(addr, len);
}

void InetAddress::setSockAddr(const struct sockaddr* addr, socklen_t len) {
    std::memset(&addr_, 0, sizeof addr_);
    if (len > sizeof addr_) len = sizeof addr_;
    std::memcpy(&addr_, addr, len);
    valid_ = (addr_.ss_family == AF_INET || addr_.ss_family == AF_INET6);
}

socklen_t InetAddress::getSockLen() const {
    return family() == AF_INET6 ? static_cast<socklen_t>(sizeof(struct sockaddr_in6))
                                : static_cast<socklen_t>(sizeof(struct sockaddr_in));
}

std::string InetAddress::toIp() const {
    char buf[INET6_ADDRSTRLEN] = "";
    if (family() == AF_INET6) {
        ::inet_ntop(AF_INET6, &reinterpret_cast<const struct sockaddr_in6*>(&addr_)->sin6_addr, buf, sizeof buf);
    } else {
        ::inet_ntop(AF_INET, &reinterpret_cast<const struct sockaddr_in*>(&addr_)->sin_addr, buf, sizeof buf);
    }
    return buf;
}

std::string InetAddress::toIpPort() const {
    char buf[16];
    std::snprintf(buf, sizeof buf, ":%u", toPort());
    if (family() == AF_INET6) {
        return "[" + toIp() + "]" + buf;
    }
    return toIp() + buf;
}

uint16_t InetAddress::toPort() const {
    if (family() == AF_INET6) {
        return ntohs(reinterpret_cast<const struct sockaddr_in6*>(&addr_)->sin6_port);
    }
    return ntohs(reinterpret_cast<const struct sockaddr_in*>(&addr_)->sin_port);
}

} // namespace network
} // namespace relay
