#pragma once

#include "relay/common/noncopyable.h"

#include <string>

struct ssl_ctx_st;

namespace relay {
namespace network {

/// Client-side OpenSSL context shared by every upstream fetch.
class TlsContext : relay::common::noncopyable {
public:
    TlsContext();
    ~TlsContext();

    // Loads the system trust store plus caFile when given. With verifyPeer off,
    // certificate and hostname checks are skipped.
    bool InitClient(bool verifyPeer, const std::string& caFile = std::string());

    ssl_ctx_st* ctx() const { return ctx_; }
    bool ok() const { return ctx_ != nullptr; }
    bool verifyPeer() const { return verifyPeer_; }

    // Drains the thread's OpenSSL error queue into one line.
    static std::string LastErrorString();

private:
    ssl_ctx_st* ctx_{nullptr};
    bool verifyPeer_{true};
};

} // namespace network
} // namespace relay
