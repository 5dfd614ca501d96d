#include "relay/network/TlsContext.h"
#include "relay/common/Logger.h"

#include <openssl/err.h>
#include <openssl/ssl.h>

#include <mutex>

namespace relay {
namespace network {

TlsContext::TlsContext() {
    static std::once_flag once;
    std::call_once(once, []() {
        OPENSSL_init_ssl(OPENSSL_INIT_LOAD_SSL_STRINGS | OPENSSL_INIT_LOAD_CRYPTO_STRINGS, nullptr);
    });
}

TlsContext::~TlsContext() {
    if (ctx_) {
        SSL_CTX_free(reinterpret_cast<SSL_CTX*>(ctx_));
        ctx_ = nullptr;
    }
}

bool TlsContext::InitClient(bool verifyPeer, const std::string& caFile) {
    if (ctx_) {
        SSL_CTX_free(reinterpret_cast<SSL_CTX*>(ctx_));
        ctx_ = nullptr;
    }

    SSL_CTX* c = SSL_CTX_new(TLS_client_method());
    if (!c) {
        LOG_ERROR << "TLS: SSL_CTX_new failed: " << LastErrorString();
        return false;
    }

    SSL_CTX_set_min_proto_version(c, TLS1_2_VERSION);
    SSL_CTX_set_options(c, SSL_OP_NO_COMPRESSION);
    SSL_CTX_set_mode(c, SSL_MODE_ENABLE_PARTIAL_WRITE | SSL_MODE_ACCEPT_MOVING_WRITE_BUFFER);

    if (SSL_CTX_set_default_verify_paths(c) != 1) {
        LOG_WARN << "TLS: could not load system trust store: " << LastErrorString();
    }
    if (!caFile.empty() && SSL_CTX_load_verify_locations(c, caFile.c_str(), nullptr) != 1) {
        LOG_ERROR << "TLS: load CA file failed: " << caFile << " " << LastErrorString();
        SSL_CTX_free(c);
        return false;
    }
    SSL_CTX_set_verify(c, verifyPeer ? SSL_VERIFY_PEER : SSL_VERIFY_NONE, nullptr);

    verifyPeer_ = verifyPeer;
    ctx_ = reinterpret_cast<ssl_ctx_st*>(c);
    return true;
}

std::string TlsContext::LastErrorString() {
    std::string out;
    unsigned long e = 0;
    while ((e = ERR_get_error()) != 0) {
        char buf[256];
        ERR_error_string_n(e, buf, sizeof(buf));
        if (!out.empty()) out += "; ";
        out += buf;
    }
    return out;
}

} // namespace network
} // namespace relay
