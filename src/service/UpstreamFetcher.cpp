#include "relay/service/UpstreamFetcher.h"
#include "relay/network/Channel.h"
#include "relay/network/EventLoop.h"
#include "relay/network/TlsContext.h"
#include "relay/protocol/Compression.h"
#include "relay/common/Logger.h"

#include <openssl/err.h>
#include <openssl/ssl.h>
#include <openssl/x509v3.h>

#include <sys/socket.h>
#include <sys/timerfd.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>

namespace relay {
namespace service {

using relay::network::Channel;
using relay::network::EventLoop;
using relay::network::InetAddress;
using relay::protocol::HttpResponseContext;

namespace {

std::string ErrnoText(int err) {
    return "[Errno " + std::to_string(err) + "] " + std::strerror(err);
}

// Stop a channel and destroy it once the current poll iteration is over; the
// poller may still hold it in its active list.
void RetireChannel(EventLoop* loop, std::shared_ptr<Channel>* channel) {
    if (!*channel) return;
    (*channel)->ClearCallbacks();
    if (!(*channel)->IsNoneEvent()) (*channel)->DisableAll();
    (*channel)->Remove();
    loop->QueueInLoop([dead = std::move(*channel)]() mutable { dead.reset(); });
    channel->reset();
}

std::string TlsFailureText(SSL* ssl, int sslError) {
    const long verify = SSL_get_verify_result(ssl);
    if (verify != X509_V_OK) {
        ERR_clear_error();
        return std::string("[SSL: CERTIFICATE_VERIFY_FAILED] certificate verify failed: ") +
               X509_verify_cert_error_string(verify);
    }
    std::string text = relay::network::TlsContext::LastErrorString();
    if (!text.empty()) return text;
    if (sslError == SSL_ERROR_SYSCALL && errno != 0) return ErrnoText(errno);
    return "Server disconnected without sending a response.";
}

} // namespace

const char* const UpstreamFetcher::kUserAgent = "SyftBox-Proxy/1.0";

UpstreamFetcher::UpstreamFetcher(relay::network::Resolver* resolver,
                                 relay::network::TlsContext* tls,
                                 Options options)
    : resolver_(resolver), tls_(tls), options_(std::move(options)) {
}

std::string UpstreamFetcher::BuildRequest(const relay::protocol::Url& url) const {
    std::string req;
    req.reserve(256 + url.target.size());
    req += "GET " + url.target + " HTTP/1.1\r\n";
    req += "Host: " + url.hostHeader() + "\r\n";
    req += "Accept: */*\r\n";
    req += "Accept-Encoding: gzip, deflate\r\n";
    req += "Connection: close\r\n";
    req += "User-Agent: ";
    req += kUserAgent;
    req += "\r\n";
    req += "\r\n";
    return req;
}

void UpstreamFetcher::Fetch(EventLoop* loop, const std::string& url, Callback cb) {
    auto ctx = std::make_shared<FetchContext>();
    ctx->loop = loop;
    ctx->cb = std::move(cb);
    ctx->rawUrl = url;
    loop->RunInLoop([this, ctx]() { Start(ctx); });
}

void UpstreamFetcher::Start(const FetchContextPtr& ctx) {
    std::string error;
    if (!relay::protocol::Url::Parse(ctx->rawUrl, &ctx->url, &error)) {
        Finish(ctx, FetchOutcome::FetchError(error));
        return;
    }
    if (ctx->url.isHttps() && (!tls_ || !tls_->ok())) {
        Finish(ctx, FetchOutcome::FetchError("TLS is not available"));
        return;
    }
    if (!ArmTimer(ctx)) {
        Finish(ctx, FetchOutcome::FetchError(ErrnoText(errno)));
        return;
    }

    InetAddress literal(ctx->url.host, ctx->url.port);
    if (literal.valid()) {
        ctx->addresses.push_back(literal);
        ConnectNext(ctx);
        return;
    }

    ctx->state = State::kResolving;
    LOG_DEBUG << "UpstreamFetcher: resolving " << ctx->url.host;
    resolver_->Resolve(ctx->loop, ctx->url.host, ctx->url.port,
                       [this, ctx](const relay::network::Resolver::Result& result) {
                           OnResolved(ctx, result);
                       });
}

bool UpstreamFetcher::ArmTimer(const FetchContextPtr& ctx) {
    // A non-positive timeout means no deadline.
    if (options_.timeoutSec <= 0) return true;

    int tfd = ::timerfd_create(CLOCK_MONOTONIC, TFD_NONBLOCK | TFD_CLOEXEC);
    if (tfd < 0) {
        const int saved = errno;
        LOG_ERROR << "UpstreamFetcher: timerfd_create failed errno=" << saved;
        errno = saved;
        return false;
    }

    struct itimerspec howlong;
    std::memset(&howlong, 0, sizeof howlong);
    howlong.it_value.tv_sec = static_cast<time_t>(options_.timeoutSec);
    howlong.it_value.tv_nsec =
        static_cast<long>((options_.timeoutSec - static_cast<double>(howlong.it_value.tv_sec)) * 1000000000);
    if (howlong.it_value.tv_sec == 0 && howlong.it_value.tv_nsec == 0) howlong.it_value.tv_nsec = 1;
    if (::timerfd_settime(tfd, 0, &howlong, nullptr) < 0) {
        const int saved = errno;
        LOG_ERROR << "UpstreamFetcher: timerfd_settime failed errno=" << saved;
        ::close(tfd);
        errno = saved;
        return false;
    }

    ctx->timerfd = tfd;
    ctx->timerChannel = std::make_shared<Channel>(ctx->loop, tfd);
    ctx->timerChannel->SetReadCallback([this, ctx](std::chrono::system_clock::time_point) { OnTimeout(ctx); });
    ctx->timerChannel->EnableReading();
    return true;
}

void UpstreamFetcher::OnResolved(const FetchContextPtr& ctx, const relay::network::Resolver::Result& result) {
    if (ctx->finished.load()) return;
    if (result.error != 0) {
        Finish(ctx, FetchOutcome::FetchError(result.errorText));
        return;
    }
    ctx->addresses = result.addresses;
    ctx->nextAddress = 0;
    ConnectNext(ctx);
}

void UpstreamFetcher::ConnectNext(const FetchContextPtr& ctx) {
    while (ctx->nextAddress < ctx->addresses.size()) {
        const InetAddress addr = ctx->addresses[ctx->nextAddress++];
        CloseSocket(ctx);

        int sockfd = ::socket(addr.family(), SOCK_STREAM | SOCK_NONBLOCK | SOCK_CLOEXEC, IPPROTO_TCP);
        if (sockfd < 0) {
            LOG_WARN << "UpstreamFetcher: socket() failed for " << addr.toIpPort() << " errno=" << errno;
            continue;
        }
        ctx->sockfd = sockfd;
        ctx->connChannel = std::make_shared<Channel>(ctx->loop, sockfd);
        ctx->connChannel->SetWriteCallback([this, ctx]() { OnWritable(ctx); });
        ctx->connChannel->SetReadCallback([this, ctx](std::chrono::system_clock::time_point) { OnReadable(ctx); });
        // HUP/ERR: let the state handler discover the failure through SO_ERROR or recv().
        ctx->connChannel->SetCloseCallback([this, ctx]() {
            if (ctx->state == State::kConnecting) OnWritable(ctx); else OnReadable(ctx);
        });
        ctx->connChannel->SetErrorCallback([this, ctx]() {
            if (ctx->state == State::kConnecting) OnWritable(ctx); else OnReadable(ctx);
        });

        LOG_DEBUG << "UpstreamFetcher: connecting to " << addr.toIpPort();
        const int ret = ::connect(sockfd, addr.getSockAddr(), addr.getSockLen());
        const int savedErrno = (ret == 0) ? 0 : errno;
        if (ret == 0 || savedErrno == EISCONN) {
            OnConnected(ctx);
            return;
        }
        if (savedErrno == EINPROGRESS) {
            ctx->state = State::kConnecting;
            ctx->connChannel->EnableWriting();
            return;
        }
        LOG_DEBUG << "UpstreamFetcher: connect " << addr.toIpPort() << " failed: " << std::strerror(savedErrno);
    }
    Finish(ctx, FetchOutcome::FetchError("All connection attempts failed"));
}

void UpstreamFetcher::OnConnected(const FetchContextPtr& ctx) {
    ctx->out = BuildRequest(ctx->url);
    ctx->outOffset = 0;
    if (ctx->url.isHttps()) {
        StartTls(ctx);
        return;
    }
    ctx->state = State::kSending;
    SendRequest(ctx);
}

void UpstreamFetcher::OnWritable(const FetchContextPtr& ctx) {
    if (ctx->finished.load()) return;

    switch (ctx->state) {
        case State::kConnecting: {
            int err = 0;
            socklen_t len = sizeof err;
            if (::getsockopt(ctx->sockfd, SOL_SOCKET, SO_ERROR, &err, &len) < 0) {
                err = errno;
            }
            if (err) {
                LOG_DEBUG << "UpstreamFetcher: connect failed: " << std::strerror(err);
                ConnectNext(ctx);
                return;
            }
            ctx->connChannel->DisableWriting();
            OnConnected(ctx);
            return;
        }
        case State::kHandshaking:
            ContinueHandshake(ctx);
            return;
        case State::kSending:
            SendRequest(ctx);
            return;
        case State::kReading:
            // SSL_read asked for writability (renegotiation).
            ctx->connChannel->DisableWriting();
            OnReadable(ctx);
            return;
        default:
            return;
    }
}

void UpstreamFetcher::OnReadable(const FetchContextPtr& ctx) {
    if (ctx->finished.load()) return;

    switch (ctx->state) {
        case State::kConnecting:
            OnWritable(ctx);
            return;
        case State::kHandshaking:
            ContinueHandshake(ctx);
            return;
        case State::kSending:
            SendRequest(ctx);
            return;
        case State::kReading:
            if (ctx->ssl) ReadTls(ctx); else ReadPlain(ctx);
            return;
        default:
            return;
    }
}

void UpstreamFetcher::OnTimeout(const FetchContextPtr& ctx) {
    uint64_t one = 0;
    ssize_t n = ::read(ctx->timerfd, &one, sizeof one);
    (void)n;
    LOG_DEBUG << "UpstreamFetcher: deadline expired for " << ctx->url.host;
    Finish(ctx, FetchOutcome::Timeout());
}

void UpstreamFetcher::StartTls(const FetchContextPtr& ctx) {
    SSL* ssl = SSL_new(reinterpret_cast<SSL_CTX*>(tls_->ctx()));
    if (!ssl) {
        Finish(ctx, FetchOutcome::FetchError(relay::network::TlsContext::LastErrorString()));
        return;
    }
    ctx->ssl = ssl;
    SSL_set_fd(ssl, ctx->sockfd);

    const bool ipLiteral = InetAddress(ctx->url.host, ctx->url.port).valid();
    if (!ipLiteral) {
        SSL_set_tlsext_host_name(ssl, ctx->url.host.c_str());
    }
    if (tls_->verifyPeer()) {
        const int ok = ipLiteral
            ? X509_VERIFY_PARAM_set1_ip_asc(SSL_get0_param(ssl), ctx->url.host.c_str())
            : SSL_set1_host(ssl, ctx->url.host.c_str());
        if (ok != 1) {
            Finish(ctx, FetchOutcome::FetchError(relay::network::TlsContext::LastErrorString()));
            return;
        }
    }
    SSL_set_connect_state(ssl);

    ctx->state = State::kHandshaking;
    ContinueHandshake(ctx);
}

void UpstreamFetcher::ContinueHandshake(const FetchContextPtr& ctx) {
    ERR_clear_error();
    errno = 0;
    const int ret = SSL_do_handshake(ctx->ssl);
    if (ret == 1) {
        LOG_DEBUG << "UpstreamFetcher: TLS established with " << ctx->url.host
                  << " (" << SSL_get_version(ctx->ssl) << ")";
        ctx->connChannel->DisableWriting();
        ctx->state = State::kSending;
        SendRequest(ctx);
        return;
    }
    const int err = SSL_get_error(ctx->ssl, ret);
    if (err == SSL_ERROR_WANT_READ) {
        if (ctx->connChannel->IsWriting()) ctx->connChannel->DisableWriting();
        if (!ctx->connChannel->IsReading()) ctx->connChannel->EnableReading();
        return;
    }
    if (err == SSL_ERROR_WANT_WRITE) {
        if (!ctx->connChannel->IsWriting()) ctx->connChannel->EnableWriting();
        return;
    }
    const std::string reason = TlsFailureText(ctx->ssl, err);
    LOG_DEBUG << "UpstreamFetcher: TLS handshake with " << ctx->url.host << " failed: " << reason;
    Finish(ctx, FetchOutcome::FetchError(reason));
}

void UpstreamFetcher::SendRequest(const FetchContextPtr& ctx) {
    while (ctx->outOffset < ctx->out.size()) {
        const char* p = ctx->out.data() + ctx->outOffset;
        const size_t left = ctx->out.size() - ctx->outOffset;

        if (ctx->ssl) {
            ERR_clear_error();
            errno = 0;
            const int n = SSL_write(ctx->ssl, p, static_cast<int>(left));
            if (n > 0) {
                ctx->outOffset += static_cast<size_t>(n);
                continue;
            }
            const int err = SSL_get_error(ctx->ssl, n);
            if (err == SSL_ERROR_WANT_WRITE) {
                if (!ctx->connChannel->IsWriting()) ctx->connChannel->EnableWriting();
                return;
            }
            if (err == SSL_ERROR_WANT_READ) {
                if (!ctx->connChannel->IsReading()) ctx->connChannel->EnableReading();
                return;
            }
            Finish(ctx, FetchOutcome::FetchError(TlsFailureText(ctx->ssl, err)));
            return;
        }

        const ssize_t n = ::send(ctx->sockfd, p, left, MSG_NOSIGNAL);
        if (n > 0) {
            ctx->outOffset += static_cast<size_t>(n);
            continue;
        }
        if (n < 0 && errno == EINTR) continue;
        if (n < 0 && (errno == EAGAIN || errno == EWOULDBLOCK)) {
            if (!ctx->connChannel->IsWriting()) ctx->connChannel->EnableWriting();
            return;
        }
        Finish(ctx, FetchOutcome::FetchError(ErrnoText(n < 0 ? errno : EPIPE)));
        return;
    }

    // Sent all.
    if (ctx->connChannel->IsWriting()) ctx->connChannel->DisableWriting();
    ctx->state = State::kReading;
    if (!ctx->connChannel->IsReading()) ctx->connChannel->EnableReading();
    // TLS may already hold decrypted application data.
    if (ctx->ssl && SSL_pending(ctx->ssl) > 0) ReadTls(ctx);
}

void UpstreamFetcher::ReadPlain(const FetchContextPtr& ctx) {
    char buf[16384];
    while (true) {
        const ssize_t n = ::recv(ctx->sockfd, buf, sizeof(buf), 0);
        if (n > 0) {
            ctx->response.feed(buf, static_cast<size_t>(n));
            if (ctx->response.gotAll() || ctx->response.hasError()) {
                Complete(ctx);
                return;
            }
            continue;
        }
        if (n == 0) {
            OnPeerClosed(ctx);
            return;
        }
        if (errno == EINTR) continue;
        if (errno == EAGAIN || errno == EWOULDBLOCK) return;
        Finish(ctx, FetchOutcome::FetchError(ErrnoText(errno)));
        return;
    }
}

void UpstreamFetcher::ReadTls(const FetchContextPtr& ctx) {
    char buf[16384];
    while (true) {
        ERR_clear_error();
        errno = 0;
        const int n = SSL_read(ctx->ssl, buf, sizeof(buf));
        if (n > 0) {
            ctx->response.feed(buf, static_cast<size_t>(n));
            if (ctx->response.gotAll() || ctx->response.hasError()) {
                Complete(ctx);
                return;
            }
            continue;
        }
        const int err = SSL_get_error(ctx->ssl, n);
        if (err == SSL_ERROR_WANT_READ) return;
        if (err == SSL_ERROR_WANT_WRITE) {
            if (!ctx->connChannel->IsWriting()) ctx->connChannel->EnableWriting();
            return;
        }
        if (err == SSL_ERROR_ZERO_RETURN) {
            OnPeerClosed(ctx);
            return;
        }
        if (err == SSL_ERROR_SYSCALL && ERR_peek_error() == 0) {
            // EOF without close_notify; the response framing decides whether that is fine.
            if (errno == 0) {
                OnPeerClosed(ctx);
            } else {
                Finish(ctx, FetchOutcome::FetchError(ErrnoText(errno)));
            }
            return;
        }
        Finish(ctx, FetchOutcome::FetchError(TlsFailureText(ctx->ssl, err)));
        return;
    }
}

void UpstreamFetcher::OnPeerClosed(const FetchContextPtr& ctx) {
    ctx->response.finishOnClose();
    Complete(ctx);
}

void UpstreamFetcher::Complete(const FetchContextPtr& ctx) {
    HttpResponseContext& r = ctx->response;
    if (r.hasError() || !r.gotAll()) {
        switch (r.error()) {
            case HttpResponseContext::Error::kNoResponse:
                Finish(ctx, FetchOutcome::FetchError("Server disconnected without sending a response."));
                return;
            case HttpResponseContext::Error::kIncompleteBody:
                Finish(ctx, FetchOutcome::FetchError("peer closed connection without sending complete message body"));
                return;
            default:
                Finish(ctx, FetchOutcome::FetchError("Invalid HTTP response"));
                return;
        }
    }

    const int status = r.statusCode();
    LOG_DEBUG << "UpstreamFetcher: " << ctx->url.host << " answered " << status
              << " with " << r.body().size() << " body bytes";
    if (status != 200) {
        Finish(ctx, FetchOutcome::UpstreamError(status));
        return;
    }

    const auto encoding = relay::protocol::Compression::ParseContentEncoding(r.getHeader("Content-Encoding"));
    std::string body;
    if (encoding == relay::protocol::Compression::Encoding::kGzip ||
        encoding == relay::protocol::Compression::Encoding::kDeflate) {
        if (!relay::protocol::Compression::Decompress(encoding, r.body(), &body)) {
            Finish(ctx, FetchOutcome::FetchError("Error decoding response body"));
            return;
        }
    } else {
        body.swap(r.mutableBody());
    }
    Finish(ctx, FetchOutcome::Success(std::move(body), r.getHeader("Content-Type")));
}

void UpstreamFetcher::Finish(const FetchContextPtr& ctx, FetchOutcome outcome) {
    if (!CleanUp(ctx)) return;
    Callback cb = std::move(ctx->cb);
    ctx->cb = nullptr;
    if (cb) cb(std::move(outcome));
}

bool UpstreamFetcher::CleanUp(const FetchContextPtr& ctx) {
    if (ctx->finished.exchange(true)) return false;
    ctx->state = State::kDone;

    CloseSocket(ctx);
    RetireChannel(ctx->loop, &ctx->timerChannel);
    if (ctx->timerfd >= 0) {
        ::close(ctx->timerfd);
        ctx->timerfd = -1;
    }
    return true;
}

void UpstreamFetcher::CloseSocket(const FetchContextPtr& ctx) {
    if (ctx->ssl) {
        SSL_free(ctx->ssl);
        ctx->ssl = nullptr;
    }
    RetireChannel(ctx->loop, &ctx->connChannel);
    if (ctx->sockfd >= 0) {
        ::close(ctx->sockfd);
        ctx->sockfd = -1;
    }
}

} // namespace service
} // namespace relay
