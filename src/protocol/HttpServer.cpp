#include "relay/protocol/HttpServer.h"
#include "relay/protocol/HttpContext.h"
#include "relay/protocol/HttpRequest.h"
#include "relay/network/EventLoop.h"
#include "relay/common/Logger.h"

#include <strings.h>

#include <atomic>
#include <cstring>

namespace relay {
namespace protocol {

struct HttpServer::ConnectionState {
    HttpContext context;
    bool awaitingResponse{false};
    bool closing{false};
};

namespace {

bool HasToken(const std::string& value, const char* token) {
    size_t start = 0;
    while (start <= value.size()) {
        size_t comma = value.find(',', start);
        if (comma == std::string::npos) comma = value.size();
        size_t b = start;
        size_t e = comma;
        while (b < e && (value[b] == ' ' || value[b] == '\t')) ++b;
        while (e > b && (value[e - 1] == ' ' || value[e - 1] == '\t')) --e;
        if (e - b == std::strlen(token) && ::strncasecmp(value.data() + b, token, e - b) == 0) {
            return true;
        }
        start = comma + 1;
    }
    return false;
}

} // namespace

HttpServer::HttpServer(relay::network::EventLoop* loop,
                       const relay::network::InetAddress& listenAddr,
                       const std::string& name)
    : server_(loop, listenAddr, name) {
    server_.SetConnectionCallback(
        [this](const relay::network::TcpConnectionPtr& conn) { onConnection(conn); });
    server_.SetMessageCallback(
        [this](const relay::network::TcpConnectionPtr& conn,
               relay::network::Buffer* buf,
               std::chrono::system_clock::time_point t) { onMessage(conn, buf, t); });
}

void HttpServer::start() {
    LOG_INFO << "HttpServer[" << server_.name() << "] starts listening on " << server_.hostport();
    server_.Start();
}

void HttpServer::onConnection(const relay::network::TcpConnectionPtr& conn) {
    if (conn->connected()) {
        conn->SetContext(std::make_shared<ConnectionState>());
    }
}

void HttpServer::onMessage(const relay::network::TcpConnectionPtr& conn,
                           relay::network::Buffer* buf,
                           std::chrono::system_clock::time_point receiveTime) {
    (void)buf;
    auto* statePtr = std::any_cast<ConnectionStatePtr>(conn->GetMutableContext());
    if (!statePtr || !*statePtr) return;
    ConnectionStatePtr state = *statePtr;
    processBuffer(conn, state, receiveTime);
}

void HttpServer::processBuffer(const relay::network::TcpConnectionPtr& conn,
                               const ConnectionStatePtr& state,
                               std::chrono::system_clock::time_point receiveTime) {
    relay::network::Buffer* buf = conn->inputBuffer();
    // One request at a time; the rest waits in the buffer until the response goes out.
    while (!state->awaitingResponse && !state->closing && buf->ReadableBytes() > 0) {
        if (!state->context.parseRequest(buf, receiveTime)) {
            LOG_WARN << "HttpServer: malformed request from " << conn->peerAddress().toIpPort();
            HttpResponse bad(true);
            bad.setStatusCode(HttpResponse::k400BadRequest);
            bad.setContentType("text/plain; charset=utf-8");
            bad.setBody("Invalid HTTP request received.");
            relay::network::Buffer out;
            bad.appendToBuffer(&out);
            conn->Send(out.RetrieveAllAsString());
            state->closing = true;
            buf->RetrieveAll();
            conn->Shutdown();
            return;
        }
        if (!state->context.gotAll()) {
            return;
        }
        HttpRequest req;
        req.swap(state->context.request());
        state->context.reset();
        onRequest(conn, state, req);
    }
}

void HttpServer::onRequest(const relay::network::TcpConnectionPtr& conn,
                           const ConnectionStatePtr& state,
                           const HttpRequest& req) {
    const std::string connection = req.getHeader("Connection");
    const bool close = HasToken(connection, "close") ||
                       (req.getVersion() == HttpRequest::kHttp10 && !HasToken(connection, "keep-alive"));

    const bool headOnly = req.getMethod() == HttpRequest::kHead;

    state->awaitingResponse = true;
    if (close) state->closing = true;

    std::weak_ptr<relay::network::TcpConnection> weakConn(conn);
    relay::network::EventLoop* loop = conn->getLoop();
    auto answered = std::make_shared<std::atomic<bool>>(false);

    Responder responder = [this, weakConn, state, loop, answered, close, headOnly](HttpResponse response) {
        if (answered->exchange(true)) {
            LOG_WARN << "HttpServer: duplicate response ignored";
            return;
        }
        loop->RunInLoop([this, weakConn, state, close, headOnly, response = std::move(response)]() mutable {
            sendResponse(weakConn, state, std::move(response), close, headOnly);
        });
    };

    if (httpCallback_) {
        httpCallback_(req, responder);
    } else {
        HttpResponse notFound;
        notFound.setStatusCode(HttpResponse::k404NotFound);
        responder(std::move(notFound));
    }
}

void HttpServer::sendResponse(const std::weak_ptr<relay::network::TcpConnection>& weakConn,
                              const ConnectionStatePtr& state,
                              HttpResponse response,
                              bool close,
                              bool headOnly) {
    relay::network::TcpConnectionPtr conn = weakConn.lock();
    if (!conn || !conn->connected()) {
        LOG_DEBUG << "HttpServer: client went away, response discarded";
        return;
    }

    if (close) response.setCloseConnection(true);
    relay::network::Buffer out;
    response.appendToBuffer(&out, !headOnly);
    conn->Send(out.RetrieveAllAsString());

    state->awaitingResponse = false;
    if (response.closeConnection()) {
        state->closing = true;
        conn->Shutdown();
        return;
    }
    if (conn->inputBuffer()->ReadableBytes() > 0) {
        // Queued rather than called so synchronous handlers cannot recurse per pipelined request.
        conn->getLoop()->QueueInLoop([this, weakConn, state]() {
            relay::network::TcpConnectionPtr c = weakConn.lock();
            if (c && c->connected()) {
                processBuffer(c, state, std::chrono::system_clock::now());
            }
        });
    }
}

} // namespace protocol
} // namespace relay
