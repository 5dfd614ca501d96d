#pragma once

#include "relay/common/noncopyable.h"
#include "relay/network/TcpServer.h"
#include "relay/protocol/HttpResponse.h"

#include <functional>
#include <memory>
#include <string>

namespace relay {
namespace protocol {

class HttpRequest;

/// HTTP/1.1 server on top of TcpServer. Handlers answer through a Responder,
/// which may be invoked later (after asynchronous work) from any thread.
/// Requests on one connection are answered strictly in order: while a response
/// is outstanding, further input stays buffered.
class HttpServer : relay::common::noncopyable {
public:
    // Call exactly once per request; later calls are ignored.
    using Responder = std::function<void(HttpResponse)>;
    using HttpCallback = std::function<void(const HttpRequest&, const Responder&)>;

    HttpServer(relay::network::EventLoop* loop,
               const relay::network::InetAddress& listenAddr,
               const std::string& name);

    relay::network::EventLoop* getLoop() const { return server_.getLoop(); }
    bool ok() const { return server_.ok(); }
    const std::string& hostport() const { return server_.hostport(); }

    void setHttpCallback(const HttpCallback& cb) { httpCallback_ = cb; }

    void setThreadNum(int numThreads) { server_.SetThreadNum(numThreads); }

    void start();

private:
    struct ConnectionState;
    using ConnectionStatePtr = std::shared_ptr<ConnectionState>;

    void onConnection(const relay::network::TcpConnectionPtr& conn);
    void onMessage(const relay::network::TcpConnectionPtr& conn,
                   relay::network::Buffer* buf,
                   std::chrono::system_clock::time_point receiveTime);
    void processBuffer(const relay::network::TcpConnectionPtr& conn,
                       const ConnectionStatePtr& state,
                       std::chrono::system_clock::time_point receiveTime);
    void onRequest(const relay::network::TcpConnectionPtr& conn,
                   const ConnectionStatePtr& state,
                   const HttpRequest& req);
    void sendResponse(const std::weak_ptr<relay::network::TcpConnection>& weakConn,
                      const ConnectionStatePtr& state,
                      HttpResponse response,
                      bool close,
                      bool headOnly);

    relay::network::TcpServer server_;
    HttpCallback httpCallback_;
};

} // namespace protocol
} // namespace relay
