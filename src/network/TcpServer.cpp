#include "relay/network/TcpServer.h"
#include "relay/network/Acceptor.h"
#include "relay/network/EventLoop.h"
#include "relay/common/Logger.h"

#include <sys/socket.h>

#include <cstring>

namespace relay {
namespace network {

namespace {

InetAddress LocalAddressOf(int sockfd) {
    struct sockaddr_storage addr;
    std::memset(&addr, 0, sizeof addr);
    socklen_t len = sizeof addr;
    if (::getsockname(sockfd, reinterpret_cast<struct sockaddr*>(&addr), &len) < 0) {
        return InetAddress();
    }
    return InetAddress(reinterpret_cast<struct sockaddr*>(&addr), len);
}

} // namespace

TcpServer::TcpServer(EventLoop* loop, const InetAddress& listenAddr, const std::string& nameArg)
    : loop_(loop),
      hostport_(listenAddr.toIpPort()),
      name_(nameArg),
      acceptor_(new Acceptor(loop, listenAddr)),
      threadPool_(new EventLoopThreadPool(loop, nameArg)),
      started_(0),
      next_conn_id_(1) {
    acceptor_->SetNewConnectionCallback(
        [this](int sockfd, const InetAddress& peer) { NewConnection(sockfd, peer); });
}

TcpServer::~TcpServer() {
    for (auto& item : connections_) {
        TcpConnectionPtr conn(item.second);
        item.second.reset();
        conn->getLoop()->RunInLoop([conn]() {
            // The owner of our callbacks is going away with us.
            conn->SetConnectionCallback(nullptr);
            conn->SetMessageCallback(nullptr);
            conn->SetCloseCallback(nullptr);
            conn->ConnectDestroyed();
        });
    }
}

bool TcpServer::ok() const {
    return acceptor_->ok();
}

void TcpServer::Start() {
    if (started_++ == 0) {
        threadPool_->Start(numThreads_);
        loop_->RunInLoop([this]() { acceptor_->Listen(); });
    }
}

void TcpServer::NewConnection(int sockfd, const InetAddress& peerAddr) {
    char buf[64];
    snprintf(buf, sizeof buf, "-%s#%d", hostport_.c_str(), next_conn_id_);
    ++next_conn_id_;
    const std::string connName = name_ + buf;

    LOG_DEBUG << "TcpServer::NewConnection [" << name_ << "] - new connection [" << connName
              << "] from " << peerAddr.toIpPort();

    EventLoop* ioLoop = threadPool_->GetNextLoop();
    TcpConnectionPtr conn(new TcpConnection(ioLoop, connName, sockfd, LocalAddressOf(sockfd), peerAddr));
    connections_[connName] = conn;
    conn->SetConnectionCallback(connectionCallback_);
    conn->SetMessageCallback(messageCallback_);
    conn->SetCloseCallback([this](const TcpConnectionPtr& c) { RemoveConnection(c); });

    ioLoop->RunInLoop([conn]() { conn->ConnectEstablished(); });
}

void TcpServer::RemoveConnection(const TcpConnectionPtr& conn) {
    // Deferred so the connection is never erased from inside its own callbacks.
    loop_->QueueInLoop([this, conn]() { RemoveConnectionInLoop(conn); });
}

void TcpServer::RemoveConnectionInLoop(const TcpConnectionPtr& conn) {
    LOG_DEBUG << "TcpServer::RemoveConnectionInLoop [" << name_ << "] - connection " << conn->name();
    connections_.erase(conn->name());

    EventLoop* ioLoop = conn->getLoop();
    ioLoop->QueueInLoop([conn]() { conn->ConnectDestroyed(); });
}

} // namespace network
} // namespace relay
