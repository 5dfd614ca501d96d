#pragma once

#include "relay/common/noncopyable.h"
#include "relay/network/Callbacks.h"
#include "relay/network/EventLoopThreadPool.h"
#include "relay/network/InetAddress.h"
#include "relay/network/TcpConnection.h"

#include <atomic>
#include <map>
#include <memory>
#include <string>

namespace relay {
namespace network {

class Acceptor;
class EventLoop;

/// Accepts on the base loop and hands each connection to the next I/O loop.
class TcpServer : relay::common::noncopyable {
public:
    TcpServer(EventLoop* loop, const InetAddress& listenAddr, const std::string& nameArg);
    ~TcpServer();

    const std::string& hostport() const { return hostport_; }
    const std::string& name() const { return name_; }
    EventLoop* getLoop() const { return loop_; }

    // False when the listening address could not be bound.
    bool ok() const;

    // I/O loops besides the accepting one. Takes effect at Start().
    void SetThreadNum(int numThreads) { numThreads_ = numThreads; }
    void Start();

    void SetConnectionCallback(const ConnectionCallback& cb) { connectionCallback_ = cb; }
    void SetMessageCallback(const MessageCallback& cb) { messageCallback_ = cb; }

private:
    void NewConnection(int sockfd, const InetAddress& peerAddr);
    void RemoveConnection(const TcpConnectionPtr& conn);
    void RemoveConnectionInLoop(const TcpConnectionPtr& conn);

    using ConnectionMap = std::map<std::string, TcpConnectionPtr>;

    EventLoop* loop_;
    const std::string hostport_;
    const std::string name_;
    std::unique_ptr<Acceptor> acceptor_;
    std::unique_ptr<EventLoopThreadPool> threadPool_;
    int numThreads_{0};

    ConnectionCallback connectionCallback_;
    MessageCallback messageCallback_;

    std::atomic_int started_;
    int next_conn_id_;
    ConnectionMap connections_;
};

} // namespace network
} // namespace relay
