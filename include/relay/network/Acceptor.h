#pragma once

#include "relay/common/noncopyable.h"
#include "relay/network/Channel.h"
#include "relay/network/Socket.h"

#include <functional>

namespace relay {
namespace network {

class EventLoop;
class InetAddress;

/// Listening socket of a TcpServer; binds at construction, listens on Listen().
class Acceptor : relay::common::noncopyable {
public:
    using NewConnectionCallback = std::function<void(int sockfd, const InetAddress&)>;

    Acceptor(EventLoop* loop, const InetAddress& listenAddr);
    ~Acceptor();

    void SetNewConnectionCallback(const NewConnectionCallback& cb) {
        new_connection_callback_ = cb;
    }

    // False when the listening socket could not be created or bound.
    bool ok() const { return ok_; }
    void Listen();

private:
    void HandleRead();

    EventLoop* loop_;
    Socket accept_socket_;
    Channel accept_channel_;
    NewConnectionCallback new_connection_callback_;
    bool ok_;
    bool listening_;
};

} // namespace network
} // namespace relay
