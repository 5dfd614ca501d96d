#include "relay/network/Acceptor.h"
#include "relay/network/EventLoop.h"
#include "relay/network/InetAddress.h"
#include "relay/common/Logger.h"

#include <sys/socket.h>
#include <unistd.h>

#include <cerrno>

namespace relay {
namespace network {

namespace {

int CreateNonblocking(sa_family_t family) {
    int sockfd = ::socket(family, SOCK_STREAM | SOCK_NONBLOCK | SOCK_CLOEXEC, IPPROTO_TCP);
    if (sockfd < 0) {
        LOG_FATAL << "Acceptor: socket() failed errno=" << errno;
    }
    return sockfd;
}

} // namespace

Acceptor::Acceptor(EventLoop* loop, const InetAddress& listenAddr)
    : loop_(loop),
      accept_socket_(CreateNonblocking(listenAddr.family())),
      accept_channel_(loop, accept_socket_.fd()),
      ok_(false),
      listening_(false) {
    if (accept_socket_.fd() >= 0) {
        accept_socket_.SetReuseAddr(true);
        ok_ = accept_socket_.BindAddress(listenAddr);
    }
    accept_channel_.SetReadCallback([this](std::chrono::system_clock::time_point) { HandleRead(); });
}

Acceptor::~Acceptor() {
    if (listening_) {
        accept_channel_.DisableAll();
        accept_channel_.Remove();
    }
}

void Acceptor::Listen() {
    if (!ok_) return;
    if (!accept_socket_.Listen()) {
        ok_ = false;
        return;
    }
    listening_ = true;
    accept_channel_.EnableReading();
}

void Acceptor::HandleRead() {
    InetAddress peerAddr;
    int connfd = accept_socket_.Accept(&peerAddr);
    if (connfd >= 0) {
        if (new_connection_callback_) {
            new_connection_callback_(connfd, peerAddr);
        } else {
            ::close(connfd);
        }
    } else {
        const int saved = errno;
        if (saved == EAGAIN || saved == EWOULDBLOCK || saved == EINTR) return;
        LOG_ERROR << "Acceptor::HandleRead accept errno=" << saved;
        if (saved == EMFILE) {
            LOG_ERROR << "sockfd reached limit";
        }
    }
}

} // namespace network
} // namespace relay
