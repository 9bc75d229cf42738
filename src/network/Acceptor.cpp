#include "edgelog/network/Acceptor.h"
#include "edgelog/network/InetAddress.h"
#include "edgelog/network/EventLoop.h"
#include "edgelog/common/Logger.h"

#include <sys/socket.h>
#include <unistd.h>
#include <cerrno>

namespace edgelog {
namespace network {

static int CreateNonblockingOrDie() {
    int sockfd = ::socket(AF_INET, SOCK_STREAM | SOCK_NONBLOCK | SOCK_CLOEXEC, IPPROTO_TCP);
    if (sockfd < 0) {
        LOG_FATAL << "Acceptor: socket() failed errno=" << errno;
    }
    return sockfd;
}

Acceptor::Acceptor(EventLoop* loop, const InetAddress& listenAddr)
    : loop_(loop),
      accept_socket_(CreateNonblockingOrDie()),
      accept_channel_(loop, accept_socket_.fd()) {
    accept_socket_.SetReuseAddr(true);
    accept_socket_.BindAddress(listenAddr);

    accept_channel_.SetReadCallback(std::bind(&Acceptor::HandleRead, this));
}

Acceptor::~Acceptor() {
    accept_channel_.DisableAll();
    accept_channel_.Remove();
}

void Acceptor::Listen() {
    accept_socket_.Listen();
    accept_channel_.EnableReading();
}

InetAddress Acceptor::ListenAddress() const {
    return Socket::LocalAddress(accept_socket_.fd());
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
        const int savedErrno = errno;
        if (savedErrno != EAGAIN && savedErrno != EINTR) {
            LOG_ERROR << "Acceptor::HandleRead accept errno=" << savedErrno;
        }
        if (savedErrno == EMFILE) {
            LOG_ERROR << "sockfd reached limit";
        }
    }
}

} // namespace network
} // namespace edgelog
