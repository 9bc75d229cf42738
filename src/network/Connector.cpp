#include "edgelog/network/Connector.h"
#include "edgelog/network/Channel.h"
#include "edgelog/network/EventLoop.h"
#include "edgelog/common/Logger.h"

#include <cerrno>
#include <cstring>
#include <unistd.h>
#include <sys/socket.h>

namespace edgelog {
namespace network {

Connector::Connector(EventLoop* loop, const InetAddress& serverAddr)
    : loop_(loop),
      serverAddr_(serverAddr),
      connect_(false),
      state_(kDisconnected) {
}

Connector::~Connector() = default;

void Connector::Start() {
    connect_ = true;
    auto self = shared_from_this();
    loop_->RunInLoop([self]() { self->StartInLoop(); });
}

void Connector::StartInLoop() {
    if (connect_) {
        Connect();
    } else {
        LOG_DEBUG << "Connector::StartInLoop - stopped before connecting";
    }
}

void Connector::Stop() {
    connect_ = false;
    auto self = shared_from_this();
    loop_->QueueInLoop([self]() { self->StopInLoop(); });
}

void Connector::StopInLoop() {
    if (state_ == kConnecting) {
        SetState(kDisconnected);
        int sockfd = RemoveAndResetChannel();
        ::close(sockfd);
    }
}

void Connector::Connect() {
    int sockfd = ::socket(AF_INET, SOCK_STREAM | SOCK_NONBLOCK | SOCK_CLOEXEC, IPPROTO_TCP);
    if (sockfd < 0) {
        const int savedErrno = errno;
        LOG_ERROR << "Connector::Connect socket errno=" << savedErrno;
        Fail(-1, savedErrno);
        return;
    }

    int ret = ::connect(sockfd, serverAddr_.getSockAddr(), sizeof(struct sockaddr_in));
    int savedErrno = (ret == 0) ? 0 : errno;

    switch (savedErrno) {
        case 0:
        case EINPROGRESS:
        case EINTR:
        case EISCONN:
            Connecting(sockfd);
            break;

        default:
            LOG_WARN << "Connector::Connect " << serverAddr_.toIpPort() << " failed: " << std::strerror(savedErrno);
            Fail(sockfd, savedErrno);
            break;
    }
}

void Connector::Connecting(int sockfd) {
    SetState(kConnecting);
    channel_.reset(new Channel(loop_, sockfd));
    channel_->SetWriteCallback(std::bind(&Connector::HandleWrite, this));
    channel_->SetErrorCallback(std::bind(&Connector::HandleError, this));
    channel_->EnableWriting();
}

int Connector::RemoveAndResetChannel() {
    channel_->DisableAll();
    channel_->Remove();
    int sockfd = channel_->fd();
    // Can't reset channel_ here because we may be inside Channel::HandleEvent
    auto self = shared_from_this();
    loop_->QueueInLoop([self]() { self->ResetChannel(); });
    return sockfd;
}

void Connector::ResetChannel() {
    channel_.reset();
}

void Connector::HandleWrite() {
    if (state_ != kConnecting) return;

    auto guard = shared_from_this();
    int sockfd = RemoveAndResetChannel();
    int err = 0;
    socklen_t len = sizeof err;
    if (::getsockopt(sockfd, SOL_SOCKET, SO_ERROR, &err, &len) < 0) {
        err = errno;
    }

    if (err) {
        LOG_WARN << "Connector::HandleWrite " << serverAddr_.toIpPort() << " - SO_ERROR = " << err << " " << std::strerror(err);
        Fail(sockfd, err);
        return;
    }

    SetState(kConnected);
    if (connect_ && newConnectionCallback_) {
        newConnectionCallback_(sockfd);
    } else {
        ::close(sockfd);
    }
}

void Connector::HandleError() {
    if (state_ != kConnecting) return;

    auto guard = shared_from_this();
    int sockfd = RemoveAndResetChannel();
    int err = 0;
    socklen_t len = sizeof err;
    if (::getsockopt(sockfd, SOL_SOCKET, SO_ERROR, &err, &len) < 0) {
        err = errno;
    }
    LOG_WARN << "Connector::HandleError " << serverAddr_.toIpPort() << " - SO_ERROR = " << err << " " << std::strerror(err);
    Fail(sockfd, err != 0 ? err : ECONNREFUSED);
}

void Connector::Fail(int sockfd, int savedErrno) {
    if (sockfd >= 0) {
        ::close(sockfd);
    }
    SetState(kDisconnected);
    // Reported from the pending queue so the owner may destroy us in its callback.
    auto self = shared_from_this();
    loop_->QueueInLoop([self, savedErrno]() {
        if (self->connect_ && self->connectFailedCallback_) {
            self->connectFailedCallback_(savedErrno);
        }
    });
}

} // namespace network
} // namespace edgelog
