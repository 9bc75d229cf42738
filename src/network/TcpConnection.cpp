#include "edgelog/network/TcpConnection.h"
#include "edgelog/network/Socket.h"
#include "edgelog/network/Channel.h"
#include "edgelog/network/EventLoop.h"
#include "edgelog/common/Logger.h"

#include <openssl/err.h>
#include <openssl/ssl.h>
#include <openssl/x509v3.h>

#include <unistd.h>
#include <errno.h>
#include <sys/socket.h>

namespace edgelog {
namespace network {

namespace {

std::string DrainSslErrors() {
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

} // namespace

TcpConnection::TcpConnection(EventLoop* loop,
                             const std::string& nameArg,
                             int sockfd,
                             const InetAddress& localAddr,
                             const InetAddress& peerAddr,
                             ssl_ctx_st* tlsCtx,
                             const std::string& tlsServerName,
                             bool tlsVerifyHost)
    : loop_(loop),
      name_(nameArg),
      state_(kConnecting),
      reading_(true),
      socket_(new Socket(sockfd)),
      channel_(new Channel(loop, sockfd)),
      localAddr_(localAddr),
      peerAddr_(peerAddr),
      highWaterMark_(64 * 1024 * 1024),
      tlsCtx_(tlsCtx),
      tlsServerName_(tlsServerName),
      tlsVerifyHost_(tlsVerifyHost) {
    channel_->SetReadCallback(
        std::bind(&TcpConnection::HandleRead, this, std::placeholders::_1));
    channel_->SetWriteCallback(
        std::bind(&TcpConnection::HandleWrite, this));
    channel_->SetCloseCallback(
        std::bind(&TcpConnection::HandleClose, this));
    channel_->SetErrorCallback(
        std::bind(&TcpConnection::HandleError, this));

    LOG_DEBUG << "TcpConnection::ctor[" << name_ << "] at " << this << " fd=" << sockfd;
    socket_->SetKeepAlive(true);
    // relayed WebSocket frames are small; do not hold them back
    socket_->SetTcpNoDelay(true);
}

TcpConnection::~TcpConnection() {
    LOG_DEBUG << "TcpConnection::dtor[" << name_ << "] at " << this << " fd=" << channel_->fd() << " state=" << state_;
    if (ssl_) {
        SSL_free(reinterpret_cast<SSL*>(ssl_));
        ssl_ = nullptr;
    }
}

void TcpConnection::ConnectEstablished() {
    SetState(kConnected);
    channel_->Tie(shared_from_this());
    channel_->EnableReading();

    if (tlsEnabled()) {
        if (!tlsStart()) {
            HandleClose();
            return;
        }
        const int r = tlsDoHandshake();
        if (r < 0) {
            HandleClose();
        } else if (r > 0) {
            tlsEstablished();
        }
        return;
    }

    if (connectionCallback_) {
        connectionCallback_(shared_from_this());
    }
}

void TcpConnection::ConnectDestroyed() {
    if (state_ == kConnected) {
        SetState(kDisconnected);
        channel_->DisableAll();
        if (connectionCallback_) {
            connectionCallback_(shared_from_this());
        }
    }
    channel_->Remove();
}

bool TcpConnection::tlsStart() {
    SSL* s = SSL_new(reinterpret_cast<SSL_CTX*>(tlsCtx_));
    if (!s) {
        LOG_WARN << "TLS: SSL_new failed for " << name_ << ": " << DrainSslErrors();
        return false;
    }
    SSL_set_fd(s, channel_->fd());
    SSL_set_connect_state(s);
    if (!tlsServerName_.empty()) {
        SSL_set_tlsext_host_name(s, tlsServerName_.c_str());
        if (tlsVerifyHost_) {
            SSL_set_hostflags(s, X509_CHECK_FLAG_NO_PARTIAL_WILDCARDS);
            if (SSL_set1_host(s, tlsServerName_.c_str()) != 1) {
                LOG_WARN << "TLS: cannot set verify host " << tlsServerName_;
                SSL_free(s);
                return false;
            }
        }
    }
    ssl_ = reinterpret_cast<ssl_st*>(s);
    tlsState_ = kTlsHandshaking;
    return true;
}

int TcpConnection::tlsDoHandshake() {
    SSL* s = reinterpret_cast<SSL*>(ssl_);
    const int r = SSL_do_handshake(s);
    if (r == 1) {
        return 1;
    }
    const int e = SSL_get_error(s, r);
    if (e == SSL_ERROR_WANT_READ) {
        if (channel_->IsWriting()) channel_->DisableWriting();
        return 0;
    }
    if (e == SSL_ERROR_WANT_WRITE) {
        if (!channel_->IsWriting()) channel_->EnableWriting();
        return 0;
    }
    const long verify = SSL_get_verify_result(s);
    if (verify != X509_V_OK) {
        LOG_WARN << "TLS handshake with " << peerAddr_.toIpPort() << " failed: certificate verify: "
                 << X509_verify_cert_error_string(verify);
    } else {
        const std::string detail = DrainSslErrors();
        LOG_WARN << "TLS handshake with " << peerAddr_.toIpPort() << " failed: "
                 << (detail.empty() ? "error=" + std::to_string(e) : detail);
    }
    return -1;
}

void TcpConnection::tlsEstablished() {
    tlsState_ = kTlsEstablished;
    LOG_DEBUG << "TLS established [" << name_ << "] " << SSL_get_version(reinterpret_cast<SSL*>(ssl_));
    if (outputBuffer_.ReadableBytes() > 0) {
        if (!channel_->IsWriting()) channel_->EnableWriting();
    } else if (channel_->IsWriting()) {
        channel_->DisableWriting();
    }
    if (connectionCallback_) {
        connectionCallback_(shared_from_this());
    }
}

ssize_t TcpConnection::tlsReadOnce(char* buf, size_t cap, int* savedErrno) {
    SSL* s = reinterpret_cast<SSL*>(ssl_);
    const int r = SSL_read(s, buf, static_cast<int>(cap));
    if (r > 0) return r;
    const int e = SSL_get_error(s, r);
    if (e == SSL_ERROR_WANT_READ) return -2;
    if (e == SSL_ERROR_WANT_WRITE) {
        if (!channel_->IsWriting()) channel_->EnableWriting();
        return -2;
    }
    if (e == SSL_ERROR_ZERO_RETURN) return 0;
    if (e == SSL_ERROR_SYSCALL && ERR_peek_error() == 0 && errno == 0) return 0; // EOF without close_notify
    *savedErrno = (e == SSL_ERROR_SYSCALL && errno != 0) ? errno : EIO;
    return -1;
}

ssize_t TcpConnection::tlsWriteOnce(const void* data, size_t len, int* savedErrno) {
    SSL* s = reinterpret_cast<SSL*>(ssl_);
    const int r = SSL_write(s, data, static_cast<int>(len));
    if (r > 0) return r;
    const int e = SSL_get_error(s, r);
    if (e == SSL_ERROR_WANT_WRITE || e == SSL_ERROR_WANT_READ) return -2;
    *savedErrno = (e == SSL_ERROR_SYSCALL && errno != 0) ? errno : EIO;
    return -1;
}

ssize_t TcpConnection::ReadIntoInputBuffer(int* savedErrno) {
    if (!ssl_) {
        const ssize_t n = inputBuffer_.ReadFd(channel_->fd(), savedErrno);
        if (n < 0 && (*savedErrno == EAGAIN || *savedErrno == EWOULDBLOCK || *savedErrno == EINTR)) return -2;
        return n;
    }
    // SSL_read yields at most one record; drain until the socket would block.
    char tmp[16 * 1024];
    ssize_t total = 0;
    while (true) {
        errno = 0;
        const ssize_t r = tlsReadOnce(tmp, sizeof(tmp), savedErrno);
        if (r > 0) {
            inputBuffer_.Append(tmp, static_cast<size_t>(r));
            total += r;
            continue;
        }
        // a close or error after data is seen again on the next read event
        return total > 0 ? total : r;
    }
}

ssize_t TcpConnection::WriteRaw(const void* data, size_t len, int* savedErrno) {
    if (ssl_) {
        return tlsWriteOnce(data, len, savedErrno);
    }
    const ssize_t n = ::write(channel_->fd(), data, len);
    if (n < 0) {
        *savedErrno = errno;
        if (errno == EWOULDBLOCK || errno == EAGAIN || errno == EINTR) return -2;
    }
    return n;
}

void TcpConnection::HandleRead(std::chrono::system_clock::time_point receiveTime) {
    if (tlsState_ == kTlsHandshaking) {
        const int r = tlsDoHandshake();
        if (r < 0) {
            HandleClose();
            return;
        }
        if (r == 0) return;
        tlsEstablished();
        if (state_ != kConnected) return;
    }

    int savedErrno = 0;
    const ssize_t n = ReadIntoInputBuffer(&savedErrno);
    if (n > 0) {
        if (messageCallback_) {
            messageCallback_(shared_from_this(), &inputBuffer_, receiveTime);
        }
    } else if (n == 0) {
        HandleClose();
    } else if (n == -2) {
        return;
    } else {
        if (savedErrno != ECONNRESET) {
            LOG_ERROR << "TcpConnection::HandleRead [" << name_ << "] errno=" << savedErrno;
        }
        HandleError();
        HandleClose();
    }
}

void TcpConnection::HandleWrite() {
    if (tlsState_ == kTlsHandshaking) {
        const int r = tlsDoHandshake();
        if (r < 0) {
            HandleClose();
            return;
        }
        if (r == 0) return;
        tlsEstablished();
        if (state_ != kConnected) return;
    }

    if (!channel_->IsWriting()) {
        LOG_DEBUG << "Connection fd = " << channel_->fd() << " is down, no more writing";
        return;
    }
    if (outputBuffer_.ReadableBytes() == 0) {
        // write interest was only needed by the TLS engine
        channel_->DisableWriting();
        return;
    }

    int savedErrno = 0;
    const ssize_t n = WriteRaw(outputBuffer_.Peek(), outputBuffer_.ReadableBytes(), &savedErrno);
    if (n > 0) {
        outputBuffer_.Retrieve(n);
        if (outputBuffer_.ReadableBytes() == 0) {
            channel_->DisableWriting();
            if (writeCompleteCallback_) {
                loop_->QueueInLoop(
                    std::bind(writeCompleteCallback_, shared_from_this()));
            }
            if (state_ == kDisconnecting) {
                ShutdownInLoop();
            }
        }
    } else if (n == -1) {
        LOG_ERROR << "TcpConnection::HandleWrite [" << name_ << "] errno=" << savedErrno;
        if (savedErrno == EPIPE || savedErrno == ECONNRESET || ssl_) {
            HandleClose();
        }
    }
}

void TcpConnection::HandleClose() {
    if (state_ == kDisconnected) return;
    LOG_DEBUG << "fd = " << channel_->fd() << " state = " << state_;
    SetState(kDisconnected);
    channel_->DisableAll();

    TcpConnectionPtr guardThis(shared_from_this());
    if (connectionCallback_) {
        connectionCallback_(guardThis);
    }

    if (closeCallback_) {
        closeCallback_(guardThis);
    }
}

void TcpConnection::HandleError() {
    int err = 0;
    int optval;
    socklen_t optlen = static_cast<socklen_t>(sizeof optval);
    if (::getsockopt(channel_->fd(), SOL_SOCKET, SO_ERROR, &optval, &optlen) < 0) {
        err = errno;
    } else {
        err = optval;
    }
    if (err != 0) {
        LOG_WARN << "TcpConnection::HandleError name:" << name_ << " - SO_ERROR:" << err;
    }
}

void TcpConnection::Send(const std::string& message) {
    Send(message.data(), message.size());
}

void TcpConnection::Send(const void* data, size_t len) {
    if (state_ == kConnected) {
        if (loop_->IsInLoopThread()) {
            SendInLoop(data, len);
        } else {
            std::string msg(static_cast<const char*>(data), len);
            loop_->RunInLoop([ptr = shared_from_this(), msg = std::move(msg)]() {
                ptr->SendInLoop(msg.data(), msg.size());
            });
        }
    }
}

void TcpConnection::SendInLoop(const void* data, size_t len) {
    ssize_t nwrote = 0;
    size_t remaining = len;
    bool faultError = false;

    if (state_ == kDisconnected) {
        LOG_WARN << "disconnected, give up writing";
        return;
    }
    if (len == 0) return;

    // if nothing in output queue, try write directly
    const bool canWriteNow = (tlsState_ != kTlsHandshaking);
    if (canWriteNow && !channel_->IsWriting() && outputBuffer_.ReadableBytes() == 0) {
        int savedErrno = 0;
        nwrote = WriteRaw(data, len, &savedErrno);
        if (nwrote >= 0) {
            remaining = len - nwrote;
            if (remaining == 0 && writeCompleteCallback_) {
                loop_->QueueInLoop(
                    std::bind(writeCompleteCallback_, shared_from_this()));
            }
        } else {
            if (nwrote == -1) {
                LOG_ERROR << "TcpConnection::SendInLoop [" << name_ << "] errno=" << savedErrno;
                if (savedErrno == EPIPE || savedErrno == ECONNRESET || ssl_) {
                    faultError = true;
                }
            }
            nwrote = 0;
        }
    }

    // append remaining to buffer
    if (!faultError && remaining > 0) {
        size_t oldLen = outputBuffer_.ReadableBytes();
        if (oldLen + remaining >= highWaterMark_
            && oldLen < highWaterMark_
            && highWaterMarkCallback_) {
            loop_->QueueInLoop(std::bind(highWaterMarkCallback_, shared_from_this(), oldLen + remaining));
        }
        outputBuffer_.Append(static_cast<const char*>(data) + nwrote, remaining);
        // during the handshake the TLS engine owns write interest
        if (canWriteNow && !channel_->IsWriting()) {
            channel_->EnableWriting();
        }
    }
}

void TcpConnection::Shutdown() {
    if (state_ == kConnected) {
        SetState(kDisconnecting);
        loop_->RunInLoop([conn = shared_from_this()]() { conn->ShutdownInLoop(); });
    }
}

void TcpConnection::ShutdownInLoop() {
    if (!channel_->IsWriting()) {
        if (ssl_ && tlsState_ == kTlsEstablished) {
            SSL_shutdown(reinterpret_cast<SSL*>(ssl_));
        }
        socket_->ShutdownWrite();
    }
}

void TcpConnection::ForceClose() {
    if (state_ == kConnected || state_ == kDisconnecting || state_ == kConnecting) {
        loop_->RunInLoop([conn = shared_from_this()]() {
            conn->ForceCloseInLoop();
        });
    }
}

void TcpConnection::ForceCloseInLoop() {
    if (state_ == kConnected || state_ == kDisconnecting || state_ == kConnecting) {
        HandleClose();
    }
}

void TcpConnection::StartRead() {
    auto self = shared_from_this();
    loop_->RunInLoop([self]() { self->StartReadInLoop(); });
}

void TcpConnection::StopRead() {
    auto self = shared_from_this();
    loop_->RunInLoop([self]() { self->StopReadInLoop(); });
}

void TcpConnection::StartReadInLoop() {
    if (!reading_ && state_ != kDisconnected) {
        reading_ = true;
        channel_->EnableReading();
    }
}

void TcpConnection::StopReadInLoop() {
    if (reading_ && state_ != kDisconnected) {
        reading_ = false;
        channel_->DisableReading();
    }
}

} // namespace network
} // namespace edgelog
