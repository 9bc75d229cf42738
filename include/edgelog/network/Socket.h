#pragma once

#include "edgelog/common/noncopyable.h"

namespace edgelog {
namespace network {

class InetAddress;

// Owns a socket fd; closes it on destruction.
class Socket : edgelog::common::noncopyable {
public:
    explicit Socket(int sockfd)
        : sockfd_(sockfd) {}
    ~Socket();

    int fd() const { return sockfd_; }

    void BindAddress(const InetAddress& localaddr);
    void Listen();
    int Accept(InetAddress* peeraddr);

    void ShutdownWrite();

    void SetTcpNoDelay(bool on);
    void SetReuseAddr(bool on);
    void SetKeepAlive(bool on);

    static InetAddress LocalAddress(int sockfd);

private:
    const int sockfd_;
};

} // namespace network
} // namespace edgelog
