#pragma once

#include "edgelog/common/noncopyable.h"
#include "edgelog/network/Socket.h"
#include "edgelog/network/Channel.h"

#include <functional>

namespace edgelog {
namespace network {

class EventLoop;
class InetAddress;

class Acceptor : edgelog::common::noncopyable {
public:
    using NewConnectionCallback = std::function<void(int sockfd, const InetAddress&)>;

    Acceptor(EventLoop* loop, const InetAddress& listenAddr);
    ~Acceptor();

    void SetNewConnectionCallback(const NewConnectionCallback& cb) {
        new_connection_callback_ = cb;
    }

    void Listen();

    // Bound address; useful when listening on port 0.
    InetAddress ListenAddress() const;

private:
    void HandleRead();

    EventLoop* loop_;
    Socket accept_socket_;
    Channel accept_channel_;
    NewConnectionCallback new_connection_callback_;
};

} // namespace network
} // namespace edgelog
