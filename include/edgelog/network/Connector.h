#pragma once

#include "edgelog/common/noncopyable.h"
#include "edgelog/network/InetAddress.h"
#include "edgelog/network/Callbacks.h"

#include <functional>
#include <memory>

namespace edgelog {
namespace network {

class Channel;
class EventLoop;

// Single non-blocking connect attempt. Success hands the fd to NewConnectionCallback,
// failure reports errno through ConnectFailedCallback. There is no retry.
// Must be owned by a shared_ptr.
class Connector : public std::enable_shared_from_this<Connector>,
                  edgelog::common::noncopyable {
public:
    using NewConnectionCallback = std::function<void(int sockfd)>;

    Connector(EventLoop* loop, const InetAddress& serverAddr);
    ~Connector();

    void SetNewConnectionCallback(const NewConnectionCallback& cb) {
        newConnectionCallback_ = cb;
    }
    void SetConnectFailedCallback(const ConnectFailedCallback& cb) {
        connectFailedCallback_ = cb;
    }

    void Start();
    void Stop();

    const InetAddress& serverAddress() const { return serverAddr_; }

private:
    enum States { kDisconnected, kConnecting, kConnected };

    void SetState(States s) { state_ = s; }
    void StartInLoop();
    void StopInLoop();
    void Connect();
    void Connecting(int sockfd);
    void HandleWrite();
    void HandleError();
    void Fail(int sockfd, int savedErrno);
    int RemoveAndResetChannel();
    void ResetChannel();

    EventLoop* loop_;
    InetAddress serverAddr_;
    bool connect_;
    States state_;
    std::unique_ptr<Channel> channel_;
    NewConnectionCallback newConnectionCallback_;
    ConnectFailedCallback connectFailedCallback_;
};

} // namespace network
} // namespace edgelog
