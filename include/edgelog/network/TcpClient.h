#pragma once

#include "edgelog/common/noncopyable.h"
#include "edgelog/network/TcpConnection.h"
#include <mutex>

struct ssl_ctx_st;

namespace edgelog {
namespace network {

class Connector;
class EventLoop;

// One outbound connection. Destroying the client force-closes its connection.
class TcpClient : edgelog::common::noncopyable {
public:
    TcpClient(EventLoop* loop, const InetAddress& serverAddr, const std::string& nameArg);
    ~TcpClient();

    // Wrap the connection in TLS. serverName is sent as SNI and, when verifyHost
    // is set, checked against the peer certificate. Call before Connect().
    void EnableTls(ssl_ctx_st* ctx, const std::string& serverName, bool verifyHost);

    void Connect();
    void Disconnect();
    void Stop();

    void SetConnectionCallback(const ConnectionCallback& cb) { connectionCallback_ = cb; }
    void SetMessageCallback(const MessageCallback& cb) { messageCallback_ = cb; }
    void SetConnectFailedCallback(const ConnectFailedCallback& cb) { connectFailedCallback_ = cb; }

private:
    void NewConnection(int sockfd);
    void OnConnectFailed(int savedErrno);
    void RemoveConnection(const TcpConnectionPtr& conn);

    EventLoop* loop_;
    std::shared_ptr<Connector> connector_;
    const std::string name_;

    ConnectionCallback connectionCallback_;
    MessageCallback messageCallback_;
    ConnectFailedCallback connectFailedCallback_;

    ssl_ctx_st* tlsCtx_{nullptr};
    std::string tlsServerName_;
    bool tlsVerifyHost_{false};

    bool connect_;
    int nextConnId_;
    mutable std::mutex mutex_;
    TcpConnectionPtr connection_;
};

} // namespace network
} // namespace edgelog
