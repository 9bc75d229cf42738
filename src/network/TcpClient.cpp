#include "edgelog/network/TcpClient.h"
#include "edgelog/network/Connector.h"
#include "edgelog/network/EventLoop.h"
#include "edgelog/network/Socket.h"
#include "edgelog/common/Logger.h"

namespace edgelog {
namespace network {

namespace detail {
void RemoveConnection(EventLoop* loop, const TcpConnectionPtr& conn) {
    loop->QueueInLoop(std::bind(&TcpConnection::ConnectDestroyed, conn));
}
} // namespace detail

TcpClient::TcpClient(EventLoop* loop, const InetAddress& serverAddr, const std::string& nameArg)
    : loop_(loop),
      connector_(new Connector(loop, serverAddr)),
      name_(nameArg),
      connect_(true),
      nextConnId_(1) {
    connector_->SetNewConnectionCallback(
        std::bind(&TcpClient::NewConnection, this, std::placeholders::_1));
    connector_->SetConnectFailedCallback(
        std::bind(&TcpClient::OnConnectFailed, this, std::placeholders::_1));
    LOG_DEBUG << "TcpClient::TcpClient[" << name_ << "] - connector " << connector_.get();
}

TcpClient::~TcpClient() {
    LOG_DEBUG << "TcpClient::~TcpClient[" << name_ << "] - connector " << connector_.get();
    TcpConnectionPtr conn;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        conn = connection_;
    }
    if (conn) {
        // The connection may outlive us; route its teardown away from this object.
        EventLoop* loop = loop_;
        loop_->RunInLoop([conn, loop]() {
            conn->SetCloseCallback(std::bind(&detail::RemoveConnection, loop, std::placeholders::_1));
            conn->SetConnectionCallback(ConnectionCallback());
            conn->SetMessageCallback(MessageCallback());
            conn->ForceClose();
        });
    } else {
        connector_->Stop();
    }
}

void TcpClient::EnableTls(ssl_ctx_st* ctx, const std::string& serverName, bool verifyHost) {
    tlsCtx_ = ctx;
    tlsServerName_ = serverName;
    tlsVerifyHost_ = verifyHost;
}

void TcpClient::Connect() {
    LOG_DEBUG << "TcpClient::Connect[" << name_ << "] - connecting to "
              << connector_->serverAddress().toIpPort();
    connect_ = true;
    connector_->Start();
}

void TcpClient::Disconnect() {
    connect_ = false;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (connection_) {
            connection_->Shutdown();
        }
    }
}

void TcpClient::Stop() {
    connect_ = false;
    connector_->Stop();
}

void TcpClient::NewConnection(int sockfd) {
    InetAddress peerAddr = connector_->serverAddress();
    InetAddress localAddr = Socket::LocalAddress(sockfd);

    std::string connName = name_ + ":" + peerAddr.toIpPort() + "#" + std::to_string(nextConnId_);
    ++nextConnId_;

    TcpConnectionPtr conn(new TcpConnection(loop_,
                                            connName,
                                            sockfd,
                                            localAddr,
                                            peerAddr,
                                            tlsCtx_,
                                            tlsServerName_,
                                            tlsVerifyHost_));

    conn->SetConnectionCallback(connectionCallback_);
    conn->SetMessageCallback(messageCallback_);
    conn->SetCloseCallback(
        std::bind(&TcpClient::RemoveConnection, this, std::placeholders::_1));

    {
        std::lock_guard<std::mutex> lock(mutex_);
        connection_ = conn;
    }
    conn->ConnectEstablished();
}

void TcpClient::OnConnectFailed(int savedErrno) {
    if (connectFailedCallback_) {
        connectFailedCallback_(savedErrno);
    }
}

void TcpClient::RemoveConnection(const TcpConnectionPtr& conn) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        connection_.reset();
    }

    loop_->QueueInLoop(std::bind(&TcpConnection::ConnectDestroyed, conn));
}

} // namespace network
} // namespace edgelog
