#pragma once

#include "edgelog/common/noncopyable.h"
#include "edgelog/network/InetAddress.h"
#include "edgelog/network/Callbacks.h"
#include "edgelog/network/TcpConnection.h"
#include "edgelog/network/EventLoopThreadPool.h"

#include <map>
#include <string>
#include <atomic>
#include <memory>

namespace edgelog {
namespace network {

class EventLoop;
class Acceptor;

// Acceptor on the base loop, connections spread round-robin over the I/O pool.
class TcpServer : edgelog::common::noncopyable {
public:
    TcpServer(EventLoop* loop,
              const InetAddress& listenAddr,
              const std::string& nameArg);
    ~TcpServer();

    const std::string& hostport() const { return hostport_; }
    const std::string& name() const { return name_; }

    // Actual bound address (port resolved when listening on 0).
    InetAddress listenAddress() const;

    void SetThreadNum(int numThreads);

    void Start();

    void SetConnectionCallback(const ConnectionCallback& cb) { connectionCallback_ = cb; }
    void SetMessageCallback(const MessageCallback& cb) { messageCallback_ = cb; }

private:
    void NewConnection(int sockfd, const InetAddress& peerAddr);
    void RemoveConnection(const TcpConnectionPtr& conn);
    void RemoveConnectionInLoop(const TcpConnectionPtr& conn);

    using ConnectionMap = std::map<std::string, TcpConnectionPtr>;

    EventLoop* loop_;
    const std::string hostport_;
    const std::string name_;
    std::unique_ptr<Acceptor> acceptor_;

    std::unique_ptr<EventLoopThreadPool> threadPool_;

    ConnectionCallback connectionCallback_;
    MessageCallback messageCallback_;

    std::atomic_int started_;
    int next_conn_id_;
    ConnectionMap connections_;
};

} // namespace network
} // namespace edgelog
