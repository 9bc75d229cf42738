#pragma once

#include "edgelog/common/noncopyable.h"
#include "edgelog/network/InetAddress.h"
#include "edgelog/network/Callbacks.h"
#include "edgelog/network/Buffer.h"

#include <memory>
#include <string>
#include <atomic>
#include <chrono>
#include <any>

struct ssl_ctx_st;
struct ssl_st;

namespace edgelog {
namespace network {

class Channel;
class EventLoop;
class Socket;

// One established TCP stream bound to a single EventLoop.
//
// With a TLS context the connection acts as a TLS client: the handshake is driven
// from the channel's read/write events and the connection callback fires only once
// it completes. Data sent before that is queued and flushed afterwards. A failed
// handshake closes the connection without a "connected" callback ever firing.
class TcpConnection : edgelog::common::noncopyable,
                      public std::enable_shared_from_this<TcpConnection> {
public:
    TcpConnection(EventLoop* loop,
                  const std::string& name,
                  int sockfd,
                  const InetAddress& localAddr,
                  const InetAddress& peerAddr,
                  ssl_ctx_st* tlsCtx = nullptr,
                  const std::string& tlsServerName = std::string(),
                  bool tlsVerifyHost = false);
    ~TcpConnection();

    EventLoop* getLoop() const { return loop_; }
    const std::string& name() const { return name_; }
    const InetAddress& localAddress() const { return localAddr_; }
    const InetAddress& peerAddress() const { return peerAddr_; }
    bool connected() const { return state_ == kConnected; }
    // Bytes queued but not yet written. Loop thread only.
    size_t outputBytes() const { return outputBuffer_.ReadableBytes(); }

    void SetContext(const std::any& context) { context_ = context; }
    std::any* GetMutableContext() { return &context_; }

    // Thread safe
    void Send(const std::string& message);
    void Send(const void* data, size_t len);
    void Shutdown();
    void ForceClose();
    void StartRead();
    void StopRead();

    void SetConnectionCallback(const ConnectionCallback& cb) { connectionCallback_ = cb; }
    void SetMessageCallback(const MessageCallback& cb) { messageCallback_ = cb; }
    void SetWriteCompleteCallback(const WriteCompleteCallback& cb) { writeCompleteCallback_ = cb; }
    void SetHighWaterMarkCallback(const HighWaterMarkCallback& cb, size_t highWaterMark) { highWaterMarkCallback_ = cb; highWaterMark_ = highWaterMark; }
    void SetCloseCallback(const CloseCallback& cb) { closeCallback_ = cb; }

    // Called when TcpServer accepts a new connection or TcpClient's connector succeeds
    void ConnectEstablished();
    // Called when the owner has removed me from its map
    void ConnectDestroyed();

private:
    enum StateE { kDisconnected, kConnecting, kConnected, kDisconnecting };
    enum TlsState { kTlsNone, kTlsHandshaking, kTlsEstablished };

    void HandleRead(std::chrono::system_clock::time_point receiveTime);
    void HandleWrite();
    void HandleClose();
    void HandleError();

    void SendInLoop(const void* message, size_t len);
    void ShutdownInLoop();
    void ForceCloseInLoop();
    void StartReadInLoop();
    void StopReadInLoop();

    bool tlsEnabled() const { return tlsCtx_ != nullptr; }
    bool tlsStart();
    // 1 done, 0 in progress, -1 failed
    int tlsDoHandshake();
    void tlsEstablished();
    // >0 bytes, 0 orderly close, -1 error, -2 retry later
    ssize_t tlsReadOnce(char* buf, size_t cap, int* savedErrno);
    ssize_t tlsWriteOnce(const void* data, size_t len, int* savedErrno);
    ssize_t ReadIntoInputBuffer(int* savedErrno);
    ssize_t WriteRaw(const void* data, size_t len, int* savedErrno);

    void SetState(StateE s) { state_ = s; }

    EventLoop* loop_;
    const std::string name_;
    std::atomic<StateE> state_;
    bool reading_;

    std::unique_ptr<Socket> socket_;
    std::unique_ptr<Channel> channel_;

    const InetAddress localAddr_;
    const InetAddress peerAddr_;

    ConnectionCallback connectionCallback_;
    MessageCallback messageCallback_;
    WriteCompleteCallback writeCompleteCallback_;
    HighWaterMarkCallback highWaterMarkCallback_;
    CloseCallback closeCallback_;

    size_t highWaterMark_;

    Buffer inputBuffer_;
    Buffer outputBuffer_;

    std::any context_;

    ssl_ctx_st* tlsCtx_{nullptr};
    ssl_st* ssl_{nullptr};
    const std::string tlsServerName_;
    const bool tlsVerifyHost_;
    TlsState tlsState_{kTlsNone};
};

} // namespace network
} // namespace edgelog
