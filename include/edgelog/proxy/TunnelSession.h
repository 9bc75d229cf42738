#pragma once

#include "edgelog/common/noncopyable.h"
#include "edgelog/network/InetAddress.h"
#include "edgelog/network/TcpClient.h"
#include "edgelog/network/TcpConnection.h"

#include <chrono>
#include <cstddef>
#include <memory>
#include <string>

struct ssl_ctx_st;

namespace edgelog {
namespace proxy {

// Raw byte relay between a client connection taken over after a WebSocket
// upgrade request and a fresh backend connection.
//
// The client stops reading until the backend is connected (TLS included). A
// failed dial or handshake answers 502 on the client and no takeover happens.
// Once connected the request head is written to the backend and both
// directions are relayed untouched. Either side closing closes the other; when
// the backend goes first, bytes already queued for the client are flushed.
class TunnelSession : public std::enable_shared_from_this<TunnelSession>,
                      edgelog::common::noncopyable {
public:
    struct Options {
        size_t highWaterMarkBytes{8 * 1024 * 1024};
        ssl_ctx_st* tlsCtx{nullptr}; // null for plain TCP
        std::string tlsServerName;
        bool tlsVerifyHost{false};
    };

    TunnelSession(edgelog::network::EventLoop* loop,
                  const edgelog::network::InetAddress& backendAddr,
                  const edgelog::network::TcpConnectionPtr& clientConn,
                  Options opts);
    ~TunnelSession();

    // head: serialized request to replay on the backend.
    void Start(const std::string& head);

    // Client -> backend. Buffered until the backend is connected.
    void Send(const void* data, size_t len);

    // Client went away.
    void Close();

    bool established() const { return established_; }

private:
    void OnBackendConnection(const edgelog::network::TcpConnectionPtr& conn);
    void OnBackendMessage(const edgelog::network::TcpConnectionPtr& conn,
                          edgelog::network::Buffer* buf,
                          std::chrono::system_clock::time_point);
    void OnConnectFailed(int savedErrno);
    void FailClient(int code, const char* reason);
    void CloseClientAfterFlush(const edgelog::network::TcpConnectionPtr& client);
    void InstallBackpressure(const edgelog::network::TcpConnectionPtr& client,
                             const edgelog::network::TcpConnectionPtr& backend);

    edgelog::network::EventLoop* loop_;
    edgelog::network::InetAddress backendAddr_;
    std::unique_ptr<edgelog::network::TcpClient> backendClient_;
    std::weak_ptr<edgelog::network::TcpConnection> clientConn_;
    edgelog::network::TcpConnectionPtr backendConn_;
    Options opts_;
    bool established_{false};
    bool closed_{false};
    std::string initialBuffer_; // data that arrived before the backend connected
};

using TunnelSessionPtr = std::shared_ptr<TunnelSession>;

} // namespace proxy
} // namespace edgelog
