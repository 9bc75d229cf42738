#include "edgelog/proxy/TunnelSession.h"
#include "edgelog/common/Logger.h"
#include "edgelog/network/EventLoop.h"
#include "edgelog/protocol/HttpResponse.h"

#include <cstring>

namespace edgelog {
namespace proxy {

using edgelog::network::TcpConnectionPtr;

TunnelSession::TunnelSession(edgelog::network::EventLoop* loop,
                             const edgelog::network::InetAddress& backendAddr,
                             const TcpConnectionPtr& clientConn,
                             Options opts)
    : loop_(loop),
      backendAddr_(backendAddr),
      backendClient_(new edgelog::network::TcpClient(loop, backendAddr, "Tunnel")),
      clientConn_(clientConn),
      opts_(std::move(opts)) {
    if (opts_.tlsCtx) {
        backendClient_->EnableTls(opts_.tlsCtx, opts_.tlsServerName, opts_.tlsVerifyHost);
    }
}

TunnelSession::~TunnelSession() {
    LOG_DEBUG << "TunnelSession destroyed backend=" << backendAddr_.toIpPort();
}

void TunnelSession::Start(const std::string& head) {
    std::weak_ptr<TunnelSession> weakSelf(shared_from_this());
    backendClient_->SetConnectionCallback([weakSelf](const TcpConnectionPtr& conn) {
        if (auto self = weakSelf.lock()) self->OnBackendConnection(conn);
    });
    backendClient_->SetMessageCallback([weakSelf](const TcpConnectionPtr& conn,
                                                  edgelog::network::Buffer* buf,
                                                  std::chrono::system_clock::time_point t) {
        if (auto self = weakSelf.lock()) {
            self->OnBackendMessage(conn, buf, t);
        } else {
            buf->RetrieveAll();
        }
    });
    backendClient_->SetConnectFailedCallback([weakSelf](int savedErrno) {
        if (auto self = weakSelf.lock()) self->OnConnectFailed(savedErrno);
    });

    initialBuffer_ = head + initialBuffer_;
    if (auto client = clientConn_.lock()) {
        client->StopRead();
    }
    backendClient_->Connect();
}

void TunnelSession::Send(const void* data, size_t len) {
    if (closed_ || len == 0) return;
    if (established_ && backendConn_) {
        backendConn_->Send(data, len);
    } else {
        initialBuffer_.append(static_cast<const char*>(data), len);
    }
}

void TunnelSession::Close() {
    if (closed_) return;
    closed_ = true;
    backendClient_->Stop();
    if (backendConn_) {
        backendConn_->ForceClose();
    }
}

void TunnelSession::FailClient(int code, const char* reason) {
    closed_ = true;
    auto client = clientConn_.lock();
    if (!client) return;
    protocol::HttpResponse resp(true);
    resp.setStatusCode(static_cast<protocol::HttpResponse::HttpStatusCode>(code));
    resp.setStatusMessage(reason);
    resp.setContentType("text/plain");
    resp.setBody(std::string(reason) + "\n");
    edgelog::network::Buffer out;
    resp.appendToBuffer(&out);
    client->Send(out.RetrieveAllAsString());
    client->StartRead();
    client->Shutdown();
}

void TunnelSession::OnConnectFailed(int savedErrno) {
    LOG_WARN << "tunnel: connect to " << backendAddr_.toIpPort() << " failed: " << std::strerror(savedErrno);
    FailClient(502, "Bad Gateway");
}

void TunnelSession::InstallBackpressure(const TcpConnectionPtr& client, const TcpConnectionPtr& backend) {
    const size_t hwm = opts_.highWaterMarkBytes;
    std::weak_ptr<edgelog::network::TcpConnection> wClient = client;
    std::weak_ptr<edgelog::network::TcpConnection> wBackend = backend;

    // Client -> Backend: stop reading the client while the backend is behind.
    backend->SetHighWaterMarkCallback(
        [wClient](const TcpConnectionPtr&, size_t) {
            if (auto c = wClient.lock()) c->StopRead();
        },
        hwm);
    backend->SetWriteCompleteCallback(
        [wClient](const TcpConnectionPtr&) {
            if (auto c = wClient.lock()) c->StartRead();
        });

    // Backend -> Client
    client->SetHighWaterMarkCallback(
        [wBackend](const TcpConnectionPtr&, size_t) {
            if (auto b = wBackend.lock()) b->StopRead();
        },
        hwm);
    client->SetWriteCompleteCallback(
        [wBackend](const TcpConnectionPtr&) {
            if (auto b = wBackend.lock()) b->StartRead();
        });
}

void TunnelSession::OnBackendConnection(const TcpConnectionPtr& conn) {
    if (conn->connected()) {
        if (closed_) {
            conn->ForceClose();
            return;
        }
        auto client = clientConn_.lock();
        if (!client || !client->connected()) {
            // nothing left to take over
            LOG_WARN << "tunnel: client gone before takeover, backend=" << backendAddr_.toIpPort();
            closed_ = true;
            if (client) FailClient(500, "Internal Server Error");
            conn->ForceClose();
            return;
        }
        LOG_INFO << "tunnel: " << client->peerAddress().toIpPort() << " <-> " << conn->peerAddress().toIpPort();
        established_ = true;
        backendConn_ = conn;
        InstallBackpressure(client, conn);
        if (!initialBuffer_.empty()) {
            conn->Send(initialBuffer_);
            initialBuffer_.clear();
        }
        client->StartRead();
        return;
    }

    if (!established_) {
        // TLS handshake failed, or the backend hung up before we got to use it.
        if (!closed_) {
            LOG_WARN << "tunnel: backend " << backendAddr_.toIpPort() << " closed before the tunnel was up";
            FailClient(502, "Bad Gateway");
        }
        return;
    }

    LOG_DEBUG << "tunnel: backend closed " << conn->name();
    backendConn_.reset();
    closed_ = true;
    if (auto client = clientConn_.lock()) {
        CloseClientAfterFlush(client);
    }
}

void TunnelSession::CloseClientAfterFlush(const TcpConnectionPtr& client) {
    // A half-close would leave the client socket open for as long as the peer keeps it.
    client->SetHighWaterMarkCallback(nullptr, opts_.highWaterMarkBytes);
    client->SetWriteCompleteCallback([](const TcpConnectionPtr& c) { c->ForceClose(); });
    if (client->outputBytes() == 0) {
        client->ForceClose();
    }
}

void TunnelSession::OnBackendMessage(const TcpConnectionPtr&,
                                     edgelog::network::Buffer* buf,
                                     std::chrono::system_clock::time_point) {
    auto client = clientConn_.lock();
    if (client && buf->ReadableBytes() > 0) {
        client->Send(buf->Peek(), buf->ReadableBytes());
    }
    buf->RetrieveAll();
}

} // namespace proxy
} // namespace edgelog
