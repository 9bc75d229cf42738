#include "edgelog/proxy/ProxyServer.h"
#include "edgelog/common/Logger.h"
#include "edgelog/common/StringUtil.h"
#include "edgelog/proxy/ClientIdentity.h"
#include "edgelog/proxy/Dashboard.h"

#include <any>
#include <functional>
#include <sstream>

namespace edgelog {
namespace proxy {

using common::HeaderContainsTokenCI;
using protocol::HttpRequest;
using protocol::HttpResponse;

// Client bytes buffered while a request is in flight; reading pauses above this.
static const size_t kMaxPendingInbound = 1024 * 1024;

static ProxySessionContextPtr GetSessionContext(const network::TcpConnectionPtr& conn) {
    std::any* any = conn->GetMutableContext();
    if (!any->has_value()) return nullptr;
    try {
        auto* ctxPtr = std::any_cast<ProxySessionContextPtr>(any);
        return ctxPtr ? *ctxPtr : nullptr;
    } catch (const std::bad_any_cast&) {
        LOG_ERROR << "Unexpected context type on " << conn->name();
        return nullptr;
    }
}

// HTTP/1.0 closes unless asked otherwise; HTTP/1.1 stays open unless asked.
static bool ClientWantsClose(const HttpRequest& req) {
    const std::string connection = req.getHeader("Connection");
    if (req.getVersion() == HttpRequest::kHttp10) {
        return !HeaderContainsTokenCI(connection, "keep-alive");
    }
    return HeaderContainsTokenCI(connection, "close");
}

// Request head (and any body already read) as the client sent it. A chunked
// body has been decoded by the parser, so it goes out with a Content-Length.
static std::string SerializeOriginal(const HttpRequest& req) {
    const bool dechunked = HeaderContainsTokenCI(req.getHeader("Transfer-Encoding"), "chunked");
    std::string out;
    out.reserve(256 + req.body().size());
    out += req.method();
    out += ' ';
    out += req.target();
    out += ' ';
    out += req.versionString();
    out += "\r\n";
    for (const auto& kv : req.headers()) {
        if (dechunked && (common::IEquals(kv.first, "Transfer-Encoding") ||
                          common::IEquals(kv.first, "Content-Length"))) {
            continue;
        }
        out += kv.first;
        out += ": ";
        out += kv.second;
        out += "\r\n";
    }
    if (dechunked) {
        out += "Content-Length: " + std::to_string(req.body().size()) + "\r\n";
    }
    out += "\r\n";
    out += req.body();
    return out;
}

ProxyServer::ProxyServer(network::EventLoop* loop,
                         const network::InetAddress& listenAddr,
                         ServerContext ctx,
                         const std::string& name)
    : server_(loop, listenAddr, name),
      ctx_(std::move(ctx)),
      api_(&ctx_) {
    server_.SetConnectionCallback(std::bind(&ProxyServer::OnConnection, this, std::placeholders::_1));
    server_.SetMessageCallback(std::bind(&ProxyServer::OnMessage, this,
                                         std::placeholders::_1, std::placeholders::_2, std::placeholders::_3));

    dashboard_ = [this](const HttpRequest&, HttpResponse* resp) {
        resp->setStatusCode(HttpResponse::k200Ok);
        resp->setContentType("text/html; charset=utf-8");
        resp->setBody(DashboardHtml(ctx_.dashboardFile, ctx_.apiPrefix));
    };

    if (!tlsVerify_.InitClient(true)) {
        LOG_ERROR << "TLS client context (verifying) init failed; https backends will answer 502";
    }
    if (!tlsNoVerify_.InitClient(false)) {
        LOG_ERROR << "TLS client context (no verify) init failed; no_tls_verify backends will answer 502";
    }
}

void ProxyServer::SetThreadNum(int numThreads) {
    server_.SetThreadNum(numThreads);
}

void ProxyServer::Start() {
    LOG_INFO << "ProxyServer [" << server_.name() << "] listening on " << server_.hostport()
             << " with " << (ctx_.routes ? ctx_.routes->size() : 0) << " route(s)";
    server_.Start();
}

bool ProxyServer::IsWebSocketUpgrade(const HttpRequest& req) {
    return HeaderContainsTokenCI(req.getHeader("Upgrade"), "websocket");
}

ssl_ctx_st* ProxyServer::TlsFor(const route::RouteEntry& route) const {
    return route.noTlsVerify ? tlsNoVerify_.ctx() : tlsVerify_.ctx();
}

void ProxyServer::SendResponse(const network::TcpConnectionPtr& conn, const HttpResponse& resp) {
    network::Buffer out;
    resp.appendToBuffer(&out);
    conn->Send(out.RetrieveAllAsString());
    if (resp.closeConnection()) {
        conn->Shutdown();
    }
}

void ProxyServer::SendError(const network::TcpConnectionPtr& conn, HttpResponse::HttpStatusCode code) {
    HttpResponse resp(true);
    resp.setStatusCode(code);
    resp.setContentType("text/plain; charset=utf-8");
    resp.setBody(std::string(HttpResponse::DefaultReason(code)) + "\n");
    SendResponse(conn, resp);
}

void ProxyServer::OnConnection(const network::TcpConnectionPtr& conn) {
    if (conn->connected()) {
        LOG_DEBUG << "Client connected: " << conn->peerAddress().toIpPort();
        conn->SetContext(std::make_shared<ProxySessionContext>());
        return;
    }

    LOG_DEBUG << "Client disconnected: " << conn->peerAddress().toIpPort();
    ProxySessionContextPtr ctx = GetSessionContext(conn);
    if (!ctx) return;
    if (ctx->tunnel) {
        ctx->tunnel->Close();
        ctx->tunnel.reset();
    }
    if (ctx->forwarder) {
        ctx->forwarder->Abort();
        ctx->forwarder.reset();
    }
}

void ProxyServer::OnMessage(const network::TcpConnectionPtr& conn,
                            network::Buffer* buf,
                            std::chrono::system_clock::time_point receiveTime) {
    ProxySessionContextPtr ctx = GetSessionContext(conn);
    if (!ctx) {
        buf->RetrieveAll();
        return;
    }

    if (ctx->type == ProxySessionContext::kTunnel) {
        if (ctx->tunnel && buf->ReadableBytes() > 0) {
            ctx->tunnel->Send(buf->Peek(), buf->ReadableBytes());
        }
        buf->RetrieveAll();
        return;
    }

    ctx->inbound.Append(buf->Peek(), buf->ReadableBytes());
    buf->RetrieveAll();

    if (ctx->type == ProxySessionContext::kForwarding) {
        // Pipelined bytes wait for the in-flight exchange to finish.
        if (ctx->inbound.ReadableBytes() > kMaxPendingInbound) {
            conn->StopRead();
        }
        return;
    }
    ProcessInbound(conn, ctx, receiveTime);
}

void ProxyServer::ProcessInbound(const network::TcpConnectionPtr& conn,
                                 const ProxySessionContextPtr& ctx,
                                 std::chrono::system_clock::time_point receiveTime) {
    while (ctx->type == ProxySessionContext::kHttp && conn->connected() && ctx->inbound.ReadableBytes() > 0) {
        if (!ctx->httpContext.parseRequest(&ctx->inbound, receiveTime)) {
            LOG_WARN << "Malformed request from " << conn->peerAddress().toIpPort();
            ctx->inbound.RetrieveAll();
            SendError(conn, HttpResponse::k400BadRequest);
            return;
        }
        if (!ctx->httpContext.gotAll()) return;

        HttpRequest req;
        req.swap(ctx->httpContext.request());
        ctx->httpContext.reset();
        Dispatch(conn, ctx, req);
    }
}

void ProxyServer::Dispatch(const network::TcpConnectionPtr& conn,
                           const ProxySessionContextPtr& ctx,
                           const HttpRequest& req) {
    const std::string peer = conn->peerAddress().toIpPort();
    const bool clientClose = ClientWantsClose(req);

    if (api_.Matches(req.path())) {
        HttpResponse resp(clientClose);
        api_.Handle(req, peer, &resp);
        SendResponse(conn, resp);
        return;
    }

    const ClientIdentity id = ExtractClientIdentity(req, peer);
    const std::string host = req.getHeader("Host");
    LOG_INFO << id.ip << " (" << id.country << ") -> " << host << " " << req.method() << " " << req.path();

    if (ctx_.recorder) {
        store::ConnectionRecord rec = MakeConnectionRecord(req, id);
        std::string err;
        if (!ctx_.recorder->Record(rec, &err)) {
            LOG_ERROR << "record failed: " << err;
        }
    }

    std::optional<route::RouteEntry> route;
    if (ctx_.routes) route = ctx_.routes->Lookup(host);

    if (!route) {
        HttpResponse resp(clientClose);
        if (req.path() == "/" || req.path() == "/dashboard") {
            dashboard_(req, &resp);
        } else {
            std::ostringstream body;
            body << "Your IP: " << id.ip << "\n"
                 << "Country: " << id.country << "\n"
                 << "Host: " << host << "\n"
                 << "Path: " << req.path() << "\n";
            resp.setStatusCode(HttpResponse::k200Ok);
            resp.setContentType("text/plain; charset=utf-8");
            resp.setBody(body.str());
        }
        SendResponse(conn, resp);
        return;
    }

    if (IsWebSocketUpgrade(req)) {
        StartTunnel(conn, ctx, req, *route);
    } else {
        StartForward(conn, ctx, req, *route, clientClose);
    }
}

void ProxyServer::StartTunnel(const network::TcpConnectionPtr& conn,
                              const ProxySessionContextPtr& ctx,
                              const HttpRequest& req,
                              const route::RouteEntry& route) {
    const route::BackendUrl& backend = route.backend;
    network::InetAddress addr;
    std::string err;
    if (!network::InetAddress::Resolve(backend.host, backend.port, &addr, &err)) {
        LOG_WARN << "Tunnel to " << backend.original << " failed: " << err;
        SendError(conn, HttpResponse::k502BadGateway);
        return;
    }

    TunnelSession::Options opts;
    opts.highWaterMarkBytes = ctx_.highWaterMarkBytes;
    if (backend.tls()) {
        opts.tlsCtx = TlsFor(route);
        if (!opts.tlsCtx) {
            SendError(conn, HttpResponse::k502BadGateway);
            return;
        }
        opts.tlsServerName = backend.host;
        opts.tlsVerifyHost = !route.noTlsVerify;
    }

    LOG_INFO << "WebSocket tunnel " << conn->peerAddress().toIpPort() << " -> " << backend.authority();
    ctx->type = ProxySessionContext::kTunnel;
    ctx->tunnel = std::make_shared<TunnelSession>(conn->getLoop(), addr, conn, opts);
    ctx->tunnel->Start(SerializeOriginal(req));
    if (ctx->inbound.ReadableBytes() > 0) {
        ctx->tunnel->Send(ctx->inbound.Peek(), ctx->inbound.ReadableBytes());
        ctx->inbound.RetrieveAll();
    }
}

void ProxyServer::StartForward(const network::TcpConnectionPtr& conn,
                               const ProxySessionContextPtr& ctx,
                               const HttpRequest& req,
                               const route::RouteEntry& route,
                               bool clientClose) {
    const route::BackendUrl& backend = route.backend;
    network::InetAddress addr;
    std::string err;
    if (!network::InetAddress::Resolve(backend.host, backend.port, &addr, &err)) {
        LOG_WARN << "Forward to " << backend.original << " failed: " << err;
        SendError(conn, HttpResponse::k502BadGateway);
        return;
    }

    HttpForwarder::Options opts;
    opts.highWaterMarkBytes = ctx_.highWaterMarkBytes;
    if (backend.tls()) {
        opts.tlsCtx = TlsFor(route);
        if (!opts.tlsCtx) {
            SendError(conn, HttpResponse::k502BadGateway);
            return;
        }
        opts.tlsServerName = backend.host;
        opts.tlsVerifyHost = !route.noTlsVerify;
    }

    ctx->type = ProxySessionContext::kForwarding;
    ctx->forwarder = std::make_shared<HttpForwarder>(conn->getLoop(), addr, conn, opts);

    std::weak_ptr<network::TcpConnection> weakConn(conn);
    std::weak_ptr<ProxySessionContext> weakCtx(ctx);
    ctx->forwarder->Start(HttpForwarder::BuildRequest(req, route, StripPort(conn->peerAddress().toIpPort())),
                          req.method() == "HEAD",
                          clientClose,
                          [this, weakConn, weakCtx](bool keepClientOpen) {
                              OnForwardDone(weakConn, weakCtx, keepClientOpen);
                          });
}

void ProxyServer::OnForwardDone(const std::weak_ptr<network::TcpConnection>& weakConn,
                                const std::weak_ptr<ProxySessionContext>& weakCtx,
                                bool keepClientOpen) {
    network::TcpConnectionPtr conn = weakConn.lock();
    ProxySessionContextPtr ctx = weakCtx.lock();
    if (!conn || !ctx) return;

    ctx->forwarder.reset();
    if (!keepClientOpen || !conn->connected()) {
        conn->Shutdown();
        return;
    }

    ctx->type = ProxySessionContext::kHttp;
    conn->StartRead();
    ProcessInbound(conn, ctx, std::chrono::system_clock::now());
}

} // namespace proxy
} // namespace edgelog
