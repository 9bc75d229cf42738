#pragma once

#include "edgelog/common/noncopyable.h"
#include "edgelog/network/EventLoop.h"
#include "edgelog/network/TcpServer.h"
#include "edgelog/network/TlsContext.h"
#include "edgelog/protocol/HttpRequest.h"
#include "edgelog/protocol/HttpResponse.h"
#include "edgelog/proxy/ApiHandler.h"
#include "edgelog/proxy/ProxySessionContext.h"
#include "edgelog/proxy/ServerContext.h"
#include "edgelog/route/RouteTable.h"

#include <functional>
#include <memory>
#include <string>

namespace edgelog {
namespace proxy {

// Host-routed reverse proxy. Every dispatched request is recorded, then
// forwarded to the backend its Host maps to, tunneled when it asks for a
// WebSocket upgrade, or answered locally when no route matches.
class ProxyServer : edgelog::common::noncopyable {
public:
    // Renders "/" and "/dashboard" for hosts without a route.
    using DashboardHandler = std::function<void(const protocol::HttpRequest&, protocol::HttpResponse*)>;

    ProxyServer(network::EventLoop* loop,
                const network::InetAddress& listenAddr,
                ServerContext ctx,
                const std::string& name = "edgelog");

    // Call before Start(); handlers run on the I/O threads.
    void SetDashboardHandler(DashboardHandler handler) { dashboard_ = std::move(handler); }
    void SetThreadNum(int numThreads);
    void Start();

    network::InetAddress listenAddress() const { return server_.listenAddress(); }

    static bool IsWebSocketUpgrade(const protocol::HttpRequest& req);

private:
    void OnConnection(const network::TcpConnectionPtr& conn);
    void OnMessage(const network::TcpConnectionPtr& conn,
                   network::Buffer* buf,
                   std::chrono::system_clock::time_point receiveTime);

    void ProcessInbound(const network::TcpConnectionPtr& conn,
                        const ProxySessionContextPtr& ctx,
                        std::chrono::system_clock::time_point receiveTime);
    void Dispatch(const network::TcpConnectionPtr& conn,
                  const ProxySessionContextPtr& ctx,
                  const protocol::HttpRequest& req);
    void StartTunnel(const network::TcpConnectionPtr& conn,
                     const ProxySessionContextPtr& ctx,
                     const protocol::HttpRequest& req,
                     const route::RouteEntry& route);
    void StartForward(const network::TcpConnectionPtr& conn,
                      const ProxySessionContextPtr& ctx,
                      const protocol::HttpRequest& req,
                      const route::RouteEntry& route,
                      bool clientClose);
    void OnForwardDone(const std::weak_ptr<network::TcpConnection>& weakConn,
                       const std::weak_ptr<ProxySessionContext>& weakCtx,
                       bool keepClientOpen);

    // Null when the route's TLS mode has no usable context.
    ssl_ctx_st* TlsFor(const route::RouteEntry& route) const;

    static void SendResponse(const network::TcpConnectionPtr& conn, const protocol::HttpResponse& resp);
    static void SendError(const network::TcpConnectionPtr& conn, protocol::HttpResponse::HttpStatusCode code);

    network::TcpServer server_;
    ServerContext ctx_;
    ApiHandler api_;
    DashboardHandler dashboard_;

    network::TlsContext tlsVerify_;
    network::TlsContext tlsNoVerify_;
};

} // namespace proxy
} // namespace edgelog
