#pragma once

#include "edgelog/network/Buffer.h"
#include "edgelog/protocol/HttpContext.h"
#include "edgelog/proxy/HttpForwarder.h"
#include "edgelog/proxy/TunnelSession.h"

#include <memory>

namespace edgelog {
namespace proxy {

// Per client connection, stored in the TcpConnection context.
//   kHttp:       parsing requests
//   kForwarding: one request in flight to a backend; further client bytes wait in inbound
//   kTunnel:     the connection belongs to a WebSocket relay
struct ProxySessionContext {
    enum Type {
        kHttp,
        kForwarding,
        kTunnel
    };

    Type type = kHttp;

    protocol::HttpContext httpContext;
    edgelog::network::Buffer inbound;

    std::shared_ptr<HttpForwarder> forwarder;
    std::shared_ptr<TunnelSession> tunnel;
};

using ProxySessionContextPtr = std::shared_ptr<ProxySessionContext>;

} // namespace proxy
} // namespace edgelog
