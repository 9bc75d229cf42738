#pragma once

#include "edgelog/common/noncopyable.h"
#include "edgelog/network/InetAddress.h"
#include "edgelog/network/TcpClient.h"
#include "edgelog/network/TcpConnection.h"
#include "edgelog/protocol/HttpRequest.h"
#include "edgelog/protocol/HttpResponseContext.h"
#include "edgelog/route/RouteTable.h"

#include <chrono>
#include <cstddef>
#include <functional>
#include <memory>
#include <string>

struct ssl_ctx_st;

namespace edgelog {
namespace proxy {

// One request/response exchange with a backend over a dedicated connection.
// The response is streamed to the client as it arrives; its framing is tracked
// with HttpResponseContext so the client connection can be reused afterwards.
class HttpForwarder : public std::enable_shared_from_this<HttpForwarder>,
                      edgelog::common::noncopyable {
public:
    struct Options {
        size_t highWaterMarkBytes{8 * 1024 * 1024};
        ssl_ctx_st* tlsCtx{nullptr};
        std::string tlsServerName;
        bool tlsVerifyHost{false};
    };

    // keepClientOpen: the client connection may carry another request.
    // Always invoked from a queued functor, never from inside a backend callback.
    using DoneCallback = std::function<void(bool keepClientOpen)>;

    HttpForwarder(edgelog::network::EventLoop* loop,
                  const edgelog::network::InetAddress& backendAddr,
                  const edgelog::network::TcpConnectionPtr& clientConn,
                  Options opts);
    ~HttpForwarder();

    // request: serialized with BuildRequest().
    void Start(const std::string& request, bool requestWasHead, bool clientWantsClose, DoneCallback done);

    // Client went away; drop the backend side.
    void Abort();

    size_t bytesForwarded() const { return bytesForwarded_; }

    // Request as sent to the backend for a route.
    static std::string BuildRequest(const protocol::HttpRequest& req,
                                    const route::RouteEntry& route,
                                    const std::string& peerIp);

    // "/api" + "/x" -> "/api/x"; exactly one slash at the seam.
    static std::string JoinPath(const std::string& prefix, const std::string& path);
    // "a=1" + "b=2" -> "a=1&b=2"
    static std::string MergeQuery(const std::string& a, const std::string& b);

private:
    void OnBackendConnection(const edgelog::network::TcpConnectionPtr& conn);
    void OnBackendMessage(const edgelog::network::TcpConnectionPtr& conn,
                          edgelog::network::Buffer* buf,
                          std::chrono::system_clock::time_point);
    void OnConnectFailed(int savedErrno);
    // Backend failed before completing the response.
    void Fail(const std::string& why);
    void Finish(bool keepClientOpen);

    edgelog::network::EventLoop* loop_;
    edgelog::network::InetAddress backendAddr_;
    std::unique_ptr<edgelog::network::TcpClient> backendClient_;
    std::weak_ptr<edgelog::network::TcpConnection> clientConn_;
    edgelog::network::TcpConnectionPtr backendConn_;
    Options opts_;

    std::string request_;
    bool clientWantsClose_{false};
    DoneCallback done_;

    protocol::HttpResponseContext resp_;
    size_t bytesForwarded_{0};
    bool established_{false};
    bool finished_{false};
};

using HttpForwarderPtr = std::shared_ptr<HttpForwarder>;

} // namespace proxy
} // namespace edgelog
