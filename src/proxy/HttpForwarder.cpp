#include "edgelog/proxy/HttpForwarder.h"
#include "edgelog/common/Logger.h"
#include "edgelog/common/StringUtil.h"
#include "edgelog/network/EventLoop.h"
#include "edgelog/protocol/HttpResponse.h"

#include <cstring>
#include <set>

namespace edgelog {
namespace proxy {

using edgelog::network::TcpConnectionPtr;

// Per-hop headers that must not travel to the backend.
static const char* const kHopByHop[] = {
    "connection",
    "proxy-connection",
    "keep-alive",
    "te",
    "trailer",
    "transfer-encoding",
    "upgrade",
    "proxy-authorization",
};

HttpForwarder::HttpForwarder(edgelog::network::EventLoop* loop,
                             const edgelog::network::InetAddress& backendAddr,
                             const TcpConnectionPtr& clientConn,
                             Options opts)
    : loop_(loop),
      backendAddr_(backendAddr),
      backendClient_(new edgelog::network::TcpClient(loop, backendAddr, "Backend")),
      clientConn_(clientConn),
      opts_(std::move(opts)) {
    if (opts_.tlsCtx) {
        backendClient_->EnableTls(opts_.tlsCtx, opts_.tlsServerName, opts_.tlsVerifyHost);
    }
}

HttpForwarder::~HttpForwarder() {
    LOG_DEBUG << "HttpForwarder destroyed backend=" << backendAddr_.toIpPort();
}

std::string HttpForwarder::JoinPath(const std::string& prefix, const std::string& path) {
    if (prefix.empty()) return path.empty() ? "/" : path;
    if (path.empty()) return prefix;
    const bool aslash = prefix.back() == '/';
    const bool bslash = path.front() == '/';
    if (aslash && bslash) return prefix + path.substr(1);
    if (!aslash && !bslash) return prefix + "/" + path;
    return prefix + path;
}

std::string HttpForwarder::MergeQuery(const std::string& a, const std::string& b) {
    if (a.empty()) return b;
    if (b.empty()) return a;
    return a + "&" + b;
}

std::string HttpForwarder::BuildRequest(const protocol::HttpRequest& req,
                                        const route::RouteEntry& route,
                                        const std::string& peerIp) {
    std::set<std::string> drop(std::begin(kHopByHop), std::end(kHopByHop));
    // headers named in Connection are per-hop too
    for (const auto& token : common::SplitString(req.getHeader("Connection"), ',')) {
        const std::string t = common::ToLowerAscii(common::TrimCopy(token));
        if (!t.empty()) drop.insert(t);
    }
    drop.insert("content-length");
    drop.insert("x-forwarded-for");

    std::string target = JoinPath(route.backend.pathPrefix, req.path());
    const std::string query = MergeQuery(route.backend.rawQuery, req.query());
    if (!query.empty()) target += "?" + query;

    std::string out;
    out.reserve(512 + req.body().size());
    // An HTTP/1.0 client cannot read chunked framing, so the backend sees its version.
    const bool http10 = req.getVersion() == protocol::HttpRequest::kHttp10;
    out += req.method() + " " + target + (http10 ? " HTTP/1.0\r\n" : " HTTP/1.1\r\n");
    for (const auto& h : req.headers()) {
        if (drop.count(common::ToLowerAscii(h.first))) continue;
        out += h.first + ": " + h.second + "\r\n";
    }
    if (!req.hasHeader("Host")) {
        out += "Host: " + route.backend.authority() + "\r\n";
    }

    const std::string prior = req.getHeader("X-Forwarded-For");
    out += "X-Forwarded-For: " + (prior.empty() ? peerIp : prior + ", " + peerIp) + "\r\n";

    if (!req.body().empty() || req.hasHeader("Content-Length") || req.hasHeader("Transfer-Encoding")) {
        out += "Content-Length: " + std::to_string(req.body().size()) + "\r\n";
    }
    out += "\r\n";
    out += req.body();
    return out;
}

void HttpForwarder::Start(const std::string& request, bool requestWasHead, bool clientWantsClose, DoneCallback done) {
    request_ = request;
    clientWantsClose_ = clientWantsClose;
    done_ = std::move(done);
    resp_.reset();
    resp_.setRequestWasHead(requestWasHead);

    std::weak_ptr<HttpForwarder> weakSelf(shared_from_this());
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
    backendClient_->Connect();
}

void HttpForwarder::Abort() {
    if (finished_) return;
    finished_ = true;
    backendClient_->Stop();
    if (backendConn_) backendConn_->ForceClose();
}

void HttpForwarder::Finish(bool keepClientOpen) {
    finished_ = true;
    if (backendConn_) backendConn_->ForceClose();
    DoneCallback done;
    done.swap(done_);
    if (done) {
        loop_->QueueInLoop([done, keepClientOpen]() { done(keepClientOpen); });
    }
}

void HttpForwarder::Fail(const std::string& why) {
    if (finished_) return;
    LOG_WARN << "forward to " << backendAddr_.toIpPort() << " failed: " << why
             << " (forwarded " << bytesForwarded_ << " bytes)";
    auto client = clientConn_.lock();
    if (client && bytesForwarded_ == 0) {
        protocol::HttpResponse resp(true);
        resp.setStatusCode(protocol::HttpResponse::k502BadGateway);
        resp.setContentType("text/plain");
        resp.setBody("Bad Gateway\n");
        edgelog::network::Buffer out;
        resp.appendToBuffer(&out);
        client->Send(out.RetrieveAllAsString());
    }
    Finish(false);
}

void HttpForwarder::OnConnectFailed(int savedErrno) {
    Fail(std::string("connect: ") + std::strerror(savedErrno));
}

void HttpForwarder::OnBackendConnection(const TcpConnectionPtr& conn) {
    if (conn->connected()) {
        if (finished_) {
            conn->ForceClose();
            return;
        }
        auto client = clientConn_.lock();
        if (!client) {
            Abort();
            conn->ForceClose();
            return;
        }
        established_ = true;
        backendConn_ = conn;

        // Backend -> Client: hold the backend while the client is behind.
        std::weak_ptr<edgelog::network::TcpConnection> wBackend = conn;
        client->SetHighWaterMarkCallback(
            [wBackend](const TcpConnectionPtr&, size_t) {
                if (auto b = wBackend.lock()) b->StopRead();
            },
            opts_.highWaterMarkBytes);
        client->SetWriteCompleteCallback(
            [wBackend](const TcpConnectionPtr&) {
                if (auto b = wBackend.lock()) b->StartRead();
            });

        conn->Send(request_);
        request_.clear();
        return;
    }

    if (finished_) return;
    backendConn_.reset();
    if (!established_) {
        Fail("backend closed during connect");
    } else if (resp_.needsCloseToFinish() && !resp_.hasError()) {
        Finish(false);
    } else {
        Fail("backend closed before the response completed");
    }
}

void HttpForwarder::OnBackendMessage(const TcpConnectionPtr&,
                                     edgelog::network::Buffer* buf,
                                     std::chrono::system_clock::time_point) {
    if (finished_) {
        buf->RetrieveAll();
        return;
    }
    const char* data = buf->Peek();
    const size_t n = buf->ReadableBytes();
    const bool done = resp_.feed(data, n);
    if (resp_.hasError()) {
        buf->RetrieveAll();
        Fail("malformed response");
        return;
    }
    auto client = clientConn_.lock();
    if (!client) {
        buf->RetrieveAll();
        Abort();
        return;
    }
    client->Send(data, n);
    bytesForwarded_ += n;
    buf->RetrieveAll();

    if (done) {
        const bool keep = !clientWantsClose_ && resp_.keepAlive() && !resp_.needsCloseToFinish();
        Finish(keep);
    }
}

} // namespace proxy
} // namespace edgelog
