#include "edgelog/proxy/ProxyServer.h"
#include "edgelog/common/Logger.h"
#include "edgelog/network/EventLoop.h"
#include "edgelog/route/RouteTable.h"

#include <arpa/inet.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>

#include <atomic>
#include <cassert>
#include <chrono>
#include <cstring>
#include <functional>
#include <string>
#include <thread>

using namespace edgelog::common;
using namespace edgelog::network;
using namespace edgelog::proxy;
using namespace edgelog::route;

namespace {

const char* const kSwitching =
    "HTTP/1.1 101 Switching Protocols\r\n"
    "Upgrade: websocket\r\n"
    "Connection: Upgrade\r\n"
    "Sec-WebSocket-Accept: s3pPLMBiTxaQ9kYGzzhZRbK+xOo=\r\n"
    "\r\n";

int listenOnLoopback(uint16_t* port) {
    int fd = ::socket(AF_INET, SOCK_STREAM, 0);
    assert(fd >= 0);
    int one = 1;
    ::setsockopt(fd, SOL_SOCKET, SO_REUSEADDR, &one, sizeof(one));
    sockaddr_in addr;
    std::memset(&addr, 0, sizeof(addr));
    addr.sin_family = AF_INET;
    addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
    addr.sin_port = htons(0);
    assert(::bind(fd, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) == 0);
    assert(::listen(fd, 16) == 0);
    socklen_t len = sizeof(addr);
    assert(::getsockname(fd, reinterpret_cast<sockaddr*>(&addr), &len) == 0);
    *port = ntohs(addr.sin_port);
    return fd;
}

int connectTo(uint16_t port) {
    int fd = ::socket(AF_INET, SOCK_STREAM, 0);
    assert(fd >= 0);
    sockaddr_in addr;
    std::memset(&addr, 0, sizeof(addr));
    addr.sin_family = AF_INET;
    addr.sin_port = htons(port);
    assert(::inet_pton(AF_INET, "127.0.0.1", &addr.sin_addr) == 1);
    int ret = ::connect(fd, reinterpret_cast<sockaddr*>(&addr), sizeof(addr));
    assert(ret == 0);
    return fd;
}

void sendAll(int fd, const std::string& data) {
    size_t off = 0;
    while (off < data.size()) {
        ssize_t n = ::send(fd, data.data() + off, data.size() - off, MSG_NOSIGNAL);
        assert(n > 0);
        off += static_cast<size_t>(n);
    }
}

// Reads until `needle` shows up, the peer closes, or the timeout hits.
std::string recvUntil(int fd, const std::string& needle, int timeoutMs = 3000) {
    std::string out;
    const auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(timeoutMs);
    while (needle.empty() || out.find(needle) == std::string::npos) {
        const auto left = std::chrono::duration_cast<std::chrono::milliseconds>(
            deadline - std::chrono::steady_clock::now()).count();
        if (left <= 0) break;
        pollfd pfd{fd, POLLIN, 0};
        if (::poll(&pfd, 1, static_cast<int>(left)) != 1) break;
        char buf[4096];
        ssize_t n = ::recv(fd, buf, sizeof(buf), 0);
        if (n <= 0) break;
        out.append(buf, static_cast<size_t>(n));
    }
    return out;
}

// Request head plus whatever body bytes follow it, up to `bodyLen`.
std::string recvRequest(int fd, size_t bodyLen) {
    std::string in = recvUntil(fd, "\r\n\r\n");
    const size_t end = in.find("\r\n\r\n");
    assert(end != std::string::npos);
    while (in.size() < end + 4 + bodyLen) {
        std::string more = recvUntil(fd, "", 500);
        if (more.empty()) break;
        in += more;
    }
    return in;
}

// Keeps writing after the proxy's EOF; a socket that was only half-closed
// accepts these writes forever, a closed one resets.
bool fullyClosedByPeer(int fd, int timeoutMs = 3000) {
    const auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(timeoutMs);
    while (std::chrono::steady_clock::now() < deadline) {
        if (::send(fd, "x", 1, MSG_NOSIGNAL) < 0) return true;
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
    }
    return false;
}

// Runs a proxy routing `host` to the loopback backend until `clientBody` returns.
void withProxy(const std::string& host, uint16_t backendPort, const char* name,
               const std::function<void(uint16_t)>& clientBody) {
    RouteTable routes;
    assert(routes.Add(host, "http://127.0.0.1:" + std::to_string(backendPort), false));
    ServerContext ctx;
    ctx.routes = &routes;

    EventLoop loop;
    ProxyServer server(&loop, InetAddress(0, true), ctx, name);
    server.Start();
    const uint16_t port = server.listenAddress().toPort();

    std::thread client([&]() {
        clientBody(port);
        loop.QueueInLoop([&loop]() { loop.Quit(); });
    });
    loop.Loop();
    client.join();
}

std::string upgradeRequest(const std::string& target, const std::string& host) {
    return "GET " + target + " HTTP/1.1\r\n"
           "Host: " + host + "\r\n"
           "Upgrade: websocket\r\n"
           "Connection: Upgrade\r\n"
           "Sec-WebSocket-Key: dGhlIHNhbXBsZSBub25jZQ==\r\n"
           "Sec-WebSocket-Version: 13\r\n"
           "\r\n";
}

} // namespace

void testClientClosesFirst() {
    uint16_t backendPort = 0;
    const int listenFd = listenOnLoopback(&backendPort);
    std::string handshake;
    std::atomic<bool> backendSawEof{false};

    // Answers the upgrade, greets, then echoes raw bytes until the proxy hangs up.
    std::thread backend([&]() {
        int c = ::accept(listenFd, nullptr, nullptr);
        assert(c >= 0);
        std::string in = recvUntil(c, "\r\n\r\n");
        const size_t end = in.find("\r\n\r\n");
        assert(end != std::string::npos);
        handshake = in.substr(0, end + 4);
        const std::string early = in.substr(end + 4);

        sendAll(c, std::string(kSwitching) + "srv-hello|");
        if (!early.empty()) sendAll(c, early);

        char buf[4096];
        for (;;) {
            ssize_t n = ::recv(c, buf, sizeof(buf), 0);
            if (n <= 0) break;
            sendAll(c, std::string(buf, static_cast<size_t>(n)));
        }
        backendSawEof = true;
        ::close(c);
    });

    withProxy("ws.example.com", backendPort, "WebSocketTest", [&](uint16_t port) {
        int fd = connectTo(port);
        // bytes after the head must reach the backend once the tunnel is up
        sendAll(fd, upgradeRequest("/chat?room=1", "ws.example.com") + "early|");

        std::string got = recvUntil(fd, "early|");
        assert(got.find("HTTP/1.1 101 Switching Protocols\r\n") == 0);
        assert(got.find("srv-hello|") != std::string::npos);

        std::string frame("\x81\x04ping", 6);
        sendAll(fd, frame);
        std::string echoed = recvUntil(fd, "ping");
        assert(echoed == frame);

        ::close(fd);
        for (int i = 0; i < 200 && !backendSawEof.load(); ++i) {
            std::this_thread::sleep_for(std::chrono::milliseconds(10));
        }
    });
    backend.join();
    ::close(listenFd);

    // the handshake reaches the backend as the client sent it
    assert(handshake.find("GET /chat?room=1 HTTP/1.1\r\n") == 0);
    assert(handshake.find("\r\nHost: ws.example.com\r\n") != std::string::npos);
    assert(handshake.find("\r\nUpgrade: websocket\r\n") != std::string::npos);
    assert(handshake.find("\r\nConnection: Upgrade\r\n") != std::string::npos);
    assert(handshake.find("\r\nSec-WebSocket-Key: dGhlIHNhbXBsZSBub25jZQ==\r\n") != std::string::npos);
    assert(backendSawEof.load());
    LOG_INFO << "Client closes first PASS";
}

void testBackendClosesFirst() {
    uint16_t backendPort = 0;
    const int listenFd = listenOnLoopback(&backendPort);

    // Accepts the upgrade, says goodbye and hangs up.
    std::thread backend([&]() {
        int c = ::accept(listenFd, nullptr, nullptr);
        assert(c >= 0);
        recvUntil(c, "\r\n\r\n");
        sendAll(c, std::string(kSwitching) + "bye|");
        ::close(c);
    });

    withProxy("ws.example.com", backendPort, "BackendCloseTest", [&](uint16_t port) {
        int fd = connectTo(port);
        sendAll(fd, upgradeRequest("/feed", "ws.example.com"));

        // the goodbye is flushed before the proxy closes
        std::string got = recvUntil(fd, "");
        assert(got.find("HTTP/1.1 101 Switching Protocols\r\n") == 0);
        assert(got.find("bye|") != std::string::npos);

        // the client never closes on its own; the proxy must not hold its end open
        assert(fullyClosedByPeer(fd));
        ::close(fd);
    });
    backend.join();
    ::close(listenFd);
    LOG_INFO << "Backend closes first PASS";
}

void testSameHostTakesBothPaths() {
    uint16_t backendPort = 0;
    const int listenFd = listenOnLoopback(&backendPort);
    std::string plainSeen;
    std::string upgradeSeen;

    std::thread backend([&]() {
        int c = ::accept(listenFd, nullptr, nullptr);
        assert(c >= 0);
        plainSeen = recvUntil(c, "\r\n\r\n");
        sendAll(c, "HTTP/1.1 200 OK\r\nContent-Length: 2\r\n\r\nok");
        recvUntil(c, "");
        ::close(c);

        c = ::accept(listenFd, nullptr, nullptr);
        assert(c >= 0);
        upgradeSeen = recvUntil(c, "\r\n\r\n");
        sendAll(c, kSwitching);
        ::close(c);
    });

    withProxy("mixed.example.com", backendPort, "SameHostTest", [&](uint16_t port) {
        int fd = connectTo(port);
        sendAll(fd, "GET /page HTTP/1.1\r\nHost: mixed.example.com\r\nConnection: close\r\n\r\n");
        std::string resp = recvUntil(fd, "");
        assert(resp.find("HTTP/1.1 200 OK\r\n") == 0);
        assert(resp.find("\r\n\r\nok") != std::string::npos);
        ::close(fd);

        fd = connectTo(port);
        sendAll(fd, upgradeRequest("/page", "mixed.example.com"));
        resp = recvUntil(fd, "\r\n\r\n");
        assert(resp.find("HTTP/1.1 101 Switching Protocols\r\n") == 0);
        ::close(fd);
    });
    backend.join();
    ::close(listenFd);

    // standard forwarding rewrites the head, the tunnel replays it untouched
    assert(plainSeen.find("GET /page HTTP/1.1\r\n") == 0);
    assert(plainSeen.find("\r\nX-Forwarded-For: 127.0.0.1\r\n") != std::string::npos);
    assert(plainSeen.find("Upgrade:") == std::string::npos);
    assert(upgradeSeen.find("GET /page HTTP/1.1\r\n") == 0);
    assert(upgradeSeen.find("\r\nUpgrade: websocket\r\n") != std::string::npos);
    assert(upgradeSeen.find("X-Forwarded-For") == std::string::npos);
    LOG_INFO << "Same host both paths PASS";
}

void testChunkedUpgradeBody() {
    uint16_t backendPort = 0;
    const int listenFd = listenOnLoopback(&backendPort);
    std::string seen;

    std::thread backend([&]() {
        int c = ::accept(listenFd, nullptr, nullptr);
        assert(c >= 0);
        seen = recvRequest(c, 4);
        sendAll(c, kSwitching);
        ::close(c);
    });

    withProxy("ws.example.com", backendPort, "ChunkedUpgradeTest", [&](uint16_t port) {
        int fd = connectTo(port);
        sendAll(fd,
                "GET /up HTTP/1.1\r\n"
                "Host: ws.example.com\r\n"
                "Upgrade: websocket\r\n"
                "Connection: Upgrade\r\n"
                "Transfer-Encoding: chunked\r\n"
                "\r\n"
                "4\r\ndata\r\n0\r\n\r\n");
        std::string resp = recvUntil(fd, "\r\n\r\n");
        assert(resp.find("HTTP/1.1 101 Switching Protocols\r\n") == 0);
        ::close(fd);
    });
    backend.join();
    ::close(listenFd);

    // the decoded body is replayed with a length, not as chunks
    const size_t end = seen.find("\r\n\r\n");
    assert(end != std::string::npos);
    const std::string head = seen.substr(0, end + 4);
    assert(head.find("Transfer-Encoding") == std::string::npos);
    assert(head.find("\r\nContent-Length: 4\r\n") != std::string::npos);
    assert(seen.substr(end + 4) == "data");
    LOG_INFO << "Chunked upgrade body PASS";
}

int main() {
    Logger::Instance().SetLevel(LogLevel::ERROR);
    testClientClosesFirst();
    testBackendClosesFirst();
    testSameHostTakesBothPaths();
    testChunkedUpgradeBody();
    return 0;
}
