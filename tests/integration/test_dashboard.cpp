#include "edgelog/proxy/ProxyServer.h"
#include "edgelog/common/Logger.h"
#include "edgelog/network/EventLoop.h"

#include <arpa/inet.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>

#include <cassert>
#include <chrono>
#include <cstdlib>
#include <cstring>
#include <fstream>
#include <initializer_list>
#include <string>
#include <thread>

using namespace edgelog::common;
using namespace edgelog::network;
using namespace edgelog::proxy;
using edgelog::protocol::HttpRequest;
using edgelog::protocol::HttpResponse;

namespace {

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

std::string recvAll(int fd, int timeoutMs = 3000) {
    std::string out;
    const auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(timeoutMs);
    for (;;) {
        const auto left = std::chrono::duration_cast<std::chrono::milliseconds>(
            deadline - std::chrono::steady_clock::now()).count();
        if (left <= 0) break;
        pollfd pfd{fd, POLLIN, 0};
        if (::poll(&pfd, 1, static_cast<int>(left)) != 1) break;
        char buf[8192];
        ssize_t n = ::recv(fd, buf, sizeof(buf), 0);
        if (n <= 0) break;
        out.append(buf, static_cast<size_t>(n));
    }
    return out;
}

std::string get(uint16_t port, const std::string& host, const std::string& path, const std::string& extra = "") {
    int fd = connectTo(port);
    const std::string req = "GET " + path + " HTTP/1.1\r\nHost: " + host + "\r\n" + extra +
                            "Connection: close\r\n\r\n";
    assert(::send(fd, req.data(), req.size(), MSG_NOSIGNAL) == static_cast<ssize_t>(req.size()));
    std::string resp = recvAll(fd);
    ::close(fd);
    return resp;
}

std::string bodyOf(const std::string& resp) {
    const size_t pos = resp.find("\r\n\r\n");
    assert(pos != std::string::npos);
    return resp.substr(pos + 4);
}

// Runs `body` against a proxy with no routes, stopping the loop afterwards.
template <typename Fn>
void withProxy(ServerContext ctx, Fn body, ProxyServer::DashboardHandler handler = nullptr) {
    EventLoop loop;
    ProxyServer server(&loop, InetAddress(0, true), ctx, "DashboardTest");
    if (handler) server.SetDashboardHandler(handler);
    server.Start();
    const uint16_t port = server.listenAddress().toPort();
    std::thread client([&]() {
        body(port);
        loop.QueueInLoop([&loop]() { loop.Quit(); });
    });
    loop.Loop();
    client.join();
}

} // namespace

void testBuiltinPage() {
    ServerContext ctx;
    withProxy(ctx, [](uint16_t port) {
        for (const char* path : {"/", "/dashboard"}) {
            std::string resp = get(port, "unrouted.example.com", path);
            assert(resp.find("HTTP/1.1 200 OK\r\n") == 0);
            assert(resp.find("Content-Type: text/html; charset=utf-8\r\n") != std::string::npos);
            const std::string body = bodyOf(resp);
            assert(body.find("<title>edgelog</title>") != std::string::npos);
            assert(body.find("/_proxy/connections") != std::string::npos);
        }
    });
    LOG_INFO << "Built-in dashboard PASS";
}

void testDashboardFile() {
    char path[] = "/tmp/edgelog_dashboard_XXXXXX";
    int fd = ::mkstemp(path);
    assert(fd >= 0);
    ::close(fd);
    {
        std::ofstream out(path);
        out << "<html><body>custom dashboard</body></html>\n";
    }

    ServerContext ctx;
    ctx.dashboardFile = path;
    withProxy(ctx, [](uint16_t port) {
        std::string resp = get(port, "localhost:8080", "/");
        assert(bodyOf(resp) == "<html><body>custom dashboard</body></html>\n");
    });

    // a missing file falls back to the built-in page
    ::unlink(path);
    withProxy(ctx, [](uint16_t port) {
        std::string resp = get(port, "localhost:8080", "/dashboard");
        assert(resp.find("HTTP/1.1 200 OK\r\n") == 0);
        assert(bodyOf(resp).find("<title>edgelog</title>") != std::string::npos);
    });
    LOG_INFO << "Dashboard file PASS";
}

void testCustomHandler() {
    ServerContext ctx;
    withProxy(ctx, [](uint16_t port) {
        std::string resp = get(port, "unrouted.example.com", "/");
        assert(bodyOf(resp) == "custom\n");
    }, [](const HttpRequest&, HttpResponse* resp) {
        resp->setStatusCode(HttpResponse::k200Ok);
        resp->setContentType("text/plain");
        resp->setBody("custom\n");
    });
    LOG_INFO << "Custom dashboard handler PASS";
}

void testWhoami() {
    ServerContext ctx;
    withProxy(ctx, [](uint16_t port) {
        std::string resp = get(port, "unknown.example", "/some/page?x=1",
                               "CF-Connecting-IP: 198.51.100.4\r\nCF-IPCountry: FR\r\n");
        assert(resp.find("HTTP/1.1 200 OK\r\n") == 0);
        assert(resp.find("Content-Type: text/plain; charset=utf-8\r\n") != std::string::npos);
        assert(bodyOf(resp) ==
               "Your IP: 198.51.100.4\n"
               "Country: FR\n"
               "Host: unknown.example\n"
               "Path: /some/page\n");

        // socket peer and unknown country when the edge headers are absent
        resp = get(port, "unknown.example", "/x");
        assert(bodyOf(resp) ==
               "Your IP: 127.0.0.1\n"
               "Country: XX\n"
               "Host: unknown.example\n"
               "Path: /x\n");
    });
    LOG_INFO << "Whoami PASS";
}

int main() {
    Logger::Instance().SetLevel(LogLevel::ERROR);
    testBuiltinPage();
    testDashboardFile();
    testCustomHandler();
    testWhoami();
    return 0;
}
