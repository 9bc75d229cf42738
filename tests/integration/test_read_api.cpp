#include "edgelog/proxy/ProxyServer.h"
#include "edgelog/common/Logger.h"
#include "edgelog/network/EventLoop.h"
#include "edgelog/query/QueryService.h"
#include "edgelog/route/RouteTable.h"
#include "edgelog/store/ConnectionRecorder.h"

#include <arpa/inet.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>

#include <cassert>
#include <cstdlib>
#include <chrono>
#include <cstring>
#include <initializer_list>
#include <memory>
#include <string>
#include <thread>

using namespace edgelog::common;
using namespace edgelog::network;
using namespace edgelog::proxy;
using namespace edgelog::query;
using namespace edgelog::route;
using namespace edgelog::store;

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

void sendAll(int fd, const std::string& data) {
    size_t off = 0;
    while (off < data.size()) {
        ssize_t n = ::send(fd, data.data() + off, data.size() - off, MSG_NOSIGNAL);
        assert(n > 0);
        off += static_cast<size_t>(n);
    }
}

// Everything the peer sends before closing.
std::string recvAll(int fd, int timeoutMs = 3000) {
    std::string out;
    const auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(timeoutMs);
    for (;;) {
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

// One request per connection; the proxy closes after answering.
std::string roundTrip(uint16_t port, const std::string& method, const std::string& target,
                      const std::string& extraHeaders = "") {
    int fd = connectTo(port);
    sendAll(fd, method + " " + target + " HTTP/1.1\r\n"
                "Host: observatory.example.com\r\n" +
                extraHeaders +
                "Connection: close\r\n\r\n");
    std::string resp = recvAll(fd);
    ::close(fd);
    return resp;
}

std::string bodyOf(const std::string& resp) {
    const size_t pos = resp.find("\r\n\r\n");
    assert(pos != std::string::npos);
    return resp.substr(pos + 4);
}

std::string g_dir;

std::unique_ptr<ConnectionRecorder> openRecorder() {
    char tmpl[] = "/tmp/edgelog_readapi_XXXXXX";
    char* dir = ::mkdtemp(tmpl);
    assert(dir != nullptr);
    g_dir = dir;
    ConnectionRecorder::Options opts;
    opts.dbPath = g_dir + "/connections.db";
    opts.logPath = g_dir + "/connections.log";
    std::string err;
    auto recorder = ConnectionRecorder::Open(opts, &err);
    assert(recorder);
    return recorder;
}

void cleanup() {
    for (const char* f : {"/connections.db", "/connections.db-wal", "/connections.db-shm", "/connections.log"}) {
        ::unlink((g_dir + f).c_str());
    }
    ::rmdir(g_dir.c_str());
}

} // namespace

int main() {
    Logger::Instance().SetLevel(LogLevel::ERROR);

    auto recorder = openRecorder();
    QueryService queries(recorder->store());
    RouteTable routes;
    assert(routes.Add("app.example.com", "http://127.0.0.1:3000", false));

    ServerContext ctx;
    ctx.routes = &routes;
    ctx.recorder = recorder.get();
    ctx.queries = &queries;

    EventLoop loop;
    ProxyServer server(&loop, InetAddress(0, true), ctx, "ReadApiTest");
    server.SetThreadNum(2);
    server.Start();
    const uint16_t port = server.listenAddress().toPort();

    std::thread client([&]() {
        std::string resp = roundTrip(port, "GET", "/_proxy/health");
        assert(resp.find("HTTP/1.1 200 OK\r\n") == 0);
        assert(resp.find("Content-Type: application/json\r\n") != std::string::npos);
        assert(bodyOf(resp) == "{\"status\":\"ok\"}\n");

        // unrouted traffic is recorded before the local answer
        resp = roundTrip(port, "GET", "/visit",
                         "CF-Connecting-IP: 198.51.100.4\r\nCF-IPCountry: FR\r\nUser-Agent: scanner\r\n");
        assert(resp.find("HTTP/1.1 200 OK\r\n") == 0);
        resp = roundTrip(port, "GET", "/visit/2", "X-Forwarded-For: 198.51.100.4, 10.0.0.1\r\n");
        assert(resp.find("HTTP/1.1 200 OK\r\n") == 0);

        resp = roundTrip(port, "GET", "/_proxy/connections?ip=198.51.100.4&limit=10");
        assert(resp.find("HTTP/1.1 200 OK\r\n") == 0);
        std::string body = bodyOf(resp);
        assert(body.find("\"path\":\"/visit/2\"") < body.find("\"path\":\"/visit\""));
        assert(body.find("\"country\":\"FR\"") != std::string::npos);
        assert(body.find("\"country\":\"XX\"") != std::string::npos);
        assert(body.find("\"user_agent\":\"scanner\"") != std::string::npos);

        resp = roundTrip(port, "GET", "/_proxy/connections?country=JP");
        assert(bodyOf(resp) == "[]\n");

        // two visits plus three recorded API calls from 127.0.0.1, then this one
        resp = roundTrip(port, "GET", "/_proxy/stats");
        body = bodyOf(resp);
        assert(body.find("\"total_connections\":6") != std::string::npos);
        assert(body.find("\"unique_ips\":2") != std::string::npos);
        assert(body.find("\"observatory.example.com\":6") != std::string::npos);

        // health checks show up as connections of their own
        resp = roundTrip(port, "GET", "/_proxy/connections?ip=127.0.0.1");
        assert(bodyOf(resp).find("\"path\":\"/_proxy/health\"") != std::string::npos);

        resp = roundTrip(port, "GET", "/_proxy/stats/ip/198.51.100.4");
        assert(resp.find("HTTP/1.1 200 OK\r\n") == 0);
        body = bodyOf(resp);
        assert(body.find("\"hit_count\":2") != std::string::npos);
        assert(body.find("{\"path\":\"/visit\",\"host\":\"observatory.example.com\"}") != std::string::npos);

        resp = roundTrip(port, "GET", "/_proxy/stats/ip/192.0.2.99");
        assert(resp.find("HTTP/1.1 404 Not Found\r\n") == 0);
        assert(bodyOf(resp) == "IP not found\n");

        resp = roundTrip(port, "DELETE", "/_proxy/connections");
        assert(resp.find("HTTP/1.1 405 Method Not Allowed\r\n") == 0);

        resp = roundTrip(port, "GET", "/_proxy/config");
        assert(bodyOf(resp) == "{\"app.example.com\":\"http://127.0.0.1:3000\"}\n");

        // keep-alive: two API calls on one connection
        int fd = connectTo(port);
        sendAll(fd, "GET /_proxy/health HTTP/1.1\r\nHost: x\r\n\r\n"
                    "GET /_proxy/health HTTP/1.1\r\nHost: x\r\nConnection: close\r\n\r\n");
        resp = recvAll(fd);
        ::close(fd);
        const size_t first = resp.find("HTTP/1.1 200 OK");
        assert(first == 0);
        assert(resp.find("HTTP/1.1 200 OK", first + 1) != std::string::npos);

        loop.QueueInLoop([&loop]() { loop.Quit(); });
    });

    loop.Loop();
    client.join();

    recorder.reset();
    cleanup();
    LOG_INFO << "Read API PASS";
    return 0;
}
