#include "edgelog/common/Config.h"
#include "edgelog/common/Logger.h"
#include "edgelog/network/EventLoop.h"
#include "edgelog/network/InetAddress.h"
#include "edgelog/proxy/ProxyServer.h"
#include "edgelog/query/QueryService.h"
#include "edgelog/route/RouteTable.h"
#include "edgelog/store/ConnectionRecorder.h"

#include <getopt.h>
#include <signal.h>
#include <sys/stat.h>
#include <unistd.h>

#include <cerrno>
#include <cstdio>
#include <cstring>
#include <string>

namespace {

// mkdir -p
bool MakeDirs(const std::string& dir, std::string* err) {
    if (dir.empty()) return true;
    std::string partial;
    size_t pos = 0;
    while (pos != std::string::npos) {
        pos = dir.find('/', pos + 1);
        partial = dir.substr(0, pos);
        if (partial.empty()) continue;
        if (::mkdir(partial.c_str(), 0755) != 0 && errno != EEXIST) {
            if (err) *err = partial + ": " + std::strerror(errno);
            return false;
        }
    }
    return true;
}

} // namespace

int main(int argc, char* argv[]) {
    using namespace edgelog;

    std::string configFile = "config/edgelog.conf";
    bool checkOnly = false;
    int ch;
    while ((ch = getopt(argc, argv, "c:hC")) != -1) {
        switch (ch) {
            case 'c':
                configFile = optarg;
                break;
            case 'C':
                checkOnly = true;
                break;
            case 'h':
            default:
                printf("Usage: %s [-c config_file] [-C]\n", argv[0]);
                printf("  -C  check config and route file, then exit\n");
                return 0;
        }
    }

    auto& conf = common::Config::Instance();
    if (!conf.Load(configFile)) {
        LOG_WARN << "Failed to load config " << configFile << ", using defaults.";
    }
    conf.ApplyEnvOverride("DATA_DIR", "global", "data_dir");
    conf.ApplyEnvOverride("PORT", "global", "listen_port");
    conf.ApplyEnvOverride("PROXY_CONFIG", "proxy", "routes_file");

    common::Logger::Instance().SetLevel(common::Logger::Instance().ParseLevel(conf.GetString("global", "log_level", "INFO")));

    const std::string dataDir = conf.GetString("global", "data_dir", "/data");
    const int port = conf.GetInt("global", "listen_port", 8080);
    const int threads = conf.GetInt("global", "threads", 4);
    const std::string routesFile = conf.GetPath("proxy", "routes_file", dataDir, "proxy-config.json");
    const int hwmKb = conf.GetInt("proxy", "high_water_mark_kb", 8 * 1024);

    store::ConnectionRecorder::Options storeOpts;
    storeOpts.dbPath = conf.GetPath("store", "db_file", dataDir, "connections.db");
    storeOpts.logPath = conf.GetPath("store", "log_file", dataDir, "connections.log");
    storeOpts.busyTimeoutMs = conf.GetInt("store", "busy_timeout_ms", 5000);

    if (port <= 0 || port > 65535) {
        LOG_ERROR << "Invalid listen_port " << port;
        return 1;
    }

    route::RouteTable routes;
    std::string err;
    if (!route::RouteTable::LoadFromFile(routesFile, &routes, &err)) {
        LOG_WARN << "No routes loaded from " << routesFile << ": " << err
                 << " (serving API and dashboard only)";
    }
    for (const auto& kv : routes.ListAll()) {
        LOG_INFO << "Route: " << kv.first << " -> " << kv.second;
    }

    if (checkOnly) {
        printf("OK\n");
        return 0;
    }

    ::signal(SIGPIPE, SIG_IGN);

    if (!MakeDirs(dataDir, &err)) {
        LOG_ERROR << "Cannot create data directory " << err;
        return 1;
    }

    std::unique_ptr<store::ConnectionRecorder> recorder = store::ConnectionRecorder::Open(storeOpts, &err);
    if (!recorder) {
        LOG_ERROR << "Cannot open connection store: " << err;
        return 1;
    }
    query::QueryService queries(recorder->store());

    proxy::ServerContext ctx;
    ctx.routes = &routes;
    ctx.recorder = recorder.get();
    ctx.queries = &queries;
    ctx.apiPrefix = conf.GetString("api", "prefix", "/_proxy");
    ctx.dashboardFile = conf.GetString("dashboard", "file", "");
    if (hwmKb > 0) ctx.highWaterMarkBytes = static_cast<size_t>(hwmKb) * 1024;

    LOG_INFO << "edgelog starting: port=" << port << " threads=" << threads
             << " data_dir=" << dataDir << " db=" << storeOpts.dbPath
             << " log=" << storeOpts.logPath << " api=" << ctx.apiPrefix;

    network::EventLoop loop;
    network::InetAddress listenAddr(static_cast<uint16_t>(port));
    proxy::ProxyServer server(&loop, listenAddr, ctx, "edgelog");
    server.SetThreadNum(threads);
    server.Start();
    loop.Loop();
    return 0;
}
