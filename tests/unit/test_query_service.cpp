#include "edgelog/query/QueryService.h"
#include "edgelog/store/ConnectionRecorder.h"
#include "edgelog/common/Logger.h"

#include <unistd.h>

#include <cassert>
#include <cstdlib>
#include <initializer_list>
#include <memory>
#include <optional>
#include <string>
#include <vector>

using namespace edgelog::query;
using namespace edgelog::store;
using namespace edgelog::common;

namespace {

std::string g_dir;

std::unique_ptr<ConnectionRecorder> openRecorder() {
    char tmpl[] = "/tmp/edgelog_query_XXXXXX";
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

void add(ConnectionRecorder* recorder, const char* ts, const char* ip, const char* country,
         const char* path, const char* host) {
    ConnectionRecord rec;
    rec.timestamp = ts;
    rec.clientIp = ip;
    rec.country = country;
    rec.method = "GET";
    rec.path = path;
    rec.host = host;
    rec.userAgent = "test-agent";
    std::string err;
    assert(recorder->Record(rec, &err));
}

void seed(ConnectionRecorder* r) {
    add(r, "2024-01-01 10:00:00", "203.0.113.9", "DE", "/", "app.example.com");
    add(r, "2024-01-01 10:05:00", "203.0.113.9", "DE", "/login", "app.example.com");
    add(r, "2024-01-02 09:00:00", "198.51.100.1", "US", "/", "api.example.com");
    add(r, "2024-01-02 09:00:00", "203.0.113.9", "DE", "/", "app.example.com");
    add(r, "2024-01-03 12:00:00", "192.0.2.7", "XX", "/health", "status.example.org");
    add(r, "2024-01-03 12:30:00", "198.51.100.1", "US", "/v1/items", "api.example.com");
}

} // namespace

void testNormalizeLimit() {
    assert(ConnectionFilter::NormalizeLimit(0) == 100);
    assert(ConnectionFilter::NormalizeLimit(-5) == 100);
    assert(ConnectionFilter::NormalizeLimit(1) == 1);
    assert(ConnectionFilter::NormalizeLimit(1000) == 1000);
    assert(ConnectionFilter::NormalizeLimit(1001) == 100);
    LOG_INFO << "NormalizeLimit PASS";
}

void testListConnections(const QueryService& q) {
    std::vector<ConnectionRecord> rows;
    std::string err;

    ConnectionFilter all;
    assert(q.ListConnections(all, &rows, &err));
    assert(rows.size() == 6);
    // newest first; equal timestamps fall back to id
    assert(rows[0].timestamp == "2024-01-03 12:30:00");
    assert(rows[0].path == "/v1/items");
    assert(rows[2].timestamp == "2024-01-02 09:00:00");
    assert(rows[3].timestamp == "2024-01-02 09:00:00");
    assert(rows[2].id > rows[3].id);
    assert(rows[5].timestamp == "2024-01-01 10:00:00");
    assert(rows[0].userAgent == "test-agent");

    ConnectionFilter byIp;
    byIp.clientIp = "203.0.113.9";
    assert(q.ListConnections(byIp, &rows, &err));
    assert(rows.size() == 3);
    for (const auto& r : rows) assert(r.clientIp == "203.0.113.9");

    ConnectionFilter byCountry;
    byCountry.country = "US";
    assert(q.ListConnections(byCountry, &rows, &err));
    assert(rows.size() == 2);

    ConnectionFilter byHost;
    byHost.host = "example.com";
    assert(q.ListConnections(byHost, &rows, &err));
    assert(rows.size() == 5);
    byHost.host = "api.";
    assert(q.ListConnections(byHost, &rows, &err));
    assert(rows.size() == 2);

    ConnectionFilter since;
    since.since = "2024-01-02 09:00:00";
    assert(q.ListConnections(since, &rows, &err));
    assert(rows.size() == 4);

    ConnectionFilter combined;
    combined.clientIp = "198.51.100.1";
    combined.since = "2024-01-03";
    assert(q.ListConnections(combined, &rows, &err));
    assert(rows.size() == 1);
    assert(rows[0].path == "/v1/items");

    ConnectionFilter none;
    none.clientIp = "10.9.9.9";
    assert(q.ListConnections(none, &rows, &err));
    assert(rows.empty());
    LOG_INFO << "ListConnections PASS";
}

void testPaging(const QueryService& q) {
    std::vector<ConnectionRecord> rows;
    std::string err;

    ConnectionFilter page;
    page.limit = 2;
    assert(q.ListConnections(page, &rows, &err));
    assert(rows.size() == 2);
    const std::int64_t firstId = rows[0].id;

    page.offset = 2;
    assert(q.ListConnections(page, &rows, &err));
    assert(rows.size() == 2);
    assert(rows[0].id != firstId);

    page.offset = 5;
    assert(q.ListConnections(page, &rows, &err));
    assert(rows.size() == 1);

    page.offset = 50;
    assert(q.ListConnections(page, &rows, &err));
    assert(rows.empty());

    // out-of-range limit and negative offset are clamped, not rejected
    ConnectionFilter wild;
    wild.limit = 5000;
    wild.offset = -3;
    assert(q.ListConnections(wild, &rows, &err));
    assert(rows.size() == 6);
    LOG_INFO << "Paging PASS";
}

void testStats(const QueryService& q) {
    std::string err;
    Totals totals;
    assert(q.GetTotals(&totals, &err));
    assert(totals.totalConnections == 6);
    assert(totals.uniqueIps == 3);

    std::vector<IpStats> top;
    assert(q.TopClients("", &top, &err));
    assert(top.size() == 3);
    assert(top[0].clientIp == "203.0.113.9");
    assert(top[0].hitCount == 3);
    assert(top[0].country == "DE");
    assert(top[0].firstSeen == "2024-01-01 10:00:00");
    assert(top[0].lastSeen == "2024-01-02 09:00:00");
    assert(top[1].clientIp == "198.51.100.1");
    assert(top[1].hitCount == 2);
    assert(top[2].clientIp == "192.0.2.7");

    assert(q.TopClients("2024-01-02 00:00:00", &top, &err));
    assert(top.size() == 3);
    assert(top[0].clientIp == "198.51.100.1");
    assert(top[0].hitCount == 2);

    assert(q.TopClients("2030-01-01", &top, &err));
    assert(top.empty());

    std::vector<HostHits> hosts;
    assert(q.TopHosts(&hosts, &err));
    assert(hosts.size() == 3);
    assert(hosts[0].host == "app.example.com");
    assert(hosts[0].hits == 3);
    assert(hosts[1].host == "api.example.com");
    assert(hosts[1].hits == 2);
    LOG_INFO << "Stats PASS";
}

void testClientDetail(const QueryService& q) {
    std::string err;
    std::optional<ClientDetail> detail;
    assert(q.GetClientDetail("203.0.113.9", &detail, &err));
    assert(detail.has_value());
    assert(detail->stats.hitCount == 3);
    assert(detail->stats.country == "DE");
    // "/" on app.example.com was seen twice but is listed once, newest first
    assert(detail->recentPaths.size() == 2);
    assert(detail->recentPaths[0].path == "/");
    assert(detail->recentPaths[0].host == "app.example.com");
    assert(detail->recentPaths[1].path == "/login");

    assert(q.GetClientDetail("10.9.9.9", &detail, &err));
    assert(!detail.has_value());
    LOG_INFO << "ClientDetail PASS";
}

void testEmptyStore() {
    auto recorder = openRecorder();
    QueryService q(recorder->store());
    std::string err;
    Totals totals;
    assert(q.GetTotals(&totals, &err));
    assert(totals.totalConnections == 0);
    std::vector<IpStats> top;
    assert(q.TopClients("", &top, &err));
    assert(top.empty());
    std::vector<HostHits> hosts;
    assert(q.TopHosts(&hosts, &err));
    assert(hosts.empty());
    recorder.reset();
    cleanup();
    LOG_INFO << "Empty Store PASS";
}

int main() {
    Logger::Instance().SetLevel(LogLevel::ERROR);
    testNormalizeLimit();
    {
        auto recorder = openRecorder();
        seed(recorder.get());
        QueryService q(recorder->store());
        testListConnections(q);
        testPaging(q);
        testStats(q);
        testClientDetail(q);
        recorder.reset();
        cleanup();
    }
    testEmptyStore();
    return 0;
}
