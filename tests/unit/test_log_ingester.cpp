#include "edgelog/ingest/LogIngester.h"
#include "edgelog/query/QueryService.h"
#include "edgelog/store/ConnectionRecorder.h"
#include "edgelog/common/Logger.h"

#include <unistd.h>

#include <cassert>
#include <cstdlib>
#include <ctime>
#include <initializer_list>
#include <sstream>
#include <string>
#include <vector>

using namespace edgelog::ingest;
using namespace edgelog::store;
using namespace edgelog::common;

void testSampleJsonLine() {
    LogIngester ingester(nullptr, false);
    ConnectionRecord rec;
    auto o = ingester.Classify("{\"time\":\"2024-01-01T00:00:00Z\",\"clientIP\":\"1.2.3.4\",\"hostname\":\"svc.local\"}", &rec);
    assert(o == LogIngester::kRecorded);
    assert(rec.host == "svc.local");
    assert(rec.clientIp == "1.2.3.4");
    assert(rec.method == "GET");
    assert(rec.timestamp == "2024-01-01 00:00:00");
    assert(rec.country.empty());
    LOG_INFO << "Sample JSON Line PASS";
}

void testJsonAndKeyValueEquivalent() {
    LogIngester ingester(nullptr, false);
    ConnectionRecord fromJson;
    ConnectionRecord fromKv;
    assert(ingester.Classify(
               "{\"time\":\"2024-03-05T08:00:00+01:00\",\"msg\":\"Request\",\"clientIP\":\"203.0.113.7\","
               "\"hostname\":\"svc.example.com\",\"path\":\"/widgets\",\"method\":\"POST\"}",
               &fromJson) == LogIngester::kRecorded);
    assert(ingester.Classify(
               "time=2024-03-05T08:00:00+01:00 msg=Request ip=203.0.113.7 host=svc.example.com "
               "path=/widgets method=POST",
               &fromKv) == LogIngester::kRecorded);
    assert(fromJson.timestamp == fromKv.timestamp);
    assert(fromJson.timestamp == "2024-03-05 07:00:00");
    assert(fromJson.clientIp == fromKv.clientIp);
    assert(fromJson.host == fromKv.host);
    assert(fromJson.path == fromKv.path);
    assert(fromJson.method == fromKv.method);
    assert(fromJson.country == fromKv.country);
    LOG_INFO << "JSON/Key=Value Equivalence PASS";
}

void testOriginUrlDerivation() {
    LogIngester ingester(nullptr, false);
    ConnectionRecord rec;
    assert(ingester.Classify("{\"originURL\":\"https://origin.example.com:8443/api/v1?x=1\"}", &rec) ==
           LogIngester::kRecorded);
    assert(rec.host == "origin.example.com");
    assert(rec.path == "/api/v1");
    assert(rec.clientIp.empty());
    assert(rec.timestamp.size() == 19);

    assert(ingester.Classify("ip=192.0.2.1 url=http://kv.example.com", &rec) == LogIngester::kRecorded);
    assert(rec.host == "kv.example.com");
    assert(rec.path == "/");

    // explicit hostname and path win over the origin
    assert(ingester.Classify(
               "{\"clientIP\":\"192.0.2.2\",\"hostname\":\"h.example.com\",\"path\":\"/p\","
               "\"originURL\":\"http://o.example.com/q\"}",
               &rec) == LogIngester::kRecorded);
    assert(rec.host == "h.example.com");
    assert(rec.path == "/p");

    assert(LogIngester::HostFromUrl("http://a.b:80/x") == "a.b");
    assert(LogIngester::HostFromUrl("a.b") == "a.b");
    assert(LogIngester::PathFromUrl("https://a.b/x/y#frag") == "/x/y");
    assert(LogIngester::PathFromUrl("https://a.b?q") == "/");
    LOG_INFO << "Origin URL Derivation PASS";
}

void testSkips() {
    LogIngester ingester(nullptr, false);
    ConnectionRecord rec;
    assert(ingester.Classify("", &rec) == LogIngester::kEmpty);
    assert(ingester.Classify("   \t", &rec) == LogIngester::kEmpty);
    assert(ingester.Classify("2024-01-01 starting tunnel daemon", &rec) == LogIngester::kNoMatch);
    assert(ingester.Classify("{\"level\":\"info\",\"message\":\"Starting metrics server\"}", &rec) ==
           LogIngester::kNonActionable);
    assert(ingester.Classify("level=debug msg=heartbeat", &rec) == LogIngester::kNonActionable);

    assert(ingester.Classify(
               "{\"message\":\"Registered tunnel connection\",\"ip\":\"198.41.200.13\",\"connIndex\":0}", &rec) ==
           LogIngester::kDenylisted);
    assert(ingester.Classify("msg=\"Initial protocol quic\" ip=198.41.200.13", &rec) == LogIngester::kDenylisted);
    // without msg= the whole line is the message
    assert(ingester.Classify("Connection established ip=198.41.200.13", &rec) == LogIngester::kDenylisted);

    assert(LogIngester::IsDenylisted("INF Registered tunnel connection connIndex=0"));
    assert(!LogIngester::IsDenylisted("Request served"));
    LOG_INFO << "Skips PASS";
}

void testUnparseableTimeFallsBackToNow() {
    LogIngester ingester(nullptr, false);
    ConnectionRecord rec;
    assert(ingester.Classify("time=yesterday ip=192.0.2.9", &rec) == LogIngester::kRecorded);
    assert(rec.timestamp.size() == 19);
    assert(rec.timestamp != "yesterday");
    LOG_INFO << "Time Fallback PASS";
}

void testRunCountsAndRecords() {
    char tmpl[] = "/tmp/edgelog_ingest_XXXXXX";
    char* dirp = ::mkdtemp(tmpl);
    assert(dirp != nullptr);
    const std::string dir = dirp;

    ConnectionRecorder::Options opts;
    opts.dbPath = dir + "/connections.db";
    opts.logPath = dir + "/connections.log";
    std::string err;
    auto recorder = ConnectionRecorder::Open(opts, &err);
    assert(recorder);

    std::istringstream in(
        "{\"time\":\"2024-01-01T00:00:00Z\",\"clientIP\":\"1.2.3.4\",\"hostname\":\"svc.local\"}\r\n"
        "\n"
        "{\"message\":\"Registered tunnel connection\",\"ip\":\"198.41.200.13\"}\n"
        "random noise\n"
        "level=info msg=ready\n"
        "ip=5.6.7.8 host=svc.local path=/kv method=PUT\n");

    LogIngester ingester(recorder.get(), true);
    const LogIngester::Summary& s = ingester.Run(in);
    assert(s.lines == 6);
    assert(s.count(LogIngester::kRecorded) == 2);
    assert(s.count(LogIngester::kEmpty) == 1);
    assert(s.count(LogIngester::kDenylisted) == 1);
    assert(s.count(LogIngester::kNoMatch) == 1);
    assert(s.count(LogIngester::kNonActionable) == 1);
    assert(s.count(LogIngester::kStoreError) == 0);
    assert(&ingester.summary() == &s);

    edgelog::query::QueryService q(recorder->store());
    edgelog::query::ConnectionFilter filter;
    std::vector<ConnectionRecord> rows;
    assert(q.ListConnections(filter, &rows, &err));
    assert(rows.size() == 2);
    filter.clientIp = "5.6.7.8";
    assert(q.ListConnections(filter, &rows, &err));
    assert(rows.size() == 1);
    assert(rows[0].method == "PUT");
    assert(rows[0].path == "/kv");
    assert(rows[0].country.empty());

    recorder.reset();
    for (const char* f : {"/connections.db", "/connections.db-wal", "/connections.db-shm", "/connections.log"}) {
        ::unlink((dir + f).c_str());
    }
    ::rmdir(dir.c_str());
    LOG_INFO << "Run PASS";
}

void testNoRecorderIsStoreError() {
    LogIngester ingester(nullptr, false);
    assert(ingester.ProcessLine("ip=1.1.1.1") == LogIngester::kStoreError);
    assert(ingester.summary().count(LogIngester::kStoreError) == 1);
    LOG_INFO << "No Recorder PASS";
}

int main() {
    ::setenv("TZ", "UTC", 1);
    ::tzset();
    Logger::Instance().SetLevel(LogLevel::ERROR);
    testSampleJsonLine();
    testJsonAndKeyValueEquivalent();
    testOriginUrlDerivation();
    testSkips();
    testUnparseableTimeFallsBackToNow();
    testRunCountsAndRecords();
    testNoRecorderIsStoreError();
    return 0;
}
