#include "edgelog/proxy/ApiHandler.h"
#include "edgelog/common/Json.h"
#include "edgelog/common/Logger.h"
#include "edgelog/common/StringUtil.h"
#include "edgelog/proxy/ClientIdentity.h"

#include <cstdlib>
#include <cstring>
#include <sstream>

namespace edgelog {
namespace proxy {

using common::JsonQuote;
using protocol::HttpResponse;

static const char* kConnections = "/connections";
static const char* kStats = "/stats";
static const char* kClientDetail = "/stats/ip/";
static const char* kClientDetailBare = "/stats/ip";
static const char* kHealth = "/health";
static const char* kConfig = "/config";

static void JsonReply(HttpResponse* resp, const std::string& body) {
    resp->setStatusCode(HttpResponse::k200Ok);
    resp->setContentType("application/json");
    resp->setBody(body + "\n");
}

static void TextError(HttpResponse* resp, HttpResponse::HttpStatusCode code, const std::string& msg) {
    resp->setStatusCode(code);
    resp->setContentType("text/plain; charset=utf-8");
    resp->setBody(msg + "\n");
}

// Non-numeric text reads as 0, like an absent value.
static int ParseIntParam(const std::string& text) {
    if (text.empty()) return 0;
    char* end = nullptr;
    const long v = std::strtol(text.c_str(), &end, 10);
    if (end == text.c_str() || *end != '\0') return 0;
    if (v > 1000000000L) return 1000000000;
    if (v < -1000000000L) return -1000000000;
    return static_cast<int>(v);
}

std::string ApiHandler::RecordsToJson(const std::vector<store::ConnectionRecord>& records) {
    std::ostringstream oss;
    oss << "[";
    for (size_t i = 0; i < records.size(); ++i) {
        const auto& r = records[i];
        if (i) oss << ",";
        oss << "{\"id\":" << r.id
            << ",\"timestamp\":" << JsonQuote(r.timestamp)
            << ",\"client_ip\":" << JsonQuote(r.clientIp)
            << ",\"country\":" << JsonQuote(r.country)
            << ",\"method\":" << JsonQuote(r.method)
            << ",\"path\":" << JsonQuote(r.path)
            << ",\"host\":" << JsonQuote(r.host)
            << ",\"user_agent\":" << JsonQuote(r.userAgent)
            << ",\"referer\":" << JsonQuote(r.referer) << "}";
    }
    oss << "]";
    return oss.str();
}

std::string ApiHandler::IpStatsToJson(const query::IpStats& s) {
    std::ostringstream oss;
    oss << "{\"client_ip\":" << JsonQuote(s.clientIp)
        << ",\"country\":" << JsonQuote(s.country)
        << ",\"hit_count\":" << s.hitCount
        << ",\"first_seen\":" << JsonQuote(s.firstSeen)
        << ",\"last_seen\":" << JsonQuote(s.lastSeen) << "}";
    return oss.str();
}

bool ApiHandler::Matches(const std::string& path) const {
    const std::string& prefix = ctx_->apiPrefix;
    if (prefix.empty() || path.compare(0, prefix.size(), prefix) != 0) return false;
    const std::string rest = path.substr(prefix.size());
    return rest == kConnections || rest == kStats || rest == kHealth || rest == kConfig ||
           rest == kClientDetailBare || rest.compare(0, std::strlen(kClientDetail), kClientDetail) == 0;
}

void ApiHandler::RecordCall(const protocol::HttpRequest& req, const std::string& peerAddr) const {
    if (!ctx_->recorder) return;
    store::ConnectionRecord rec = MakeConnectionRecord(req, ExtractClientIdentity(req, peerAddr));
    std::string err;
    if (!ctx_->recorder->Record(rec, &err)) {
        LOG_ERROR << "api: record failed: " << err;
    }
}

void ApiHandler::Handle(const protocol::HttpRequest& req, const std::string& peerAddr, HttpResponse* resp) const {
    const std::string rest = req.path().substr(ctx_->apiPrefix.size());

    // every API call is a connection too, rejected ones included
    RecordCall(req, peerAddr);
    if (rest == kHealth) {
        JsonReply(resp, "{\"status\":\"ok\"}");
        return;
    }
    if (rest == kConfig) {
        HandleConfig(resp);
        return;
    }
    if (req.method() != "GET") {
        TextError(resp, HttpResponse::k405MethodNotAllowed, "Method not allowed");
        return;
    }
    if (!ctx_->queries) {
        TextError(resp, HttpResponse::k500InternalServerError, "store unavailable");
        return;
    }
    if (rest == kConnections) {
        HandleConnections(req, resp);
    } else if (rest == kStats) {
        HandleStats(req, resp);
    } else {
        const std::string ip = rest == kClientDetailBare
                                   ? std::string()
                                   : common::UrlDecode(rest.substr(std::strlen(kClientDetail)), false);
        HandleClientDetail(req, ip, resp);
    }
}

void ApiHandler::HandleConnections(const protocol::HttpRequest& req, HttpResponse* resp) const {
    const std::string& q = req.query();
    query::ConnectionFilter filter;
    filter.limit = ParseIntParam(common::ExtractQueryParam(q, "limit"));
    filter.offset = ParseIntParam(common::ExtractQueryParam(q, "offset"));
    filter.clientIp = common::ExtractQueryParam(q, "ip");
    filter.country = common::ExtractQueryParam(q, "country");
    filter.host = common::ExtractQueryParam(q, "host");
    filter.since = common::ExtractQueryParam(q, "since");

    std::vector<store::ConnectionRecord> records;
    std::string err;
    if (!ctx_->queries->ListConnections(filter, &records, &err)) {
        LOG_ERROR << "api: connections query failed: " << err;
        TextError(resp, HttpResponse::k500InternalServerError, err);
        return;
    }
    JsonReply(resp, RecordsToJson(records));
}

void ApiHandler::HandleStats(const protocol::HttpRequest& req, HttpResponse* resp) const {
    const std::string since = common::ExtractQueryParam(req.query(), "since");

    std::vector<query::IpStats> clients;
    query::Totals totals;
    std::vector<query::HostHits> hosts;
    std::string err;
    if (!ctx_->queries->TopClients(since, &clients, &err) ||
        !ctx_->queries->GetTotals(&totals, &err) ||
        !ctx_->queries->TopHosts(&hosts, &err)) {
        LOG_ERROR << "api: stats query failed: " << err;
        TextError(resp, HttpResponse::k500InternalServerError, err);
        return;
    }

    std::ostringstream oss;
    oss << "{\"total_connections\":" << totals.totalConnections
        << ",\"unique_ips\":" << totals.uniqueIps
        << ",\"top_ips\":[";
    for (size_t i = 0; i < clients.size(); ++i) {
        if (i) oss << ",";
        oss << IpStatsToJson(clients[i]);
    }
    oss << "],\"top_hosts\":{";
    for (size_t i = 0; i < hosts.size(); ++i) {
        if (i) oss << ",";
        oss << JsonQuote(hosts[i].host) << ":" << hosts[i].hits;
    }
    oss << "}}";
    JsonReply(resp, oss.str());
}

void ApiHandler::HandleClientDetail(const protocol::HttpRequest&, const std::string& ip, HttpResponse* resp) const {
    if (ip.empty()) {
        TextError(resp, HttpResponse::k400BadRequest, "IP required");
        return;
    }
    std::optional<query::ClientDetail> detail;
    std::string err;
    if (!ctx_->queries->GetClientDetail(ip, &detail, &err)) {
        LOG_ERROR << "api: client detail query failed: " << err;
        TextError(resp, HttpResponse::k500InternalServerError, err);
        return;
    }
    if (!detail) {
        TextError(resp, HttpResponse::k404NotFound, "IP not found");
        return;
    }

    std::ostringstream oss;
    oss << "{\"stats\":" << IpStatsToJson(detail->stats) << ",\"recent_paths\":[";
    for (size_t i = 0; i < detail->recentPaths.size(); ++i) {
        const auto& ph = detail->recentPaths[i];
        if (i) oss << ",";
        oss << "{\"path\":" << JsonQuote(ph.path) << ",\"host\":" << JsonQuote(ph.host) << "}";
    }
    oss << "]}";
    JsonReply(resp, oss.str());
}

void ApiHandler::HandleConfig(HttpResponse* resp) const {
    std::ostringstream oss;
    oss << "{";
    if (ctx_->routes) {
        bool first = true;
        for (const auto& kv : ctx_->routes->ListAll()) {
            if (!first) oss << ",";
            first = false;
            oss << JsonQuote(kv.first) << ":" << JsonQuote(kv.second);
        }
    }
    oss << "}";
    JsonReply(resp, oss.str());
}

} // namespace proxy
} // namespace edgelog
