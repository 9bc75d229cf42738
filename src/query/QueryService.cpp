#include "edgelog/query/QueryService.h"
#include "edgelog/store/Statement.h"

namespace edgelog {
namespace query {

using store::Statement;

const int ConnectionFilter::kDefaultLimit;
const int ConnectionFilter::kMaxLimit;
const int QueryService::kTopClientsLimit;
const int QueryService::kTopHostsLimit;
const int QueryService::kRecentPathsLimit;

int ConnectionFilter::NormalizeLimit(int limit) {
    if (limit <= 0 || limit > kMaxLimit) return kDefaultLimit;
    return limit;
}

static bool Fail(const Statement& stmt, std::string* err) {
    if (err) *err = stmt.error().empty() ? "query failed" : stmt.error();
    return false;
}

bool QueryService::ListConnections(const ConnectionFilter& filter,
                                   std::vector<store::ConnectionRecord>* out,
                                   std::string* err) const {
    std::string sql =
        "SELECT id, timestamp, client_ip, country, method, path, host, user_agent, referer"
        " FROM connections WHERE 1=1";
    std::vector<std::string> args;
    if (!filter.clientIp.empty()) {
        sql += " AND client_ip = ?";
        args.push_back(filter.clientIp);
    }
    if (!filter.country.empty()) {
        sql += " AND country = ?";
        args.push_back(filter.country);
    }
    if (!filter.host.empty()) {
        sql += " AND host LIKE ?";
        args.push_back("%" + filter.host + "%");
    }
    if (!filter.since.empty()) {
        sql += " AND timestamp >= ?";
        args.push_back(filter.since);
    }
    sql += " ORDER BY timestamp DESC, id DESC LIMIT ? OFFSET ?";

    Statement stmt(store_.reader(), sql);
    if (!stmt.ok()) return Fail(stmt, err);
    int idx = 1;
    for (const auto& a : args) {
        if (!stmt.Bind(idx++, a)) return Fail(stmt, err);
    }
    const int limit = ConnectionFilter::NormalizeLimit(filter.limit);
    const int offset = filter.offset < 0 ? 0 : filter.offset;
    if (!stmt.Bind(idx++, static_cast<std::int64_t>(limit)) ||
        !stmt.Bind(idx++, static_cast<std::int64_t>(offset))) {
        return Fail(stmt, err);
    }

    out->clear();
    while (true) {
        const auto rc = stmt.Step();
        if (rc == Statement::kDone) break;
        if (rc == Statement::kError) return Fail(stmt, err);
        store::ConnectionRecord r;
        r.id = stmt.ColumnInt64(0);
        r.timestamp = stmt.ColumnText(1);
        r.clientIp = stmt.ColumnText(2);
        r.country = stmt.ColumnText(3);
        r.method = stmt.ColumnText(4);
        r.path = stmt.ColumnText(5);
        r.host = stmt.ColumnText(6);
        r.userAgent = stmt.ColumnText(7);
        r.referer = stmt.ColumnText(8);
        out->push_back(std::move(r));
    }
    return true;
}

static IpStats ReadIpStats(const Statement& stmt) {
    IpStats s;
    s.clientIp = stmt.ColumnText(0);
    s.country = stmt.ColumnText(1);
    s.hitCount = stmt.ColumnInt64(2);
    s.firstSeen = stmt.ColumnText(3);
    s.lastSeen = stmt.ColumnText(4);
    return s;
}

bool QueryService::TopClients(const std::string& since, std::vector<IpStats>* out, std::string* err) const {
    std::string sql =
        "SELECT client_ip, country, COUNT(*) AS hit_count, MIN(timestamp) AS first_seen, MAX(timestamp) AS last_seen"
        " FROM connections";
    if (!since.empty()) sql += " WHERE timestamp >= ?";
    sql += " GROUP BY client_ip ORDER BY hit_count DESC, client_ip LIMIT " + std::to_string(kTopClientsLimit);

    Statement stmt(store_.reader(), sql);
    if (!stmt.ok()) return Fail(stmt, err);
    if (!since.empty() && !stmt.Bind(1, since)) return Fail(stmt, err);

    out->clear();
    while (true) {
        const auto rc = stmt.Step();
        if (rc == Statement::kDone) break;
        if (rc == Statement::kError) return Fail(stmt, err);
        out->push_back(ReadIpStats(stmt));
    }
    return true;
}

bool QueryService::GetTotals(Totals* out, std::string* err) const {
    Statement stmt(store_.reader(), "SELECT COUNT(*), COUNT(DISTINCT client_ip) FROM connections");
    if (!stmt.ok()) return Fail(stmt, err);
    if (stmt.Step() != Statement::kRow) return Fail(stmt, err);
    out->totalConnections = stmt.ColumnInt64(0);
    out->uniqueIps = stmt.ColumnInt64(1);
    return true;
}

bool QueryService::TopHosts(std::vector<HostHits>* out, std::string* err) const {
    Statement stmt(store_.reader(),
                   "SELECT host, COUNT(*) AS hits FROM connections GROUP BY host ORDER BY hits DESC, host LIMIT " +
                       std::to_string(kTopHostsLimit));
    if (!stmt.ok()) return Fail(stmt, err);

    out->clear();
    while (true) {
        const auto rc = stmt.Step();
        if (rc == Statement::kDone) break;
        if (rc == Statement::kError) return Fail(stmt, err);
        HostHits h;
        h.host = stmt.ColumnText(0);
        h.hits = stmt.ColumnInt64(1);
        out->push_back(std::move(h));
    }
    return true;
}

bool QueryService::GetClientDetail(const std::string& ip, std::optional<ClientDetail>* out, std::string* err) const {
    out->reset();
    Statement stats(store_.reader(),
                    "SELECT client_ip, country, COUNT(*) AS hit_count, MIN(timestamp), MAX(timestamp)"
                    " FROM connections WHERE client_ip = ? GROUP BY client_ip");
    if (!stats.ok() || !stats.Bind(1, ip)) return Fail(stats, err);
    const auto rc = stats.Step();
    if (rc == Statement::kError) return Fail(stats, err);
    if (rc == Statement::kDone) return true;

    ClientDetail detail;
    detail.stats = ReadIpStats(stats);

    // Distinct (path, host) pairs, most recently seen first.
    Statement paths(store_.reader(),
                    "SELECT path, host FROM connections WHERE client_ip = ?"
                    " GROUP BY path, host ORDER BY MAX(timestamp) DESC, MAX(id) DESC LIMIT " +
                        std::to_string(kRecentPathsLimit));
    if (!paths.ok() || !paths.Bind(1, ip)) return Fail(paths, err);
    while (true) {
        const auto prc = paths.Step();
        if (prc == Statement::kDone) break;
        if (prc == Statement::kError) return Fail(paths, err);
        PathHost ph;
        ph.path = paths.ColumnText(0);
        ph.host = paths.ColumnText(1);
        detail.recentPaths.push_back(std::move(ph));
    }
    *out = std::move(detail);
    return true;
}

} // namespace query
} // namespace edgelog
