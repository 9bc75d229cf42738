#pragma once

#include "edgelog/store/ConnectionRecord.h"
#include "edgelog/store/ConnectionStore.h"

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace edgelog {
namespace query {

struct ConnectionFilter {
    static const int kDefaultLimit = 100;
    static const int kMaxLimit = 1000;

    std::string clientIp; // exact
    std::string country;  // exact
    std::string host;     // substring
    std::string since;    // inclusive lower bound on timestamp
    int limit{kDefaultLimit};
    int offset{0};

    // <=0 or above kMaxLimit falls back to kDefaultLimit.
    static int NormalizeLimit(int limit);
};

struct IpStats {
    std::string clientIp;
    std::string country;
    std::int64_t hitCount{0};
    std::string firstSeen;
    std::string lastSeen;
};

struct HostHits {
    std::string host;
    std::int64_t hits{0};
};

struct Totals {
    std::int64_t totalConnections{0};
    std::int64_t uniqueIps{0};
};

struct PathHost {
    std::string path;
    std::string host;
};

struct ClientDetail {
    IpStats stats;
    std::vector<PathHost> recentPaths;
};

// Read-only queries over the connection store's reader handle.
class QueryService {
public:
    static const int kTopClientsLimit = 100;
    static const int kTopHostsLimit = 20;
    static const int kRecentPathsLimit = 20;

    explicit QueryService(const store::ConnectionStore& store) : store_(store) {}

    // Newest first (timestamp, then id).
    bool ListConnections(const ConnectionFilter& filter,
                         std::vector<store::ConnectionRecord>* out,
                         std::string* err) const;

    // Clients by hit count; since may be empty.
    bool TopClients(const std::string& since, std::vector<IpStats>* out, std::string* err) const;

    bool GetTotals(Totals* out, std::string* err) const;

    bool TopHosts(std::vector<HostHits>* out, std::string* err) const;

    // *out is nullopt when the ip was never recorded.
    bool GetClientDetail(const std::string& ip, std::optional<ClientDetail>* out, std::string* err) const;

private:
    const store::ConnectionStore& store_;
};

} // namespace query
} // namespace edgelog
