#pragma once

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace edgelog {
namespace route {

// Parsed backend target of a route.
struct BackendUrl {
    std::string scheme;     // "http" or "https"
    std::string host;
    uint16_t port{0};
    std::string pathPrefix; // empty or starts with '/'
    std::string rawQuery;   // without '?'
    std::string original;

    bool tls() const { return scheme == "https"; }
    // host[:port], port omitted when it is the scheme default
    std::string authority() const;

    static bool Parse(const std::string& text, BackendUrl* out, std::string* err);
};

struct RouteEntry {
    std::string host; // lowercased, no port
    BackendUrl backend;
    bool noTlsVerify{false};
};

// Host-keyed backend registry. Filled once at startup, read-only afterwards,
// so lookups need no locking.
class RouteTable {
public:
    RouteTable() = default;

    // Adds one entry. A malformed backend URL or empty host skips the entry with
    // a warning and returns false. A repeated host replaces the earlier entry.
    bool Add(const std::string& host, const std::string& backend, bool noTlsVerify);

    std::optional<RouteEntry> Lookup(const std::string& host) const;

    // host -> backend text as configured
    std::map<std::string, std::string> ListAll() const;

    size_t size() const { return routes_.size(); }
    bool empty() const { return routes_.empty(); }

    // Lowercase, strip a ":port" suffix. "[::1]:8080" keeps its brackets.
    static std::string NormalizeHost(const std::string& host);

    // A JSON array of {"host", "backend", "no_tls_verify"} objects.
    // False when the file cannot be read or the document is not such an array;
    // individual bad entries are skipped.
    static bool LoadFromFile(const std::string& path, RouteTable* table, std::string* err);
    static bool LoadFromJson(const std::string& text, RouteTable* table, std::string* err);

private:
    std::map<std::string, RouteEntry> routes_;
};

} // namespace route
} // namespace edgelog
