#include "edgelog/ingest/LineParser.h"

#include <cctype>
#include <initializer_list>
#include <map>

namespace edgelog {
namespace ingest {

static bool IsKeyChar(char c) {
    return std::isalnum(static_cast<unsigned char>(c)) || c == '_' || c == '-' || c == '.';
}

static bool IsSpace(char c) {
    return std::isspace(static_cast<unsigned char>(c)) != 0;
}

// First value per key. Keys only start at the beginning of the line or after
// whitespace, so "xip=..." does not yield "ip".
static std::map<std::string, std::string> ExtractPairs(const std::string& line) {
    std::map<std::string, std::string> pairs;
    size_t i = 0;
    const size_t n = line.size();
    while (i < n) {
        if (i > 0 && !IsSpace(line[i - 1])) {
            ++i;
            continue;
        }
        size_t k = i;
        while (k < n && IsKeyChar(line[k])) ++k;
        if (k == i || k >= n || line[k] != '=') {
            ++i;
            continue;
        }
        const std::string key = line.substr(i, k - i);
        size_t v = k + 1;
        std::string value;
        if (v < n && (line[v] == '"' || line[v] == '\'')) {
            const char quote = line[v++];
            while (v < n && line[v] != quote) {
                if (line[v] == '\\' && v + 1 < n && quote == '"') ++v;
                value.push_back(line[v++]);
            }
            if (v < n) ++v; // closing quote
        } else {
            while (v < n && !IsSpace(line[v])) value.push_back(line[v++]);
        }
        pairs.emplace(key, value);
        i = v;
    }
    return pairs;
}

static std::string Pick(const std::map<std::string, std::string>& pairs,
                        std::initializer_list<const char*> keys) {
    for (const char* k : keys) {
        auto it = pairs.find(k);
        if (it != pairs.end() && !it->second.empty()) return it->second;
    }
    return std::string();
}

static bool IsAbsoluteUrl(const std::string& s) {
    return s.rfind("http://", 0) == 0 || s.rfind("https://", 0) == 0;
}

bool KeyValueLineParser::Parse(const std::string& line, ParsedLine* out) const {
    const auto pairs = ExtractPairs(line);
    if (pairs.empty()) return false;

    ParsedLine p;
    p.time = Pick(pairs, {"time"});
    p.message = Pick(pairs, {"msg"});
    if (p.message.empty()) p.message = line;
    p.clientIp = Pick(pairs, {"ip", "clientIP", "client_ip"});
    p.hostname = Pick(pairs, {"host", "hostname"});
    p.method = Pick(pairs, {"method"});
    p.path = Pick(pairs, {"path", "uri"});
    const std::string url = Pick(pairs, {"url"});
    if (IsAbsoluteUrl(url)) {
        p.originUrl = url;
    } else if (p.path.empty()) {
        p.path = url;
    }
    p.rayId = Pick(pairs, {"cfRay", "traceId"});
    *out = std::move(p);
    return true;
}

} // namespace ingest
} // namespace edgelog
