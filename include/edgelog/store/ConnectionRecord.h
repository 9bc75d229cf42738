#pragma once

#include <cstdint>
#include <string>

namespace edgelog {
namespace store {

// One observed client request, from the proxy or from an ingested log line.
struct ConnectionRecord {
    std::int64_t id{0};      // assigned on insert
    std::string timestamp;   // "YYYY-MM-DD HH:MM:SS", local time
    std::string clientIp;
    std::string country;
    std::string method;
    std::string path;
    std::string host;
    std::string userAgent;
    std::string referer;
};

} // namespace store
} // namespace edgelog
