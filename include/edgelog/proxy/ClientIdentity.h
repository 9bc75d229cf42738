#pragma once

#include "edgelog/protocol/HttpRequest.h"
#include "edgelog/store/ConnectionRecord.h"

#include <string>

namespace edgelog {
namespace proxy {

struct ClientIdentity {
    std::string ip;
    std::string country;
};

// Country used when the edge did not tag the request.
extern const char* const kUnknownCountry;

// Real client address behind the edge: CF-Connecting-IP, then the first
// X-Forwarded-For entry, then the socket peer (port stripped).
ClientIdentity ExtractClientIdentity(const protocol::HttpRequest& req, const std::string& peerAddr);

// Record for one observed request; timestamp left empty for the recorder to fill.
store::ConnectionRecord MakeConnectionRecord(const protocol::HttpRequest& req, const ClientIdentity& id);

// "1.2.3.4:80" -> "1.2.3.4", "[::1]:80" -> "::1"
std::string StripPort(const std::string& hostport);

} // namespace proxy
} // namespace edgelog
