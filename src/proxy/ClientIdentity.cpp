#include "edgelog/proxy/ClientIdentity.h"
#include "edgelog/common/StringUtil.h"

namespace edgelog {
namespace proxy {

const char* const kUnknownCountry = "XX";

std::string StripPort(const std::string& hostport) {
    if (!hostport.empty() && hostport[0] == '[') {
        const size_t close = hostport.find(']');
        if (close != std::string::npos) return hostport.substr(1, close - 1);
        return hostport;
    }
    const size_t colon = hostport.find(':');
    // more than one colon: bare IPv6 address, no port
    if (colon == std::string::npos || hostport.find(':', colon + 1) != std::string::npos) return hostport;
    return hostport.substr(0, colon);
}

ClientIdentity ExtractClientIdentity(const protocol::HttpRequest& req, const std::string& peerAddr) {
    ClientIdentity id;
    id.ip = common::TrimCopy(req.getHeader("CF-Connecting-IP"));
    if (id.ip.empty()) {
        const std::string xff = req.getHeader("X-Forwarded-For");
        if (!xff.empty()) {
            id.ip = common::TrimCopy(xff.substr(0, xff.find(',')));
        }
    }
    if (id.ip.empty()) {
        id.ip = StripPort(peerAddr);
    }

    id.country = common::TrimCopy(req.getHeader("CF-IPCountry"));
    if (id.country.empty()) id.country = kUnknownCountry;
    return id;
}

store::ConnectionRecord MakeConnectionRecord(const protocol::HttpRequest& req, const ClientIdentity& id) {
    store::ConnectionRecord rec;
    rec.clientIp = id.ip;
    rec.country = id.country;
    rec.method = req.method();
    rec.path = req.path();
    rec.host = req.getHeader("Host");
    rec.userAgent = req.getHeader("User-Agent");
    rec.referer = req.getHeader("Referer");
    return rec;
}

} // namespace proxy
} // namespace edgelog
