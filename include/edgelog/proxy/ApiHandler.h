#pragma once

#include "edgelog/protocol/HttpRequest.h"
#include "edgelog/protocol/HttpResponse.h"
#include "edgelog/proxy/ServerContext.h"
#include "edgelog/query/QueryService.h"
#include "edgelog/store/ConnectionRecord.h"

#include <string>
#include <vector>

namespace edgelog {
namespace proxy {

// JSON read API mounted under ServerContext::apiPrefix:
//   GET <prefix>/connections?limit&offset&ip&country&host&since
//   GET <prefix>/stats?since
//   GET <prefix>/stats/ip/{ip}
//   GET <prefix>/health
//   GET <prefix>/config
// Every matched call is itself recorded, before any method check.
class ApiHandler {
public:
    explicit ApiHandler(const ServerContext* ctx) : ctx_(ctx) {}

    // True for the endpoints above; other paths under the prefix fall through
    // to normal dispatch.
    bool Matches(const std::string& path) const;

    void Handle(const protocol::HttpRequest& req, const std::string& peerAddr, protocol::HttpResponse* resp) const;

    static std::string RecordsToJson(const std::vector<store::ConnectionRecord>& records);
    static std::string IpStatsToJson(const query::IpStats& s);

private:
    void HandleConnections(const protocol::HttpRequest& req, protocol::HttpResponse* resp) const;
    void HandleStats(const protocol::HttpRequest& req, protocol::HttpResponse* resp) const;
    void HandleClientDetail(const protocol::HttpRequest& req, const std::string& ip, protocol::HttpResponse* resp) const;
    void HandleConfig(protocol::HttpResponse* resp) const;
    void RecordCall(const protocol::HttpRequest& req, const std::string& peerAddr) const;

    const ServerContext* ctx_;
};

} // namespace proxy
} // namespace edgelog
