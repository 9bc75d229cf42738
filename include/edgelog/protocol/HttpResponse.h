#pragma once

#include <string>
#include <vector>
#include <utility>

#include "edgelog/network/Buffer.h"

namespace edgelog {
namespace protocol {

// Response generated by the proxy itself (API, dashboard, errors).
class HttpResponse {
public:
    enum HttpStatusCode {
        kUnknown,
        k200Ok = 200,
        k400BadRequest = 400,
        k404NotFound = 404,
        k405MethodNotAllowed = 405,
        k500InternalServerError = 500,
        k502BadGateway = 502,
    };

    explicit HttpResponse(bool close)
        : statusCode_(kUnknown), closeConnection_(close) {}

    void setStatusCode(HttpStatusCode code) { statusCode_ = code; }
    HttpStatusCode statusCode() const { return statusCode_; }
    void setStatusMessage(const std::string& message) { statusMessage_ = message; }
    void setCloseConnection(bool on) { closeConnection_ = on; }
    bool closeConnection() const { return closeConnection_; }
    void setContentType(const std::string& contentType) { addHeader("Content-Type", contentType); }

    void addHeader(const std::string& key, const std::string& value) {
        headers_.emplace_back(key, value);
    }

    void setBody(const std::string& body) { body_ = body; }
    const std::string& body() const { return body_; }

    void appendToBuffer(edgelog::network::Buffer* output) const;

    static const char* DefaultReason(HttpStatusCode code);

private:
    HttpStatusCode statusCode_;
    std::string statusMessage_;
    bool closeConnection_;
    std::vector<std::pair<std::string, std::string>> headers_;
    std::string body_;
};

} // namespace protocol
} // namespace edgelog
