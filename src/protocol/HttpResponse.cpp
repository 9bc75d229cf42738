#include "edgelog/protocol/HttpResponse.h"

#include <cstdio>
#include <cstring>

namespace edgelog {
namespace protocol {

const char* HttpResponse::DefaultReason(HttpStatusCode code) {
    switch (code) {
        case k200Ok: return "OK";
        case k400BadRequest: return "Bad Request";
        case k404NotFound: return "Not Found";
        case k405MethodNotAllowed: return "Method Not Allowed";
        case k500InternalServerError: return "Internal Server Error";
        case k502BadGateway: return "Bad Gateway";
        default: return "Unknown";
    }
}

void HttpResponse::appendToBuffer(edgelog::network::Buffer* output) const {
    char buf[64];
    std::snprintf(buf, sizeof buf, "HTTP/1.1 %d ", static_cast<int>(statusCode_));
    output->Append(buf, std::strlen(buf));
    output->Append(statusMessage_.empty() ? std::string(DefaultReason(statusCode_)) : statusMessage_);
    output->Append("\r\n");

    std::snprintf(buf, sizeof buf, "Content-Length: %zu\r\n", body_.size());
    output->Append(buf, std::strlen(buf));
    if (closeConnection_) {
        output->Append("Connection: close\r\n");
    } else {
        output->Append("Connection: keep-alive\r\n");
    }

    for (const auto& header : headers_) {
        output->Append(header.first);
        output->Append(": ");
        output->Append(header.second);
        output->Append("\r\n");
    }

    output->Append("\r\n");
    output->Append(body_);
}

} // namespace protocol
} // namespace edgelog
