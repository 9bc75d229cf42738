#include "edgelog/protocol/HttpRequest.h"
#include "edgelog/common/StringUtil.h"

#include <cctype>
#include <cstring>

namespace edgelog {
namespace protocol {

using edgelog::common::IEquals;

namespace {

bool IsTokenChar(char c) {
    if (std::isalnum(static_cast<unsigned char>(c))) return true;
    return std::strchr("!#$%&'*+-.^_`|~", c) != nullptr && c != '\0';
}

} // namespace

bool HttpRequest::setMethod(const char* start, const char* end) {
    if (start == end) return false;
    for (const char* p = start; p != end; ++p) {
        if (!IsTokenChar(*p)) return false;
    }
    method_.assign(start, end);
    return true;
}

void HttpRequest::addHeader(const char* start, const char* colon, const char* end) {
    std::string field(start, colon);
    ++colon;
    while (colon < end && isspace(*colon)) {
        ++colon;
    }
    std::string value(colon, end);
    while (!value.empty() && isspace(value[value.size() - 1])) {
        value.resize(value.size() - 1);
    }
    headers_.emplace_back(std::move(field), std::move(value));
}

std::string HttpRequest::getHeader(const std::string& field) const {
    for (const auto& h : headers_) {
        if (IEquals(h.first, field)) return h.second;
    }
    return std::string();
}

bool HttpRequest::hasHeader(const std::string& field) const {
    for (const auto& h : headers_) {
        if (IEquals(h.first, field)) return true;
    }
    return false;
}

void HttpRequest::setHeaderCI(const std::string& field, const std::string& value) {
    removeHeaderCI(field);
    headers_.emplace_back(field, value);
}

void HttpRequest::removeHeaderCI(const std::string& field) {
    for (auto it = headers_.begin(); it != headers_.end();) {
        if (IEquals(it->first, field)) {
            it = headers_.erase(it);
            continue;
        }
        ++it;
    }
}

void HttpRequest::swap(HttpRequest& that) {
    method_.swap(that.method_);
    std::swap(version_, that.version_);
    target_.swap(that.target_);
    path_.swap(that.path_);
    query_.swap(that.query_);
    headers_.swap(that.headers_);
    body_.swap(that.body_);
}

} // namespace protocol
} // namespace edgelog
