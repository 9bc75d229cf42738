#pragma once

#include <string>
#include <vector>
#include <utility>
#include <cstddef>

namespace edgelog {
namespace protocol {

class HttpRequest {
public:
    enum Version {
        kUnknown, kHttp10, kHttp11
    };

    using HeaderList = std::vector<std::pair<std::string, std::string>>;

    HttpRequest() : version_(kUnknown) {}

    void setVersion(Version v) { version_ = v; }
    Version getVersion() const { return version_; }
    const char* versionString() const { return version_ == kHttp10 ? "HTTP/1.0" : "HTTP/1.1"; }

    // Any RFC 7230 token is accepted; the proxy forwards methods it does not know.
    bool setMethod(const char* start, const char* end);
    const std::string& method() const { return method_; }

    // Request target as received (path plus "?query").
    void setTarget(const char* start, const char* end) { target_.assign(start, end); }
    const std::string& target() const { return target_; }

    void setPath(const char* start, const char* end) { path_.assign(start, end); }
    const std::string& path() const { return path_; }

    // Query string without the leading '?'.
    void setQuery(const char* start, const char* end) { query_.assign(start, end); }
    const std::string& query() const { return query_; }

    void addHeader(const char* start, const char* colon, const char* end);
    void addHeader(const std::string& field, const std::string& value) { headers_.emplace_back(field, value); }

    // Case-insensitive; first occurrence. Empty when absent.
    std::string getHeader(const std::string& field) const;
    bool hasHeader(const std::string& field) const;

    // Replaces every occurrence (case-insensitive) with one header.
    void setHeaderCI(const std::string& field, const std::string& value);
    void removeHeaderCI(const std::string& field);

    const HeaderList& headers() const { return headers_; }

    void setBody(const std::string& body) { body_ = body; }
    void appendBody(const char* data, size_t len) { body_.append(data, len); }
    const std::string& body() const { return body_; }

    void swap(HttpRequest& that);

private:
    std::string method_;
    Version version_;
    std::string target_;
    std::string path_;
    std::string query_;
    HeaderList headers_;
    std::string body_;
};

} // namespace protocol
} // namespace edgelog
