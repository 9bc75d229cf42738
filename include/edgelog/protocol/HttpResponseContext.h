#pragma once

#include <cstddef>
#include <string>
#include <vector>
#include <utility>

namespace edgelog {
namespace protocol {

// Minimal incremental HTTP/1.x response parser used while streaming a backend
// response to the client. It only tracks framing; the bytes themselves are
// forwarded untouched by the caller.
// - Content-Length, Transfer-Encoding: chunked, or read-until-close bodies.
// - No body for HEAD requests, 1xx, 204 and 304.
// - Interim 1xx responses (except 101) are skipped; the final response follows.
class HttpResponseContext {
public:
    enum ParseState { kExpectStatusLine, kExpectBody, kGotAll, kError };

    static const size_t kMaxHeaderBytes = 64 * 1024;

    // Feed bytes without copying the whole response.
    // Returns true if the response is complete after processing these bytes.
    bool feed(const char* data, size_t len);

    bool gotAll() const { return state_ == kGotAll; }
    bool hasError() const { return state_ == kError; }

    void reset();

    // The request was HEAD: the response carries no body whatever its headers say.
    void setRequestWasHead(bool on) { requestWasHead_ = on; }

    bool keepAlive() const { return keepAlive_; }
    bool needsCloseToFinish() const { return needsCloseToFinish_; }
    int statusCode() const { return statusCode_; }
    std::string getHeader(const std::string& field) const;

private:
    bool parseHeaderBlock(const std::string& headerBlock);
    bool consumeBody(const char* data, size_t len);
    bool consumeChunked(const char* data, size_t len);

    ParseState state_{kExpectStatusLine};
    std::string headerBuf_;
    bool requestWasHead_{false};

    int httpMajor_{1};
    int httpMinor_{1};
    int statusCode_{0};

    std::vector<std::pair<std::string, std::string>> headers_;
    bool chunked_{false};
    size_t bodyRemaining_{0};
    bool keepAlive_{false};
    bool needsCloseToFinish_{false};

    // chunked parsing
    bool expectingChunkSize_{true};
    std::string chunkLineBuf_;
    size_t chunkRemaining_{0};
    size_t chunkCrlfRemaining_{0}; // bytes of CRLF left to consume after a chunk
    bool trailer_{false};
    std::string trailerBuf_;
};

} // namespace protocol
} // namespace edgelog
