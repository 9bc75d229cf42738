#pragma once

#include "edgelog/protocol/HttpRequest.h"
#include "edgelog/network/Buffer.h"

#include <chrono>

namespace edgelog {
namespace protocol {

// Incremental HTTP/1.x request parser. Consumes from the buffer what it has parsed;
// bytes of a following pipelined request stay in the buffer.
class HttpContext {
public:
    enum HttpRequestParseState {
        kExpectRequestLine,
        kExpectHeaders,
        kExpectBody,
        kGotAll,
    };

    // A request line or header line longer than this is rejected.
    static const size_t kMaxLineBytes = 64 * 1024;

    HttpContext()
        : state_(kExpectRequestLine) {}

    // return false if some error
    bool parseRequest(edgelog::network::Buffer* buf, std::chrono::system_clock::time_point receiveTime);

    bool gotAll() const { return state_ == kGotAll; }
    void reset();

    const HttpRequest& request() const { return request_; }
    HttpRequest& request() { return request_; }

private:
    bool processRequestLine(const char* begin, const char* end);
    bool processHeadersEnd();
    bool processChunked(edgelog::network::Buffer* buf, bool* hasMore);

    HttpRequestParseState state_;
    HttpRequest request_;

    // Body parsing state
    bool chunked_{false};
    size_t bodyRemaining_{0};
    size_t chunkSize_{0};
    bool expectingChunkSize_{true};
};

} // namespace protocol
} // namespace edgelog
