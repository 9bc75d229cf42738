#include "edgelog/protocol/HttpContext.h"
#include "edgelog/common/StringUtil.h"

#include <algorithm>
#include <cctype>
#include <cstdlib>

namespace edgelog {
namespace protocol {

using edgelog::network::Buffer;

void HttpContext::reset() {
    state_ = kExpectRequestLine;
    HttpRequest dummy;
    request_.swap(dummy);
    chunked_ = false;
    bodyRemaining_ = 0;
    chunkSize_ = 0;
    expectingChunkSize_ = true;
}

bool HttpContext::processRequestLine(const char* begin, const char* end) {
    bool succeed = false;
    const char* start = begin;
    const char* space = std::find(start, end, ' ');
    if (space != end && request_.setMethod(start, space)) {
        start = space + 1;
        space = std::find(start, end, ' ');
        if (space != end && space != start) {
            request_.setTarget(start, space);
            const char* question = std::find(start, space, '?');
            if (question != space) {
                request_.setPath(start, question);
                request_.setQuery(question + 1, space);
            } else {
                request_.setPath(start, space);
            }
            start = space + 1;
            succeed = end - start == 8 && std::equal(start, end - 1, "HTTP/1.");
            if (succeed) {
                if (*(end - 1) == '1') {
                    request_.setVersion(HttpRequest::kHttp11);
                } else if (*(end - 1) == '0') {
                    request_.setVersion(HttpRequest::kHttp10);
                } else {
                    succeed = false;
                }
            }
        }
    }
    return succeed;
}

bool HttpContext::processHeadersEnd() {
    chunked_ = false;
    bodyRemaining_ = 0;
    chunkSize_ = 0;
    expectingChunkSize_ = true;

    const std::string te = request_.getHeader("Transfer-Encoding");
    if (!te.empty() && edgelog::common::HeaderContainsTokenCI(te, "chunked")) {
        chunked_ = true;
    } else {
        const std::string cl = edgelog::common::TrimCopy(request_.getHeader("Content-Length"));
        if (!cl.empty()) {
            char* endp = nullptr;
            long long v = std::strtoll(cl.c_str(), &endp, 10);
            if (endp == cl.c_str() || *endp != '\0' || v < 0) {
                return false;
            }
            bodyRemaining_ = static_cast<size_t>(v);
        }
    }

    state_ = (chunked_ || bodyRemaining_ > 0) ? kExpectBody : kGotAll;
    return true;
}

// Chunk-size lines and chunk data; trailers are skipped.
bool HttpContext::processChunked(Buffer* buf, bool* hasMore) {
    while (true) {
        if (expectingChunkSize_) {
            const char* crlf = buf->FindCRLF();
            if (crlf == nullptr) {
                *hasMore = false;
                return buf->ReadableBytes() <= kMaxLineBytes;
            }
            std::string line(buf->Peek(), crlf);
            buf->RetrieveUntil(crlf + 2);

            auto semi = line.find(';');
            if (semi != std::string::npos) line = line.substr(0, semi);
            line = edgelog::common::TrimCopy(line);
            if (line.empty()) return false;

            char* endp = nullptr;
            long long sz = std::strtoll(line.c_str(), &endp, 16);
            if (endp == line.c_str() || *endp != '\0' || sz < 0) return false;
            chunkSize_ = static_cast<size_t>(sz);
            expectingChunkSize_ = false;
        }

        if (chunkSize_ == 0) {
            // last chunk: skip trailers up to the empty line
            while (true) {
                const char* tcrlf = buf->FindCRLF();
                if (tcrlf == nullptr) {
                    *hasMore = false;
                    return true;
                }
                const bool empty = (tcrlf == buf->Peek());
                buf->RetrieveUntil(tcrlf + 2);
                if (empty) {
                    state_ = kGotAll;
                    *hasMore = false;
                    return true;
                }
            }
        }

        // Need chunkSize_ bytes + CRLF.
        if (buf->ReadableBytes() < chunkSize_ + 2) {
            *hasMore = false;
            return true;
        }
        request_.appendBody(buf->Peek(), chunkSize_);
        buf->Retrieve(chunkSize_);
        const char* p = buf->Peek();
        if (p[0] != '\r' || p[1] != '\n') return false;
        buf->Retrieve(2);
        expectingChunkSize_ = true;
    }
}

// return false if any error
bool HttpContext::parseRequest(Buffer* buf, std::chrono::system_clock::time_point receiveTime) {
    (void)receiveTime;
    bool ok = true;
    bool hasMore = true;
    while (hasMore && ok) {
        if (state_ == kExpectRequestLine) {
            const char* crlf = buf->FindCRLF();
            if (crlf) {
                ok = processRequestLine(buf->Peek(), crlf);
                if (ok) {
                    buf->RetrieveUntil(crlf + 2);
                    state_ = kExpectHeaders;
                }
            } else {
                ok = buf->ReadableBytes() <= kMaxLineBytes;
                hasMore = false;
            }
        } else if (state_ == kExpectHeaders) {
            const char* crlf = buf->FindCRLF();
            if (crlf) {
                if (crlf == buf->Peek()) {
                    // empty line, end of headers
                    buf->RetrieveUntil(crlf + 2);
                    ok = processHeadersEnd();
                    hasMore = (state_ != kGotAll);
                    continue;
                }
                const char* colon = std::find(buf->Peek(), crlf, ':');
                if (colon == crlf || colon == buf->Peek()) {
                    ok = false;
                    break;
                }
                request_.addHeader(buf->Peek(), colon, crlf);
                buf->RetrieveUntil(crlf + 2);
            } else {
                ok = buf->ReadableBytes() <= kMaxLineBytes;
                hasMore = false;
            }
        } else if (state_ == kExpectBody) {
            if (chunked_) {
                ok = processChunked(buf, &hasMore);
            } else {
                const size_t n = std::min(bodyRemaining_, buf->ReadableBytes());
                if (n > 0) {
                    request_.appendBody(buf->Peek(), n);
                    buf->Retrieve(n);
                    bodyRemaining_ -= n;
                }
                if (bodyRemaining_ == 0) {
                    state_ = kGotAll;
                }
                hasMore = false;
            }
        } else {
            hasMore = false;
        }
    }
    return ok;
}

} // namespace protocol
} // namespace edgelog
