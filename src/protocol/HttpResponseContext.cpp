#include "edgelog/protocol/HttpResponseContext.h"
#include "edgelog/common/StringUtil.h"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <stdexcept>

namespace edgelog {
namespace protocol {

using edgelog::common::HeaderContainsTokenCI;
using edgelog::common::IEquals;
using edgelog::common::TrimCopy;

static bool findCrlfInSpan(const char* data, size_t len, size_t* posOut) {
    if (len < 2) return false;
    for (size_t i = 0; i + 1 < len; ++i) {
        if (data[i] == '\r' && data[i + 1] == '\n') {
            *posOut = i;
            return true;
        }
    }
    return false;
}

void HttpResponseContext::reset() {
    state_ = kExpectStatusLine;
    headerBuf_.clear();
    requestWasHead_ = false;
    httpMajor_ = 1;
    httpMinor_ = 1;
    statusCode_ = 0;
    headers_.clear();
    chunked_ = false;
    bodyRemaining_ = 0;
    keepAlive_ = false;
    needsCloseToFinish_ = false;
    expectingChunkSize_ = true;
    chunkLineBuf_.clear();
    chunkRemaining_ = 0;
    chunkCrlfRemaining_ = 0;
    trailer_ = false;
    trailerBuf_.clear();
}

std::string HttpResponseContext::getHeader(const std::string& field) const {
    for (const auto& kv : headers_) {
        if (IEquals(kv.first, field)) return kv.second;
    }
    return std::string();
}

bool HttpResponseContext::parseHeaderBlock(const std::string& headerBlock) {
    headers_.clear();

    size_t pos = 0;
    size_t lineEnd = headerBlock.find("\r\n", pos);
    if (lineEnd == std::string::npos) {
        state_ = kError;
        return false;
    }
    const std::string statusLine = headerBlock.substr(0, lineEnd);
    pos = lineEnd + 2;

    // HTTP/1.1 200 OK  (reason phrase optional)
    if (statusLine.rfind("HTTP/", 0) != 0) {
        state_ = kError;
        return false;
    }
    const size_t sp1 = statusLine.find(' ');
    if (sp1 == std::string::npos) {
        state_ = kError;
        return false;
    }
    const std::string ver = statusLine.substr(5, sp1 - 5);
    const size_t dot = ver.find('.');
    if (dot == std::string::npos) {
        state_ = kError;
        return false;
    }
    size_t sp2 = statusLine.find(' ', sp1 + 1);
    if (sp2 == std::string::npos) sp2 = statusLine.size();
    try {
        httpMajor_ = std::stoi(ver.substr(0, dot));
        httpMinor_ = std::stoi(ver.substr(dot + 1));
        statusCode_ = std::stoi(statusLine.substr(sp1 + 1, sp2 - (sp1 + 1)));
    } catch (const std::exception&) {
        state_ = kError;
        return false;
    }
    if (statusCode_ < 100 || statusCode_ > 999) {
        state_ = kError;
        return false;
    }

    while (pos < headerBlock.size()) {
        const size_t next = headerBlock.find("\r\n", pos);
        if (next == std::string::npos) break;
        if (next == pos) {
            pos += 2;
            break;
        }
        const std::string line = headerBlock.substr(pos, next - pos);
        pos = next + 2;
        const size_t colon = line.find(':');
        if (colon == std::string::npos) continue;
        headers_.emplace_back(line.substr(0, colon), TrimCopy(line.substr(colon + 1)));
    }

    // Interim response: the caller keeps feeding, the final status line follows.
    if (statusCode_ >= 100 && statusCode_ < 200 && statusCode_ != 101) {
        state_ = kExpectStatusLine;
        return true;
    }

    const std::string te = getHeader("Transfer-Encoding");
    const std::string cl = TrimCopy(getHeader("Content-Length"));
    const std::string conn = getHeader("Connection");

    keepAlive_ = true;
    if (httpMajor_ == 1 && httpMinor_ == 0) {
        keepAlive_ = HeaderContainsTokenCI(conn, "keep-alive");
    } else if (HeaderContainsTokenCI(conn, "close")) {
        keepAlive_ = false;
    }

    const bool noBody = requestWasHead_ || statusCode_ < 200 || statusCode_ == 204 || statusCode_ == 304;
    if (noBody) {
        needsCloseToFinish_ = false;
        state_ = kGotAll;
        return true;
    }

    chunked_ = (!te.empty() && HeaderContainsTokenCI(te, "chunked"));
    if (chunked_) {
        expectingChunkSize_ = true;
        chunkLineBuf_.clear();
        chunkRemaining_ = 0;
        chunkCrlfRemaining_ = 0;
        trailer_ = false;
        trailerBuf_.clear();
        needsCloseToFinish_ = false;
    } else if (!cl.empty()) {
        char* endp = nullptr;
        const long long n = std::strtoll(cl.c_str(), &endp, 10);
        if (endp == cl.c_str() || *endp != '\0' || n < 0) {
            state_ = kError;
            return false;
        }
        bodyRemaining_ = static_cast<size_t>(n);
        needsCloseToFinish_ = false;
    } else {
        needsCloseToFinish_ = true;
        keepAlive_ = false;
    }

    state_ = kExpectBody;
    if (!chunked_ && !needsCloseToFinish_ && bodyRemaining_ == 0) {
        state_ = kGotAll;
    }
    return true;
}

bool HttpResponseContext::consumeChunked(const char* data, size_t len) {
    size_t consumed = 0;
    while (consumed < len) {
        const char* p = data + consumed;
        const size_t avail = len - consumed;

        if (trailer_) {
            // Trailer section ends with an empty line; with no trailers that is
            // the CRLF right after the last-chunk line.
            trailerBuf_.append(p, avail);
            if (trailerBuf_.compare(0, 2, "\r\n") == 0 || trailerBuf_.find("\r\n\r\n") != std::string::npos) {
                state_ = kGotAll;
                return true;
            }
            if (trailerBuf_.size() > kMaxHeaderBytes) {
                state_ = kError;
                return false;
            }
            return true;
        }

        if (expectingChunkSize_) {
            size_t pos = 0;
            bool lineDone = false;
            if (!chunkLineBuf_.empty() && chunkLineBuf_.back() == '\r' && p[0] == '\n') {
                // CRLF straddled the previous read boundary
                chunkLineBuf_.pop_back();
                consumed += 1;
                lineDone = true;
            } else if (findCrlfInSpan(p, avail, &pos)) {
                chunkLineBuf_.append(p, pos);
                consumed += (pos + 2);
                lineDone = true;
            }
            if (lineDone) {
                std::string line = chunkLineBuf_;
                chunkLineBuf_.clear();
                const size_t semi = line.find(';');
                if (semi != std::string::npos) line = line.substr(0, semi);
                line = TrimCopy(line);
                if (line.empty()) {
                    state_ = kError;
                    return false;
                }
                char* endp = nullptr;
                const unsigned long long n = std::strtoull(line.c_str(), &endp, 16);
                if (endp == line.c_str() || *endp != '\0') {
                    state_ = kError;
                    return false;
                }
                chunkRemaining_ = static_cast<size_t>(n);
                expectingChunkSize_ = false;
                if (chunkRemaining_ == 0) {
                    trailer_ = true;
                }
                continue;
            }
            // size line split across reads
            chunkLineBuf_.append(p, avail);
            if (chunkLineBuf_.size() > kMaxHeaderBytes) {
                state_ = kError;
                return false;
            }
            return true;
        }

        if (chunkRemaining_ > 0) {
            const size_t take = std::min(chunkRemaining_, avail);
            chunkRemaining_ -= take;
            consumed += take;
            if (chunkRemaining_ == 0) {
                chunkCrlfRemaining_ = 2;
            }
            continue;
        }

        if (chunkCrlfRemaining_ > 0) {
            const char expect = (chunkCrlfRemaining_ == 2) ? '\r' : '\n';
            if (p[0] != expect) {
                state_ = kError;
                return false;
            }
            --chunkCrlfRemaining_;
            ++consumed;
            if (chunkCrlfRemaining_ == 0) {
                expectingChunkSize_ = true;
            }
            continue;
        }
    }
    return true;
}

bool HttpResponseContext::consumeBody(const char* data, size_t len) {
    if (chunked_) {
        return consumeChunked(data, len);
    }
    if (needsCloseToFinish_) {
        // Finishes only when the backend closes.
        return true;
    }
    const size_t take = std::min(bodyRemaining_, len);
    bodyRemaining_ -= take;
    if (bodyRemaining_ == 0) state_ = kGotAll;
    return true;
}

bool HttpResponseContext::feed(const char* data, size_t len) {
    if (state_ == kError || state_ == kGotAll) return (state_ == kGotAll);
    if (!data || len == 0) return false;

    if (state_ == kExpectStatusLine) {
        headerBuf_.append(data, len);
        const size_t hdrPos = headerBuf_.find("\r\n\r\n");
        if (hdrPos == std::string::npos) {
            if (headerBuf_.size() > kMaxHeaderBytes) state_ = kError;
            return false;
        }
        const size_t headerEnd = hdrPos + 4;
        const std::string headerBlock = headerBuf_.substr(0, headerEnd);
        std::string rest = headerBuf_.substr(headerEnd);
        headerBuf_.clear();

        if (!parseHeaderBlock(headerBlock)) return false;
        if (state_ == kExpectStatusLine) {
            // interim 1xx consumed; parse what follows as the next response head
            return rest.empty() ? false : feed(rest.data(), rest.size());
        }
        if (state_ == kExpectBody && !rest.empty()) {
            if (!consumeBody(rest.data(), rest.size())) return false;
        }
        return state_ == kGotAll;
    }

    if (!consumeBody(data, len)) return false;
    return state_ == kGotAll;
}

} // namespace protocol
} // namespace edgelog
