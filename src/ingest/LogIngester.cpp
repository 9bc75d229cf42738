#include "edgelog/ingest/LogIngester.h"
#include "edgelog/common/Logger.h"
#include "edgelog/common/StringUtil.h"
#include "edgelog/common/TimeUtil.h"

#include <istream>

namespace edgelog {
namespace ingest {

// Tunnel bookkeeping messages that carry no client request.
static const char* const kDenylist[] = {
    "Registered tunnel connection",
    "Initial protocol",
    "Connection established",
};

LogIngester::LogIngester(store::ConnectionRecorder* recorder, bool verbose)
    : recorder_(recorder), verbose_(verbose) {
    parsers_.push_back(std::make_unique<JsonLineParser>());
    parsers_.push_back(std::make_unique<KeyValueLineParser>());
}

const char* LogIngester::OutcomeName(Outcome o) {
    switch (o) {
        case kRecorded: return "recorded";
        case kEmpty: return "empty";
        case kNoMatch: return "no_match";
        case kNonActionable: return "non_actionable";
        case kDenylisted: return "denylisted";
        case kStoreError: return "store_error";
        default: return "unknown";
    }
}

bool LogIngester::IsDenylisted(const std::string& message) {
    for (const char* phrase : kDenylist) {
        if (message.find(phrase) != std::string::npos) return true;
    }
    return false;
}

static std::string StripScheme(const std::string& url) {
    const size_t sep = url.find("://");
    return sep == std::string::npos ? url : url.substr(sep + 3);
}

std::string LogIngester::HostFromUrl(const std::string& url) {
    std::string rest = StripScheme(url);
    const size_t end = rest.find_first_of("/?#");
    if (end != std::string::npos) rest.resize(end);
    const size_t colon = rest.find(':');
    if (colon != std::string::npos) rest.resize(colon);
    return rest;
}

std::string LogIngester::PathFromUrl(const std::string& url) {
    const std::string rest = StripScheme(url);
    const size_t slash = rest.find('/');
    if (slash == std::string::npos) return "/";
    std::string path = rest.substr(slash);
    const size_t q = path.find_first_of("?#");
    if (q != std::string::npos) path.resize(q);
    return path;
}

LogIngester::Outcome LogIngester::Classify(const std::string& line, store::ConnectionRecord* rec) const {
    if (common::TrimCopy(line).empty()) return kEmpty;

    ParsedLine p;
    bool matched = false;
    for (const auto& parser : parsers_) {
        if (parser->Parse(line, &p)) {
            matched = true;
            break;
        }
    }
    if (!matched) return kNoMatch;

    if (p.clientIp.empty() && p.hostname.empty() && p.originUrl.empty()) return kNonActionable;
    if (IsDenylisted(p.message)) return kDenylisted;

    store::ConnectionRecord r;
    r.clientIp = p.clientIp;
    r.host = p.hostname;
    r.path = p.path;
    if (!p.originUrl.empty()) {
        if (r.host.empty()) r.host = HostFromUrl(p.originUrl);
        if (r.path.empty()) r.path = PathFromUrl(p.originUrl);
    }
    r.method = p.method.empty() ? "GET" : p.method;
    if (p.time.empty() || !common::Rfc3339ToLocal(p.time, &r.timestamp)) {
        r.timestamp = common::NowLocalString();
    }
    *rec = std::move(r);
    return kRecorded;
}

void LogIngester::Count(Outcome o, const std::string& line, const std::string& detail) {
    ++summary_.counts[o];
    if (o == kRecorded || o == kEmpty) return;
    if (o == kStoreError) {
        LOG_WARN << "ingest: store error: " << detail;
    } else if (verbose_) {
        LOG_INFO << "ingest: skipped (" << OutcomeName(o) << "): " << line;
    }
}

LogIngester::Outcome LogIngester::ProcessLine(const std::string& line) {
    ++summary_.lines;
    store::ConnectionRecord rec;
    const Outcome o = Classify(line, &rec);
    if (o != kRecorded) {
        Count(o, line, std::string());
        return o;
    }
    if (!recorder_) {
        Count(kStoreError, line, "no recorder");
        return kStoreError;
    }
    std::string err;
    if (!recorder_->Record(rec, &err)) {
        Count(kStoreError, line, err);
        return kStoreError;
    }
    if (verbose_) {
        LOG_INFO << "ingest: recorded " << rec.timestamp << " | " << rec.clientIp << " | "
                 << rec.method << " " << rec.path << " | " << rec.host;
    }
    Count(kRecorded, line, std::string());
    return kRecorded;
}

const LogIngester::Summary& LogIngester::Run(std::istream& in) {
    std::string line;
    while (std::getline(in, line)) {
        if (!line.empty() && line.back() == '\r') line.pop_back();
        ProcessLine(line);
    }
    return summary_;
}

} // namespace ingest
} // namespace edgelog
