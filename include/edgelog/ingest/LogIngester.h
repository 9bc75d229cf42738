#pragma once

#include "edgelog/common/noncopyable.h"
#include "edgelog/ingest/LineParser.h"
#include "edgelog/store/ConnectionRecord.h"
#include "edgelog/store/ConnectionRecorder.h"

#include <cstddef>
#include <iosfwd>
#include <memory>
#include <string>
#include <vector>

namespace edgelog {
namespace ingest {

// Turns tunnel-daemon log lines into connection records.
class LogIngester : edgelog::common::noncopyable {
public:
    enum Outcome {
        kRecorded,
        kEmpty,
        kNoMatch,
        kNonActionable,
        kDenylisted,
        kStoreError,
        kOutcomeCount
    };

    struct Summary {
        size_t lines{0};
        size_t counts[kOutcomeCount] = {};

        size_t count(Outcome o) const { return counts[o]; }
    };

    // recorder may be null for classification-only use (Classify()).
    LogIngester(store::ConnectionRecorder* recorder, bool verbose);

    // Replace the default json -> kv chain.
    void SetParsers(std::vector<std::unique_ptr<LineParser>> parsers) { parsers_ = std::move(parsers); }

    // Parses and classifies one line; on kRecorded *rec holds the record to write.
    Outcome Classify(const std::string& line, store::ConnectionRecord* rec) const;

    // Classify and write through the recorder.
    Outcome ProcessLine(const std::string& line);

    // Processes lines until end of stream.
    const Summary& Run(std::istream& in);

    const Summary& summary() const { return summary_; }

    static const char* OutcomeName(Outcome o);
    static bool IsDenylisted(const std::string& message);

    // "https://a.example.com:8443/x?y" -> "a.example.com" and "/x"
    static std::string HostFromUrl(const std::string& url);
    static std::string PathFromUrl(const std::string& url);

private:
    void Count(Outcome o, const std::string& line, const std::string& detail);

    store::ConnectionRecorder* recorder_;
    bool verbose_;
    std::vector<std::unique_ptr<LineParser>> parsers_;
    Summary summary_;
};

} // namespace ingest
} // namespace edgelog
