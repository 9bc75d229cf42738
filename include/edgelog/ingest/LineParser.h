#pragma once

#include <string>

namespace edgelog {
namespace ingest {

// Fields pulled out of one tunnel-daemon log line, before classification.
struct ParsedLine {
    std::string time;
    std::string message;
    std::string clientIp;
    std::string hostname;
    std::string path;
    std::string method;
    std::string originUrl;
    std::string rayId;
};

// One log format. Parsers are tried in order; the first that recognizes the
// line wins.
class LineParser {
public:
    virtual ~LineParser() = default;

    virtual const char* name() const = 0;

    // False when the line is not in this parser's format.
    virtual bool Parse(const std::string& line, ParsedLine* out) const = 0;
};

// Flat JSON object per line (cloudflared --output json).
class JsonLineParser : public LineParser {
public:
    const char* name() const override { return "json"; }
    bool Parse(const std::string& line, ParsedLine* out) const override;
};

// logfmt-style key=value pairs; values bare or quoted with " or '.
class KeyValueLineParser : public LineParser {
public:
    const char* name() const override { return "kv"; }
    bool Parse(const std::string& line, ParsedLine* out) const override;
};

} // namespace ingest
} // namespace edgelog
