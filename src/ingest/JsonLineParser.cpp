#include "edgelog/ingest/LineParser.h"
#include "edgelog/common/Json.h"
#include "edgelog/common/StringUtil.h"

namespace edgelog {
namespace ingest {

using common::JsonGetString;

static std::string FirstOf(const common::JsonObject& obj, const char* a, const char* b) {
    std::string v = JsonGetString(obj, a);
    if (v.empty()) v = JsonGetString(obj, b);
    return v;
}

bool JsonLineParser::Parse(const std::string& line, ParsedLine* out) const {
    const std::string trimmed = common::TrimCopy(line);
    if (trimmed.empty() || trimmed[0] != '{') return false;

    common::JsonObject obj;
    if (!common::ParseJsonObject(trimmed, &obj, nullptr)) return false;

    ParsedLine p;
    p.time = JsonGetString(obj, "time");
    p.message = FirstOf(obj, "message", "msg");
    p.clientIp = FirstOf(obj, "clientIP", "ip");
    p.hostname = JsonGetString(obj, "hostname");
    p.path = JsonGetString(obj, "path");
    p.method = JsonGetString(obj, "method");
    p.originUrl = JsonGetString(obj, "originURL");
    p.rayId = FirstOf(obj, "cfRay", "traceId");
    *out = std::move(p);
    return true;
}

} // namespace ingest
} // namespace edgelog
