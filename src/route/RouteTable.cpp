#include "edgelog/route/RouteTable.h"
#include "edgelog/common/Json.h"
#include "edgelog/common/Logger.h"
#include "edgelog/common/StringUtil.h"

#include <fstream>
#include <sstream>

namespace edgelog {
namespace route {

using edgelog::common::ToLowerAscii;

std::string BackendUrl::authority() const {
    const uint16_t def = tls() ? 443 : 80;
    if (port == def) return host;
    return host + ":" + std::to_string(port);
}

bool BackendUrl::Parse(const std::string& text, BackendUrl* out, std::string* err) {
    const std::string trimmed = common::TrimCopy(text);
    const size_t sep = trimmed.find("://");
    if (sep == std::string::npos) {
        if (err) *err = "missing scheme";
        return false;
    }
    BackendUrl url;
    url.original = trimmed;
    url.scheme = ToLowerAscii(trimmed.substr(0, sep));
    if (url.scheme != "http" && url.scheme != "https") {
        if (err) *err = "unsupported scheme '" + url.scheme + "'";
        return false;
    }

    std::string rest = trimmed.substr(sep + 3);
    const size_t frag = rest.find('#');
    if (frag != std::string::npos) rest.resize(frag);
    const size_t q = rest.find('?');
    if (q != std::string::npos) {
        url.rawQuery = rest.substr(q + 1);
        rest.resize(q);
    }
    const size_t slash = rest.find('/');
    std::string authority = rest.substr(0, slash);
    if (slash != std::string::npos) url.pathPrefix = rest.substr(slash);
    const size_t at = authority.rfind('@');
    if (at != std::string::npos) authority = authority.substr(at + 1);
    if (authority.empty()) {
        if (err) *err = "empty host";
        return false;
    }

    std::string portText;
    if (authority[0] == '[') {
        const size_t close = authority.find(']');
        if (close == std::string::npos) {
            if (err) *err = "unterminated IPv6 literal";
            return false;
        }
        // backends are dialed over IPv4 only
        if (err) *err = "IPv6 backend " + authority.substr(0, close + 1) + " is not supported";
        return false;
    } else {
        const size_t colon = authority.rfind(':');
        url.host = authority.substr(0, colon);
        if (colon != std::string::npos) portText = authority.substr(colon + 1);
    }
    if (url.host.empty()) {
        if (err) *err = "empty host";
        return false;
    }

    url.port = url.tls() ? 443 : 80;
    if (!portText.empty()) {
        int port = 0;
        try {
            size_t used = 0;
            port = std::stoi(portText, &used);
            if (used != portText.size()) port = 0;
        } catch (const std::exception&) {
            port = 0;
        }
        if (port < 1 || port > 65535) {
            if (err) *err = "invalid port '" + portText + "'";
            return false;
        }
        url.port = static_cast<uint16_t>(port);
    }

    *out = std::move(url);
    return true;
}

std::string RouteTable::NormalizeHost(const std::string& host) {
    std::string h = ToLowerAscii(common::TrimCopy(host));
    if (!h.empty() && h[0] == '[') {
        const size_t close = h.find(']');
        if (close != std::string::npos) h.resize(close + 1);
        return h;
    }
    const size_t colon = h.find(':');
    if (colon != std::string::npos) h.resize(colon);
    return h;
}

bool RouteTable::Add(const std::string& host, const std::string& backend, bool noTlsVerify) {
    const std::string key = NormalizeHost(host);
    if (key.empty()) {
        LOG_WARN << "route skipped: empty host (backend=" << backend << ")";
        return false;
    }
    RouteEntry entry;
    std::string err;
    if (!BackendUrl::Parse(backend, &entry.backend, &err)) {
        LOG_WARN << "route skipped: host=" << key << " backend=" << backend << ": " << err;
        return false;
    }
    entry.host = key;
    entry.noTlsVerify = noTlsVerify;
    if (routes_.count(key)) {
        LOG_WARN << "duplicate route for host " << key << ", keeping the later one";
    }
    routes_[key] = std::move(entry);
    return true;
}

std::optional<RouteEntry> RouteTable::Lookup(const std::string& host) const {
    auto it = routes_.find(NormalizeHost(host));
    if (it == routes_.end()) return std::nullopt;
    return it->second;
}

std::map<std::string, std::string> RouteTable::ListAll() const {
    std::map<std::string, std::string> out;
    for (const auto& kv : routes_) {
        out[kv.first] = kv.second.backend.original;
    }
    return out;
}

bool RouteTable::LoadFromJson(const std::string& text, RouteTable* table, std::string* err) {
    std::vector<std::string> objects;
    if (!common::SplitJsonObjectArray(text, &objects, err)) return false;

    for (size_t i = 0; i < objects.size(); ++i) {
        common::JsonObject obj;
        std::string perr;
        if (!common::ParseJsonObject(objects[i], &obj, &perr)) {
            LOG_WARN << "route #" << i << " skipped: " << perr;
            continue;
        }
        table->Add(common::JsonGetString(obj, "host"),
                   common::JsonGetString(obj, "backend"),
                   common::JsonGetBool(obj, "no_tls_verify", false));
    }
    return true;
}

bool RouteTable::LoadFromFile(const std::string& path, RouteTable* table, std::string* err) {
    std::ifstream in(path);
    if (!in.is_open()) {
        if (err) *err = "cannot open " + path;
        return false;
    }
    std::stringstream ss;
    ss << in.rdbuf();
    if (!LoadFromJson(ss.str(), table, err)) {
        if (err) *err = path + ": " + *err;
        return false;
    }
    return true;
}

} // namespace route
} // namespace edgelog
