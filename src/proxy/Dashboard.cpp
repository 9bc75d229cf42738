#include "edgelog/proxy/Dashboard.h"
#include "edgelog/common/Logger.h"

#include <fstream>
#include <sstream>

namespace edgelog {
namespace proxy {

static std::string PlaceholderHtml(const std::string& p) {
    std::ostringstream oss;
    oss << R"(<!doctype html>
<html>
<head>
  <meta charset="utf-8">
  <title>edgelog</title>
  <style>
    body { font-family: -apple-system, BlinkMacSystemFont, "Segoe UI", Roboto, Arial, sans-serif; margin: 16px; color:#111; }
    code { background:#f3f4f6; padding:1px 4px; border-radius:4px; }
  </style>
</head>
<body>
  <h2>edgelog</h2>
  <p>No dashboard file configured. Read API:</p>
  <ul>
    <li><a href=")" << p << R"(/connections"><code>)" << p << R"(/connections</code></a></li>
    <li><a href=")" << p << R"(/stats"><code>)" << p << R"(/stats</code></a></li>
    <li><code>)" << p << R"(/stats/ip/{ip}</code></li>
    <li><a href=")" << p << R"(/health"><code>)" << p << R"(/health</code></a></li>
    <li><a href=")" << p << R"(/config"><code>)" << p << R"(/config</code></a></li>
  </ul>
</body>
</html>
)";
    return oss.str();
}

std::string DashboardHtml(const std::string& file, const std::string& apiPrefix) {
    if (!file.empty()) {
        std::ifstream in(file, std::ios::binary);
        if (in.is_open()) {
            std::stringstream ss;
            ss << in.rdbuf();
            return ss.str();
        }
        LOG_WARN << "dashboard file unreadable: " << file;
    }
    return PlaceholderHtml(apiPrefix);
}

} // namespace proxy
} // namespace edgelog
