#pragma once

#include <string>

namespace edgelog {
namespace proxy {

// Page served for "/" and "/dashboard" on hosts without a route: the HTML file
// at `file`, or a small built-in page linking the read API when the file is
// unset or unreadable.
std::string DashboardHtml(const std::string& file, const std::string& apiPrefix);

} // namespace proxy
} // namespace edgelog
