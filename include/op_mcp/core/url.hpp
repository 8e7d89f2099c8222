#pragma once

#include <string>
#include <utility>
#include <vector>

namespace op_mcp {

// Percent-encode a string per RFC 3986.
// Unreserved characters (alphanumeric, '-', '_', '.', '~') pass through;
// everything else is replaced with %XX (uppercase hex).
std::string UrlEncode(const std::string& value);

// Build "?k1=v1&k2=v2" with every value percent-encoded. Empty input gives "".
std::string BuildQuery(const std::vector<std::pair<std::string, std::string>>& params);

} // namespace op_mcp
