#pragma once

#include <string>
#include <utility>
#include <vector>

namespace pocketbase {

// Ordered query parameters; order is preserved on the wire.
using QueryParams = std::vector<std::pair<std::string, std::string>>;

// Percent-encode a string per RFC 3986.
// Unreserved characters (alphanumeric, '-', '_', '.', '~') pass through;
// everything else is replaced with %XX (uppercase hex).
std::string UrlEncode(const std::string& value);

// Render "?k1=v1&k2=v2" with keys and values percent-encoded.
// Returns an empty string for empty params.
std::string BuildQueryString(const QueryParams& params);

} // namespace pocketbase
