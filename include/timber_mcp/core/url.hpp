#pragma once

#include <string>
#include <string_view>

namespace timber_mcp {

// Percent-encode a string per RFC 3986.
// Unreserved characters (alphanumeric, '-', '_', '.', '~') pass through;
// everything else is replaced with %XX (uppercase hex).
std::string UrlEncode(std::string_view value);

// Percent-encode every segment of a '/'-separated path, keeping the slashes.
std::string UrlEncodePath(std::string_view path);

} // namespace timber_mcp
