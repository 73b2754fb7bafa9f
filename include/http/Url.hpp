#pragma once

#include <string>

namespace ddns::http {

/// Percent-encode a query or path component via curl_easy_escape
/// (RFC 3986 unreserved kept as-is). Throws std::bad_alloc on failure.
std::string urlEncode(const std::string& sValue);

}  // namespace ddns::http
