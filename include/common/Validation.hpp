#pragma once

#include <string>

namespace ddns::common {

/// Strict IPv4 dotted-quad check (four decimal octets 0..255, no leading zeros).
bool isValidIpv4(const std::string& sIp);

/// DNS hostname check: 1..253 chars, labels of 1..63 [A-Za-z0-9_-] that do
/// not start or end with '-', optional single trailing dot.
bool isValidHostname(const std::string& sHostname);

/// Lower-cases and drops a trailing dot so names compare equal across providers.
std::string normalizeHostname(const std::string& sHostname);

}  // namespace ddns::common
