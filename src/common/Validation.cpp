#include "common/Validation.hpp"

#include <arpa/inet.h>

#include <algorithm>
#include <cctype>

namespace ddns::common {

bool isValidIpv4(const std::string& sIp) {
  if (sIp.empty() || sIp.size() > 15) {
    return false;
  }
  in_addr addr{};
  return inet_pton(AF_INET, sIp.c_str(), &addr) == 1;
}

bool isValidHostname(const std::string& sHostname) {
  std::string sName = sHostname;
  if (!sName.empty() && sName.back() == '.') {
    sName.pop_back();
  }
  if (sName.empty() || sName.size() > 253) {
    return false;
  }

  size_t uStart = 0;
  while (uStart <= sName.size()) {
    size_t uEnd = sName.find('.', uStart);
    if (uEnd == std::string::npos) {
      uEnd = sName.size();
    }
    const size_t uLen = uEnd - uStart;
    if (uLen == 0 || uLen > 63) {
      return false;
    }
    if (sName[uStart] == '-' || sName[uEnd - 1] == '-') {
      return false;
    }
    for (size_t i = uStart; i < uEnd; ++i) {
      const auto c = static_cast<unsigned char>(sName[i]);
      if (!std::isalnum(c) && c != '-' && c != '_') {
        return false;
      }
    }
    uStart = uEnd + 1;
  }
  return true;
}

std::string normalizeHostname(const std::string& sHostname) {
  std::string sName = sHostname;
  if (!sName.empty() && sName.back() == '.') {
    sName.pop_back();
  }
  std::transform(sName.begin(), sName.end(), sName.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return sName;
}

}  // namespace ddns::common
