#include "providers/ProviderResponse.hpp"

#include "common/Errors.hpp"

namespace ddns::providers {

void throwForStatus(const std::string& sProvider, const http::HttpResponse& hrs,
                    const std::string& sVendorDetail) {
  if (hrs.iStatus >= 200 && hrs.iStatus < 300) {
    return;
  }

  std::string sMsg = sProvider + " API returned HTTP " + std::to_string(hrs.iStatus);
  if (!sVendorDetail.empty()) {
    sMsg += ": " + sVendorDetail;
  }

  switch (hrs.iStatus) {
    case 401:
    case 403:
      throw common::ProviderAuthError("auth_error", sMsg);
    case 404:
      throw common::RecordNotFoundError("not_found", sMsg);
    case 429:
      throw common::RateLimitedError("rate_limited", sMsg);
    default:
      break;
  }
  if (hrs.iStatus >= 500) {
    throw common::TransportError("transport", sMsg);
  }
  throw common::ProviderError("provider_error", sMsg);
}

nlohmann::json parseJsonBody(const std::string& sProvider, const http::HttpResponse& hrs) {
  try {
    return nlohmann::json::parse(hrs.sBody);
  } catch (const nlohmann::json::parse_error&) {
    // Status-derived errors take precedence over a garbled body
    throwForStatus(sProvider, hrs, "");
    throw common::ProviderError(
        "invalid_response",
        sProvider + " API returned a non-JSON body (HTTP " + std::to_string(hrs.iStatus) + ")");
  }
}

}  // namespace ddns::providers
