#pragma once

#include <string>

#include <nlohmann/json.hpp>

#include "http/IHttpClient.hpp"

namespace ddns::providers {

/// Map a non-2xx provider response to the common::ProviderError hierarchy.
/// sVendorDetail is appended to the message when non-empty.
/// Returns normally for 2xx.
void throwForStatus(const std::string& sProvider, const http::HttpResponse& hrs,
                    const std::string& sVendorDetail);

/// Parse a provider response body as JSON; throws common::ProviderError
/// ("invalid_response") on malformed bodies.
nlohmann::json parseJsonBody(const std::string& sProvider, const http::HttpResponse& hrs);

}  // namespace ddns::providers
