#include "providers/ProviderFactory.hpp"

#include "providers/CloudflareProvider.hpp"
#include "providers/DigitalOceanProvider.hpp"

#include <algorithm>
#include <cctype>
#include <stdexcept>

namespace ddns::providers {

std::optional<ProviderKind> ProviderFactory::parseKind(const std::string& sKind) {
  std::string sLower = sKind;
  std::transform(sLower.begin(), sLower.end(), sLower.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  if (sLower == "cloudflare") {
    return ProviderKind::Cloudflare;
  }
  if (sLower == "digitalocean") {
    return ProviderKind::DigitalOcean;
  }
  return std::nullopt;
}

const std::string& ProviderFactory::requireCredential(const common::ProviderConfig& pc,
                                                      const std::string& sField) {
  auto it = pc.mCredentials.find(sField);
  if (it == pc.mCredentials.end() || it->second.empty()) {
    throw std::runtime_error("Provider '" + pc.sName + "' (type " + pc.sKind +
                             ") is missing required credential '" + sField + "'");
  }
  return it->second;
}

std::unique_ptr<IProvider> ProviderFactory::create(const common::ProviderConfig& pc,
                                                   const http::IHttpClient& hcClient) {
  const auto oKind = parseKind(pc.sKind);
  if (!oKind) {
    throw std::runtime_error("Provider '" + pc.sName + "' has unsupported type: " + pc.sKind);
  }

  switch (*oKind) {
    case ProviderKind::Cloudflare:
      return std::make_unique<CloudflareProvider>(
          pc.oApiEndpoint.value_or(CloudflareProvider::kDefaultEndpoint),
          requireCredential(pc, "api_key"), hcClient);
    case ProviderKind::DigitalOcean:
      return std::make_unique<DigitalOceanProvider>(
          pc.oApiEndpoint.value_or(DigitalOceanProvider::kDefaultEndpoint),
          requireCredential(pc, "api_token"), hcClient);
  }
  throw std::runtime_error("Provider '" + pc.sName + "' has unsupported type: " + pc.sKind);
}

}  // namespace ddns::providers
