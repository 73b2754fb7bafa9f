#pragma once

#include <memory>
#include <optional>
#include <string>

#include "common/Types.hpp"
#include "http/IHttpClient.hpp"
#include "providers/IProvider.hpp"

namespace ddns::providers {

/// Closed set of supported provider kinds.
enum class ProviderKind { Cloudflare, DigitalOcean };

/// Creates concrete IProvider instances from a ProviderConfig.
class ProviderFactory {
 public:
  /// "cloudflare" / "digitalocean" (case-insensitive); nullopt otherwise.
  static std::optional<ProviderKind> parseKind(const std::string& sKind);

  /// Throws std::runtime_error on an unknown kind or when a credential
  /// required by that kind is missing or empty.
  static std::unique_ptr<IProvider> create(const common::ProviderConfig& pc,
                                           const http::IHttpClient& hcClient);

 private:
  static const std::string& requireCredential(const common::ProviderConfig& pc,
                                              const std::string& sField);
};

}  // namespace ddns::providers
