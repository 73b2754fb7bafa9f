#pragma once

#include <optional>
#include <string>

#include <nlohmann/json.hpp>

#include "http/IHttpClient.hpp"
#include "providers/IProvider.hpp"

namespace ddns::providers {

/// Cloudflare API v4 provider implementation.
/// Zone is the Cloudflare zone id; the token is sent as a Bearer credential.
/// Class abbreviation: cfp
class CloudflareProvider : public IProvider {
 public:
  static constexpr const char* kDefaultEndpoint = "https://api.cloudflare.com/client/v4";

  CloudflareProvider(std::string sApiEndpoint, std::string sToken,
                     const http::IHttpClient& hcClient);
  ~CloudflareProvider() override;

  std::string name() const override;
  std::optional<common::DnsRecord> findRecord(const std::string& sZone,
                                              const std::string& sHostname) override;
  common::DnsRecord createRecord(const std::string& sZone, const std::string& sHostname,
                                 const std::string& sIp) override;
  common::DnsRecord updateRecord(const std::string& sZone, const std::string& sRecordId,
                                 const std::string& sIp) override;

 private:
  /// Send one API call and return the decoded envelope once "success" is true.
  nlohmann::json call(const std::string& sMethod, const std::string& sPath,
                      const std::optional<nlohmann::json>& ojBody) const;

  std::string _sApiEndpoint;
  std::string _sToken;
  const http::IHttpClient& _hcClient;
};

}  // namespace ddns::providers
