#pragma once

#include <cstdint>
#include <optional>
#include <string>

#include <nlohmann/json.hpp>

#include "http/IHttpClient.hpp"
#include "providers/IProvider.hpp"

namespace ddns::providers {

/// DigitalOcean API v2 /domains provider implementation.
/// Zone is the domain name; record names on the wire are relative to it.
/// Class abbreviation: dop
class DigitalOceanProvider : public IProvider {
 public:
  static constexpr const char* kDefaultEndpoint = "https://api.digitalocean.com/v2";
  static constexpr uint32_t kDefaultTtl = 1800;

  DigitalOceanProvider(std::string sApiEndpoint, std::string sToken,
                       const http::IHttpClient& hcClient);
  ~DigitalOceanProvider() override;

  std::string name() const override;
  std::optional<common::DnsRecord> findRecord(const std::string& sZone,
                                              const std::string& sHostname) override;
  common::DnsRecord createRecord(const std::string& sZone, const std::string& sHostname,
                                 const std::string& sIp) override;
  common::DnsRecord updateRecord(const std::string& sZone, const std::string& sRecordId,
                                 const std::string& sIp) override;

 private:
  nlohmann::json call(const std::string& sMethod, const std::string& sPath,
                      const std::optional<nlohmann::json>& ojBody) const;

  std::string _sApiEndpoint;
  std::string _sToken;
  const http::IHttpClient& _hcClient;
};

}  // namespace ddns::providers
