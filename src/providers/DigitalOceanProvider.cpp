#include "providers/DigitalOceanProvider.hpp"

#include "common/Errors.hpp"
#include "common/Logger.hpp"
#include "common/Validation.hpp"
#include "http/Url.hpp"
#include "providers/ProviderResponse.hpp"

#include <utility>
#include <vector>

namespace ddns::providers {

namespace {

/// "www" + "example.com" -> "www.example.com"; "@" is the apex.
std::string toFqdn(const std::string& sRelative, const std::string& sZone) {
  if (sRelative == "@" || sRelative.empty()) {
    return sZone;
  }
  return sRelative + "." + sZone;
}

/// Inverse of toFqdn. Throws ValidationError for names outside the zone.
std::string toRelative(const std::string& sFqdn, const std::string& sZone) {
  if (sFqdn == sZone) {
    return "@";
  }
  const std::string sSuffix = "." + sZone;
  if (sFqdn.size() > sSuffix.size() &&
      sFqdn.compare(sFqdn.size() - sSuffix.size(), sSuffix.size(), sSuffix) == 0) {
    return sFqdn.substr(0, sFqdn.size() - sSuffix.size());
  }
  throw common::ValidationError("invalid_input",
                                "Hostname " + sFqdn + " is not inside domain " + sZone);
}

common::DnsRecord toRecord(const nlohmann::json& jRecord, const std::string& sZone) {
  try {
    common::DnsRecord dr;
    const auto& jId = jRecord.at("id");
    dr.sProviderRecordId = jId.is_string() ? jId.get<std::string>() : jId.dump();
    dr.sName = toFqdn(jRecord.at("name").get<std::string>(), sZone);
    dr.sType = jRecord.at("type").get<std::string>();
    dr.sContent = jRecord.at("data").get<std::string>();
    if (auto it = jRecord.find("ttl"); it != jRecord.end() && it->is_number_unsigned()) {
      dr.oTtl = it->get<uint32_t>();
    }
    return dr;
  } catch (const nlohmann::json::exception& ex) {
    throw common::ProviderError("invalid_response",
                                std::string("DigitalOcean returned a malformed DNS record: ") +
                                    ex.what());
  }
}

const nlohmann::json& singleRecord(const nlohmann::json& jBody) {
  if (!jBody.is_object() || !jBody.contains("domain_record") ||
      !jBody["domain_record"].is_object()) {
    throw common::ProviderError("invalid_response",
                                "No domain_record in DigitalOcean response");
  }
  return jBody["domain_record"];
}

}  // namespace

DigitalOceanProvider::DigitalOceanProvider(std::string sApiEndpoint, std::string sToken,
                                           const http::IHttpClient& hcClient)
    : _sApiEndpoint(std::move(sApiEndpoint)), _sToken(std::move(sToken)), _hcClient(hcClient) {
  while (!_sApiEndpoint.empty() && _sApiEndpoint.back() == '/') {
    _sApiEndpoint.pop_back();
  }
}

DigitalOceanProvider::~DigitalOceanProvider() = default;

std::string DigitalOceanProvider::name() const { return "digitalocean"; }

nlohmann::json DigitalOceanProvider::call(const std::string& sMethod, const std::string& sPath,
                                          const std::optional<nlohmann::json>& ojBody) const {
  http::HttpRequest hrq;
  hrq.sMethod = sMethod;
  hrq.sUrl = _sApiEndpoint + sPath;
  hrq.mHeaders["Authorization"] = "Bearer " + _sToken;
  hrq.mHeaders["Content-Type"] = "application/json";
  if (ojBody) {
    hrq.sBody = ojBody->dump();
  }

  const http::HttpResponse hrs = _hcClient.send(hrq);
  nlohmann::json jBody = parseJsonBody("DigitalOcean", hrs);

  // Error bodies look like {"id":"unauthorized","message":"..."}
  std::string sDetail;
  if (jBody.is_object() && jBody.contains("message") && jBody["message"].is_string()) {
    const bool bHasId = jBody.contains("id") && jBody["id"].is_string();
    sDetail = (bHasId ? jBody["id"].get<std::string>() : std::string("error")) + ": " +
              jBody["message"].get<std::string>();
  }
  throwForStatus("DigitalOcean", hrs, sDetail);
  return jBody;
}

std::optional<common::DnsRecord> DigitalOceanProvider::findRecord(
    const std::string& sZone, const std::string& sHostname) {
  const std::string sDomain = common::normalizeHostname(sZone);
  const std::string sName = common::normalizeHostname(sHostname);
  nlohmann::json jBody = call("GET",
                              "/domains/" + http::urlEncode(sDomain) +
                                  "/records?type=A&per_page=200&name=" + http::urlEncode(sName),
                              std::nullopt);

  if (!jBody.is_object() || !jBody.contains("domain_records") ||
      !jBody["domain_records"].is_array()) {
    throw common::ProviderError("invalid_response",
                                "DigitalOcean list response has no domain_records array");
  }

  std::vector<common::DnsRecord> vMatches;
  for (const auto& jRecord : jBody["domain_records"]) {
    common::DnsRecord dr = toRecord(jRecord, sDomain);
    if (dr.sType == "A" && common::normalizeHostname(dr.sName) == sName) {
      vMatches.push_back(std::move(dr));
    }
  }

  common::Logger::get()->debug("DigitalOcean: {} A record(s) named {} in domain {}",
                               vMatches.size(), sName, sDomain);
  if (vMatches.empty()) {
    return std::nullopt;
  }
  if (vMatches.size() > 1) {
    throw common::AmbiguousRecordError(
        "ambiguous_record", "Found " + std::to_string(vMatches.size()) + " A records named " +
                                sName + " in domain " + sDomain);
  }
  return vMatches.front();
}

common::DnsRecord DigitalOceanProvider::createRecord(const std::string& sZone,
                                                     const std::string& sHostname,
                                                     const std::string& sIp) {
  const std::string sDomain = common::normalizeHostname(sZone);
  const nlohmann::json jBody = {
      {"type", "A"},
      {"name", toRelative(common::normalizeHostname(sHostname), sDomain)},
      {"data", sIp},
      {"ttl", kDefaultTtl},
  };
  nlohmann::json jResp =
      call("POST", "/domains/" + http::urlEncode(sDomain) + "/records", jBody);
  return toRecord(singleRecord(jResp), sDomain);
}

common::DnsRecord DigitalOceanProvider::updateRecord(const std::string& sZone,
                                                     const std::string& sRecordId,
                                                     const std::string& sIp) {
  const std::string sDomain = common::normalizeHostname(sZone);
  const nlohmann::json jBody = {{"data", sIp}};
  nlohmann::json jResp = call("PATCH",
                              "/domains/" + http::urlEncode(sDomain) + "/records/" +
                                  http::urlEncode(sRecordId),
                              jBody);
  return toRecord(singleRecord(jResp), sDomain);
}

}  // namespace ddns::providers
