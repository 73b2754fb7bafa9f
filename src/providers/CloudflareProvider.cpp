#include "providers/CloudflareProvider.hpp"

#include "common/Errors.hpp"
#include "common/Logger.hpp"
#include "common/Validation.hpp"
#include "http/Url.hpp"
#include "providers/ProviderResponse.hpp"

#include <utility>
#include <vector>

namespace ddns::providers {

namespace {

/// "code: message, code: message" from the envelope's errors[] array.
std::string formatErrors(const nlohmann::json& jEnvelope) {
  if (!jEnvelope.is_object()) {
    return {};
  }
  auto it = jEnvelope.find("errors");
  if (it == jEnvelope.end() || !it->is_array()) {
    return {};
  }
  std::string sOut;
  for (const auto& jErr : *it) {
    if (!jErr.is_object()) {
      continue;
    }
    if (!sOut.empty()) {
      sOut += ", ";
    }
    sOut += jErr.contains("code") ? jErr["code"].dump() : std::string("?");
    sOut += ": ";
    if (jErr.contains("message") && jErr["message"].is_string()) {
      sOut += jErr["message"].get<std::string>();
    }
  }
  return sOut;
}

common::DnsRecord toRecord(const nlohmann::json& jRecord) {
  try {
    common::DnsRecord dr;
    dr.sProviderRecordId = jRecord.at("id").get<std::string>();
    dr.sName = jRecord.at("name").get<std::string>();
    dr.sType = jRecord.at("type").get<std::string>();
    dr.sContent = jRecord.at("content").get<std::string>();
    if (auto it = jRecord.find("ttl"); it != jRecord.end() && it->is_number_unsigned()) {
      dr.oTtl = it->get<uint32_t>();
    }
    return dr;
  } catch (const nlohmann::json::exception& ex) {
    throw common::ProviderError("invalid_response",
                                std::string("Cloudflare returned a malformed DNS record: ") +
                                    ex.what());
  }
}

}  // namespace

CloudflareProvider::CloudflareProvider(std::string sApiEndpoint, std::string sToken,
                                       const http::IHttpClient& hcClient)
    : _sApiEndpoint(std::move(sApiEndpoint)), _sToken(std::move(sToken)), _hcClient(hcClient) {
  while (!_sApiEndpoint.empty() && _sApiEndpoint.back() == '/') {
    _sApiEndpoint.pop_back();
  }
}

CloudflareProvider::~CloudflareProvider() = default;

std::string CloudflareProvider::name() const { return "cloudflare"; }

nlohmann::json CloudflareProvider::call(const std::string& sMethod, const std::string& sPath,
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
  nlohmann::json jEnvelope = parseJsonBody("Cloudflare", hrs);
  const std::string sErrors = formatErrors(jEnvelope);
  throwForStatus("Cloudflare", hrs, sErrors);

  const bool bSuccess = jEnvelope.is_object() && jEnvelope.contains("success") &&
                        jEnvelope["success"].is_boolean() && jEnvelope["success"].get<bool>();
  if (!bSuccess) {
    throw common::ProviderError("provider_error", "Cloudflare API error: " +
                                                      (sErrors.empty() ? "unknown" : sErrors));
  }
  return jEnvelope;
}

std::optional<common::DnsRecord> CloudflareProvider::findRecord(const std::string& sZone,
                                                                const std::string& sHostname) {
  const std::string sName = common::normalizeHostname(sHostname);
  nlohmann::json jEnvelope =
      call("GET",
           "/zones/" + http::urlEncode(sZone) + "/dns_records?type=A&name=" +
               http::urlEncode(sName),
           std::nullopt);

  auto it = jEnvelope.find("result");
  if (it == jEnvelope.end() || !it->is_array()) {
    throw common::ProviderError("invalid_response",
                                "Cloudflare list response has no result array");
  }

  std::vector<common::DnsRecord> vMatches;
  for (const auto& jRecord : *it) {
    common::DnsRecord dr = toRecord(jRecord);
    if (dr.sType == "A" && common::normalizeHostname(dr.sName) == sName) {
      vMatches.push_back(std::move(dr));
    }
  }

  common::Logger::get()->debug("Cloudflare: {} A record(s) named {} in zone {}",
                               vMatches.size(), sName, sZone);
  if (vMatches.empty()) {
    return std::nullopt;
  }
  if (vMatches.size() > 1) {
    throw common::AmbiguousRecordError(
        "ambiguous_record", "Found " + std::to_string(vMatches.size()) + " A records named " +
                                sName + " in zone " + sZone);
  }
  return vMatches.front();
}

common::DnsRecord CloudflareProvider::createRecord(const std::string& sZone,
                                                   const std::string& sHostname,
                                                   const std::string& sIp) {
  // ttl 1 means "automatic" on Cloudflare
  const nlohmann::json jBody = {
      {"type", "A"},
      {"name", common::normalizeHostname(sHostname)},
      {"content", sIp},
      {"ttl", 1},
      {"proxied", false},
  };
  nlohmann::json jEnvelope = call("POST", "/zones/" + http::urlEncode(sZone) + "/dns_records",
                                  jBody);
  if (!jEnvelope.contains("result") || !jEnvelope["result"].is_object()) {
    throw common::ProviderError("invalid_response", "No result in Cloudflare create response");
  }
  return toRecord(jEnvelope["result"]);
}

common::DnsRecord CloudflareProvider::updateRecord(const std::string& sZone,
                                                   const std::string& sRecordId,
                                                   const std::string& sIp) {
  const nlohmann::json jBody = {{"content", sIp}};
  nlohmann::json jEnvelope = call(
      "PATCH",
      "/zones/" + http::urlEncode(sZone) + "/dns_records/" + http::urlEncode(sRecordId), jBody);
  if (!jEnvelope.contains("result") || !jEnvelope["result"].is_object()) {
    throw common::ProviderError("invalid_response", "No result in Cloudflare update response");
  }
  return toRecord(jEnvelope["result"]);
}

}  // namespace ddns::providers
