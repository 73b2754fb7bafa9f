#pragma once

#include <cstdint>
#include <map>
#include <optional>
#include <string>

namespace ddns::common {

/// A-record as seen by providers. Never cached; always fetched fresh.
/// Class abbreviation: dr
struct DnsRecord {
  std::string sProviderRecordId;
  std::string sName;
  std::string sType = "A";
  std::string sContent;
  std::optional<uint32_t> oTtl;
};

/// One configured provider entry, immutable after startup.
/// Class abbreviation: pc
struct ProviderConfig {
  std::string sName;
  std::string sKind;
  std::string sZoneId;
  std::optional<std::string> oApiEndpoint;
  std::map<std::string, std::string> mCredentials;
};

/// Transient per-call request parsed from the URL path.
/// Class abbreviation: ur
struct UpdateRequest {
  std::string sProviderName;
  std::string sHostname;
  std::string sIp;
};

/// What a reconciliation actually did to the remote zone.
enum class UpdateOutcome { Created, Updated, Unchanged, Failed };

/// Result of a reconciliation.
/// Class abbreviation: ures
struct UpdateResult {
  bool bSuccess = false;
  std::string sMessage;
  std::optional<std::string> oRecordId;
  std::string sError;
  UpdateOutcome outcome = UpdateOutcome::Failed;

  static UpdateResult succeeded(UpdateOutcome outcome, std::string sMessage,
                                std::string sRecordId);
  static UpdateResult failed(std::string sError);
};

}  // namespace ddns::common
