#pragma once

#include <optional>
#include <string>

#include "common/Types.hpp"

namespace ddns::providers {

/// Pure abstract interface for all DNS provider integrations.
/// Every operation throws a common::ProviderError subtype on failure:
/// ProviderAuthError, RateLimitedError, RecordNotFoundError, TransportError,
/// AmbiguousRecordError (find only) or plain ProviderError. A hostname the
/// provider cannot place in the zone raises common::ValidationError.
class IProvider {
 public:
  virtual ~IProvider() = default;

  virtual std::string name() const = 0;

  /// Existing A record for sHostname in sZone; nullopt when there is none.
  virtual std::optional<common::DnsRecord> findRecord(const std::string& sZone,
                                                      const std::string& sHostname) = 0;
  virtual common::DnsRecord createRecord(const std::string& sZone,
                                         const std::string& sHostname,
                                         const std::string& sIp) = 0;
  /// Changes only the address of the record, keeping its id and other attributes.
  virtual common::DnsRecord updateRecord(const std::string& sZone,
                                         const std::string& sRecordId,
                                         const std::string& sIp) = 0;
};

}  // namespace ddns::providers
