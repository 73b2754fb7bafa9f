#pragma once

#include <string>

#include "common/Types.hpp"

namespace ddns::providers {
class IProvider;
}

namespace ddns::core {

/// Find-then-upsert of a single A record through one provider client.
/// Stateless: every call re-queries the provider, nothing is cached, and
/// concurrent calls share nothing but the (thread-safe) client.
/// Class abbreviation: rs
class ReconciliationService {
 public:
  ReconciliationService();
  ~ReconciliationService();

  /// Validate input, then create, update or leave unchanged the A record
  /// named sHostname in sZone so that it points at sIp.
  /// Never throws for provider or input errors; they are reported through
  /// UpdateResult{bSuccess=false}. A record deleted between find and
  /// update is recreated once.
  common::UpdateResult reconcile(providers::IProvider& ipClient, const std::string& sZone,
                                 const std::string& sHostname, const std::string& sIp) const;

  /// IPv4 first, then hostname. Throws common::ValidationError
  /// ("Invalid IP address: X" / "Invalid hostname: X").
  static void validateInput(const std::string& sHostname, const std::string& sIp);

 private:
  /// Steps after validation; provider errors propagate as exceptions.
  common::UpdateResult upsert(providers::IProvider& ipClient, const std::string& sZone,
                              const std::string& sHostname, const std::string& sIp) const;
};

}  // namespace ddns::core
