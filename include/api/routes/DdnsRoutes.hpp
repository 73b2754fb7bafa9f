#pragma once

#include <string>

#include <crow.h>
#include <nlohmann/json.hpp>

#include "api/AccessLogMiddleware.hpp"
#include "common/Types.hpp"

namespace ddns::providers {
class ProviderRegistry;
}

namespace ddns::core {
class ReconciliationService;
}

namespace ddns::api::routes {

/// Handler for GET /ddns/{provider}/{host}/{ip}.
/// Always answers 200; the outcome is carried in the JSON envelope.
/// Class abbreviation: ddr
class DdnsRoutes {
 public:
  DdnsRoutes(const providers::ProviderRegistry& prRegistry,
             const core::ReconciliationService& rsService);
  ~DdnsRoutes();

  /// Register DDNS routes on the Crow app.
  void registerRoutes(DdnsApp& app);

  /// Resolve the provider and reconcile. Never throws.
  common::UpdateResult handleUpdate(const common::UpdateRequest& ur) const;

  /// GET /ddns/{provider}/{host}/{ip}
  crow::response update(const std::string& sProvider, const std::string& sHost,
                        const std::string& sIp) const;

  /// {"success":true,"message":...,"record_id":...} or {"success":false,"error":...}
  static nlohmann::ordered_json toJson(const common::UpdateResult& ures);

 private:
  const providers::ProviderRegistry& _prRegistry;
  const core::ReconciliationService& _rsService;
};

}  // namespace ddns::api::routes
