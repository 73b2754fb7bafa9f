#pragma once

#include <crow.h>

#include "api/AccessLogMiddleware.hpp"

namespace ddns::api::routes {

/// Handler for /health. Liveness only; never touches a provider.
/// Class abbreviation: hr
class HealthRoutes {
 public:
  HealthRoutes();
  ~HealthRoutes();

  /// Register health routes on the Crow app.
  void registerRoutes(DdnsApp& app);

  /// GET /health
  crow::response health() const;
};

}  // namespace ddns::api::routes
