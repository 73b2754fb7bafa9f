#pragma once

#include <string>

#include "api/AccessLogMiddleware.hpp"
#include "api/routes/DdnsRoutes.hpp"
#include "api/routes/HealthRoutes.hpp"

namespace ddns::providers {
class ProviderRegistry;
}

namespace ddns::core {
class ReconciliationService;
}

namespace ddns::api {

/// Owns the Crow application instance; registers all routes at startup.
/// Class abbreviation: api
class ApiServer {
 public:
  ApiServer(const providers::ProviderRegistry& prRegistry,
            const core::ReconciliationService& rsService);
  ~ApiServer();

  void registerRoutes();

  /// Bind and serve; blocks until stop() or SIGINT/SIGTERM.
  void start(const std::string& sHost, int iPort, int iThreads);
  void stop();

 private:
  DdnsApp _app;
  routes::HealthRoutes _hrRoutes;
  routes::DdnsRoutes _ddrRoutes;
};

}  // namespace ddns::api
