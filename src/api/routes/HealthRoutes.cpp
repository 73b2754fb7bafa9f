#include "api/routes/HealthRoutes.hpp"

#include <nlohmann/json.hpp>

namespace ddns::api::routes {

HealthRoutes::HealthRoutes() = default;
HealthRoutes::~HealthRoutes() = default;

void HealthRoutes::registerRoutes(DdnsApp& app) {
  // GET /health
  CROW_ROUTE(app, "/health").methods("GET"_method)([this]() { return health(); });
}

crow::response HealthRoutes::health() const {
  nlohmann::json jResp = {{"status", "ok"}};
  crow::response resp(200, jResp.dump());
  resp.set_header("Content-Type", "application/json");
  return resp;
}

}  // namespace ddns::api::routes
