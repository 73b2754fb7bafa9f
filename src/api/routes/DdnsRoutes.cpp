#include "api/routes/DdnsRoutes.hpp"

#include "common/Errors.hpp"
#include "common/Logger.hpp"
#include "core/ReconciliationService.hpp"
#include "providers/ProviderRegistry.hpp"

namespace ddns::api::routes {

DdnsRoutes::DdnsRoutes(const providers::ProviderRegistry& prRegistry,
                       const core::ReconciliationService& rsService)
    : _prRegistry(prRegistry), _rsService(rsService) {}

DdnsRoutes::~DdnsRoutes() = default;

void DdnsRoutes::registerRoutes(DdnsApp& app) {
  // GET /ddns/{provider}/{host}/{ip}
  CROW_ROUTE(app, "/ddns/<string>/<string>/<string>").methods("GET"_method)(
      [this](std::string sProvider, std::string sHost, std::string sIp) {
        return update(sProvider, sHost, sIp);
      });
}

common::UpdateResult DdnsRoutes::handleUpdate(const common::UpdateRequest& ur) const {
  try {
    const auto& rp = _prRegistry.require(ur.sProviderName);
    return _rsService.reconcile(*rp.upClient, rp.sZoneId, ur.sHostname, ur.sIp);
  } catch (const common::ProviderNotFoundError& e) {
    common::Logger::get()->warn("{} ({})", e.what(), e._sErrorCode);
    return common::UpdateResult::failed(e.what());
  }
}

crow::response DdnsRoutes::update(const std::string& sProvider, const std::string& sHost,
                                  const std::string& sIp) const {
  const auto ures = handleUpdate(common::UpdateRequest{sProvider, sHost, sIp});
  crow::response resp(200, toJson(ures).dump());
  resp.set_header("Content-Type", "application/json");
  return resp;
}

nlohmann::ordered_json DdnsRoutes::toJson(const common::UpdateResult& ures) {
  nlohmann::ordered_json jResp;
  jResp["success"] = ures.bSuccess;
  if (!ures.bSuccess) {
    jResp["error"] = ures.sError;
    return jResp;
  }
  jResp["message"] = ures.sMessage;
  if (ures.oRecordId) {
    jResp["record_id"] = *ures.oRecordId;
  }
  return jResp;
}

}  // namespace ddns::api::routes
