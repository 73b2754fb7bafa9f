#include "core/ReconciliationService.hpp"

#include "common/Errors.hpp"
#include "common/Logger.hpp"
#include "common/Validation.hpp"
#include "providers/IProvider.hpp"

namespace ddns::core {

namespace {

std::string successMessage(const std::string& sHostname, const std::string& sIp) {
  return "Updated record " + sHostname + " to IP " + sIp;
}

const char* outcomeName(common::UpdateOutcome outcome) {
  switch (outcome) {
    case common::UpdateOutcome::Created:
      return "created";
    case common::UpdateOutcome::Updated:
      return "updated";
    case common::UpdateOutcome::Unchanged:
      return "unchanged";
    case common::UpdateOutcome::Failed:
      break;
  }
  return "failed";
}

}  // namespace

ReconciliationService::ReconciliationService() = default;
ReconciliationService::~ReconciliationService() = default;

void ReconciliationService::validateInput(const std::string& sHostname,
                                          const std::string& sIp) {
  if (!common::isValidIpv4(sIp)) {
    throw common::ValidationError("invalid_ip", "Invalid IP address: " + sIp);
  }
  if (!common::isValidHostname(sHostname)) {
    throw common::ValidationError("invalid_hostname", "Invalid hostname: " + sHostname);
  }
}

common::UpdateResult ReconciliationService::reconcile(providers::IProvider& ipClient,
                                                      const std::string& sZone,
                                                      const std::string& sHostname,
                                                      const std::string& sIp) const {
  auto spLog = common::Logger::get();

  try {
    validateInput(sHostname, sIp);
  } catch (const common::ValidationError& e) {
    spLog->warn("Rejected update on {} ({}): {}", ipClient.name(), e._sErrorCode, e.what());
    return common::UpdateResult::failed(e.what());
  }

  try {
    auto ures = upsert(ipClient, sZone, sHostname, sIp);
    spLog->info("DNS update successful: provider={} zone={} host={} ip={} record_id={} ({})",
                ipClient.name(), sZone, sHostname, sIp, ures.oRecordId.value_or("-"),
                outcomeName(ures.outcome));
    return ures;
  } catch (const common::AppError& e) {
    spLog->error("DNS update failed: provider={} zone={} host={} ip={} code={}: {}",
                 ipClient.name(), sZone, sHostname, sIp, e._sErrorCode, e.what());
    return common::UpdateResult::failed(std::string("DNS update failed: ") + e.what());
  } catch (const std::exception& ex) {
    spLog->error("DNS update failed: provider={} zone={} host={} ip={}: unexpected error: {}",
                 ipClient.name(), sZone, sHostname, sIp, ex.what());
    return common::UpdateResult::failed(std::string("DNS update failed: ") + ex.what());
  }
}

common::UpdateResult ReconciliationService::upsert(providers::IProvider& ipClient,
                                                   const std::string& sZone,
                                                   const std::string& sHostname,
                                                   const std::string& sIp) const {
  auto spLog = common::Logger::get();
  const auto oExisting = ipClient.findRecord(sZone, sHostname);

  if (!oExisting) {
    spLog->debug("Creating new record {} with IP {}", sHostname, sIp);
    const auto drCreated = ipClient.createRecord(sZone, sHostname, sIp);
    return common::UpdateResult::succeeded(common::UpdateOutcome::Created,
                                           successMessage(sHostname, sIp),
                                           drCreated.sProviderRecordId);
  }

  if (oExisting->sContent == sIp) {
    spLog->debug("Record {} already has IP {}, no update needed", sHostname, sIp);
    return common::UpdateResult::succeeded(common::UpdateOutcome::Unchanged,
                                           successMessage(sHostname, sIp),
                                           oExisting->sProviderRecordId);
  }

  spLog->debug("Updating existing record {} from {} to {}", sHostname, oExisting->sContent,
               sIp);
  try {
    const auto drUpdated = ipClient.updateRecord(sZone, oExisting->sProviderRecordId, sIp);
    return common::UpdateResult::succeeded(common::UpdateOutcome::Updated,
                                           successMessage(sHostname, sIp),
                                           drUpdated.sProviderRecordId);
  } catch (const common::RecordNotFoundError&) {
    // Deleted between find and update: recreate exactly once
    spLog->warn("Record {} ({}) vanished before update, creating it instead", sHostname,
                oExisting->sProviderRecordId);
  }

  const auto drCreated = ipClient.createRecord(sZone, sHostname, sIp);
  return common::UpdateResult::succeeded(common::UpdateOutcome::Created,
                                         successMessage(sHostname, sIp),
                                         drCreated.sProviderRecordId);
}

}  // namespace ddns::core
