#include "common/Types.hpp"

#include <utility>

namespace ddns::common {

UpdateResult UpdateResult::succeeded(UpdateOutcome outcome, std::string sMessage,
                                     std::string sRecordId) {
  UpdateResult ures;
  ures.bSuccess = true;
  ures.sMessage = std::move(sMessage);
  ures.oRecordId = std::move(sRecordId);
  ures.outcome = outcome;
  return ures;
}

UpdateResult UpdateResult::failed(std::string sError) {
  UpdateResult ures;
  ures.sError = std::move(sError);
  return ures;
}

}  // namespace ddns::common
