#include "providers/ProviderRegistry.hpp"

#include "common/Errors.hpp"

#include <stdexcept>

namespace ddns::providers {

ProviderRegistry::ProviderRegistry(const std::vector<common::ProviderConfig>& vConfigs,
                                   const ProviderBuilder& fnBuild) {
  for (const auto& pc : vConfigs) {
    if (_mByName.count(pc.sName) > 0) {
      throw std::runtime_error("Duplicate provider name in configuration: " + pc.sName);
    }

    auto upClient = fnBuild(pc);
    if (!upClient) {
      throw std::runtime_error("Provider '" + pc.sName + "' could not be constructed");
    }

    auto upEntry = std::make_unique<RegisteredProvider>(
        RegisteredProvider{pc.sName, pc.sZoneId, std::move(upClient)});
    _mByName.emplace(pc.sName, upEntry.get());
    _vEntries.push_back(std::move(upEntry));
  }
}

ProviderRegistry::~ProviderRegistry() = default;

const RegisteredProvider* ProviderRegistry::resolve(const std::string& sName) const {
  auto it = _mByName.find(sName);
  return it == _mByName.end() ? nullptr : it->second;
}

const RegisteredProvider& ProviderRegistry::require(const std::string& sName) const {
  const RegisteredProvider* pEntry = resolve(sName);
  if (pEntry == nullptr) {
    throw common::ProviderNotFoundError("provider_not_found", "Provider not found: " + sName);
  }
  return *pEntry;
}

std::vector<std::string> ProviderRegistry::names() const {
  std::vector<std::string> vNames;
  vNames.reserve(_vEntries.size());
  for (const auto& upEntry : _vEntries) {
    vNames.push_back(upEntry->sName);
  }
  return vNames;
}

}  // namespace ddns::providers
