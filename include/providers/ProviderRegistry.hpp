#pragma once

#include <functional>
#include <memory>
#include <string>
#include <unordered_map>
#include <vector>

#include "common/Types.hpp"
#include "providers/IProvider.hpp"

namespace ddns::providers {

/// Builds the client for one configured provider.
using ProviderBuilder =
    std::function<std::unique_ptr<IProvider>(const common::ProviderConfig&)>;

/// A constructed provider client together with its zone scope.
/// Class abbreviation: rp
struct RegisteredProvider {
  std::string sName;
  std::string sZoneId;
  std::unique_ptr<IProvider> upClient;
};

/// Maps configured provider names to constructed clients.
/// Built once at startup and read-only afterwards, so concurrent
/// resolve() calls need no locking.
/// Class abbreviation: pr
class ProviderRegistry {
 public:
  /// Throws std::runtime_error on duplicate names or when fnBuild fails
  /// (unknown kind, missing credentials) or returns null.
  ProviderRegistry(const std::vector<common::ProviderConfig>& vConfigs,
                   const ProviderBuilder& fnBuild);
  ~ProviderRegistry();

  ProviderRegistry(const ProviderRegistry&) = delete;
  ProviderRegistry& operator=(const ProviderRegistry&) = delete;

  /// nullptr when no provider is configured under sName.
  const RegisteredProvider* resolve(const std::string& sName) const;

  /// Like resolve(), but throws common::ProviderNotFoundError when absent.
  const RegisteredProvider& require(const std::string& sName) const;

  /// Provider names in configuration order.
  std::vector<std::string> names() const;

  size_t size() const { return _vEntries.size(); }

 private:
  std::vector<std::unique_ptr<RegisteredProvider>> _vEntries;
  std::unordered_map<std::string, const RegisteredProvider*> _mByName;
};

}  // namespace ddns::providers
