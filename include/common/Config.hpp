#pragma once

#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "common/Types.hpp"

namespace ddns::common {

/// Startup configuration: built-in defaults, then the JSON config file,
/// then DDNS_* environment overrides. Loaded once; never re-read.
/// Class abbreviation: cfg
struct Config {
  // ── Config file ───────────────────────────────────────────────────────
  std::string sConfigFile = "config.json";

  // ── HTTP ──────────────────────────────────────────────────────────────
  std::string sHttpHost = "0.0.0.0";
  int iHttpPort = 3000;
  int iHttpThreads = 4;

  // ── Logging ───────────────────────────────────────────────────────────
  std::string sLogLevel = "info";

  // ── Provider calls ────────────────────────────────────────────────────
  int iProviderTimeoutSeconds = 10;
  int iProviderConnectTimeoutSeconds = 5;

  // ── Providers (configuration order) ───────────────────────────────────
  std::vector<ProviderConfig> vProviders;

  /// Load sConfigPath, else the file named by DDNS_CONFIG_FILE, else
  /// "config.json"; apply environment overrides and validate.
  /// Throws std::runtime_error on any unreadable or invalid input.
  static Config load(const std::string& sConfigPath = {});

  /// Build a Config from an already parsed document. Environment
  /// overrides are not applied. Relative *_file paths resolve against
  /// the process working directory.
  static Config fromJson(const nlohmann::json& jDoc);

  /// Lookup by provider name, nullptr when absent.
  const ProviderConfig* findProvider(const std::string& sName) const;

 private:
  /// Parse one providers[] entry.
  static ProviderConfig parseProvider(const nlohmann::json& jEntry, size_t uIndex);

  /// Read a whole file; trims trailing whitespace/newlines.
  static std::string readSecretFile(const std::string& sPath, const std::string& sField);

  /// Cross-field checks shared by load() and fromJson().
  static void validate(const Config& cfg);

  /// Read an env var, return empty string if unset.
  static std::string getEnv(const char* pVarName);

  /// Read an env var as int with a default value.
  static int getEnvInt(const char* pVarName, int iDefault);
};

}  // namespace ddns::common
