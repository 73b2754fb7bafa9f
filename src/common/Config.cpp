#include "common/Config.hpp"

#include <openssl/crypto.h>
#include <spdlog/common.h>

#include <cstdint>
#include <cstdlib>
#include <fstream>
#include <limits>
#include <set>
#include <sstream>
#include <stdexcept>
#include <string>

namespace ddns::common {

namespace {

constexpr const char* kFileSuffix = "_file";
constexpr int kMaxHttpThreads = 65535;

bool endsWith(const std::string& sValue, const std::string& sSuffix) {
  return sValue.size() > sSuffix.size() &&
         sValue.compare(sValue.size() - sSuffix.size(), sSuffix.size(), sSuffix) == 0;
}

std::string requireString(const nlohmann::json& jEntry, const char* pKey, size_t uIndex) {
  auto it = jEntry.find(pKey);
  if (it == jEntry.end() || !it->is_string() || it->get<std::string>().empty()) {
    throw std::runtime_error("providers[" + std::to_string(uIndex) + "]: '" + pKey +
                             "' is required and must be a non-empty string");
  }
  return it->get<std::string>();
}

int readInt(const nlohmann::json& jServer, const char* pKey, int iDefault) {
  auto it = jServer.find(pKey);
  if (it == jServer.end()) {
    return iDefault;
  }
  if (!it->is_number_integer()) {
    throw std::runtime_error(std::string("server.") + pKey + " must be an integer");
  }
  // Range-check before narrowing; get<int>() would silently wrap
  const bool bInRange =
      it->is_number_unsigned()
          ? it->get<uint64_t>() <= static_cast<uint64_t>(std::numeric_limits<int>::max())
          : it->get<int64_t>() >= std::numeric_limits<int>::min() &&
                it->get<int64_t>() <= std::numeric_limits<int>::max();
  if (!bInRange) {
    throw std::runtime_error(std::string("server.") + pKey + " is out of range: " + it->dump());
  }
  return static_cast<int>(it->get<int64_t>());
}

std::string readString(const nlohmann::json& jServer, const char* pKey,
                       const std::string& sDefault) {
  auto it = jServer.find(pKey);
  if (it == jServer.end()) {
    return sDefault;
  }
  if (!it->is_string()) {
    throw std::runtime_error(std::string("server.") + pKey + " must be a string");
  }
  return it->get<std::string>();
}

}  // namespace

std::string Config::getEnv(const char* pVarName) {
  const char* pValue = std::getenv(pVarName);
  return pValue ? std::string(pValue) : std::string{};
}

int Config::getEnvInt(const char* pVarName, int iDefault) {
  const std::string sValue = getEnv(pVarName);
  if (sValue.empty()) {
    return iDefault;
  }
  try {
    size_t uPos = 0;
    int iValue = std::stoi(sValue, &uPos);
    if (uPos != sValue.size()) {
      throw std::invalid_argument(sValue);
    }
    return iValue;
  } catch (const std::logic_error&) {
    throw std::runtime_error(
        std::string("Invalid integer value for ") + pVarName + ": " + sValue);
  }
}

std::string Config::readSecretFile(const std::string& sPath, const std::string& sField) {
  std::ifstream ifs(sPath);
  if (!ifs.is_open()) {
    throw std::runtime_error("Cannot open secret file for '" + sField + "': " + sPath);
  }

  std::ostringstream oss;
  oss << ifs.rdbuf();
  std::string sValue = oss.str();

  // Trim trailing whitespace/newlines
  while (!sValue.empty() &&
         (sValue.back() == '\n' || sValue.back() == '\r' || sValue.back() == ' ' ||
          sValue.back() == '\t')) {
    sValue.pop_back();
  }

  if (sValue.empty()) {
    throw std::runtime_error("Secret file is empty: " + sPath + " (for '" + sField + "')");
  }
  return sValue;
}

ProviderConfig Config::parseProvider(const nlohmann::json& jEntry, size_t uIndex) {
  if (!jEntry.is_object()) {
    throw std::runtime_error("providers[" + std::to_string(uIndex) + "] must be an object");
  }

  ProviderConfig pc;
  pc.sName = requireString(jEntry, "name", uIndex);
  pc.sKind = requireString(jEntry, "type", uIndex);
  pc.sZoneId = requireString(jEntry, "zone_id", uIndex);

  for (const auto& [sKey, jValue] : jEntry.items()) {
    if (sKey == "name" || sKey == "type" || sKey == "zone_id") {
      continue;
    }
    if (!jValue.is_string()) {
      throw std::runtime_error("providers[" + std::to_string(uIndex) + "] ('" + pc.sName +
                               "'): '" + sKey + "' must be a string");
    }
    if (sKey == "api_endpoint") {
      pc.oApiEndpoint = jValue.get<std::string>();
      continue;
    }
    if (endsWith(sKey, kFileSuffix)) {
      const std::string sField = sKey.substr(0, sKey.size() - std::string(kFileSuffix).size());
      pc.mCredentials[sField] = readSecretFile(jValue.get<std::string>(), sField);
      continue;
    }
    // An inline value never overrides one already loaded from *_file
    pc.mCredentials.emplace(sKey, jValue.get<std::string>());
  }
  return pc;
}

void Config::validate(const Config& cfg) {
  if (cfg.iHttpPort < 1 || cfg.iHttpPort > 65535) {
    throw std::runtime_error("HTTP port must be within 1..65535 (got " +
                             std::to_string(cfg.iHttpPort) + ")");
  }
  if (cfg.iHttpThreads < 1 || cfg.iHttpThreads > kMaxHttpThreads) {
    throw std::runtime_error("HTTP threads must be within 1.." +
                             std::to_string(kMaxHttpThreads) + " (got " +
                             std::to_string(cfg.iHttpThreads) + ")");
  }
  if (cfg.iProviderTimeoutSeconds < 1) {
    throw std::runtime_error("Provider timeout must be >= 1 second (got " +
                             std::to_string(cfg.iProviderTimeoutSeconds) + ")");
  }
  if (cfg.iProviderConnectTimeoutSeconds < 1) {
    throw std::runtime_error("Provider connect timeout must be >= 1 second (got " +
                             std::to_string(cfg.iProviderConnectTimeoutSeconds) + ")");
  }

  // spdlog maps unknown names to "off"; a typo must not silence logging
  if (spdlog::level::from_str(cfg.sLogLevel) == spdlog::level::off && cfg.sLogLevel != "off") {
    throw std::runtime_error("Unknown log level: '" + cfg.sLogLevel + "'");
  }

  std::set<std::string> setNames;
  for (const auto& pc : cfg.vProviders) {
    if (!setNames.insert(pc.sName).second) {
      throw std::runtime_error("Duplicate provider name in configuration: " + pc.sName);
    }
  }
}

Config Config::fromJson(const nlohmann::json& jDoc) {
  if (!jDoc.is_object()) {
    throw std::runtime_error("Configuration root must be a JSON object");
  }

  Config cfg;

  // ── Server section (optional) ──────────────────────────────────────────
  if (auto it = jDoc.find("server"); it != jDoc.end()) {
    if (!it->is_object()) {
      throw std::runtime_error("'server' must be an object");
    }
    cfg.sHttpHost = readString(*it, "host", cfg.sHttpHost);
    cfg.iHttpPort = readInt(*it, "port", cfg.iHttpPort);
    cfg.iHttpThreads = readInt(*it, "threads", cfg.iHttpThreads);
    cfg.sLogLevel = readString(*it, "log_level", cfg.sLogLevel);
    cfg.iProviderTimeoutSeconds =
        readInt(*it, "provider_timeout_seconds", cfg.iProviderTimeoutSeconds);
    cfg.iProviderConnectTimeoutSeconds =
        readInt(*it, "provider_connect_timeout_seconds", cfg.iProviderConnectTimeoutSeconds);
  }

  // ── Providers (required) ───────────────────────────────────────────────
  auto itProviders = jDoc.find("providers");
  if (itProviders == jDoc.end() || !itProviders->is_array()) {
    throw std::runtime_error("'providers' is required and must be an array");
  }
  for (size_t i = 0; i < itProviders->size(); ++i) {
    cfg.vProviders.push_back(parseProvider((*itProviders)[i], i));
  }

  validate(cfg);
  return cfg;
}

Config Config::load(const std::string& sConfigPath) {
  std::string sPath = sConfigPath.empty() ? getEnv("DDNS_CONFIG_FILE") : sConfigPath;
  if (sPath.empty()) {
    sPath = "config.json";
  }

  std::ifstream ifs(sPath);
  if (!ifs.is_open()) {
    throw std::runtime_error("Failed to read config file: " + sPath);
  }
  std::ostringstream oss;
  oss << ifs.rdbuf();
  std::string sRaw = oss.str();

  nlohmann::json jDoc;
  try {
    jDoc = nlohmann::json::parse(sRaw);
  } catch (const nlohmann::json::parse_error& ex) {
    OPENSSL_cleanse(sRaw.data(), sRaw.size());
    throw std::runtime_error("Failed to parse config file " + sPath + ": " + ex.what());
  }

  // The raw buffer holds provider credentials
  OPENSSL_cleanse(sRaw.data(), sRaw.size());

  Config cfg = fromJson(jDoc);
  cfg.sConfigFile = sPath;

  // ── Environment overrides ──────────────────────────────────────────────
  const std::string sHost = getEnv("DDNS_HTTP_HOST");
  if (!sHost.empty()) {
    cfg.sHttpHost = sHost;
  }
  cfg.iHttpPort = getEnvInt("DDNS_HTTP_PORT", cfg.iHttpPort);
  cfg.iHttpThreads = getEnvInt("DDNS_HTTP_THREADS", cfg.iHttpThreads);
  const std::string sLogLevel = getEnv("DDNS_LOG_LEVEL");
  if (!sLogLevel.empty()) {
    cfg.sLogLevel = sLogLevel;
  }
  cfg.iProviderTimeoutSeconds =
      getEnvInt("DDNS_PROVIDER_TIMEOUT_SECONDS", cfg.iProviderTimeoutSeconds);
  cfg.iProviderConnectTimeoutSeconds =
      getEnvInt("DDNS_PROVIDER_CONNECT_TIMEOUT_SECONDS", cfg.iProviderConnectTimeoutSeconds);

  validate(cfg);
  return cfg;
}

const ProviderConfig* Config::findProvider(const std::string& sName) const {
  for (const auto& pc : vProviders) {
    if (pc.sName == sName) {
      return &pc;
    }
  }
  return nullptr;
}

}  // namespace ddns::common
