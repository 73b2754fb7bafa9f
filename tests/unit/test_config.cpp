#include "common/Config.hpp"

#include <gtest/gtest.h>

#include <cstdio>
#include <cstdlib>
#include <fstream>
#include <string>

using namespace ddns::common;

namespace {

const char* kConfigPath = "/tmp/ddns_test_config.json";
const char* kSecretPath = "/tmp/ddns_test_cf_token";

void clearAllDdnsEnv() {
  const char* vVars[] = {
      "DDNS_CONFIG_FILE", "DDNS_HTTP_HOST", "DDNS_HTTP_PORT", "DDNS_HTTP_THREADS",
      "DDNS_LOG_LEVEL", "DDNS_PROVIDER_TIMEOUT_SECONDS",
      "DDNS_PROVIDER_CONNECT_TIMEOUT_SECONDS",
      nullptr};
  for (int i = 0; vVars[i] != nullptr; ++i) {
    unsetenv(vVars[i]);
  }
}

void writeFile(const std::string& sPath, const std::string& sContent) {
  std::ofstream ofs(sPath);
  ofs << sContent;
}

const char* kMinimalConfig = R"({
  "providers": [
    {"name": "cloudflare", "type": "cloudflare", "api_key": "cf-token", "zone_id": "zone-1"}
  ]
})";

}  // namespace

class ConfigTest : public ::testing::Test {
 protected:
  void SetUp() override { clearAllDdnsEnv(); }
  void TearDown() override {
    clearAllDdnsEnv();
    std::remove(kConfigPath);
    std::remove(kSecretPath);
  }
};

TEST_F(ConfigTest, LoadWithDefaults) {
  writeFile(kConfigPath, kMinimalConfig);
  setenv("DDNS_CONFIG_FILE", kConfigPath, 1);

  auto cfg = Config::load();
  EXPECT_EQ(cfg.sConfigFile, kConfigPath);
  EXPECT_EQ(cfg.sHttpHost, "0.0.0.0");
  EXPECT_EQ(cfg.iHttpPort, 3000);
  EXPECT_EQ(cfg.iHttpThreads, 4);
  EXPECT_EQ(cfg.sLogLevel, "info");
  EXPECT_EQ(cfg.iProviderTimeoutSeconds, 10);
  EXPECT_EQ(cfg.iProviderConnectTimeoutSeconds, 5);

  ASSERT_EQ(cfg.vProviders.size(), 1u);
  const auto& pc = cfg.vProviders[0];
  EXPECT_EQ(pc.sName, "cloudflare");
  EXPECT_EQ(pc.sKind, "cloudflare");
  EXPECT_EQ(pc.sZoneId, "zone-1");
  EXPECT_FALSE(pc.oApiEndpoint.has_value());
  EXPECT_EQ(pc.mCredentials.at("api_key"), "cf-token");
}

TEST_F(ConfigTest, ThrowsOnMissingFile) {
  setenv("DDNS_CONFIG_FILE", "/tmp/ddns_does_not_exist.json", 1);
  EXPECT_THROW(Config::load(), std::runtime_error);
}

TEST_F(ConfigTest, ThrowsOnMalformedJson) {
  writeFile(kConfigPath, "{ \"providers\": [ ");
  setenv("DDNS_CONFIG_FILE", kConfigPath, 1);
  EXPECT_THROW(Config::load(), std::runtime_error);
}

TEST_F(ConfigTest, ServerSectionOverridesDefaults) {
  auto cfg = Config::fromJson(nlohmann::json::parse(R"({
    "server": {"host": "127.0.0.1", "port": 8053, "log_level": "debug", "threads": 2,
               "provider_timeout_seconds": 7, "provider_connect_timeout_seconds": 3},
    "providers": []
  })"));
  EXPECT_EQ(cfg.sHttpHost, "127.0.0.1");
  EXPECT_EQ(cfg.iHttpPort, 8053);
  EXPECT_EQ(cfg.sLogLevel, "debug");
  EXPECT_EQ(cfg.iHttpThreads, 2);
  EXPECT_EQ(cfg.iProviderTimeoutSeconds, 7);
  EXPECT_EQ(cfg.iProviderConnectTimeoutSeconds, 3);
  EXPECT_TRUE(cfg.vProviders.empty());
}

TEST_F(ConfigTest, EnvironmentOverridesFile) {
  writeFile(kConfigPath, R"({"server": {"port": 8053}, "providers": []})");
  setenv("DDNS_CONFIG_FILE", kConfigPath, 1);
  setenv("DDNS_HTTP_PORT", "9090", 1);
  setenv("DDNS_LOG_LEVEL", "warn", 1);
  setenv("DDNS_PROVIDER_TIMEOUT_SECONDS", "6", 1);

  auto cfg = Config::load();
  EXPECT_EQ(cfg.iHttpPort, 9090);
  EXPECT_EQ(cfg.sLogLevel, "warn");
  EXPECT_EQ(cfg.iProviderTimeoutSeconds, 6);
}

TEST_F(ConfigTest, ThrowsOnNonNumericEnvOverride) {
  writeFile(kConfigPath, kMinimalConfig);
  setenv("DDNS_CONFIG_FILE", kConfigPath, 1);
  setenv("DDNS_HTTP_PORT", "80abc", 1);
  EXPECT_THROW(Config::load(), std::runtime_error);
}

TEST_F(ConfigTest, ProvidersKeepConfigurationOrder) {
  auto cfg = Config::fromJson(nlohmann::json::parse(R"({
    "providers": [
      {"name": "zeta", "type": "cloudflare", "api_key": "a", "zone_id": "z1"},
      {"name": "alpha", "type": "digitalocean", "api_token": "b", "zone_id": "example.com",
       "api_endpoint": "http://127.0.0.1:8080/v2"}
    ]
  })"));
  ASSERT_EQ(cfg.vProviders.size(), 2u);
  EXPECT_EQ(cfg.vProviders[0].sName, "zeta");
  EXPECT_EQ(cfg.vProviders[1].sName, "alpha");
  EXPECT_EQ(cfg.vProviders[1].oApiEndpoint.value_or(""), "http://127.0.0.1:8080/v2");
  EXPECT_EQ(cfg.vProviders[1].mCredentials.count("api_endpoint"), 0u);
  ASSERT_NE(cfg.findProvider("alpha"), nullptr);
  EXPECT_EQ(cfg.findProvider("alpha")->mCredentials.at("api_token"), "b");
  EXPECT_EQ(cfg.findProvider("missing"), nullptr);
}

TEST_F(ConfigTest, ThrowsOnDuplicateProviderNames) {
  EXPECT_THROW(Config::fromJson(nlohmann::json::parse(R"({
    "providers": [
      {"name": "cf", "type": "cloudflare", "api_key": "a", "zone_id": "z1"},
      {"name": "cf", "type": "cloudflare", "api_key": "b", "zone_id": "z2"}
    ]
  })")),
               std::runtime_error);
}

TEST_F(ConfigTest, ThrowsOnMissingRequiredProviderFields) {
  EXPECT_THROW(Config::fromJson(nlohmann::json::parse(
                   R"({"providers": [{"type": "cloudflare", "zone_id": "z"}]})")),
               std::runtime_error);
  EXPECT_THROW(Config::fromJson(nlohmann::json::parse(
                   R"({"providers": [{"name": "cf", "zone_id": "z"}]})")),
               std::runtime_error);
  EXPECT_THROW(Config::fromJson(nlohmann::json::parse(
                   R"({"providers": [{"name": "cf", "type": "cloudflare"}]})")),
               std::runtime_error);
  EXPECT_THROW(Config::fromJson(nlohmann::json::parse(R"({"server": {}})")),
               std::runtime_error);
}

TEST_F(ConfigTest, ThrowsOnNonStringCredential) {
  EXPECT_THROW(Config::fromJson(nlohmann::json::parse(R"({
    "providers": [{"name": "cf", "type": "cloudflare", "zone_id": "z", "api_key": 42}]
  })")),
               std::runtime_error);
}

TEST_F(ConfigTest, CredentialFileFallback) {
  writeFile(kSecretPath, "file-token\n");
  nlohmann::json jDoc = {
      {"providers",
       {{{"name", "cf"}, {"type", "cloudflare"}, {"zone_id", "z"},
         {"api_key_file", kSecretPath}}}}};

  auto cfg = Config::fromJson(jDoc);
  ASSERT_EQ(cfg.vProviders.size(), 1u);
  EXPECT_EQ(cfg.vProviders[0].mCredentials.at("api_key"), "file-token");
  EXPECT_EQ(cfg.vProviders[0].mCredentials.count("api_key_file"), 0u);
}

TEST_F(ConfigTest, ThrowsOnEmptyOrMissingCredentialFile) {
  writeFile(kSecretPath, "\n");
  nlohmann::json jDoc = {
      {"providers",
       {{{"name", "cf"}, {"type", "cloudflare"}, {"zone_id", "z"},
         {"api_key_file", kSecretPath}}}}};
  EXPECT_THROW(Config::fromJson(jDoc), std::runtime_error);

  jDoc["providers"][0]["api_key_file"] = "/tmp/ddns_no_such_secret";
  EXPECT_THROW(Config::fromJson(jDoc), std::runtime_error);
}

TEST_F(ConfigTest, PortMustBeInRange) {
  EXPECT_THROW(Config::fromJson(nlohmann::json::parse(
                   R"({"server": {"port": 0}, "providers": []})")),
               std::runtime_error);
  EXPECT_THROW(Config::fromJson(nlohmann::json::parse(
                   R"({"server": {"port": 70000}, "providers": []})")),
               std::runtime_error);
}

TEST_F(ConfigTest, TimeoutsMustBePositive) {
  EXPECT_THROW(Config::fromJson(nlohmann::json::parse(
                   R"({"server": {"provider_timeout_seconds": 0}, "providers": []})")),
               std::runtime_error);
  EXPECT_THROW(Config::fromJson(nlohmann::json::parse(
                   R"({"server": {"threads": 0}, "providers": []})")),
               std::runtime_error);
}

TEST_F(ConfigTest, ThrowsOnIntegerThatDoesNotFitInt) {
  // 4294970296 == 2^32 + 3000; must not wrap to a valid port
  EXPECT_THROW(Config::fromJson(nlohmann::json::parse(
                   R"({"server": {"port": 4294970296}, "providers": []})")),
               std::runtime_error);
  EXPECT_THROW(Config::fromJson(nlohmann::json::parse(
                   R"({"server": {"threads": -4294967295}, "providers": []})")),
               std::runtime_error);
  EXPECT_THROW(Config::fromJson(nlohmann::json::parse(
                   R"({"server": {"provider_timeout_seconds": 18446744073709551615},
                       "providers": []})")),
               std::runtime_error);
}

TEST_F(ConfigTest, ThreadsMustBeInRange) {
  EXPECT_THROW(Config::fromJson(nlohmann::json::parse(
                   R"({"server": {"threads": 70000}, "providers": []})")),
               std::runtime_error);
  auto cfg = Config::fromJson(nlohmann::json::parse(
      R"({"server": {"threads": 65535}, "providers": []})"));
  EXPECT_EQ(cfg.iHttpThreads, 65535);
}

TEST_F(ConfigTest, ThreadsEnvOverrideMustBeInRange) {
  writeFile(kConfigPath, kMinimalConfig);
  setenv("DDNS_CONFIG_FILE", kConfigPath, 1);
  setenv("DDNS_HTTP_THREADS", "70000", 1);
  EXPECT_THROW(Config::load(), std::runtime_error);
}

TEST_F(ConfigTest, ThrowsOnUnknownLogLevel) {
  EXPECT_THROW(Config::fromJson(nlohmann::json::parse(
                   R"({"server": {"log_level": "inf"}, "providers": []})")),
               std::runtime_error);

  writeFile(kConfigPath, kMinimalConfig);
  setenv("DDNS_CONFIG_FILE", kConfigPath, 1);
  setenv("DDNS_LOG_LEVEL", "verbose", 1);
  EXPECT_THROW(Config::load(), std::runtime_error);
}

TEST_F(ConfigTest, AcceptsKnownLogLevels) {
  for (const char* pLevel : {"trace", "debug", "info", "warn", "error", "critical", "off"}) {
    nlohmann::json jDoc = {{"server", {{"log_level", pLevel}}},
                           {"providers", nlohmann::json::array()}};
    EXPECT_EQ(Config::fromJson(jDoc).sLogLevel, pLevel);
  }
}

TEST_F(ConfigTest, ExplicitPathTakesPrecedenceOverEnvironment) {
  writeFile(kConfigPath, R"({"server": {"port": 8053}, "providers": []})");
  setenv("DDNS_CONFIG_FILE", "/tmp/ddns_does_not_exist.json", 1);

  auto cfg = Config::load(kConfigPath);
  EXPECT_EQ(cfg.sConfigFile, kConfigPath);
  EXPECT_EQ(cfg.iHttpPort, 8053);
}
