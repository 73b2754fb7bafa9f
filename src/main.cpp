#include <chrono>
#include <cstdlib>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>

#include "api/ApiServer.hpp"
#include "common/Config.hpp"
#include "common/Logger.hpp"
#include "core/ReconciliationService.hpp"
#include "http/CurlHttpClient.hpp"
#include "providers/ProviderFactory.hpp"
#include "providers/ProviderRegistry.hpp"

#include <curl/curl.h>

namespace {

/// curl_global_init/cleanup for the lifetime of main().
class CurlGlobal {
 public:
  CurlGlobal() {
    if (curl_global_init(CURL_GLOBAL_DEFAULT) != CURLE_OK) {
      throw std::runtime_error("curl_global_init failed");
    }
  }
  ~CurlGlobal() { curl_global_cleanup(); }

  CurlGlobal(const CurlGlobal&) = delete;
  CurlGlobal& operator=(const CurlGlobal&) = delete;
};

void printUsage(const char* pProgram) {
  std::cerr << "Usage: " << pProgram << " [-c|--config PATH]\n"
            << "  PATH defaults to $DDNS_CONFIG_FILE, then ./config.json\n";
}

}  // namespace

int main(int argc, char* argv[]) {
  std::string sConfigPath;
  for (int i = 1; i < argc; ++i) {
    const std::string sArg = argv[i];
    if (sArg == "-c" || sArg == "--config") {
      if (i + 1 >= argc) {
        std::cerr << "Missing value for " << sArg << "\n";
        printUsage(argv[0]);
        return EXIT_FAILURE;
      }
      sConfigPath = argv[++i];
    } else if (sArg.rfind("--config=", 0) == 0) {
      sConfigPath = sArg.substr(9);
    } else if (sArg == "-h" || sArg == "--help") {
      printUsage(argv[0]);
      return EXIT_SUCCESS;
    } else {
      std::cerr << "Unknown argument: " << sArg << "\n";
      printUsage(argv[0]);
      return EXIT_FAILURE;
    }
  }

  try {
    // ── Step 1: Load and validate configuration ──────────────────────────
    const auto cfgApp = ddns::common::Config::load(sConfigPath);

    // Initialize logger with configured level
    ddns::common::Logger::init(cfgApp.sLogLevel);
    auto spLog = ddns::common::Logger::get();
    spLog->info("Step 1: Configuration loaded from {}", cfgApp.sConfigFile);

    // ── Step 2: Outbound HTTP client ─────────────────────────────────────
    CurlGlobal cgCurl;
    auto upHttp = std::make_unique<ddns::http::CurlHttpClient>(
        std::chrono::seconds(cfgApp.iProviderTimeoutSeconds),
        std::chrono::seconds(cfgApp.iProviderConnectTimeoutSeconds));
    spLog->info("Step 2: HTTP client ready (timeout={}s, connect timeout={}s)",
                cfgApp.iProviderTimeoutSeconds, cfgApp.iProviderConnectTimeoutSeconds);

    // ── Step 3: Provider registry (fails fast on bad provider config) ────
    const auto& hcClient = *upHttp;
    auto upRegistry = std::make_unique<ddns::providers::ProviderRegistry>(
        cfgApp.vProviders, [&hcClient](const ddns::common::ProviderConfig& pc) {
          return ddns::providers::ProviderFactory::create(pc, hcClient);
        });

    std::string sNames;
    for (const auto& sName : upRegistry->names()) {
      sNames += sNames.empty() ? sName : ", " + sName;
    }
    spLog->info("Step 3: Loaded {} provider(s): [{}]", upRegistry->size(), sNames);
    if (upRegistry->size() == 0) {
      spLog->warn("No providers configured; every DDNS update will fail");
    }

    // ── Step 4: Reconciliation service ───────────────────────────────────
    auto upService = std::make_unique<ddns::core::ReconciliationService>();
    spLog->info("Step 4: ReconciliationService ready");

    // ── Step 5: API routes + HTTP server ─────────────────────────────────
    ddns::api::ApiServer apiServer(*upRegistry, *upService);
    apiServer.registerRoutes();
    spLog->info("Step 5: API routes registered");

    apiServer.start(cfgApp.sHttpHost, cfgApp.iHttpPort, cfgApp.iHttpThreads);

    spLog->info("ddns-relay stopped");
    return EXIT_SUCCESS;
  } catch (const std::exception& ex) {
    std::cerr << "[fatal] startup failed: " << ex.what() << "\n";
    return EXIT_FAILURE;
  }
}
