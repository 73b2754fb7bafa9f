#include "api/ApiServer.hpp"

#include "common/Logger.hpp"

namespace ddns::api {

ApiServer::ApiServer(const providers::ProviderRegistry& prRegistry,
                     const core::ReconciliationService& rsService)
    : _ddrRoutes(prRegistry, rsService) {
  // Requests are logged by AccessLogMiddleware; keep Crow's own logger quiet
  _app.loglevel(crow::LogLevel::Warning);
}

ApiServer::~ApiServer() = default;

void ApiServer::registerRoutes() {
  _hrRoutes.registerRoutes(_app);
  _ddrRoutes.registerRoutes(_app);
}

void ApiServer::start(const std::string& sHost, int iPort, int iThreads) {
  auto spLog = common::Logger::get();
  spLog->info("Server listening on http://{}:{} ({} threads)", sHost, iPort, iThreads);
  spLog->info("DDNS endpoint: GET /ddns/{provider}/{host}/{ip}");

  _app.bindaddr(sHost)
      .port(static_cast<uint16_t>(iPort))
      .concurrency(static_cast<uint16_t>(iThreads))
      .run();
}

void ApiServer::stop() { _app.stop(); }

}  // namespace ddns::api
