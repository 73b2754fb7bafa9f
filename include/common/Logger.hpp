#pragma once

#include <memory>
#include <string>

#include <spdlog/spdlog.h>

namespace ddns::common {

/// Thin wrapper over spdlog for structured logging.
/// Uses spdlog's default logger to avoid static destruction order issues.
/// Class abbreviation: N/A (static interface)
///
/// Usage:
///   Logger::init("debug");
///   Logger::get()->info("Server listening on {}:{}", sHost, iPort);
///   Logger::access()->info("GET /health ...");
class Logger {
 public:
  /// Initialize the application and access loggers with the given level string.
  /// Valid levels: "trace", "debug", "info", "warn", "error", "critical", "off"
  static void init(const std::string& sLevel);

  /// Get the shared application logger ("ddns").
  /// Returns spdlog's default logger (always valid).
  static std::shared_ptr<spdlog::logger> get();

  /// Get the per-request access logger ("access").
  static std::shared_ptr<spdlog::logger> access();

 private:
  static bool _bInitialized;
};

}  // namespace ddns::common
