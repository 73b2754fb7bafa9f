#include "common/Logger.hpp"

#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

namespace ddns::common {

namespace {

constexpr const char* kPattern = "[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] [%n] %v";
constexpr const char* kAccessLoggerName = "access";

}  // namespace

bool Logger::_bInitialized = false;

void Logger::init(const std::string& sLevel) {
  auto level = spdlog::level::from_str(sLevel);

  if (_bInitialized) {
    // Re-initialization: just update level
    spdlog::set_level(level);
    return;
  }

  auto spLogger = spdlog::stdout_color_mt("ddns");
  spLogger->set_pattern(kPattern);
  spLogger->set_level(level);
  spdlog::set_default_logger(spLogger);

  auto spAccess = spdlog::stdout_color_mt(kAccessLoggerName);
  spAccess->set_pattern(kPattern);
  spAccess->set_level(level);

  _bInitialized = true;
  spLogger->info("Logger initialized at level '{}'", sLevel);
}

std::shared_ptr<spdlog::logger> Logger::get() {
  if (!_bInitialized) {
    init("info");
  }
  return spdlog::default_logger();
}

std::shared_ptr<spdlog::logger> Logger::access() {
  if (!_bInitialized) {
    init("info");
  }
  auto spAccess = spdlog::get(kAccessLoggerName);
  return spAccess ? spAccess : spdlog::default_logger();
}

}  // namespace ddns::common
