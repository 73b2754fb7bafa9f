#pragma once

#include <chrono>
#include <string>

#include <crow.h>

namespace ddns::api {

/// Crow middleware writing one line per request to the "access" logger:
///   METHOD path?query "user-agent" client-ip status length 1.234ms
/// Class abbreviation: alm
struct AccessLogMiddleware {
  struct context {
    std::chrono::steady_clock::time_point tpStart;
  };

  void before_handle(crow::request& req, crow::response& res, context& ctx);
  void after_handle(crow::request& req, crow::response& res, context& ctx);

  /// First X-Forwarded-For entry, else X-Real-IP, else the socket peer, else "-".
  static std::string clientIp(const std::string& sForwardedFor, const std::string& sRealIp,
                              const std::string& sPeer);

  static std::string formatLine(const std::string& sMethod, const std::string& sPath,
                                const std::string& sUserAgent, const std::string& sClientIp,
                                int iStatus, size_t uLength, double dMillis);
};

/// The application type shared by ApiServer and the route classes.
using DdnsApp = crow::App<AccessLogMiddleware>;

}  // namespace ddns::api
