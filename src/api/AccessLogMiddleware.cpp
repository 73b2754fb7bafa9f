#include "api/AccessLogMiddleware.hpp"

#include "common/Logger.hpp"

#include <spdlog/fmt/fmt.h>

namespace ddns::api {

namespace {

std::string trim(const std::string& sValue) {
  const auto uFirst = sValue.find_first_not_of(" \t");
  if (uFirst == std::string::npos) {
    return {};
  }
  const auto uLast = sValue.find_last_not_of(" \t");
  return sValue.substr(uFirst, uLast - uFirst + 1);
}

}  // namespace

void AccessLogMiddleware::before_handle(crow::request& /*req*/, crow::response& /*res*/,
                                        context& ctx) {
  ctx.tpStart = std::chrono::steady_clock::now();
}

void AccessLogMiddleware::after_handle(crow::request& req, crow::response& res,
                                       context& ctx) {
  const auto durElapsed = std::chrono::steady_clock::now() - ctx.tpStart;
  const double dMillis = std::chrono::duration<double, std::milli>(durElapsed).count();

  const std::string sUserAgent = req.get_header_value("User-Agent");
  const std::string sIp = clientIp(req.get_header_value("X-Forwarded-For"),
                                   req.get_header_value("X-Real-IP"), req.remote_ip_address);

  common::Logger::access()->info(formatLine(crow::method_name(req.method), req.raw_url,
                                            sUserAgent.empty() ? "-" : sUserAgent, sIp,
                                            res.code, res.body.size(), dMillis));
}

std::string AccessLogMiddleware::clientIp(const std::string& sForwardedFor,
                                          const std::string& sRealIp,
                                          const std::string& sPeer) {
  if (!sForwardedFor.empty()) {
    const std::string sFirst = trim(sForwardedFor.substr(0, sForwardedFor.find(',')));
    return sFirst.empty() ? "-" : sFirst;
  }
  if (!sRealIp.empty()) {
    return trim(sRealIp);
  }
  return sPeer.empty() ? "-" : sPeer;
}

std::string AccessLogMiddleware::formatLine(const std::string& sMethod,
                                            const std::string& sPath,
                                            const std::string& sUserAgent,
                                            const std::string& sClientIp, int iStatus,
                                            size_t uLength, double dMillis) {
  return fmt::format("{} {} \"{}\" {} {} {} {:.3f}ms", sMethod, sPath, sUserAgent, sClientIp,
                     iStatus, uLength, dMillis);
}

}  // namespace ddns::api
