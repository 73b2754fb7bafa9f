#pragma once

#include <map>
#include <string>

namespace ddns::http {

/// Outbound request to a provider API.
/// Class abbreviation: hrq
struct HttpRequest {
  std::string sMethod = "GET";
  std::string sUrl;
  std::map<std::string, std::string> mHeaders;
  std::string sBody;
};

/// Raw provider response. Non-2xx statuses are data, not exceptions.
/// Class abbreviation: hrs
struct HttpResponse {
  long iStatus = 0;
  std::string sBody;
};

/// Pure abstract interface for the blocking HTTP client used by providers.
/// Implementations must be safe to call from concurrent request handlers.
class IHttpClient {
 public:
  virtual ~IHttpClient() = default;

  /// Perform the request. Throws common::TransportError when no HTTP
  /// response was obtained (DNS, connect, TLS, timeout).
  virtual HttpResponse send(const HttpRequest& hrq) const = 0;
};

}  // namespace ddns::http
