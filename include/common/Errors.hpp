#pragma once

#include <stdexcept>
#include <string>
#include <utility>

namespace ddns::common {

/// Base error for all application-level exceptions.
/// Carries HTTP status code and machine-readable error code slug.
struct AppError : public std::runtime_error {
  int _iHttpStatus;
  std::string _sErrorCode;

  explicit AppError(int iHttpStatus, std::string sCode, std::string sMsg)
      : std::runtime_error(std::move(sMsg)),
        _iHttpStatus(iHttpStatus),
        _sErrorCode(std::move(sCode)) {}
};

/// 400 Bad Request: malformed IP or hostname. Never retried.
struct ValidationError : AppError {
  explicit ValidationError(std::string sCode, std::string sMsg)
      : AppError(400, std::move(sCode), std::move(sMsg)) {}
};

/// 404 Not Found: unknown provider token in the request path.
struct ProviderNotFoundError : AppError {
  explicit ProviderNotFoundError(std::string sCode, std::string sMsg)
      : AppError(404, std::move(sCode), std::move(sMsg)) {}
};

/// 502 Bad Gateway: upstream DNS provider error.
/// Base for every failure raised by a provider client.
struct ProviderError : AppError {
  explicit ProviderError(std::string sCode, std::string sMsg)
      : AppError(502, std::move(sCode), std::move(sMsg)) {}

 protected:
  ProviderError(int iHttpStatus, std::string sCode, std::string sMsg)
      : AppError(iHttpStatus, std::move(sCode), std::move(sMsg)) {}
};

/// Provider rejected the configured credentials.
struct ProviderAuthError : ProviderError {
  explicit ProviderAuthError(std::string sCode, std::string sMsg)
      : ProviderError(401, std::move(sCode), std::move(sMsg)) {}
};

/// Provider is throttling us. Surfaced to the caller, never retried here.
struct RateLimitedError : ProviderError {
  explicit RateLimitedError(std::string sCode, std::string sMsg)
      : ProviderError(429, std::move(sCode), std::move(sMsg)) {}
};

/// Network or HTTP failure (timeouts included). Remote state is unknown.
struct TransportError : ProviderError {
  explicit TransportError(std::string sCode, std::string sMsg)
      : ProviderError(502, std::move(sCode), std::move(sMsg)) {}
};

/// More than one A record matches the hostname in the zone.
struct AmbiguousRecordError : ProviderError {
  explicit AmbiguousRecordError(std::string sCode, std::string sMsg)
      : ProviderError(409, std::move(sCode), std::move(sMsg)) {}
};

/// Zone or record vanished. Consumed by the create fallback on update.
struct RecordNotFoundError : ProviderError {
  explicit RecordNotFoundError(std::string sCode, std::string sMsg)
      : ProviderError(404, std::move(sCode), std::move(sMsg)) {}
};

}  // namespace ddns::common
