#pragma once

#include <chrono>
#include <string>

#include "http/IHttpClient.hpp"

namespace ddns::http {

/// libcurl-backed IHttpClient. Uses a fresh easy handle per call, so a
/// single instance may be shared by every request thread.
/// The caller owns curl_global_init()/curl_global_cleanup().
/// Class abbreviation: chc
class CurlHttpClient : public IHttpClient {
 public:
  CurlHttpClient(std::chrono::seconds durTimeout, std::chrono::seconds durConnectTimeout);
  ~CurlHttpClient() override;

  HttpResponse send(const HttpRequest& hrq) const override;

 private:
  std::chrono::seconds _durTimeout;
  std::chrono::seconds _durConnectTimeout;
};

}  // namespace ddns::http
