#include "http/Url.hpp"

#include <curl/curl.h>

#include <memory>
#include <new>

namespace ddns::http {

std::string urlEncode(const std::string& sValue) {
  // The handle argument is ignored by libcurl >= 7.82 and may be null
  std::unique_ptr<char, decltype(&curl_free)> upEscaped(
      curl_easy_escape(nullptr, sValue.c_str(), static_cast<int>(sValue.size())), &curl_free);
  if (!upEscaped) {
    throw std::bad_alloc();
  }
  return std::string(upEscaped.get());
}

}  // namespace ddns::http
