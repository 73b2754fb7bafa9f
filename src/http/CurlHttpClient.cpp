#include "http/CurlHttpClient.hpp"

#include "common/Errors.hpp"
#include "common/Logger.hpp"

#include <curl/curl.h>

#include <memory>

namespace ddns::http {

namespace {

size_t writeCallback(char* pData, size_t uSize, size_t uCount, void* pUser) {
  auto* pBody = static_cast<std::string*>(pUser);
  pBody->append(pData, uSize * uCount);
  return uSize * uCount;
}

struct CurlEasyDeleter {
  void operator()(CURL* pCurl) const { curl_easy_cleanup(pCurl); }
};

struct CurlSlistDeleter {
  void operator()(curl_slist* pList) const { curl_slist_free_all(pList); }
};

}  // namespace

CurlHttpClient::CurlHttpClient(std::chrono::seconds durTimeout,
                               std::chrono::seconds durConnectTimeout)
    : _durTimeout(durTimeout), _durConnectTimeout(durConnectTimeout) {}

CurlHttpClient::~CurlHttpClient() = default;

HttpResponse CurlHttpClient::send(const HttpRequest& hrq) const {
  std::unique_ptr<CURL, CurlEasyDeleter> upCurl(curl_easy_init());
  if (!upCurl) {
    throw common::TransportError("transport", "Failed to initialise HTTP client handle");
  }

  std::unique_ptr<curl_slist, CurlSlistDeleter> upHeaders;
  for (const auto& [sName, sValue] : hrq.mHeaders) {
    const std::string sLine = sName + ": " + sValue;
    curl_slist* pAppended = curl_slist_append(upHeaders.get(), sLine.c_str());
    if (pAppended == nullptr) {
      throw common::TransportError("transport", "Failed to build request headers");
    }
    upHeaders.release();
    upHeaders.reset(pAppended);
  }

  HttpResponse hrs;
  char vErrBuf[CURL_ERROR_SIZE] = {0};

  CURL* pCurl = upCurl.get();
  curl_easy_setopt(pCurl, CURLOPT_URL, hrq.sUrl.c_str());
  curl_easy_setopt(pCurl, CURLOPT_CUSTOMREQUEST, hrq.sMethod.c_str());
  curl_easy_setopt(pCurl, CURLOPT_HTTPHEADER, upHeaders.get());
  curl_easy_setopt(pCurl, CURLOPT_WRITEFUNCTION, writeCallback);
  curl_easy_setopt(pCurl, CURLOPT_WRITEDATA, &hrs.sBody);
  curl_easy_setopt(pCurl, CURLOPT_ERRORBUFFER, vErrBuf);
  curl_easy_setopt(pCurl, CURLOPT_NOSIGNAL, 1L);
  curl_easy_setopt(pCurl, CURLOPT_TIMEOUT_MS,
                   static_cast<long>(std::chrono::milliseconds(_durTimeout).count()));
  curl_easy_setopt(pCurl, CURLOPT_CONNECTTIMEOUT_MS,
                   static_cast<long>(std::chrono::milliseconds(_durConnectTimeout).count()));
  curl_easy_setopt(pCurl, CURLOPT_USERAGENT, "ddns-relay/1.0");
  if (!hrq.sBody.empty()) {
    curl_easy_setopt(pCurl, CURLOPT_POSTFIELDS, hrq.sBody.c_str());
    curl_easy_setopt(pCurl, CURLOPT_POSTFIELDSIZE, static_cast<long>(hrq.sBody.size()));
  }

  const CURLcode rc = curl_easy_perform(pCurl);
  if (rc != CURLE_OK) {
    const std::string sDetail = vErrBuf[0] != '\0' ? vErrBuf : curl_easy_strerror(rc);
    common::Logger::get()->debug("HTTP {} {} failed: {}", hrq.sMethod, hrq.sUrl, sDetail);
    if (rc == CURLE_OPERATION_TIMEDOUT) {
      throw common::TransportError("transport", "Provider request timed out: " + sDetail);
    }
    throw common::TransportError("transport", "Provider request failed: " + sDetail);
  }

  curl_easy_getinfo(pCurl, CURLINFO_RESPONSE_CODE, &hrs.iStatus);
  common::Logger::get()->debug("HTTP {} {} -> {}", hrq.sMethod, hrq.sUrl, hrs.iStatus);
  return hrs;
}

}  // namespace ddns::http
