#include "http/CurlHttpClient.hpp"

#include "common/Errors.hpp"
#include "core/ReconciliationService.hpp"
#include "http/Url.hpp"
#include "providers/CloudflareProvider.hpp"

#include <gtest/gtest.h>

#include <arpa/inet.h>
#include <fcntl.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <unistd.h>

#include <chrono>
#include <cstdint>
#include <stdexcept>
#include <string>

using ddns::common::TransportError;
using ddns::core::ReconciliationService;
using ddns::http::CurlHttpClient;
using ddns::http::HttpRequest;
using ddns::providers::CloudflareProvider;

namespace {

/// Loopback listener that lets the kernel complete handshakes into the
/// backlog but never reads or answers.
class SilentListener {
 public:
  SilentListener() {
    _iFd = ::socket(AF_INET, SOCK_STREAM, 0);
    if (_iFd < 0) {
      throw std::runtime_error("socket() failed");
    }
    sockaddr_in saAddr{};
    saAddr.sin_family = AF_INET;
    saAddr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
    saAddr.sin_port = 0;
    socklen_t uLen = sizeof(saAddr);
    if (::bind(_iFd, reinterpret_cast<sockaddr*>(&saAddr), sizeof(saAddr)) != 0 ||
        ::listen(_iFd, 8) != 0 ||
        ::getsockname(_iFd, reinterpret_cast<sockaddr*>(&saAddr), &uLen) != 0) {
      ::close(_iFd);
      throw std::runtime_error("Failed to open loopback listener");
    }
    _uPort = ntohs(saAddr.sin_port);
  }

  ~SilentListener() {
    if (_iFd >= 0) {
      ::close(_iFd);
    }
  }

  SilentListener(const SilentListener&) = delete;
  SilentListener& operator=(const SilentListener&) = delete;

  std::string baseUrl() const { return "http://127.0.0.1:" + std::to_string(_uPort); }

  /// Drain the accept queue; returns how many connections were made.
  int acceptPending() {
    ::fcntl(_iFd, F_SETFL, ::fcntl(_iFd, F_GETFL, 0) | O_NONBLOCK);
    int iCount = 0;
    for (int iConn = ::accept(_iFd, nullptr, nullptr); iConn >= 0;
         iConn = ::accept(_iFd, nullptr, nullptr)) {
      ::close(iConn);
      ++iCount;
    }
    return iCount;
  }

 private:
  int _iFd = -1;
  uint16_t _uPort = 0;
};

}  // namespace

class CurlHttpClientTest : public ::testing::Test {
 protected:
  CurlHttpClient _chc{std::chrono::seconds(1), std::chrono::seconds(1)};
};

TEST_F(CurlHttpClientTest, SilentServerTimesOutAsTransportError) {
  SilentListener sl;
  HttpRequest hrq;
  hrq.sUrl = sl.baseUrl() + "/client/v4/zones";

  const auto tpStart = std::chrono::steady_clock::now();
  try {
    _chc.send(hrq);
    FAIL() << "expected TransportError";
  } catch (const TransportError& e) {
    EXPECT_EQ(e._sErrorCode, "transport");
    EXPECT_EQ(std::string(e.what()).rfind("Provider request timed out", 0), 0u) << e.what();
  }
  const auto durElapsed = std::chrono::steady_clock::now() - tpStart;
  EXPECT_LT(durElapsed, std::chrono::seconds(5));
  EXPECT_EQ(sl.acceptPending(), 1);
}

TEST_F(CurlHttpClientTest, RefusedConnectionIsTransportError) {
  std::string sUrl;
  {
    SilentListener sl;
    sUrl = sl.baseUrl() + "/";
  }
  HttpRequest hrq;
  hrq.sUrl = sUrl;

  try {
    _chc.send(hrq);
    FAIL() << "expected TransportError";
  } catch (const TransportError& e) {
    EXPECT_EQ(std::string(e.what()).rfind("Provider request failed", 0), 0u) << e.what();
  }
}

TEST_F(CurlHttpClientTest, ReconcileSurfacesTimeoutWithoutRetry) {
  SilentListener sl;
  CloudflareProvider cfp(sl.baseUrl() + "/client/v4", "token", _chc);
  ReconciliationService rs;

  auto ures = rs.reconcile(cfp, "zone-1", "home.example.com", "1.2.3.4");

  EXPECT_FALSE(ures.bSuccess);
  EXPECT_EQ(ures.sError.rfind("DNS update failed: Provider request timed out", 0), 0u)
      << ures.sError;
  EXPECT_EQ(sl.acceptPending(), 1);
}

TEST(UrlTest, EncodesReservedCharacters) {
  EXPECT_EQ(ddns::http::urlEncode("home.example.com"), "home.example.com");
  EXPECT_EQ(ddns::http::urlEncode("a-b_c~d"), "a-b_c~d");
  EXPECT_EQ(ddns::http::urlEncode("a b/c?d=e&f"), "a%20b%2Fc%3Fd%3De%26f");
}
