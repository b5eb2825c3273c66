#pragma once
// ============================================================
// Blocking HTTPS request helper (one connection per request):
// resolve -> TCP connect -> TLS handshake (SNI) -> HTTP/1.1 POST
// -> read full response -> TLS shutdown.
// Every failure on the way surfaces as mvs::Error(TRANSPORT).
// ============================================================

#include <boost/asio.hpp>
#include <boost/asio/ssl.hpp>
#include <string>
#include <utility>
#include <vector>

namespace mvs {
namespace asio = boost::asio;

using HeaderList = std::vector<std::pair<std::string, std::string>>;

struct HttpResponse {
  unsigned status{0};
  std::string body;
};

class HttpsTransport {
public:
  HttpsTransport(std::string host, std::string port, bool verify_tls);

  HttpsTransport(const HttpsTransport&) = delete;
  HttpsTransport& operator=(const HttpsTransport&) = delete;

  // any HTTP status is returned; only I/O errors throw
  HttpResponse post(const std::string& target, const HeaderList& headers, const std::string& body);

  const std::string& host() const { return host_; }

private:
  std::string host_;
  std::string port_;
  bool verify_;

  asio::io_context io_;
  asio::ssl::context ctx_;
};

} // namespace mvs
