#pragma once

#include <chrono>
#include <map>
#include <string>

#include <openssl/ssl.h>

namespace promptgate {

class CancellationToken;

struct HttpResponse {
  int status{0};
  std::map<std::string, std::string> headers;  // Lower-cased names.
  std::string body;
};

// Blocking HTTP/1.1 client over POSIX sockets with optional TLS (OpenSSL).
// One connection per request ("Connection: close"). Chunked transfer
// encoding is decoded transparently.
//
// When a CancellationToken is supplied the socket is polled in short slices
// and the call is abandoned with RequestCancelled once the token fires.
class HttpClient {
public:
  explicit HttpClient(std::chrono::milliseconds io_timeout = std::chrono::seconds(30));
  ~HttpClient();
  HttpClient(const HttpClient &) = delete;
  HttpClient &operator=(const HttpClient &) = delete;

  HttpResponse
  Post(const std::string &url, const std::string &body,
       const std::map<std::string, std::string> &headers = {},
       const CancellationToken *cancel = nullptr) const;

  // Exposed for tests: splits a raw HTTP response into status, headers and
  // a de-chunked body.
  static HttpResponse ParseResponse(const std::string &raw);

  // Sets SNI and the name the peer certificate must match. Throws
  // std::runtime_error when OpenSSL rejects the hostname.
  static void BindPeerHostname(SSL *ssl, const std::string &host);

private:
  HttpResponse Send(const std::string &method, const std::string &url,
                    const std::string &body,
                    const std::map<std::string, std::string> &headers,
                    const CancellationToken *cancel) const;

  SSL_CTX *ssl_ctx_{nullptr};
  bool tls_ready_{false};
  std::chrono::milliseconds io_timeout_;
};

} // namespace promptgate
