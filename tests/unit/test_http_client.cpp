#include <catch2/catch_test_macros.hpp>

#include "net/cancellation_token.h"
#include "net/http_client.h"

#include <string>

#include <openssl/ssl.h>
#include <openssl/x509_vfy.h>

TEST_CASE("HttpClient parses status, headers and body", "[http_client]") {
  auto response = promptgate::HttpClient::ParseResponse(
      "HTTP/1.1 404 Not Found\r\n"
      "Content-Type: application/json\r\n"
      "X-Request-Id:  abc \r\n"
      "\r\n"
      "{\"error\":{}}");
  REQUIRE(response.status == 404);
  REQUIRE(response.headers["content-type"] == "application/json");
  REQUIRE(response.headers["x-request-id"] == "abc");
  REQUIRE(response.body == "{\"error\":{}}");
}

TEST_CASE("HttpClient decodes chunked bodies", "[http_client]") {
  auto response = promptgate::HttpClient::ParseResponse(
      "HTTP/1.1 200 OK\r\n"
      "Transfer-Encoding: chunked\r\n"
      "\r\n"
      "5\r\nHello\r\n"
      "7\r\n, world\r\n"
      "0\r\n\r\n");
  REQUIRE(response.status == 200);
  REQUIRE(response.body == "Hello, world");
}

TEST_CASE("HttpClient tolerates a response without a body", "[http_client]") {
  auto response = promptgate::HttpClient::ParseResponse("HTTP/1.1 204 No Content\r\n\r\n");
  REQUIRE(response.status == 204);
  REQUIRE(response.body.empty());
}

TEST_CASE("HttpClient reports garbage status lines as status 0", "[http_client]") {
  auto response = promptgate::HttpClient::ParseResponse("garbage");
  REQUIRE(response.status == 0);
}

TEST_CASE("HttpClient refuses to start on a cancelled token", "[http_client]") {
  promptgate::HttpClient client;
  promptgate::CancellationToken token;
  token.Cancel();
  REQUIRE_THROWS_AS(client.Post("http://127.0.0.1:9/never", "{}", {}, &token),
                    promptgate::RequestCancelled);
}

TEST_CASE("HttpClient rejects unsupported URLs", "[http_client]") {
  promptgate::HttpClient client;
  REQUIRE_THROWS(client.Post("ftp://example.com/file", "{}"));
}

TEST_CASE("HttpClient pins the certificate hostname on TLS sessions", "[http_client]") {
  SSL_CTX *ctx = SSL_CTX_new(TLS_client_method());
  REQUIRE(ctx != nullptr);
  SSL *ssl = SSL_new(ctx);
  REQUIRE(ssl != nullptr);

  promptgate::HttpClient::BindPeerHostname(ssl, "generativelanguage.googleapis.com");

  const char *pinned = X509_VERIFY_PARAM_get0_host(SSL_get0_param(ssl), 0);
  REQUIRE(pinned != nullptr);
  REQUIRE(std::string(pinned) == "generativelanguage.googleapis.com");
  REQUIRE(std::string(SSL_get_servername(ssl, TLSEXT_NAMETYPE_host_name)) ==
          "generativelanguage.googleapis.com");

  SSL_free(ssl);
  SSL_CTX_free(ctx);
}
