#include "net/http_client.h"

#include "net/cancellation_token.h"

#include <arpa/inet.h>
#include <cerrno>
#include <netdb.h>
#include <poll.h>
#include <sys/socket.h>
#include <sys/time.h>
#include <unistd.h>

#include <openssl/err.h>
#include <openssl/x509v3.h>

#include <algorithm>
#include <cctype>
#include <sstream>
#include <stdexcept>

namespace promptgate {
namespace {
constexpr int kPollSliceMs = 100;

struct ParsedUrl {
  std::string scheme{"http"};
  std::string host;
  std::string path{"/"};
  int port{80};
  bool use_tls{false};
};

ParsedUrl ParseUrl(const std::string &url) {
  ParsedUrl parsed;
  std::string remainder = url;
  auto scheme_pos = url.find("://");
  if (scheme_pos != std::string::npos) {
    parsed.scheme = url.substr(0, scheme_pos);
    remainder = url.substr(scheme_pos + 3);
  }
  if (parsed.scheme != "http" && parsed.scheme != "https") {
    throw std::runtime_error("unsupported URL scheme: " + parsed.scheme);
  }
  parsed.use_tls = (parsed.scheme == "https");
  parsed.port = parsed.use_tls ? 443 : 80;

  auto slash = remainder.find('/');
  std::string host_port =
      slash == std::string::npos ? remainder : remainder.substr(0, slash);
  parsed.path = slash == std::string::npos ? "/" : remainder.substr(slash);

  auto colon = host_port.find(':');
  if (colon == std::string::npos) {
    parsed.host = host_port;
  } else {
    parsed.host = host_port.substr(0, colon);
    parsed.port = std::stoi(host_port.substr(colon + 1));
  }
  if (parsed.host.empty()) {
    throw std::runtime_error("invalid URL host");
  }
  return parsed;
}

int CreateSocket(const ParsedUrl &parsed, std::chrono::milliseconds timeout) {
  addrinfo hints{};
  hints.ai_family = AF_UNSPEC;
  hints.ai_socktype = SOCK_STREAM;
  addrinfo *result = nullptr;
  if (getaddrinfo(parsed.host.c_str(), std::to_string(parsed.port).c_str(),
                  &hints, &result) != 0) {
    throw std::runtime_error("failed to resolve host " + parsed.host);
  }
  int sock = -1;
  for (addrinfo *rp = result; rp != nullptr; rp = rp->ai_next) {
    sock = ::socket(rp->ai_family, rp->ai_socktype, rp->ai_protocol);
    if (sock == -1)
      continue;
    if (::connect(sock, rp->ai_addr, rp->ai_addrlen) == 0)
      break;
    ::close(sock);
    sock = -1;
  }
  freeaddrinfo(result);
  if (sock == -1)
    throw std::runtime_error("failed to connect to " + parsed.host);
  struct timeval tv;
  tv.tv_sec = static_cast<time_t>(timeout.count() / 1000);
  tv.tv_usec = static_cast<suseconds_t>((timeout.count() % 1000) * 1000);
  setsockopt(sock, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv));
  setsockopt(sock, SOL_SOCKET, SO_SNDTIMEO, &tv, sizeof(tv));
  return sock;
}

std::string BuildRequest(const ParsedUrl &parsed, const std::string &method,
                         const std::string &body,
                         const std::map<std::string, std::string> &headers) {
  std::ostringstream request;
  request << method << " " << parsed.path << " HTTP/1.1\r\n";
  request << "Host: " << parsed.host << "\r\n";
  request << "Content-Length: " << body.size() << "\r\n";
  if (headers.find("Content-Type") == headers.end()) {
    request << "Content-Type: application/json\r\n";
  }
  for (const auto &[key, value] : headers) {
    request << key << ": " << value << "\r\n";
  }
  request << "Connection: close\r\n\r\n";
  request << body;
  return request.str();
}

std::string ToLower(std::string value) {
  std::transform(value.begin(), value.end(), value.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return value;
}

std::string TrimSpaces(const std::string &value) {
  auto start = value.find_first_not_of(" \t");
  if (start == std::string::npos) {
    return "";
  }
  auto end = value.find_last_not_of(" \t\r\n");
  return value.substr(start, end - start + 1);
}

std::string DecodeChunked(const std::string &raw) {
  std::string decoded;
  std::size_t pos = 0;
  while (pos < raw.size()) {
    auto line_end = raw.find("\r\n", pos);
    if (line_end == std::string::npos) {
      throw std::runtime_error("malformed chunked body");
    }
    std::string size_field = raw.substr(pos, line_end - pos);
    auto ext = size_field.find(';');
    if (ext != std::string::npos) {
      size_field.resize(ext);
    }
    std::size_t chunk_size = 0;
    try {
      chunk_size = std::stoul(TrimSpaces(size_field), nullptr, 16);
    } catch (const std::exception &) {
      throw std::runtime_error("malformed chunk size");
    }
    pos = line_end + 2;
    if (chunk_size == 0) {
      break;
    }
    if (pos + chunk_size > raw.size()) {
      throw std::runtime_error("truncated chunked body");
    }
    decoded.append(raw, pos, chunk_size);
    pos += chunk_size + 2;
  }
  return decoded;
}

// Owns the socket and the optional TLS session for one request.
struct Connection {
  int sock{-1};
  SSL *ssl{nullptr};

  ~Connection() {
    if (ssl) {
      SSL_shutdown(ssl);
      SSL_free(ssl);
    }
    if (sock >= 0) {
      ::close(sock);
    }
  }

  void SendAll(const std::string &payload) {
    const char *send_ptr = payload.c_str();
    std::size_t send_remaining = payload.size();
    while (send_remaining > 0) {
      if (ssl) {
        int sent = SSL_write(ssl, send_ptr, static_cast<int>(send_remaining));
        if (sent <= 0) {
          throw std::runtime_error("failed to send TLS request");
        }
        send_ptr += sent;
        send_remaining -= static_cast<std::size_t>(sent);
      } else {
        ssize_t sent = ::send(sock, send_ptr, send_remaining, 0);
        if (sent < 0 && errno == EINTR) {
          continue;
        }
        if (sent <= 0) {
          throw std::runtime_error("failed to send request");
        }
        send_ptr += sent;
        send_remaining -= static_cast<std::size_t>(sent);
      }
    }
  }

  // Waits until data is readable. Returns false when the I/O timeout
  // elapses; throws RequestCancelled when the token fires first.
  bool WaitReadable(const CancellationToken *cancel,
                    std::chrono::milliseconds io_timeout) {
    if (ssl && SSL_pending(ssl) > 0) {
      return true;
    }
    auto give_up = std::chrono::steady_clock::now() + io_timeout;
    while (true) {
      if (cancel) {
        cancel->ThrowIfCancelled("upstream read");
      }
      pollfd pfd{};
      pfd.fd = sock;
      pfd.events = POLLIN;
      int rc = ::poll(&pfd, 1, cancel ? kPollSliceMs : static_cast<int>(io_timeout.count()));
      if (rc > 0) {
        return true;
      }
      if (rc < 0 && errno != EINTR) {
        throw std::runtime_error("poll failed on upstream socket");
      }
      if (std::chrono::steady_clock::now() >= give_up) {
        return false;
      }
    }
  }

  std::string ReadToEnd(const CancellationToken *cancel,
                        std::chrono::milliseconds io_timeout) {
    std::string response;
    char buffer[4096];
    while (true) {
      if (!WaitReadable(cancel, io_timeout)) {
        throw std::runtime_error("upstream read timed out");
      }
      if (ssl) {
        int read_bytes = SSL_read(ssl, buffer, sizeof(buffer));
        if (read_bytes > 0) {
          response.append(buffer, buffer + read_bytes);
          continue;
        }
        int err = SSL_get_error(ssl, read_bytes);
        if (err == SSL_ERROR_WANT_READ || err == SSL_ERROR_WANT_WRITE) {
          continue;
        }
        break;
      }
      ssize_t read_bytes = ::recv(sock, buffer, sizeof(buffer), 0);
      if (read_bytes < 0 && errno == EINTR) {
        continue;
      }
      if (read_bytes <= 0) {
        break;
      }
      response.append(buffer, buffer + read_bytes);
    }
    return response;
  }
};
} // namespace

HttpClient::HttpClient(std::chrono::milliseconds io_timeout)
    : io_timeout_(io_timeout) {
  SSL_load_error_strings();
  OpenSSL_add_ssl_algorithms();
  ssl_ctx_ = SSL_CTX_new(TLS_client_method());
  if (ssl_ctx_) {
    SSL_CTX_set_verify(ssl_ctx_, SSL_VERIFY_PEER, nullptr);
    SSL_CTX_set_default_verify_paths(ssl_ctx_);
    tls_ready_ = true;
  }
}

HttpClient::~HttpClient() {
  if (ssl_ctx_) {
    SSL_CTX_free(ssl_ctx_);
    ssl_ctx_ = nullptr;
  }
}

HttpResponse
HttpClient::Post(const std::string &url, const std::string &body,
                 const std::map<std::string, std::string> &headers,
                 const CancellationToken *cancel) const {
  return Send("POST", url, body, headers, cancel);
}

HttpResponse HttpClient::ParseResponse(const std::string &raw) {
  HttpResponse http_response;
  auto header_end = raw.find("\r\n\r\n");
  std::string header =
      header_end == std::string::npos ? raw : raw.substr(0, header_end);
  std::string body_str = header_end == std::string::npos
                             ? std::string()
                             : raw.substr(header_end + 4);

  std::istringstream lines(header);
  std::string status_line;
  std::getline(lines, status_line);
  auto status_pos = status_line.find(' ');
  if (status_pos != std::string::npos) {
    try {
      http_response.status = std::stoi(status_line.substr(status_pos + 1));
    } catch (const std::exception &) {
      http_response.status = 0;
    }
  }
  std::string line;
  while (std::getline(lines, line)) {
    auto colon = line.find(':');
    if (colon == std::string::npos) {
      continue;
    }
    http_response.headers[ToLower(TrimSpaces(line.substr(0, colon)))] =
        TrimSpaces(line.substr(colon + 1));
  }

  auto te = http_response.headers.find("transfer-encoding");
  if (te != http_response.headers.end() &&
      ToLower(te->second).find("chunked") != std::string::npos) {
    http_response.body = DecodeChunked(body_str);
  } else {
    http_response.body = body_str;
  }
  return http_response;
}

void HttpClient::BindPeerHostname(SSL *ssl, const std::string &host) {
  if (SSL_set_tlsext_host_name(ssl, host.c_str()) != 1) {
    throw std::runtime_error("failed to set TLS server name: " + host);
  }
  if (SSL_set1_host(ssl, host.c_str()) != 1) {
    throw std::runtime_error("failed to set TLS peer hostname: " + host);
  }
}

HttpResponse
HttpClient::Send(const std::string &method, const std::string &url,
                 const std::string &body,
                 const std::map<std::string, std::string> &headers,
                 const CancellationToken *cancel) const {
  if (cancel) {
    cancel->ThrowIfCancelled("upstream connect");
  }
  auto parsed = ParseUrl(url);
  Connection conn;
  conn.sock = CreateSocket(parsed, io_timeout_);
  auto payload = BuildRequest(parsed, method, body, headers);

  if (parsed.use_tls) {
    if (!tls_ready_) {
      throw std::runtime_error("TLS not available in HttpClient");
    }
    conn.ssl = SSL_new(ssl_ctx_);
    if (!conn.ssl) {
      throw std::runtime_error("failed to allocate TLS context");
    }
    BindPeerHostname(conn.ssl, parsed.host);
    SSL_set_fd(conn.ssl, conn.sock);
    if (SSL_connect(conn.ssl) != 1) {
      throw std::runtime_error("TLS handshake failed");
    }
    if (SSL_get_verify_result(conn.ssl) != X509_V_OK) {
      throw std::runtime_error("TLS certificate verification failed");
    }
  }
  conn.SendAll(payload);
  return ParseResponse(conn.ReadToEnd(cancel, io_timeout_));
}

} // namespace promptgate
