#include "server/http/http_server.h"

#include "net/cancellation_token.h"
#include "screening/screening_pipeline.h"
#include "server/logging/logger.h"
#include "server/metrics/metrics.h"

#include <nlohmann/json.hpp>

#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <sys/time.h>
#include <unistd.h>

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cstring>
#include <string>
#include <utility>
#include <vector>

#include <openssl/err.h>
#include <openssl/ssl.h>

using json = nlohmann::json;

namespace promptgate {

namespace {

constexpr const char *kServiceName = "PromptGate";
constexpr const char *kGenericFailure =
    "An error occurred while processing your request.";
constexpr std::size_t kInitialBuf = 4096;
constexpr std::size_t kMaxRequest = 1024 * 1024;

std::string Trim(const std::string &value) {
  auto s = value.find_first_not_of(" \t\r\n");
  if (s == std::string::npos) {
    return {};
  }
  auto e = value.find_last_not_of(" \t\r\n");
  return value.substr(s, e - s + 1);
}

std::string ToLower(std::string value) {
  std::transform(value.begin(), value.end(), value.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return value;
}

std::map<std::string, std::string> ParseHeaders(const std::string &block) {
  std::map<std::string, std::string> headers;
  std::size_t pos = block.find("\r\n");
  while (pos != std::string::npos && pos < block.size()) {
    pos += 2;
    auto end = block.find("\r\n", pos);
    std::string line = block.substr(pos, end == std::string::npos ? std::string::npos
                                                                  : end - pos);
    auto colon = line.find(':');
    if (colon != std::string::npos) {
      headers[ToLower(Trim(line.substr(0, colon)))] = Trim(line.substr(colon + 1));
    }
    pos = end;
  }
  return headers;
}

std::string BuildResponse(const HttpReply &reply) {
  std::string headers = "HTTP/1.1 " + std::to_string(reply.status) + " " +
                        HttpServer::StatusText(reply.status) + "\r\n";
  headers += "Content-Type: " + reply.content_type + "\r\n";
  headers += "Connection: close\r\n";
  headers += "Content-Length: " + std::to_string(reply.body.size()) + "\r\n\r\n";
  return headers + reply.body;
}

HttpReply JsonReply(int status, const json &body) {
  HttpReply reply;
  reply.status = status;
  reply.body = body.dump(-1, ' ', false, json::error_handler_t::replace);
  return reply;
}

HttpReply DetailReply(int status, const std::string &detail) {
  return JsonReply(status, json{{"detail", detail}});
}

} // namespace

HttpServer::HttpServer(std::string host, int port, ScreeningPipeline *pipeline,
                       MetricsRegistry *metrics, TlsConfig tls_config,
                       int num_workers,
                       std::chrono::milliseconds request_timeout)
    : host_(std::move(host)), port_(port), pipeline_(pipeline),
      metrics_(metrics), num_workers_(num_workers > 0 ? num_workers : 4),
      request_timeout_(request_timeout) {
  if (tls_config.enabled) {
    if (tls_config.cert_path.empty() || tls_config.key_path.empty()) {
      log::Warn("http", "TLS enabled without cert/key; falling back to HTTP");
    } else {
      SSL_load_error_strings();
      OpenSSL_add_ssl_algorithms();
      ssl_ctx_ = SSL_CTX_new(TLS_server_method());
      if (!ssl_ctx_) {
        log::Error("http", "Failed to initialize TLS context");
      } else if (SSL_CTX_use_certificate_file(ssl_ctx_,
                                              tls_config.cert_path.c_str(),
                                              SSL_FILETYPE_PEM) <= 0) {
        log::Error("http", "Failed to load TLS certificate",
                   tls_config.cert_path);
        SSL_CTX_free(ssl_ctx_);
        ssl_ctx_ = nullptr;
      } else if (SSL_CTX_use_PrivateKey_file(ssl_ctx_,
                                             tls_config.key_path.c_str(),
                                             SSL_FILETYPE_PEM) <= 0) {
        log::Error("http", "Failed to load TLS key", tls_config.key_path);
        SSL_CTX_free(ssl_ctx_);
        ssl_ctx_ = nullptr;
      } else {
        tls_enabled_ = true;
        log::Info("http", "TLS enabled", "cert=" + tls_config.cert_path);
      }
    }
  }
}

HttpServer::~HttpServer() {
  Stop();
  if (ssl_ctx_) {
    SSL_CTX_free(ssl_ctx_);
    ssl_ctx_ = nullptr;
  }
}

std::string HttpServer::StatusText(int status) {
  switch (status) {
  case 200:
    return "OK";
  case 400:
    return "Bad Request";
  case 403:
    return "Forbidden";
  case 404:
    return "Not Found";
  case 405:
    return "Method Not Allowed";
  case 413:
    return "Payload Too Large";
  case 500:
    return "Internal Server Error";
  default:
    return "Unknown";
  }
}

std::string
HttpServer::ResolveClientIp(const std::map<std::string, std::string> &headers,
                            const std::string &peer_address) {
  auto forwarded = headers.find("x-forwarded-for");
  if (forwarded != headers.end()) {
    auto first = Trim(forwarded->second.substr(0, forwarded->second.find(',')));
    if (!first.empty()) {
      return first;
    }
  }
  auto real_ip = headers.find("x-real-ip");
  if (real_ip != headers.end()) {
    auto value = Trim(real_ip->second);
    if (!value.empty()) {
      return value;
    }
  }
  if (!peer_address.empty()) {
    return peer_address;
  }
  return "unknown";
}

bool HttpServer::Start() {
  if (running_) {
    return true;
  }
  int fd = OpenListener();
  if (fd < 0) {
    return false;
  }
  server_fd_.store(fd);
  running_ = true;
  stopping_ = false;
  for (int i = 0; i < num_workers_; ++i) {
    workers_.emplace_back(&HttpServer::WorkerLoop, this);
  }
  accept_thread_ = std::thread(&HttpServer::Run, this, fd);
  return true;
}

void HttpServer::Stop() {
  if (!running_) {
    return;
  }
  running_ = false;
  stopping_ = true;
  // Close the listening socket to unblock the accept() call in Run().
  int fd = server_fd_.exchange(-1);
  if (fd >= 0) {
    ::shutdown(fd, SHUT_RDWR);
    ::close(fd);
  }
  {
    std::lock_guard<std::mutex> lock(tokens_mutex_);
    for (auto *token : active_tokens_) {
      token->Cancel();
    }
  }
  queue_cv_.notify_all();
  if (accept_thread_.joinable()) {
    accept_thread_.join();
  }
  for (auto &w : workers_) {
    if (w.joinable()) {
      w.join();
    }
  }
  workers_.clear();
  std::lock_guard<std::mutex> lock(queue_mutex_);
  while (!client_queue_.empty()) {
    auto session = std::move(client_queue_.front());
    client_queue_.pop();
    CloseSession(session);
  }
}

void HttpServer::WorkerLoop() {
  while (true) {
    ClientSession session;
    {
      std::unique_lock<std::mutex> lock(queue_mutex_);
      queue_cv_.wait(lock,
                     [this] { return !client_queue_.empty() || !running_; });
      if (!running_ && client_queue_.empty()) {
        return;
      }
      session = std::move(client_queue_.front());
      client_queue_.pop();
    }
    if (session.fd >= 0) {
      HandleClient(session);
      CloseSession(session);
    }
  }
}

int HttpServer::OpenListener() {
  int fd = ::socket(AF_INET, SOCK_STREAM, 0);
  if (fd < 0) {
    log::Error("http", "socket() failed", std::strerror(errno));
    return -1;
  }

  int opt = 1;
  ::setsockopt(fd, SOL_SOCKET, SO_REUSEADDR, &opt, sizeof(opt));

  sockaddr_in addr;
  std::memset(&addr, 0, sizeof(addr));
  addr.sin_family = AF_INET;
  addr.sin_port = htons(static_cast<uint16_t>(port_));
  if (::inet_pton(AF_INET, host_.c_str(), &addr.sin_addr) != 1) {
    log::Error("http", "Invalid listen address", host_);
    ::close(fd);
    return -1;
  }

  if (::bind(fd, reinterpret_cast<sockaddr *>(&addr), sizeof(addr)) < 0) {
    log::Error("http", "bind() failed",
               host_ + ":" + std::to_string(port_) + " " + std::strerror(errno));
    ::close(fd);
    return -1;
  }

  if (::listen(fd, 128) < 0) {
    log::Error("http", "listen() failed", std::strerror(errno));
    ::close(fd);
    return -1;
  }

  sockaddr_in bound;
  socklen_t bound_len = sizeof(bound);
  if (::getsockname(fd, reinterpret_cast<sockaddr *>(&bound), &bound_len) == 0) {
    bound_port_.store(ntohs(bound.sin_port));
  } else {
    bound_port_.store(port_);
  }
  return fd;
}

void HttpServer::Run(int fd) {
  while (running_) {
    sockaddr_in client_addr;
    socklen_t client_len = sizeof(client_addr);
    int client_fd =
        ::accept(fd, reinterpret_cast<sockaddr *>(&client_addr), &client_len);
    if (client_fd < 0) {
      break; // Socket closed by Stop() or error.
    }
    if (!running_) {
      ::close(client_fd);
      break;
    }
    // Bound how long a slow client can hold a worker while sending.
    timeval tv{30, 0};
    ::setsockopt(client_fd, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv));

    ClientSession session;
    session.fd = client_fd;
    char peer[INET_ADDRSTRLEN] = {0};
    if (inet_ntop(AF_INET, &client_addr.sin_addr, peer, sizeof(peer))) {
      session.peer_address = peer;
    }
    if (tls_enabled_) {
      SSL *ssl = SSL_new(ssl_ctx_);
      if (!ssl) {
        ::close(client_fd);
        continue;
      }
      SSL_set_fd(ssl, client_fd);
      if (SSL_accept(ssl) != 1) {
        SSL_free(ssl);
        ::close(client_fd);
        continue;
      }
      session.ssl = ssl;
    }
    {
      std::lock_guard<std::mutex> lock(queue_mutex_);
      client_queue_.push(std::move(session));
    }
    queue_cv_.notify_one();
  }

  int expected = fd;
  if (server_fd_.compare_exchange_strong(expected, -1)) {
    ::close(fd);
  }
}

void HttpServer::HandleClient(ClientSession &session) {
  struct ConnectionGuard {
    MetricsRegistry *metrics;
    ~ConnectionGuard() {
      if (metrics) {
        metrics->DecrementConnections();
      }
    }
  } guard{metrics_};
  if (metrics_) {
    metrics_->IncrementConnections();
  }

  // Phase 1: read until the end-of-headers marker.
  std::string request;
  std::size_t header_end_pos = std::string::npos;
  std::vector<char> buffer(kInitialBuf);
  while (header_end_pos == std::string::npos) {
    if (request.size() >= kMaxRequest) {
      SendAll(session,
              BuildResponse(DetailReply(413, "Request too large")));
      return;
    }
    ssize_t bytes = Receive(session, buffer.data(), buffer.size());
    if (bytes <= 0) {
      return;
    }
    request.append(buffer.data(), static_cast<std::size_t>(bytes));
    header_end_pos = request.find("\r\n\r\n");
  }

  HttpRequest parsed;
  parsed.peer_address = session.peer_address;
  std::string header_block = request.substr(0, header_end_pos);
  auto first_line = header_block.substr(0, header_block.find("\r\n"));
  auto method_end = first_line.find(' ');
  auto path_end = first_line.find(' ', method_end == std::string::npos
                                           ? std::string::npos
                                           : method_end + 1);
  if (method_end == std::string::npos) {
    SendAll(session, BuildResponse(DetailReply(400, "Malformed request line")));
    return;
  }
  parsed.method = first_line.substr(0, method_end);
  parsed.path = first_line.substr(method_end + 1, path_end == std::string::npos
                                                       ? std::string::npos
                                                       : path_end - method_end - 1);
  auto query = parsed.path.find('?');
  if (query != std::string::npos) {
    parsed.path.resize(query);
  }
  parsed.headers = ParseHeaders(header_block);

  // Phase 2: read the body per Content-Length.
  std::size_t content_length = 0;
  auto cl = parsed.headers.find("content-length");
  if (cl != parsed.headers.end()) {
    try {
      content_length = std::stoull(cl->second);
    } catch (const std::logic_error &) {
      SendAll(session,
              BuildResponse(DetailReply(400, "Invalid Content-Length")));
      return;
    }
  }
  if (content_length > kMaxRequest) {
    SendAll(session, BuildResponse(DetailReply(413, "Request too large")));
    return;
  }
  std::size_t body_start = header_end_pos + 4;
  while (request.size() < body_start + content_length) {
    ssize_t bytes = Receive(session, buffer.data(), buffer.size());
    if (bytes <= 0) {
      return;
    }
    request.append(buffer.data(), static_cast<std::size_t>(bytes));
  }
  parsed.body = request.substr(body_start, content_length);

  auto reply = Dispatch(parsed);
  if (!SendAll(session, BuildResponse(reply))) {
    log::Debug("http", "Client went away before the response was sent",
               parsed.path);
  }
}

HttpReply HttpServer::Dispatch(const HttpRequest &request) {
  if (request.path == "/health") {
    if (request.method != "GET") {
      return DetailReply(405, "Method Not Allowed");
    }
    return JsonReply(200, json{{"status", "healthy"}, {"service", kServiceName}});
  }
  if (request.path == "/metrics") {
    if (request.method != "GET") {
      return DetailReply(405, "Method Not Allowed");
    }
    HttpReply reply;
    reply.content_type = "text/plain; version=0.0.4";
    reply.body = metrics_ ? metrics_->RenderPrometheus() : std::string();
    return reply;
  }
  if (request.path == "/chat") {
    if (request.method != "POST") {
      return DetailReply(405, "Method Not Allowed");
    }
    return HandleChat(request);
  }
  return DetailReply(404, "Not Found");
}

HttpReply HttpServer::HandleChat(const HttpRequest &request) {
  std::string user_query;
  try {
    auto body = json::parse(request.body);
    if (body.is_object() && body.contains("user_query") &&
        body["user_query"].is_string()) {
      user_query = body["user_query"].get<std::string>();
    }
  } catch (const json::exception &ex) {
    log::Debug("http", "Rejected malformed /chat body", ex.what());
  }
  if (Trim(user_query).empty()) {
    return DetailReply(400, "user_query is required");
  }
  if (!pipeline_) {
    return DetailReply(500, kGenericFailure);
  }

  auto client_ip = ResolveClientIp(request.headers, request.peer_address);
  CancellationToken token(CancellationToken::DeadlineAfter(request_timeout_));
  TrackToken(&token);
  PipelineOutcome outcome;
  try {
    outcome = pipeline_->Process(user_query, client_ip, &token);
  } catch (const std::exception &ex) {
    ReleaseToken(&token);
    log::Error("http", "Unhandled error in /chat", ex.what());
    return DetailReply(500, kGenericFailure);
  }
  ReleaseToken(&token);

  switch (outcome.state) {
  case PipelineState::kComplete:
    return JsonReply(200, json{{"response", outcome.response}});
  case PipelineState::kBlockedPii:
    log::Warn("http", "PII detected", "ip=" + client_ip);
    return DetailReply(400, "Security Alert: PII or Secrets detected. " +
                                outcome.verdict.detail);
  case PipelineState::kBlockedInjection:
    log::Warn("http", "Prompt injection detected", "ip=" + client_ip);
    return DetailReply(403, "Security Alert: Prompt Injection detected via " +
                                outcome.verdict.detail + ".");
  default:
    return DetailReply(500, kGenericFailure);
  }
}

void HttpServer::TrackToken(CancellationToken *token) {
  std::lock_guard<std::mutex> lock(tokens_mutex_);
  active_tokens_.insert(token);
  if (stopping_) {
    token->Cancel();
  }
}

void HttpServer::ReleaseToken(CancellationToken *token) {
  std::lock_guard<std::mutex> lock(tokens_mutex_);
  active_tokens_.erase(token);
}

bool HttpServer::SendAll(ClientSession &session, const std::string &payload) {
  const char *data = payload.c_str();
  std::size_t remaining = payload.size();
  while (remaining > 0) {
    int sent = 0;
    if (session.ssl) {
      sent = SSL_write(session.ssl, data, static_cast<int>(remaining));
      if (sent <= 0) {
        int err = SSL_get_error(session.ssl, sent);
        if (err == SSL_ERROR_WANT_READ || err == SSL_ERROR_WANT_WRITE) {
          continue;
        }
        return false;
      }
    } else {
      sent = static_cast<int>(::send(session.fd, data, remaining, MSG_NOSIGNAL));
      if (sent <= 0) {
        if (errno == EINTR) {
          continue;
        }
        return false;
      }
    }
    data += sent;
    remaining -= static_cast<std::size_t>(sent);
  }
  return true;
}

ssize_t HttpServer::Receive(ClientSession &session, char *buffer,
                            std::size_t length) {
  if (session.ssl) {
    while (true) {
      int received = SSL_read(session.ssl, buffer, static_cast<int>(length));
      if (received > 0) {
        return received;
      }
      int err = SSL_get_error(session.ssl, received);
      if (err == SSL_ERROR_WANT_READ || err == SSL_ERROR_WANT_WRITE) {
        continue;
      }
      return -1;
    }
  }
  while (true) {
    ssize_t received = ::recv(session.fd, buffer, length, 0);
    if (received < 0 && errno == EINTR) {
      continue;
    }
    return received;
  }
}

void HttpServer::CloseSession(ClientSession &session) {
  if (session.ssl) {
    SSL_shutdown(session.ssl);
    SSL_free(session.ssl);
    session.ssl = nullptr;
  }
  if (session.fd >= 0) {
    ::close(session.fd);
    session.fd = -1;
  }
}

} // namespace promptgate
