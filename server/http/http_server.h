#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <map>
#include <mutex>
#include <queue>
#include <string>
#include <thread>
#include <unordered_set>
#include <vector>

#include <openssl/ssl.h>
#include <sys/types.h>

namespace promptgate {

class CancellationToken;
class MetricsRegistry;
class ScreeningPipeline;

struct HttpRequest {
  std::string method;
  std::string path;
  // Header names are lower-cased.
  std::map<std::string, std::string> headers;
  std::string body;
  std::string peer_address;
};

struct HttpReply {
  int status{200};
  std::string content_type{"application/json"};
  std::string body;
};

class HttpServer {
 public:
  struct TlsConfig {
    bool enabled{false};
    std::string cert_path;
    std::string key_path;
  };

  HttpServer(std::string host,
             int port,
             ScreeningPipeline* pipeline,
             MetricsRegistry* metrics,
             TlsConfig tls_config,
             int num_workers = 4,
             std::chrono::milliseconds request_timeout = std::chrono::seconds(60));
  ~HttpServer();

  // Binds and listens, then starts the accept thread and the workers.
  // Returns false when the socket cannot be bound.
  bool Start();
  // Stops accepting, cancels in-flight requests and joins the workers.
  void Stop();

  // Routes one parsed request. Exposed so the routing can be exercised
  // without sockets.
  HttpReply Dispatch(const HttpRequest& request);

  // First X-Forwarded-For entry, then X-Real-IP, then the peer address,
  // then "unknown".
  static std::string ResolveClientIp(const std::map<std::string, std::string>& headers,
                                     const std::string& peer_address);

  static std::string StatusText(int status);

  // Port actually listened on; differs from the configured one when that
  // was 0. Zero before Start().
  int BoundPort() const { return bound_port_.load(); }

 private:
  struct ClientSession {
    int fd{-1};
    SSL* ssl{nullptr};
    std::string peer_address;
  };

  int OpenListener();
  void Run(int fd);
  void WorkerLoop();
  void HandleClient(ClientSession& session);
  HttpReply HandleChat(const HttpRequest& request);

  bool SendAll(ClientSession& session, const std::string& payload);
  ssize_t Receive(ClientSession& session, char* buffer, std::size_t length);
  void CloseSession(ClientSession& session);

  void TrackToken(CancellationToken* token);
  void ReleaseToken(CancellationToken* token);

  std::string host_;
  int port_;
  ScreeningPipeline* pipeline_;
  MetricsRegistry* metrics_;
  bool tls_enabled_{false};
  SSL_CTX* ssl_ctx_{nullptr};
  std::atomic<bool> running_{false};
  std::atomic<bool> stopping_{false};
  std::atomic<int> server_fd_{-1};
  std::atomic<int> bound_port_{0};
  int num_workers_;
  std::chrono::milliseconds request_timeout_;
  std::thread accept_thread_;
  std::vector<std::thread> workers_;
  std::queue<ClientSession> client_queue_;
  std::mutex queue_mutex_;
  std::condition_variable queue_cv_;

  std::mutex tokens_mutex_;
  std::unordered_set<CancellationToken*> active_tokens_;
};

}  // namespace promptgate
