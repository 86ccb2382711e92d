#pragma once

#include "server/http/http_message.h"

#include <atomic>
#include <condition_variable>
#include <functional>
#include <mutex>
#include <queue>
#include <string>
#include <thread>
#include <vector>

#include <openssl/ssl.h>
#include <sys/types.h>

namespace promptgw {

// Blocking HTTP/1.1 server: one accept thread feeding a fixed worker pool.
// Each connection carries exactly one request (Connection: close).
class HttpServer {
 public:
  struct TlsConfig {
    bool enabled{false};
    std::string cert_path;
    std::string key_path;
  };

  // Invoked concurrently from worker threads.
  using RequestHandler = std::function<HttpReply(const HttpRequest&)>;

  HttpServer(std::string host,
             int port,
             RequestHandler handler,
             TlsConfig tls_config,
             int num_workers = 4);
  ~HttpServer();

  // Binds and listens synchronously, then starts the accept thread and the
  // workers. Returns false if the socket could not be bound. Port 0 binds an
  // ephemeral port; see Port().
  bool Start();
  void Stop();

  int Port() const { return bound_port_.load(); }
  bool TlsEnabled() const { return tls_enabled_; }

 private:
  struct ClientSession {
    int fd{-1};
    SSL* ssl{nullptr};
  };

  void Run(int fd);
  void HandleClient(ClientSession& session);
  void WorkerLoop();
  bool AcceptTls(ClientSession& session);

  bool SendAll(ClientSession& session, const std::string& payload);
  ssize_t Receive(ClientSession& session, char* buffer, std::size_t length);
  void CloseSession(ClientSession& session);

  std::string host_;
  int port_;
  RequestHandler handler_;
  bool tls_enabled_{false};
  SSL_CTX* ssl_ctx_{nullptr};
  std::atomic<bool> running_{false};
  std::atomic<int> server_fd_{-1};
  std::atomic<int> bound_port_{0};
  int num_workers_;
  std::thread accept_thread_;
  std::vector<std::thread> workers_;
  std::queue<ClientSession> client_queue_;
  std::mutex queue_mutex_;
  std::condition_variable queue_cv_;
};

}  // namespace promptgw
