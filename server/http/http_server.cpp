#include "server/http/http_server.h"

#include "server/logging/logger.h"

#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <sys/time.h>
#include <unistd.h>

#include <algorithm>
#include <cerrno>
#include <chrono>
#include <cstring>
#include <string>
#include <string_view>
#include <utility>

#include <openssl/err.h>
#include <openssl/ssl.h>

namespace promptgw {

namespace {

constexpr std::size_t kInitialBuf = 4096;
constexpr std::size_t kMaxRequest = 16 * 1024 * 1024; // 16 MB hard limit
constexpr int kClientReadTimeoutSec = 30;

// Returns nullptr (after logging why) when the certificate or key cannot be
// loaded; the server then serves plain HTTP.
SSL_CTX *CreateServerContext(const HttpServer::TlsConfig &config) {
  if (config.cert_path.empty() || config.key_path.empty()) {
    log::Warn("http", "TLS requested without cert_path/key_path, serving plain HTTP");
    return nullptr;
  }
  SSL_CTX *ctx = SSL_CTX_new(TLS_server_method());
  if (!ctx) {
    log::Error("http", "SSL_CTX_new failed");
    return nullptr;
  }
  SSL_CTX_set_min_proto_version(ctx, TLS1_2_VERSION);
  std::string failure;
  if (SSL_CTX_use_certificate_chain_file(ctx, config.cert_path.c_str()) != 1) {
    failure = "cert=" + config.cert_path;
  } else if (SSL_CTX_use_PrivateKey_file(ctx, config.key_path.c_str(),
                                         SSL_FILETYPE_PEM) != 1) {
    failure = "key=" + config.key_path;
  } else if (SSL_CTX_check_private_key(ctx) != 1) {
    failure = "key does not match certificate";
  }
  if (!failure.empty()) {
    char reason[256];
    ERR_error_string_n(ERR_get_error(), reason, sizeof(reason));
    log::Error("http", "TLS setup failed, serving plain HTTP",
               failure + " error=" + reason);
    SSL_CTX_free(ctx);
    return nullptr;
  }
  log::Info("http", "TLS enabled", "cert=" + config.cert_path);
  return ctx;
}

void SetClientTimeout(int fd) {
  struct timeval tv;
  tv.tv_sec = kClientReadTimeoutSec;
  tv.tv_usec = 0;
  setsockopt(fd, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv));
  setsockopt(fd, SOL_SOCKET, SO_SNDTIMEO, &tv, sizeof(tv));
}

} // namespace

HttpServer::HttpServer(std::string host, int port, RequestHandler handler,
                       TlsConfig tls_config, int num_workers)
    : host_(std::move(host)), port_(port), handler_(std::move(handler)),
      num_workers_(num_workers > 0 ? num_workers : 4) {
  if (tls_config.enabled) {
    ssl_ctx_ = CreateServerContext(tls_config);
    tls_enabled_ = ssl_ctx_ != nullptr;
  }
}

HttpServer::~HttpServer() {
  Stop();
  if (ssl_ctx_) {
    SSL_CTX_free(ssl_ctx_);
    ssl_ctx_ = nullptr;
  }
}

bool HttpServer::Start() {
  if (running_) {
    return true;
  }
  int fd = ::socket(AF_INET, SOCK_STREAM, 0);
  if (fd < 0) {
    log::Error("http", "socket() failed", std::strerror(errno));
    return false;
  }

  int opt = 1;
  ::setsockopt(fd, SOL_SOCKET, SO_REUSEADDR, &opt, sizeof(opt));

  sockaddr_in addr;
  std::memset(&addr, 0, sizeof(addr));
  addr.sin_family = AF_INET;
  addr.sin_port = htons(static_cast<uint16_t>(port_));
  if (::inet_pton(AF_INET, host_.c_str(), &addr.sin_addr) != 1) {
    log::Error("http", "invalid listen address", "host=" + host_);
    ::close(fd);
    return false;
  }

  if (::bind(fd, reinterpret_cast<sockaddr *>(&addr), sizeof(addr)) < 0) {
    log::Error("http", "bind() failed",
               host_ + ":" + std::to_string(port_) + " " + std::strerror(errno));
    ::close(fd);
    return false;
  }

  if (::listen(fd, 128) < 0) {
    log::Error("http", "listen() failed", std::strerror(errno));
    ::close(fd);
    return false;
  }

  sockaddr_in bound;
  socklen_t bound_len = sizeof(bound);
  if (::getsockname(fd, reinterpret_cast<sockaddr *>(&bound), &bound_len) == 0) {
    bound_port_.store(ntohs(bound.sin_port));
  } else {
    bound_port_.store(port_);
  }
  server_fd_.store(fd);

  running_ = true;
  for (int i = 0; i < num_workers_; ++i) {
    workers_.emplace_back(&HttpServer::WorkerLoop, this);
  }
  accept_thread_ = std::thread(&HttpServer::Run, this, fd);
  return true;
}

void HttpServer::Stop() {
  {
    std::lock_guard<std::mutex> lock(queue_mutex_);
    if (!running_) {
      return;
    }
    running_ = false;
  }
  // Close the listening socket to unblock the accept() call in Run().
  int fd = server_fd_.exchange(-1);
  if (fd >= 0) {
    ::shutdown(fd, SHUT_RDWR);
    ::close(fd);
  }
  // Wake all worker threads.
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
  // Drain any remaining clients in the queue.
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
    if (session.fd < 0) {
      continue;
    }
    if (tls_enabled_ && !AcceptTls(session)) {
      CloseSession(session);
      continue;
    }
    HandleClient(session);
    CloseSession(session);
  }
}

bool HttpServer::AcceptTls(ClientSession &session) {
  session.ssl = SSL_new(ssl_ctx_);
  if (!session.ssl) {
    return false;
  }
  SSL_set_fd(session.ssl, session.fd);
  if (SSL_accept(session.ssl) != 1) {
    log::Debug("http", "TLS handshake failed");
    SSL_free(session.ssl);
    session.ssl = nullptr;
    return false;
  }
  return true;
}

void HttpServer::Run(int fd) {
  while (running_) {
    sockaddr_in client_addr;
    socklen_t client_len = sizeof(client_addr);
    int client_fd =
        ::accept(fd, reinterpret_cast<sockaddr *>(&client_addr), &client_len);
    if (client_fd < 0) {
      if (errno == EINTR && running_) {
        continue;
      }
      break; // Socket closed by Stop() or accept failed.
    }
    if (!running_) {
      ::close(client_fd);
      break;
    }
    SetClientTimeout(client_fd);
    ClientSession session;
    session.fd = client_fd;
    {
      std::lock_guard<std::mutex> lock(queue_mutex_);
      client_queue_.push(std::move(session));
    }
    queue_cv_.notify_one();
  }

  // If Stop() hasn't already closed the socket, close it now.
  int expected = fd;
  if (server_fd_.compare_exchange_strong(expected, -1)) {
    ::close(fd);
  }
}

void HttpServer::HandleClient(ClientSession &session) {
  auto req_start = std::chrono::steady_clock::now();

  // Phase 1: read until we find the end-of-headers marker.
  std::string request;
  std::size_t total = 0;
  std::size_t header_end_pos = std::string::npos;
  while (header_end_pos == std::string::npos) {
    if (total >= kMaxRequest) {
      SendAll(session, SerializeReply(JsonError(413, "Payload Too Large",
                                                "request_too_large")));
      return;
    }
    request.resize(std::min(std::max(total + kInitialBuf, total * 2), kMaxRequest));
    ssize_t bytes = Receive(session, &request[total], request.size() - total);
    if (bytes <= 0) {
      return;
    }
    total += static_cast<std::size_t>(bytes);
    header_end_pos = std::string_view(request.data(), total).find("\r\n\r\n");
  }
  request.resize(total);

  HttpRequest parsed;
  if (!ParseRequestHead(request.substr(0, header_end_pos), &parsed)) {
    SendAll(session, SerializeReply(JsonError(400, "Bad Request",
                                              "malformed_request")));
    return;
  }

  // Phase 2: read the remaining body bytes announced by Content-Length.
  std::size_t body_start = header_end_pos + 4;
  std::size_t content_length = 0;
  if (const std::string *cl = parsed.Header("Content-Length")) {
    try {
      content_length = std::stoull(*cl);
    } catch (const std::exception &) {
      SendAll(session, SerializeReply(JsonError(400, "Bad Request",
                                                "invalid_content_length")));
      return;
    }
  }
  if (content_length > kMaxRequest) {
    SendAll(session, SerializeReply(JsonError(413, "Payload Too Large",
                                              "request_too_large")));
    return;
  }
  std::size_t needed = body_start + content_length;
  if (needed > total) {
    request.resize(needed);
    while (total < needed) {
      ssize_t bytes = Receive(session, &request[total], needed - total);
      if (bytes <= 0) {
        return;
      }
      total += static_cast<std::size_t>(bytes);
    }
  }
  parsed.body = request.substr(body_start, content_length);

  HttpReply reply;
  try {
    reply = handler_(parsed);
  } catch (const std::exception &e) {
    log::Error("http", "request handler failed",
               parsed.method + " " + parsed.path + " error=" + e.what());
    reply = JsonError(500, "Internal Server Error", "internal_error");
  }
  SendAll(session, SerializeReply(reply));

  auto elapsed_ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                        std::chrono::steady_clock::now() - req_start)
                        .count();
  log::Debug("http", parsed.method + " " + parsed.path,
             "status=" + std::to_string(reply.status) +
                 " latency_ms=" + std::to_string(elapsed_ms));
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
      sent = static_cast<int>(
          ::send(session.fd, data, remaining, MSG_NOSIGNAL));
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

} // namespace promptgw
