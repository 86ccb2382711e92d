#include "net/http_client.h"

#include <arpa/inet.h>
#include <cerrno>
#include <netdb.h>
#include <sys/socket.h>
#include <sys/time.h>
#include <unistd.h>

#include <openssl/err.h>
#include <openssl/x509v3.h>

#include <algorithm>
#include <cctype>
#include <cstring>
#include <sstream>

namespace promptgw {
namespace {

using Kind = HttpClientError::Kind;

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
    throw HttpClientError(Kind::kInvalidUrl,
                          "unsupported URL scheme '" + parsed.scheme + "'");
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
    try {
      parsed.port = std::stoi(host_port.substr(colon + 1));
    } catch (const std::exception &) {
      throw HttpClientError(Kind::kInvalidUrl, "invalid URL port in " + url);
    }
    if (parsed.port <= 0 || parsed.port > 65535) {
      throw HttpClientError(Kind::kInvalidUrl, "invalid URL port in " + url);
    }
  }
  if (parsed.host.empty()) {
    throw HttpClientError(Kind::kInvalidUrl, "invalid URL host");
  }
  return parsed;
}

class Deadline {
public:
  explicit Deadline(std::chrono::milliseconds timeout)
      : at_(std::chrono::steady_clock::now() + timeout) {}

  std::chrono::milliseconds Remaining() const {
    auto left = std::chrono::duration_cast<std::chrono::milliseconds>(
        at_ - std::chrono::steady_clock::now());
    return left.count() > 0 ? left : std::chrono::milliseconds(0);
  }
  bool Expired() const { return Remaining().count() <= 0; }

private:
  std::chrono::steady_clock::time_point at_;
};

bool IsTimeoutErrno(int err) {
  return err == EAGAIN || err == EWOULDBLOCK || err == ETIMEDOUT ||
         err == EINPROGRESS;
}

// A zero timeval disables the timeout, so an exhausted deadline is rounded up
// to one microsecond instead.
void ArmSocketTimeout(int sock, std::chrono::milliseconds remaining) {
  struct timeval tv;
  tv.tv_sec = static_cast<time_t>(remaining.count() / 1000);
  tv.tv_usec = static_cast<suseconds_t>((remaining.count() % 1000) * 1000);
  if (tv.tv_sec == 0 && tv.tv_usec == 0) {
    tv.tv_usec = 1;
  }
  setsockopt(sock, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv));
  setsockopt(sock, SOL_SOCKET, SO_SNDTIMEO, &tv, sizeof(tv));
}

void CheckDeadline(const Deadline &deadline, const char *phase) {
  if (deadline.Expired()) {
    throw HttpClientError(Kind::kTimeout,
                          std::string("deadline exceeded during ") + phase);
  }
}

struct Connection {
  int sock{-1};
  SSL *ssl{nullptr};

  Connection() = default;
  Connection(const Connection &) = delete;
  Connection &operator=(const Connection &) = delete;
  ~Connection() {
    if (ssl) {
      SSL_shutdown(ssl);
      SSL_free(ssl);
    }
    if (sock >= 0) {
      ::close(sock);
    }
  }
};

void Connect(const ParsedUrl &parsed, const Deadline &deadline,
             Connection *conn) {
  addrinfo hints{};
  hints.ai_family = AF_UNSPEC;
  hints.ai_socktype = SOCK_STREAM;
  addrinfo *result = nullptr;
  int rc = getaddrinfo(parsed.host.c_str(), std::to_string(parsed.port).c_str(),
                       &hints, &result);
  if (rc != 0) {
    throw HttpClientError(Kind::kResolve, "failed to resolve host " +
                                              parsed.host + ": " +
                                              gai_strerror(rc));
  }
  int sock = -1;
  int last_errno = 0;
  for (addrinfo *rp = result; rp != nullptr; rp = rp->ai_next) {
    if (deadline.Expired()) {
      last_errno = ETIMEDOUT;
      break;
    }
    sock = ::socket(rp->ai_family, rp->ai_socktype, rp->ai_protocol);
    if (sock == -1) {
      last_errno = errno;
      continue;
    }
    // Linux bounds a blocking connect() by SO_SNDTIMEO.
    ArmSocketTimeout(sock, deadline.Remaining());
    if (::connect(sock, rp->ai_addr, rp->ai_addrlen) == 0)
      break;
    last_errno = errno;
    ::close(sock);
    sock = -1;
  }
  freeaddrinfo(result);
  if (sock == -1) {
    if (last_errno == ECONNREFUSED) {
      throw HttpClientError(Kind::kConnectRefused,
                            "connection refused by " + parsed.host + ":" +
                                std::to_string(parsed.port));
    }
    if (IsTimeoutErrno(last_errno) || deadline.Expired()) {
      throw HttpClientError(Kind::kTimeout, "connect to " + parsed.host +
                                                " timed out");
    }
    throw HttpClientError(Kind::kConnect, "failed to connect to " +
                                              parsed.host + ": " +
                                              std::strerror(last_errno));
  }
  conn->sock = sock;
}

std::string BuildRequest(const ParsedUrl &parsed, const std::string &method,
                         const std::string &body,
                         const std::map<std::string, std::string> &headers) {
  std::ostringstream request;
  request << method << " " << parsed.path << " HTTP/1.1\r\n";
  request << "Host: " << parsed.host << ":" << parsed.port << "\r\n";
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

void StartTls(SSL_CTX *ctx, const ParsedUrl &parsed, const Deadline &deadline,
              Connection *conn) {
  conn->ssl = SSL_new(ctx);
  if (!conn->ssl) {
    throw HttpClientError(Kind::kTls, "failed to allocate TLS context");
  }
  SSL_set_tlsext_host_name(conn->ssl, parsed.host.c_str());
  if (SSL_set1_host(conn->ssl, parsed.host.c_str()) != 1) {
    throw HttpClientError(Kind::kTls, "failed to set TLS verification host");
  }
  SSL_set_fd(conn->ssl, conn->sock);
  ArmSocketTimeout(conn->sock, deadline.Remaining());
  if (SSL_connect(conn->ssl) != 1) {
    if (IsTimeoutErrno(errno) || deadline.Expired()) {
      throw HttpClientError(Kind::kTimeout, "TLS handshake timed out");
    }
    throw HttpClientError(Kind::kTls, "TLS handshake failed");
  }
  if (SSL_get_verify_result(conn->ssl) != X509_V_OK) {
    throw HttpClientError(Kind::kTls, "TLS certificate verification failed");
  }
}

void SendPayload(Connection *conn, const std::string &payload,
                 const Deadline &deadline) {
  const char *send_ptr = payload.c_str();
  std::size_t send_remaining = payload.size();
  while (send_remaining > 0) {
    CheckDeadline(deadline, "send");
    ArmSocketTimeout(conn->sock, deadline.Remaining());
    std::size_t sent = 0;
    if (conn->ssl) {
      int n = SSL_write(conn->ssl, send_ptr, static_cast<int>(send_remaining));
      if (n <= 0) {
        int err = SSL_get_error(conn->ssl, n);
        if (err == SSL_ERROR_WANT_READ || err == SSL_ERROR_WANT_WRITE) {
          continue;
        }
        if (IsTimeoutErrno(errno)) {
          throw HttpClientError(Kind::kTimeout, "TLS send timed out");
        }
        throw HttpClientError(Kind::kIo, "failed to send TLS request");
      }
      sent = static_cast<std::size_t>(n);
    } else {
      ssize_t n = ::send(conn->sock, send_ptr, send_remaining, MSG_NOSIGNAL);
      if (n < 0) {
        if (errno == EINTR) {
          continue;
        }
        if (IsTimeoutErrno(errno)) {
          throw HttpClientError(Kind::kTimeout, "send timed out");
        }
        throw HttpClientError(Kind::kIo, std::string("failed to send request: ") +
                                             std::strerror(errno));
      }
      sent = static_cast<std::size_t>(n);
    }
    send_ptr += sent;
    send_remaining -= sent;
  }
}

std::string ToLower(std::string value) {
  std::transform(value.begin(), value.end(), value.begin(), [](unsigned char c) {
    return static_cast<char>(std::tolower(c));
  });
  return value;
}

std::string Trim(const std::string &input) {
  auto start = input.find_first_not_of(" \t");
  auto end = input.find_last_not_of(" \t\r\n");
  if (start == std::string::npos) {
    return "";
  }
  return input.substr(start, end - start + 1);
}

std::map<std::string, std::string> ParseHeaderLines(const std::string &block) {
  std::map<std::string, std::string> headers;
  std::size_t pos = block.find("\r\n");
  while (pos != std::string::npos && pos + 2 < block.size()) {
    auto next = block.find("\r\n", pos + 2);
    std::string line = block.substr(
        pos + 2, next == std::string::npos ? std::string::npos : next - pos - 2);
    auto colon = line.find(':');
    if (colon != std::string::npos) {
      headers[ToLower(Trim(line.substr(0, colon)))] =
          Trim(line.substr(colon + 1));
    }
    pos = next;
  }
  return headers;
}

// Reads the chunk-size line starting at `pos`. On success `*next` is the first
// byte of chunk data.
bool ReadChunkSize(const std::string &raw, std::size_t pos, std::size_t *size,
                   std::size_t *next) {
  auto line_end = raw.find("\r\n", pos);
  if (line_end == std::string::npos) {
    return false;
  }
  std::string size_line = raw.substr(pos, line_end - pos);
  auto ext = size_line.find(';');
  if (ext != std::string::npos) {
    size_line = size_line.substr(0, ext);
  }
  try {
    *size = std::stoul(Trim(size_line), nullptr, 16);
  } catch (const std::exception &) {
    return false;
  }
  *next = line_end + 2;
  return true;
}

// Returns false on a malformed chunk stream.
bool DecodeChunked(const std::string &raw, std::string *out) {
  std::size_t pos = 0;
  out->clear();
  while (true) {
    std::size_t chunk_size = 0;
    if (!ReadChunkSize(raw, pos, &chunk_size, &pos)) {
      return false;
    }
    if (chunk_size == 0) {
      return true;
    }
    if (pos + chunk_size > raw.size()) {
      return false;
    }
    out->append(raw, pos, chunk_size);
    pos += chunk_size + 2;
  }
}

// Walks the chunk framing from `pos`. True once the last chunk and the
// trailer section have arrived, or once the framing is unreadable so the
// decoder can report it.
bool ChunkedBodyComplete(const std::string &raw, std::size_t pos) {
  while (true) {
    if (raw.find("\r\n", pos) == std::string::npos) {
      return false;
    }
    std::size_t chunk_size = 0;
    if (!ReadChunkSize(raw, pos, &chunk_size, &pos)) {
      return true;
    }
    if (chunk_size == 0) {
      break;
    }
    if (chunk_size > raw.size() || pos + chunk_size + 2 > raw.size()) {
      return false;
    }
    pos += chunk_size + 2;
  }
  // Trailer fields, if any, end with an empty line.
  while (raw.compare(pos, 2, "\r\n") != 0) {
    auto line_end = raw.find("\r\n", pos);
    if (line_end == std::string::npos) {
      return false;
    }
    pos = line_end + 2;
  }
  return true;
}

// True once the bytes received so far hold a complete response, so the read
// loop need not wait for the peer to close.
bool ResponseComplete(const std::string &raw) {
  auto header_end = raw.find("\r\n\r\n");
  if (header_end == std::string::npos) {
    return false;
  }
  auto headers = ParseHeaderLines(raw.substr(0, header_end));
  std::size_t body_size = raw.size() - header_end - 4;
  auto te = headers.find("transfer-encoding");
  if (te != headers.end() &&
      ToLower(te->second).find("chunked") != std::string::npos) {
    return ChunkedBodyComplete(raw, header_end + 4);
  }
  auto cl = headers.find("content-length");
  if (cl != headers.end()) {
    try {
      return body_size >= std::stoull(cl->second);
    } catch (const std::exception &) {
      return false;
    }
  }
  return false;
}

std::string ReceiveAll(Connection *conn, const Deadline &deadline) {
  std::string response;
  char buffer[4096];
  while (!ResponseComplete(response)) {
    CheckDeadline(deadline, "receive");
    ArmSocketTimeout(conn->sock, deadline.Remaining());
    if (conn->ssl) {
      int n = SSL_read(conn->ssl, buffer, sizeof(buffer));
      if (n > 0) {
        response.append(buffer, buffer + n);
        continue;
      }
      int err = SSL_get_error(conn->ssl, n);
      if (err == SSL_ERROR_ZERO_RETURN) {
        break;
      }
      if (err == SSL_ERROR_WANT_READ || err == SSL_ERROR_WANT_WRITE) {
        continue;
      }
      if (err == SSL_ERROR_SYSCALL && IsTimeoutErrno(errno)) {
        throw HttpClientError(Kind::kTimeout, "TLS receive timed out");
      }
      if (err == SSL_ERROR_SYSCALL && n == 0) {
        break; // Peer closed without close_notify.
      }
      throw HttpClientError(Kind::kIo, "failed to read TLS response");
    }
    ssize_t n = ::recv(conn->sock, buffer, sizeof(buffer), 0);
    if (n > 0) {
      response.append(buffer, buffer + n);
      continue;
    }
    if (n == 0) {
      break;
    }
    if (errno == EINTR) {
      continue;
    }
    if (IsTimeoutErrno(errno)) {
      throw HttpClientError(Kind::kTimeout, "receive timed out");
    }
    throw HttpClientError(Kind::kIo, std::string("failed to read response: ") +
                                         std::strerror(errno));
  }
  return response;
}

HttpResponse ParseResponse(const std::string &response) {
  auto header_end = response.find("\r\n\r\n");
  if (header_end == std::string::npos) {
    throw HttpClientError(Kind::kIo, "incomplete HTTP response");
  }
  std::string header = response.substr(0, header_end);
  std::string status_line = header.substr(0, header.find("\r\n"));
  if (status_line.rfind("HTTP/", 0) != 0) {
    throw HttpClientError(Kind::kIo, "malformed HTTP status line");
  }

  HttpResponse http_response;
  auto status_pos = status_line.find(' ');
  if (status_pos != std::string::npos) {
    try {
      http_response.status = std::stoi(status_line.substr(status_pos + 1));
    } catch (const std::exception &) {
      http_response.status = 0;
    }
  }
  if (http_response.status <= 0) {
    throw HttpClientError(Kind::kIo, "malformed HTTP status line");
  }
  http_response.headers = ParseHeaderLines(header);
  std::string body_str = response.substr(header_end + 4);
  auto te = http_response.headers.find("transfer-encoding");
  if (te != http_response.headers.end() &&
      ToLower(te->second).find("chunked") != std::string::npos) {
    if (!DecodeChunked(body_str, &http_response.body)) {
      throw HttpClientError(Kind::kIo, "malformed chunked response body");
    }
  } else {
    http_response.body = std::move(body_str);
  }
  return http_response;
}

} // namespace

std::string HttpResponse::Header(const std::string &name) const {
  auto it = headers.find(ToLower(name));
  return it == headers.end() ? std::string() : it->second;
}

const char *HttpClientErrorKindName(HttpClientError::Kind kind) {
  switch (kind) {
  case Kind::kInvalidUrl:
    return "invalid_endpoint";
  case Kind::kResolve:
    return "dns_failure";
  case Kind::kConnectRefused:
    return "connection_refused";
  case Kind::kConnect:
    return "connection_failed";
  case Kind::kTimeout:
    return "timeout";
  case Kind::kTls:
    return "tls_error";
  case Kind::kIo:
    return "io_error";
  }
  return "unknown";
}

std::string JoinUrl(const std::string &base, const std::string &path) {
  std::string joined = base;
  while (!joined.empty() && joined.back() == '/') {
    joined.pop_back();
  }
  if (path.empty() || path.front() != '/') {
    joined.push_back('/');
  }
  return joined + path;
}

HttpClient::HttpClient() {
  SSL_load_error_strings();
  OpenSSL_add_ssl_algorithms();
  ssl_ctx_ = SSL_CTX_new(TLS_client_method());
  if (ssl_ctx_) {
    SSL_CTX_set_verify(ssl_ctx_, SSL_VERIFY_PEER, nullptr);
    SSL_CTX_set_default_verify_paths(ssl_ctx_);
#ifdef SSL_OP_IGNORE_UNEXPECTED_EOF
    SSL_CTX_set_options(ssl_ctx_, SSL_OP_IGNORE_UNEXPECTED_EOF);
#endif
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
HttpClient::Send(const std::string &method, const std::string &url,
                 const std::string &body,
                 const std::map<std::string, std::string> &headers,
                 std::chrono::milliseconds timeout) const {
  auto parsed = ParseUrl(url);
  Deadline deadline(timeout);
  Connection conn;
  Connect(parsed, deadline, &conn);
  if (parsed.use_tls) {
    if (!tls_ready_) {
      throw HttpClientError(Kind::kTls, "TLS not available in HttpClient");
    }
    StartTls(ssl_ctx_, parsed, deadline, &conn);
  }
  SendPayload(&conn, BuildRequest(parsed, method, body, headers), deadline);
  return ParseResponse(ReceiveAll(&conn, deadline));
}

} // namespace promptgw
