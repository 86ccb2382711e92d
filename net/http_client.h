#pragma once

#include <chrono>
#include <map>
#include <stdexcept>
#include <string>

#include <openssl/ssl.h>

namespace promptgw {

struct HttpResponse {
  int status{0};
  std::string body;
  // Header names are stored lower-case.
  std::map<std::string, std::string> headers;

  std::string Header(const std::string &name) const;
};

// Thrown by HttpTransport::Send when no HTTP response could be obtained.
// A response with a non-2xx status is NOT an error at this layer.
class HttpClientError : public std::runtime_error {
public:
  enum class Kind {
    kInvalidUrl,
    kResolve,
    kConnectRefused,
    kConnect,
    kTimeout,
    kTls,
    kIo,
  };

  HttpClientError(Kind kind, const std::string &message)
      : std::runtime_error(message), kind_(kind) {}

  Kind kind() const { return kind_; }

private:
  Kind kind_;
};

const char *HttpClientErrorKindName(HttpClientError::Kind kind);

// "http://h:1/" + "/api/tags" -> "http://h:1/api/tags".
std::string JoinUrl(const std::string &base, const std::string &path);

// Seam between the gateway and the network. Production code uses HttpClient;
// tests substitute a scripted implementation.
//
// Thread safety: Send must be safe to call concurrently.
class HttpTransport {
public:
  virtual ~HttpTransport() = default;

  // `timeout` bounds the whole exchange (connect, send, receive). Throws
  // HttpClientError on failure.
  virtual HttpResponse
  Send(const std::string &method, const std::string &url,
       const std::string &body,
       const std::map<std::string, std::string> &headers,
       std::chrono::milliseconds timeout) const = 0;

  HttpResponse Get(const std::string &url, std::chrono::milliseconds timeout,
                   const std::map<std::string, std::string> &headers = {}) const {
    return Send("GET", url, "", headers, timeout);
  }
  HttpResponse Post(const std::string &url, const std::string &body,
                    std::chrono::milliseconds timeout,
                    const std::map<std::string, std::string> &headers = {}) const {
    return Send("POST", url, body, headers, timeout);
  }
};

class HttpClient : public HttpTransport {
public:
  HttpClient();
  ~HttpClient() override;
  HttpClient(const HttpClient &) = delete;
  HttpClient &operator=(const HttpClient &) = delete;

  HttpResponse Send(const std::string &method, const std::string &url,
                    const std::string &body,
                    const std::map<std::string, std::string> &headers,
                    std::chrono::milliseconds timeout) const override;

private:
  SSL_CTX *ssl_ctx_{nullptr};
  bool tls_ready_{false};
};

} // namespace promptgw
