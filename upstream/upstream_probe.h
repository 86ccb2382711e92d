#pragma once

#include "net/http_client.h"

#include <chrono>
#include <optional>
#include <string>

namespace promptgw {

struct UpstreamHealth {
  bool reachable{false};
  std::chrono::system_clock::time_point checked_at;
  // Failure classification: connection_refused, connection_failed, timeout,
  // dns_failure, tls_error, io_error, invalid_endpoint, unexpected_status:<code>.
  std::optional<std::string> detail;
};

// ISO-8601 UTC with millisecond precision, e.g. 2026-10-19T08:15:02.123Z.
std::string FormatTimestamp(std::chrono::system_clock::time_point tp);

// One bounded GET against the upstream's model listing endpoint. Every call
// is a fresh network round trip; results are never cached.
class UpstreamProbe {
 public:
  static constexpr const char* kIntrospectionPath = "/api/tags";

  UpstreamProbe(const HttpTransport* transport, std::string base_url,
                std::chrono::milliseconds timeout);

  // Never throws.
  UpstreamHealth Check() const;

  const std::string& BaseUrl() const { return base_url_; }

 private:
  const HttpTransport* transport_;
  std::string base_url_;
  std::chrono::milliseconds timeout_;
};

}  // namespace promptgw
