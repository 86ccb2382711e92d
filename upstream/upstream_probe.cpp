#include "upstream/upstream_probe.h"

#include "server/logging/logger.h"

#include <cstdio>
#include <ctime>
#include <utility>

namespace promptgw {

std::string FormatTimestamp(std::chrono::system_clock::time_point tp) {
  auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                tp.time_since_epoch())
                .count();
  std::time_t secs = static_cast<std::time_t>(ms / 1000);
  std::tm utc{};
  gmtime_r(&secs, &utc);
  char buf[32];
  std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%S", &utc);
  char out[40];
  std::snprintf(out, sizeof(out), "%s.%03dZ", buf, static_cast<int>(ms % 1000));
  return out;
}

UpstreamProbe::UpstreamProbe(const HttpTransport* transport, std::string base_url,
                             std::chrono::milliseconds timeout)
    : transport_(transport), base_url_(std::move(base_url)), timeout_(timeout) {}

UpstreamHealth UpstreamProbe::Check() const {
  UpstreamHealth health;
  health.checked_at = std::chrono::system_clock::now();
  if (!transport_) {
    health.detail = "invalid_endpoint";
    return health;
  }
  try {
    auto response = transport_->Get(JoinUrl(base_url_, kIntrospectionPath), timeout_);
    if (response.status == 200) {
      health.reachable = true;
    } else {
      health.detail = "unexpected_status:" + std::to_string(response.status);
    }
  } catch (const HttpClientError& e) {
    health.detail = HttpClientErrorKindName(e.kind());
    log::Debug("upstream", "probe failed", std::string("error=") + e.what());
  } catch (const std::exception& e) {
    health.detail = "io_error";
    log::Debug("upstream", "probe failed", std::string("error=") + e.what());
  }
  return health;
}

}  // namespace promptgw
