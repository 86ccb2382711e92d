#include "upstream/startup_retrier.h"

#include "server/logging/logger.h"

#include <thread>
#include <utility>

namespace promptgw {

StartupRetrier::StartupRetrier(RetryPolicy policy, SleepFn sleep)
    : policy_(policy), sleep_(std::move(sleep)) {
  if (policy_.max_attempts < 1) {
    policy_.max_attempts = 1;
  }
  if (policy_.delay.count() < 0) {
    policy_.delay = std::chrono::milliseconds(0);
  }
  if (!sleep_) {
    sleep_ = [](std::chrono::milliseconds d) { std::this_thread::sleep_for(d); };
  }
}

UpstreamHealth StartupRetrier::EnsureReachable(const ProbeFn& probe, int* attempts) const {
  UpstreamHealth health;
  int attempt = 0;
  while (attempt < policy_.max_attempts) {
    ++attempt;
    health = probe();
    if (health.reachable) {
      log::Info("upstream", "upstream reachable",
                "attempt=" + std::to_string(attempt) + "/" +
                    std::to_string(policy_.max_attempts));
      break;
    }
    std::string progress = "attempt=" + std::to_string(attempt) + "/" +
                           std::to_string(policy_.max_attempts) +
                           " detail=" + health.detail.value_or("unknown");
    if (attempt == policy_.max_attempts) {
      log::Warn("upstream", "upstream still unreachable, giving up warm-up", progress);
      break;
    }
    log::Warn("upstream", "upstream not available", progress);
    log::Info("upstream", "retrying",
              "delay_ms=" + std::to_string(policy_.delay.count()));
    sleep_(policy_.delay);
  }
  if (attempts) {
    *attempts = attempt;
  }
  return health;
}

}  // namespace promptgw
