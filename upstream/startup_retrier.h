#pragma once

#include "upstream/upstream_probe.h"

#include <chrono>
#include <functional>

namespace promptgw {

struct RetryPolicy {
  int max_attempts{10};
  std::chrono::milliseconds delay{2000};
};

// Drives a probe in a bounded, fixed-interval loop. Used once at startup as a
// best-effort warm-up: exhausting the budget is logged, never fatal.
class StartupRetrier {
 public:
  using ProbeFn = std::function<UpstreamHealth()>;
  using SleepFn = std::function<void(std::chrono::milliseconds)>;

  // An empty `sleep` uses std::this_thread::sleep_for.
  explicit StartupRetrier(RetryPolicy policy, SleepFn sleep = {});

  // Probes until reachable or max_attempts probes have run, sleeping
  // policy.delay between attempts (not after the last). Returns the last
  // health observed. *attempts receives the number of probes performed.
  UpstreamHealth EnsureReachable(const ProbeFn& probe, int* attempts = nullptr) const;

  const RetryPolicy& Policy() const { return policy_; }

 private:
  RetryPolicy policy_;
  SleepFn sleep_;
};

}  // namespace promptgw
