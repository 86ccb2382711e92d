#include <catch2/catch_test_macros.hpp>

#include "upstream/startup_retrier.h"

#include <chrono>
#include <vector>

using promptgw::RetryPolicy;
using promptgw::StartupRetrier;
using promptgw::UpstreamHealth;

namespace {

UpstreamHealth Down() {
  UpstreamHealth health;
  health.detail = "connection_refused";
  return health;
}

UpstreamHealth Up() {
  UpstreamHealth health;
  health.reachable = true;
  return health;
}

struct SleepRecorder {
  std::vector<std::chrono::milliseconds> sleeps;
  StartupRetrier::SleepFn Fn() {
    return [this](std::chrono::milliseconds d) { sleeps.push_back(d); };
  }
};

} // namespace

TEST_CASE("StartupRetrier stops at the first reachable probe", "[retrier]") {
  SleepRecorder recorder;
  StartupRetrier retrier(RetryPolicy{}, recorder.Fn());
  int probes = 0;
  int attempts = 0;
  auto health = retrier.EnsureReachable(
      [&] {
        ++probes;
        return probes == 7 ? Up() : Down();
      },
      &attempts);
  REQUIRE(health.reachable);
  REQUIRE(probes == 7);
  REQUIRE(attempts == 7);
  REQUIRE(recorder.sleeps.size() == 6);
  for (auto d : recorder.sleeps) {
    REQUIRE(d == std::chrono::seconds(2));
  }
}

TEST_CASE("StartupRetrier gives up after max_attempts without throwing", "[retrier]") {
  SleepRecorder recorder;
  StartupRetrier retrier(RetryPolicy{}, recorder.Fn());
  int probes = 0;
  int attempts = 0;
  UpstreamHealth health;
  REQUIRE_NOTHROW(health = retrier.EnsureReachable(
                      [&] {
                        ++probes;
                        return Down();
                      },
                      &attempts));
  REQUIRE_FALSE(health.reachable);
  REQUIRE(health.detail.value() == "connection_refused");
  REQUIRE(probes == 10);
  REQUIRE(attempts == 10);
  // No sleep after the final attempt.
  REQUIRE(recorder.sleeps.size() == 9);
}

TEST_CASE("StartupRetrier immediate success never sleeps", "[retrier]") {
  SleepRecorder recorder;
  StartupRetrier retrier(RetryPolicy{}, recorder.Fn());
  int attempts = 0;
  REQUIRE(retrier.EnsureReachable(Up, &attempts).reachable);
  REQUIRE(attempts == 1);
  REQUIRE(recorder.sleeps.empty());
}

TEST_CASE("StartupRetrier clamps a non-positive attempt budget to one", "[retrier]") {
  SleepRecorder recorder;
  RetryPolicy policy;
  policy.max_attempts = 0;
  policy.delay = std::chrono::milliseconds(-5);
  StartupRetrier retrier(policy, recorder.Fn());
  REQUIRE(retrier.Policy().max_attempts == 1);
  REQUIRE(retrier.Policy().delay == std::chrono::milliseconds(0));

  int probes = 0;
  retrier.EnsureReachable([&] {
    ++probes;
    return Down();
  });
  REQUIRE(probes == 1);
  REQUIRE(recorder.sleeps.empty());
}

TEST_CASE("StartupRetrier uses the configured delay", "[retrier]") {
  SleepRecorder recorder;
  RetryPolicy policy;
  policy.max_attempts = 3;
  policy.delay = std::chrono::milliseconds(250);
  StartupRetrier retrier(policy, recorder.Fn());
  retrier.EnsureReachable(Down);
  REQUIRE(recorder.sleeps ==
          std::vector<std::chrono::milliseconds>(2, std::chrono::milliseconds(250)));
}
