#include <catch2/catch_test_macros.hpp>

#include "tests/unit/scripted_transport.h"
#include "upstream/upstream_probe.h"

#include <chrono>
#include <regex>
#include <string>

using promptgw::HttpClientError;
using promptgw::UpstreamProbe;
using promptgw::testing::ScriptedTransport;

TEST_CASE("UpstreamProbe reports 200 as reachable", "[upstream]") {
  ScriptedTransport transport;
  transport.Respond(200, R"({"models":[]})");
  UpstreamProbe probe(&transport, "http://ollama:11434", std::chrono::seconds(5));

  auto before = std::chrono::system_clock::now();
  auto health = probe.Check();
  REQUIRE(health.reachable);
  REQUIRE_FALSE(health.detail.has_value());
  REQUIRE(health.checked_at >= before);

  auto calls = transport.Calls();
  REQUIRE(calls.size() == 1);
  REQUIRE(calls[0].method == "GET");
  REQUIRE(calls[0].url == "http://ollama:11434/api/tags");
  REQUIRE(calls[0].timeout == std::chrono::seconds(5));
}

TEST_CASE("UpstreamProbe treats other statuses as unreachable", "[upstream]") {
  ScriptedTransport transport;
  transport.Respond(500, "boom");
  transport.Respond(404);
  UpstreamProbe probe(&transport, "http://ollama:11434/", std::chrono::seconds(1));

  auto first = probe.Check();
  REQUIRE_FALSE(first.reachable);
  REQUIRE(first.detail.value() == "unexpected_status:500");
  REQUIRE(probe.Check().detail.value() == "unexpected_status:404");
  REQUIRE(transport.Calls()[0].url == "http://ollama:11434/api/tags");
}

TEST_CASE("UpstreamProbe classifies transport failures", "[upstream]") {
  struct Case {
    HttpClientError::Kind kind;
    const char *detail;
  };
  const Case cases[] = {
      {HttpClientError::Kind::kConnectRefused, "connection_refused"},
      {HttpClientError::Kind::kConnect, "connection_failed"},
      {HttpClientError::Kind::kTimeout, "timeout"},
      {HttpClientError::Kind::kResolve, "dns_failure"},
      {HttpClientError::Kind::kTls, "tls_error"},
      {HttpClientError::Kind::kIo, "io_error"},
      {HttpClientError::Kind::kInvalidUrl, "invalid_endpoint"},
  };
  for (const auto &c : cases) {
    ScriptedTransport transport;
    transport.Fail(c.kind);
    UpstreamProbe probe(&transport, "http://ollama:11434", std::chrono::seconds(1));
    auto health = probe.Check();
    INFO(c.detail);
    REQUIRE_FALSE(health.reachable);
    REQUIRE(health.detail.value() == c.detail);
  }
}

TEST_CASE("UpstreamProbe without a transport is an invalid endpoint", "[upstream]") {
  UpstreamProbe probe(nullptr, "http://ollama:11434", std::chrono::seconds(1));
  auto health = probe.Check();
  REQUIRE_FALSE(health.reachable);
  REQUIRE(health.detail.value() == "invalid_endpoint");
}

TEST_CASE("FormatTimestamp renders ISO-8601 UTC with milliseconds", "[upstream]") {
  std::chrono::system_clock::time_point tp{std::chrono::milliseconds(1700000000123LL)};
  REQUIRE(promptgw::FormatTimestamp(tp) == "2023-11-14T22:13:20.123Z");

  auto now = promptgw::FormatTimestamp(std::chrono::system_clock::now());
  REQUIRE(std::regex_match(now, std::regex(R"(\d{4}-\d{2}-\d{2}T\d{2}:\d{2}:\d{2}\.\d{3}Z)")));
}
