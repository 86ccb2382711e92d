#pragma once

#include "net/http_client.h"
#include "server/auth/auth_guard.h"
#include "server/gateway/query_request.h"
#include "server/http/http_message.h"
#include "upstream/upstream_probe.h"

#include <chrono>
#include <string>

namespace promptgw {

struct GatewayOptions {
  std::string upstream_base_url{"http://host.docker.internal:11434"};
  std::chrono::milliseconds query_timeout{std::chrono::seconds(300)};
  QueryPolicy query_policy;
};

// {"status","reachable","detail","checked_at"} for the health route.
std::string UpstreamHealthJson(const UpstreamHealth &health);

// Routes one parsed request:
//   POST /query          bearer-protected forward to the upstream chat API
//   GET  /health/ollama  fresh upstream probe, 200 or 503
//   GET  /up             liveness, always 200
//   GET  /echo           "Server active!"
// Stateless; safe to call from every worker concurrently.
class GatewayHandler {
public:
  static constexpr const char *kQueryPath = "/query";
  static constexpr const char *kHealthPath = "/health/ollama";
  static constexpr const char *kLivenessPath = "/up";
  static constexpr const char *kEchoPath = "/echo";
  static constexpr const char *kUpstreamChatPath = "/api/chat";

  GatewayHandler(const AuthGuard *guard, const UpstreamProbe *probe,
                 const HttpTransport *transport, GatewayOptions options);

  HttpReply Handle(const HttpRequest &request) const;

private:
  HttpReply HandleQuery(const HttpRequest &request) const;
  HttpReply HandleUpstreamHealth() const;

  const AuthGuard *guard_;
  const UpstreamProbe *probe_;
  const HttpTransport *transport_;
  GatewayOptions options_;
};

} // namespace promptgw
