#include "server/gateway/gateway_handler.h"

#include "server/logging/logger.h"

#include <nlohmann/json.hpp>

#include <utility>

using json = nlohmann::json;

namespace promptgw {

namespace {

// One body for every authentication failure so callers cannot tell a missing
// header from a wrong token.
HttpReply Unauthorized() {
  auto reply = JsonError(401, "Authentication Error", "unauthorized");
  reply.extra_headers.emplace_back("WWW-Authenticate", "Bearer");
  return reply;
}

HttpReply UpstreamUnavailable() {
  return JsonError(503, "Upstream service is not available",
                   "upstream_unavailable");
}

HttpReply JsonReply(int status, const json &body) {
  HttpReply reply;
  reply.status = status;
  reply.body = body.dump(-1, ' ', false, json::error_handler_t::replace);
  return reply;
}

HttpReply MethodNotAllowed(const char *allow) {
  auto reply = JsonError(405, "Method Not Allowed", "method_not_allowed");
  reply.extra_headers.emplace_back("Allow", allow);
  return reply;
}

} // namespace

std::string UpstreamHealthJson(const UpstreamHealth &health) {
  json j;
  j["status"] = health.reachable ? "healthy" : "unhealthy";
  j["reachable"] = health.reachable;
  if (health.detail) {
    j["detail"] = *health.detail;
  } else {
    j["detail"] = nullptr;
  }
  j["checked_at"] = FormatTimestamp(health.checked_at);
  return j.dump();
}

GatewayHandler::GatewayHandler(const AuthGuard *guard,
                               const UpstreamProbe *probe,
                               const HttpTransport *transport,
                               GatewayOptions options)
    : guard_(guard), probe_(probe), transport_(transport),
      options_(std::move(options)) {}

HttpReply GatewayHandler::Handle(const HttpRequest &request) const {
  const std::string &method = request.method;
  const std::string &path = request.path;

  // CORS preflight.
  if (method == "OPTIONS") {
    HttpReply reply;
    reply.status = 204;
    reply.content_type.clear();
    reply.extra_headers = {
        {"Access-Control-Allow-Methods", "GET, POST, OPTIONS"},
        {"Access-Control-Allow-Headers", "Content-Type, Authorization"},
        {"Access-Control-Max-Age", "86400"}};
    return reply;
  }

  // Unauthenticated liveness and health probes.
  if (path == kLivenessPath) {
    if (method != "GET") {
      return MethodNotAllowed("GET");
    }
    return JsonReply(200, {{"status", "up"}});
  }
  if (path == kEchoPath) {
    if (method != "GET") {
      return MethodNotAllowed("GET");
    }
    return JsonReply(200, "Server active!");
  }
  if (path == kHealthPath) {
    if (method != "GET") {
      return MethodNotAllowed("GET");
    }
    return HandleUpstreamHealth();
  }

  if (path == kQueryPath) {
    if (method != "POST") {
      return MethodNotAllowed("POST");
    }
    return HandleQuery(request);
  }
  return JsonError(404, "Not Found", "not_found");
}

HttpReply GatewayHandler::HandleUpstreamHealth() const {
  if (!probe_) {
    UpstreamHealth health;
    health.checked_at = std::chrono::system_clock::now();
    health.detail = "invalid_endpoint";
    HttpReply reply;
    reply.status = 503;
    reply.body = UpstreamHealthJson(health);
    return reply;
  }
  auto health = probe_->Check();
  HttpReply reply;
  reply.status = health.reachable ? 200 : 503;
  reply.body = UpstreamHealthJson(health);
  return reply;
}

HttpReply GatewayHandler::HandleQuery(const HttpRequest &request) const {
  if (!guard_) {
    return Unauthorized();
  }
  auto decision = guard_->Authorize(request);
  if (!decision.verdict.authorized) {
    return Unauthorized();
  }
  const std::string identity = decision.verdict.identity.value_or("");

  QueryRequest query;
  std::string error;
  if (!ParseQueryRequest(request.body, options_.query_policy, &query, &error)) {
    log::Info("gateway", "query rejected",
              "identity=" + identity + " error=" + error);
    return JsonError(400, "Validation Error", error);
  }

  if (!transport_) {
    return UpstreamUnavailable();
  }
  auto started = std::chrono::steady_clock::now();
  HttpResponse upstream;
  try {
    upstream = transport_->Post(
        JoinUrl(options_.upstream_base_url, kUpstreamChatPath),
        BuildChatPayload(query), options_.query_timeout);
  } catch (const HttpClientError &e) {
    log::Warn("gateway", "upstream forward failed",
              "identity=" + identity +
                  " kind=" + HttpClientErrorKindName(e.kind()) +
                  " error=" + e.what());
    return UpstreamUnavailable();
  }
  auto elapsed_ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                        std::chrono::steady_clock::now() - started)
                        .count();
  log::Info("gateway", "query forwarded",
            "identity=" + identity + " model=" + query.model +
                " status=" + std::to_string(upstream.status) +
                " latency_ms=" + std::to_string(elapsed_ms));

  HttpReply reply;
  reply.status = upstream.status;
  reply.body = std::move(upstream.body);
  std::string content_type = upstream.Header("Content-Type");
  if (!content_type.empty()) {
    reply.content_type = content_type;
  }
  return reply;
}

} // namespace promptgw
