#include "net/http_client.h"
#include "server/auth/auth_guard.h"
#include "server/auth/credential_store.h"
#include "server/config/gateway_config.h"
#include "server/gateway/gateway_handler.h"
#include "server/http/http_server.h"
#include "server/logging/logger.h"
#include "upstream/model_provisioner.h"
#include "upstream/startup_retrier.h"
#include "upstream/upstream_probe.h"

#include <atomic>
#include <chrono>
#include <csignal>
#include <iostream>
#include <memory>
#include <string>
#include <thread>
#include <vector>

namespace {

std::atomic<bool> g_running{true};

void SignalHandler(int) { g_running = false; }

void PrintUsage() {
  std::cout << "Usage: promptgw [--config PATH] [-H|--host HOST] [-P|--port PORT]\n"
            << "                [-L|--loglevel DEBUG|INFO|WARN|ERROR]\n";
}

std::string Join(const std::vector<std::string> &items) {
  std::string out;
  for (const auto &item : items) {
    if (!out.empty()) {
      out += ",";
    }
    out += item;
  }
  return out;
}

} // namespace

int main(int argc, char **argv) {
  promptgw::CommandLineOptions options;
  std::string cli_error;
  if (!promptgw::ParseCommandLine(argc, argv, &options, &cli_error)) {
    std::cerr << cli_error << "\n";
    PrintUsage();
    return 2;
  }
  if (options.show_help) {
    PrintUsage();
    return 0;
  }

  auto config = promptgw::ResolveConfig(options, promptgw::ProcessEnvironment());
  promptgw::log::SetJsonMode(config.json_logs);
  promptgw::log::SetMinLevel(config.log_level);

  // Peers closing mid-write must not kill the process.
  std::signal(SIGPIPE, SIG_IGN);

  std::string credential_error;
  auto store = std::make_shared<const promptgw::CredentialStore>(
      promptgw::CredentialStore::Load(config.api_keys, &credential_error));
  if (!credential_error.empty()) {
    promptgw::log::Error("config", "invalid API key configuration; all requests will be rejected",
                         credential_error);
  } else if (store->Empty()) {
    promptgw::log::Warn("config", "no API keys configured; all requests will be rejected");
  } else {
    promptgw::log::Info("config", "loaded API keys",
                        "count=" + std::to_string(store->Size()) +
                            " identities=" + Join(store->Identities()));
  }
  auto shadowed = store->ShadowedIdentities();
  if (!shadowed.empty()) {
    promptgw::log::Warn("config", "duplicate API keys; later entries never match",
                        "identities=" + Join(shadowed));
  }

  promptgw::HttpClient client;
  promptgw::UpstreamProbe probe(&client, config.upstream_url, config.probe_timeout);

  promptgw::RetryPolicy policy;
  policy.max_attempts = config.startup_max_attempts;
  policy.delay = config.startup_delay;
  promptgw::StartupRetrier retrier(policy);
  int attempts = 0;
  auto health = retrier.EnsureReachable([&probe] { return probe.Check(); }, &attempts);
  if (!health.reachable) {
    promptgw::log::Warn("upstream", "starting without a reachable upstream",
                        "url=" + config.upstream_url +
                            " attempts=" + std::to_string(attempts));
  } else if (config.pull_models) {
    promptgw::ModelProvisioner provisioner(&client, config.upstream_url,
                                           config.probe_timeout, config.query_timeout);
    auto report = provisioner.EnsureModels(config.allowed_models);
    if (!report.failed.empty()) {
      promptgw::log::Warn("upstream", "some models are unavailable",
                          "models=" + Join(report.failed));
    }
  }

  promptgw::AuthGuard guard(store);
  promptgw::GatewayOptions gateway_options;
  gateway_options.upstream_base_url = config.upstream_url;
  gateway_options.query_timeout = config.query_timeout;
  gateway_options.query_policy.allowed_models = config.allowed_models;
  gateway_options.query_policy.default_model = config.default_model;
  promptgw::GatewayHandler handler(&guard, &probe, &client, gateway_options);

  promptgw::HttpServer::TlsConfig tls_config;
  tls_config.enabled = config.tls_enabled;
  tls_config.cert_path = config.tls_cert_path;
  tls_config.key_path = config.tls_key_path;
  promptgw::HttpServer server(
      config.host, config.port,
      [&handler](const promptgw::HttpRequest &request) { return handler.Handle(request); },
      tls_config, config.http_workers);

  std::signal(SIGINT, SignalHandler);
  std::signal(SIGTERM, SignalHandler);

  if (!server.Start()) {
    promptgw::log::Error("server", "failed to start",
                         config.host + ":" + std::to_string(config.port));
    return 1;
  }
  promptgw::log::Info("server", "listening",
                      config.host + ":" + std::to_string(server.Port()) +
                          (server.TlsEnabled() ? " tls=on" : " tls=off") +
                          " workers=" + std::to_string(config.http_workers));

  while (g_running) {
    std::this_thread::sleep_for(std::chrono::milliseconds(200));
  }

  server.Stop();
  promptgw::log::Info("server", "shutting down");
  return 0;
}
