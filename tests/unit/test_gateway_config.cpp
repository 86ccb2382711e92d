#include <catch2/catch_test_macros.hpp>

#include "server/config/gateway_config.h"

#include <chrono>
#include <cstdio>
#include <filesystem>
#include <fstream>
#include <map>
#include <string>

using promptgw::CommandLineOptions;
using promptgw::GatewayConfig;

namespace {

std::filesystem::path WriteTempFile(const std::string &name, const std::string &content) {
  auto path = std::filesystem::temp_directory_path() / name;
  std::ofstream out(path);
  out << content;
  return path;
}

} // namespace

TEST_CASE("GatewayConfig defaults", "[config]") {
  GatewayConfig config;
  REQUIRE(config.host == "0.0.0.0");
  REQUIRE(config.port == 5000);
  REQUIRE(config.http_workers == 4);
  REQUIRE(config.upstream_url == "http://host.docker.internal:11434");
  REQUIRE(config.probe_timeout == std::chrono::seconds(5));
  REQUIRE(config.query_timeout == std::chrono::seconds(300));
  REQUIRE(config.startup_max_attempts == 10);
  REQUIRE(config.startup_delay == std::chrono::seconds(2));
  REQUIRE(config.pull_models);
  REQUIRE(config.allowed_models == std::vector<std::string>{"llama3:8b"});
  REQUIRE(config.api_keys.empty());
}

TEST_CASE("LoadConfigFile reads the YAML layout", "[config]") {
  auto path = WriteTempFile("promptgw_config_test.yaml", R"(
server:
  host: 127.0.0.1
  port: 6000
  http_workers: 8
upstream:
  url: http://ollama:11434
  probe_timeout_ms: 1500
  query_timeout_ms: 60000
  pull_models: false
  startup:
    max_attempts: 3
    delay_ms: 100
models:
  default: mistral:7b
  allowed:
    - llama3:8b
    - mistral:7b
logging:
  level: debug
  format: json
tls:
  enabled: true
  cert_path: /etc/cert.pem
  key_path: /etc/key.pem
)");
  GatewayConfig config;
  REQUIRE(promptgw::LoadConfigFile(path.string(), &config));
  std::filesystem::remove(path);

  REQUIRE(config.host == "127.0.0.1");
  REQUIRE(config.port == 6000);
  REQUIRE(config.http_workers == 8);
  REQUIRE(config.upstream_url == "http://ollama:11434");
  REQUIRE(config.probe_timeout == std::chrono::milliseconds(1500));
  REQUIRE(config.query_timeout == std::chrono::seconds(60));
  REQUIRE_FALSE(config.pull_models);
  REQUIRE(config.startup_max_attempts == 3);
  REQUIRE(config.startup_delay == std::chrono::milliseconds(100));
  REQUIRE(config.allowed_models == std::vector<std::string>{"llama3:8b", "mistral:7b"});
  REQUIRE(config.default_model == "mistral:7b");
  REQUIRE(config.log_level == promptgw::log::Level::DEBUG);
  REQUIRE(config.json_logs);
  REQUIRE(config.tls_enabled);
  REQUIRE(config.tls_cert_path == "/etc/cert.pem");
}

TEST_CASE("LoadConfigFile leaves defaults on a missing or malformed file", "[config]") {
  GatewayConfig config;
  REQUIRE_FALSE(promptgw::LoadConfigFile("/nonexistent/promptgw.yaml", &config));
  REQUIRE(config.port == 5000);

  auto path = WriteTempFile("promptgw_bad_config.yaml", "server:\n  port: [oops\n");
  REQUIRE_FALSE(promptgw::LoadConfigFile(path.string(), &config));
  std::filesystem::remove(path);
  REQUIRE(config.port == 5000);
}

TEST_CASE("LoadConfigFile ignores out-of-range YAML values", "[config]") {
  auto path = WriteTempFile("promptgw_range_config.yaml", R"(
server:
  port: 70000
  http_workers: -3
upstream:
  probe_timeout_ms: 0
  query_timeout_ms: -5
  pull_models: sometimes
  startup:
    max_attempts: -1
    delay_ms: 250
)");
  GatewayConfig config;
  REQUIRE(promptgw::LoadConfigFile(path.string(), &config));
  std::filesystem::remove(path);

  REQUIRE(config.port == 5000);
  REQUIRE(config.http_workers == 4);
  REQUIRE(config.probe_timeout == std::chrono::seconds(5));
  REQUIRE(config.query_timeout == std::chrono::seconds(300));
  REQUIRE(config.pull_models);
  REQUIRE(config.startup_max_attempts == 10);
  REQUIRE(config.startup_delay == std::chrono::milliseconds(250));
}

TEST_CASE("ParseDotEnv handles comments, quotes and export", "[config]") {
  auto values = promptgw::ParseDotEnv(
      "# comment\n"
      "\n"
      "API_KEYS=[{\"appname\":\"APP1\",\"key\":\"abc\"}]\n"
      "export PROMPTGW_PORT=7000\n"
      "PROMPTGW_HOST='127.0.0.1'\n"
      "PROMPTGW_UPSTREAM_URL = \"http://ollama:11434\"\n"
      "garbage line\n");
  REQUIRE(values.size() == 4);
  REQUIRE(values["API_KEYS"] == R"([{"appname":"APP1","key":"abc"}])");
  REQUIRE(values["PROMPTGW_PORT"] == "7000");
  REQUIRE(values["PROMPTGW_HOST"] == "127.0.0.1");
  REQUIRE(values["PROMPTGW_UPSTREAM_URL"] == "http://ollama:11434");
}

TEST_CASE("ApplyEnvironment overrides and validates values", "[config]") {
  GatewayConfig config;
  promptgw::ApplyEnvironment(
      promptgw::MapEnvironment({{"PROMPTGW_PORT", "8081"},
                                {"PROMPTGW_STARTUP_DELAY_MS", "-1"},
                                {"PROMPTGW_HTTP_WORKERS", "0"},
                                {"PROMPTGW_QUERY_TIMEOUT_MS", "abc"},
                                {"PROMPTGW_PROBE_TIMEOUT_MS", "250"},
                                {"PROMPTGW_STARTUP_MAX_ATTEMPTS", "2"},
                                {"PROMPTGW_PULL_MODELS", "no"},
                                {"PROMPTGW_ALLOWED_MODELS", "mistral:7b, phi3"},
                                {"PROMPTGW_LOG_LEVEL", "warning"},
                                {"PROMPTGW_LOG_FORMAT", "json"},
                                {"PROMPTGW_TLS_ENABLED", "maybe"}}),
      &config);
  REQUIRE(config.port == 8081);
  REQUIRE(config.http_workers == 4);
  REQUIRE(config.query_timeout == std::chrono::seconds(300));
  REQUIRE(config.probe_timeout == std::chrono::milliseconds(250));
  REQUIRE(config.startup_max_attempts == 2);
  REQUIRE(config.startup_delay == std::chrono::seconds(2));
  REQUIRE_FALSE(config.pull_models);
  REQUIRE(config.allowed_models == std::vector<std::string>{"mistral:7b", "phi3"});
  REQUIRE(config.default_model == "mistral:7b");
  REQUIRE(config.log_level == promptgw::log::Level::WARN);
  REQUIRE(config.json_logs);
  REQUIRE_FALSE(config.tls_enabled);
}

TEST_CASE("ApplyEnvironment prefers PROMPTGW_API_KEYS over API_KEYS", "[config]") {
  GatewayConfig config;
  promptgw::ApplyEnvironment(promptgw::MapEnvironment({{"API_KEYS", "legacy"}}), &config);
  REQUIRE(config.api_keys == "legacy");
  promptgw::ApplyEnvironment(
      promptgw::MapEnvironment({{"API_KEYS", "legacy"}, {"PROMPTGW_API_KEYS", "current"}}),
      &config);
  REQUIRE(config.api_keys == "current");
}

TEST_CASE("ParseCommandLine reads host, port and log level", "[config]") {
  const char *argv[] = {"promptgw", "--config", "/tmp/gw.yaml", "-H", "127.0.0.1",
                        "--port",   "9000",     "-L",           "error"};
  CommandLineOptions options;
  std::string error;
  REQUIRE(promptgw::ParseCommandLine(9, argv, &options, &error));
  REQUIRE(options.config_path == "/tmp/gw.yaml");
  REQUIRE(options.host.value() == "127.0.0.1");
  REQUIRE(options.port.value() == 9000);
  REQUIRE(options.log_level.value() == promptgw::log::Level::ERROR);
}

TEST_CASE("ParseCommandLine rejects bad input", "[config]") {
  CommandLineOptions options;
  std::string error;
  const char *bad_port[] = {"promptgw", "-P", "http"};
  REQUIRE_FALSE(promptgw::ParseCommandLine(3, bad_port, &options, &error));
  REQUIRE(error == "invalid port: http");

  const char *missing[] = {"promptgw", "--host"};
  REQUIRE_FALSE(promptgw::ParseCommandLine(2, missing, &options, &error));

  const char *unknown[] = {"promptgw", "--verbose"};
  REQUIRE_FALSE(promptgw::ParseCommandLine(2, unknown, &options, &error));
  REQUIRE(error == "unknown argument: --verbose");

  const char *big_port[] = {"promptgw", "--port", "70000"};
  REQUIRE_FALSE(promptgw::ParseCommandLine(3, big_port, &options, &error));
  REQUIRE(error == "invalid port: 70000");
}

TEST_CASE("ApplyEnvironment rejects ports above 65535", "[config]") {
  GatewayConfig config;
  promptgw::ApplyEnvironment(promptgw::MapEnvironment({{"PROMPTGW_PORT", "70000"}}),
                             &config);
  REQUIRE(config.port == 5000);
}

TEST_CASE("ResolveConfig layers YAML, .env, environment and CLI", "[config]") {
  auto yaml = WriteTempFile("promptgw_layers.yaml",
                            "server:\n  host: 10.0.0.1\n  port: 6000\n  http_workers: 2\n"
                            "upstream:\n  url: http://from-yaml:11434\n");
  auto dotenv = WriteTempFile("promptgw_layers.env",
                              "PROMPTGW_PORT=7000\n"
                              "PROMPTGW_UPSTREAM_URL=http://from-dotenv:11434\n"
                              "API_KEYS=[{\"appname\":\"APP1\",\"key\":\"abc\"}]\n");

  CommandLineOptions options;
  options.config_path = yaml.string();
  options.host = "127.0.0.1";
  auto env = promptgw::MapEnvironment({{"PROMPTGW_UPSTREAM_URL", "http://from-env:11434"}});

  auto config = promptgw::ResolveConfig(options, env, dotenv.string());
  std::filesystem::remove(yaml);
  std::filesystem::remove(dotenv);

  REQUIRE(config.host == "127.0.0.1");
  REQUIRE(config.upstream_url == "http://from-env:11434");
  REQUIRE(config.port == 7000);
  REQUIRE(config.http_workers == 2);
  REQUIRE(config.api_keys == R"([{"appname":"APP1","key":"abc"}])");
}
