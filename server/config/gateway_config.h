#pragma once

#include "server/logging/logger.h"

#include <chrono>
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace promptgw {

struct GatewayConfig {
  std::string host{"0.0.0.0"};
  int port{5000};
  int http_workers{4};

  std::string upstream_url{"http://host.docker.internal:11434"};
  std::chrono::milliseconds probe_timeout{std::chrono::seconds(5)};
  std::chrono::milliseconds query_timeout{std::chrono::seconds(300)};
  int startup_max_attempts{10};
  std::chrono::milliseconds startup_delay{std::chrono::seconds(2)};
  bool pull_models{true};
  std::vector<std::string> allowed_models{"llama3:8b"};
  std::string default_model{"llama3:8b"};

  // Raw JSON credential array; parsed by CredentialStore::Load.
  std::string api_keys;

  log::Level log_level{log::Level::INFO};
  bool json_logs{false};

  bool tls_enabled{false};
  std::string tls_cert_path;
  std::string tls_key_path;
};

// Returns the value of an environment-style variable, or nullopt if unset.
using EnvLookup = std::function<std::optional<std::string>(const std::string &)>;

struct CommandLineOptions {
  std::string config_path{"config/gateway.yaml"};
  std::optional<std::string> host;
  std::optional<int> port;
  std::optional<log::Level> log_level;
  bool show_help{false};
};

// Merges the YAML file at `path` into *config. A missing file is not an
// error. A malformed file is logged and leaves *config unchanged.
// Returns true if values were read from the file.
bool LoadConfigFile(const std::string &path, GatewayConfig *config);

// KEY=VALUE lines; blank lines and '#' comments skipped, an optional
// "export " prefix and matching surrounding quotes removed.
std::map<std::string, std::string> ParseDotEnv(const std::string &content);

// Reads and parses `path`; empty when the file does not exist.
std::map<std::string, std::string> ReadDotEnvFile(const std::string &path);

// Applies PROMPTGW_* variables (and API_KEYS) visible through `lookup`.
// Unparseable values are logged and ignored.
void ApplyEnvironment(const EnvLookup &lookup, GatewayConfig *config);

EnvLookup ProcessEnvironment();
EnvLookup MapEnvironment(std::map<std::string, std::string> values);

// Returns false with *error set on unknown flags or bad values.
bool ParseCommandLine(int argc, const char *const *argv,
                      CommandLineOptions *options, std::string *error);
void ApplyCommandLine(const CommandLineOptions &options, GatewayConfig *config);

// Full precedence chain: defaults, YAML file, .env in the working
// directory, process environment, command line.
GatewayConfig ResolveConfig(const CommandLineOptions &options,
                            const EnvLookup &process_env,
                            const std::string &dotenv_path = ".env");

} // namespace promptgw
