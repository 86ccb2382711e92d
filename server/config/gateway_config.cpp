#include "server/config/gateway_config.h"

#include <yaml-cpp/yaml.h>

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <limits>
#include <sstream>
#include <utility>

namespace promptgw {

namespace {

std::string Trim(const std::string &input) {
  auto start = input.find_first_not_of(" \t");
  auto end = input.find_last_not_of(" \t\r\n");
  if (start == std::string::npos) {
    return "";
  }
  return input.substr(start, end - start + 1);
}

std::string ToLower(std::string value) {
  std::transform(value.begin(), value.end(), value.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return value;
}

bool ParseInt(const std::string &text, int *value) {
  try {
    std::size_t consumed = 0;
    int parsed = std::stoi(text, &consumed);
    if (consumed != text.size()) {
      return false;
    }
    *value = parsed;
    return true;
  } catch (const std::exception &) {
    return false;
  }
}

bool ParseBool(const std::string &text, bool *value) {
  auto lowered = ToLower(Trim(text));
  if (lowered == "true" || lowered == "1" || lowered == "yes" || lowered == "on") {
    *value = true;
    return true;
  }
  if (lowered == "false" || lowered == "0" || lowered == "no" || lowered == "off") {
    *value = false;
    return true;
  }
  return false;
}

std::vector<std::string> SplitList(const std::string &raw) {
  std::vector<std::string> items;
  std::stringstream ss(raw);
  std::string item;
  while (std::getline(ss, item, ',')) {
    auto trimmed = Trim(item);
    if (!trimmed.empty()) {
      items.push_back(trimmed);
    }
  }
  return items;
}

void IgnoredValue(const std::string &name, const std::string &value) {
  log::Warn("config", "ignoring invalid value", name + "=" + value);
}

void SetAllowedModels(std::vector<std::string> models, GatewayConfig *config) {
  if (models.empty()) {
    return;
  }
  config->allowed_models = std::move(models);
  if (std::find(config->allowed_models.begin(), config->allowed_models.end(),
                config->default_model) == config->allowed_models.end()) {
    config->default_model = config->allowed_models.front();
  }
}

constexpr int kMaxPort = 65535;
constexpr int kUnbounded = std::numeric_limits<int>::max();

// Applies an integer override when it parses and lies in [min_value, max_value].
void ApplyInt(const std::string &name, const std::string &raw, int min_value,
              int max_value, int *target) {
  int parsed = 0;
  if (ParseInt(Trim(raw), &parsed) && parsed >= min_value && parsed <= max_value) {
    *target = parsed;
  } else {
    IgnoredValue(name, raw);
  }
}

void ApplyMillis(const std::string &name, const std::string &raw, int min_value,
                 std::chrono::milliseconds *target) {
  int parsed = 0;
  if (ParseInt(Trim(raw), &parsed) && parsed >= min_value) {
    *target = std::chrono::milliseconds(parsed);
  } else {
    IgnoredValue(name, raw);
  }
}

void ApplyLogLevel(const std::string &name, const std::string &raw,
                   GatewayConfig *config) {
  log::Level level;
  if (log::ParseLevel(Trim(raw), &level)) {
    config->log_level = level;
  } else {
    IgnoredValue(name, raw);
  }
}

void ApplyLogFormat(const std::string &name, const std::string &raw,
                    GatewayConfig *config) {
  auto lowered = ToLower(Trim(raw));
  if (lowered == "json") {
    config->json_logs = true;
  } else if (lowered == "text" || lowered == "plain") {
    config->json_logs = false;
  } else {
    IgnoredValue(name, raw);
  }
}

void ApplyFlag(const std::string &name, const std::string &raw, bool *target) {
  if (!ParseBool(raw, target)) {
    IgnoredValue(name, raw);
  }
}

} // namespace

bool LoadConfigFile(const std::string &path, GatewayConfig *config) {
  if (path.empty() || !std::filesystem::exists(path)) {
    return false;
  }
  GatewayConfig staged = *config;
  try {
    YAML::Node root = YAML::LoadFile(path);

    if (auto server = root["server"]) {
      if (server["host"]) staged.host = server["host"].as<std::string>();
      if (server["port"]) {
        ApplyInt("server.port", server["port"].Scalar(), 0, kMaxPort, &staged.port);
      }
      if (server["http_workers"]) {
        ApplyInt("server.http_workers", server["http_workers"].Scalar(), 1,
                 kUnbounded, &staged.http_workers);
      }
    }

    if (auto upstream = root["upstream"]) {
      if (upstream["url"]) staged.upstream_url = upstream["url"].as<std::string>();
      if (upstream["probe_timeout_ms"]) {
        ApplyMillis("upstream.probe_timeout_ms", upstream["probe_timeout_ms"].Scalar(),
                    1, &staged.probe_timeout);
      }
      if (upstream["query_timeout_ms"]) {
        ApplyMillis("upstream.query_timeout_ms", upstream["query_timeout_ms"].Scalar(),
                    1, &staged.query_timeout);
      }
      if (upstream["pull_models"]) {
        ApplyFlag("upstream.pull_models", upstream["pull_models"].Scalar(),
                  &staged.pull_models);
      }
      if (auto startup = upstream["startup"]) {
        if (startup["max_attempts"]) {
          ApplyInt("upstream.startup.max_attempts", startup["max_attempts"].Scalar(), 0,
                   kUnbounded, &staged.startup_max_attempts);
        }
        if (startup["delay_ms"]) {
          ApplyMillis("upstream.startup.delay_ms", startup["delay_ms"].Scalar(), 0,
                      &staged.startup_delay);
        }
      }
    }

    if (auto models = root["models"]) {
      if (models["default"]) staged.default_model = models["default"].as<std::string>();
      if (models["allowed"] && models["allowed"].IsSequence()) {
        std::vector<std::string> allowed;
        for (const auto &node : models["allowed"]) {
          auto name = Trim(node.as<std::string>());
          if (!name.empty()) {
            allowed.push_back(name);
          }
        }
        SetAllowedModels(std::move(allowed), &staged);
      }
    }

    if (auto logging = root["logging"]) {
      if (logging["level"]) {
        ApplyLogLevel("logging.level", logging["level"].as<std::string>(), &staged);
      }
      if (logging["format"]) {
        ApplyLogFormat("logging.format", logging["format"].as<std::string>(), &staged);
      }
    }

    if (auto tls = root["tls"]) {
      if (tls["enabled"]) {
        ApplyFlag("tls.enabled", tls["enabled"].Scalar(), &staged.tls_enabled);
      }
      if (tls["cert_path"]) staged.tls_cert_path = tls["cert_path"].as<std::string>();
      if (tls["key_path"]) staged.tls_key_path = tls["key_path"].as<std::string>();
    }
  } catch (const YAML::Exception &e) {
    log::Error("config", "failed to parse config file",
               "path=" + path + " error=" + e.what());
    return false;
  }
  *config = std::move(staged);
  return true;
}

std::map<std::string, std::string> ParseDotEnv(const std::string &content) {
  std::map<std::string, std::string> values;
  std::stringstream ss(content);
  std::string line;
  while (std::getline(ss, line)) {
    auto trimmed = Trim(line);
    if (trimmed.empty() || trimmed[0] == '#') {
      continue;
    }
    if (trimmed.rfind("export ", 0) == 0) {
      trimmed = Trim(trimmed.substr(7));
    }
    auto eq = trimmed.find('=');
    if (eq == std::string::npos) {
      continue;
    }
    auto key = Trim(trimmed.substr(0, eq));
    auto value = Trim(trimmed.substr(eq + 1));
    if (key.empty()) {
      continue;
    }
    if (value.size() >= 2 && (value.front() == '"' || value.front() == '\'') &&
        value.back() == value.front()) {
      value = value.substr(1, value.size() - 2);
    }
    values[key] = value;
  }
  return values;
}

std::map<std::string, std::string> ReadDotEnvFile(const std::string &path) {
  std::ifstream in(path);
  if (!in) {
    return {};
  }
  std::stringstream buffer;
  buffer << in.rdbuf();
  return ParseDotEnv(buffer.str());
}

void ApplyEnvironment(const EnvLookup &lookup, GatewayConfig *config) {
  if (auto keys = lookup("PROMPTGW_API_KEYS")) {
    config->api_keys = *keys;
  } else if (auto legacy = lookup("API_KEYS")) {
    config->api_keys = *legacy;
  }
  if (auto v = lookup("PROMPTGW_HOST")) {
    config->host = Trim(*v);
  }
  if (auto v = lookup("PROMPTGW_PORT")) {
    ApplyInt("PROMPTGW_PORT", *v, 0, kMaxPort, &config->port);
  }
  if (auto v = lookup("PROMPTGW_HTTP_WORKERS")) {
    ApplyInt("PROMPTGW_HTTP_WORKERS", *v, 1, kUnbounded, &config->http_workers);
  }
  if (auto v = lookup("PROMPTGW_UPSTREAM_URL")) {
    config->upstream_url = Trim(*v);
  }
  if (auto v = lookup("PROMPTGW_PROBE_TIMEOUT_MS")) {
    ApplyMillis("PROMPTGW_PROBE_TIMEOUT_MS", *v, 1, &config->probe_timeout);
  }
  if (auto v = lookup("PROMPTGW_QUERY_TIMEOUT_MS")) {
    ApplyMillis("PROMPTGW_QUERY_TIMEOUT_MS", *v, 1, &config->query_timeout);
  }
  if (auto v = lookup("PROMPTGW_STARTUP_MAX_ATTEMPTS")) {
    ApplyInt("PROMPTGW_STARTUP_MAX_ATTEMPTS", *v, 0, kUnbounded,
             &config->startup_max_attempts);
  }
  if (auto v = lookup("PROMPTGW_STARTUP_DELAY_MS")) {
    ApplyMillis("PROMPTGW_STARTUP_DELAY_MS", *v, 0, &config->startup_delay);
  }
  if (auto v = lookup("PROMPTGW_PULL_MODELS")) {
    ApplyFlag("PROMPTGW_PULL_MODELS", *v, &config->pull_models);
  }
  if (auto v = lookup("PROMPTGW_ALLOWED_MODELS")) {
    auto models = SplitList(*v);
    if (models.empty()) {
      IgnoredValue("PROMPTGW_ALLOWED_MODELS", *v);
    } else {
      SetAllowedModels(std::move(models), config);
    }
  }
  if (auto v = lookup("PROMPTGW_LOG_LEVEL")) {
    ApplyLogLevel("PROMPTGW_LOG_LEVEL", *v, config);
  }
  if (auto v = lookup("PROMPTGW_LOG_FORMAT")) {
    ApplyLogFormat("PROMPTGW_LOG_FORMAT", *v, config);
  }
  if (auto v = lookup("PROMPTGW_TLS_ENABLED")) {
    ApplyFlag("PROMPTGW_TLS_ENABLED", *v, &config->tls_enabled);
  }
  if (auto v = lookup("PROMPTGW_TLS_CERT_PATH")) {
    config->tls_cert_path = *v;
  }
  if (auto v = lookup("PROMPTGW_TLS_KEY_PATH")) {
    config->tls_key_path = *v;
  }
}

EnvLookup ProcessEnvironment() {
  return [](const std::string &name) -> std::optional<std::string> {
    if (const char *value = std::getenv(name.c_str())) {
      return std::string(value);
    }
    return std::nullopt;
  };
}

EnvLookup MapEnvironment(std::map<std::string, std::string> values) {
  return [values = std::move(values)](
             const std::string &name) -> std::optional<std::string> {
    auto it = values.find(name);
    if (it == values.end()) {
      return std::nullopt;
    }
    return it->second;
  };
}

bool ParseCommandLine(int argc, const char *const *argv,
                      CommandLineOptions *options, std::string *error) {
  for (int i = 1; i < argc; ++i) {
    std::string arg = argv[i];
    auto next_value = [&](std::string *value) {
      if (i + 1 >= argc) {
        *error = arg + " requires a value";
        return false;
      }
      *value = argv[++i];
      return true;
    };
    std::string value;
    if (arg == "-h" || arg == "--help") {
      options->show_help = true;
    } else if (arg == "--config") {
      if (!next_value(&value)) {
        return false;
      }
      options->config_path = value;
    } else if (arg == "-H" || arg == "--host") {
      if (!next_value(&value)) {
        return false;
      }
      options->host = value;
    } else if (arg == "-P" || arg == "--port") {
      if (!next_value(&value)) {
        return false;
      }
      int port = 0;
      if (!ParseInt(value, &port) || port < 0 || port > kMaxPort) {
        *error = "invalid port: " + value;
        return false;
      }
      options->port = port;
    } else if (arg == "-L" || arg == "--loglevel") {
      if (!next_value(&value)) {
        return false;
      }
      log::Level level;
      if (!log::ParseLevel(value, &level)) {
        *error = "invalid log level: " + value;
        return false;
      }
      options->log_level = level;
    } else {
      *error = "unknown argument: " + arg;
      return false;
    }
  }
  return true;
}

void ApplyCommandLine(const CommandLineOptions &options, GatewayConfig *config) {
  if (options.host) {
    config->host = *options.host;
  }
  if (options.port) {
    config->port = *options.port;
  }
  if (options.log_level) {
    config->log_level = *options.log_level;
  }
}

GatewayConfig ResolveConfig(const CommandLineOptions &options,
                            const EnvLookup &process_env,
                            const std::string &dotenv_path) {
  GatewayConfig config;
  LoadConfigFile(options.config_path, &config);
  auto dotenv = ReadDotEnvFile(dotenv_path);
  if (!dotenv.empty()) {
    ApplyEnvironment(MapEnvironment(std::move(dotenv)), &config);
  }
  ApplyEnvironment(process_env, &config);
  ApplyCommandLine(options, &config);
  return config;
}

} // namespace promptgw
