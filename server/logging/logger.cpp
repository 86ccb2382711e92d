#include "server/logging/logger.h"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <atomic>
#include <cctype>
#include <chrono>
#include <iostream>
#include <mutex>

using json = nlohmann::json;

namespace promptgw {
namespace log {

namespace {

std::atomic<bool> g_json_mode{false};
std::atomic<Level> g_min_level{Level::INFO};
std::mutex g_mutex;

int Rank(Level level) { return static_cast<int>(level); }

} // namespace

const char *LevelName(Level level) {
  switch (level) {
  case Level::DEBUG:
    return "DEBUG";
  case Level::INFO:
    return "INFO";
  case Level::WARN:
    return "WARN";
  case Level::ERROR:
    return "ERROR";
  }
  return "UNKNOWN";
}

void SetJsonMode(bool enabled) { g_json_mode.store(enabled); }
bool IsJsonMode() { return g_json_mode.load(); }

void SetMinLevel(Level level) { g_min_level.store(level); }
Level MinLevel() { return g_min_level.load(); }

bool ParseLevel(const std::string &text, Level *level) {
  std::string upper = text;
  std::transform(upper.begin(), upper.end(), upper.begin(),
                 [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
  Level parsed;
  if (upper == "DEBUG") {
    parsed = Level::DEBUG;
  } else if (upper == "INFO") {
    parsed = Level::INFO;
  } else if (upper == "WARN" || upper == "WARNING") {
    parsed = Level::WARN;
  } else if (upper == "ERROR" || upper == "CRITICAL") {
    parsed = Level::ERROR;
  } else {
    return false;
  }
  if (level) {
    *level = parsed;
  }
  return true;
}

void Log(Level level, const std::string &component, const std::string &message,
         const std::string &extra) {
  if (Rank(level) < Rank(g_min_level.load())) {
    return;
  }
  auto now = std::chrono::system_clock::now();
  auto ts = std::chrono::duration_cast<std::chrono::milliseconds>(
                now.time_since_epoch())
                .count();

  std::string line;
  if (g_json_mode.load()) {
    json j;
    j["ts"] = ts;
    j["level"] = LevelName(level);
    j["component"] = component;
    j["message"] = message;
    if (!extra.empty()) {
      j["extra"] = extra;
    }
    // Replace invalid UTF-8 rather than throwing from a log call.
    line = j.dump(-1, ' ', false, json::error_handler_t::replace);
  } else {
    line = std::string("[") + LevelName(level) + "] " + component + ": " +
           message;
    if (!extra.empty()) {
      line += " | " + extra;
    }
  }

  std::lock_guard<std::mutex> lock(g_mutex);
  std::cerr << line << "\n";
}

} // namespace log
} // namespace promptgw
