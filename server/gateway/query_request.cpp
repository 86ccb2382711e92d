#include "server/gateway/query_request.h"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <cstdint>
#include <limits>
#include <regex>
#include <sstream>
#include <utility>

using json = nlohmann::json;

namespace promptgw {

namespace {

std::string Trim(const std::string &input) {
  auto start = input.find_first_not_of(" \t\r\n");
  auto end = input.find_last_not_of(" \t\r\n");
  if (start == std::string::npos) {
    return "";
  }
  return input.substr(start, end - start + 1);
}

// Reads an optional numeric field. Returns false when present with the wrong
// type.
bool ReadNumber(const json &j, const char *field, double *value,
                std::string *error) {
  auto it = j.find(field);
  if (it == j.end() || it->is_null()) {
    return true;
  }
  if (!it->is_number()) {
    *error = std::string(field) + " must be a number";
    return false;
  }
  *value = it->get<double>();
  return true;
}

// Integer fields reject fractions and anything outside the range of int.
bool ReadInt(const json &j, const char *field, int *value, std::string *error) {
  auto it = j.find(field);
  if (it == j.end() || it->is_null()) {
    return true;
  }
  if (!it->is_number_integer()) {
    *error = std::string(field) + " must be an integer";
    return false;
  }
  if (it->is_number_unsigned()) {
    if (it->get<std::uint64_t>() >
        static_cast<std::uint64_t>(std::numeric_limits<int>::max())) {
      *error = std::string(field) + " is out of range";
      return false;
    }
  } else {
    auto wide = it->get<std::int64_t>();
    if (wide < std::numeric_limits<int>::min() ||
        wide > std::numeric_limits<int>::max()) {
      *error = std::string(field) + " is out of range";
      return false;
    }
  }
  *value = it->get<int>();
  return true;
}

bool ReadString(const json &j, const char *field, std::string *value,
                std::string *error) {
  auto it = j.find(field);
  if (it == j.end() || it->is_null()) {
    return true;
  }
  if (!it->is_string()) {
    *error = std::string(field) + " must be a string";
    return false;
  }
  *value = it->get<std::string>();
  return true;
}

std::vector<std::string> SplitStops(const std::string &raw) {
  std::vector<std::string> stops;
  std::stringstream ss(raw);
  std::string item;
  while (std::getline(ss, item, ',')) {
    auto trimmed = Trim(item);
    if (!trimmed.empty()) {
      stops.push_back(trimmed);
    }
  }
  return stops;
}

std::string JoinModels(const std::vector<std::string> &models) {
  std::string out;
  for (const auto &m : models) {
    if (!out.empty()) {
      out += ", ";
    }
    out += m;
  }
  return out;
}

} // namespace

std::string CleanQueryText(const std::string &text) {
  static const std::regex kAnsiEscape(R"(\x1B[@-_][0-?]*[ -/]*[@-~])");
  std::string stripped = Trim(std::regex_replace(text, kAnsiEscape, ""));
  std::string cleaned;
  std::stringstream lines(stripped);
  std::string line;
  bool first = true;
  while (std::getline(lines, line)) {
    if (line.rfind("INFO", 0) == 0) {
      continue;
    }
    if (!first) {
      cleaned.push_back(' ');
    }
    cleaned += Trim(line);
    first = false;
  }
  return cleaned;
}

bool ParseQueryRequest(const std::string &body, const QueryPolicy &policy,
                       QueryRequest *out, std::string *error) {
  json j;
  try {
    j = json::parse(body);
  } catch (const json::parse_error &) {
    *error = "request body must be valid JSON";
    return false;
  }
  if (!j.is_object()) {
    *error = "request body must be a JSON object";
    return false;
  }

  QueryRequest req;
  req.model = policy.default_model;
  if (!ReadString(j, "query", &req.query, error) ||
      !ReadString(j, "model", &req.model, error) ||
      !ReadString(j, "context", &req.context, error) ||
      !ReadString(j, "format", &req.format, error) ||
      !ReadNumber(j, "temperature", &req.temperature, error) ||
      !ReadNumber(j, "top_p", &req.top_p, error) ||
      !ReadInt(j, "top_k", &req.top_k, error) ||
      !ReadInt(j, "num_predict", &req.num_predict, error) ||
      !ReadInt(j, "num_ctx", &req.num_ctx, error) ||
      !ReadInt(j, "num_gpu", &req.num_gpu, error) ||
      !ReadInt(j, "num_thread", &req.num_thread, error)) {
    return false;
  }
  if (j.contains("stop")) {
    const auto &stop = j["stop"];
    if (stop.is_string()) {
      req.stop = SplitStops(stop.get<std::string>());
    } else if (stop.is_array()) {
      for (const auto &s : stop) {
        if (!s.is_string()) {
          *error = "stop must be a string or an array of strings";
          return false;
        }
        auto trimmed = Trim(s.get<std::string>());
        if (!trimmed.empty()) {
          req.stop.push_back(trimmed);
        }
      }
    } else if (!stop.is_null()) {
      *error = "stop must be a string or an array of strings";
      return false;
    }
  }

  if (req.query.empty()) {
    *error = "query is required";
    return false;
  }
  if (Trim(req.model).empty()) {
    req.model = policy.default_model;
  }
  if (std::find(policy.allowed_models.begin(), policy.allowed_models.end(),
                req.model) == policy.allowed_models.end()) {
    *error = "Invalid model. Allowed models: " + JoinModels(policy.allowed_models);
    return false;
  }
  if (req.query.find("..") != std::string::npos || req.query.front() == '/') {
    *error = "Invalid query";
    return false;
  }
  if (req.query.find_first_of(";&|") != std::string::npos) {
    *error = "Invalid characters in query";
    return false;
  }
  if (req.temperature < 0.0 || req.temperature > 2.0) {
    *error = "temperature must be between 0.0 and 2.0";
    return false;
  }
  if (req.top_p < 0.0 || req.top_p > 1.0) {
    *error = "top_p must be between 0.0 and 1.0";
    return false;
  }
  if (req.top_k < 0) {
    *error = "top_k must be non-negative";
    return false;
  }
  if (req.num_predict < 0) {
    *error = "num_predict must be non-negative";
    return false;
  }

  req.query = CleanQueryText(req.query);
  if (req.query.empty()) {
    *error = "query is required";
    return false;
  }
  *out = std::move(req);
  return true;
}

std::string BuildChatPayload(const QueryRequest &request) {
  json options = {{"num_ctx", request.num_ctx},
                  {"num_gpu", request.num_gpu},
                  {"num_thread", request.num_thread},
                  {"temperature", request.temperature},
                  {"top_p", request.top_p},
                  {"top_k", request.top_k},
                  {"num_predict", request.num_predict}};
  if (!request.stop.empty()) {
    options["stop"] = request.stop;
  }
  json j;
  j["model"] = request.model;
  j["messages"] = json::array({{{"role", "system"}, {"content", request.context}},
                               {{"role", "user"}, {"content", request.query}}});
  j["options"] = options;
  j["stream"] = false;
  if (!request.format.empty()) {
    j["format"] = request.format;
  }
  return j.dump(-1, ' ', false, json::error_handler_t::replace);
}

} // namespace promptgw
