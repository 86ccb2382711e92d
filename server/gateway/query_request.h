#pragma once

#include <string>
#include <vector>

namespace promptgw {

struct QueryRequest {
  std::string query;
  std::string model;
  std::string context;
  double temperature{0.7};
  double top_p{0.9};
  int top_k{40};
  int num_predict{2048};
  std::vector<std::string> stop;
  std::string format;
  int num_ctx{4096};
  int num_gpu{1};
  int num_thread{4};
};

struct QueryPolicy {
  std::vector<std::string> allowed_models{"llama3:8b"};
  std::string default_model{"llama3:8b"};
};

// Parses and validates a /query body. On failure returns false with a
// client-facing message in *error; *out is then unspecified.
bool ParseQueryRequest(const std::string &body, const QueryPolicy &policy,
                       QueryRequest *out, std::string *error);

// Strips ANSI escape sequences, drops lines starting with "INFO" and joins the
// remaining trimmed lines with single spaces.
std::string CleanQueryText(const std::string &text);

// Body for the upstream POST /api/chat. Streaming is always off: the gateway
// relays a single response.
std::string BuildChatPayload(const QueryRequest &request);

} // namespace promptgw
