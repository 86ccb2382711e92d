#include <catch2/catch_test_macros.hpp>

#include "server/gateway/query_request.h"

#include <nlohmann/json.hpp>

#include <string>

using json = nlohmann::json;
using promptgw::ParseQueryRequest;
using promptgw::QueryPolicy;
using promptgw::QueryRequest;

namespace {

std::string ParseError(const std::string &body) {
  QueryRequest request;
  std::string error;
  REQUIRE_FALSE(ParseQueryRequest(body, QueryPolicy{}, &request, &error));
  return error;
}

} // namespace

TEST_CASE("QueryRequest applies defaults", "[query]") {
  QueryRequest request;
  std::string error;
  REQUIRE(ParseQueryRequest(R"({"query":"Hello, how are you?"})", QueryPolicy{},
                            &request, &error));
  REQUIRE(request.query == "Hello, how are you?");
  REQUIRE(request.model == "llama3:8b");
  REQUIRE(request.context.empty());
  REQUIRE(request.temperature == 0.7);
  REQUIRE(request.top_p == 0.9);
  REQUIRE(request.top_k == 40);
  REQUIRE(request.num_predict == 2048);
  REQUIRE(request.num_ctx == 4096);
  REQUIRE(request.stop.empty());
}

TEST_CASE("QueryRequest reads sampling options", "[query]") {
  QueryRequest request;
  std::string error;
  REQUIRE(ParseQueryRequest(
      R"({"query":"hi","context":"be brief","temperature":1.5,"top_p":0.5,)"
      R"("top_k":10,"num_predict":64,"stop":"END, STOP ,","format":"json"})",
      QueryPolicy{}, &request, &error));
  REQUIRE(request.context == "be brief");
  REQUIRE(request.temperature == 1.5);
  REQUIRE(request.top_p == 0.5);
  REQUIRE(request.top_k == 10);
  REQUIRE(request.num_predict == 64);
  REQUIRE(request.stop == std::vector<std::string>{"END", "STOP"});
  REQUIRE(request.format == "json");
}

TEST_CASE("QueryRequest accepts stop as an array", "[query]") {
  QueryRequest request;
  std::string error;
  REQUIRE(ParseQueryRequest(R"({"query":"hi","stop":["a"," b "]})", QueryPolicy{},
                            &request, &error));
  REQUIRE(request.stop == std::vector<std::string>{"a", "b"});
}

TEST_CASE("QueryRequest rejects malformed bodies", "[query]") {
  REQUIRE(ParseError("not json") == "request body must be valid JSON");
  REQUIRE(ParseError("[1,2]") == "request body must be a JSON object");
  REQUIRE(ParseError("{}") == "query is required");
  REQUIRE(ParseError(R"({"query":""})") == "query is required");
  REQUIRE(ParseError(R"({"query":42})") == "query must be a string");
  REQUIRE(ParseError(R"({"query":"hi","temperature":"hot"})") ==
          "temperature must be a number");
  REQUIRE(ParseError(R"({"query":"hi","stop":[1]})") ==
          "stop must be a string or an array of strings");
}

TEST_CASE("QueryRequest enforces the model allow-list", "[query]") {
  REQUIRE(ParseError(R"({"query":"hi","model":"gpt-4"})") ==
          "Invalid model. Allowed models: llama3:8b");

  QueryPolicy policy;
  policy.allowed_models = {"llama3:8b", "mistral:7b"};
  QueryRequest request;
  std::string error;
  REQUIRE(ParseQueryRequest(R"({"query":"hi","model":"mistral:7b"})", policy,
                            &request, &error));
  REQUIRE(request.model == "mistral:7b");
}

TEST_CASE("QueryRequest rejects path-like and shell-like queries", "[query]") {
  REQUIRE(ParseError(R"({"query":"../etc/passwd"})") == "Invalid query");
  REQUIRE(ParseError(R"({"query":"/etc/passwd"})") == "Invalid query");
  REQUIRE(ParseError(R"({"query":"hi; rm -rf"})") == "Invalid characters in query");
  REQUIRE(ParseError(R"({"query":"a && b"})") == "Invalid characters in query");
  REQUIRE(ParseError(R"({"query":"a | b"})") == "Invalid characters in query");
}

TEST_CASE("QueryRequest range-checks sampling options", "[query]") {
  REQUIRE(ParseError(R"({"query":"hi","temperature":2.5})") ==
          "temperature must be between 0.0 and 2.0");
  REQUIRE(ParseError(R"({"query":"hi","top_p":1.1})") ==
          "top_p must be between 0.0 and 1.0");
  REQUIRE(ParseError(R"({"query":"hi","top_k":-1})") == "top_k must be non-negative");
  REQUIRE(ParseError(R"({"query":"hi","num_predict":-5})") ==
          "num_predict must be non-negative");
}

TEST_CASE("CleanQueryText strips escapes and log lines", "[query]") {
  REQUIRE(promptgw::CleanQueryText("\x1b[31mred\x1b[0m text") == "red text");
  REQUIRE(promptgw::CleanQueryText("INFO starting\n  first\nsecond  \n") ==
          "first second");
  REQUIRE(promptgw::CleanQueryText("plain") == "plain");
}

TEST_CASE("BuildChatPayload produces a non-streaming chat request", "[query]") {
  QueryRequest request;
  request.query = "Hello";
  request.model = "llama3:8b";
  request.context = "You are terse.";
  request.stop = {"END"};

  auto payload = json::parse(promptgw::BuildChatPayload(request));
  REQUIRE(payload["model"] == "llama3:8b");
  REQUIRE(payload["stream"] == false);
  REQUIRE(payload["messages"].size() == 2);
  REQUIRE(payload["messages"][0]["role"] == "system");
  REQUIRE(payload["messages"][0]["content"] == "You are terse.");
  REQUIRE(payload["messages"][1]["role"] == "user");
  REQUIRE(payload["messages"][1]["content"] == "Hello");
  REQUIRE(payload["options"]["top_k"] == 40);
  REQUIRE(payload["options"]["stop"] == json::array({"END"}));
  REQUIRE_FALSE(payload.contains("format"));
}

TEST_CASE("QueryRequest requires integer options to fit an int", "[query]") {
  REQUIRE(ParseError(R"({"query":"hi","top_k":1e300})") == "top_k must be an integer");
  REQUIRE(ParseError(R"({"query":"hi","top_k":3.9})") == "top_k must be an integer");
  REQUIRE(ParseError(R"({"query":"hi","num_predict":4294967295})") ==
          "num_predict is out of range");
  REQUIRE(ParseError(R"({"query":"hi","num_ctx":-3000000000})") ==
          "num_ctx is out of range");
  REQUIRE(ParseError(R"({"query":"hi","num_gpu":"1"})") == "num_gpu must be an integer");

  QueryRequest request;
  std::string error;
  REQUIRE(ParseQueryRequest(R"({"query":"hi","num_thread":2147483647,"temperature":1})",
                            QueryPolicy{}, &request, &error));
  REQUIRE(request.num_thread == 2147483647);
  REQUIRE(request.temperature == 1.0);
}
