#include "server/http/http_message.h"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <cctype>

using json = nlohmann::json;

namespace promptgw {

namespace {

std::string ToLower(std::string value) {
  std::transform(value.begin(), value.end(), value.begin(), [](unsigned char c) {
    return static_cast<char>(std::tolower(c));
  });
  return value;
}

// Strips optional whitespace around a header value.
std::string TrimOws(const std::string &val) {
  auto s = val.find_first_not_of(" \t");
  auto e = val.find_last_not_of(" \t\r\n");
  return (s == std::string::npos) ? "" : val.substr(s, e - s + 1);
}

} // namespace

const std::string *HttpRequest::Header(const std::string &name) const {
  auto it = headers.find(ToLower(name));
  return it == headers.end() ? nullptr : &it->second;
}

bool ParseRequestHead(const std::string &head, HttpRequest *request) {
  auto first_line_end = head.find("\r\n");
  std::string first_line = head.substr(0, first_line_end);
  auto method_end = first_line.find(' ');
  if (method_end == std::string::npos || method_end == 0) {
    return false;
  }
  auto path_end = first_line.find(' ', method_end + 1);
  if (path_end == std::string::npos || path_end == method_end + 1) {
    return false;
  }
  request->method = first_line.substr(0, method_end);
  std::string target =
      first_line.substr(method_end + 1, path_end - method_end - 1);
  auto qmark = target.find('?');
  request->path = target.substr(0, qmark);
  request->query =
      qmark == std::string::npos ? std::string() : target.substr(qmark + 1);

  request->headers.clear();
  std::size_t pos = first_line_end;
  while (pos != std::string::npos && pos + 2 < head.size()) {
    auto next = head.find("\r\n", pos + 2);
    std::string line = head.substr(
        pos + 2, next == std::string::npos ? std::string::npos : next - pos - 2);
    auto colon = line.find(':');
    if (colon != std::string::npos && colon > 0) {
      std::string name = ToLower(line.substr(0, colon));
      // First occurrence wins for repeated headers.
      request->headers.emplace(name, TrimOws(line.substr(colon + 1)));
    }
    pos = next;
  }
  return true;
}

std::string StatusText(int status) {
  switch (status) {
  case 200:
    return "OK";
  case 204:
    return "No Content";
  case 400:
    return "Bad Request";
  case 401:
    return "Unauthorized";
  case 403:
    return "Forbidden";
  case 404:
    return "Not Found";
  case 405:
    return "Method Not Allowed";
  case 413:
    return "Payload Too Large";
  case 500:
    return "Internal Server Error";
  case 502:
    return "Bad Gateway";
  case 503:
    return "Service Unavailable";
  case 504:
    return "Gateway Timeout";
  default:
    return "Status";
  }
}

std::string SerializeReply(const HttpReply &reply) {
  std::string headers = "HTTP/1.1 " + std::to_string(reply.status) + " " +
                        StatusText(reply.status) + "\r\n";
  if (!reply.content_type.empty()) {
    headers += "Content-Type: " + reply.content_type + "\r\n";
  }
  headers += "Access-Control-Allow-Origin: *\r\n";
  for (const auto &[name, value] : reply.extra_headers) {
    headers += name + ": " + value + "\r\n";
  }
  headers += "Connection: close\r\n";
  headers += "Content-Length: " + std::to_string(reply.body.size()) + "\r\n\r\n";
  return headers + reply.body;
}

HttpReply JsonError(int status, const std::string &message,
                    const std::string &error) {
  HttpReply reply;
  reply.status = status;
  reply.body = json({{"message", message}, {"error", error}})
                   .dump(-1, ' ', false, json::error_handler_t::replace);
  return reply;
}

} // namespace promptgw
