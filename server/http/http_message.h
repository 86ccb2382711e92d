#pragma once

#include <map>
#include <string>
#include <utility>
#include <vector>

namespace promptgw {

// Header names are lower-cased at parse time; use Header() for lookups.
using HeaderMap = std::map<std::string, std::string>;

struct HttpRequest {
  std::string method;
  std::string path;   // Without the query string.
  std::string query;  // Raw text after '?', if any.
  HeaderMap headers;
  std::string body;

  // Returns nullptr when the header is absent. `name` is matched
  // case-insensitively.
  const std::string *Header(const std::string &name) const;
};

struct HttpReply {
  int status{200};
  std::string body;
  std::string content_type{"application/json"};
  std::vector<std::pair<std::string, std::string>> extra_headers;
};

// Parses the request line and header block (everything before the blank
// line). Returns false if the request line is malformed.
bool ParseRequestHead(const std::string &head, HttpRequest *request);

std::string StatusText(int status);

// Serializes a reply into an HTTP/1.1 response with Content-Length,
// Connection: close and the CORS allow-origin header.
std::string SerializeReply(const HttpReply &reply);

// {"message": message, "error": error} with the given status.
HttpReply JsonError(int status, const std::string &message,
                    const std::string &error);

} // namespace promptgw
