#pragma once

#include "net/http_client.h"

#include <chrono>
#include <string>
#include <vector>

namespace promptgw {

struct ProvisionReport {
  std::vector<std::string> present;
  std::vector<std::string> pulled;
  std::vector<std::string> failed;
};

// Makes sure the upstream has every model the gateway allows, pulling the
// missing ones. Best effort: failures are reported, never thrown.
class ModelProvisioner {
 public:
  ModelProvisioner(const HttpTransport* transport, std::string base_url,
                   std::chrono::milliseconds list_timeout,
                   std::chrono::milliseconds pull_timeout);

  ProvisionReport EnsureModels(const std::vector<std::string>& models) const;

  // Names reported by GET /api/tags. Returns false and fills *error when the
  // listing could not be obtained or parsed.
  bool ListModels(std::vector<std::string>* names, std::string* error) const;

  // "llama3" and "llama3:latest" name the same model.
  static bool SameModel(const std::string& a, const std::string& b);

 private:
  bool Pull(const std::string& model, std::string* error) const;

  const HttpTransport* transport_;
  std::string base_url_;
  std::chrono::milliseconds list_timeout_;
  std::chrono::milliseconds pull_timeout_;
};

}  // namespace promptgw
