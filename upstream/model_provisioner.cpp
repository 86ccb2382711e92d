#include "upstream/model_provisioner.h"

#include "server/logging/logger.h"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <utility>

using json = nlohmann::json;

namespace promptgw {

namespace {
std::string WithDefaultTag(const std::string& name) {
  return name.find(':') == std::string::npos ? name + ":latest" : name;
}
}  // namespace

ModelProvisioner::ModelProvisioner(const HttpTransport* transport, std::string base_url,
                                   std::chrono::milliseconds list_timeout,
                                   std::chrono::milliseconds pull_timeout)
    : transport_(transport),
      base_url_(std::move(base_url)),
      list_timeout_(list_timeout),
      pull_timeout_(pull_timeout) {}

bool ModelProvisioner::SameModel(const std::string& a, const std::string& b) {
  return WithDefaultTag(a) == WithDefaultTag(b);
}

bool ModelProvisioner::ListModels(std::vector<std::string>* names, std::string* error) const {
  names->clear();
  try {
    auto response = transport_->Get(JoinUrl(base_url_, "/api/tags"), list_timeout_);
    if (response.status != 200) {
      *error = "unexpected_status:" + std::to_string(response.status);
      return false;
    }
    auto j = json::parse(response.body);
    if (!j.contains("models") || !j["models"].is_array()) {
      *error = "model listing has no \"models\" array";
      return false;
    }
    for (const auto& model : j["models"]) {
      if (model.is_object() && model.contains("name") && model["name"].is_string()) {
        names->push_back(model["name"].get<std::string>());
      }
    }
    return true;
  } catch (const HttpClientError& e) {
    *error = HttpClientErrorKindName(e.kind());
  } catch (const json::exception& e) {
    *error = std::string("invalid model listing: ") + e.what();
  }
  return false;
}

bool ModelProvisioner::Pull(const std::string& model, std::string* error) const {
  json payload = {{"model", model}, {"stream", false}};
  try {
    auto response =
        transport_->Post(JoinUrl(base_url_, "/api/pull"), payload.dump(), pull_timeout_);
    if (response.status >= 200 && response.status < 300) {
      return true;
    }
    *error = "unexpected_status:" + std::to_string(response.status);
  } catch (const HttpClientError& e) {
    *error = HttpClientErrorKindName(e.kind());
  }
  return false;
}

ProvisionReport ModelProvisioner::EnsureModels(const std::vector<std::string>& models) const {
  ProvisionReport report;
  if (models.empty()) {
    return report;
  }
  std::vector<std::string> installed;
  std::string error;
  if (!ListModels(&installed, &error)) {
    log::Warn("upstream", "could not list installed models", "error=" + error);
    report.failed = models;
    return report;
  }
  for (const auto& model : models) {
    bool exists = std::any_of(installed.begin(), installed.end(),
                              [&](const std::string& name) { return SameModel(name, model); });
    if (exists) {
      log::Info("upstream", "model already present", "model=" + model);
      report.present.push_back(model);
      continue;
    }
    log::Info("upstream", "pulling model", "model=" + model);
    if (Pull(model, &error)) {
      log::Info("upstream", "model pulled", "model=" + model);
      report.pulled.push_back(model);
    } else {
      log::Warn("upstream", "could not pull model", "model=" + model + " error=" + error);
      report.failed.push_back(model);
    }
  }
  return report;
}

}  // namespace promptgw
