#include "server/auth/auth_guard.h"

#include "server/logging/logger.h"

#include <utility>

namespace promptgw {

namespace {
constexpr char kBearerPrefix[] = "Bearer ";
constexpr std::size_t kBearerPrefixLen = sizeof(kBearerPrefix) - 1;
}  // namespace

const char* AuthFailureReason(AuthFailure failure) {
  switch (failure) {
    case AuthFailure::kNone:
      return "none";
    case AuthFailure::kMissingCredential:
      return "missing credential";
    case AuthFailure::kMalformedHeader:
      return "malformed header";
    case AuthFailure::kInvalidCredential:
      return "invalid credential";
  }
  return "unknown";
}

AuthGuard::AuthGuard(std::shared_ptr<const CredentialStore> store)
    : store_(std::move(store)) {}

bool AuthGuard::ParseBearer(const std::string& header_value, std::string* token) {
  if (header_value.compare(0, kBearerPrefixLen, kBearerPrefix) != 0) {
    return false;
  }
  std::string candidate = header_value.substr(kBearerPrefixLen);
  // "Bearer  abc" has two separators; "Bearer " has no token.
  if (candidate.empty() || candidate.front() == ' ' || candidate.front() == '\t') {
    return false;
  }
  if (token) {
    *token = std::move(candidate);
  }
  return true;
}

AuthDecision AuthGuard::Authorize(const HttpRequest& request) const {
  AuthDecision decision;
  const std::string* header = request.Header("Authorization");
  std::string token;
  if (!header) {
    decision.failure = AuthFailure::kMissingCredential;
  } else if (!ParseBearer(*header, &token)) {
    decision.failure = AuthFailure::kMalformedHeader;
  } else {
    decision.verdict = store_ ? store_->Lookup(token) : AuthVerdict{};
    if (!decision.verdict.authorized) {
      decision.failure = AuthFailure::kInvalidCredential;
    }
  }

  if (decision.verdict.authorized) {
    log::Info("auth", "request authorized",
              "identity=" + decision.verdict.identity.value_or(""));
  } else {
    log::Warn("auth", "request denied",
              std::string("reason=") + AuthFailureReason(decision.failure));
  }
  return decision;
}

}  // namespace promptgw
