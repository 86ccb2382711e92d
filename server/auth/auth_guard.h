#pragma once

#include "server/auth/credential_store.h"
#include "server/http/http_message.h"

#include <memory>

namespace promptgw {

enum class AuthFailure {
  kNone,
  kMissingCredential,
  kMalformedHeader,
  kInvalidCredential,
};

// Internal label for logs. Never sent to clients.
const char* AuthFailureReason(AuthFailure failure);

struct AuthDecision {
  AuthVerdict verdict;
  AuthFailure failure{AuthFailure::kNone};
};

// Validates "Authorization: Bearer <token>" against a CredentialStore and
// logs the outcome (identity or denial reason, never the token).
class AuthGuard {
 public:
  explicit AuthGuard(std::shared_ptr<const CredentialStore> store);

  AuthDecision Authorize(const HttpRequest& request) const;

  // Extracts the token from an Authorization header value. Requires the exact
  // scheme "Bearer", one space, and a non-empty token.
  static bool ParseBearer(const std::string& header_value, std::string* token);

 private:
  std::shared_ptr<const CredentialStore> store_;
};

}  // namespace promptgw
