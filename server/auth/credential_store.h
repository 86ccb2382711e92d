#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace promptgw {

struct Credential {
  std::string identity;
  std::string token;
};

struct AuthVerdict {
  bool authorized{false};
  std::optional<std::string> identity;
};

// Immutable set of caller credentials, in configuration order. Tokens are kept
// only as SHA-256 digests. Safe for concurrent reads.
class CredentialStore {
 public:
  CredentialStore() = default;
  explicit CredentialStore(const std::vector<Credential>& credentials);

  // Parses a JSON array of {"appname": <identity>, "key": <token>} objects.
  // Blank input yields an empty store and no error. Any malformed input yields
  // an empty store and a description in *error.
  static CredentialStore Load(const std::string& raw, std::string* error = nullptr);

  // First credential in configuration order whose token equals `token`.
  AuthVerdict Lookup(const std::string& token) const;

  bool Empty() const { return entries_.empty(); }
  std::size_t Size() const { return entries_.size(); }
  std::vector<std::string> Identities() const;

  // Identities that can never match because an earlier credential carries the
  // same token.
  std::vector<std::string> ShadowedIdentities() const;

 private:
  struct Entry {
    std::string identity;
    std::string digest;  // 32 raw bytes.
  };

  static std::string Digest(const std::string& token);

  std::vector<Entry> entries_;
};

}  // namespace promptgw
