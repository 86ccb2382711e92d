#include "server/auth/credential_store.h"

#include <nlohmann/json.hpp>

#include <openssl/crypto.h>
#include <openssl/sha.h>

using json = nlohmann::json;

namespace promptgw {

namespace {
constexpr const char* kIdentityField = "appname";
constexpr const char* kTokenField = "key";

bool IsBlank(const std::string& raw) {
  return raw.find_first_not_of(" \t\r\n") == std::string::npos;
}

bool NonEmptyString(const json& obj, const char* field) {
  auto it = obj.find(field);
  return it != obj.end() && it->is_string() && !it->get<std::string>().empty();
}
}  // namespace

CredentialStore::CredentialStore(const std::vector<Credential>& credentials) {
  entries_.reserve(credentials.size());
  for (const auto& credential : credentials) {
    entries_.push_back({credential.identity, Digest(credential.token)});
  }
}

std::string CredentialStore::Digest(const std::string& token) {
  unsigned char hash[SHA256_DIGEST_LENGTH];
  SHA256(reinterpret_cast<const unsigned char*>(token.data()), token.size(), hash);
  return std::string(reinterpret_cast<const char*>(hash), SHA256_DIGEST_LENGTH);
}

CredentialStore CredentialStore::Load(const std::string& raw, std::string* error) {
  if (IsBlank(raw)) {
    return CredentialStore();
  }
  auto fail = [error](const std::string& message) {
    if (error) {
      *error = message;
    }
    return CredentialStore();
  };

  json doc;
  try {
    doc = json::parse(raw);
  } catch (const json::parse_error& e) {
    return fail(std::string("credentials are not valid JSON: ") + e.what());
  }
  if (!doc.is_array()) {
    return fail("credentials must be a JSON array");
  }

  std::vector<Credential> credentials;
  credentials.reserve(doc.size());
  for (std::size_t i = 0; i < doc.size(); ++i) {
    const auto& item = doc[i];
    if (!item.is_object()) {
      return fail("credential #" + std::to_string(i) + " is not an object");
    }
    if (!NonEmptyString(item, kIdentityField)) {
      return fail("credential #" + std::to_string(i) +
                  " needs a non-empty string \"appname\"");
    }
    if (!NonEmptyString(item, kTokenField)) {
      return fail("credential #" + std::to_string(i) +
                  " needs a non-empty string \"key\"");
    }
    credentials.push_back({item[kIdentityField].get<std::string>(),
                           item[kTokenField].get<std::string>()});
  }
  return CredentialStore(credentials);
}

AuthVerdict CredentialStore::Lookup(const std::string& token) const {
  AuthVerdict verdict;
  if (token.empty() || entries_.empty()) {
    return verdict;
  }
  const std::string presented = Digest(token);
  for (const auto& entry : entries_) {
    if (CRYPTO_memcmp(entry.digest.data(), presented.data(), SHA256_DIGEST_LENGTH) == 0) {
      verdict.authorized = true;
      verdict.identity = entry.identity;
      return verdict;
    }
  }
  return verdict;
}

std::vector<std::string> CredentialStore::Identities() const {
  std::vector<std::string> identities;
  identities.reserve(entries_.size());
  for (const auto& entry : entries_) {
    identities.push_back(entry.identity);
  }
  return identities;
}

std::vector<std::string> CredentialStore::ShadowedIdentities() const {
  std::vector<std::string> shadowed;
  for (std::size_t i = 1; i < entries_.size(); ++i) {
    for (std::size_t j = 0; j < i; ++j) {
      if (entries_[j].digest == entries_[i].digest) {
        shadowed.push_back(entries_[i].identity);
        break;
      }
    }
  }
  return shadowed;
}

}  // namespace promptgw
