#include "server/auth/key_generator.h"

#include <nlohmann/json.hpp>

#include <openssl/rand.h>

#include <cstring>
#include <stdexcept>

using json = nlohmann::json;

namespace promptgw {

const char kApiKeyAlphabet[] =
    "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789-_";

std::string GenerateApiKey(std::size_t length) {
  const std::size_t alphabet_size = std::strlen(kApiKeyAlphabet);
  // Rejection sampling keeps the distribution uniform for any alphabet size.
  const unsigned limit = 256 - (256 % alphabet_size);
  std::string key;
  key.reserve(length);
  unsigned char buffer[64];
  while (key.size() < length) {
    if (RAND_bytes(buffer, sizeof(buffer)) != 1) {
      throw std::runtime_error("RAND_bytes failed");
    }
    for (unsigned char byte : buffer) {
      if (key.size() == length) {
        break;
      }
      if (byte < limit) {
        key.push_back(kApiKeyAlphabet[byte % alphabet_size]);
      }
    }
  }
  return key;
}

std::vector<Credential> GenerateCredentials(const std::vector<std::string>& identities,
                                            std::size_t length) {
  std::vector<Credential> credentials;
  credentials.reserve(identities.size());
  for (const auto& identity : identities) {
    credentials.push_back({identity, GenerateApiKey(length)});
  }
  return credentials;
}

std::string CredentialsToJson(const std::vector<Credential>& credentials) {
  json arr = json::array();
  for (const auto& c : credentials) {
    arr.push_back({{"appname", c.identity}, {"key", c.token}});
  }
  return arr.dump();
}

}  // namespace promptgw
