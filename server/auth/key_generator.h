#pragma once

#include <cstddef>
#include <string>
#include <vector>

#include "server/auth/credential_store.h"

namespace promptgw {

// Characters used for generated keys: URL- and header-safe.
extern const char kApiKeyAlphabet[];

// Random key drawn from kApiKeyAlphabet using OpenSSL's CSPRNG. Throws
// std::runtime_error if the CSPRNG fails.
std::string GenerateApiKey(std::size_t length = 32);

// One fresh credential per identity.
std::vector<Credential> GenerateCredentials(const std::vector<std::string>& identities,
                                            std::size_t length = 32);

// The JSON array accepted by CredentialStore::Load.
std::string CredentialsToJson(const std::vector<Credential>& credentials);

}  // namespace promptgw
