#include "server/auth/key_generator.h"

#include <cstddef>
#include <exception>
#include <iostream>
#include <string>
#include <vector>

namespace {

constexpr std::size_t kMinKeyLength = 16;
constexpr std::size_t kMaxKeyLength = 256;

void PrintUsage() {
  std::cout
      << "Usage:\n"
      << "  promptgw-keygen [--length N] [APPNAME...]\n"
      << "      Generates one API key per application name (default: APP1 "
         "WEBAPP MOBILE)\n"
      << "      and prints an API_KEYS line for .env or the environment.\n"
      << "  --length N   key length in characters (" << kMinKeyLength << "-"
      << kMaxKeyLength << ", default 32)\n";
}

bool ParseLength(const std::string &text, std::size_t *length) {
  try {
    std::size_t consumed = 0;
    unsigned long value = std::stoul(text, &consumed);
    if (consumed != text.size() || value < kMinKeyLength ||
        value > kMaxKeyLength) {
      return false;
    }
    *length = static_cast<std::size_t>(value);
    return true;
  } catch (const std::exception &) {
    return false;
  }
}

} // namespace

int main(int argc, char **argv) {
  std::size_t length = 32;
  std::vector<std::string> identities;
  for (int i = 1; i < argc; ++i) {
    std::string arg = argv[i];
    if (arg == "-h" || arg == "--help") {
      PrintUsage();
      return 0;
    }
    if (arg == "--length") {
      if (i + 1 >= argc || !ParseLength(argv[i + 1], &length)) {
        std::cerr << "--length expects a number between " << kMinKeyLength
                  << " and " << kMaxKeyLength << "\n";
        return 1;
      }
      ++i;
      continue;
    }
    if (!arg.empty() && arg[0] == '-') {
      std::cerr << "Unknown option: " << arg << "\n";
      PrintUsage();
      return 1;
    }
    identities.push_back(arg);
  }
  if (identities.empty()) {
    identities = {"APP1", "WEBAPP", "MOBILE"};
  }

  std::vector<promptgw::Credential> credentials;
  try {
    credentials = promptgw::GenerateCredentials(identities, length);
  } catch (const std::exception &e) {
    std::cerr << "Key generation failed: " << e.what() << "\n";
    return 1;
  }
  const std::string json = promptgw::CredentialsToJson(credentials);

  std::cout << "Generated API keys:\n";
  for (const auto &credential : credentials) {
    std::cout << "  " << credential.identity << ": " << credential.token << "\n";
  }
  std::cout << "\nAdd to .env:\n"
            << "API_KEYS=" << json << "\n"
            << "\nOr export in the shell:\n"
            << "export PROMPTGW_API_KEYS='" << json << "'\n"
            << "\nExample request:\n"
            << "curl -X POST \"http://localhost:5000/query\" \\\n"
            << "  -H \"Content-Type: application/json\" \\\n"
            << "  -H \"Authorization: Bearer " << credentials.front().token
            << "\" \\\n"
            << "  -d '{\"query\": \"Hello, how are you?\"}'\n";
  return 0;
}
