#include "quotaswap/security/fingerprint.hpp"

#include <openssl/sha.h>

#include <iomanip>
#include <sstream>

namespace quotaswap::security {

std::string sha256_hex(const std::string &text) {
  unsigned char digest[SHA256_DIGEST_LENGTH];
  SHA256(reinterpret_cast<const unsigned char *>(text.data()), text.size(), digest);

  std::ostringstream stream;
  stream << std::hex << std::setfill('0');
  for (const unsigned char c : digest) {
    stream << std::setw(2) << static_cast<int>(c);
  }
  return stream.str();
}

std::string fingerprint(const std::string &secret) {
  if (secret.empty()) {
    return "-";
  }
  return sha256_hex(secret).substr(0, FINGERPRINT_LENGTH);
}

std::string token_fingerprint(const std::string &access_token, const std::string &refresh_token) {
  return fingerprint(refresh_token.empty() ? access_token : refresh_token);
}

} // namespace quotaswap::security
