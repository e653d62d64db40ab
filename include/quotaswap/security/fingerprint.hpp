#pragma once

#include <cstddef>
#include <string>

namespace quotaswap::security {

inline constexpr std::size_t FINGERPRINT_LENGTH = 12;

[[nodiscard]] std::string sha256_hex(const std::string &text);

/// Short stable label for a secret, safe to log and display. "-" when empty.
[[nodiscard]] std::string fingerprint(const std::string &secret);

/// Fingerprint of a credential pair, keyed on the refresh token when present.
[[nodiscard]] std::string token_fingerprint(const std::string &access_token,
                                            const std::string &refresh_token);

} // namespace quotaswap::security
