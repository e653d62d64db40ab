#pragma once

#include "quotaswap/common/result.hpp"
#include "quotaswap/pool/credential.hpp"

#include <filesystem>
#include <optional>

namespace quotaswap::pool {

/// Durable home of the Active document and the Reserve Pool document.
/// Every load re-reads disk; every save is a temp-file write plus one rename.
class CredentialStore {
public:
  CredentialStore(std::filesystem::path active_path, std::filesystem::path reserve_path);

  /// None when the document is missing, malformed, or carries no tokens.
  [[nodiscard]] std::optional<Credential> load_active() const;

  /// Rewrites only `access_token`, `refresh_token` and `id`, keeping every
  /// other member of the existing document.
  [[nodiscard]] common::Status save_active(const Credential &credential) const;

  /// Replace the Active document with `{}`.
  [[nodiscard]] common::Status clear_active() const;

  /// A missing document is created as `[]`. A malformed one reads as empty
  /// and is left on disk untouched.
  [[nodiscard]] CredentialList load_reserve() const;
  [[nodiscard]] common::Status save_reserve(const CredentialList &pool) const;

  [[nodiscard]] const std::filesystem::path &active_path() const { return active_path_; }
  [[nodiscard]] const std::filesystem::path &reserve_path() const { return reserve_path_; }

private:
  std::filesystem::path active_path_;
  std::filesystem::path reserve_path_;
};

[[nodiscard]] std::string render_pool(const CredentialList &pool);

} // namespace quotaswap::pool
