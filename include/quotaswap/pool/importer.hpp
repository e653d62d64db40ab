#pragma once

#include "quotaswap/common/result.hpp"
#include "quotaswap/pool/store.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace quotaswap::pool {

inline constexpr const char *IMPORT_FIELD_SEPARATOR = "----";

struct ImportSummary {
  std::size_t added = 0;
  std::size_t skipped = 0;
  std::size_t ignored = 0;
  std::vector<std::string> ids;
};

/// Ingest `refreshToken----accessToken[----anything]` lines. New entries go to
/// the front of the pool in input order; known refresh tokens are skipped.
/// Ids are `base_ms + n` (now when unset), bumped past ids already taken.
[[nodiscard]] common::Result<ImportSummary>
import_lines(const CredentialStore &store, const std::vector<std::string> &lines,
             std::optional<std::int64_t> base_ms = std::nullopt);

[[nodiscard]] std::vector<std::string> split_lines(const std::string &text);

struct ReconcileReport {
  std::string active_id;
  bool id_assigned = false;
  bool pool_synced = false;
};

/// Give the Active credential an id if it lacks one, then copy its tokens into
/// the pool entry sharing that id.
[[nodiscard]] common::Result<ReconcileReport> reconcile_on_start(const CredentialStore &store);

/// Remove pool entries by id. Returns how many were removed.
[[nodiscard]] common::Result<std::size_t> delete_entries(const CredentialStore &store,
                                                         const std::vector<std::string> &ids);

/// Move the Active credential back into the pool and clear the Active document.
/// Returns the id it was filed under.
[[nodiscard]] common::Result<std::string> deactivate(const CredentialStore &store);

} // namespace quotaswap::pool
