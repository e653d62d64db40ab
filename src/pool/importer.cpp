#include "quotaswap/pool/importer.hpp"

#include "quotaswap/common/fs.hpp"
#include "quotaswap/observability/global.hpp"

#include <algorithm>
#include <sstream>
#include <unordered_set>

namespace quotaswap::pool {

common::Result<ImportSummary> import_lines(const CredentialStore &store,
                                           const std::vector<std::string> &lines,
                                           const std::optional<std::int64_t> base_ms) {
  CredentialList pool = store.load_reserve();

  std::unordered_set<std::string> known;
  for (const auto &entry : pool) {
    if (!entry.refresh_token.empty()) {
      known.insert(entry.refresh_token);
    }
  }

  const std::int64_t base = base_ms.value_or(common::now_millis());
  ImportSummary summary;
  CredentialList accepted;

  for (const auto &raw_line : lines) {
    const std::string line = common::trim(raw_line);
    if (line.empty()) {
      continue;
    }
    const auto parts = common::split(line, IMPORT_FIELD_SEPARATOR);
    if (parts.size() < 2) {
      ++summary.ignored;
      continue;
    }
    const std::string refresh_token = common::trim(parts[0]);
    const std::string access_token = common::trim(parts[1]);
    if (refresh_token.empty()) {
      ++summary.ignored;
      continue;
    }
    if (!known.insert(refresh_token).second) {
      ++summary.skipped;
      continue;
    }

    std::int64_t candidate = base + static_cast<std::int64_t>(summary.added);
    while (find_by_id(pool, std::to_string(candidate)) != nullptr ||
           find_by_id(accepted, std::to_string(candidate)) != nullptr) {
      ++candidate;
    }

    Credential credential;
    credential.id = std::to_string(candidate);
    credential.refresh_token = refresh_token;
    credential.access_token = access_token;
    credential.status = CredentialStatus::Active;
    summary.ids.push_back(credential.id);
    accepted.push_back(std::move(credential));
    ++summary.added;
  }

  if (!accepted.empty()) {
    pool.insert(pool.begin(), std::make_move_iterator(accepted.begin()),
                std::make_move_iterator(accepted.end()));
    if (const auto saved = store.save_reserve(pool); !saved.ok()) {
      return common::Result<ImportSummary>::failure("import not saved: " + saved.error());
    }
  }

  observability::record_import(summary.added, summary.skipped, summary.ignored);
  return common::Result<ImportSummary>::success(std::move(summary));
}

std::vector<std::string> split_lines(const std::string &text) {
  std::vector<std::string> lines;
  std::istringstream stream(text);
  std::string line;
  while (std::getline(stream, line)) {
    lines.push_back(line);
  }
  return lines;
}

common::Result<ReconcileReport> reconcile_on_start(const CredentialStore &store) {
  ReconcileReport report;
  auto active = store.load_active();
  if (!active.has_value()) {
    return common::Result<ReconcileReport>::success(report);
  }

  CredentialList pool = store.load_reserve();
  if (active->id.empty()) {
    const Credential *match = find_by_refresh_token(pool, active->refresh_token);
    active->id = match != nullptr ? match->id : mint_id(pool, common::now_millis());
    if (const auto saved = store.save_active(*active); !saved.ok()) {
      return common::Result<ReconcileReport>::failure("unable to assign an id to the active credential: " +
                                                      saved.error());
    }
    report.id_assigned = true;
  }
  report.active_id = active->id;

  if (Credential *entry = find_by_id(pool, active->id); entry != nullptr) {
    entry->access_token = active->access_token;
    entry->refresh_token = active->refresh_token;
    if (const auto saved = store.save_reserve(pool); !saved.ok()) {
      return common::Result<ReconcileReport>::failure("unable to sync the active credential into the pool: " +
                                                      saved.error());
    }
    report.pool_synced = true;
  }

  return common::Result<ReconcileReport>::success(report);
}

common::Result<std::size_t> delete_entries(const CredentialStore &store,
                                           const std::vector<std::string> &ids) {
  CredentialList pool = store.load_reserve();
  const std::unordered_set<std::string> doomed(ids.begin(), ids.end());
  const auto before = pool.size();
  std::erase_if(pool, [&](const Credential &entry) { return doomed.contains(entry.id); });
  const std::size_t removed = before - pool.size();

  if (removed > 0) {
    if (const auto saved = store.save_reserve(pool); !saved.ok()) {
      return common::Result<std::size_t>::failure("delete not saved: " + saved.error());
    }
  }
  return common::Result<std::size_t>::success(removed);
}

common::Result<std::string> deactivate(const CredentialStore &store) {
  const auto active = store.load_active();
  if (!active.has_value()) {
    return common::Result<std::string>::failure("there is no active credential");
  }

  CredentialList pool = store.load_reserve();
  const std::string id = demote_into_pool(pool, *active);
  if (const auto saved = store.save_reserve(pool); !saved.ok()) {
    return common::Result<std::string>::failure("unable to save the pool: " + saved.error());
  }
  if (const auto cleared = store.clear_active(); !cleared.ok()) {
    return common::Result<std::string>::failure("credential " + id +
                                                " was filed but the active document was not cleared: " +
                                                cleared.error());
  }
  return common::Result<std::string>::success(id);
}

} // namespace quotaswap::pool
