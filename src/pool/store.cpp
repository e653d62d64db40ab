#include "quotaswap/pool/store.hpp"

#include "quotaswap/common/fs.hpp"
#include "quotaswap/common/json_util.hpp"
#include "quotaswap/observability/global.hpp"

#include <sstream>

namespace quotaswap::pool {

namespace {

std::optional<std::vector<std::string>> pool_elements(const std::string &content) {
  if (auto elements = common::json_array_elements(content); elements.has_value()) {
    return elements;
  }
  // Older files wrap the list: {"tokens": [...]}
  const auto fields = common::json_object_fields(content);
  if (!fields.has_value()) {
    return std::nullopt;
  }
  const std::string *tokens = common::json_find_field(*fields, "tokens");
  if (tokens == nullptr) {
    return std::nullopt;
  }
  return common::json_array_elements(*tokens);
}

} // namespace

CredentialStore::CredentialStore(std::filesystem::path active_path,
                                 std::filesystem::path reserve_path)
    : active_path_(std::move(active_path)), reserve_path_(std::move(reserve_path)) {}

std::optional<Credential> CredentialStore::load_active() const {
  const auto content = common::read_file(active_path_);
  if (!content.ok()) {
    return std::nullopt;
  }
  const auto fields = common::json_object_fields(content.value());
  if (!fields.has_value()) {
    return std::nullopt;
  }

  Credential active;
  active.id = text_member(*fields, "id");
  active.access_token = text_member(*fields, "access_token");
  active.refresh_token = text_member(*fields, "refresh_token");
  if (active.access_token.empty() && active.refresh_token.empty()) {
    return std::nullopt;
  }
  return active;
}

common::Status CredentialStore::save_active(const Credential &credential) const {
  common::JsonFields fields;
  if (const auto existing = common::read_file(active_path_); existing.ok()) {
    fields = common::json_object_fields(existing.value()).value_or(common::JsonFields{});
  }

  common::json_set_field(fields, "access_token", common::json_quote(credential.access_token));
  common::json_set_field(fields, "refresh_token", common::json_quote(credential.refresh_token));
  common::json_set_field(fields, "id", common::json_quote(credential.id));

  const auto status = common::atomic_write_file(active_path_, common::json_render_object(fields) + "\n");
  if (!status.ok()) {
    observability::record_error("store", status.error());
  }
  return status;
}

common::Status CredentialStore::clear_active() const {
  const auto status = common::atomic_write_file(active_path_, "{}\n");
  if (!status.ok()) {
    observability::record_error("store", status.error());
  }
  return status;
}

CredentialList CredentialStore::load_reserve() const {
  std::error_code ec;
  if (!std::filesystem::exists(reserve_path_, ec)) {
    if (const auto created = save_reserve({}); !created.ok()) {
      observability::record_error("store", "unable to create empty pool: " + created.error());
    }
    return {};
  }

  const auto content = common::read_file(reserve_path_);
  if (!content.ok()) {
    observability::record_error("store", content.error());
    return {};
  }

  const auto elements = pool_elements(content.value());
  if (!elements.has_value()) {
    observability::record_error("store", "malformed pool document " + reserve_path_.string() +
                                             "; treating it as empty");
    return {};
  }

  CredentialList pool;
  pool.reserve(elements->size());
  for (const auto &raw : *elements) {
    if (auto credential = credential_from_json(raw); credential.has_value()) {
      pool.push_back(std::move(*credential));
    }
  }
  return pool;
}

common::Status CredentialStore::save_reserve(const CredentialList &pool) const {
  const auto status = common::atomic_write_file(reserve_path_, render_pool(pool) + "\n");
  if (!status.ok()) {
    observability::record_error("store", status.error());
    return status;
  }
  observability::record_pool_size(pool.size());
  return status;
}

std::string render_pool(const CredentialList &pool) {
  if (pool.empty()) {
    return "[]";
  }
  std::ostringstream out;
  out << "[\n";
  for (std::size_t i = 0; i < pool.size(); ++i) {
    out << "  " << credential_to_json(pool[i], 1);
    if (i + 1 < pool.size()) {
      out << ",";
    }
    out << "\n";
  }
  out << "]";
  return out.str();
}

} // namespace quotaswap::pool
