#include "quotaswap/pool/credential.hpp"

#include "quotaswap/common/fs.hpp"

#include <algorithm>
#include <iomanip>
#include <sstream>

namespace quotaswap::pool {

namespace {

constexpr const char *KEY_ID = "id";
constexpr const char *KEY_ACCESS = "access_token";
constexpr const char *KEY_REFRESH = "refresh_token";
constexpr const char *KEY_STATUS = "status";
constexpr const char *KEY_RATIO = "ratio";

bool is_owned_key(const std::string &key) {
  return key == KEY_ID || key == KEY_ACCESS || key == KEY_REFRESH || key == KEY_STATUS ||
         key == KEY_RATIO;
}

template <typename Pool, typename Pred> auto find_entry(Pool &pool, Pred &&pred) {
  const auto it = std::find_if(pool.begin(), pool.end(), pred);
  return it == pool.end() ? nullptr : &*it;
}

} // namespace

std::string_view status_to_string(const CredentialStatus status) {
  switch (status) {
  case CredentialStatus::Active:
    return "active";
  case CredentialStatus::LowQuota:
    return "low_quota";
  case CredentialStatus::Invalid:
    return "invalid";
  }
  return "active";
}

CredentialStatus status_from_string(const std::string &value) {
  const std::string normalized = common::to_lower(common::trim(value));
  if (normalized == "low_quota" || value == "额度不足") {
    return CredentialStatus::LowQuota;
  }
  if (normalized == "invalid" || value == "失效") {
    return CredentialStatus::Invalid;
  }
  return CredentialStatus::Active;
}

std::string text_member(const common::JsonFields &fields, const std::string &key) {
  const std::string *raw = common::json_find_field(fields, key);
  if (raw == nullptr) {
    return "";
  }
  if (const auto text = common::json_string_value(*raw); text.has_value()) {
    return common::trim(*text);
  }
  if (common::json_number_value(*raw).has_value()) {
    return *raw;
  }
  return "";
}

std::string format_ratio(const double ratio) {
  if (ratio < 0.0) {
    return "failed";
  }
  std::ostringstream out;
  out << std::fixed << std::setprecision(1) << ratio * 100.0 << "%";
  return out.str();
}

std::optional<Credential> credential_from_json(const std::string &raw) {
  const auto fields = common::json_object_fields(raw);
  if (!fields.has_value()) {
    return std::nullopt;
  }

  Credential credential;
  credential.id = text_member(*fields, KEY_ID);
  credential.access_token = text_member(*fields, KEY_ACCESS);
  credential.refresh_token = text_member(*fields, KEY_REFRESH);
  if (const std::string *status = common::json_find_field(*fields, KEY_STATUS); status != nullptr) {
    credential.status = status_from_string(common::json_string_value(*status).value_or(""));
  }
  if (const std::string *ratio = common::json_find_field(*fields, KEY_RATIO); ratio != nullptr) {
    credential.ratio = common::json_number_value(*ratio);
  }
  for (const auto &field : *fields) {
    if (!is_owned_key(field.key)) {
      credential.extra.push_back(field);
    }
  }
  return credential;
}

std::string credential_to_json(const Credential &credential, const std::size_t indent) {
  common::JsonFields fields;
  fields.push_back({KEY_ID, common::json_quote(credential.id)});
  fields.push_back({KEY_REFRESH, common::json_quote(credential.refresh_token)});
  fields.push_back({KEY_ACCESS, common::json_quote(credential.access_token)});
  fields.push_back({KEY_STATUS, common::json_quote(std::string(status_to_string(credential.status)))});
  if (credential.ratio.has_value()) {
    fields.push_back({KEY_RATIO, common::json_number(*credential.ratio)});
  }
  for (const auto &field : credential.extra) {
    fields.push_back(field);
  }
  return common::json_render_object(fields, indent);
}

Credential *find_by_id(CredentialList &pool, const std::string &id) {
  return find_entry(pool, [&](const Credential &entry) { return !id.empty() && entry.id == id; });
}

const Credential *find_by_id(const CredentialList &pool, const std::string &id) {
  return find_entry(pool, [&](const Credential &entry) { return !id.empty() && entry.id == id; });
}

Credential *find_by_refresh_token(CredentialList &pool, const std::string &refresh_token) {
  return find_entry(pool, [&](const Credential &entry) {
    return !refresh_token.empty() && entry.refresh_token == refresh_token;
  });
}

const Credential *find_by_refresh_token(const CredentialList &pool,
                                        const std::string &refresh_token) {
  return find_entry(pool, [&](const Credential &entry) {
    return !refresh_token.empty() && entry.refresh_token == refresh_token;
  });
}

std::string mint_id(const CredentialList &pool, std::int64_t base_ms) {
  while (find_by_id(pool, std::to_string(base_ms)) != nullptr) {
    ++base_ms;
  }
  return std::to_string(base_ms);
}

void apply_usage_report(Credential &entry, const usage::UsageReport &report,
                        const double warn_threshold) {
  if (report.refreshed.has_value()) {
    entry.access_token = report.refreshed->access_token;
    entry.refresh_token = report.refreshed->refresh_token;
  }
  if (report.ok()) {
    entry.ratio = report.ratio;
    entry.status = report.ratio >= warn_threshold ? CredentialStatus::LowQuota
                                                  : CredentialStatus::Active;
  } else {
    entry.ratio = RATIO_FAILED;
    entry.status = CredentialStatus::Invalid;
  }
}

std::string demote_into_pool(CredentialList &pool, Credential previous) {
  if (previous.id.empty()) {
    const Credential *match = find_by_refresh_token(pool, previous.refresh_token);
    previous.id = match != nullptr ? match->id : mint_id(pool, common::now_millis());
  }

  Credential *existing = find_by_id(pool, previous.id);
  if (existing == nullptr) {
    existing = find_by_refresh_token(pool, previous.refresh_token);
  }
  if (existing != nullptr) {
    existing->access_token = previous.access_token;
    existing->refresh_token = previous.refresh_token;
    return existing->id;
  }

  previous.status = CredentialStatus::Active;
  const std::string id = previous.id;
  pool.insert(pool.begin(), std::move(previous));
  return id;
}

} // namespace quotaswap::pool
