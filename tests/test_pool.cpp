#include "test_framework.hpp"
#include "tests/helpers/test_helpers.hpp"

#include "quotaswap/common/json_util.hpp"
#include "quotaswap/pool/credential.hpp"
#include "quotaswap/pool/store.hpp"

#include <filesystem>

void register_pool_tests(std::vector<quotaswap::tests::TestCase> &tests) {
  using quotaswap::tests::require;
  namespace pool = quotaswap::pool;
  namespace common = quotaswap::common;
  namespace qt = quotaswap::testing;

  tests.push_back({"credential_status_labels", [] {
                     require(pool::status_from_string("low_quota") == pool::CredentialStatus::LowQuota,
                             "low_quota");
                     require(pool::status_from_string("INVALID") == pool::CredentialStatus::Invalid,
                             "case-insensitive invalid");
                     require(pool::status_from_string("额度不足") == pool::CredentialStatus::LowQuota,
                             "legacy low quota label");
                     require(pool::status_from_string("失效") == pool::CredentialStatus::Invalid,
                             "legacy invalid label");
                     require(pool::status_from_string("whatever") == pool::CredentialStatus::Active,
                             "unknown reads as active");
                   }});

  tests.push_back({"credential_json_preserves_unknown_members", [] {
                     const auto parsed = pool::credential_from_json(
                         R"({"id": 1700000000001, "refresh_token": "rt", "access_token": "at",
                             "status": "low_quota", "ratio": 0.95, "note": {"owner": "ops"}})");
                     require(parsed.has_value(), "parse failed");
                     require(parsed->id == "1700000000001", "numeric id should read as text");
                     require(parsed->status == pool::CredentialStatus::LowQuota, "status");
                     require(parsed->ratio.has_value() && *parsed->ratio == 0.95, "ratio");
                     require(parsed->extra.size() == 1 && parsed->extra[0].key == "note",
                             "unknown member not kept");

                     const auto rendered = pool::credential_to_json(*parsed);
                     const auto fields = common::json_object_fields(rendered);
                     require(fields.has_value() && fields->size() == 6, "render lost members");
                     require((*fields)[0].key == "id" && (*fields)[1].key == "refresh_token",
                             "member order");
                     require(*common::json_find_field(*fields, "note") == R"({"owner": "ops"})",
                             "extra member raw text changed");
                   }});

  tests.push_back({"credential_without_ratio_omits_member", [] {
                     const auto credential = qt::make_credential("9", "rt", "at");
                     const auto fields = common::json_object_fields(pool::credential_to_json(credential));
                     require(common::json_find_field(*fields, "ratio") == nullptr,
                             "unset ratio should not be written");
                     require(pool::credential_from_json("[1]") == std::nullopt,
                             "non-object entry rejected");
                   }});

  tests.push_back({"credential_lookup_ignores_empty_keys", [] {
                     pool::CredentialList list{qt::make_credential("", "", "at-a"),
                                               qt::make_credential("2", "rt-b", "at-b")};
                     require(pool::find_by_id(list, "") == nullptr, "empty id never matches");
                     require(pool::find_by_refresh_token(list, "") == nullptr,
                             "empty refresh token never matches");
                     require(pool::find_by_refresh_token(list, "rt-b")->id == "2", "lookup by token");
                   }});

  tests.push_back({"credential_mint_id_skips_taken", [] {
                     pool::CredentialList list{qt::make_credential("100", "a", "a"),
                                               qt::make_credential("101", "b", "b")};
                     require(pool::mint_id(list, 100) == "102", "minted id collides");
                     require(pool::mint_id(list, 50) == "50", "free id should be used");
                   }});

  tests.push_back({"credential_apply_usage_report", [] {
                     auto entry = qt::make_credential("1", "rt", "at");
                     quotaswap::usage::UsageReport low;
                     low.ratio = 0.95;
                     low.refreshed = quotaswap::usage::TokenPair{.access_token = "at2",
                                                                 .refresh_token = "rt2"};
                     pool::apply_usage_report(entry, low, 0.9);
                     require(entry.status == pool::CredentialStatus::LowQuota, "low quota status");
                     require(entry.access_token == "at2" && entry.refresh_token == "rt2",
                             "refreshed tokens not applied");

                     quotaswap::usage::UsageReport failed;
                     pool::apply_usage_report(entry, failed, 0.9);
                     require(entry.status == pool::CredentialStatus::Invalid, "failed query status");
                     require(entry.ratio == pool::RATIO_FAILED, "failed ratio sentinel");
                     require(pool::format_ratio(0.425) == "42.5%", "percent format");
                     require(pool::format_ratio(-1.0) == "failed", "failed format");
                   }});

  tests.push_back({"credential_demote_merges_or_inserts_front", [] {
                     pool::CredentialList list{qt::make_credential("1", "rt-1", "at-1", 0.2)};

                     const auto merged = pool::demote_into_pool(list, qt::make_credential("1", "rt-1b", "at-1b"));
                     require(merged == "1" && list.size() == 1, "same id should merge");
                     require(list[0].access_token == "at-1b", "merged tokens");
                     require(list[0].ratio == 0.2, "merge keeps usage fields");

                     const auto by_token = pool::demote_into_pool(list, qt::make_credential("", "rt-1b", "x"));
                     require(by_token == "1" && list.size() == 1, "empty id resolves by refresh token");

                     const auto inserted = pool::demote_into_pool(list, qt::make_credential("5", "rt-5", "at-5"));
                     require(inserted == "5" && list.size() == 2, "new credential inserted");
                     require(list.front().id == "5", "demoted credential goes to the front");
                     require(list.front().status == pool::CredentialStatus::Active, "inserted as active");

                     const auto minted = pool::demote_into_pool(list, qt::make_credential("", "rt-new", "at-new"));
                     require(!minted.empty() && list.front().id == minted, "unknown credential gets an id");
                   }});

  tests.push_back({"store_missing_pool_is_created_empty", [] {
                     qt::TempWorkspace ws;
                     const auto store = qt::temp_store(qt::temp_config(ws));
                     require(store->load_reserve().empty(), "missing pool should read empty");
                     require(std::filesystem::exists(store->reserve_path()), "pool file not created");
                     require(ws.read("quotaswap/tokens.json") == "[]\n", "empty pool content");
                   }});

  tests.push_back({"store_reads_bare_and_wrapped_arrays", [] {
                     qt::TempWorkspace ws;
                     const auto store = qt::temp_store(qt::temp_config(ws));
                     ws.create_file("quotaswap/tokens.json",
                                    R"([{"id":"1","refresh_token":"a","access_token":"b"}])");
                     require(store->load_reserve().size() == 1, "bare array");
                     ws.create_file("quotaswap/tokens.json",
                                    R"({"tokens":[{"id":"1","refresh_token":"a"},{"id":"2","refresh_token":"c"}]})");
                     require(store->load_reserve().size() == 2, "wrapped array");
                   }});

  tests.push_back({"store_malformed_pool_reads_empty_and_stays", [] {
                     qt::TempWorkspace ws;
                     const auto store = qt::temp_store(qt::temp_config(ws));
                     ws.create_file("quotaswap/tokens.json", "[{\"id\":\"1\",");
                     qt::ObserverCapture capture;
                     require(store->load_reserve().empty(), "malformed pool should read empty");
                     require(ws.read("quotaswap/tokens.json") == "[{\"id\":\"1\",",
                             "malformed document must not be overwritten on read");
                     require(!capture.observer().events().empty(), "malformed pool should be reported");
                   }});

  tests.push_back({"store_reserve_roundtrip_keeps_order", [] {
                     qt::TempWorkspace ws;
                     const auto store = qt::temp_store(qt::temp_config(ws));
                     pool::CredentialList list{qt::make_credential("3", "rt3", "at3", 0.1),
                                               qt::make_credential("1", "rt1", "at1", -1.0),
                                               qt::make_credential("2", "rt2", "at2")};
                     require(store->save_reserve(list).ok(), "save failed");
                     const auto loaded = store->load_reserve();
                     require(loaded.size() == 3, "entries lost");
                     require(loaded[0].id == "3" && loaded[1].id == "1" && loaded[2].id == "2",
                             "order lost");
                     require(loaded[1].ratio == -1.0, "failed ratio lost");
                     require(!loaded[2].ratio.has_value(), "unset ratio should stay unset");
                   }});

  tests.push_back({"store_interrupted_save_leaves_pool_intact", [] {
                     qt::TempWorkspace ws;
                     const auto store = qt::temp_store(qt::temp_config(ws));
                     require(store->save_reserve({qt::make_credential("1", "rt1", "at1", 0.2),
                                                  qt::make_credential("2", "rt2", "at2")})
                                 .ok(),
                             "seed pool");
                     const auto before = ws.read("quotaswap/tokens.json");

                     // A save killed between writing its temporary sibling and the rename.
                     ws.create_file("quotaswap/tokens.json.tmp-4242-1700000000000-0", "[{\"id\":\"9\",\"refr");

                     const auto loaded = store->load_reserve();
                     require(loaded.size() == 2, "original entries lost");
                     require(loaded[0].id == "1" && loaded[0].refresh_token == "rt1" &&
                                 loaded[0].ratio == 0.2,
                             "first entry changed");
                     require(loaded[1].id == "2" && !loaded[1].ratio.has_value(), "second entry changed");
                     require(ws.read("quotaswap/tokens.json") == before, "pool document modified");
                   }});

  tests.push_back({"store_active_merge_keeps_other_members", [] {
                     qt::TempWorkspace ws;
                     const auto store = qt::temp_store(qt::temp_config(ws));
                     ws.create_file("factory/auth.json",
                                    R"({"access_token":"old","refresh_token":"old-rt","user":{"email":"a@b"}})");
                     const auto before = store->load_active();
                     require(before.has_value() && before->id.empty(), "active without id");

                     require(store->save_active(qt::make_credential("7", "rt7", "at7")).ok(), "save failed");
                     const auto fields = common::json_object_fields(ws.read("factory/auth.json"));
                     require(fields.has_value(), "active document not valid JSON");
                     require(common::json_find_field(*fields, "user") != nullptr,
                             "foreign member dropped");
                     const auto after = store->load_active();
                     require(after->id == "7" && after->access_token == "at7", "tokens not written");
                   }});

  tests.push_back({"store_active_absent_or_empty", [] {
                     qt::TempWorkspace ws;
                     const auto store = qt::temp_store(qt::temp_config(ws));
                     require(!store->load_active().has_value(), "missing document");
                     ws.create_file("factory/auth.json", "{\"id\":\"3\"}");
                     require(!store->load_active().has_value(), "document without tokens");
                     ws.create_file("factory/auth.json", "not json");
                     require(!store->load_active().has_value(), "malformed document");
                     require(store->save_active(qt::make_credential("4", "rt", "at")).ok(),
                             "malformed document should be replaced");
                     require(store->load_active()->id == "4", "replacement not readable");
                     require(store->clear_active().ok(), "clear failed");
                     require(!store->load_active().has_value(), "cleared document still active");
                   }});
}
