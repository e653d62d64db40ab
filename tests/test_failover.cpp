#include "test_framework.hpp"
#include "tests/helpers/test_helpers.hpp"

#include "quotaswap/pool/failover.hpp"

#include <algorithm>
#include <set>

namespace {

namespace pool = quotaswap::pool;
namespace qt = quotaswap::testing;

struct Fixture {
  qt::TempWorkspace ws;
  quotaswap::config::Config config = qt::temp_config(ws);
  std::shared_ptr<pool::CredentialStore> store = qt::temp_store(config);
  std::shared_ptr<qt::MockRemoteApi> remote = std::make_shared<qt::MockRemoteApi>();
  std::shared_ptr<quotaswap::usage::UsageOracle> oracle =
      std::make_shared<quotaswap::usage::UsageOracle>(remote);
  pool::FailoverEngine engine{store, oracle, config.failover, 1000};
};

std::set<std::string> all_ids(const pool::CredentialStore &store) {
  std::set<std::string> ids;
  if (const auto active = store.load_active(); active.has_value()) {
    ids.insert(active->id);
  }
  for (const auto &entry : store.load_reserve()) {
    ids.insert(entry.id);
  }
  return ids;
}

std::size_t occurrences(const pool::CredentialStore &store, const std::string &id) {
  std::size_t count = 0;
  if (const auto active = store.load_active(); active.has_value() && active->id == id) {
    ++count;
  }
  const auto reserve = store.load_reserve();
  count += static_cast<std::size_t>(std::count_if(
      reserve.begin(), reserve.end(), [&](const pool::Credential &entry) { return entry.id == id; }));
  return count;
}

const pool::ConfirmFn kAccept = [](const pool::SwitchPrompt &) { return true; };

} // namespace

void register_failover_tests(std::vector<quotaswap::tests::TestCase> &tests) {
  using quotaswap::tests::require;

  tests.push_back({"failover_select_prefers_lowest_ratio", [] {
                     const pool::CredentialList list{qt::make_credential("1", "a", "a", 0.95),
                                                     qt::make_credential("2", "b", "b", 0.92),
                                                     qt::make_credential("3", "c", "c", 0.1),
                                                     qt::make_credential("4", "d", "d", 0.5)};
                     require(pool::select_candidate(list, "", 0.9) == std::optional<std::string>("3"),
                             "lowest ratio under the threshold should win");
                     require(pool::select_candidate(list, "3", 0.9) == std::optional<std::string>("4"),
                             "active id is excluded");
                   }});

  tests.push_back({"failover_select_ties_and_failed_entries", [] {
                     const pool::CredentialList tied{qt::make_credential("a", "1", "1", 0.2),
                                                     qt::make_credential("b", "2", "2", 0.2)};
                     require(pool::select_candidate(tied, "", 0.9) == std::optional<std::string>("a"),
                             "ties resolve in pool order");

                     const pool::CredentialList failed_first{qt::make_credential("x", "1", "1", 0.3),
                                                             qt::make_credential("y", "2", "2", -1.0)};
                     require(pool::select_candidate(failed_first, "", 0.9) ==
                                 std::optional<std::string>("y"),
                             "a failed entry has the lowest ratio");

                     const pool::CredentialList only_failed{qt::make_credential("x", "1", "1", -1.0)};
                     require(pool::select_candidate(only_failed, "", 0.9) ==
                                 std::optional<std::string>("x"),
                             "a failed entry is still a candidate");

                     const pool::CredentialList unchecked{qt::make_credential("u", "1", "1")};
                     require(pool::select_candidate(unchecked, "", 0.9) ==
                                 std::optional<std::string>("u"),
                             "unchecked entries count as unused");

                     const pool::CredentialList exhausted{qt::make_credential("e", "1", "1", 0.9)};
                     require(!pool::select_candidate(exhausted, "", 0.9).has_value(),
                             "ratio at the warn threshold is excluded");
                   }});

  tests.push_back({"failover_auto_prefers_unchecked_over_known_low_ratio", [] {
                     Fixture f;
                     require(f.store->save_active(qt::make_credential("0", "rt0", "at0")).ok(), "seed active");
                     require(f.store->save_reserve({qt::make_credential("1", "rt1", "at1", 0.95),
                                                    qt::make_credential("2", "rt2", "at2", 0.3),
                                                    qt::make_credential("3", "rt3", "at3")})
                                 .ok(),
                             "seed pool");
                     f.remote->set_usage("at2", 0.3);
                     f.remote->set_usage("at3", 0.05);

                     require(pool::select_candidate(f.store->load_reserve(), "0", 0.9) ==
                                 std::optional<std::string>("3"),
                             "unchecked entry should be selected");
                     const auto result = f.engine.auto_failover();
                     require(result.ok() && result.id == "3", "unchecked entry not promoted");
                     require(f.remote->queried_tokens() == std::vector<std::string>{"at3"},
                             "admission query should target the candidate only");
                     require(f.store->load_active()->id == "3", "candidate not active");
                     const auto reserve = f.store->load_reserve();
                     require(pool::find_by_id(reserve, "0") != nullptr, "previous active not demoted");
                   }});

  tests.push_back({"failover_auto_promotes_best_and_demotes_active", [] {
                     Fixture f;
                     require(f.store->save_active(qt::make_credential("5", "rt5", "at5")).ok(), "seed active");
                     require(f.store->save_reserve({qt::make_credential("1", "rt1", "at1", 0.95),
                                                    qt::make_credential("3", "rt3", "at3", 0.1),
                                                    qt::make_credential("4", "rt4", "at4", 0.5)})
                                 .ok(),
                             "seed pool");
                     f.remote->set_usage("at3", 0.12);

                     const auto result = f.engine.auto_failover();
                     require(result.ok(), "auto failover failed: " + result.message);
                     require(result.id == "3" && result.previous_id == "5", "ids in result");
                     require(f.store->load_active()->id == "3", "candidate not active");
                     const auto reserve = f.store->load_reserve();
                     require(pool::find_by_id(reserve, "3") == nullptr, "promoted entry left in pool");
                     require(reserve.front().id == "5", "previous active should head the pool");
                     require(all_ids(*f.store) == std::set<std::string>{"1", "3", "4", "5"},
                             "credential lost or invented");
                     for (const auto &id : {"1", "3", "4", "5"}) {
                       require(occurrences(*f.store, id) == 1, std::string("duplicate id ") + id);
                     }
                   }});

  tests.push_back({"failover_manual_switch_demotes_previous", [] {
                     Fixture f;
                     require(f.store->save_active(qt::make_credential("5", "rt5", "at5")).ok(), "seed active");
                     require(f.store->save_reserve({qt::make_credential("7", "rt7", "at7", 0.3)}).ok(),
                             "seed pool");
                     f.remote->set_usage("at7", 0.3);

                     std::optional<pool::SwitchPrompt> shown;
                     const auto result = f.engine.switch_to("7", [&](const pool::SwitchPrompt &prompt) {
                       shown = prompt;
                       return true;
                     });
                     require(result.ok(), "switch failed: " + result.message);
                     require(shown.has_value() && shown->id == "7", "prompt not shown");
                     require(shown->remaining_ratio > 0.69 && shown->remaining_ratio < 0.71,
                             "remaining ratio in prompt");
                     require(f.store->load_active()->id == "7", "7 should be active");
                     const auto reserve = f.store->load_reserve();
                     require(reserve.size() == 1 && reserve[0].id == "5", "5 should be in the pool");
                   }});

  tests.push_back({"failover_rejects_exhausted_and_failed_candidates", [] {
                     Fixture f;
                     require(f.store->save_active(qt::make_credential("5", "rt5", "at5")).ok(), "seed active");
                     require(f.store->save_reserve({qt::make_credential("7", "rt7", "at7", 0.1),
                                                    qt::make_credential("8", "rt8", "at8", 0.1)})
                                 .ok(),
                             "seed pool");
                     f.remote->set_usage("at7", 1.0);

                     const auto exhausted = f.engine.switch_to("7", kAccept);
                     require(exhausted.outcome == pool::SwitchOutcome::Exhausted, "fresh ratio 1 rejected");
                     const auto failed = f.engine.switch_to("8", kAccept);
                     require(failed.outcome == pool::SwitchOutcome::QueryFailed, "failed query rejected");

                     require(f.store->load_active()->id == "5", "active must not change");
                     const auto reserve = f.store->load_reserve();
                     require(pool::find_by_id(reserve, "7")->ratio == 1.0,
                             "admission usage should be recorded");
                     require(pool::find_by_id(reserve, "7")->status == pool::CredentialStatus::LowQuota,
                             "exhausted entry marked low quota");
                     require(pool::find_by_id(reserve, "8")->status == pool::CredentialStatus::Invalid,
                             "failed entry marked invalid");
                   }});

  tests.push_back({"failover_declined_and_missing", [] {
                     Fixture f;
                     require(f.store->save_active(qt::make_credential("5", "rt5", "at5")).ok(), "seed active");
                     require(f.store->save_reserve({qt::make_credential("7", "rt7", "at7")}).ok(),
                             "seed pool");
                     f.remote->set_usage("at7", 0.2);

                     const auto declined =
                         f.engine.switch_to("7", [](const pool::SwitchPrompt &) { return false; });
                     require(declined.outcome == pool::SwitchOutcome::Declined, "declined outcome");
                     require(f.store->load_active()->id == "5", "declined switch changed active");
                     require(f.store->load_reserve().size() == 1, "declined switch changed pool");

                     const auto missing = f.engine.switch_to("404", kAccept);
                     require(missing.outcome == pool::SwitchOutcome::PoolLookupMiss, "lookup miss");
                     require(f.remote->usage_calls() == 1, "missing id must not query");
                   }});

  tests.push_back({"failover_none_available", [] {
                     Fixture f;
                     require(f.store->save_active(qt::make_credential("5", "rt5", "at5")).ok(), "seed active");
                     require(f.store->save_reserve({qt::make_credential("6", "rt6", "at6", 0.97)}).ok(),
                             "seed pool");
                     qt::ObserverCapture capture;
                     const auto result = f.engine.auto_failover();
                     require(result.outcome == pool::SwitchOutcome::NoneAvailable, "none available");
                     require(f.remote->usage_calls() == 0, "no query without a candidate");
                     require(!capture.observer().events().empty(), "failover attempt not recorded");
                   }});

  tests.push_back({"failover_refresh_during_admission_lands_on_promoted", [] {
                     Fixture f;
                     require(f.store->save_reserve({qt::make_credential("7", "rt7", "at7-expired")}).ok(),
                             "seed pool");
                     f.remote->set_refresh("rt7", {.access_token = "at7-new", .refresh_token = "rt7-new"});
                     f.remote->set_usage("at7-new", 0.4);

                     const auto result = f.engine.switch_to("7", kAccept);
                     require(result.ok(), "switch failed: " + result.message);
                     const auto active = f.store->load_active();
                     require(active->access_token == "at7-new" && active->refresh_token == "rt7-new",
                             "refreshed tokens must be promoted");
                     require(f.store->load_reserve().empty(), "no previous active to demote");
                   }});

  tests.push_back({"failover_same_credential_not_duplicated", [] {
                     Fixture f;
                     require(f.store->save_active(qt::make_credential("7", "rt7", "at7")).ok(), "seed active");
                     require(f.store->save_reserve({qt::make_credential("7", "rt7", "at7", 0.1)}).ok(),
                             "seed pool");
                     f.remote->set_usage("at7", 0.1);
                     const auto result = f.engine.switch_to("7", kAccept);
                     require(result.ok(), "switch failed");
                     require(result.previous_id.empty(), "same credential should not be demoted");
                     require(occurrences(*f.store, "7") == 1, "credential duplicated");
                   }});
}
