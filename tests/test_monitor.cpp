#include "test_framework.hpp"
#include "tests/helpers/test_helpers.hpp"

#include "quotaswap/monitor/log_watcher.hpp"
#include "quotaswap/monitor/poller.hpp"

#include <atomic>
#include <chrono>
#include <mutex>
#include <thread>

namespace {

constexpr const char *kBillingLine =
    "Ready for more? Reload your tokens at https://app.factory.ai/settings/billing\n";

quotaswap::monitor::LogWatcherConfig watcher_config(const quotaswap::testing::TempWorkspace &ws) {
  quotaswap::monitor::LogWatcherConfig config;
  config.globs = {(ws.path() / "logs" / "*.log").string()};
  config.pattern = quotaswap::config::MonitorConfig{}.error_pattern;
  config.poll_interval = std::chrono::milliseconds(20);
  return config;
}

template <typename Pred> bool wait_until(Pred pred, std::chrono::milliseconds timeout) {
  const auto deadline = std::chrono::steady_clock::now() + timeout;
  while (std::chrono::steady_clock::now() < deadline) {
    if (pred()) {
      return true;
    }
    std::this_thread::sleep_for(std::chrono::milliseconds(5));
  }
  return pred();
}

} // namespace

void register_monitor_tests(std::vector<quotaswap::tests::TestCase> &tests) {
  using quotaswap::tests::require;
  namespace monitor = quotaswap::monitor;
  namespace qt = quotaswap::testing;

  tests.push_back({"poller_first_fire_is_user_initiated", [] {
                     std::mutex mutex;
                     std::vector<bool> calls;
                     monitor::Poller poller(
                         [&](const bool user_initiated) {
                           std::lock_guard<std::mutex> lock(mutex);
                           calls.push_back(user_initiated);
                           return calls.size() != 2;
                         },
                         std::chrono::milliseconds(10));
                     poller.start();
                     require(poller.is_running(), "poller should run");
                     require(wait_until([&] { return poller.fires() + poller.dropped() >= 3; },
                                        std::chrono::seconds(2)),
                             "poller did not fire repeatedly");
                     poller.stop();
                     require(!poller.is_running(), "poller should stop");

                     std::lock_guard<std::mutex> lock(mutex);
                     require(calls.at(0), "first fire must be user-initiated");
                     require(!calls.at(1) && !calls.at(2), "later fires are timer-initiated");
                     require(poller.dropped() == 1, "rejected fire should count as dropped");
                   }});

  tests.push_back({"poller_stop_is_prompt", [] {
                     monitor::Poller poller([](bool) { return true; }, std::chrono::seconds(60));
                     poller.start();
                     require(wait_until([&] { return poller.fires() == 1; }, std::chrono::seconds(1)),
                             "first fire should be immediate");
                     const auto started = std::chrono::steady_clock::now();
                     poller.stop();
                     require(std::chrono::steady_clock::now() - started < std::chrono::seconds(1),
                             "stop should not wait for the interval");
                   }});

  tests.push_back({"log_watcher_ignores_existing_content", [] {
                     qt::TempWorkspace ws;
                     ws.create_file("logs/droid.log", kBillingLine);
                     std::vector<std::string> sources;
                     monitor::LogWatcher watcher(watcher_config(ws),
                                                 [&](const std::string &source) { sources.push_back(source); });
                     const auto first = watcher.scan_once();
                     require(first.ok() && !first.value().has_value(),
                             "content present at start must not trigger");
                     require(watcher.tracked_files() == 1, "file should be tracked");

                     ws.append_file("logs/droid.log", "ordinary line\n");
                     require(!watcher.scan_once().value().has_value(), "ordinary line triggered");

                     ws.append_file("logs/droid.log", std::string("error: ") + kBillingLine);
                     const auto hit = watcher.scan_once();
                     require(hit.ok() && hit.value().has_value(), "appended billing error missed");
                     require(sources.size() == 1, "callback not invoked once");
                     require(!watcher.scan_once().value().has_value(), "same text reported twice");
                   }});

  tests.push_back({"log_watcher_new_and_truncated_files", [] {
                     qt::TempWorkspace ws;
                     ws.create_file("logs/a.log", std::string(400, '.') + "\n");
                     std::size_t hits = 0;
                     monitor::LogWatcher watcher(watcher_config(ws), [&](const std::string &) { ++hits; });
                     require(watcher.scan_once().ok(), "priming scan failed");

                     ws.create_file("logs/b.log", kBillingLine);
                     const auto new_file = watcher.scan_once();
                     require(new_file.value().has_value() &&
                                 new_file.value()->find("b.log") != std::string::npos,
                             "a file created later is read from the start");

                     ws.create_file("logs/a.log", kBillingLine);
                     require(watcher.scan_once().value().has_value(),
                             "rewritten shorter file should be rescanned from the start");

                     std::filesystem::remove(ws.path() / "logs" / "b.log");
                     require(watcher.scan_once().ok(), "scan after removal failed");
                     require(watcher.tracked_files() == 1, "vanished file should be forgotten");
                     require(hits == 2, "callback count");
                   }});

  tests.push_back({"log_watcher_one_hit_per_pass", [] {
                     qt::TempWorkspace ws;
                     std::size_t hits = 0;
                     monitor::LogWatcher watcher(watcher_config(ws), [&](const std::string &) { ++hits; });
                     require(watcher.scan_once().ok(), "priming scan failed");
                     ws.create_file("logs/a.log", kBillingLine);
                     ws.create_file("logs/b.log", kBillingLine);
                     require(watcher.scan_once().value().has_value(), "hit expected");
                     require(hits == 1, "at most one report per pass");
                     require(!watcher.scan_once().value().has_value(), "both files were consumed");
                   }});

  tests.push_back({"log_watcher_survives_very_long_lines", [] {
                     qt::TempWorkspace ws;
                     ws.create_file("logs/droid.log", "");
                     std::size_t hits = 0;
                     monitor::LogWatcher watcher(watcher_config(ws), [&](const std::string &) { ++hits; });
                     require(watcher.scan_once().ok(), "priming scan failed");

                     ws.append_file("logs/droid.log",
                                    "Ready for more? Reload your tokens " + std::string(200'000, 'x') + "\n");
                     const auto unmatched = watcher.scan_once();
                     require(unmatched.ok() && !unmatched.value().has_value(),
                             "prefix without the billing url must not match");

                     ws.append_file("logs/droid.log", std::string(200'000, 'y') + " " + kBillingLine);
                     const auto matched = watcher.scan_once();
                     require(matched.ok() && matched.value().has_value(),
                             "billing message at the end of a long line missed");
                     require(hits == 1, "callback count");
                   }});

  tests.push_back({"log_watcher_bad_pattern", [] {
                     qt::TempWorkspace ws;
                     auto config = watcher_config(ws);
                     config.pattern = "([unclosed";
                     monitor::LogWatcher watcher(config, nullptr);
                     require(!watcher.start().ok(), "bad pattern should refuse to start");
                     require(!watcher.scan_once().ok(), "bad pattern should fail scans");
                   }});

  tests.push_back({"log_watcher_thread_reports", [] {
                     qt::TempWorkspace ws;
                     ws.create_file("logs/a.log", "boot\n");
                     std::atomic<int> hits{0};
                     monitor::LogWatcher watcher(watcher_config(ws), [&](const std::string &) { ++hits; });
                     require(watcher.start().ok(), "start failed");
                     std::this_thread::sleep_for(std::chrono::milliseconds(80));
                     ws.append_file("logs/a.log", kBillingLine);
                     require(wait_until([&] { return hits.load() == 1; }, std::chrono::seconds(2)),
                             "background scan did not report");
                     watcher.stop();
                     require(!watcher.is_running(), "watcher should stop");
                   }});
}
