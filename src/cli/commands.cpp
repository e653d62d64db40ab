#include "quotaswap/cli/commands.hpp"

#include "quotaswap/common/fs.hpp"
#include "quotaswap/config/config.hpp"
#include "quotaswap/daemon/pid_file.hpp"
#include "quotaswap/observability/global.hpp"
#include "quotaswap/pool/importer.hpp"
#include "quotaswap/runtime/app.hpp"
#include "quotaswap/security/fingerprint.hpp"

#include <algorithm>
#include <atomic>
#include <chrono>
#include <csignal>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <string>
#include <thread>
#include <type_traits>
#include <vector>


namespace quotaswap::cli {

namespace {

constexpr auto EVENT_WAIT = std::chrono::milliseconds(200);

std::atomic<bool> g_stop_requested{false};

void handle_stop_signal(int) { g_stop_requested = true; }

std::string version_string() {
#ifdef QUOTASWAP_VERSION
  return std::string("quotaswap ") + QUOTASWAP_VERSION;
#else
  return "quotaswap 0.1.0";
#endif
}

std::vector<std::string> collect_args(int argc, char **argv) {
  std::vector<std::string> out;
  out.reserve(static_cast<std::size_t>(argc));
  for (int i = 0; i < argc; ++i) {
    out.emplace_back(argv[i]);
  }
  return out;
}

bool take_option(std::vector<std::string> &args, const std::string &name, std::string &out_value) {
  for (std::size_t i = 0; i < args.size(); ++i) {
    if (args[i] == name) {
      if (i + 1 >= args.size()) {
        return false;
      }
      out_value = args[i + 1];
      args.erase(args.begin() + static_cast<long>(i), args.begin() + static_cast<long>(i + 2));
      return true;
    }
  }
  return false;
}

bool take_flag(std::vector<std::string> &args, const std::string &name) {
  for (std::size_t i = 0; i < args.size(); ++i) {
    if (args[i] == name) {
      args.erase(args.begin() + static_cast<long>(i));
      return true;
    }
  }
  return false;
}

bool apply_global_options(std::vector<std::string> &args, std::string &error) {
  for (std::size_t i = 0; i < args.size();) {
    if (args[i] == "--config") {
      if (i + 1 >= args.size()) {
        error = "missing value for --config";
        return false;
      }
      config::set_config_path_override(args[i + 1]);
      args.erase(args.begin() + static_cast<long>(i), args.begin() + static_cast<long>(i + 2));
      continue;
    }
    if (common::starts_with(args[i], "--config=")) {
      const auto value = args[i].substr(std::string("--config=").size());
      if (value.empty()) {
        error = "missing value for --config";
        return false;
      }
      config::set_config_path_override(value);
      args.erase(args.begin() + static_cast<long>(i));
      continue;
    }
    ++i;
  }
  return true;
}

std::string usage_text(const std::optional<double> &ratio) {
  if (!ratio.has_value()) {
    return "not checked";
  }
  if (*ratio < 0.0) {
    return "query failed";
  }
  return "used " + pool::format_ratio(*ratio) + ", remaining " +
         pool::format_ratio(std::max(0.0, 1.0 - *ratio));
}

bool confirm_on_terminal(const pool::SwitchPrompt &prompt) {
  std::cout << "Switch to credential " << prompt.id << "?\n";
  std::cout << "  used " << pool::format_ratio(prompt.used_ratio) << ", remaining "
            << pool::format_ratio(prompt.remaining_ratio) << "\n";
  std::cout << "Proceed? [y/N] " << std::flush;
  std::string answer;
  if (!std::getline(std::cin, answer)) {
    return false;
  }
  answer = common::to_lower(common::trim(answer));
  return answer == "y" || answer == "yes";
}

void print_event(const monitor::CoordinatorEvent &event) {
  std::visit(
      [](auto &&evt) {
        using T = std::decay_t<decltype(evt)>;
        if constexpr (std::is_same_v<T, monitor::ActiveChecked>) {
          if (!evt.has_active) {
            std::cout << "No active credential.\n";
            return;
          }
          std::cout << "Active " << evt.id << " [" << evt.fingerprint
                    << "]: " << usage_text(evt.ratio) << (evt.refreshed ? " (tokens refreshed)" : "")
                    << "\n";
          if (evt.quota_alert) {
            std::cerr << "\n!!! Quota for the active credential is nearly exhausted ("
                      << pool::format_ratio(evt.ratio) << " used). Switch credentials soon. !!!\n\n";
          }
        } else if constexpr (std::is_same_v<T, monitor::PoolChecked>) {
          for (const auto &result : evt.results) {
            std::cout << "  " << std::left << std::setw(16) << result.id << std::setw(10)
                      << pool::status_to_string(result.status) << usage_text(result.ratio) << "\n";
          }
          for (const auto &id : evt.missing) {
            std::cout << "  " << std::left << std::setw(16) << id << "not in the pool\n";
          }
          std::cout << "Checked " << evt.results.size() << " credential(s).\n";
        } else if constexpr (std::is_same_v<T, monitor::SwitchFinished>) {
          if (evt.result.ok()) {
            std::cout << evt.result.message << "\n";
          } else if (evt.automatic && evt.result.outcome == pool::SwitchOutcome::NoneAvailable) {
            std::cerr << "Automatic failover: no usable backup credential.\n";
          } else {
            std::cerr << (evt.automatic ? "Automatic failover failed: " : "Switch failed: ")
                      << evt.result.message << "\n";
          }
        } else if constexpr (std::is_same_v<T, monitor::OperationFailed>) {
          std::cerr << monitor::operation_to_string(evt.operation) << " error: " << evt.message
                    << "\n";
        }
      },
      event);
}

int drain_and_print(monitor::Coordinator &coordinator) {
  coordinator.wait_idle();
  int exit_code = 0;
  for (const auto &event : coordinator.drain_events()) {
    print_event(event);
    if (const auto *finished = std::get_if<monitor::SwitchFinished>(&event);
        finished != nullptr && !finished->result.ok()) {
      exit_code = 1;
    }
    if (std::holds_alternative<monitor::OperationFailed>(event)) {
      exit_code = 1;
    }
  }
  return exit_code;
}

/// Load config, install logging and reconcile the Active credential with the pool.
common::Result<runtime::RuntimeContext> prepare_context() {
  auto context = runtime::RuntimeContext::from_disk();
  if (!context.ok()) {
    return context;
  }
  context.value().install_observer();

  const auto reconciled = pool::reconcile_on_start(*context.value().store());
  if (!reconciled.ok()) {
    return common::Result<runtime::RuntimeContext>::failure(reconciled.error());
  }
  if (reconciled.value().id_assigned) {
    std::cout << "Assigned id " << reconciled.value().active_id
              << " to the active credential.\n";
  }
  return context;
}

int run_status() {
  auto context = prepare_context();
  if (!context.ok()) {
    std::cerr << context.error() << "\n";
    return 1;
  }
  auto &ctx = context.value();
  const auto store = ctx.store();
  const auto active = store->load_active();
  const auto reserve = store->load_reserve();

  if (active.has_value()) {
    std::cout << "Active: " << active->id << " ["
              << security::token_fingerprint(active->access_token, active->refresh_token)
              << "]\n";
  } else {
    std::cout << "Active: none\n";
  }
  std::cout << "Pool: " << reserve.size() << " credential(s)\n";
  std::cout << "Active document: " << store->active_path().string() << "\n";
  std::cout << "Pool document: " << store->reserve_path().string() << "\n";
  if (const auto owner = daemon::PidFile::live_owner(ctx.config().store.lock_path);
      owner.has_value()) {
    std::cout << "Watcher: running (pid " << *owner << ")\n";
  } else {
    std::cout << "Watcher: not running\n";
  }
  return 0;
}

int run_list() {
  auto context = prepare_context();
  if (!context.ok()) {
    std::cerr << context.error() << "\n";
    return 1;
  }
  const auto reserve = context.value().store()->load_reserve();
  if (reserve.empty()) {
    std::cout << "The pool is empty.\n";
    return 0;
  }

  std::cout << std::left << std::setw(5) << "#" << std::setw(16) << "ID" << std::setw(14)
            << "FINGERPRINT" << std::setw(11) << "STATUS" << "USAGE\n";
  for (std::size_t i = 0; i < reserve.size(); ++i) {
    const auto &entry = reserve[i];
    std::cout << std::left << std::setw(5) << i + 1 << std::setw(16) << entry.id << std::setw(14)
              << security::token_fingerprint(entry.access_token, entry.refresh_token)
              << std::setw(11) << pool::status_to_string(entry.status) << usage_text(entry.ratio)
              << "\n";
  }
  return 0;
}

int run_import(std::vector<std::string> args) {
  auto context = prepare_context();
  if (!context.ok()) {
    std::cerr << context.error() << "\n";
    return 1;
  }

  std::string text;
  if (!args.empty() && args[0] != "-") {
    const auto content = common::read_file(args[0]);
    if (!content.ok()) {
      std::cerr << content.error() << "\n";
      return 1;
    }
    text = content.value();
  } else {
    std::ostringstream buffer;
    buffer << std::cin.rdbuf();
    text = buffer.str();
  }

  const auto imported = pool::import_lines(*context.value().store(), pool::split_lines(text));
  if (!imported.ok()) {
    std::cerr << imported.error() << "\n";
    return 1;
  }
  const auto &summary = imported.value();
  std::cout << "Imported " << summary.added << " credential(s)";
  if (summary.skipped > 0) {
    std::cout << ", skipped " << summary.skipped << " duplicate(s)";
  }
  if (summary.ignored > 0) {
    std::cout << ", ignored " << summary.ignored << " malformed line(s)";
  }
  std::cout << ".\n";
  return 0;
}

int run_delete(std::vector<std::string> args) {
  if (args.empty()) {
    std::cerr << "usage: quotaswap delete ID...\n";
    return 1;
  }
  auto context = prepare_context();
  if (!context.ok()) {
    std::cerr << context.error() << "\n";
    return 1;
  }
  const auto removed = pool::delete_entries(*context.value().store(), args);
  if (!removed.ok()) {
    std::cerr << removed.error() << "\n";
    return 1;
  }
  std::cout << "Deleted " << removed.value() << " credential(s).\n";
  return removed.value() == args.size() ? 0 : 1;
}

int run_check(std::vector<std::string> args) {
  auto context = prepare_context();
  if (!context.ok()) {
    std::cerr << context.error() << "\n";
    return 1;
  }
  auto coordinator = context.value().create_coordinator();

  const bool all = take_flag(args, "--all");
  bool admitted = false;
  if (all) {
    admitted = coordinator->check_all();
  } else if (!args.empty()) {
    admitted = coordinator->check_selected(args);
  } else {
    admitted = coordinator->check_active(true);
  }
  if (!admitted) {
    std::cerr << "A check is already running.\n";
    return 1;
  }
  return drain_and_print(*coordinator);
}

int run_switch(std::vector<std::string> args) {
  const bool assume_yes = take_flag(args, "--yes") || take_flag(args, "-y");
  if (args.size() != 1) {
    std::cerr << "usage: quotaswap switch ID [--yes]\n";
    return 1;
  }
  auto context = prepare_context();
  if (!context.ok()) {
    std::cerr << context.error() << "\n";
    return 1;
  }
  auto coordinator = context.value().create_coordinator();
  pool::ConfirmFn confirm = assume_yes ? pool::ConfirmFn([](const pool::SwitchPrompt &) { return true; })
                                       : pool::ConfirmFn(confirm_on_terminal);
  if (!coordinator->switch_to(args[0], std::move(confirm))) {
    std::cerr << "Another switch or a pool check is running.\n";
    return 1;
  }
  return drain_and_print(*coordinator);
}

int run_failover() {
  auto context = prepare_context();
  if (!context.ok()) {
    std::cerr << context.error() << "\n";
    return 1;
  }
  auto coordinator = context.value().create_coordinator();
  if (!coordinator->auto_failover()) {
    std::cerr << "Another switch or a pool check is running.\n";
    return 1;
  }
  return drain_and_print(*coordinator);
}

int run_deactivate() {
  auto context = prepare_context();
  if (!context.ok()) {
    std::cerr << context.error() << "\n";
    return 1;
  }
  const auto demoted = pool::deactivate(*context.value().store());
  if (!demoted.ok()) {
    std::cerr << demoted.error() << "\n";
    return 1;
  }
  std::cout << "Moved credential " << demoted.value() << " back into the pool.\n";
  return 0;
}

int run_watch(std::vector<std::string> args) {
  std::string duration_raw;
  (void)take_option(args, "--duration-secs", duration_raw);
  const bool poll = !take_flag(args, "--no-poll");
  const bool watch_logs = !take_flag(args, "--no-logs");
  const bool deactivate_on_exit = take_flag(args, "--deactivate-on-exit");

  int duration = 0;
  if (!duration_raw.empty()) {
    try {
      duration = std::stoi(duration_raw);
    } catch (const std::exception &) {
      std::cerr << "invalid duration: " << duration_raw << "\n";
      return 1;
    }
  }

  auto loaded = runtime::RuntimeContext::from_disk();
  if (!loaded.ok()) {
    std::cerr << loaded.error() << "\n";
    return 1;
  }
  daemon::PidFile lock(loaded.value().config().store.lock_path);
  if (const auto acquired = lock.acquire(); !acquired.ok()) {
    std::cerr << acquired.error() << "\n";
    return 1;
  }

  auto context = prepare_context();
  if (!context.ok()) {
    std::cerr << context.error() << "\n";
    return 1;
  }
  auto &ctx = context.value();
  auto coordinator = ctx.create_coordinator();
  auto poller = ctx.create_poller(*coordinator);
  auto watcher = ctx.create_log_watcher(*coordinator);

  g_stop_requested = false;
  std::signal(SIGINT, handle_stop_signal);
  std::signal(SIGTERM, handle_stop_signal);

  if (poll) {
    poller->start();
    std::cout << "Checking the active credential every " << ctx.config().monitor.interval_secs
              << "s.\n";
  }
  if (watch_logs) {
    if (const auto started = watcher->start(); !started.ok()) {
      std::cerr << started.error() << "\n";
      poller->stop();
      return 1;
    }
    std::cout << "Watching logs for billing errors.\n";
  }
  std::cout << "Press Ctrl-C to stop.\n";

  const auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(duration);
  while (!g_stop_requested && (duration <= 0 || std::chrono::steady_clock::now() < deadline)) {
    if (const auto event = coordinator->wait_event(EVENT_WAIT); event.has_value()) {
      print_event(*event);
    }
  }

  poller->stop();
  watcher->stop();
  coordinator->wait_idle();
  for (const auto &event : coordinator->drain_events()) {
    print_event(event);
  }

  int exit_code = 0;
  const auto synced = coordinator->shutdown_sync();
  if (!synced.ok()) {
    std::cerr << "shutdown sync failed: " << synced.error() << "\n";
    exit_code = 1;
  } else if (!synced.value().id.empty()) {
    std::cout << "Active " << synced.value().id << ": " << usage_text(synced.value().ratio)
              << (synced.value().pool_updated ? " (pool entry updated)" : "") << "\n";
  }

  if (deactivate_on_exit) {
    const auto demoted = pool::deactivate(*ctx.store());
    if (!demoted.ok()) {
      std::cerr << demoted.error() << "\n";
      exit_code = 1;
    } else {
      std::cout << "Moved credential " << demoted.value() << " back into the pool.\n";
    }
  }

  std::signal(SIGINT, SIG_DFL);
  std::signal(SIGTERM, SIG_DFL);
  return exit_code;
}

} // namespace

void print_help() {
  std::cout << version_string() << "\n\n";
  std::cout << "USAGE\n";
  std::cout << "  quotaswap [--config PATH] <command> [options]\n\n";
  std::cout << "POOL\n";
  std::cout << "  status                     Active credential, pool size, document paths\n";
  std::cout << "  list                       Pool entries with status and usage\n";
  std::cout << "  import [FILE]              Import refreshToken----accessToken lines (stdin when no FILE)\n";
  std::cout << "  delete ID...               Remove pool entries\n";
  std::cout << "  deactivate                 Move the active credential back into the pool\n\n";
  std::cout << "USAGE CHECKS\n";
  std::cout << "  check                      Query the active credential\n";
  std::cout << "  check --all                Query every pool entry\n";
  std::cout << "  check ID...                Query selected pool entries\n\n";
  std::cout << "SWITCHING\n";
  std::cout << "  switch ID [--yes]          Promote a pool entry after confirmation\n";
  std::cout << "  failover                   Promote the best pool entry now\n";
  std::cout << "  watch [--duration-secs N] [--no-poll] [--no-logs] [--deactivate-on-exit]\n";
  std::cout << "                             Poll usage and watch logs, failing over automatically\n\n";
  std::cout << "OTHER\n";
  std::cout << "  config-path                Print the config file location\n";
  std::cout << "  version                    Show version\n";
}

int run_cli(int argc, char **argv) {
  std::vector<std::string> args = collect_args(argc - 1, argv + 1);
  std::string global_error;
  if (!apply_global_options(args, global_error)) {
    std::cerr << global_error << "\n";
    return 1;
  }

  if (args.empty()) {
    print_help();
    return 0;
  }

  const std::string subcommand = args[0];
  args.erase(args.begin());

  if (subcommand == "--help" || subcommand == "-h" || subcommand == "help") {
    print_help();
    return 0;
  }
  if (subcommand == "--version" || subcommand == "-V" || subcommand == "version") {
    std::cout << version_string() << "\n";
    return 0;
  }
  if (subcommand == "config-path") {
    auto path_result = config::config_path();
    if (!path_result.ok()) {
      std::cerr << path_result.error() << "\n";
      return 1;
    }
    std::cout << path_result.value().string() << "\n";
    return 0;
  }
  if (subcommand == "status") {
    return run_status();
  }
  if (subcommand == "list") {
    return run_list();
  }
  if (subcommand == "import") {
    return run_import(std::move(args));
  }
  if (subcommand == "delete") {
    return run_delete(std::move(args));
  }
  if (subcommand == "check") {
    return run_check(std::move(args));
  }
  if (subcommand == "switch") {
    return run_switch(std::move(args));
  }
  if (subcommand == "failover") {
    return run_failover();
  }
  if (subcommand == "deactivate") {
    return run_deactivate();
  }
  if (subcommand == "watch") {
    return run_watch(std::move(args));
  }

  std::cerr << "Unknown command: " << subcommand << "\n";
  print_help();
  return 1;
}

} // namespace quotaswap::cli
