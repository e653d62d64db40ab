#include "test_framework.hpp"
#include "tests/helpers/test_helpers.hpp"

#include "quotaswap/daemon/pid_file.hpp"

#include <unistd.h>

void register_daemon_tests(std::vector<quotaswap::tests::TestCase> &tests) {
  using quotaswap::tests::require;
  namespace qt = quotaswap::testing;
  using quotaswap::daemon::PidFile;

  tests.push_back({"pid_file_acquire_and_release", [] {
                     qt::TempWorkspace ws;
                     const auto path = ws.path() / "run" / "quotaswap.pid";
                     {
                       PidFile lock(path);
                       require(lock.acquire().ok(), "acquire failed");
                       require(lock.held(), "lock should be held");
                       require(std::filesystem::exists(path), "pid file missing");
                       const auto owner = PidFile::live_owner(path);
                       require(owner.has_value() && *owner == static_cast<int>(getpid()),
                               "pid file should name this process");
                     }
                     require(!std::filesystem::exists(path), "destructor should remove pid file");
                   }});

  tests.push_back({"pid_file_refuses_live_owner", [] {
                     qt::TempWorkspace ws;
                     const auto path = ws.path() / "quotaswap.pid";
                     PidFile first(path);
                     require(first.acquire().ok(), "first acquire failed");

                     PidFile second(path);
                     const auto status = second.acquire();
                     require(!status.ok(), "second instance should be refused");
                     require(status.error().find("another quotaswap instance") != std::string::npos,
                             "unexpected error: " + status.error());
                     require(!second.held(), "refused lock must not be held");
                   }});

  tests.push_back({"pid_file_takes_over_stale_file", [] {
                     qt::TempWorkspace ws;
                     ws.create_file("quotaswap.pid", "2147483646\n");
                     PidFile lock(ws.path() / "quotaswap.pid");
                     require(lock.acquire().ok(), "stale lock should be taken over");
                     require(ws.read("quotaswap.pid") == std::to_string(getpid()) + "\n",
                             "pid file not rewritten");
                   }});

  tests.push_back({"pid_file_process_probe", [] {
                     require(PidFile::is_process_running(static_cast<int>(getpid())),
                             "own process should be running");
                     require(!PidFile::is_process_running(0), "pid 0 is not a process");
                     require(!PidFile::is_process_running(-5), "negative pid");
                   }});
}
