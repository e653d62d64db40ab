#pragma once

namespace quotaswap::cli {

/// Entry point for the `quotaswap` executable. Returns the process exit code.
int run_cli(int argc, char **argv);

void print_help();

} // namespace quotaswap::cli
