#include "quotaswap/cli/commands.hpp"

int main(int argc, char **argv) { return quotaswap::cli::run_cli(argc, argv); }
