#include <iostream>

void run_config_benchmark();
void run_pool_benchmarks();

int main() {
  std::cout << "quotaswap benchmarks\n";
  run_config_benchmark();
  run_pool_benchmarks();
  return 0;
}
