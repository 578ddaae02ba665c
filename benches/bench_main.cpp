#include <iostream>

void run_sanitize_benchmark();
void run_config_benchmark();

int main() {
  std::cout << "Scrubline Benchmarks\n";
  run_sanitize_benchmark();
  run_config_benchmark();
  return 0;
}
