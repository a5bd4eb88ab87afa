#include <iostream>

void run_scan_benchmark();
void run_sanitize_benchmark();
void run_history_benchmark();
void run_config_benchmark();

int main() {
  std::cout << "textguard benchmarks\n";
  run_scan_benchmark();
  run_sanitize_benchmark();
  run_history_benchmark();
  run_config_benchmark();
  return 0;
}
