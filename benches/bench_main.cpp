#include <iostream>

void run_gate_benchmarks();
void run_worklist_benchmarks();

int main() {
  std::cout << "Warden Benchmarks\n";
  run_gate_benchmarks();
  run_worklist_benchmarks();
  return 0;
}
