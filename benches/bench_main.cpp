#include <iostream>

void run_code_benchmark();
void run_crypto_benchmark();
void run_store_benchmark();

int main() {
  std::cout << "CouponVault Benchmarks\n";
  run_code_benchmark();
  run_crypto_benchmark();
  run_store_benchmark();
  return 0;
}
