#pragma once
#include <chrono>
#include <cstdint>
#include <iomanip>
#include <iostream>
#include <random>
#include <string>
#include <vector>

namespace bench {

// High precision timer
class Timer {
public:
  using clock = std::chrono::high_resolution_clock;
  using time_point = clock::time_point;

  void start() { start_ = clock::now(); }

  double elapsed_ns() const {
    auto end = clock::now();
    return std::chrono::duration<double, std::nano>(end - start_).count();
  }

  double elapsed_us() const { return elapsed_ns() / 1000.0; }

  double elapsed_ms() const { return elapsed_ns() / 1000000.0; }

private:
  time_point start_;
};

// Benchmark result
struct Result {
  std::string library;
  double ns_per_number;
  double mb_per_s;
  bool correctness_check;

  void print() const {
    std::cout << std::left << std::setw(20) << library
              << " | " << std::right << std::setw(9) << std::fixed
              << std::setprecision(2) << ns_per_number << " ns/number"
              << " | " << std::setw(9) << mb_per_s << " MB/s"
              << " | " << (correctness_check ? "PASS" : "FAIL") << "\n";
  }
};

// Number literals in the mix a real document has: mostly small integers,
// some decimals, a few exponents and 64-bit edge values.
inline std::vector<std::string> make_corpus(size_t n, uint32_t seed = 42) {
  std::mt19937_64 rng(seed);
  std::vector<std::string> out;
  out.reserve(n);
  for (size_t i = 0; i < n; ++i) {
    switch (rng() % 8) {
    case 0:
    case 1:
    case 2:
      out.push_back(std::to_string(static_cast<int64_t>(rng() % 100000)));
      break;
    case 3:
      out.push_back(std::to_string(-static_cast<int64_t>(rng() % 1000000000)));
      break;
    case 4:
      out.push_back(std::to_string(rng() % 1000) + "." +
                    std::to_string(rng() % 1000000));
      break;
    case 5:
      out.push_back("-" + std::to_string(rng() % 10) + "." +
                    std::to_string(rng() % 1000) + "e" +
                    std::to_string(static_cast<int>(rng() % 40) - 20));
      break;
    case 6:
      out.push_back(std::to_string(rng())); // often above INT64_MAX
      break;
    default:
      out.push_back(std::to_string(static_cast<int64_t>(rng() >> 1)));
      break;
    }
  }
  return out;
}

inline size_t corpus_bytes(const std::vector<std::string> &corpus) {
  size_t total = 0;
  for (const auto &s : corpus)
    total += s.size();
  return total;
}

// Print header
inline void print_header(const std::string &benchmark_name) {
  std::cout << "\n=== " << benchmark_name << " ===\n";
  std::cout << std::string(80, '-') << "\n";
}

// Print table header
inline void print_table_header() {
  std::cout << std::left << std::setw(20) << "Library" << " | Timings\n";
  std::cout << std::string(80, '-') << "\n";
}

} // namespace bench
