#pragma once

#include <algorithm>
#include <chrono>
#include <cstddef>
#include <cstdlib>
#include <iostream>
#include <string>
#include <vector>

namespace tot_bench {

using clock_type = std::chrono::steady_clock;

template <class T>
inline void keep(const T& v) {
#if defined(_MSC_VER)
  volatile const char* p = reinterpret_cast<const char*>(&v);
  (void)p;
#else
  asm volatile("" : : "g"(v) : "memory");
#endif
}

struct sample {
  double seconds{0.0};
  std::size_t bytes{0};
};

// Runs body() iters times; body returns the bytes it consumed or produced.
template <class Body>
sample time_loop(std::size_t iters, Body&& body) {
  std::size_t bytes = 0;
  const auto start = clock_type::now();
  for (std::size_t i = 0; i < iters; ++i) bytes += body();
  const auto stop = clock_type::now();
  return {std::chrono::duration<double>(stop - start).count(), bytes};
}

template <class Fn>
sample median_of(std::size_t runs, Fn&& fn) {
  if (runs <= 1) return fn();
  std::vector<sample> all;
  all.reserve(runs);
  for (std::size_t r = 0; r < runs; ++r) all.push_back(fn());
  auto mid = all.begin() + static_cast<std::ptrdiff_t>(all.size() / 2);
  std::nth_element(all.begin(), mid, all.end(),
                   [](const sample& a, const sample& b) { return a.seconds < b.seconds; });
  return *mid;
}

inline void report(const char* name, const sample& s) {
  const double mib = static_cast<double>(s.bytes) / (1024.0 * 1024.0);
  std::cout << name << ": " << (s.seconds > 0.0 ? mib / s.seconds : 0.0) << " MiB/s (" << s.seconds << " s)\n";
}

[[noreturn]] inline void die(const char* who, const std::string& what) {
  std::cerr << who << ": " << what << "\n";
  std::exit(1);
}

struct bench_args {
  std::size_t n_objects{2000};
  std::size_t iters{200};
  std::size_t runs{5};
};

// <objects> <iters> <runs>, all optional.
inline bench_args read_args(int argc, char** argv) {
  bench_args a;
  std::size_t* slots[] = {&a.n_objects, &a.iters, &a.runs};
  for (int i = 1; i < argc && i <= 3; ++i) *slots[i - 1] = static_cast<std::size_t>(std::stoull(argv[i]));
  return a;
}

} // namespace tot_bench
