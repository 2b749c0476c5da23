/**
 * @file test_performance.cpp
 * @brief Speedup checks. Hidden by default; run with the [.performance] tag.
 */

#include "pmap/sugar.hpp"

#include <catch2/catch_test_macros.hpp>

#include <cstdint>
#include <string>
#include <vector>

#include <time.h>

namespace {

// Factorial modulo a prime, computed the slow way.
uint64_t SlowFactorial(const int& n) {
  uint64_t acc = 1;
  for (int round = 0; round < 50; ++round) {
    acc = 1;
    for (int i = 2; i <= n; ++i) acc = (acc * static_cast<uint64_t>(i)) % 1000000007ULL;
  }
  return acc;
}

int SleepThenEcho(const int& ms) {
  struct timespec ts = {0, static_cast<long>(ms) * 1000000L};
  nanosleep(&ts, nullptr);
  return ms;
}

template <typename Fn>
uint64_t TimeMs(Fn&& fn) {
  const uint64_t start = pmap::SteadyNowMs();
  fn();
  return pmap::SteadyNowMs() - start;
}

}  // namespace

TEST_CASE("perf - factorial speeds up with workers", "[.performance]") {
  const uint32_t workers = pmap::DefaultWorkerCount();
  if (workers < 4U) {
    WARN("fewer than 4 CPUs, skipping");
    return;
  }
  std::vector<int> inputs(64, 200000);

  uint64_t serial_result = 0;
  const uint64_t serial_ms = TimeMs([&] {
    for (int n : inputs) serial_result ^= SlowFactorial(n);
  });

  uint64_t parallel_result = 0;
  const uint64_t parallel_ms = TimeMs([&] {
    auto mapped = pmap::ImapUnordered<uint64_t>(&SlowFactorial, inputs);
    REQUIRE(mapped.has_value());
    auto all = pmap::Collect(mapped.value());
    REQUIRE(all.has_value());
    for (uint64_t v : all.value()) parallel_result ^= v;
  });

  WARN("serial " << serial_ms << " ms, " << workers << " workers " << parallel_ms << " ms");
  REQUIRE(parallel_result == serial_result);
  REQUIRE(parallel_ms * 2U < serial_ms);
}

TEST_CASE("perf - sleeping workers overlap", "[.performance]") {
  std::vector<int> inputs(16, 100);
  const uint64_t ms = TimeMs([&] {
    auto mapped = pmap::ImapOrdered<int>(&SleepThenEcho, inputs, 16);
    REQUIRE(mapped.has_value());
    auto all = pmap::Collect(mapped.value());
    REQUIRE(all.has_value());
    REQUIRE(all.value().size() == 16U);
  });
  WARN("16 x 100 ms sleeps took " << ms << " ms");
  REQUIRE(ms < 800U);
}

TEST_CASE("perf - many small string items", "[.performance]") {
  std::vector<std::string> inputs;
  for (int i = 0; i < 100000; ++i) inputs.push_back(std::string(static_cast<size_t>(i % 64), 'x'));

  pmap::expected<std::vector<size_t>, pmap::PoolFailure> lengths =
      pmap::expected<std::vector<size_t>, pmap::PoolFailure>::success(std::vector<size_t>());
  const uint64_t ms = TimeMs([&] {
    auto mapped = pmap::ImapOrderedChunked<size_t>([](const std::string& s) { return s.size(); },
                                                   inputs, 4, 256);
    REQUIRE(mapped.has_value());
    lengths = pmap::Collect(mapped.value());
  });
  WARN("100000 strings in chunks of 256 took " << ms << " ms");
  REQUIRE(lengths.has_value());
  REQUIRE(lengths.value().size() == inputs.size());
  REQUIRE(lengths.value()[63] == 63U);
}
