/**
 * @file basic_demo.cpp
 * @brief Basic demo of the one-call parallel map functions.
 *
 * Demonstrates:
 *   - ImapOrdered over a std::vector, collected in input order
 *   - ImapUnordered consumed item by item as results arrive
 *   - Binding extra arguments through lambda capture
 *   - A worker exception surfacing as a PoolFailure
 */

#include "pmap/log.hpp"
#include "pmap/sugar.hpp"

#include <cstdint>
#include <cstdio>
#include <stdexcept>
#include <string>
#include <vector>

#include <unistd.h>

// -- Transformations ---------------------------------------------------------

static uint64_t Collatz(const int& start) {
  uint64_t n = static_cast<uint64_t>(start);
  uint64_t steps = 0;
  while (n > 1U) {
    n = (n % 2U == 0U) ? n / 2U : 3U * n + 1U;
    ++steps;
  }
  return steps;
}

static int Checked(const int& x) {
  if (x == 3) throw std::invalid_argument("Bad value: " + std::to_string(x));
  return x;
}

// ---------------------------------------------------------------------------

int main() {
  pmap::log::Init(pmap::log::Level::kInfo);

  std::vector<int> inputs;
  for (int i = 1; i <= 20; ++i) inputs.push_back(i * 1000 + 1);

  // Ordered: results line up with inputs.
  auto ordered = pmap::ImapOrdered<uint64_t>(&Collatz, inputs, 4);
  if (!ordered.has_value()) {
    PMAP_LOG_ERROR("demo", "pool: %s", ordered.get_error().Message().c_str());
    return 1;
  }
  auto steps = pmap::Collect(ordered.value());
  if (!steps.has_value()) {
    PMAP_LOG_ERROR("demo", "map: %s", steps.get_error().Message().c_str());
    return 1;
  }
  for (size_t i = 0; i < inputs.size(); ++i) {
    std::printf("collatz(%d) = %llu\n", inputs[i],
                static_cast<unsigned long long>(steps.value()[i]));
  }

  // Unordered: results as they arrive, each tagged with its input index.
  const std::string prefix = "item-";
  pmap::PoolOptions opts;
  opts.num_workers = 3;
  auto tagged = pmap::ImapUnordered<std::string>(
      [prefix](const int& x) { return prefix + std::to_string(x) + "@" + std::to_string(getpid()); },
      std::vector<int>{1, 2, 3, 4, 5, 6}, opts);
  if (!tagged.has_value()) return 1;

  pmap::ResultItem<int, std::string> item;
  for (auto r = tagged.value().Next(item); r.has_value() && r.value();
       r = tagged.value().Next(item)) {
    std::printf("#%llu -> %s\n", static_cast<unsigned long long>(item.index),
                item.value.c_str());
  }

  // A throwing transformation ends the stream with the worker's exception.
  auto failing = pmap::ImapOrdered<int>(&Checked, std::vector<int>{0, 3, 0}, 2);
  if (!failing.has_value()) return 1;
  auto all = pmap::Collect(failing.value());
  if (!all.has_value()) {
    std::printf("failed as expected: %s\n", all.get_error().detail.c_str());
  }

  pmap::log::Shutdown();
  return 0;
}
