/**
 * @file test_sugar.cpp
 * @brief Tests for sugar.hpp: ImapOrdered, ImapUnordered, ImapOrderedChunked
 *        and Collect.
 */

#include "pmap/sugar.hpp"

#include <catch2/catch_test_macros.hpp>

#include <algorithm>
#include <stdexcept>
#include <string>
#include <vector>

#include <unistd.h>

namespace {

struct PrintCounter {
  int calls = 0;
  std::string last;

  static void Hook(const pmap::ErrorEnvelope& env, void* ctx) {
    auto* self = static_cast<PrintCounter*>(ctx);
    ++self->calls;
    self->last = env.Summary();
  }
};

int CheckedValue(const int& x) {
  if (x == 3) throw std::invalid_argument("Bad value: " + std::to_string(x));
  return x;
}

std::vector<int> Squares(int n) {
  std::vector<int> v;
  for (int i = 0; i < n; ++i) v.push_back(i * i);
  return v;
}

std::vector<int> Range(int n) {
  std::vector<int> v;
  for (int i = 0; i < n; ++i) v.push_back(i);
  return v;
}

}  // namespace

// ============================================================================
// Results
// ============================================================================

TEST_CASE("ImapOrdered returns values in input order", "[sugar]") {
  auto mapped = pmap::ImapOrdered<int>([](const int& x) { return x * x; }, Range(100), 4);
  REQUIRE(mapped.has_value());
  auto all = pmap::Collect(mapped.value());
  REQUIRE(all.has_value());
  REQUIRE(all.value() == Squares(100));
  REQUIRE(mapped.value().GetPool().State() == pmap::PoolState::kClosed);
}

TEST_CASE("ImapOrdered with the default worker count", "[sugar]") {
  auto mapped = pmap::ImapOrdered<int>([](const int& x) { return x * x; }, Range(20));
  REQUIRE(mapped.has_value());
  REQUIRE(mapped.value().GetPool().WorkerCount() == pmap::DefaultWorkerCount());
  auto all = pmap::Collect(mapped.value());
  REQUIRE(all.has_value());
  REQUIRE(all.value() == Squares(20));
}

TEST_CASE("ImapUnordered returns every value", "[sugar]") {
  pmap::PoolOptions opts;
  opts.num_workers = 3;
  auto mapped = pmap::ImapUnordered<int>([](const int& x) { return x * x; }, Range(100), opts);
  REQUIRE(mapped.has_value());
  REQUIRE(mapped.value().GetPool().WorkerCount() == 3U);

  auto all = pmap::Collect(mapped.value());
  REQUIRE(all.has_value());
  std::vector<int> sorted = all.value();
  std::sort(sorted.begin(), sorted.end());
  REQUIRE(sorted == Squares(100));
}

TEST_CASE("ImapOrderedChunked keeps order across chunks", "[sugar]") {
  auto mapped =
      pmap::ImapOrderedChunked<int>([](const int& x) { return x * x; }, Range(101), 3, 5);
  REQUIRE(mapped.has_value());
  REQUIRE(mapped.value().GetPool().ChunkSize() == 5U);
  auto all = pmap::Collect(mapped.value());
  REQUIRE(all.has_value());
  REQUIRE(all.value() == Squares(101));
}

TEST_CASE("Extra arguments are bound by capture", "[sugar]") {
  const int offset = 1000;
  const std::string tag = "id-";
  auto mapped = pmap::ImapOrdered<std::string>(
      [offset, tag](const int& x) { return tag + std::to_string(x + offset); }, Range(3), 2);
  REQUIRE(mapped.has_value());
  auto all = pmap::Collect(mapped.value());
  REQUIRE(all.has_value());
  REQUIRE(all.value() == std::vector<std::string>{"id-1000", "id-1001", "id-1002"});
}

TEST_CASE("Sugar accepts a lazy InputSource", "[sugar]") {
  auto mapped = pmap::ImapOrdered<int>([](const int& x) { return -x; },
                                       pmap::InputSource<int>::FromRange(0, 5), 2);
  REQUIRE(mapped.has_value());

  pmap::ResultItem<int, int> item;
  std::vector<uint64_t> indices;
  for (auto r = mapped.value().Next(item); r.has_value() && r.value();
       r = mapped.value().Next(item)) {
    REQUIRE(item.value == -static_cast<int>(item.index));
    indices.push_back(item.index);
  }
  REQUIRE(indices == std::vector<uint64_t>{0, 1, 2, 3, 4});
}

TEST_CASE("Empty input yields nothing", "[sugar]") {
  auto mapped = pmap::ImapUnordered<int>([](const int& x) { return x; }, std::vector<int>{});
  REQUIRE(mapped.has_value());
  auto all = pmap::Collect(mapped.value());
  REQUIRE(all.has_value());
  REQUIRE(all.value().empty());
}

TEST_CASE("Values are computed in other processes", "[sugar]") {
  const int self = static_cast<int>(::getpid());
  auto mapped =
      pmap::ImapUnordered<int>([](const int&) { return static_cast<int>(::getpid()); }, Range(8));
  REQUIRE(mapped.has_value());
  auto all = pmap::Collect(mapped.value());
  REQUIRE(all.has_value());
  for (int pid : all.value()) REQUIRE(pid != self);
}

TEST_CASE("Collect over a pool ResultStream", "[sugar]") {
  auto pool = pmap::ForkIdentical(pmap::MapWorker<std::string, size_t>(
                                      [](const std::string& s) { return s.size(); }),
                                  2);
  REQUIRE(pool.has_value());
  auto stream = pool.value()
                    ->Imap(pmap::InputSource<std::string>::FromContainer(
                        std::vector<std::string>{"a", "bb", "", "dddd"}))
                    .Ordered();
  auto sizes = pmap::Collect(stream);
  REQUIRE(sizes.has_value());
  REQUIRE(sizes.value() == std::vector<size_t>{1, 2, 0, 4});
}

// ============================================================================
// Failures
// ============================================================================

TEST_CASE("Worker exception surfaces from every entry point", "[sugar]") {
  const std::vector<int> inputs = {0, 3, 0};

  SECTION("ImapUnordered") {
    PrintCounter printer;
    pmap::PoolOptions opts;
    opts.num_workers = 2;
    opts.exception_printer = &PrintCounter::Hook;
    opts.exception_printer_ctx = &printer;
    auto mapped = pmap::ImapUnordered<int>(&CheckedValue, inputs, opts);
    REQUIRE(mapped.has_value());
    auto all = pmap::Collect(mapped.value());
    REQUIRE_FALSE(all.has_value());
    REQUIRE(all.get_error().code == pmap::PoolError::kWorkerException);
    REQUIRE(all.get_error().detail == "std::invalid_argument: Bad value: 3");
    REQUIRE(printer.calls == 1);
  }

  SECTION("ImapOrdered") {
    PrintCounter printer;
    pmap::PoolOptions opts;
    opts.exception_printer = &PrintCounter::Hook;
    opts.exception_printer_ctx = &printer;
    auto mapped = pmap::ImapOrdered<int>(&CheckedValue, inputs, 2, opts);
    REQUIRE(mapped.has_value());

    int first = -1;
    auto r = mapped.value().Next(first);
    REQUIRE(r.has_value());
    REQUIRE(first == 0);
    r = mapped.value().Next(first);
    REQUIRE_FALSE(r.has_value());
    REQUIRE(r.get_error().detail == "std::invalid_argument: Bad value: 3");
    REQUIRE(printer.calls == 1);
    REQUIRE(printer.last == "std::invalid_argument: Bad value: 3");
    REQUIRE(mapped.value().GetPool().State() == pmap::PoolState::kClosed);
  }

  SECTION("ImapOrderedChunked") {
    PrintCounter printer;
    pmap::PoolOptions opts;
    opts.exception_printer = &PrintCounter::Hook;
    opts.exception_printer_ctx = &printer;
    auto mapped = pmap::ImapOrderedChunked<int>(&CheckedValue, inputs, 2, 2, opts);
    REQUIRE(mapped.has_value());
    auto all = pmap::Collect(mapped.value());
    REQUIRE_FALSE(all.has_value());
    REQUIRE(all.get_error().IsWorkerException());
    REQUIRE(all.get_error().envelope->sequence_index == 1U);
    REQUIRE(printer.calls == 1);
  }
}

TEST_CASE("Zero chunk size is rejected", "[sugar]") {
  auto mapped = pmap::ImapOrderedChunked<int>([](const int& x) { return x; }, Range(4), 2, 0);
  REQUIRE_FALSE(mapped.has_value());
  REQUIRE(mapped.get_error().code == pmap::PoolError::kInvalidArgument);
}
