/**
 * @file streaming_demo.cpp
 * @brief Streaming demo: a long-lived pool over a lazy input generator.
 *
 * Demonstrates:
 *   - A generator-shaped worker emitting several values per input
 *   - InputSource::FromGenerator read only as fast as results are consumed
 *   - Abandoning an endless stream with Close() (close_if_done = false)
 *   - PoolObserver hooks and PoolStats
 */

#include "pmap/log.hpp"
#include "pmap/pool.hpp"

#include <cstdint>
#include <cstdio>
#include <memory>

// -- Observer ----------------------------------------------------------------

class StateLogger : public pmap::PoolObserver {
 public:
  void OnStateChange(pmap::PoolState from, pmap::PoolState to) override {
    PMAP_LOG_INFO("demo", "pool %s -> %s", pmap::PoolStateName(from), pmap::PoolStateName(to));
  }
  void OnClosed() override { PMAP_LOG_INFO("demo", "pool closed"); }
};

// ---------------------------------------------------------------------------

int main() {
  pmap::log::Init(pmap::log::Level::kInfo);

  // Emits every prime factor of each input.
  auto factorize = pmap::MakeWorker<uint64_t, uint64_t>(
      [](pmap::InputStream<uint64_t>& in, pmap::Emitter<uint64_t>& out) {
        uint64_t n = 0;
        while (in.Next(n)) {
          for (uint64_t p = 2; p * p <= n; ++p) {
            while (n % p == 0U) {
              out.Emit(p);
              n /= p;
            }
          }
          if (n > 1U) out.Emit(n);
        }
      },
      "factorize");

  StateLogger observer;
  pmap::PoolOptions opts;
  opts.chunk_size = 4;
  opts.in_flight_per_worker = 2;
  opts.observer = &observer;

  auto created = pmap::ForkIdentical(factorize, 4, opts);
  if (!created.has_value()) {
    PMAP_LOG_ERROR("demo", "%s", created.get_error().Message().c_str());
    return 1;
  }
  std::unique_ptr<pmap::Pool<uint64_t, uint64_t>> pool = std::move(created.value());

  // An endless generator; only what the consumer asks for gets read.
  auto next = std::make_shared<uint64_t>(1000000000ULL);
  pool->Imap(pmap::InputSource<uint64_t>::FromGenerator([next](uint64_t& out) {
    out = (*next)++;
    return true;
  }));

  auto stream = pool->Ordered(false);
  pmap::ResultItem<uint64_t, uint64_t> item;
  uint64_t last_index = UINT64_MAX;
  for (int taken = 0; taken < 60; ++taken) {
    auto r = stream.Next(item);
    if (!r.has_value() || !r.value()) break;
    if (item.index != last_index) {
      std::printf("\ninput #%llu:", static_cast<unsigned long long>(item.index));
      last_index = item.index;
    }
    std::printf(" %llu", static_cast<unsigned long long>(item.value));
  }
  std::printf("\nread %llu inputs (lookahead bound %llu)\n",
              static_cast<unsigned long long>(pool->Stats().inputs_read),
              static_cast<unsigned long long>(pool->MaxLookahead()));

  // The generator never ends; stop here.
  auto drained = pool->Close();
  if (!drained.has_value()) {
    PMAP_LOG_WARN("demo", "%s", drained.get_error().Message().c_str());
  }

  const pmap::PoolStats& s = pool->Stats();
  PMAP_LOG_INFO("demo", "batches=%llu frames=%llu completed=%llu",
                static_cast<unsigned long long>(s.batches_sent),
                static_cast<unsigned long long>(s.frames_received),
                static_cast<unsigned long long>(s.items_completed));

  pmap::log::Shutdown();
  return 0;
}
