/**
 * MIT License
 *
 * Copyright (c) 2024 liudegui
 *
 * Permission is hereby granted, free of charge, to any person obtaining a copy
 * of this software and associated documentation files (the "Software"), to deal
 * in the Software without restriction, including without limitation the rights
 * to use, copy, modify, merge, publish, distribute, sublicense, and/or sell
 * copies of the Software, and to permit persons to whom the Software is
 * furnished to do so, subject to the following conditions:
 *
 * The above copyright notice and this permission notice shall be included in all
 * copies or substantial portions of the Software.
 *
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR
 * IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY,
 * FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE
 * AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER
 * LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM,
 * OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE
 * SOFTWARE.
 */

/**
 * @file sugar.hpp
 * @brief One-call parallel map over a container.
 *
 * @code
 *   auto squares = pmap::ImapOrdered<int>([](const int& x) { return x * x; },
 *                                         std::vector<int>{1, 2, 3}, 4);
 *   if (squares.has_value()) {
 *     auto all = pmap::Collect(squares.value());
 *   }
 * @endcode
 *
 * Each call builds a pool of identical MapWorker units, feeds it the inputs
 * and returns a MappedStream owning both the pool and its result stream.
 * The pool closes when the stream is exhausted, fails or is destroyed.
 * Extra arguments are bound through lambda capture.
 */

#ifndef PMAP_SUGAR_HPP_
#define PMAP_SUGAR_HPP_

#include "pmap/options.hpp"
#include "pmap/pool.hpp"
#include "pmap/worker.hpp"

#include <memory>
#include <type_traits>
#include <utility>
#include <vector>

namespace pmap {

// ============================================================================
// MappedStream
// ============================================================================

template <typename In, typename Out>
class MappedStream {
 public:
  MappedStream(std::unique_ptr<Pool<In, Out>> pool, ResultStream<In, Out> stream)
      : pool_(std::move(pool)), stream_(stream) {}

  MappedStream(MappedStream&&) noexcept = default;
  MappedStream& operator=(MappedStream&&) noexcept = default;

  /// @brief Next value only.
  expected<bool, PoolFailure> Next(Out& out) {
    ResultItem<In, Out> item;
    auto r = stream_.Next(item);
    if (r.has_value() && r.value()) out = std::move(item.value);
    return r;
  }

  expected<bool, PoolFailure> Next(ResultItem<In, Out>& item) { return stream_.Next(item); }

  Pool<In, Out>& GetPool() noexcept { return *pool_; }

 private:
  std::unique_ptr<Pool<In, Out>> pool_;
  ResultStream<In, Out> stream_;
};

namespace detail {

template <typename Inputs>
struct InputsTraits {
  using Value = typename std::decay_t<Inputs>::value_type;
  static InputSource<Value> Make(Inputs inputs) {
    return InputSource<Value>::FromContainer(std::move(inputs));
  }
};

template <typename In>
struct InputsTraits<InputSource<In>> {
  using Value = In;
  static InputSource<In> Make(InputSource<In> inputs) { return inputs; }
};

template <typename Out, typename Fn, typename Inputs>
auto StartMapped(Fn&& fn, Inputs inputs, uint32_t num_workers, uint32_t chunk_size,
                 StreamMode mode, PoolOptions opts)
    -> expected<MappedStream<typename InputsTraits<Inputs>::Value, Out>, PoolFailure> {
  using In = typename InputsTraits<Inputs>::Value;
  using Result = expected<MappedStream<In, Out>, PoolFailure>;

  opts.chunk_size = chunk_size;
  if (num_workers == 0U) num_workers = DefaultWorkerCount();

  auto created = ForkIdentical(MapWorker<In, Out>(std::forward<Fn>(fn)), num_workers, opts);
  if (!created.has_value()) return Result::error(created.get_error());

  std::unique_ptr<Pool<In, Out>> pool = std::move(created.value());
  pool->Imap(InputsTraits<Inputs>::Make(std::move(inputs)));
  ResultStream<In, Out> stream =
      (mode == StreamMode::kOrdered) ? pool->Ordered() : pool->Unordered();
  return Result::success(MappedStream<In, Out>(std::move(pool), stream));
}

}  // namespace detail

// ============================================================================
// Entry points
// ============================================================================

/**
 * @brief Map @p fn over @p inputs, yielding results as they arrive.
 *
 * Worker count is opts.num_workers, or the CPU count when 0.
 */
template <typename Out, typename Fn, typename Inputs>
auto ImapUnordered(Fn&& fn, Inputs inputs, const PoolOptions& opts = PoolOptions()) {
  return detail::StartMapped<Out>(std::forward<Fn>(fn), std::move(inputs), opts.num_workers,
                                  1U, StreamMode::kUnordered, opts);
}

/// @brief Map @p fn over @p inputs, yielding results in input order.
template <typename Out, typename Fn, typename Inputs>
auto ImapOrdered(Fn&& fn, Inputs inputs, uint32_t num_workers = 0U,
                 const PoolOptions& opts = PoolOptions()) {
  return detail::StartMapped<Out>(std::forward<Fn>(fn), std::move(inputs), num_workers, 1U,
                                  StreamMode::kOrdered, opts);
}

/**
 * @brief As ImapOrdered(), sending @p chunk_size consecutive inputs to one
 *        worker at a time.
 */
template <typename Out, typename Fn, typename Inputs>
auto ImapOrderedChunked(Fn&& fn, Inputs inputs, uint32_t num_workers, uint32_t chunk_size,
                        const PoolOptions& opts = PoolOptions()) {
  return detail::StartMapped<Out>(std::forward<Fn>(fn), std::move(inputs), num_workers,
                                  chunk_size, StreamMode::kOrdered, opts);
}

// ============================================================================
// Collect
// ============================================================================

template <typename In, typename Out>
expected<std::vector<Out>, PoolFailure> Collect(MappedStream<In, Out>& stream) {
  std::vector<Out> values;
  Out v{};
  for (;;) {
    auto r = stream.Next(v);
    if (!r.has_value()) return expected<std::vector<Out>, PoolFailure>::error(r.get_error());
    if (!r.value()) break;
    values.push_back(std::move(v));
  }
  return expected<std::vector<Out>, PoolFailure>::success(std::move(values));
}

template <typename In, typename Out>
expected<std::vector<Out>, PoolFailure> Collect(ResultStream<In, Out>& stream) {
  std::vector<Out> values;
  ResultItem<In, Out> item;
  for (;;) {
    auto r = stream.Next(item);
    if (!r.has_value()) return expected<std::vector<Out>, PoolFailure>::error(r.get_error());
    if (!r.value()) break;
    values.push_back(std::move(item.value));
  }
  return expected<std::vector<Out>, PoolFailure>::success(std::move(values));
}

}  // namespace pmap

#endif  // PMAP_SUGAR_HPP_
