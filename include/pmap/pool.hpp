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
 * @file pool.hpp
 * @brief Pool coordinator: forks workers, feeds them inputs, reassembles
 *        results and tears everything down exactly once.
 *
 * Ownership: the pool exclusively owns every worker process and channel.
 * All coordination happens on the caller's thread, inside
 * ResultStream::Next(), BlockIgnoreOutput() and Close().
 *
 * @code
 *   auto worker = pmap::MapWorker<int, int>([](const int& x) { return 2 * x; });
 *   auto pool = pmap::ForkIdentical(worker, 4);
 *   if (!pool.has_value()) return;
 *   auto stream = pool.value()->Imap(pmap::InputSource<int>::FromRange(0, 100)).Ordered();
 *   pmap::ResultItem<int, int> item;
 *   for (auto r = stream.Next(item); r.has_value() && r.value(); r = stream.Next(item)) {
 *     Use(item.value);
 *   }
 * @endcode
 *
 * Backpressure: at most num_workers * in_flight_per_worker * chunk_size
 * inputs are dispatched and not yet yielded; a source is read only when a
 * worker slot is free and the bound allows a whole chunk.
 */

#ifndef PMAP_POOL_HPP_
#define PMAP_POOL_HPP_

#include "pmap/platform.hpp"
#include "pmap/channel.hpp"
#include "pmap/codec.hpp"
#include "pmap/error.hpp"
#include "pmap/io_poller.hpp"
#include "pmap/log.hpp"
#include "pmap/options.hpp"
#include "pmap/process.hpp"
#include "pmap/vocabulary.hpp"
#include "pmap/worker.hpp"

#include <algorithm>
#include <cerrno>
#include <cstdint>
#include <cstdlib>
#include <deque>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <utility>
#include <vector>

#include <sys/types.h>
#include <unistd.h>

namespace pmap {

// ============================================================================
// PoolState / PoolObserver / PoolStats
// ============================================================================

enum class PoolState : uint8_t {
  kConstructed = 0,
  kRunning,
  kDraining,
  kClosed,
};

inline const char* PoolStateName(PoolState s) noexcept {
  switch (s) {
    case PoolState::kConstructed: return "constructed";
    case PoolState::kRunning:     return "running";
    case PoolState::kDraining:    return "draining";
    case PoolState::kClosed:      return "closed";
    default:                      return "unknown";
  }
}

/**
 * @brief Optional lifecycle hooks, injected through PoolOptions::observer.
 *
 * Called on the coordinator thread. Default implementations do nothing.
 */
class PoolObserver {
 public:
  virtual ~PoolObserver() = default;

  /// Before the first channel of a new pool is created.
  virtual void OnBeforeChannelsOpen(uint32_t /*num_workers*/) {}
  /// After every worker is forked and the coordinator holds only its ends.
  virtual void OnChannelsOpened(uint32_t /*num_workers*/) {}
  virtual void OnStateChange(PoolState /*from*/, PoolState /*to*/) {}
  virtual void OnWorkerFailure(uint32_t /*worker_id*/, const PoolFailure& /*failure*/) {}
  /// After the last descriptor is closed and the last worker reaped.
  virtual void OnClosed() {}
};

struct PoolStats {
  uint64_t inputs_read = 0;
  uint64_t batches_sent = 0;
  uint64_t frames_received = 0;
  uint64_t items_completed = 0;
};

// ============================================================================
// InputSource
// ============================================================================

/**
 * @brief A lazy, pull-based input sequence.
 */
template <typename In>
class InputSource {
 public:
  /// Writes the next input and returns true, or returns false at the end.
  using Generator = std::function<bool(In&)>;

  explicit InputSource(Generator gen) : gen_(std::move(gen)) {}

  static InputSource FromGenerator(Generator gen) { return InputSource(std::move(gen)); }

  /// @brief Take ownership of a container and iterate it.
  template <typename Container>
  static InputSource FromContainer(Container container) {
    auto holder = std::make_shared<Container>(std::move(container));
    auto it = std::make_shared<typename Container::const_iterator>(holder->cbegin());
    return InputSource([holder, it](In& out) {
      if (*it == holder->cend()) return false;
      out = **it;
      ++*it;
      return true;
    });
  }

  /// @brief Iterate [first, last). The range must outlive the stream.
  template <typename It>
  static InputSource FromRange(It first, It last) {
    auto cur = std::make_shared<It>(first);
    return InputSource([cur, last](In& out) {
      if (*cur == last) return false;
      out = static_cast<In>(**cur);
      ++*cur;
      return true;
    });
  }

  /// @brief The integers [first, last).
  static InputSource FromRange(In first, In last) {
    auto cur = std::make_shared<In>(first);
    return InputSource([cur, last](In& out) {
      if (!(*cur < last)) return false;
      out = *cur;
      ++*cur;
      return true;
    });
  }

  bool Next(In& out) { return gen_ ? gen_(out) : false; }

 private:
  Generator gen_;
};

// ============================================================================
// ResultItem / ResultStream
// ============================================================================

/**
 * @brief One output value and where it came from.
 *
 * `input` is filled only by ZipInOut streams.
 */
template <typename In, typename Out>
struct ResultItem {
  uint64_t index = 0;
  In input{};
  Out value{};
  uint32_t worker_id = 0;
};

enum class StreamMode : uint8_t {
  kNone = 0,
  kOrdered,
  kUnordered,
  kZipInOut,
};

template <typename In, typename Out>
class Pool;

/**
 * @brief Lazy result sequence of a pool.
 *
 * Next() returns true with an item, false once exhausted, or the failure.
 * After exhaustion or a failure the stream is finished and keeps returning
 * false. Creating a newer stream on the same pool retires this one.
 */
template <typename In, typename Out>
class ResultStream {
 public:
  expected<bool, PoolFailure> Next(ResultItem<In, Out>& out) {
    if (finished_) return expected<bool, PoolFailure>::success(false);
    return pool_->NextResult(*this, out);
  }

  bool Finished() const noexcept { return finished_; }
  StreamMode Mode() const noexcept { return mode_; }

 private:
  friend class Pool<In, Out>;

  ResultStream(Pool<In, Out>* pool, StreamMode mode, bool close_if_done,
               uint64_t generation, bool rejected) noexcept
      : pool_(pool),
        mode_(mode),
        close_if_done_(close_if_done),
        generation_(generation),
        rejected_(rejected) {}

  Pool<In, Out>* pool_;
  StreamMode mode_;
  bool close_if_done_;
  uint64_t generation_;
  bool rejected_;
  bool finished_ = false;
};

// ============================================================================
// Pool registry (atexit and post-fork hygiene)
// ============================================================================

namespace detail {

class PoolBase {
 public:
  virtual ~PoolBase() = default;
  /// Close from the atexit hook.
  virtual void CloseAtExit() = 0;
  /// In a freshly forked child: drop every coordinator-side descriptor.
  virtual void ReleaseInChild() noexcept = 0;
};

/**
 * @brief Tracks live pools so that pools still open at exit get closed, and
 *        so that a newly forked worker closes the pipes of every other pool.
 */
class PoolRegistry {
 public:
  static PoolRegistry& Instance() {
    static PoolRegistry registry;
    return registry;
  }

  void Add(PoolBase* pool) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!hooked_) {
      hooked_ = (std::atexit(&PoolRegistry::CloseAllAtExit) == 0);
      if (!hooked_) PMAP_LOG_WARN("Pool", "atexit registration failed");
    }
    pools_.push_back(pool);
  }

  void Remove(PoolBase* pool) {
    std::lock_guard<std::mutex> lock(mutex_);
    pools_.erase(std::remove(pools_.begin(), pools_.end(), pool), pools_.end());
  }

  /// @note Child side of fork(): single-threaded, so no locking.
  void ReleaseAllInChild() noexcept {
    for (PoolBase* pool : pools_) pool->ReleaseInChild();
  }

 private:
  PoolRegistry() = default;

  static void CloseAllAtExit() {
    std::vector<PoolBase*> snapshot;
    {
      std::lock_guard<std::mutex> lock(Instance().mutex_);
      snapshot = Instance().pools_;
    }
    for (PoolBase* pool : snapshot) pool->CloseAtExit();
  }

  std::mutex mutex_;
  std::vector<PoolBase*> pools_;
  bool hooked_ = false;
};

}  // namespace detail

// ============================================================================
// Pool
// ============================================================================

/**
 * @brief Fixed set of forked workers mapping In to Out.
 *
 * In and Out must be default constructible and have a Serializer; In must
 * be copyable.
 */
template <typename In, typename Out>
class Pool final : public detail::PoolBase {
 public:
  using WorkerType = Worker<In, Out>;
  using Stream = ResultStream<In, Out>;
  using Item = ResultItem<In, Out>;
  using CreateResult = expected<std::unique_ptr<Pool>, PoolFailure>;

  /**
   * @brief Fork one process per worker, each with its own channel pair.
   *
   * On any failure, workers already started are torn down before returning
   * kConstructionFailed. opts.num_workers is ignored; the worker list sets
   * the pool size.
   *
   * @note Workers are bound to the calling thread (see WorkerProcess::Spawn).
   *       Create the pool on a thread that outlives it; a pool created on a
   *       short-lived thread and handed to another loses its workers when
   *       the creating thread exits, surfacing as kWorkerExited.
   */
  static CreateResult Create(std::vector<WorkerType> workers,
                             const PoolOptions& opts = PoolOptions()) {
    if (workers.empty() || opts.chunk_size == 0U || opts.in_flight_per_worker == 0U) {
      return CreateResult::error(PoolFailure::Make(
          PoolError::kInvalidArgument,
          "need at least one worker, chunk_size >= 1 and in_flight_per_worker >= 1"));
    }
    for (const auto& w : workers) {
      if (!w.Valid()) {
        return CreateResult::error(
            PoolFailure::Make(PoolError::kInvalidArgument, "worker without a body"));
      }
    }

    const uint32_t n = static_cast<uint32_t>(workers.size());
    const uint32_t capacity = EstimateWorkerCapacity();
    if (n > capacity) {
      PMAP_LOG_ERROR("Pool", "%u workers requested, descriptor/process limits allow %u",
                     n, capacity);
      return CreateResult::error(PoolFailure::Make(
          PoolError::kConstructionFailed,
          "requested " + std::to_string(n) + " workers, capacity is " +
              std::to_string(capacity)));
    }

    std::unique_ptr<Pool> pool(new Pool(opts));
    detail::PoolRegistry::Instance().Add(pool.get());
    if (pool->observer_ != nullptr) pool->observer_->OnBeforeChannelsOpen(n);

    ScopeGuard rollback([&pool]() {
      auto r = pool->Close();
      if (!r.has_value()) {
        PMAP_LOG_WARN("Pool", "rollback close: %s", r.get_error().Message().c_str());
      }
    });

    for (uint32_t id = 0; id < n; ++id) {
      auto started = pool->StartWorker(workers[id], id);
      if (!started.has_value()) return CreateResult::error(started.get_error());
    }
    rollback.release();

    if (pool->observer_ != nullptr) pool->observer_->OnChannelsOpened(n);
    PMAP_LOG_INFO("Pool", "forked %u workers (chunk_size=%u, in_flight=%u)", n,
                  pool->chunk_size_, pool->in_flight_);
    return CreateResult::success(std::move(pool));
  }

  ~Pool() override {
    auto r = Close();
    if (!r.has_value()) {
      PMAP_LOG_WARN("Pool", "close on destruction: %s", r.get_error().Message().c_str());
    }
  }

  Pool(const Pool&) = delete;
  Pool& operator=(const Pool&) = delete;

  // --------------------------------------------------------------------------
  // Input
  // --------------------------------------------------------------------------

  /**
   * @brief Queue an input source behind any already queued.
   *
   * Nothing is read until a stream is consumed. Ignored on a closed pool.
   */
  Pool& Imap(InputSource<In> inputs) {
    if (state_ == PoolState::kClosed) {
      PMAP_LOG_WARN("Pool", "Imap on a closed pool ignored");
      return *this;
    }
    sources_.push_back(std::move(inputs));
    inputs_exhausted_ = false;
    return *this;
  }

  // --------------------------------------------------------------------------
  // Output
  // --------------------------------------------------------------------------

  /// @brief Results in input order.
  Stream Ordered(bool close_if_done = true) {
    return MakeStream(StreamMode::kOrdered, close_if_done);
  }

  /// @brief Results in arrival order.
  Stream Unordered(bool close_if_done = true) {
    return MakeStream(StreamMode::kUnordered, close_if_done);
  }

  /// @brief Results in arrival order, each carrying its input.
  Stream ZipInOut(bool close_if_done = true) {
    return MakeStream(StreamMode::kZipInOut, close_if_done);
  }

  /// @brief Consume every queued input, discarding values.
  expected<void, PoolFailure> BlockIgnoreOutput(bool close_if_done = true) {
    StreamMode mode = (mode_ == StreamMode::kNone || slots_.empty()) ? StreamMode::kUnordered
                                                                     : mode_;
    Stream stream = MakeStream(mode, close_if_done);
    Item item;
    for (;;) {
      auto r = stream.Next(item);
      if (!r.has_value()) return expected<void, PoolFailure>::error(r.get_error());
      if (!r.value()) return expected<void, PoolFailure>::success();
    }
  }

  // --------------------------------------------------------------------------
  // Lifecycle
  // --------------------------------------------------------------------------

  /**
   * @brief Close every channel and reap every worker.
   *
   * Closes the input channels, discards pending output, waits up to
   * shutdown_grace_ms for the workers to exit and SIGKILLs the rest.
   * The state steps through every stage up to kClosed, kRunning included
   * for a pool that never dispatched. Later calls are no-ops.
   */
  expected<void, PoolFailure> Close() {
    if (state_ == PoolState::kClosed) return expected<void, PoolFailure>::success();
    if (state_ == PoolState::kConstructed) SetState(PoolState::kRunning);
    SetState(PoolState::kDraining);
    return Teardown();
  }

  // --------------------------------------------------------------------------
  // Queries
  // --------------------------------------------------------------------------

  PoolState State() const noexcept { return state_; }
  uint32_t WorkerCount() const noexcept { return static_cast<uint32_t>(workers_.size()); }
  uint32_t ChunkSize() const noexcept { return chunk_size_; }
  uint32_t InFlightPerWorker() const noexcept { return in_flight_; }
  const PoolStats& Stats() const noexcept { return stats_; }

  /// @brief Bound on inputs dispatched but not yet yielded.
  uint64_t MaxLookahead() const noexcept {
    return static_cast<uint64_t>(WorkerCount()) * in_flight_ * chunk_size_;
  }

  std::vector<pid_t> WorkerPids() const {
    std::vector<pid_t> pids;
    pids.reserve(workers_.size());
    for (const auto& w : workers_) pids.push_back(w->pid);
    return pids;
  }

  /// @brief Coordinator-side descriptors still open.
  std::vector<int> OpenDescriptors() const {
    std::vector<int> fds;
    for (const auto& w : workers_) {
      auto mine = w->channel.OpenDescriptors();
      fds.insert(fds.end(), mine.begin(), mine.end());
    }
    return fds;
  }

 private:
  friend class ResultStream<In, Out>;

  struct Batch {
    uint64_t first;
    uint32_t size;
    uint32_t done;
  };

  struct WorkerHandle {
    uint32_t id = 0;
    pid_t pid = -1;
    ChannelPair channel;
    WorkerProcess process;
    FrameWriter writer;
    std::deque<Batch> batches;  // outstanding, oldest first
    bool failed = false;        // raised an exception
    bool gone = false;          // exited or lost its channel

    bool Available(uint32_t in_flight) const noexcept {
      return !failed && !gone && channel.InputWriteFd() >= 0 && writer.Idle() &&
             batches.size() < in_flight;
    }
  };

  struct Slot {
    In input{};
    std::deque<Out> values;
    uint32_t worker_id = 0;
    bool done = false;
    bool failed = false;
    PoolFailure failure;
  };

  enum class Take : uint8_t { kNothing, kItem, kFailure };

  explicit Pool(const PoolOptions& opts)
      : chunk_size_(opts.chunk_size),
        in_flight_(opts.in_flight_per_worker),
        grace_ms_(opts.shutdown_grace_ms),
        printer_(opts.exception_printer != nullptr ? opts.exception_printer
                                                   : &PrintException),
        printer_ctx_(opts.exception_printer_ctx),
        observer_(opts.observer) {}

  // --------------------------------------------------------------------------
  // Construction
  // --------------------------------------------------------------------------

  expected<void, PoolFailure> StartWorker(const WorkerType& worker, uint32_t id) {
    auto opened = ChannelPair::Open();
    if (!opened.has_value()) {
      return expected<void, PoolFailure>::error(PoolFailure::Make(
          PoolError::kConstructionFailed,
          std::string("cannot open channel: ") + ChannelStatusName(opened.get_error())));
    }
    ChannelPair& channel = opened.value();

    auto proc = WorkerProcess::Spawn([&worker, &channel, id]() noexcept {
      detail::PoolRegistry::Instance().ReleaseAllInChild();
      channel.CloseCoordinatorSide();
      return RunWorkerProcess(worker, channel, id);
    });
    if (!proc.has_value()) {
      return expected<void, PoolFailure>::error(
          PoolFailure::Make(PoolError::kConstructionFailed,
                            "cannot fork worker " + std::to_string(id)));
    }

    auto handle = std::make_unique<WorkerHandle>();
    handle->id = id;
    handle->pid = proc.value().GetPid();
    handle->process = std::move(proc.value());
    handle->channel = std::move(channel);
    handle->channel.CloseWorkerSide();
    if (!handle->channel.MakeInputNonBlocking()) {
      workers_.push_back(std::move(handle));
      return expected<void, PoolFailure>::error(PoolFailure::Make(
          PoolError::kConstructionFailed, "cannot make worker input non-blocking"));
    }
    PMAP_LOG_DEBUG("Pool", "worker %u forked (pid %d)", id, static_cast<int>(handle->pid));
    workers_.push_back(std::move(handle));
    return expected<void, PoolFailure>::success();
  }

  void ReleaseInChild() noexcept override {
    for (auto& w : workers_) w->channel.CloseCoordinatorSide();
  }

  void CloseAtExit() override {
    auto r = Close();
    if (!r.has_value()) {
      PMAP_LOG_WARN("Pool", "close at exit: %s", r.get_error().Message().c_str());
    }
  }

  // --------------------------------------------------------------------------
  // Streams
  // --------------------------------------------------------------------------

  Stream MakeStream(StreamMode mode, bool close_if_done) {
    if (mode_ != StreamMode::kNone && mode_ != mode && !slots_.empty()) {
      return Stream(this, mode, close_if_done, generation_, true);
    }
    if (mode_ != mode) ready_.clear();
    mode_ = mode;
    return Stream(this, mode, close_if_done, ++generation_, false);
  }

  bool UsesArrivalOrder() const noexcept { return mode_ != StreamMode::kOrdered; }

  expected<bool, PoolFailure> NextResult(Stream& stream, Item& out) {
    if (stream.rejected_) {
      return Finish(stream, PoolFailure::Make(
                                PoolError::kInvalidState,
                                "another stream mode has results outstanding"));
    }
    if (stream.generation_ != generation_) {
      return Finish(stream, PoolFailure::Make(PoolError::kInvalidState,
                                              "stream superseded by a newer one"));
    }
    if (state_ == PoolState::kClosed) {
      return Finish(stream, PoolFailure::Make(PoolError::kClosed, "pool is closed"));
    }

    for (;;) {
      if (pending_failure_) return Fail(stream, *pending_failure_);

      PoolFailure failure;
      Take t = UsesArrivalOrder() ? TakeArrival(out, failure) : TakeOrdered(out, failure);
      if (t == Take::kItem) return expected<bool, PoolFailure>::success(true);
      if (t == Take::kFailure) return Fail(stream, failure);

      auto d = Dispatch();
      if (!d.has_value()) return Fail(stream, d.get_error());

      if (slots_.empty() && inputs_exhausted_) {
        stream.finished_ = true;
        if (stream.close_if_done_) {
          auto c = Close();
          if (!c.has_value()) {
            PMAP_LOG_WARN("Pool", "close after drain: %s", c.get_error().Message().c_str());
          }
        } else {
          SetState(PoolState::kDraining);
        }
        return expected<bool, PoolFailure>::success(false);
      }

      auto w = WaitAndService();
      if (!w.has_value()) return Fail(stream, w.get_error());
    }
  }

  expected<bool, PoolFailure> Finish(Stream& stream, PoolFailure failure) {
    stream.finished_ = true;
    return expected<bool, PoolFailure>::error(std::move(failure));
  }

  /// @brief Surface a failure: the stream ends and the pool goes straight to
  ///        kClosed.
  expected<bool, PoolFailure> Fail(Stream& stream, PoolFailure failure) {
    stream.finished_ = true;
    pending_failure_.reset();
    auto c = Teardown();
    if (!c.has_value()) {
      PMAP_LOG_WARN("Pool", "close after failure: %s", c.get_error().Message().c_str());
    }
    return expected<bool, PoolFailure>::error(std::move(failure));
  }

  void Fill(Item& out, uint64_t index, Slot& s) {
    out.index = index;
    out.worker_id = s.worker_id;
    out.value = std::move(s.values.front());
    s.values.pop_front();
    if (mode_ == StreamMode::kZipInOut) {
      out.input = s.input;
    } else {
      out.input = In{};
    }
  }

  Take TakeOrdered(Item& out, PoolFailure& failure) {
    while (!slots_.empty()) {
      auto it = slots_.begin();
      Slot& s = it->second;
      if (!s.values.empty()) {
        Fill(out, it->first, s);
        return Take::kItem;
      }
      if (s.failed) {
        failure = s.failure;
        return Take::kFailure;
      }
      if (!s.done) return Take::kNothing;
      slots_.erase(it);
    }
    return Take::kNothing;
  }

  // ready_ holds one entry per value record plus one closing entry per index
  // (done or failed), in arrival order.
  Take TakeArrival(Item& out, PoolFailure& failure) {
    while (!ready_.empty()) {
      uint64_t index = ready_.front();
      ready_.pop_front();
      auto it = slots_.find(index);
      if (it == slots_.end()) continue;
      Slot& s = it->second;
      if (!s.values.empty()) {
        Fill(out, index, s);
        return Take::kItem;
      }
      if (s.failed) {
        failure = s.failure;
        return Take::kFailure;
      }
      if (s.done) slots_.erase(it);
    }
    return Take::kNothing;
  }

  // --------------------------------------------------------------------------
  // Dispatch
  // --------------------------------------------------------------------------

  bool ReadInput(In& out) {
    while (!sources_.empty()) {
      if (sources_.front().Next(out)) {
        ++stats_.inputs_read;
        return true;
      }
      sources_.pop_front();
    }
    inputs_exhausted_ = true;
    return false;
  }

  WorkerHandle* NextAvailableWorker() {
    const size_t n = workers_.size();
    for (size_t k = 0; k < n; ++k) {
      size_t i = (rr_cursor_ + k) % n;
      if (workers_[i]->Available(in_flight_)) {
        rr_cursor_ = (i + 1) % n;
        return workers_[i].get();
      }
    }
    return nullptr;
  }

  bool AnyWorkerAlive() const noexcept {
    for (const auto& w : workers_) {
      if (!w->failed && !w->gone) return true;
    }
    return false;
  }

  expected<void, PoolFailure> Dispatch() {
    while (!inputs_exhausted_) {
      if (slots_.size() + chunk_size_ > MaxLookahead()) break;
      WorkerHandle* w = NextAvailableWorker();
      if (w == nullptr) break;

      std::vector<uint8_t> payload;
      ByteWriter writer(payload);
      const uint64_t first = next_index_;
      uint32_t count = 0;
      while (count < chunk_size_) {
        In x{};
        if (!ReadInput(x)) break;
        writer.PutU64(next_index_);
        Serializer<In>::Encode(x, writer);
        Slot& slot = slots_[next_index_];
        slot.worker_id = w->id;
        if (mode_ == StreamMode::kZipInOut) slot.input = std::move(x);
        ++next_index_;
        ++count;
      }
      if (count == 0U) break;

      if (state_ != PoolState::kRunning) SetState(PoolState::kRunning);
      w->batches.push_back(Batch{first, count, 0});
      if (w->writer.Load(FrameType::kWorkBatch, count, payload) != ChannelStatus::kOk) {
        return expected<void, PoolFailure>::error(PoolFailure::Make(
            PoolError::kInvalidArgument, "work batch exceeds the maximum frame size"));
      }
      ++stats_.batches_sent;
      PumpInput(*w);
    }

    if (inputs_exhausted_ && state_ == PoolState::kRunning) SetState(PoolState::kDraining);
    if (!inputs_exhausted_ && slots_.empty() && !AnyWorkerAlive()) {
      return expected<void, PoolFailure>::error(
          PoolFailure::Make(PoolError::kWorkerExited, "no live worker left for the input"));
    }
    return expected<void, PoolFailure>::success();
  }

  void PumpInput(WorkerHandle& w) {
    if (w.writer.Idle() || w.channel.InputWriteFd() < 0) return;
    ChannelStatus s = w.writer.Pump(w.channel.InputWriteFd());
    if (s == ChannelStatus::kOk || s == ChannelStatus::kWouldBlock) return;
    // The worker stopped reading; its output side reports why.
    PMAP_LOG_DEBUG("Pool", "worker %u input %s", w.id, ChannelStatusName(s));
    w.writer.Reset();
    w.channel.CloseInput();
  }

  // --------------------------------------------------------------------------
  // Receive
  // --------------------------------------------------------------------------

  WorkerHandle* FindByFd(int fd) {
    for (auto& w : workers_) {
      if (w->channel.OutputReadFd() == fd || w->channel.InputWriteFd() == fd) return w.get();
    }
    return nullptr;
  }

  void Watch(int fd, IoEvent ev) {
    auto added = poller_.Add(fd, static_cast<uint8_t>(ev));
    if (!added.has_value()) {
      PMAP_LOG_DEBUG("Pool", "fd %d not watched (poller error %u)", fd,
                     static_cast<unsigned>(added.get_error()));
    }
  }

  expected<void, PoolFailure> WaitAndService() {
    poller_.Clear();
    for (auto& w : workers_) {
      if (w->channel.OutputReadFd() >= 0) {
        Watch(w->channel.OutputReadFd(), IoEvent::kReadable);
      }
      if (!w->writer.Idle() && w->channel.InputWriteFd() >= 0) {
        Watch(w->channel.InputWriteFd(), IoEvent::kWritable);
      }
    }
    if (poller_.Size() == 0U) {
      return expected<void, PoolFailure>::error(PoolFailure::Make(
          PoolError::kWorkerExited, "results outstanding but no worker channel is open"));
    }

    auto waited = poller_.Wait(-1);
    if (!waited.has_value()) {
      return expected<void, PoolFailure>::error(
          PoolFailure::Make(PoolError::kChannelError, "poll failed"));
    }

    // Copy: servicing may close descriptors and clear the poller.
    std::vector<PollResult> ready(poller_.Results(), poller_.Results() + poller_.ResultCount());
    for (const PollResult& r : ready) {
      WorkerHandle* w = FindByFd(r.fd);
      if (w == nullptr) continue;
      if (r.fd == w->channel.InputWriteFd()) {
        PumpInput(*w);
      } else {
        ReceiveFrom(*w);
      }
    }
    return expected<void, PoolFailure>::success();
  }

  void ReceiveFrom(WorkerHandle& w) {
    ChannelStatus s = RecvFrame(w.channel.OutputReadFd(), frame_);
    if (s == ChannelStatus::kClosed) {
      WorkerGone(w, PoolError::kWorkerExited, "closed its channel");
      return;
    }
    if (s != ChannelStatus::kOk || frame_.type != FrameType::kResultBatch) {
      WorkerGone(w, PoolError::kChannelError,
                 std::string("result channel ") + ChannelStatusName(s));
      return;
    }
    ++stats_.frames_received;
    if (!HandleRecords(w)) {
      WorkerGone(w, PoolError::kChannelError, "sent an invalid result record");
    }
  }

  bool HandleRecords(WorkerHandle& w) {
    ByteReader r(frame_.payload.data(), frame_.payload.size());
    for (uint32_t k = 0; k < frame_.count; ++k) {
      RecordKind kind;
      uint64_t index = 0;
      if (!detail::GetRecordHead(r, kind, index)) return false;

      switch (kind) {
        case RecordKind::kValue: {
          auto it = slots_.find(index);
          if (it == slots_.end() || it->second.done) return false;
          Out v{};
          if (!Serializer<Out>::Decode(r, v)) return false;
          it->second.values.push_back(std::move(v));
          if (UsesArrivalOrder()) ready_.push_back(index);
          break;
        }
        case RecordKind::kDone: {
          auto it = slots_.find(index);
          if (it == slots_.end() || it->second.done) return false;
          if (!CompleteOnWorker(w, index)) return false;
          it->second.done = true;
          ++stats_.items_completed;
          if (UsesArrivalOrder()) ready_.push_back(index);
          break;
        }
        case RecordKind::kError: {
          ErrorEnvelope env;
          if (!Serializer<ErrorEnvelope>::Decode(r, env)) return false;
          WorkerRaised(w, std::move(env));
          return true;  // nothing follows an error
        }
        case RecordKind::kExit:
          WorkerGone(w, PoolError::kWorkerExited, "returned from its body");
          return true;
        default:
          return false;
      }
    }
    return r.AtEnd();
  }

  /// @brief Account a finished item against the worker's oldest batch.
  bool CompleteOnWorker(WorkerHandle& w, uint64_t index) {
    if (w.batches.empty()) return false;
    Batch& b = w.batches.front();
    if (index < b.first || index >= b.first + b.size) return false;
    if (++b.done == b.size) {
      w.batches.pop_front();
      PumpInput(w);
    }
    return true;
  }

  void WorkerRaised(WorkerHandle& w, ErrorEnvelope env) {
    w.failed = true;
    w.writer.Reset();
    w.channel.CloseInput();

    printer_(env, printer_ctx_);

    const uint64_t index = env.sequence_index;
    PoolFailure failure = PoolFailure::FromEnvelope(std::move(env));
    if (observer_ != nullptr) observer_->OnWorkerFailure(w.id, failure);

    auto it = slots_.find(index);
    if (it != slots_.end() && !it->second.done) {
      it->second.failed = true;
      it->second.failure = std::move(failure);
      if (UsesArrivalOrder()) ready_.push_back(index);
    } else {
      pending_failure_ = std::move(failure);
    }
  }

  void WorkerGone(WorkerHandle& w, PoolError code, const std::string& why) {
    w.gone = true;
    w.writer.Reset();
    w.channel.CloseInput();
    w.channel.CloseOutput();
    if (w.failed || w.batches.empty()) {
      PMAP_LOG_DEBUG("Pool", "worker %u %s", w.id, why.c_str());
      return;
    }

    std::string detail = "worker " + std::to_string(w.id) + " (pid " +
                         std::to_string(static_cast<int>(w.pid)) + ") " + why +
                         " with input #" + std::to_string(w.batches.front().first +
                                                          w.batches.front().done) +
                         " outstanding";
    WaitResult wr = w.process.Wait(100);
    if (wr.signaled) detail += ", killed by signal " + std::to_string(wr.term_signal);
    if (wr.exited) detail += ", exit code " + std::to_string(wr.exit_code);

    PMAP_LOG_ERROR("Pool", "%s", detail.c_str());
    PoolFailure failure = PoolFailure::Make(code, detail);
    if (observer_ != nullptr) observer_->OnWorkerFailure(w.id, failure);
    if (!pending_failure_) pending_failure_ = std::move(failure);
  }

  // --------------------------------------------------------------------------
  // Teardown
  // --------------------------------------------------------------------------

  void DrainOutputs(uint64_t deadline) {
    uint8_t scratch[16384];
    for (;;) {
      poller_.Clear();
      for (auto& w : workers_) {
        if (w->channel.OutputReadFd() >= 0) {
          Watch(w->channel.OutputReadFd(), IoEvent::kReadable);
        }
      }
      uint64_t now = SteadyNowMs();
      if (poller_.Size() == 0U || now >= deadline) return;

      auto waited = poller_.Wait(static_cast<int32_t>(deadline - now));
      if (!waited.has_value() || waited.value() == 0U) return;

      std::vector<PollResult> ready(poller_.Results(), poller_.Results() + poller_.ResultCount());
      for (const PollResult& r : ready) {
        WorkerHandle* w = FindByFd(r.fd);
        if (w == nullptr) continue;
        ssize_t n = ::read(r.fd, scratch, sizeof(scratch));
        if (n == 0 || (n < 0 && errno != EINTR && errno != EAGAIN)) {
          w->channel.CloseOutput();
        }
      }
    }
  }

  /// @brief Release everything and enter kClosed from the current state.
  expected<void, PoolFailure> Teardown() {
    if (state_ == PoolState::kClosed) return expected<void, PoolFailure>::success();
    for (auto& w : workers_) {
      w->writer.Reset();
      w->channel.CloseInput();
    }

    const uint64_t deadline = SteadyNowMs() + grace_ms_;
    DrainOutputs(deadline);

    std::string reap_errors;
    for (auto& w : workers_) {
      uint64_t now = SteadyNowMs();
      WaitResult wr = (now < deadline) ? w->process.Wait(static_cast<uint32_t>(deadline - now))
                                       : w->process.TryWait();
      if (wr.timed_out) {
        PMAP_LOG_WARN("Pool", "worker %u (pid %d) still running after %u ms, killing",
                      w->id, static_cast<int>(w->pid), grace_ms_);
        if (w->process.Kill() != ProcessResult::kSuccess) {
          reap_errors += "worker " + std::to_string(w->id) + " could not be reaped; ";
        }
      } else if (wr.signaled && !w->failed) {
        PMAP_LOG_WARN("Pool", "worker %u (pid %d) terminated by signal %d", w->id,
                      static_cast<int>(w->pid), wr.term_signal);
      }
      w->channel.CloseAll();
    }

    slots_.clear();
    ready_.clear();
    sources_.clear();
    inputs_exhausted_ = true;
    pending_failure_.reset();

    SetState(PoolState::kClosed);
    detail::PoolRegistry::Instance().Remove(this);
    if (observer_ != nullptr) observer_->OnClosed();
    PMAP_LOG_DEBUG("Pool", "closed (%llu inputs, %llu completed)",
                   static_cast<unsigned long long>(stats_.inputs_read),
                   static_cast<unsigned long long>(stats_.items_completed));

    if (!reap_errors.empty()) {
      return expected<void, PoolFailure>::error(
          PoolFailure::Make(PoolError::kWorkerExited, reap_errors));
    }
    return expected<void, PoolFailure>::success();
  }

  void SetState(PoolState next) {
    if (next == state_) return;
    PoolState prev = state_;
    state_ = next;
    PMAP_LOG_DEBUG("Pool", "state %s -> %s", PoolStateName(prev), PoolStateName(next));
    if (observer_ != nullptr) observer_->OnStateChange(prev, next);
  }

  const uint32_t chunk_size_;
  const uint32_t in_flight_;
  const uint32_t grace_ms_;
  ExceptionPrintFn printer_;
  void* printer_ctx_;
  PoolObserver* observer_;

  PoolState state_ = PoolState::kConstructed;
  StreamMode mode_ = StreamMode::kNone;
  uint64_t generation_ = 0;

  std::vector<std::unique_ptr<WorkerHandle>> workers_;
  size_t rr_cursor_ = 0;
  IoPoller poller_;
  Frame frame_;

  std::deque<InputSource<In>> sources_;
  bool inputs_exhausted_ = true;
  uint64_t next_index_ = 0;

  std::map<uint64_t, Slot> slots_;  // dispatched, not yet fully yielded
  std::deque<uint64_t> ready_;      // arrival order, unordered modes only
  optional<PoolFailure> pending_failure_;

  PoolStats stats_;
};

// ============================================================================
// Construction helpers
// ============================================================================

template <typename In, typename Out>
expected<std::unique_ptr<Pool<In, Out>>, PoolFailure> Fork(
    std::vector<Worker<In, Out>> workers, const PoolOptions& opts = PoolOptions()) {
  return Pool<In, Out>::Create(std::move(workers), opts);
}

/// @brief A pool of @p num_workers copies of one worker.
template <typename In, typename Out>
expected<std::unique_ptr<Pool<In, Out>>, PoolFailure> ForkIdentical(
    const Worker<In, Out>& worker, uint32_t num_workers,
    const PoolOptions& opts = PoolOptions()) {
  if (num_workers == 0U) {
    return expected<std::unique_ptr<Pool<In, Out>>, PoolFailure>::error(
        PoolFailure::Make(PoolError::kInvalidArgument, "num_workers must be >= 1"));
  }
  return Pool<In, Out>::Create(std::vector<Worker<In, Out>>(num_workers, worker), opts);
}

/// @brief As ForkIdentical(), dispatching inputs in chunks of @p chunk_size.
template <typename In, typename Out>
expected<std::unique_ptr<Pool<In, Out>>, PoolFailure> ForkIdenticalChunked(
    const Worker<In, Out>& worker, uint32_t num_workers, uint32_t chunk_size,
    PoolOptions opts = PoolOptions()) {
  opts.chunk_size = chunk_size;
  return ForkIdentical(worker, num_workers, opts);
}

}  // namespace pmap

#endif  // PMAP_POOL_HPP_
