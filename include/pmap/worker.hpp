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
 * @file worker.hpp
 * @brief Worker unit: user transformation wrapper and the worker process
 *        main loop.
 *
 * A worker body consumes an InputStream and produces through an Emitter:
 *
 * @code
 *   auto w = pmap::MakeWorker<int, int>(
 *       [](pmap::InputStream<int>& in, pmap::Emitter<int>& out) {
 *         int x;
 *         while (in.Next(x)) out.Emit(x * 2);
 *       },
 *       "doubler");
 * @endcode
 *
 * The body runs once per worker process. Each value emitted is tagged with
 * the index of the input most recently pulled; zero, one or many values per
 * input are allowed. Pulling the next input marks the previous one done.
 *
 * Records on the result channel:
 *   kValue  index + Serializer<Out> payload
 *   kError  index + ErrorEnvelope
 *   kDone   index; the input produced all of its values
 *   kExit   the body returned; no further records follow
 */

#ifndef PMAP_WORKER_HPP_
#define PMAP_WORKER_HPP_

#include "pmap/platform.hpp"
#include "pmap/channel.hpp"
#include "pmap/codec.hpp"
#include "pmap/error.hpp"
#include "pmap/log.hpp"

#include <cstdint>
#include <functional>
#include <exception>
#include <string>
#include <system_error>
#include <thread>
#include <utility>
#include <vector>

#include <unistd.h>

namespace pmap {

/// Result buffer size that triggers a flush before the batch is finished.
inline constexpr size_t kResultFlushBytes = 256U * 1024U;

/// Index carried by a failure that happened before any input was pulled.
inline constexpr uint64_t kNoIndex = UINT64_MAX;

/// Exit code of a worker whose body threw.
inline constexpr int kWorkerFailedExitCode = 1;
/// Exit code of a worker that lost its channel.
inline constexpr int kWorkerChannelExitCode = 2;

// ============================================================================
// Record encoding
// ============================================================================

enum class RecordKind : uint8_t {
  kValue = 1,
  kError = 2,
  kDone = 3,
  kExit = 4,
};

namespace detail {

inline void PutRecordHead(ByteWriter& w, RecordKind kind, uint64_t index) {
  w.PutPod(static_cast<uint8_t>(kind));
  w.PutU64(index);
}

inline bool GetRecordHead(ByteReader& r, RecordKind& kind, uint64_t& index) {
  uint8_t raw = 0;
  if (!r.GetPod(raw) || !r.GetU64(index)) return false;
  if (raw < static_cast<uint8_t>(RecordKind::kValue) ||
      raw > static_cast<uint8_t>(RecordKind::kExit)) {
    return false;
  }
  kind = static_cast<RecordKind>(raw);
  return true;
}

template <typename In, typename Out>
class WorkerRuntime;

/// Where an uncaught worker exception gets reported from the terminate path.
class FailureSink {
 public:
  virtual uint32_t WorkerId() const noexcept = 0;
  virtual uint64_t FailureIndex() const noexcept = 0;
  virtual void FinishWithError(const ErrorEnvelope& env) = 0;

 protected:
  ~FailureSink() = default;
};

inline FailureSink*& ActiveFailureSink() noexcept {
  static FailureSink* sink = nullptr;
  return sink;
}

/**
 * @brief Terminate handler of a worker process.
 *
 * Entered for an exception no handler claimed; the throwing frames are still
 * on the stack. Reports the exception through the active sink and ends the
 * process. A second entry, or one without a sink, exits immediately.
 */
[[noreturn]] inline void ReportUncaughtAndExit() noexcept {
  static bool entered = false;
  FailureSink* sink = ActiveFailureSink();
  if (entered || sink == nullptr) ::_exit(kWorkerFailedExitCode);
  entered = true;
  ErrorEnvelope env = CaptureCurrentException(sink->WorkerId(), sink->FailureIndex());
  sink->FinishWithError(env);
  ::_exit(kWorkerFailedExitCode);
}

}  // namespace detail

// ============================================================================
// InputStream / Emitter
// ============================================================================

/**
 * @brief Lazy input of a worker body.
 */
template <typename In>
class InputStream {
 public:
  /**
   * @brief Pull the next input.
   * @return false once the coordinator closed the input channel, or the
   *         channel failed. The body should then return.
   */
  bool Next(In& out) { return next_fn_(ctx_, out); }

  /// @brief Index of the input most recently pulled.
  uint64_t CurrentIndex() const noexcept { return index_fn_(ctx_); }

  InputStream(const InputStream&) = delete;
  InputStream& operator=(const InputStream&) = delete;

 private:
  template <typename, typename>
  friend class detail::WorkerRuntime;

  using NextFn = bool (*)(void*, In&);
  using IndexFn = uint64_t (*)(const void*);

  InputStream(void* ctx, NextFn next_fn, IndexFn index_fn) noexcept
      : ctx_(ctx), next_fn_(next_fn), index_fn_(index_fn) {}

  void* ctx_;
  NextFn next_fn_;
  IndexFn index_fn_;
};

/**
 * @brief Output of a worker body.
 */
template <typename Out>
class Emitter {
 public:
  /// @brief Emit a value for the input most recently pulled.
  void Emit(const Out& value) { emit_fn_(ctx_, value); }

  Emitter(const Emitter&) = delete;
  Emitter& operator=(const Emitter&) = delete;

 private:
  template <typename, typename>
  friend class detail::WorkerRuntime;

  using EmitFn = void (*)(void*, const Out&);

  Emitter(void* ctx, EmitFn emit_fn) noexcept : ctx_(ctx), emit_fn_(emit_fn) {}

  void* ctx_;
  EmitFn emit_fn_;
};

// ============================================================================
// Worker
// ============================================================================

/**
 * @brief A named worker body.
 *
 * Copied into every forked process; captured state is duplicated, never
 * shared.
 */
template <typename In, typename Out>
class Worker {
 public:
  using Body = std::function<void(InputStream<In>&, Emitter<Out>&)>;

  Worker(Body body, std::string name) : body_(std::move(body)), name_(std::move(name)) {}

  const std::string& Name() const noexcept { return name_; }
  bool Valid() const noexcept { return static_cast<bool>(body_); }

  void operator()(InputStream<In>& in, Emitter<Out>& out) const { body_(in, out); }

 private:
  Body body_;
  std::string name_;
};

/// @brief Wrap a generator-shaped body.
template <typename In, typename Out, typename Fn>
Worker<In, Out> MakeWorker(Fn&& body, std::string name = "worker") {
  return Worker<In, Out>(typename Worker<In, Out>::Body(std::forward<Fn>(body)),
                         std::move(name));
}

/// @brief Wrap a plain `Out(const In&)` function: one output per input.
template <typename In, typename Out, typename Fn>
Worker<In, Out> MapWorker(Fn&& fn, std::string name = "map") {
  return Worker<In, Out>(
      [f = std::forward<Fn>(fn)](InputStream<In>& in, Emitter<Out>& out) {
        In x{};
        while (in.Next(x)) {
          out.Emit(f(x));
        }
      },
      std::move(name));
}

// ============================================================================
// WorkerRuntime (runs in the child)
// ============================================================================

namespace detail {

template <typename In, typename Out>
class WorkerRuntime final : public FailureSink {
 public:
  WorkerRuntime(int in_fd, int out_fd, uint32_t worker_id)
      : in_fd_(in_fd), out_fd_(out_fd), worker_id_(worker_id), reader_(nullptr, 0) {}

  InputStream<In> MakeInput() noexcept {
    return InputStream<In>(this, &WorkerRuntime::NextThunk, &WorkerRuntime::IndexThunk);
  }

  Emitter<Out> MakeEmitter() noexcept {
    return Emitter<Out>(this, &WorkerRuntime::EmitThunk);
  }

  bool ChannelFailed() const noexcept { return channel_failed_; }

  /// @brief The body returned: finish the current item and say goodbye.
  void FinishNormally() {
    CompleteCurrent();
    ByteWriter w(results_);
    PutRecordHead(w, RecordKind::kExit, 0);
    ++result_count_;
    (void)Flush();
  }

  uint32_t WorkerId() const noexcept override { return worker_id_; }

  /// @brief The body threw: report it for the current item.
  void FinishWithError(const ErrorEnvelope& env) override {
    ByteWriter w(results_);
    PutRecordHead(w, RecordKind::kError, env.sequence_index);
    Serializer<ErrorEnvelope>::Encode(env, w);
    ++result_count_;
    (void)Flush();
  }

  uint64_t FailureIndex() const noexcept override {
    return has_current_ ? current_ : kNoIndex;
  }

 private:
  static bool NextThunk(void* self, In& out) {
    return static_cast<WorkerRuntime*>(self)->Next(out);
  }
  static uint64_t IndexThunk(const void* self) {
    return static_cast<const WorkerRuntime*>(self)->current_;
  }
  static void EmitThunk(void* self, const Out& v) {
    static_cast<WorkerRuntime*>(self)->Emit(v);
  }

  bool Next(In& out) {
    CompleteCurrent();
    if (exhausted_) return false;

    while (remaining_ == 0U) {
      if (!Flush()) return Stop();
      ChannelStatus s = RecvFrame(in_fd_, frame_);
      if (s == ChannelStatus::kClosed) {
        PMAP_LOG_DEBUG("Worker", "worker %u: input closed", worker_id_);
        exhausted_ = true;
        return false;
      }
      if (s != ChannelStatus::kOk || frame_.type != FrameType::kWorkBatch) {
        PMAP_LOG_ERROR("Worker", "worker %u: bad work batch (%s)", worker_id_,
                       ChannelStatusName(s));
        channel_failed_ = true;
        return Stop();
      }
      reader_ = ByteReader(frame_.payload.data(), frame_.payload.size());
      remaining_ = frame_.count;
    }

    uint64_t index = 0;
    if (!reader_.GetU64(index) || !Serializer<In>::Decode(reader_, out)) {
      PMAP_LOG_ERROR("Worker", "worker %u: undecodable input record", worker_id_);
      channel_failed_ = true;
      return Stop();
    }
    --remaining_;
    current_ = index;
    has_current_ = true;
    return true;
  }

  void Emit(const Out& v) {
    if (!has_current_) {
      PMAP_LOG_WARN("Worker", "worker %u: value emitted outside of an input, dropped",
                    worker_id_);
      return;
    }
    ByteWriter w(results_);
    PutRecordHead(w, RecordKind::kValue, current_);
    Serializer<Out>::Encode(v, w);
    ++result_count_;
    if (PMAP_UNLIKELY(results_.size() >= kResultFlushBytes)) (void)Flush();
  }

  void CompleteCurrent() {
    if (!has_current_) return;
    ByteWriter w(results_);
    PutRecordHead(w, RecordKind::kDone, current_);
    ++result_count_;
    has_current_ = false;
  }

  bool Flush() {
    if (result_count_ == 0U || channel_failed_) return !channel_failed_;
    ChannelStatus s = SendFrame(out_fd_, FrameType::kResultBatch, result_count_, results_);
    results_.clear();
    result_count_ = 0;
    if (s != ChannelStatus::kOk) {
      PMAP_LOG_DEBUG("Worker", "worker %u: result channel %s", worker_id_,
                     ChannelStatusName(s));
      channel_failed_ = true;
      return false;
    }
    return true;
  }

  bool Stop() noexcept {
    exhausted_ = true;
    remaining_ = 0;
    return false;
  }

  int in_fd_;
  int out_fd_;
  uint32_t worker_id_;

  Frame frame_;
  ByteReader reader_;
  uint32_t remaining_ = 0;
  uint64_t current_ = kNoIndex;
  bool has_current_ = false;
  bool exhausted_ = false;
  bool channel_failed_ = false;

  std::vector<uint8_t> results_;
  uint32_t result_count_ = 0;
};

}  // namespace detail

namespace detail {

/// @brief Run the body, catching what escapes it. Trace is taken at the catch.
template <typename In, typename Out>
int RunBodyCatching(const Worker<In, Out>& worker, WorkerRuntime<In, Out>& rt) noexcept {
  InputStream<In> in = rt.MakeInput();
  Emitter<Out> out = rt.MakeEmitter();
  try {
    worker(in, out);
    rt.FinishNormally();
  } catch (...) {
    ErrorEnvelope env = CaptureCurrentException(rt.WorkerId(), rt.FailureIndex());
    rt.FinishWithError(env);
    return kWorkerFailedExitCode;
  }
  return rt.ChannelFailed() ? kWorkerChannelExitCode : 0;
}

}  // namespace detail

/**
 * @brief Worker main loop, safe to call in-process.
 *
 * Runs @p worker once over the channel's worker side, converting an escaping
 * exception into an error record. Closes the worker side before returning.
 *
 * @return Process exit code.
 */
template <typename In, typename Out>
int RunWorker(const Worker<In, Out>& worker, ChannelPair& channel,
              uint32_t worker_id) noexcept {
  PMAP_LOG_DEBUG("Worker", "worker %u '%s' started (pid %d)", worker_id,
                 worker.Name().c_str(), static_cast<int>(::getpid()));

  int code = 0;
  {
    detail::WorkerRuntime<In, Out> rt(channel.InputReadFd(), channel.OutputWriteFd(),
                                      worker_id);
    code = detail::RunBodyCatching(worker, rt);
  }
  channel.CloseAll();
  return code;
}

/**
 * @brief Entry point of a forked worker process.
 *
 * Same records as RunWorker, but the body runs on a thread of its own with no
 * handler above it. An exception escaping the body therefore reaches
 * std::terminate before the stack unwinds, and the reported trace starts at
 * the function that threw. The process ends right after the error record is
 * sent, so this must only run in a forked child.
 *
 * @return Process exit code when the body did not throw.
 */
template <typename In, typename Out>
int RunWorkerProcess(const Worker<In, Out>& worker, ChannelPair& channel,
                     uint32_t worker_id) noexcept {
  PMAP_LOG_DEBUG("Worker", "worker %u '%s' started (pid %d)", worker_id,
                 worker.Name().c_str(), static_cast<int>(::getpid()));

  int code = 0;
  {
    detail::WorkerRuntime<In, Out> rt(channel.InputReadFd(), channel.OutputWriteFd(),
                                      worker_id);
    detail::ActiveFailureSink() = &rt;
    (void)std::set_terminate(&detail::ReportUncaughtAndExit);

    std::thread body;
    try {
      body = std::thread([&worker, &rt]() {
        InputStream<In> in = rt.MakeInput();
        Emitter<Out> out = rt.MakeEmitter();
        worker(in, out);
        rt.FinishNormally();
      });
    } catch (const std::system_error& e) {
      PMAP_LOG_WARN("Worker", "worker %u: no body thread (%s), running inline", worker_id,
                    e.what());
    }

    if (body.joinable()) {
      body.join();
      code = rt.ChannelFailed() ? kWorkerChannelExitCode : 0;
    } else {
      code = detail::RunBodyCatching(worker, rt);
    }
    detail::ActiveFailureSink() = nullptr;
  }
  channel.CloseAll();
  return code;
}

}  // namespace pmap

#endif  // PMAP_WORKER_HPP_
