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
 * @file error.hpp
 * @brief Pool failure taxonomy and cross-process exception marshaling.
 *
 * A user exception thrown inside a worker never crosses the channel as a
 * C++ exception. The worker converts it into an ErrorEnvelope (type name,
 * message, backtrace) that travels as an ordinary record; the coordinator
 * surfaces it as PoolFailure{kWorkerException}.
 */

#ifndef PMAP_ERROR_HPP_
#define PMAP_ERROR_HPP_

#include "pmap/platform.hpp"
#include "pmap/codec.hpp"
#include "pmap/log.hpp"

#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <exception>
#include <memory>
#include <string>
#include <typeinfo>
#include <utility>
#include <vector>

#include <boost/stacktrace.hpp>

#include <cxxabi.h>
#include <sys/types.h>
#include <unistd.h>

namespace pmap {

// ============================================================================
// PoolError
// ============================================================================

enum class PoolError : uint8_t {
  kConstructionFailed = 0,  ///< A worker failed to start; pool rolled back.
  kWorkerException,         ///< The user transformation threw.
  kChannelError,            ///< Broken pipe, truncated or malformed frame.
  kWorkerExited,            ///< A worker ended while items were outstanding.
  kClosed,                  ///< Operation on a closed pool.
  kInvalidState,            ///< Stream mode misuse.
  kInvalidArgument,         ///< Invalid options.
};

inline const char* PoolErrorName(PoolError e) noexcept {
  switch (e) {
    case PoolError::kConstructionFailed: return "construction failed";
    case PoolError::kWorkerException:    return "worker exception";
    case PoolError::kChannelError:       return "channel error";
    case PoolError::kWorkerExited:       return "worker exited";
    case PoolError::kClosed:             return "pool closed";
    case PoolError::kInvalidState:       return "invalid state";
    case PoolError::kInvalidArgument:    return "invalid argument";
    default:                             return "unknown";
  }
}

// ============================================================================
// ErrorEnvelope
// ============================================================================

/**
 * @brief A worker-side failure, marshaled for the coordinator.
 */
struct ErrorEnvelope {
  uint32_t origin_worker = 0;
  int32_t origin_pid = 0;
  uint64_t sequence_index = 0;
  std::string exception_kind;   ///< e.g. "std::invalid_argument"
  std::string message;          ///< what()
  std::string formatted_trace;  ///< symbolized worker backtrace

  /// @brief "<kind>: <message>".
  std::string Summary() const { return exception_kind + ": " + message; }
};

template <>
struct Serializer<ErrorEnvelope> {
  static void Encode(const ErrorEnvelope& e, ByteWriter& w) {
    w.PutU32(e.origin_worker);
    w.PutPod(e.origin_pid);
    w.PutU64(e.sequence_index);
    Serializer<std::string>::Encode(e.exception_kind, w);
    Serializer<std::string>::Encode(e.message, w);
    Serializer<std::string>::Encode(e.formatted_trace, w);
  }

  static bool Decode(ByteReader& r, ErrorEnvelope& e) {
    return r.GetU32(e.origin_worker) && r.GetPod(e.origin_pid) &&
           r.GetU64(e.sequence_index) && r.GetString(e.exception_kind) &&
           r.GetString(e.message) && r.GetString(e.formatted_trace);
  }
};

// ============================================================================
// PoolFailure
// ============================================================================

/**
 * @brief The error type of every fallible pool operation.
 *
 * For kWorkerException the envelope is set; it is shared and immutable.
 */
struct PoolFailure {
  PoolError code = PoolError::kInvalidState;
  std::shared_ptr<const ErrorEnvelope> envelope;
  std::string detail;

  static PoolFailure Make(PoolError code, std::string detail) {
    PoolFailure f;
    f.code = code;
    f.detail = std::move(detail);
    return f;
  }

  static PoolFailure FromEnvelope(ErrorEnvelope env) {
    PoolFailure f;
    f.code = PoolError::kWorkerException;
    f.detail = env.Summary();
    f.envelope = std::make_shared<const ErrorEnvelope>(std::move(env));
    return f;
  }

  bool IsWorkerException() const noexcept {
    return code == PoolError::kWorkerException && envelope != nullptr;
  }

  /**
   * @brief Human-readable description.
   *
   * Worker exceptions read "<kind>: <message>" followed by the worker trace.
   */
  std::string Message() const {
    if (IsWorkerException()) {
      std::string out = envelope->Summary();
      if (!envelope->formatted_trace.empty()) {
        out += "\n";
        out += envelope->formatted_trace;
      }
      return out;
    }
    std::string out = PoolErrorName(code);
    if (!detail.empty()) {
      out += ": ";
      out += detail;
    }
    return out;
  }
};

// ============================================================================
// Capture (worker side)
// ============================================================================

#ifndef PMAP_TRACE_MAX_FRAMES
#define PMAP_TRACE_MAX_FRAMES 64
#endif

namespace detail {

inline std::string Demangle(const char* mangled) {
  if (mangled == nullptr) return "unknown";
  int status = 0;
  char* readable = abi::__cxa_demangle(mangled, nullptr, nullptr, &status);
  if (status != 0 || readable == nullptr) return mangled;
  std::string out(readable);
  std::free(readable);
  return out;
}

/// @brief True for the runtime entry points that start an unwind.
inline bool IsThrowEntry(const std::string& name) {
  return name.find("__cxa_throw") != std::string::npos ||
         name.find("__cxa_rethrow") != std::string::npos ||
         name.find("rethrow_exception") != std::string::npos;
}

/**
 * @brief Symbolized backtrace of the calling thread.
 *
 * When the stack still holds the frames of an exception being thrown (the
 * worker terminate path), frames above the runtime throw entry are dropped
 * and the trace starts at the function that threw. Otherwise it starts at
 * the caller.
 */
inline std::string FormatBacktrace(uint32_t worker_id, pid_t pid) {
  char head[96];
  (void)std::snprintf(head, sizeof(head), "Traceback (worker %u, pid %d):\n",
                      worker_id, static_cast<int>(pid));
  std::string out(head);

  boost::stacktrace::stacktrace st(1, PMAP_TRACE_MAX_FRAMES);
  if (st.empty()) {
    out += "  <no frames>\n";
    return out;
  }

  // Return addresses point past the call; name the call itself.
  std::vector<boost::stacktrace::frame> calls;
  calls.reserve(st.size());
  for (const boost::stacktrace::frame& f : st) {
    calls.emplace_back(static_cast<const void*>(static_cast<const char*>(f.address()) - 1));
  }

  std::vector<std::string> names(calls.size());
  size_t first = 0;
  for (size_t i = 0; i < calls.size(); ++i) {
    names[i] = calls[i].name();
    if (IsThrowEntry(names[i])) {
      first = i + 1;
      break;
    }
  }

  for (size_t i = first; i < calls.size(); ++i) {
    char line[64];
    (void)std::snprintf(line, sizeof(line), "  #%-2u ", static_cast<unsigned>(i - first));
    out += line;
    if (names[i].empty()) names[i] = calls[i].name();
    if (names[i].empty()) {
      (void)std::snprintf(line, sizeof(line), "%p", calls[i].address());
      out += line;
    } else {
      out += names[i];
    }
    const size_t src_line = calls[i].source_line();
    if (src_line != 0U) {
      out += " at ";
      out += calls[i].source_file();
      out += ':';
      out += std::to_string(src_line);
    }
    out += '\n';
  }
  return out;
}

}  // namespace detail

/**
 * @brief Build an envelope from the exception currently being handled.
 * @pre Called from inside a catch block, or from a terminate handler entered
 *      for an uncaught exception.
 */
inline ErrorEnvelope CaptureCurrentException(uint32_t worker_id, uint64_t index) {
  ErrorEnvelope env;
  env.origin_worker = worker_id;
  env.origin_pid = static_cast<int32_t>(::getpid());
  env.sequence_index = index;

  std::exception_ptr current = std::current_exception();
  if (current) {
    try {
      std::rethrow_exception(current);
    } catch (const std::exception& e) {
      env.exception_kind = detail::Demangle(typeid(e).name());
      env.message = e.what();
    } catch (...) {
      const std::type_info* ti = abi::__cxa_current_exception_type();
      env.exception_kind = "unknown";
      env.message = "non-standard exception";
      if (ti != nullptr) {
        env.message += " of type ";
        env.message += detail::Demangle(ti->name());
      }
    }
  } else {
    env.exception_kind = "unknown";
  }

  env.formatted_trace = detail::FormatBacktrace(worker_id, ::getpid());
  env.formatted_trace += env.Summary();
  env.formatted_trace += '\n';
  return env;
}

// ============================================================================
// Print hook (coordinator side)
// ============================================================================

/**
 * @brief Default diagnostic hook: one error log line plus the worker trace.
 */
inline void PrintException(const ErrorEnvelope& env, void* /*ctx*/) {
  PMAP_LOG_ERROR("Pool", "worker %u (pid %d) failed on input #%llu: %s",
                 env.origin_worker, static_cast<int>(env.origin_pid),
                 static_cast<unsigned long long>(env.sequence_index),
                 env.Summary().c_str());
  if (!env.formatted_trace.empty()) {
    (void)std::fputs(env.formatted_trace.c_str(), stderr);
    (void)std::fflush(stderr);
  }
}

}  // namespace pmap

#endif  // PMAP_ERROR_HPP_
