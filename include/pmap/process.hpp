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
 * @file process.hpp
 * @brief Worker process control: fork a function, wait with timeout,
 *        terminate, and estimate how many workers the limits allow.
 *
 * Workers are forked without exec; the function to run is already in the
 * child's address space. Linux-only (requires /proc, prctl(2)).
 */

#ifndef PMAP_PROCESS_HPP_
#define PMAP_PROCESS_HPP_

#include "pmap/platform.hpp"
#include "pmap/log.hpp"
#include "pmap/vocabulary.hpp"

#include <cerrno>
#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <utility>

#include <dirent.h>
#include <signal.h>
#include <sys/prctl.h>
#include <sys/resource.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <time.h>
#include <unistd.h>

namespace pmap {

// ============================================================================
// ProcessResult
// ============================================================================

enum class ProcessResult : int8_t {
  kSuccess = 0,
  kFailed = -1,     ///< fork(2) or signal delivery failed
  kWaitError = -2,  ///< waitpid(2) error
};

/// Exit code of a worker whose coordinator died before it could start.
inline constexpr int kOrphanedExitCode = 126;

namespace detail {

class DirGuard {
 public:
  explicit DirGuard(DIR* dir) : dir_(dir) {}
  ~DirGuard() {
    if (dir_) {
      closedir(dir_);
    }
  }
  DIR* get() const { return dir_; }

  DirGuard(const DirGuard&) = delete;
  DirGuard& operator=(const DirGuard&) = delete;

 private:
  DIR* dir_;
};

/// @brief Sleep for @p ms milliseconds.
inline void SleepMs(uint32_t ms) {
  struct timespec ts;
  ts.tv_sec = static_cast<time_t>(ms / 1000U);
  ts.tv_nsec = static_cast<long>(ms % 1000U) * 1000000L;  // NOLINT
  while (nanosleep(&ts, &ts) != 0 && errno == EINTR) {
  }
}

inline bool IsDigitString(const char* s) {
  if (*s == '\0') return false;
  for (; *s != '\0'; ++s) {
    if (*s < '0' || *s > '9') return false;
  }
  return true;
}

}  // namespace detail

// ============================================================================
// WaitResult
// ============================================================================

struct WaitResult {
  bool exited;      ///< true if child exited normally
  int exit_code;    ///< valid if exited
  bool signaled;    ///< true if child was killed by a signal
  int term_signal;  ///< valid if signaled
  bool timed_out;   ///< true if the wait timed out

  WaitResult()
      : exited(false), exit_code(-1), signaled(false), term_signal(0), timed_out(false) {}

  bool Clean() const noexcept { return exited && exit_code == 0; }
};

// ============================================================================
// WorkerProcess
// ============================================================================

/**
 * @brief Owner of one forked worker.
 *
 * RAII: a child that was never reaped is SIGKILLed and reaped by the
 * destructor, so a WorkerProcess never leaves a zombie behind.
 *
 * @code
 *   auto proc = pmap::WorkerProcess::Spawn([]() noexcept { return 0; });
 *   if (proc.has_value()) {
 *     pmap::WaitResult wr = proc.value().Wait(1000);
 *   }
 * @endcode
 */
class WorkerProcess {
 public:
  WorkerProcess() : pid_(-1) {}
  ~WorkerProcess() { (void)Kill(); }

  WorkerProcess(const WorkerProcess&) = delete;
  WorkerProcess& operator=(const WorkerProcess&) = delete;

  WorkerProcess(WorkerProcess&& other) noexcept : pid_(other.pid_) { other.pid_ = -1; }
  WorkerProcess& operator=(WorkerProcess&& other) noexcept {
    if (this != &other) {
      (void)Kill();
      pid_ = other.pid_;
      other.pid_ = -1;
    }
    return *this;
  }

  /**
   * @brief Fork and run @p child_main in the child.
   *
   * The child never returns from Spawn: it calls _exit() with the value
   * returned by @p child_main, so atexit handlers and static destructors of
   * the parent image do not run twice. The child is SIGKILLed if the
   * coordinator dies.
   *
   * @note PR_SET_PDEATHSIG tracks the forking thread, not the process: the
   *       child is also killed when the thread that called Spawn exits,
   *       even if the rest of the process keeps running.
   *
   * @param child_main Callable `int()`; should be noexcept.
   */
  template <typename Fn>
  static expected<WorkerProcess, ProcessResult> Spawn(Fn&& child_main) {
    // Buffered stdio would otherwise be flushed by both processes.
    (void)std::fflush(nullptr);
    const pid_t parent = ::getpid();

    pid_t child = ::fork();
    if (child < 0) {
      PMAP_LOG_ERROR("Process", "fork failed: %s", std::strerror(errno));
      return expected<WorkerProcess, ProcessResult>::error(ProcessResult::kFailed);
    }

    if (child == 0) {
      (void)::prctl(PR_SET_PDEATHSIG, SIGKILL);
      if (::getppid() != parent) {
        ::_exit(kOrphanedExitCode);
      }
      int code = child_main();
      (void)std::fflush(nullptr);
      ::_exit(code);
    }

    return expected<WorkerProcess, ProcessResult>::success(WorkerProcess(child));
  }

  /// @brief Child pid, or -1 once reaped.
  pid_t GetPid() const noexcept { return pid_; }

  /// @brief Reap without blocking. timed_out is set if the child still runs.
  WaitResult TryWait() {
    WaitResult wr;
    if (pid_ <= 0) {
      wr.exited = true;
      return wr;
    }
    int status = 0;
    pid_t w = ::waitpid(pid_, &status, WNOHANG);
    if (w == pid_) {
      Fill(status, wr);
      pid_ = -1;
    } else if (w == 0) {
      wr.timed_out = true;
    } else if (errno == ECHILD) {
      pid_ = -1;
    } else {
      wr.timed_out = true;
    }
    return wr;
  }

  /**
   * @brief Wait for the child to exit.
   * @param timeout_ms 0 waits forever.
   */
  WaitResult Wait(uint32_t timeout_ms = 0) {
    if (pid_ <= 0) return TryWait();

    if (timeout_ms == 0) {
      WaitResult wr;
      int status = 0;
      pid_t w;
      do {
        w = ::waitpid(pid_, &status, 0);
      } while (w < 0 && errno == EINTR);
      if (w == pid_) Fill(status, wr);
      pid_ = -1;
      return wr;
    }

    constexpr uint32_t kPollIntervalMs = 2;
    const uint64_t deadline = SteadyNowMs() + timeout_ms;
    for (;;) {
      WaitResult wr = TryWait();
      if (!wr.timed_out || SteadyNowMs() >= deadline) return wr;
      detail::SleepMs(kPollIntervalMs);
    }
  }

  /**
   * @brief SIGKILL the child and reap it.
   * @return kSuccess also when there was nothing left to kill.
   */
  ProcessResult Kill() {
    if (pid_ <= 0) return ProcessResult::kSuccess;
    if (::kill(pid_, SIGKILL) != 0 && errno != ESRCH) {
      PMAP_LOG_WARN("Process", "kill(%d) failed: %s", static_cast<int>(pid_),
                    std::strerror(errno));
    }
    int status = 0;
    pid_t w;
    do {
      w = ::waitpid(pid_, &status, 0);
    } while (w < 0 && errno == EINTR);
    pid_ = -1;
    if (w < 0 && errno != ECHILD) return ProcessResult::kWaitError;
    return ProcessResult::kSuccess;
  }

 private:
  explicit WorkerProcess(pid_t pid) : pid_(pid) {}

  static void Fill(int status, WaitResult& wr) {
    if (WIFEXITED(status)) {
      wr.exited = true;
      wr.exit_code = WEXITSTATUS(status);
    }
    if (WIFSIGNALED(status)) {
      wr.signaled = true;
      wr.term_signal = WTERMSIG(status);
    }
  }

  pid_t pid_;
};

// ============================================================================
// Capacity
// ============================================================================

/// @brief Number of entries in /proc/self/fd, excluding the listing itself.
inline uint32_t CountOpenDescriptors() {
  detail::DirGuard dir(opendir("/proc/self/fd"));
  if (!dir.get()) return 0;
  uint32_t n = 0;
  const int self = dirfd(dir.get());
  struct dirent* entry;
  while ((entry = readdir(dir.get())) != nullptr) {
    if (!detail::IsDigitString(entry->d_name)) continue;
    if (std::atoi(entry->d_name) == self) continue;
    ++n;
  }
  return n;
}

/// Descriptors kept free for the caller while a pool is running.
inline constexpr uint32_t kReservedDescriptors = 16U;

/**
 * @brief Upper bound on the workers one more pool may start.
 *
 * Each worker holds two descriptors in the coordinator, plus two more while
 * its pipes are being created. The bound is also capped by RLIMIT_NPROC when
 * that limit is finite.
 */
inline uint32_t EstimateWorkerCapacity() {
  struct rlimit nofile;
  if (getrlimit(RLIMIT_NOFILE, &nofile) != 0) return 0;

  uint64_t fd_limit = (nofile.rlim_cur == RLIM_INFINITY) ? UINT32_MAX : nofile.rlim_cur;
  uint64_t used = CountOpenDescriptors() + kReservedDescriptors + 2U;
  uint64_t capacity = (fd_limit > used) ? (fd_limit - used) / 2U : 0U;

  struct rlimit nproc;
  if (getrlimit(RLIMIT_NPROC, &nproc) == 0 && nproc.rlim_cur != RLIM_INFINITY &&
      nproc.rlim_cur < capacity) {
    capacity = nproc.rlim_cur;
  }
  return (capacity > UINT32_MAX) ? UINT32_MAX : static_cast<uint32_t>(capacity);
}

}  // namespace pmap

#endif  // PMAP_PROCESS_HPP_
