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
 * @file io_poller.hpp
 * @brief Readiness wait over a small set of pipe descriptors, built on poll(2).
 *
 * The pool waits on at most two descriptors per worker, so a poll(2) set
 * rebuilt per wait is cheaper than keeping a kernel object around, and it
 * opens no descriptor of its own.
 */

#ifndef PMAP_IO_POLLER_HPP_
#define PMAP_IO_POLLER_HPP_

#include "pmap/platform.hpp"
#include "pmap/vocabulary.hpp"

#include <cerrno>
#include <cstdint>
#include <vector>

#include <poll.h>

namespace pmap {

// ============================================================================
// Error Enum
// ============================================================================

enum class PollerError : uint8_t {
  kAddFailed,
  kWaitFailed
};

// ============================================================================
// Event Types
// ============================================================================

enum class IoEvent : uint8_t {
  kReadable = 0x01,
  kWritable = 0x02,
  kError    = 0x04,
  kHangup   = 0x08
};

inline constexpr uint8_t operator|(IoEvent a, IoEvent b) {
  return static_cast<uint8_t>(a) | static_cast<uint8_t>(b);
}

inline constexpr bool HasEvent(uint8_t events, IoEvent ev) {
  return (events & static_cast<uint8_t>(ev)) != 0U;
}

struct PollResult {
  int32_t fd;
  uint8_t events;  // bitmask of IoEvent
};

// ============================================================================
// IoPoller
// ============================================================================

class IoPoller {
 public:
  IoPoller() = default;

  IoPoller(const IoPoller&) = delete;
  IoPoller& operator=(const IoPoller&) = delete;
  IoPoller(IoPoller&&) noexcept = default;
  IoPoller& operator=(IoPoller&&) noexcept = default;

  /** @brief Watch @p fd for @p events (kReadable, kWritable). */
  expected<void, PollerError> Add(int32_t fd, uint8_t events);

  void Clear() noexcept {
    fds_.clear();
    results_.clear();
  }

  uint32_t Size() const noexcept { return static_cast<uint32_t>(fds_.size()); }

  /**
   * @brief Wait until a watched descriptor is ready.
   * @param timeout_ms  -1 for infinite, 0 for non-blocking.
   * @return Number of ready descriptors (0 on timeout). Interrupted waits
   *         are resumed with the remaining timeout.
   */
  expected<uint32_t, PollerError> Wait(int32_t timeout_ms = -1);

  /** @brief Results of the last Wait(). */
  const PollResult* Results() const noexcept { return results_.data(); }
  uint32_t ResultCount() const noexcept {
    return static_cast<uint32_t>(results_.size());
  }

 private:
  int32_t IndexOf(int32_t fd) const noexcept {
    for (size_t i = 0; i < fds_.size(); ++i) {
      if (fds_[i].fd == fd) return static_cast<int32_t>(i);
    }
    return -1;
  }

  static short ToPollEvents(uint8_t events) noexcept {
    short ev = 0;
    if (HasEvent(events, IoEvent::kReadable)) ev |= POLLIN;
    if (HasEvent(events, IoEvent::kWritable)) ev |= POLLOUT;
    return ev;
  }

  static uint8_t FromPollEvents(short revents) noexcept {
    uint8_t ev = 0;
    if (revents & POLLIN) ev |= static_cast<uint8_t>(IoEvent::kReadable);
    if (revents & POLLOUT) ev |= static_cast<uint8_t>(IoEvent::kWritable);
    if (revents & (POLLERR | POLLNVAL)) ev |= static_cast<uint8_t>(IoEvent::kError);
    if (revents & POLLHUP) ev |= static_cast<uint8_t>(IoEvent::kHangup);
    return ev;
  }

  std::vector<struct pollfd> fds_;
  std::vector<PollResult> results_;
};

// ============================================================================
// Inline Implementation
// ============================================================================

inline expected<void, PollerError> IoPoller::Add(int32_t fd, uint8_t events) {
  if (fd < 0 || IndexOf(fd) >= 0) {
    return expected<void, PollerError>::error(PollerError::kAddFailed);
  }
  struct pollfd p {};
  p.fd = fd;
  p.events = ToPollEvents(events);
  fds_.push_back(p);
  return expected<void, PollerError>::success();
}

inline expected<uint32_t, PollerError> IoPoller::Wait(int32_t timeout_ms) {
  results_.clear();
  const uint64_t deadline =
      (timeout_ms > 0) ? SteadyNowMs() + static_cast<uint64_t>(timeout_ms) : 0U;
  int32_t remaining = timeout_ms;

  for (;;) {
    int n = ::poll(fds_.data(), static_cast<nfds_t>(fds_.size()), remaining);
    if (n >= 0) break;
    if (errno != EINTR) {
      return expected<uint32_t, PollerError>::error(PollerError::kWaitFailed);
    }
    if (timeout_ms > 0) {
      uint64_t now = SteadyNowMs();
      if (now >= deadline) return expected<uint32_t, PollerError>::success(0U);
      remaining = static_cast<int32_t>(deadline - now);
    }
  }

  for (const auto& p : fds_) {
    if (p.revents != 0) {
      results_.push_back(PollResult{p.fd, FromPollEvents(p.revents)});
    }
  }
  return expected<uint32_t, PollerError>::success(
      static_cast<uint32_t>(results_.size()));
}

}  // namespace pmap

#endif  // PMAP_IO_POLLER_HPP_
