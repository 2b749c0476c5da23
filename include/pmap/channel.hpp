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
 * @file channel.hpp
 * @brief Framed, bounded, bidirectional pipe pair between the coordinator
 *        and one worker process.
 *
 * Wire format (native byte order, both ends are the same binary):
 *
 *   +-------+------+----------+-------+--------+---------------+
 *   | magic | type | reserved | count | length | payload ...   |
 *   |  u32  |  u8  |  u8[3]   |  u32  |  u32   | length bytes  |
 *   +-------+------+----------+-------+--------+---------------+
 *
 * Pipe capacity bounds what is buffered between the two processes. The
 * worker side reads and writes blocking. The coordinator writes through a
 * non-blocking FrameWriter so it can keep draining results while a worker's
 * input pipe is full.
 */

#ifndef PMAP_CHANNEL_HPP_
#define PMAP_CHANNEL_HPP_

#include "pmap/platform.hpp"
#include "pmap/log.hpp"
#include "pmap/vocabulary.hpp"

#include <cerrno>
#include <cstdint>
#include <cstring>
#include <utility>
#include <vector>

#include <fcntl.h>
#include <pthread.h>
#include <signal.h>
#include <time.h>
#include <unistd.h>

namespace pmap {

// ============================================================================
// Frame layout
// ============================================================================

inline constexpr uint32_t kFrameMagic = 0x50414D50U;  // "PMAP" in memory on little-endian
inline constexpr uint32_t kFrameHeaderSize = 16U;
inline constexpr uint32_t kMaxFrameBytes = 64U * 1024U * 1024U;

enum class FrameType : uint8_t {
  kWorkBatch = 1,    ///< coordinator -> worker: indexed inputs
  kResultBatch = 2,  ///< worker -> coordinator: value/error/done/exit records
};

struct FrameHeader {
  uint32_t magic;
  uint8_t type;
  uint8_t reserved[3];
  uint32_t count;   ///< records in the payload
  uint32_t length;  ///< payload bytes
};
static_assert(sizeof(FrameHeader) == kFrameHeaderSize, "FrameHeader must be 16 bytes");

struct Frame {
  FrameType type = FrameType::kWorkBatch;
  uint32_t count = 0;
  std::vector<uint8_t> payload;
};

enum class ChannelStatus : uint8_t {
  kOk = 0,
  kClosed,      ///< Peer closed on a frame boundary.
  kBroken,      ///< Peer vanished mid-frame, or wrote to a closed reader.
  kMalformed,   ///< Bad magic, unknown type or oversized frame.
  kWouldBlock,  ///< Non-blocking write made partial progress.
  kIoError,     ///< Any other errno.
};

inline const char* ChannelStatusName(ChannelStatus s) noexcept {
  switch (s) {
    case ChannelStatus::kOk:         return "ok";
    case ChannelStatus::kClosed:     return "closed";
    case ChannelStatus::kBroken:     return "broken";
    case ChannelStatus::kMalformed:  return "malformed";
    case ChannelStatus::kWouldBlock: return "would block";
    case ChannelStatus::kIoError:    return "io error";
    default:                         return "unknown";
  }
}

// ============================================================================
// PipeEnd - RAII owner of one descriptor
// ============================================================================

class PipeEnd {
 public:
  PipeEnd() noexcept : fd_(-1) {}
  explicit PipeEnd(int fd) noexcept : fd_(fd) {}
  ~PipeEnd() { Close(); }

  PipeEnd(PipeEnd&& other) noexcept : fd_(other.fd_) { other.fd_ = -1; }
  PipeEnd& operator=(PipeEnd&& other) noexcept {
    if (this != &other) {
      Close();
      fd_ = other.fd_;
      other.fd_ = -1;
    }
    return *this;
  }

  PipeEnd(const PipeEnd&) = delete;
  PipeEnd& operator=(const PipeEnd&) = delete;

  int Fd() const noexcept { return fd_; }
  bool IsOpen() const noexcept { return fd_ >= 0; }

  /// @brief Close once; later calls are no-ops. EINTR still releases the fd on Linux.
  void Close() noexcept {
    if (fd_ >= 0) {
      (void)::close(fd_);
      fd_ = -1;
    }
  }

 private:
  int fd_;
};

namespace detail {

// ============================================================================
// SIGPIPE suppression
// ============================================================================

/**
 * @brief Blocks SIGPIPE on the calling thread for the guard's lifetime.
 *
 * If a write failed with EPIPE, the SIGPIPE it raised is consumed before the
 * old mask is restored. A SIGPIPE already pending on entry is left alone.
 */
class SigpipeGuard {
 public:
  SigpipeGuard() noexcept {
    sigset_t pending;
    sigemptyset(&pending);
    (void)sigpending(&pending);
    was_pending_ = (sigismember(&pending, SIGPIPE) == 1);
    if (!was_pending_) {
      sigset_t block;
      sigemptyset(&block);
      sigaddset(&block, SIGPIPE);
      (void)pthread_sigmask(SIG_BLOCK, &block, &old_mask_);
    }
  }

  ~SigpipeGuard() {
    if (was_pending_) return;
    if (epipe_) {
      sigset_t sigpipe;
      sigemptyset(&sigpipe);
      sigaddset(&sigpipe, SIGPIPE);
      struct timespec zero = {0, 0};
      while (sigtimedwait(&sigpipe, nullptr, &zero) == -1 && errno == EINTR) {
      }
    }
    (void)pthread_sigmask(SIG_SETMASK, &old_mask_, nullptr);
  }

  void NoteEpipe() noexcept { epipe_ = true; }

  SigpipeGuard(const SigpipeGuard&) = delete;
  SigpipeGuard& operator=(const SigpipeGuard&) = delete;

 private:
  sigset_t old_mask_;
  bool was_pending_ = false;
  bool epipe_ = false;
};

inline void EncodeHeader(FrameType type, uint32_t count, uint32_t length,
                         uint8_t* out) noexcept {
  FrameHeader h;
  std::memset(&h, 0, sizeof(h));
  h.magic = kFrameMagic;
  h.type = static_cast<uint8_t>(type);
  h.count = count;
  h.length = length;
  std::memcpy(out, &h, sizeof(h));
}

inline ChannelStatus DecodeHeader(const uint8_t* in, FrameHeader& h) noexcept {
  std::memcpy(&h, in, sizeof(h));
  if (PMAP_UNLIKELY(h.magic != kFrameMagic)) return ChannelStatus::kMalformed;
  if (h.type != static_cast<uint8_t>(FrameType::kWorkBatch) &&
      h.type != static_cast<uint8_t>(FrameType::kResultBatch)) {
    return ChannelStatus::kMalformed;
  }
  if (PMAP_UNLIKELY(h.length > kMaxFrameBytes)) return ChannelStatus::kMalformed;
  return ChannelStatus::kOk;
}

/**
 * @brief Read exactly @p len bytes.
 * @return kOk, kClosed if EOF came before the first byte and
 *         @p eof_is_clean, kBroken on any other EOF, kIoError otherwise.
 */
inline ChannelStatus ReadExact(int fd, uint8_t* buf, size_t len,
                               bool eof_is_clean) noexcept {
  size_t got = 0;
  while (got < len) {
    ssize_t n = ::read(fd, buf + got, len - got);
    if (n > 0) {
      got += static_cast<size_t>(n);
      continue;
    }
    if (n == 0) {
      return (got == 0U && eof_is_clean) ? ChannelStatus::kClosed
                                         : ChannelStatus::kBroken;
    }
    if (errno == EINTR) continue;
    return ChannelStatus::kIoError;
  }
  return ChannelStatus::kOk;
}

/// @brief Blocking write of the whole buffer.
inline ChannelStatus WriteAll(int fd, const uint8_t* data, size_t len) noexcept {
  SigpipeGuard guard;
  size_t sent = 0;
  while (sent < len) {
    ssize_t n = ::write(fd, data + sent, len - sent);
    if (n >= 0) {
      sent += static_cast<size_t>(n);
      continue;
    }
    if (errno == EINTR) continue;
    if (errno == EPIPE) {
      guard.NoteEpipe();
      return ChannelStatus::kBroken;
    }
    return ChannelStatus::kIoError;
  }
  return ChannelStatus::kOk;
}

inline bool SetNonBlocking(int fd) noexcept {
  int flags = ::fcntl(fd, F_GETFL, 0);
  if (flags < 0) return false;
  return ::fcntl(fd, F_SETFL, flags | O_NONBLOCK) == 0;
}

}  // namespace detail

// ============================================================================
// Blocking frame I/O
// ============================================================================

/**
 * @brief Send one frame, blocking while the pipe is full.
 * @return kOk, kBroken if the reader is gone, kMalformed if oversized.
 */
inline ChannelStatus SendFrame(int fd, FrameType type, uint32_t count,
                               const std::vector<uint8_t>& payload) {
  if (payload.size() > kMaxFrameBytes) return ChannelStatus::kMalformed;
  std::vector<uint8_t> wire(kFrameHeaderSize + payload.size());
  detail::EncodeHeader(type, count, static_cast<uint32_t>(payload.size()),
                       wire.data());
  if (!payload.empty()) {
    std::memcpy(wire.data() + kFrameHeaderSize, payload.data(), payload.size());
  }
  return detail::WriteAll(fd, wire.data(), wire.size());
}

/**
 * @brief Receive one frame, blocking until it is complete.
 * @return kOk, kClosed on EOF at a frame boundary, kBroken on EOF inside a
 *         frame, kMalformed on a bad header.
 */
inline ChannelStatus RecvFrame(int fd, Frame& out) {
  uint8_t raw[kFrameHeaderSize];
  ChannelStatus s = detail::ReadExact(fd, raw, sizeof(raw), true);
  if (s != ChannelStatus::kOk) return s;

  FrameHeader h;
  s = detail::DecodeHeader(raw, h);
  if (s != ChannelStatus::kOk) return s;

  out.type = static_cast<FrameType>(h.type);
  out.count = h.count;
  out.payload.resize(h.length);
  if (h.length == 0U) return ChannelStatus::kOk;
  return detail::ReadExact(fd, out.payload.data(), h.length, false);
}

// ============================================================================
// FrameWriter - non-blocking send with resumable progress
// ============================================================================

/**
 * @brief Holds one encoded frame and writes it to a non-blocking descriptor
 *        in as many steps as the pipe requires.
 */
class FrameWriter {
 public:
  bool Idle() const noexcept { return offset_ >= wire_.size(); }

  /// @pre Idle().
  ChannelStatus Load(FrameType type, uint32_t count,
                     const std::vector<uint8_t>& payload) {
    PMAP_ASSERT(Idle());
    if (payload.size() > kMaxFrameBytes) return ChannelStatus::kMalformed;
    wire_.resize(kFrameHeaderSize + payload.size());
    detail::EncodeHeader(type, count, static_cast<uint32_t>(payload.size()),
                         wire_.data());
    if (!payload.empty()) {
      std::memcpy(wire_.data() + kFrameHeaderSize, payload.data(), payload.size());
    }
    offset_ = 0;
    return ChannelStatus::kOk;
  }

  /**
   * @brief Write as much as the pipe accepts.
   * @return kOk when the frame is fully written, kWouldBlock when the pipe
   *         filled up first, kBroken when the reader is gone.
   */
  ChannelStatus Pump(int fd) noexcept {
    detail::SigpipeGuard guard;
    while (offset_ < wire_.size()) {
      ssize_t n = ::write(fd, wire_.data() + offset_, wire_.size() - offset_);
      if (n >= 0) {
        offset_ += static_cast<size_t>(n);
        continue;
      }
      if (errno == EINTR) continue;
      if (errno == EAGAIN || errno == EWOULDBLOCK) return ChannelStatus::kWouldBlock;
      if (errno == EPIPE) {
        guard.NoteEpipe();
        return ChannelStatus::kBroken;
      }
      return ChannelStatus::kIoError;
    }
    wire_.clear();
    offset_ = 0;
    return ChannelStatus::kOk;
  }

  void Reset() noexcept {
    wire_.clear();
    offset_ = 0;
  }

 private:
  std::vector<uint8_t> wire_;
  size_t offset_ = 0;
};

// ============================================================================
// ChannelPair
// ============================================================================

/**
 * @brief The two pipes linking the coordinator with one worker.
 *
 * Created before fork. Afterwards the coordinator calls CloseWorkerSide()
 * and the child calls CloseCoordinatorSide(), so each process holds only its
 * own two ends and EOF propagates when the other side closes.
 */
class ChannelPair {
 public:
  ChannelPair() = default;
  ChannelPair(ChannelPair&&) noexcept = default;
  ChannelPair& operator=(ChannelPair&&) noexcept = default;

  /// @brief Create both pipes with O_CLOEXEC.
  static expected<ChannelPair, ChannelStatus> Open() {
    int in_fds[2];
    if (::pipe2(in_fds, O_CLOEXEC) != 0) {
      PMAP_LOG_ERROR("Channel", "pipe2 failed: %s", std::strerror(errno));
      return expected<ChannelPair, ChannelStatus>::error(ChannelStatus::kIoError);
    }
    PipeEnd in_read(in_fds[0]);
    PipeEnd in_write(in_fds[1]);

    int out_fds[2];
    if (::pipe2(out_fds, O_CLOEXEC) != 0) {
      PMAP_LOG_ERROR("Channel", "pipe2 failed: %s", std::strerror(errno));
      return expected<ChannelPair, ChannelStatus>::error(ChannelStatus::kIoError);
    }

    ChannelPair pair;
    pair.input_read_ = std::move(in_read);
    pair.input_write_ = std::move(in_write);
    pair.output_read_ = PipeEnd(out_fds[0]);
    pair.output_write_ = PipeEnd(out_fds[1]);
    return expected<ChannelPair, ChannelStatus>::success(std::move(pair));
  }

  // --- coordinator side ---

  /// @brief Coordinator end of the input pipe; switched to non-blocking.
  int InputWriteFd() const noexcept { return input_write_.Fd(); }
  int OutputReadFd() const noexcept { return output_read_.Fd(); }

  bool MakeInputNonBlocking() noexcept {
    return input_write_.IsOpen() && detail::SetNonBlocking(input_write_.Fd());
  }

  /// @brief Signal end of input to the worker.
  void CloseInput() noexcept { input_write_.Close(); }
  void CloseOutput() noexcept { output_read_.Close(); }

  void CloseWorkerSide() noexcept {
    input_read_.Close();
    output_write_.Close();
  }

  // --- worker side ---

  int InputReadFd() const noexcept { return input_read_.Fd(); }
  int OutputWriteFd() const noexcept { return output_write_.Fd(); }

  void CloseCoordinatorSide() noexcept {
    input_write_.Close();
    output_read_.Close();
  }

  void CloseAll() noexcept {
    CloseWorkerSide();
    CloseCoordinatorSide();
  }

  /// @brief Descriptors this pair still owns.
  std::vector<int> OpenDescriptors() const {
    std::vector<int> fds;
    for (const PipeEnd* e : {&input_read_, &input_write_, &output_read_, &output_write_}) {
      if (e->IsOpen()) fds.push_back(e->Fd());
    }
    return fds;
  }

 private:
  PipeEnd input_read_;    // worker reads work batches
  PipeEnd input_write_;   // coordinator writes work batches
  PipeEnd output_read_;   // coordinator reads result batches
  PipeEnd output_write_;  // worker writes result batches
};

}  // namespace pmap

#endif  // PMAP_CHANNEL_HPP_
