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
 * @file log.hpp
 * @brief Leveled, printf-style synchronous logger.
 *
 * Each record is formatted into a stack buffer and written to stderr with a
 * single fprintf, so lines from the coordinator and from forked workers do
 * not interleave mid-line.
 *
 * Output format:
 *   [2024-05-01 12:00:00.123] [INFO] [Pool] forked 4 workers (pool.hpp:210)
 *
 * Compile-time floor: PMAP_LOG_MIN_LEVEL (0=DEBUG .. 4=FATAL). Calls below
 * the floor compile to nothing. Runtime threshold: SetLevel().
 */

#ifndef PMAP_LOG_HPP_
#define PMAP_LOG_HPP_

#include "pmap/platform.hpp"

#include <atomic>
#include <cstdarg>
#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <cstring>

#include <strings.h>
#include <time.h>
#include <unistd.h>

#ifndef PMAP_LOG_MIN_LEVEL
#define PMAP_LOG_MIN_LEVEL 0
#endif

#ifndef PMAP_LOG_LINE_MAX
#define PMAP_LOG_LINE_MAX 512U
#endif

namespace pmap {
namespace log {

// ============================================================================
// Level
// ============================================================================

enum class Level : uint8_t {
  kDebug = 0,
  kInfo = 1,
  kWarn = 2,
  kError = 3,
  kFatal = 4,
  kOff = 5
};

namespace detail {

inline Level DefaultLevel() noexcept {
#ifdef NDEBUG
  return Level::kInfo;
#else
  return Level::kDebug;
#endif
}

inline std::atomic<Level>& LogLevelRef() noexcept {
  static std::atomic<Level> level{DefaultLevel()};
  return level;
}

inline const char* LevelTag(Level level) noexcept {
  switch (level) {
    case Level::kDebug: return "DEBUG";
    case Level::kInfo:  return "INFO";
    case Level::kWarn:  return "WARN";
    case Level::kError: return "ERROR";
    case Level::kFatal: return "FATAL";
    default:            return "OFF";
  }
}

inline const char* Basename(const char* path) noexcept {
  if (path == nullptr) return "?";
  const char* slash = std::strrchr(path, '/');
  return (slash != nullptr) ? slash + 1 : path;
}

inline void FormatTimestamp(char* buf, size_t bufsz) noexcept {
  struct timespec ts;
  clock_gettime(CLOCK_REALTIME, &ts);
  struct tm tm_local;
  localtime_r(&ts.tv_sec, &tm_local);
  (void)snprintf(buf, bufsz, "%04d-%02d-%02d %02d:%02d:%02d.%03ld",
                 tm_local.tm_year + 1900, tm_local.tm_mon + 1, tm_local.tm_mday,
                 tm_local.tm_hour, tm_local.tm_min, tm_local.tm_sec,
                 ts.tv_nsec / 1000000L);
}

}  // namespace detail

// ============================================================================
// Runtime control
// ============================================================================

inline void SetLevel(Level level) noexcept {
  detail::LogLevelRef().store(level, std::memory_order_relaxed);
}

inline Level GetLevel() noexcept {
  return detail::LogLevelRef().load(std::memory_order_relaxed);
}

/// @brief Set the threshold. Output works before Init() as well.
inline void Init(Level level = detail::DefaultLevel()) noexcept { SetLevel(level); }

/// @brief Flush pending output.
inline void Shutdown() noexcept { (void)std::fflush(stderr); }

/**
 * @brief Parse a level name ("debug", "info", "warn", "error", "fatal", "off").
 * @return true and sets @p out on a recognized name.
 */
inline bool ParseLevel(const char* name, Level& out) noexcept {
  if (name == nullptr) return false;
  static constexpr struct {
    const char* name;
    Level level;
  } kNames[] = {{"debug", Level::kDebug}, {"info", Level::kInfo},
                {"warn", Level::kWarn},   {"error", Level::kError},
                {"fatal", Level::kFatal}, {"off", Level::kOff}};
  for (const auto& n : kNames) {
    if (strcasecmp(name, n.name) == 0) {
      out = n.level;
      return true;
    }
  }
  return false;
}

// ============================================================================
// Write path
// ============================================================================

inline void LogWriteVa(Level level, const char* category, const char* file,
                       int line, const char* fmt, va_list args) noexcept {
  if (static_cast<uint8_t>(level) < static_cast<uint8_t>(GetLevel())) {
    return;
  }

  char ts[32];
  detail::FormatTimestamp(ts, sizeof(ts));

  char msg[PMAP_LOG_LINE_MAX];
  (void)vsnprintf(msg, sizeof(msg), fmt, args);

  (void)std::fprintf(stderr, "[%s] [%s] [%s] %s (%s:%d)\n", ts,
                     detail::LevelTag(level),
                     (category != nullptr) ? category : "-", msg,
                     detail::Basename(file), line);
  if (static_cast<uint8_t>(level) >= static_cast<uint8_t>(Level::kError)) {
    (void)std::fflush(stderr);
  }
}

inline void LogWrite(Level level, const char* category, const char* file,
                     int line, const char* fmt, ...) noexcept
    __attribute__((format(printf, 5, 6)));

inline void LogWrite(Level level, const char* category, const char* file,
                     int line, const char* fmt, ...) noexcept {
  va_list args;
  va_start(args, fmt);
  LogWriteVa(level, category, file, line, fmt, args);
  va_end(args);
}

}  // namespace log
}  // namespace pmap

// ============================================================================
// Macros
// ============================================================================

#define PMAP_LOG_DEBUG(cat, fmt, ...)                                        \
  do {                                                                      \
    if (PMAP_LOG_MIN_LEVEL <= 0) {                                          \
      ::pmap::log::LogWrite(::pmap::log::Level::kDebug, cat, __FILE__,      \
                            __LINE__, fmt, ##__VA_ARGS__);                  \
    }                                                                       \
  } while (0)

#define PMAP_LOG_INFO(cat, fmt, ...)                                         \
  do {                                                                      \
    if (PMAP_LOG_MIN_LEVEL <= 1) {                                          \
      ::pmap::log::LogWrite(::pmap::log::Level::kInfo, cat, __FILE__,       \
                            __LINE__, fmt, ##__VA_ARGS__);                  \
    }                                                                       \
  } while (0)

#define PMAP_LOG_WARN(cat, fmt, ...)                                         \
  do {                                                                      \
    if (PMAP_LOG_MIN_LEVEL <= 2) {                                          \
      ::pmap::log::LogWrite(::pmap::log::Level::kWarn, cat, __FILE__,       \
                            __LINE__, fmt, ##__VA_ARGS__);                  \
    }                                                                       \
  } while (0)

#define PMAP_LOG_ERROR(cat, fmt, ...)                                        \
  do {                                                                      \
    if (PMAP_LOG_MIN_LEVEL <= 3) {                                          \
      ::pmap::log::LogWrite(::pmap::log::Level::kError, cat, __FILE__,      \
                            __LINE__, fmt, ##__VA_ARGS__);                  \
    }                                                                       \
  } while (0)

#define PMAP_LOG_FATAL(cat, fmt, ...)                                        \
  do {                                                                      \
    ::pmap::log::LogWrite(::pmap::log::Level::kFatal, cat, __FILE__,        \
                          __LINE__, fmt, ##__VA_ARGS__);                    \
    std::abort();                                                           \
  } while (0)

#endif  // PMAP_LOG_HPP_
