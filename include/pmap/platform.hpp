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
 * @file platform.hpp
 * @brief Platform detection, compiler hints, assertion macros and clocks.
 *
 * pmap forks worker processes and inspects /proc, so only Linux is
 * supported. Every other pmap header includes this one first.
 */

#ifndef PMAP_PLATFORM_HPP_
#define PMAP_PLATFORM_HPP_

#include <cstddef>
#include <cstdint>
#include <cstdio>
#include <cstdlib>

#include <time.h>

namespace pmap {

// ============================================================================
// Platform Detection
// ============================================================================

#if defined(__linux__)
#define PMAP_PLATFORM_LINUX 1
#else
#error "pmap requires Linux (fork(2), pipe2(2) and /proc)"
#endif

// ============================================================================
// Compiler Hints
// ============================================================================

#if defined(__GNUC__) || defined(__clang__)
#define PMAP_LIKELY(x) __builtin_expect(!!(x), 1)
#define PMAP_UNLIKELY(x) __builtin_expect(!!(x), 0)
#else
#define PMAP_LIKELY(x) (x)
#define PMAP_UNLIKELY(x) (x)
#endif

// ============================================================================
// Assert Macro
// ============================================================================

namespace detail {

/**
 * @brief Called when an assertion fails in debug mode.
 *
 * Prints the failed condition, file, and line to stderr, then aborts.
 */
inline void AssertFail(const char* cond, const char* file, int line) {
  (void)std::fprintf(stderr, "PMAP_ASSERT failed: %s at %s:%d\n", cond, file, line);
  std::abort();
}

}  // namespace detail

#ifdef NDEBUG
#define PMAP_ASSERT(cond) ((void)0)
#else
#define PMAP_ASSERT(cond)                                                    \
  ((cond) ? ((void)0) : ::pmap::detail::AssertFail(#cond, __FILE__, __LINE__))
#endif

// ============================================================================
// Clocks
// ============================================================================

/// @brief Monotonic time in milliseconds (CLOCK_MONOTONIC).
inline uint64_t SteadyNowMs() noexcept {
  struct timespec ts;
  clock_gettime(CLOCK_MONOTONIC, &ts);
  return static_cast<uint64_t>(ts.tv_sec) * 1000U +
         static_cast<uint64_t>(ts.tv_nsec / 1000000L);
}

}  // namespace pmap

#endif  // PMAP_PLATFORM_HPP_
