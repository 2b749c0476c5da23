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
 * @file options.hpp
 * @brief PoolOptions: tunables shared by the pool, the sugar layer and the
 *        configuration loader.
 */

#ifndef PMAP_OPTIONS_HPP_
#define PMAP_OPTIONS_HPP_

#include "pmap/platform.hpp"

#include <cstdint>
#include <thread>

namespace pmap {

struct ErrorEnvelope;
class PoolObserver;

/**
 * @brief Diagnostic hook invoked once per worker failure, on receipt.
 * @param envelope The failure as marshaled by the worker.
 * @param ctx      PoolOptions::exception_printer_ctx.
 */
using ExceptionPrintFn = void (*)(const ErrorEnvelope& envelope, void* ctx);

inline constexpr uint32_t kDefaultChunkSize = 1U;
inline constexpr uint32_t kDefaultInFlightPerWorker = 1U;
inline constexpr uint32_t kDefaultShutdownGraceMs = 2000U;

/// @brief Worker count used when none is requested: one per online CPU.
inline uint32_t DefaultWorkerCount() noexcept {
  uint32_t n = std::thread::hardware_concurrency();
  return (n == 0U) ? 1U : n;
}

struct PoolOptions {
  /// Used by the sugar layer; 0 selects DefaultWorkerCount().
  uint32_t num_workers = 0U;
  /// Inputs per work batch. 1 dispatches item by item.
  uint32_t chunk_size = kDefaultChunkSize;
  /// Outstanding batches allowed per worker.
  uint32_t in_flight_per_worker = kDefaultInFlightPerWorker;
  /// How long Close() waits for workers to exit before SIGKILL.
  uint32_t shutdown_grace_ms = kDefaultShutdownGraceMs;
  /// nullptr selects PrintException().
  ExceptionPrintFn exception_printer = nullptr;
  void* exception_printer_ctx = nullptr;
  /// Not owned; must outlive the pool.
  PoolObserver* observer = nullptr;
};

}  // namespace pmap

#endif  // PMAP_OPTIONS_HPP_
