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
 * @file vocabulary.hpp
 * @brief Vocabulary types shared by all pmap modules.
 *
 *   - expected<V, E>  -- error handling without exceptions
 *   - optional<T>     -- std::optional re-exported into pmap
 *   - ScopeGuard      -- run a callback on scope exit (rollback paths)
 *
 * Library code reports every failure through expected<V, E>; the only
 * exceptions in pmap are the user exceptions caught at the worker boundary.
 */

#ifndef PMAP_VOCABULARY_HPP_
#define PMAP_VOCABULARY_HPP_

#include "pmap/platform.hpp"

#include <functional>
#include <new>
#include <optional>
#include <type_traits>
#include <utility>

namespace pmap {

using std::nullopt;
using std::optional;

// ============================================================================
// expected<V, E>
// ============================================================================

/**
 * @brief Value-or-error result type.
 *
 * Constructed only through the success() / error() factories:
 * @code
 *   expected<int, ChannelStatus> r = expected<int, ChannelStatus>::success(4);
 *   if (!r.has_value()) { HandleError(r.get_error()); }
 * @endcode
 */
template <typename V, typename E>
class expected final {
 public:
  static expected success(const V& value) { return expected(ValueTag{}, value); }
  static expected success(V&& value) {
    return expected(ValueTag{}, static_cast<V&&>(value));
  }
  static expected error(const E& err) { return expected(ErrorTag{}, err); }
  static expected error(E&& err) { return expected(ErrorTag{}, static_cast<E&&>(err)); }

  expected(const expected& other) : has_value_(other.has_value_) {
    if (has_value_) {
      ::new (static_cast<void*>(&value_)) V(other.value_);
    } else {
      ::new (static_cast<void*>(&error_)) E(other.error_);
    }
  }

  expected(expected&& other) noexcept(std::is_nothrow_move_constructible<V>::value &&
                                      std::is_nothrow_move_constructible<E>::value)
      : has_value_(other.has_value_) {
    if (has_value_) {
      ::new (static_cast<void*>(&value_)) V(static_cast<V&&>(other.value_));
    } else {
      ::new (static_cast<void*>(&error_)) E(static_cast<E&&>(other.error_));
    }
  }

  expected& operator=(const expected& other) {
    if (this != &other) {
      Destroy();
      has_value_ = other.has_value_;
      if (has_value_) {
        ::new (static_cast<void*>(&value_)) V(other.value_);
      } else {
        ::new (static_cast<void*>(&error_)) E(other.error_);
      }
    }
    return *this;
  }

  expected& operator=(expected&& other) noexcept(
      std::is_nothrow_move_constructible<V>::value &&
      std::is_nothrow_move_constructible<E>::value) {
    if (this != &other) {
      Destroy();
      has_value_ = other.has_value_;
      if (has_value_) {
        ::new (static_cast<void*>(&value_)) V(static_cast<V&&>(other.value_));
      } else {
        ::new (static_cast<void*>(&error_)) E(static_cast<E&&>(other.error_));
      }
    }
    return *this;
  }

  ~expected() { Destroy(); }

  bool has_value() const noexcept { return has_value_; }
  explicit operator bool() const noexcept { return has_value_; }

  V& value() & {
    PMAP_ASSERT(has_value_);
    return value_;
  }
  const V& value() const& {
    PMAP_ASSERT(has_value_);
    return value_;
  }

  const E& get_error() const& {
    PMAP_ASSERT(!has_value_);
    return error_;
  }

  V value_or(const V& default_value) const {
    return has_value_ ? value_ : default_value;
  }

 private:
  struct ValueTag {};
  struct ErrorTag {};

  template <typename U>
  expected(ValueTag, U&& value) : has_value_(true) {
    ::new (static_cast<void*>(&value_)) V(static_cast<U&&>(value));
  }

  template <typename U>
  expected(ErrorTag, U&& err) : has_value_(false) {
    ::new (static_cast<void*>(&error_)) E(static_cast<U&&>(err));
  }

  void Destroy() noexcept {
    if (has_value_) {
      value_.~V();
    } else {
      error_.~E();
    }
  }

  union {
    V value_;
    E error_;
  };
  bool has_value_;
};

/**
 * @brief expected<void, E> specialization: success carries no value.
 */
template <typename E>
class expected<void, E> final {
 public:
  static expected success() { return expected(); }
  static expected error(const E& err) {
    expected r;
    r.error_.emplace(err);
    return r;
  }
  static expected error(E&& err) {
    expected r;
    r.error_.emplace(static_cast<E&&>(err));
    return r;
  }

  bool has_value() const noexcept { return !error_.has_value(); }
  explicit operator bool() const noexcept { return has_value(); }

  const E& get_error() const& {
    PMAP_ASSERT(error_.has_value());
    return *error_;
  }

 private:
  expected() = default;

  optional<E> error_;
};

// ============================================================================
// ScopeGuard
// ============================================================================

/**
 * @brief Runs a callback when the guard leaves scope unless released.
 *
 * Used on multi-step acquisition paths (pool construction) so that a failure
 * half-way through tears down what was already acquired.
 */
class ScopeGuard final {
 public:
  explicit ScopeGuard(std::function<void()> fn) : fn_(std::move(fn)), active_(true) {}

  ~ScopeGuard() {
    if (active_ && fn_) {
      fn_();
    }
  }

  ScopeGuard(const ScopeGuard&) = delete;
  ScopeGuard& operator=(const ScopeGuard&) = delete;

  /// @brief Disarm the guard; the callback will not run.
  void release() noexcept { active_ = false; }

 private:
  std::function<void()> fn_;
  bool active_;
};

}  // namespace pmap

#endif  // PMAP_VOCABULARY_HPP_
