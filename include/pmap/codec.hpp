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
 * @file codec.hpp
 * @brief Payload encoding for values crossing a worker channel.
 *
 * Serializer<T> turns a value into bytes and back. Trivially copyable types
 * are copied verbatim; std::string, std::vector, std::pair and std::optional
 * are length-prefixed compositions. Both ends of a channel are the same
 * binary on the same host (fork without exec), so native byte order is used.
 *
 * User types are supported by specializing Serializer:
 * @code
 *   template <>
 *   struct pmap::Serializer<Point> {
 *     static void Encode(const Point& p, pmap::ByteWriter& w) {
 *       pmap::Serializer<std::string>::Encode(p.label, w);
 *       w.PutPod(p.x);
 *     }
 *     static bool Decode(pmap::ByteReader& r, Point& p) {
 *       return pmap::Serializer<std::string>::Decode(r, p.label) && r.GetPod(p.x);
 *     }
 *   };
 * @endcode
 */

#ifndef PMAP_CODEC_HPP_
#define PMAP_CODEC_HPP_

#include "pmap/platform.hpp"

#include <cstdint>
#include <cstring>
#include <optional>
#include <string>
#include <type_traits>
#include <utility>
#include <vector>

namespace pmap {

// ============================================================================
// ByteWriter / ByteReader
// ============================================================================

/// @brief Appends to a caller-owned byte vector.
class ByteWriter {
 public:
  explicit ByteWriter(std::vector<uint8_t>& buf) noexcept : buf_(buf) {}

  void PutRaw(const void* data, size_t len) {
    if (len == 0U) return;
    const auto* p = static_cast<const uint8_t*>(data);
    buf_.insert(buf_.end(), p, p + len);
  }

  template <typename T>
  void PutPod(const T& v) {
    static_assert(std::is_trivially_copyable<T>::value, "PutPod needs a POD");
    PutRaw(&v, sizeof(T));
  }

  void PutU32(uint32_t v) { PutPod(v); }
  void PutU64(uint64_t v) { PutPod(v); }

  /// @brief u32 length followed by the bytes.
  void PutBytes(const void* data, uint32_t len) {
    PutU32(len);
    PutRaw(data, len);
  }

  size_t Size() const noexcept { return buf_.size(); }

 private:
  std::vector<uint8_t>& buf_;
};

/// @brief Bounds-checked cursor over a byte range it does not own.
class ByteReader {
 public:
  ByteReader(const uint8_t* data, size_t size) noexcept
      : data_(data), size_(size), pos_(0) {}

  bool GetRaw(void* out, size_t len) noexcept {
    if (len > Remaining()) return false;
    if (len != 0U) {
      std::memcpy(out, data_ + pos_, len);
      pos_ += len;
    }
    return true;
  }

  template <typename T>
  bool GetPod(T& out) noexcept {
    static_assert(std::is_trivially_copyable<T>::value, "GetPod needs a POD");
    return GetRaw(&out, sizeof(T));
  }

  bool GetU32(uint32_t& out) noexcept { return GetPod(out); }
  bool GetU64(uint64_t& out) noexcept { return GetPod(out); }

  bool GetString(std::string& out) {
    uint32_t len = 0;
    if (!GetU32(len) || len > Remaining()) return false;
    out.assign(reinterpret_cast<const char*>(data_ + pos_), len);
    pos_ += len;
    return true;
  }

  bool Skip(size_t len) noexcept {
    if (len > Remaining()) return false;
    pos_ += len;
    return true;
  }

  size_t Remaining() const noexcept { return size_ - pos_; }
  bool AtEnd() const noexcept { return pos_ == size_; }

 private:
  const uint8_t* data_;
  size_t size_;
  size_t pos_;
};

// ============================================================================
// Serializer<T>
// ============================================================================

/**
 * @brief Default serializer for trivially copyable types.
 *
 * Pointers are trivially copyable but meaningless in another process; do not
 * send them.
 */
template <typename T, typename Enable = void>
struct Serializer {
  static_assert(std::is_trivially_copyable<T>::value,
                "Specialize pmap::Serializer<T> for non-trivially-copyable types");

  static void Encode(const T& v, ByteWriter& w) { w.PutPod(v); }
  static bool Decode(ByteReader& r, T& out) noexcept { return r.GetPod(out); }
};

template <>
struct Serializer<std::string> {
  static void Encode(const std::string& s, ByteWriter& w) {
    PMAP_ASSERT(s.size() <= UINT32_MAX);
    w.PutBytes(s.data(), static_cast<uint32_t>(s.size()));
  }
  static bool Decode(ByteReader& r, std::string& out) { return r.GetString(out); }
};

template <typename T, typename A>
struct Serializer<std::vector<T, A>> {
  static void Encode(const std::vector<T, A>& v, ByteWriter& w) {
    PMAP_ASSERT(v.size() <= UINT32_MAX);
    w.PutU32(static_cast<uint32_t>(v.size()));
    for (const auto& e : v) Serializer<T>::Encode(e, w);
  }

  static bool Decode(ByteReader& r, std::vector<T, A>& out) {
    uint32_t n = 0;
    // Every element encodes to at least one byte.
    if (!r.GetU32(n) || n > r.Remaining()) return false;
    out.clear();
    out.reserve(n);
    for (uint32_t i = 0; i < n; ++i) {
      T e{};
      if (!Serializer<T>::Decode(r, e)) return false;
      out.push_back(std::move(e));
    }
    return true;
  }
};

template <typename A, typename B>
struct Serializer<std::pair<A, B>> {
  static void Encode(const std::pair<A, B>& p, ByteWriter& w) {
    Serializer<A>::Encode(p.first, w);
    Serializer<B>::Encode(p.second, w);
  }
  static bool Decode(ByteReader& r, std::pair<A, B>& out) {
    return Serializer<A>::Decode(r, out.first) &&
           Serializer<B>::Decode(r, out.second);
  }
};

template <typename T>
struct Serializer<std::optional<T>> {
  static void Encode(const std::optional<T>& v, ByteWriter& w) {
    w.PutPod(static_cast<uint8_t>(v.has_value() ? 1U : 0U));
    if (v.has_value()) Serializer<T>::Encode(*v, w);
  }
  static bool Decode(ByteReader& r, std::optional<T>& out) {
    uint8_t present = 0;
    if (!r.GetPod(present)) return false;
    if (present == 0U) {
      out.reset();
      return true;
    }
    T v{};
    if (!Serializer<T>::Decode(r, v)) return false;
    out = std::move(v);
    return true;
  }
};

}  // namespace pmap

#endif  // PMAP_CODEC_HPP_
