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
 * @file config.hpp
 * @brief Multi-format configuration store and PoolOptions loader.
 *
 * Backends are selected at compile time:
 *   - IniBackend  : inih          (PMAP_CONFIG_INI_ENABLED)
 *   - JsonBackend : nlohmann/json (PMAP_CONFIG_JSON_ENABLED)
 *   - YamlBackend : fkYAML        (PMAP_CONFIG_YAML_ENABLED)
 *
 * Every format is flattened to "section + key = value". ConfigStore::Set()
 * adds entries programmatically, so LoadPoolOptions() works with no backend
 * compiled in.
 *
 * @code
 *   pmap::Config<pmap::IniBackend> cfg;
 *   cfg.LoadFile("pmap.ini");
 *   pmap::PoolOptions opts;
 *   auto r = pmap::LoadPoolOptions(cfg, opts);
 * @endcode
 *
 * Recognized keys, section [pool]:
 *   num_workers, chunk_size, in_flight_per_worker  positive integers
 *   shutdown_grace_ms                              non-negative integer
 *   log_level                                      debug|info|warn|error|off
 */

#ifndef PMAP_CONFIG_HPP_
#define PMAP_CONFIG_HPP_

#include "pmap/platform.hpp"
#include "pmap/log.hpp"
#include "pmap/options.hpp"
#include "pmap/vocabulary.hpp"

#include <cerrno>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <string>
#include <tuple>

#ifdef PMAP_CONFIG_INI_ENABLED
#include "ini.h"
#endif

#ifdef PMAP_CONFIG_JSON_ENABLED
#include <nlohmann/json.hpp>
#endif

#ifdef PMAP_CONFIG_YAML_ENABLED
#include <fkYAML/node.hpp>
#endif

namespace pmap {

enum class ConfigError : uint8_t {
  kFileNotFound = 0,
  kParseError,
  kFormatNotSupported,
  kBufferFull,
  kInvalidValue,
};

enum class ConfigFormat : uint8_t {
  kAuto = 0,
  kIni,
  kJson,
  kYaml,
};

namespace detail {

inline bool CaseEqual(const char* a, const char* b) noexcept {
  while (*a != '\0' && *b != '\0') {
    char la = (*a >= 'A' && *a <= 'Z') ? static_cast<char>(*a + 32) : *a;
    char lb = (*b >= 'A' && *b <= 'Z') ? static_cast<char>(*b + 32) : *b;
    if (la != lb) return false;
    ++a;
    ++b;
  }
  return *a == *b;
}

}  // namespace detail

// ============================================================================
// Backend tags
// ============================================================================

struct IniBackend {
  static constexpr ConfigFormat kFormat = ConfigFormat::kIni;
  static bool MatchesExtension(const char* ext) noexcept {
    return detail::CaseEqual(ext, "ini") || detail::CaseEqual(ext, "conf");
  }
};

struct JsonBackend {
  static constexpr ConfigFormat kFormat = ConfigFormat::kJson;
  static bool MatchesExtension(const char* ext) noexcept {
    return detail::CaseEqual(ext, "json");
  }
};

struct YamlBackend {
  static constexpr ConfigFormat kFormat = ConfigFormat::kYaml;
  static bool MatchesExtension(const char* ext) noexcept {
    return detail::CaseEqual(ext, "yaml") || detail::CaseEqual(ext, "yml");
  }
};

// ============================================================================
// ConfigStore
// ============================================================================

#ifndef PMAP_CONFIG_MAX_FILE_SIZE
#define PMAP_CONFIG_MAX_FILE_SIZE 8192U
#endif

/**
 * @brief Flat, case-insensitive section/key/value table.
 *
 * Fixed capacity; a later entry for the same section and key overwrites the
 * earlier one.
 */
class ConfigStore {
 public:
  static constexpr uint32_t kMaxEntries = 64;
  static constexpr uint32_t kMaxKeyLen = 64;
  static constexpr uint32_t kMaxValueLen = 128;

  /// @return false when the table is full.
  bool Set(const char* section, const char* key, const char* value) {
    PMAP_ASSERT(section != nullptr && key != nullptr);
    for (uint32_t i = 0; i < count_; ++i) {
      if (detail::CaseEqual(entries_[i].section, section) &&
          detail::CaseEqual(entries_[i].key, key)) {
        SafeCopy(entries_[i].value, value, kMaxValueLen);
        return true;
      }
    }
    if (count_ >= kMaxEntries) return false;
    Entry& e = entries_[count_];
    SafeCopy(e.section, section, kMaxKeyLen);
    SafeCopy(e.key, key, kMaxKeyLen);
    SafeCopy(e.value, value, kMaxValueLen);
    ++count_;
    return true;
  }

  const char* GetString(const char* section, const char* key,
                        const char* default_val = "") const {
    const Entry* e = FindEntry(section, key);
    return (e != nullptr) ? e->value : default_val;
  }

  int32_t GetInt(const char* section, const char* key,
                 int32_t default_val = 0) const {
    auto v = FindInt(section, key);
    return v.has_value() ? *v : default_val;
  }

  bool GetBool(const char* section, const char* key,
               bool default_val = false) const {
    const Entry* e = FindEntry(section, key);
    return (e != nullptr) ? ParseBool(e->value) : default_val;
  }

  optional<const char*> FindString(const char* section, const char* key) const {
    const Entry* e = FindEntry(section, key);
    return (e == nullptr) ? optional<const char*>{}
                          : optional<const char*>{e->value};
  }

  /// @brief Integer value; empty when absent or not entirely numeric.
  optional<int32_t> FindInt(const char* section, const char* key) const {
    const Entry* e = FindEntry(section, key);
    if (e == nullptr) return {};
    errno = 0;
    char* end = nullptr;
    long val = std::strtol(e->value, &end, 10);
    if (end == e->value || *end != '\0' || errno == ERANGE) return {};
    if (val < INT32_MIN || val > INT32_MAX) return {};
    return static_cast<int32_t>(val);
  }

  optional<bool> FindBool(const char* section, const char* key) const {
    const Entry* e = FindEntry(section, key);
    return (e == nullptr) ? optional<bool>{} : optional<bool>{ParseBool(e->value)};
  }

  bool HasSection(const char* section) const {
    PMAP_ASSERT(section != nullptr);
    for (uint32_t i = 0; i < count_; ++i) {
      if (detail::CaseEqual(entries_[i].section, section)) return true;
    }
    return false;
  }

  bool HasKey(const char* section, const char* key) const {
    return FindEntry(section, key) != nullptr;
  }

  uint32_t EntryCount() const noexcept { return count_; }

 protected:
  struct Entry {
    char section[kMaxKeyLen];
    char key[kMaxKeyLen];
    char value[kMaxValueLen];
  };

  static expected<uint32_t, ConfigError> ReadFile(const char* path, char* buf,
                                                  uint32_t buf_size) {
    FILE* f = std::fopen(path, "r");
    if (f == nullptr) {
      return expected<uint32_t, ConfigError>::error(ConfigError::kFileNotFound);
    }
    size_t bytes = std::fread(buf, 1, buf_size - 1, f);
    bool truncated = (bytes == buf_size - 1) && (std::fgetc(f) != EOF);
    (void)std::fclose(f);
    if (truncated) {
      return expected<uint32_t, ConfigError>::error(ConfigError::kBufferFull);
    }
    buf[bytes] = '\0';
    return expected<uint32_t, ConfigError>::success(static_cast<uint32_t>(bytes));
  }

  static void SafeCopy(char* dst, const char* src, uint32_t dst_size) noexcept {
    if (src == nullptr) {
      dst[0] = '\0';
      return;
    }
    uint32_t i = 0;
    while (i < (dst_size - 1U) && src[i] != '\0') {
      dst[i] = src[i];
      ++i;
    }
    dst[i] = '\0';
  }

  static const char* Extension(const char* path) noexcept {
    const char* dot = std::strrchr(path, '.');
    const char* slash = std::strrchr(path, '/');
    if (dot == nullptr || (slash != nullptr && dot < slash)) return nullptr;
    return dot + 1;
  }

 private:
  const Entry* FindEntry(const char* section, const char* key) const {
    PMAP_ASSERT(section != nullptr && key != nullptr);
    for (uint32_t i = 0; i < count_; ++i) {
      if (detail::CaseEqual(entries_[i].section, section) &&
          detail::CaseEqual(entries_[i].key, key)) {
        return &entries_[i];
      }
    }
    return nullptr;
  }

  static bool ParseBool(const char* s) noexcept {
    return detail::CaseEqual(s, "true") || detail::CaseEqual(s, "1") ||
           detail::CaseEqual(s, "yes") || detail::CaseEqual(s, "on");
  }

  Entry entries_[kMaxEntries];
  uint32_t count_ = 0;

  template <typename>
  friend struct ConfigParser;
};

// ============================================================================
// ConfigParser<Backend>
// ============================================================================

/** Backend not compiled in. */
template <typename Backend>
struct ConfigParser {
  static expected<void, ConfigError> ParseFile(ConfigStore&, const char*) {
    return expected<void, ConfigError>::error(ConfigError::kFormatNotSupported);
  }
  static expected<void, ConfigError> ParseBuffer(ConfigStore&, const char*,
                                                 uint32_t) {
    return expected<void, ConfigError>::error(ConfigError::kFormatNotSupported);
  }
};

#ifdef PMAP_CONFIG_INI_ENABLED
template <>
struct ConfigParser<IniBackend> {
  static expected<void, ConfigError> ParseFile(ConfigStore& store,
                                               const char* path) {
    int rc = ini_parse(path, &Handler, &store);
    if (rc == -1) {
      return expected<void, ConfigError>::error(ConfigError::kFileNotFound);
    }
    if (rc != 0) {
      return expected<void, ConfigError>::error(ConfigError::kParseError);
    }
    return expected<void, ConfigError>::success();
  }

  static expected<void, ConfigError> ParseBuffer(ConfigStore& store,
                                                 const char* data, uint32_t) {
    if (ini_parse_string(data, &Handler, &store) != 0) {
      return expected<void, ConfigError>::error(ConfigError::kParseError);
    }
    return expected<void, ConfigError>::success();
  }

 private:
  static int Handler(void* user, const char* section, const char* name,
                     const char* value) {
    auto* store = static_cast<ConfigStore*>(user);
    return store->Set(section ? section : "", name ? name : "",
                      value ? value : "")
               ? 1
               : 0;
  }
};
#endif

#ifdef PMAP_CONFIG_JSON_ENABLED
template <>
struct ConfigParser<JsonBackend> {
  static expected<void, ConfigError> ParseFile(ConfigStore& store,
                                               const char* path) {
    char buf[PMAP_CONFIG_MAX_FILE_SIZE];
    auto r = ConfigStore::ReadFile(path, buf, sizeof(buf));
    if (!r.has_value()) return expected<void, ConfigError>::error(r.get_error());
    return ParseBuffer(store, buf, r.value());
  }

  static expected<void, ConfigError> ParseBuffer(ConfigStore& store,
                                                 const char* data,
                                                 uint32_t size) {
    auto root = nlohmann::json::parse(data, data + size, nullptr, false);
    if (root.is_discarded() || !root.is_object()) {
      return expected<void, ConfigError>::error(ConfigError::kParseError);
    }
    for (auto it = root.begin(); it != root.end(); ++it) {
      if (it->is_object()) {
        for (auto kit = it->begin(); kit != it->end(); ++kit) {
          std::string val = ToString(*kit);
          if (!store.Set(it.key().c_str(), kit.key().c_str(), val.c_str())) {
            return expected<void, ConfigError>::error(ConfigError::kBufferFull);
          }
        }
      } else {
        std::string val = ToString(*it);
        if (!store.Set("", it.key().c_str(), val.c_str())) {
          return expected<void, ConfigError>::error(ConfigError::kBufferFull);
        }
      }
    }
    return expected<void, ConfigError>::success();
  }

 private:
  static std::string ToString(const nlohmann::json& n) {
    if (n.is_string()) return n.get<std::string>();
    if (n.is_boolean()) return n.get<bool>() ? "true" : "false";
    if (n.is_number_integer()) return std::to_string(n.get<int64_t>());
    return n.dump();
  }
};
#endif

#ifdef PMAP_CONFIG_YAML_ENABLED
template <>
struct ConfigParser<YamlBackend> {
  static expected<void, ConfigError> ParseFile(ConfigStore& store,
                                               const char* path) {
    char buf[PMAP_CONFIG_MAX_FILE_SIZE];
    auto r = ConfigStore::ReadFile(path, buf, sizeof(buf));
    if (!r.has_value()) return expected<void, ConfigError>::error(r.get_error());
    return ParseBuffer(store, buf, r.value());
  }

  static expected<void, ConfigError> ParseBuffer(ConfigStore& store,
                                                 const char* data,
                                                 uint32_t size) {
    std::string text(data, size);
    auto root = fkyaml::node::deserialize(text);
    if (!root.is_mapping()) {
      return expected<void, ConfigError>::error(ConfigError::kParseError);
    }
    for (auto it = root.begin(); it != root.end(); ++it) {
      std::string section = it.key().get_value<std::string>();
      auto& node = *it;
      if (node.is_mapping()) {
        for (auto kit = node.begin(); kit != node.end(); ++kit) {
          std::string key = kit.key().get_value<std::string>();
          std::string val = ToString(*kit);
          if (!store.Set(section.c_str(), key.c_str(), val.c_str())) {
            return expected<void, ConfigError>::error(ConfigError::kBufferFull);
          }
        }
      } else {
        std::string val = ToString(node);
        if (!store.Set("", section.c_str(), val.c_str())) {
          return expected<void, ConfigError>::error(ConfigError::kBufferFull);
        }
      }
    }
    return expected<void, ConfigError>::success();
  }

 private:
  static std::string ToString(const fkyaml::node& n) {
    if (n.is_string()) return n.get_value<std::string>();
    if (n.is_boolean()) return n.get_value<bool>() ? "true" : "false";
    if (n.is_integer()) return std::to_string(n.get_value<int64_t>());
    if (n.is_float_number()) return std::to_string(n.get_value<double>());
    return std::string();
  }
};
#endif

// ============================================================================
// Config<Backends...>
// ============================================================================

template <typename... Backends>
class Config final : public ConfigStore {
  static_assert(sizeof...(Backends) > 0, "Config requires at least one backend");

 public:
  expected<void, ConfigError> LoadFile(const char* path,
                                       ConfigFormat format = ConfigFormat::kAuto) {
    PMAP_ASSERT(path != nullptr);
    if (format == ConfigFormat::kAuto) format = DetectFormat(path);
    auto r = DispatchFile<Backends...>(path, format);
    if (!r.has_value()) {
      PMAP_LOG_WARN("Config", "failed to load %s (error %u)", path,
                    static_cast<unsigned>(r.get_error()));
    }
    return r;
  }

  expected<void, ConfigError> LoadBuffer(const char* data, uint32_t size,
                                         ConfigFormat format) {
    PMAP_ASSERT(data != nullptr);
    return DispatchBuffer<Backends...>(data, size, format);
  }

 private:
  using Head = typename std::tuple_element<0, std::tuple<Backends...>>::type;

  template <typename First, typename... Rest>
  expected<void, ConfigError> DispatchFile(const char* path, ConfigFormat format) {
    if (First::kFormat == format) return ConfigParser<First>::ParseFile(*this, path);
    if constexpr (sizeof...(Rest) > 0) return DispatchFile<Rest...>(path, format);
    return expected<void, ConfigError>::error(ConfigError::kFormatNotSupported);
  }

  template <typename First, typename... Rest>
  expected<void, ConfigError> DispatchBuffer(const char* data, uint32_t size,
                                             ConfigFormat format) {
    if (First::kFormat == format) {
      return ConfigParser<First>::ParseBuffer(*this, data, size);
    }
    if constexpr (sizeof...(Rest) > 0) {
      return DispatchBuffer<Rest...>(data, size, format);
    }
    return expected<void, ConfigError>::error(ConfigError::kFormatNotSupported);
  }

  ConfigFormat DetectFormat(const char* path) const noexcept {
    const char* ext = Extension(path);
    return (ext == nullptr) ? Head::kFormat : DetectExt<Backends...>(ext);
  }

  template <typename First, typename... Rest>
  ConfigFormat DetectExt(const char* ext) const noexcept {
    if (First::MatchesExtension(ext)) return First::kFormat;
    if constexpr (sizeof...(Rest) > 0) return DetectExt<Rest...>(ext);
    return Head::kFormat;
  }
};

#if defined(PMAP_CONFIG_INI_ENABLED) || defined(PMAP_CONFIG_JSON_ENABLED) || \
    defined(PMAP_CONFIG_YAML_ENABLED)
#define PMAP_CONFIG_ANY_BACKEND_ENABLED 1
#endif

#ifdef PMAP_CONFIG_ANY_BACKEND_ENABLED
/// Every backend compiled in; the file extension picks the parser.
using MultiConfig = Config<
#ifdef PMAP_CONFIG_INI_ENABLED
    IniBackend
#endif
#if defined(PMAP_CONFIG_INI_ENABLED) && \
    (defined(PMAP_CONFIG_JSON_ENABLED) || defined(PMAP_CONFIG_YAML_ENABLED))
    ,
#endif
#ifdef PMAP_CONFIG_JSON_ENABLED
    JsonBackend
#endif
#if defined(PMAP_CONFIG_JSON_ENABLED) && defined(PMAP_CONFIG_YAML_ENABLED)
    ,
#endif
#ifdef PMAP_CONFIG_YAML_ENABLED
    YamlBackend
#endif
    >;
#endif

#ifdef PMAP_CONFIG_INI_ENABLED
using IniConfig = Config<IniBackend>;
#endif
#ifdef PMAP_CONFIG_JSON_ENABLED
using JsonConfig = Config<JsonBackend>;
#endif
#ifdef PMAP_CONFIG_YAML_ENABLED
using YamlConfig = Config<YamlBackend>;
#endif

// ============================================================================
// PoolOptions loader
// ============================================================================

namespace detail {

inline bool ReadPositive(const ConfigStore& store, const char* key,
                         bool allow_zero, uint32_t& out) {
  if (!store.HasKey("pool", key)) return true;
  auto v = store.FindInt("pool", key);
  if (!v.has_value() || *v < 0 || (*v == 0 && !allow_zero)) {
    PMAP_LOG_ERROR("Config", "pool.%s: invalid value '%s'", key,
                   store.GetString("pool", key));
    return false;
  }
  out = static_cast<uint32_t>(*v);
  return true;
}

}  // namespace detail

/**
 * @brief Apply section [pool] of @p store on top of @p opts.
 *
 * Absent keys keep the values already in @p opts. On kInvalidValue neither
 * @p opts nor the log level is modified. A valid log_level is applied with
 * log::SetLevel().
 */
inline expected<void, ConfigError> LoadPoolOptions(const ConfigStore& store,
                                                   PoolOptions& opts) {
  PoolOptions next = opts;
  bool ok = detail::ReadPositive(store, "num_workers", false, next.num_workers) &&
            detail::ReadPositive(store, "chunk_size", false, next.chunk_size) &&
            detail::ReadPositive(store, "in_flight_per_worker", false,
                                 next.in_flight_per_worker) &&
            detail::ReadPositive(store, "shutdown_grace_ms", true,
                                 next.shutdown_grace_ms);
  if (!ok) {
    return expected<void, ConfigError>::error(ConfigError::kInvalidValue);
  }

  auto level_name = store.FindString("pool", "log_level");
  log::Level level = log::GetLevel();
  if (level_name.has_value() && !log::ParseLevel(*level_name, level)) {
    PMAP_LOG_ERROR("Config", "pool.log_level: unknown level '%s'", *level_name);
    return expected<void, ConfigError>::error(ConfigError::kInvalidValue);
  }

  opts = next;
  if (level_name.has_value()) log::SetLevel(level);
  return expected<void, ConfigError>::success();
}

}  // namespace pmap

#endif  // PMAP_CONFIG_HPP_
