/**
 * @file test_config.cpp
 * @brief Tests for config.hpp - ConfigStore, format backends, LoadPoolOptions.
 */

#include "pmap/config.hpp"

#include <catch2/catch_test_macros.hpp>

#include <cstdio>
#include <cstring>

// ============================================================================
// ConfigStore
// ============================================================================

TEST_CASE("ConfigStore Set and typed getters", "[config]") {
  pmap::ConfigStore store;
  REQUIRE(store.Set("pool", "num_workers", "4"));
  REQUIRE(store.Set("pool", "verbose", "yes"));
  REQUIRE(store.Set("pool", "name", "mapper"));

  REQUIRE(store.GetInt("pool", "num_workers", 0) == 4);
  REQUIRE(store.GetBool("pool", "verbose", false));
  REQUIRE(std::strcmp(store.GetString("pool", "name"), "mapper") == 0);
  REQUIRE(store.EntryCount() == 3U);
}

TEST_CASE("ConfigStore lookups are case-insensitive", "[config]") {
  pmap::ConfigStore store;
  REQUIRE(store.Set("Pool", "Chunk_Size", "3"));
  REQUIRE(store.HasSection("pool"));
  REQUIRE(store.HasKey("POOL", "chunk_size"));
  REQUIRE(store.GetInt("pool", "CHUNK_SIZE", 0) == 3);
}

TEST_CASE("ConfigStore later Set overwrites", "[config]") {
  pmap::ConfigStore store;
  REQUIRE(store.Set("pool", "chunk_size", "2"));
  REQUIRE(store.Set("pool", "chunk_size", "5"));
  REQUIRE(store.EntryCount() == 1U);
  REQUIRE(store.GetInt("pool", "chunk_size", 0) == 5);
}

TEST_CASE("ConfigStore defaults for missing keys", "[config]") {
  pmap::ConfigStore store;
  REQUIRE(store.GetInt("pool", "missing", 17) == 17);
  REQUIRE(std::strcmp(store.GetString("pool", "missing", "dflt"), "dflt") == 0);
  REQUIRE(store.GetBool("pool", "missing", true));
  REQUIRE_FALSE(store.FindInt("pool", "missing").has_value());
  REQUIRE_FALSE(store.FindString("pool", "missing").has_value());
  REQUIRE_FALSE(store.HasSection("pool"));
}

TEST_CASE("ConfigStore FindInt rejects partial numbers", "[config]") {
  pmap::ConfigStore store;
  REQUIRE(store.Set("pool", "a", "12abc"));
  REQUIRE(store.Set("pool", "b", ""));
  REQUIRE(store.Set("pool", "c", "99999999999"));
  REQUIRE(store.Set("pool", "d", "-8"));
  REQUIRE_FALSE(store.FindInt("pool", "a").has_value());
  REQUIRE_FALSE(store.FindInt("pool", "b").has_value());
  REQUIRE_FALSE(store.FindInt("pool", "c").has_value());
  REQUIRE(store.FindInt("pool", "d").value() == -8);
}

TEST_CASE("ConfigStore capacity is bounded", "[config]") {
  pmap::ConfigStore store;
  char key[16];
  for (uint32_t i = 0; i < pmap::ConfigStore::kMaxEntries; ++i) {
    std::snprintf(key, sizeof(key), "k%u", i);
    REQUIRE(store.Set("s", key, "v"));
  }
  REQUIRE_FALSE(store.Set("s", "overflow", "v"));
  // Overwriting an existing key still works when full.
  REQUIRE(store.Set("s", "k0", "w"));
  REQUIRE(std::strcmp(store.GetString("s", "k0"), "w") == 0);
}

// ============================================================================
// LoadPoolOptions
// ============================================================================

TEST_CASE("LoadPoolOptions applies the pool section", "[config]") {
  auto prev = pmap::log::GetLevel();
  pmap::ConfigStore store;
  REQUIRE(store.Set("pool", "num_workers", "6"));
  REQUIRE(store.Set("pool", "chunk_size", "4"));
  REQUIRE(store.Set("pool", "in_flight_per_worker", "2"));
  REQUIRE(store.Set("pool", "shutdown_grace_ms", "0"));
  REQUIRE(store.Set("pool", "log_level", "warn"));

  pmap::PoolOptions opts;
  auto r = pmap::LoadPoolOptions(store, opts);
  REQUIRE(r.has_value());
  REQUIRE(opts.num_workers == 6U);
  REQUIRE(opts.chunk_size == 4U);
  REQUIRE(opts.in_flight_per_worker == 2U);
  REQUIRE(opts.shutdown_grace_ms == 0U);
  REQUIRE(pmap::log::GetLevel() == pmap::log::Level::kWarn);
  pmap::log::SetLevel(prev);
}

TEST_CASE("LoadPoolOptions keeps values for absent keys", "[config]") {
  pmap::ConfigStore store;
  REQUIRE(store.Set("other", "chunk_size", "9"));

  pmap::PoolOptions opts;
  opts.chunk_size = 3U;
  auto r = pmap::LoadPoolOptions(store, opts);
  REQUIRE(r.has_value());
  REQUIRE(opts.chunk_size == 3U);
  REQUIRE(opts.num_workers == 0U);
  REQUIRE(opts.shutdown_grace_ms == pmap::kDefaultShutdownGraceMs);
}

TEST_CASE("LoadPoolOptions rejects invalid values atomically", "[config]") {
  auto prev = pmap::log::GetLevel();

  SECTION("zero chunk size") {
    pmap::ConfigStore store;
    REQUIRE(store.Set("pool", "num_workers", "2"));
    REQUIRE(store.Set("pool", "chunk_size", "0"));
    pmap::PoolOptions opts;
    auto r = pmap::LoadPoolOptions(store, opts);
    REQUIRE_FALSE(r.has_value());
    REQUIRE(r.get_error() == pmap::ConfigError::kInvalidValue);
    REQUIRE(opts.num_workers == 0U);
    REQUIRE(opts.chunk_size == pmap::kDefaultChunkSize);
  }

  SECTION("non-numeric worker count") {
    pmap::ConfigStore store;
    REQUIRE(store.Set("pool", "num_workers", "many"));
    pmap::PoolOptions opts;
    REQUIRE(pmap::LoadPoolOptions(store, opts).get_error() ==
            pmap::ConfigError::kInvalidValue);
  }

  SECTION("unknown log level leaves the level alone") {
    pmap::ConfigStore store;
    REQUIRE(store.Set("pool", "chunk_size", "2"));
    REQUIRE(store.Set("pool", "log_level", "chatty"));
    pmap::PoolOptions opts;
    REQUIRE(pmap::LoadPoolOptions(store, opts).get_error() ==
            pmap::ConfigError::kInvalidValue);
    REQUIRE(opts.chunk_size == pmap::kDefaultChunkSize);
    REQUIRE(pmap::log::GetLevel() == prev);
  }

  pmap::log::SetLevel(prev);
}

// ============================================================================
// INI Backend Tests
// ============================================================================

#ifdef PMAP_CONFIG_INI_ENABLED

TEST_CASE("INI LoadBuffer feeds LoadPoolOptions", "[config][ini]") {
  const char* ini_data =
      "[pool]\n"
      "num_workers = 3\n"
      "chunk_size = 2\n";

  pmap::IniConfig cfg;
  auto result = cfg.LoadBuffer(ini_data, static_cast<uint32_t>(std::strlen(ini_data)),
                               pmap::ConfigFormat::kIni);
  REQUIRE(result.has_value());

  pmap::PoolOptions opts;
  REQUIRE(pmap::LoadPoolOptions(cfg, opts).has_value());
  REQUIRE(opts.num_workers == 3U);
  REQUIRE(opts.chunk_size == 2U);
}

TEST_CASE("INI LoadFile from disk", "[config][ini]") {
  const char* path = "/tmp/pmap_test_config.ini";
  FILE* f = std::fopen(path, "w");
  REQUIRE(f != nullptr);
  std::fputs("[pool]\nshutdown_grace_ms = 250\n", f);
  std::fclose(f);

  pmap::IniConfig cfg;
  REQUIRE(cfg.LoadFile(path).has_value());
  REQUIRE(cfg.GetInt("pool", "shutdown_grace_ms", 0) == 250);
  std::remove(path);
}

TEST_CASE("INI LoadFile missing file", "[config][ini]") {
  pmap::IniConfig cfg;
  auto r = cfg.LoadFile("/tmp/pmap_no_such_config.ini");
  REQUIRE_FALSE(r.has_value());
  REQUIRE(r.get_error() == pmap::ConfigError::kFileNotFound);
}

#endif  // PMAP_CONFIG_INI_ENABLED

// ============================================================================
// JSON Backend Tests
// ============================================================================

#ifdef PMAP_CONFIG_JSON_ENABLED

TEST_CASE("JSON LoadBuffer nested objects", "[config][json]") {
  const char* json_data = R"({"pool": {"num_workers": 5, "log_level": "error"}})";

  pmap::JsonConfig cfg;
  auto r = cfg.LoadBuffer(json_data, static_cast<uint32_t>(std::strlen(json_data)),
                          pmap::ConfigFormat::kJson);
  REQUIRE(r.has_value());
  REQUIRE(cfg.GetInt("pool", "num_workers", 0) == 5);
  REQUIRE(std::strcmp(cfg.GetString("pool", "log_level"), "error") == 0);
}

TEST_CASE("JSON LoadBuffer rejects malformed input", "[config][json]") {
  const char* json_data = "{\"pool\": ";
  pmap::JsonConfig cfg;
  auto r = cfg.LoadBuffer(json_data, static_cast<uint32_t>(std::strlen(json_data)),
                          pmap::ConfigFormat::kJson);
  REQUIRE_FALSE(r.has_value());
  REQUIRE(r.get_error() == pmap::ConfigError::kParseError);
}

#endif  // PMAP_CONFIG_JSON_ENABLED

// ============================================================================
// YAML Backend Tests
// ============================================================================

#ifdef PMAP_CONFIG_YAML_ENABLED

TEST_CASE("YAML LoadBuffer nested mapping", "[config][yaml]") {
  const char* yaml_data =
      "pool:\n"
      "  chunk_size: 8\n"
      "  in_flight_per_worker: 2\n";

  pmap::YamlConfig cfg;
  auto r = cfg.LoadBuffer(yaml_data, static_cast<uint32_t>(std::strlen(yaml_data)),
                          pmap::ConfigFormat::kYaml);
  REQUIRE(r.has_value());

  pmap::PoolOptions opts;
  REQUIRE(pmap::LoadPoolOptions(cfg, opts).has_value());
  REQUIRE(opts.chunk_size == 8U);
  REQUIRE(opts.in_flight_per_worker == 2U);
}

#endif  // PMAP_CONFIG_YAML_ENABLED
