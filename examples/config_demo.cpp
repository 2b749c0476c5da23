/**
 * @file config_demo.cpp
 * @brief Load PoolOptions from a configuration file and run a chunked map.
 *
 * Usage: config_demo [pool.ini|pool.json|pool.yaml]
 *
 * With no argument, or no file backend compiled in, the [pool] section is
 * filled programmatically.
 */

#include "pmap/config.hpp"
#include "pmap/log.hpp"
#include "pmap/sugar.hpp"

#include <cstdio>
#include <cstring>
#include <string>
#include <vector>

int main(int argc, char* argv[]) {
  pmap::log::Init();

#ifdef PMAP_CONFIG_ANY_BACKEND_ENABLED
  pmap::MultiConfig cfg;
#else
  pmap::ConfigStore cfg;
#endif

  if (argc > 1) {
#ifdef PMAP_CONFIG_ANY_BACKEND_ENABLED
    auto loaded = cfg.LoadFile(argv[1]);
    if (!loaded.has_value()) {
      PMAP_LOG_ERROR("demo", "cannot load %s", argv[1]);
      return 1;
    }
#else
    PMAP_LOG_WARN("demo", "no config backend compiled in, ignoring %s", argv[1]);
#endif
  } else {
    (void)cfg.Set("pool", "num_workers", "3");
    (void)cfg.Set("pool", "chunk_size", "8");
    (void)cfg.Set("pool", "log_level", "debug");
  }

  pmap::PoolOptions opts;
  auto applied = pmap::LoadPoolOptions(cfg, opts);
  if (!applied.has_value()) {
    PMAP_LOG_ERROR("demo", "invalid [pool] section");
    return 1;
  }
  PMAP_LOG_INFO("demo", "num_workers=%u chunk_size=%u in_flight=%u grace=%u ms",
                opts.num_workers, opts.chunk_size, opts.in_flight_per_worker,
                opts.shutdown_grace_ms);

  std::vector<std::string> words = {"alpha", "beta", "gamma", "delta", "epsilon",
                                    "zeta",  "eta",  "theta", "iota",  "kappa"};
  auto mapped = pmap::ImapOrderedChunked<size_t>(
      [](const std::string& w) { return w.size(); }, words, opts.num_workers,
      opts.chunk_size, opts);
  if (!mapped.has_value()) {
    PMAP_LOG_ERROR("demo", "%s", mapped.get_error().Message().c_str());
    return 1;
  }
  auto lengths = pmap::Collect(mapped.value());
  if (!lengths.has_value()) {
    PMAP_LOG_ERROR("demo", "%s", lengths.get_error().Message().c_str());
    return 1;
  }
  for (size_t i = 0; i < words.size(); ++i) {
    std::printf("%-8s %zu\n", words[i].c_str(), lengths.value()[i]);
  }

  pmap::log::Shutdown();
  return 0;
}
