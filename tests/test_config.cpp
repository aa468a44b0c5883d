/**
 * @file test_config.cpp
 * @brief Tests for config.hpp and scheduler_config.hpp.
 */

#include "tsched/config.hpp"
#include "tsched/scheduler_config.hpp"

#include <catch2/catch_test_macros.hpp>

#include <cstdio>
#include <cstring>
#include <string>
#include <vector>

// ============================================================================
// ConfigStore
// ============================================================================

TEST_CASE("ConfigStore stores and returns values", "[config]") {
  tsched::ConfigStore store;
  store.Set("scheduler", "worker_count", "8");
  store.Set("scheduler", "name", "ingest");

  REQUIRE(store.HasKey("scheduler", "name"));
  REQUIRE(!store.HasKey("scheduler", "missing"));
  REQUIRE(store.FindInt("scheduler", "worker_count") == 8);
  REQUIRE(std::strcmp(store.GetString("scheduler", "name"), "ingest") == 0);
  REQUIRE(std::strcmp(store.GetString("x", "y", "default"), "default") == 0);
}

TEST_CASE("ConfigStore lookup is case-insensitive and Set overwrites", "[config]") {
  tsched::ConfigStore store;
  store.Set("Scheduler", "Worker_Count", "2");
  store.Set("scheduler", "worker_count", "6");
  REQUIRE(store.FindInt("SCHEDULER", "WORKER_COUNT") == 6);
  REQUIRE(store.KeysIn("scheduler") == std::vector<std::string>{"worker_count"});
}

TEST_CASE("ConfigStore FindInt is strict", "[config]") {
  tsched::ConfigStore store;
  store.Set("s", "good", "12");
  store.Set("s", "negative", "-3");
  store.Set("s", "trailing", "12ms");
  store.Set("s", "text", "many");
  store.Set("s", "empty", "");
  store.Set("s", "huge", "99999999999");

  REQUIRE(store.FindInt("s", "good") == 12);
  REQUIRE(store.FindInt("s", "negative") == -3);
  REQUIRE(!store.FindInt("s", "trailing").has_value());
  REQUIRE(!store.FindInt("s", "text").has_value());
  REQUIRE(!store.FindInt("s", "empty").has_value());
  REQUIRE(!store.FindInt("s", "huge").has_value());
  REQUIRE(!store.FindInt("s", "missing").has_value());
}

TEST_CASE("ConfigStore KeysIn lists one section only", "[config]") {
  tsched::ConfigStore store;
  store.Set("scheduler", "tick_interval_ms", "10");
  store.Set("scheduler", "name", "a");
  store.Set("log", "level", "info");
  store.Set("schedulerx", "other", "1");

  REQUIRE(store.KeysIn("scheduler") == std::vector<std::string>{"name", "tick_interval_ms"});
  REQUIRE(store.KeysIn("log") == std::vector<std::string>{"level"});
  REQUIRE(store.KeysIn("absent").empty());
}

// ============================================================================
// SchedulerConfigFromStore
// ============================================================================

TEST_CASE("SchedulerConfig defaults", "[config][scheduler_config]") {
  tsched::ConfigStore store;
  auto cfg = tsched::SchedulerConfigFromStore(store);
  REQUIRE(cfg.name == "scheduler");
  REQUIRE(cfg.worker_count == tsched::kDefaultWorkerCount);
  REQUIRE(cfg.submit_queue_capacity == 100U);
  REQUIRE(cfg.dispatch_queue_capacity == 100U);
  REQUIRE(cfg.tick_interval_ms == 100U);
  REQUIRE(cfg.max_dispatch_wait_ticks == 0U);
}

TEST_CASE("SchedulerConfig reads every key", "[config][scheduler_config]") {
  tsched::ConfigStore store;
  store.Set("scheduler", "name", "reports");
  store.Set("scheduler", "worker_count", "3");
  store.Set("scheduler", "submit_queue_capacity", "16");
  store.Set("scheduler", "dispatch_queue_capacity", "8");
  store.Set("scheduler", "tick_interval_ms", "25");
  store.Set("scheduler", "max_dispatch_wait_ticks", "4");

  auto cfg = tsched::SchedulerConfigFromStore(store);
  REQUIRE(cfg.name == "reports");
  REQUIRE(cfg.worker_count == 3U);
  REQUIRE(cfg.submit_queue_capacity == 16U);
  REQUIRE(cfg.dispatch_queue_capacity == 8U);
  REQUIRE(cfg.tick_interval_ms == 25U);
  REQUIRE(cfg.max_dispatch_wait_ticks == 4U);
}

TEST_CASE("SchedulerConfig invalid values fall back to defaults", "[config][scheduler_config]") {
  tsched::ConfigStore store;
  store.Set("scheduler", "worker_count", "0");
  store.Set("scheduler", "submit_queue_capacity", "-5");
  store.Set("scheduler", "tick_interval_ms", "fast");
  store.Set("scheduler", "max_dispatch_wait_ticks", "0");

  auto cfg = tsched::SchedulerConfigFromStore(store);
  REQUIRE(cfg.worker_count == tsched::kDefaultWorkerCount);
  REQUIRE(cfg.submit_queue_capacity == tsched::kDefaultQueueCapacity);
  REQUIRE(cfg.tick_interval_ms == tsched::kDefaultTickIntervalMs);
  REQUIRE(cfg.max_dispatch_wait_ticks == 0U);
}

namespace {

struct Warnings {
  std::vector<std::string> lines;
};

void CollectWarnings(tsched::log::Level level, const char*, const char* line, void* ctx) {
  if (level == tsched::log::Level::kWarn) {
    static_cast<Warnings*>(ctx)->lines.emplace_back(line);
  }
}

}  // namespace

TEST_CASE("SchedulerConfig warns about unknown scheduler keys", "[config][scheduler_config]") {
  tsched::ConfigStore store;
  store.Set("scheduler", "worker_count", "2");
  store.Set("scheduler", "workers", "9");

  Warnings w;
  tsched::log::SetSink(&CollectWarnings, &w);
  auto cfg = tsched::SchedulerConfigFromStore(store);
  tsched::log::SetSink(nullptr);

  REQUIRE(cfg.worker_count == 2U);
  REQUIRE(w.lines.size() == 1U);
  REQUIRE(w.lines[0].find("unknown key=scheduler.workers") != std::string::npos);
}

TEST_CASE("SchedulerConfig applies the log level", "[config][scheduler_config]") {
  const auto prev = tsched::log::GetLevel();
  tsched::ConfigStore store;
  store.Set("log", "level", "error");
  (void)tsched::SchedulerConfigFromStore(store);
  REQUIRE(tsched::log::GetLevel() == tsched::log::Level::kError);

  store.Set("log", "level", "chatty");
  (void)tsched::SchedulerConfigFromStore(store);
  REQUIRE(tsched::log::GetLevel() == tsched::log::Level::kError);
  tsched::log::SetLevel(prev);
}

// ============================================================================
// INI backend
// ============================================================================

#ifdef TSCHED_CONFIG_INI_ENABLED

TEST_CASE("INI LoadBuffer basic", "[config][ini]") {
  const char* ini_data =
      "[scheduler]\n"
      "worker_count = 6\n"
      "name = etl\n"
      "; comment\n"
      "[log]\n"
      "level = INFO\n";

  tsched::IniConfig cfg;
  auto result = cfg.LoadBuffer(ini_data);
  REQUIRE(result.has_value());
  REQUIRE(cfg.FindInt("scheduler", "worker_count") == 6);
  REQUIRE(std::strcmp(cfg.GetString("scheduler", "name"), "etl") == 0);
  REQUIRE(std::strcmp(cfg.GetString("log", "level"), "INFO") == 0);
}

TEST_CASE("INI LoadBuffer rejects malformed input", "[config][ini]") {
  tsched::IniConfig cfg;
  auto result = cfg.LoadBuffer("[scheduler\nworker_count 4\n");
  REQUIRE(!result.has_value());
  REQUIRE(result.get_error() == tsched::ConfigError::kParseError);
}

TEST_CASE("INI LoadFile missing file", "[config][ini]") {
  tsched::IniConfig cfg;
  auto result = cfg.LoadFile("/nonexistent/path/scheduler.ini");
  REQUIRE(!result.has_value());
  REQUIRE(result.get_error() == tsched::ConfigError::kFileNotFound);
}

TEST_CASE("LoadSchedulerConfig from file", "[config][ini][scheduler_config]") {
  const char* path = "/tmp/tsched_test_scheduler.ini";
  FILE* f = std::fopen(path, "w");
  REQUIRE(f != nullptr);
  std::fputs(
      "[scheduler]\n"
      "worker_count = 2\n"
      "tick_interval_ms = 50\n"
      "max_dispatch_wait_ticks = 10\n",
      f);
  std::fclose(f);

  auto r = tsched::LoadSchedulerConfig(path);
  std::remove(path);
  REQUIRE(r.has_value());
  REQUIRE(r.value().worker_count == 2U);
  REQUIRE(r.value().tick_interval_ms == 50U);
  REQUIRE(r.value().max_dispatch_wait_ticks == 10U);
  REQUIRE(r.value().submit_queue_capacity == tsched::kDefaultQueueCapacity);

  auto missing = tsched::LoadSchedulerConfig("/nonexistent/path/scheduler.ini");
  REQUIRE(!missing.has_value());
  REQUIRE(missing.get_error() == tsched::ConfigError::kFileNotFound);
}

#endif  // TSCHED_CONFIG_INI_ENABLED
