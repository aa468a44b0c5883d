/**
 * @file scheduler_config.hpp
 * @brief SchedulerConfig and its mapping from a ConfigStore.
 *
 * Recognized keys (case-insensitive):
 *
 *   [scheduler]
 *   name                    = scheduler
 *   worker_count            = 4
 *   submit_queue_capacity   = 100
 *   dispatch_queue_capacity = 100
 *   tick_interval_ms        = 100
 *   max_dispatch_wait_ticks = 0       ; 0 = wait indefinitely
 *
 *   [log]
 *   level = info                      ; debug|info|warn|error|fatal|off
 */

#ifndef TSCHED_SCHEDULER_CONFIG_HPP_
#define TSCHED_SCHEDULER_CONFIG_HPP_

#include "tsched/config.hpp"
#include "tsched/log.hpp"
#include "tsched/vocabulary.hpp"

#include <cstdint>
#include <string>

namespace tsched {

static constexpr uint32_t kDefaultWorkerCount = 4U;
static constexpr uint32_t kDefaultQueueCapacity = 100U;
static constexpr uint32_t kDefaultTickIntervalMs = 100U;

struct SchedulerConfig {
  FixedString<31> name{"scheduler"};
  uint32_t worker_count{kDefaultWorkerCount};
  uint32_t submit_queue_capacity{kDefaultQueueCapacity};
  uint32_t dispatch_queue_capacity{kDefaultQueueCapacity};
  uint32_t tick_interval_ms{kDefaultTickIntervalMs};
  uint32_t max_dispatch_wait_ticks{0U};
};

namespace detail {

inline bool IsSchedulerKey(const std::string& key) noexcept {
  static const char* const kKeys[] = {"name",
                                      "worker_count",
                                      "submit_queue_capacity",
                                      "dispatch_queue_capacity",
                                      "tick_interval_ms",
                                      "max_dispatch_wait_ticks"};
  for (const char* k : kKeys) {
    if (key == k) return true;
  }
  return false;
}

inline uint32_t ReadPositive(const ConfigStore& store, const char* key, uint32_t default_val,
                             bool allow_zero) {
  if (!store.HasKey("scheduler", key)) return default_val;
  optional<int32_t> v = store.FindInt("scheduler", key);
  if (!v.has_value() || *v < 0 || (*v == 0 && !allow_zero)) {
    TSCHED_LOG_WARN("Config", "invalid value key=scheduler.%s value=%s default=%u", key,
                    store.GetString("scheduler", key), default_val);
    return default_val;
  }
  return static_cast<uint32_t>(*v);
}

}  // namespace detail

/**
 * @brief Build a SchedulerConfig from @p store.
 *
 * Missing keys keep their defaults. Malformed or out-of-range values are
 * logged and replaced by the default, and so is a misspelled key in
 * [scheduler]. A valid [log] level is applied to the logger.
 */
inline SchedulerConfig SchedulerConfigFromStore(const ConfigStore& store) {
  SchedulerConfig cfg;
  for (const std::string& key : store.KeysIn("scheduler")) {
    if (!detail::IsSchedulerKey(key)) {
      TSCHED_LOG_WARN("Config", "unknown key=scheduler.%s ignored", key.c_str());
    }
  }
  if (store.HasKey("scheduler", "name")) {
    cfg.name = store.GetString("scheduler", "name");
  }
  cfg.worker_count = detail::ReadPositive(store, "worker_count", kDefaultWorkerCount, false);
  cfg.submit_queue_capacity =
      detail::ReadPositive(store, "submit_queue_capacity", kDefaultQueueCapacity, false);
  cfg.dispatch_queue_capacity =
      detail::ReadPositive(store, "dispatch_queue_capacity", kDefaultQueueCapacity, false);
  cfg.tick_interval_ms =
      detail::ReadPositive(store, "tick_interval_ms", kDefaultTickIntervalMs, false);
  cfg.max_dispatch_wait_ticks = detail::ReadPositive(store, "max_dispatch_wait_ticks", 0U, true);

  if (store.HasKey("log", "level")) {
    const char* name = store.GetString("log", "level");
    optional<log::Level> level = log::ParseLevel(name);
    if (level.has_value()) {
      log::SetLevel(*level);
    } else {
      TSCHED_LOG_WARN("Config", "invalid value key=log.level value=%s", name);
    }
  }
  return cfg;
}

#ifdef TSCHED_CONFIG_INI_ENABLED

/**
 * @brief Load an INI file and map it onto a SchedulerConfig.
 * @return kFileNotFound or kParseError if the file cannot be read.
 */
inline expected<SchedulerConfig, ConfigError> LoadSchedulerConfig(const char* path) {
  IniConfig ini;
  auto r = ini.LoadFile(path);
  if (!r.has_value()) {
    return expected<SchedulerConfig, ConfigError>::error(r.get_error());
  }
  return expected<SchedulerConfig, ConfigError>::success(SchedulerConfigFromStore(ini));
}

#endif  // TSCHED_CONFIG_INI_ENABLED

}  // namespace tsched

#endif  // TSCHED_SCHEDULER_CONFIG_HPP_
