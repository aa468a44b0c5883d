/**
 * @file config.hpp
 * @brief Section/key settings store and its inih-backed INI loader.
 *
 * Section and key names are folded to lower case on the way in, so
 * "[Scheduler] Worker_Count" and "[scheduler] worker_count" are the same
 * setting. Values are kept verbatim. Parsing is enabled by the CMake option
 * TSCHED_CONFIG_INI (defines TSCHED_CONFIG_INI_ENABLED and links inih).
 *
 * Usage:
 * @code
 *   tsched::IniConfig ini;
 *   if (ini.LoadFile("scheduler.ini").has_value()) {
 *     tsched::SchedulerConfig cfg = tsched::SchedulerConfigFromStore(ini);
 *   }
 * @endcode
 */

#ifndef TSCHED_CONFIG_HPP_
#define TSCHED_CONFIG_HPP_

#include "tsched/log.hpp"
#include "tsched/platform.hpp"
#include "tsched/vocabulary.hpp"

#include <cctype>
#include <cerrno>
#include <cstdint>
#include <cstdlib>
#include <limits>
#include <map>
#include <string>
#include <utility>
#include <vector>

#ifdef TSCHED_CONFIG_INI_ENABLED
#include "ini.h"
#endif

namespace tsched {

// ============================================================================
// ConfigStore
// ============================================================================

class ConfigStore {
 public:
  /// Insert or overwrite one setting.
  void Set(const char* section, const char* key, const char* value) {
    TSCHED_ASSERT(section != nullptr && key != nullptr);
    entries_[MakeKey(section, key)] = (value != nullptr) ? value : "";
  }

  bool HasKey(const char* section, const char* key) const {
    return Find(section, key) != nullptr;
  }

  /// The pointer stays valid until the same setting is overwritten.
  const char* GetString(const char* section, const char* key,
                        const char* default_val = "") const {
    const std::string* v = Find(section, key);
    return (v != nullptr) ? v->c_str() : default_val;
  }

  /**
   * @brief Whole-value base-10 integer.
   *
   * Empty for a missing key, trailing characters ("12ms"), or a value
   * outside the int32_t range.
   */
  optional<int32_t> FindInt(const char* section, const char* key) const {
    const std::string* v = Find(section, key);
    if (v == nullptr || v->empty()) return {};
    errno = 0;
    char* end = nullptr;
    const long long n = std::strtoll(v->c_str(), &end, 10);
    if (*end != '\0' || errno == ERANGE || n < std::numeric_limits<int32_t>::min() ||
        n > std::numeric_limits<int32_t>::max()) {
      return {};
    }
    return static_cast<int32_t>(n);
  }

  /// Lower-cased key names present in @p section, sorted.
  std::vector<std::string> KeysIn(const char* section) const {
    const std::string sec = Fold(section);
    std::vector<std::string> keys;
    for (auto it = entries_.lower_bound(Key(sec, std::string())); it != entries_.end(); ++it) {
      if (it->first.first != sec) break;
      keys.push_back(it->first.second);
    }
    return keys;
  }

 private:
  using Key = std::pair<std::string, std::string>;

  static std::string Fold(const char* s) {
    std::string out(s != nullptr ? s : "");
    for (char& c : out) {
      c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
    return out;
  }

  static Key MakeKey(const char* section, const char* key) { return Key(Fold(section), Fold(key)); }

  const std::string* Find(const char* section, const char* key) const {
    TSCHED_ASSERT(section != nullptr && key != nullptr);
    auto it = entries_.find(MakeKey(section, key));
    return (it != entries_.end()) ? &it->second : nullptr;
  }

  std::map<Key, std::string> entries_;
};

// ============================================================================
// IniConfig - inih-backed loader
// ============================================================================

#ifdef TSCHED_CONFIG_INI_ENABLED

class IniConfig final : public ConfigStore {
 public:
  IniConfig() = default;

  /// @return kFileNotFound if @p path cannot be opened, kParseError on a bad line.
  expected<void, ConfigError> LoadFile(const char* path) {
    TSCHED_ASSERT(path != nullptr);
    return Check(ini_parse(path, &IniConfig::OnEntry, this), path);
  }

  expected<void, ConfigError> LoadBuffer(const char* data) {
    TSCHED_ASSERT(data != nullptr);
    return Check(ini_parse_string(data, &IniConfig::OnEntry, this), "<buffer>");
  }

 private:
  // ini_parse returns -1 when the file cannot be opened, -2 on allocation
  // failure, and the first bad line number otherwise.
  static expected<void, ConfigError> Check(int rc, const char* origin) {
    if (rc == 0) return expected<void, ConfigError>::success();
    if (rc == -1) {
      TSCHED_LOG_ERROR("Config", "cannot open path=%s", origin);
      return expected<void, ConfigError>::error(ConfigError::kFileNotFound);
    }
    TSCHED_LOG_ERROR("Config", "parse error origin=%s line=%d", origin, rc);
    return expected<void, ConfigError>::error(ConfigError::kParseError);
  }

  static int OnEntry(void* user, const char* section, const char* name, const char* value) {
    static_cast<IniConfig*>(user)->Set(section != nullptr ? section : "",
                                       name != nullptr ? name : "", value);
    return 1;
  }
};

#endif  // TSCHED_CONFIG_INI_ENABLED

}  // namespace tsched

#endif  // TSCHED_CONFIG_HPP_
