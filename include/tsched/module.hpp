/**
 * @file module.hpp
 * @brief Module interface and ModuleManager for grouped start/stop.
 *
 * Modules start in registration order and stop in reverse order, so a
 * module may rely on everything registered before it.
 */

#ifndef TSCHED_MODULE_HPP_
#define TSCHED_MODULE_HPP_

#include "tsched/context.hpp"
#include "tsched/log.hpp"
#include "tsched/vocabulary.hpp"

#include <cstdint>
#include <string>
#include <utility>
#include <vector>

namespace tsched {

enum class ModuleError : uint8_t {
  kDuplicateName = 0,  ///< A module with this name is registered
  kInvalidModule,      ///< nullptr module or empty name
  kStartFailed,        ///< A module's StartModule() returned false
  kStopFailed,         ///< A module's StopModule() returned false
};

/**
 * @brief Long-running component with an explicit lifecycle.
 */
class Module {
 public:
  virtual ~Module() = default;

  /** @return false if the module could not start. */
  virtual bool StartModule(const Context& ctx) = 0;

  /** @return false if the module did not stop cleanly. */
  virtual bool StopModule() = 0;
};

class ModuleManager final {
 public:
  ModuleManager() = default;
  ModuleManager(const ModuleManager&) = delete;
  ModuleManager& operator=(const ModuleManager&) = delete;

  /**
   * @brief Register a module. The manager does not take ownership.
   */
  expected<void, ModuleError> Register(const std::string& name, Module* module) {
    if (module == nullptr || name.empty()) {
      return expected<void, ModuleError>::error(ModuleError::kInvalidModule);
    }
    for (const auto& e : entries_) {
      if (e.name == name) {
        return expected<void, ModuleError>::error(ModuleError::kDuplicateName);
      }
    }
    entries_.push_back(Entry{name, module, false});
    return expected<void, ModuleError>::success();
  }

  /**
   * @brief Start every module in registration order.
   *
   * Stops at the first failure; modules already started stay running and
   * are stopped by the next StopAll().
   */
  expected<void, ModuleError> StartAll(const Context& ctx) {
    for (auto& e : entries_) {
      if (e.started) continue;
      if (!e.module->StartModule(ctx)) {
        TSCHED_LOG_ERROR("Module", "start failed module=%s", e.name.c_str());
        return expected<void, ModuleError>::error(ModuleError::kStartFailed);
      }
      e.started = true;
      TSCHED_LOG_INFO("Module", "started module=%s", e.name.c_str());
    }
    return expected<void, ModuleError>::success();
  }

  /**
   * @brief Stop started modules in reverse order.
   *
   * Every started module gets its StopModule() call even if an earlier one
   * fails; the first failure is reported.
   */
  expected<void, ModuleError> StopAll() {
    bool ok = true;
    for (auto it = entries_.rbegin(); it != entries_.rend(); ++it) {
      if (!it->started) continue;
      it->started = false;
      if (!it->module->StopModule()) {
        TSCHED_LOG_ERROR("Module", "stop failed module=%s", it->name.c_str());
        ok = false;
        continue;
      }
      TSCHED_LOG_INFO("Module", "stopped module=%s", it->name.c_str());
    }
    if (!ok) {
      return expected<void, ModuleError>::error(ModuleError::kStopFailed);
    }
    return expected<void, ModuleError>::success();
  }

  uint32_t Count() const noexcept { return static_cast<uint32_t>(entries_.size()); }

  bool IsStarted(const std::string& name) const {
    for (const auto& e : entries_) {
      if (e.name == name) return e.started;
    }
    return false;
  }

 private:
  struct Entry {
    std::string name;
    Module* module;
    bool started;
  };

  std::vector<Entry> entries_;
};

}  // namespace tsched

#endif  // TSCHED_MODULE_HPP_
