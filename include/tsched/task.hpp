/**
 * @file task.hpp
 * @brief Task contract executed by the Scheduler, plus a callable adapter.
 *
 * Producers implement Task directly, or wrap a lambda with MakeTask():
 * @code
 *   auto task = tsched::MakeTask(
 *       "process-data",
 *       [](const tsched::Context& ctx) -> tsched::TaskResult {
 *         if (ctx.WaitFor(std::chrono::milliseconds(10))) {
 *           return tsched::TaskFail("interrupted");
 *         }
 *         return tsched::TaskOk();
 *       },
 *       tsched::TaskOptions{10, std::chrono::seconds(30), 3});
 * @endcode
 */

#ifndef TSCHED_TASK_HPP_
#define TSCHED_TASK_HPP_

#include "tsched/context.hpp"
#include "tsched/vocabulary.hpp"

#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <utility>

namespace tsched {

/// Failure message on error, nothing on success.
using TaskResult = expected<void, std::string>;

inline TaskResult TaskOk() noexcept { return TaskResult::success(); }

inline TaskResult TaskFail(std::string message) { return TaskResult::error(std::move(message)); }

// ============================================================================
// Task
// ============================================================================

/**
 * @brief One unit of work.
 *
 * Priority(), Timeout() and RetryBudget() are read once when the task is
 * submitted. Execute() may run several times (once per attempt) and on any
 * worker thread; it should return promptly once @p ctx is done.
 */
class Task {
 public:
  virtual ~Task() = default;

  virtual TaskResult Execute(const Context& ctx) = 0;

  virtual std::string Name() const = 0;

  /// Higher runs sooner.
  virtual int32_t Priority() const = 0;

  /// Zero means unbounded.
  virtual std::chrono::milliseconds Timeout() const = 0;

  /// Re-executions allowed after the first failure.
  virtual uint32_t RetryBudget() const = 0;
};

// ============================================================================
// FunctionTask
// ============================================================================

struct TaskOptions {
  int32_t priority{0};
  std::chrono::milliseconds timeout{0};
  uint32_t retry_budget{0U};
};

class FunctionTask final : public Task {
 public:
  using Handler = std::function<TaskResult(const Context&)>;

  FunctionTask(std::string name, Handler handler, const TaskOptions& opts = TaskOptions{})
      : name_(std::move(name)), handler_(std::move(handler)), opts_(opts) {}

  TaskResult Execute(const Context& ctx) override {
    if (!handler_) {
      return TaskFail("no handler");
    }
    return handler_(ctx);
  }

  std::string Name() const override { return name_; }
  int32_t Priority() const override { return opts_.priority; }
  std::chrono::milliseconds Timeout() const override { return opts_.timeout; }
  uint32_t RetryBudget() const override { return opts_.retry_budget; }

 private:
  std::string name_;
  Handler handler_;
  TaskOptions opts_;
};

inline std::shared_ptr<Task> MakeTask(std::string name, FunctionTask::Handler handler,
                                      const TaskOptions& opts = TaskOptions{}) {
  return std::make_shared<FunctionTask>(std::move(name), std::move(handler), opts);
}

}  // namespace tsched

#endif  // TSCHED_TASK_HPP_
