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
 * @file task_registry.hpp
 * @brief TaskRegistry - lifecycle records for every submitted task.
 *
 * Records live in an append-only arena and are addressed by a RecordHandle
 * (arena index) internally and by TaskId externally. One shared_mutex
 * guards the arena and the id index:
 *   - Create / transitions / Cancel : exclusive lock
 *   - Snapshot / Size / CountByStatus : shared lock
 *
 * Status machine:
 *
 *   kPending --> kRunning --> kCompleted
 *      |  ^          |
 *      |  +--retry---+
 *      |             +------> kFailed
 *      +--> kCancelled
 *      +--> kFailed           (queue full, dispatch timeout, pool closed)
 *
 * kCompleted, kFailed and kCancelled are terminal. kRunning never becomes
 * kCancelled.
 */

#ifndef TSCHED_TASK_REGISTRY_HPP_
#define TSCHED_TASK_REGISTRY_HPP_

#include "tsched/platform.hpp"
#include "tsched/task.hpp"
#include "tsched/vocabulary.hpp"

#include <atomic>
#include <chrono>
#include <cinttypes>
#include <cstdint>
#include <cstdio>
#include <deque>
#include <memory>
#include <mutex>
#include <random>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <utility>

namespace tsched {

// ============================================================================
// Error codes
// ============================================================================

enum class SchedulerError : uint8_t {
  kQueueFull = 0,      ///< Submission buffer saturated
  kRetryQueueFull,     ///< Retry could not be re-enqueued
  kDispatchTimeout,    ///< Not dispatched within max_dispatch_wait_ticks
  kTaskNotFound,       ///< Unknown identifier
  kInvalidTransition,  ///< Status change not allowed from current status
  kExecutionError,     ///< Task reported failure or threw
  kDeadlineExceeded,   ///< Task timeout fired
  kPoolClosed,         ///< Scheduler stopped
  kInvalidTask,        ///< Null task or empty identifier
  kDuplicateId,        ///< Identifier already registered
  kAlreadyStarted,     ///< Start() while running
};

inline const char* SchedulerErrorToString(SchedulerError e) noexcept {
  switch (e) {
    case SchedulerError::kQueueFull:
      return "QueueFull";
    case SchedulerError::kRetryQueueFull:
      return "RetryQueueFull";
    case SchedulerError::kDispatchTimeout:
      return "DispatchTimeout";
    case SchedulerError::kTaskNotFound:
      return "TaskNotFound";
    case SchedulerError::kInvalidTransition:
      return "InvalidTransition";
    case SchedulerError::kExecutionError:
      return "ExecutionError";
    case SchedulerError::kDeadlineExceeded:
      return "DeadlineExceeded";
    case SchedulerError::kPoolClosed:
      return "PoolClosed";
    case SchedulerError::kInvalidTask:
      return "InvalidTask";
    case SchedulerError::kDuplicateId:
      return "DuplicateId";
    case SchedulerError::kAlreadyStarted:
      return "AlreadyStarted";
  }
  return "Unknown";
}

struct ErrorInfo {
  SchedulerError code{SchedulerError::kExecutionError};
  std::string message;
};

// ============================================================================
// TaskStatus
// ============================================================================

enum class TaskStatus : uint8_t {
  kPending = 0,
  kRunning,
  kCompleted,
  kFailed,
  kCancelled,
};

inline const char* TaskStatusToString(TaskStatus s) noexcept {
  switch (s) {
    case TaskStatus::kPending:
      return "pending";
    case TaskStatus::kRunning:
      return "running";
    case TaskStatus::kCompleted:
      return "completed";
    case TaskStatus::kFailed:
      return "failed";
    case TaskStatus::kCancelled:
      return "cancelled";
  }
  return "unknown";
}

inline bool IsTerminal(TaskStatus s) noexcept {
  return s == TaskStatus::kCompleted || s == TaskStatus::kFailed || s == TaskStatus::kCancelled;
}

inline bool IsLegalTransition(TaskStatus from, TaskStatus to) noexcept {
  switch (from) {
    case TaskStatus::kPending:
      return to == TaskStatus::kRunning || to == TaskStatus::kCancelled ||
             to == TaskStatus::kFailed;
    case TaskStatus::kRunning:
      return to == TaskStatus::kCompleted || to == TaskStatus::kFailed ||
             to == TaskStatus::kPending;
    default:
      return false;
  }
}

// ============================================================================
// TaskRecord
// ============================================================================

using TaskId = std::string;

/**
 * @brief Lifecycle entry of one submitted task.
 *
 * Timestamps are monotonic microseconds (SteadyNowUs), 0 when not reached.
 */
struct TaskRecord {
  TaskId id;
  std::shared_ptr<Task> task;
  std::string name;
  int32_t priority{0};
  std::chrono::milliseconds timeout{0};
  uint32_t retry_budget{0U};

  TaskStatus status{TaskStatus::kPending};
  uint64_t created_us{0U};
  uint64_t started_us{0U};
  uint64_t ended_us{0U};
  optional<ErrorInfo> last_error;
  uint32_t retries{0U};
  uint32_t executions{0U};
};

/// Arena index of a record; stable for the registry's lifetime.
using RecordHandle = uint32_t;

/// Result of TaskRegistry::Create().
struct CreatedRecord {
  RecordHandle handle{0U};
  TaskId id;
  int32_t priority{0};
};

/// What a worker needs to run one attempt, captured under the lock.
struct RunTicket {
  std::shared_ptr<Task> task;
  TaskId id;
  int32_t priority{0};
  std::chrono::milliseconds timeout{0};
  uint32_t retry_budget{0U};
  uint32_t attempt{0U};
};

enum class FailureOutcome : uint8_t {
  kRetry = 0,   ///< Back to kPending, caller must re-enqueue
  kExhausted,   ///< Now kFailed
  kIgnored,     ///< Record was not kRunning
};

// ============================================================================
// TaskRegistry
// ============================================================================

class TaskRegistry final {
 public:
  explicit TaskRegistry(const char* id_prefix = "task") : prefix_(id_prefix), instance_tag_(MakeInstanceTag()) {}

  TaskRegistry(const TaskRegistry&) = delete;
  TaskRegistry& operator=(const TaskRegistry&) = delete;

  /**
   * @brief Register a new kPending record.
   *
   * Priority, timeout and retry budget are read from @p task here, once.
   *
   * @param id Caller-chosen identifier, or empty to generate one.
   * @return Handle, id and priority, or kInvalidTask / kDuplicateId.
   */
  expected<CreatedRecord, SchedulerError> Create(std::shared_ptr<Task> task, const TaskId& id = TaskId()) {
    if (!task) {
      return expected<CreatedRecord, SchedulerError>::error(SchedulerError::kInvalidTask);
    }

    TaskRecord rec;
    rec.name = task->Name();
    rec.priority = task->Priority();
    rec.timeout = task->Timeout();
    if (rec.timeout.count() < 0) {
      rec.timeout = std::chrono::milliseconds(0);
    }
    rec.retry_budget = task->RetryBudget();
    rec.task = std::move(task);
    rec.status = TaskStatus::kPending;
    rec.created_us = SteadyNowUs();

    std::unique_lock<std::shared_mutex> lock(mtx_);
    rec.id = id.empty() ? NextIdLocked() : id;
    if (index_.find(rec.id) != index_.end()) {
      return expected<CreatedRecord, SchedulerError>::error(SchedulerError::kDuplicateId);
    }
    CreatedRecord created;
    created.handle = static_cast<RecordHandle>(records_.size());
    created.id = rec.id;
    created.priority = rec.priority;
    index_.emplace(rec.id, created.handle);
    records_.push_back(std::move(rec));
    return expected<CreatedRecord, SchedulerError>::success(std::move(created));
  }

  // ======================== Queries ========================

  optional<TaskRecord> Snapshot(const TaskId& id) const {
    std::shared_lock<std::shared_mutex> lock(mtx_);
    auto it = index_.find(id);
    if (it == index_.end()) return {};
    return records_[it->second];
  }

  optional<TaskRecord> Snapshot(RecordHandle handle) const {
    std::shared_lock<std::shared_mutex> lock(mtx_);
    if (handle >= records_.size()) return {};
    return records_[handle];
  }

  optional<TaskStatus> StatusOf(RecordHandle handle) const {
    std::shared_lock<std::shared_mutex> lock(mtx_);
    if (handle >= records_.size()) return {};
    return records_[handle].status;
  }

  TaskId IdOf(RecordHandle handle) const {
    std::shared_lock<std::shared_mutex> lock(mtx_);
    return (handle < records_.size()) ? records_[handle].id : TaskId();
  }

  uint32_t Size() const {
    std::shared_lock<std::shared_mutex> lock(mtx_);
    return static_cast<uint32_t>(records_.size());
  }

  uint32_t CountByStatus(TaskStatus status) const {
    std::shared_lock<std::shared_mutex> lock(mtx_);
    uint32_t n = 0U;
    for (const auto& r : records_) {
      if (r.status == status) ++n;
    }
    return n;
  }

  // ======================== Transitions ========================

  /**
   * @brief kPending -> kCancelled.
   * @return kTaskNotFound, or kInvalidTransition for any other status.
   */
  expected<void, SchedulerError> Cancel(const TaskId& id) {
    std::unique_lock<std::shared_mutex> lock(mtx_);
    auto it = index_.find(id);
    if (it == index_.end()) {
      return expected<void, SchedulerError>::error(SchedulerError::kTaskNotFound);
    }
    TaskRecord& rec = records_[it->second];
    if (!TransitionLocked(rec, TaskStatus::kPending, TaskStatus::kCancelled)) {
      return expected<void, SchedulerError>::error(SchedulerError::kInvalidTransition);
    }
    rec.ended_us = SteadyNowUs();
    return expected<void, SchedulerError>::success();
  }

  /**
   * @brief kPending -> kRunning, stamping the start time.
   *
   * Serialized with Cancel(): exactly one of them wins a given record.
   * @return Ticket, or empty if the record is no longer kPending.
   */
  optional<RunTicket> BeginRun(RecordHandle handle) {
    std::unique_lock<std::shared_mutex> lock(mtx_);
    if (handle >= records_.size()) return {};
    TaskRecord& rec = records_[handle];
    if (!TransitionLocked(rec, TaskStatus::kPending, TaskStatus::kRunning)) return {};
    rec.started_us = SteadyNowUs();
    rec.ended_us = 0U;
    ++rec.executions;

    RunTicket ticket;
    ticket.task = rec.task;
    ticket.id = rec.id;
    ticket.priority = rec.priority;
    ticket.timeout = rec.timeout;
    ticket.retry_budget = rec.retry_budget;
    ticket.attempt = rec.executions;
    return ticket;
  }

  /// kRunning -> kCompleted.
  bool Complete(RecordHandle handle) {
    std::unique_lock<std::shared_mutex> lock(mtx_);
    if (handle >= records_.size()) return false;
    TaskRecord& rec = records_[handle];
    if (!TransitionLocked(rec, TaskStatus::kRunning, TaskStatus::kCompleted)) return false;
    rec.ended_us = SteadyNowUs();
    return true;
  }

  /**
   * @brief Apply a failed attempt to a kRunning record.
   *
   * Within budget: retries++ and back to kPending (caller re-enqueues).
   * Otherwise kFailed. @p error becomes the record's last error either way.
   */
  FailureOutcome RecordFailure(RecordHandle handle, ErrorInfo error) {
    std::unique_lock<std::shared_mutex> lock(mtx_);
    if (handle >= records_.size()) return FailureOutcome::kIgnored;
    TaskRecord& rec = records_[handle];
    const bool retry = rec.retries < rec.retry_budget;
    if (!TransitionLocked(rec, TaskStatus::kRunning,
                          retry ? TaskStatus::kPending : TaskStatus::kFailed)) {
      return FailureOutcome::kIgnored;
    }
    rec.ended_us = SteadyNowUs();
    rec.last_error = std::move(error);
    if (retry) {
      ++rec.retries;
      return FailureOutcome::kRetry;
    }
    return FailureOutcome::kExhausted;
  }

  /**
   * @brief kPending -> kFailed with @p code.
   *
   * A previous execution error is kept in the message so the cause of the
   * last attempt is not lost.
   */
  expected<void, SchedulerError> Fail(RecordHandle handle, SchedulerError code, const std::string& message) {
    std::unique_lock<std::shared_mutex> lock(mtx_);
    if (handle >= records_.size()) {
      return expected<void, SchedulerError>::error(SchedulerError::kTaskNotFound);
    }
    TaskRecord& rec = records_[handle];
    if (!TransitionLocked(rec, TaskStatus::kPending, TaskStatus::kFailed)) {
      return expected<void, SchedulerError>::error(SchedulerError::kInvalidTransition);
    }
    ErrorInfo info{code, message};
    if (rec.last_error.has_value() && !rec.last_error->message.empty()) {
      info.message += " (last error: " + rec.last_error->message + ")";
    }
    rec.last_error = std::move(info);
    rec.ended_us = SteadyNowUs();
    return expected<void, SchedulerError>::success();
  }

 private:
  /// Every status change goes through here; caller holds mtx_ exclusively.
  static bool TransitionLocked(TaskRecord& rec, TaskStatus from, TaskStatus to) noexcept {
    TSCHED_ASSERT(IsLegalTransition(from, to));
    if (rec.status != from) return false;
    rec.status = to;
    return true;
  }

  static uint32_t MakeInstanceTag() {
    std::random_device rd;
    const uint64_t mix = (static_cast<uint64_t>(rd()) << 32U) ^ SteadyNowNs();
    return static_cast<uint32_t>(mix ^ (mix >> 32U));
  }

  TaskId NextIdLocked() {
    char buf[64];
    (void)std::snprintf(buf, sizeof(buf), "%s-%08" PRIx32 "-%" PRIu64, prefix_.c_str(), instance_tag_,
                        ++sequence_);
    return TaskId(buf);
  }

  FixedString<15> prefix_;
  const uint32_t instance_tag_;
  uint64_t sequence_{0U};

  mutable std::shared_mutex mtx_;
  std::deque<TaskRecord> records_;
  std::unordered_map<TaskId, RecordHandle> index_;
};

}  // namespace tsched

#endif  // TSCHED_TASK_REGISTRY_HPP_
