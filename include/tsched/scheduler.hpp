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
 * @file scheduler.hpp
 * @brief Scheduler - bounded worker pool with a priority dispatcher.
 *
 * Architecture:
 *   Submit() -> TaskRegistry::Create() -> submit queue (bounded MPMC)
 *                    |
 *              Dispatcher thread (one flush per tick)
 *                    | priority desc, sequence asc
 *              dispatch queue (bounded MPMC)
 *                    |
 *              Worker[0..N-1] -> Task::Execute(ctx) -> TaskRegistry
 *                    | failure within retry budget
 *              submit queue (resubmit)
 *
 * Features:
 * - Non-blocking submission; a full submit queue is reported as kQueueFull
 * - Priority ordering within each flush window
 * - Per-task timeout through a deadline-bound child Context
 * - Retry budget with resubmission behind earlier equal-priority work
 * - Cancellation of pending tasks, serialized with the worker start step
 * - Graceful Stop(): final flush, drain, join
 * - Cancelling the Start() context closes the pool without waiting for Stop()
 *
 * Usage:
 *   tsched::SchedulerConfig cfg;
 *   cfg.worker_count = 4;
 *
 *   tsched::Scheduler sched(cfg);
 *   sched.Start();
 *   auto id = sched.Submit(tsched::MakeTask("job", [](const tsched::Context&) {
 *     return tsched::TaskOk();
 *   }));
 *   sched.Stop();
 */

#ifndef TSCHED_SCHEDULER_HPP_
#define TSCHED_SCHEDULER_HPP_

#include "tsched/bounded_queue.hpp"
#include "tsched/context.hpp"
#include "tsched/log.hpp"
#include "tsched/module.hpp"
#include "tsched/platform.hpp"
#include "tsched/scheduler_config.hpp"
#include "tsched/task.hpp"
#include "tsched/task_registry.hpp"
#include "tsched/vocabulary.hpp"

#include <cstdint>

#include <algorithm>
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <exception>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <utility>
#include <vector>

namespace tsched {

// ============================================================================
// QueueItem - what travels through both queues
// ============================================================================

struct QueueItem {
  RecordHandle handle{0U};
  int32_t priority{0};
  uint64_t seq{0U};           ///< Assigned on every enqueue to the submit queue
  uint32_t waited_ticks{0U};  ///< Ticks spent in the dispatcher heap
};

namespace detail {

/// Heap order: higher priority first, then lower sequence first.
struct QueueItemLess {
  bool operator()(const QueueItem& a, const QueueItem& b) const noexcept {
    if (a.priority != b.priority) {
      return a.priority < b.priority;
    }
    return a.seq > b.seq;
  }
};

}  // namespace detail

// ============================================================================
// Scheduler Statistics
// ============================================================================

struct SchedulerStats {
  uint64_t submitted{0U};          ///< Accepted by Submit()
  uint64_t rejected{0U};           ///< Refused by Submit() (any error)
  uint64_t dispatched{0U};         ///< Forwarded to the dispatch queue
  uint64_t requeued{0U};           ///< Kept in the heap because the dispatch queue was full
  uint64_t dispatch_timeouts{0U};  ///< Failed with kDispatchTimeout
  uint64_t completed{0U};
  uint64_t failed{0U};             ///< Accepted tasks that ended kFailed
  uint64_t cancelled{0U};
  uint64_t retried{0U};            ///< Retries successfully resubmitted
  uint32_t submit_queue_depth{0U};
  uint32_t dispatch_queue_depth{0U};
};

// ============================================================================
// Scheduler
// ============================================================================

class Scheduler final : public Module {
 public:
  explicit Scheduler(const SchedulerConfig& cfg = SchedulerConfig{})
      : name_(cfg.name),
        worker_count_(cfg.worker_count > 0U ? cfg.worker_count : 1U),
        tick_(cfg.tick_interval_ms > 0U ? cfg.tick_interval_ms : 1U),
        max_dispatch_wait_ticks_(cfg.max_dispatch_wait_ticks),
        submit_q_(cfg.submit_queue_capacity),
        dispatch_q_(cfg.dispatch_queue_capacity) {}

  /// Must not run on one of the scheduler's own threads.
  ~Scheduler() override { (void)Stop(); }

  Scheduler(const Scheduler&) = delete;
  Scheduler& operator=(const Scheduler&) = delete;
  Scheduler(Scheduler&&) = delete;
  Scheduler& operator=(Scheduler&&) = delete;

  // ======================== Submission ========================

  /**
   * @brief Register @p task and enqueue it without blocking.
   *
   * @return The generated identifier, or:
   *   - kInvalidTask  : null task
   *   - kPoolClosed   : Stop() was called, or the Start() context is done
   *                     (no record is created)
   *   - kQueueFull    : submit queue saturated (the record is kFailed)
   */
  expected<TaskId, SchedulerError> Submit(std::shared_ptr<Task> task) {
    return SubmitImpl(std::move(task), TaskId());
  }

  /**
   * @brief Submit() with a caller-chosen identifier.
   *
   * An empty @p id is kInvalidTask; an identifier already registered is
   * kDuplicateId and the existing record is left untouched.
   */
  expected<TaskId, SchedulerError> SubmitWithId(std::shared_ptr<Task> task, const TaskId& id) {
    if (id.empty()) {
      rejected_.fetch_add(1U, std::memory_order_relaxed);
      TSCHED_LOG_WARN("Scheduler", "task rejected reason=%s",
                      SchedulerErrorToString(SchedulerError::kInvalidTask));
      return expected<TaskId, SchedulerError>::error(SchedulerError::kInvalidTask);
    }
    return SubmitImpl(std::move(task), id);
  }

  // ======================== Queries ========================

  /// Snapshot of the record, or empty for an unknown identifier.
  optional<TaskRecord> GetInfo(const TaskId& id) const { return registry_.Snapshot(id); }

  const TaskRegistry& Registry() const noexcept { return registry_; }

  SchedulerStats GetStats() const {
    SchedulerStats s;
    s.submitted = submitted_.load(std::memory_order_relaxed);
    s.rejected = rejected_.load(std::memory_order_relaxed);
    s.dispatched = dispatched_.load(std::memory_order_relaxed);
    s.requeued = requeued_.load(std::memory_order_relaxed);
    s.dispatch_timeouts = dispatch_timeouts_.load(std::memory_order_relaxed);
    s.completed = completed_.load(std::memory_order_relaxed);
    s.failed = failed_.load(std::memory_order_relaxed);
    s.cancelled = cancelled_.load(std::memory_order_relaxed);
    s.retried = retried_.load(std::memory_order_relaxed);
    s.submit_queue_depth = submit_q_.Size();
    s.dispatch_queue_depth = dispatch_q_.Size();
    return s;
  }

  bool IsRunning() const noexcept { return running_.load(std::memory_order_acquire); }
  uint32_t WorkerCount() const noexcept { return worker_count_; }
  const char* Name() const noexcept { return name_.c_str(); }

  // ======================== Cancellation ========================

  /// @return true only if the task was kPending and is now kCancelled.
  bool Cancel(const TaskId& id) { return CancelEx(id).has_value(); }

  /**
   * @brief Cancel a pending task, reporting why it could not be cancelled.
   * @return kTaskNotFound or kInvalidTransition (running or terminal).
   */
  expected<void, SchedulerError> CancelEx(const TaskId& id) {
    auto r = registry_.Cancel(id);
    if (r.has_value()) {
      cancelled_.fetch_add(1U, std::memory_order_relaxed);
      TSCHED_LOG_INFO("Scheduler", "task cancelled id=%s", id.c_str());
    } else {
      TSCHED_LOG_DEBUG("Scheduler", "cancel refused id=%s reason=%s", id.c_str(),
                       SchedulerErrorToString(r.get_error()));
    }
    return r;
  }

  // ======================== Lifecycle ========================

  /**
   * @brief Spawn the dispatcher and the workers, then return.
   *
   * Cancelling @p ctx cancels every running task's context and closes the
   * pool: the workers stop pulling work, Submit() reports kPoolClosed, and
   * every record still queued ends kFailed with kPoolClosed within one tick.
   * Stop() is still required to join the threads.
   *
   * @return kAlreadyStarted while running, kPoolClosed after Stop().
   */
  expected<void, SchedulerError> Start(const Context& ctx = Context::Background()) {
    std::lock_guard<std::mutex> lock(lifecycle_mtx_);
    if (state_ == State::kRunning) {
      return expected<void, SchedulerError>::error(SchedulerError::kAlreadyStarted);
    }
    if (state_ == State::kStopped) {
      return expected<void, SchedulerError>::error(SchedulerError::kPoolClosed);
    }

    pool_ctx_ = Context::WithCancel(ctx);
    {
      std::lock_guard<std::mutex> tick_lock(tick_mtx_);
      stop_dispatch_ = false;
    }

    dispatcher_thread_ = std::thread(&Scheduler::DispatcherLoop, this);
    worker_threads_.reserve(worker_count_);
    for (uint32_t i = 0U; i < worker_count_; ++i) {
      worker_threads_.emplace_back(&Scheduler::WorkerLoop, this, i);
    }

    state_ = State::kRunning;
    running_.store(true, std::memory_order_release);
    TSCHED_LOG_INFO("Scheduler", "scheduler started name=%s workers=%u tick_ms=%u",
                    name_.c_str(), worker_count_, static_cast<uint32_t>(tick_.count()));
    return expected<void, SchedulerError>::success();
  }

  /**
   * @brief Stop accepting work, flush, drain, and join every thread.
   *
   * Queued tasks are still executed unless the context passed to Start()
   * is cancelled; whatever cannot run ends kFailed with kPoolClosed.
   * A second call returns success without side effects.
   *
   * @return kInvalidTransition when called from a task or another thread
   *         owned by this scheduler, which cannot join itself.
   */
  expected<void, SchedulerError> Stop() {
    if (TSCHED_UNLIKELY(CurrentOwner() == this)) {
      TSCHED_LOG_ERROR("Scheduler", "Stop() refused on an own thread name=%s", name_.c_str());
      return expected<void, SchedulerError>::error(SchedulerError::kInvalidTransition);
    }
    std::lock_guard<std::mutex> lock(lifecycle_mtx_);
    if (state_ == State::kStopped) {
      return expected<void, SchedulerError>::success();
    }
    const bool was_running = (state_ == State::kRunning);
    state_ = State::kStopped;
    closed_.store(true, std::memory_order_release);

    if (was_running) {
      {
        std::lock_guard<std::mutex> tick_lock(tick_mtx_);
        stop_dispatch_ = true;
      }
      tick_cv_.notify_all();
      if (dispatcher_thread_.joinable()) {
        dispatcher_thread_.join();
      }

      dispatch_q_.Close();
      for (auto& t : worker_threads_) {
        if (t.joinable()) {
          t.join();
        }
      }
      worker_threads_.clear();
    } else {
      submit_q_.Close();
      dispatch_q_.Close();
    }

    const uint32_t leftovers = FailLeftovers();
    pool_ctx_.Cancel();
    running_.store(false, std::memory_order_release);

    TSCHED_LOG_INFO("Scheduler",
                    "scheduler stopped name=%s completed=%llu failed=%llu cancelled=%llu leftovers=%u",
                    name_.c_str(),
                    static_cast<unsigned long long>(completed_.load(std::memory_order_relaxed)),
                    static_cast<unsigned long long>(failed_.load(std::memory_order_relaxed)),
                    static_cast<unsigned long long>(cancelled_.load(std::memory_order_relaxed)),
                    leftovers);
    return expected<void, SchedulerError>::success();
  }

  // ======================== Module ========================

  bool StartModule(const Context& ctx) override { return Start(ctx).has_value(); }
  bool StopModule() override { return Stop().has_value(); }

 private:
  enum class State : uint8_t { kIdle = 0, kRunning, kStopped };

  static constexpr std::chrono::milliseconds kWorkerPoll{10};
  static constexpr std::chrono::milliseconds kFlushPoll{10};

  /// Scheduler that owns the calling thread, or nullptr.
  static const Scheduler*& CurrentOwner() noexcept {
    static thread_local const Scheduler* owner = nullptr;
    return owner;
  }

  // ======================== Submission path ========================

  expected<TaskId, SchedulerError> SubmitImpl(std::shared_ptr<Task> task, const TaskId& id) {
    if (!task) {
      return Reject(SchedulerError::kInvalidTask);
    }
    // running_ is read first: closed_ is always set before running_ drops, and
    // pool_ctx_ is only reassigned by Start() before running_ is published.
    const bool running = running_.load(std::memory_order_acquire);
    if (TSCHED_UNLIKELY(closed_.load(std::memory_order_acquire) ||
                        (running && pool_ctx_.IsDone()))) {
      return Reject(SchedulerError::kPoolClosed);
    }

    auto created = registry_.Create(std::move(task), id);
    if (!created.has_value()) {
      return Reject(created.get_error());
    }
    const CreatedRecord& rec = created.value();

    QueueItem item;
    item.handle = rec.handle;
    item.priority = rec.priority;
    item.seq = seq_.fetch_add(1U, std::memory_order_relaxed);

    const PushResult pr = submit_q_.TryPush(item);
    if (pr == PushResult::kOk) {
      submitted_.fetch_add(1U, std::memory_order_relaxed);
      TSCHED_LOG_INFO("Scheduler", "task submitted id=%s priority=%d", rec.id.c_str(),
                      rec.priority);
      return expected<TaskId, SchedulerError>::success(rec.id);
    }

    // The record exists; make it agree with what the caller is told.
    const SchedulerError code =
        (pr == PushResult::kClosed) ? SchedulerError::kPoolClosed : SchedulerError::kQueueFull;
    (void)registry_.Fail(rec.handle, code,
                         code == SchedulerError::kQueueFull ? "submit queue full" : "scheduler stopped");
    rejected_.fetch_add(1U, std::memory_order_relaxed);
    TSCHED_LOG_WARN("Scheduler", "task rejected id=%s reason=%s depth=%u", rec.id.c_str(),
                    SchedulerErrorToString(code), submit_q_.Size());
    return expected<TaskId, SchedulerError>::error(code);
  }

  expected<TaskId, SchedulerError> Reject(SchedulerError code) {
    rejected_.fetch_add(1U, std::memory_order_relaxed);
    TSCHED_LOG_WARN("Scheduler", "task rejected reason=%s", SchedulerErrorToString(code));
    return expected<TaskId, SchedulerError>::error(code);
  }

  // ======================== Dispatcher thread ========================

  void DispatcherLoop() {
    CurrentOwner() = this;
    std::vector<QueueItem> batch;
    batch.reserve(submit_q_.Capacity());

    for (;;) {
      {
        std::unique_lock<std::mutex> lock(tick_mtx_);
        tick_cv_.wait_for(lock, tick_, [this] { return stop_dispatch_; });
        if (stop_dispatch_) {
          break;
        }
      }
      if (pool_ctx_.IsDone()) {
        break;
      }
      FlushTick(batch);
    }

    // Producers and retries see kClosed from here on.
    submit_q_.Close();
    if (pool_ctx_.IsDone()) {
      AbortPool();
      return;
    }
    CollectSubmitted(batch);
    FinalFlush();
  }

  /// The Start() context ended: nothing queued will ever run.
  void AbortPool() {
    closed_.store(true, std::memory_order_release);
    running_.store(false, std::memory_order_release);
    dispatch_q_.Close();
    const uint32_t leftovers = FailLeftovers();
    TSCHED_LOG_WARN("Scheduler", "pool context done name=%s state=%s leftovers=%u",
                    name_.c_str(), ContextStateToString(pool_ctx_.State()), leftovers);
  }

  void CollectSubmitted(std::vector<QueueItem>& batch) {
    batch.clear();
    submit_q_.DrainTo(batch);
    for (const QueueItem& item : batch) {
      heap_.push_back(item);
      std::push_heap(heap_.begin(), heap_.end(), detail::QueueItemLess());
    }
  }

  QueueItem PopHighest() {
    std::pop_heap(heap_.begin(), heap_.end(), detail::QueueItemLess());
    QueueItem item = heap_.back();
    heap_.pop_back();
    return item;
  }

  bool IsStillPending(RecordHandle handle) const {
    optional<TaskStatus> st = registry_.StatusOf(handle);
    return st.has_value() && *st == TaskStatus::kPending;
  }

  /**
   * @brief One flush window: drain, order, forward.
   *
   * Once the dispatch queue refuses an item, the remaining items stay in the
   * heap so a lower priority never overtakes a higher one within a window.
   */
  void FlushTick(std::vector<QueueItem>& batch) {
    CollectSubmitted(batch);
    if (heap_.empty()) {
      return;
    }

    std::vector<QueueItem> deferred;
    bool dispatch_full = false;
    while (!heap_.empty()) {
      QueueItem item = PopHighest();
      if (!IsStillPending(item.handle)) {
        continue;
      }

      if (!dispatch_full) {
        if (TSCHED_LIKELY(dispatch_q_.TryPush(item) == PushResult::kOk)) {
          dispatched_.fetch_add(1U, std::memory_order_relaxed);
          continue;
        }
        dispatch_full = true;
      }

      ++item.waited_ticks;
      if (max_dispatch_wait_ticks_ > 0U && item.waited_ticks >= max_dispatch_wait_ticks_) {
        if (registry_.Fail(item.handle, SchedulerError::kDispatchTimeout,
                           "not dispatched within " + std::to_string(max_dispatch_wait_ticks_) +
                               " ticks")
                .has_value()) {
          dispatch_timeouts_.fetch_add(1U, std::memory_order_relaxed);
          failed_.fetch_add(1U, std::memory_order_relaxed);
          TSCHED_LOG_ERROR("Scheduler", "dispatch timeout id=%s waited_ticks=%u",
                           registry_.IdOf(item.handle).c_str(), item.waited_ticks);
        }
        continue;
      }
      deferred.push_back(item);
    }

    for (const QueueItem& item : deferred) {
      heap_.push_back(item);
      std::push_heap(heap_.begin(), heap_.end(), detail::QueueItemLess());
    }
    if (!deferred.empty()) {
      requeued_.fetch_add(deferred.size(), std::memory_order_relaxed);
      TSCHED_LOG_WARN("Scheduler", "dispatch queue full requeued=%u dispatch_depth=%u",
                      static_cast<uint32_t>(deferred.size()), dispatch_q_.Size());
    }
  }

  /**
   * @brief Forward everything left, waiting for capacity.
   *
   * Only a cancelled pool context gives up; the remainder is then failed by
   * Stop() together with the dispatch queue contents.
   */
  void FinalFlush() {
    while (!heap_.empty()) {
      QueueItem item = PopHighest();
      if (!IsStillPending(item.handle)) {
        continue;
      }
      bool placed = false;
      while (!pool_ctx_.IsDone()) {
        const PushResult pr = dispatch_q_.PushFor(item, kFlushPoll);
        if (pr == PushResult::kOk) {
          placed = true;
          break;
        }
        if (pr == PushResult::kClosed) {
          break;
        }
      }
      if (!placed) {
        heap_.push_back(item);
        std::push_heap(heap_.begin(), heap_.end(), detail::QueueItemLess());
        return;
      }
      dispatched_.fetch_add(1U, std::memory_order_relaxed);
    }
  }

  // ======================== Worker thread ========================

  void WorkerLoop(uint32_t worker_id) {
    CurrentOwner() = this;
    TSCHED_LOG_DEBUG("Scheduler", "worker started name=%s worker=%u", name_.c_str(), worker_id);
    QueueItem item;
    while (!pool_ctx_.IsDone()) {
      const PopResult r = dispatch_q_.PopFor(item, kWorkerPoll);
      if (r == PopResult::kClosed) {
        break;
      }
      if (r == PopResult::kEmpty) {
        continue;
      }
      if (TSCHED_UNLIKELY(pool_ctx_.IsDone())) {
        FailClosed(item.handle);
        break;
      }
      Execute(item, worker_id);
    }
    TSCHED_LOG_DEBUG("Scheduler", "worker exited name=%s worker=%u", name_.c_str(), worker_id);
  }

  void Execute(const QueueItem& item, uint32_t worker_id) {
    optional<RunTicket> ticket = registry_.BeginRun(item.handle);
    if (!ticket.has_value()) {
      // Cancelled (or otherwise finished) while queued.
      return;
    }

    TSCHED_LOG_DEBUG("Scheduler", "task started id=%s worker=%u attempt=%u", ticket->id.c_str(),
                     worker_id, ticket->attempt);

    const Context exec_ctx = (ticket->timeout.count() > 0)
                                 ? Context::WithTimeout(pool_ctx_, ticket->timeout)
                                 : pool_ctx_;
    ErrorInfo error;
    if (RunGuarded(*ticket, exec_ctx, error)) {
      if (registry_.Complete(item.handle)) {
        completed_.fetch_add(1U, std::memory_order_relaxed);
        TSCHED_LOG_INFO("Scheduler", "task completed id=%s attempt=%u", ticket->id.c_str(),
                        ticket->attempt);
      }
      return;
    }
    HandleFailure(item, *ticket, std::move(error));
  }

  /// Execute once, turning every failure mode into @p error.
  static bool RunGuarded(const RunTicket& ticket, const Context& ctx, ErrorInfo& error) {
    try {
      TaskResult result = ticket.task->Execute(ctx);
      if (ctx.State() == ContextState::kDeadlineExceeded) {
        error.code = SchedulerError::kDeadlineExceeded;
        error.message = (ticket.timeout.count() > 0)
                            ? "deadline exceeded after " + std::to_string(ticket.timeout.count()) + "ms"
                            : std::string("deadline exceeded");
        return false;
      }
      if (result.has_value()) {
        return true;
      }
      error.code = SchedulerError::kExecutionError;
      error.message = result.get_error();
    } catch (const std::exception& e) {
      error.code = SchedulerError::kExecutionError;
      error.message = std::string("exception: ") + e.what();
    } catch (...) {
      error.code = SchedulerError::kExecutionError;
      error.message = "unknown exception";
    }
    return false;
  }

  void HandleFailure(const QueueItem& item, const RunTicket& ticket, ErrorInfo error) {
    const SchedulerError code = error.code;
    const std::string message = error.message;
    const FailureOutcome outcome = registry_.RecordFailure(item.handle, std::move(error));
    if (outcome == FailureOutcome::kIgnored) {
      return;
    }
    if (outcome == FailureOutcome::kExhausted) {
      failed_.fetch_add(1U, std::memory_order_relaxed);
      TSCHED_LOG_ERROR("Scheduler", "task failed id=%s code=%s error=%s attempts=%u",
                       ticket.id.c_str(), SchedulerErrorToString(code), message.c_str(),
                       ticket.attempt);
      return;
    }

    QueueItem retry;
    retry.handle = item.handle;
    retry.priority = ticket.priority;
    retry.seq = seq_.fetch_add(1U, std::memory_order_relaxed);
    const PushResult pr = pool_ctx_.IsDone() ? PushResult::kClosed : submit_q_.TryPush(retry);
    if (pr == PushResult::kOk) {
      retried_.fetch_add(1U, std::memory_order_relaxed);
      TSCHED_LOG_WARN("Scheduler", "task retry id=%s attempt=%u budget=%u code=%s error=%s",
                      ticket.id.c_str(), ticket.attempt, ticket.retry_budget,
                      SchedulerErrorToString(code), message.c_str());
      return;
    }

    const SchedulerError fail_code =
        (pr == PushResult::kClosed) ? SchedulerError::kPoolClosed : SchedulerError::kRetryQueueFull;
    if (registry_.Fail(item.handle, fail_code,
                       fail_code == SchedulerError::kPoolClosed ? "scheduler stopped before retry"
                                                                : "retry could not be enqueued")
            .has_value()) {
      failed_.fetch_add(1U, std::memory_order_relaxed);
      TSCHED_LOG_ERROR("Scheduler", "task failed id=%s code=%s error=%s attempts=%u",
                       ticket.id.c_str(), SchedulerErrorToString(fail_code), message.c_str(),
                       ticket.attempt);
    }
  }

  // ======================== Shutdown helpers ========================

  /// Fail every record still sitting in the heap or either queue.
  uint32_t FailLeftovers() {
    std::vector<QueueItem> items;
    items.swap(heap_);
    (void)submit_q_.DrainTo(items);
    (void)dispatch_q_.DrainTo(items);

    uint32_t n = 0U;
    for (const QueueItem& item : items) {
      if (FailClosed(item.handle)) {
        ++n;
      }
    }
    return n;
  }

  bool FailClosed(RecordHandle handle) {
    if (!registry_.Fail(handle, SchedulerError::kPoolClosed, "scheduler stopped").has_value()) {
      return false;
    }
    failed_.fetch_add(1U, std::memory_order_relaxed);
    return true;
  }

  FixedString<31> name_;
  const uint32_t worker_count_;
  const std::chrono::milliseconds tick_;
  const uint32_t max_dispatch_wait_ticks_;

  TaskRegistry registry_;
  BoundedQueue<QueueItem> submit_q_;
  BoundedQueue<QueueItem> dispatch_q_;
  std::vector<QueueItem> heap_;  ///< Dispatcher thread only (and Stop() after join)
  std::atomic<uint64_t> seq_{0U};

  std::mutex lifecycle_mtx_;
  State state_{State::kIdle};
  std::atomic<bool> running_{false};
  std::atomic<bool> closed_{false};
  Context pool_ctx_{Context::Background()};

  std::mutex tick_mtx_;
  std::condition_variable tick_cv_;
  bool stop_dispatch_{false};

  std::thread dispatcher_thread_;
  std::vector<std::thread> worker_threads_;

  // One cache line per writer group.
  alignas(kCacheLineSize) std::atomic<uint64_t> submitted_{0U};
  std::atomic<uint64_t> rejected_{0U};
  alignas(kCacheLineSize) std::atomic<uint64_t> dispatched_{0U};
  std::atomic<uint64_t> requeued_{0U};
  std::atomic<uint64_t> dispatch_timeouts_{0U};
  alignas(kCacheLineSize) std::atomic<uint64_t> completed_{0U};
  std::atomic<uint64_t> failed_{0U};
  std::atomic<uint64_t> cancelled_{0U};
  std::atomic<uint64_t> retried_{0U};
};

}  // namespace tsched

#endif  // TSCHED_SCHEDULER_HPP_
