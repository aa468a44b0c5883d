// Copyright (c) 2024 liudegui. MIT License.
//
// scheduler_demo.cpp -- Scheduler walkthrough.
//
// Demonstrates:
//   1. Priority ordering within one flush window
//   2. Retry budget on a flaky task
//   3. Per-task timeout (DeadlineExceeded)
//   4. Cancelling a pending task
//   5. Submit-queue backpressure (QueueFull)
//   6. Long-running service mode stopped by SIGINT/SIGTERM
//
// Usage: scheduler_demo [config.ini] [service_seconds]

#include "tsched/log.hpp"
#include "tsched/module.hpp"
#include "tsched/scheduler.hpp"
#include "tsched/scheduler_config.hpp"
#include "tsched/shutdown.hpp"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

using namespace std::chrono_literals;

// ============================================================================
// Helpers
// ============================================================================

static void WaitIdle(const tsched::Scheduler& sched) {
  for (int i = 0; i < 500; ++i) {
    const auto& reg = sched.Registry();
    if (reg.CountByStatus(tsched::TaskStatus::kPending) == 0U &&
        reg.CountByStatus(tsched::TaskStatus::kRunning) == 0U) {
      return;
    }
    std::this_thread::sleep_for(10ms);
  }
}

static void PrintRecord(const tsched::Scheduler& sched, const tsched::TaskId& id) {
  auto rec = sched.GetInfo(id);
  if (!rec.has_value()) {
    printf("  %-28s <unknown>\n", id.c_str());
    return;
  }
  printf("  %-28s %-10s prio=%-3d exec=%u retries=%u", rec->name.c_str(),
         tsched::TaskStatusToString(rec->status), rec->priority, rec->executions, rec->retries);
  if (rec->last_error.has_value()) {
    printf(" error=%s(%s)", tsched::SchedulerErrorToString(rec->last_error->code),
           rec->last_error->message.c_str());
  }
  printf("\n");
}

static void PrintStats(const tsched::Scheduler& sched) {
  const tsched::SchedulerStats s = sched.GetStats();
  printf("  stats: submitted=%llu rejected=%llu dispatched=%llu requeued=%llu completed=%llu "
         "failed=%llu cancelled=%llu retried=%llu\n",
         static_cast<unsigned long long>(s.submitted), static_cast<unsigned long long>(s.rejected),
         static_cast<unsigned long long>(s.dispatched), static_cast<unsigned long long>(s.requeued),
         static_cast<unsigned long long>(s.completed), static_cast<unsigned long long>(s.failed),
         static_cast<unsigned long long>(s.cancelled), static_cast<unsigned long long>(s.retried));
}

// ============================================================================
// Demo 1: Priority ordering
// ============================================================================

static void DemoPriority(const tsched::SchedulerConfig& base) {
  printf("\n=== Demo 1: Priority Ordering ===\n");
  tsched::SchedulerConfig cfg = base;
  cfg.worker_count = 1U;
  tsched::Scheduler sched(cfg);

  std::mutex mtx;
  std::vector<int32_t> order;
  for (int32_t p : {1, 5, 3, 2, 4}) {
    tsched::TaskOptions opts;
    opts.priority = p;
    (void)sched.Submit(tsched::MakeTask(
        "prio-" + std::to_string(p),
        [&mtx, &order, p](const tsched::Context&) {
          std::lock_guard<std::mutex> lock(mtx);
          order.push_back(p);
          return tsched::TaskOk();
        },
        opts));
  }
  (void)sched.Start();
  WaitIdle(sched);
  (void)sched.Stop();

  printf("  start order:");
  for (int32_t p : order) printf(" %d", p);
  printf("\n");
}

// ============================================================================
// Demo 2-4: Retry, timeout, cancel
// ============================================================================

static void DemoFailureModes(const tsched::SchedulerConfig& cfg) {
  printf("\n=== Demo 2-4: Retry / Timeout / Cancel ===\n");
  tsched::Scheduler sched(cfg);

  std::atomic<int> flaky_calls{0};
  tsched::TaskOptions retry_opts;
  retry_opts.retry_budget = 2U;
  auto flaky = sched.Submit(tsched::MakeTask(
      "flaky-upload",
      [&flaky_calls](const tsched::Context&) {
        return (flaky_calls.fetch_add(1) < 2) ? tsched::TaskFail("connection reset")
                                              : tsched::TaskOk();
      },
      retry_opts));

  tsched::TaskOptions slow_opts;
  slow_opts.timeout = 50ms;
  auto slow = sched.Submit(tsched::MakeTask(
      "slow-report",
      [](const tsched::Context& ctx) {
        if (ctx.WaitFor(2s)) {
          return tsched::TaskFail("interrupted");
        }
        return tsched::TaskOk();
      },
      slow_opts));

  auto doomed = sched.Submit(tsched::MakeTask("never-runs", [](const tsched::Context&) {
    return tsched::TaskOk();
  }));
  if (doomed.has_value()) {
    printf("  cancel %s -> %s\n", doomed.value().c_str(),
           sched.Cancel(doomed.value()) ? "cancelled" : "refused");
  }

  (void)sched.Start();
  WaitIdle(sched);
  (void)sched.Stop();

  for (const auto* r : {&flaky, &slow, &doomed}) {
    if (r->has_value()) PrintRecord(sched, r->value());
  }
  PrintStats(sched);
}

// ============================================================================
// Demo 5: Backpressure
// ============================================================================

static void DemoBackpressure(const tsched::SchedulerConfig& base) {
  printf("\n=== Demo 5: Submit Queue Backpressure ===\n");
  tsched::SchedulerConfig cfg = base;
  cfg.submit_queue_capacity = 8U;
  tsched::Scheduler sched(cfg);

  uint32_t accepted = 0U;
  uint32_t full = 0U;
  for (uint32_t i = 0U; i < 20U; ++i) {
    auto r = sched.Submit(tsched::MakeTask("burst", [](const tsched::Context&) {
      return tsched::TaskOk();
    }));
    if (r.has_value()) {
      ++accepted;
    } else if (r.get_error() == tsched::SchedulerError::kQueueFull) {
      ++full;
    }
  }
  printf("  accepted=%u queue_full=%u\n", accepted, full);

  (void)sched.Start();
  WaitIdle(sched);
  (void)sched.Stop();
  PrintStats(sched);
}

// ============================================================================
// Demo 6: Service mode
// ============================================================================

static void StopModules(int signo, void* user) {
  printf("\n  shutdown (signo=%d), stopping modules\n", signo);
  (void)static_cast<tsched::ModuleManager*>(user)->StopAll();
}

static void DemoService(const tsched::SchedulerConfig& cfg, int32_t seconds) {
  printf("\n=== Demo 6: Service Mode (%d s, Ctrl-C to stop early) ===\n", seconds);
  tsched::Scheduler sched(cfg);
  tsched::ModuleManager modules;
  (void)modules.Register("scheduler", &sched);

  tsched::ShutdownManager shutdown;
  auto root = tsched::Context::WithCancel(tsched::Context::Background());
  shutdown.Watch(root);
  (void)shutdown.Register(&StopModules, &modules);
  if (!shutdown.InstallSignalHandlers().has_value()) {
    TSCHED_LOG_WARN("Demo", "signal handlers not installed");
  }

  if (!modules.StartAll(root).has_value()) {
    TSCHED_LOG_ERROR("Demo", "module start failed");
    return;
  }

  std::thread producer([&sched, &root] {
    uint32_t n = 0U;
    while (!root.WaitFor(200ms)) {
      tsched::TaskOptions opts;
      opts.priority = static_cast<int32_t>(n % 3U);
      opts.retry_budget = 1U;
      (void)sched.Submit(tsched::MakeTask(
          "tick-" + std::to_string(n),
          [n](const tsched::Context& ctx) {
            (void)ctx.WaitFor(std::chrono::milliseconds(20 + (n % 5U) * 10U));
            return (n % 7U == 0U) ? tsched::TaskFail("simulated fault") : tsched::TaskOk();
          },
          opts));
      ++n;
    }
  });

  if (!shutdown.WaitForShutdownFor(seconds * 1000)) {
    shutdown.Quit(0);
    shutdown.WaitForShutdown();
  }
  producer.join();
  PrintStats(sched);
}

int main(int argc, char* argv[]) {
  setvbuf(stdout, nullptr, _IOLBF, 0);
  tsched::log::Init();

  tsched::SchedulerConfig cfg;
  cfg.tick_interval_ms = 20U;
#ifdef TSCHED_CONFIG_INI_ENABLED
  if (argc > 1) {
    auto loaded = tsched::LoadSchedulerConfig(argv[1]);
    if (!loaded.has_value()) {
      fprintf(stderr, "cannot load %s\n", argv[1]);
      return 1;
    }
    cfg = loaded.value();
  }
#else
  if (argc > 1) {
    fprintf(stderr, "built without INI support, ignoring %s\n", argv[1]);
  }
#endif
  const int32_t service_seconds = (argc > 2) ? std::atoi(argv[2]) : 2;

  printf("Scheduler Demo\n");
  printf("==============\n");
  printf("workers=%u tick=%ums submit_cap=%u dispatch_cap=%u\n", cfg.worker_count,
         cfg.tick_interval_ms, cfg.submit_queue_capacity, cfg.dispatch_queue_capacity);

  DemoPriority(cfg);
  DemoFailureModes(cfg);
  DemoBackpressure(cfg);
  DemoService(cfg, service_seconds);

  printf("\nAll demos completed.\n");
  tsched::log::Shutdown();
  return 0;
}
