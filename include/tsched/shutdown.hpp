/**
 * @file shutdown.hpp
 * @brief Signal-driven process shutdown that cancels scheduler contexts.
 *
 * SIGINT / SIGTERM are installed with sigaction(2); the handler only writes
 * one byte to a self-pipe. WaitForShutdown() wakes on that byte (or on
 * Quit()), cancels every watched Context, then runs the registered
 * callbacks in LIFO order, so the last component started is stopped first.
 */

#ifndef TSCHED_SHUTDOWN_HPP_
#define TSCHED_SHUTDOWN_HPP_

#include "tsched/context.hpp"
#include "tsched/log.hpp"
#include "tsched/platform.hpp"
#include "tsched/vocabulary.hpp"

#include <atomic>
#include <cerrno>
#include <csignal>
#include <cstdint>
#include <vector>

#include <poll.h>
#include <unistd.h>

namespace tsched {

enum class ShutdownError : uint8_t {
  kCallbacksFull = 0,
  kInvalidCallback,
  kPipeCreationFailed,
  kSignalInstallFailed,
  kAlreadyInstantiated,
};

/// Cleanup callback. @p signo is 0 for Quit() without a signal.
using ShutdownFn = void (*)(int signo, void* user);

class ShutdownManager;

namespace detail {

/// One active ShutdownManager per process, reachable from the signal handler.
inline ShutdownManager*& GetShutdownInstance() {
  static ShutdownManager* ptr = nullptr;
  return ptr;
}

}  // namespace detail

/**
 * @brief Process-wide shutdown coordinator.
 *
 * @code
 *   tsched::ShutdownManager mgr;
 *   mgr.Watch(root_ctx);
 *   mgr.Register([](int, void* p) { static_cast<tsched::Scheduler*>(p)->Stop(); }, &sched);
 *   mgr.InstallSignalHandlers();
 *   mgr.WaitForShutdown();
 * @endcode
 */
class ShutdownManager final {
 public:
  static constexpr uint32_t kMaxCallbacks = 16U;

  ShutdownManager() noexcept {
    pipe_fd_[0] = -1;
    pipe_fd_[1] = -1;
    if (detail::GetShutdownInstance() != nullptr) {
      return;
    }
    if (::pipe(pipe_fd_) != 0) {
      pipe_fd_[0] = -1;
      pipe_fd_[1] = -1;
      return;
    }
    detail::GetShutdownInstance() = this;
    valid_ = true;
  }

  ~ShutdownManager() {
    if (detail::GetShutdownInstance() == this) {
      detail::GetShutdownInstance() = nullptr;
    }
    if (pipe_fd_[0] >= 0) {
      ::close(pipe_fd_[0]);
    }
    if (pipe_fd_[1] >= 0) {
      ::close(pipe_fd_[1]);
    }
  }

  ShutdownManager(const ShutdownManager&) = delete;
  ShutdownManager& operator=(const ShutdownManager&) = delete;
  ShutdownManager(ShutdownManager&&) = delete;
  ShutdownManager& operator=(ShutdownManager&&) = delete;

  /// False when another instance was alive at construction or pipe(2) failed.
  bool IsValid() const noexcept { return valid_; }

  /**
   * @brief Register a cleanup callback (run in LIFO order).
   * @return kAlreadyInstantiated, kInvalidCallback, or kCallbacksFull.
   */
  expected<void, ShutdownError> Register(ShutdownFn fn, void* user = nullptr) {
    if (!valid_) {
      return expected<void, ShutdownError>::error(ShutdownError::kAlreadyInstantiated);
    }
    if (fn == nullptr) {
      return expected<void, ShutdownError>::error(ShutdownError::kInvalidCallback);
    }
    if (callback_count_ >= kMaxCallbacks) {
      return expected<void, ShutdownError>::error(ShutdownError::kCallbacksFull);
    }
    callbacks_[callback_count_] = Callback{fn, user};
    ++callback_count_;
    return expected<void, ShutdownError>::success();
  }

  /// Cancel @p ctx as soon as shutdown is triggered, before any callback.
  void Watch(const Context& ctx) { watched_.push_back(ctx); }

  expected<void, ShutdownError> InstallSignalHandlers() noexcept {
    if (!valid_) {
      return expected<void, ShutdownError>::error(ShutdownError::kAlreadyInstantiated);
    }
    if (pipe_fd_[1] < 0) {
      return expected<void, ShutdownError>::error(ShutdownError::kPipeCreationFailed);
    }

    struct sigaction sa;
    sa.sa_handler = &ShutdownManager::SignalHandler;
    ::sigemptyset(&sa.sa_mask);
    sa.sa_flags = SA_RESTART;
    if (::sigaction(SIGINT, &sa, nullptr) != 0 || ::sigaction(SIGTERM, &sa, nullptr) != 0) {
      return expected<void, ShutdownError>::error(ShutdownError::kSignalInstallFailed);
    }
    return expected<void, ShutdownError>::success();
  }

  /// Trigger shutdown from code. Only the first trigger is recorded.
  void Quit(int signo = 0) noexcept { Trigger(signo); }

  bool IsShutdownRequested() const noexcept {
    return shutdown_flag_.load(std::memory_order_acquire);
  }

  int Signal() const noexcept { return signo_.load(std::memory_order_relaxed); }

  /**
   * @brief Block until shutdown is triggered, then cancel and clean up.
   *
   * Runs the watched-context cancellation and the callbacks exactly once.
   */
  void WaitForShutdown() {
    while (!IsShutdownRequested()) {
      if (WaitPipe(-1) < 0) {
        break;
      }
    }
    RunShutdown();
  }

  /**
   * @brief Like WaitForShutdown(), bounded by @p timeout_ms.
   * @return true if shutdown was triggered (and handled) within the bound.
   */
  bool WaitForShutdownFor(int32_t timeout_ms) {
    if (!IsShutdownRequested()) {
      (void)WaitPipe(timeout_ms);
    }
    if (!IsShutdownRequested()) {
      return false;
    }
    RunShutdown();
    return true;
  }

 private:
  struct Callback {
    ShutdownFn fn;
    void* user;
  };

  void Trigger(int signo) noexcept {
    bool expected_val = false;
    if (shutdown_flag_.compare_exchange_strong(expected_val, true, std::memory_order_acq_rel)) {
      signo_.store(signo, std::memory_order_relaxed);
      if (pipe_fd_[1] >= 0) {
        const uint8_t byte = 1U;
        (void)::write(pipe_fd_[1], &byte, 1);
      }
    }
  }

  /// @return 1 if the pipe became readable, 0 on timeout or EINTR, -1 on error.
  int WaitPipe(int32_t timeout_ms) {
    if (pipe_fd_[0] < 0) {
      return -1;
    }
    struct pollfd pfd;
    pfd.fd = pipe_fd_[0];
    pfd.events = POLLIN;
    pfd.revents = 0;
    const int r = ::poll(&pfd, 1, timeout_ms);
    if (r < 0) {
      return (errno == EINTR) ? 0 : -1;
    }
    if (r > 0) {
      uint8_t buf = 0U;
      (void)::read(pipe_fd_[0], &buf, 1);
      return 1;
    }
    return 0;
  }

  void RunShutdown() {
    bool expected_val = false;
    if (!handled_.compare_exchange_strong(expected_val, true)) {
      return;
    }
    const int signo = signo_.load(std::memory_order_relaxed);
    TSCHED_LOG_INFO("Shutdown", "shutdown requested signo=%d contexts=%u callbacks=%u", signo,
                    static_cast<uint32_t>(watched_.size()), callback_count_);
    for (const Context& ctx : watched_) {
      ctx.Cancel();
    }
    for (uint32_t i = callback_count_; i > 0U; --i) {
      callbacks_[i - 1U].fn(signo, callbacks_[i - 1U].user);
    }
  }

  static void SignalHandler(int signo) {
    ShutdownManager* self = detail::GetShutdownInstance();
    if (self != nullptr) {
      self->Trigger(signo);
    }
  }

  Callback callbacks_[kMaxCallbacks] = {};
  uint32_t callback_count_{0U};
  std::vector<Context> watched_;
  std::atomic<bool> shutdown_flag_{false};
  std::atomic<bool> handled_{false};
  std::atomic<int> signo_{0};
  int pipe_fd_[2];
  bool valid_{false};
};

}  // namespace tsched

#endif  // TSCHED_SHUTDOWN_HPP_
