/**
 * @file context.hpp
 * @brief Cancellation and deadline propagation for running tasks.
 *
 * A Context is a cheap, copyable handle on a node in a cancellation tree:
 *
 *   Context::Background()                 never done
 *     +-- Context::WithCancel(parent)     done on Cancel() or parent done
 *           +-- Context::WithTimeout(...) additionally done at its deadline
 *
 * Cancelling a node cancels every descendant. A child's deadline never
 * exceeds its parent's. Tasks observe the context cooperatively through
 * IsDone() / WaitFor(); nothing is interrupted preemptively.
 */

#ifndef TSCHED_CONTEXT_HPP_
#define TSCHED_CONTEXT_HPP_

#include "tsched/platform.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <memory>
#include <mutex>
#include <thread>
#include <vector>

namespace tsched {

enum class ContextState : uint8_t {
  kActive = 0,
  kCancelled,
  kDeadlineExceeded,
};

class Context final {
 public:
  using Clock = std::chrono::steady_clock;

  /** @brief Root context: never cancelled, no deadline. */
  static Context Background() { return Context(); }

  /** @brief Child that can be cancelled independently of its parent. */
  static Context WithCancel(const Context& parent) {
    auto node = std::make_shared<Node>();
    if (parent.node_) {
      node->has_deadline = parent.node_->has_deadline;
      node->deadline = parent.node_->deadline;
    }
    Attach(parent, node);
    return Context(std::move(node));
  }

  /** @brief Child that is done at @p deadline or earlier. */
  static Context WithDeadline(const Context& parent, Clock::time_point deadline) {
    Context child = WithCancel(parent);
    Node& n = *child.node_;
    if (!n.has_deadline || deadline < n.deadline) {
      n.has_deadline = true;
      n.deadline = deadline;
    }
    return child;
  }

  template <typename Rep, typename Period>
  static Context WithTimeout(const Context& parent, std::chrono::duration<Rep, Period> timeout) {
    return WithDeadline(parent,
                        Clock::now() + std::chrono::duration_cast<Clock::duration>(timeout));
  }

  /**
   * @brief Cancel this context and all of its descendants.
   *
   * No-op on Background().
   */
  void Cancel() const noexcept {
    if (node_) {
      CancelNode(*node_);
    }
  }

  ContextState State() const noexcept {
    if (!node_) return ContextState::kActive;
    if (node_->cancelled.load(std::memory_order_acquire)) return ContextState::kCancelled;
    if (node_->has_deadline && Clock::now() >= node_->deadline) {
      return ContextState::kDeadlineExceeded;
    }
    return ContextState::kActive;
  }

  bool IsDone() const noexcept { return State() != ContextState::kActive; }

  bool HasDeadline() const noexcept { return node_ && node_->has_deadline; }

  Clock::time_point Deadline() const noexcept {
    return HasDeadline() ? node_->deadline : Clock::time_point::max();
  }

  /**
   * @brief Sleep for up to @p timeout, waking early when the context ends.
   *
   * @return true if the context is done on return.
   */
  template <typename Rep, typename Period>
  bool WaitFor(std::chrono::duration<Rep, Period> timeout) const {
    const auto until = Clock::now() + std::chrono::duration_cast<Clock::duration>(timeout);
    if (!node_) {
      std::this_thread::sleep_until(until);
      return false;
    }
    Node& n = *node_;
    const auto wake = (n.has_deadline && n.deadline < until) ? n.deadline : until;
    std::unique_lock<std::mutex> lock(n.mtx);
    n.cv.wait_until(lock, wake, [&n] { return n.cancelled.load(std::memory_order_acquire); });
    lock.unlock();
    return IsDone();
  }

 private:
  struct Node {
    std::atomic<bool> cancelled{false};
    bool has_deadline{false};
    Clock::time_point deadline{};
    std::mutex mtx;
    std::condition_variable cv;
    std::vector<std::weak_ptr<Node>> children;
  };

  Context() = default;
  explicit Context(std::shared_ptr<Node> node) : node_(std::move(node)) {}

  static void Attach(const Context& parent, const std::shared_ptr<Node>& child) {
    if (!parent.node_) return;
    Node& p = *parent.node_;
    bool parent_cancelled = false;
    {
      std::lock_guard<std::mutex> lock(p.mtx);
      parent_cancelled = p.cancelled.load(std::memory_order_acquire);
      if (!parent_cancelled) {
        // Drop children that are already gone before growing the list.
        auto it = p.children.begin();
        while (it != p.children.end()) {
          if (it->expired()) {
            it = p.children.erase(it);
          } else {
            ++it;
          }
        }
        p.children.push_back(child);
      }
    }
    if (parent_cancelled) {
      child->cancelled.store(true, std::memory_order_release);
    }
  }

  static void CancelNode(Node& n) noexcept {
    std::vector<std::weak_ptr<Node>> children;
    {
      std::lock_guard<std::mutex> lock(n.mtx);
      if (n.cancelled.exchange(true, std::memory_order_acq_rel)) {
        return;
      }
      children.swap(n.children);
    }
    n.cv.notify_all();
    for (auto& weak : children) {
      if (auto child = weak.lock()) {
        CancelNode(*child);
      }
    }
  }

  std::shared_ptr<Node> node_;
};

inline const char* ContextStateToString(ContextState s) noexcept {
  switch (s) {
    case ContextState::kActive:
      return "active";
    case ContextState::kCancelled:
      return "cancelled";
    case ContextState::kDeadlineExceeded:
      return "deadline exceeded";
  }
  return "unknown";
}

}  // namespace tsched

#endif  // TSCHED_CONTEXT_HPP_
