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
 * @file bounded_queue.hpp
 * @brief Fixed-capacity multi-producer multi-consumer FIFO.
 *
 * Ring buffer guarded by one mutex with not_empty / not_full condition
 * variables. The capacity is exact (no power-of-2 rounding) because it is
 * the scheduler's backpressure limit.
 *
 * Producers never block in TryPush(). Consumers either poll (TryPop,
 * DrainTo) or wait with a bound (PopFor). Close() rejects further pushes;
 * items already queued can still be popped.
 */

#ifndef TSCHED_BOUNDED_QUEUE_HPP_
#define TSCHED_BOUNDED_QUEUE_HPP_

#include "tsched/platform.hpp"

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <mutex>
#include <utility>
#include <vector>

namespace tsched {

enum class PushResult : uint8_t {
  kOk = 0,
  kFull,
  kClosed,
  kTimeout,
};

enum class PopResult : uint8_t {
  kOk = 0,
  kEmpty,    ///< Nothing arrived within the wait bound
  kClosed,   ///< Closed and fully drained
};

template <typename T>
class BoundedQueue final {
 public:
  explicit BoundedQueue(uint32_t capacity)
      : capacity_(capacity > 0U ? capacity : 1U), buffer_(capacity_) {}

  BoundedQueue(const BoundedQueue&) = delete;
  BoundedQueue& operator=(const BoundedQueue&) = delete;
  BoundedQueue(BoundedQueue&&) = delete;
  BoundedQueue& operator=(BoundedQueue&&) = delete;

  /**
   * @brief Enqueue without waiting.
   * @return kOk, kFull, or kClosed.
   */
  PushResult TryPush(T item) {
    {
      std::lock_guard<std::mutex> lock(mtx_);
      if (closed_) return PushResult::kClosed;
      if (count_ >= capacity_) return PushResult::kFull;
      PushLocked(std::move(item));
    }
    not_empty_.notify_one();
    return PushResult::kOk;
  }

  /**
   * @brief Enqueue, waiting up to @p timeout for free space.
   * @return kOk, kClosed, or kTimeout.
   */
  template <typename Rep, typename Period>
  PushResult PushFor(T item, std::chrono::duration<Rep, Period> timeout) {
    {
      std::unique_lock<std::mutex> lock(mtx_);
      const bool ready =
          not_full_.wait_for(lock, timeout, [this] { return closed_ || count_ < capacity_; });
      if (closed_) return PushResult::kClosed;
      if (!ready) return PushResult::kTimeout;
      PushLocked(std::move(item));
    }
    not_empty_.notify_one();
    return PushResult::kOk;
  }

  bool TryPop(T& out) {
    {
      std::lock_guard<std::mutex> lock(mtx_);
      if (count_ == 0U) return false;
      PopLocked(out);
    }
    not_full_.notify_one();
    return true;
  }

  /**
   * @brief Dequeue, waiting up to @p timeout for an item.
   * @return kOk, kEmpty (timed out), or kClosed (closed and drained).
   */
  template <typename Rep, typename Period>
  PopResult PopFor(T& out, std::chrono::duration<Rep, Period> timeout) {
    {
      std::unique_lock<std::mutex> lock(mtx_);
      not_empty_.wait_for(lock, timeout, [this] { return closed_ || count_ > 0U; });
      if (count_ == 0U) {
        return closed_ ? PopResult::kClosed : PopResult::kEmpty;
      }
      PopLocked(out);
    }
    not_full_.notify_one();
    return PopResult::kOk;
  }

  /**
   * @brief Move every queued item into @p out (appended, FIFO order).
   * @return Number of items moved.
   */
  uint32_t DrainTo(std::vector<T>& out) {
    uint32_t n = 0U;
    {
      std::lock_guard<std::mutex> lock(mtx_);
      while (count_ > 0U) {
        T item;
        PopLocked(item);
        out.push_back(std::move(item));
        ++n;
      }
    }
    if (n > 0U) {
      not_full_.notify_all();
    }
    return n;
  }

  /// Reject further pushes and wake every waiter.
  void Close() {
    {
      std::lock_guard<std::mutex> lock(mtx_);
      closed_ = true;
    }
    not_empty_.notify_all();
    not_full_.notify_all();
  }

  bool IsClosed() const {
    std::lock_guard<std::mutex> lock(mtx_);
    return closed_;
  }

  uint32_t Size() const {
    std::lock_guard<std::mutex> lock(mtx_);
    return count_;
  }

  uint32_t Capacity() const noexcept { return capacity_; }

 private:
  void PushLocked(T&& item) {
    TSCHED_ASSERT(count_ < capacity_);
    buffer_[(head_ + count_) % capacity_] = std::move(item);
    ++count_;
  }

  void PopLocked(T& out) {
    TSCHED_ASSERT(count_ > 0U);
    out = std::move(buffer_[head_]);
    buffer_[head_] = T{};
    head_ = (head_ + 1U) % capacity_;
    --count_;
  }

  const uint32_t capacity_;
  std::vector<T> buffer_;
  uint32_t head_{0U};
  uint32_t count_{0U};
  bool closed_{false};

  mutable std::mutex mtx_;
  std::condition_variable not_empty_;
  std::condition_variable not_full_;
};

}  // namespace tsched

#endif  // TSCHED_BOUNDED_QUEUE_HPP_
