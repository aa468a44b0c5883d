/**
 * @file vocabulary.hpp
 * @brief Vocabulary types shared by all tsched modules.
 *
 * - expected<V, E>  : value-or-error return type (no exceptions)
 * - optional<T>     : alias of std::optional
 * - FixedString<N>  : fixed-capacity, truncating, stack-only string
 * - SteadyNowUs/Ns  : monotonic clock helpers
 */

#ifndef TSCHED_VOCABULARY_HPP_
#define TSCHED_VOCABULARY_HPP_

#include "tsched/platform.hpp"

#include <cstdint>
#include <cstring>

#include <chrono>
#include <new>
#include <optional>
#include <type_traits>
#include <utility>

namespace tsched {

// ============================================================================
// optional
// ============================================================================

template <typename T>
using optional = std::optional<T>;

// ============================================================================
// expected<V, E>
// ============================================================================

/**
 * @brief Holds either a value of type V or an error of type E.
 *
 * V and E must be nothrow move-constructible so assignment never leaves
 * the object without a live member.
 *
 * Construct through the static factories:
 * @code
 *   return expected<TaskId, SchedulerError>::success(id);
 *   return expected<TaskId, SchedulerError>::error(SchedulerError::kQueueFull);
 * @endcode
 */
template <typename V, typename E>
class expected final {
  static_assert(std::is_nothrow_move_constructible<V>::value &&
                    std::is_nothrow_move_constructible<E>::value,
                "expected<V, E> requires nothrow move construction");

 public:
  static expected success(const V& v) { return expected(ValueTag{}, v); }
  static expected success(V&& v) { return expected(ValueTag{}, std::move(v)); }
  static expected error(const E& e) { return expected(ErrorTag{}, e); }

  expected(const expected& other) : has_value_(other.has_value_) {
    if (has_value_) {
      new (&value_) V(other.value_);
    } else {
      new (&error_) E(other.error_);
    }
  }

  expected(expected&& other) noexcept : has_value_(other.has_value_) {
    if (has_value_) {
      new (&value_) V(std::move(other.value_));
    } else {
      new (&error_) E(std::move(other.error_));
    }
  }

  // The copy is made before the current member is destroyed, so a throwing
  // copy constructor leaves *this unchanged.
  expected& operator=(const expected& other) {
    if (this != &other) {
      expected tmp(other);
      MoveFrom(std::move(tmp));
    }
    return *this;
  }

  expected& operator=(expected&& other) noexcept {
    if (this != &other) {
      MoveFrom(std::move(other));
    }
    return *this;
  }

  ~expected() { Destroy(); }

  bool has_value() const noexcept { return has_value_; }
  explicit operator bool() const noexcept { return has_value_; }

  V& value() & {
    TSCHED_ASSERT(has_value_);
    return value_;
  }
  const V& value() const& {
    TSCHED_ASSERT(has_value_);
    return value_;
  }
  V&& value() && {
    TSCHED_ASSERT(has_value_);
    return std::move(value_);
  }

  const E& get_error() const {
    TSCHED_ASSERT(!has_value_);
    return error_;
  }

  V value_or(const V& default_val) const { return has_value_ ? value_ : default_val; }

 private:
  struct ValueTag {};
  struct ErrorTag {};

  template <typename U>
  expected(ValueTag, U&& v) : has_value_(true) {
    new (&value_) V(std::forward<U>(v));
  }
  template <typename U>
  expected(ErrorTag, U&& e) : has_value_(false) {
    new (&error_) E(std::forward<U>(e));
  }

  void MoveFrom(expected&& src) noexcept {
    Destroy();
    has_value_ = src.has_value_;
    if (has_value_) {
      new (&value_) V(std::move(src.value_));
    } else {
      new (&error_) E(std::move(src.error_));
    }
  }

  void Destroy() noexcept {
    if (has_value_) {
      value_.~V();
    } else {
      error_.~E();
    }
  }

  union {
    V value_;
    E error_;
  };
  bool has_value_;
};

/**
 * @brief expected<void, E>: success carries no value.
 */
template <typename E>
class expected<void, E> final {
 public:
  static expected success() noexcept { return expected(); }
  static expected error(const E& e) {
    expected r;
    r.error_ = e;
    r.has_value_ = false;
    return r;
  }

  bool has_value() const noexcept { return has_value_; }
  explicit operator bool() const noexcept { return has_value_; }

  const E& get_error() const {
    TSCHED_ASSERT(!has_value_);
    return *error_;
  }

 private:
  expected() = default;

  optional<E> error_;
  bool has_value_{true};
};

// ============================================================================
// FixedString<N>
// ============================================================================

/**
 * @brief Fixed-capacity string; longer input is truncated.
 *
 * @tparam N Maximum number of characters (excluding terminator).
 */
template <uint32_t N>
class FixedString {
 public:
  FixedString() noexcept { buf_[0] = '\0'; }

  // NOLINTNEXTLINE(google-explicit-constructor)
  FixedString(const char* s) noexcept { assign(s); }

  FixedString& operator=(const char* s) noexcept {
    assign(s);
    return *this;
  }

  void assign(const char* s) noexcept {
    size_ = 0U;
    if (s != nullptr) {
      while (size_ < N && s[size_] != '\0') {
        buf_[size_] = s[size_];
        ++size_;
      }
    }
    buf_[size_] = '\0';
  }

  const char* c_str() const noexcept { return buf_; }
  uint32_t size() const noexcept { return size_; }
  bool empty() const noexcept { return size_ == 0U; }
  static constexpr uint32_t capacity() noexcept { return N; }

  bool operator==(const char* s) const noexcept {
    return s != nullptr && std::strcmp(buf_, s) == 0;
  }
  bool operator!=(const char* s) const noexcept { return !(*this == s); }

 private:
  char buf_[N + 1U];
  uint32_t size_{0U};
};

// ============================================================================
// ConfigError
// ============================================================================

enum class ConfigError : uint8_t {
  kFileNotFound = 0,
  kParseError,
};

// ============================================================================
// Monotonic clock helpers
// ============================================================================

inline uint64_t SteadyNowNs() noexcept {
  return static_cast<uint64_t>(std::chrono::duration_cast<std::chrono::nanoseconds>(
                                   std::chrono::steady_clock::now().time_since_epoch())
                                   .count());
}

inline uint64_t SteadyNowUs() noexcept { return SteadyNowNs() / 1000U; }

}  // namespace tsched

#endif  // TSCHED_VOCABULARY_HPP_
