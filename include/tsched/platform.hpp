/**
 * @file platform.hpp
 * @brief Build-environment switches shared by every tsched header.
 *
 * TSCHED_POSIX          defined where clock_gettime/localtime_r/sigaction exist
 * TSCHED_LIKELY(x)      branch hint for hot paths (dispatch, submit)
 * TSCHED_ASSERT(cond)   internal invariant check, compiled out with NDEBUG
 */

#ifndef TSCHED_PLATFORM_HPP_
#define TSCHED_PLATFORM_HPP_

#include <cstddef>
#include <cstdio>
#include <cstdlib>

#if defined(__unix__) || defined(__APPLE__)
#define TSCHED_POSIX 1
#endif

#if defined(__GNUC__) || defined(__clang__)
#define TSCHED_LIKELY(x) __builtin_expect(!!(x), 1)
#define TSCHED_UNLIKELY(x) __builtin_expect(!!(x), 0)
#else
#define TSCHED_LIKELY(x) (x)
#define TSCHED_UNLIKELY(x) (x)
#endif

namespace tsched {

/// Alignment for scheduler counters written by different thread groups.
static constexpr size_t kCacheLineSize = 64;

namespace detail {

[[noreturn]] inline void InvariantBroken(const char* cond, const char* func, const char* file,
                                         int line) {
  (void)std::fprintf(stderr, "tsched: invariant '%s' broken in %s (%s:%d)\n", cond, func, file,
                     line);
  std::abort();
}

}  // namespace detail
}  // namespace tsched

// Guards conditions no caller input can produce; errors callers can cause
// are reported through expected<> instead.
#ifdef NDEBUG
#define TSCHED_ASSERT(cond) ((void)0)
#else
#define TSCHED_ASSERT(cond) \
  ((cond) ? (void)0 : ::tsched::detail::InvariantBroken(#cond, __func__, __FILE__, __LINE__))
#endif

#endif  // TSCHED_PLATFORM_HPP_
