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
 * @file log.hpp
 * @brief Leveled, printf-style logging with a pluggable sink.
 *
 * Every line carries a category tag and, in debug builds, the source
 * location:
 *
 *   [2024-05-01 12:00:00.123] [INFO] [Scheduler] task submitted task_id=... (scheduler.hpp:210)
 *
 * Scheduler events are written as key=value pairs after a short message so
 * that they stay greppable.
 *
 * Filtering happens twice:
 *   - compile time: TSCHED_LOG_MIN_LEVEL (0=DEBUG .. 4=FATAL) removes calls
 *   - run time:     log::SetLevel()
 *
 * The default sink writes to stderr. log::SetSink() redirects formatted
 * lines, e.g. to capture events in tests.
 */

#ifndef TSCHED_LOG_HPP_
#define TSCHED_LOG_HPP_

#include "tsched/platform.hpp"
#include "tsched/vocabulary.hpp"

#include <atomic>
#include <cstdarg>
#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <ctime>
#include <mutex>

#ifdef TSCHED_POSIX
#include <time.h>
#endif

#ifndef TSCHED_LOG_MIN_LEVEL
#define TSCHED_LOG_MIN_LEVEL 0
#endif

namespace tsched {
namespace log {

// ============================================================================
// Level
// ============================================================================

enum class Level : uint8_t {
  kDebug = 0,
  kInfo = 1,
  kWarn = 2,
  kError = 3,
  kFatal = 4,
  kOff = 5,
};

/**
 * @brief Sink receiving fully formatted lines (without trailing newline).
 */
using LogSinkFn = void (*)(Level level, const char* category, const char* line, void* context);

namespace detail {

inline std::atomic<Level>& LogLevelRef() noexcept {
#ifdef NDEBUG
  static std::atomic<Level> level{Level::kInfo};
#else
  static std::atomic<Level> level{Level::kDebug};
#endif
  return level;
}

struct LogState {
  std::mutex mtx;
  LogSinkFn sink{nullptr};
  void* sink_context{nullptr};
  bool initialized{false};

  static LogState& Instance() noexcept {
    static LogState state;
    return state;
  }
};

inline const char* LevelTag(Level level) noexcept {
  switch (level) {
    case Level::kDebug:
      return "DEBUG";
    case Level::kInfo:
      return "INFO";
    case Level::kWarn:
      return "WARN";
    case Level::kError:
      return "ERROR";
    case Level::kFatal:
      return "FATAL";
    default:
      return "OFF";
  }
}

inline const char* Basename(const char* path) noexcept {
  if (path == nullptr) return "?";
  const char* slash = std::strrchr(path, '/');
  return (slash != nullptr) ? slash + 1 : path;
}

/// @brief Format wall-clock time as "YYYY-MM-DD HH:MM:SS.mmm".
inline void FormatTimestamp(char* buf, size_t bufsz) noexcept {
#ifdef TSCHED_POSIX
  struct timespec ts;
  clock_gettime(CLOCK_REALTIME, &ts);
  struct tm tm_local;
  localtime_r(&ts.tv_sec, &tm_local);
  (void)std::snprintf(buf, bufsz, "%04d-%02d-%02d %02d:%02d:%02d.%03ld",
                      tm_local.tm_year + 1900, tm_local.tm_mon + 1, tm_local.tm_mday,
                      tm_local.tm_hour, tm_local.tm_min, tm_local.tm_sec,
                      static_cast<long>(ts.tv_nsec / 1000000L));
#else
  std::time_t t = std::time(nullptr);
  struct std::tm* tm_local = std::localtime(&t);
  if (tm_local != nullptr) {
    (void)std::snprintf(buf, bufsz, "%04d-%02d-%02d %02d:%02d:%02d.000",
                        tm_local->tm_year + 1900, tm_local->tm_mon + 1, tm_local->tm_mday,
                        tm_local->tm_hour, tm_local->tm_min, tm_local->tm_sec);
  } else {
    (void)std::snprintf(buf, bufsz, "0000-00-00 00:00:00.000");
  }
#endif
}

}  // namespace detail

// ============================================================================
// Runtime control
// ============================================================================

inline void SetLevel(Level level) noexcept {
  detail::LogLevelRef().store(level, std::memory_order_relaxed);
}

inline Level GetLevel() noexcept {
  return detail::LogLevelRef().load(std::memory_order_relaxed);
}

/**
 * @brief Parse a level name ("debug", "INFO", "warn", "error", "fatal", "off").
 */
inline optional<Level> ParseLevel(const char* name) noexcept {
  if (name == nullptr) return {};
  char lower[8];
  size_t i = 0;
  for (; name[i] != '\0'; ++i) {
    if (i + 1U >= sizeof(lower)) return {};
    const char c = name[i];
    lower[i] = (c >= 'A' && c <= 'Z') ? static_cast<char>(c + 32) : c;
  }
  lower[i] = '\0';
  if (std::strcmp(lower, "debug") == 0) return Level::kDebug;
  if (std::strcmp(lower, "info") == 0) return Level::kInfo;
  if (std::strcmp(lower, "warn") == 0 || std::strcmp(lower, "warning") == 0) return Level::kWarn;
  if (std::strcmp(lower, "error") == 0) return Level::kError;
  if (std::strcmp(lower, "fatal") == 0) return Level::kFatal;
  if (std::strcmp(lower, "off") == 0) return Level::kOff;
  return {};
}

/**
 * @brief Redirect output. nullptr restores the stderr sink.
 */
inline void SetSink(LogSinkFn sink, void* context = nullptr) noexcept {
  auto& st = detail::LogState::Instance();
  std::lock_guard<std::mutex> lock(st.mtx);
  st.sink = sink;
  st.sink_context = context;
}

inline void Init() noexcept {
  auto& st = detail::LogState::Instance();
  std::lock_guard<std::mutex> lock(st.mtx);
  st.initialized = true;
}

inline void Shutdown() noexcept {
  auto& st = detail::LogState::Instance();
  std::lock_guard<std::mutex> lock(st.mtx);
  (void)std::fflush(stderr);
  st.sink = nullptr;
  st.sink_context = nullptr;
  st.initialized = false;
}

inline bool IsInitialized() noexcept {
  auto& st = detail::LogState::Instance();
  std::lock_guard<std::mutex> lock(st.mtx);
  return st.initialized;
}

// ============================================================================
// Write path
// ============================================================================

inline void LogWriteVa(Level level, const char* category, const char* file, int line,
                       const char* fmt, va_list args) noexcept {
  if (static_cast<uint8_t>(level) < static_cast<uint8_t>(GetLevel())) {
    return;
  }

  char msg[512];
  (void)std::vsnprintf(msg, sizeof(msg), fmt, args);

  char ts[32];
  detail::FormatTimestamp(ts, sizeof(ts));

  char out[640];
#ifdef NDEBUG
  (void)file;
  (void)line;
  (void)std::snprintf(out, sizeof(out), "[%s] [%s] [%s] %s", ts, detail::LevelTag(level),
                      category, msg);
#else
  (void)std::snprintf(out, sizeof(out), "[%s] [%s] [%s] %s (%s:%d)", ts, detail::LevelTag(level),
                      category, msg, detail::Basename(file), line);
#endif

  auto& st = detail::LogState::Instance();
  {
    std::lock_guard<std::mutex> lock(st.mtx);
    if (st.sink != nullptr) {
      st.sink(level, category, out, st.sink_context);
    } else {
      (void)std::fprintf(stderr, "%s\n", out);
      if (level >= Level::kError) {
        (void)std::fflush(stderr);
      }
    }
  }

  if (level == Level::kFatal) {
    std::abort();
  }
}

#if defined(__GNUC__) || defined(__clang__)
__attribute__((format(printf, 5, 6)))
#endif
inline void LogWrite(Level level, const char* category, const char* file, int line,
                     const char* fmt, ...) noexcept {
  va_list args;
  va_start(args, fmt);
  LogWriteVa(level, category, file, line, fmt, args);
  va_end(args);
}

}  // namespace log
}  // namespace tsched

// ============================================================================
// Macros
// ============================================================================

#define TSCHED_LOG_DEBUG(cat, fmt, ...)                                       \
  do {                                                                        \
    if (TSCHED_LOG_MIN_LEVEL <= 0) {                                          \
      ::tsched::log::LogWrite(::tsched::log::Level::kDebug, cat, __FILE__,    \
                              __LINE__, fmt, ##__VA_ARGS__);                  \
    }                                                                         \
  } while (0)

#define TSCHED_LOG_INFO(cat, fmt, ...)                                        \
  do {                                                                        \
    if (TSCHED_LOG_MIN_LEVEL <= 1) {                                          \
      ::tsched::log::LogWrite(::tsched::log::Level::kInfo, cat, __FILE__,     \
                              __LINE__, fmt, ##__VA_ARGS__);                  \
    }                                                                         \
  } while (0)

#define TSCHED_LOG_WARN(cat, fmt, ...)                                        \
  do {                                                                        \
    if (TSCHED_LOG_MIN_LEVEL <= 2) {                                          \
      ::tsched::log::LogWrite(::tsched::log::Level::kWarn, cat, __FILE__,     \
                              __LINE__, fmt, ##__VA_ARGS__);                  \
    }                                                                         \
  } while (0)

#define TSCHED_LOG_ERROR(cat, fmt, ...)                                       \
  do {                                                                        \
    if (TSCHED_LOG_MIN_LEVEL <= 3) {                                          \
      ::tsched::log::LogWrite(::tsched::log::Level::kError, cat, __FILE__,    \
                              __LINE__, fmt, ##__VA_ARGS__);                  \
    }                                                                         \
  } while (0)

#define TSCHED_LOG_FATAL(cat, fmt, ...)                                       \
  do {                                                                        \
    ::tsched::log::LogWrite(::tsched::log::Level::kFatal, cat, __FILE__,      \
                            __LINE__, fmt, ##__VA_ARGS__);                    \
  } while (0)

#endif  // TSCHED_LOG_HPP_
