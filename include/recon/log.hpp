/**
 * @file log.hpp
 * @brief Synchronous leveled logging to stderr.
 *
 * Output format:
 *   [2024-01-01 12:00:00.123] [INFO] [reconciler] message (file.hpp:42)
 *
 * The source location suffix is omitted in release (NDEBUG) builds.
 * RECON_LOG_MIN_LEVEL removes lower levels at compile time
 * (0=DEBUG .. 4=FATAL). The runtime threshold is set with SetLevel().
 *
 * Header-only, compatible with -fno-exceptions -fno-rtti.
 */

#ifndef RECON_LOG_HPP_
#define RECON_LOG_HPP_

#include "recon/platform.hpp"

#include <atomic>
#include <cstdarg>
#include <cstdint>
#include <cstdio>
#include <cstring>
#include <ctime>

#if defined(RECON_PLATFORM_POSIX)
#include <time.h>
#endif

#ifndef RECON_LOG_MIN_LEVEL
#define RECON_LOG_MIN_LEVEL 0
#endif

#ifndef RECON_LOG_MAX_MESSAGE
#define RECON_LOG_MAX_MESSAGE 512U
#endif

namespace recon {
namespace log {

enum class Level : uint8_t {
  kDebug = 0,
  kInfo = 1,
  kWarn = 2,
  kError = 3,
  kFatal = 4,
  kOff = 5,
};

/**
 * @brief Sink receiving every formatted line that passed the threshold.
 *
 * The default sink writes to stderr. Tests install their own to capture
 * output.
 */
using SinkFn = void (*)(Level level, const char* category, const char* message,
                        void* context);

namespace detail {

struct LogState {
  std::atomic<uint8_t> level{
#ifdef NDEBUG
      static_cast<uint8_t>(Level::kInfo)
#else
      static_cast<uint8_t>(Level::kDebug)
#endif
  };
  std::atomic<bool> initialized{false};
  SinkFn sink = nullptr;
  void* sink_context = nullptr;
};

inline LogState& State() noexcept {
  static LogState state;
  return state;
}

inline const char* LevelTag(Level level) noexcept {
  switch (level) {
    case Level::kDebug: return "DEBUG";
    case Level::kInfo:  return "INFO";
    case Level::kWarn:  return "WARN";
    case Level::kError: return "ERROR";
    case Level::kFatal: return "FATAL";
    case Level::kOff:   return "OFF";
  }
  return "?";
}

inline const char* Basename(const char* path) noexcept {
  if (path == nullptr) return "?";
  const char* slash = std::strrchr(path, '/');
  return (slash != nullptr) ? slash + 1 : path;
}

inline void FormatTimestamp(char* buf, size_t bufsz) noexcept {
#if defined(RECON_PLATFORM_POSIX)
  struct timespec ts;
  clock_gettime(CLOCK_REALTIME, &ts);
  struct tm tm_local;
  localtime_r(&ts.tv_sec, &tm_local);
  (void)std::snprintf(buf, bufsz, "%04d-%02d-%02d %02d:%02d:%02d.%03ld",
                      tm_local.tm_year + 1900, tm_local.tm_mon + 1,
                      tm_local.tm_mday, tm_local.tm_hour, tm_local.tm_min,
                      tm_local.tm_sec, ts.tv_nsec / 1000000L);
#else
  std::time_t t = std::time(nullptr);
  std::tm* tm_local = std::localtime(&t);
  if (tm_local == nullptr) {
    (void)std::snprintf(buf, bufsz, "0000-00-00 00:00:00.000");
    return;
  }
  (void)std::snprintf(buf, bufsz, "%04d-%02d-%02d %02d:%02d:%02d.000",
                      tm_local->tm_year + 1900, tm_local->tm_mon + 1,
                      tm_local->tm_mday, tm_local->tm_hour, tm_local->tm_min,
                      tm_local->tm_sec);
#endif
}

}  // namespace detail

// ============================================================================
// Runtime control
// ============================================================================

inline void SetLevel(Level level) noexcept {
  detail::State().level.store(static_cast<uint8_t>(level),
                              std::memory_order_relaxed);
}

inline Level GetLevel() noexcept {
  return static_cast<Level>(
      detail::State().level.load(std::memory_order_relaxed));
}

/** Parse "debug" / "info" / "warn" / "error" / "fatal" / "off". */
inline bool ParseLevel(const char* name, Level& out) noexcept {
  if (name == nullptr) return false;
  static const char* const kNames[] = {"debug", "info", "warn",
                                       "error", "fatal", "off"};
  for (uint8_t i = 0; i < 6U; ++i) {
    const char* a = name;
    const char* b = kNames[i];
    while (*a != '\0' && *b != '\0') {
      char la = (*a >= 'A' && *a <= 'Z') ? static_cast<char>(*a + 32) : *a;
      if (la != *b) break;
      ++a;
      ++b;
    }
    if (*a == '\0' && *b == '\0') {
      out = static_cast<Level>(i);
      return true;
    }
  }
  return false;
}

inline void Init() noexcept {
  detail::State().initialized.store(true, std::memory_order_release);
}

inline void Shutdown() noexcept {
  (void)std::fflush(stderr);
  detail::State().initialized.store(false, std::memory_order_release);
}

inline bool IsInitialized() noexcept {
  return detail::State().initialized.load(std::memory_order_acquire);
}

/** Install a sink (nullptr restores stderr). Not thread-safe. */
inline void SetSink(SinkFn sink, void* context = nullptr) noexcept {
  detail::State().sink = sink;
  detail::State().sink_context = context;
}

// ============================================================================
// LogWrite
// ============================================================================

#if defined(__GNUC__) || defined(__clang__)
__attribute__((format(printf, 5, 6)))
#endif
inline void LogWrite(Level level, const char* category, const char* file,
                     int line, const char* fmt, ...) noexcept {
  if (static_cast<uint8_t>(level) < static_cast<uint8_t>(GetLevel())) return;

  char msg[RECON_LOG_MAX_MESSAGE];
  va_list args;
  va_start(args, fmt);
  (void)std::vsnprintf(msg, sizeof(msg), fmt, args);
  va_end(args);

  detail::LogState& st = detail::State();
  if (st.sink != nullptr) {
    st.sink(level, category, msg, st.sink_context);
    return;
  }

  char ts[32];
  detail::FormatTimestamp(ts, sizeof(ts));
#ifdef NDEBUG
  (void)file;
  (void)line;
  (void)std::fprintf(stderr, "[%s] [%s] [%s] %s\n", ts,
                     detail::LevelTag(level), category, msg);
#else
  (void)std::fprintf(stderr, "[%s] [%s] [%s] %s (%s:%d)\n", ts,
                     detail::LevelTag(level), category, msg,
                     detail::Basename(file), line);
#endif
}

}  // namespace log
}  // namespace recon

// ============================================================================
// Macros
// ============================================================================

#define RECON_LOG_DEBUG(cat, fmt, ...)                                       \
  do {                                                                      \
    if (RECON_LOG_MIN_LEVEL <= 0) {                                         \
      ::recon::log::LogWrite(::recon::log::Level::kDebug, cat, __FILE__,    \
                             __LINE__, fmt, ##__VA_ARGS__);                 \
    }                                                                       \
  } while (0)

#define RECON_LOG_INFO(cat, fmt, ...)                                        \
  do {                                                                      \
    if (RECON_LOG_MIN_LEVEL <= 1) {                                         \
      ::recon::log::LogWrite(::recon::log::Level::kInfo, cat, __FILE__,     \
                             __LINE__, fmt, ##__VA_ARGS__);                 \
    }                                                                       \
  } while (0)

#define RECON_LOG_WARN(cat, fmt, ...)                                        \
  do {                                                                      \
    if (RECON_LOG_MIN_LEVEL <= 2) {                                         \
      ::recon::log::LogWrite(::recon::log::Level::kWarn, cat, __FILE__,     \
                             __LINE__, fmt, ##__VA_ARGS__);                 \
    }                                                                       \
  } while (0)

#define RECON_LOG_ERROR(cat, fmt, ...)                                       \
  do {                                                                      \
    if (RECON_LOG_MIN_LEVEL <= 3) {                                         \
      ::recon::log::LogWrite(::recon::log::Level::kError, cat, __FILE__,    \
                             __LINE__, fmt, ##__VA_ARGS__);                 \
    }                                                                       \
  } while (0)

#endif  // RECON_LOG_HPP_
