/**
 * @file log.hpp
 * @brief Synchronous printf-style logging with level filtering.
 *
 * Output format:
 *   [2026-10-19 14:03:07.123] [INFO] [Orchestrator] finished configure on 3 nodes
 *
 * Two filters apply:
 *   - Compile time: CORRAL_LOG_MIN_LEVEL (0=DEBUG .. 4=FATAL) removes calls
 *     below the floor entirely.
 *   - Run time: SetLevel() adjusts the threshold without recompiling.
 *
 * Lines go to stderr until Init(path) redirects them to an append-mode file.
 * A process-wide mutex keeps lines from interleaving across threads.
 *
 * Usage:
 * @code
 *   corral::log::Init();
 *   CORRAL_LOG_INFO("Lock", "acquired %s", name);
 *   corral::log::Shutdown();
 * @endcode
 */

#ifndef CORRAL_LOG_HPP_
#define CORRAL_LOG_HPP_

#include "corral/platform.hpp"

#include <atomic>
#include <cstdarg>
#include <cstdio>
#include <ctime>
#include <mutex>

#ifndef CORRAL_LOG_MIN_LEVEL
#ifdef NDEBUG
#define CORRAL_LOG_MIN_LEVEL 1
#else
#define CORRAL_LOG_MIN_LEVEL 0
#endif
#endif

namespace corral {
namespace log {

enum class Level : uint8_t {
  kDebug = 0,
  kInfo = 1,
  kWarn = 2,
  kError = 3,
  kFatal = 4,
  kOff = 5,
};

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
  std::mutex mtx;
  FILE* sink{nullptr};  ///< nullptr = stderr
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
    default:            return "?";
  }
}

inline void FormatTimestamp(char* buf, size_t size) noexcept {
  struct timespec ts;
  ::clock_gettime(CLOCK_REALTIME, &ts);
  struct tm tm_local;
  ::localtime_r(&ts.tv_sec, &tm_local);
  (void)std::snprintf(buf, size, "%04d-%02d-%02d %02d:%02d:%02d.%03ld",
                      tm_local.tm_year + 1900, tm_local.tm_mon + 1,
                      tm_local.tm_mday, tm_local.tm_hour, tm_local.tm_min,
                      tm_local.tm_sec, ts.tv_nsec / 1000000L);
}

}  // namespace detail

inline void SetLevel(Level level) noexcept {
  detail::State().level.store(static_cast<uint8_t>(level),
                              std::memory_order_relaxed);
}

inline Level GetLevel() noexcept {
  return static_cast<Level>(
      detail::State().level.load(std::memory_order_relaxed));
}

/**
 * @brief Parse "debug" / "info" / "warn" / "error" / "fatal" / "off".
 * @return true and sets @p out on a recognised name.
 */
inline bool ParseLevel(const char* name, Level& out) noexcept {
  if (name == nullptr) return false;
  struct Named {
    const char* name;
    Level level;
  };
  static constexpr Named kNames[] = {
      {"debug", Level::kDebug}, {"info", Level::kInfo},
      {"warn", Level::kWarn},   {"error", Level::kError},
      {"fatal", Level::kFatal}, {"off", Level::kOff},
  };
  for (const auto& n : kNames) {
    const char* a = name;
    const char* b = n.name;
    while (*a != '\0' && *b != '\0' &&
           ((*a >= 'A' && *a <= 'Z') ? static_cast<char>(*a + 32) : *a) == *b) {
      ++a;
      ++b;
    }
    if (*a == '\0' && *b == '\0') {
      out = n.level;
      return true;
    }
  }
  return false;
}

/**
 * @brief Mark logging initialized; optionally redirect output to a file.
 * @param path Append-mode log file, or nullptr for stderr.
 * @return false if the file could not be opened (stderr stays active).
 */
inline bool Init(const char* path = nullptr) noexcept {
  auto& st = detail::State();
  std::lock_guard<std::mutex> lock(st.mtx);
  bool ok = true;
  if (path != nullptr && path[0] != '\0') {
    FILE* f = std::fopen(path, "a");
    if (f != nullptr) {
      if (st.sink != nullptr) std::fclose(st.sink);
      st.sink = f;
    } else {
      ok = false;
    }
  }
  st.initialized.store(true, std::memory_order_release);
  return ok;
}

inline void Shutdown() noexcept {
  auto& st = detail::State();
  std::lock_guard<std::mutex> lock(st.mtx);
  if (st.sink != nullptr) {
    std::fflush(st.sink);
    std::fclose(st.sink);
    st.sink = nullptr;
  }
  st.initialized.store(false, std::memory_order_release);
}

inline bool IsInitialized() noexcept {
  return detail::State().initialized.load(std::memory_order_acquire);
}

inline void LogWrite(Level level, const char* category, const char* fmt, ...)
    CORRAL_PRINTF_FORMAT(3, 4);

inline void LogWrite(Level level, const char* category, const char* fmt, ...) {
  auto& st = detail::State();
  if (static_cast<uint8_t>(level) <
      st.level.load(std::memory_order_relaxed)) {
    return;
  }

  char ts[32];
  detail::FormatTimestamp(ts, sizeof(ts));

  char msg[1024];
  va_list args;
  va_start(args, fmt);
  (void)std::vsnprintf(msg, sizeof(msg), fmt, args);
  va_end(args);

  std::lock_guard<std::mutex> lock(st.mtx);
  FILE* out = (st.sink != nullptr) ? st.sink : stderr;
  (void)std::fprintf(out, "[%s] [%s] [%s] %s\n", ts, detail::LevelTag(level),
                     (category != nullptr) ? category : "", msg);
  if (level >= Level::kWarn) {
    std::fflush(out);
  }
}

}  // namespace log
}  // namespace corral

// ============================================================================
// Macros
// ============================================================================

#if CORRAL_LOG_MIN_LEVEL <= 0
#define CORRAL_LOG_DEBUG(cat, fmt, ...) \
  ::corral::log::LogWrite(::corral::log::Level::kDebug, cat, fmt, ##__VA_ARGS__)
#else
#define CORRAL_LOG_DEBUG(cat, fmt, ...) ((void)0)
#endif

#if CORRAL_LOG_MIN_LEVEL <= 1
#define CORRAL_LOG_INFO(cat, fmt, ...) \
  ::corral::log::LogWrite(::corral::log::Level::kInfo, cat, fmt, ##__VA_ARGS__)
#else
#define CORRAL_LOG_INFO(cat, fmt, ...) ((void)0)
#endif

#if CORRAL_LOG_MIN_LEVEL <= 2
#define CORRAL_LOG_WARN(cat, fmt, ...) \
  ::corral::log::LogWrite(::corral::log::Level::kWarn, cat, fmt, ##__VA_ARGS__)
#else
#define CORRAL_LOG_WARN(cat, fmt, ...) ((void)0)
#endif

#define CORRAL_LOG_ERROR(cat, fmt, ...) \
  ::corral::log::LogWrite(::corral::log::Level::kError, cat, fmt, ##__VA_ARGS__)

#define CORRAL_LOG_FATAL(cat, fmt, ...)                                     \
  do {                                                                      \
    ::corral::log::LogWrite(::corral::log::Level::kFatal, cat, fmt,         \
                            ##__VA_ARGS__);                                 \
    std::abort();                                                           \
  } while (0)

#endif  // CORRAL_LOG_HPP_
