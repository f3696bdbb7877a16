/**
 * @file platform.hpp
 * @brief Clocks, sleeping, debug assertions and small macro helpers.
 *
 * Two clocks are used throughout corral and must not be mixed:
 * SteadyNowMs() for deadlines and retention windows (never jumps), and
 * WallNowMs() for timestamps that are persisted or shown to operators.
 */

#ifndef CORRAL_PLATFORM_HPP_
#define CORRAL_PLATFORM_HPP_

#include <cerrno>
#include <chrono>
#include <cstdint>
#include <cstdio>
#include <cstdlib>

#include <time.h>

#if defined(__GNUC__) || defined(__clang__)
#define CORRAL_PRINTF_FORMAT(fmt_idx, arg_idx) \
  __attribute__((format(printf, fmt_idx, arg_idx)))
#else
#define CORRAL_PRINTF_FORMAT(fmt_idx, arg_idx)
#endif

#define CORRAL_CONCAT_IMPL(a, b) a##b
#define CORRAL_CONCAT(a, b) CORRAL_CONCAT_IMPL(a, b)

namespace corral {

inline uint64_t SteadyNowMs() noexcept {
  using namespace std::chrono;
  return static_cast<uint64_t>(
      duration_cast<milliseconds>(steady_clock::now().time_since_epoch())
          .count());
}

inline uint64_t WallNowMs() noexcept {
  using namespace std::chrono;
  return static_cast<uint64_t>(
      duration_cast<milliseconds>(system_clock::now().time_since_epoch())
          .count());
}

/// @brief nanosleep for @p ms, resuming after signal interruptions.
inline void SleepMs(uint32_t ms) noexcept {
  struct timespec req;
  req.tv_sec = static_cast<time_t>(ms / 1000U);
  req.tv_nsec = static_cast<long>(ms % 1000U) * 1000000L;  // NOLINT
  struct timespec rem;
  while (::nanosleep(&req, &rem) != 0 && errno == EINTR) {
    req = rem;
  }
}

namespace detail {

[[noreturn]] inline void AssertFail(const char* cond, const char* file,
                                    int line) {
  (void)std::fprintf(stderr, "corral: assertion '%s' failed (%s:%d)\n", cond,
                     file, line);
  std::abort();
}

}  // namespace detail
}  // namespace corral

/// Precondition check on internal invariants; compiled out under NDEBUG.
#ifdef NDEBUG
#define CORRAL_ASSERT(cond) ((void)0)
#else
#define CORRAL_ASSERT(cond) \
  ((cond) ? ((void)0) : ::corral::detail::AssertFail(#cond, __FILE__, __LINE__))
#endif

#endif  // CORRAL_PLATFORM_HPP_
