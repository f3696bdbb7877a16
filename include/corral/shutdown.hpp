/**
 * @file shutdown.hpp
 * @brief Signal-driven, ordered shutdown for corral processes.
 *
 * The first SIGINT/SIGTERM (or Quit()) wakes WaitForShutdown(), which runs
 * the registered steps newest-first: typically "stop the orchestrator and
 * drain its queue" before "flush the log". Draining can take as long as the
 * slowest unit command, so a second signal during that time exits the
 * process immediately with status 128 + signo.
 */

#ifndef CORRAL_SHUTDOWN_HPP_
#define CORRAL_SHUTDOWN_HPP_

#include "corral/log.hpp"
#include "corral/vocabulary.hpp"

#include <atomic>
#include <cerrno>
#include <csignal>
#include <cstdint>
#include <exception>
#include <functional>
#include <string>
#include <utility>
#include <vector>

#include <fcntl.h>
#include <poll.h>
#include <unistd.h>

namespace corral {

enum class ShutdownError : uint8_t {
  kCallbacksFull = 0,
  kPipeCreationFailed,
  kSignalInstallFailed,
  kAlreadyInstantiated
};

inline const char* ShutdownErrorName(ShutdownError e) noexcept {
  switch (e) {
    case ShutdownError::kCallbacksFull:       return "callbacks full";
    case ShutdownError::kPipeCreationFailed:  return "pipe creation failed";
    case ShutdownError::kSignalInstallFailed: return "signal install failed";
    case ShutdownError::kAlreadyInstantiated: return "already instantiated";
    default:                                  return "unknown";
  }
}

/// Receives the signal number, or the value given to Quit().
using ShutdownFn = std::function<void(int signo)>;

class ShutdownManager;

namespace detail {

inline std::atomic<ShutdownManager*>& ActiveShutdownManager() {
  static std::atomic<ShutdownManager*> active{nullptr};
  return active;
}

}  // namespace detail

class ShutdownManager final {
 public:
  static constexpr uint32_t kMaxCallbacks = 16U;

  /// Only the first live instance is valid; later ones reject every call.
  ShutdownManager() {
    ShutdownManager* none = nullptr;
    if (!detail::ActiveShutdownManager().compare_exchange_strong(none, this)) {
      return;
    }
    int fds[2];
    if (::pipe2(fds, O_CLOEXEC | O_NONBLOCK) != 0) {
      CORRAL_LOG_ERROR("Shutdown", "wakeup pipe: errno %d", errno);
      return;
    }
    wake_read_ = fds[0];
    wake_write_ = fds[1];
    valid_ = true;
  }

  ~ShutdownManager() {
    ShutdownManager* self = this;
    (void)detail::ActiveShutdownManager().compare_exchange_strong(self, nullptr);
    if (wake_read_ >= 0) {
      (void)::close(wake_read_);
    }
    if (wake_write_ >= 0) {
      (void)::close(wake_write_);
    }
  }

  ShutdownManager(const ShutdownManager&) = delete;
  ShutdownManager& operator=(const ShutdownManager&) = delete;

  bool IsValid() const noexcept { return valid_; }

  /**
   * @brief Add a shutdown step. Steps run in reverse registration order.
   * @param name Shown in the log as the step runs.
   */
  expected<void, ShutdownError> Register(std::string name, ShutdownFn fn) {
    using R = expected<void, ShutdownError>;
    if (!valid_) {
      return R::error(ShutdownError::kAlreadyInstantiated);
    }
    if (!fn || steps_.size() >= kMaxCallbacks) {
      return R::error(ShutdownError::kCallbacksFull);
    }
    steps_.push_back(Step{std::move(name), std::move(fn)});
    return R::success();
  }

  expected<void, ShutdownError> Register(ShutdownFn fn) {
    return Register("step " + std::to_string(steps_.size() + 1U), std::move(fn));
  }

  /// @brief SIGINT and SIGTERM. SIGPIPE is ignored so a closed remote
  ///        session cannot kill the process.
  expected<void, ShutdownError> InstallSignalHandlers() noexcept {
    using R = expected<void, ShutdownError>;
    if (!valid_) {
      return R::error(ShutdownError::kAlreadyInstantiated);
    }
    struct sigaction sa;
    sa.sa_handler = &ShutdownManager::OnSignal;
    (void)::sigemptyset(&sa.sa_mask);
    sa.sa_flags = SA_RESTART;
    if (::sigaction(SIGINT, &sa, nullptr) != 0 ||
        ::sigaction(SIGTERM, &sa, nullptr) != 0) {
      return R::error(ShutdownError::kSignalInstallFailed);
    }
    (void)::signal(SIGPIPE, SIG_IGN);
    return R::success();
  }

  void Quit(int signo = 0) noexcept { Request(signo); }

  bool IsShutdownRequested() const noexcept {
    return requested_.load(std::memory_order_acquire) >= 0;
  }

  /// @brief Block until shutdown is requested, then run every step.
  void WaitForShutdown() {
    while (!IsShutdownRequested() && wake_read_ >= 0) {
      struct pollfd pfd;
      pfd.fd = wake_read_;
      pfd.events = POLLIN;
      pfd.revents = 0;
      if (::poll(&pfd, 1, -1) < 0 && errno != EINTR) {
        CORRAL_LOG_ERROR("Shutdown", "wait failed: errno %d", errno);
        break;
      }
      uint8_t drain[16];
      while (::read(wake_read_, drain, sizeof(drain)) > 0) {
      }
    }
    RunSteps();
  }

 private:
  struct Step {
    std::string name;
    ShutdownFn fn;
  };

  /// Async-signal-safe: atomics and write(2) only.
  void Request(int signo) noexcept {
    int none = -1;
    if (!requested_.compare_exchange_strong(none, signo < 0 ? 0 : signo,
                                            std::memory_order_acq_rel)) {
      return;
    }
    if (wake_write_ >= 0) {
      const uint8_t byte = 1U;
      (void)::write(wake_write_, &byte, 1);
    }
  }

  static void OnSignal(int signo) {
    ShutdownManager* self = detail::ActiveShutdownManager().load();
    if (self == nullptr) {
      return;
    }
    if (self->IsShutdownRequested()) {
      ::_exit(128 + signo);
    }
    self->Request(signo);
  }

  void RunSteps() {
    const int raw = requested_.load(std::memory_order_acquire);
    const int signo = raw < 0 ? 0 : raw;
    CORRAL_LOG_INFO("Shutdown", "shutting down (signal %d), %u steps", signo,
                    static_cast<uint32_t>(steps_.size()));
    for (auto it = steps_.rbegin(); it != steps_.rend(); ++it) {
      CORRAL_LOG_DEBUG("Shutdown", "running %s", it->name.c_str());
      try {
        it->fn(signo);
      } catch (const std::exception& ex) {
        CORRAL_LOG_ERROR("Shutdown", "%s failed: %s", it->name.c_str(),
                         ex.what());
      }
    }
  }

  std::vector<Step> steps_;
  std::atomic<int> requested_{-1};  ///< Signal number once requested
  int wake_read_{-1};
  int wake_write_{-1};
  bool valid_{false};
};

}  // namespace corral

#endif  // CORRAL_SHUTDOWN_HPP_
