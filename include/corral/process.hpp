/**
 * @file process.hpp
 * @brief Child processes for unit commands: spawn, capture, deadline, reap.
 *
 * Header-only, Linux/POSIX.
 *
 *   RunCommand(argv, timeout)
 *        |
 *   ChildProcess::Spawn ---- status pipe (CLOEXEC) ----> exec errno or EOF
 *        |
 *        +-- poll(output pipe, <= kPollSliceMs) --> append to bounded tail
 *        +-- TryReap() -------------------------> exited / signaled
 *        +-- deadline -------------------------> Kill() + reap, timed_out
 *
 * stdout and stderr share one pipe. Only the last kMaxCapturedOutput bytes
 * are kept; unit commands are long-running configuration tools whose full
 * logs belong in their own log files.
 */

#ifndef CORRAL_PROCESS_HPP_
#define CORRAL_PROCESS_HPP_

#include "corral/platform.hpp"
#include "corral/vocabulary.hpp"

#include <cerrno>
#include <cstddef>
#include <cstdint>
#include <cstring>
#include <string>
#include <utility>
#include <vector>

#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

namespace corral {

enum class SpawnError : uint8_t {
  kEmptyCommand = 0,
  kPipeFailed,
  kForkFailed,
  kExecFailed,  ///< Program missing or not executable
};

inline const char* SpawnErrorName(SpawnError e) noexcept {
  switch (e) {
    case SpawnError::kEmptyCommand: return "empty command";
    case SpawnError::kPipeFailed:   return "pipe failed";
    case SpawnError::kForkFailed:   return "fork failed";
    case SpawnError::kExecFailed:   return "exec failed";
    default:                        return "unknown";
  }
}

/// How a reaped child ended.
struct ExitStatus {
  bool exited{false};
  int exit_code{-1};
  bool signaled{false};
  int term_signal{0};

  bool Succeeded() const noexcept { return exited && exit_code == 0; }
};

struct CommandResult {
  ExitStatus status;
  bool timed_out{false};
  std::string output;  ///< Merged stdout/stderr tail
};

constexpr size_t kMaxCapturedOutput = 64U * 1024U;

namespace detail {

/// Owns one file descriptor.
class Fd {
 public:
  Fd() = default;
  explicit Fd(int fd) : fd_(fd) {}
  ~Fd() { Reset(); }

  Fd(Fd&& other) noexcept : fd_(other.fd_) { other.fd_ = -1; }
  Fd& operator=(Fd&& other) noexcept {
    if (this != &other) {
      Reset();
      fd_ = other.fd_;
      other.fd_ = -1;
    }
    return *this;
  }
  Fd(const Fd&) = delete;
  Fd& operator=(const Fd&) = delete;

  int Get() const noexcept { return fd_; }
  bool IsOpen() const noexcept { return fd_ >= 0; }

  void Reset() noexcept {
    if (fd_ >= 0) {
      (void)::close(fd_);
      fd_ = -1;
    }
  }

 private:
  int fd_{-1};
};

/// pipe2 with O_CLOEXEC; @p ends[0] is the read end.
inline bool MakePipe(Fd (&ends)[2]) {
  int raw[2];
  if (::pipe2(raw, O_CLOEXEC) != 0) {
    return false;
  }
  ends[0] = Fd(raw[0]);
  ends[1] = Fd(raw[1]);
  return true;
}

inline void AppendBounded(std::string& out, const char* data, size_t n,
                          size_t limit) {
  out.append(data, n);
  if (out.size() > limit) {
    out.erase(0U, out.size() - limit);
  }
}

inline void FillExitStatus(int raw, ExitStatus& st) {
  if (WIFEXITED(raw)) {
    st.exited = true;
    st.exit_code = WEXITSTATUS(raw);
  } else if (WIFSIGNALED(raw)) {
    st.signaled = true;
    st.term_signal = WTERMSIG(raw);
  }
}

}  // namespace detail

// ============================================================================
// ChildProcess
// ============================================================================

/**
 * @brief One spawned command with its merged output pipe.
 *
 * The destructor kills and reaps a child that is still running, so an
 * early return never leaks a process.
 *
 * @code
 *   corral::ChildProcess child;
 *   auto spawned = child.Spawn({"ssh", "web-1", "chef-client"});
 *   if (!spawned.has_value()) { ... }
 * @endcode
 */
class ChildProcess {
 public:
  ChildProcess() = default;

  ~ChildProcess() {
    if (pid_ > 0) {
      Kill();
      ExitStatus ignored;
      (void)WaitBlocking(ignored);
    }
  }

  ChildProcess(const ChildProcess&) = delete;
  ChildProcess& operator=(const ChildProcess&) = delete;

  /**
   * @brief fork/exec @p argv with stdout and stderr on one pipe.
   *
   * The child runs in its own session with default signal dispositions.
   * An exec failure is reported here as kExecFailed: the child writes its
   * errno to a close-on-exec pipe that a successful exec closes silently.
   */
  expected<void, SpawnError> Spawn(const std::vector<std::string>& argv) {
    using R = expected<void, SpawnError>;
    if (argv.empty() || argv[0].empty()) {
      return R::error(SpawnError::kEmptyCommand);
    }
    std::vector<char*> cargv;
    cargv.reserve(argv.size() + 1U);
    for (const auto& a : argv) {
      cargv.push_back(const_cast<char*>(a.c_str()));
    }
    cargv.push_back(nullptr);

    detail::Fd out[2];
    detail::Fd status[2];
    if (!detail::MakePipe(out) || !detail::MakePipe(status)) {
      return R::error(SpawnError::kPipeFailed);
    }

    const pid_t child = ::fork();
    if (child < 0) {
      return R::error(SpawnError::kForkFailed);
    }
    if (child == 0) {
      (void)::setsid();
      struct sigaction dfl;
      std::memset(&dfl, 0, sizeof(dfl));
      dfl.sa_handler = SIG_DFL;
      for (int sig = 1; sig < NSIG; ++sig) {
        (void)::sigaction(sig, &dfl, nullptr);
      }
      sigset_t none;
      (void)::sigemptyset(&none);
      (void)::sigprocmask(SIG_SETMASK, &none, nullptr);

      (void)::dup2(out[1].Get(), STDOUT_FILENO);
      (void)::dup2(out[1].Get(), STDERR_FILENO);
      ::execvp(cargv[0], cargv.data());
      const int err = errno;
      (void)::write(status[1].Get(), &err, sizeof(err));
      ::_exit(127);
    }

    pid_ = child;
    out[1].Reset();
    status[1].Reset();

    int child_errno = 0;
    ssize_t n;
    do {
      n = ::read(status[0].Get(), &child_errno, sizeof(child_errno));
    } while (n < 0 && errno == EINTR);
    if (n == static_cast<ssize_t>(sizeof(child_errno))) {
      ExitStatus ignored;
      (void)WaitBlocking(ignored);
      return R::error(SpawnError::kExecFailed);
    }

    const int flags = ::fcntl(out[0].Get(), F_GETFL, 0);
    if (flags >= 0) {
      (void)::fcntl(out[0].Get(), F_SETFL, flags | O_NONBLOCK);
    }
    output_ = std::move(out[0]);
    return R::success();
  }

  /**
   * @brief Wait up to @p wait_ms for output and append what arrived.
   * @return false once the pipe is closed (EOF or error).
   */
  bool PumpOutput(std::string& out, uint32_t wait_ms,
                  size_t limit = kMaxCapturedOutput) {
    if (!output_.IsOpen()) {
      return false;
    }
    struct pollfd pfd;
    pfd.fd = output_.Get();
    pfd.events = POLLIN;
    pfd.revents = 0;
    const int ready = ::poll(&pfd, 1, static_cast<int>(wait_ms));
    if (ready <= 0) {
      return ready == 0 || errno == EINTR;
    }
    char buf[4096];
    for (;;) {
      const ssize_t n = ::read(output_.Get(), buf, sizeof(buf));
      if (n > 0) {
        detail::AppendBounded(out, buf, static_cast<size_t>(n), limit);
        continue;
      }
      if (n < 0 && errno == EINTR) {
        continue;
      }
      if (n < 0 && (errno == EAGAIN || errno == EWOULDBLOCK)) {
        return true;
      }
      output_.Reset();
      return false;
    }
  }

  /// @return true once the child has been reaped into @p st.
  bool TryReap(ExitStatus& st) {
    if (pid_ <= 0) {
      return true;
    }
    int raw = 0;
    const pid_t w = ::waitpid(pid_, &raw, WNOHANG);
    if (w == pid_) {
      detail::FillExitStatus(raw, st);
      pid_ = -1;
      return true;
    }
    return false;
  }

  bool WaitBlocking(ExitStatus& st) {
    if (pid_ <= 0) {
      return false;
    }
    int raw = 0;
    pid_t w;
    do {
      w = ::waitpid(pid_, &raw, 0);
    } while (w < 0 && errno == EINTR);
    pid_ = -1;
    if (w < 0) {
      return false;
    }
    detail::FillExitStatus(raw, st);
    return true;
  }

  /// SIGKILL the child's whole session.
  void Kill() noexcept {
    if (pid_ > 0) {
      (void)::kill(-pid_, SIGKILL);
      (void)::kill(pid_, SIGKILL);
    }
  }

  pid_t Pid() const noexcept { return pid_; }

 private:
  pid_t pid_{-1};
  detail::Fd output_;
};

// ============================================================================
// RunCommand
// ============================================================================

/**
 * @brief Run @p argv to completion, or until @p timeout_ms (0 = no limit).
 *
 * A command that outlives its deadline is killed and reported with
 * timed_out set; its partial output is kept.
 */
inline expected<CommandResult, SpawnError> RunCommand(
    const std::vector<std::string>& argv, uint32_t timeout_ms) {
  using R = expected<CommandResult, SpawnError>;
  static constexpr uint32_t kPollSliceMs = 20U;

  ChildProcess child;
  auto spawned = child.Spawn(argv);
  if (!spawned.has_value()) {
    return R::error(spawned.get_error());
  }

  CommandResult result;
  const uint64_t deadline = (timeout_ms > 0U) ? SteadyNowMs() + timeout_ms : 0U;
  bool open = true;
  for (;;) {
    if (open) {
      open = child.PumpOutput(result.output, kPollSliceMs);
    }
    if (child.TryReap(result.status)) {
      (void)child.PumpOutput(result.output, 0U);
      return R::success(std::move(result));
    }
    if (deadline != 0U && SteadyNowMs() >= deadline) {
      child.Kill();
      (void)child.WaitBlocking(result.status);
      result.timed_out = true;
      return R::success(std::move(result));
    }
    if (!open) {
      SleepMs(kPollSliceMs);
    }
  }
}

}  // namespace corral

#endif  // CORRAL_PROCESS_HPP_
