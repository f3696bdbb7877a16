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
 * @file job.hpp
 * @brief Job - tracked record of one asynchronous orchestration request.
 *
 * State machine (monotonic, terminal states absorbing):
 *
 *   Queued --MarkRunning--> Running --Succeed--> Success
 *      |                       |
 *      +--------Fail-----------+----Fail-----> Failure
 *
 * Every transition and status message is appended to the Job's history;
 * nothing recorded is ever rewritten. Terminal transitions on a terminal
 * Job are no-ops that return false, so cleanup paths may repeat them.
 *
 * Progress calls are made only by the orchestrator executing the request.
 * Readers take snapshots or block in WaitTerminal(); all access is
 * serialized on the Job's own mutex.
 */

#ifndef CORRAL_JOB_HPP_
#define CORRAL_JOB_HPP_

#include "corral/error.hpp"
#include "corral/log.hpp"
#include "corral/platform.hpp"
#include "corral/vocabulary.hpp"

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <mutex>
#include <string>
#include <utility>
#include <vector>

namespace corral {

using JobId = uint64_t;

// ============================================================================
// Enumerations
// ============================================================================

enum class JobState : uint8_t {
  kQueued = 0,
  kRunning,
  kSuccess,
  kFailure,
};

inline const char* JobStateName(JobState s) noexcept {
  switch (s) {
    case JobState::kQueued:  return "queued";
    case JobState::kRunning: return "running";
    case JobState::kSuccess: return "success";
    case JobState::kFailure: return "failure";
    default:                 return "unknown";
  }
}

inline bool IsTerminal(JobState s) noexcept {
  return s == JobState::kSuccess || s == JobState::kFailure;
}

enum class JobKind : uint8_t {
  kEnvironmentConfigure = 0,
  kEnvironmentDestroy,
  kEnvironmentBootstrap,
};

inline const char* JobKindName(JobKind k) noexcept {
  switch (k) {
    case JobKind::kEnvironmentConfigure: return "environment_configure";
    case JobKind::kEnvironmentDestroy:   return "environment_destroy";
    case JobKind::kEnvironmentBootstrap: return "environment_bootstrap";
    default:                             return "unknown";
  }
}

enum class JobError : uint8_t {
  kNotFound = 0,  ///< Unknown id, or retention window elapsed
  kTimeout,       ///< Job not terminal within the caller's deadline
  kDuplicateId,   ///< Register() with an id already tracked
  kInvalidJob,    ///< Register() without a job
};

// ============================================================================
// Records
// ============================================================================

struct JobResult {
  uint32_t success_count{0U};
  uint32_t failure_count{0U};
  std::vector<std::string> failed_units;
  optional<Fault> fault;
};

struct JobEvent {
  uint64_t at_ms{0U};
  JobState state{JobState::kQueued};
  std::string message;
};

struct JobSnapshot {
  JobId id{0U};
  JobKind kind{JobKind::kEnvironmentConfigure};
  JobState state{JobState::kQueued};
  std::string status_message;
  JobResult result;
  uint64_t created_at_ms{0U};
  uint64_t finished_at_ms{0U};
  std::vector<JobEvent> history;
};

/// @brief Terminal view handed back to a caller resolving a Ticket.
struct FinalStatus {
  JobState state{JobState::kQueued};
  std::string message;
  uint32_t success_count{0U};
  uint32_t failure_count{0U};
  std::vector<std::string> failed_units;
  optional<Fault> fault;
};

// ============================================================================
// Job
// ============================================================================

class Job {
 public:
  Job(JobId id, JobKind kind)
      : id_(id), kind_(kind), created_at_ms_(WallNowMs()) {
    history_.push_back(JobEvent{created_at_ms_, JobState::kQueued, "queued"});
  }

  Job(const Job&) = delete;
  Job& operator=(const Job&) = delete;

  JobId Id() const noexcept { return id_; }
  JobKind Kind() const noexcept { return kind_; }
  uint64_t CreatedAtMs() const noexcept { return created_at_ms_; }

  // --------------------------------------------------------------------------
  // Progress API
  // --------------------------------------------------------------------------

  /// @brief Queued -> Running.
  bool MarkRunning(const std::string& message) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (state_ != JobState::kQueued) {
      return false;
    }
    Append(JobState::kRunning, message);
    return true;
  }

  /// @brief Update the status message of a non-terminal job.
  bool SetStatus(const std::string& message) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (IsTerminal(state_)) {
      return false;
    }
    Append(state_, message);
    return true;
  }

  /// @brief Running -> Success.
  bool Succeed(const std::string& message, JobResult result = JobResult()) {
    {
      std::lock_guard<std::mutex> lock(mutex_);
      if (state_ != JobState::kRunning) {
        if (!IsTerminal(state_)) {
          CORRAL_LOG_WARN("Job", "job %llu: success reported while %s",
                          static_cast<unsigned long long>(id_),
                          JobStateName(state_));
        }
        return false;
      }
      result_ = std::move(result);
      Finish(JobState::kSuccess, message);
    }
    terminal_cv_.notify_all();
    return true;
  }

  /// @brief Queued|Running -> Failure. The fault travels in the result.
  bool Fail(const Fault& fault, JobResult result = JobResult()) {
    {
      std::lock_guard<std::mutex> lock(mutex_);
      if (IsTerminal(state_)) {
        return false;
      }
      result.fault = fault;
      result_ = std::move(result);
      Finish(JobState::kFailure, fault.message);
    }
    terminal_cv_.notify_all();
    return true;
  }

  // --------------------------------------------------------------------------
  // Queries
  // --------------------------------------------------------------------------

  JobState State() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_;
  }

  JobSnapshot Snapshot() const {
    std::lock_guard<std::mutex> lock(mutex_);
    JobSnapshot s;
    s.id = id_;
    s.kind = kind_;
    s.state = state_;
    s.status_message = status_message_;
    s.result = result_;
    s.created_at_ms = created_at_ms_;
    s.finished_at_ms = finished_at_ms_;
    s.history = history_;
    return s;
  }

  /// @brief Block until the job is terminal.
  FinalStatus WaitTerminal() const {
    std::unique_lock<std::mutex> lock(mutex_);
    terminal_cv_.wait(lock, [this] { return IsTerminal(state_); });
    return FinalLocked();
  }

  /// @return The final status, or empty if still running after @p timeout_ms.
  optional<FinalStatus> WaitTerminalFor(uint32_t timeout_ms) const {
    std::unique_lock<std::mutex> lock(mutex_);
    if (!terminal_cv_.wait_for(lock, std::chrono::milliseconds(timeout_ms),
                               [this] { return IsTerminal(state_); })) {
      return optional<FinalStatus>();
    }
    return optional<FinalStatus>(FinalLocked());
  }

 private:
  void Append(JobState state, const std::string& message) {
    state_ = state;
    status_message_ = message;
    history_.push_back(JobEvent{WallNowMs(), state, message});
  }

  void Finish(JobState state, const std::string& message) {
    Append(state, message);
    finished_at_ms_ = history_.back().at_ms;
    CORRAL_LOG_INFO("Job", "job %llu (%s) %s: %s",
                    static_cast<unsigned long long>(id_), JobKindName(kind_),
                    JobStateName(state), message.c_str());
  }

  FinalStatus FinalLocked() const {
    FinalStatus f;
    f.state = state_;
    f.message = status_message_;
    f.success_count = result_.success_count;
    f.failure_count = result_.failure_count;
    f.failed_units = result_.failed_units;
    f.fault = result_.fault;
    return f;
  }

  const JobId id_;
  const JobKind kind_;
  const uint64_t created_at_ms_;

  mutable std::mutex mutex_;
  mutable std::condition_variable terminal_cv_;
  JobState state_{JobState::kQueued};
  std::string status_message_{"queued"};
  JobResult result_;
  uint64_t finished_at_ms_{0U};
  std::vector<JobEvent> history_;
};

}  // namespace corral

#endif  // CORRAL_JOB_HPP_
