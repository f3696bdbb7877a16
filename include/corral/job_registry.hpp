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
 * @file job_registry.hpp
 * @brief JobRegistry - process-wide store of Jobs keyed by ticket id, and
 *        Ticket - the caller-held handle that resolves through it.
 *
 * Lifecycle of an entry:
 *   Submit()/Register()  -> active
 *   Terminate()          -> retained (still resolvable) for retention_ms
 *   retention elapsed    -> swept; Find() reports kNotFound
 *
 * The registry is constructed once by the application and handed to its
 * users; there is no global instance. Every map access happens under one
 * internal mutex, so concurrent Submit/Find/Remove never race.
 */

#ifndef CORRAL_JOB_REGISTRY_HPP_
#define CORRAL_JOB_REGISTRY_HPP_

#include "corral/job.hpp"
#include "corral/log.hpp"
#include "corral/platform.hpp"
#include "corral/vocabulary.hpp"

#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <utility>
#include <vector>

namespace corral {

static constexpr uint32_t kDefaultJobRetentionMs = 300000U;

class JobRegistry;

// ============================================================================
// Ticket
// ============================================================================

/**
 * @brief Reference to a Job. Owns no job data; every call resolves the id
 *        through the registry, so an expired ticket reports kNotFound.
 */
class Ticket {
 public:
  Ticket() noexcept = default;
  Ticket(JobId id, JobRegistry* registry) noexcept
      : job_id_(id), registry_(registry) {}

  JobId Id() const noexcept { return job_id_; }
  bool IsValid() const noexcept { return registry_ != nullptr; }

  /// @brief Block until the job is terminal and return its final status.
  expected<FinalStatus, JobError> Await() const;

  /// @brief As Await(), giving up with kTimeout after @p timeout_ms.
  expected<FinalStatus, JobError> Await(uint32_t timeout_ms) const;

  /// @brief Non-blocking: current state, status message and history.
  expected<JobSnapshot, JobError> Poll() const;

 private:
  JobId job_id_{0U};
  JobRegistry* registry_{nullptr};
};

// ============================================================================
// JobRegistry
// ============================================================================

class JobRegistry {
 public:
  explicit JobRegistry(uint32_t retention_ms = kDefaultJobRetentionMs) noexcept
      : retention_ms_(retention_ms) {}

  JobRegistry(const JobRegistry&) = delete;
  JobRegistry& operator=(const JobRegistry&) = delete;

  /// @brief Create a Queued job of @p kind, register it, hand back a ticket.
  std::pair<std::shared_ptr<Job>, Ticket> Submit(JobKind kind) {
    std::shared_ptr<Job> job;
    {
      std::lock_guard<std::mutex> lock(mutex_);
      SweepLocked(SteadyNowMs());
      job = std::make_shared<Job>(next_id_++, kind);
      active_.emplace(job->Id(), job);
    }
    CORRAL_LOG_DEBUG("Registry", "job %llu (%s) submitted",
                     static_cast<unsigned long long>(job->Id()),
                     JobKindName(kind));
    return std::make_pair(job, Ticket(job->Id(), this));
  }

  /// @brief Track an externally created job. Ids must be unique.
  expected<JobId, JobError> Register(std::shared_ptr<Job> job) {
    using R = expected<JobId, JobError>;
    if (!job) {
      return R::error(JobError::kInvalidJob);
    }
    std::lock_guard<std::mutex> lock(mutex_);
    const JobId id = job->Id();
    if (active_.count(id) != 0U || retained_.count(id) != 0U) {
      CORRAL_LOG_WARN("Registry", "job %llu already registered",
                      static_cast<unsigned long long>(id));
      return R::error(JobError::kDuplicateId);
    }
    if (id >= next_id_) {
      next_id_ = id + 1U;
    }
    active_.emplace(id, std::move(job));
    return R::success(id);
  }

  expected<std::shared_ptr<Job>, JobError> Find(JobId id) {
    using R = expected<std::shared_ptr<Job>, JobError>;
    std::lock_guard<std::mutex> lock(mutex_);
    SweepLocked(SteadyNowMs());
    auto it = active_.find(id);
    if (it != active_.end()) {
      return R::success(it->second);
    }
    auto rt = retained_.find(id);
    if (rt != retained_.end()) {
      return R::success(rt->second.job);
    }
    return R::error(JobError::kNotFound);
  }

  /// @brief Forget a job immediately, active or retained.
  bool Remove(JobId id) {
    std::lock_guard<std::mutex> lock(mutex_);
    return (active_.erase(id) + retained_.erase(id)) > 0U;
  }

  /**
   * @brief Detach a job from active tracking. It stays resolvable for the
   *        retention window, measured from this call.
   * @return false if the job is not active.
   */
  bool Terminate(JobId id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = active_.find(id);
    if (it == active_.end()) {
      return false;
    }
    Retained r;
    r.job = std::move(it->second);
    r.expires_at_ms = SteadyNowMs() + retention_ms_;
    active_.erase(it);
    retained_[id] = std::move(r);
    return true;
  }

  /// @brief Drop retained jobs whose window elapsed.
  uint32_t Sweep() {
    std::lock_guard<std::mutex> lock(mutex_);
    return SweepLocked(SteadyNowMs());
  }

  uint32_t ActiveCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return static_cast<uint32_t>(active_.size());
  }

  uint32_t RetainedCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return static_cast<uint32_t>(retained_.size());
  }

  std::vector<JobSnapshot> ListActive() const {
    std::vector<std::shared_ptr<Job>> jobs;
    {
      std::lock_guard<std::mutex> lock(mutex_);
      jobs.reserve(active_.size());
      for (const auto& kv : active_) {
        jobs.push_back(kv.second);
      }
    }
    std::vector<JobSnapshot> out;
    out.reserve(jobs.size());
    for (const auto& j : jobs) {
      out.push_back(j->Snapshot());
    }
    return out;
  }

  uint32_t RetentionMs() const noexcept { return retention_ms_; }

 private:
  struct Retained {
    std::shared_ptr<Job> job;
    uint64_t expires_at_ms{0U};
  };

  uint32_t SweepLocked(uint64_t now_ms) {
    uint32_t removed = 0U;
    for (auto it = retained_.begin(); it != retained_.end();) {
      if (it->second.expires_at_ms <= now_ms) {
        it = retained_.erase(it);
        ++removed;
      } else {
        ++it;
      }
    }
    return removed;
  }

  const uint32_t retention_ms_;
  mutable std::mutex mutex_;
  JobId next_id_{1U};
  std::map<JobId, std::shared_ptr<Job>> active_;
  std::map<JobId, Retained> retained_;
};

// ============================================================================
// Ticket (out-of-line, needs the complete registry)
// ============================================================================

inline expected<FinalStatus, JobError> Ticket::Await() const {
  using R = expected<FinalStatus, JobError>;
  if (registry_ == nullptr) {
    return R::error(JobError::kNotFound);
  }
  auto job = registry_->Find(job_id_);
  if (!job.has_value()) {
    return R::error(job.get_error());
  }
  return R::success(job.value()->WaitTerminal());
}

inline expected<FinalStatus, JobError> Ticket::Await(uint32_t timeout_ms) const {
  using R = expected<FinalStatus, JobError>;
  if (registry_ == nullptr) {
    return R::error(JobError::kNotFound);
  }
  auto job = registry_->Find(job_id_);
  if (!job.has_value()) {
    return R::error(job.get_error());
  }
  auto final_status = job.value()->WaitTerminalFor(timeout_ms);
  if (!final_status.has_value()) {
    return R::error(JobError::kTimeout);
  }
  return R::success(final_status.value());
}

inline expected<JobSnapshot, JobError> Ticket::Poll() const {
  using R = expected<JobSnapshot, JobError>;
  if (registry_ == nullptr) {
    return R::error(JobError::kNotFound);
  }
  auto job = registry_->Find(job_id_);
  if (!job.has_value()) {
    return R::error(job.get_error());
  }
  return R::success(job.value()->Snapshot());
}

}  // namespace corral

#endif  // CORRAL_JOB_REGISTRY_HPP_
