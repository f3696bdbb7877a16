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
 * @file orchestrator.hpp
 * @brief Lock, mutate, fan out, aggregate, release.
 *
 * Request flow:
 *
 *   Submit*(req) --> Job (Queued) + Ticket --> request queue
 *                                                 |
 *                              request worker N --+
 *                                                 v
 *   Find --> claim in process --> RunExclusive{ re-read --> merge+persist
 *        --> ListMembers --> FanOut --> join }
 *        --> Succeed / Fail --> JobRegistry::Terminate
 *
 * Every request worker acquires under the same identity, and the store lock
 * lets that identity back in. Jobs of one orchestrator on the same resource
 * are therefore also kept apart in process: the second one fails with
 * kLockConflict, as it would against another process. force does not
 * override a job running here.
 *
 * Collaborators arrive through OrchestratorContext and must outlive the
 * Orchestrator. Faults never escape as exceptions: everything is reduced to
 * a Fault and recorded on the Job. A collaborator that throws
 * std::exception is recorded as kInternal.
 *
 * Usage:
 * @code
 *   corral::Orchestrator orch(ctx, settings);
 *   orch.Start();
 *   corral::Ticket t = orch.SubmitConfigure(req);
 *   auto final_status = t.Await();
 *   orch.Shutdown();
 * @endcode
 */

#ifndef CORRAL_ORCHESTRATOR_HPP_
#define CORRAL_ORCHESTRATOR_HPP_

#include "corral/distributed_lock.hpp"
#include "corral/error.hpp"
#include "corral/fan_out.hpp"
#include "corral/job.hpp"
#include "corral/job_registry.hpp"
#include "corral/log.hpp"
#include "corral/resource.hpp"
#include "corral/unit_executor.hpp"
#include "corral/vocabulary.hpp"

#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <exception>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <utility>
#include <vector>

namespace corral {

// ============================================================================
// Inputs
// ============================================================================

struct OrchestratorSettings {
  std::string identity{"corral"};    ///< Lock owner id written to records
  uint32_t request_workers{2U};      ///< Threads executing Jobs
  uint32_t max_unit_concurrency{0U}; ///< Fan-out bound, 0 = one per unit
};

/// @brief Immutable once submitted.
struct OrchestrationRequest {
  std::string target_resource_id;
  AttributeMap attributes;
  bool force{false};
};

struct OrchestratorContext {
  DistributedLock& lock;
  ResourceRepository& resources;
  UnitExecutor& executor;
  JobRegistry& jobs;
};

inline UnitOperation OperationFor(JobKind kind) noexcept {
  switch (kind) {
    case JobKind::kEnvironmentDestroy:   return UnitOperation::kDestroy;
    case JobKind::kEnvironmentBootstrap: return UnitOperation::kBootstrap;
    default:                             return UnitOperation::kConfigure;
  }
}

// ============================================================================
// Orchestrator
// ============================================================================

class Orchestrator {
 public:
  Orchestrator(const OrchestratorContext& ctx, OrchestratorSettings settings)
      : ctx_(ctx), settings_(std::move(settings)) {
    if (settings_.identity.empty()) {
      settings_.identity = "corral";
    }
    if (settings_.request_workers == 0U) {
      settings_.request_workers = 1U;
    }
  }

  ~Orchestrator() { Shutdown(); }

  Orchestrator(const Orchestrator&) = delete;
  Orchestrator& operator=(const Orchestrator&) = delete;

  // ======================== Lifecycle ========================

  void Start() {
    std::lock_guard<std::mutex> lk(mutex_);
    if (running_) {
      return;
    }
    running_ = true;
    stopping_ = false;
    workers_.reserve(settings_.request_workers);
    for (uint32_t i = 0U; i < settings_.request_workers; ++i) {
      workers_.emplace_back(&Orchestrator::WorkerLoop, this);
    }
    CORRAL_LOG_INFO("Orchestrator", "started as %s with %u request workers",
                    settings_.identity.c_str(), settings_.request_workers);
  }

  /// @brief Stop accepting requests, run everything already queued, join.
  void Shutdown() {
    std::vector<std::thread> joining;
    {
      std::lock_guard<std::mutex> lk(mutex_);
      if (!running_) {
        return;
      }
      stopping_ = true;
      joining.swap(workers_);
    }
    cv_.notify_all();
    for (auto& t : joining) {
      if (t.joinable()) {
        t.join();
      }
    }
    {
      std::lock_guard<std::mutex> lk(mutex_);
      running_ = false;
    }
    CORRAL_LOG_INFO("Orchestrator", "stopped");
  }

  bool IsRunning() const {
    std::lock_guard<std::mutex> lk(mutex_);
    return running_ && !stopping_;
  }

  uint32_t PendingCount() const {
    std::lock_guard<std::mutex> lk(mutex_);
    return static_cast<uint32_t>(queue_.size());
  }

  const OrchestratorSettings& Settings() const noexcept { return settings_; }

  // ======================== Caller API ========================

  /**
   * @brief Queue a request and return immediately.
   *
   * The returned Ticket always resolves. A stopped orchestrator fails the
   * Job at once with kInternal.
   */
  Ticket Submit(JobKind kind, OrchestrationRequest req) {
    auto submitted = ctx_.jobs.Submit(kind);
    std::shared_ptr<Job> job = std::move(submitted.first);
    {
      std::lock_guard<std::mutex> lk(mutex_);
      if (running_ && !stopping_) {
        queue_.push_back(Pending{job, std::move(req)});
        cv_.notify_one();
        return submitted.second;
      }
    }
    CORRAL_LOG_WARN("Orchestrator", "job %llu rejected: not running",
                    static_cast<unsigned long long>(job->Id()));
    (void)job->Fail(Fault(FaultKind::kInternal, "orchestrator not running"));
    (void)ctx_.jobs.Terminate(job->Id());
    return submitted.second;
  }

  Ticket SubmitConfigure(OrchestrationRequest req) {
    return Submit(JobKind::kEnvironmentConfigure, std::move(req));
  }

  Ticket SubmitDestroy(OrchestrationRequest req) {
    return Submit(JobKind::kEnvironmentDestroy, std::move(req));
  }

  Ticket SubmitBootstrap(OrchestrationRequest req) {
    return Submit(JobKind::kEnvironmentBootstrap, std::move(req));
  }

  // ======================== Synchronous entry points ========================

  /// @brief Run @p job to a terminal state on the calling thread.
  void Execute(Job& job, const OrchestrationRequest& req) {
    CORRAL_SCOPE_EXIT((void)ctx_.jobs.Terminate(job.Id()));
    try {
      Status st = Run(job, req);
      if (!st.has_value()) {
        (void)job.Fail(st.get_error());
      }
    } catch (const std::exception& ex) {
      CORRAL_LOG_ERROR("Orchestrator", "job %llu: unexpected error: %s",
                       static_cast<unsigned long long>(job.Id()), ex.what());
      (void)job.Fail(Fault(FaultKind::kInternal, ex.what()));
    }
  }

  void Configure(Job& job, const OrchestrationRequest& req) {
    Execute(job, req);
  }

  void Destroy(Job& job, const OrchestrationRequest& req) {
    Execute(job, req);
  }

  void Bootstrap(Job& job, const OrchestrationRequest& req) {
    Execute(job, req);
  }

  // ======================== Environment management ========================

  expected<Resource, Fault> FindEnvironment(const std::string& id) {
    return ctx_.resources.Find(id);
  }

  expected<Resource, Fault> CreateEnvironment(const std::string& id) {
    return ctx_.resources.Create(id);
  }

  std::vector<Resource> ListEnvironments() { return ctx_.resources.List(); }

  /// @brief Administrative lock held under this orchestrator's identity.
  bool LockEnvironment(const std::string& id) {
    return ctx_.lock.Acquire(id, settings_.identity);
  }

  bool UnlockEnvironment(const std::string& id) {
    return ctx_.lock.Release(id, settings_.identity);
  }

  expected<std::vector<LockRecord>, Fault> ListLocks() {
    return ctx_.lock.ListHeld();
  }

 private:
  struct Pending {
    std::shared_ptr<Job> job;
    OrchestrationRequest req;
  };

  void WorkerLoop() {
    for (;;) {
      Pending next;
      {
        std::unique_lock<std::mutex> lk(mutex_);
        cv_.wait(lk, [this] { return stopping_ || !queue_.empty(); });
        if (queue_.empty()) {
          return;
        }
        next = std::move(queue_.front());
        queue_.pop_front();
      }
      Execute(*next.job, next.req);
    }
  }

  /**
   * @brief Everything up to the terminal transition.
   * @return A fault for the caller to record; unit-level outcomes are
   *         reported on the job directly.
   */
  Status Run(Job& job, const OrchestrationRequest& req) {
    const JobKind kind = job.Kind();
    const UnitOperation op = OperationFor(kind);
    const char* op_name = UnitOperationName(op);
    const std::string& id = req.target_resource_id;

    if (id.empty()) {
      return Failed(FaultKind::kInvalidRequest,
                    "target resource id must not be empty");
    }

    auto found = ctx_.resources.Find(id);
    if (!found.has_value()) {
      return Status::error(found.get_error());
    }

    (void)job.MarkRunning("finding resource " + id);

    Status claimed = ClaimResource(id, job.Id());
    if (!claimed.has_value()) {
      return claimed;
    }
    CORRAL_SCOPE_EXIT(ReleaseResource(id));

    std::vector<NodeResult> results;
    bool ran = false;
    Status locked = ctx_.lock.RunExclusive(
        id, settings_.identity, req.force, [&]() -> Status {
          // Another holder may have written since the first read.
          auto current = ctx_.resources.Find(id);
          if (!current.has_value()) {
            return Status::error(current.get_error());
          }
          Resource resource = std::move(current).value();

          if (kind != JobKind::kEnvironmentDestroy) {
            (void)job.SetStatus("saving updated attributes");
            (void)MergeAttributes(resource.attributes, req.attributes);
            Status persisted = ctx_.resources.Persist(resource);
            if (!persisted.has_value()) {
              return persisted;
            }
          }

          (void)job.SetStatus("searching for members of " + id);
          auto members = ctx_.resources.ListMembers(resource);
          if (!members.has_value()) {
            return Status::error(members.get_error());
          }

          (void)job.SetStatus(std::string("running ") + op_name + " on " +
                              std::to_string(members.value().size()) +
                              " nodes");
          results = FanOut(members.value(), settings_.max_unit_concurrency,
                           [this, op](const std::string& unit) {
                             return ctx_.executor.Run(op, unit);
                           });
          ran = true;

          if (kind == JobKind::kEnvironmentDestroy &&
              CountOutcomes(results).failures == 0U) {
            return ctx_.resources.Remove(id);
          }
          return Ok();
        });

    if (!ran) {
      return locked;
    }

    JobResult result;
    for (const auto& r : results) {
      if (r.ok) {
        ++result.success_count;
      } else {
        ++result.failure_count;
        result.failed_units.push_back(r.unit_id);
        CORRAL_LOG_ERROR("Orchestrator", "%s failed on %s (exit %d): %s",
                         op_name, r.unit_id.c_str(), r.error.exit_code,
                         r.error.message.c_str());
      }
    }

    if (!locked.has_value()) {
      (void)job.Fail(locked.get_error(), std::move(result));
      return Ok();
    }
    if (result.failure_count > 0U) {
      const std::string msg = std::string(op_name) + " failed on " +
                              std::to_string(result.failure_count) + " nodes";
      (void)job.Fail(Fault(FaultKind::kRemoteCommand, msg), std::move(result));
      return Ok();
    }
    const std::string msg = std::string("finished ") + op_name + " on " +
                            std::to_string(result.success_count) + " nodes";
    (void)job.Succeed(msg, std::move(result));
    return Ok();
  }

  Status ClaimResource(const std::string& id, JobId job_id) {
    std::lock_guard<std::mutex> lk(mutex_);
    auto it = in_flight_.find(id);
    if (it != in_flight_.end()) {
      CORRAL_LOG_INFO("Orchestrator", "job %llu: %s is busy with job %llu",
                      static_cast<unsigned long long>(job_id), id.c_str(),
                      static_cast<unsigned long long>(it->second.job_id));
      return Status::error(
          MakeLockConflict(id, settings_.identity, it->second.since_ms));
    }
    in_flight_.emplace(id, InFlight{job_id, WallNowMs()});
    return Ok();
  }

  void ReleaseResource(const std::string& id) {
    std::lock_guard<std::mutex> lk(mutex_);
    in_flight_.erase(id);
  }

  struct InFlight {
    JobId job_id;
    uint64_t since_ms;
  };

  OrchestratorContext ctx_;
  OrchestratorSettings settings_;

  mutable std::mutex mutex_;
  std::condition_variable cv_;
  std::deque<Pending> queue_;
  std::map<std::string, InFlight> in_flight_;  ///< Resources with a job running
  std::vector<std::thread> workers_;
  bool running_{false};
  bool stopping_{false};
};

}  // namespace corral

#endif  // CORRAL_ORCHESTRATOR_HPP_
