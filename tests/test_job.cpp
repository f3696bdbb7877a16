/**
 * @file test_job.cpp
 * @brief Tests for job.hpp
 */

#include "corral/job.hpp"

#include <catch2/catch_test_macros.hpp>

#include <chrono>
#include <string>
#include <thread>

// ============================================================================
// Names
// ============================================================================

TEST_CASE("Job state and kind names", "[job]") {
  REQUIRE(std::string(corral::JobStateName(corral::JobState::kQueued)) ==
          "queued");
  REQUIRE(std::string(corral::JobKindName(
              corral::JobKind::kEnvironmentConfigure)) ==
          "environment_configure");
  REQUIRE(!corral::IsTerminal(corral::JobState::kRunning));
  REQUIRE(corral::IsTerminal(corral::JobState::kSuccess));
  REQUIRE(corral::IsTerminal(corral::JobState::kFailure));
}

// ============================================================================
// Transitions
// ============================================================================

TEST_CASE("Job starts queued", "[job]") {
  corral::Job job(7U, corral::JobKind::kEnvironmentDestroy);
  REQUIRE(job.Id() == 7U);
  REQUIRE(job.Kind() == corral::JobKind::kEnvironmentDestroy);
  REQUIRE(job.State() == corral::JobState::kQueued);
  REQUIRE(job.CreatedAtMs() > 0U);
  auto snap = job.Snapshot();
  REQUIRE(snap.history.size() == 1U);
  REQUIRE(snap.finished_at_ms == 0U);
}

TEST_CASE("Job success path records history", "[job]") {
  corral::Job job(1U, corral::JobKind::kEnvironmentConfigure);
  REQUIRE(job.MarkRunning("finding resource env"));
  REQUIRE(!job.MarkRunning("again"));
  REQUIRE(job.SetStatus("searching for members"));

  corral::JobResult result;
  result.success_count = 3U;
  REQUIRE(job.Succeed("finished configure on 3 nodes", result));
  REQUIRE(job.State() == corral::JobState::kSuccess);

  auto snap = job.Snapshot();
  REQUIRE(snap.status_message == "finished configure on 3 nodes");
  REQUIRE(snap.result.success_count == 3U);
  REQUIRE(!snap.result.fault.has_value());
  REQUIRE(snap.finished_at_ms >= snap.created_at_ms);
  REQUIRE(snap.history.size() == 4U);
  REQUIRE(snap.history[1].state == corral::JobState::kRunning);
  REQUIRE(snap.history[3].state == corral::JobState::kSuccess);
}

TEST_CASE("Job terminal transitions are one-shot", "[job]") {
  corral::Job job(2U, corral::JobKind::kEnvironmentConfigure);
  REQUIRE(job.MarkRunning("running"));
  REQUIRE(job.Fail(corral::Fault(corral::FaultKind::kRemoteCommand,
                                 "configure failed on 1 nodes")));
  REQUIRE(!job.Succeed("late success"));
  REQUIRE(!job.Fail(corral::Fault(corral::FaultKind::kInternal, "late")));
  REQUIRE(!job.SetStatus("late status"));

  auto snap = job.Snapshot();
  REQUIRE(snap.state == corral::JobState::kFailure);
  REQUIRE(snap.status_message == "configure failed on 1 nodes");
  REQUIRE(snap.result.fault.has_value());
  REQUIRE(snap.result.fault.value().kind == corral::FaultKind::kRemoteCommand);
}

TEST_CASE("Job can fail straight from queued", "[job]") {
  corral::Job job(3U, corral::JobKind::kEnvironmentBootstrap);
  REQUIRE(job.Fail(corral::Fault(corral::FaultKind::kNotFound, "missing")));
  REQUIRE(job.State() == corral::JobState::kFailure);
}

TEST_CASE("Job success requires running", "[job]") {
  corral::Job job(4U, corral::JobKind::kEnvironmentConfigure);
  REQUIRE(!job.Succeed("too early"));
  REQUIRE(job.State() == corral::JobState::kQueued);
}

// ============================================================================
// Waiting
// ============================================================================

TEST_CASE("Job WaitTerminal wakes on completion", "[job]") {
  corral::Job job(5U, corral::JobKind::kEnvironmentConfigure);
  std::thread worker([&job]() {
    (void)job.MarkRunning("running");
    std::this_thread::sleep_for(std::chrono::milliseconds(20));
    corral::JobResult r;
    r.failure_count = 1U;
    r.failed_units.push_back("db-2");
    (void)job.Fail(corral::Fault(corral::FaultKind::kRemoteCommand, "x"), r);
  });
  corral::FinalStatus fs = job.WaitTerminal();
  worker.join();
  REQUIRE(fs.state == corral::JobState::kFailure);
  REQUIRE(fs.failure_count == 1U);
  REQUIRE(fs.failed_units.size() == 1U);
  REQUIRE(fs.failed_units[0] == "db-2");
  REQUIRE(fs.fault.has_value());
}

TEST_CASE("Job WaitTerminalFor times out", "[job]") {
  corral::Job job(6U, corral::JobKind::kEnvironmentConfigure);
  REQUIRE(!job.WaitTerminalFor(10U).has_value());
  (void)job.MarkRunning("running");
  (void)job.Succeed("done");
  auto fs = job.WaitTerminalFor(10U);
  REQUIRE(fs.has_value());
  REQUIRE(fs.value().state == corral::JobState::kSuccess);
}
