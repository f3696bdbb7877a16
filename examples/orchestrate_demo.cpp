// Copyright (c) 2024 liudegui. MIT License.
//
// orchestrate_demo.cpp -- in-memory orchestration walkthrough.
//
// Demonstrates:
//   1. Configure with one failing node (partial failure is a Job failure)
//   2. Lock conflict against a foreign holder
//   3. Forced destroy over a foreign lock
//   4. Ticket polling and job history

#include "corral/distributed_lock.hpp"
#include "corral/job_registry.hpp"
#include "corral/log.hpp"
#include "corral/orchestrator.hpp"
#include "corral/record_store.hpp"
#include "corral/resource.hpp"
#include "corral/unit_executor.hpp"

#include <cstdio>
#include <set>
#include <string>
#include <utility>

namespace {

/// Succeeds on every unit except the ones listed as broken.
class SimulatedExecutor final : public corral::UnitExecutor {
 public:
  explicit SimulatedExecutor(std::set<std::string> broken)
      : broken_(std::move(broken)) {}

  corral::expected<void, corral::RemoteCommandError> Run(
      corral::UnitOperation op, const std::string& unit_id) override {
    using R = corral::expected<void, corral::RemoteCommandError>;
    if (broken_.count(unit_id) != 0U) {
      return R::error(corral::RemoteCommandError{
          unit_id, 1, std::string(corral::UnitOperationName(op)) +
                          ": chef-client exited 1"});
    }
    return R::success();
  }

  void Repair() { broken_.clear(); }

 private:
  std::set<std::string> broken_;
};

void PrintFinal(const char* title, const corral::FinalStatus& fs) {
  std::printf("%-28s %-8s %s (ok=%u failed=%u)\n", title,
              corral::JobStateName(fs.state), fs.message.c_str(),
              fs.success_count, fs.failure_count);
  for (const auto& u : fs.failed_units) {
    std::printf("    failed unit: %s\n", u.c_str());
  }
  if (fs.fault.has_value() && !fs.fault.value().holder_id.empty()) {
    std::printf("    held by: %s\n", fs.fault.value().holder_id.c_str());
  }
}

}  // namespace

int main() {
  corral::log::Init();
  corral::log::SetLevel(corral::log::Level::kWarn);

  corral::MemoryRecordStore store;
  corral::DistributedLock lock(store);
  corral::MemoryResourceRepository repo;
  SimulatedExecutor executor({"db-2"});
  corral::JobRegistry jobs;

  corral::Resource env;
  env.id = "production";
  env.attributes["app.version"] = "1.4.0";
  env.members = {"web-1", "web-2", "db-1", "db-2"};
  repo.Put(env);

  corral::OrchestratorContext ctx{lock, repo, executor, jobs};
  corral::OrchestratorSettings settings;
  settings.identity = "demo@localhost";
  settings.max_unit_concurrency = 2U;
  corral::Orchestrator orch(ctx, settings);
  orch.Start();

  // ======================== Demo 1 ========================
  corral::OrchestrationRequest configure;
  configure.target_resource_id = "production";
  configure.attributes["app.version"] = "1.5.0";
  auto t1 = orch.SubmitConfigure(configure);
  auto r1 = t1.Await();
  if (r1.has_value()) {
    PrintFinal("configure production:", r1.value());
  }
  auto after = orch.FindEnvironment("production");
  if (after.has_value()) {
    std::printf("    app.version now %s\n",
                after.value().attributes["app.version"].c_str());
  }

  // ======================== Demo 2 ========================
  (void)lock.Acquire("production", "operator@bastion");
  corral::OrchestrationRequest plain;
  plain.target_resource_id = "production";
  auto r2 = orch.SubmitDestroy(plain).Await();
  if (r2.has_value()) {
    PrintFinal("destroy (no force):", r2.value());
  }

  // ======================== Demo 3 ========================
  executor.Repair();
  corral::OrchestrationRequest forced = plain;
  forced.force = true;
  auto t3 = orch.SubmitDestroy(forced);
  auto r3 = t3.Await();
  if (r3.has_value()) {
    PrintFinal("destroy (force):", r3.value());
  }
  std::printf("    production exists: %s, locks held: %zu\n",
              repo.Contains("production") ? "yes" : "no",
              orch.ListLocks().value_or({}).size());

  // ======================== Demo 4 ========================
  auto snap = t3.Poll();
  if (snap.has_value()) {
    std::printf("job %llu history:\n",
                static_cast<unsigned long long>(snap.value().id));
    for (const auto& ev : snap.value().history) {
      std::printf("    [%-7s] %s\n", corral::JobStateName(ev.state),
                  ev.message.c_str());
    }
  }

  orch.Shutdown();
  corral::log::Shutdown();
  return 0;
}
