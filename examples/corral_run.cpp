// Copyright (c) 2024 liudegui. MIT License.
//
// corral_run.cpp -- run one environment operation from an INI file.
//
//   corral_run <settings.ini> [configure|bootstrap|destroy] [force]
//
// Settings file:
//
//   [orchestrator]
//   identity = deploy@build-host
//   max_unit_concurrency = 8
//
//   [store]
//   lock_dir = /var/lib/corral/locks
//
//   [executor]
//   command = ssh {unit} sudo chef-client
//   timeout_ms = 600000
//
//   [environment]
//   id = staging
//   members = web-1,web-2,db-1
//
//   [attributes]
//   app.version = 1.5.0
//
// SIGINT/SIGTERM stop the request workers after the running job finishes.

#include "corral/config.hpp"
#include "corral/distributed_lock.hpp"
#include "corral/job_registry.hpp"
#include "corral/log.hpp"
#include "corral/orchestrator.hpp"
#include "corral/record_store.hpp"
#include "corral/resource.hpp"
#include "corral/settings.hpp"
#include "corral/shutdown.hpp"
#include "corral/unit_executor.hpp"

#include <cstdio>
#include <cstring>
#include <memory>
#include <string>
#include <thread>
#include <vector>

namespace {

std::vector<std::string> SplitList(const std::string& csv) {
  std::vector<std::string> out;
  std::string cur;
  for (char c : csv) {
    if (c == ',') {
      if (!cur.empty()) out.push_back(cur);
      cur.clear();
    } else if (c != ' ' && c != '\t') {
      cur.push_back(c);
    }
  }
  if (!cur.empty()) out.push_back(cur);
  return out;
}

bool ParseKind(const char* arg, corral::JobKind& kind) {
  if (std::strcmp(arg, "configure") == 0) {
    kind = corral::JobKind::kEnvironmentConfigure;
  } else if (std::strcmp(arg, "bootstrap") == 0) {
    kind = corral::JobKind::kEnvironmentBootstrap;
  } else if (std::strcmp(arg, "destroy") == 0) {
    kind = corral::JobKind::kEnvironmentDestroy;
  } else {
    return false;
  }
  return true;
}

}  // namespace

int main(int argc, char* argv[]) {
  if (argc < 2) {
    std::fprintf(stderr,
                 "usage: %s <settings.ini> [configure|bootstrap|destroy] "
                 "[force]\n",
                 argv[0]);
    return 2;
  }
  corral::JobKind kind = corral::JobKind::kEnvironmentConfigure;
  if (argc >= 3 && !ParseKind(argv[2], kind)) {
    std::fprintf(stderr, "unknown operation '%s'\n", argv[2]);
    return 2;
  }
  const bool force = (argc >= 4 && std::strcmp(argv[3], "force") == 0);

  // ======================== Settings ========================
  corral::IniConfig cfg;
  auto loaded = cfg.LoadFile(argv[1]);
  if (!loaded.has_value()) {
    std::fprintf(stderr, "%s: %s\n", argv[1],
                 corral::ConfigErrorName(loaded.get_error()));
    return 1;
  }
  const uint32_t overrides = cfg.ApplyEnvironment("CORRAL_");
  auto parsed = corral::LoadSettings(cfg);
  if (!parsed.has_value()) {
    std::fprintf(stderr, "%s: %s\n", argv[1],
                 corral::SettingsErrorName(parsed.get_error()));
    return 1;
  }
  const corral::Settings& settings = parsed.value();

  corral::log::SetLevel(settings.log.level);
  if (!corral::log::Init(settings.log.file.c_str())) {
    std::fprintf(stderr, "cannot open log file %s, using stderr\n",
                 settings.log.file.c_str());
  }
  if (overrides > 0U) {
    CORRAL_LOG_INFO("Main", "%u settings overridden from environment",
                    overrides);
  }

  // ======================== Collaborators ========================
  std::unique_ptr<corral::RecordStore> store;
  if (settings.store.backend == corral::StoreBackend::kFile) {
    auto file_store =
        std::make_unique<corral::FileRecordStore>(settings.store.lock_dir);
    auto opened = file_store->Open();
    if (!opened.has_value()) {
      CORRAL_LOG_ERROR("Main", "cannot open lock dir %s: %s",
                       settings.store.lock_dir.c_str(),
                       corral::RecordStoreErrorName(opened.get_error()));
      return 1;
    }
    store = std::move(file_store);
  } else {
    store = std::make_unique<corral::MemoryRecordStore>();
  }
  corral::DistributedLock lock(*store);

  corral::MemoryResourceRepository repo;
  corral::Resource env;
  env.id = cfg.GetString("environment", "id");
  env.members = SplitList(cfg.GetString("environment", "members"));
  repo.Put(env);

  corral::CommandUnitExecutor executor(
      corral::CommandUnitExecutor::SplitCommand(settings.executor.command),
      settings.executor.timeout_ms);
  corral::JobRegistry jobs(settings.jobs.retention_ms);

  corral::OrchestratorContext ctx{lock, repo, executor, jobs};
  corral::Orchestrator orch(ctx, settings.orchestrator);

  // ======================== Run ========================
  corral::ShutdownManager shutdown;
  (void)shutdown.Register("stop orchestrator", [&orch](int) { orch.Shutdown(); });
  auto installed = shutdown.InstallSignalHandlers();
  if (!installed.has_value()) {
    CORRAL_LOG_WARN("Main", "signal handlers not installed");
  }

  orch.Start();

  corral::OrchestrationRequest req;
  req.target_resource_id = env.id;
  for (const auto& kv : cfg.SectionEntries("attributes")) {
    req.attributes[kv.first] = kv.second;
  }
  req.force = force;

  corral::Ticket ticket = orch.Submit(kind, req);
  std::thread waiter([&shutdown, &ticket]() {
    (void)ticket.Await();
    shutdown.Quit(0);
  });
  shutdown.WaitForShutdown();
  waiter.join();

  auto final_status = ticket.Await();
  int rc = 1;
  if (final_status.has_value()) {
    const corral::FinalStatus& fs = final_status.value();
    std::printf("%s %s: %s (ok=%u failed=%u)\n", corral::JobKindName(kind),
                corral::JobStateName(fs.state), fs.message.c_str(),
                fs.success_count, fs.failure_count);
    for (const auto& u : fs.failed_units) {
      std::printf("  failed: %s\n", u.c_str());
    }
    rc = (fs.state == corral::JobState::kSuccess) ? 0 : 1;
  } else {
    std::fprintf(stderr, "job %llu no longer tracked\n",
                 static_cast<unsigned long long>(ticket.Id()));
  }

  corral::log::Shutdown();
  return rc;
}
