/**
 * @file settings.hpp
 * @brief Typed process settings built from a ConfigStore.
 *
 * Recognised keys (section.key, default):
 *   orchestrator.identity              required, lock owner id
 *   orchestrator.request_workers       2, >= 1
 *   orchestrator.max_unit_concurrency  0 (unbounded)
 *   store.backend                      file | memory (file)
 *   store.lock_dir                     required when backend = file
 *   jobs.retention_ms                  300000
 *   executor.command                   argv template, "{unit}" / "{op}"
 *   executor.timeout_ms                0 (no limit)
 *   log.level                          debug|info|warn|error|fatal|off (info)
 *   log.file                           empty = stderr
 */

#ifndef CORRAL_SETTINGS_HPP_
#define CORRAL_SETTINGS_HPP_

#include "corral/config.hpp"
#include "corral/job_registry.hpp"
#include "corral/log.hpp"
#include "corral/orchestrator.hpp"
#include "corral/vocabulary.hpp"

#include <cstdint>
#include <string>
#include <utility>

namespace corral {

enum class SettingsError : uint8_t {
  kMissingIdentity = 0,
  kInvalidWorkerCount,
  kInvalidConcurrency,
  kUnknownStoreBackend,
  kMissingLockDir,
  kInvalidRetention,
  kInvalidTimeout,
  kUnknownLogLevel,
};

inline const char* SettingsErrorName(SettingsError e) noexcept {
  switch (e) {
    case SettingsError::kMissingIdentity:     return "orchestrator.identity is required";
    case SettingsError::kInvalidWorkerCount:  return "orchestrator.request_workers must be >= 1";
    case SettingsError::kInvalidConcurrency:  return "orchestrator.max_unit_concurrency must be >= 0";
    case SettingsError::kUnknownStoreBackend: return "store.backend must be 'file' or 'memory'";
    case SettingsError::kMissingLockDir:      return "store.lock_dir is required for the file backend";
    case SettingsError::kInvalidRetention:    return "jobs.retention_ms must be >= 0";
    case SettingsError::kInvalidTimeout:      return "executor.timeout_ms must be >= 0";
    case SettingsError::kUnknownLogLevel:     return "log.level is not a known level";
    default:                                  return "unknown settings error";
  }
}

enum class StoreBackend : uint8_t {
  kFile = 0,
  kMemory,
};

struct StoreSettings {
  StoreBackend backend{StoreBackend::kFile};
  std::string lock_dir;
};

struct JobSettings {
  uint32_t retention_ms{kDefaultJobRetentionMs};
};

struct ExecutorSettings {
  std::string command;
  uint32_t timeout_ms{0U};
};

struct LogSettings {
  log::Level level{log::Level::kInfo};
  std::string file;
};

struct Settings {
  OrchestratorSettings orchestrator;
  StoreSettings store;
  JobSettings jobs;
  ExecutorSettings executor;
  LogSettings log;
};

/// @brief Range and presence checks that do not depend on the source format.
inline expected<void, SettingsError> ValidateSettings(const Settings& s) {
  using R = expected<void, SettingsError>;
  if (s.orchestrator.identity.empty()) {
    return R::error(SettingsError::kMissingIdentity);
  }
  if (s.orchestrator.request_workers == 0U) {
    return R::error(SettingsError::kInvalidWorkerCount);
  }
  if (s.store.backend == StoreBackend::kFile && s.store.lock_dir.empty()) {
    return R::error(SettingsError::kMissingLockDir);
  }
  return R::success();
}

namespace detail {

/// @return false if present but negative or out of uint32_t range.
inline bool ReadUint32(const ConfigStore& cfg, const char* section,
                       const char* key, uint32_t& out) {
  if (!cfg.HasKey(section, key)) {
    return true;
  }
  auto v = cfg.FindInt(section, key);
  if (!v.has_value() || v.value() < 0 || v.value() > 0xFFFFFFFFLL) {
    return false;
  }
  out = static_cast<uint32_t>(v.value());
  return true;
}

}  // namespace detail

/**
 * @brief Build Settings from @p cfg, applying defaults for absent keys.
 * @return The first problem found; the result is always validated.
 */
inline expected<Settings, SettingsError> LoadSettings(const ConfigStore& cfg) {
  using R = expected<Settings, SettingsError>;
  Settings s;

  s.orchestrator.identity = cfg.GetString("orchestrator", "identity");
  if (!detail::ReadUint32(cfg, "orchestrator", "request_workers",
                          s.orchestrator.request_workers)) {
    return R::error(SettingsError::kInvalidWorkerCount);
  }
  if (!detail::ReadUint32(cfg, "orchestrator", "max_unit_concurrency",
                          s.orchestrator.max_unit_concurrency)) {
    return R::error(SettingsError::kInvalidConcurrency);
  }

  const std::string backend = cfg.GetString("store", "backend", "file");
  if (detail::CaseEqual(backend.c_str(), "file")) {
    s.store.backend = StoreBackend::kFile;
  } else if (detail::CaseEqual(backend.c_str(), "memory")) {
    s.store.backend = StoreBackend::kMemory;
  } else {
    return R::error(SettingsError::kUnknownStoreBackend);
  }
  s.store.lock_dir = cfg.GetString("store", "lock_dir");

  if (!detail::ReadUint32(cfg, "jobs", "retention_ms", s.jobs.retention_ms)) {
    return R::error(SettingsError::kInvalidRetention);
  }

  s.executor.command = cfg.GetString("executor", "command");
  if (!detail::ReadUint32(cfg, "executor", "timeout_ms",
                          s.executor.timeout_ms)) {
    return R::error(SettingsError::kInvalidTimeout);
  }

  const std::string level = cfg.GetString("log", "level", "info");
  if (!log::ParseLevel(level.c_str(), s.log.level)) {
    return R::error(SettingsError::kUnknownLogLevel);
  }
  s.log.file = cfg.GetString("log", "file");

  auto valid = ValidateSettings(s);
  if (!valid.has_value()) {
    return R::error(valid.get_error());
  }
  return R::success(std::move(s));
}

}  // namespace corral

#endif  // CORRAL_SETTINGS_HPP_
