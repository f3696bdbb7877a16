/**
 * @file test_config.cpp
 * @brief Tests for config.hpp
 */

#include "corral/config.hpp"

#include <catch2/catch_test_macros.hpp>

#include <cstdio>
#include <cstring>
#include <string>

#include <unistd.h>

// ============================================================================
// ConfigStore (backend independent)
// ============================================================================

TEST_CASE("ConfigStore Set and typed getters", "[config]") {
  corral::ConfigStore store;
  REQUIRE(store.Set("orchestrator", "identity", "deploy@host"));
  REQUIRE(store.Set("orchestrator", "request_workers", "4"));
  REQUIRE(store.Set("jobs", "retention_ms", "12x"));
  REQUIRE(store.Set("feature", "enabled", "Yes"));
  REQUIRE(store.Set("limits", "ratio", "0.25"));

  REQUIRE(store.GetString("orchestrator", "identity") == "deploy@host");
  REQUIRE(store.GetInt("orchestrator", "request_workers", 0) == 4);
  REQUIRE(store.GetInt("orchestrator", "missing", 7) == 7);
  REQUIRE(!store.FindInt("jobs", "retention_ms").has_value());
  REQUIRE(store.GetBool("feature", "enabled"));
  REQUIRE(store.GetDouble("limits", "ratio", 1.0) == 0.25);
  REQUIRE(store.EntryCount() == 5U);
}

TEST_CASE("ConfigStore lookups ignore case and overwrite duplicates",
          "[config]") {
  corral::ConfigStore store;
  REQUIRE(store.Set("Store", "Lock_Dir", "/a"));
  REQUIRE(store.Set("store", "lock_dir", "/b"));
  REQUIRE(store.EntryCount() == 1U);
  REQUIRE(store.HasSection("STORE"));
  REQUIRE(store.HasKey("store", "LOCK_DIR"));
  REQUIRE(store.GetString("store", "lock_dir") == "/b");
}

TEST_CASE("ConfigStore SectionEntries keeps load order", "[config]") {
  corral::ConfigStore store;
  REQUIRE(store.Set("attributes", "b", "2"));
  REQUIRE(store.Set("attributes", "a", "1"));
  REQUIRE(store.Set("other", "c", "3"));
  auto entries = store.SectionEntries("attributes");
  REQUIRE(entries.size() == 2U);
  REQUIRE(entries[0].first == "b");
  REQUIRE(entries[1].second == "1");
}

TEST_CASE("ApplyEnvironment overrides section keys", "[config]") {
  corral::ConfigStore store;
  REQUIRE(store.Set("store", "lock_dir", "/var/lib/corral/locks"));
  const char* envp[] = {
      "PATH=/usr/bin",
      "CORRAL_STORE_LOCK_DIR=/tmp/locks",
      "CORRAL_ORCHESTRATOR_REQUEST_WORKERS=4",
      "CORRAL_NOSECTION=1",
      "CORRAL__KEY=x",
      "CORRAL_LOG_=x",
      nullptr,
  };
  REQUIRE(store.ApplyEnvironment("CORRAL_", envp) == 2U);
  REQUIRE(store.GetString("store", "lock_dir") == "/tmp/locks");
  REQUIRE(store.GetInt("orchestrator", "request_workers", 0) == 4);
  REQUIRE(store.EntryCount() == 2U);
}

TEST_CASE("ApplyEnvironment with no matching variables", "[config]") {
  corral::ConfigStore store;
  const char* envp[] = {"HOME=/root", nullptr};
  REQUIRE(store.ApplyEnvironment("CORRAL_", envp) == 0U);
  REQUIRE(store.ApplyEnvironment("CORRAL_", nullptr) == 0U);
  REQUIRE(store.EntryCount() == 0U);
}

// ============================================================================
// INI Backend
// ============================================================================

#ifdef CORRAL_CONFIG_INI_ENABLED

TEST_CASE("INI LoadBuffer basic", "[config][ini]") {
  const char* ini_data =
      "[orchestrator]\n"
      "identity = deploy@build-host\n"
      "max_unit_concurrency = 8\n"
      "[executor]\n"
      "command = ssh {unit} sudo chef-client\n";

  corral::IniConfig cfg;
  auto result = cfg.LoadBuffer(ini_data, corral::ConfigFormat::kIni);
  REQUIRE(result.has_value());
  REQUIRE(cfg.GetString("orchestrator", "identity") == "deploy@build-host");
  REQUIRE(cfg.GetInt("orchestrator", "max_unit_concurrency", 0) == 8);
  REQUIRE(cfg.GetString("executor", "command") ==
          "ssh {unit} sudo chef-client");
}

TEST_CASE("INI LoadFile auto-detects format", "[config][ini]") {
  char path[] = "/tmp/corral_cfg_XXXXXX.ini";
  int fd = ::mkstemps(path, 4);
  REQUIRE(fd >= 0);
  const char* body = "[store]\nlock_dir = /var/lib/corral\n";
  REQUIRE(::write(fd, body, std::strlen(body)) ==
          static_cast<ssize_t>(std::strlen(body)));
  ::close(fd);

  corral::IniConfig cfg;
  REQUIRE(cfg.LoadFile(path).has_value());
  REQUIRE(cfg.GetString("store", "lock_dir") == "/var/lib/corral");
  ::unlink(path);
}

TEST_CASE("INI LoadFile missing file", "[config][ini]") {
  corral::IniConfig cfg;
  auto r = cfg.LoadFile("/nonexistent/corral.ini");
  REQUIRE(!r.has_value());
  REQUIRE(r.get_error() == corral::ConfigError::kFileNotFound);
}

TEST_CASE("INI LoadBuffer malformed line", "[config][ini]") {
  const char* bad = "[orchestrator\nidentity\n";
  corral::IniConfig cfg;
  auto r = cfg.LoadBuffer(bad, corral::ConfigFormat::kIni);
  REQUIRE(!r.has_value());
  REQUIRE(r.get_error() == corral::ConfigError::kParseError);
}

TEST_CASE("INI unsupported format is rejected", "[config][ini]") {
  corral::IniConfig cfg;
  auto r = cfg.LoadBuffer("{}", corral::ConfigFormat::kJson);
  REQUIRE(!r.has_value());
  REQUIRE(r.get_error() == corral::ConfigError::kFormatNotSupported);
}

#endif  // CORRAL_CONFIG_INI_ENABLED

// ============================================================================
// JSON Backend
// ============================================================================

#ifdef CORRAL_CONFIG_JSON_ENABLED

TEST_CASE("JSON LoadBuffer flattens sections", "[config][json]") {
  const char* json_data =
      R"({"orchestrator": {"identity": "ci", "request_workers": 3},)"
      R"( "environment": {"members": ["web-1", "web-2"]},)"
      R"( "verbose": true})";
  corral::JsonConfig cfg;
  auto r = cfg.LoadBuffer(json_data, corral::ConfigFormat::kJson);
  REQUIRE(r.has_value());
  REQUIRE(cfg.GetString("orchestrator", "identity") == "ci");
  REQUIRE(cfg.GetInt("orchestrator", "request_workers", 0) == 3);
  REQUIRE(cfg.GetString("environment", "members") == "web-1,web-2");
  REQUIRE(cfg.GetBool("", "verbose"));
}

TEST_CASE("JSON nested mappings keep a dotted key", "[config][json]") {
  corral::JsonConfig cfg;
  auto r = cfg.LoadBuffer(
      R"({"executor": {"ssh": {"port": 2222, "user": "deploy"}, "timeout_ms": 0}})",
      corral::ConfigFormat::kJson);
  REQUIRE(r.has_value());
  REQUIRE(cfg.GetInt("executor", "ssh.port", 0) == 2222);
  REQUIRE(cfg.GetString("executor", "ssh.user") == "deploy");
  REQUIRE(cfg.FindInt("executor", "timeout_ms").value_or(-1) == 0);
}

TEST_CASE("JSON LoadBuffer rejects non-object", "[config][json]") {
  corral::JsonConfig cfg;
  auto r = cfg.LoadBuffer("[1,2]", corral::ConfigFormat::kJson);
  REQUIRE(!r.has_value());
  REQUIRE(r.get_error() == corral::ConfigError::kParseError);
}

#endif  // CORRAL_CONFIG_JSON_ENABLED

// ============================================================================
// YAML Backend
// ============================================================================

#ifdef CORRAL_CONFIG_YAML_ENABLED

TEST_CASE("YAML LoadBuffer flattens sections", "[config][yaml]") {
  const char* yaml_data =
      "orchestrator:\n"
      "  identity: ci\n"
      "  max_unit_concurrency: 2\n"
      "environment:\n"
      "  members: [db-1, db-2]\n"
      "  ssh:\n"
      "    port: 22\n"
      "dry_run: false\n";
  corral::YamlConfig cfg;
  auto r = cfg.LoadBuffer(yaml_data, corral::ConfigFormat::kYaml);
  REQUIRE(r.has_value());
  REQUIRE(cfg.GetString("orchestrator", "identity") == "ci");
  REQUIRE(cfg.GetInt("orchestrator", "max_unit_concurrency", 0) == 2);
  REQUIRE(cfg.GetString("environment", "members") == "db-1,db-2");
  REQUIRE(cfg.GetInt("environment", "ssh.port", 0) == 22);
  REQUIRE(cfg.FindBool("", "dry_run").value_or(true) == false);
}

TEST_CASE("YAML LoadBuffer rejects a top-level sequence", "[config][yaml]") {
  corral::YamlConfig cfg;
  auto r = cfg.LoadBuffer("- a\n- b\n", corral::ConfigFormat::kYaml);
  REQUIRE(!r.has_value());
  REQUIRE(r.get_error() == corral::ConfigError::kParseError);
}

#endif  // CORRAL_CONFIG_YAML_ENABLED
