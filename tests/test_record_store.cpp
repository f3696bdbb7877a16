/**
 * @file test_record_store.cpp
 * @brief Tests for record_store.hpp
 */

#include "corral/record_store.hpp"

#include <catch2/catch_test_macros.hpp>

#include <atomic>
#include <cstdio>
#include <string>
#include <thread>
#include <vector>

#include <fcntl.h>
#include <unistd.h>

namespace {

corral::LockRecord MakeRecord(const std::string& resource,
                              const std::string& owner, uint64_t at = 1000U) {
  corral::LockRecord r;
  r.resource = resource;
  r.owner_id = owner;
  r.acquired_at_ms = at;
  return r;
}

/// Fresh directory under /tmp, removed with its records on scope exit.
class TempDir {
 public:
  TempDir() {
    char tmpl[] = "/tmp/corral_store_XXXXXX";
    const char* p = ::mkdtemp(tmpl);
    path_ = (p != nullptr) ? p : "";
  }
  ~TempDir() {
    corral::FileRecordStore store(path_);
    auto all = store.List();
    if (all.has_value()) {
      for (const auto& r : all.value()) (void)store.Delete(r.resource);
    }
    (void)::rmdir(path_.c_str());
  }
  const std::string& path() const { return path_; }

 private:
  std::string path_;
};

/// Same contract checks for every store implementation.
void CheckStoreContract(corral::RecordStore& store) {
  auto missing = store.Find("env-a");
  REQUIRE(missing.has_value());
  REQUIRE(!missing.value().has_value());

  auto created = store.Create(MakeRecord("env-a", "alice", 1234U));
  REQUIRE(created.has_value());

  auto found = store.Find("env-a");
  REQUIRE(found.has_value());
  REQUIRE(found.value().has_value());
  REQUIRE(found.value().value().owner_id == "alice");
  REQUIRE(found.value().value().acquired_at_ms == 1234U);

  auto dup = store.Create(MakeRecord("env-a", "bob"));
  REQUIRE(!dup.has_value());
  REQUIRE(dup.get_error() == corral::RecordStoreError::kAlreadyExists);
  REQUIRE(store.Find("env-a").value().value().owner_id == "alice");

  REQUIRE(store.Create(MakeRecord("env-b", "bob")).has_value());
  auto all = store.List();
  REQUIRE(all.has_value());
  REQUIRE(all.value().size() == 2U);

  auto del = store.Delete("env-a");
  REQUIRE(del.has_value());
  REQUIRE(del.value());
  auto again = store.Delete("env-a");
  REQUIRE(again.has_value());
  REQUIRE(!again.value());

  auto empty = store.Create(MakeRecord("", "x"));
  REQUIRE(!empty.has_value());
  REQUIRE(empty.get_error() == corral::RecordStoreError::kInvalidName);
}

/// Many threads race to create one name; exactly one may win.
void CheckSingleWinner(corral::RecordStore& store) {
  constexpr int kThreads = 8;
  std::atomic<int> winners{0};
  std::atomic<int> losers{0};
  std::vector<std::thread> threads;
  for (int i = 0; i < kThreads; ++i) {
    threads.emplace_back([&, i]() {
      auto r = store.Create(MakeRecord("contended", "owner-" + std::to_string(i)));
      if (r.has_value()) {
        ++winners;
      } else if (r.get_error() == corral::RecordStoreError::kAlreadyExists) {
        ++losers;
      }
    });
  }
  for (auto& t : threads) t.join();
  REQUIRE(winners.load() == 1);
  REQUIRE(losers.load() == kThreads - 1);
}

}  // namespace

// ============================================================================
// MemoryRecordStore
// ============================================================================

TEST_CASE("MemoryRecordStore contract", "[record_store][memory]") {
  corral::MemoryRecordStore store;
  CheckStoreContract(store);
}

TEST_CASE("MemoryRecordStore create race has one winner",
          "[record_store][memory]") {
  corral::MemoryRecordStore store;
  CheckSingleWinner(store);
}

// ============================================================================
// FileRecordStore
// ============================================================================

TEST_CASE("FileRecordStore contract", "[record_store][file]") {
  TempDir dir;
  REQUIRE(!dir.path().empty());
  corral::FileRecordStore store(dir.path());
  REQUIRE(store.Open().has_value());
  CheckStoreContract(store);
}

TEST_CASE("FileRecordStore create race has one winner", "[record_store][file]") {
  TempDir dir;
  corral::FileRecordStore store(dir.path());
  REQUIRE(store.Open().has_value());
  CheckSingleWinner(store);
}

TEST_CASE("FileRecordStore records are visible to a second instance",
          "[record_store][file]") {
  TempDir dir;
  corral::FileRecordStore a(dir.path());
  corral::FileRecordStore b(dir.path());
  REQUIRE(a.Open().has_value());
  REQUIRE(a.Create(MakeRecord("envs/prod east", "alice")).has_value());

  auto seen = b.Find("envs/prod east");
  REQUIRE(seen.has_value());
  REQUIRE(seen.value().has_value());
  REQUIRE(seen.value().value().resource == "envs/prod east");

  auto dup = b.Create(MakeRecord("envs/prod east", "bob"));
  REQUIRE(dup.get_error() == corral::RecordStoreError::kAlreadyExists);
}

TEST_CASE("FileRecordStore reports corrupt records", "[record_store][file]") {
  TempDir dir;
  corral::FileRecordStore store(dir.path());
  REQUIRE(store.Open().has_value());

  const std::string path = dir.path() + "/broken";
  int fd = ::open(path.c_str(), O_CREAT | O_WRONLY, 0644);
  REQUIRE(fd >= 0);
  REQUIRE(::write(fd, "only-one-line", 13) == 13);
  ::close(fd);

  auto r = store.Find("broken");
  REQUIRE(!r.has_value());
  REQUIRE(r.get_error() == corral::RecordStoreError::kCorruptRecord);
  (void)::unlink(path.c_str());
}

TEST_CASE("FileRecordStore Open creates the directory", "[record_store][file]") {
  TempDir parent;
  const std::string nested = parent.path() + "/locks";
  corral::FileRecordStore store(nested);
  REQUIRE(store.Open().has_value());
  REQUIRE(store.Create(MakeRecord("env", "me")).has_value());
  REQUIRE(store.Delete("env").value());
  REQUIRE(::rmdir(nested.c_str()) == 0);

  corral::FileRecordStore unnamed("");
  REQUIRE(unnamed.Open().get_error() == corral::RecordStoreError::kInvalidName);
}

TEST_CASE("FileRecordStore rejects names with line breaks",
          "[record_store][file]") {
  TempDir dir;
  corral::FileRecordStore store(dir.path());
  REQUIRE(store.Open().has_value());

  auto bad_owner = store.Create(MakeRecord("env", "deploy\nci"));
  REQUIRE(!bad_owner.has_value());
  REQUIRE(bad_owner.get_error() == corral::RecordStoreError::kInvalidName);
  auto bad_resource = store.Create(MakeRecord("env\r\n", "deploy"));
  REQUIRE(bad_resource.get_error() == corral::RecordStoreError::kInvalidName);

  auto held = store.Find("env");
  REQUIRE(held.has_value());
  REQUIRE(!held.value().has_value());
  REQUIRE(store.List().value().empty());
}
