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
 * @file record_store.hpp
 * @brief Shared record store backing the distributed lock.
 *
 * A LockRecord marks exclusive ownership of one named resource. The store
 * holds at most one record per resource name. Create() is an atomic
 * create-if-absent: when two callers race on an absent name, exactly one
 * succeeds and the other receives kAlreadyExists. Mutual exclusion built
 * on a store that cannot honour this contract is not guaranteed.
 *
 * Implementations:
 *   - MemoryRecordStore: process-local, mutex-guarded map.
 *   - FileRecordStore:   one file per resource in a shared directory.
 *                        Records are written to a private temp file and
 *                        published with link(2), which fails with EEXIST
 *                        if the name is taken, so independent processes on
 *                        the same filesystem contend correctly.
 */

#ifndef CORRAL_RECORD_STORE_HPP_
#define CORRAL_RECORD_STORE_HPP_

#include "corral/log.hpp"
#include "corral/platform.hpp"
#include "corral/vocabulary.hpp"

#include <cerrno>
#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <cstring>

#include <atomic>
#include <map>
#include <mutex>
#include <string>
#include <vector>

#include <dirent.h>
#include <fcntl.h>
#include <sys/stat.h>
#include <sys/types.h>
#include <unistd.h>

namespace corral {

// ============================================================================
// LockRecord
// ============================================================================

struct LockRecord {
  std::string resource;         ///< Unique key
  std::string owner_id;         ///< Holder identity
  uint64_t acquired_at_ms{0U};  ///< Wall clock at acquisition
};

// ============================================================================
// RecordStoreError
// ============================================================================

enum class RecordStoreError : uint8_t {
  kAlreadyExists = 0,  ///< Create() lost: a record for the name exists
  kIoError,            ///< Underlying storage failed
  kCorruptRecord,      ///< Stored record could not be parsed
  kInvalidName,        ///< Empty name, or a line break the store cannot hold
};

inline const char* RecordStoreErrorName(RecordStoreError e) noexcept {
  switch (e) {
    case RecordStoreError::kAlreadyExists: return "already exists";
    case RecordStoreError::kIoError:       return "I/O error";
    case RecordStoreError::kCorruptRecord: return "corrupt record";
    case RecordStoreError::kInvalidName:   return "invalid name";
    default:                               return "unknown";
  }
}

// ============================================================================
// RecordStore - collaborator interface
// ============================================================================

class RecordStore {
 public:
  virtual ~RecordStore() = default;

  /// @return The record for @p resource, or an empty optional if absent.
  virtual expected<optional<LockRecord>, RecordStoreError> Find(
      const std::string& resource) = 0;

  /// @brief Atomic create-if-absent.
  virtual expected<LockRecord, RecordStoreError> Create(
      const LockRecord& record) = 0;

  /// @return true if a record was removed, false if none existed.
  virtual expected<bool, RecordStoreError> Delete(
      const std::string& resource) = 0;

  virtual expected<std::vector<LockRecord>, RecordStoreError> List() = 0;
};

// ============================================================================
// MemoryRecordStore
// ============================================================================

class MemoryRecordStore final : public RecordStore {
 public:
  MemoryRecordStore() = default;

  MemoryRecordStore(const MemoryRecordStore&) = delete;
  MemoryRecordStore& operator=(const MemoryRecordStore&) = delete;

  expected<optional<LockRecord>, RecordStoreError> Find(
      const std::string& resource) override {
    using R = expected<optional<LockRecord>, RecordStoreError>;
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = records_.find(resource);
    if (it == records_.end()) {
      return R::success(optional<LockRecord>());
    }
    return R::success(optional<LockRecord>(it->second));
  }

  expected<LockRecord, RecordStoreError> Create(
      const LockRecord& record) override {
    using R = expected<LockRecord, RecordStoreError>;
    if (record.resource.empty()) {
      return R::error(RecordStoreError::kInvalidName);
    }
    std::lock_guard<std::mutex> lock(mutex_);
    auto inserted = records_.emplace(record.resource, record);
    if (!inserted.second) {
      return R::error(RecordStoreError::kAlreadyExists);
    }
    return R::success(record);
  }

  expected<bool, RecordStoreError> Delete(const std::string& resource) override {
    std::lock_guard<std::mutex> lock(mutex_);
    return expected<bool, RecordStoreError>::success(records_.erase(resource) >
                                                     0U);
  }

  expected<std::vector<LockRecord>, RecordStoreError> List() override {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<LockRecord> out;
    out.reserve(records_.size());
    for (const auto& kv : records_) {
      out.push_back(kv.second);
    }
    return expected<std::vector<LockRecord>, RecordStoreError>::success(
        std::move(out));
  }

 private:
  std::map<std::string, LockRecord> records_;
  mutable std::mutex mutex_;
};

// ============================================================================
// FileRecordStore
// ============================================================================

namespace detail {

class DirGuard {
 public:
  explicit DirGuard(DIR* dir) : dir_(dir) {}
  ~DirGuard() {
    if (dir_) {
      closedir(dir_);
    }
  }
  DIR* get() const { return dir_; }

  DirGuard(const DirGuard&) = delete;
  DirGuard& operator=(const DirGuard&) = delete;

 private:
  DIR* dir_;
};

class FdGuard {
 public:
  explicit FdGuard(int fd) : fd_(fd) {}
  ~FdGuard() {
    if (fd_ >= 0) {
      close(fd_);  // NOLINT
    }
  }
  int get() const { return fd_; }

  /// @brief Close now and report the result (close(2) can surface write errors).
  bool Close() {
    int fd = fd_;
    fd_ = -1;
    return fd < 0 || close(fd) == 0;  // NOLINT
  }

  FdGuard(const FdGuard&) = delete;
  FdGuard& operator=(const FdGuard&) = delete;

 private:
  int fd_;
};

/// @brief Escape a resource name into a safe single path component.
/// Keeps [A-Za-z0-9_-] and non-leading '.', encodes the rest as %XX.
inline std::string EscapeRecordName(const std::string& name) {
  static constexpr char kHex[] = "0123456789ABCDEF";
  std::string out;
  out.reserve(name.size());
  for (size_t i = 0; i < name.size(); ++i) {
    const unsigned char c = static_cast<unsigned char>(name[i]);
    const bool plain = (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') ||
                       (c >= '0' && c <= '9') || c == '_' || c == '-' ||
                       (c == '.' && i > 0U);
    if (plain) {
      out.push_back(static_cast<char>(c));
    } else {
      out.push_back('%');
      out.push_back(kHex[c >> 4U]);
      out.push_back(kHex[c & 0x0FU]);
    }
  }
  return out;
}

inline bool WriteAll(int fd, const char* data, size_t len) {
  while (len > 0U) {
    ssize_t n = write(fd, data, len);
    if (n < 0) {
      if (errno == EINTR) continue;
      return false;
    }
    data += n;
    len -= static_cast<size_t>(n);
  }
  return true;
}

}  // namespace detail

/**
 * @brief Directory-backed record store shared between processes.
 *
 * Record file body (three lines): resource name, owner id, acquired_at_ms.
 *
 * Usage:
 * @code
 *   corral::FileRecordStore store("/var/lib/corral/locks");
 *   if (!store.Open().has_value()) { ... }
 *   corral::DistributedLock lock(store);
 * @endcode
 */
class FileRecordStore final : public RecordStore {
 public:
  explicit FileRecordStore(std::string dir) : dir_(std::move(dir)) {}

  FileRecordStore(const FileRecordStore&) = delete;
  FileRecordStore& operator=(const FileRecordStore&) = delete;

  /// @brief Create the store directory if missing.
  expected<void, RecordStoreError> Open() {
    if (dir_.empty()) {
      return expected<void, RecordStoreError>::error(
          RecordStoreError::kInvalidName);
    }
    if (::mkdir(dir_.c_str(), 0755) != 0 && errno != EEXIST) {
      CORRAL_LOG_ERROR("Store", "mkdir %s failed: %s", dir_.c_str(),
                       std::strerror(errno));
      return expected<void, RecordStoreError>::error(RecordStoreError::kIoError);
    }
    struct stat st;
    if (::stat(dir_.c_str(), &st) != 0 || !S_ISDIR(st.st_mode)) {
      return expected<void, RecordStoreError>::error(RecordStoreError::kIoError);
    }
    return expected<void, RecordStoreError>::success();
  }

  const std::string& Directory() const noexcept { return dir_; }

  expected<optional<LockRecord>, RecordStoreError> Find(
      const std::string& resource) override {
    using R = expected<optional<LockRecord>, RecordStoreError>;
    if (resource.empty()) {
      return R::error(RecordStoreError::kInvalidName);
    }
    return ReadRecord(PathFor(resource));
  }

  expected<LockRecord, RecordStoreError> Create(
      const LockRecord& record) override {
    using R = expected<LockRecord, RecordStoreError>;
    // One field per line on disk.
    if (record.resource.empty() ||
        record.resource.find_first_of("\r\n") != std::string::npos ||
        record.owner_id.find_first_of("\r\n") != std::string::npos) {
      return R::error(RecordStoreError::kInvalidName);
    }

    char tmp_name[64];
    (void)std::snprintf(tmp_name, sizeof(tmp_name), "/.tmp.%d.%u",
                        static_cast<int>(getpid()),
                        tmp_seq_.fetch_add(1U, std::memory_order_relaxed));
    const std::string tmp_path = dir_ + tmp_name;
    const std::string final_path = PathFor(record.resource);

    {
      detail::FdGuard fd(::open(tmp_path.c_str(),
                                O_CREAT | O_EXCL | O_WRONLY | O_CLOEXEC, 0644));
      if (fd.get() < 0) {
        CORRAL_LOG_ERROR("Store", "create %s failed: %s", tmp_path.c_str(),
                         std::strerror(errno));
        return R::error(RecordStoreError::kIoError);
      }
      char tail[32];
      (void)std::snprintf(tail, sizeof(tail), "%llu\n",
                          static_cast<unsigned long long>(record.acquired_at_ms));
      const std::string body =
          record.resource + "\n" + record.owner_id + "\n" + tail;
      if (!detail::WriteAll(fd.get(), body.data(), body.size()) ||
          ::fsync(fd.get()) != 0 || !fd.Close()) {
        (void)::unlink(tmp_path.c_str());
        return R::error(RecordStoreError::kIoError);
      }
    }

    // link(2) refuses to replace an existing name: this is the atomic step.
    const int rc = ::link(tmp_path.c_str(), final_path.c_str());
    const int link_errno = errno;
    (void)::unlink(tmp_path.c_str());
    if (rc != 0) {
      if (link_errno == EEXIST) {
        return R::error(RecordStoreError::kAlreadyExists);
      }
      CORRAL_LOG_ERROR("Store", "link %s failed: %s", final_path.c_str(),
                       std::strerror(link_errno));
      return R::error(RecordStoreError::kIoError);
    }
    return R::success(record);
  }

  expected<bool, RecordStoreError> Delete(const std::string& resource) override {
    using R = expected<bool, RecordStoreError>;
    if (resource.empty()) {
      return R::error(RecordStoreError::kInvalidName);
    }
    if (::unlink(PathFor(resource).c_str()) == 0) {
      return R::success(true);
    }
    if (errno == ENOENT) {
      return R::success(false);
    }
    CORRAL_LOG_ERROR("Store", "unlink for %s failed: %s", resource.c_str(),
                     std::strerror(errno));
    return R::error(RecordStoreError::kIoError);
  }

  expected<std::vector<LockRecord>, RecordStoreError> List() override {
    using R = expected<std::vector<LockRecord>, RecordStoreError>;
    detail::DirGuard dir(opendir(dir_.c_str()));
    if (!dir.get()) {
      return R::error(RecordStoreError::kIoError);
    }
    std::vector<LockRecord> out;
    struct dirent* entry;
    while ((entry = readdir(dir.get())) != nullptr) {
      if (entry->d_name[0] == '.') {
        continue;  // ".", ".." and in-flight temp files
      }
      auto rec = ReadRecord(dir_ + "/" + entry->d_name);
      if (rec.has_value() && rec.value().has_value()) {
        out.push_back(rec.value().value());
      } else if (!rec.has_value()) {
        CORRAL_LOG_WARN("Store", "skipping unreadable record %s",
                        entry->d_name);
      }
    }
    return R::success(std::move(out));
  }

 private:
  std::string PathFor(const std::string& resource) const {
    return dir_ + "/" + detail::EscapeRecordName(resource);
  }

  static expected<optional<LockRecord>, RecordStoreError> ReadRecord(
      const std::string& path) {
    using R = expected<optional<LockRecord>, RecordStoreError>;
    detail::FdGuard fd(::open(path.c_str(), O_RDONLY | O_CLOEXEC));
    if (fd.get() < 0) {
      if (errno == ENOENT) {
        return R::success(optional<LockRecord>());
      }
      return R::error(RecordStoreError::kIoError);
    }

    std::string body;
    char buf[512];
    for (;;) {
      ssize_t n = read(fd.get(), buf, sizeof(buf));
      if (n < 0) {
        if (errno == EINTR) continue;
        return R::error(RecordStoreError::kIoError);
      }
      if (n == 0) break;
      body.append(buf, static_cast<size_t>(n));
    }

    const size_t first = body.find('\n');
    const size_t second =
        (first == std::string::npos) ? first : body.find('\n', first + 1U);
    if (second == std::string::npos) {
      return R::error(RecordStoreError::kCorruptRecord);
    }
    LockRecord rec;
    rec.resource = body.substr(0, first);
    rec.owner_id = body.substr(first + 1U, second - first - 1U);
    const std::string ts = body.substr(second + 1U);
    char* end = nullptr;
    rec.acquired_at_ms = std::strtoull(ts.c_str(), &end, 10);
    if (end == ts.c_str() || rec.resource.empty()) {
      return R::error(RecordStoreError::kCorruptRecord);
    }
    return R::success(optional<LockRecord>(std::move(rec)));
  }

  std::string dir_;
  std::atomic<uint32_t> tmp_seq_{0U};
};

}  // namespace corral

#endif  // CORRAL_RECORD_STORE_HPP_
