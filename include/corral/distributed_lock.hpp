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
 * @file distributed_lock.hpp
 * @brief Exclusive ownership of a named resource across processes.
 *
 * Ownership is a LockRecord in a shared RecordStore:
 *   Acquire()      -> create the record (or confirm we already own it)
 *   Release()      -> delete it, only if we own it
 *   ForceRelease() -> delete it unconditionally (explicit override only)
 *
 * Acquire never blocks and never retries. RunExclusive() is the entry point
 * for ordinary orchestration: it never invokes the body when the lock is
 * held elsewhere, and attempts Release on every exit path of a body that
 * ran, including stack unwinding. A store that fails or throws during that
 * release is logged; the body's result stands. Direct Acquire/Release is reserved for
 * administrative use such as shutdown cleanup.
 *
 * Thread-safety: stateless apart from the store reference; all
 * serialization is delegated to the store's create-if-absent contract.
 */

#ifndef CORRAL_DISTRIBUTED_LOCK_HPP_
#define CORRAL_DISTRIBUTED_LOCK_HPP_

#include "corral/error.hpp"
#include "corral/log.hpp"
#include "corral/record_store.hpp"
#include "corral/vocabulary.hpp"

#include <exception>
#include <string>
#include <type_traits>
#include <utility>
#include <vector>

namespace corral {

class DistributedLock {
 public:
  explicit DistributedLock(RecordStore& store) noexcept : store_(store) {}

  DistributedLock(const DistributedLock&) = delete;
  DistributedLock& operator=(const DistributedLock&) = delete;

  /**
   * @brief Try to take the lock for @p owner.
   * @return true if @p owner now holds it (freshly or already), false if
   *         another owner holds it or the store failed.
   */
  bool Acquire(const std::string& resource, const std::string& owner) {
    return TryAcquire(resource, owner).has_value();
  }

  /**
   * @brief Delete the record iff it exists and belongs to @p owner.
   * @return true if removed; false leaves any foreign record intact.
   */
  bool Release(const std::string& resource, const std::string& owner) {
    auto current = store_.Find(resource);
    if (!current.has_value()) {
      CORRAL_LOG_WARN("Lock", "release %s: store read failed (%s)",
                      resource.c_str(),
                      RecordStoreErrorName(current.get_error()));
      return false;
    }
    if (!current.value().has_value()) {
      return false;
    }
    if (current.value().value().owner_id != owner) {
      CORRAL_LOG_DEBUG("Lock", "release %s by %s refused: held by %s",
                       resource.c_str(), owner.c_str(),
                       current.value().value().owner_id.c_str());
      return false;
    }
    auto deleted = store_.Delete(resource);
    if (!deleted.has_value()) {
      CORRAL_LOG_WARN("Lock", "release %s: delete failed (%s)",
                      resource.c_str(),
                      RecordStoreErrorName(deleted.get_error()));
      return false;
    }
    if (deleted.value()) {
      CORRAL_LOG_DEBUG("Lock", "released %s (owner %s)", resource.c_str(),
                       owner.c_str());
    }
    return deleted.value();
  }

  /// @brief Unconditional delete. Only for an explicit caller override.
  bool ForceRelease(const std::string& resource) {
    auto deleted = store_.Delete(resource);
    if (!deleted.has_value()) {
      CORRAL_LOG_WARN("Lock", "force release %s failed (%s)", resource.c_str(),
                      RecordStoreErrorName(deleted.get_error()));
      return false;
    }
    if (deleted.value()) {
      CORRAL_LOG_WARN("Lock", "force released %s", resource.c_str());
    }
    return deleted.value();
  }

  /// @return Current holder of @p resource, empty if unlocked or unreadable.
  optional<LockRecord> Holder(const std::string& resource) {
    auto current = store_.Find(resource);
    if (!current.has_value()) {
      return optional<LockRecord>();
    }
    return current.value();
  }

  /// @brief Every record currently in the store.
  expected<std::vector<LockRecord>, Fault> ListHeld() {
    using R = expected<std::vector<LockRecord>, Fault>;
    auto all = store_.List();
    if (!all.has_value()) {
      return R::error(StoreFault("list", "*", all.get_error()));
    }
    return R::success(std::move(all).value());
  }

  /**
   * @brief Run @p fn while holding the lock on @p resource.
   *
   * @param force Clear any existing record first (explicit override).
   * @param fn    Callable returning Status (expected<void, Fault>).
   * @return kLockConflict with the holder when the lock is taken elsewhere
   *         (fn not invoked), kStoreFailure when the store failed before fn
   *         ran, otherwise fn's own result.
   */
  template <typename Fn>
  Status RunExclusive(const std::string& resource, const std::string& owner,
                      bool force, Fn&& fn) {
    static_assert(std::is_convertible<decltype(fn()), Status>::value,
                  "RunExclusive body must return corral::Status");
    if (force) {
      (void)ForceRelease(resource);
    }

    auto acquired = TryAcquire(resource, owner);
    if (!acquired.has_value()) {
      return Status::error(acquired.get_error());
    }

    CORRAL_SCOPE_EXIT(ReleaseAfterRun(resource, owner));
    return fn();
  }

 private:
  /// Runs from a scope guard: a failed release is logged, never thrown.
  void ReleaseAfterRun(const std::string& resource,
                       const std::string& owner) noexcept {
    try {
      if (!Release(resource, owner)) {
        CORRAL_LOG_WARN("Lock", "lock on %s was not released by %s",
                        resource.c_str(), owner.c_str());
      }
    } catch (const std::exception& ex) {
      CORRAL_LOG_ERROR("Lock", "release of %s by %s failed: %s",
                       resource.c_str(), owner.c_str(), ex.what());
    }
  }

  expected<LockRecord, Fault> TryAcquire(const std::string& resource,
                                         const std::string& owner) {
    using R = expected<LockRecord, Fault>;
    auto current = store_.Find(resource);
    if (!current.has_value()) {
      return R::error(StoreFault("read", resource, current.get_error()));
    }
    if (!current.value().has_value()) {
      LockRecord rec;
      rec.resource = resource;
      rec.owner_id = owner;
      rec.acquired_at_ms = WallNowMs();
      auto created = store_.Create(rec);
      if (created.has_value()) {
        CORRAL_LOG_DEBUG("Lock", "acquired %s (owner %s)", resource.c_str(),
                         owner.c_str());
        return R::success(created.value());
      }
      if (created.get_error() != RecordStoreError::kAlreadyExists) {
        return R::error(StoreFault("create", resource, created.get_error()));
      }
      // Lost the create race: judge ownership against the winner's record.
      current = store_.Find(resource);
      if (!current.has_value()) {
        return R::error(StoreFault("read", resource, current.get_error()));
      }
      if (!current.value().has_value()) {
        return R::error(Fault(FaultKind::kLockConflict,
                              "resource '" + resource +
                                  "' changed hands during acquisition"));
      }
    }

    const LockRecord& holder = current.value().value();
    if (holder.owner_id == owner) {
      return R::success(holder);
    }
    CORRAL_LOG_INFO("Lock", "%s is locked by %s", resource.c_str(),
                    holder.owner_id.c_str());
    return R::error(
        MakeLockConflict(resource, holder.owner_id, holder.acquired_at_ms));
  }

  static Fault StoreFault(const char* op, const std::string& resource,
                          RecordStoreError err) {
    CORRAL_LOG_ERROR("Lock", "store %s for %s failed: %s", op,
                     resource.c_str(), RecordStoreErrorName(err));
    return Fault(FaultKind::kStoreFailure, std::string("lock store ") + op +
                                               " failed for '" + resource +
                                               "': " + RecordStoreErrorName(err));
  }

  RecordStore& store_;
};

}  // namespace corral

#endif  // CORRAL_DISTRIBUTED_LOCK_HPP_
