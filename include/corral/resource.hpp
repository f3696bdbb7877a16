/**
 * @file resource.hpp
 * @brief Resource model and the resource-repository collaborator.
 *
 * A Resource (an environment) owns a flat attribute map and a list of
 * member units (nodes). The repository is the system of record; the
 * orchestrator only reads it, persists merged attributes, and removes a
 * resource on destroy.
 */

#ifndef CORRAL_RESOURCE_HPP_
#define CORRAL_RESOURCE_HPP_

#include "corral/error.hpp"
#include "corral/log.hpp"
#include "corral/vocabulary.hpp"

#include <map>
#include <mutex>
#include <string>
#include <utility>
#include <vector>

namespace corral {

/// Attribute keys are unique; iteration order is key order.
using AttributeMap = std::map<std::string, std::string>;

struct Resource {
  std::string id;
  AttributeMap attributes;
  std::vector<std::string> members;
};

/**
 * @brief Merge @p src into @p dst, last write wins per key.
 * @return Number of keys added or changed.
 */
inline uint32_t MergeAttributes(AttributeMap& dst, const AttributeMap& src) {
  uint32_t changed = 0U;
  for (const auto& kv : src) {
    auto it = dst.find(kv.first);
    if (it == dst.end()) {
      dst.emplace(kv.first, kv.second);
      ++changed;
    } else if (it->second != kv.second) {
      it->second = kv.second;
      ++changed;
    }
  }
  return changed;
}

// ============================================================================
// ResourceRepository - collaborator interface
// ============================================================================

class ResourceRepository {
 public:
  virtual ~ResourceRepository() = default;

  /// @return The resource, or kNotFound.
  virtual expected<Resource, Fault> Find(const std::string& id) = 0;

  /// @brief Store @p resource's attributes (and membership) as given.
  virtual Status Persist(const Resource& resource) = 0;

  virtual expected<std::vector<std::string>, Fault> ListMembers(
      const Resource& resource) = 0;

  virtual expected<Resource, Fault> Create(const std::string& id) = 0;

  virtual Status Remove(const std::string& id) = 0;

  virtual std::vector<Resource> List() = 0;
};

// ============================================================================
// MemoryResourceRepository
// ============================================================================

class MemoryResourceRepository final : public ResourceRepository {
 public:
  MemoryResourceRepository() = default;

  MemoryResourceRepository(const MemoryResourceRepository&) = delete;
  MemoryResourceRepository& operator=(const MemoryResourceRepository&) = delete;

  expected<Resource, Fault> Find(const std::string& id) override {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = resources_.find(id);
    if (it == resources_.end()) {
      return expected<Resource, Fault>::error(NotFound(id));
    }
    return expected<Resource, Fault>::success(it->second);
  }

  Status Persist(const Resource& resource) override {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = resources_.find(resource.id);
    if (it == resources_.end()) {
      return Status::error(NotFound(resource.id));
    }
    it->second = resource;
    return Ok();
  }

  expected<std::vector<std::string>, Fault> ListMembers(
      const Resource& resource) override {
    using R = expected<std::vector<std::string>, Fault>;
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = resources_.find(resource.id);
    if (it == resources_.end()) {
      return R::error(NotFound(resource.id));
    }
    return R::success(it->second.members);
  }

  expected<Resource, Fault> Create(const std::string& id) override {
    using R = expected<Resource, Fault>;
    if (id.empty()) {
      return R::error(
          Fault(FaultKind::kInvalidRequest, "resource id must not be empty"));
    }
    std::lock_guard<std::mutex> lock(mutex_);
    Resource res;
    res.id = id;
    auto inserted = resources_.emplace(id, res);
    if (!inserted.second) {
      return R::error(Fault(FaultKind::kInvalidRequest,
                            "resource '" + id + "' already exists"));
    }
    CORRAL_LOG_INFO("Repo", "created resource %s", id.c_str());
    return R::success(res);
  }

  Status Remove(const std::string& id) override {
    std::lock_guard<std::mutex> lock(mutex_);
    if (resources_.erase(id) == 0U) {
      return Status::error(NotFound(id));
    }
    CORRAL_LOG_INFO("Repo", "removed resource %s", id.c_str());
    return Ok();
  }

  std::vector<Resource> List() override {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<Resource> out;
    out.reserve(resources_.size());
    for (const auto& kv : resources_) {
      out.push_back(kv.second);
    }
    return out;
  }

  /// @brief Insert or replace a resource wholesale (seeding, tests).
  void Put(const Resource& resource) {
    std::lock_guard<std::mutex> lock(mutex_);
    resources_[resource.id] = resource;
  }

  bool Contains(const std::string& id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return resources_.count(id) != 0U;
  }

 private:
  static Fault NotFound(const std::string& id) {
    return Fault(FaultKind::kNotFound, "resource '" + id + "' not found");
  }

  std::map<std::string, Resource> resources_;
  mutable std::mutex mutex_;
};

}  // namespace corral

#endif  // CORRAL_RESOURCE_HPP_
