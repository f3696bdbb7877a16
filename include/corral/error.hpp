/**
 * @file error.hpp
 * @brief Orchestration fault taxonomy.
 *
 * A Fault is the value every orchestration failure is reduced to before it
 * reaches a Job. Lock conflicts carry the current holder so a caller can
 * decide whether to retry with force.
 */

#ifndef CORRAL_ERROR_HPP_
#define CORRAL_ERROR_HPP_

#include "corral/vocabulary.hpp"

#include <cstdint>
#include <string>
#include <utility>

namespace corral {

enum class FaultKind : uint8_t {
  kNotFound = 0,    ///< Target resource absent
  kLockConflict,    ///< Lock held by another owner
  kRemoteCommand,   ///< One or more unit operations failed
  kStoreFailure,    ///< Record store or repository I/O failed
  kInvalidRequest,  ///< Request rejected before any work
  kInternal,        ///< Anything else, including collaborator exceptions
};

inline const char* FaultKindName(FaultKind kind) noexcept {
  switch (kind) {
    case FaultKind::kNotFound:       return "NotFound";
    case FaultKind::kLockConflict:   return "LockConflict";
    case FaultKind::kRemoteCommand:  return "RemoteCommandError";
    case FaultKind::kStoreFailure:   return "StoreFailure";
    case FaultKind::kInvalidRequest: return "InvalidRequest";
    case FaultKind::kInternal:       return "InternalError";
    default:                         return "Unknown";
  }
}

struct Fault {
  FaultKind kind{FaultKind::kInternal};
  std::string message;
  std::string holder_id;       ///< kLockConflict only
  uint64_t held_since_ms{0U};  ///< kLockConflict only, wall clock

  Fault() = default;
  Fault(FaultKind k, std::string msg) : kind(k), message(std::move(msg)) {}
};

inline Fault MakeLockConflict(const std::string& resource,
                              const std::string& holder,
                              uint64_t held_since_ms) {
  Fault f(FaultKind::kLockConflict,
          "resource '" + resource + "' is locked by '" + holder + "'");
  f.holder_id = holder;
  f.held_since_ms = held_since_ms;
  return f;
}

/// @brief Result of an orchestration step that yields no value.
using Status = expected<void, Fault>;

inline Status Ok() { return Status::success(); }

inline Status Failed(FaultKind kind, std::string message) {
  return Status::error(Fault(kind, std::move(message)));
}

}  // namespace corral

#endif  // CORRAL_ERROR_HPP_
