/**
 * @file unit_executor.hpp
 * @brief Per-unit remote operation collaborator.
 *
 * UnitExecutor::Run() performs one operation on one unit and reports a
 * RemoteCommandError on failure. Implementations must be safe to call
 * concurrently for different units; timeout enforcement belongs here, not
 * in the orchestrator.
 *
 * CommandUnitExecutor runs a local command per unit, for example
 *   ssh {unit} sudo chef-client
 * with "{unit}" and "{op}" substituted in every argument.
 */

#ifndef CORRAL_UNIT_EXECUTOR_HPP_
#define CORRAL_UNIT_EXECUTOR_HPP_

#include "corral/log.hpp"
#include "corral/process.hpp"
#include "corral/vocabulary.hpp"

#include <cstdint>
#include <string>
#include <utility>
#include <vector>

namespace corral {

enum class UnitOperation : uint8_t {
  kConfigure = 0,
  kBootstrap,
  kDestroy,
};

inline const char* UnitOperationName(UnitOperation op) noexcept {
  switch (op) {
    case UnitOperation::kConfigure: return "configure";
    case UnitOperation::kBootstrap: return "bootstrap";
    case UnitOperation::kDestroy:   return "destroy";
    default:                        return "unknown";
  }
}

struct RemoteCommandError {
  std::string unit_id;
  int exit_code{-1};  ///< -1 when the command never produced an exit code
  std::string message;
};

class UnitExecutor {
 public:
  virtual ~UnitExecutor() = default;

  virtual expected<void, RemoteCommandError> Run(UnitOperation op,
                                                 const std::string& unit_id) = 0;
};

// ============================================================================
// CommandUnitExecutor
// ============================================================================

class CommandUnitExecutor final : public UnitExecutor {
 public:
  /**
   * @param argv_template Program and arguments; "{unit}" and "{op}" are
   *                      replaced per call.
   * @param timeout_ms    Kill the command after this long (0 = no limit).
   */
  CommandUnitExecutor(std::vector<std::string> argv_template,
                      uint32_t timeout_ms)
      : argv_template_(std::move(argv_template)), timeout_ms_(timeout_ms) {}

  /// @brief Split a command line on blanks (no quoting rules).
  static std::vector<std::string> SplitCommand(const std::string& line) {
    std::vector<std::string> out;
    std::string cur;
    for (char c : line) {
      if (c == ' ' || c == '\t') {
        if (!cur.empty()) {
          out.push_back(cur);
          cur.clear();
        }
      } else {
        cur.push_back(c);
      }
    }
    if (!cur.empty()) {
      out.push_back(cur);
    }
    return out;
  }

  expected<void, RemoteCommandError> Run(UnitOperation op,
                                         const std::string& unit_id) override {
    using R = expected<void, RemoteCommandError>;
    if (argv_template_.empty()) {
      return R::error(RemoteCommandError{unit_id, -1, "no command configured"});
    }

    std::vector<std::string> args;
    args.reserve(argv_template_.size());
    for (const auto& a : argv_template_) {
      args.push_back(Substitute(Substitute(a, "{unit}", unit_id), "{op}",
                                UnitOperationName(op)));
    }
    auto ran = RunCommand(args, timeout_ms_);
    if (!ran.has_value()) {
      return R::error(RemoteCommandError{
          unit_id, -1,
          "failed to spawn " + args[0] + " (" + SpawnErrorName(ran.get_error()) + ")"});
    }
    const CommandResult& res = ran.value();
    if (res.timed_out) {
      return R::error(RemoteCommandError{
          unit_id, -1, "timed out after " + std::to_string(timeout_ms_) + " ms"});
    }
    if (res.status.signaled) {
      return R::error(RemoteCommandError{
          unit_id, -1, "killed by signal " + std::to_string(res.status.term_signal)});
    }
    if (!res.status.Succeeded()) {
      CORRAL_LOG_DEBUG("Executor", "%s on %s output: %s", UnitOperationName(op),
                       unit_id.c_str(), res.output.c_str());
      return R::error(RemoteCommandError{
          unit_id, res.status.exit_code,
          "exited with status " + std::to_string(res.status.exit_code) + ": " +
              Tail(res.output)});
    }
    return R::success();
  }

 private:
  static std::string Substitute(const std::string& in, const char* token,
                                const std::string& value) {
    std::string out = in;
    const std::string tok(token);
    size_t pos = 0U;
    while ((pos = out.find(tok, pos)) != std::string::npos) {
      out.replace(pos, tok.size(), value);
      pos += value.size();
    }
    return out;
  }

  /// @brief Last line of command output, for error messages.
  static std::string Tail(const std::string& output) {
    size_t end = output.find_last_not_of("\r\n");
    if (end == std::string::npos) {
      return std::string();
    }
    size_t start = output.rfind('\n', end);
    start = (start == std::string::npos) ? 0U : start + 1U;
    return output.substr(start, end - start + 1U);
  }

  const std::vector<std::string> argv_template_;
  const uint32_t timeout_ms_;
};

}  // namespace corral

#endif  // CORRAL_UNIT_EXECUTOR_HPP_
