#include "boxrun/pipeline/outcome.hpp"

#include <type_traits>

namespace boxrun::pipeline {

std::string_view error_kind_name(const ErrorKind kind) {
  switch (kind) {
  case ErrorKind::FileNotFound:
    return "FileNotFound";
  case ErrorKind::SandboxUnavailable:
    return "SandboxUnavailable";
  case ErrorKind::EnvironmentSetupFailed:
    return "EnvironmentSetupFailed";
  case ErrorKind::ScriptExecutionFailed:
    return "ScriptExecutionFailed";
  case ErrorKind::InternalError:
    return "InternalError";
  }
  return "InternalError";
}

std::optional<ErrorKind> error_kind_of(const ExecutionOutcome &result) {
  return std::visit(
      [](auto &&value) -> std::optional<ErrorKind> {
        using T = std::decay_t<decltype(value)>;
        if constexpr (std::is_same_v<T, outcome::Success>) {
          return std::nullopt;
        } else if constexpr (std::is_same_v<T, outcome::FileNotFound>) {
          return ErrorKind::FileNotFound;
        } else if constexpr (std::is_same_v<T, outcome::EnvironmentSetupFailed>) {
          return ErrorKind::EnvironmentSetupFailed;
        } else if constexpr (std::is_same_v<T, outcome::ScriptExecutionFailed>) {
          return ErrorKind::ScriptExecutionFailed;
        } else if constexpr (std::is_same_v<T, outcome::SandboxUnavailable>) {
          return ErrorKind::SandboxUnavailable;
        } else {
          return ErrorKind::InternalError;
        }
      },
      result);
}

bool is_success(const ExecutionOutcome &result) {
  return std::holds_alternative<outcome::Success>(result);
}

const std::string &outcome_logs(const ExecutionOutcome &result) {
  static const std::string empty;
  return std::visit(
      [](auto &&value) -> const std::string & {
        using T = std::decay_t<decltype(value)>;
        if constexpr (std::is_same_v<T, outcome::FileNotFound>) {
          return empty;
        } else {
          return value.logs;
        }
      },
      result);
}

std::string describe(const ExecutionOutcome &result) {
  return std::visit(
      [](auto &&value) -> std::string {
        using T = std::decay_t<decltype(value)>;
        if constexpr (std::is_same_v<T, outcome::Success>) {
          return "script completed, " + std::to_string(value.captured.size()) +
                 " file(s) captured";
        } else if constexpr (std::is_same_v<T, outcome::FileNotFound>) {
          return "file not found: " + value.path;
        } else if constexpr (std::is_same_v<T, outcome::EnvironmentSetupFailed>) {
          return "dependency installation failed with exit code " +
                 std::to_string(value.exit_code);
        } else if constexpr (std::is_same_v<T, outcome::ScriptExecutionFailed>) {
          return "script exited with code " + std::to_string(value.exit_code);
        } else if constexpr (std::is_same_v<T, outcome::SandboxUnavailable>) {
          return "container runtime unavailable: " + value.cause;
        } else {
          return "internal error: " + value.cause;
        }
      },
      result);
}

ExecutionOutcome outcome_from_error(RunError error) {
  if (error.kind == ErrorKind::FileNotFound) {
    return outcome::FileNotFound{.path = std::move(error.message)};
  }
  if (error.kind == ErrorKind::SandboxUnavailable) {
    return outcome::SandboxUnavailable{.cause = std::move(error.message), .logs = {}};
  }
  // Payload failures only come out of classification, never as a RunError.
  return outcome::InternalError{.cause = std::move(error.message), .logs = {}};
}

} // namespace boxrun::pipeline
