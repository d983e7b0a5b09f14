#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace boxrun::pipeline {

enum class ErrorKind {
  FileNotFound,
  SandboxUnavailable,
  EnvironmentSetupFailed,
  ScriptExecutionFailed,
  InternalError,
};

struct RunError {
  ErrorKind kind = ErrorKind::InternalError;
  std::string message;
};

struct CapturedFile {
  std::string name;
  std::uint64_t size = 0;
  std::string sha256;
};

namespace outcome {

struct Success {
  std::vector<CapturedFile> captured;
  std::string logs;
};

struct FileNotFound {
  std::string path;
};

struct EnvironmentSetupFailed {
  int exit_code = 0;
  std::string logs;
};

struct ScriptExecutionFailed {
  int exit_code = 0;
  std::string logs;
  // Files the script left behind before failing; reported, never collected.
  std::vector<std::string> produced_files;
};

struct SandboxUnavailable {
  std::string cause;
  std::string logs;
};

struct InternalError {
  std::string cause;
  std::string logs;
};

} // namespace outcome

using ExecutionOutcome =
    std::variant<outcome::Success, outcome::FileNotFound, outcome::EnvironmentSetupFailed,
                 outcome::ScriptExecutionFailed, outcome::SandboxUnavailable,
                 outcome::InternalError>;

[[nodiscard]] std::string_view error_kind_name(ErrorKind kind);

/// nullopt for Success.
[[nodiscard]] std::optional<ErrorKind> error_kind_of(const ExecutionOutcome &outcome);

[[nodiscard]] bool is_success(const ExecutionOutcome &outcome);

/// Raw sandbox log text carried by the outcome; empty when none was produced.
[[nodiscard]] const std::string &outcome_logs(const ExecutionOutcome &outcome);

/// Single-line human description of the outcome.
[[nodiscard]] std::string describe(const ExecutionOutcome &outcome);

[[nodiscard]] ExecutionOutcome outcome_from_error(RunError error);

} // namespace boxrun::pipeline
