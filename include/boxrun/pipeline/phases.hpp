#pragma once

#include "boxrun/common/result.hpp"

#include <array>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace boxrun::pipeline {

inline constexpr std::string_view kPhaseEnvCreate = "env-create";
inline constexpr std::string_view kPhaseInstall = "install";
inline constexpr std::string_view kPhaseScript = "script";

inline constexpr std::array<std::string_view, 3> kPhaseOrder = {kPhaseEnvCreate, kPhaseInstall,
                                                                 kPhaseScript};

inline constexpr std::string_view kMarkerPrefix = "@@boxrun:";
inline constexpr std::string_view kDefaultVenvDir = "/tmp/.boxrun-venv";

/// `@@boxrun:<nonce>:phase=<phase>:begin`
[[nodiscard]] std::string begin_marker(std::string_view nonce, std::string_view phase);
/// `@@boxrun:<nonce>:phase=<phase>:end:code=<code>`
[[nodiscard]] std::string end_marker(std::string_view nonce, std::string_view phase, int code);

/// Wraps `value` in single quotes so sh takes it literally.
[[nodiscard]] std::string shell_quote(std::string_view value);

/// Splits an argument string with sh-like quoting: whitespace separates, '...' is literal,
/// "..." honours backslash escapes. Fails on an unterminated quote or trailing escape.
[[nodiscard]] common::Result<std::vector<std::string>> split_args_quoted(std::string_view input);

// The single sh program run inside the container: three gated phases, each bracketed
// by nonce-tagged markers, with stderr folded into stdout.
class PhasePlan {
public:
  [[nodiscard]] static common::Result<PhasePlan>
  compose(const std::string &script_name, const std::string &manifest_name,
          const std::optional<std::string> &script_args, const std::string &nonce,
          const std::string &venv_dir = std::string(kDefaultVenvDir));

  [[nodiscard]] const std::string &command() const { return command_; }
  [[nodiscard]] const std::string &nonce() const { return nonce_; }
  [[nodiscard]] const std::vector<std::string> &script_argv() const { return script_argv_; }

private:
  PhasePlan() = default;

  std::string command_;
  std::string nonce_;
  std::vector<std::string> script_argv_;
};

} // namespace boxrun::pipeline
