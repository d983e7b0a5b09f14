#include "boxrun/pipeline/phases.hpp"

namespace boxrun::pipeline {

namespace {

bool is_blank(const char c) { return c == ' ' || c == '\t' || c == '\n' || c == '\r'; }

// Emits the gated block for one phase: begin marker, the command, end marker with the
// command's status, and an early exit carrying that status on failure.
void append_phase(std::string &program, const std::string &nonce, const std::string_view phase,
                  const std::string &command) {
  program += "printf '%s\\n' " + shell_quote(begin_marker(nonce, phase)) + "\n";
  program += command + "\n";
  program += "rc=$?\n";
  program += "printf '%s%s\\n' " + shell_quote(std::string(kMarkerPrefix) + nonce + ":phase=" +
                                               std::string(phase) + ":end:code=") +
             " \"$rc\"\n";
  program += "[ \"$rc\" -eq 0 ] || exit \"$rc\"\n";
}

} // namespace

std::string begin_marker(const std::string_view nonce, const std::string_view phase) {
  std::string marker(kMarkerPrefix);
  marker.append(nonce).append(":phase=").append(phase).append(":begin");
  return marker;
}

std::string end_marker(const std::string_view nonce, const std::string_view phase,
                       const int code) {
  std::string marker(kMarkerPrefix);
  marker.append(nonce).append(":phase=").append(phase).append(":end:code=");
  marker += std::to_string(code);
  return marker;
}

std::string shell_quote(const std::string_view value) {
  std::string out = "'";
  for (const char c : value) {
    if (c == '\'') {
      out += "'\\''";
    } else {
      out.push_back(c);
    }
  }
  out.push_back('\'');
  return out;
}

common::Result<std::vector<std::string>> split_args_quoted(const std::string_view input) {
  enum class State { Plain, Single, Double };

  std::vector<std::string> out;
  std::string current;
  // Tracks "" and '' so an explicitly empty argument survives.
  bool in_token = false;
  bool escaped = false;
  State state = State::Plain;

  for (const char c : input) {
    if (state == State::Plain) {
      if (is_blank(c)) {
        if (in_token) {
          out.push_back(std::move(current));
          current.clear();
          in_token = false;
        }
        continue;
      }
      in_token = true;
      if (c == '\'') {
        state = State::Single;
      } else if (c == '"') {
        state = State::Double;
        escaped = false;
      } else {
        current.push_back(c);
      }
    } else if (state == State::Single) {
      if (c == '\'') {
        state = State::Plain;
      } else {
        current.push_back(c);
      }
    } else {
      if (escaped) {
        current.push_back(c);
        escaped = false;
      } else if (c == '\\') {
        escaped = true;
      } else if (c == '"') {
        state = State::Plain;
      } else {
        current.push_back(c);
      }
    }
  }

  if (state != State::Plain) {
    return common::Result<std::vector<std::string>>::failure(
        "unterminated quote in script arguments");
  }
  if (in_token) {
    out.push_back(std::move(current));
  }
  return common::Result<std::vector<std::string>>::success(std::move(out));
}

common::Result<PhasePlan> PhasePlan::compose(const std::string &script_name,
                                             const std::string &manifest_name,
                                             const std::optional<std::string> &script_args,
                                             const std::string &nonce,
                                             const std::string &venv_dir) {
  if (script_name.empty() || manifest_name.empty()) {
    return common::Result<PhasePlan>::failure("script and manifest names are required");
  }
  if (nonce.empty()) {
    return common::Result<PhasePlan>::failure("phase marker nonce is empty");
  }
  if (venv_dir.empty() || venv_dir.front() != '/') {
    return common::Result<PhasePlan>::failure("venv directory must be absolute: " + venv_dir);
  }

  PhasePlan plan;
  plan.nonce_ = nonce;
  if (script_args.has_value()) {
    auto argv = split_args_quoted(*script_args);
    if (!argv.ok()) {
      return common::Result<PhasePlan>::failure(argv.error());
    }
    plan.script_argv_ = std::move(argv.value());
  }

  const std::string venv_python = shell_quote(venv_dir + "/bin/python");
  std::string script_command = venv_python + " " + shell_quote(script_name);
  for (const auto &arg : plan.script_argv_) {
    script_command += " " + shell_quote(arg);
  }

  std::string program = "exec 2>&1\n";
  append_phase(program, nonce, kPhaseEnvCreate, "python -m venv " + shell_quote(venv_dir));
  append_phase(program, nonce, kPhaseInstall,
               venv_python + " -m pip install --no-input -r " + shell_quote(manifest_name));
  append_phase(program, nonce, kPhaseScript, script_command);
  program += "exit 0\n";

  plan.command_ = std::move(program);
  return common::Result<PhasePlan>::success(std::move(plan));
}

} // namespace boxrun::pipeline
