#include "boxrun/report/render.hpp"

#include "boxrun/common/json_util.hpp"

#include <sstream>
#include <type_traits>

namespace boxrun::report {

namespace {

std::vector<std::string> captured_names(const std::vector<pipeline::CapturedFile> &files) {
  std::vector<std::string> names;
  names.reserve(files.size());
  for (const auto &file : files) {
    names.push_back(file.name);
  }
  return names;
}

std::string files_json(const std::vector<pipeline::CapturedFile> &files) {
  std::ostringstream out;
  out << "[";
  for (std::size_t i = 0; i < files.size(); ++i) {
    if (i > 0) {
      out << ",";
    }
    out << "{\"name\":" << common::json_quote(files[i].name) << ",\"size\":" << files[i].size
        << ",\"sha256\":" << common::json_quote(files[i].sha256) << "}";
  }
  out << "]";
  return out.str();
}

// Body of the "details" object, without braces.
std::string details_json(const pipeline::ExecutionOutcome &outcome,
                         const std::filesystem::path &results_dir) {
  return std::visit(
      [&results_dir](auto &&value) -> std::string {
        using T = std::decay_t<decltype(value)>;
        namespace oc = pipeline::outcome;
        std::ostringstream out;
        if constexpr (std::is_same_v<T, oc::FileNotFound>) {
          out << "\"path\":" << common::json_quote(value.path);
        } else {
          out << "\"raw_logs\":" << common::json_quote(value.logs);
          if constexpr (std::is_same_v<T, oc::Success>) {
            out << ",\"results_dir\":" << common::json_quote(results_dir.string())
                << ",\"files\":" << files_json(value.captured);
          } else if constexpr (std::is_same_v<T, oc::EnvironmentSetupFailed>) {
            out << ",\"exit_code\":" << value.exit_code;
          } else if constexpr (std::is_same_v<T, oc::ScriptExecutionFailed>) {
            out << ",\"exit_code\":" << value.exit_code
                << ",\"produced_files\":" << common::json_string_array(value.produced_files);
          }
        }
        return out.str();
      },
      outcome);
}

std::string join_names(const std::vector<std::string> &names) {
  std::string out;
  for (const auto &name : names) {
    if (!out.empty()) {
      out += ", ";
    }
    out += name;
  }
  return out;
}

} // namespace

int process_exit_code(const pipeline::ExecutionOutcome &outcome, const ExitCodePolicy &policy) {
  const auto kind = pipeline::error_kind_of(outcome);
  if (!kind.has_value()) {
    return 0;
  }
  if ((*kind == pipeline::ErrorKind::EnvironmentSetupFailed ||
       *kind == pipeline::ErrorKind::ScriptExecutionFailed) &&
      !policy.failure_exit_code) {
    return 0;
  }
  return 1;
}

std::string render_json(const pipeline::RunReport &report,
                        const std::filesystem::path &results_dir) {
  const auto kind = pipeline::error_kind_of(report.outcome);
  std::ostringstream out;
  out << "{\"status\":" << common::json_quote(kind.has_value() ? "error" : "success");
  if (kind.has_value()) {
    out << ",\"error_kind\":" << common::json_quote(std::string(pipeline::error_kind_name(*kind)));
  }
  out << ",\"message\":" << common::json_quote(pipeline::describe(report.outcome));
  if (const auto *success = std::get_if<pipeline::outcome::Success>(&report.outcome)) {
    out << ",\"captured_files\":" << common::json_string_array(captured_names(success->captured));
  }
  out << ",\"run_id\":" << common::json_quote(report.run_id);
  if (!report.image.empty()) {
    out << ",\"image\":" << common::json_quote(report.image);
  }
  out << ",\"duration_ms\":" << report.duration.count();
  out << ",\"details\":{" << details_json(report.outcome, results_dir) << "}}";
  return out.str();
}

std::string render_human(const pipeline::RunReport &report,
                         const std::filesystem::path &results_dir) {
  if (const auto *success = std::get_if<pipeline::outcome::Success>(&report.outcome)) {
    std::string line = "Success: captured " + std::to_string(success->captured.size()) +
                       " file(s) into " + results_dir.string();
    if (!success->captured.empty()) {
      line += ": " + join_names(captured_names(success->captured));
    }
    return line;
  }

  const auto kind = pipeline::error_kind_of(report.outcome);
  std::string line = "Error [" +
                     std::string(pipeline::error_kind_name(
                         kind.value_or(pipeline::ErrorKind::InternalError))) +
                     "]: " + pipeline::describe(report.outcome);
  if (const auto *failed = std::get_if<pipeline::outcome::ScriptExecutionFailed>(&report.outcome);
      failed != nullptr && !failed->produced_files.empty()) {
    line += " (left behind: " + join_names(failed->produced_files) + ")";
  }
  return line;
}

} // namespace boxrun::report
