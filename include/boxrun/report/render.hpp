#pragma once

#include "boxrun/pipeline/orchestrator.hpp"

#include <filesystem>
#include <string>

namespace boxrun::report {

struct ExitCodePolicy {
  // When false, environment and script failures exit 0 and live only in the payload.
  bool failure_exit_code = true;
};

[[nodiscard]] int process_exit_code(const pipeline::ExecutionOutcome &outcome,
                                    const ExitCodePolicy &policy);

/// Single JSON object describing the run, raw logs included.
[[nodiscard]] std::string render_json(const pipeline::RunReport &report,
                                      const std::filesystem::path &results_dir);

/// Final summary line for human mode; the logs were already streamed.
[[nodiscard]] std::string render_human(const pipeline::RunReport &report,
                                       const std::filesystem::path &results_dir);

} // namespace boxrun::report
