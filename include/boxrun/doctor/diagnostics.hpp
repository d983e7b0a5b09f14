#pragma once

#include "boxrun/config/schema.hpp"
#include "boxrun/sandbox/docker.hpp"

#include <chrono>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace boxrun::doctor {

enum class CheckStatus {
  Pass,
  Fail,
  Warn,
};

struct DiagnosticCheck {
  std::string name;
  CheckStatus status = CheckStatus::Pass;
  std::string message;
  std::optional<std::chrono::milliseconds> latency;
};

struct DiagnosticsReport {
  std::vector<DiagnosticCheck> checks;
  int passed = 0;
  int failed = 0;
  int warnings = 0;
};

[[nodiscard]] DiagnosticsReport run_diagnostics(const config::Config &config,
                                                std::shared_ptr<sandbox::IDockerRunner> runner);
void print_diagnostics_report(const DiagnosticsReport &report, std::ostream &out = std::cout);

} // namespace boxrun::doctor
