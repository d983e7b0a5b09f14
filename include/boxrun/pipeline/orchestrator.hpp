#pragma once

#include "boxrun/config/schema.hpp"
#include "boxrun/pipeline/outcome.hpp"
#include "boxrun/pipeline/request.hpp"
#include "boxrun/sandbox/docker.hpp"

#include <chrono>
#include <filesystem>
#include <memory>
#include <string>

namespace boxrun::pipeline {

struct RunOptions {
  std::filesystem::path results_dir = "results";
  // Receives sandbox output as it is produced.
  sandbox::OutputSink log_sink;
};

struct RunReport {
  std::string run_id;
  std::string image;
  ExecutionOutcome outcome;
  std::chrono::milliseconds duration{0};
};

// Runs one request end to end: stage, compose, sandbox, classify, collect. Strictly
// sequential; every run gets its own staging directory and container.
class Orchestrator {
public:
  Orchestrator(config::Config config, std::shared_ptr<sandbox::IDockerRunner> runner);

  [[nodiscard]] RunReport run(const ExecutionRequest &request, const RunOptions &options);

private:
  [[nodiscard]] ExecutionOutcome execute(const ExecutionRequest &request,
                                         const RunOptions &options, const std::string &run_id,
                                         std::string &image);

  config::Config config_;
  std::shared_ptr<sandbox::IDockerRunner> runner_;
};

} // namespace boxrun::pipeline
