#pragma once

#include "boxrun/common/result.hpp"

#include <chrono>
#include <functional>
#include <string>
#include <string_view>
#include <vector>

namespace boxrun::sandbox {

using OutputSink = std::function<void(std::string_view chunk)>;

struct DockerCommandOptions {
  bool allow_failure = false;
  // Zero waits forever.
  std::chrono::milliseconds timeout{30'000};
  // Route stderr into the stdout pipe so the text keeps its original interleaving.
  bool merge_output = false;
  // Receives output chunks as they arrive (stdout only unless merge_output is set).
  OutputSink on_output;
};

struct DockerProcessResult {
  int exit_code = 0;
  bool timed_out = false;
  std::string stdout_text;
  std::string stderr_text;
};

// Seam between the sandbox driver and the container runtime. Arguments exclude the
// docker binary itself.
class IDockerRunner {
public:
  virtual ~IDockerRunner() = default;

  [[nodiscard]] virtual common::Result<DockerProcessResult>
  run(const std::vector<std::string> &args, const DockerCommandOptions &options = {}) = 0;
};

class DockerCliRunner final : public IDockerRunner {
public:
  explicit DockerCliRunner(std::string docker_binary = "docker");

  [[nodiscard]] common::Result<DockerProcessResult>
  run(const std::vector<std::string> &args, const DockerCommandOptions &options = {}) override;

private:
  std::string docker_binary_;
};

} // namespace boxrun::sandbox
