#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace boxrun::config {

struct SandboxConfig {
  // Full image reference; when empty the image is built from repository, version, variant.
  std::string image;
  std::string image_repository = "python";
  std::string runtime_version = "3.10";
  std::string image_variant = "slim";
  std::string workdir = "/app";
  std::string venv_dir = "/tmp/.boxrun-venv";
  std::string container_prefix = "boxrun-";
  std::string docker_binary = "docker";
  std::uint32_t timeout_seconds = 3600;
  bool run_as_host_user = true;
  std::string memory_limit;
  double cpu_limit = 0.0;
  std::uint32_t pids_limit = 0;
  std::vector<std::string> env = {"PYTHONUNBUFFERED=1", "PIP_DISABLE_PIP_VERSION_CHECK=1"};
};

struct StagingConfig {
  std::string temp_prefix = "boxrun-stage-";
};

struct ResultsConfig {
  std::string dir = "results";
};

struct OutputConfig {
  std::string format = "human";
  bool failure_exit_code = true;
};

struct ObservabilityConfig {
  std::string backend = "log";
};

struct Config {
  SandboxConfig sandbox;
  StagingConfig staging;
  ResultsConfig results;
  OutputConfig output;
  ObservabilityConfig observability;
};

} // namespace boxrun::config
