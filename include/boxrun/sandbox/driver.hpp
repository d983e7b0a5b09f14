#pragma once

#include "boxrun/common/result.hpp"
#include "boxrun/config/schema.hpp"
#include "boxrun/sandbox/docker.hpp"

#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace boxrun::sandbox {

struct ContainerSpec {
  std::string run_id;
  std::string container_name;
  std::filesystem::path host_dir;
  std::string image;
  // sh program executed as `sh -c <command>`.
  std::string command;
};

struct SandboxRun {
  int exit_code = -1;
  // Interleaved stdout/stderr exactly as the container produced it.
  std::string logs;
  bool timed_out = false;
};

/// A selector containing ':' or '/' is taken as a full image reference; anything else is a
/// runtime version expanded with the configured repository and variant. No selector means
/// the configured default.
[[nodiscard]] std::string resolve_image(const config::SandboxConfig &config,
                                        const std::optional<std::string> &selector);

[[nodiscard]] std::string container_name_for(const config::SandboxConfig &config,
                                             const std::string &run_id);

[[nodiscard]] std::vector<std::string> build_create_args(const config::SandboxConfig &config,
                                                         const ContainerSpec &spec);

// Owns one created container and force-removes it, writable layer included, on release or
// destruction.
class SandboxHandle {
public:
  SandboxHandle(std::shared_ptr<IDockerRunner> runner, std::string container_name);
  ~SandboxHandle();

  SandboxHandle(SandboxHandle &&other) noexcept;
  SandboxHandle &operator=(SandboxHandle &&other) noexcept;
  SandboxHandle(const SandboxHandle &) = delete;
  SandboxHandle &operator=(const SandboxHandle &) = delete;

  [[nodiscard]] const std::string &name() const { return container_name_; }
  [[nodiscard]] common::Status release();

private:
  std::shared_ptr<IDockerRunner> runner_;
  std::string container_name_;
};

class SandboxDriver {
public:
  SandboxDriver(config::SandboxConfig config, std::shared_ptr<IDockerRunner> runner);

  /// Daemon server version; fails when the runtime cannot be reached.
  [[nodiscard]] common::Result<std::string> probe();

  /// Pulls `image` only when it is not present locally. True when a pull happened.
  [[nodiscard]] common::Result<bool> ensure_image(const std::string &image);

  /// One attempt: create, attach and stream, read the exit state, remove. Any failure to
  /// operate the runtime is returned as the error string.
  [[nodiscard]] common::Result<SandboxRun> run(const ContainerSpec &spec,
                                               const OutputSink &sink = {});

  [[nodiscard]] const config::SandboxConfig &config() const { return config_; }

private:
  config::SandboxConfig config_;
  std::shared_ptr<IDockerRunner> runner_;
};

} // namespace boxrun::sandbox
