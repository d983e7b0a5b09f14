#pragma once

#include "boxrun/sandbox/docker.hpp"

#include <cstddef>
#include <filesystem>
#include <functional>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <vector>

namespace boxrun::testing {

struct FakeContainerRun {
  int exit_code = 0;
  std::string logs;
  bool timed_out = false;
};

// What the container does once started. It sees the bind-mounted host directory and the
// marker nonce embedded in the composed command.
using ContainerBehavior =
    std::function<FakeContainerRun(const std::filesystem::path &host_dir, const std::string &nonce)>;

/// Marker trail in which every phase before `failing_phase` succeeds. The failing phase
/// ends with `code`, or never ends when `code` is nullopt. An empty phase means all succeed.
/// `script_output` is printed inside the script phase.
std::string marker_trail(const std::string &nonce, std::string_view failing_phase = {},
                         std::optional<int> code = 0, const std::string &script_output = "");

/// Script succeeds after writing `files` into the mounted directory.
ContainerBehavior succeed_with_files(std::map<std::string, std::string> files,
                                     std::string script_output = "");

/// `phase` fails with `code`; the container exits with the same code.
ContainerBehavior fail_in_phase(std::string phase, int code,
                                std::map<std::string, std::string> files = {});

class FakeDockerRunner final : public sandbox::IDockerRunner {
public:
  FakeDockerRunner();

  [[nodiscard]] common::Result<sandbox::DockerProcessResult>
  run(const std::vector<std::string> &args,
      const sandbox::DockerCommandOptions &options = {}) override;

  [[nodiscard]] std::size_t count(const std::string &verb) const;
  [[nodiscard]] bool saw(const std::string &verb) const { return count(verb) > 0; }
  /// Containers created and not yet removed.
  [[nodiscard]] std::size_t live_containers() const;

  std::set<std::string> local_images;
  bool daemon_up = true;
  bool pull_fails = false;
  bool create_fails = false;
  // The daemon registers the container but the create command still fails, as when the
  // CLI is killed by its timeout.
  bool create_fails_after_register = false;
  bool start_fails = false;
  ContainerBehavior behavior;

  std::vector<std::vector<std::string>> commands;
  std::vector<std::string> created;
  std::vector<std::string> removed;
  std::vector<std::string> killed;
  std::filesystem::path last_host_dir;
  std::string last_nonce;
  std::string last_command;
  std::set<std::string> staged_at_start;
  bool streamed = false;

private:
  std::map<std::string, std::filesystem::path> mounts_;
  std::map<std::string, std::string> nonces_;
  std::map<std::string, int> exit_codes_;
};

} // namespace boxrun::testing
