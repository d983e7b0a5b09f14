#include "boxrun/sandbox/driver.hpp"

#include "boxrun/common/fs.hpp"
#include "boxrun/config/config.hpp"
#include "boxrun/observability/global.hpp"

#include <iomanip>
#include <sstream>
#include <unistd.h>

namespace boxrun::sandbox {

namespace {

std::string first_non_empty(const DockerProcessResult &result) {
  const std::string err = common::trim(result.stderr_text);
  if (!err.empty()) {
    return err;
  }
  return common::trim(result.stdout_text);
}

std::chrono::milliseconds run_timeout(const config::SandboxConfig &config) {
  return std::chrono::milliseconds(static_cast<std::int64_t>(config.timeout_seconds) * 1000);
}

} // namespace

std::string resolve_image(const config::SandboxConfig &config,
                          const std::optional<std::string> &selector) {
  if (!selector.has_value() || common::trim(*selector).empty()) {
    return config::default_image(config);
  }
  const std::string value = common::trim(*selector);
  if (value.find(':') != std::string::npos || value.find('/') != std::string::npos) {
    return value;
  }
  config::SandboxConfig versioned = config;
  versioned.image.clear();
  versioned.runtime_version = value;
  return config::default_image(versioned);
}

std::string container_name_for(const config::SandboxConfig &config, const std::string &run_id) {
  std::string name = config.container_prefix + run_id;
  if (name.size() > 63) {
    name.resize(63);
  }
  return name;
}

std::vector<std::string> build_create_args(const config::SandboxConfig &config,
                                           const ContainerSpec &spec) {
  std::vector<std::string> args = {"create", "--name", spec.container_name};
  args.push_back("--label");
  args.push_back("boxrun.managed=1");
  args.push_back("--label");
  args.push_back("boxrun.run=" + spec.run_id);

  args.push_back("-v");
  args.push_back(spec.host_dir.string() + ":" + config.workdir + ":rw");
  args.push_back("--workdir");
  args.push_back(config.workdir);

  if (config.run_as_host_user) {
    args.push_back("--user");
    args.push_back(std::to_string(getuid()) + ":" + std::to_string(getgid()));
    // An arbitrary uid has no home inside the image; pip needs somewhere to write.
    args.push_back("--env");
    args.push_back("HOME=/tmp");
  }

  for (const auto &entry : config.env) {
    if (common::trim(entry).empty()) {
      continue;
    }
    args.push_back("--env");
    args.push_back(entry);
  }

  if (config.pids_limit > 0) {
    args.push_back("--pids-limit");
    args.push_back(std::to_string(config.pids_limit));
  }
  if (!common::trim(config.memory_limit).empty()) {
    args.push_back("--memory");
    args.push_back(common::trim(config.memory_limit));
  }
  if (config.cpu_limit > 0) {
    args.push_back("--cpus");
    std::ostringstream cpu;
    cpu << std::fixed << std::setprecision(2) << config.cpu_limit;
    args.push_back(cpu.str());
  }

  args.push_back(spec.image);
  args.push_back("sh");
  args.push_back("-c");
  args.push_back(spec.command);
  return args;
}

SandboxHandle::SandboxHandle(std::shared_ptr<IDockerRunner> runner, std::string container_name)
    : runner_(std::move(runner)), container_name_(std::move(container_name)) {}

SandboxHandle::~SandboxHandle() {
  const auto status = release();
  if (!status.ok()) {
    observability::record_error("sandbox", status.error());
  }
}

SandboxHandle::SandboxHandle(SandboxHandle &&other) noexcept
    : runner_(std::move(other.runner_)), container_name_(std::move(other.container_name_)) {
  other.container_name_.clear();
}

SandboxHandle &SandboxHandle::operator=(SandboxHandle &&other) noexcept {
  if (this != &other) {
    const auto status = release();
    if (!status.ok()) {
      observability::record_error("sandbox", status.error());
    }
    runner_ = std::move(other.runner_);
    container_name_ = std::move(other.container_name_);
    other.container_name_.clear();
  }
  return *this;
}

common::Status SandboxHandle::release() {
  if (container_name_.empty() || !runner_) {
    return common::Status::success();
  }
  const std::string name = std::move(container_name_);
  container_name_.clear();

  auto removed =
      runner_->run({"rm", "-f", name}, DockerCommandOptions{.allow_failure = true});
  if (!removed.ok()) {
    return common::Status::error("failed to remove container " + name + ": " + removed.error());
  }
  if (removed.value().exit_code != 0) {
    return common::Status::error("failed to remove container " + name + ": " +
                                 first_non_empty(removed.value()));
  }
  return common::Status::success();
}

SandboxDriver::SandboxDriver(config::SandboxConfig config, std::shared_ptr<IDockerRunner> runner)
    : config_(std::move(config)), runner_(std::move(runner)) {}

common::Result<std::string> SandboxDriver::probe() {
  if (!runner_) {
    return common::Result<std::string>::failure("docker runner unavailable");
  }
  auto version = runner_->run({"version", "--format", "{{.Server.Version}}"});
  if (!version.ok()) {
    return common::Result<std::string>::failure(version.error());
  }
  return common::Result<std::string>::success(common::trim(version.value().stdout_text));
}

common::Result<bool> SandboxDriver::ensure_image(const std::string &image) {
  if (!runner_) {
    return common::Result<bool>::failure("docker runner unavailable");
  }
  auto inspect =
      runner_->run({"image", "inspect", image}, DockerCommandOptions{.allow_failure = true});
  if (!inspect.ok()) {
    return common::Result<bool>::failure(inspect.error());
  }
  if (inspect.value().exit_code == 0) {
    return common::Result<bool>::success(false);
  }

  auto pull = runner_->run({"pull", image}, DockerCommandOptions{.timeout = run_timeout(config_)});
  if (!pull.ok()) {
    return common::Result<bool>::failure("failed to pull image " + image + ": " +
                                         common::trim(pull.error()));
  }
  return common::Result<bool>::success(true);
}

common::Result<SandboxRun> SandboxDriver::run(const ContainerSpec &spec, const OutputSink &sink) {
  if (!runner_) {
    return common::Result<SandboxRun>::failure("docker runner unavailable");
  }

  // Owned before create: a create that times out or fails may still leave the named
  // container behind on the daemon side.
  SandboxHandle handle(runner_, spec.container_name);
  auto created = runner_->run(build_create_args(config_, spec));
  if (!created.ok()) {
    return common::Result<SandboxRun>::failure("failed to create container: " +
                                               common::trim(created.error()));
  }

  auto attached = runner_->run({"start", "--attach", spec.container_name},
                               DockerCommandOptions{.allow_failure = true,
                                                    .timeout = run_timeout(config_),
                                                    .merge_output = true,
                                                    .on_output = sink});
  if (!attached.ok()) {
    return common::Result<SandboxRun>::failure("failed to start container: " + attached.error());
  }

  SandboxRun run;
  run.logs = std::move(attached.value().stdout_text);

  if (attached.value().timed_out) {
    run.timed_out = true;
    auto killed = runner_->run({"kill", spec.container_name},
                               DockerCommandOptions{.allow_failure = true});
    if (!killed.ok()) {
      observability::record_error("sandbox", "failed to kill " + spec.container_name + ": " +
                                                 killed.error());
    }
    auto removed = handle.release();
    if (!removed.ok()) {
      observability::record_error("sandbox", removed.error());
    }
    return common::Result<SandboxRun>::success(std::move(run));
  }

  auto state = runner_->run({"inspect", "--format", "{{.State.Status}} {{.State.ExitCode}}",
                             spec.container_name});
  if (!state.ok()) {
    return common::Result<SandboxRun>::failure("failed to inspect container: " +
                                               common::trim(state.error()));
  }

  std::istringstream fields(state.value().stdout_text);
  std::string status;
  int exit_code = -1;
  fields >> status >> exit_code;
  if (status != "exited" || fields.fail()) {
    std::string cause = "container did not run (state '" + common::trim(state.value().stdout_text) +
                        "')";
    const std::string start_output = common::trim(run.logs);
    if (!start_output.empty()) {
      cause += ": " + start_output;
    }
    return common::Result<SandboxRun>::failure(cause);
  }

  run.exit_code = exit_code;
  auto removed = handle.release();
  if (!removed.ok()) {
    observability::record_error("sandbox", removed.error());
  }
  return common::Result<SandboxRun>::success(std::move(run));
}

} // namespace boxrun::sandbox
