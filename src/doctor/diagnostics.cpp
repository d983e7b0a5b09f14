#include "boxrun/doctor/diagnostics.hpp"

#include "boxrun/common/fs.hpp"
#include "boxrun/config/config.hpp"
#include "boxrun/sandbox/driver.hpp"

#include <filesystem>

namespace boxrun::doctor {

namespace {

void add_check(DiagnosticsReport &report, DiagnosticCheck check) {
  switch (check.status) {
  case CheckStatus::Pass:
    ++report.passed;
    break;
  case CheckStatus::Fail:
    ++report.failed;
    break;
  case CheckStatus::Warn:
    ++report.warnings;
    break;
  }
  report.checks.push_back(std::move(check));
}

DiagnosticCheck check_config(const config::Config &config) {
  DiagnosticCheck check;
  check.name = "Config";
  auto validation = config::validate_config(config);
  if (!validation.ok()) {
    check.status = CheckStatus::Fail;
    check.message = validation.error();
    return check;
  }

  if (!validation.value().empty()) {
    check.status = CheckStatus::Warn;
    check.message = validation.value().front();
    return check;
  }

  check.status = CheckStatus::Pass;
  check.message = config::config_exists() ? "valid" : "valid (defaults, no config file)";
  return check;
}

DiagnosticCheck check_docker_binary(const config::Config &config,
                                    sandbox::IDockerRunner &runner) {
  DiagnosticCheck check;
  check.name = "Docker CLI";
  auto version = runner.run({"--version"}, sandbox::DockerCommandOptions{.allow_failure = true});
  if (!version.ok()) {
    check.status = CheckStatus::Fail;
    check.message = version.error();
    return check;
  }
  if (version.value().exit_code != 0) {
    check.status = CheckStatus::Fail;
    check.message = "'" + config.sandbox.docker_binary + "' is not runnable";
    return check;
  }
  check.status = CheckStatus::Pass;
  check.message = common::trim(version.value().stdout_text);
  return check;
}

DiagnosticCheck check_daemon(sandbox::SandboxDriver &driver) {
  DiagnosticCheck check;
  check.name = "Docker daemon";

  const auto start = std::chrono::steady_clock::now();
  auto probe = driver.probe();
  const auto end = std::chrono::steady_clock::now();
  check.latency = std::chrono::duration_cast<std::chrono::milliseconds>(end - start);

  if (!probe.ok()) {
    check.status = CheckStatus::Fail;
    check.message = common::trim(probe.error());
    return check;
  }
  check.status = CheckStatus::Pass;
  check.message = "server " + probe.value();
  return check;
}

DiagnosticCheck check_default_image(const config::Config &config,
                                    sandbox::IDockerRunner &runner) {
  DiagnosticCheck check;
  const std::string image = config::default_image(config.sandbox);
  check.name = "Image";
  auto inspect =
      runner.run({"image", "inspect", image}, sandbox::DockerCommandOptions{.allow_failure = true});
  if (!inspect.ok()) {
    check.status = CheckStatus::Fail;
    check.message = inspect.error();
    return check;
  }
  if (inspect.value().exit_code != 0) {
    check.status = CheckStatus::Warn;
    check.message = image + " not present locally (pulled on first run)";
    return check;
  }
  check.status = CheckStatus::Pass;
  check.message = image;
  return check;
}

DiagnosticCheck check_staging_root() {
  DiagnosticCheck check;
  check.name = "Staging";
  std::error_code ec;
  const auto root = std::filesystem::temp_directory_path(ec);
  if (ec) {
    check.status = CheckStatus::Fail;
    check.message = "no usable temp directory: " + ec.message();
    return check;
  }
  const auto status = std::filesystem::status(root, ec);
  if (ec || !std::filesystem::is_directory(status)) {
    check.status = CheckStatus::Fail;
    check.message = root.string() + " is not a directory";
    return check;
  }
  check.status = CheckStatus::Pass;
  check.message = root.string();
  return check;
}

} // namespace

DiagnosticsReport run_diagnostics(const config::Config &config,
                                  std::shared_ptr<sandbox::IDockerRunner> runner) {
  DiagnosticsReport report;

  add_check(report, check_config(config));
  add_check(report, check_staging_root());
  if (!runner) {
    add_check(report, DiagnosticCheck{.name = "Docker CLI",
                                      .status = CheckStatus::Fail,
                                      .message = "docker runner unavailable",
                                      .latency = std::nullopt});
    return report;
  }

  auto binary = check_docker_binary(config, *runner);
  const bool have_binary = binary.status == CheckStatus::Pass;
  add_check(report, std::move(binary));
  if (!have_binary) {
    return report;
  }

  sandbox::SandboxDriver driver(config.sandbox, runner);
  auto daemon = check_daemon(driver);
  const bool have_daemon = daemon.status == CheckStatus::Pass;
  add_check(report, std::move(daemon));
  if (have_daemon) {
    add_check(report, check_default_image(config, *runner));
  }
  return report;
}

void print_diagnostics_report(const DiagnosticsReport &report, std::ostream &out) {
  auto status_prefix = [](CheckStatus status) -> const char * {
    switch (status) {
    case CheckStatus::Pass:
      return "[PASS]";
    case CheckStatus::Fail:
      return "[FAIL]";
    case CheckStatus::Warn:
      return "[WARN]";
    }
    return "[INFO]";
  };

  for (const auto &check : report.checks) {
    out << status_prefix(check.status) << " " << check.name << ": " << check.message;
    if (check.latency.has_value()) {
      out << " (" << check.latency->count() << "ms)";
    }
    out << "\n";
  }

  out << "Summary: " << report.passed << " passed, " << report.failed << " failed, "
      << report.warnings << " warnings\n";
}

} // namespace boxrun::doctor
