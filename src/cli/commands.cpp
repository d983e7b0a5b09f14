#include "boxrun/cli/commands.hpp"

#include "boxrun/common/fs.hpp"
#include "boxrun/config/config.hpp"
#include "boxrun/doctor/diagnostics.hpp"
#include "boxrun/observability/factory.hpp"
#include "boxrun/observability/global.hpp"
#include "boxrun/pipeline/orchestrator.hpp"
#include "boxrun/report/render.hpp"

#include <iostream>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace boxrun::cli {

namespace {

std::string version_string() {
#ifdef BOXRUN_VERSION
  std::string version = BOXRUN_VERSION;
#else
  std::string version = "0.1.0";
#endif
#ifdef BOXRUN_GIT_COMMIT
  const std::string commit = BOXRUN_GIT_COMMIT;
  if (!commit.empty() && commit != "unknown") {
    version += " (" + commit + ")";
  }
#endif
  return "boxrun " + version;
}

std::vector<std::string> collect_args(int argc, char **argv) {
  std::vector<std::string> out;
  out.reserve(static_cast<std::size_t>(argc));
  for (int i = 0; i < argc; ++i) {
    out.emplace_back(argv[i]);
  }
  return out;
}

// Removes `--name value` or `--name=value` from args. A trailing `--name` without a value
// is reported through `missing`.
bool take_option(std::vector<std::string> &args, const std::string &name, std::string &out_value,
                 bool &missing) {
  const std::string inline_prefix = name + "=";
  for (std::size_t i = 0; i < args.size(); ++i) {
    if (args[i] == name) {
      if (i + 1 >= args.size()) {
        missing = true;
        return false;
      }
      out_value = args[i + 1];
      args.erase(args.begin() + static_cast<long>(i), args.begin() + static_cast<long>(i + 2));
      return true;
    }
    if (common::starts_with(args[i], inline_prefix)) {
      out_value = args[i].substr(inline_prefix.size());
      args.erase(args.begin() + static_cast<long>(i));
      return true;
    }
  }
  return false;
}

bool take_flag(std::vector<std::string> &args, const std::string &name) {
  for (std::size_t i = 0; i < args.size(); ++i) {
    if (args[i] == name) {
      args.erase(args.begin() + static_cast<long>(i));
      return true;
    }
  }
  return false;
}

bool apply_global_options(std::vector<std::string> &args, std::string &error) {
  for (std::size_t i = 0; i < args.size();) {
    if (args[i] == "--config") {
      if (i + 1 >= args.size()) {
        error = "missing value for --config";
        return false;
      }
      config::set_config_path_override(args[i + 1]);
      args.erase(args.begin() + static_cast<long>(i), args.begin() + static_cast<long>(i + 2));
      continue;
    }
    if (common::starts_with(args[i], "--config=")) {
      const auto value = args[i].substr(std::string("--config=").size());
      if (value.empty()) {
        error = "missing value for --config";
        return false;
      }
      config::set_config_path_override(value);
      args.erase(args.begin() + static_cast<long>(i));
      continue;
    }
    ++i;
  }
  return true;
}

struct RunArgs {
  pipeline::ExecutionRequest request;
  std::optional<std::string> output_format;
  std::optional<std::string> results_dir;
  std::optional<std::uint32_t> timeout_seconds;
  std::optional<bool> failure_exit_code;
};

std::optional<std::uint32_t> parse_seconds(const std::string &raw) {
  try {
    std::size_t consumed = 0;
    const unsigned long value = std::stoul(raw, &consumed);
    if (consumed != raw.size() || value > 0xffffffffUL) {
      return std::nullopt;
    }
    return static_cast<std::uint32_t>(value);
  } catch (const std::exception &) {
    return std::nullopt;
  }
}

common::Result<RunArgs> parse_run_args(std::vector<std::string> args) {
  RunArgs parsed;
  bool missing = false;
  std::string value;

  if (take_option(args, "--script", value, missing)) {
    parsed.request.script = value;
  }
  if (take_option(args, "--reqs", value, missing) ||
      take_option(args, "--requirements", value, missing)) {
    parsed.request.manifest = value;
  }
  while (take_option(args, "--input", value, missing)) {
    parsed.request.inputs.emplace_back(value);
  }
  if (take_option(args, "--script-args", value, missing)) {
    parsed.request.script_args = value;
  }

  std::string version;
  std::string image;
  const bool has_version = take_option(args, "--python-version", version, missing);
  const bool has_image = take_option(args, "--image", image, missing);
  if (has_version && has_image) {
    return common::Result<RunArgs>::failure("--python-version and --image are exclusive");
  }
  if (has_version) {
    parsed.request.image = version;
  } else if (has_image) {
    parsed.request.image = image;
  }

  if (take_option(args, "--output", value, missing)) {
    const std::string format = common::to_lower(common::trim(value));
    if (format != "human" && format != "json") {
      return common::Result<RunArgs>::failure("--output must be human or json");
    }
    parsed.output_format = format;
  }
  if (take_option(args, "--results-dir", value, missing)) {
    parsed.results_dir = value;
  }
  if (take_option(args, "--timeout", value, missing)) {
    const auto seconds = parse_seconds(common::trim(value));
    if (!seconds.has_value()) {
      return common::Result<RunArgs>::failure("--timeout expects whole seconds: " + value);
    }
    parsed.timeout_seconds = seconds;
  }

  const bool exit_zero = take_flag(args, "--exit-zero-on-failure");
  const bool exit_nonzero = take_flag(args, "--failure-exit-code");
  if (exit_zero && exit_nonzero) {
    return common::Result<RunArgs>::failure(
        "--exit-zero-on-failure and --failure-exit-code are exclusive");
  }
  if (exit_zero || exit_nonzero) {
    parsed.failure_exit_code = exit_nonzero;
  }

  if (missing) {
    return common::Result<RunArgs>::failure("missing value for an option");
  }
  if (!args.empty()) {
    return common::Result<RunArgs>::failure("unexpected argument: " + args.front());
  }
  if (parsed.request.script.empty() || parsed.request.manifest.empty()) {
    return common::Result<RunArgs>::failure(
        "usage: boxrun run --script <file> --reqs <file> [--input <file>]...");
  }
  return common::Result<RunArgs>::success(std::move(parsed));
}

int run_pipeline(std::vector<std::string> args, std::shared_ptr<sandbox::IDockerRunner> runner) {
  auto parsed = parse_run_args(std::move(args));
  if (!parsed.ok()) {
    std::cerr << parsed.error() << "\n";
    return 1;
  }

  auto cfg = config::load_config();
  if (!cfg.ok()) {
    std::cerr << cfg.error() << "\n";
    return 1;
  }
  config::Config config = cfg.value();
  const RunArgs &run = parsed.value();
  if (run.timeout_seconds.has_value()) {
    config.sandbox.timeout_seconds = *run.timeout_seconds;
  }
  if (run.results_dir.has_value()) {
    config.results.dir = *run.results_dir;
  }
  if (run.output_format.has_value()) {
    config.output.format = *run.output_format;
  }
  if (run.failure_exit_code.has_value()) {
    config.output.failure_exit_code = *run.failure_exit_code;
  }

  auto validation = config::validate_config(config);
  if (!validation.ok()) {
    std::cerr << "invalid configuration: " << validation.error() << "\n";
    return 1;
  }

  observability::set_global_observer(observability::create_observer(config));
  if (!runner) {
    runner = std::make_shared<sandbox::DockerCliRunner>(config.sandbox.docker_binary);
  }

  const bool json = config.output.format == "json";
  pipeline::RunOptions options;
  options.results_dir = config.results.dir;

  bool ends_with_newline = true;
  if (!json) {
    options.log_sink = [&ends_with_newline](std::string_view chunk) {
      std::cerr << chunk;
      std::cerr.flush();
      if (!chunk.empty()) {
        ends_with_newline = chunk.back() == '\n';
      }
    };
  }

  pipeline::Orchestrator orchestrator(config, runner);
  const auto report = orchestrator.run(run.request, options);
  if (auto *observer = observability::get_global_observer(); observer != nullptr) {
    observer->flush();
  }

  if (json) {
    std::cout << report::render_json(report, options.results_dir) << "\n";
  } else {
    if (!ends_with_newline) {
      std::cerr << "\n";
    }
    const std::string summary = report::render_human(report, options.results_dir);
    if (pipeline::is_success(report.outcome)) {
      std::cout << summary << "\n";
    } else {
      std::cerr << summary << "\n";
    }
  }

  return report::process_exit_code(
      report.outcome, report::ExitCodePolicy{.failure_exit_code = config.output.failure_exit_code});
}

int run_doctor(std::shared_ptr<sandbox::IDockerRunner> runner) {
  auto cfg = config::load_config();
  if (!cfg.ok()) {
    std::cerr << "[FAIL] Config load: " << cfg.error() << "\n";
    return 1;
  }
  if (!runner) {
    runner = std::make_shared<sandbox::DockerCliRunner>(cfg.value().sandbox.docker_binary);
  }

  const auto report = doctor::run_diagnostics(cfg.value(), runner);
  doctor::print_diagnostics_report(report);
  return report.failed == 0 ? 0 : 1;
}

int run_config_show(const config::Config &config) {
  auto path = config::config_path();
  if (path.ok()) {
    std::cout << "# " << path.value().string()
              << (config::config_exists() ? "" : " (not present, defaults)") << "\n";
  }
  for (const auto &key : config::config_keys()) {
    auto value = config::get_config_value(config, key);
    if (value.ok()) {
      std::cout << key << " = " << value.value() << "\n";
    }
  }
  std::cout << "# effective image: " << config::default_image(config.sandbox) << "\n";
  return 0;
}

int run_config(std::vector<std::string> args) {
  auto cfg = config::load_config();
  if (!cfg.ok()) {
    std::cerr << cfg.error() << "\n";
    return 1;
  }

  if (args.empty() || args[0] == "show") {
    return run_config_show(cfg.value());
  }

  if (args[0] == "get") {
    if (args.size() < 2) {
      std::cerr << "usage: boxrun config get <key>\n";
      return 1;
    }
    auto value = config::get_config_value(cfg.value(), args[1]);
    if (!value.ok()) {
      std::cerr << value.error() << "\n";
      return 1;
    }
    std::cout << value.value() << "\n";
    return 0;
  }

  if (args[0] == "set") {
    if (args.size() < 3) {
      std::cerr << "usage: boxrun config set <key> <value>\n";
      return 1;
    }
    auto status = config::set_config_value(cfg.value(), args[1], args[2]);
    if (!status.ok()) {
      std::cerr << status.error() << "\n";
      return 1;
    }
    auto validation = config::validate_config(cfg.value());
    if (!validation.ok()) {
      std::cerr << "refusing to save: " << validation.error() << "\n";
      return 1;
    }
    auto saved = config::save_config(cfg.value());
    if (!saved.ok()) {
      std::cerr << saved.error() << "\n";
      return 1;
    }
    return 0;
  }

  std::cerr << "unknown config command\n";
  return 1;
}

} // namespace

void print_help() {
  constexpr const char *RESET = "\033[0m";
  constexpr const char *BOLD = "\033[1m";
  constexpr const char *DIM = "\033[2m";
  constexpr const char *CYAN = "\033[36m";
  constexpr const char *GREEN = "\033[32m";

  std::cout << "\n";
  std::cout << BOLD << CYAN << "  boxrun" << RESET << DIM
            << ": run a Python script with its requirements in a throwaway container" << RESET
            << "\n";
  std::cout << DIM << "  " << version_string() << RESET << "\n\n";

  std::cout << BOLD << "  USAGE" << RESET << "\n";
  std::cout << DIM << "  $ " << RESET << "boxrun [--config PATH] <command> [options]\n\n";

  std::cout << BOLD << "  RUN" << RESET << "\n";
  std::cout << "  " << GREEN << "run" << RESET << " --script FILE --reqs FILE [--input FILE]...\n";
  std::cout << DIM << "      [--script-args \"ARGS\"] [--python-version V | --image REF]\n"
            << "      [--output human|json] [--results-dir DIR] [--timeout SECONDS]\n"
            << "      [--exit-zero-on-failure | --failure-exit-code]" << RESET << "\n\n";

  std::cout << BOLD << "  DIAGNOSTICS" << RESET << "\n";
  std::cout << "  " << GREEN << "doctor" << RESET << DIM << "         Check docker and configuration"
            << RESET << "\n";
  std::cout << "  " << GREEN << "config show" << RESET << DIM
            << "    Display current configuration" << RESET << "\n";
  std::cout << "  " << GREEN << "config get" << RESET << " KEY\n";
  std::cout << "  " << GREEN << "config set" << RESET << " KEY VALUE\n";
  std::cout << "  " << GREEN << "config-path" << RESET << DIM << "    Print the config file location"
            << RESET << "\n";
  std::cout << "  " << GREEN << "version" << RESET << DIM << "        Show version" << RESET
            << "\n\n";
}

int run_cli(int argc, char **argv, std::shared_ptr<sandbox::IDockerRunner> runner) {
  if (argc <= 1) {
    print_help();
    return 0;
  }

  std::vector<std::string> args = collect_args(argc - 1, argv + 1);
  std::string global_error;
  if (!apply_global_options(args, global_error)) {
    std::cerr << global_error << "\n";
    return 1;
  }

  if (args.empty()) {
    print_help();
    return 0;
  }

  const std::string subcommand = args[0];
  args.erase(args.begin());

  if (subcommand == "--help" || subcommand == "-h" || subcommand == "help") {
    print_help();
    return 0;
  }
  if (subcommand == "--version" || subcommand == "-V" || subcommand == "version") {
    std::cout << version_string() << "\n";
    return 0;
  }
  if (subcommand == "config-path") {
    auto path_result = config::config_path();
    if (!path_result.ok()) {
      std::cerr << path_result.error() << "\n";
      return 1;
    }
    std::cout << path_result.value().string() << "\n";
    return 0;
  }
  if (subcommand == "run") {
    return run_pipeline(std::move(args), std::move(runner));
  }
  if (subcommand == "doctor") {
    return run_doctor(std::move(runner));
  }
  if (subcommand == "config") {
    return run_config(std::move(args));
  }

  std::cerr << "Unknown command: " << subcommand << "\n";
  print_help();
  return 1;
}

} // namespace boxrun::cli
