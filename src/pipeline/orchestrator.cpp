#include "boxrun/pipeline/orchestrator.hpp"

#include "boxrun/common/fs.hpp"
#include "boxrun/observability/global.hpp"
#include "boxrun/pipeline/classifier.hpp"
#include "boxrun/pipeline/collector.hpp"
#include "boxrun/pipeline/phases.hpp"
#include "boxrun/pipeline/stager.hpp"
#include "boxrun/sandbox/driver.hpp"

#include <stdexcept>

namespace boxrun::pipeline {

namespace {

outcome::InternalError internal_error(std::string cause, std::string logs = {}) {
  return outcome::InternalError{.cause = std::move(cause), .logs = std::move(logs)};
}

std::string outcome_label(const ExecutionOutcome &result) {
  const auto kind = error_kind_of(result);
  return kind.has_value() ? std::string(error_kind_name(*kind)) : "Success";
}

} // namespace

Orchestrator::Orchestrator(config::Config config, std::shared_ptr<sandbox::IDockerRunner> runner)
    : config_(std::move(config)), runner_(std::move(runner)) {}

RunReport Orchestrator::run(const ExecutionRequest &request, const RunOptions &options) {
  RunReport report;
  const auto started = std::chrono::steady_clock::now();

  auto run_id = common::random_hex(8);
  if (!run_id.ok()) {
    report.outcome = internal_error(run_id.error());
    return report;
  }
  report.run_id = run_id.value();
  observability::record_run_start(report.run_id, request.script.string(),
                                  sandbox::resolve_image(config_.sandbox, request.image));

  try {
    report.outcome = execute(request, options, report.run_id, report.image);
  } catch (const std::exception &ex) {
    observability::record_error("pipeline", ex.what());
    report.outcome = internal_error(std::string("unexpected failure: ") + ex.what());
  }

  report.duration = std::chrono::duration_cast<std::chrono::milliseconds>(
      std::chrono::steady_clock::now() - started);
  observability::record_run_end(report.run_id, outcome_label(report.outcome), report.duration);
  return report;
}

ExecutionOutcome Orchestrator::execute(const ExecutionRequest &request, const RunOptions &options,
                                       const std::string &run_id, std::string &image) {
  if (auto valid = ContextStager::validate(request); !valid.ok()) {
    return outcome_from_error(valid.error());
  }

  auto nonce = common::random_hex(8);
  if (!nonce.ok()) {
    return internal_error(nonce.error());
  }
  auto plan = PhasePlan::compose(request.script.filename().string(),
                                 request.manifest.filename().string(), request.script_args,
                                 nonce.value(), config_.sandbox.venv_dir);
  if (!plan.ok()) {
    return internal_error(plan.error());
  }

  const ContextStager stager(StagingOptions{.root = {}, .prefix = config_.staging.temp_prefix});
  auto staged = stager.stage(request);
  if (!staged.ok()) {
    return outcome_from_error(staged.error());
  }
  StagingContext context = std::move(staged.value());
  observability::record_phase(run_id, "stage", context.dir().string());

  auto before = context.snapshot_names();
  if (!before.ok()) {
    return internal_error(before.error());
  }

  sandbox::SandboxDriver driver(config_.sandbox, runner_);
  image = sandbox::resolve_image(config_.sandbox, request.image);
  auto pulled = driver.ensure_image(image);
  if (!pulled.ok()) {
    observability::record_phase(run_id, "image", pulled.error(), false);
    return outcome::SandboxUnavailable{.cause = pulled.error(), .logs = {}};
  }
  observability::record_phase(run_id, "image", pulled.value() ? "pulled " + image : image);

  const sandbox::ContainerSpec spec{.run_id = run_id,
                                    .container_name =
                                        sandbox::container_name_for(config_.sandbox, run_id),
                                    .host_dir = context.dir(),
                                    .image = image,
                                    .command = plan.value().command()};
  auto ran = driver.run(spec, options.log_sink);
  if (!ran.ok()) {
    observability::record_phase(run_id, "container", ran.error(), false);
    return outcome::SandboxUnavailable{.cause = ran.error(), .logs = {}};
  }
  auto &sandbox_run = ran.value();
  observability::record_phase(run_id, "container",
                              "exit code " + std::to_string(sandbox_run.exit_code),
                              !sandbox_run.timed_out);

  if (sandbox_run.timed_out) {
    return internal_error("sandbox timed out after " +
                              std::to_string(config_.sandbox.timeout_seconds) + "s",
                          std::move(sandbox_run.logs));
  }

  ExecutionOutcome result =
      classify_outcome(sandbox_run.exit_code, sandbox_run.logs, plan.value().nonce());
  observability::record_phase(run_id, "classify", outcome_label(result), is_success(result));

  if (auto *success = std::get_if<outcome::Success>(&result)) {
    const ResultCollector collector;
    auto captured = collector.collect(context.dir(), before.value(), options.results_dir);
    if (!captured.ok()) {
      observability::record_phase(run_id, "collect", captured.error().message, false);
      return internal_error(captured.error().message, std::move(success->logs));
    }
    std::uint64_t bytes = 0;
    for (const auto &file : captured.value()) {
      bytes += file.size;
    }
    observability::record_captured_files(captured.value().size(), bytes);
    observability::record_phase(run_id, "collect", options.results_dir.string());
    success->captured = std::move(captured.value());
  } else if (auto *failed = std::get_if<outcome::ScriptExecutionFailed>(&result)) {
    auto produced = ResultCollector::new_file_names(context.dir(), before.value());
    if (produced.ok()) {
      failed->produced_files = std::move(produced.value());
    } else {
      observability::record_error("collect", produced.error());
    }
  }

  if (auto cleaned = context.release(); !cleaned.ok()) {
    observability::record_phase(run_id, "cleanup", cleaned.error(), false);
  }
  return result;
}

} // namespace boxrun::pipeline
