#include "test_framework.hpp"

#include "boxrun/pipeline/orchestrator.hpp"
#include "boxrun/pipeline/phases.hpp"
#include "tests/helpers/fake_docker.hpp"
#include "tests/helpers/test_helpers.hpp"

#include <filesystem>
#include <memory>
#include <set>

namespace {

namespace pl = boxrun::pipeline;
namespace bt = boxrun::testing;

struct Fixture {
  bt::TempWorkspace ws;
  std::shared_ptr<bt::FakeDockerRunner> fake = std::make_shared<bt::FakeDockerRunner>();
  pl::ExecutionRequest request;
  pl::RunOptions options;

  Fixture() {
    request.script = ws.create_file("src/main.py", "print('hi')\n");
    request.manifest = ws.create_file("src/requirements.txt", "requests\n");
    request.inputs = {ws.create_file("data/input.csv", "x\n")};
    options.results_dir = ws.path() / "results";
  }

  pl::RunReport run() {
    pl::Orchestrator orchestrator(bt::quiet_config(), fake);
    return orchestrator.run(request, options);
  }
};

} // namespace

void register_pipeline_tests(std::vector<boxrun::tests::TestCase> &tests) {
  using boxrun::tests::require;

  tests.push_back({"pipeline_success_collects_new_files_only", [] {
                     Fixture f;
                     f.fake->behavior =
                         bt::succeed_with_files({{"out.json", "{}"}, {"plot.png", "png"}}, "done\n");
                     (void)f.ws.create_file("results/stale.txt", "old");

                     const auto report = f.run();
                     const auto *success = std::get_if<pl::outcome::Success>(&report.outcome);
                     require(success != nullptr, pl::describe(report.outcome));
                     require(success->captured.size() == 2, "two files captured");
                     require(success->captured[0].name == "out.json" &&
                                 success->captured[1].name == "plot.png",
                             "sorted names");
                     require(bt::count_entries(f.options.results_dir) == 2,
                             "stale results replaced");
                     require(bt::slurp(f.options.results_dir / "plot.png") == "png", "content");
                     require(success->logs.find("done\n") != std::string::npos, "logs carried");
                     require(report.image == "python:3.10-slim", "default image reported");
                     require(report.run_id.size() == 16, "run id is 16 hex chars");
                   }});

  tests.push_back({"pipeline_stages_inputs_and_cleans_up", [] {
                     Fixture f;
                     const auto report = f.run();
                     require(pl::is_success(report.outcome), pl::describe(report.outcome));
                     require(f.fake->staged_at_start ==
                                 std::set<std::string>{"main.py", "requirements.txt", "input.csv"},
                             "container saw flattened inputs");
                     require(!f.fake->last_host_dir.empty(), "host dir recorded");
                     require(!std::filesystem::exists(f.fake->last_host_dir),
                             "staging directory removed");
                     require(f.fake->live_containers() == 0, "container removed");
                     require(f.fake->count("pull") == 1, "missing image pulled");
                   }});

  tests.push_back({"pipeline_missing_file_stops_before_docker", [] {
                     Fixture f;
                     f.request.inputs.push_back(f.ws.path() / "nope.csv");
                     const auto report = f.run();
                     const auto *missing = std::get_if<pl::outcome::FileNotFound>(&report.outcome);
                     require(missing != nullptr, "FileNotFound expected");
                     require(missing->path == (f.ws.path() / "nope.csv").string(), "path reported");
                     require(f.fake->commands.empty(), "no docker command issued");
                   }});

  tests.push_back({"pipeline_install_failure_is_environment_setup", [] {
                     Fixture f;
                     f.fake->behavior = bt::fail_in_phase(std::string(pl::kPhaseInstall), 1);
                     const auto report = f.run();
                     const auto *env =
                         std::get_if<pl::outcome::EnvironmentSetupFailed>(&report.outcome);
                     require(env != nullptr, pl::describe(report.outcome));
                     require(env->exit_code == 1, "pip exit code");
                     require(env->logs.find("Requirement already satisfied") != std::string::npos,
                             "install output kept");
                     require(!std::filesystem::exists(f.options.results_dir),
                             "no results directory on failure");
                   }});

  tests.push_back({"pipeline_script_failure_reports_left_behind_files", [] {
                     Fixture f;
                     f.fake->behavior = bt::fail_in_phase(std::string(pl::kPhaseScript), 3,
                                                          {{"partial.csv", "1"}});
                     (void)f.ws.create_file("results/previous.txt", "keep me");

                     const auto report = f.run();
                     const auto *failed =
                         std::get_if<pl::outcome::ScriptExecutionFailed>(&report.outcome);
                     require(failed != nullptr, pl::describe(report.outcome));
                     require(failed->exit_code == 3, "script code");
                     require(failed->produced_files == std::vector<std::string>{"partial.csv"},
                             "left-behind file reported");
                     require(bt::slurp(f.options.results_dir / "previous.txt") == "keep me",
                             "destination untouched on failure");
                     require(!std::filesystem::exists(f.options.results_dir / "partial.csv"),
                             "partial results never collected");
                   }});

  tests.push_back({"pipeline_daemon_down_is_sandbox_unavailable", [] {
                     Fixture f;
                     f.fake->daemon_up = false;
                     const auto report = f.run();
                     const auto *down = std::get_if<pl::outcome::SandboxUnavailable>(&report.outcome);
                     require(down != nullptr, pl::describe(report.outcome));
                     require(down->cause.find("Cannot connect") != std::string::npos, "cause kept");
                     require(down->logs.empty(), "no sandbox output");
                   }});

  tests.push_back({"pipeline_pull_and_create_failures_are_sandbox_unavailable", [] {
                     Fixture pull;
                     pull.fake->pull_fails = true;
                     require(std::holds_alternative<pl::outcome::SandboxUnavailable>(
                                 pull.run().outcome),
                             "pull failure");

                     Fixture create;
                     create.fake->create_fails = true;
                     const auto report = create.run();
                     require(std::holds_alternative<pl::outcome::SandboxUnavailable>(report.outcome),
                             "create failure");
                     require(!std::filesystem::exists(create.fake->last_host_dir) ||
                                 create.fake->last_host_dir.empty(),
                             "staging cleaned up");
                   }});

  tests.push_back({"pipeline_create_timeout_leaves_no_container", [] {
                     Fixture f;
                     f.fake->create_fails_after_register = true;
                     const auto report = f.run();
                     require(std::holds_alternative<pl::outcome::SandboxUnavailable>(report.outcome),
                             pl::describe(report.outcome));
                     require(f.fake->created.size() == 1, "container was registered");
                     require(f.fake->live_containers() == 0, "container removed");
                     require(!std::filesystem::exists(f.fake->last_host_dir), "staging removed");
                   }});

  tests.push_back({"pipeline_timeout_is_internal_error_with_logs", [] {
                     Fixture f;
                     f.fake->behavior = [](const std::filesystem::path &, const std::string &nonce) {
                       return bt::FakeContainerRun{
                           .exit_code = 0,
                           .logs = bt::marker_trail(nonce, pl::kPhaseScript, std::nullopt,
                                                    "still going\n"),
                           .timed_out = true};
                     };
                     const auto report = f.run();
                     const auto *internal = std::get_if<pl::outcome::InternalError>(&report.outcome);
                     require(internal != nullptr, pl::describe(report.outcome));
                     require(internal->cause.find("timed out") != std::string::npos, "cause");
                     require(internal->logs.find("still going") != std::string::npos,
                             "partial logs kept");
                     require(f.fake->killed.size() == 1, "container killed");
                     require(f.fake->live_containers() == 0, "container removed");
                   }});

  tests.push_back({"pipeline_bad_script_args_create_no_container", [] {
                     Fixture f;
                     f.request.script_args = "--name 'unterminated";
                     const auto report = f.run();
                     require(std::holds_alternative<pl::outcome::InternalError>(report.outcome),
                             "argument error is internal");
                     require(!f.fake->saw("create"), "no container created");
                   }});

  tests.push_back({"pipeline_streams_and_keeps_logs_verbatim", [] {
                     Fixture f;
                     f.fake->behavior = bt::succeed_with_files({}, "line one\nline two\n");
                     std::string streamed;
                     f.options.log_sink = [&streamed](std::string_view chunk) {
                       streamed.append(chunk);
                     };
                     const auto report = f.run();
                     require(pl::is_success(report.outcome), pl::describe(report.outcome));
                     require(f.fake->streamed, "sink attached");
                     require(streamed == pl::outcome_logs(report.outcome),
                             "streamed text equals recorded logs");
                     require(streamed.find("@@boxrun:" + f.fake->last_nonce) != std::string::npos,
                             "markers left in the logs");
                   }});

  tests.push_back({"pipeline_image_selector_reaches_create", [] {
                     Fixture f;
                     f.request.image = "3.12";
                     f.fake->local_images.insert("python:3.12-slim");
                     const auto report = f.run();
                     require(report.image == "python:3.12-slim", "version expanded");
                     require(!f.fake->saw("pull"), "local image not pulled");
                     bool found = false;
                     for (const auto &cmd : f.fake->commands) {
                       if (!cmd.empty() && cmd[0] == "create") {
                         found = cmd[cmd.size() - 4] == "python:3.12-slim";
                       }
                     }
                     require(found, "create used the selected image");
                   }});

  tests.push_back({"pipeline_runs_are_independent", [] {
                     Fixture f;
                     f.fake->behavior = bt::succeed_with_files({{"a.txt", "1"}});
                     const auto first = f.run();
                     const auto first_dir = f.fake->last_host_dir;
                     f.fake->behavior = bt::succeed_with_files({{"b.txt", "2"}});
                     const auto second = f.run();
                     require(first.run_id != second.run_id, "distinct run ids");
                     require(first_dir != f.fake->last_host_dir, "distinct staging dirs");
                     require(f.fake->created.size() == 2 && f.fake->created[0] != f.fake->created[1],
                             "distinct containers");
                     require(bt::count_entries(f.options.results_dir) == 1 &&
                                 std::filesystem::exists(f.options.results_dir / "b.txt"),
                             "second run replaced first results");
                   }});
}
