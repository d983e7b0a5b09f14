#include "test_framework.hpp"

#include "boxrun/sandbox/driver.hpp"
#include "tests/helpers/fake_docker.hpp"
#include "tests/helpers/test_helpers.hpp"

#include <algorithm>
#include <memory>

namespace {

namespace sb = boxrun::sandbox;
namespace bt = boxrun::testing;

bool contains_pair(const std::vector<std::string> &args, const std::string &flag,
                   const std::string &value) {
  for (std::size_t i = 0; i + 1 < args.size(); ++i) {
    if (args[i] == flag && args[i + 1] == value) {
      return true;
    }
  }
  return false;
}

sb::ContainerSpec spec_for(const bt::TempWorkspace &ws, const std::string &command = "true") {
  return sb::ContainerSpec{.run_id = "r1",
                           .container_name = "boxrun-r1",
                           .host_dir = ws.path(),
                           .image = "python:3.10-slim",
                           .command = command};
}

} // namespace

void register_sandbox_tests(std::vector<boxrun::tests::TestCase> &tests) {
  using boxrun::tests::require;

  tests.push_back({"resolve_image_handles_versions_and_references", [] {
                     const boxrun::config::SandboxConfig config;
                     require(sb::resolve_image(config, std::nullopt) == "python:3.10-slim",
                             "default image");
                     require(sb::resolve_image(config, std::string("  ")) == "python:3.10-slim",
                             "blank selector means default");
                     require(sb::resolve_image(config, std::string("3.12")) == "python:3.12-slim",
                             "version expands with variant");
                     require(sb::resolve_image(config, std::string("python:3.11-alpine")) ==
                                 "python:3.11-alpine",
                             "tagged reference kept");
                     require(sb::resolve_image(config, std::string("ghcr.io/acme/py")) ==
                                 "ghcr.io/acme/py",
                             "registry path kept");

                     boxrun::config::SandboxConfig pinned;
                     pinned.image = "internal/python:pinned";
                     require(sb::resolve_image(pinned, std::string("3.9")) == "python:3.9-slim",
                             "version selector overrides a pinned image");
                   }});

  tests.push_back({"container_name_is_prefixed_and_bounded", [] {
                     boxrun::config::SandboxConfig config;
                     require(sb::container_name_for(config, "abc") == "boxrun-abc", "prefixed");
                     config.container_prefix = std::string(80, 'x');
                     require(sb::container_name_for(config, "abc").size() == 63,
                             "docker name length bound");
                   }});

  tests.push_back({"create_args_mount_workdir_and_limits", [] {
                     bt::TempWorkspace ws;
                     boxrun::config::SandboxConfig config;
                     config.memory_limit = "512m";
                     config.cpu_limit = 1.5;
                     config.pids_limit = 64;
                     config.env = {"A=1", " "};
                     const auto args = sb::build_create_args(config, spec_for(ws, "echo hi"));

                     require(args[0] == "create", "create verb");
                     require(contains_pair(args, "--name", "boxrun-r1"), "name");
                     require(contains_pair(args, "--label", "boxrun.run=r1"), "run label");
                     require(contains_pair(args, "-v", ws.path().string() + ":/app:rw"), "mount");
                     require(contains_pair(args, "--workdir", "/app"), "workdir");
                     require(contains_pair(args, "--env", "HOME=/tmp"), "home for host uid");
                     require(contains_pair(args, "--env", "A=1"), "configured env");
                     require(std::count(args.begin(), args.end(), "--env") == 2,
                             "blank env entries skipped");
                     require(contains_pair(args, "--memory", "512m"), "memory");
                     require(contains_pair(args, "--cpus", "1.50"), "cpus");
                     require(contains_pair(args, "--pids-limit", "64"), "pids");
                     require(std::find(args.begin(), args.end(), "--user") != args.end(),
                             "runs as host user");
                     require(args.size() >= 4 && args[args.size() - 4] == "python:3.10-slim" &&
                                 args[args.size() - 3] == "sh" && args[args.size() - 2] == "-c" &&
                                 args.back() == "echo hi",
                             "image then sh -c program last");
                   }});

  tests.push_back({"create_args_without_optional_limits", [] {
                     bt::TempWorkspace ws;
                     boxrun::config::SandboxConfig config;
                     config.run_as_host_user = false;
                     config.env.clear();
                     const auto args = sb::build_create_args(config, spec_for(ws));
                     for (const char *flag : {"--user", "--memory", "--cpus", "--pids-limit", "--env"}) {
                       require(std::find(args.begin(), args.end(), flag) == args.end(),
                               std::string(flag) + " should be absent");
                     }
                   }});

  tests.push_back({"probe_reports_daemon_version_or_failure", [] {
                     auto fake = std::make_shared<bt::FakeDockerRunner>();
                     sb::SandboxDriver driver({}, fake);
                     auto version = driver.probe();
                     require(version.ok() && version.value() == "24.0.7", "server version");

                     fake->daemon_up = false;
                     auto down = driver.probe();
                     require(!down.ok(), "daemon down should fail");
                     require(down.error().find("Cannot connect") != std::string::npos,
                             "daemon error surfaced");
                   }});

  tests.push_back({"ensure_image_pulls_only_when_missing", [] {
                     auto fake = std::make_shared<bt::FakeDockerRunner>();
                     sb::SandboxDriver driver({}, fake);

                     auto first = driver.ensure_image("python:3.10-slim");
                     require(first.ok() && first.value(), "missing image is pulled");
                     auto second = driver.ensure_image("python:3.10-slim");
                     require(second.ok() && !second.value(), "present image is not pulled");
                     require(fake->count("pull") == 1, "exactly one pull");

                     fake->pull_fails = true;
                     auto denied = driver.ensure_image("private/python:1");
                     require(!denied.ok(), "pull failure reported");
                     require(denied.error().find("private/python:1") != std::string::npos,
                             "image named in error");
                   }});

  tests.push_back({"driver_run_streams_logs_and_removes_container", [] {
                     bt::TempWorkspace ws;
                     auto fake = std::make_shared<bt::FakeDockerRunner>();
                     fake->behavior = [](const std::filesystem::path &, const std::string &) {
                       return bt::FakeContainerRun{.exit_code = 4, .logs = "out\nerr\n"};
                     };
                     sb::SandboxDriver driver({}, fake);

                     std::string seen;
                     auto run = driver.run(spec_for(ws),
                                           [&seen](std::string_view chunk) { seen.append(chunk); });
                     require(run.ok(), run.ok() ? "" : run.error());
                     require(run.value().exit_code == 4, "exit code from inspect");
                     require(run.value().logs == "out\nerr\n", "logs captured");
                     require(!run.value().timed_out, "not timed out");
                     require(seen == "out\nerr\n", "sink saw the stream");
                     require(fake->removed == std::vector<std::string>{"boxrun-r1"},
                             "container removed");
                     require(fake->live_containers() == 0, "no container left");
                   }});

  tests.push_back({"driver_run_kills_and_removes_on_timeout", [] {
                     bt::TempWorkspace ws;
                     auto fake = std::make_shared<bt::FakeDockerRunner>();
                     fake->behavior = [](const std::filesystem::path &, const std::string &) {
                       return bt::FakeContainerRun{.exit_code = 0, .logs = "partial\n",
                                                   .timed_out = true};
                     };
                     sb::SandboxDriver driver({}, fake);

                     auto run = driver.run(spec_for(ws));
                     require(run.ok(), "timeout is a result, not a runtime error");
                     require(run.value().timed_out, "timed_out flag");
                     require(run.value().logs == "partial\n", "partial logs kept");
                     require(fake->killed == std::vector<std::string>{"boxrun-r1"}, "killed");
                     require(fake->live_containers() == 0, "removed after kill");
                     require(!fake->saw("inspect"), "no inspect after timeout");
                   }});

  tests.push_back({"driver_run_reports_container_that_never_started", [] {
                     bt::TempWorkspace ws;
                     auto fake = std::make_shared<bt::FakeDockerRunner>();
                     fake->start_fails = true;
                     sb::SandboxDriver driver({}, fake);

                     auto run = driver.run(spec_for(ws));
                     require(!run.ok(), "never-started container is a failure");
                     require(run.error().find("created") != std::string::npos, "state reported");
                     require(run.error().find("failed to create task") != std::string::npos,
                             "daemon output included");
                     require(fake->live_containers() == 0, "container still removed");
                   }});

  tests.push_back({"driver_run_create_failure_leaves_nothing", [] {
                     bt::TempWorkspace ws;
                     auto fake = std::make_shared<bt::FakeDockerRunner>();
                     fake->create_fails = true;
                     sb::SandboxDriver driver({}, fake);

                     auto run = driver.run(spec_for(ws));
                     require(!run.ok(), "create failure");
                     require(run.error().rfind("failed to create container", 0) == 0, "cause");
                     require(!fake->saw("start"), "nothing started");
                     require(fake->count("rm") == 1, "removal attempted for the name");
                     require(fake->live_containers() == 0, "no container left");
                   }});

  tests.push_back({"driver_run_removes_container_when_create_times_out", [] {
                     bt::TempWorkspace ws;
                     auto fake = std::make_shared<bt::FakeDockerRunner>();
                     fake->create_fails_after_register = true;
                     sb::SandboxDriver driver({}, fake);

                     auto run = driver.run(spec_for(ws));
                     require(!run.ok(), "create error reported");
                     require(run.error().find("timed out") != std::string::npos, "cause kept");
                     require(fake->created == std::vector<std::string>{"boxrun-r1"},
                             "daemon registered the container");
                     require(fake->removed == std::vector<std::string>{"boxrun-r1"},
                             "registered container removed");
                     require(fake->live_containers() == 0, "no container left");
                   }});

  tests.push_back({"sandbox_handle_removes_once", [] {
                     auto fake = std::make_shared<bt::FakeDockerRunner>();
                     {
                       sb::SandboxHandle handle(fake, "boxrun-h");
                       sb::SandboxHandle moved = std::move(handle);
                       require(moved.release().ok(), "release succeeds");
                       require(moved.release().ok(), "second release is a no-op");
                     }
                     require(fake->count("rm") == 1, "exactly one rm");

                     {
                       sb::SandboxHandle scoped(fake, "boxrun-scoped");
                     }
                     require(fake->removed.back() == "boxrun-scoped", "destructor removes");
                   }});
}
