#include "test_framework.hpp"

#include "boxrun/pipeline/stager.hpp"
#include "tests/helpers/test_helpers.hpp"

#include <filesystem>

namespace {

namespace pl = boxrun::pipeline;
namespace bt = boxrun::testing;

pl::ExecutionRequest make_request(const bt::TempWorkspace &ws) {
  pl::ExecutionRequest request;
  request.script = ws.create_file("main.py", "print('hi')\n");
  request.manifest = ws.create_file("requirements.txt", "requests==2.31.0\n");
  request.inputs = {ws.create_file("data.csv", "a,b\n1,2\n")};
  return request;
}

} // namespace

void register_stager_tests(std::vector<boxrun::tests::TestCase> &tests) {
  using boxrun::tests::require;

  tests.push_back({"stager_copies_request_files_by_base_name", [] {
                     bt::TempWorkspace ws;
                     bt::TempWorkspace root;
                     const auto request = make_request(ws);
                     const pl::ContextStager stager(
                         pl::StagingOptions{.root = root.path(), .prefix = "t-"});

                     auto staged = stager.stage(request);
                     require(staged.ok(), "staging should succeed");
                     const auto &dir = staged.value().dir();
                     require(dir.parent_path() == root.path(), "staged under the configured root");
                     require(dir.filename().string().rfind("t-", 0) == 0, "prefix applied");
                     require(dir.filename().string().size() == 2 + 32, "32 hex chars after prefix");
                     require(bt::slurp(dir / "main.py") == "print('hi')\n", "script copied");
                     require(bt::slurp(dir / "requirements.txt") == "requests==2.31.0\n",
                             "manifest copied");
                     require(bt::slurp(dir / "data.csv") == "a,b\n1,2\n", "input copied");

                     const auto perms = std::filesystem::status(dir).permissions();
                     require((perms & std::filesystem::perms::group_all) ==
                                     std::filesystem::perms::none &&
                                 (perms & std::filesystem::perms::others_all) ==
                                     std::filesystem::perms::none,
                             "staging dir should be owner-only");

                     auto snapshot = staged.value().snapshot_names();
                     require(snapshot.ok() && snapshot.value().size() == 3, "three staged names");
                   }});

  tests.push_back({"stager_reports_first_missing_path_in_order", [] {
                     bt::TempWorkspace ws;
                     bt::TempWorkspace root;
                     const pl::ContextStager stager(
                         pl::StagingOptions{.root = root.path(), .prefix = "t-"});

                     auto request = make_request(ws);
                     request.manifest = ws.path() / "nope.txt";
                     request.inputs.push_back(ws.path() / "also-missing.csv");

                     auto staged = stager.stage(request);
                     require(!staged.ok(), "missing manifest should fail");
                     require(staged.error().kind == pl::ErrorKind::FileNotFound, "FileNotFound");
                     require(staged.error().message == (ws.path() / "nope.txt").string(),
                             "manifest is checked before inputs");
                     require(bt::count_entries(root.path()) == 0,
                             "no staging directory should be created");
                   }});

  tests.push_back({"stager_rejects_directories_as_inputs", [] {
                     bt::TempWorkspace ws;
                     auto request = make_request(ws);
                     std::filesystem::create_directories(ws.path() / "folder");
                     request.inputs.push_back(ws.path() / "folder");

                     auto valid = pl::ContextStager::validate(request);
                     require(!valid.ok(), "a directory is not a regular file");
                     require(valid.error().message == (ws.path() / "folder").string(),
                             "offending path reported");
                   }});

  tests.push_back({"stager_later_input_wins_on_name_collision", [] {
                     bt::TempWorkspace ws;
                     bt::TempWorkspace root;
                     auto request = make_request(ws);
                     request.inputs.push_back(ws.create_file("other/data.csv", "second\n"));

                     const pl::ContextStager stager(
                         pl::StagingOptions{.root = root.path(), .prefix = "t-"});
                     auto staged = stager.stage(request);
                     require(staged.ok(), "collisions are not errors");
                     require(bt::slurp(staged.value().dir() / "data.csv") == "second\n",
                             "the later file should overwrite");
                   }});

  tests.push_back({"staging_context_removes_directory_on_destruction", [] {
                     bt::TempWorkspace ws;
                     bt::TempWorkspace root;
                     const pl::ContextStager stager(
                         pl::StagingOptions{.root = root.path(), .prefix = "t-"});
                     std::filesystem::path dir;
                     {
                       auto staged = stager.stage(make_request(ws));
                       require(staged.ok(), "staging should succeed");
                       pl::StagingContext owned = std::move(staged.value());
                       dir = owned.dir();
                       std::filesystem::create_directories(dir / "out" / "deep");
                       require(std::filesystem::exists(dir), "directory exists while owned");
                     }
                     require(!std::filesystem::exists(dir), "directory removed with its owner");
                   }});

  tests.push_back({"staging_context_release_is_idempotent", [] {
                     bt::TempWorkspace ws;
                     bt::TempWorkspace root;
                     const pl::ContextStager stager(
                         pl::StagingOptions{.root = root.path(), .prefix = "t-"});
                     auto staged = stager.stage(make_request(ws));
                     require(staged.ok(), "staging should succeed");
                     pl::StagingContext context = std::move(staged.value());
                     const auto dir = context.dir();
                     require(context.release().ok(), "first release");
                     require(context.release().ok(), "second release");
                     require(!std::filesystem::exists(dir), "directory gone");
                   }});
}
