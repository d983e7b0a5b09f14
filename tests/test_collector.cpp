#include "test_framework.hpp"

#include "boxrun/pipeline/collector.hpp"
#include "tests/helpers/test_helpers.hpp"

#include <filesystem>
#include <set>

namespace {

namespace pl = boxrun::pipeline;
namespace bt = boxrun::testing;

const std::set<std::string> kStaged = {"main.py", "requirements.txt", "data.csv"};

void stage_inputs(const bt::TempWorkspace &staging) {
  (void)staging.create_file("main.py", "print('hi')\n");
  (void)staging.create_file("requirements.txt", "\n");
  (void)staging.create_file("data.csv", "a,b\n");
}

} // namespace

void register_collector_tests(std::vector<boxrun::tests::TestCase> &tests) {
  using boxrun::tests::require;

  tests.push_back({"collector_copies_only_new_files_sorted", [] {
                     bt::TempWorkspace staging;
                     bt::TempWorkspace out;
                     stage_inputs(staging);
                     (void)staging.create_file("z.txt", "last\n");
                     (void)staging.create_file("abc.txt", "abc");

                     const pl::ResultCollector collector;
                     auto captured = collector.collect(staging.path(), kStaged, out.path() / "res");
                     require(captured.ok(), "collect should succeed");
                     const auto &files = captured.value();
                     require(files.size() == 2, "two new files");
                     require(files[0].name == "abc.txt" && files[1].name == "z.txt", "sorted by name");
                     require(files[0].size == 3, "size recorded");
                     require(files[0].sha256 ==
                                 "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad",
                             "digest recorded");
                     require(bt::slurp(out.path() / "res" / "z.txt") == "last\n", "content copied");
                     require(!std::filesystem::exists(out.path() / "res" / "main.py"),
                             "inputs are not results");
                   }});

  tests.push_back({"collector_clears_stale_destination", [] {
                     bt::TempWorkspace staging;
                     bt::TempWorkspace out;
                     stage_inputs(staging);
                     (void)staging.create_file("fresh.txt", "new\n");
                     (void)out.create_file("res/stale.txt", "old\n");
                     (void)out.create_file("res/nested/older.txt", "old\n");

                     const pl::ResultCollector collector;
                     auto captured = collector.collect(staging.path(), kStaged, out.path() / "res");
                     require(captured.ok(), "collect should succeed");
                     require(bt::count_entries(out.path() / "res") == 1,
                             "only this run's results remain");
                   }});

  tests.push_back({"collector_ignores_inputs_modified_in_place", [] {
                     bt::TempWorkspace staging;
                     bt::TempWorkspace out;
                     stage_inputs(staging);
                     (void)staging.create_file("data.csv", "rewritten by script\n");

                     const pl::ResultCollector collector;
                     auto captured = collector.collect(staging.path(), kStaged, out.path() / "res");
                     require(captured.ok() && captured.value().empty(),
                             "names present before the run are never captured");
                   }});

  tests.push_back({"collector_skips_directories_and_symlinks", [] {
                     bt::TempWorkspace staging;
                     bt::TempWorkspace out;
                     stage_inputs(staging);
                     (void)staging.create_file("cache/blob.bin", "x");
                     (void)staging.create_file("real.txt", "r");
                     std::error_code ec;
                     std::filesystem::create_symlink("/etc/hostname", staging.path() / "leak", ec);
                     require(!ec, "symlink setup");

                     auto names = pl::ResultCollector::new_file_names(staging.path(), kStaged);
                     require(names.ok(), "scan should succeed");
                     require(names.value() == std::vector<std::string>{"real.txt"},
                             "only the regular file is new");
                   }});

  tests.push_back({"collector_with_no_new_files_leaves_empty_destination", [] {
                     bt::TempWorkspace staging;
                     bt::TempWorkspace out;
                     stage_inputs(staging);

                     const pl::ResultCollector collector;
                     auto captured = collector.collect(staging.path(), kStaged, out.path() / "res");
                     require(captured.ok() && captured.value().empty(), "nothing to capture");
                     require(std::filesystem::is_directory(out.path() / "res"),
                             "destination exists");
                     require(bt::count_entries(out.path() / "res") == 0, "and is empty");
                   }});

  tests.push_back({"collector_reports_unusable_destination", [] {
                     bt::TempWorkspace staging;
                     bt::TempWorkspace out;
                     stage_inputs(staging);
                     (void)staging.create_file("result.txt", "r");
                     const auto blocker = out.create_file("blocker", "not a directory");

                     const pl::ResultCollector collector;
                     auto captured = collector.collect(staging.path(), kStaged, blocker / "res");
                     require(!captured.ok(), "a file in the way should fail");
                     require(captured.error().kind == pl::ErrorKind::InternalError,
                             "collection failures are internal");

                     require(!collector.collect(staging.path(), kStaged, {}).ok(),
                             "empty destination rejected");
                   }});

  tests.push_back({"collector_reports_missing_staging", [] {
                     bt::TempWorkspace out;
                     auto names = pl::ResultCollector::new_file_names(out.path() / "gone", {});
                     require(!names.ok(), "missing staging directory should fail");
                   }});
}
