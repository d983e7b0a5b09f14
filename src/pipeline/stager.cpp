#include "boxrun/pipeline/stager.hpp"

#include "boxrun/common/fs.hpp"
#include "boxrun/observability/global.hpp"

#include <vector>

namespace boxrun::pipeline {

namespace {

using StageResult = common::Result<StagingContext, RunError>;

StageResult stage_failure(std::string message) {
  return StageResult::failure(RunError{.kind = ErrorKind::InternalError,
                                       .message = std::move(message)});
}

bool is_existing_regular_file(const std::filesystem::path &path) {
  std::error_code ec;
  return std::filesystem::is_regular_file(path, ec) && !ec;
}

std::vector<std::filesystem::path> staged_paths(const ExecutionRequest &request) {
  std::vector<std::filesystem::path> paths;
  paths.reserve(request.inputs.size() + 2);
  paths.push_back(request.script);
  paths.push_back(request.manifest);
  paths.insert(paths.end(), request.inputs.begin(), request.inputs.end());
  return paths;
}

} // namespace

StagingContext::StagingContext(std::filesystem::path dir) : dir_(std::move(dir)) {}

StagingContext::~StagingContext() {
  const auto status = release();
  if (!status.ok()) {
    observability::record_error("staging", status.error());
  }
}

StagingContext::StagingContext(StagingContext &&other) noexcept : dir_(std::move(other.dir_)) {
  other.dir_.clear();
}

StagingContext &StagingContext::operator=(StagingContext &&other) noexcept {
  if (this != &other) {
    const auto status = release();
    if (!status.ok()) {
      observability::record_error("staging", status.error());
    }
    dir_ = std::move(other.dir_);
    other.dir_.clear();
  }
  return *this;
}

common::Result<std::set<std::string>> StagingContext::snapshot_names() const {
  return common::list_entry_names(dir_);
}

common::Status StagingContext::release() {
  if (dir_.empty()) {
    return common::Status::success();
  }
  std::error_code ec;
  std::filesystem::remove_all(dir_, ec);
  if (ec) {
    return common::Status::error("failed to remove staging directory " + dir_.string() + ": " +
                                 ec.message());
  }
  dir_.clear();
  return common::Status::success();
}

ContextStager::ContextStager(StagingOptions options) : options_(std::move(options)) {}

common::Result<void, RunError> ContextStager::validate(const ExecutionRequest &request) {
  for (const auto &path : staged_paths(request)) {
    if (path.empty() || !is_existing_regular_file(path)) {
      return common::Result<void, RunError>::failure(
          RunError{.kind = ErrorKind::FileNotFound, .message = path.string()});
    }
  }
  return common::Result<void, RunError>::success();
}

common::Result<StagingContext, RunError>
ContextStager::stage(const ExecutionRequest &request) const {
  if (auto valid = validate(request); !valid.ok()) {
    return StageResult::failure(valid.error());
  }

  std::error_code ec;
  std::filesystem::path root = options_.root;
  if (root.empty()) {
    root = std::filesystem::temp_directory_path(ec);
    if (ec) {
      return stage_failure("no usable temp directory: " + ec.message());
    }
  }

  const auto suffix = common::random_hex(16);
  if (!suffix.ok()) {
    return stage_failure(suffix.error());
  }
  const auto dir = root / (options_.prefix + suffix.value());
  if (!std::filesystem::create_directories(dir, ec) || ec) {
    return stage_failure("failed to create staging directory " + dir.string() +
                         (ec ? ": " + ec.message() : std::string(": already exists")));
  }

  // Owned from here on: any early return below removes the directory.
  StagingContext context(dir);
  std::filesystem::permissions(dir, std::filesystem::perms::owner_all,
                               std::filesystem::perm_options::replace, ec);
  if (ec) {
    return stage_failure("failed to restrict staging directory: " + ec.message());
  }

  // Same base name twice: the later file wins.
  for (const auto &source : staged_paths(request)) {
    const auto target = dir / source.filename();
    std::filesystem::copy_file(source, target, std::filesystem::copy_options::overwrite_existing,
                               ec);
    if (ec) {
      return stage_failure("failed to stage " + source.string() + ": " + ec.message());
    }
  }

  return StageResult::success(std::move(context));
}

} // namespace boxrun::pipeline
