#pragma once

#include "boxrun/common/result.hpp"
#include "boxrun/pipeline/outcome.hpp"
#include "boxrun/pipeline/request.hpp"

#include <filesystem>
#include <set>
#include <string>

namespace boxrun::pipeline {

// Exclusively owns one staging directory. The directory and everything in it is
// removed when the context is released or destroyed.
class StagingContext {
public:
  explicit StagingContext(std::filesystem::path dir);
  ~StagingContext();

  StagingContext(StagingContext &&other) noexcept;
  StagingContext &operator=(StagingContext &&other) noexcept;
  StagingContext(const StagingContext &) = delete;
  StagingContext &operator=(const StagingContext &) = delete;

  [[nodiscard]] const std::filesystem::path &dir() const { return dir_; }

  /// Names currently present in the staging directory.
  [[nodiscard]] common::Result<std::set<std::string>> snapshot_names() const;

  /// Removes the directory now. Safe to call more than once.
  [[nodiscard]] common::Status release();

private:
  std::filesystem::path dir_;
};

struct StagingOptions {
  // Parent of the staging directories; empty means the system temp directory.
  std::filesystem::path root;
  std::string prefix = "boxrun-stage-";
};

class ContextStager {
public:
  explicit ContextStager(StagingOptions options = {});

  /// Checks script, manifest, then inputs in order. A FileNotFound error carries the
  /// offending path as its message.
  [[nodiscard]] static common::Result<void, RunError> validate(const ExecutionRequest &request);

  [[nodiscard]] common::Result<StagingContext, RunError>
  stage(const ExecutionRequest &request) const;

private:
  StagingOptions options_;
};

} // namespace boxrun::pipeline
