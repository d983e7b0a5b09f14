#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace boxrun::pipeline {

struct ExecutionRequest {
  std::filesystem::path script;
  std::filesystem::path manifest;
  std::vector<std::filesystem::path> inputs;
  std::optional<std::string> script_args;
  // Either a full image reference ("python:3.12-bookworm") or a bare runtime version ("3.12").
  std::optional<std::string> image;
};

} // namespace boxrun::pipeline
