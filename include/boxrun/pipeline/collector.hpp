#pragma once

#include "boxrun/common/result.hpp"
#include "boxrun/pipeline/outcome.hpp"

#include <filesystem>
#include <set>
#include <string>
#include <vector>

namespace boxrun::pipeline {

class ResultCollector {
public:
  /// Regular files directly under `staging` whose names are not in `pre_existing`,
  /// sorted by name. Symlinks and directories are skipped.
  [[nodiscard]] static common::Result<std::vector<std::string>>
  new_file_names(const std::filesystem::path &staging, const std::set<std::string> &pre_existing);

  /// Clears `destination`, then copies every new file into it. On any failure the
  /// destination is cleared again and an InternalError is returned.
  [[nodiscard]] common::Result<std::vector<CapturedFile>, RunError>
  collect(const std::filesystem::path &staging, const std::set<std::string> &pre_existing,
          const std::filesystem::path &destination) const;
};

} // namespace boxrun::pipeline
