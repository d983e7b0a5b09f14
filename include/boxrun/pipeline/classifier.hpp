#pragma once

#include "boxrun/pipeline/outcome.hpp"

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace boxrun::pipeline {

struct PhaseMarker {
  std::string phase;
  bool is_end = false;
  // Set on end markers whose code parsed as an integer.
  std::optional<int> code;
};

/// Marker trail for `nonce` in order of appearance. Text carrying another nonce is ignored.
[[nodiscard]] std::vector<PhaseMarker> scan_phase_markers(std::string_view logs,
                                                          std::string_view nonce);

/// Maps a finished sandbox run to its outcome. A zero exit yields Success with nothing
/// captured yet; the collector fills that in.
[[nodiscard]] ExecutionOutcome classify_outcome(int exit_code, const std::string &logs,
                                                std::string_view nonce);

} // namespace boxrun::pipeline
