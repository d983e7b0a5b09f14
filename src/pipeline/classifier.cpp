#include "boxrun/pipeline/classifier.hpp"

#include "boxrun/pipeline/phases.hpp"

#include <charconv>

namespace boxrun::pipeline {

namespace {

std::optional<int> parse_code(const std::string_view text) {
  int value = 0;
  const auto *begin = text.data();
  const auto *end = text.data() + text.size();
  const auto [ptr, ec] = std::from_chars(begin, end, value);
  if (ec != std::errc() || ptr != end || text.empty()) {
    return std::nullopt;
  }
  return value;
}

// `body` is what follows "phase=" up to the end of the line.
std::optional<PhaseMarker> parse_marker_body(std::string_view body) {
  constexpr std::string_view kBegin = ":begin";
  constexpr std::string_view kEnd = ":end:code=";

  if (body.size() > kBegin.size() && body.substr(body.size() - kBegin.size()) == kBegin) {
    return PhaseMarker{
        .phase = std::string(body.substr(0, body.size() - kBegin.size())), .is_end = false,
        .code = std::nullopt};
  }
  const auto end_pos = body.find(kEnd);
  if (end_pos == std::string_view::npos || end_pos == 0) {
    return std::nullopt;
  }
  return PhaseMarker{.phase = std::string(body.substr(0, end_pos)),
                     .is_end = true,
                     .code = parse_code(body.substr(end_pos + kEnd.size()))};
}

std::string exit_suffix(const int exit_code) {
  return " (container exited with code " + std::to_string(exit_code) + ")";
}

outcome::InternalError internal(std::string cause, const std::string &logs) {
  return outcome::InternalError{.cause = std::move(cause), .logs = logs};
}

} // namespace

std::vector<PhaseMarker> scan_phase_markers(const std::string_view logs,
                                            const std::string_view nonce) {
  std::vector<PhaseMarker> markers;
  if (nonce.empty()) {
    return markers;
  }
  std::string needle(kMarkerPrefix);
  needle.append(nonce).append(":phase=");

  std::size_t pos = logs.find(needle);
  while (pos != std::string_view::npos) {
    const std::size_t body_start = pos + needle.size();
    std::size_t line_end = logs.find('\n', body_start);
    if (line_end == std::string_view::npos) {
      line_end = logs.size();
    }
    auto body = logs.substr(body_start, line_end - body_start);
    if (!body.empty() && body.back() == '\r') {
      body.remove_suffix(1);
    }
    if (auto marker = parse_marker_body(body); marker.has_value()) {
      markers.push_back(std::move(*marker));
    }
    pos = logs.find(needle, line_end);
  }
  return markers;
}

ExecutionOutcome classify_outcome(const int exit_code, const std::string &logs,
                                  const std::string_view nonce) {
  if (exit_code == 0) {
    return outcome::Success{.captured = {}, .logs = logs};
  }

  const auto markers = scan_phase_markers(logs, nonce);
  if (markers.empty()) {
    return internal("no phase markers in sandbox output" + exit_suffix(exit_code), logs);
  }

  const PhaseMarker &last = markers.back();
  if (last.phase == kPhaseInstall) {
    if (!last.is_end) {
      return outcome::EnvironmentSetupFailed{.exit_code = exit_code, .logs = logs};
    }
    if (last.code.has_value() && *last.code != 0) {
      return outcome::EnvironmentSetupFailed{.exit_code = *last.code, .logs = logs};
    }
  }

  for (auto it = markers.rbegin(); it != markers.rend(); ++it) {
    if (it->phase != kPhaseScript || !it->is_end) {
      continue;
    }
    if (!it->code.has_value()) {
      return internal("script end marker carries an unparseable exit code" +
                          exit_suffix(exit_code),
                      logs);
    }
    if (*it->code == 0) {
      return internal("script reported success but the sandbox failed" + exit_suffix(exit_code),
                      logs);
    }
    return outcome::ScriptExecutionFailed{
        .exit_code = *it->code, .logs = logs, .produced_files = {}};
  }

  if (last.phase == kPhaseEnvCreate) {
    return internal("virtual environment creation failed" + exit_suffix(exit_code), logs);
  }
  if (last.phase == kPhaseScript) {
    return internal("script phase ended without an end marker" + exit_suffix(exit_code), logs);
  }
  if (last.phase == kPhaseInstall && last.is_end && !last.code.has_value()) {
    return internal("install end marker carries an unparseable exit code" +
                        exit_suffix(exit_code),
                    logs);
  }
  return internal("sandbox stopped after phase '" + last.phase + "' without a failure marker" +
                      exit_suffix(exit_code),
                  logs);
}

} // namespace boxrun::pipeline
