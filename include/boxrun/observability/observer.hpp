#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <variant>

namespace boxrun::observability {

struct RunStartEvent {
  std::string run_id;
  std::string script;
  std::string image;
};

// One orchestration step: stage, image, container, classify, collect, cleanup.
struct PhaseEvent {
  std::string run_id;
  std::string phase;
  std::string detail;
  bool success = true;
};

struct RunEndEvent {
  std::string run_id;
  std::string outcome;
  std::chrono::milliseconds duration{0};
};

struct ErrorEvent {
  std::string component;
  std::string message;
};

using ObserverEvent = std::variant<RunStartEvent, PhaseEvent, RunEndEvent, ErrorEvent>;

struct RunDurationMetric {
  std::chrono::milliseconds duration{0};
};

struct CapturedFilesMetric {
  std::size_t count = 0;
  std::uint64_t bytes = 0;
};

using ObserverMetric = std::variant<RunDurationMetric, CapturedFilesMetric>;

class IObserver {
public:
  virtual ~IObserver() = default;

  virtual void record_event(const ObserverEvent &event) = 0;
  virtual void record_metric(const ObserverMetric &metric) = 0;
  virtual void flush() {}
  [[nodiscard]] virtual std::string_view name() const = 0;
};

} // namespace boxrun::observability
