#include "boxrun/observability/log_observer.hpp"

#include <iostream>
#include <type_traits>

namespace boxrun::observability {

namespace {

void log_line(std::ostream &out, const std::string &level, const std::string &message) {
  out << "[" << level << "] " << message << "\n";
}

} // namespace

LogObserver::LogObserver() : out_(&std::cerr) {}

LogObserver::LogObserver(std::ostream &out) : out_(&out) {}

void LogObserver::record_event(const ObserverEvent &event) {
  std::visit(
      [this](auto &&evt) {
        using T = std::decay_t<decltype(evt)>;
        if constexpr (std::is_same_v<T, RunStartEvent>) {
          log_line(*out_, "INFO",
                   "run.start id=" + evt.run_id + " script=" + evt.script + " image=" + evt.image);
        } else if constexpr (std::is_same_v<T, PhaseEvent>) {
          log_line(*out_, evt.success ? "INFO" : "WARN",
                   "run.phase id=" + evt.run_id + " phase=" + evt.phase +
                       (evt.detail.empty() ? std::string() : " " + evt.detail));
        } else if constexpr (std::is_same_v<T, RunEndEvent>) {
          log_line(*out_, "INFO",
                   "run.end id=" + evt.run_id + " outcome=" + evt.outcome +
                       " duration_ms=" + std::to_string(evt.duration.count()));
        } else if constexpr (std::is_same_v<T, ErrorEvent>) {
          log_line(*out_, "ERROR", evt.component + ": " + evt.message);
        }
      },
      event);
}

void LogObserver::record_metric(const ObserverMetric &metric) {
  std::visit(
      [this](auto &&m) {
        using T = std::decay_t<decltype(m)>;
        if constexpr (std::is_same_v<T, RunDurationMetric>) {
          log_line(*out_, "DEBUG", "metric.run_duration_ms=" + std::to_string(m.duration.count()));
        } else if constexpr (std::is_same_v<T, CapturedFilesMetric>) {
          log_line(*out_, "DEBUG",
                   "metric.captured_files=" + std::to_string(m.count) +
                       " bytes=" + std::to_string(m.bytes));
        }
      },
      metric);
}

void LogObserver::flush() { out_->flush(); }

} // namespace boxrun::observability
