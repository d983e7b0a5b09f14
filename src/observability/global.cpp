#include "boxrun/observability/global.hpp"

#include <mutex>

namespace boxrun::observability {

namespace {

std::mutex g_observer_mutex;
std::unique_ptr<IObserver> g_observer;

} // namespace

void set_global_observer(std::unique_ptr<IObserver> observer) {
  std::lock_guard<std::mutex> lock(g_observer_mutex);
  if (g_observer != nullptr) {
    g_observer->flush();
  }
  g_observer = std::move(observer);
}

IObserver *get_global_observer() {
  std::lock_guard<std::mutex> lock(g_observer_mutex);
  return g_observer.get();
}

void record_event(const ObserverEvent &event) {
  if (auto *observer = get_global_observer(); observer != nullptr) {
    observer->record_event(event);
  }
}

void record_metric(const ObserverMetric &metric) {
  if (auto *observer = get_global_observer(); observer != nullptr) {
    observer->record_metric(metric);
  }
}

void record_run_start(const std::string &run_id, const std::string &script,
                      const std::string &image) {
  record_event(RunStartEvent{.run_id = run_id, .script = script, .image = image});
}

void record_phase(const std::string &run_id, const std::string &phase, const std::string &detail,
                  const bool success) {
  record_event(PhaseEvent{.run_id = run_id, .phase = phase, .detail = detail, .success = success});
}

void record_run_end(const std::string &run_id, const std::string &outcome,
                    const std::chrono::milliseconds duration) {
  record_event(RunEndEvent{.run_id = run_id, .outcome = outcome, .duration = duration});
  record_metric(RunDurationMetric{.duration = duration});
}

void record_captured_files(const std::size_t count, const std::uint64_t bytes) {
  record_metric(CapturedFilesMetric{.count = count, .bytes = bytes});
}

void record_error(const std::string &component, const std::string &message) {
  record_event(ErrorEvent{.component = component, .message = message});
}

} // namespace boxrun::observability
