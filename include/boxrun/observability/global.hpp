#pragma once

#include "boxrun/observability/observer.hpp"

#include <memory>

namespace boxrun::observability {

void set_global_observer(std::unique_ptr<IObserver> observer);
IObserver *get_global_observer();

void record_event(const ObserverEvent &event);
void record_metric(const ObserverMetric &metric);

void record_run_start(const std::string &run_id, const std::string &script,
                      const std::string &image);
void record_phase(const std::string &run_id, const std::string &phase,
                  const std::string &detail = "", bool success = true);
void record_run_end(const std::string &run_id, const std::string &outcome,
                    std::chrono::milliseconds duration);
void record_captured_files(std::size_t count, std::uint64_t bytes);
void record_error(const std::string &component, const std::string &message);

} // namespace boxrun::observability
