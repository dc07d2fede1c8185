#pragma once

#include "clawboot/observability/observer.hpp"

#include <memory>

namespace clawboot::observability {

void set_global_observer(std::unique_ptr<IObserver> observer);
IObserver *get_global_observer();

void record_event(const ObserverEvent &event);
void record_metric(const ObserverMetric &metric);

void record_step_start(const std::string &step);
void record_step_end(const std::string &step, const std::string &outcome,
                     const std::string &message, std::chrono::milliseconds duration);
void record_notice(const std::string &component, const std::string &message);
void record_warning(const std::string &component, const std::string &message);
void record_error(const std::string &component, const std::string &message);
void flush();

} // namespace clawboot::observability
