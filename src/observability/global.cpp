#include "clawboot/observability/global.hpp"

#include <mutex>

namespace clawboot::observability {

namespace {

std::mutex g_observer_mutex;
std::unique_ptr<IObserver> g_observer;

} // namespace

void set_global_observer(std::unique_ptr<IObserver> observer) {
  std::lock_guard<std::mutex> lock(g_observer_mutex);
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

void record_step_start(const std::string &step) { record_event(StepStartEvent{.step = step}); }

void record_step_end(const std::string &step, const std::string &outcome,
                     const std::string &message, const std::chrono::milliseconds duration) {
  record_event(StepEndEvent{.step = step, .outcome = outcome, .message = message});
  record_metric(StepDurationMetric{.step = step, .duration = duration});
}

void record_notice(const std::string &component, const std::string &message) {
  record_event(NoticeEvent{.component = component, .message = message});
}

void record_warning(const std::string &component, const std::string &message) {
  record_event(WarningEvent{.component = component, .message = message});
}

void record_error(const std::string &component, const std::string &message) {
  record_event(ErrorEvent{.component = component, .message = message});
}

void flush() {
  if (auto *observer = get_global_observer(); observer != nullptr) {
    observer->flush();
  }
}

} // namespace clawboot::observability
