#include "clawboot/observability/log_observer.hpp"

#include <iostream>
#include <type_traits>

namespace clawboot::observability {

namespace {

const char *level_name(const LogLevel level) {
  switch (level) {
  case LogLevel::Debug:
    return "DEBUG";
  case LogLevel::Info:
    return "INFO";
  case LogLevel::Warn:
    return "WARN";
  case LogLevel::Error:
    return "ERROR";
  }
  return "INFO";
}

} // namespace

LogObserver::LogObserver(const LogLevel min_level) : out_(&std::cerr), min_level_(min_level) {}

LogObserver::LogObserver(std::ostream &out, const LogLevel min_level)
    : out_(&out), min_level_(min_level) {}

void LogObserver::log_line(const LogLevel level, const std::string &message) {
  if (level < min_level_) {
    return;
  }
  *out_ << "[" << level_name(level) << "] " << message << "\n";
}

void LogObserver::record_event(const ObserverEvent &event) {
  std::visit(
      [this](auto &&evt) {
        using T = std::decay_t<decltype(evt)>;
        if constexpr (std::is_same_v<T, StepStartEvent>) {
          log_line(LogLevel::Debug, "boot: " + evt.step + " started");
        } else if constexpr (std::is_same_v<T, StepEndEvent>) {
          std::string line = "boot: " + evt.step + " " + evt.outcome;
          if (!evt.message.empty()) {
            line += " (" + evt.message + ")";
          }
          LogLevel level = LogLevel::Info;
          if (evt.outcome == "failed") {
            level = LogLevel::Error;
          } else if (evt.outcome == "warning") {
            level = LogLevel::Warn;
          }
          log_line(level, line);
        } else if constexpr (std::is_same_v<T, NoticeEvent>) {
          log_line(LogLevel::Info, evt.component + ": " + evt.message);
        } else if constexpr (std::is_same_v<T, WarningEvent>) {
          log_line(LogLevel::Warn, evt.component + ": " + evt.message);
        } else if constexpr (std::is_same_v<T, ErrorEvent>) {
          log_line(LogLevel::Error, evt.component + ": " + evt.message);
        }
      },
      event);
}

void LogObserver::record_metric(const ObserverMetric &metric) {
  std::visit(
      [this](auto &&m) {
        using T = std::decay_t<decltype(m)>;
        if constexpr (std::is_same_v<T, StepDurationMetric>) {
          log_line(LogLevel::Debug, "metric.step_duration_ms step=" + m.step +
                                        " value=" + std::to_string(m.duration.count()));
        } else if constexpr (std::is_same_v<T, BindingsAppliedMetric>) {
          log_line(LogLevel::Debug, "metric.bindings_applied=" + std::to_string(m.count));
        }
      },
      metric);
}

void LogObserver::flush() { out_->flush(); }

} // namespace clawboot::observability
