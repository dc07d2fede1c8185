#pragma once

#include <chrono>
#include <cstdint>
#include <string>
#include <string_view>
#include <variant>

namespace clawboot::observability {

struct StepStartEvent {
  std::string step;
};

struct StepEndEvent {
  std::string step;
  std::string outcome;
  std::string message;
};

struct NoticeEvent {
  std::string component;
  std::string message;
};

struct WarningEvent {
  std::string component;
  std::string message;
};

struct ErrorEvent {
  std::string component;
  std::string message;
};

using ObserverEvent =
    std::variant<StepStartEvent, StepEndEvent, NoticeEvent, WarningEvent, ErrorEvent>;

struct StepDurationMetric {
  std::string step;
  std::chrono::milliseconds duration{0};
};

struct BindingsAppliedMetric {
  std::uint64_t count = 0;
};

using ObserverMetric = std::variant<StepDurationMetric, BindingsAppliedMetric>;

class IObserver {
public:
  virtual ~IObserver() = default;

  virtual void record_event(const ObserverEvent &event) = 0;
  virtual void record_metric(const ObserverMetric &metric) = 0;
  virtual void flush() {}
  [[nodiscard]] virtual std::string_view name() const = 0;
};

} // namespace clawboot::observability
