#pragma once

#include "clawboot/observability/observer.hpp"

#include <iosfwd>

namespace clawboot::observability {

enum class LogLevel { Debug = 0, Info = 1, Warn = 2, Error = 3 };

class LogObserver final : public IObserver {
public:
  explicit LogObserver(LogLevel min_level = LogLevel::Info);
  LogObserver(std::ostream &out, LogLevel min_level);

  void record_event(const ObserverEvent &event) override;
  void record_metric(const ObserverMetric &metric) override;
  void flush() override;
  [[nodiscard]] std::string_view name() const override { return "log"; }
  [[nodiscard]] LogLevel min_level() const { return min_level_; }

private:
  void log_line(LogLevel level, const std::string &message);

  std::ostream *out_;
  LogLevel min_level_;
};

} // namespace clawboot::observability
