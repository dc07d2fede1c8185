#include "clawboot/observability/factory.hpp"

#include "clawboot/common/fs.hpp"

namespace clawboot::observability {

std::optional<LogLevel> parse_log_level(const std::string &value) {
  const std::string level = common::to_lower(common::trim(value));
  if (level == "debug") {
    return LogLevel::Debug;
  }
  if (level.empty() || level == "info" || level == "log") {
    return LogLevel::Info;
  }
  if (level == "warn" || level == "warning") {
    return LogLevel::Warn;
  }
  if (level == "error") {
    return LogLevel::Error;
  }
  return std::nullopt;
}

std::unique_ptr<IObserver> create_observer(const config::BootConfig &config) {
  const std::string backend = common::to_lower(common::trim(config.log_backend));
  if (backend == "none" || backend == "noop" || backend == "off") {
    return nullptr;
  }

  const auto level = parse_log_level(backend);
  return std::make_unique<LogObserver>(level.value_or(LogLevel::Info));
}

} // namespace clawboot::observability
