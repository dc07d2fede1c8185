#pragma once

#include "clawboot/config/schema.hpp"
#include "clawboot/observability/log_observer.hpp"
#include "clawboot/observability/observer.hpp"

#include <memory>
#include <optional>
#include <string>

namespace clawboot::observability {

[[nodiscard]] std::optional<LogLevel> parse_log_level(const std::string &value);

[[nodiscard]] std::unique_ptr<IObserver> create_observer(const config::BootConfig &config);

} // namespace clawboot::observability
