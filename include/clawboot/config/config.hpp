#pragma once

#include "clawboot/common/result.hpp"
#include "clawboot/config/environment.hpp"
#include "clawboot/config/schema.hpp"

#include <cstdint>
#include <string>
#include <vector>

namespace clawboot::config {

inline constexpr const char *STATE_DIR_VAR = "OPENCLAW_STATE_DIR";
inline constexpr const char *WORKSPACE_DIR_VAR = "OPENCLAW_WORKSPACE_DIR";
inline constexpr const char *GATEWAY_TOKEN_VAR = "OPENCLAW_GATEWAY_TOKEN";
inline constexpr const char *GATEWAY_PORT_VAR = "OPENCLAW_GATEWAY_PORT";
inline constexpr std::uint16_t DEFAULT_GATEWAY_PORT = 18789;

/// Builds the boot configuration from an environment snapshot. Fails only on
/// values that cannot be interpreted (ports, timeouts, modes).
[[nodiscard]] common::Result<BootConfig> load_boot_config(const Environment &env);

[[nodiscard]] std::vector<std::string> boot_config_warnings(const BootConfig &config);

[[nodiscard]] bool is_truthy(const std::string &value);

[[nodiscard]] common::Result<std::uint16_t> parse_port(const std::string &value);

} // namespace clawboot::config
