#pragma once

#include "clawboot/common/result.hpp"
#include "clawboot/config/schema.hpp"
#include "clawboot/process/process.hpp"

#include <string>
#include <vector>

namespace clawboot::proxy {

[[nodiscard]] process::ProcessSpec proxy_command(const config::ProxyConfig &proxy,
                                                 std::vector<std::string> env);

/// Starts the proxy in the background and fails unless it is still running
/// once the startup grace period has passed.
[[nodiscard]] common::Result<pid_t> start_proxy(process::IProcessLauncher &launcher,
                                                const config::ProxyConfig &proxy,
                                                std::vector<std::string> env);

} // namespace clawboot::proxy
