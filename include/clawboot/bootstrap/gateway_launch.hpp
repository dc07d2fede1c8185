#pragma once

#include "clawboot/config/environment.hpp"
#include "clawboot/config/schema.hpp"
#include "clawboot/process/process.hpp"

#include <string>
#include <vector>

namespace clawboot::bootstrap {

[[nodiscard]] config::Environment child_environment(const config::Environment &env,
                                                    const config::BootConfig &config,
                                                    const std::string &token);

[[nodiscard]] process::ProcessSpec gateway_command(const config::BootConfig &config,
                                                   const config::Environment &child_env,
                                                   const std::string &token);

[[nodiscard]] process::ProcessSpec self_heal_command(const config::BootConfig &config,
                                                     const config::Environment &child_env);

[[nodiscard]] std::vector<process::ProcessSpec>
package_install_commands(const std::vector<std::string> &packages,
                         const config::Environment &child_env);

[[nodiscard]] std::string redacted_command_line(const process::ProcessSpec &spec);

} // namespace clawboot::bootstrap
