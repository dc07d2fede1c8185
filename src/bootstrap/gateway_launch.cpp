#include "clawboot/bootstrap/gateway_launch.hpp"

#include "clawboot/config/config.hpp"
#include "clawboot/security/token_store.hpp"

namespace clawboot::bootstrap {

config::Environment child_environment(const config::Environment &env,
                                      const config::BootConfig &config, const std::string &token) {
  config::Environment child = env;
  child.set(config::GATEWAY_TOKEN_VAR, token);
  child.set(config::STATE_DIR_VAR, config.paths.state_dir.string());
  child.set(config::WORKSPACE_DIR_VAR, config.paths.workspace_dir.string());
  child.set("OPENCLAW_CONFIG_PATH", config.paths.config_file.string());
  child.set(config::GATEWAY_PORT_VAR, std::to_string(config.gateway.port));
  child.set("HOME", config.paths.home_dir.string());
  if (config.proxy.enabled) {
    child.set("PORT", std::to_string(config.proxy.listen_port));
  }
  return child;
}

process::ProcessSpec gateway_command(const config::BootConfig &config,
                                     const config::Environment &child_env,
                                     const std::string &token) {
  process::ProcessSpec spec;
  spec.program = config.gateway.binary;
  spec.args = {"gateway", "--port", std::to_string(config.gateway.port)};
  if (config.gateway.verbose) {
    spec.args.emplace_back("--verbose");
  }
  if (config.gateway.allow_unconfigured) {
    spec.args.emplace_back("--allow-unconfigured");
  }
  spec.args.insert(spec.args.end(), {"--bind", config.gateway.bind, "--token", token});
  spec.env = child_env.to_entries();
  return spec;
}

process::ProcessSpec self_heal_command(const config::BootConfig &config,
                                       const config::Environment &child_env) {
  return process::ProcessSpec{.program = config.gateway.binary,
                              .args = {"doctor", "--fix"},
                              .working_dir = config.paths.app_dir,
                              .env = child_env.to_entries()};
}

std::vector<process::ProcessSpec>
package_install_commands(const std::vector<std::string> &packages,
                         const config::Environment &child_env) {
  config::Environment apt_env = child_env;
  apt_env.set("DEBIAN_FRONTEND", "noninteractive");
  const auto entries = apt_env.to_entries();

  std::vector<std::string> install_args = {"install", "-y", "--no-install-recommends"};
  install_args.insert(install_args.end(), packages.begin(), packages.end());

  return {
      process::ProcessSpec{.program = "apt-get", .args = {"update"}, .env = entries},
      process::ProcessSpec{.program = "apt-get", .args = install_args, .env = entries},
      process::ProcessSpec{.program = "rm", .args = {"-rf", "/var/lib/apt/lists"}, .env = entries},
  };
}

std::string redacted_command_line(const process::ProcessSpec &spec) {
  std::string line = spec.program;
  bool mask_next = false;
  for (const auto &arg : spec.args) {
    line += " ";
    line += mask_next ? security::mask_token(arg) : arg;
    mask_next = arg == "--token";
  }
  return line;
}

} // namespace clawboot::bootstrap
