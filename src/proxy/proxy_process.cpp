#include "clawboot/proxy/proxy_process.hpp"

#include <thread>

namespace clawboot::proxy {

process::ProcessSpec proxy_command(const config::ProxyConfig &proxy,
                                   std::vector<std::string> env) {
  return process::ProcessSpec{
      .program = proxy.binary,
      .args = {"run", "--config", proxy.caddyfile.string(), "--adapter", "caddyfile"},
      .env = std::move(env)};
}

common::Result<pid_t> start_proxy(process::IProcessLauncher &launcher,
                                  const config::ProxyConfig &proxy,
                                  std::vector<std::string> env) {
  auto spawned = launcher.spawn_background(proxy_command(proxy, std::move(env)));
  if (!spawned.ok()) {
    return spawned;
  }
  const pid_t pid = spawned.value();

  if (proxy.startup_grace.count() > 0) {
    std::this_thread::sleep_for(proxy.startup_grace);
  }
  if (!launcher.is_running(pid)) {
    return common::Result<pid_t>::failure(proxy.binary + " exited during startup (config " +
                                          proxy.caddyfile.string() + ")");
  }
  return spawned;
}

} // namespace clawboot::proxy
