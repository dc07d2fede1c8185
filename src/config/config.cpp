#include "clawboot/config/config.hpp"

#include "clawboot/common/fs.hpp"

#include <charconv>
#include <sstream>

namespace clawboot::config {

namespace {

constexpr const char *DEFAULT_STATE_DIR = "/data/.openclaw";
constexpr const char *DEFAULT_WORKSPACE_DIR = "/data/workspace";
constexpr const char *STATE_FOLDER_SUFFIX = "/.openclaw";
constexpr std::size_t MIN_TOKEN_LENGTH = 16;

common::Result<std::uint64_t> parse_unsigned(const std::string &name, const std::string &raw) {
  const std::string value = common::trim(raw);
  std::uint64_t parsed = 0;
  const auto *begin = value.data();
  const auto *end = value.data() + value.size();
  const auto [ptr, ec] = std::from_chars(begin, end, parsed);
  if (value.empty() || ec != std::errc() || ptr != end) {
    return common::Result<std::uint64_t>::failure(name + " must be a non-negative integer, got '" +
                                                  raw + "'");
  }
  return common::Result<std::uint64_t>::success(parsed);
}

std::vector<std::string> split_words(const std::string &value) {
  std::vector<std::string> words;
  std::istringstream stream(value);
  std::string word;
  while (stream >> word) {
    words.push_back(word);
  }
  return words;
}

bool is_disabled_word(const std::string &value) {
  const std::string lowered = common::to_lower(common::trim(value));
  return lowered == "none" || lowered == "off" || lowered == "false" || lowered == "0" ||
         lowered == "disabled";
}

} // namespace

bool is_truthy(const std::string &value) {
  const std::string lowered = common::to_lower(common::trim(value));
  return lowered == "true" || lowered == "1";
}

common::Result<std::uint16_t> parse_port(const std::string &value) {
  const auto parsed = parse_unsigned("port", value);
  if (!parsed.ok()) {
    return common::Result<std::uint16_t>::failure(parsed.error());
  }
  if (parsed.value() == 0 || parsed.value() > 65535) {
    return common::Result<std::uint16_t>::failure("port must be 1-65535, got " + value);
  }
  return common::Result<std::uint16_t>::success(static_cast<std::uint16_t>(parsed.value()));
}

common::Result<BootConfig> load_boot_config(const Environment &env) {
  BootConfig config;

  std::string state_dir = common::rstrip(env.get_or(STATE_DIR_VAR, DEFAULT_STATE_DIR), '/');
  if (state_dir.empty()) {
    state_dir = "/";
  }
  const std::string workspace_dir =
      common::rstrip(env.get_or(WORKSPACE_DIR_VAR, DEFAULT_WORKSPACE_DIR), '/');

  auto &paths = config.paths;
  paths.state_dir = state_dir;
  paths.workspace_dir = workspace_dir.empty() ? std::string("/") : workspace_dir;
  paths.config_file = env.get_or("OPENCLAW_CONFIG_PATH", (paths.state_dir / "openclaw.json").string());
  paths.custom_config_file = env.get_or("OPENCLAW_CUSTOM_CONFIG", paths.custom_config_file.string());
  paths.config_template = env.get_or("CLAWBOOT_CONFIG_TEMPLATE", paths.config_template.string());
  paths.token_file = paths.state_dir / "gateway.token";
  paths.credentials_dir = paths.state_dir / "credentials";
  paths.app_dir = env.get_or("OPENCLAW_APP_DIR", paths.app_dir.string());
  paths.lock_files = {"/tmp/openclaw-gateway.lock", paths.state_dir / "gateway.lock"};
  if (common::ends_with(state_dir, STATE_FOLDER_SUFFIX)) {
    const std::string parent =
        state_dir.substr(0, state_dir.size() - std::string(STATE_FOLDER_SUFFIX).size());
    paths.home_dir = parent.empty() ? std::string("/") : parent;
  } else {
    paths.home_dir = paths.state_dir;
  }

  auto &gateway = config.gateway;
  gateway.binary = env.get_or("CLAWBOOT_GATEWAY_BIN", gateway.binary);
  if (env.has(GATEWAY_PORT_VAR)) {
    const auto port = parse_port(*env.get(GATEWAY_PORT_VAR));
    if (!port.ok()) {
      return common::Result<BootConfig>::failure(std::string(GATEWAY_PORT_VAR) + ": " +
                                                 port.error());
    }
    gateway.port = port.value();
    gateway.port_from_env = true;
  }
  gateway.bind = common::trim(env.get_or("OPENCLAW_GATEWAY_BIND", gateway.bind));
  if (env.has("CLAWBOOT_GATEWAY_VERBOSE")) {
    gateway.verbose = is_truthy(*env.get("CLAWBOOT_GATEWAY_VERBOSE"));
  }
  gateway.token_override = common::trim(env.get_or(GATEWAY_TOKEN_VAR, ""));

  config.auth.username = env.get_or("AUTH_USERNAME", config.auth.username);
  config.auth.password = env.get_or("AUTH_PASSWORD", "");

  config.hooks.enabled = is_truthy(env.get_or("HOOKS_ENABLED", ""));
  config.hooks.path = env.get_or("HOOKS_PATH", config.hooks.path);

  auto &proxy = config.proxy;
  proxy.enabled = !is_disabled_word(env.get_or("CLAWBOOT_PROXY", "caddy"));
  proxy.binary = env.get_or("CLAWBOOT_PROXY_BIN", proxy.binary);
  proxy.caddyfile = env.get_or("CLAWBOOT_CADDYFILE", proxy.caddyfile.string());
  proxy.snippet_dir = env.get_or("CLAWBOOT_SNIPPET_DIR", proxy.snippet_dir.string());
  proxy.hash_cache_file = paths.state_dir / "proxy-auth.cache";
  if (env.has("PORT")) {
    const auto port = parse_port(*env.get("PORT"));
    if (!port.ok()) {
      return common::Result<BootConfig>::failure("PORT: " + port.error());
    }
    proxy.listen_port = port.value();
  }
  // Without the proxy the gateway owns the published port.
  if (!proxy.enabled && !gateway.port_from_env && env.has("PORT")) {
    gateway.port = proxy.listen_port;
    gateway.port_from_env = true;
  }
  if (env.has("CLAWBOOT_PROXY_GRACE_MS")) {
    const auto grace = parse_unsigned("CLAWBOOT_PROXY_GRACE_MS", *env.get("CLAWBOOT_PROXY_GRACE_MS"));
    if (!grace.ok()) {
      return common::Result<BootConfig>::failure(grace.error());
    }
    proxy.startup_grace = std::chrono::milliseconds(grace.value());
  }

  const std::string hand_off = common::to_lower(common::trim(env.get_or("CLAWBOOT_HANDOFF", "exec")));
  if (hand_off == "exec") {
    config.hand_off = HandOffMode::Exec;
  } else if (hand_off == "supervise") {
    config.hand_off = HandOffMode::Supervise;
  } else {
    return common::Result<BootConfig>::failure("CLAWBOOT_HANDOFF must be 'exec' or 'supervise', got '" +
                                               hand_off + "'");
  }

  config.apt_packages = split_words(env.get_or("OPENCLAW_DOCKER_APT_PACKAGES", ""));

  config.log_backend = common::to_lower(common::trim(env.get_or("CLAWBOOT_LOG", config.log_backend)));

  return common::Result<BootConfig>::success(std::move(config));
}

std::vector<std::string> boot_config_warnings(const BootConfig &config) {
  std::vector<std::string> warnings;

  if (!config.gateway.token_override.empty() &&
      config.gateway.token_override.size() < MIN_TOKEN_LENGTH) {
    warnings.push_back(std::string(GATEWAY_TOKEN_VAR) + " is shorter than " +
                       std::to_string(MIN_TOKEN_LENGTH) + " characters");
  }
  if (config.proxy.enabled && !config.auth.password.empty() && config.gateway.bind != "loopback") {
    warnings.push_back("gateway bind '" + config.gateway.bind +
                       "' exposes port " + std::to_string(config.gateway.port) +
                       " next to the authenticated proxy");
  }
  if (config.proxy.enabled && config.proxy.listen_port == config.gateway.port) {
    warnings.push_back("proxy and gateway share port " + std::to_string(config.gateway.port));
  }
  if (!config.proxy.enabled && config.hooks.enabled) {
    warnings.push_back("HOOKS_ENABLED has no effect without the proxy");
  }
  return warnings;
}

} // namespace clawboot::config
