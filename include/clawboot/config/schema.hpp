#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

namespace clawboot::config {

struct PathsConfig {
  std::filesystem::path state_dir = "/data/.openclaw";
  std::filesystem::path workspace_dir = "/data/workspace";
  std::filesystem::path config_file = "/data/.openclaw/openclaw.json";
  std::filesystem::path custom_config_file = "/app/config/openclaw.json";
  std::filesystem::path config_template = "/app/openclaw.json.example";
  std::filesystem::path token_file = "/data/.openclaw/gateway.token";
  std::filesystem::path credentials_dir = "/data/.openclaw/credentials";
  std::filesystem::path app_dir = "/opt/openclaw/app";
  /// HOME exported to the gateway: the state dir's parent when the state dir
  /// is named `.openclaw`, otherwise the state dir itself.
  std::filesystem::path home_dir = "/data";
  std::vector<std::filesystem::path> lock_files = {"/tmp/openclaw-gateway.lock",
                                                   "/data/.openclaw/gateway.lock"};
};

struct GatewayConfig {
  std::string binary = "openclaw";
  std::uint16_t port = 18789;
  bool port_from_env = false;
  std::string bind = "lan";
  bool verbose = true;
  bool allow_unconfigured = true;
  std::string token_override;
};

struct AuthConfig {
  std::string username = "admin";
  std::string password;
};

struct HooksConfig {
  bool enabled = false;
  std::string path = "/hooks";
};

struct ProxyConfig {
  bool enabled = true;
  std::string binary = "caddy";
  std::filesystem::path caddyfile = "/app/Caddyfile";
  std::filesystem::path snippet_dir = "/app/caddy.d";
  std::filesystem::path hash_cache_file = "/data/.openclaw/proxy-auth.cache";
  std::uint16_t listen_port = 8080;
  std::chrono::milliseconds startup_grace{500};
};

enum class HandOffMode { Exec, Supervise };

struct BootConfig {
  PathsConfig paths;
  GatewayConfig gateway;
  AuthConfig auth;
  HooksConfig hooks;
  ProxyConfig proxy;
  HandOffMode hand_off = HandOffMode::Exec;
  std::vector<std::string> apt_packages;
  std::string log_backend = "info";
};

} // namespace clawboot::config
