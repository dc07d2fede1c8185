#pragma once

#include "clawboot/config/environment.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace clawboot::providers {

/// Providers the gateway detects from its own environment. No
/// `models.providers` entry is written for them.
struct BuiltinProvider {
  std::string env_var;
  std::string label;
  std::string key;
};

struct ModelEntry {
  std::string id;
  std::string name;
  std::int64_t context_window = 0;
};

struct CustomProvider {
  std::string key;
  std::string env_var;
  std::string api;
  /// Fixed endpoint. Empty when the endpoint comes from `base_url_env`.
  std::string base_url;
  std::string base_url_env;
  std::string base_url_default;
  std::vector<ModelEntry> models;
};

struct PrimaryModelRule {
  std::string env_var;
  std::string model;
};

[[nodiscard]] const std::vector<BuiltinProvider> &builtin_providers();
[[nodiscard]] const std::vector<CustomProvider> &custom_providers();
[[nodiscard]] const std::vector<PrimaryModelRule> &primary_model_priority();

[[nodiscard]] std::vector<std::string> credential_variables();

[[nodiscard]] std::optional<std::string> opencode_key(const config::Environment &env);
[[nodiscard]] std::string ollama_base_url(const config::Environment &env);
[[nodiscard]] bool has_bedrock_credentials(const config::Environment &env);
[[nodiscard]] std::string bedrock_region(const config::Environment &env);

[[nodiscard]] bool has_provider(const config::Environment &env);

[[nodiscard]] std::vector<std::string> detected_providers(const config::Environment &env);

[[nodiscard]] std::optional<std::string> select_primary_model(const config::Environment &env);

} // namespace clawboot::providers
