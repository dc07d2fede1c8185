#pragma once

#include "clawboot/config/environment.hpp"
#include "clawboot/config/schema.hpp"

#include <json/json.h>

#include <optional>
#include <string>
#include <vector>

namespace clawboot::synth {

enum class FieldType {
  String,
  Int,
  BoolDefaultTrue,
  BoolDefaultFalse,
  Csv,
  CsvSmart,
};

struct FieldMapping {
  std::string env_var;
  std::string json_path;
  FieldType type = FieldType::String;
};

struct ChannelSpec {
  std::string key;
  /// All must be non-empty to enable the channel, unless `bool_gate` is set.
  std::vector<std::string> gate_vars;
  std::vector<std::string> token_fields;
  /// Gate is a single true/1 toggle instead of credentials.
  bool bool_gate = false;
  /// Merge into an existing channel object instead of replacing it.
  bool merge = true;
  std::vector<FieldMapping> fields;
};

[[nodiscard]] const std::vector<ChannelSpec> &channel_specs();
[[nodiscard]] const std::vector<FieldMapping> &browser_fields();
[[nodiscard]] const std::vector<FieldMapping> &hooks_fields();

[[nodiscard]] std::optional<Json::Value> parse_field_value(const std::string &raw, FieldType type);

/// Applies every mapping whose variable is set (even to the empty string).
/// Returns the names of variables skipped because their value was invalid.
std::vector<std::string> apply_fields(Json::Value &target, const std::vector<FieldMapping> &fields,
                                      const config::Environment &env);

struct RuleContext {
  const config::Environment &env;
  const config::BootConfig &config;
  std::string token;
  /// A custom document was loaded; stale provider entries are then kept.
  bool has_custom_config = false;
};

void apply_gateway_rules(Json::Value &document, const RuleContext &ctx);
void apply_agent_defaults(Json::Value &document, const RuleContext &ctx);
void apply_custom_providers(Json::Value &document, const RuleContext &ctx);
void apply_bedrock_provider(Json::Value &document, const RuleContext &ctx);
void apply_ollama_provider(Json::Value &document, const RuleContext &ctx);
void prune_builtin_providers(Json::Value &document, const RuleContext &ctx);
void apply_primary_model(Json::Value &document, const RuleContext &ctx);
void apply_audio_transcription(Json::Value &document, const RuleContext &ctx);
void apply_channels(Json::Value &document, const RuleContext &ctx);
void apply_browser(Json::Value &document, const RuleContext &ctx);
void apply_hooks(Json::Value &document, const RuleContext &ctx);

void apply_schema_rules(Json::Value &document, const RuleContext &ctx);

/// Settings the gateway needs behind the proxy, forced after self-heal:
/// gateway.mode=local, controlUi.enabled and controlUi.allowInsecureAuth.
void force_gateway_settings(Json::Value &document);

} // namespace clawboot::synth
