#include "clawboot/synth/schema_rules.hpp"

#include "clawboot/common/fs.hpp"
#include "clawboot/config/config.hpp"
#include "clawboot/observability/global.hpp"
#include "clawboot/providers/catalog.hpp"
#include "clawboot/synth/document.hpp"
#include "clawboot/synth/value_inference.hpp"

#include <charconv>
#include <cstdint>

namespace clawboot::synth {

namespace {

constexpr const char *COMPONENT = "configure";

using FT = FieldType;

void note(const std::string &message) { observability::record_notice(COMPONENT, message); }

bool is_missing_or_null(const Json::Value &object, const std::string &key) {
  return !object.isMember(key) || object[key].isNull();
}

bool is_truthy_member(const Json::Value &object, const std::string &key) {
  return object.isObject() && object.isMember(key) && is_truthy_value(object[key]);
}

std::optional<std::int64_t> parse_int(const std::string &raw) {
  const std::string text = common::trim(raw);
  if (!is_integer_literal(text)) {
    return std::nullopt;
  }
  const char *begin = text.data();
  const char *end = text.data() + text.size();
  if (*begin == '+') {
    ++begin;
  }
  std::int64_t value = 0;
  const auto [ptr, ec] = std::from_chars(begin, end, value);
  if (ec != std::errc() || ptr != end) {
    return std::nullopt;
  }
  return value;
}

Json::Value split_list(const std::string &raw, const bool smart) {
  Json::Value items(Json::arrayValue);
  for (const auto &piece : common::split(raw, ",")) {
    const std::string item = common::trim(piece);
    if (item.empty()) {
      continue;
    }
    if (smart) {
      if (const auto number = parse_int(item); number.has_value()) {
        items.append(Json::Value(static_cast<Json::Int64>(*number)));
        continue;
      }
    }
    items.append(Json::Value(item));
  }
  return items;
}

Json::Value models_to_json(const std::vector<providers::ModelEntry> &models) {
  Json::Value out(Json::arrayValue);
  for (const auto &model : models) {
    Json::Value entry(Json::objectValue);
    entry["id"] = model.id;
    entry["name"] = model.name;
    entry["contextWindow"] = static_cast<Json::Int64>(model.context_window);
    out.append(entry);
  }
  return out;
}

Json::Value *existing_providers(Json::Value &document) {
  if (!document.isObject() || !document.isMember("models") || !document["models"].isObject()) {
    return nullptr;
  }
  Json::Value &models = document["models"];
  if (!models.isMember("providers") || !models["providers"].isObject()) {
    return nullptr;
  }
  return &models["providers"];
}

// Stale entries are only dropped when the operator did not supply a custom
// document, which may legitimately carry them.
void remove_stale_provider(Json::Value &document, const RuleContext &ctx, const std::string &key,
                           const std::string &reason) {
  if (ctx.has_custom_config) {
    return;
  }
  Json::Value *providers = existing_providers(document);
  if (providers != nullptr && providers->isMember(key)) {
    note("removing provider " + key + " (" + reason + ")");
    providers->removeMember(key);
  }
}

bool channel_gate_open(const ChannelSpec &channel, const config::Environment &env) {
  if (channel.bool_gate) {
    return config::is_truthy(env.get_or(channel.gate_vars.front(), ""));
  }
  for (const auto &var : channel.gate_vars) {
    if (!env.has(var)) {
      return false;
    }
  }
  return !channel.gate_vars.empty();
}

} // namespace

const std::vector<ChannelSpec> &channel_specs() {
  static const std::vector<ChannelSpec> channels = {
      {.key = "telegram",
       .gate_vars = {"TELEGRAM_BOT_TOKEN"},
       .token_fields = {"botToken"},
       .fields =
           {
               {"TELEGRAM_DM_POLICY", "dmPolicy", FT::String},
               {"TELEGRAM_GROUP_POLICY", "groupPolicy", FT::String},
               {"TELEGRAM_REPLY_TO_MODE", "replyToMode", FT::String},
               {"TELEGRAM_CHUNK_MODE", "chunkMode", FT::String},
               {"TELEGRAM_STREAM_MODE", "streamMode", FT::String},
               {"TELEGRAM_REACTION_NOTIFICATIONS", "reactionNotifications", FT::String},
               {"TELEGRAM_REACTION_LEVEL", "reactionLevel", FT::String},
               {"TELEGRAM_PROXY", "proxy", FT::String},
               {"TELEGRAM_WEBHOOK_URL", "webhookUrl", FT::String},
               {"TELEGRAM_WEBHOOK_SECRET", "webhookSecret", FT::String},
               {"TELEGRAM_WEBHOOK_PATH", "webhookPath", FT::String},
               {"TELEGRAM_MESSAGE_PREFIX", "messagePrefix", FT::String},
               {"TELEGRAM_LINK_PREVIEW", "linkPreview", FT::BoolDefaultTrue},
               {"TELEGRAM_ACTIONS_REACTIONS", "actions.reactions", FT::BoolDefaultTrue},
               {"TELEGRAM_ACTIONS_STICKER", "actions.sticker", FT::BoolDefaultFalse},
               {"TELEGRAM_TEXT_CHUNK_LIMIT", "textChunkLimit", FT::Int},
               {"TELEGRAM_MEDIA_MAX_MB", "mediaMaxMb", FT::Int},
               {"TELEGRAM_ALLOW_FROM", "allowFrom", FT::CsvSmart},
               {"TELEGRAM_GROUP_ALLOW_FROM", "groupAllowFrom", FT::CsvSmart},
               {"TELEGRAM_INLINE_BUTTONS", "capabilities.inlineButtons", FT::String},
           }},
      {.key = "discord",
       .gate_vars = {"DISCORD_BOT_TOKEN"},
       .token_fields = {"token"},
       .fields =
           {
               {"DISCORD_DM_POLICY", "dm.policy", FT::String},
               {"DISCORD_GROUP_POLICY", "groupPolicy", FT::String},
               {"DISCORD_REPLY_TO_MODE", "replyToMode", FT::String},
               {"DISCORD_CHUNK_MODE", "chunkMode", FT::String},
               {"DISCORD_REACTION_NOTIFICATIONS", "reactionNotifications", FT::String},
               {"DISCORD_MESSAGE_PREFIX", "messagePrefix", FT::String},
               {"DISCORD_ALLOW_BOTS", "allowBots", FT::BoolDefaultFalse},
               {"DISCORD_ACTIONS_REACTIONS", "actions.reactions", FT::BoolDefaultTrue},
               {"DISCORD_ACTIONS_STICKERS", "actions.stickers", FT::BoolDefaultTrue},
               {"DISCORD_ACTIONS_EMOJI_UPLOADS", "actions.emojiUploads", FT::BoolDefaultTrue},
               {"DISCORD_ACTIONS_STICKER_UPLOADS", "actions.stickerUploads", FT::BoolDefaultTrue},
               {"DISCORD_ACTIONS_POLLS", "actions.polls", FT::BoolDefaultTrue},
               {"DISCORD_ACTIONS_PERMISSIONS", "actions.permissions", FT::BoolDefaultTrue},
               {"DISCORD_ACTIONS_MESSAGES", "actions.messages", FT::BoolDefaultTrue},
               {"DISCORD_ACTIONS_THREADS", "actions.threads", FT::BoolDefaultTrue},
               {"DISCORD_ACTIONS_PINS", "actions.pins", FT::BoolDefaultTrue},
               {"DISCORD_ACTIONS_SEARCH", "actions.search", FT::BoolDefaultTrue},
               {"DISCORD_ACTIONS_MEMBER_INFO", "actions.memberInfo", FT::BoolDefaultTrue},
               {"DISCORD_ACTIONS_ROLE_INFO", "actions.roleInfo", FT::BoolDefaultTrue},
               {"DISCORD_ACTIONS_CHANNEL_INFO", "actions.channelInfo", FT::BoolDefaultTrue},
               {"DISCORD_ACTIONS_CHANNELS", "actions.channels", FT::BoolDefaultTrue},
               {"DISCORD_ACTIONS_VOICE_STATUS", "actions.voiceStatus", FT::BoolDefaultTrue},
               {"DISCORD_ACTIONS_EVENTS", "actions.events", FT::BoolDefaultTrue},
               {"DISCORD_ACTIONS_ROLES", "actions.roles", FT::BoolDefaultFalse},
               {"DISCORD_ACTIONS_MODERATION", "actions.moderation", FT::BoolDefaultFalse},
               {"DISCORD_TEXT_CHUNK_LIMIT", "textChunkLimit", FT::Int},
               {"DISCORD_MAX_LINES_PER_MESSAGE", "maxLinesPerMessage", FT::Int},
               {"DISCORD_MEDIA_MAX_MB", "mediaMaxMb", FT::Int},
               {"DISCORD_HISTORY_LIMIT", "historyLimit", FT::Int},
               {"DISCORD_DM_HISTORY_LIMIT", "dmHistoryLimit", FT::Int},
               {"DISCORD_DM_ALLOW_FROM", "dm.allowFrom", FT::Csv},
           }},
      {.key = "slack",
       .gate_vars = {"SLACK_BOT_TOKEN", "SLACK_APP_TOKEN"},
       .token_fields = {"botToken", "appToken"},
       .fields =
           {
               {"SLACK_USER_TOKEN", "userToken", FT::String},
               {"SLACK_SIGNING_SECRET", "signingSecret", FT::String},
               {"SLACK_MODE", "mode", FT::String},
               {"SLACK_WEBHOOK_PATH", "webhookPath", FT::String},
               {"SLACK_DM_POLICY", "dm.policy", FT::String},
               {"SLACK_GROUP_POLICY", "groupPolicy", FT::String},
               {"SLACK_REPLY_TO_MODE", "replyToMode", FT::String},
               {"SLACK_REACTION_NOTIFICATIONS", "reactionNotifications", FT::String},
               {"SLACK_CHUNK_MODE", "chunkMode", FT::String},
               {"SLACK_MESSAGE_PREFIX", "messagePrefix", FT::String},
               {"SLACK_ALLOW_BOTS", "allowBots", FT::BoolDefaultFalse},
               {"SLACK_ACTIONS_REACTIONS", "actions.reactions", FT::BoolDefaultTrue},
               {"SLACK_ACTIONS_MESSAGES", "actions.messages", FT::BoolDefaultTrue},
               {"SLACK_ACTIONS_PINS", "actions.pins", FT::BoolDefaultTrue},
               {"SLACK_ACTIONS_MEMBER_INFO", "actions.memberInfo", FT::BoolDefaultTrue},
               {"SLACK_ACTIONS_EMOJI_LIST", "actions.emojiList", FT::BoolDefaultTrue},
               {"SLACK_HISTORY_LIMIT", "historyLimit", FT::Int},
               {"SLACK_TEXT_CHUNK_LIMIT", "textChunkLimit", FT::Int},
               {"SLACK_MEDIA_MAX_MB", "mediaMaxMb", FT::Int},
               {"SLACK_DM_ALLOW_FROM", "dm.allowFrom", FT::Csv},
           }},
      {.key = "whatsapp",
       .gate_vars = {"WHATSAPP_ENABLED"},
       .bool_gate = true,
       .merge = false,
       .fields =
           {
               {"WHATSAPP_DM_POLICY", "dmPolicy", FT::String},
               {"WHATSAPP_GROUP_POLICY", "groupPolicy", FT::String},
               {"WHATSAPP_MESSAGE_PREFIX", "messagePrefix", FT::String},
               {"WHATSAPP_SELF_CHAT_MODE", "selfChatMode", FT::BoolDefaultFalse},
               {"WHATSAPP_SEND_READ_RECEIPTS", "sendReadReceipts", FT::BoolDefaultTrue},
               {"WHATSAPP_ACTIONS_REACTIONS", "actions.reactions", FT::BoolDefaultTrue},
               {"WHATSAPP_MEDIA_MAX_MB", "mediaMaxMb", FT::Int},
               {"WHATSAPP_HISTORY_LIMIT", "historyLimit", FT::Int},
               {"WHATSAPP_DM_HISTORY_LIMIT", "dmHistoryLimit", FT::Int},
               {"WHATSAPP_ALLOW_FROM", "allowFrom", FT::Csv},
               {"WHATSAPP_GROUP_ALLOW_FROM", "groupAllowFrom", FT::Csv},
               {"WHATSAPP_ACK_REACTION_EMOJI", "ackReaction.emoji", FT::String},
               {"WHATSAPP_ACK_REACTION_DIRECT", "ackReaction.direct", FT::BoolDefaultTrue},
               {"WHATSAPP_ACK_REACTION_GROUP", "ackReaction.group", FT::String},
           }},
  };
  return channels;
}

const std::vector<FieldMapping> &browser_fields() {
  static const std::vector<FieldMapping> fields = {
      {"BROWSER_CDP_URL", "cdpUrl", FT::String},
      {"BROWSER_EVALUATE_ENABLED", "evaluateEnabled", FT::BoolDefaultFalse},
      {"BROWSER_SNAPSHOT_MODE", "snapshotDefaults.mode", FT::String},
      {"BROWSER_REMOTE_TIMEOUT_MS", "remoteCdpTimeoutMs", FT::Int},
      {"BROWSER_REMOTE_HANDSHAKE_TIMEOUT_MS", "remoteCdpHandshakeTimeoutMs", FT::Int},
      {"BROWSER_DEFAULT_PROFILE", "defaultProfile", FT::String},
  };
  return fields;
}

const std::vector<FieldMapping> &hooks_fields() {
  static const std::vector<FieldMapping> fields = {
      {"HOOKS_TOKEN", "token", FT::String},
      {"HOOKS_PATH", "path", FT::String},
  };
  return fields;
}

std::optional<Json::Value> parse_field_value(const std::string &raw, const FieldType type) {
  switch (type) {
  case FieldType::String:
    return Json::Value(raw);
  case FieldType::Int: {
    const auto value = parse_int(raw);
    if (!value.has_value()) {
      return std::nullopt;
    }
    return Json::Value(static_cast<Json::Int64>(*value));
  }
  case FieldType::BoolDefaultTrue:
    return Json::Value(common::to_lower(raw) != "false");
  case FieldType::BoolDefaultFalse:
    return Json::Value(common::to_lower(raw) == "true");
  case FieldType::Csv:
    return split_list(raw, false);
  case FieldType::CsvSmart:
    return split_list(raw, true);
  }
  return Json::Value(raw);
}

std::vector<std::string> apply_fields(Json::Value &target, const std::vector<FieldMapping> &fields,
                                      const config::Environment &env) {
  std::vector<std::string> skipped;
  for (const auto &field : fields) {
    const auto raw = env.get(field.env_var);
    if (!raw.has_value()) {
      continue;
    }
    auto value = parse_field_value(*raw, field.type);
    if (!value.has_value()) {
      observability::record_warning(COMPONENT, field.env_var + " is not an integer; ignored");
      skipped.push_back(field.env_var);
      continue;
    }
    set_path(target, split_dotted(field.json_path), std::move(*value));
  }
  return skipped;
}

void apply_gateway_rules(Json::Value &document, const RuleContext &ctx) {
  Json::Value &gateway = ensure_object(document, {"gateway"});

  if (ctx.config.gateway.port_from_env) {
    gateway["port"] = ctx.config.gateway.port;
  } else if (!is_truthy_member(gateway, "port")) {
    gateway["port"] = config::DEFAULT_GATEWAY_PORT;
  }

  if (!is_truthy_member(gateway, "mode")) {
    gateway["mode"] = "local";
  }

  if (!ctx.token.empty()) {
    Json::Value &auth = ensure_object(gateway, {"auth"});
    auth["mode"] = "token";
    auth["token"] = ctx.token;
  }

  Json::Value &control_ui = ensure_object(gateway, {"controlUi"});
  if (is_missing_or_null(control_ui, "allowInsecureAuth")) {
    control_ui["allowInsecureAuth"] = true;
  }
  if (is_missing_or_null(control_ui, "enabled")) {
    control_ui["enabled"] = true;
  }
}

void apply_agent_defaults(Json::Value &document, const RuleContext &ctx) {
  Json::Value &defaults = ensure_object(document, {"agents", "defaults"});
  if (!is_truthy_member(defaults, "workspace")) {
    defaults["workspace"] = ctx.config.paths.workspace_dir.string();
  }
  ensure_object(defaults, {"model"});
}

void apply_custom_providers(Json::Value &document, const RuleContext &ctx) {
  for (const auto &provider : providers::custom_providers()) {
    if (!ctx.env.has(provider.env_var)) {
      remove_stale_provider(document, ctx, provider.key, provider.env_var + " not set");
      continue;
    }
    note("configuring " + provider.key + " provider");
    Json::Value entry(Json::objectValue);
    entry["api"] = provider.api;
    entry["apiKey"] = *ctx.env.get(provider.env_var);
    entry["models"] = models_to_json(provider.models);
    if (!provider.base_url.empty()) {
      entry["baseUrl"] = provider.base_url;
    } else {
      entry["baseUrl"] =
          common::rstrip(ctx.env.get_or(provider.base_url_env, provider.base_url_default), '/');
    }
    ensure_object(document, {"models", "providers"})[provider.key] = entry;
  }
}

void apply_bedrock_provider(Json::Value &document, const RuleContext &ctx) {
  if (!providers::has_bedrock_credentials(ctx.env)) {
    remove_stale_provider(document, ctx, "amazon-bedrock", "AWS credentials not set");
    if (!ctx.has_custom_config && document.isMember("models") && document["models"].isObject()) {
      document["models"].removeMember("bedrockDiscovery");
    }
    return;
  }

  note("configuring Amazon Bedrock provider");
  const std::string region = providers::bedrock_region(ctx.env);

  Json::Value entry(Json::objectValue);
  entry["api"] = "bedrock-converse-stream";
  entry["baseUrl"] = "https://bedrock-runtime." + region + ".amazonaws.com";
  entry["models"] = models_to_json({
      {"anthropic.claude-opus-4-5-20251101-v1:0", "Claude Opus 4.5 (Bedrock)", 200000},
      {"anthropic.claude-sonnet-4-5-20250929-v1:0", "Claude Sonnet 4.5 (Bedrock)", 200000},
  });
  ensure_object(document, {"models", "providers"})["amazon-bedrock"] = entry;

  Json::Value discovery(Json::objectValue);
  discovery["enabled"] = true;
  discovery["region"] = region;
  discovery["providerFilter"] = ctx.env.get_or("BEDROCK_PROVIDER_FILTER", "anthropic");
  discovery["refreshInterval"] = 3600;
  ensure_object(document, {"models"})["bedrockDiscovery"] = discovery;
}

void apply_ollama_provider(Json::Value &document, const RuleContext &ctx) {
  const std::string url = providers::ollama_base_url(ctx.env);
  if (url.empty()) {
    remove_stale_provider(document, ctx, "ollama", "OLLAMA_BASE_URL not set");
    return;
  }

  note("configuring Ollama provider");
  Json::Value entry(Json::objectValue);
  entry["api"] = "openai-completions";
  entry["baseUrl"] = common::ends_with(url, "/v1") ? url : url + "/v1";
  entry["models"] = models_to_json({{"llama3.3", "Llama 3.3", 128000}});
  ensure_object(document, {"models", "providers"})["ollama"] = entry;
}

void prune_builtin_providers(Json::Value &document, const RuleContext &ctx) {
  for (const auto &provider : providers::builtin_providers()) {
    if (ctx.env.has(provider.env_var)) {
      note(provider.label + " provider enabled (" + provider.env_var + " set)");
    }
    remove_stale_provider(document, ctx, provider.key, "built-in, detected by the gateway");
  }
  if (providers::opencode_key(ctx.env).has_value()) {
    note("OpenCode provider enabled");
  }
  remove_stale_provider(document, ctx, "opencode", "built-in, detected by the gateway");
}

void apply_primary_model(Json::Value &document, const RuleContext &ctx) {
  Json::Value &model = ensure_object(document, {"agents", "defaults", "model"});

  if (ctx.env.has("OPENCLAW_PRIMARY_MODEL")) {
    model["primary"] = *ctx.env.get("OPENCLAW_PRIMARY_MODEL");
    note("primary model (override): " + model["primary"].asString());
    return;
  }
  if (is_truthy_member(model, "primary")) {
    return;
  }
  if (const auto selected = providers::select_primary_model(ctx.env); selected.has_value()) {
    model["primary"] = *selected;
    note("primary model (auto): " + *selected);
  }
}

void apply_audio_transcription(Json::Value &document, const RuleContext &ctx) {
  if (!ctx.env.has("DEEPGRAM_API_KEY")) {
    return;
  }
  note("configuring Deepgram transcription");
  Json::Value &audio = ensure_object(document, {"tools", "media", "audio"});
  audio["enabled"] = true;
  Json::Value models(Json::arrayValue);
  Json::Value deepgram(Json::objectValue);
  deepgram["provider"] = "deepgram";
  deepgram["model"] = "nova-3";
  models.append(deepgram);
  audio["models"] = models;
}

void apply_channels(Json::Value &document, const RuleContext &ctx) {
  for (const auto &channel : channel_specs()) {
    if (!channel_gate_open(channel, ctx.env)) {
      continue;
    }
    note("configuring " + channel.key + " channel");
    Json::Value &channels = ensure_object(document, {"channels"});
    if (!channel.merge) {
      channels[channel.key] = Json::Value(Json::objectValue);
    }
    Json::Value &target = ensure_object(channels, {channel.key});
    target["enabled"] = true;
    for (std::size_t i = 0; i < channel.token_fields.size() && i < channel.gate_vars.size(); ++i) {
      target[channel.token_fields[i]] = *ctx.env.get(channel.gate_vars[i]);
    }
    (void)apply_fields(target, channel.fields, ctx.env);
  }

  if (document.isMember("channels") && document["channels"].isObject() &&
      document["channels"].empty()) {
    document.removeMember("channels");
  }
}

void apply_browser(Json::Value &document, const RuleContext &ctx) {
  if (!ctx.env.has("BROWSER_CDP_URL")) {
    return;
  }
  note("configuring browser tool (remote CDP)");
  (void)apply_fields(ensure_object(document, {"browser"}), browser_fields(), ctx.env);
}

void apply_hooks(Json::Value &document, const RuleContext &ctx) {
  if (!ctx.config.hooks.enabled) {
    return;
  }
  note("configuring hooks");
  Json::Value &hooks = ensure_object(document, {"hooks"});
  hooks["enabled"] = true;
  (void)apply_fields(hooks, hooks_fields(), ctx.env);
}

void apply_schema_rules(Json::Value &document, const RuleContext &ctx) {
  apply_gateway_rules(document, ctx);
  apply_agent_defaults(document, ctx);
  apply_custom_providers(document, ctx);
  apply_bedrock_provider(document, ctx);
  apply_ollama_provider(document, ctx);
  prune_builtin_providers(document, ctx);
  apply_primary_model(document, ctx);
  apply_audio_transcription(document, ctx);
  apply_channels(document, ctx);
  apply_browser(document, ctx);
  apply_hooks(document, ctx);
}

void force_gateway_settings(Json::Value &document) {
  Json::Value &gateway = ensure_object(document, {"gateway"});
  gateway["mode"] = "local";
  Json::Value &control_ui = ensure_object(gateway, {"controlUi"});
  control_ui["enabled"] = true;
  control_ui["allowInsecureAuth"] = true;
}

} // namespace clawboot::synth
