#include "clawboot/providers/catalog.hpp"

#include "clawboot/common/fs.hpp"

namespace clawboot::providers {

namespace {

constexpr const char *OPENCODE_VAR = "OPENCODE_API_KEY";
constexpr const char *OPENCODE_ZEN_VAR = "OPENCODE_ZEN_API_KEY";
constexpr const char *OLLAMA_VAR = "OLLAMA_BASE_URL";
constexpr const char *AWS_ACCESS_VAR = "AWS_ACCESS_KEY_ID";
constexpr const char *AWS_SECRET_VAR = "AWS_SECRET_ACCESS_KEY";

bool credential_present(const config::Environment &env, const std::string &var) {
  if (var == OPENCODE_VAR) {
    return opencode_key(env).has_value();
  }
  if (var == OLLAMA_VAR) {
    return !ollama_base_url(env).empty();
  }
  return env.has(var);
}

} // namespace

const std::vector<BuiltinProvider> &builtin_providers() {
  static const std::vector<BuiltinProvider> providers = {
      {"ANTHROPIC_API_KEY", "Anthropic", "anthropic"},
      {"OPENAI_API_KEY", "OpenAI", "openai"},
      {"OPENROUTER_API_KEY", "OpenRouter", "openrouter"},
      {"GEMINI_API_KEY", "Google Gemini", "google"},
      {"XAI_API_KEY", "xAI", "xai"},
      {"GROQ_API_KEY", "Groq", "groq"},
      {"MISTRAL_API_KEY", "Mistral", "mistral"},
      {"CEREBRAS_API_KEY", "Cerebras", "cerebras"},
      {"ZAI_API_KEY", "ZAI", "zai"},
      {"AI_GATEWAY_API_KEY", "Vercel AI Gateway", "vercel-ai-gateway"},
      {"COPILOT_GITHUB_TOKEN", "GitHub Copilot", "github-copilot"},
  };
  return providers;
}

const std::vector<CustomProvider> &custom_providers() {
  static const std::vector<CustomProvider> providers = {
      {.key = "venice",
       .env_var = "VENICE_API_KEY",
       .api = "openai-completions",
       .base_url = "https://api.venice.ai/api/v1",
       .models = {{"llama-3.3-70b", "Llama 3.3 70B", 128000}}},
      {.key = "minimax",
       .env_var = "MINIMAX_API_KEY",
       .api = "anthropic-messages",
       .base_url = "https://api.minimax.io/anthropic",
       .models = {{"MiniMax-M2.1", "MiniMax M2.1", 200000}}},
      {.key = "moonshot",
       .env_var = "MOONSHOT_API_KEY",
       .api = "openai-completions",
       .base_url_env = "MOONSHOT_BASE_URL",
       .base_url_default = "https://api.moonshot.ai/v1",
       .models = {{"kimi-k2.5", "Kimi K2.5", 128000}}},
      {.key = "kimi-coding",
       .env_var = "KIMI_API_KEY",
       .api = "anthropic-messages",
       .base_url_env = "KIMI_BASE_URL",
       .base_url_default = "https://api.moonshot.ai/anthropic",
       .models = {{"k2p5", "Kimi K2P5", 128000}}},
      {.key = "synthetic",
       .env_var = "SYNTHETIC_API_KEY",
       .api = "anthropic-messages",
       .base_url = "https://api.synthetic.new/anthropic",
       .models = {{"hf:MiniMaxAI/MiniMax-M2.1", "MiniMax M2.1", 192000}}},
      {.key = "xiaomi",
       .env_var = "XIAOMI_API_KEY",
       .api = "anthropic-messages",
       .base_url = "https://api.xiaomimimo.com/anthropic",
       .models = {{"mimo-v2-flash", "MiMo v2 Flash", 262144}}},
  };
  return providers;
}

const std::vector<PrimaryModelRule> &primary_model_priority() {
  static const std::vector<PrimaryModelRule> rules = {
      {"ANTHROPIC_API_KEY", "anthropic/claude-opus-4-5-20251101"},
      {"OPENAI_API_KEY", "openai/gpt-5.2"},
      {"OPENROUTER_API_KEY", "openrouter/anthropic/claude-opus-4-5"},
      {"GEMINI_API_KEY", "google/gemini-2.5-pro"},
      {OPENCODE_VAR, "opencode/claude-opus-4-5"},
      {"COPILOT_GITHUB_TOKEN", "github-copilot/claude-opus-4-5"},
      {"XAI_API_KEY", "xai/grok-3"},
      {"GROQ_API_KEY", "groq/llama-3.3-70b-versatile"},
      {"MISTRAL_API_KEY", "mistral/mistral-large-latest"},
      {"CEREBRAS_API_KEY", "cerebras/llama-3.3-70b"},
      {"VENICE_API_KEY", "venice/llama-3.3-70b"},
      {"MOONSHOT_API_KEY", "moonshot/kimi-k2.5"},
      {"KIMI_API_KEY", "kimi-coding/k2p5"},
      {"MINIMAX_API_KEY", "minimax/MiniMax-M2.1"},
      {"SYNTHETIC_API_KEY", "synthetic/hf:MiniMaxAI/MiniMax-M2.1"},
      {"ZAI_API_KEY", "zai/glm-4.7"},
      {"AI_GATEWAY_API_KEY", "vercel-ai-gateway/anthropic/claude-opus-4.5"},
      {"XIAOMI_API_KEY", "xiaomi/mimo-v2-flash"},
      {AWS_ACCESS_VAR, "amazon-bedrock/anthropic.claude-opus-4-5-20251101-v1:0"},
      {OLLAMA_VAR, "ollama/llama3.3"},
  };
  return rules;
}

std::vector<std::string> credential_variables() {
  std::vector<std::string> vars;
  for (const auto &provider : builtin_providers()) {
    vars.push_back(provider.env_var);
  }
  vars.push_back(OPENCODE_VAR);
  vars.push_back(OPENCODE_ZEN_VAR);
  for (const auto &provider : custom_providers()) {
    vars.push_back(provider.env_var);
  }
  return vars;
}

std::optional<std::string> opencode_key(const config::Environment &env) {
  if (env.has(OPENCODE_VAR)) {
    return env.get(OPENCODE_VAR);
  }
  if (env.has(OPENCODE_ZEN_VAR)) {
    return env.get(OPENCODE_ZEN_VAR);
  }
  return std::nullopt;
}

std::string ollama_base_url(const config::Environment &env) {
  return common::rstrip(env.get_or(OLLAMA_VAR, ""), '/');
}

bool has_bedrock_credentials(const config::Environment &env) {
  return env.has(AWS_ACCESS_VAR) && env.has(AWS_SECRET_VAR);
}

std::string bedrock_region(const config::Environment &env) {
  return env.get_or("AWS_REGION", env.get_or("AWS_DEFAULT_REGION", "us-east-1"));
}

bool has_provider(const config::Environment &env) {
  for (const auto &var : credential_variables()) {
    if (env.has(var)) {
      return true;
    }
  }
  return has_bedrock_credentials(env) || !ollama_base_url(env).empty();
}

std::vector<std::string> detected_providers(const config::Environment &env) {
  std::vector<std::string> labels;
  for (const auto &provider : builtin_providers()) {
    if (env.has(provider.env_var)) {
      labels.push_back(provider.label);
    }
  }
  if (opencode_key(env).has_value()) {
    labels.push_back("OpenCode");
  }
  for (const auto &provider : custom_providers()) {
    if (env.has(provider.env_var)) {
      labels.push_back(provider.key);
    }
  }
  if (has_bedrock_credentials(env)) {
    labels.push_back("Amazon Bedrock");
  }
  if (!ollama_base_url(env).empty()) {
    labels.push_back("Ollama");
  }
  return labels;
}

std::optional<std::string> select_primary_model(const config::Environment &env) {
  for (const auto &rule : primary_model_priority()) {
    if (credential_present(env, rule.env_var)) {
      return rule.model;
    }
  }
  return std::nullopt;
}

} // namespace clawboot::providers
