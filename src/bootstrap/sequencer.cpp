#include "clawboot/bootstrap/sequencer.hpp"

#include "clawboot/bootstrap/gateway_launch.hpp"
#include "clawboot/common/fs.hpp"
#include "clawboot/observability/global.hpp"
#include "clawboot/providers/catalog.hpp"
#include "clawboot/proxy/proxy_process.hpp"
#include "clawboot/security/token_store.hpp"
#include "clawboot/synth/document.hpp"
#include "clawboot/synth/synthesizer.hpp"

namespace clawboot::bootstrap {

namespace {

constexpr const char *COMPONENT = "boot";

StepOutcome outcome_of(const common::Status &status) {
  switch (status.severity()) {
  case common::Status::Severity::Ok:
    return StepOutcome::Ok;
  case common::Status::Severity::Warning:
    return StepOutcome::Warning;
  case common::Status::Severity::Error:
    return StepOutcome::Failed;
  }
  return StepOutcome::Failed;
}

} // namespace

const std::vector<BootStep> &boot_steps() {
  static const std::vector<BootStep> steps = {
      BootStep::ResolveToken,        BootStep::ValidateProviders,
      BootStep::EnsureDirectories,   BootStep::InstallPackages,
      BootStep::SynthesizeConfig,    BootStep::GenerateSnippets,
      BootStep::SelfHeal,            BootStep::ReapplyGatewaySettings,
      BootStep::StartProxy,          BootStep::ClearStaleLocks,
      BootStep::HandOffToGateway,
  };
  return steps;
}

std::string step_name(const BootStep step) {
  switch (step) {
  case BootStep::ResolveToken:
    return "resolve-token";
  case BootStep::ValidateProviders:
    return "validate-providers";
  case BootStep::EnsureDirectories:
    return "ensure-directories";
  case BootStep::InstallPackages:
    return "install-packages";
  case BootStep::SynthesizeConfig:
    return "synthesize-config";
  case BootStep::GenerateSnippets:
    return "generate-snippets";
  case BootStep::SelfHeal:
    return "self-heal";
  case BootStep::ReapplyGatewaySettings:
    return "reapply-gateway-settings";
  case BootStep::StartProxy:
    return "start-proxy";
  case BootStep::ClearStaleLocks:
    return "clear-stale-locks";
  case BootStep::HandOffToGateway:
    return "hand-off";
  }
  return "unknown";
}

std::string outcome_name(const StepOutcome outcome) {
  switch (outcome) {
  case StepOutcome::Ok:
    return "ok";
  case StepOutcome::Warning:
    return "warning";
  case StepOutcome::Failed:
    return "failed";
  case StepOutcome::Skipped:
    return "skipped";
  }
  return "unknown";
}

const StepRecord *BootReport::find(const BootStep step) const {
  for (const auto &record : steps) {
    if (record.step == step) {
      return &record;
    }
  }
  return nullptr;
}

BootstrapSequencer::BootstrapSequencer(const config::BootConfig &config,
                                       const config::Environment &env,
                                       process::IProcessLauncher &launcher,
                                       std::unique_ptr<proxy::IPasswordHasher> hasher)
    : config_(config), env_(env), launcher_(launcher), hasher_(std::move(hasher)) {}

BootReport BootstrapSequencer::run(const BootOptions &options) {
  BootReport report;

  for (const BootStep step : boot_steps()) {
    if (step > options.stop_after) {
      break;
    }
    const std::string name = step_name(step);
    StepRecord record{.step = step};

    if (const auto reason = skip_reason(step, options); reason.has_value()) {
      record.outcome = StepOutcome::Skipped;
      record.message = *reason;
      observability::record_step_end(name, outcome_name(record.outcome), record.message,
                                     record.duration);
      report.steps.push_back(std::move(record));
      continue;
    }

    observability::record_step_start(name);
    const auto started = std::chrono::steady_clock::now();
    const common::Status status = execute(step);
    record.duration = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - started);
    record.outcome = outcome_of(status);
    record.message = status.message();
    observability::record_step_end(name, outcome_name(record.outcome), record.message,
                                   record.duration);
    report.steps.push_back(std::move(record));

    if (!status.ok()) {
      report.failed_step = step;
      report.exit_code = 1;
      observability::record_error(COMPONENT, "boot aborted at " + name);
      break;
    }
  }

  if (report.ok() && gateway_exit_code_.has_value()) {
    report.exit_code = *gateway_exit_code_;
  }
  observability::flush();
  return report;
}

std::optional<std::string> BootstrapSequencer::skip_reason(const BootStep step,
                                                           const BootOptions &options) const {
  switch (step) {
  case BootStep::InstallPackages:
    if (!options.install_packages) {
      return std::string("package installation left to boot");
    }
    if (config_.apt_packages.empty()) {
      return std::string("no extra packages requested");
    }
    break;
  case BootStep::GenerateSnippets:
  case BootStep::StartProxy:
    if (!config_.proxy.enabled) {
      return std::string("proxy disabled");
    }
    break;
  default:
    break;
  }
  return std::nullopt;
}

common::Status BootstrapSequencer::execute(const BootStep step) {
  switch (step) {
  case BootStep::ResolveToken:
    return resolve_token();
  case BootStep::ValidateProviders:
    return validate_providers();
  case BootStep::EnsureDirectories:
    return ensure_directories();
  case BootStep::InstallPackages:
    return install_packages();
  case BootStep::SynthesizeConfig:
    return synthesize_config();
  case BootStep::GenerateSnippets:
    return generate_snippets();
  case BootStep::SelfHeal:
    return self_heal();
  case BootStep::ReapplyGatewaySettings:
    return reapply_gateway_settings();
  case BootStep::StartProxy:
    return start_proxy();
  case BootStep::ClearStaleLocks:
    return clear_stale_locks();
  case BootStep::HandOffToGateway:
    return hand_off();
  }
  return common::Status::error("unknown boot step");
}

common::Status BootstrapSequencer::resolve_token() {
  auto resolved = security::resolve_token(config_.gateway.token_override, config_.paths.token_file);
  if (!resolved.ok()) {
    return common::Status::error(resolved.error());
  }
  token_ = resolved.value().value;
  return common::Status::success(security::token_source_name(resolved.value().source) + " token " +
                                 security::mask_token(token_));
}

common::Status BootstrapSequencer::validate_providers() {
  if (providers::has_provider(env_)) {
    std::string labels;
    for (const auto &label : providers::detected_providers(env_)) {
      labels += labels.empty() ? label : ", " + label;
    }
    return common::Status::success(labels);
  }
  observability::record_warning(COMPONENT, "no AI provider credentials detected; set one of "
                                           "ANTHROPIC_API_KEY, OPENAI_API_KEY, "
                                           "OPENROUTER_API_KEY, ... or OLLAMA_BASE_URL");
  return common::Status::warning(
      "no provider configured, gateway starts unconfigured; configure it from the Control UI");
}

common::Status BootstrapSequencer::ensure_directories() {
  auto state = common::ensure_dir(config_.paths.state_dir, common::OWNER_ALL);
  if (!state.ok()) {
    return state.status();
  }
  auto credentials = common::ensure_dir(config_.paths.credentials_dir, common::OWNER_ALL);
  if (!credentials.ok()) {
    return credentials.status();
  }
  auto workspace = common::ensure_dir(config_.paths.workspace_dir);
  if (!workspace.ok()) {
    return workspace.status();
  }
  return common::Status::success();
}

common::Status BootstrapSequencer::install_packages() {
  std::string joined;
  for (const auto &package : config_.apt_packages) {
    joined += joined.empty() ? package : " " + package;
  }
  observability::record_notice(COMPONENT, "installing extra packages: " + joined);

  for (const auto &spec : package_install_commands(config_.apt_packages, child_env())) {
    auto exit_code = launcher_.run(spec);
    if (!exit_code.ok()) {
      return exit_code.status();
    }
    if (exit_code.value() != 0) {
      return common::Status::error(spec.program + " " + spec.args.front() + " exited with " +
                                   std::to_string(exit_code.value()));
    }
  }
  return common::Status::success(joined);
}

common::Status BootstrapSequencer::synthesize_config() {
  const synth::ConfigSynthesizer synthesizer(config_, env_);
  auto report = synthesizer.run(token_);
  if (!report.ok()) {
    return common::Status::error(report.error());
  }
  document_ = report.value().document;
  if (!report.value().rejected_bindings.empty()) {
    return common::Status::warning(std::to_string(report.value().rejected_bindings.size()) +
                                   " convention variable(s) ignored");
  }
  return common::Status::success(std::to_string(report.value().bindings_applied) +
                                 " convention override(s)");
}

proxy::HooksRoute BootstrapSequencer::hooks_route() const {
  proxy::HooksRoute route;
  route.gateway_port = config_.gateway.port;
  route.path = config_.hooks.path;

  const Json::Value *enabled = synth::find_path(document_, {"hooks", "enabled"});
  route.enabled = config_.hooks.enabled || (enabled != nullptr && synth::is_truthy_value(*enabled));

  const Json::Value *path = synth::find_path(document_, {"hooks", "path"});
  if (path != nullptr && path->isString() && !path->asString().empty()) {
    route.path = path->asString();
  }
  return route;
}

common::Status BootstrapSequencer::generate_snippets() {
  if (!hasher_) {
    hasher_ = std::make_unique<proxy::CachingPasswordHasher>(
        std::make_unique<proxy::ProxyPasswordHasher>(launcher_, config_.proxy.binary),
        config_.proxy.hash_cache_file, token_);
  }

  proxy::SnippetGenerator generator(*hasher_);
  const proxy::HooksRoute route = hooks_route();
  auto snippets = generator.generate(config_.auth, route, token_);
  if (!snippets.ok()) {
    return common::Status::error(snippets.error());
  }
  auto written = proxy::write_snippets(config_.proxy.snippet_dir, snippets.value());
  if (!written.ok()) {
    return written;
  }
  const std::string auth_state = config_.auth.password.empty() ? "no auth" : "basicauth";
  const std::string hooks_state = route.enabled ? "hooks at " + route.path : "hooks off";
  return common::Status::success(auth_state + ", " + hooks_state);
}

common::Status BootstrapSequencer::self_heal() {
  auto exit_code = launcher_.run(self_heal_command(config_, child_env()));
  if (!exit_code.ok()) {
    return common::Status::warning("self-heal could not run: " + exit_code.error());
  }
  if (exit_code.value() != 0) {
    return common::Status::warning("self-heal exited with " + std::to_string(exit_code.value()));
  }
  return common::Status::success();
}

common::Status BootstrapSequencer::reapply_gateway_settings() {
  auto status = synth::reapply_gateway_settings(config_.paths.config_file);
  if (status.ok() && !status.is_warning()) {
    auto reloaded = synth::load_document(config_.paths.config_file);
    if (reloaded.ok() && reloaded.value().has_value()) {
      document_ = *reloaded.value();
    }
  }
  return status;
}

common::Status BootstrapSequencer::start_proxy() {
  auto pid = proxy::start_proxy(launcher_, config_.proxy, child_env().to_entries());
  if (!pid.ok()) {
    return pid.status();
  }
  proxy_pid_ = pid.value();
  return common::Status::success("pid " + std::to_string(pid.value()) + ", port " +
                                 std::to_string(config_.proxy.listen_port));
}

common::Status BootstrapSequencer::clear_stale_locks() {
  std::string failures;
  for (const auto &lock : config_.paths.lock_files) {
    auto removed = common::remove_if_exists(lock);
    if (!removed.ok()) {
      failures += failures.empty() ? removed.error() : "; " + removed.error();
    }
  }
  if (!failures.empty()) {
    return common::Status::warning(failures);
  }
  return common::Status::success();
}

common::Status BootstrapSequencer::hand_off() {
  const process::ProcessSpec spec = gateway_command(config_, child_env(), token_);
  observability::record_notice(COMPONENT, "starting gateway: " + redacted_command_line(spec));

  if (config_.hand_off == config::HandOffMode::Supervise) {
    auto exit_code = launcher_.supervise(spec);
    if (!exit_code.ok()) {
      return exit_code.status();
    }
    gateway_exit_code_ = exit_code.value();
    if (proxy_pid_.has_value()) {
      launcher_.terminate(*proxy_pid_);
    }
    return common::Status::success("gateway exited with " + std::to_string(exit_code.value()));
  }

  observability::flush();
  return launcher_.exec_replace(spec);
}

config::Environment BootstrapSequencer::child_env() const {
  return child_environment(env_, config_, token_);
}

} // namespace clawboot::bootstrap
