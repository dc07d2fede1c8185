#include "clawboot/synth/synthesizer.hpp"

#include "clawboot/observability/global.hpp"
#include "clawboot/synth/convention.hpp"
#include "clawboot/synth/document.hpp"
#include "clawboot/synth/schema_rules.hpp"

namespace clawboot::synth {

namespace {

constexpr const char *COMPONENT = "configure";

} // namespace

ConfigSynthesizer::ConfigSynthesizer(const config::BootConfig &config,
                                     const config::Environment &env)
    : config_(config), env_(env) {}

common::Result<SynthesisReport> ConfigSynthesizer::build(const std::string &token) const {
  SynthesisReport report;
  report.document = Json::Value(Json::objectValue);

  auto custom = load_document(config_.paths.custom_config_file);
  if (!custom.ok()) {
    return common::Result<SynthesisReport>::failure(custom.error());
  }
  if (custom.value().has_value()) {
    report.document = std::move(*custom.value());
    report.custom_config_loaded = true;
    observability::record_notice(COMPONENT, "loaded custom config from " +
                                                config_.paths.custom_config_file.string());
  }

  auto persisted = load_document(config_.paths.config_file);
  if (!persisted.ok()) {
    return common::Result<SynthesisReport>::failure(persisted.error());
  }
  if (persisted.value().has_value()) {
    deep_merge(report.document, *persisted.value());
    report.persisted_config_loaded = true;
  } else {
    auto seed = load_document(config_.paths.config_template);
    if (!seed.ok()) {
      return common::Result<SynthesisReport>::failure(seed.error());
    }
    if (seed.value().has_value()) {
      deep_merge(report.document, *seed.value());
      report.seeded_from_template = true;
      observability::record_notice(COMPONENT, "seeded config from " +
                                                  config_.paths.config_template.string());
    } else {
      observability::record_notice(COMPONENT, "no persisted config found, starting empty");
    }
  }

  const RuleContext ctx{.env = env_,
                        .config = config_,
                        .token = token,
                        .has_custom_config = report.custom_config_loaded};
  apply_schema_rules(report.document, ctx);

  auto scan = collect_bindings(env_);
  for (const auto &name : scan.rejected) {
    observability::record_warning(COMPONENT, "ignoring " + name + ": empty path segment");
  }
  for (const auto &binding : scan.bindings) {
    // Values may carry secrets; only the path is logged.
    observability::record_notice(COMPONENT, "convention override: " + binding.dotted_path());
  }
  report.bindings_applied = apply_bindings(report.document, scan.bindings);
  report.rejected_bindings = std::move(scan.rejected);
  observability::record_metric(
      observability::BindingsAppliedMetric{.count = report.bindings_applied});

  return common::Result<SynthesisReport>::success(std::move(report));
}

common::Result<SynthesisReport> ConfigSynthesizer::run(const std::string &token) const {
  auto report = build(token);
  if (!report.ok()) {
    return report;
  }
  auto saved = save_document(config_.paths.config_file, report.value().document);
  if (!saved.ok()) {
    return common::Result<SynthesisReport>::failure(saved.error());
  }
  observability::record_notice(COMPONENT,
                               "config written to " + config_.paths.config_file.string());
  return report;
}

common::Status reapply_gateway_settings(const std::filesystem::path &config_file) {
  auto loaded = load_document(config_file);
  if (!loaded.ok()) {
    return loaded.status();
  }
  if (!loaded.value().has_value()) {
    return common::Status::warning(config_file.string() + " does not exist");
  }
  Json::Value document = std::move(*loaded.value());
  force_gateway_settings(document);
  return save_document(config_file, document);
}

} // namespace clawboot::synth
