#pragma once

#include "clawboot/common/result.hpp"
#include "clawboot/config/environment.hpp"
#include "clawboot/config/schema.hpp"
#include "clawboot/process/process.hpp"
#include "clawboot/proxy/password_hasher.hpp"
#include "clawboot/proxy/snippets.hpp"

#include <json/json.h>

#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace clawboot::bootstrap {

enum class BootStep {
  ResolveToken,
  ValidateProviders,
  EnsureDirectories,
  InstallPackages,
  SynthesizeConfig,
  GenerateSnippets,
  SelfHeal,
  ReapplyGatewaySettings,
  StartProxy,
  ClearStaleLocks,
  HandOffToGateway,
};

[[nodiscard]] const std::vector<BootStep> &boot_steps();
[[nodiscard]] std::string step_name(BootStep step);

enum class StepOutcome { Ok, Warning, Failed, Skipped };

[[nodiscard]] std::string outcome_name(StepOutcome outcome);

struct StepRecord {
  BootStep step = BootStep::ResolveToken;
  StepOutcome outcome = StepOutcome::Ok;
  std::string message;
  std::chrono::milliseconds duration{0};
};

struct BootReport {
  std::vector<StepRecord> steps;
  std::optional<BootStep> failed_step;
  /// 0 on success, 1 when a step failed, the gateway's own code when supervised.
  int exit_code = 0;

  [[nodiscard]] bool ok() const { return !failed_step.has_value(); }
  [[nodiscard]] const StepRecord *find(BootStep step) const;
};

struct BootOptions {
  BootStep stop_after = BootStep::HandOffToGateway;
  /// `configure` leaves OPENCLAW_DOCKER_APT_PACKAGES to a real boot.
  bool install_packages = true;
};

/// Runs the boot steps strictly in order. Warnings are recorded and the
/// sequence continues; the first failure stops it before the gateway is
/// started.
class BootstrapSequencer {
public:
  BootstrapSequencer(const config::BootConfig &config, const config::Environment &env,
                     process::IProcessLauncher &launcher,
                     std::unique_ptr<proxy::IPasswordHasher> hasher = nullptr);

  [[nodiscard]] BootReport run(const BootOptions &options = {});

  [[nodiscard]] const std::string &token() const { return token_; }
  [[nodiscard]] const Json::Value &document() const { return document_; }
  [[nodiscard]] std::optional<pid_t> proxy_pid() const { return proxy_pid_; }

private:
  [[nodiscard]] std::optional<std::string> skip_reason(BootStep step,
                                                       const BootOptions &options) const;
  [[nodiscard]] common::Status execute(BootStep step);

  common::Status resolve_token();
  common::Status validate_providers();
  common::Status ensure_directories();
  common::Status install_packages();
  common::Status synthesize_config();
  common::Status generate_snippets();
  common::Status self_heal();
  common::Status reapply_gateway_settings();
  common::Status start_proxy();
  common::Status clear_stale_locks();
  common::Status hand_off();

  [[nodiscard]] proxy::HooksRoute hooks_route() const;
  [[nodiscard]] config::Environment child_env() const;

  const config::BootConfig &config_;
  const config::Environment &env_;
  process::IProcessLauncher &launcher_;
  std::unique_ptr<proxy::IPasswordHasher> hasher_;

  std::string token_;
  Json::Value document_{Json::objectValue};
  std::optional<pid_t> proxy_pid_;
  std::optional<int> gateway_exit_code_;
};

} // namespace clawboot::bootstrap
