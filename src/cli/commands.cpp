#include "clawboot/cli/commands.hpp"

#include "clawboot/bootstrap/sequencer.hpp"
#include "clawboot/common/fs.hpp"
#include "clawboot/config/config.hpp"
#include "clawboot/observability/factory.hpp"
#include "clawboot/observability/global.hpp"
#include "clawboot/providers/catalog.hpp"
#include "clawboot/security/token_store.hpp"

#include <iostream>

extern char **environ;

namespace clawboot::cli {

namespace {

std::string version_string() {
#ifdef CLAWBOOT_VERSION
  return std::string("clawboot ") + CLAWBOOT_VERSION;
#else
  return "clawboot 0.1.0";
#endif
}

std::vector<std::string> collect_args(int argc, char **argv) {
  std::vector<std::string> out;
  out.reserve(static_cast<std::size_t>(argc));
  for (int i = 0; i < argc; ++i) {
    out.emplace_back(argv[i]);
  }
  return out;
}

bool take_flag(std::vector<std::string> &args, const std::string &name) {
  for (std::size_t i = 0; i < args.size(); ++i) {
    if (args[i] == name) {
      args.erase(args.begin() + static_cast<long>(i));
      return true;
    }
  }
  return false;
}

void print_help() {
  std::cout << "usage: clawboot <command> [options]\n\n"
            << "commands:\n"
            << "  boot [--supervise]   Prepare state, config and proxy, then start the gateway\n"
            << "  configure            Resolve the token, write the config and proxy snippets\n"
            << "                       (no packages installed, nothing started)\n"
            << "  token [--show]       Resolve the gateway token (masked unless --show)\n"
            << "  providers            List detected AI provider credentials\n"
            << "  version              Show version\n"
            << "  help                 Show this help\n\n"
            << "Settings are read from the environment (OPENCLAW_*, AUTH_*, HOOKS_*, PORT,\n"
            << "CLAWBOOT_*). OPENCLAW_JSON__a__b=value sets a.b in the gateway config.\n";
}

// Installs the process-wide observer once the log level is known.
common::Result<config::BootConfig> load_config(const config::Environment &env) {
  auto loaded = config::load_boot_config(env);
  if (!loaded.ok()) {
    return loaded;
  }
  const std::string &backend = loaded.value().log_backend;
  if (!observability::parse_log_level(backend).has_value() && backend != "none" &&
      backend != "noop" && backend != "off") {
    std::cerr << "[clawboot] unknown CLAWBOOT_LOG '" << backend << "', using info\n";
  }
  observability::set_global_observer(observability::create_observer(loaded.value()));
  for (const auto &warning : config::boot_config_warnings(loaded.value())) {
    observability::record_warning("config", warning);
  }
  return loaded;
}

void print_failure(const bootstrap::BootReport &report) {
  if (!report.failed_step.has_value()) {
    return;
  }
  const auto *record = report.find(*report.failed_step);
  std::cerr << "[clawboot] " << bootstrap::step_name(*report.failed_step) << " failed";
  if (record != nullptr && !record->message.empty()) {
    std::cerr << ": " << record->message;
  }
  std::cerr << "\n";
}

int run_boot(std::vector<std::string> args, const config::Environment &env,
             process::IProcessLauncher &launcher) {
  auto loaded = load_config(env);
  if (!loaded.ok()) {
    std::cerr << "[clawboot] " << loaded.error() << "\n";
    return 1;
  }
  config::BootConfig boot_config = loaded.value();
  if (take_flag(args, "--supervise")) {
    boot_config.hand_off = config::HandOffMode::Supervise;
  }
  if (!args.empty()) {
    std::cerr << "usage: clawboot boot [--supervise]\n";
    return 1;
  }

  bootstrap::BootstrapSequencer sequencer(boot_config, env, launcher);
  const auto report = sequencer.run();
  print_failure(report);
  return report.exit_code;
}

int run_configure(std::vector<std::string> args, const config::Environment &env,
                  process::IProcessLauncher &launcher) {
  if (!args.empty()) {
    std::cerr << "usage: clawboot configure\n";
    return 1;
  }
  auto loaded = load_config(env);
  if (!loaded.ok()) {
    std::cerr << "[clawboot] " << loaded.error() << "\n";
    return 1;
  }

  bootstrap::BootstrapSequencer sequencer(loaded.value(), env, launcher);
  const auto report = sequencer.run(bootstrap::BootOptions{
      .stop_after = bootstrap::BootStep::GenerateSnippets, .install_packages = false});
  print_failure(report);
  if (report.ok()) {
    std::cout << loaded.value().paths.config_file.string() << "\n";
  }
  return report.exit_code;
}

int run_token(std::vector<std::string> args, const config::Environment &env) {
  const bool show = take_flag(args, "--show");
  if (!args.empty()) {
    std::cerr << "usage: clawboot token [--show]\n";
    return 1;
  }
  auto loaded = load_config(env);
  if (!loaded.ok()) {
    std::cerr << "[clawboot] " << loaded.error() << "\n";
    return 1;
  }
  auto resolved = security::resolve_token(loaded.value().gateway.token_override,
                                          loaded.value().paths.token_file);
  if (!resolved.ok()) {
    std::cerr << "[clawboot] " << resolved.error() << "\n";
    return 1;
  }
  const auto &token = resolved.value();
  std::cout << (show ? token.value : security::mask_token(token.value)) << " ("
            << security::token_source_name(token.source) << ")\n";
  return 0;
}

int run_providers(const std::vector<std::string> &args, const config::Environment &env) {
  if (!args.empty()) {
    std::cerr << "usage: clawboot providers\n";
    return 1;
  }
  const auto detected = providers::detected_providers(env);
  if (detected.empty()) {
    std::cout << "no provider credentials set. recognized variables:\n";
    for (const auto &var : providers::credential_variables()) {
      std::cout << "  " << var << "\n";
    }
    std::cout << "  AWS_ACCESS_KEY_ID + AWS_SECRET_ACCESS_KEY\n"
              << "  OLLAMA_BASE_URL\n";
    return 0;
  }
  for (const auto &label : detected) {
    std::cout << label << "\n";
  }
  if (const auto primary = providers::select_primary_model(env); primary.has_value()) {
    std::cout << "primary model: " << *primary << "\n";
  }
  return 0;
}

} // namespace

int run_cli(std::vector<std::string> args, const config::Environment &env,
            process::IProcessLauncher &launcher) {
  if (args.empty()) {
    print_help();
    return 1;
  }

  const std::string subcommand = args[0];
  args.erase(args.begin());

  if (subcommand == "--help" || subcommand == "-h" || subcommand == "help") {
    print_help();
    return 0;
  }
  if (subcommand == "--version" || subcommand == "-V" || subcommand == "version") {
    std::cout << version_string() << "\n";
    return 0;
  }
  if (subcommand == "boot") {
    return run_boot(std::move(args), env, launcher);
  }
  if (subcommand == "configure") {
    return run_configure(std::move(args), env, launcher);
  }
  if (subcommand == "token") {
    return run_token(std::move(args), env);
  }
  if (subcommand == "providers") {
    return run_providers(args, env);
  }

  std::cerr << "Unknown command: " << subcommand << "\n";
  print_help();
  return 1;
}

int run_cli(int argc, char **argv) {
  const auto env = config::Environment::from_process(environ);
  process::PosixProcessLauncher launcher;
  std::vector<std::string> args = collect_args(argc - 1, argv + 1);
  return run_cli(std::move(args), env, launcher);
}

} // namespace clawboot::cli
