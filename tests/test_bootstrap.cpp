#include "test_framework.hpp"

#include "clawboot/bootstrap/gateway_launch.hpp"
#include "clawboot/bootstrap/sequencer.hpp"
#include "clawboot/config/config.hpp"
#include "clawboot/observability/global.hpp"
#include "clawboot/observability/log_observer.hpp"
#include "clawboot/synth/document.hpp"
#include "tests/helpers/test_helpers.hpp"

#include <filesystem>
#include <fstream>
#include <initializer_list>
#include <memory>
#include <sstream>
#include <utility>

namespace {

namespace bc = clawboot::bootstrap;
namespace cfg = clawboot::config;
using clawboot::tests::require;
using clawboot::tests::require_absent;
using clawboot::tests::require_contains;
using clawboot::testing::contains;
using clawboot::testing::FakeHasher;
using clawboot::testing::FakeLauncher;

struct BootFixture {
  clawboot::testing::TempWorkspace ws;
  cfg::Environment env;
  cfg::BootConfig config;
  FakeLauncher launcher;

  explicit BootFixture(
      std::initializer_list<std::pair<const std::string, std::string>> extra = {})
      : env(clawboot::testing::boot_environment(ws)) {
    for (const auto &[name, value] : extra) {
      env.set(name, value);
    }
    reload();
  }

  void reload() {
    auto loaded = cfg::load_boot_config(env);
    require(loaded.ok(), loaded.error());
    config = loaded.value();
    config.paths.lock_files = {ws.path() / "tmp" / "openclaw-gateway.lock",
                               config.paths.state_dir / "gateway.lock"};
  }

  [[nodiscard]] std::filesystem::path config_file() const { return config.paths.config_file; }
  [[nodiscard]] std::filesystem::path snippet(const std::string &name) const {
    return config.proxy.snippet_dir / (name + ".caddyfile");
  }
};

Json::Value read_config(const BootFixture &fixture) {
  auto loaded = clawboot::synth::load_document(fixture.config_file());
  require(loaded.ok() && loaded.value().has_value(), "config file should exist and parse");
  return *loaded.value();
}

std::string read_text(const std::filesystem::path &path) {
  std::ifstream in(path);
  std::ostringstream buffer;
  buffer << in.rdbuf();
  return buffer.str();
}

bc::StepOutcome outcome_of(const bc::BootReport &report, const bc::BootStep step) {
  const auto *record = report.find(step);
  require(record != nullptr, "step " + bc::step_name(step) + " was not recorded");
  return record->outcome;
}

} // namespace

void register_bootstrap_tests(std::vector<clawboot::tests::TestCase> &tests) {
  tests.push_back({"boot_runs_every_step_and_execs_gateway", [] {
                     BootFixture f({{"ANTHROPIC_API_KEY", "sk-ant"}});
                     bc::BootstrapSequencer sequencer(f.config, f.env, f.launcher,
                                                      std::make_unique<FakeHasher>());
                     const auto report = sequencer.run();
                     require(report.ok(), "boot should succeed");
                     require(report.exit_code == 0, "exit code 0");
                     require(report.steps.size() == bc::boot_steps().size(), "every step recorded");
                     for (std::size_t i = 0; i < report.steps.size(); ++i) {
                       require(report.steps[i].step == bc::boot_steps()[i], "steps in order");
                     }
                     require(outcome_of(report, bc::BootStep::InstallPackages) ==
                                 bc::StepOutcome::Skipped,
                             "no packages requested");

                     const std::string &token = sequencer.token();
                     require(token.size() == 64, "generated token");
                     const auto doc = read_config(f);
                     require(doc["gateway"]["auth"]["token"].asString() == token,
                             "config carries the token");
                     require(doc["agents"]["defaults"]["model"]["primary"].asString() ==
                                 "anthropic/claude-opus-4-5-20251101",
                             "primary model chosen");

                     require(f.launcher.find_run("openclaw", "doctor") != nullptr, "self-heal ran");
                     require(f.launcher.find_run("openclaw", "doctor")->working_dir ==
                                 f.config.paths.app_dir,
                             "self-heal runs from the app dir");
                     require(f.launcher.spawned.size() == 1 && f.launcher.spawned[0].program == "caddy",
                             "proxy started");
                     require(sequencer.proxy_pid().has_value(), "proxy pid recorded");

                     require(f.launcher.execs.size() == 1, "gateway exec'd once");
                     const auto &gateway = f.launcher.execs[0];
                     require(gateway.program == "openclaw" && gateway.args[0] == "gateway",
                             "gateway command");
                     require(contains(gateway.args, "--allow-unconfigured"), "allow unconfigured");
                     require(contains(gateway.args, "--verbose"), "verbose by default");
                     require(contains(gateway.args, token), "token passed on the command line");
                     require(gateway.env.has_value(), "explicit child environment");
                     require(contains(*gateway.env, "OPENCLAW_GATEWAY_TOKEN=" + token),
                             "token exported");
                     require(contains(*gateway.env, "HOME=" + (f.ws.path() / "data").string()),
                             "home is the state dir parent");
                     require(contains(*gateway.env, "PORT=8080"), "proxy port exported");
                   }});

  tests.push_back({"boot_without_providers_warns_and_continues", [] {
                     BootFixture f;
                     bc::BootstrapSequencer sequencer(f.config, f.env, f.launcher,
                                                      std::make_unique<FakeHasher>());
                     const auto report = sequencer.run();
                     require(report.ok(), "missing providers is not fatal");
                     require(outcome_of(report, bc::BootStep::ValidateProviders) ==
                                 bc::StepOutcome::Warning,
                             "provider check warns");
                     require(f.launcher.execs.size() == 1 &&
                                 contains(f.launcher.execs[0].args, "--allow-unconfigured"),
                             "gateway still starts unconfigured");
                   }});

  tests.push_back({"hooks_disabled_writes_empty_snippet", [] {
                     BootFixture f({{"OPENAI_API_KEY", "sk"}});
                     bc::BootstrapSequencer sequencer(f.config, f.env, f.launcher,
                                                      std::make_unique<FakeHasher>());
                     require(sequencer.run().ok(), "boot should succeed");
                     require(std::filesystem::exists(f.snippet("hooks")), "hooks file present");
                     require(read_text(f.snippet("hooks")).empty(), "hooks file empty");
                     require(read_text(f.snippet("auth")) == "(auth_block) {}\n",
                             "open auth block without password");
                     require(f.launcher.spawned.size() == 1, "proxy still started");
                   }});

  tests.push_back({"hooks_enabled_routes_with_token", [] {
                     BootFixture f({{"OPENAI_API_KEY", "sk"},
                                    {"HOOKS_ENABLED", "true"},
                                    {"HOOKS_TOKEN", "hook-secret"},
                                    {"AUTH_PASSWORD", "pw"}});
                     bc::BootstrapSequencer sequencer(f.config, f.env, f.launcher,
                                                      std::make_unique<FakeHasher>());
                     require(sequencer.run().ok(), "boot should succeed");
                     const std::string hooks = read_text(f.snippet("hooks"));
                     require_contains(hooks, "handle /hooks* {", "hooks route");
                     require_contains(hooks, "Bearer " + sequencer.token(), "gateway token injected");
                     require_contains(read_text(f.snippet("auth")), "basicauth", "basic auth configured");
                     const auto doc = read_config(f);
                     require(doc["hooks"]["enabled"].asBool(), "hooks enabled in config");
                     require(doc["hooks"]["token"].asString() == "hook-secret", "hooks token");
                   }});

  tests.push_back({"hooks_enabled_by_document_alone", [] {
                     BootFixture f({{"OPENCLAW_JSON__hooks__enabled", "true"},
                                    {"OPENCLAW_JSON__hooks__path", "/events"}});
                     bc::BootstrapSequencer sequencer(f.config, f.env, f.launcher,
                                                      std::make_unique<FakeHasher>());
                     require(sequencer.run().ok(), "boot should succeed");
                     require(read_text(f.snippet("hooks")).find("handle /events* {") !=
                                 std::string::npos,
                             "document path used for the route");
                   }});

  tests.push_back({"malformed_custom_config_is_fatal", [] {
                     BootFixture f({{"OPENAI_API_KEY", "sk"}});
                     f.ws.create_file("app/config/openclaw.json", "{\"gateway\": ");
                     bc::BootstrapSequencer sequencer(f.config, f.env, f.launcher,
                                                      std::make_unique<FakeHasher>());
                     const auto report = sequencer.run();
                     require(!report.ok(), "boot must fail");
                     require(report.failed_step == bc::BootStep::SynthesizeConfig,
                             "fails while synthesizing");
                     require(report.exit_code == 1, "exit code 1");
                     require(report.steps.back().step == bc::BootStep::SynthesizeConfig,
                             "nothing runs after the failure");
                     require(f.launcher.spawned.empty() && f.launcher.execs.empty(),
                             "neither proxy nor gateway started");
                     require(!std::filesystem::exists(f.config_file()), "no config written");
                   }});

  tests.push_back({"self_heal_failure_is_ignored", [] {
                     BootFixture f({{"OPENAI_API_KEY", "sk"}});
                     f.launcher.exit_codes["openclaw doctor"] = 2;
                     bc::BootstrapSequencer sequencer(f.config, f.env, f.launcher,
                                                      std::make_unique<FakeHasher>());
                     const auto report = sequencer.run();
                     require(report.ok(), "self-heal failure is not fatal");
                     require(outcome_of(report, bc::BootStep::SelfHeal) == bc::StepOutcome::Warning,
                             "self-heal warns");
                     require(f.launcher.execs.size() == 1, "gateway started");
                   }});

  tests.push_back({"proxy_failure_is_fatal", [] {
                     BootFixture f({{"OPENAI_API_KEY", "sk"}});
                     f.launcher.proxy_stays_up = false;
                     bc::BootstrapSequencer sequencer(f.config, f.env, f.launcher,
                                                      std::make_unique<FakeHasher>());
                     const auto report = sequencer.run();
                     require(report.failed_step == bc::BootStep::StartProxy, "proxy step fails");
                     require(f.launcher.execs.empty(), "gateway not started");
                   }});

  tests.push_back({"hash_failure_with_password_is_fatal", [] {
                     BootFixture f({{"AUTH_PASSWORD", "pw"}});
                     auto hasher = std::make_unique<FakeHasher>();
                     hasher->fail = true;
                     bc::BootstrapSequencer sequencer(f.config, f.env, f.launcher, std::move(hasher));
                     const auto report = sequencer.run();
                     require(report.failed_step == bc::BootStep::GenerateSnippets,
                             "snippet generation fails");
                     require(f.launcher.spawned.empty(), "proxy not started");
                   }});

  tests.push_back({"stale_locks_are_cleared", [] {
                     BootFixture f;
                     f.ws.create_file("tmp/openclaw-gateway.lock", "123");
                     f.ws.create_file("data/.openclaw/gateway.lock", "456");
                     bc::BootstrapSequencer sequencer(f.config, f.env, f.launcher,
                                                      std::make_unique<FakeHasher>());
                     const auto report = sequencer.run();
                     require(report.ok(), "boot should succeed");
                     for (const auto &lock : f.config.paths.lock_files) {
                       require(!std::filesystem::exists(lock), lock.string() + " should be gone");
                     }
                     require(outcome_of(report, bc::BootStep::ClearStaleLocks) ==
                                 bc::StepOutcome::Ok,
                             "missing locks are fine too");
                   }});

  tests.push_back({"restart_keeps_token_and_operator_edits", [] {
                     BootFixture f({{"OPENAI_API_KEY", "sk"}});
                     std::string first_token;
                     {
                       bc::BootstrapSequencer first(f.config, f.env, f.launcher,
                                                    std::make_unique<FakeHasher>());
                       require(first.run().ok(), "first boot");
                       first_token = first.token();
                     }
                     auto doc = read_config(f);
                     doc["ui"]["theme"] = "dark";
                     require(clawboot::synth::save_document(f.config_file(), doc).ok(), "edit saved");

                     bc::BootstrapSequencer second(f.config, f.env, f.launcher,
                                                   std::make_unique<FakeHasher>());
                     require(second.run().ok(), "second boot");
                     require(second.token() == first_token, "token stable across restarts");
                     const auto after = read_config(f);
                     require(after["ui"]["theme"].asString() == "dark", "operator edit kept");
                   }});

  tests.push_back({"first_boot_seeds_from_template", [] {
                     BootFixture f;
                     f.ws.create_file("app/openclaw.json.example", "{\"ui\": {\"seeded\": true}}");
                     bc::BootstrapSequencer sequencer(f.config, f.env, f.launcher,
                                                      std::make_unique<FakeHasher>());
                     require(sequencer.run().ok(), "boot should succeed");
                     require(read_config(f)["ui"]["seeded"].asBool(), "template applied");
                   }});

  tests.push_back({"convention_overrides_win_and_stay_out_of_logs", [] {
                     BootFixture f({{"OPENAI_API_KEY", "sk"},
                                    {"OPENCLAW_JSON__agents__defaults__maxConcurrent", "4"},
                                    {"OPENCLAW_JSON__gateway__port", "19999"},
                                    {"OPENCLAW_JSON__channels__custom__token", "very-secret-value"}});
                     std::ostringstream log;
                     clawboot::observability::set_global_observer(
                         std::make_unique<clawboot::observability::LogObserver>(
                             log, clawboot::observability::LogLevel::Debug));
                     bc::BootstrapSequencer sequencer(f.config, f.env, f.launcher,
                                                      std::make_unique<FakeHasher>());
                     const auto report = sequencer.run();
                     clawboot::observability::set_global_observer(nullptr);

                     require(report.ok(), "boot should succeed");
                     const auto doc = read_config(f);
                     require(doc["agents"]["defaults"]["maxConcurrent"].asInt() == 4,
                             "typed override applied");
                     require(doc["gateway"]["port"].asInt() == 19999, "override beats schema rule");
                     require_contains(log.str(), "channels.custom.token", "override path logged");
                     require_absent(log.str(), "very-secret-value", "override value never logged");
                     require_absent(log.str(), sequencer.token(), "gateway token never logged");
                   }});

  tests.push_back({"proxy_disabled_skips_proxy_steps", [] {
                     BootFixture f({{"CLAWBOOT_PROXY", "off"}, {"PORT", "7000"}});
                     bc::BootstrapSequencer sequencer(f.config, f.env, f.launcher,
                                                      std::make_unique<FakeHasher>());
                     const auto report = sequencer.run();
                     require(report.ok(), "boot should succeed");
                     require(outcome_of(report, bc::BootStep::GenerateSnippets) ==
                                 bc::StepOutcome::Skipped,
                             "snippets skipped");
                     require(outcome_of(report, bc::BootStep::StartProxy) == bc::StepOutcome::Skipped,
                             "proxy skipped");
                     require(f.launcher.spawned.empty(), "no proxy process");
                     const auto &args = f.launcher.execs.at(0).args;
                     require(args[1] == "--port" && args[2] == "7000", "gateway takes PORT");
                   }});

  tests.push_back({"extra_packages_installed_before_config", [] {
                     BootFixture f({{"OPENCLAW_DOCKER_APT_PACKAGES", "jq ffmpeg"}});
                     bc::BootstrapSequencer sequencer(f.config, f.env, f.launcher,
                                                      std::make_unique<FakeHasher>());
                     require(sequencer.run().ok(), "boot should succeed");
                     const auto *update = f.launcher.find_run("apt-get", "update");
                     const auto *install = f.launcher.find_run("apt-get", "install");
                     require(update != nullptr && install != nullptr, "apt-get invoked");
                     require(contains(install->args, "jq") && contains(install->args, "ffmpeg"),
                             "requested packages installed");
                     require(contains(*install->env, "DEBIAN_FRONTEND=noninteractive"),
                             "non-interactive install");
                     require(f.launcher.find_run("rm", "-rf") != nullptr, "apt lists cleaned");

                     BootFixture failing({{"OPENCLAW_DOCKER_APT_PACKAGES", "nosuchpkg"}});
                     failing.launcher.exit_codes["apt-get install"] = 100;
                     bc::BootstrapSequencer broken(failing.config, failing.env, failing.launcher,
                                                   std::make_unique<FakeHasher>());
                     require(broken.run().failed_step == bc::BootStep::InstallPackages,
                             "failed install is fatal");
                   }});

  tests.push_back({"supervised_gateway_exit_code_propagates", [] {
                     BootFixture f({{"CLAWBOOT_HANDOFF", "supervise"}});
                     f.launcher.gateway_exit_code = 3;
                     bc::BootstrapSequencer sequencer(f.config, f.env, f.launcher,
                                                      std::make_unique<FakeHasher>());
                     const auto report = sequencer.run();
                     require(report.ok(), "supervised run completes");
                     require(report.exit_code == 3, "gateway exit code returned");
                     require(f.launcher.supervised.size() == 1 && f.launcher.execs.empty(),
                             "supervised instead of exec");
                     require(f.launcher.terminated.size() == 1 &&
                                 f.launcher.terminated[0] == *sequencer.proxy_pid(),
                             "proxy stopped after the gateway");
                   }});

  tests.push_back({"stop_after_snippets_prepares_only", [] {
                     BootFixture f({{"OPENCLAW_GATEWAY_TOKEN", "fixed-token-0123456789"}});
                     bc::BootstrapSequencer sequencer(f.config, f.env, f.launcher,
                                                      std::make_unique<FakeHasher>());
                     const auto report =
                         sequencer.run({.stop_after = bc::BootStep::GenerateSnippets});
                     require(report.ok(), "configure run succeeds");
                     require(report.steps.back().step == bc::BootStep::GenerateSnippets,
                             "stops after snippets");
                     require(f.launcher.runs.empty() && f.launcher.spawned.empty() &&
                                 f.launcher.execs.empty(),
                             "no processes started");
                     require(read_config(f)["gateway"]["auth"]["token"].asString() ==
                                 "fixed-token-0123456789",
                             "explicit token used");
                   }});

  tests.push_back({"package_install_can_be_deferred", [] {
                     BootFixture f({{"OPENCLAW_DOCKER_APT_PACKAGES", "ffmpeg"}});
                     bc::BootstrapSequencer sequencer(f.config, f.env, f.launcher,
                                                      std::make_unique<FakeHasher>());
                     const auto report = sequencer.run({.stop_after = bc::BootStep::GenerateSnippets,
                                                        .install_packages = false});
                     require(report.ok(), "prepare run succeeds");
                     const auto *install = report.find(bc::BootStep::InstallPackages);
                     require(install != nullptr && install->outcome == bc::StepOutcome::Skipped,
                             "install step recorded as skipped");
                     require(f.launcher.runs.empty(), "apt-get not run");
                   }});

  tests.push_back({"redacted_command_line_masks_token", [] {
                     cfg::BootConfig config;
                     const auto spec = bc::gateway_command(config, cfg::Environment{},
                                                           "0123456789abcdef0123456789abcdef");
                     const auto line = bc::redacted_command_line(spec);
                     require_absent(line, "0123456789abcdef0123456789abcdef", "token masked");
                     require_contains(line, "--token 0123...cdef", "mask shown");
                     require_contains(line, "--bind lan", "other args kept");
                   }});
}
