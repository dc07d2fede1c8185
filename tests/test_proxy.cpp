#include "test_framework.hpp"

#include "clawboot/proxy/password_hasher.hpp"
#include "clawboot/proxy/proxy_process.hpp"
#include "clawboot/proxy/snippets.hpp"
#include "tests/helpers/test_helpers.hpp"

#include <filesystem>
#include <memory>
#include <string>

void register_proxy_tests(std::vector<clawboot::tests::TestCase> &tests) {
  using clawboot::tests::require;
  using clawboot::tests::require_absent;
  using clawboot::tests::require_contains;
  using clawboot::tests::require_eq;
  namespace px = clawboot::proxy;
  namespace cfg = clawboot::config;
  using clawboot::testing::FakeHasher;
  using clawboot::testing::FakeLauncher;

  tests.push_back({"auth_snippet_open_without_password", [] {
                     FakeHasher hasher;
                     px::SnippetGenerator generator(hasher);
                     auto snippet = generator.auth_snippet(cfg::AuthConfig{});
                     require(snippet.ok(), snippet.error());
                     require_eq(snippet.value().content, "(auth_block) {}\n", "empty auth block");
                     require(snippet.value().file_name() == "auth.caddyfile", "file name");
                     require(hasher.calls == 0, "nothing hashed without a password");
                   }});

  tests.push_back({"auth_snippet_with_password", [] {
                     FakeHasher hasher;
                     px::SnippetGenerator generator(hasher);
                     auto snippet = generator.auth_snippet({.username = "", .password = "pw"});
                     require(snippet.ok(), snippet.error());
                     require_eq(snippet.value().content,
                                "(auth_block) {\n"
                                "    basicauth {\n"
                                "        admin hashed#1\n"
                                "    }\n"
                                "}\n",
                                "basicauth block with default user");
                     require_absent(snippet.value().content, " pw\n",
                                    "plaintext password never written");
                     require_eq(hasher.last_credentials, "admin:pw", "default user hashed");

                     hasher.fail = true;
                     require(!generator.auth_snippet({.username = "ops", .password = "pw"}).ok(),
                             "hash failure is fatal");
                   }});

  tests.push_back({"hooks_snippet_toggle", [] {
                     const auto off = px::SnippetGenerator::hooks_snippet({.enabled = false}, "tok");
                     require(off.content.empty(), "disabled hooks produce an empty snippet");
                     require(off.file_name() == "hooks.caddyfile", "hooks file name");

                     const auto on = px::SnippetGenerator::hooks_snippet(
                         {.enabled = true, .path = "/hooks", .gateway_port = 18789}, "tok");
                     require_eq(on.content,
                                "handle /hooks* {\n"
                                "    reverse_proxy localhost:18789 {\n"
                                "        header_up Authorization \"Bearer tok\"\n"
                                "    }\n"
                                "}\n",
                                "hooks route injects the bearer token");
                   }});

  tests.push_back({"generate_and_write_both_snippets", [] {
                     clawboot::testing::TempWorkspace ws;
                     FakeHasher hasher;
                     px::SnippetGenerator generator(hasher);
                     auto snippets = generator.generate(cfg::AuthConfig{}, {.enabled = false}, "t");
                     require(snippets.ok() && snippets.value().size() == 2, "two snippets");
                     const auto dir = ws.path() / "caddy.d";
                     require(px::write_snippets(dir, snippets.value()).ok(), "write succeeds");
                     require(std::filesystem::exists(dir / "auth.caddyfile"), "auth written");
                     require(std::filesystem::exists(dir / "hooks.caddyfile"), "hooks written");
                     require(std::filesystem::file_size(dir / "hooks.caddyfile") == 0,
                             "empty hooks file still present");
                   }});

  tests.push_back({"snippets_written_owner_only", [] {
                     clawboot::testing::TempWorkspace ws;
                     FakeHasher hasher;
                     px::SnippetGenerator generator(hasher);
                     const auto dir = ws.path() / "caddy.d";
                     auto snippets = generator.generate(
                         {}, {.enabled = true, .path = "/hooks", .gateway_port = 18789}, "secret-tok");
                     require(snippets.ok(), snippets.error());
                     require(px::write_snippets(dir, snippets.value()).ok(), "write succeeds");
                     for (const char *name : {"auth.caddyfile", "hooks.caddyfile"}) {
                       const auto perms = std::filesystem::status(dir / name).permissions();
                       require((perms & (std::filesystem::perms::group_all |
                                         std::filesystem::perms::others_all)) ==
                                   std::filesystem::perms::none,
                               std::string(name) + " must be owner-only");
                     }
                     require_contains(ws.read("caddy.d/hooks.caddyfile"), "Bearer secret-tok",
                                      "token routed through hooks");
                   }});

  tests.push_back({"caching_hasher_reuses_hash", [] {
                     clawboot::testing::TempWorkspace ws;
                     const auto cache = ws.path() / "proxy-auth.cache";
                     auto inner = std::make_unique<FakeHasher>();
                     FakeHasher *inner_view = inner.get();
                     px::CachingPasswordHasher hasher(std::move(inner), cache, "token-key");

                     auto first = hasher.hash("admin", "pw");
                     auto second = hasher.hash("admin", "pw");
                     require(first.ok() && second.ok(), "hashing succeeds");
                     require(first.value() == second.value(), "cached hash reused");
                     require(inner_view->calls == 1, "inner hasher called once");

                     const auto perms = std::filesystem::status(cache).permissions();
                     require((perms & std::filesystem::perms::others_read) ==
                                 std::filesystem::perms::none,
                             "cache is owner-only");
                     require(ws.read("proxy-auth.cache").find("pw") == std::string::npos,
                             "cache never stores the password");

                     auto changed = hasher.hash("admin", "new-pw");
                     require(changed.ok() && changed.value() != first.value(),
                             "new password rehashed");
                     require(inner_view->calls == 2, "inner called for new credentials");
                   }});

  tests.push_back({"snippets_stable_across_boots", [] {
                     clawboot::testing::TempWorkspace ws;
                     const auto cache = ws.path() / "proxy-auth.cache";
                     const cfg::AuthConfig auth{.username = "admin", .password = "pw"};
                     const px::HooksRoute hooks{.enabled = true};

                     px::CachingPasswordHasher first_boot(std::make_unique<FakeHasher>(), cache, "k");
                     auto first = px::SnippetGenerator(first_boot).generate(auth, hooks, "tok");
                     px::CachingPasswordHasher second_boot(std::make_unique<FakeHasher>(), cache, "k");
                     auto second = px::SnippetGenerator(second_boot).generate(auth, hooks, "tok");
                     require(first.ok() && second.ok(), "generation succeeds");
                     require(first.value()[0].content == second.value()[0].content,
                             "auth snippet identical for identical inputs");
                     require(first.value()[1].content == second.value()[1].content,
                             "hooks snippet identical for identical inputs");
                   }});

  tests.push_back({"proxy_password_hasher_runs_proxy", [] {
                     FakeLauncher launcher;
                     px::ProxyPasswordHasher hasher(launcher, "caddy");
                     auto hashed = hasher.hash("admin", "pw");
                     require(hashed.ok(), hashed.error());
                     require(hashed.value() == "$2a$14$fakehash", "stdout trimmed");
                     require(launcher.captures.size() == 1, "one capture");
                     const auto &spec = launcher.captures[0];
                     require(spec.program == "caddy" && spec.args.size() == 3 &&
                                 spec.args[0] == "hash-password" && spec.args[2] == "pw",
                             "hash-password invocation");
                     require(spec.timeout.has_value(), "hashing is bounded");

                     launcher.capture_output.exit_code = 1;
                     require(!hasher.hash("admin", "pw").ok(), "non-zero exit is an error");
                     launcher.capture_output.exit_code = 0;
                     launcher.capture_output.stdout_text = "\n";
                     require(!hasher.hash("admin", "pw").ok(), "empty output is an error");
                   }});

  tests.push_back({"start_proxy_checks_liveness", [] {
                     cfg::ProxyConfig proxy;
                     proxy.startup_grace = std::chrono::milliseconds(0);
                     const auto spec = px::proxy_command(proxy, {"PORT=8080"});
                     require(spec.args.size() == 5 && spec.args[0] == "run" &&
                                 spec.args[2] == "/app/Caddyfile" && spec.args[4] == "caddyfile",
                             "caddy run command");

                     FakeLauncher launcher;
                     auto started = px::start_proxy(launcher, proxy, {});
                     require(started.ok(), started.error());
                     require(launcher.spawned.size() == 1, "proxy spawned");

                     launcher.proxy_stays_up = false;
                     require(!px::start_proxy(launcher, proxy, {}).ok(),
                             "proxy that dies during startup is fatal");
                   }});
}
