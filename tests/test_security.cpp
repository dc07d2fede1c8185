#include "test_framework.hpp"

#include "clawboot/security/token_store.hpp"
#include "tests/helpers/test_helpers.hpp"

#include <filesystem>
#include <set>

namespace {

bool is_lower_hex(const std::string &value) {
  for (const char c : value) {
    if (!((c >= '0' && c <= '9') || (c >= 'a' && c <= 'f'))) {
      return false;
    }
  }
  return true;
}

bool owner_only(const std::filesystem::path &path) {
  namespace fs = std::filesystem;
  const auto perms = fs::status(path).permissions();
  return (perms & (fs::perms::group_all | fs::perms::others_all)) == fs::perms::none;
}

} // namespace

void register_security_tests(std::vector<clawboot::tests::TestCase> &tests) {
  using clawboot::tests::require;
  namespace sec = clawboot::security;

  tests.push_back({"generated_tokens_are_hex_and_unique", [] {
                     std::set<std::string> seen;
                     for (int i = 0; i < 16; ++i) {
                       auto token = sec::generate_token();
                       require(token.ok(), token.error());
                       require(token.value().size() == sec::TOKEN_BYTES * 2, "64 hex chars");
                       require(is_lower_hex(token.value()), "lowercase hex expected");
                       seen.insert(token.value());
                     }
                     require(seen.size() == 16, "tokens must not repeat");
                   }});

  tests.push_back({"token_generated_then_persisted", [] {
                     clawboot::testing::TempWorkspace ws;
                     const auto file = ws.path() / "state" / "gateway.token";

                     auto first = sec::resolve_token("", file);
                     require(first.ok(), first.error());
                     require(first.value().source == sec::TokenSource::Generated, "generated");
                     require(std::filesystem::exists(file), "token file written");
                     require(owner_only(file), "token file must be 0600");
                     require(ws.read("state/gateway.token") == first.value().value + "\n",
                             "file holds the token and a newline");

                     auto second = sec::resolve_token("", file);
                     require(second.ok(), second.error());
                     require(second.value().source == sec::TokenSource::Persisted, "persisted");
                     require(second.value().value == first.value().value,
                             "token stable across restarts");
                   }});

  tests.push_back({"explicit_token_wins_and_is_persisted", [] {
                     clawboot::testing::TempWorkspace ws;
                     ws.create_file("gateway.token", "old-token\n");
                     const auto file = ws.path() / "gateway.token";

                     auto resolved = sec::resolve_token("  from-env-token  ", file);
                     require(resolved.ok(), resolved.error());
                     require(resolved.value().source == sec::TokenSource::Explicit, "explicit");
                     require(resolved.value().value == "from-env-token", "explicit value trimmed");

                     auto later = sec::resolve_token("", file);
                     require(later.value().value == "from-env-token",
                             "explicit token survives once the variable is removed");
                   }});

  tests.push_back({"blank_token_file_regenerates", [] {
                     clawboot::testing::TempWorkspace ws;
                     ws.create_file("gateway.token", "  \n");
                     auto resolved = sec::resolve_token("", ws.path() / "gateway.token");
                     require(resolved.ok(), resolved.error());
                     require(resolved.value().source == sec::TokenSource::Generated,
                             "blank file treated as missing");
                   }});

  tests.push_back({"unwritable_token_location_fails", [] {
                     clawboot::testing::TempWorkspace ws;
                     ws.create_file("blocker", "file, not a directory");
                     auto resolved = sec::resolve_token("", ws.path() / "blocker" / "gateway.token");
                     require(!resolved.ok(), "persisting under a file must fail");
                   }});

  tests.push_back({"mask_token_hides_secret", [] {
                     const std::string token(64, 'a');
                     const auto masked = sec::mask_token("abcd" + std::string(56, 'x') + "wxyz");
                     require(masked == "abcd...wxyz", "prefix and suffix only");
                     require(sec::mask_token("short-token") == "****", "short token fully hidden");
                     require(sec::mask_token(token).find(token) == std::string::npos,
                             "masked form never contains the token");
                   }});

  tests.push_back({"hmac_is_keyed_and_stable", [] {
                     const auto a = sec::hmac_sha256_hex("key", "admin:pw");
                     require(a.size() == 64 && is_lower_hex(a), "sha256 hex digest");
                     require(a == sec::hmac_sha256_hex("key", "admin:pw"), "deterministic");
                     require(a != sec::hmac_sha256_hex("other", "admin:pw"), "depends on key");
                     require(a != sec::hmac_sha256_hex("key", "admin:pw2"), "depends on message");
                   }});
}
