#include "clawboot/proxy/snippets.hpp"

#include "clawboot/common/fs.hpp"

#include <sstream>

namespace clawboot::proxy {

namespace {

constexpr const char *DEFAULT_USERNAME = "admin";
constexpr const char *OPEN_AUTH_BLOCK = "(auth_block) {}\n";

} // namespace

SnippetGenerator::SnippetGenerator(IPasswordHasher &hasher) : hasher_(hasher) {}

common::Result<ProxySnippet> SnippetGenerator::auth_snippet(const config::AuthConfig &auth) {
  if (auth.password.empty()) {
    return common::Result<ProxySnippet>::success(
        ProxySnippet{.name = "auth", .content = OPEN_AUTH_BLOCK});
  }

  const std::string username = auth.username.empty() ? DEFAULT_USERNAME : auth.username;
  auto hashed = hasher_.hash(username, auth.password);
  if (!hashed.ok()) {
    return common::Result<ProxySnippet>::failure("failed to hash proxy password: " +
                                                 hashed.error());
  }

  std::ostringstream out;
  out << "(auth_block) {\n"
      << "    basicauth {\n"
      << "        " << username << " " << hashed.value() << "\n"
      << "    }\n"
      << "}\n";
  return common::Result<ProxySnippet>::success(ProxySnippet{.name = "auth", .content = out.str()});
}

ProxySnippet SnippetGenerator::hooks_snippet(const HooksRoute &hooks, const std::string &token) {
  if (!hooks.enabled) {
    return ProxySnippet{.name = "hooks", .content = ""};
  }

  std::ostringstream out;
  out << "handle " << hooks.path << "* {\n"
      << "    reverse_proxy localhost:" << hooks.gateway_port << " {\n"
      << "        header_up Authorization \"Bearer " << token << "\"\n"
      << "    }\n"
      << "}\n";
  return ProxySnippet{.name = "hooks", .content = out.str()};
}

common::Result<std::vector<ProxySnippet>>
SnippetGenerator::generate(const config::AuthConfig &auth, const HooksRoute &hooks,
                           const std::string &token) {
  auto auth_result = auth_snippet(auth);
  if (!auth_result.ok()) {
    return common::Result<std::vector<ProxySnippet>>::failure(auth_result.error());
  }
  std::vector<ProxySnippet> snippets;
  snippets.push_back(std::move(auth_result.value()));
  snippets.push_back(hooks_snippet(hooks, token));
  return common::Result<std::vector<ProxySnippet>>::success(std::move(snippets));
}

common::Status write_snippets(const std::filesystem::path &dir,
                              const std::vector<ProxySnippet> &snippets) {
  auto created = common::ensure_dir(dir);
  if (!created.ok()) {
    return created.status();
  }
  for (const auto &snippet : snippets) {
    // hooks.caddyfile carries the bearer token.
    auto written = common::write_file_atomic(dir / snippet.file_name(), snippet.content,
                                             common::OWNER_READ_WRITE);
    if (!written.ok()) {
      return written;
    }
  }
  return common::Status::success();
}

} // namespace clawboot::proxy
