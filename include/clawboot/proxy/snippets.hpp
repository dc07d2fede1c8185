#pragma once

#include "clawboot/common/result.hpp"
#include "clawboot/config/schema.hpp"
#include "clawboot/proxy/password_hasher.hpp"

#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

namespace clawboot::proxy {

/// A fragment imported by the proxy's Caddyfile. Empty content is valid and
/// means "nothing to add".
struct ProxySnippet {
  std::string name;
  std::string content;

  [[nodiscard]] std::string file_name() const { return name + ".caddyfile"; }
};

struct HooksRoute {
  bool enabled = false;
  std::string path = "/hooks";
  std::uint16_t gateway_port = 18789;
};

class SnippetGenerator {
public:
  explicit SnippetGenerator(IPasswordHasher &hasher);

  [[nodiscard]] common::Result<std::vector<ProxySnippet>>
  generate(const config::AuthConfig &auth, const HooksRoute &hooks, const std::string &token);

  [[nodiscard]] common::Result<ProxySnippet> auth_snippet(const config::AuthConfig &auth);
  [[nodiscard]] static ProxySnippet hooks_snippet(const HooksRoute &hooks,
                                                  const std::string &token);

private:
  IPasswordHasher &hasher_;
};

[[nodiscard]] common::Status write_snippets(const std::filesystem::path &dir,
                                            const std::vector<ProxySnippet> &snippets);

} // namespace clawboot::proxy
