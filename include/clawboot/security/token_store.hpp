#pragma once

#include "clawboot/common/result.hpp"

#include <cstddef>
#include <filesystem>
#include <string>

namespace clawboot::security {

inline constexpr std::size_t TOKEN_BYTES = 32;

enum class TokenSource { Explicit, Persisted, Generated };

struct ResolvedToken {
  std::string value;
  TokenSource source = TokenSource::Generated;
};

[[nodiscard]] common::Result<std::string> generate_token();

/// Resolves the gateway bearer token. Precedence is the explicit value, then
/// the persisted file, then a freshly generated token. The explicit and the
/// generated value are written back to `persisted_file` with mode 0600 so the
/// token survives restarts; failing to persist is an error.
[[nodiscard]] common::Result<ResolvedToken>
resolve_token(const std::string &explicit_value, const std::filesystem::path &persisted_file);

[[nodiscard]] std::string mask_token(const std::string &token);

[[nodiscard]] std::string token_source_name(TokenSource source);

[[nodiscard]] std::string hmac_sha256_hex(const std::string &key, const std::string &message);

} // namespace clawboot::security
