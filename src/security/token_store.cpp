#include "clawboot/security/token_store.hpp"

#include "clawboot/common/fs.hpp"

#include <openssl/evp.h>
#include <openssl/hmac.h>
#include <openssl/rand.h>

#include <iomanip>
#include <sstream>
#include <vector>

namespace clawboot::security {

namespace {

std::string to_hex(const unsigned char *data, const std::size_t size) {
  std::ostringstream stream;
  stream << std::hex << std::setfill('0');
  for (std::size_t i = 0; i < size; ++i) {
    stream << std::setw(2) << static_cast<int>(data[i]);
  }
  return stream.str();
}

common::Status persist_token(const std::string &token, const std::filesystem::path &file) {
  auto written = common::write_file_atomic(file, token + "\n", common::OWNER_READ_WRITE);
  if (!written.ok()) {
    return common::Status::error("failed to persist gateway token: " + written.error());
  }
  return common::Status::success();
}

} // namespace

common::Result<std::string> generate_token() {
  std::vector<unsigned char> data(TOKEN_BYTES);
  if (RAND_bytes(data.data(), static_cast<int>(data.size())) != 1) {
    return common::Result<std::string>::failure("RAND_bytes failed to produce a token");
  }
  return common::Result<std::string>::success(to_hex(data.data(), data.size()));
}

common::Result<ResolvedToken> resolve_token(const std::string &explicit_value,
                                            const std::filesystem::path &persisted_file) {
  const std::string explicit_token = common::trim(explicit_value);
  if (!explicit_token.empty()) {
    auto persisted = persist_token(explicit_token, persisted_file);
    if (!persisted.ok()) {
      return common::Result<ResolvedToken>::failure(persisted.error());
    }
    return common::Result<ResolvedToken>::success(
        ResolvedToken{.value = explicit_token, .source = TokenSource::Explicit});
  }

  std::error_code ec;
  if (std::filesystem::exists(persisted_file, ec)) {
    auto content = common::read_file(persisted_file);
    if (!content.ok()) {
      return common::Result<ResolvedToken>::failure("failed to read gateway token: " +
                                                    content.error());
    }
    std::string token = common::trim(content.value());
    if (!token.empty()) {
      return common::Result<ResolvedToken>::success(
          ResolvedToken{.value = std::move(token), .source = TokenSource::Persisted});
    }
  }

  auto generated = generate_token();
  if (!generated.ok()) {
    return common::Result<ResolvedToken>::failure(generated.error());
  }
  auto persisted = persist_token(generated.value(), persisted_file);
  if (!persisted.ok()) {
    return common::Result<ResolvedToken>::failure(persisted.error());
  }
  return common::Result<ResolvedToken>::success(
      ResolvedToken{.value = generated.value(), .source = TokenSource::Generated});
}

std::string mask_token(const std::string &token) {
  if (token.size() <= 12) {
    return std::string(token.empty() ? 0 : 4, '*');
  }
  return token.substr(0, 4) + "..." + token.substr(token.size() - 4);
}

std::string token_source_name(const TokenSource source) {
  switch (source) {
  case TokenSource::Explicit:
    return "environment";
  case TokenSource::Persisted:
    return "persisted";
  case TokenSource::Generated:
    return "generated";
  }
  return "unknown";
}

std::string hmac_sha256_hex(const std::string &key, const std::string &message) {
  unsigned char digest[EVP_MAX_MD_SIZE];
  unsigned int digest_len = 0;
  HMAC(EVP_sha256(), key.data(), static_cast<int>(key.size()),
       reinterpret_cast<const unsigned char *>(message.data()), message.size(), digest,
       &digest_len);
  return to_hex(digest, digest_len);
}

} // namespace clawboot::security
