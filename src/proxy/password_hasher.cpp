#include "clawboot/proxy/password_hasher.hpp"

#include "clawboot/common/fs.hpp"
#include "clawboot/observability/global.hpp"
#include "clawboot/security/token_store.hpp"

#include <chrono>

namespace clawboot::proxy {

namespace {

constexpr std::chrono::seconds HASH_TIMEOUT{30};

} // namespace

ProxyPasswordHasher::ProxyPasswordHasher(process::IProcessLauncher &launcher,
                                         std::string proxy_binary)
    : launcher_(launcher), proxy_binary_(std::move(proxy_binary)) {}

common::Result<std::string> ProxyPasswordHasher::hash(const std::string & /*username*/,
                                                      const std::string &password) {
  process::ProcessSpec spec{.program = proxy_binary_,
                            .args = {"hash-password", "--plaintext", password},
                            .timeout = HASH_TIMEOUT};
  auto output = launcher_.run_capture(spec);
  if (!output.ok()) {
    return common::Result<std::string>::failure(output.error());
  }
  const auto &result = output.value();
  if (result.timed_out) {
    return common::Result<std::string>::failure(proxy_binary_ + " hash-password timed out");
  }
  if (result.exit_code != 0) {
    return common::Result<std::string>::failure(
        proxy_binary_ + " hash-password exited with " + std::to_string(result.exit_code) + ": " +
        common::trim(result.stderr_text));
  }
  std::string hashed = common::trim(result.stdout_text);
  if (hashed.empty()) {
    return common::Result<std::string>::failure(proxy_binary_ +
                                                " hash-password produced no output");
  }
  return common::Result<std::string>::success(std::move(hashed));
}

CachingPasswordHasher::CachingPasswordHasher(std::unique_ptr<IPasswordHasher> inner,
                                             std::filesystem::path cache_file, std::string key)
    : inner_(std::move(inner)), cache_file_(std::move(cache_file)), key_(std::move(key)) {}

std::string CachingPasswordHasher::fingerprint(const std::string &username,
                                               const std::string &password) const {
  return security::hmac_sha256_hex(key_, username + ":" + password);
}

common::Result<std::string> CachingPasswordHasher::hash(const std::string &username,
                                                        const std::string &password) {
  const std::string expected = fingerprint(username, password);

  std::error_code ec;
  if (std::filesystem::exists(cache_file_, ec)) {
    auto content = common::read_file(cache_file_);
    if (content.ok()) {
      const std::string line = common::trim(content.value());
      const auto space = line.find(' ');
      if (space != std::string::npos && line.substr(0, space) == expected) {
        const std::string cached = common::trim(line.substr(space + 1));
        if (!cached.empty()) {
          return common::Result<std::string>::success(cached);
        }
      }
    } else {
      observability::record_warning("proxy", "ignoring unreadable hash cache: " + content.error());
    }
  }

  auto hashed = inner_->hash(username, password);
  if (!hashed.ok()) {
    return hashed;
  }
  auto written = common::write_file_atomic(cache_file_, expected + " " + hashed.value() + "\n",
                                           common::OWNER_READ_WRITE);
  if (!written.ok()) {
    // The hash is still valid; the next boot just hashes again.
    observability::record_warning("proxy", "could not cache password hash: " + written.error());
  }
  return hashed;
}

} // namespace clawboot::proxy
