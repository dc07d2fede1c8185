#pragma once

#include "clawboot/common/result.hpp"
#include "clawboot/process/process.hpp"

#include <filesystem>
#include <memory>
#include <string>

namespace clawboot::proxy {

class IPasswordHasher {
public:
  virtual ~IPasswordHasher() = default;

  [[nodiscard]] virtual common::Result<std::string> hash(const std::string &username,
                                                         const std::string &password) = 0;
};

class ProxyPasswordHasher final : public IPasswordHasher {
public:
  ProxyPasswordHasher(process::IProcessLauncher &launcher, std::string proxy_binary);

  [[nodiscard]] common::Result<std::string> hash(const std::string &username,
                                                 const std::string &password) override;

private:
  process::IProcessLauncher &launcher_;
  std::string proxy_binary_;
};

/// Salted hashes differ on every call, which would make the auth snippet
/// change on every boot. This wrapper stores the last hash in `cache_file`
/// keyed by an HMAC of the credentials and reuses it while they are
/// unchanged.
class CachingPasswordHasher final : public IPasswordHasher {
public:
  CachingPasswordHasher(std::unique_ptr<IPasswordHasher> inner, std::filesystem::path cache_file,
                        std::string key);

  [[nodiscard]] common::Result<std::string> hash(const std::string &username,
                                                 const std::string &password) override;

private:
  [[nodiscard]] std::string fingerprint(const std::string &username,
                                        const std::string &password) const;

  std::unique_ptr<IPasswordHasher> inner_;
  std::filesystem::path cache_file_;
  std::string key_;
};

} // namespace clawboot::proxy
