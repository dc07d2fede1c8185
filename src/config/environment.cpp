#include "clawboot/config/environment.hpp"

namespace clawboot::config {

Environment::Environment(std::map<std::string, std::string> vars) : vars_(std::move(vars)) {}

Environment::Environment(std::initializer_list<std::pair<const std::string, std::string>> vars)
    : vars_(vars) {}

Environment Environment::from_process(char **envp) {
  std::map<std::string, std::string> vars;
  if (envp == nullptr) {
    return Environment(std::move(vars));
  }
  for (char **entry = envp; *entry != nullptr; ++entry) {
    const std::string line(*entry);
    const auto eq = line.find('=');
    if (eq == std::string::npos || eq == 0) {
      continue;
    }
    vars.emplace(line.substr(0, eq), line.substr(eq + 1));
  }
  return Environment(std::move(vars));
}

std::optional<std::string> Environment::get(const std::string &name) const {
  const auto it = vars_.find(name);
  if (it == vars_.end()) {
    return std::nullopt;
  }
  return it->second;
}

std::string Environment::get_or(const std::string &name, const std::string &fallback) const {
  const auto it = vars_.find(name);
  if (it == vars_.end() || it->second.empty()) {
    return fallback;
  }
  return it->second;
}

bool Environment::has(const std::string &name) const {
  const auto it = vars_.find(name);
  return it != vars_.end() && !it->second.empty();
}

void Environment::set(const std::string &name, std::string value) {
  vars_[name] = std::move(value);
}

void Environment::unset(const std::string &name) { vars_.erase(name); }

std::vector<std::string> Environment::to_entries() const {
  std::vector<std::string> out;
  out.reserve(vars_.size());
  for (const auto &[name, value] : vars_) {
    out.push_back(name + "=" + value);
  }
  return out;
}

} // namespace clawboot::config
