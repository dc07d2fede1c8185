#pragma once

#include <initializer_list>
#include <map>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace clawboot::config {

/// Snapshot of the process environment taken once at startup. Components read
/// variables from here instead of calling getenv.
class Environment {
public:
  Environment() = default;
  explicit Environment(std::map<std::string, std::string> vars);
  Environment(std::initializer_list<std::pair<const std::string, std::string>> vars);

  [[nodiscard]] static Environment from_process(char **envp);

  /// Present even when set to the empty string.
  [[nodiscard]] std::optional<std::string> get(const std::string &name) const;
  [[nodiscard]] std::string get_or(const std::string &name, const std::string &fallback) const;
  [[nodiscard]] bool has(const std::string &name) const;

  void set(const std::string &name, std::string value);
  void unset(const std::string &name);

  [[nodiscard]] const std::map<std::string, std::string> &vars() const { return vars_; }
  [[nodiscard]] std::vector<std::string> to_entries() const;

private:
  std::map<std::string, std::string> vars_;
};

} // namespace clawboot::config
