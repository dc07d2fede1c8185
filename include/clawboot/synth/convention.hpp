#pragma once

#include "clawboot/config/environment.hpp"

#include <json/json.h>

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace clawboot::synth {

inline constexpr const char *BINDING_PREFIX = "OPENCLAW_JSON__";
inline constexpr const char *PATH_DELIMITER = "__";

struct EnvBinding {
  std::string name;
  std::vector<std::string> path;
  std::string raw_value;

  [[nodiscard]] std::string dotted_path() const;
};

struct BindingScan {
  std::vector<EnvBinding> bindings;
  /// Names carrying the prefix but no usable path (empty remainder or an
  /// empty segment).
  std::vector<std::string> rejected;
};

[[nodiscard]] std::optional<EnvBinding> parse_binding(const std::string &name,
                                                     const std::string &value);

[[nodiscard]] BindingScan collect_bindings(const config::Environment &env);

/// Sets every binding's inferred value into `document` in order and returns
/// how many were applied. A later binding to the same path wins.
std::size_t apply_bindings(Json::Value &document, const std::vector<EnvBinding> &bindings);

[[nodiscard]] Json::Value synthesize(const std::vector<EnvBinding> &bindings,
                                     const Json::Value &existing);

} // namespace clawboot::synth
