#include "clawboot/synth/convention.hpp"

#include "clawboot/common/fs.hpp"
#include "clawboot/synth/document.hpp"
#include "clawboot/synth/value_inference.hpp"

#include <algorithm>

namespace clawboot::synth {

std::string EnvBinding::dotted_path() const {
  std::string out;
  for (const auto &segment : path) {
    if (!out.empty()) {
      out += ".";
    }
    out += segment;
  }
  return out;
}

std::optional<EnvBinding> parse_binding(const std::string &name, const std::string &value) {
  if (!common::starts_with(name, BINDING_PREFIX)) {
    return std::nullopt;
  }
  const std::string remainder = name.substr(std::string(BINDING_PREFIX).size());
  if (remainder.empty()) {
    return std::nullopt;
  }
  auto segments = common::split(remainder, PATH_DELIMITER);
  const bool has_empty = std::any_of(segments.begin(), segments.end(),
                                     [](const std::string &segment) { return segment.empty(); });
  if (has_empty) {
    return std::nullopt;
  }
  return EnvBinding{.name = name, .path = std::move(segments), .raw_value = value};
}

BindingScan collect_bindings(const config::Environment &env) {
  BindingScan scan;
  // Environment keeps variables in a std::map, so iteration is already lexical.
  for (const auto &[name, value] : env.vars()) {
    if (!common::starts_with(name, BINDING_PREFIX)) {
      continue;
    }
    auto binding = parse_binding(name, value);
    if (binding.has_value()) {
      scan.bindings.push_back(std::move(*binding));
    } else {
      scan.rejected.push_back(name);
    }
  }
  return scan;
}

std::size_t apply_bindings(Json::Value &document, const std::vector<EnvBinding> &bindings) {
  std::size_t applied = 0;
  for (const auto &binding : bindings) {
    set_path(document, binding.path, infer_value(binding.raw_value));
    ++applied;
  }
  return applied;
}

Json::Value synthesize(const std::vector<EnvBinding> &bindings, const Json::Value &existing) {
  Json::Value document = existing.isObject() ? existing : Json::Value(Json::objectValue);
  apply_bindings(document, bindings);
  return document;
}

} // namespace clawboot::synth
