#pragma once

#include "clawboot/common/result.hpp"
#include "clawboot/config/environment.hpp"
#include "clawboot/config/schema.hpp"

#include <json/json.h>

#include <cstddef>
#include <filesystem>
#include <string>
#include <vector>

namespace clawboot::synth {

struct SynthesisReport {
  Json::Value document;
  bool custom_config_loaded = false;
  bool persisted_config_loaded = false;
  bool seeded_from_template = false;
  std::size_t bindings_applied = 0;
  std::vector<std::string> rejected_bindings;
};

/// Produces the gateway configuration document from the custom document, the
/// persisted document (or the shipped template on first boot), the schema
/// rules and the OPENCLAW_JSON__ convention, in that order of increasing
/// precedence.
class ConfigSynthesizer {
public:
  ConfigSynthesizer(const config::BootConfig &config, const config::Environment &env);

  [[nodiscard]] common::Result<SynthesisReport> build(const std::string &token) const;

  [[nodiscard]] common::Result<SynthesisReport> run(const std::string &token) const;

private:
  const config::BootConfig &config_;
  const config::Environment &env_;
};

/// Re-asserts the settings the gateway needs behind the proxy on the
/// persisted document. A missing file is left alone.
[[nodiscard]] common::Status reapply_gateway_settings(const std::filesystem::path &config_file);

} // namespace clawboot::synth
