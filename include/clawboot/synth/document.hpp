#pragma once

#include "clawboot/common/result.hpp"

#include <json/json.h>

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace clawboot::synth {

/// Strict JSON parse; the root must be an object. `origin` names the source
/// in error messages.
[[nodiscard]] common::Result<Json::Value> parse_document(const std::string &text,
                                                         const std::string &origin);

/// nullopt when the file does not exist. A file that exists but cannot be
/// read or parsed is an error.
[[nodiscard]] common::Result<std::optional<Json::Value>>
load_document(const std::filesystem::path &path);

[[nodiscard]] std::string serialize_document(const Json::Value &document);

[[nodiscard]] common::Status save_document(const std::filesystem::path &path,
                                           const Json::Value &document);

void deep_merge(Json::Value &target, const Json::Value &source);

Json::Value &ensure_object(Json::Value &root, const std::vector<std::string> &keys);

void set_path(Json::Value &root, const std::vector<std::string> &path, Json::Value value);

[[nodiscard]] const Json::Value *find_path(const Json::Value &root,
                                           const std::vector<std::string> &path);

[[nodiscard]] std::vector<std::string> split_dotted(const std::string &path);

/// Python-style truthiness used by the schema rules: null, false, 0, "" and
/// empty containers are false.
[[nodiscard]] bool is_truthy_value(const Json::Value &value);

} // namespace clawboot::synth
