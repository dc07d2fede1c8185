#include "clawboot/synth/document.hpp"

#include "clawboot/common/fs.hpp"

#include <memory>

namespace clawboot::synth {

common::Result<Json::Value> parse_document(const std::string &text, const std::string &origin) {
  Json::CharReaderBuilder builder;
  Json::CharReaderBuilder::strictMode(&builder.settings_);
  const std::unique_ptr<Json::CharReader> reader(builder.newCharReader());

  Json::Value root;
  std::string errors;
  if (!reader->parse(text.data(), text.data() + text.size(), &root, &errors)) {
    return common::Result<Json::Value>::failure("malformed JSON in " + origin + ": " +
                                                common::trim(errors));
  }
  if (!root.isObject()) {
    return common::Result<Json::Value>::failure(origin + " must contain a JSON object");
  }
  return common::Result<Json::Value>::success(std::move(root));
}

common::Result<std::optional<Json::Value>> load_document(const std::filesystem::path &path) {
  std::error_code ec;
  if (!std::filesystem::exists(path, ec)) {
    return common::Result<std::optional<Json::Value>>::success(std::nullopt);
  }
  auto content = common::read_file(path);
  if (!content.ok()) {
    return common::Result<std::optional<Json::Value>>::failure(content.error());
  }
  auto parsed = parse_document(content.value(), path.string());
  if (!parsed.ok()) {
    return common::Result<std::optional<Json::Value>>::failure(parsed.error());
  }
  return common::Result<std::optional<Json::Value>>::success(std::move(parsed.value()));
}

std::string serialize_document(const Json::Value &document) {
  Json::StreamWriterBuilder builder;
  builder["indentation"] = "  ";
  builder["emitUTF8"] = true;
  builder["commentStyle"] = "None";
  // 15 significant digits prints 0.7 as typed rather than 0.69999999999999996.
  builder["precision"] = 15;
  return Json::writeString(builder, document) + "\n";
}

common::Status save_document(const std::filesystem::path &path, const Json::Value &document) {
  return common::write_file_atomic(path, serialize_document(document), common::OWNER_READ_WRITE);
}

void deep_merge(Json::Value &target, const Json::Value &source) {
  if (!target.isObject() || !source.isObject()) {
    target = source;
    return;
  }
  for (const auto &key : source.getMemberNames()) {
    const Json::Value &value = source[key];
    if (value.isObject() && target.isMember(key) && target[key].isObject()) {
      deep_merge(target[key], value);
    } else {
      target[key] = value;
    }
  }
}

Json::Value &ensure_object(Json::Value &root, const std::vector<std::string> &keys) {
  if (!root.isObject()) {
    root = Json::Value(Json::objectValue);
  }
  Json::Value *cursor = &root;
  for (const auto &key : keys) {
    Json::Value &child = (*cursor)[key];
    if (!child.isObject()) {
      child = Json::Value(Json::objectValue);
    }
    cursor = &child;
  }
  return *cursor;
}

void set_path(Json::Value &root, const std::vector<std::string> &path, Json::Value value) {
  if (path.empty()) {
    return;
  }
  const std::vector<std::string> parents(path.begin(), path.end() - 1);
  ensure_object(root, parents)[path.back()] = std::move(value);
}

const Json::Value *find_path(const Json::Value &root, const std::vector<std::string> &path) {
  const Json::Value *cursor = &root;
  for (const auto &key : path) {
    if (!cursor->isObject() || !cursor->isMember(key)) {
      return nullptr;
    }
    cursor = &(*cursor)[key];
  }
  return cursor;
}

std::vector<std::string> split_dotted(const std::string &path) { return common::split(path, "."); }

bool is_truthy_value(const Json::Value &value) {
  switch (value.type()) {
  case Json::nullValue:
    return false;
  case Json::booleanValue:
    return value.asBool();
  case Json::intValue:
  case Json::uintValue:
  case Json::realValue:
    return value.asDouble() != 0.0;
  case Json::stringValue:
    return !value.asString().empty();
  case Json::arrayValue:
  case Json::objectValue:
    return !value.empty();
  }
  return false;
}

} // namespace clawboot::synth
