#include "clawboot/synth/value_inference.hpp"

#include "clawboot/common/fs.hpp"

#include <cctype>
#include <charconv>
#include <cmath>
#include <cstdint>
#include <cstdlib>
#include <memory>
#include <optional>

namespace clawboot::synth {

namespace {

bool is_digit(const char c) { return std::isdigit(static_cast<unsigned char>(c)) != 0; }

// digits [. digits] [e [sign] digits], with at least one digit in the
// mantissa and a `.` or exponent present.
bool is_decimal_literal(const std::string &text) {
  std::size_t i = 0;
  if (i < text.size() && (text[i] == '+' || text[i] == '-')) {
    ++i;
  }
  std::size_t mantissa_digits = 0;
  while (i < text.size() && is_digit(text[i])) {
    ++i;
    ++mantissa_digits;
  }
  bool has_point = false;
  if (i < text.size() && text[i] == '.') {
    has_point = true;
    ++i;
    while (i < text.size() && is_digit(text[i])) {
      ++i;
      ++mantissa_digits;
    }
  }
  if (mantissa_digits == 0) {
    return false;
  }
  bool has_exponent = false;
  if (i < text.size() && (text[i] == 'e' || text[i] == 'E')) {
    has_exponent = true;
    ++i;
    if (i < text.size() && (text[i] == '+' || text[i] == '-')) {
      ++i;
    }
    std::size_t exponent_digits = 0;
    while (i < text.size() && is_digit(text[i])) {
      ++i;
      ++exponent_digits;
    }
    if (exponent_digits == 0) {
      return false;
    }
  }
  return i == text.size() && (has_point || has_exponent);
}

std::optional<Json::Value> parse_integer(const std::string &text) {
  const char *begin = text.data();
  const char *end = text.data() + text.size();
  if (*begin == '+') {
    ++begin;
  }

  std::int64_t signed_value = 0;
  if (const auto [ptr, ec] = std::from_chars(begin, end, signed_value);
      ec == std::errc() && ptr == end) {
    return Json::Value(static_cast<Json::Int64>(signed_value));
  }
  if (*begin != '-') {
    std::uint64_t unsigned_value = 0;
    if (const auto [ptr, ec] = std::from_chars(begin, end, unsigned_value);
        ec == std::errc() && ptr == end) {
      return Json::Value(static_cast<Json::UInt64>(unsigned_value));
    }
  }
  const double real = std::strtod(text.c_str(), nullptr);
  if (!std::isfinite(real)) {
    return std::nullopt;
  }
  return Json::Value(real);
}

std::optional<Json::Value> parse_real(const std::string &text) {
  const double real = std::strtod(text.c_str(), nullptr);
  if (!std::isfinite(real)) {
    return std::nullopt;
  }
  return Json::Value(real);
}

std::optional<Json::Value> parse_structured(const std::string &raw) {
  Json::CharReaderBuilder builder;
  Json::CharReaderBuilder::strictMode(&builder.settings_);
  const std::unique_ptr<Json::CharReader> reader(builder.newCharReader());
  Json::Value parsed;
  std::string errors;
  if (!reader->parse(raw.data(), raw.data() + raw.size(), &parsed, &errors)) {
    return std::nullopt;
  }
  return parsed;
}

} // namespace

bool is_integer_literal(const std::string &text) {
  std::size_t i = 0;
  if (i < text.size() && (text[i] == '+' || text[i] == '-')) {
    ++i;
  }
  if (i == text.size()) {
    return false;
  }
  for (; i < text.size(); ++i) {
    if (!is_digit(text[i])) {
      return false;
    }
  }
  return true;
}

Json::Value infer_value(const std::string &raw) {
  const std::string lowered = common::to_lower(raw);
  if (lowered == "true") {
    return Json::Value(true);
  }
  if (lowered == "false") {
    return Json::Value(false);
  }

  const std::string numeral = common::trim(raw);
  if (is_integer_literal(numeral)) {
    if (auto value = parse_integer(numeral); value.has_value()) {
      return *value;
    }
  } else if (is_decimal_literal(numeral)) {
    if (auto value = parse_real(numeral); value.has_value()) {
      return *value;
    }
  }

  if (!raw.empty() && (raw.front() == '{' || raw.front() == '[')) {
    if (auto value = parse_structured(raw); value.has_value()) {
      return *value;
    }
  }
  return Json::Value(raw);
}

} // namespace clawboot::synth
