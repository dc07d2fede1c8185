#pragma once

#include <json/json.h>

#include <string>

namespace clawboot::synth {

/// Types a raw environment string, first match wins:
///   `true` / `false` (any case)           -> boolean
///   optional sign and digits              -> integer (real when it overflows 64 bits)
///   decimal with `.` and/or an exponent   -> real
///   `{...}` or `[...]` that parses as JSON -> object / array
///   anything else                         -> the string, unmodified
/// Surrounding whitespace is ignored when recognising numbers.
[[nodiscard]] Json::Value infer_value(const std::string &raw);

[[nodiscard]] bool is_integer_literal(const std::string &text);

} // namespace clawboot::synth
