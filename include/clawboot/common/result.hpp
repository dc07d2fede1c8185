#pragma once

#include <optional>
#include <stdexcept>
#include <string>
#include <utility>

namespace clawboot::common {

/// Outcome of an operation that produces no value. A warning is still ok():
/// the caller continues, but the message should be surfaced.
class Status {
public:
  enum class Severity { Ok, Warning, Error };

  static Status success(std::string message = "") {
    return Status(Severity::Ok, std::move(message));
  }
  static Status warning(std::string message) { return Status(Severity::Warning, std::move(message)); }
  static Status error(std::string message) { return Status(Severity::Error, std::move(message)); }

  [[nodiscard]] bool ok() const { return severity_ != Severity::Error; }
  [[nodiscard]] bool is_warning() const { return severity_ == Severity::Warning; }
  [[nodiscard]] Severity severity() const { return severity_; }
  [[nodiscard]] const std::string &error() const { return message_; }
  [[nodiscard]] const std::string &message() const { return message_; }

private:
  Status(Severity severity, std::string message)
      : severity_(severity), message_(std::move(message)) {}

  Severity severity_;
  std::string message_;
};

template <typename T> class Result {
public:
  static Result success(T value) { return Result(true, std::move(value), ""); }
  static Result failure(std::string message) {
    return Result(false, std::nullopt, std::move(message));
  }

  [[nodiscard]] bool ok() const { return ok_; }

  [[nodiscard]] const T &value() const {
    if (!ok_) {
      throw std::logic_error("Result has no value: " + error_);
    }
    return *value_;
  }

  [[nodiscard]] T &value() {
    if (!ok_) {
      throw std::logic_error("Result has no value: " + error_);
    }
    return *value_;
  }

  [[nodiscard]] const std::string &error() const { return error_; }

  [[nodiscard]] Status status() const { return ok_ ? Status::success() : Status::error(error_); }

private:
  Result(bool ok, std::optional<T> value, std::string error)
      : ok_(ok), value_(std::move(value)), error_(std::move(error)) {}

  bool ok_;
  std::optional<T> value_;
  std::string error_;
};

} // namespace clawboot::common
