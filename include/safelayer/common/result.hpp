#pragma once

#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>

namespace safelayer::common {

enum class ErrorKind {
  Generic,
  NotFound,
  UnsupportedFormat,
  InvalidValue,
  Parse,
  Io,
  Blocked,
  GuardFailure,
  Network,
};

[[nodiscard]] inline std::string_view error_kind_name(const ErrorKind kind) {
  switch (kind) {
  case ErrorKind::Generic:
    return "error";
  case ErrorKind::NotFound:
    return "not_found";
  case ErrorKind::UnsupportedFormat:
    return "unsupported_format";
  case ErrorKind::InvalidValue:
    return "invalid_value";
  case ErrorKind::Parse:
    return "parse";
  case ErrorKind::Io:
    return "io";
  case ErrorKind::Blocked:
    return "blocked";
  case ErrorKind::GuardFailure:
    return "guard_failure";
  case ErrorKind::Network:
    return "network";
  }
  return "error";
}

/// Configuration errors are the kinds a policy or config loader reports for bad input.
[[nodiscard]] inline bool is_configuration_error(const ErrorKind kind) {
  return kind == ErrorKind::NotFound || kind == ErrorKind::UnsupportedFormat ||
         kind == ErrorKind::InvalidValue || kind == ErrorKind::Parse;
}

class Status {
public:
  static Status success() { return Status(true, "", ErrorKind::Generic); }
  static Status error(std::string message, ErrorKind kind = ErrorKind::Generic) {
    return Status(false, std::move(message), kind);
  }

  [[nodiscard]] bool ok() const { return ok_; }
  [[nodiscard]] const std::string &error() const { return error_; }
  [[nodiscard]] ErrorKind kind() const { return kind_; }

private:
  Status(bool ok, std::string error, ErrorKind kind)
      : ok_(ok), error_(std::move(error)), kind_(kind) {}

  bool ok_;
  std::string error_;
  ErrorKind kind_;
};

template <typename T> class Result {
public:
  static Result success(T value) {
    return Result(true, std::move(value), "", ErrorKind::Generic);
  }
  static Result failure(std::string message, ErrorKind kind = ErrorKind::Generic) {
    return Result(false, std::nullopt, std::move(message), kind);
  }
  /// Forward the failure of another result, keeping its kind.
  template <typename U> static Result failure_from(const Result<U> &other) {
    return failure(other.error(), other.kind());
  }
  static Result failure_from(const Status &status) {
    return failure(status.error(), status.kind());
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
  [[nodiscard]] ErrorKind kind() const { return kind_; }

private:
  Result(bool ok, std::optional<T> value, std::string error, ErrorKind kind)
      : ok_(ok), value_(std::move(value)), error_(std::move(error)), kind_(kind) {}

  bool ok_;
  std::optional<T> value_;
  std::string error_;
  ErrorKind kind_;
};

} // namespace safelayer::common
