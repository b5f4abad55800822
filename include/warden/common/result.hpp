#pragma once

#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>

namespace warden::common {

enum class ErrorKind {
  None,
  PolicyViolation,
  MalformedInput,
  RepositoryUnavailable,
  ArtifactWriteFailure,
  ConfigurationError,
  Io
};

[[nodiscard]] constexpr std::string_view error_kind_name(const ErrorKind kind) {
  switch (kind) {
  case ErrorKind::None:
    return "none";
  case ErrorKind::PolicyViolation:
    return "policy-violation";
  case ErrorKind::MalformedInput:
    return "malformed-input";
  case ErrorKind::RepositoryUnavailable:
    return "repository-unavailable";
  case ErrorKind::ArtifactWriteFailure:
    return "artifact-write-failure";
  case ErrorKind::ConfigurationError:
    return "configuration-error";
  case ErrorKind::Io:
    return "io";
  }
  return "io";
}

class Status {
public:
  static Status success() { return Status(ErrorKind::None, ""); }
  static Status error(std::string message, ErrorKind kind = ErrorKind::Io) {
    return Status(kind, std::move(message));
  }

  [[nodiscard]] bool ok() const { return kind_ == ErrorKind::None; }
  [[nodiscard]] const std::string &error() const { return error_; }
  [[nodiscard]] ErrorKind kind() const { return kind_; }

private:
  Status(ErrorKind kind, std::string error) : kind_(kind), error_(std::move(error)) {}

  ErrorKind kind_;
  std::string error_;
};

template <typename T> class Result {
public:
  static Result success(T value) { return Result(ErrorKind::None, std::move(value), ""); }
  static Result failure(std::string message, ErrorKind kind = ErrorKind::Io) {
    return Result(kind, std::nullopt, std::move(message));
  }
  static Result failure(const Status &status) { return failure(status.error(), status.kind()); }

  [[nodiscard]] bool ok() const { return kind_ == ErrorKind::None; }

  [[nodiscard]] const T &value() const {
    if (!ok()) {
      throw std::logic_error("Result has no value: " + error_);
    }
    return *value_;
  }

  [[nodiscard]] T &value() {
    if (!ok()) {
      throw std::logic_error("Result has no value: " + error_);
    }
    return *value_;
  }

  [[nodiscard]] const std::string &error() const { return error_; }
  [[nodiscard]] ErrorKind kind() const { return kind_; }
  [[nodiscard]] Status status() const {
    return ok() ? Status::success() : Status::error(error_, kind_);
  }

private:
  Result(ErrorKind kind, std::optional<T> value, std::string error)
      : kind_(kind), value_(std::move(value)), error_(std::move(error)) {}

  ErrorKind kind_;
  std::optional<T> value_;
  std::string error_;
};

} // namespace warden::common
