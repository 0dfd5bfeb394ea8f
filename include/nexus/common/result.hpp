#pragma once

#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>

namespace nexus::common {

enum class ErrorKind {
  None,
  DependencyMissing,
  InvalidIdentity,
  LaunchUnavailable,
  SignalDeliveryFailed,
  PeriodicTaskFailure,
  StaleRecordUnreadable,
  Io,
  Config,
};

[[nodiscard]] constexpr std::string_view error_kind_name(const ErrorKind kind) {
  switch (kind) {
  case ErrorKind::None:
    return "none";
  case ErrorKind::DependencyMissing:
    return "dependency_missing";
  case ErrorKind::InvalidIdentity:
    return "invalid_identity";
  case ErrorKind::LaunchUnavailable:
    return "launch_unavailable";
  case ErrorKind::SignalDeliveryFailed:
    return "signal_delivery_failed";
  case ErrorKind::PeriodicTaskFailure:
    return "periodic_task_failure";
  case ErrorKind::StaleRecordUnreadable:
    return "stale_record_unreadable";
  case ErrorKind::Io:
    return "io";
  case ErrorKind::Config:
    return "config";
  }
  return "unknown";
}

class Status {
public:
  static Status success() { return Status(ErrorKind::None, ""); }
  static Status error(std::string message) { return Status(ErrorKind::Io, std::move(message)); }
  static Status error(ErrorKind kind, std::string message) {
    return Status(kind == ErrorKind::None ? ErrorKind::Io : kind, std::move(message));
  }

  [[nodiscard]] bool ok() const { return kind_ == ErrorKind::None; }
  [[nodiscard]] ErrorKind kind() const { return kind_; }
  [[nodiscard]] const std::string &error() const { return error_; }

private:
  Status(ErrorKind kind, std::string error) : kind_(kind), error_(std::move(error)) {}

  ErrorKind kind_;
  std::string error_;
};

template <typename T> class Result {
public:
  static Result success(T value) { return Result(ErrorKind::None, std::move(value), ""); }
  static Result failure(std::string message) {
    return Result(ErrorKind::Io, std::nullopt, std::move(message));
  }
  static Result failure(ErrorKind kind, std::string message) {
    return Result(kind == ErrorKind::None ? ErrorKind::Io : kind, std::nullopt,
                  std::move(message));
  }
  static Result failure(const Status &status) {
    return failure(status.kind(), status.error());
  }

  [[nodiscard]] bool ok() const { return kind_ == ErrorKind::None; }
  [[nodiscard]] ErrorKind kind() const { return kind_; }

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
  [[nodiscard]] Status status() const {
    return ok() ? Status::success() : Status::error(kind_, error_);
  }

private:
  Result(ErrorKind kind, std::optional<T> value, std::string error)
      : kind_(kind), value_(std::move(value)), error_(std::move(error)) {}

  ErrorKind kind_;
  std::optional<T> value_;
  std::string error_;
};

} // namespace nexus::common
