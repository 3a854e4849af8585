#pragma once

#include <exception>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>

namespace carelog::util {

/*
  Result codes returned across every pipeline stage boundary.

  kUnavailable and kDeadlineExceeded are transient: the caller may retry the
  same input later (and the import pipeline queues the source for it).
  Everything else is permanent for the given input.
*/
enum class StatusCode {
  kOk = 0,

  kInvalidArgument,
  kNotFound,
  kInvalidState,

  kUnsupportedFormat,
  kMalformedResponse,

  kUnavailable,
  kDeadlineExceeded,
  kCancelled,

  kStorageError,
  kInternal
};

const char* StatusCodeName(StatusCode code);

struct Status {
  StatusCode  code = StatusCode::kOk;
  std::string message;

  static Status Ok() {
    return {};
  }

  static Status Err(StatusCode c, std::string msg = {}) {
    return {c, std::move(msg)};
  }

  explicit operator bool() const {
    return code == StatusCode::kOk;
  }

  bool ok() const {
    return code == StatusCode::kOk;
  }

  bool IsTransient() const {
    return code == StatusCode::kUnavailable || code == StatusCode::kDeadlineExceeded;
  }

  // "<CODE>: <message>"
  std::string ToString() const;
};

/*
  Value or failure Status. Modeled on arrow::Result.

  Constructing from an OK status is a programming error and is turned into
  kInternal so the failure is never mistaken for success.
*/
template <typename T>
class StatusOr {
 public:
  StatusOr(T value) : value_(std::move(value)) {
  }

  StatusOr(Status status) : status_(std::move(status)) {
    if (status_.ok()) {
      status_ = Status::Err(StatusCode::kInternal, "StatusOr built from OK status without a value");
    }
  }

  bool ok() const {
    return value_.has_value();
  }

  const Status& status() const {
    return status_;
  }

  T& value() & {
    Check();
    return *value_;
  }

  const T& value() const& {
    Check();
    return *value_;
  }

  T&& value() && {
    Check();
    return std::move(*value_);
  }

  T* operator->() {
    return &value();
  }

  const T* operator->() const {
    return &value();
  }

  T& operator*() & {
    return value();
  }

  const T& operator*() const& {
    return value();
  }

 private:
  void Check() const {
    if (!value_) {
      throw std::logic_error("StatusOr has no value: " + status_.ToString());
    }
  }

  Status           status_;
  std::optional<T> value_;
};

// Maps the exceptions in errors.hpp (and std::invalid_argument) to a Status.
Status ToStatus(const std::exception& e);

} // namespace carelog::util
