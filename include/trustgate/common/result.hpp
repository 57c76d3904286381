#pragma once

#include <optional>
#include <stdexcept>
#include <string>
#include <utility>

namespace trustgate::common {

class Status {
public:
  static Status success() { return Status(true, ""); }
  static Status error(std::string message) { return Status(false, std::move(message)); }

  [[nodiscard]] bool ok() const { return ok_; }
  [[nodiscard]] const std::string &error() const { return error_; }

private:
  Status(bool ok, std::string error) : ok_(ok), error_(std::move(error)) {}

  bool ok_;
  std::string error_;
};

// value() on a failed result throws std::logic_error.
template <typename T> class Result {
public:
  static Result success(T value) { return Result(std::move(value), ""); }
  static Result failure(std::string message) { return Result(std::nullopt, std::move(message)); }

  [[nodiscard]] bool ok() const { return value_.has_value(); }

  [[nodiscard]] const T &value() const {
    require_value();
    return *value_;
  }

  [[nodiscard]] T &value() {
    require_value();
    return *value_;
  }

  [[nodiscard]] T take() {
    require_value();
    return std::move(*value_);
  }

  [[nodiscard]] T value_or(T fallback) const { return ok() ? *value_ : std::move(fallback); }

  [[nodiscard]] const std::string &error() const { return error_; }

  [[nodiscard]] Status status() const {
    return ok() ? Status::success() : Status::error(error_);
  }

private:
  Result(std::optional<T> value, std::string error)
      : value_(std::move(value)), error_(std::move(error)) {}

  void require_value() const {
    if (!value_.has_value()) {
      throw std::logic_error("Result has no value: " + error_);
    }
  }

  std::optional<T> value_;
  std::string error_;
};

} // namespace trustgate::common
