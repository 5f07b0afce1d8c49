#pragma once

#include <optional>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <utility>

namespace tutorguard::common {

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

/// Value-or-error holder. `E` defaults to a plain message; structured error types are used
/// where callers branch on the failure kind.
template <typename T, typename E = std::string> class Result {
public:
  static Result success(T value) { return Result(std::move(value), std::nullopt); }
  static Result failure(E error) { return Result(std::nullopt, std::move(error)); }

  [[nodiscard]] bool ok() const { return value_.has_value(); }

  [[nodiscard]] const T &value() const {
    if (!value_.has_value()) {
      throw std::logic_error(missing_value_message());
    }
    return *value_;
  }

  [[nodiscard]] T &value() {
    if (!value_.has_value()) {
      throw std::logic_error(missing_value_message());
    }
    return *value_;
  }

  [[nodiscard]] const E &error() const {
    if (!error_.has_value()) {
      throw std::logic_error("Result has no error");
    }
    return *error_;
  }

private:
  Result(std::optional<T> value, std::optional<E> error)
      : value_(std::move(value)), error_(std::move(error)) {}

  [[nodiscard]] std::string missing_value_message() const {
    if constexpr (std::is_convertible_v<E, std::string>) {
      return "Result has no value: " + std::string(*error_);
    } else {
      return "Result has no value: " + error_->to_string();
    }
  }

  std::optional<T> value_;
  std::optional<E> error_;
};

} // namespace tutorguard::common
