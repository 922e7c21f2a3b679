#pragma once

#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>

namespace newsdesk::common {

enum class ErrorCode {
  ConfigurationError,
  ProviderUnavailable,
  SynthesisError,
  EmptyIndex,
  NotFound,
  Corrupt,
  ImportRejected,
  InvalidArgument,
  IoError,
  Internal,
};

[[nodiscard]] std::string_view error_code_name(ErrorCode code);

struct Error {
  ErrorCode code = ErrorCode::Internal;
  std::string message;
  /// False when repeating the same call cannot succeed (bad credentials, unknown model).
  bool retryable = true;
  /// Server-requested wait before the next attempt.
  std::optional<std::uint64_t> retry_after_seconds;

  [[nodiscard]] std::string to_string() const;
};

class Status {
public:
  static Status success() { return Status(true, {}); }
  static Status error(std::string message) {
    return Status(false, Error{.code = ErrorCode::Internal, .message = std::move(message)});
  }
  static Status error(const ErrorCode code, std::string message) {
    return Status(false, Error{.code = code, .message = std::move(message)});
  }
  static Status error(Error error) { return Status(false, std::move(error)); }

  [[nodiscard]] bool ok() const { return ok_; }
  [[nodiscard]] const std::string &error() const { return error_.message; }
  [[nodiscard]] ErrorCode code() const { return error_.code; }
  [[nodiscard]] const Error &error_detail() const { return error_; }

private:
  Status(bool ok, Error error) : ok_(ok), error_(std::move(error)) {}

  bool ok_;
  Error error_;
};

template <typename T> class Result {
public:
  static Result success(T value) { return Result(true, std::move(value), {}); }
  static Result failure(std::string message) {
    return Result(false, std::nullopt,
                  Error{.code = ErrorCode::Internal, .message = std::move(message)});
  }
  static Result failure(const ErrorCode code, std::string message) {
    return Result(false, std::nullopt, Error{.code = code, .message = std::move(message)});
  }
  static Result failure(Error error) { return Result(false, std::nullopt, std::move(error)); }

  [[nodiscard]] bool ok() const { return ok_; }

  [[nodiscard]] const T &value() const {
    if (!ok_) {
      throw std::logic_error("Result has no value: " + error_.message);
    }
    return *value_;
  }

  [[nodiscard]] T &value() {
    if (!ok_) {
      throw std::logic_error("Result has no value: " + error_.message);
    }
    return *value_;
  }

  [[nodiscard]] const std::string &error() const { return error_.message; }
  [[nodiscard]] ErrorCode code() const { return error_.code; }
  [[nodiscard]] const Error &error_detail() const { return error_; }

private:
  Result(bool ok, std::optional<T> value, Error error)
      : ok_(ok), value_(std::move(value)), error_(std::move(error)) {}

  bool ok_;
  std::optional<T> value_;
  Error error_;
};

} // namespace newsdesk::common
