#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>
#include <variant>

namespace mbt {

enum class ErrorKind : uint8_t {
  Configuration    = 1,  // rejected before any network activity
  Transient        = 2,  // timeout, reset; absorbed by the retry policy
  RetriesExhausted = 3,
  Integrity        = 4,  // checksum mismatch, never retried
  StaleResume      = 5,  // resume token no longer describes the file on disk
  Decryption       = 6,  // bad padding / malformed ciphertext
  Cancelled        = 7,
  Fatal            = 8
};

const char* to_string(ErrorKind kind);

// Only present on RetriesExhausted errors.
struct RetryExhaustion {
  std::string operation;
  int attempts = 0;
  std::chrono::milliseconds elapsed{0};
  std::string last_error;
};

struct Error {
  ErrorKind kind = ErrorKind::Fatal;
  std::string message;
  std::optional<RetryExhaustion> exhausted;

  bool retryable() const { return kind == ErrorKind::Transient; }
  std::string describe() const;

  static Error configuration(std::string msg) { return {ErrorKind::Configuration, std::move(msg), std::nullopt}; }
  static Error transient(std::string msg) { return {ErrorKind::Transient, std::move(msg), std::nullopt}; }
  static Error integrity(std::string msg) { return {ErrorKind::Integrity, std::move(msg), std::nullopt}; }
  static Error stale_resume(std::string msg) { return {ErrorKind::StaleResume, std::move(msg), std::nullopt}; }
  static Error decryption(std::string msg) { return {ErrorKind::Decryption, std::move(msg), std::nullopt}; }
  static Error cancelled(std::string msg = "operation cancelled") { return {ErrorKind::Cancelled, std::move(msg), std::nullopt}; }
  static Error fatal(std::string msg) { return {ErrorKind::Fatal, std::move(msg), std::nullopt}; }
  static Error retries_exhausted(RetryExhaustion info);
};

// Value-or-error return for operations whose failures callers must inspect.
template <typename T>
class Result {
public:
  Result(T value) : v_(std::move(value)) {}
  Result(Error error) : v_(std::move(error)) {}

  bool ok() const { return std::holds_alternative<T>(v_); }
  explicit operator bool() const { return ok(); }

  T& value() {
    if (!ok()) throw std::logic_error("Result::value() on error: " + error().describe());
    return std::get<T>(v_);
  }
  const T& value() const {
    if (!ok()) throw std::logic_error("Result::value() on error: " + error().describe());
    return std::get<T>(v_);
  }
  T& operator*() { return value(); }
  const T& operator*() const { return value(); }
  T* operator->() { return &value(); }
  const T* operator->() const { return &value(); }

  const Error& error() const { return std::get<Error>(v_); }

private:
  std::variant<T, Error> v_;
};

template <>
class Result<void> {
public:
  Result() = default;
  Result(Error error) : err_(std::move(error)) {}

  bool ok() const { return !err_.has_value(); }
  explicit operator bool() const { return ok(); }
  const Error& error() const { return *err_; }

private:
  std::optional<Error> err_;
};

using Status = Result<void>;

} // namespace mbt
