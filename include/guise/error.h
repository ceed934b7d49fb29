// Copyright 2026 Guise Authors
// SPDX-License-Identifier: MIT

#ifndef GUISE_ERROR_H_
#define GUISE_ERROR_H_

#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <variant>

namespace guise {

// Error codes for the client
enum class ErrorCode {
  kOk = 0,

  // Configuration errors, raised before any I/O
  kUnknownProfile,
  kInvalidProfile,
  kUnsupportedTlsVersion,

  // Transport establishment, see DialStage
  kDialFailed,

  // Pool errors
  kPoolExhausted,
  kPoolShutdown,
  kConnectionBroken,

  // Request errors
  kRequestCancelled,
  kRequestTimeout,
  kInvalidUrl,

  // Protocol errors on an established connection
  kH2Protocol,
  kHttp1Protocol,

  // Internal errors
  kInternal,
};

// Where a dial failed. Only meaningful with ErrorCode::kDialFailed.
enum class DialStage {
  kNone = 0,
  kResolve,
  kConnect,
  kProxyConnect,
  kTlsHandshake,
  kAlpnMismatch,
  kH2Preface,
};

std::string_view ErrorCodeName(ErrorCode code);
std::string_view DialStageName(DialStage stage);

// Error information with code and message
class Error {
 public:
  Error() : code_(ErrorCode::kOk) {}
  Error(ErrorCode code, std::string message)
      : code_(code), message_(std::move(message)) {}
  Error(ErrorCode code, DialStage stage, std::string message)
      : code_(code), stage_(stage), message_(std::move(message)) {}

  // Factory methods
  static Error Ok() { return {}; }

  static Error UnknownProfile(std::string_view id) {
    return {ErrorCode::kUnknownProfile,
            "unknown impersonation profile: " + std::string(id)};
  }

  static Error InvalidProfile(std::string_view msg) {
    return {ErrorCode::kInvalidProfile, std::string(msg)};
  }

  static Error UnsupportedTlsVersion(std::string_view msg) {
    return {ErrorCode::kUnsupportedTlsVersion, std::string(msg)};
  }

  static Error Dial(DialStage stage, std::string_view msg) {
    return {ErrorCode::kDialFailed, stage, std::string(msg)};
  }

  static Error PoolExhausted(std::string_view msg) {
    return {ErrorCode::kPoolExhausted, std::string(msg)};
  }

  static Error PoolShutdown() {
    return {ErrorCode::kPoolShutdown, "connection pool is shut down"};
  }

  static Error Broken(std::string_view msg) {
    return {ErrorCode::kConnectionBroken, std::string(msg)};
  }

  static Error Http2(std::string_view msg) {
    return {ErrorCode::kH2Protocol, std::string(msg)};
  }

  static Error Http1(std::string_view msg) {
    return {ErrorCode::kHttp1Protocol, std::string(msg)};
  }

  static Error Timeout() {
    return {ErrorCode::kRequestTimeout, "request timed out"};
  }

  static Error Cancelled() {
    return {ErrorCode::kRequestCancelled, "request cancelled"};
  }

  static Error InvalidUrl(std::string_view msg) {
    return {ErrorCode::kInvalidUrl, std::string(msg)};
  }

  static Error Internal(std::string_view msg) {
    return {ErrorCode::kInternal, std::string(msg)};
  }

  // Check if error occurred
  explicit operator bool() const { return code_ != ErrorCode::kOk; }
  bool ok() const { return code_ == ErrorCode::kOk; }

  // Network failures a caller may retry, possibly under another identity.
  // Fingerprint and configuration failures are not in this set.
  bool IsRetryableNetwork() const;

  // Accessors
  ErrorCode code() const { return code_; }
  DialStage stage() const { return stage_; }
  const std::string& message() const { return message_; }

  // "dial_failed[tls_handshake]: certificate verify failed"
  std::string ToString() const;

 private:
  ErrorCode code_;
  DialStage stage_ = DialStage::kNone;
  std::string message_;
};

// Holds either a value or an error
template <typename T>
class Result {
 public:
  Result(T value) : data_(std::move(value)) {}
  Result(Error error) : data_(std::move(error)) {}

  bool ok() const { return std::holds_alternative<T>(data_); }
  bool has_error() const { return std::holds_alternative<Error>(data_); }

  explicit operator bool() const { return ok(); }

  T& value() & { return std::get<T>(data_); }
  const T& value() const& { return std::get<T>(data_); }
  T&& value() && { return std::get<T>(std::move(data_)); }

  Error& error() & { return std::get<Error>(data_); }
  const Error& error() const& { return std::get<Error>(data_); }

  // Map - transform the value if present
  template <typename F>
  auto map(F&& f) -> Result<decltype(f(std::declval<T>()))> {
    using U = decltype(f(std::declval<T>()));
    if (ok()) {
      return Result<U>(f(std::move(value())));
    }
    return Result<U>(error());
  }

 private:
  std::variant<T, Error> data_;
};

// Specialization for void
template <>
class Result<void> {
 public:
  Result() : error_(std::nullopt) {}
  Result(Error error) : error_(std::move(error)) {}

  bool ok() const { return !error_.has_value(); }
  bool has_error() const { return error_.has_value(); }

  explicit operator bool() const { return ok(); }

  Error& error() & { return *error_; }
  const Error& error() const& { return *error_; }

 private:
  std::optional<Error> error_;
};

}  // namespace guise

#endif  // GUISE_ERROR_H_
