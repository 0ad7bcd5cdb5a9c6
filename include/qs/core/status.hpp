// File: include/qs/core/status.hpp
#pragma once

#include <optional>
#include <string>
#include <utility>

namespace qs {

// Outcome of a catalog, engine or output step. The CLI maps codes raised while
// building the configuration to a usage exit and everything later to a run error.
class Status {
 public:
  enum class Code : int {
    kOk = 0,

    // Rejected settings: non-positive scale, tau_min > tau_max, unknown model.
    kInvalidArgument,
    // Value outside its domain: latitude past the pole, magnitude under the
    // G-K table with the reject policy.
    kOutOfRange,

    // Catalog, config or output path missing / unreadable / not writable.
    kNotFound,
    kIoError,

    // A row field that does not decode (number, timestamp).
    kParseError,
    // A catalog that does not hold together: missing columns, duplicate ids.
    kCorruptData,

    kInternal,
  };

  Status() = default;  // OK
  Status(Code code, std::string message)
      : code_(code), message_(std::move(message)) {}

  [[nodiscard]] bool ok() const noexcept { return code_ == Code::kOk; }
  [[nodiscard]] Code code() const noexcept { return code_; }
  [[nodiscard]] const std::string& message() const noexcept { return message_; }

  // Same code, message prefixed with where it happened ("row 3: ", "event 'x': ").
  [[nodiscard]] Status with_prefix(const std::string& where) const {
    return ok() ? *this : Status(code_, where + message_);
  }

  static Status ok_status() { return Status(); }

  static Status invalid_argument(std::string msg) { return Status(Code::kInvalidArgument, std::move(msg)); }
  static Status out_of_range(std::string msg) { return Status(Code::kOutOfRange, std::move(msg)); }
  static Status not_found(std::string msg) { return Status(Code::kNotFound, std::move(msg)); }
  static Status io_error(std::string msg) { return Status(Code::kIoError, std::move(msg)); }
  static Status parse_error(std::string msg) { return Status(Code::kParseError, std::move(msg)); }
  static Status corrupt_data(std::string msg) { return Status(Code::kCorruptData, std::move(msg)); }
  static Status internal(std::string msg) { return Status(Code::kInternal, std::move(msg)); }

 private:
  Code code_ = Code::kOk;
  std::string message_;
};

// Short lowercase name for logs ("invalid_argument", "parse_error", ...).
const char* status_code_name(Status::Code code) noexcept;

// Events, windows, decoded catalogs: a value or the Status explaining its absence.
template <typename T>
class Result {
 public:
  Result() = delete;

  static Result ok(T value) { return Result(std::move(value)); }
  static Result err(Status status) { return Result(std::move(status)); }

  [[nodiscard]] bool ok() const noexcept { return status_.ok(); }
  [[nodiscard]] const Status& status() const noexcept { return status_; }

  [[nodiscard]] const T& value() const { return value_.value(); }
  [[nodiscard]] T& value() { return value_.value(); }

  [[nodiscard]] const T& operator*() const { return value(); }
  [[nodiscard]] T& operator*() { return value(); }

  [[nodiscard]] const T* operator->() const { return &value(); }
  [[nodiscard]] T* operator->() { return &value(); }

  [[nodiscard]] T take_value() { return std::move(value_.value()); }

 private:
  explicit Result(T value) : value_(std::move(value)), status_(Status::ok_status()) {}
  explicit Result(Status status) : value_(std::nullopt), status_(std::move(status)) {}

  std::optional<T> value_;
  Status status_;
};

// Propagates the first failing step of a pipeline stage.
#define QS_RETURN_IF_ERROR(expr)      \
  do {                                \
    const ::qs::Status _s = (expr);   \
    if (!_s.ok()) return _s;          \
  } while (0)

}  // namespace qs
