#ifndef DOCFORENSICS_RESULT_HPP
#define DOCFORENSICS_RESULT_HPP

#include <optional>
#include <stdexcept>
#include <string>
#include <utility>

namespace docforensics {

/// Failure categories reported by ledger, custody and session operations.
enum class ErrorKind {
  PersistenceError,
  EncryptionError,
  SessionNotFound,
  DocumentNotFound,
  ChainCorruption,
  UnreadableLedger,
  InvalidArgument,
  UnsupportedFormat
};

std::string toString(ErrorKind kind);

struct Error {
  ErrorKind kind;
  std::string message;
};

/**
 * @brief Value-or-error return type.
 *
 * Holds either a value of type T or an Error. Accessing the value of a
 * failed result throws std::logic_error.
 */
template <typename T> class Result {
public:
  Result(T value) : value_(std::move(value)) {}
  Result(Error error) : error_(std::move(error)) {}

  static Result failure(ErrorKind kind, std::string message) {
    return Result(Error{kind, std::move(message)});
  }

  bool ok() const { return value_.has_value(); }
  explicit operator bool() const { return ok(); }

  const T &value() const & {
    if (!value_)
      throw std::logic_error("Result has no value: " + error_->message);
    return *value_;
  }
  T &value() & {
    if (!value_)
      throw std::logic_error("Result has no value: " + error_->message);
    return *value_;
  }
  T &&value() && {
    if (!value_)
      throw std::logic_error("Result has no value: " + error_->message);
    return std::move(*value_);
  }

  const Error &error() const {
    if (!error_)
      throw std::logic_error("Result holds a value, not an error");
    return *error_;
  }

private:
  std::optional<T> value_;
  std::optional<Error> error_;
};

template <> class Result<void> {
public:
  Result() = default;
  Result(Error error) : error_(std::move(error)) {}

  static Result success() { return Result(); }
  static Result failure(ErrorKind kind, std::string message) {
    return Result(Error{kind, std::move(message)});
  }

  bool ok() const { return !error_.has_value(); }
  explicit operator bool() const { return ok(); }

  const Error &error() const {
    if (!error_)
      throw std::logic_error("Result holds no error");
    return *error_;
  }

private:
  std::optional<Error> error_;
};

} // namespace docforensics

#endif // DOCFORENSICS_RESULT_HPP
