#pragma once

#include <cstddef>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace quizconv {

enum class ErrorKind { kStructural = 0, kTypeConstraint, kMissingField };

// "StructuralError", "TypeConstraintError", "MissingFieldError".
std::string ErrorKindName(ErrorKind kind);

struct ConversionError {
  ErrorKind kind = ErrorKind::kStructural;
  int line = 0;
  std::size_t question = 0;  // 1-based position, 0 when not tied to a question
  std::string message;

  // "line 7: TypeConstraintError: question 2: expected exactly 1 correct choice, found 2"
  std::string Describe() const;
};

ConversionError MakeError(ErrorKind kind, int line, std::size_t question, std::string message);

class ConversionException : public std::runtime_error {
 public:
  explicit ConversionException(ConversionError error);

  const ConversionError& error() const { return error_; }

 private:
  ConversionError error_;
};

[[noreturn]] void ThrowStructural(int line, const std::string& message,
                                  std::size_t question = 0);

// Value or a non-empty list of errors. Hosts decide whether to look past the first.
template <typename T>
class Result {
 public:
  static Result Success(T value) {
    Result result;
    result.value_ = std::move(value);
    return result;
  }

  static Result Failure(ConversionError error) {
    return Failure(std::vector<ConversionError>{std::move(error)});
  }

  static Result Failure(std::vector<ConversionError> errors) {
    if (errors.empty()) {
      throw std::logic_error("Result::Failure requires at least one error.");
    }
    Result result;
    result.errors_ = std::move(errors);
    return result;
  }

  bool ok() const { return value_.has_value(); }

  const T& value() const {
    if (!value_) {
      throw ConversionException(errors_.front());
    }
    return *value_;
  }

  T& value() {
    if (!value_) {
      throw ConversionException(errors_.front());
    }
    return *value_;
  }

  const ConversionError& error() const {
    if (errors_.empty()) {
      throw std::logic_error("Result holds a value, not an error.");
    }
    return errors_.front();
  }

  const std::vector<ConversionError>& errors() const { return errors_; }

 private:
  Result() = default;

  std::optional<T> value_;
  std::vector<ConversionError> errors_;
};

}  // namespace quizconv
