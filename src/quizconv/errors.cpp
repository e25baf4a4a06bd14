#include "quizconv/errors.hpp"

#include <sstream>

namespace quizconv {

std::string ErrorKindName(ErrorKind kind) {
  switch (kind) {
    case ErrorKind::kStructural:
      return "StructuralError";
    case ErrorKind::kTypeConstraint:
      return "TypeConstraintError";
    case ErrorKind::kMissingField:
      return "MissingFieldError";
  }
  return "StructuralError";
}

std::string ConversionError::Describe() const {
  std::ostringstream oss;
  oss << "line " << line << ": " << ErrorKindName(kind) << ": ";
  if (question > 0) {
    oss << "question " << question << ": ";
  }
  oss << message;
  return oss.str();
}

ConversionError MakeError(ErrorKind kind, int line, std::size_t question, std::string message) {
  ConversionError error;
  error.kind = kind;
  error.line = line;
  error.question = question;
  error.message = std::move(message);
  return error;
}

ConversionException::ConversionException(ConversionError error)
    : std::runtime_error(error.Describe()), error_(std::move(error)) {}

void ThrowStructural(int line, const std::string& message, std::size_t question) {
  throw ConversionException(MakeError(ErrorKind::kStructural, line, question, message));
}

}  // namespace quizconv
