#pragma once

#include <string>

#include "quizconv/annotations.hpp"
#include "quizconv/errors.hpp"
#include "quizconv/quiz_model.hpp"

namespace quizconv::markdown {

// Parses the Markdown quiz schema. Structural problems fail with a
// StructuralError at the offending line; rule checks are left to Validate().
Result<ParsedQuiz> ReadMarkdown(const std::string& content);

std::string WriteMarkdown(const Quiz& quiz, const Annotations& annotations);

}  // namespace quizconv::markdown
