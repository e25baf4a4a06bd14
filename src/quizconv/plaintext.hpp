#pragma once

#include <string>

#include "quizconv/annotations.hpp"
#include "quizconv/errors.hpp"
#include "quizconv/quiz_model.hpp"

namespace quizconv::plaintext {

// Parses the text2qti plaintext grammar. The question type is inferred from
// the answer block.
Result<ParsedQuiz> ReadPlaintext(const std::string& content);

std::string WritePlaintext(const Quiz& quiz, const Annotations& annotations);

}  // namespace quizconv::plaintext
