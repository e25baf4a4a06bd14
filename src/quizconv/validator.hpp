#pragma once

#include <optional>
#include <vector>

#include "quizconv/errors.hpp"
#include "quizconv/quiz_model.hpp"

namespace quizconv {

// First violation in document order, or nullopt for a valid quiz.
std::optional<ConversionError> Validate(const Quiz& quiz);

std::vector<ConversionError> CollectViolations(const Quiz& quiz);

}  // namespace quizconv
