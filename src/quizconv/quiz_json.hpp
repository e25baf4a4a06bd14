#pragma once

#include <string>

#include "nlohmann/json.hpp"
#include "quizconv/quiz_model.hpp"

namespace quizconv {

// Semantic content only: no comments, spacing or source lines.
nlohmann::json QuizToJson(const Quiz& quiz);

// 16-character Crockford base32 digest of the compact QuizToJson dump.
std::string SemanticFingerprint(const Quiz& quiz);

}  // namespace quizconv
