#include "quizconv/quiz_json.hpp"

#include <algorithm>
#include <array>
#include <cstdint>
#include <optional>
#include <string>
#include <utility>

#include "xxhash.h"

namespace {

using nlohmann::json;
using quizconv::Question;
using quizconv::QuestionType;

constexpr char kBase32Alphabet[] = "0123456789ABCDEFGHJKMNPQRSTVWXYZ";

std::string EncodeBase32(const std::array<uint8_t, 10>& bytes) {
  std::string output;
  output.reserve(16);

  uint32_t buffer = 0;
  int bits = 0;
  for (const auto value : bytes) {
    buffer = (buffer << 8) | value;
    bits += 8;
    while (bits >= 5) {
      bits -= 5;
      output.push_back(kBase32Alphabet[(buffer >> bits) & 0x1Fu]);
    }
  }
  return output;
}

json Optional(const std::optional<std::string>& value) {
  return value ? json(*value) : json(nullptr);
}

json Optional(const std::optional<double>& value) {
  return value ? json(*value) : json(nullptr);
}

json QuestionToJson(const Question& question) {
  json item = {
      {"position", question.position},
      {"type", quizconv::TypeName(question.type)},
      {"title", question.title},
      {"points", Optional(question.points)},
      {"prompt", question.prompt},
  };

  switch (question.type) {
    case QuestionType::kSingleChoice:
    case QuestionType::kMultiChoice: {
      json choices = json::array();
      for (const auto& choice : question.choices) {
        choices.push_back({{"text", choice.text},
                           {"correct", choice.correct},
                           {"feedback", Optional(choice.feedback)}});
      }
      item["choices"] = std::move(choices);
      break;
    }
    case QuestionType::kNumeric:
      item["form"] = quizconv::NumericFormName(question.numeric_form);
      if (question.numeric_form == quizconv::NumericForm::kRange) {
        item["low"] = Optional(question.range_low);
        item["high"] = Optional(question.range_high);
      } else {
        item["target"] = Optional(question.target);
        item["tolerance"] = Optional(question.tolerance);
      }
      break;
    case QuestionType::kShortAnswer:
      item["answers"] = question.answers;
      break;
    case QuestionType::kEssay:
    case QuestionType::kFileUpload:
    case QuestionType::kTextStimulus:
      break;
  }

  if (!question.feedback.Empty()) {
    item["feedback"] = {{"correct", Optional(question.feedback.correct)},
                        {"incorrect", Optional(question.feedback.incorrect)},
                        {"general", Optional(question.feedback.general)},
                        {"information", Optional(question.feedback.information)}};
  }
  return item;
}

}  // namespace

namespace quizconv {

json QuizToJson(const Quiz& quiz) {
  json options = json::array();
  for (const auto& setting : quiz.options) {
    options.push_back({{"name", OptionLabel(setting.option)}, {"value", setting.value}});
  }
  json questions = json::array();
  for (const auto& question : quiz.questions) {
    questions.push_back(QuestionToJson(question));
  }
  return json{{"title", quiz.title},
              {"description", quiz.description},
              {"options", std::move(options)},
              {"questions", std::move(questions)}};
}

std::string SemanticFingerprint(const Quiz& quiz) {
  const std::string canonical = QuizToJson(quiz).dump();
  const XXH128_hash_t hash = XXH3_128bits(canonical.data(), canonical.size());
  XXH128_canonical_t hash_bytes;
  XXH128_canonicalFromHash(&hash_bytes, hash);

  std::array<uint8_t, 10> truncated{};
  std::copy(hash_bytes.digest + 6, hash_bytes.digest + 16, truncated.begin());
  return EncodeBase32(truncated);
}

}  // namespace quizconv
