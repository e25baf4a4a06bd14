#include "quizconv/quiz_model.hpp"

#include <algorithm>
#include <string>

#include "quizconv/text_util.hpp"

namespace {

using quizconv::QuestionType;
using quizconv::QuizOption;

struct TypeEntry {
  QuestionType type;
  const char* code;
  const char* name;
};

constexpr TypeEntry kTypes[] = {
    {QuestionType::kSingleChoice, "mc", "single-choice"},
    {QuestionType::kMultiChoice, "ma", "multi-choice"},
    {QuestionType::kNumeric, "num", "numeric"},
    {QuestionType::kShortAnswer, "fill", "short-answer"},
    {QuestionType::kEssay, "essay", "essay"},
    {QuestionType::kFileUpload, "file", "file-upload"},
    {QuestionType::kTextStimulus, "text", "text-stimulus"},
};

struct OptionEntry {
  QuizOption option;
  const char* label;
};

constexpr OptionEntry kOptions[] = {
    {QuizOption::kShuffleAnswers, "shuffle answers"},
    {QuizOption::kShowCorrectAnswers, "show correct answers"},
    {QuizOption::kOneQuestionAtATime, "one question at a time"},
    {QuizOption::kCantGoBack, "can't go back"},
    {QuizOption::kFeedbackIsSolution, "feedback is solution"},
    {QuizOption::kSolutionsSampleGroups, "solutions sample groups"},
    {QuizOption::kSolutionsRandomizeGroups, "solutions randomize groups"},
};

// Collapses runs of whitespace so "shuffle  answers" still matches.
std::string NormalizeLabel(const std::string& value) {
  std::string normalized;
  bool pending_space = false;
  for (const char ch : quizconv::text::ToLower(quizconv::text::Trim(value))) {
    if (ch == ' ' || ch == '\t') {
      pending_space = true;
      continue;
    }
    if (pending_space) {
      normalized.push_back(' ');
      pending_space = false;
    }
    normalized.push_back(ch);
  }
  return normalized;
}

}  // namespace

namespace quizconv {

std::string TypeCode(QuestionType type) {
  for (const auto& entry : kTypes) {
    if (entry.type == type) {
      return entry.code;
    }
  }
  return "unknown";
}

std::optional<QuestionType> ParseTypeCode(const std::string& code) {
  const std::string lowered = text::ToLower(text::Trim(code));
  for (const auto& entry : kTypes) {
    if (lowered == entry.code) {
      return entry.type;
    }
  }
  return std::nullopt;
}

std::string TypeName(QuestionType type) {
  for (const auto& entry : kTypes) {
    if (entry.type == type) {
      return entry.name;
    }
  }
  return "unknown";
}

bool IsGradeable(QuestionType type) { return type != QuestionType::kTextStimulus; }

bool IsChoiceType(QuestionType type) {
  return type == QuestionType::kSingleChoice || type == QuestionType::kMultiChoice;
}

bool IsKnownType(QuestionType type) {
  return std::any_of(std::begin(kTypes), std::end(kTypes),
                     [type](const TypeEntry& entry) { return entry.type == type; });
}

std::string OptionLabel(QuizOption option) {
  for (const auto& entry : kOptions) {
    if (entry.option == option) {
      return entry.label;
    }
  }
  return "unknown";
}

std::optional<QuizOption> ParseOptionLabel(const std::string& label) {
  const std::string normalized = NormalizeLabel(label);
  if (normalized == "cant go back" || normalized == "can\xe2\x80\x99t go back") {
    return QuizOption::kCantGoBack;
  }
  for (const auto& entry : kOptions) {
    if (normalized == entry.label) {
      return entry.option;
    }
  }
  return std::nullopt;
}

bool IsKnownOption(QuizOption option) {
  return std::any_of(std::begin(kOptions), std::end(kOptions),
                     [option](const OptionEntry& entry) { return entry.option == option; });
}

std::size_t CountCorrect(const Question& question) {
  return static_cast<std::size_t>(
      std::count_if(question.choices.begin(), question.choices.end(),
                    [](const Choice& choice) { return choice.correct; }));
}

bool ParseNumericAnswer(const std::string& body, Question& question) {
  const std::string trimmed = text::Trim(body);
  if (text::StartsWith(trimmed, "[")) {
    const auto comma = trimmed.find(',');
    if (!text::EndsWith(trimmed, "]") || comma == std::string::npos) {
      return false;
    }
    const auto low = text::ParseNumber(trimmed.substr(1, comma - 1));
    const auto high = text::ParseNumber(trimmed.substr(comma + 1, trimmed.size() - comma - 2));
    if (!low || !high) {
      return false;
    }
    question.numeric_form = NumericForm::kRange;
    question.range_low = low;
    question.range_high = high;
    return true;
  }

  const auto separator = trimmed.find("+-");
  const auto target =
      text::ParseNumber(separator == std::string::npos ? trimmed : trimmed.substr(0, separator));
  if (!target) {
    return false;
  }
  question.numeric_form = NumericForm::kTolerance;
  question.target = target;
  if (separator == std::string::npos) {
    return true;
  }
  std::string margin = text::Trim(trimmed.substr(separator + 2));
  if (text::EndsWith(margin, "%")) {
    question.numeric_form = NumericForm::kPercentMargin;
    margin.pop_back();
  }
  question.tolerance = text::ParseNumber(margin);
  return question.tolerance.has_value();
}

std::string FormatNumericAnswer(const Question& question) {
  if (question.numeric_form == NumericForm::kRange) {
    return "[" + text::FormatNumber(question.range_low.value_or(0)) + ", " +
           text::FormatNumber(question.range_high.value_or(0)) + "]";
  }
  std::string value = text::FormatNumber(question.target.value_or(0));
  if (question.tolerance) {
    value += " +- " + text::FormatNumber(*question.tolerance);
    if (question.numeric_form == NumericForm::kPercentMargin) {
      value += "%";
    }
  }
  return value;
}

std::string NumericFormName(NumericForm form) {
  switch (form) {
    case NumericForm::kTolerance:
      return "tolerance";
    case NumericForm::kRange:
      return "range";
    case NumericForm::kPercentMargin:
      return "percent";
  }
  return "tolerance";
}

}  // namespace quizconv
