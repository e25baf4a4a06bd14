#include "quizconv/validator.hpp"

#include <cmath>
#include <set>
#include <string>
#include <utility>

#include "quizconv/text_util.hpp"

namespace {

using quizconv::ConversionError;
using quizconv::ErrorKind;
using quizconv::MakeError;
using quizconv::NumericForm;
using quizconv::Question;
using quizconv::QuestionType;
using quizconv::Quiz;

constexpr std::size_t kMaxSingleChoiceOptions = 26;

class ViolationSink {
 public:
  explicit ViolationSink(const Question& question) : question_(question) {}

  void TypeConstraint(const std::string& message) { Add(ErrorKind::kTypeConstraint, message); }
  void MissingField(const std::string& message) { Add(ErrorKind::kMissingField, message); }

  std::vector<ConversionError> Take() { return std::move(errors_); }

 private:
  void Add(ErrorKind kind, const std::string& message) {
    errors_.push_back(MakeError(kind, question_.line, question_.position, message));
  }

  const Question& question_;
  std::vector<ConversionError> errors_;
};

void CheckChoices(const Question& question, ViolationSink& sink) {
  if (question.choices.empty()) {
    sink.MissingField(quizconv::TypeName(question.type) + " question has no choices");
    return;
  }
  const std::size_t correct = quizconv::CountCorrect(question);
  if (question.type == QuestionType::kSingleChoice) {
    if (question.choices.size() > kMaxSingleChoiceOptions) {
      sink.TypeConstraint("single-choice question has " +
                          std::to_string(question.choices.size()) +
                          " choices; at most 26 are supported");
    }
    if (correct != 1) {
      sink.TypeConstraint("expected exactly 1 correct choice, found " + std::to_string(correct));
    }
  } else if (correct == 0) {
    sink.TypeConstraint("expected at least 1 correct choice, found 0");
  }
}

void CheckNumeric(const Question& question, ViolationSink& sink) {
  if (question.numeric_form == NumericForm::kRange) {
    if (!question.range_low || !question.range_high) {
      sink.MissingField("numeric range is missing a bound");
    } else if (*question.range_low > *question.range_high) {
      sink.TypeConstraint("numeric range lower bound " +
                          quizconv::text::FormatNumber(*question.range_low) +
                          " exceeds upper bound " +
                          quizconv::text::FormatNumber(*question.range_high));
    }
    return;
  }
  if (!question.target) {
    sink.MissingField("numeric question has no target value");
  }
  if (!question.tolerance) {
    sink.MissingField("numeric question has no tolerance");
  } else if (*question.tolerance < 0) {
    sink.TypeConstraint("tolerance must be non-negative, found " +
                        quizconv::text::FormatNumber(*question.tolerance));
  }
}

void CheckQuestion(const Question& question, std::vector<ConversionError>& out) {
  ViolationSink sink(question);
  if (!quizconv::IsKnownType(question.type)) {
    sink.TypeConstraint("unrecognized question type");
    auto errors = sink.Take();
    out.insert(out.end(), errors.begin(), errors.end());
    return;
  }

  if (question.type == QuestionType::kTextStimulus) {
    if (question.points) {
      sink.TypeConstraint("text stimulus cannot carry points");
    }
    if (!question.feedback.Empty()) {
      sink.TypeConstraint("text stimulus cannot carry feedback");
    }
  } else if (!question.points) {
    sink.MissingField("point value is required");
  } else if (*question.points < 0) {
    sink.TypeConstraint("point value must be non-negative, found " +
                        quizconv::text::FormatNumber(*question.points));
  } else if (std::floor(*question.points * 2) != *question.points * 2) {
    sink.TypeConstraint("point value must be a whole or half number, found " +
                        quizconv::text::FormatNumber(*question.points));
  }

  switch (question.type) {
    case QuestionType::kSingleChoice:
    case QuestionType::kMultiChoice:
      CheckChoices(question, sink);
      break;
    case QuestionType::kNumeric:
      CheckNumeric(question, sink);
      break;
    case QuestionType::kShortAnswer:
      if (question.answers.empty()) {
        sink.MissingField("short-answer question has no acceptable answers");
      }
      break;
    case QuestionType::kEssay:
    case QuestionType::kFileUpload:
    case QuestionType::kTextStimulus:
      break;
  }

  auto errors = sink.Take();
  out.insert(out.end(), errors.begin(), errors.end());
}

}  // namespace

namespace quizconv {

std::vector<ConversionError> CollectViolations(const Quiz& quiz) {
  std::vector<ConversionError> errors;

  std::set<QuizOption> seen;
  for (const auto& setting : quiz.options) {
    if (!IsKnownOption(setting.option)) {
      errors.push_back(
          MakeError(ErrorKind::kTypeConstraint, setting.line, 0, "unrecognized quiz option"));
    } else if (!seen.insert(setting.option).second) {
      errors.push_back(MakeError(ErrorKind::kTypeConstraint, setting.line, 0,
                                 "quiz option '" + OptionLabel(setting.option) +
                                     "' is set more than once"));
    }
  }

  for (const auto& question : quiz.questions) {
    CheckQuestion(question, errors);
  }
  return errors;
}

std::optional<ConversionError> Validate(const Quiz& quiz) {
  auto errors = CollectViolations(quiz);
  if (errors.empty()) {
    return std::nullopt;
  }
  return errors.front();
}

}  // namespace quizconv
