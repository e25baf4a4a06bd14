#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace quizconv {

enum class QuestionType {
  kSingleChoice = 0,
  kMultiChoice,
  kNumeric,
  kShortAnswer,
  kEssay,
  kFileUpload,
  kTextStimulus,
};

enum class QuizOption {
  kShuffleAnswers = 0,
  kShowCorrectAnswers,
  kOneQuestionAtATime,
  kCantGoBack,
  kFeedbackIsSolution,
  kSolutionsSampleGroups,
  kSolutionsRandomizeGroups,
};

struct OptionSetting {
  QuizOption option = QuizOption::kShuffleAnswers;
  bool value = false;
  bool hidden = false;  // Markdown "<!--# key: value -->" form
  int line = 0;
};

struct Choice {
  std::string text;  // may hold '\n' for wrapped text
  bool correct = false;
  std::optional<std::string> feedback;
  int line = 0;
};

struct QuestionFeedback {
  std::optional<std::string> correct;
  std::optional<std::string> incorrect;
  std::optional<std::string> general;
  std::optional<std::string> information;

  bool Empty() const { return !correct && !incorrect && !general && !information; }
};

// text2qti numeric answer forms: "v +- t", "[low, high]" and "v +- p%".
enum class NumericForm { kTolerance = 0, kRange, kPercentMargin };

struct Question {
  std::size_t position = 0;  // 1-based, over all items
  int line = 0;
  std::optional<int> display_number;
  std::string title;
  QuestionType type = QuestionType::kEssay;
  std::optional<double> points;
  std::vector<std::string> prompt;

  std::vector<Choice> choices;
  NumericForm numeric_form = NumericForm::kTolerance;
  std::optional<double> target;
  std::optional<double> tolerance;  // a percentage for kPercentMargin
  std::optional<double> range_low;
  std::optional<double> range_high;
  std::vector<std::string> answers;

  QuestionFeedback feedback;
};

struct Quiz {
  std::string title;
  std::vector<std::string> description;
  std::vector<OptionSetting> options;
  std::vector<Question> questions;
};

// Short codes used in Markdown headers: mc, ma, num, fill, essay, file, text.
std::string TypeCode(QuestionType type);
std::optional<QuestionType> ParseTypeCode(const std::string& code);
std::string TypeName(QuestionType type);

bool IsGradeable(QuestionType type);
bool IsChoiceType(QuestionType type);
bool IsKnownType(QuestionType type);

// text2qti spelling, e.g. "shuffle answers", "can't go back".
std::string OptionLabel(QuizOption option);
std::optional<QuizOption> ParseOptionLabel(const std::string& label);
bool IsKnownOption(QuizOption option);

std::size_t CountCorrect(const Question& question);

// Parses the text after '=' into the numeric fields of `question`. Returns
// false when the text matches none of the three forms.
bool ParseNumericAnswer(const std::string& body, Question& question);

// Inverse of ParseNumericAnswer, without the leading '='.
std::string FormatNumericAnswer(const Question& question);

std::string NumericFormName(NumericForm form);

}  // namespace quizconv
