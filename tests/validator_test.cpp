#include <exception>
#include <iostream>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include "quizconv/validator.hpp"

namespace {

using quizconv::Choice;
using quizconv::CollectViolations;
using quizconv::ErrorKind;
using quizconv::NumericForm;
using quizconv::Question;
using quizconv::QuestionType;
using quizconv::Quiz;
using quizconv::QuizOption;
using quizconv::Validate;

void Assert(bool condition, const std::string& message) {
  if (!condition) {
    throw std::runtime_error(message);
  }
}

Question MakeQuestion(QuestionType type) {
  Question question;
  question.type = type;
  question.position = 1;
  question.line = 5;
  question.points = 1.0;
  question.prompt.push_back("Prompt?");
  return question;
}

Question MakeChoiceQuestion(QuestionType type, const std::vector<bool>& marks) {
  Question question = MakeQuestion(type);
  for (std::size_t i = 0; i < marks.size(); ++i) {
    Choice choice;
    choice.text = "option " + std::to_string(i + 1);
    choice.correct = marks[i];
    question.choices.push_back(choice);
  }
  return question;
}

Quiz Wrap(Question question) {
  Quiz quiz;
  quiz.questions.push_back(std::move(question));
  return quiz;
}

void ExpectValid(const Question& question, const std::string& label) {
  const auto violation = Validate(Wrap(question));
  Assert(!violation, label + ": unexpected violation " +
                         (violation ? violation->Describe() : std::string()));
}

void ExpectViolation(const Question& question, ErrorKind kind, const std::string& message,
                     const std::string& label) {
  const auto violation = Validate(Wrap(question));
  Assert(violation.has_value(), label + ": expected a violation");
  Assert(violation->kind == kind, label + ": wrong kind " + violation->Describe());
  Assert(violation->message == message, label + ": wrong message " + violation->Describe());
  Assert(violation->line == 5 && violation->question == 1,
         label + ": violation should cite the question header");
}

void TestChoiceRules() {
  ExpectViolation(MakeChoiceQuestion(QuestionType::kSingleChoice, {false, false}),
                  ErrorKind::kTypeConstraint, "expected exactly 1 correct choice, found 0",
                  "single-choice with none correct");
  ExpectValid(MakeChoiceQuestion(QuestionType::kSingleChoice, {false, true, false}),
              "single-choice with one correct");
  ExpectViolation(MakeChoiceQuestion(QuestionType::kSingleChoice, {true, true}),
                  ErrorKind::kTypeConstraint, "expected exactly 1 correct choice, found 2",
                  "single-choice with two correct");
  ExpectViolation(MakeChoiceQuestion(QuestionType::kMultiChoice, {false, false}),
                  ErrorKind::kTypeConstraint, "expected at least 1 correct choice, found 0",
                  "multi-choice with none correct");
  ExpectValid(MakeChoiceQuestion(QuestionType::kMultiChoice, {true, true, true}),
              "multi-choice with every choice correct");
  ExpectViolation(MakeChoiceQuestion(QuestionType::kSingleChoice, {}), ErrorKind::kMissingField,
                  "single-choice question has no choices", "no choices");

  std::vector<bool> many(27, false);
  many[0] = true;
  ExpectViolation(MakeChoiceQuestion(QuestionType::kSingleChoice, many),
                  ErrorKind::kTypeConstraint,
                  "single-choice question has 27 choices; at most 26 are supported",
                  "too many lettered choices");
}

void TestNumericRules() {
  auto numeric = MakeQuestion(QuestionType::kNumeric);
  numeric.target = 3.14;
  ExpectViolation(numeric, ErrorKind::kMissingField, "numeric question has no tolerance",
                  "missing tolerance");
  numeric.tolerance = -0.5;
  ExpectViolation(numeric, ErrorKind::kTypeConstraint,
                  "tolerance must be non-negative, found -0.5", "negative tolerance");
  numeric.tolerance = 0.0;
  ExpectValid(numeric, "zero tolerance");
  numeric.target.reset();
  ExpectViolation(numeric, ErrorKind::kMissingField, "numeric question has no target value",
                  "missing target");

  auto percent = MakeQuestion(QuestionType::kNumeric);
  percent.numeric_form = NumericForm::kPercentMargin;
  percent.target = 5.0;
  percent.tolerance = 10.0;
  ExpectValid(percent, "percent margin");
  percent.tolerance = -10.0;
  ExpectViolation(percent, ErrorKind::kTypeConstraint, "tolerance must be non-negative, found -10",
                  "negative percent margin");

  auto range = MakeQuestion(QuestionType::kNumeric);
  range.numeric_form = NumericForm::kRange;
  range.range_low = 1.0;
  ExpectViolation(range, ErrorKind::kMissingField, "numeric range is missing a bound",
                  "range without upper bound");
  range.range_high = 2.0;
  ExpectValid(range, "range needs no target or tolerance");
  range.range_low = 3.0;
  ExpectViolation(range, ErrorKind::kTypeConstraint,
                  "numeric range lower bound 3 exceeds upper bound 2", "inverted range");
}

void TestAnswerAndPointRules() {
  auto fill = MakeQuestion(QuestionType::kShortAnswer);
  ExpectViolation(fill, ErrorKind::kMissingField,
                  "short-answer question has no acceptable answers", "no answers");
  fill.answers.push_back("Paris");
  ExpectValid(fill, "one answer");

  auto essay = MakeQuestion(QuestionType::kEssay);
  essay.points.reset();
  ExpectViolation(essay, ErrorKind::kMissingField, "point value is required", "missing points");
  essay.points = -1.0;
  ExpectViolation(essay, ErrorKind::kTypeConstraint, "point value must be non-negative, found -1",
                  "negative points");
  essay.points = 0.3;
  ExpectViolation(essay, ErrorKind::kTypeConstraint,
                  "point value must be a whole or half number, found 0.3", "fractional points");
  essay.points = 2.5;
  ExpectValid(essay, "half points");
  essay.points = 0.0;
  ExpectValid(essay, "zero points");
  ExpectValid(MakeQuestion(QuestionType::kFileUpload), "file upload");
}

void TestTextStimulusRules() {
  auto text = MakeQuestion(QuestionType::kTextStimulus);
  ExpectViolation(text, ErrorKind::kTypeConstraint, "text stimulus cannot carry points",
                  "text stimulus with points");
  text.points.reset();
  ExpectValid(text, "plain text stimulus");
  text.feedback.general = std::string("Note.");
  ExpectViolation(text, ErrorKind::kTypeConstraint, "text stimulus cannot carry feedback",
                  "text stimulus with feedback");
}

void TestUnknownValues() {
  auto unknown = MakeQuestion(static_cast<QuestionType>(42));
  ExpectViolation(unknown, ErrorKind::kTypeConstraint, "unrecognized question type",
                  "unknown type");

  Quiz quiz;
  quizconv::OptionSetting setting;
  setting.option = static_cast<QuizOption>(99);
  setting.value = true;
  setting.line = 3;
  quiz.options.push_back(setting);
  const auto violation = Validate(quiz);
  Assert(violation && violation->kind == ErrorKind::kTypeConstraint && violation->line == 3 &&
             violation->question == 0,
         "Unknown option should be a TypeConstraint error on its own line");

  Quiz duplicated;
  setting.option = QuizOption::kShuffleAnswers;
  setting.line = 1;
  duplicated.options.push_back(setting);
  setting.line = 2;
  duplicated.options.push_back(setting);
  const auto repeat = Validate(duplicated);
  Assert(repeat && repeat->line == 2, "Second setting of an option should be rejected");
}

void TestCollectAndFirst() {
  Quiz quiz;
  auto first = MakeChoiceQuestion(QuestionType::kSingleChoice, {true, true});
  auto second = MakeQuestion(QuestionType::kShortAnswer);
  second.position = 2;
  second.line = 12;
  second.points.reset();
  quiz.questions.push_back(first);
  quiz.questions.push_back(second);

  const auto all = CollectViolations(quiz);
  Assert(all.size() == 3, "Expected three violations, got " + std::to_string(all.size()));
  Assert(all[0].question == 1 && all[1].question == 2 && all[2].question == 2,
         "Violations should follow document order");
  Assert(all[1].message == "point value is required", "Points are checked before answers");

  const auto violation = Validate(quiz);
  Assert(violation && violation->Describe() == all.front().Describe(),
         "Validate reports the first collected violation");
  Assert(Validate(quiz)->Describe() == violation->Describe(), "Validation is repeatable");

  Quiz empty;
  Assert(!Validate(empty) && CollectViolations(empty).empty(), "An empty quiz is valid");
}

}  // namespace

int main() {
  try {
    TestChoiceRules();
    TestNumericRules();
    TestAnswerAndPointRules();
    TestTextStimulusRules();
    TestUnknownValues();
    TestCollectAndFirst();
  } catch (const std::exception& ex) {
    std::cerr << "Validator test failed: " << ex.what() << "\n";
    return 1;
  }
  std::cout << "Validator test passed\n";
  return 0;
}
