#include <exception>
#include <iostream>
#include <stdexcept>
#include <string>

#include "quizconv/plaintext.hpp"

namespace {

using quizconv::AnchorSlot;
using quizconv::ErrorKind;
using quizconv::NumericForm;
using quizconv::ParsedQuiz;
using quizconv::QuestionType;
using quizconv::QuizOption;
using quizconv::plaintext::ReadPlaintext;

void Assert(bool condition, const std::string& message) {
  if (!condition) {
    throw std::runtime_error(message);
  }
}

ParsedQuiz MustRead(const std::string& content) {
  auto result = ReadPlaintext(content);
  if (!result.ok()) {
    throw std::runtime_error("Unexpected read failure: " + result.error().Describe());
  }
  return result.value();
}

void ExpectStructuralError(const std::string& content, int line, const std::string& label) {
  const auto result = ReadPlaintext(content);
  Assert(!result.ok(), label + ": expected a failure");
  Assert(result.error().kind == ErrorKind::kStructural, label + ": expected StructuralError");
  Assert(result.error().line == line, label + ": expected line " + std::to_string(line) +
                                          ", got " + std::to_string(result.error().line));
}

const char kSample[] =
    "Quiz title: Sample\n"
    "Quiz description: First line.\n"
    "    Second line.\n"
    "shuffle answers: true\n"
    "\n"
    "Title: Addition\n"
    "Points: 2\n"
    "1. What is 2+3?\n"
    "    Show work.\n"
    "+ Correct!\n"
    "- Try again.\n"
    "a) 4\n"
    "*b) 5\n"
    "... Yes, five.\n"
    "c) 6\n"
    "\n"
    "Points: 1\n"
    "2. Pick primes.\n"
    "[*] 2\n"
    "[ ] 4\n"
    "[*] 3\n"
    "\n"
    "Points: 1\n"
    "3. Pi?\n"
    "=   3.14 +- 0.01\n"
    "\n"
    "Points: 1\n"
    "4. Capital?\n"
    "*   Paris\n"
    "*   paris\n"
    "\n"
    "Points: 5\n"
    "5. Essay.\n"
    "____\n"
    "\n"
    "Points: 3\n"
    "6. Upload.\n"
    "^^^^\n"
    "\n"
    "Text title: Reading\n"
    "Text: Read this.\n";

void TestFullQuiz() {
  const auto parsed = MustRead(kSample);
  const auto& quiz = parsed.quiz;
  Assert(quiz.title == "Sample", "Unexpected title");
  Assert(quiz.description.size() == 2 && quiz.description[1] == "Second line.",
         "Description continuation line");
  Assert(quiz.options.size() == 1 && quiz.options[0].option == QuizOption::kShuffleAnswers &&
             quiz.options[0].value,
         "shuffle answers option");
  Assert(quiz.questions.size() == 7, "Expected seven items");

  const auto& single = quiz.questions[0];
  Assert(single.type == QuestionType::kSingleChoice, "Lettered choices infer single-choice");
  Assert(single.title == "Addition" && single.points == 2.0, "Title and points");
  Assert(single.line == 6 && single.position == 1, "First line of the question is Title:");
  Assert(single.prompt.size() == 2 && single.prompt[1] == "Show work.", "Stem continuation");
  Assert(single.feedback.correct == std::string("Correct!"), "Correct feedback");
  Assert(single.feedback.incorrect == std::string("Try again."), "Incorrect feedback");
  Assert(single.choices.size() == 3 && single.choices[1].correct, "Second choice correct");
  Assert(single.choices[1].feedback == std::string("Yes, five."), "Per-choice feedback");

  Assert(quiz.questions[1].type == QuestionType::kMultiChoice, "Bracket choices");
  Assert(quizconv::CountCorrect(quiz.questions[1]) == 2, "Two correct choices");
  Assert(quiz.questions[1].title.empty(), "No Title: line means an empty title");

  const auto& numeric = quiz.questions[2];
  Assert(numeric.type == QuestionType::kNumeric, "Numeric");
  Assert(numeric.target == 3.14 && numeric.tolerance == 0.01, "Numeric answer");

  Assert(quiz.questions[3].type == QuestionType::kShortAnswer &&
             quiz.questions[3].answers.size() == 2,
         "Short answers");
  Assert(quiz.questions[4].type == QuestionType::kEssay, "Essay");
  Assert(quiz.questions[5].type == QuestionType::kFileUpload, "File upload");

  const auto& text = quiz.questions[6];
  Assert(text.type == QuestionType::kTextStimulus, "Text stimulus");
  Assert(text.title == "Reading" && text.prompt.front() == "Read this.", "Text stimulus body");
  Assert(!text.points, "Text stimulus has no points");
}

void TestComments() {
  const auto parsed = MustRead(
      "% top\n"
      "Quiz title: T\n"
      "\n"
      "% before q\n"
      "Points: 1\n"
      "1. Stem\n"
      "% inside\n"
      "    more\n"
      "____\n"
      "COMMENT\n"
      "tail\n"
      "END_COMMENT\n");
  const auto& all = parsed.annotations.All();
  Assert(all.size() == 4, "Expected four annotations");
  Assert(all[0].anchor.slot == AnchorSlot::kBeforeTitle && all[0].lines.front() == "top",
         "Leading comment precedes the title");
  Assert(all[1].anchor.slot == AnchorSlot::kBeforeQuestion && all[1].blank_before,
         "Comment before the question keeps its blank line");
  Assert(all[2].anchor.slot == AnchorSlot::kWithinPrompt && all[2].anchor.index == 1,
         "Comment inside the stem");
  Assert(all[3].anchor.slot == AnchorSlot::kEndOfFile && all[3].block &&
             all[3].lines.front() == "tail",
         "COMMENT block at end of file");
  const auto& prompt = parsed.quiz.questions.front().prompt;
  Assert(prompt.size() == 2 && prompt[1] == "more", "Stem continues past the comment");
}

void TestInformationFeedbackAndNumericForms() {
  const auto parsed = MustRead(
      "Title: Range\n"
      "Points: 1\n"
      "1. Pick a value.\n"
      "! Any value in the interval works.\n"
      "=   [1, 2]\n"
      "\n"
      "Title: Percent\n"
      "% weighting\n"
      "Points: 2\n"
      "2. Estimate.\n"
      "=   5 +- 10%\n");
  const auto& range = parsed.quiz.questions[0];
  Assert(range.type == QuestionType::kNumeric, "'=' answer makes a numeric question");
  Assert(range.numeric_form == NumericForm::kRange && range.range_low == 1.0 &&
             range.range_high == 2.0,
         "Bracketed answer is a range");
  Assert(range.feedback.information == std::string("Any value in the interval works."),
         "'!' is information feedback");

  const auto& percent = parsed.quiz.questions[1];
  Assert(percent.numeric_form == NumericForm::kPercentMargin && percent.target == 5.0 &&
             percent.tolerance == 10.0,
         "Trailing % is a percent margin");

  const auto& all = parsed.annotations.All();
  Assert(all.size() == 1 && all[0].anchor.slot == AnchorSlot::kBeforePoints &&
             all[0].anchor.question == 1,
         "Comment between Title and Points stays before Points");
}

void TestMissingPointsIsLeftForValidation() {
  const auto parsed = MustRead("Quiz title: T\n\n1. Q\n____\n");
  Assert(!parsed.quiz.questions.front().points, "Points stay absent");
  Assert(parsed.quiz.questions.front().display_number == 1, "Stem number is informational");
}

void TestStructuralErrors() {
  ExpectStructuralError("Points: 1\n1. Q\na) x\nc) y\n", 4, "letters out of order");
  ExpectStructuralError("Points: 1\n1. Q\n", 2, "missing answer block");
  ExpectStructuralError("Quiz title: T\nshuffle: true\n", 2, "unknown option");
  ExpectStructuralError("Quiz title: T\nshuffle answers: yes\n", 2, "non-boolean option");
  ExpectStructuralError("Points: x\n1. Q\n____\n", 1, "malformed points");
  ExpectStructuralError("Quiz title: T\nCOMMENT\nnote\n", 2, "unterminated COMMENT");
  ExpectStructuralError("Points: 1\n1. Q\na) x\n[ ] y\n", 4, "mixed choice forms");
  ExpectStructuralError("Points: 1\n1. Q\n____\nrandom text\n", 4, "stray content");
  ExpectStructuralError("Points: 1\n1. Q\na) x\n% c\n... fb\n", 5, "detached choice feedback");
  ExpectStructuralError("Points: 1\n1. Q\n+ a\n+ b\n____\n", 4, "duplicate feedback");
  ExpectStructuralError("Points: 1\n1. Q\n+ a\n% c\n- b\n____\n", 5, "comment in feedback");
  ExpectStructuralError("Points: 1\n1. Q\n=   x +- 1\n", 3, "malformed numeric");
  ExpectStructuralError("Points: 1\n1. Q\n=   [1 2]\n", 3, "range without comma");
  ExpectStructuralError("Points: 1\n1. Q\n! a\n! b\n____\n", 4, "duplicate information");
  ExpectStructuralError("Points: 1\n1. Q\n%%%%\nwhat\n", 4, "unrecognized body");
  ExpectStructuralError("Text title: T\nPoints: 1\n", 2, "text title without Text:");
  ExpectStructuralError("Title: T\nPoints: 1\nQ without number\n", 3, "missing stem number");
}

}  // namespace

int main() {
  try {
    TestFullQuiz();
    TestComments();
    TestInformationFeedbackAndNumericForms();
    TestMissingPointsIsLeftForValidation();
    TestStructuralErrors();
  } catch (const std::exception& ex) {
    std::cerr << "Plaintext reader test failed: " << ex.what() << "\n";
    return 1;
  }
  std::cout << "Plaintext reader test passed\n";
  return 0;
}
