#include <exception>
#include <iostream>
#include <stdexcept>
#include <string>

#include "quizconv/markdown.hpp"
#include "quizconv/plaintext.hpp"
#include "quizconv/quiz_json.hpp"
#include "quizconv/validator.hpp"

namespace {

using quizconv::ParsedQuiz;
using quizconv::markdown::ReadMarkdown;
using quizconv::markdown::WriteMarkdown;
using quizconv::plaintext::ReadPlaintext;
using quizconv::plaintext::WritePlaintext;

void Assert(bool condition, const std::string& message) {
  if (!condition) {
    throw std::runtime_error(message);
  }
}

void AssertText(const std::string& actual, const std::string& expected, const std::string& label) {
  Assert(actual == expected,
         label + " mismatch.\n--- expected ---\n" + expected + "--- actual ---\n" + actual);
}

ParsedQuiz MustReadMarkdown(const std::string& content) {
  auto result = ReadMarkdown(content);
  if (!result.ok()) {
    throw std::runtime_error("Markdown read failed: " + result.error().Describe());
  }
  return result.value();
}

ParsedQuiz MustReadPlaintext(const std::string& content) {
  auto result = ReadPlaintext(content);
  if (!result.ok()) {
    throw std::runtime_error("Plaintext read failed: " + result.error().Describe());
  }
  return result.value();
}

// Canonical Markdown with a comment at every kind of anchor.
const char kCanonicalMarkdown[] =
    "<!-- quiz header -->\n"
    "# Sample\n"
    "\n"
    "Intro.\n"
    "<!-- between paragraphs -->\n"
    "More.\n"
    "\n"
    "<!-- option note -->\n"
    "> shuffle answers: true\n"
    "\n"
    "<!-- first question -->\n"
    "\n"
    "## 1. Addition (points: 1) {type=mc}\n"
    "\n"
    "What is 2+3?\n"
    "<!-- prompt note -->\n"
    "Show work.\n"
    "\n"
    "- [ ] 4\n"
    "<!-- choice note -->\n"
    "- [x] 5\n"
    "  > Yes.\n"
    "\n"
    "<!-- feedback note -->\n"
    "> Correct: Well done.\n"
    "> General: Five.\n"
    "\n"
    "## 2. Pi (points: 2) {type=num}\n"
    "\n"
    "Give pi.\n"
    "\n"
    "<!-- answer note -->\n"
    "### Answer\n"
    "\n"
    "= 3.14 +- 0.01\n"
    "\n"
    "## 3. Capital (points: 1) {type=fill}\n"
    "\n"
    "Capital of France?\n"
    "\n"
    "### Answers\n"
    "\n"
    "- Paris\n"
    "<!-- alt -->\n"
    "- paris\n"
    "\n"
    "<!--\n"
    "trailing\n"
    "-->\n";

const char kCanonicalPlaintext[] =
    "% quiz header\n"
    "Quiz title: Sample\n"
    "Quiz description: Intro.\n"
    "% between paragraphs\n"
    "    More.\n"
    "\n"
    "% option note\n"
    "shuffle answers: true\n"
    "\n"
    "% first question\n"
    "\n"
    "Title: Addition\n"
    "Points: 1\n"
    "1. What is 2+3?\n"
    "% prompt note\n"
    "    Show work.\n"
    "\n"
    "% feedback note\n"
    "+ Well done.\n"
    "... Five.\n"
    "a) 4\n"
    "% choice note\n"
    "*b) 5\n"
    "... Yes.\n"
    "\n"
    "Title: Pi\n"
    "Points: 2\n"
    "2. Give pi.\n"
    "\n"
    "% answer note\n"
    "=   3.14 +- 0.01\n"
    "\n"
    "Title: Capital\n"
    "Points: 1\n"
    "3. Capital of France?\n"
    "*   Paris\n"
    "% alt\n"
    "*   paris\n"
    "\n"
    "COMMENT\n"
    "trailing\n"
    "END_COMMENT\n";

void TestMarkdownIsAFixedPoint() {
  const auto parsed = MustReadMarkdown(kCanonicalMarkdown);
  Assert(!quizconv::Validate(parsed.quiz), "Canonical quiz should be valid");
  Assert(parsed.annotations.Size() == 10, "Expected ten comments");
  AssertText(WriteMarkdown(parsed.quiz, parsed.annotations), kCanonicalMarkdown,
             "Markdown rewrite");
}

void TestMarkdownToPlaintextAndBack() {
  const auto from_markdown = MustReadMarkdown(kCanonicalMarkdown);
  const std::string plaintext = WritePlaintext(from_markdown.quiz, from_markdown.annotations);
  AssertText(plaintext, kCanonicalPlaintext, "Plaintext rendering");

  const auto from_plaintext = MustReadPlaintext(plaintext);
  AssertText(WritePlaintext(from_plaintext.quiz, from_plaintext.annotations), plaintext,
             "Plaintext rewrite");
  AssertText(WriteMarkdown(from_plaintext.quiz, from_plaintext.annotations), kCanonicalMarkdown,
             "Markdown recovered from plaintext");

  Assert(quizconv::QuizToJson(from_markdown.quiz) == quizconv::QuizToJson(from_plaintext.quiz),
         "Both readers should produce the same semantic model");
  Assert(from_plaintext.annotations.Size() == from_markdown.annotations.Size(),
         "Every comment survives the trip");
}

// Hand-written text2qti with a comment at every plaintext anchor.
const char kCommentedPlaintext[] =
    "% before title\n"
    "Quiz title: Fixed\n"
    "Quiz description: About.\n"
    "\n"
    "% before question\n"
    "Title: Colors\n"
    "% between title and points\n"
    "Points: 1\n"
    "% before stem\n"
    "1. Pick a color.\n"
    "% inside stem\n"
    "    Only one.\n"
    "COMMENT\n"
    "before feedback\n"
    "END_COMMENT\n"
    "+ Right.\n"
    "! Primary colors.\n"
    "a) Red\n"
    "% between choices\n"
    "*b) Blue\n"
    "\n"
    "COMMENT\n"
    "end of file\n"
    "END_COMMENT\n";

void TestPlaintextIsAFixedPoint() {
  const auto parsed = MustReadPlaintext(kCommentedPlaintext);
  Assert(!quizconv::Validate(parsed.quiz), "Commented quiz should be valid");
  const auto& all = parsed.annotations.All();
  Assert(all.size() == 8, "Expected eight comments");
  Assert(all[2].anchor.slot == quizconv::AnchorSlot::kBeforePoints,
         "Comment after Title stays before Points");
  AssertText(WritePlaintext(parsed.quiz, parsed.annotations), kCommentedPlaintext,
             "Plaintext rewrite");

  const auto via_markdown = MustReadMarkdown(WriteMarkdown(parsed.quiz, parsed.annotations));
  Assert(via_markdown.annotations.Size() == 8, "Markdown keeps every comment");
  Assert(quizconv::QuizToJson(via_markdown.quiz) == quizconv::QuizToJson(parsed.quiz),
         "Markdown keeps the semantic model");
}

void TestBlankRunsCollapse() {
  const auto parsed = MustReadMarkdown(
      "# T\n\n\n<!-- c -->\n## 1. Q (points: 1) {type=essay}\n\nQ?\n");
  AssertText(WriteMarkdown(parsed.quiz, parsed.annotations),
             "# T\n\n<!-- c -->\n## 1. Q (points: 1) {type=essay}\n\nQ?\n",
             "Two blank lines before a comment");
}

void TestSpacingNormalizes() {
  const auto parsed = MustReadMarkdown(
      "## 1. Q   (points: 1)   {type=essay}\nQ?\n\n\n\n> General:   note\n");
  AssertText(WriteMarkdown(parsed.quiz, parsed.annotations),
             "## 1. Q (points: 1) {type=essay}\n\nQ?\n\n> General: note\n",
             "Non-canonical spacing");
}

}  // namespace

int main() {
  try {
    TestMarkdownIsAFixedPoint();
    TestMarkdownToPlaintextAndBack();
    TestPlaintextIsAFixedPoint();
    TestBlankRunsCollapse();
    TestSpacingNormalizes();
  } catch (const std::exception& ex) {
    std::cerr << "Round trip test failed: " << ex.what() << "\n";
    return 1;
  }
  std::cout << "Round trip test passed\n";
  return 0;
}
