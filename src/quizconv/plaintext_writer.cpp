#include "quizconv/plaintext.hpp"

#include "quizconv/line_emitter.hpp"
#include "quizconv/logging.hpp"
#include "quizconv/text_util.hpp"

namespace {

using quizconv::Anchor;
using quizconv::LineEmitter;
using quizconv::Question;
using quizconv::QuestionType;
using quizconv::text::FormatNumber;

constexpr char kIndent[] = "    ";

std::string Indented(const std::string& line) { return line.empty() ? line : kIndent + line; }

// Writes `marker text` followed by indented continuation lines.
void WriteEntry(LineEmitter& out, const std::string& marker, const std::string& value) {
  auto lines = quizconv::text::SplitLines(value);
  if (lines.empty()) {
    lines.emplace_back();
  }
  out.Line(lines.front().empty() ? marker : marker + " " + lines.front(), 0);
  for (std::size_t k = 1; k < lines.size(); ++k) {
    out.Line(Indented(lines[k]), 0);
  }
}

// First line after `lead`, the rest as anchored continuation lines.
void WriteBlock(LineEmitter& out, const std::string& lead, const std::vector<std::string>& lines,
                Anchor within, int gap) {
  out.Line(lines.empty() || lines.front().empty() ? lead : lead + " " + lines.front(), gap);
  for (std::size_t k = 1; k < lines.size(); ++k) {
    within.index = k;
    out.Comments(within);
    out.Line(Indented(lines[k]), 0);
  }
}

void WriteFeedback(LineEmitter& out, const Question& question) {
  if (question.feedback.correct) {
    WriteEntry(out, "+", *question.feedback.correct);
  }
  if (question.feedback.incorrect) {
    WriteEntry(out, "-", *question.feedback.incorrect);
  }
  if (question.feedback.general) {
    WriteEntry(out, "...", *question.feedback.general);
  }
  if (question.feedback.information) {
    WriteEntry(out, "!", *question.feedback.information);
  }
}

void WriteChoices(LineEmitter& out, const Question& question, std::size_t index) {
  const bool lettered = question.type == QuestionType::kSingleChoice;
  for (std::size_t k = 0; k < question.choices.size(); ++k) {
    const auto& choice = question.choices[k];
    if (k > 0) {
      out.Comments(Anchor::BeforeAnswer(index, k));
    }
    std::string marker;
    if (lettered) {
      marker = std::string(choice.correct ? "*" : "") + static_cast<char>('a' + k % 26) + ")";
    } else {
      marker = choice.correct ? "[*]" : "[ ]";
    }
    WriteEntry(out, marker, choice.text);
    if (choice.feedback) {
      WriteEntry(out, "...", *choice.feedback);
    }
  }
}

void WritePayload(LineEmitter& out, const Question& question, std::size_t index) {
  switch (question.type) {
    case QuestionType::kSingleChoice:
    case QuestionType::kMultiChoice:
      WriteChoices(out, question, index);
      break;
    case QuestionType::kNumeric:
      out.Line("=   " + quizconv::FormatNumericAnswer(question), 0);
      break;
    case QuestionType::kShortAnswer:
      for (std::size_t k = 0; k < question.answers.size(); ++k) {
        if (k > 0) {
          out.Comments(Anchor::BeforeAnswer(index, k));
        }
        out.Line("*   " + question.answers[k], 0);
      }
      break;
    case QuestionType::kEssay:
      out.Line("____", 0);
      break;
    case QuestionType::kFileUpload:
      out.Line("^^^^", 0);
      break;
    case QuestionType::kTextStimulus:
      break;
  }
}

}  // namespace

namespace quizconv::plaintext {

std::string WritePlaintext(const Quiz& quiz, const Annotations& annotations) {
  LineEmitter out(annotations, CommentSyntax::kPercent);

  out.Comments(Anchor::BeforeTitle());
  if (quiz.title.empty()) {
    logging::LogWarn("Quiz has no title; text2qti expects a 'Quiz title:' line.");
  } else {
    out.Line("Quiz title: " + quiz.title, 0);
  }
  out.Comments(Anchor::BeforeDescription());
  if (!quiz.description.empty()) {
    WriteBlock(out, "Quiz description:", quiz.description, Anchor::WithinDescription(0), 0);
  }
  for (std::size_t k = 0; k < quiz.options.size(); ++k) {
    const auto& setting = quiz.options[k];
    out.Comments(Anchor::BeforeOption(k));
    out.Line(OptionLabel(setting.option) + ": " + (setting.value ? "true" : "false"), 0);
  }

  int number = 0;
  for (std::size_t index = 0; index < quiz.questions.size(); ++index) {
    const Question& question = quiz.questions[index];
    out.Comments(Anchor::BeforeQuestion(index));

    if (question.type == QuestionType::kTextStimulus) {
      out.Line(question.title.empty() ? "Text title:" : "Text title: " + question.title, 1);
      out.Comments(Anchor::BeforePrompt(index));
      WriteBlock(out, "Text:", question.prompt, Anchor::WithinPrompt(index, 0), 0);
      continue;
    }

    ++number;
    if (!question.title.empty()) {
      out.Line("Title: " + question.title, 1);
    }
    out.Comments(Anchor::BeforePoints(index));
    out.Line("Points: " + FormatNumber(question.points.value_or(0)),
             question.title.empty() ? 1 : 0);
    out.Comments(Anchor::BeforePrompt(index));
    WriteBlock(out, std::to_string(number) + ".", question.prompt,
               Anchor::WithinPrompt(index, 0), 0);

    out.Comments(Anchor::BeforeFeedback(index));
    WriteFeedback(out, question);
    out.Comments(Anchor::BeforeAnswer(index, 0));
    WritePayload(out, question, index);
  }

  out.Comments(Anchor::EndOfFile());
  logging::LogDebug("Wrote plaintext quiz with " + std::to_string(quiz.questions.size()) +
                    " question(s)");
  return out.Finish();
}

}  // namespace quizconv::plaintext
