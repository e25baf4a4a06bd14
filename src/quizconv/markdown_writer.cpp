#include "quizconv/markdown.hpp"

#include <sstream>

#include "quizconv/line_emitter.hpp"
#include "quizconv/logging.hpp"
#include "quizconv/text_util.hpp"

namespace {

using quizconv::Anchor;
using quizconv::LineEmitter;
using quizconv::NumericForm;
using quizconv::Question;
using quizconv::QuestionType;
using quizconv::text::FormatNumber;
using quizconv::text::SplitLines;

// Splits multi-line model text; an empty string is one empty line.
std::vector<std::string> TextLines(const std::string& value) {
  auto lines = SplitLines(value);
  if (lines.empty()) {
    lines.emplace_back();
  }
  return lines;
}

std::string Header(const Question& question, int number) {
  std::ostringstream oss;
  oss << "## ";
  if (question.type == QuestionType::kTextStimulus) {
    if (!question.title.empty()) {
      oss << question.title << " ";
    }
    oss << "{type=text}";
    return oss.str();
  }
  oss << number << ". ";
  if (!question.title.empty()) {
    oss << question.title << " ";
  }
  oss << "(points: " << FormatNumber(question.points.value_or(0)) << ") {type="
      << quizconv::TypeCode(question.type) << "}";
  return oss.str();
}

void WriteBlock(LineEmitter& out, const std::vector<std::string>& lines, Anchor within) {
  for (std::size_t k = 0; k < lines.size(); ++k) {
    if (k > 0) {
      within.index = k;
      out.Comments(within);
    }
    out.Line(lines[k], k == 0 ? 1 : 0);
  }
}

void WriteQuoted(LineEmitter& out, const std::string& indent, const std::string& value) {
  for (const auto& line : TextLines(value)) {
    out.Line(indent + (line.empty() ? ">" : "> " + line), 0);
  }
}

void WriteChoices(LineEmitter& out, const Question& question, std::size_t index) {
  for (std::size_t k = 0; k < question.choices.size(); ++k) {
    const auto& choice = question.choices[k];
    if (k > 0) {
      out.Comments(Anchor::BeforeAnswer(index, k));
    }
    const auto lines = TextLines(choice.text);
    out.Line(std::string(choice.correct ? "- [x]" : "- [ ]") +
                 (lines.front().empty() ? "" : " " + lines.front()),
             k == 0 ? 1 : 0);
    for (std::size_t l = 1; l < lines.size(); ++l) {
      out.Line(lines[l].empty() ? "" : "  " + lines[l], 0);
    }
    if (choice.feedback) {
      WriteQuoted(out, "  ", *choice.feedback);
    }
  }
}

void WriteFeedback(LineEmitter& out, const Question& question) {
  int gap = 1;
  const auto entry = [&](const std::optional<std::string>& value, const char* label) {
    if (!value) {
      return;
    }
    const auto lines = TextLines(*value);
    out.Line(std::string("> ") + label + (lines.front().empty() ? "" : " " + lines.front()),
             gap);
    for (std::size_t k = 1; k < lines.size(); ++k) {
      out.Line(lines[k].empty() ? ">" : "> " + lines[k], 0);
    }
    gap = 0;
  };
  entry(question.feedback.correct, "Correct:");
  entry(question.feedback.incorrect, "Incorrect:");
  entry(question.feedback.general, "General:");
  entry(question.feedback.information, "Information:");
}

}  // namespace

namespace quizconv::markdown {

std::string WriteMarkdown(const Quiz& quiz, const Annotations& annotations) {
  LineEmitter out(annotations, CommentSyntax::kHtml);

  out.Comments(Anchor::BeforeTitle());
  if (!quiz.title.empty()) {
    out.Line("# " + quiz.title, 1);
  }
  out.Comments(Anchor::BeforeDescription());
  WriteBlock(out, quiz.description, Anchor::WithinDescription(0));

  for (std::size_t k = 0; k < quiz.options.size(); ++k) {
    const auto& setting = quiz.options[k];
    out.Comments(Anchor::BeforeOption(k));
    const std::string option =
        OptionLabel(setting.option) + ": " + (setting.value ? "true" : "false");
    out.Line(setting.hidden ? "<!--# " + option + " -->" : "> " + option, k == 0 ? 1 : 0);
  }

  int number = 0;
  for (std::size_t index = 0; index < quiz.questions.size(); ++index) {
    const Question& question = quiz.questions[index];
    out.Comments(Anchor::BeforeQuestion(index));
    if (IsGradeable(question.type)) {
      ++number;
    }
    out.Line(Header(question, number), 1);

    // No points line in Markdown; those comments join the prompt's.
    out.Comments(Anchor::BeforePoints(index));
    out.Comments(Anchor::BeforePrompt(index));
    WriteBlock(out, question.prompt, Anchor::WithinPrompt(index, 0));

    out.Comments(Anchor::BeforeAnswer(index, 0));
    switch (question.type) {
      case QuestionType::kSingleChoice:
      case QuestionType::kMultiChoice:
        WriteChoices(out, question, index);
        break;
      case QuestionType::kNumeric:
        out.Line("### Answer", 1);
        if (question.target || question.numeric_form == NumericForm::kRange) {
          out.Line("= " + quizconv::FormatNumericAnswer(question), 1);
        }
        break;
      case QuestionType::kShortAnswer:
        out.Line("### Answers", 1);
        for (std::size_t k = 0; k < question.answers.size(); ++k) {
          if (k > 0) {
            out.Comments(Anchor::BeforeAnswer(index, k));
          }
          out.Line("- " + question.answers[k], k == 0 ? 1 : 0);
        }
        break;
      case QuestionType::kEssay:
      case QuestionType::kFileUpload:
      case QuestionType::kTextStimulus:
        break;
    }

    out.Comments(Anchor::BeforeFeedback(index));
    WriteFeedback(out, question);
  }

  out.Comments(Anchor::EndOfFile());
  logging::LogDebug("Wrote Markdown quiz with " + std::to_string(quiz.questions.size()) +
                    " question(s)");
  return out.Finish();
}

}  // namespace quizconv::markdown
