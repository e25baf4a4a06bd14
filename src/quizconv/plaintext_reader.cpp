#include "quizconv/plaintext.hpp"

#include <cctype>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "quizconv/comment_tracker.hpp"
#include "quizconv/logging.hpp"
#include "quizconv/text_util.hpp"

namespace {

using quizconv::Anchor;
using quizconv::Choice;
using quizconv::CommentTracker;
using quizconv::LineKind;
using quizconv::ParsedQuiz;
using quizconv::Question;
using quizconv::QuestionType;
using quizconv::SourceLine;
using quizconv::ThrowStructural;
using quizconv::text::IndentOf;
using quizconv::text::StartsWith;
using quizconv::text::ToLower;
using quizconv::text::Trim;
using quizconv::text::TrimRight;

constexpr std::size_t kContinuationIndent = 4;
constexpr std::size_t kNone = static_cast<std::size_t>(-1);
constexpr char kPayloadHint[] = "expected choices, '=', '*', '____' or '^^^^'";

std::vector<SourceLine> Tokenize(const std::string& content) {
  const auto raw = quizconv::text::SplitLines(content);
  std::vector<SourceLine> lines;
  lines.reserve(raw.size());

  for (std::size_t i = 0; i < raw.size(); ++i) {
    SourceLine line;
    line.number = static_cast<int>(i) + 1;
    const std::string current = TrimRight(raw[i]);

    if (current.empty()) {
      line.kind = LineKind::kBlank;
    } else if (current.front() == '%') {
      std::string body = current.substr(1);
      if (!body.empty() && body.front() == ' ') {
        body.erase(0, 1);
      }
      line.kind = LineKind::kComment;
      line.comment.push_back(body);
    } else if (current == "COMMENT") {
      line.kind = LineKind::kComment;
      line.block = true;
      bool closed = false;
      for (++i; i < raw.size(); ++i) {
        const std::string candidate = TrimRight(raw[i]);
        if (candidate == "END_COMMENT") {
          closed = true;
          break;
        }
        line.comment.push_back(candidate);
      }
      if (!closed) {
        ThrowStructural(line.number, "unterminated COMMENT block; expected END_COMMENT");
      }
    } else {
      line.kind = LineKind::kText;
      line.text = current;
    }
    lines.push_back(std::move(line));
  }
  return lines;
}

struct Stem {
  int number = 0;
  std::string text;
};

std::optional<Stem> ParseStem(const std::string& line) {
  std::size_t digits = 0;
  while (digits < line.size() && std::isdigit(static_cast<unsigned char>(line[digits])) != 0) {
    ++digits;
  }
  if (digits == 0 || digits > 9 || digits >= line.size() || line[digits] != '.') {
    return std::nullopt;
  }
  if (digits + 1 < line.size() && line[digits + 1] != ' ') {
    return std::nullopt;
  }
  Stem stem;
  stem.number = std::stoi(line.substr(0, digits));
  stem.text = Trim(line.substr(digits + 1));
  return stem;
}

bool StartsQuestion(const std::string& line) {
  return StartsWith(line, "Title:") || StartsWith(line, "Points:") ||
         StartsWith(line, "Text title:") || StartsWith(line, "Text:") ||
         ParseStem(line).has_value();
}

// "marker" or "marker <text>"; returns the text.
std::optional<std::string> StripMarker(const std::string& line, const std::string& marker) {
  if (line == marker) {
    return std::string();
  }
  if (StartsWith(line, marker + " ")) {
    return Trim(line.substr(marker.size()));
  }
  return std::nullopt;
}

struct ChoiceLine {
  bool correct = false;
  char letter = 'a';
  std::string text;
};

std::optional<ChoiceLine> ParseLetterChoice(const std::string& line) {
  ChoiceLine choice;
  std::size_t pos = 0;
  if (pos < line.size() && line[pos] == '*') {
    choice.correct = true;
    ++pos;
  }
  if (pos + 1 >= line.size() || line[pos] < 'a' || line[pos] > 'z' || line[pos + 1] != ')') {
    return std::nullopt;
  }
  choice.letter = line[pos];
  pos += 2;
  if (pos < line.size() && line[pos] != ' ') {
    return std::nullopt;
  }
  choice.text = Trim(line.substr(pos));
  return choice;
}

std::optional<ChoiceLine> ParseBracketChoice(const std::string& line) {
  ChoiceLine choice;
  if (StartsWith(line, "[*]")) {
    choice.correct = true;
  } else if (!StartsWith(line, "[ ]")) {
    return std::nullopt;
  }
  if (line.size() > 3 && line[3] != ' ') {
    return std::nullopt;
  }
  choice.text = Trim(line.substr(3));
  return choice;
}

bool IsRule(const std::string& line, char ch) {
  const std::string trimmed = Trim(line);
  return trimmed.size() >= 4 &&
         trimmed.find_first_not_of(ch) == std::string::npos;
}

std::string ContinuationText(const SourceLine& line) {
  return line.text.substr(kContinuationIndent);
}

class PlaintextParser {
 public:
  explicit PlaintextParser(const std::string& content)
      : lines_(Tokenize(content)), tracker_(parsed_.annotations) {}

  ParsedQuiz Parse() {
    std::size_t i = ParsePreamble();
    while (i < lines_.size()) {
      const SourceLine& line = lines_[i];
      if (line.kind != LineKind::kText) {
        Trivia(line);
        ++i;
        continue;
      }
      if (!StartsQuestion(line.text)) {
        ThrowStructural(line.number,
                        parsed_.quiz.questions.empty()
                            ? "unexpected content before the first question"
                            : "unexpected content after question " +
                                  std::to_string(parsed_.quiz.questions.size()));
      }
      i = ParseQuestion(i);
    }
    tracker_.Finish();

    quizconv::logging::LogDebug(
        "Parsed plaintext quiz: " + std::to_string(parsed_.quiz.questions.size()) +
        " question(s), " + std::to_string(parsed_.annotations.Size()) + " comment(s)");
    return std::move(parsed_);
  }

 private:
  void Trivia(const SourceLine& line) {
    if (line.kind == LineKind::kBlank) {
      tracker_.Blank();
    } else if (line.kind == LineKind::kComment) {
      tracker_.Comment(line);
    }
  }

  // Feeds blanks and comments to the tracker; returns the next text line.
  std::size_t SkipTrivia(std::size_t i) {
    for (; i < lines_.size() && lines_[i].kind != LineKind::kText; ++i) {
      Trivia(lines_[i]);
    }
    return i;
  }

  int LineAt(std::size_t i) const {
    if (i < lines_.size()) {
      return lines_[i].number;
    }
    return lines_.empty() ? 1 : lines_.back().number;
  }

  bool IsContinuation(std::size_t i) const {
    return i < lines_.size() && lines_[i].kind == LineKind::kText &&
           IndentOf(lines_[i].text) >= kContinuationIndent;
  }

  // Indented lines of a free-text block, comments allowed in between.
  std::size_t ReadContinuationBlock(std::size_t begin, const Anchor& leading,
                                    const Anchor& within, std::vector<std::string>& lines) {
    std::size_t last = kNone;
    for (std::size_t j = begin; j < lines_.size(); ++j) {
      if (lines_[j].kind != LineKind::kText) {
        continue;
      }
      if (IndentOf(lines_[j].text) < kContinuationIndent) {
        break;
      }
      last = j;
    }
    if (last == kNone) {
      return begin;
    }
    quizconv::ReadTextBlock(lines_, begin, last, ContinuationText, leading, within, tracker_,
                            lines);
    return last + 1;
  }

  // Indented lines directly continuing a one-line entry (choice, feedback).
  std::size_t ReadAttached(std::size_t i, std::string& value) const {
    while (i < lines_.size()) {
      std::size_t j = i;
      while (j < lines_.size() && lines_[j].kind == LineKind::kBlank) {
        ++j;
      }
      if (!IsContinuation(j)) {
        break;
      }
      for (; i < j; ++i) {
        value += "\n";
      }
      value += "\n" + ContinuationText(lines_[j]);
      i = j + 1;
    }
    return i;
  }

  std::size_t ParsePreamble() {
    enum class Stage { kStart, kTitle, kDescription, kOptions };
    auto& quiz = parsed_.quiz;
    Stage stage = Stage::kStart;

    std::size_t i = 0;
    while (i < lines_.size()) {
      const SourceLine& line = lines_[i];
      if (line.kind != LineKind::kText) {
        Trivia(line);
        ++i;
        continue;
      }
      const std::string& text = line.text;
      if (StartsQuestion(text)) {
        break;
      }
      if (StartsWith(text, "Quiz title:")) {
        if (stage != Stage::kStart) {
          ThrowStructural(line.number, "'Quiz title:' must come first in the quiz preamble");
        }
        tracker_.Consume(Anchor::BeforeTitle());
        quiz.title = Trim(text.substr(11));
        stage = Stage::kTitle;
        ++i;
        continue;
      }
      if (StartsWith(text, "Quiz description:")) {
        if (stage == Stage::kDescription || stage == Stage::kOptions) {
          ThrowStructural(line.number, "'Quiz description:' must come before quiz options");
        }
        tracker_.Consume(Anchor::BeforeDescription());
        const std::string first = Trim(text.substr(17));
        if (!first.empty()) {
          quiz.description.push_back(first);
        }
        i = ReadContinuationBlock(i + 1, Anchor::BeforeDescription(),
                                  Anchor::WithinDescription(0), quiz.description);
        stage = Stage::kDescription;
        continue;
      }
      const auto colon = text.find(':');
      if (colon != std::string::npos && IndentOf(text) == 0) {
        ParseOption(line, colon);
        stage = Stage::kOptions;
        ++i;
        continue;
      }
      ThrowStructural(line.number, "unexpected content before the first question");
    }
    return i;
  }

  void ParseOption(const SourceLine& line, std::size_t colon) {
    auto& quiz = parsed_.quiz;
    const std::string key = Trim(line.text.substr(0, colon));
    const std::string value = ToLower(Trim(line.text.substr(colon + 1)));
    const auto option = quizconv::ParseOptionLabel(key);
    if (!option) {
      ThrowStructural(line.number, "unrecognized quiz option '" + key + "'");
    }
    if (value != "true" && value != "false") {
      ThrowStructural(line.number, "quiz option '" + key + "' expects true or false, found '" +
                                       value + "'");
    }
    for (const auto& existing : quiz.options) {
      if (existing.option == *option) {
        ThrowStructural(line.number, "quiz option '" + quizconv::OptionLabel(*option) +
                                         "' is set more than once");
      }
    }
    tracker_.Consume(Anchor::BeforeOption(quiz.options.size()));
    quizconv::OptionSetting setting;
    setting.option = *option;
    setting.value = value == "true";
    setting.line = line.number;
    quiz.options.push_back(setting);
  }

  std::size_t ParseQuestion(std::size_t i) {
    const std::size_t index = parsed_.quiz.questions.size();
    Question question;
    question.position = index + 1;
    question.line = lines_[i].number;
    tracker_.Consume(Anchor::BeforeQuestion(index));

    if (StartsWith(lines_[i].text, "Text title:") || StartsWith(lines_[i].text, "Text:")) {
      i = ParseTextStimulus(question, index, i);
      parsed_.quiz.questions.push_back(std::move(question));
      return i;
    }

    if (StartsWith(lines_[i].text, "Title:")) {
      question.title = Trim(lines_[i].text.substr(6));
      i = SkipTrivia(i + 1);
    }
    if (i < lines_.size() && StartsWith(lines_[i].text, "Points:")) {
      tracker_.Consume(Anchor::BeforePoints(index));
      const std::string value = Trim(lines_[i].text.substr(7));
      const auto points = quizconv::text::ParseNumber(value);
      if (!points) {
        ThrowStructural(lines_[i].number, "malformed point value '" + value + "'",
                        question.position);
      }
      question.points = *points;
      i = SkipTrivia(i + 1);
    }
    const auto stem = i < lines_.size() ? ParseStem(lines_[i].text) : std::nullopt;
    if (!stem) {
      ThrowStructural(LineAt(i), "expected a numbered question line like '1. <prompt>'",
                      question.position);
    }
    tracker_.Consume(Anchor::BeforePrompt(index));
    question.display_number = stem->number;
    if (!stem->text.empty()) {
      question.prompt.push_back(stem->text);
    }
    i = ReadContinuationBlock(i + 1, Anchor::BeforePrompt(index), Anchor::WithinPrompt(index, 0),
                              question.prompt);

    i = ParseQuestionFeedback(question, index, i);
    i = ParsePayload(question, index, i);
    parsed_.quiz.questions.push_back(std::move(question));
    return i;
  }

  std::size_t ParseTextStimulus(Question& question, std::size_t index, std::size_t i) {
    question.type = QuestionType::kTextStimulus;
    if (StartsWith(lines_[i].text, "Text title:")) {
      question.title = Trim(lines_[i].text.substr(11));
      i = SkipTrivia(i + 1);
      if (i >= lines_.size() || !StartsWith(lines_[i].text, "Text:")) {
        ThrowStructural(LineAt(i), "expected 'Text:' after 'Text title:'", question.position);
      }
    }
    tracker_.Consume(Anchor::BeforePrompt(index));
    const std::string first = Trim(lines_[i].text.substr(5));
    if (!first.empty()) {
      question.prompt.push_back(first);
    }
    return ReadContinuationBlock(i + 1, Anchor::BeforePrompt(index),
                                 Anchor::WithinPrompt(index, 0), question.prompt);
  }

  std::size_t ParseQuestionFeedback(Question& question, std::size_t index, std::size_t i) {
    bool seen = false;
    bool commented = false;
    while (i < lines_.size()) {
      const SourceLine& line = lines_[i];
      if (line.kind != LineKind::kText) {
        if (line.kind == LineKind::kComment && seen) {
          commented = true;
        }
        Trivia(line);
        ++i;
        continue;
      }

      std::optional<std::string>* slot = nullptr;
      std::optional<std::string> body;
      std::string label;
      if ((body = StripMarker(line.text, "..."))) {
        slot = &question.feedback.general;
        label = "...";
      } else if ((body = StripMarker(line.text, "+"))) {
        slot = &question.feedback.correct;
        label = "+";
      } else if ((body = StripMarker(line.text, "-"))) {
        slot = &question.feedback.incorrect;
        label = "-";
      } else if ((body = StripMarker(line.text, "!"))) {
        slot = &question.feedback.information;
        label = "!";
      } else {
        break;
      }
      if (commented) {
        ThrowStructural(line.number, "comments cannot appear inside the question feedback block",
                        question.position);
      }
      if (slot->has_value()) {
        ThrowStructural(line.number, "duplicate '" + label + "' feedback", question.position);
      }
      tracker_.Consume(Anchor::BeforeFeedback(index));
      std::string value = *body;
      i = ReadAttached(i + 1, value);
      *slot = std::move(value);
      seen = true;
    }
    return i;
  }

  std::size_t ParsePayload(Question& question, std::size_t index, std::size_t i) {
    i = SkipTrivia(i);
    if (i >= lines_.size() || StartsQuestion(lines_[i].text)) {
      ThrowStructural(LineAt(i), std::string("question has no answer block; ") + kPayloadHint,
                      question.position);
    }
    const SourceLine& line = lines_[i];
    if (ParseLetterChoice(line.text)) {
      question.type = QuestionType::kSingleChoice;
      return ParseChoices(question, index, i);
    }
    if (ParseBracketChoice(line.text)) {
      question.type = QuestionType::kMultiChoice;
      return ParseChoices(question, index, i);
    }
    if (StartsWith(line.text, "=")) {
      question.type = QuestionType::kNumeric;
      ParseNumeric(question, line);
      tracker_.Consume(Anchor::BeforeAnswer(index, 0));
      return i + 1;
    }
    if (StripMarker(line.text, "*")) {
      question.type = QuestionType::kShortAnswer;
      return ParseAnswers(question, index, i);
    }
    if (IsRule(line.text, '_')) {
      question.type = QuestionType::kEssay;
      tracker_.Consume(Anchor::BeforeAnswer(index, 0));
      return i + 1;
    }
    if (IsRule(line.text, '^')) {
      question.type = QuestionType::kFileUpload;
      tracker_.Consume(Anchor::BeforeAnswer(index, 0));
      return i + 1;
    }
    ThrowStructural(line.number, std::string("unrecognized question body; ") + kPayloadHint,
                    question.position);
  }

  std::size_t ParseChoices(Question& question, std::size_t index, std::size_t i) {
    const bool lettered = question.type == QuestionType::kSingleChoice;
    while (true) {
      i = SkipTrivia(i);
      if (i >= lines_.size()) {
        break;
      }
      const SourceLine& line = lines_[i];
      const auto parsed = lettered ? ParseLetterChoice(line.text) : ParseBracketChoice(line.text);
      if (!parsed) {
        if (lettered ? ParseBracketChoice(line.text).has_value()
                     : ParseLetterChoice(line.text).has_value()) {
          ThrowStructural(line.number, "cannot mix 'a)' and '[ ]' choice forms in one question",
                          question.position);
        }
        if (StripMarker(line.text, "...")) {
          ThrowStructural(line.number, "choice feedback must directly follow its choice",
                          question.position);
        }
        break;
      }
      const std::size_t k = question.choices.size();
      if (lettered) {
        const char expected = static_cast<char>('a' + k);
        if (k >= 26 || parsed->letter != expected) {
          ThrowStructural(line.number,
                          std::string("expected choice '") + (k < 26 ? expected : '?') +
                              ")', found '" + parsed->letter + ")'",
                          question.position);
        }
      }
      tracker_.Consume(Anchor::BeforeAnswer(index, k));
      Choice choice;
      choice.correct = parsed->correct;
      choice.text = parsed->text;
      choice.line = line.number;
      i = ReadAttached(i + 1, choice.text);

      while (i < lines_.size() && lines_[i].kind == LineKind::kText) {
        const auto feedback = StripMarker(lines_[i].text, "...");
        if (!feedback) {
          break;
        }
        std::string value = *feedback;
        i = ReadAttached(i + 1, value);
        choice.feedback = choice.feedback ? *choice.feedback + "\n" + value : value;
      }
      question.choices.push_back(std::move(choice));
    }
    return i;
  }

  void ParseNumeric(Question& question, const SourceLine& line) {
    if (!quizconv::ParseNumericAnswer(line.text.substr(1), question)) {
      ThrowStructural(line.number,
                      "malformed numeric answer '" + line.text +
                          "'; expected '=   <value> +- <tolerance>', '=   [<low>, <high>]' or "
                          "'=   <value> +- <percent>%'",
                      question.position);
    }
  }

  std::size_t ParseAnswers(Question& question, std::size_t index, std::size_t i) {
    while (true) {
      i = SkipTrivia(i);
      if (i >= lines_.size()) {
        break;
      }
      const SourceLine& line = lines_[i];
      if (ParseLetterChoice(line.text)) {
        break;
      }
      const auto answer = StripMarker(line.text, "*");
      if (!answer) {
        break;
      }
      if (answer->empty()) {
        ThrowStructural(line.number, "empty short answer", question.position);
      }
      tracker_.Consume(Anchor::BeforeAnswer(index, question.answers.size()));
      question.answers.push_back(*answer);
      ++i;
    }
    return i;
  }

  std::vector<SourceLine> lines_;
  ParsedQuiz parsed_;
  CommentTracker tracker_;
};

}  // namespace

namespace quizconv::plaintext {

Result<ParsedQuiz> ReadPlaintext(const std::string& content) {
  try {
    PlaintextParser parser(content);
    return Result<ParsedQuiz>::Success(parser.Parse());
  } catch (const ConversionException& ex) {
    logging::LogDebug("Plaintext read failed: " + ex.error().Describe());
    return Result<ParsedQuiz>::Failure(ex.error());
  }
}

}  // namespace quizconv::plaintext
