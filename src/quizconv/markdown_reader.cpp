#include "quizconv/markdown.hpp"

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
using quizconv::QuizOption;
using quizconv::SourceLine;
using quizconv::ThrowStructural;
using quizconv::text::EndsWith;
using quizconv::text::IndentOf;
using quizconv::text::StartsWith;
using quizconv::text::ToLower;
using quizconv::text::Trim;
using quizconv::text::TrimRight;

constexpr char kCommentOpen[] = "<!--";
constexpr char kCommentClose[] = "-->";
constexpr std::size_t kNone = static_cast<std::size_t>(-1);

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
    } else if (StartsWith(current, kCommentOpen)) {
      const std::string body = current.substr(4);
      if (EndsWith(body, kCommentClose)) {
        line.kind = LineKind::kComment;
        line.text = current;
        line.comment.push_back(Trim(body.substr(0, body.size() - 3)));
      } else if (body.find(kCommentClose) != std::string::npos) {
        // Inline comment followed by text is ordinary content.
        line.kind = LineKind::kText;
        line.text = current;
      } else {
        line.kind = LineKind::kComment;
        line.block = true;
        if (!Trim(body).empty()) {
          line.comment.push_back(Trim(body));
          line.inline_open = true;
        }
        bool closed = false;
        for (++i; i < raw.size(); ++i) {
          const std::string candidate = TrimRight(raw[i]);
          if (EndsWith(candidate, kCommentClose)) {
            const std::string rest = TrimRight(candidate.substr(0, candidate.size() - 3));
            if (!rest.empty()) {
              line.comment.push_back(rest);
              line.inline_close = true;
            }
            closed = true;
            break;
          }
          line.comment.push_back(candidate);
        }
        if (!closed) {
          ThrowStructural(line.number, "unterminated comment block; expected '-->'");
        }
      }
    } else {
      line.kind = LineKind::kText;
      line.text = current;
    }
    lines.push_back(std::move(line));
  }
  return lines;
}

bool IsHeading1(const std::string& line) { return line == "#" || StartsWith(line, "# "); }

bool IsHeading2(const std::string& line) { return line == "##" || StartsWith(line, "## "); }

bool IsAnswerHeader(const std::string& line) {
  std::string lowered = ToLower(Trim(line));
  if (EndsWith(lowered, ":")) {
    lowered.pop_back();
  }
  return lowered == "### answer" || lowered == "### answers";
}

struct ChoiceMarker {
  std::size_t indent = 0;
  bool correct = false;
  std::string text;
};

std::optional<ChoiceMarker> ParseChoiceMarker(const std::string& line) {
  const std::size_t indent = IndentOf(line);
  if (indent > 3) {
    return std::nullopt;
  }
  const std::string rest = line.substr(indent);
  if (rest.size() < 5 || !(StartsWith(rest, "- [") || StartsWith(rest, "* [")) ||
      rest[4] != ']') {
    return std::nullopt;
  }
  const char mark = rest[3];
  if (mark != ' ' && mark != 'x' && mark != 'X') {
    return std::nullopt;
  }
  if (rest.size() > 5 && rest[5] != ' ') {
    return std::nullopt;
  }
  ChoiceMarker marker;
  marker.indent = indent;
  marker.correct = mark != ' ';
  marker.text = Trim(rest.substr(5));
  return marker;
}

enum class FeedbackKind { kCorrect, kIncorrect, kGeneral, kInformation };

struct FeedbackLine {
  FeedbackKind kind = FeedbackKind::kGeneral;
  std::string text;
};

std::optional<FeedbackLine> ParseFeedbackLine(const std::string& line) {
  if (!StartsWith(line, ">")) {
    return std::nullopt;
  }
  const std::string body = Trim(line.substr(1));
  const auto colon = body.find(':');
  if (colon == std::string::npos) {
    return std::nullopt;
  }
  const std::string key = ToLower(Trim(body.substr(0, colon)));
  FeedbackLine feedback;
  if (key == "correct") {
    feedback.kind = FeedbackKind::kCorrect;
  } else if (key == "incorrect") {
    feedback.kind = FeedbackKind::kIncorrect;
  } else if (key == "general") {
    feedback.kind = FeedbackKind::kGeneral;
  } else if (key == "information") {
    feedback.kind = FeedbackKind::kInformation;
  } else {
    return std::nullopt;
  }
  feedback.text = Trim(body.substr(colon + 1));
  return feedback;
}

std::string FeedbackLabel(FeedbackKind kind) {
  switch (kind) {
    case FeedbackKind::kCorrect:
      return "Correct";
    case FeedbackKind::kIncorrect:
      return "Incorrect";
    case FeedbackKind::kGeneral:
      return "General";
    case FeedbackKind::kInformation:
      return "Information";
  }
  return "General";
}

// Text after the leading '>' and at most one space.
std::string QuoteBody(const std::string& quoted) {
  std::string body = quoted.substr(1);
  if (!body.empty() && body.front() == ' ') {
    body.erase(0, 1);
  }
  return TrimRight(body);
}

bool StartsBullet(const std::string& line) {
  if (IndentOf(line) > 3) {
    return false;
  }
  const std::string trimmed = Trim(line);
  return trimmed == "-" || trimmed == "*" || StartsWith(trimmed, "- ") ||
         StartsWith(trimmed, "* ");
}

std::string KnownOptionList() {
  std::string joined;
  for (int value = 0; value <= static_cast<int>(QuizOption::kSolutionsRandomizeGroups);
       ++value) {
    if (!joined.empty()) {
      joined += ", ";
    }
    joined += quizconv::OptionLabel(static_cast<QuizOption>(value));
  }
  return joined;
}

std::string LineText(const SourceLine& line) { return line.text; }

// "<!--# key: value -->" keeps an option out of rendered Markdown.
bool IsHiddenForm(const SourceLine& line) {
  return line.kind == LineKind::kComment && !line.block && StartsWith(line.text, "<!--#");
}

// The "key: value" part of a blockquoted or hidden option line.
std::string OptionText(const SourceLine& line) {
  if (IsHiddenForm(line)) {
    return Trim(line.comment.front().substr(1));
  }
  return Trim(line.text.substr(1));
}

// Only recognized keys count, so "> Hint: ..." stays in the description.
bool IsOptionLine(const SourceLine& line) {
  const bool quoted = line.kind == LineKind::kText && StartsWith(line.text, ">");
  if (!quoted && !IsHiddenForm(line)) {
    return false;
  }
  const std::string body = OptionText(line);
  const auto colon = body.find(':');
  return colon != std::string::npos && quizconv::ParseOptionLabel(body.substr(0, colon));
}

class MarkdownParser {
 public:
  explicit MarkdownParser(const std::string& content)
      : lines_(Tokenize(content)), tracker_(parsed_.annotations) {}

  ParsedQuiz Parse() {
    const std::size_t first_heading = NextHeading(0);
    ParsePreamble(first_heading);

    std::size_t start = first_heading;
    while (start < lines_.size()) {
      const std::size_t next = NextHeading(start + 1);
      ParseQuestion(start, next);
      start = next;
    }
    tracker_.Finish();

    quizconv::logging::LogDebug(
        "Parsed Markdown quiz: " + std::to_string(parsed_.quiz.questions.size()) +
        " question(s), " + std::to_string(parsed_.annotations.Size()) + " comment(s)");
    return std::move(parsed_);
  }

 private:
  std::size_t NextHeading(std::size_t from) const {
    for (std::size_t i = from; i < lines_.size(); ++i) {
      if (lines_[i].kind == LineKind::kText && IsHeading2(lines_[i].text)) {
        return i;
      }
    }
    return lines_.size();
  }

  std::size_t LastText(std::size_t begin, std::size_t end) const {
    for (std::size_t i = end; i > begin; --i) {
      if (lines_[i - 1].kind == LineKind::kText) {
        return i - 1;
      }
    }
    return kNone;
  }

  void Trivia(const SourceLine& line) {
    if (line.kind == LineKind::kBlank) {
      tracker_.Blank();
    } else if (line.kind == LineKind::kComment) {
      tracker_.Comment(line);
    }
  }

  void ParsePreamble(std::size_t end) {
    auto& quiz = parsed_.quiz;
    std::size_t i = 0;

    for (std::size_t j = 0; j < end; ++j) {
      if (lines_[j].kind != LineKind::kText) {
        continue;
      }
      if (IsHeading1(lines_[j].text)) {
        for (; i < j; ++i) {
          Trivia(lines_[i]);
        }
        tracker_.Consume(Anchor::BeforeTitle());
        quiz.title = Trim(lines_[j].text.substr(1));
        i = j + 1;
      }
      break;
    }

    // Options are the trailing run of "> key: value" or "<!--# key: value -->" lines.
    std::size_t options_begin = end;
    for (std::size_t j = end; j > i; --j) {
      const SourceLine& line = lines_[j - 1];
      if (IsOptionLine(line)) {
        options_begin = j - 1;
        continue;
      }
      if (line.kind == LineKind::kText) {
        break;
      }
    }

    const std::size_t last = LastText(i, options_begin);
    if (last != kNone) {
      quizconv::ReadTextBlock(lines_, i, last, LineText, Anchor::BeforeDescription(),
                              Anchor::WithinDescription(0), tracker_, quiz.description);
      i = last + 1;
    }

    for (; i < end; ++i) {
      if (lines_[i].kind == LineKind::kText || IsOptionLine(lines_[i])) {
        ParseOption(lines_[i]);
      } else {
        Trivia(lines_[i]);
      }
    }
  }

  void ParseOption(const SourceLine& line) {
    auto& quiz = parsed_.quiz;
    const std::string body = OptionText(line);
    const auto colon = body.find(':');
    const std::string key = Trim(body.substr(0, colon));
    const std::string value = ToLower(Trim(body.substr(colon + 1)));

    const auto option = quizconv::ParseOptionLabel(key);
    if (!option) {
      ThrowStructural(line.number, "unrecognized quiz option '" + key + "'; expected one of " +
                                       KnownOptionList());
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
    setting.hidden = IsHiddenForm(line);
    setting.line = line.number;
    quiz.options.push_back(setting);
  }

  Question ParseHeader(const SourceLine& line) const {
    Question question;
    question.line = line.number;
    std::string body = Trim(line.text.substr(2));

    std::string attributes;
    bool has_attributes = false;
    if (EndsWith(body, "}")) {
      const auto open = body.rfind('{');
      if (open == std::string::npos) {
        ThrowStructural(line.number, "unbalanced '}' in question header");
      }
      attributes = body.substr(open + 1, body.size() - open - 2);
      body = TrimRight(body.substr(0, open));
      has_attributes = true;
    }
    if (!has_attributes) {
      ThrowStructural(line.number,
                      "question header is missing a {type=...} attribute; expected one of "
                      "mc, ma, num, fill, essay, file, text");
    }

    std::optional<QuestionType> type;
    std::optional<double> attribute_points;
    std::string token;
    const auto apply = [&](const std::string& item) {
      if (item.empty()) {
        return;
      }
      const auto equals = item.find('=');
      if (equals == std::string::npos) {
        ThrowStructural(line.number,
                        "malformed header attribute '" + item + "'; expected key=value");
      }
      const std::string key = ToLower(Trim(item.substr(0, equals)));
      const std::string value = Trim(item.substr(equals + 1));
      if (key == "type") {
        type = quizconv::ParseTypeCode(value);
        if (!type) {
          ThrowStructural(line.number, "unrecognized question type '" + value +
                                           "'; expected one of mc, ma, num, fill, essay, "
                                           "file, text");
        }
      } else if (key == "points") {
        attribute_points = quizconv::text::ParseNumber(value);
        if (!attribute_points) {
          ThrowStructural(line.number, "malformed point value '" + value + "'");
        }
      } else {
        ThrowStructural(line.number, "unknown header attribute '" + key + "'");
      }
    };
    for (const char ch : attributes) {
      if (ch == ',' || std::isspace(static_cast<unsigned char>(ch)) != 0) {
        apply(token);
        token.clear();
      } else {
        token.push_back(ch);
      }
    }
    apply(token);
    if (!type) {
      ThrowStructural(line.number,
                      "question header is missing a {type=...} attribute; expected one of "
                      "mc, ma, num, fill, essay, file, text");
    }
    question.type = *type;

    const auto marker = ToLower(body).rfind("(points:");
    if (marker != std::string::npos) {
      const auto close = body.find(')', marker);
      if (close == std::string::npos) {
        ThrowStructural(line.number, "malformed point value; expected '(points: <n>)'");
      }
      const std::string value = body.substr(marker + 8, close - marker - 8);
      const auto points = quizconv::text::ParseNumber(value);
      if (!points) {
        ThrowStructural(line.number, "malformed point value '" + Trim(value) + "'");
      }
      question.points = *points;
      body = Trim(body.substr(0, marker) + body.substr(close + 1));
    }
    if (attribute_points) {
      question.points = attribute_points;
    }

    std::size_t digits = 0;
    while (digits < body.size() && std::isdigit(static_cast<unsigned char>(body[digits])) != 0) {
      ++digits;
    }
    if (digits > 0 && digits <= 9 && digits < body.size() && body[digits] == '.' &&
        (digits + 1 == body.size() || body[digits + 1] == ' ')) {
      question.display_number = std::stoi(body.substr(0, digits));
      body = body.substr(digits + 1);
    }
    question.title = Trim(body);
    return question;
  }

  bool EndsPrompt(QuestionType type, const SourceLine& line) const {
    if (line.kind != LineKind::kText) {
      return false;
    }
    if (ParseFeedbackLine(line.text)) {
      return true;
    }
    if (quizconv::IsChoiceType(type)) {
      return ParseChoiceMarker(line.text).has_value();
    }
    if (type == QuestionType::kNumeric || type == QuestionType::kShortAnswer) {
      return IsAnswerHeader(line.text);
    }
    return false;
  }

  void ParseQuestion(std::size_t begin, std::size_t end) {
    const std::size_t index = parsed_.quiz.questions.size();
    Question question = ParseHeader(lines_[begin]);
    question.position = index + 1;
    tracker_.Consume(Anchor::BeforeQuestion(index));

    std::size_t region_end = begin + 1;
    while (region_end < end && !EndsPrompt(question.type, lines_[region_end])) {
      ++region_end;
    }
    std::size_t i = begin + 1;
    const std::size_t last = LastText(begin + 1, region_end);
    if (last != kNone) {
      quizconv::ReadTextBlock(lines_, begin + 1, last, LineText, Anchor::BeforePrompt(index),
                              Anchor::WithinPrompt(index, 0), tracker_, question.prompt);
      i = last + 1;
    }

    switch (question.type) {
      case QuestionType::kSingleChoice:
      case QuestionType::kMultiChoice:
        i = ParseChoices(question, index, i, end);
        break;
      case QuestionType::kNumeric:
        i = ParseNumericAnswer(question, index, i, end);
        break;
      case QuestionType::kShortAnswer:
        i = ParseAnswerList(question, index, i, end);
        break;
      case QuestionType::kEssay:
      case QuestionType::kFileUpload:
      case QuestionType::kTextStimulus:
        break;
    }
    ParseFeedback(question, index, i, end);
    parsed_.quiz.questions.push_back(std::move(question));
  }

  std::size_t ParseChoices(Question& question, std::size_t index, std::size_t i,
                           std::size_t end) {
    const std::size_t position = index + 1;
    bool attached = false;
    bool in_feedback = false;
    std::size_t marker_indent = 0;

    for (; i < end; ++i) {
      const SourceLine& line = lines_[i];
      if (line.kind != LineKind::kText) {
        Trivia(line);
        attached = false;
        continue;
      }
      if (const auto marker = ParseChoiceMarker(line.text)) {
        tracker_.Consume(Anchor::BeforeAnswer(index, question.choices.size()));
        Choice choice;
        choice.text = marker->text;
        choice.correct = marker->correct;
        choice.line = line.number;
        question.choices.push_back(std::move(choice));
        marker_indent = marker->indent;
        attached = true;
        in_feedback = false;
        continue;
      }
      if (ParseFeedbackLine(line.text)) {
        break;
      }

      const std::size_t indent = IndentOf(line.text);
      if (!attached || question.choices.empty()) {
        ThrowStructural(line.number,
                        indent > marker_indent
                            ? "indented content must directly follow its choice, with no "
                              "blank line or comment in between"
                            : "unexpected content after the choice list",
                        position);
      }
      if (indent <= marker_indent) {
        if (StartsWith(line.text, ">")) {
          ThrowStructural(line.number,
                          "unindented blockquote beneath a choice; indent choice feedback "
                          "under its choice, or start question feedback with 'Correct:', "
                          "'Incorrect:', 'General:' or 'Information:'",
                          position);
        }
        ThrowStructural(line.number,
                        "unindented line directly beneath a choice; indent wrapped choice "
                        "text past the list marker",
                        position);
      }

      const std::string body = line.text.substr(indent);
      Choice& choice = question.choices.back();
      if (StartsWith(body, ">")) {
        if (in_feedback) {
          *choice.feedback += "\n" + QuoteBody(body);
        } else {
          choice.feedback = QuoteBody(body);
          in_feedback = true;
        }
      } else {
        if (in_feedback) {
          ThrowStructural(line.number, "choice text cannot continue after its feedback",
                          position);
        }
        choice.text += "\n" + Trim(body);
      }
    }
    return i;
  }

  std::size_t ParseNumericAnswer(Question& question, std::size_t index, std::size_t i,
                                 std::size_t end) {
    const std::size_t position = index + 1;
    bool header = false;
    bool answered = false;

    for (; i < end; ++i) {
      const SourceLine& line = lines_[i];
      if (line.kind != LineKind::kText) {
        Trivia(line);
        continue;
      }
      if (ParseFeedbackLine(line.text)) {
        break;
      }
      const std::string trimmed = Trim(line.text);
      if (!header && IsAnswerHeader(line.text)) {
        tracker_.Consume(Anchor::BeforeAnswer(index, 0));
        header = true;
        continue;
      }
      if (header && StartsWith(trimmed, "=")) {
        if (answered) {
          ThrowStructural(line.number, "numeric question has more than one '=' answer line",
                          position);
        }
        if (!quizconv::ParseNumericAnswer(trimmed.substr(1), question)) {
          ThrowStructural(line.number,
                          "malformed numeric answer '" + trimmed +
                              "'; expected '= <value> +- <tolerance>', '= [<low>, <high>]' or "
                              "'= <value> +- <percent>%'",
                          position);
        }
        tracker_.Consume(Anchor::BeforeAnswer(index, 0));
        answered = true;
        continue;
      }
      ThrowStructural(line.number,
                      header ? "unexpected content in numeric answer block; expected an "
                               "'= <answer>' line"
                             : "unexpected content after the prompt",
                      position);
    }
    return i;
  }

  std::size_t ParseAnswerList(Question& question, std::size_t index, std::size_t i,
                              std::size_t end) {
    const std::size_t position = index + 1;
    bool header = false;

    for (; i < end; ++i) {
      const SourceLine& line = lines_[i];
      if (line.kind != LineKind::kText) {
        Trivia(line);
        continue;
      }
      if (ParseFeedbackLine(line.text)) {
        break;
      }
      if (!header && IsAnswerHeader(line.text)) {
        tracker_.Consume(Anchor::BeforeAnswer(index, 0));
        header = true;
        continue;
      }
      if (header && StartsBullet(line.text)) {
        const std::string answer = Trim(Trim(line.text).substr(1));
        if (answer.empty()) {
          ThrowStructural(line.number, "empty answer bullet", position);
        }
        tracker_.Consume(Anchor::BeforeAnswer(index, question.answers.size()));
        question.answers.push_back(answer);
        continue;
      }
      ThrowStructural(line.number,
                      header ? "unexpected content in answer list; expected '- <answer>' "
                               "bullets"
                             : "unexpected content after the prompt",
                      position);
    }
    return i;
  }

  void ParseFeedback(Question& question, std::size_t index, std::size_t i, std::size_t end) {
    const std::size_t position = index + 1;
    std::optional<std::string>* current = nullptr;
    bool attached = false;
    bool interrupted = false;

    for (; i < end; ++i) {
      const SourceLine& line = lines_[i];
      if (line.kind != LineKind::kText) {
        Trivia(line);
        attached = false;
        if (line.kind == LineKind::kComment && current != nullptr) {
          interrupted = true;
        }
        continue;
      }
      if (const auto feedback = ParseFeedbackLine(line.text)) {
        if (interrupted) {
          ThrowStructural(line.number,
                          "comments cannot appear inside the question feedback block",
                          position);
        }
        std::optional<std::string>* slot = nullptr;
        switch (feedback->kind) {
          case FeedbackKind::kCorrect:
            slot = &question.feedback.correct;
            break;
          case FeedbackKind::kIncorrect:
            slot = &question.feedback.incorrect;
            break;
          case FeedbackKind::kGeneral:
            slot = &question.feedback.general;
            break;
          case FeedbackKind::kInformation:
            slot = &question.feedback.information;
            break;
        }
        if (slot->has_value()) {
          ThrowStructural(line.number,
                          "duplicate '" + FeedbackLabel(feedback->kind) + ":' feedback",
                          position);
        }
        tracker_.Consume(Anchor::BeforeFeedback(index));
        *slot = feedback->text;
        current = slot;
        attached = true;
        continue;
      }
      if (StartsWith(line.text, ">")) {
        if (current == nullptr) {
          ThrowStructural(line.number,
                          "question feedback must start with 'Correct:', 'Incorrect:', "
                          "'General:' or 'Information:'",
                          position);
        }
        if (!attached) {
          ThrowStructural(line.number,
                          interrupted
                              ? "comments cannot appear inside the question feedback block"
                              : "feedback continuation must directly follow its entry",
                          position);
        }
        **current += "\n" + QuoteBody(line.text);
        continue;
      }
      ThrowStructural(line.number,
                      current != nullptr ? "unexpected content after question feedback"
                                         : "unexpected content after the answers",
                      position);
    }
  }

  std::vector<SourceLine> lines_;
  ParsedQuiz parsed_;
  CommentTracker tracker_;
};

}  // namespace

namespace quizconv::markdown {

Result<ParsedQuiz> ReadMarkdown(const std::string& content) {
  try {
    MarkdownParser parser(content);
    return Result<ParsedQuiz>::Success(parser.Parse());
  } catch (const ConversionException& ex) {
    logging::LogDebug("Markdown read failed: " + ex.error().Describe());
    return Result<ParsedQuiz>::Failure(ex.error());
  }
}

}  // namespace quizconv::markdown
