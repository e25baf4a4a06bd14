#pragma once

#include <cstddef>
#include <string>
#include <vector>

#include "quizconv/quiz_model.hpp"

namespace quizconv {

enum class AnchorSlot {
  kBeforeTitle = 0,
  kBeforeDescription,
  kWithinDescription,
  kBeforeOption,
  kBeforeQuestion,
  kBeforePoints,
  kBeforePrompt,
  kWithinPrompt,
  kBeforeAnswer,
  kBeforeFeedback,
  kEndOfFile,
};

// The structural element a comment immediately precedes. `question` is a
// 0-based index into Quiz::questions; `index` is the option number, the answer
// item, or the line offset inside a free-text block.
struct Anchor {
  AnchorSlot slot = AnchorSlot::kEndOfFile;
  std::size_t question = 0;
  std::size_t index = 0;

  static Anchor BeforeTitle();
  static Anchor BeforeDescription();
  static Anchor WithinDescription(std::size_t line_offset);
  static Anchor BeforeOption(std::size_t option);
  static Anchor BeforeQuestion(std::size_t question);
  static Anchor BeforePoints(std::size_t question);  // plaintext "Points:" after "Title:"
  static Anchor BeforePrompt(std::size_t question);
  static Anchor WithinPrompt(std::size_t question, std::size_t line_offset);
  static Anchor BeforeAnswer(std::size_t question, std::size_t item);
  static Anchor BeforeFeedback(std::size_t question);
  static Anchor EndOfFile();

  bool operator==(const Anchor& other) const;
  bool operator!=(const Anchor& other) const { return !(*this == other); }
};

std::string DescribeAnchor(const Anchor& anchor);

struct Annotation {
  Anchor anchor;
  std::vector<std::string> lines;
  bool block = false;  // written with block-comment syntax
  bool inline_open = false;   // "<!-- first line" rather than "<!--" on its own
  bool inline_close = false;  // "last line -->" rather than "-->" on its own
  bool blank_before = false;
  bool blank_after = false;
  int line = 0;
};

class Annotations {
 public:
  void Add(Annotation annotation);

  // Annotations attached to `anchor`, in source order.
  std::vector<std::size_t> IndicesAt(const Anchor& anchor) const;
  const Annotation& At(std::size_t index) const { return entries_.at(index); }

  const std::vector<Annotation>& All() const { return entries_; }
  std::size_t Size() const { return entries_.size(); }
  bool Empty() const { return entries_.empty(); }

 private:
  std::vector<Annotation> entries_;
};

struct ParsedQuiz {
  Quiz quiz;
  Annotations annotations;
};

}  // namespace quizconv
