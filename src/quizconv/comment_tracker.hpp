#pragma once

#include <cstddef>
#include <functional>
#include <string>
#include <vector>

#include "quizconv/annotations.hpp"

namespace quizconv {

enum class LineKind { kBlank, kComment, kText };

// One logical source line. A multi-line comment block collapses into a single
// kComment entry numbered at its opening line.
struct SourceLine {
  LineKind kind = LineKind::kBlank;
  int number = 0;
  std::string text;
  std::vector<std::string> comment;
  bool block = false;
  bool inline_open = false;
  bool inline_close = false;
};

// Collects comments until the next structural line tells it where they belong.
class CommentTracker {
 public:
  explicit CommentTracker(Annotations& sink) : sink_(sink) {}

  void Blank() { ++blank_run_; }
  void Comment(const SourceLine& line);

  // Call for every structural line: pending comments are anchored to it and
  // the blank run is reset.
  void Consume(const Anchor& anchor);

  // Anchors anything still pending to the end of the file.
  void Finish();

 private:
  Annotations& sink_;
  std::vector<Annotation> pending_;
  int blank_run_ = 0;
};

using TextOf = std::function<std::string(const SourceLine&)>;

// Reads source[begin..last] (inclusive, `last` a text line) as a free-text
// block appended to `lines`. Blank lines between text lines are kept as empty
// lines unless they directly precede a comment. Comments before the first line
// anchor to `leading`; interior comments anchor to `within` at the offset of the
// line that follows them.
void ReadTextBlock(const std::vector<SourceLine>& source, std::size_t begin, std::size_t last,
                   const TextOf& text_of, const Anchor& leading, Anchor within,
                   CommentTracker& tracker, std::vector<std::string>& lines);

}  // namespace quizconv
