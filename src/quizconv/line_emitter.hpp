#pragma once

#include <cstddef>
#include <string>
#include <vector>

#include "quizconv/annotations.hpp"

namespace quizconv {

enum class CommentSyntax { kHtml, kPercent };

// Output buffer shared by both writers. Structural lines ask for a canonical
// gap; comment groups replace that gap with their own blank-line flags.
class LineEmitter {
 public:
  LineEmitter(const Annotations& annotations, CommentSyntax syntax);

  void Line(const std::string& text, int gap);
  void Comments(const Anchor& anchor);

  // Writes annotations no anchor claimed at the end, then returns the text
  // with a trailing newline.
  std::string Finish();

 private:
  void Render(const Annotation& annotation);

  const Annotations& annotations_;
  CommentSyntax syntax_;
  std::vector<bool> emitted_;
  std::vector<std::string> out_;
  bool after_comment_ = false;
  bool blank_after_ = false;
};

}  // namespace quizconv
