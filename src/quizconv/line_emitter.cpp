#include "quizconv/line_emitter.hpp"

#include "quizconv/logging.hpp"
#include "quizconv/text_util.hpp"

namespace quizconv {

LineEmitter::LineEmitter(const Annotations& annotations, CommentSyntax syntax)
    : annotations_(annotations), syntax_(syntax), emitted_(annotations.Size(), false) {}

void LineEmitter::Line(const std::string& text, int gap) {
  if (after_comment_) {
    if (blank_after_) {
      out_.emplace_back();
    }
  } else if (!out_.empty()) {
    for (int i = 0; i < gap; ++i) {
      out_.emplace_back();
    }
  }
  out_.push_back(text);
  after_comment_ = false;
}

void LineEmitter::Comments(const Anchor& anchor) {
  for (const auto index : annotations_.IndicesAt(anchor)) {
    if (emitted_[index]) {
      continue;
    }
    emitted_[index] = true;
    Render(annotations_.At(index));
  }
}

std::string LineEmitter::Finish() {
  for (std::size_t i = 0; i < emitted_.size(); ++i) {
    if (!emitted_[i]) {
      const Annotation& annotation = annotations_.At(i);
      logging::LogWarn("Comment from line " + std::to_string(annotation.line) + " (" +
                       DescribeAnchor(annotation.anchor) +
                       ") has no matching element; writing it at the end of the file.");
      emitted_[i] = true;
      Render(annotation);
    }
  }
  if (out_.empty()) {
    return {};
  }
  return text::JoinLines(out_) + "\n";
}

void LineEmitter::Render(const Annotation& annotation) {
  if (annotation.blank_before) {
    out_.emplace_back();
  }
  const bool single = !annotation.block && annotation.lines.size() == 1;
  if (syntax_ == CommentSyntax::kHtml) {
    if (single) {
      const std::string& body = annotation.lines.front();
      out_.push_back(body.empty() ? "<!-- -->" : "<!-- " + body + " -->");
    } else {
      std::vector<std::string> body = annotation.lines;
      if (annotation.inline_open && !body.empty()) {
        body.front() = "<!-- " + body.front();
      } else {
        body.insert(body.begin(), "<!--");
      }
      if (annotation.inline_close && body.size() > 1) {
        body.back() += " -->";
      } else {
        body.emplace_back("-->");
      }
      out_.insert(out_.end(), body.begin(), body.end());
    }
  } else {
    if (single) {
      const std::string& body = annotation.lines.front();
      out_.push_back(body.empty() ? "%" : "% " + body);
    } else {
      out_.emplace_back("COMMENT");
      out_.insert(out_.end(), annotation.lines.begin(), annotation.lines.end());
      out_.emplace_back("END_COMMENT");
    }
  }
  after_comment_ = true;
  blank_after_ = annotation.blank_after;
}

}  // namespace quizconv
