#include "quizconv/comment_tracker.hpp"

#include <utility>

namespace quizconv {

void CommentTracker::Comment(const SourceLine& line) {
  Annotation annotation;
  annotation.lines = line.comment;
  annotation.block = line.block;
  annotation.inline_open = line.inline_open;
  annotation.inline_close = line.inline_close;
  annotation.blank_before = blank_run_ > 0;
  annotation.line = line.number;
  pending_.push_back(std::move(annotation));
  blank_run_ = 0;
}

void CommentTracker::Consume(const Anchor& anchor) {
  if (!pending_.empty()) {
    pending_.back().blank_after = blank_run_ > 0;
    for (auto& annotation : pending_) {
      annotation.anchor = anchor;
      sink_.Add(std::move(annotation));
    }
    pending_.clear();
  }
  blank_run_ = 0;
}

void CommentTracker::Finish() {
  if (!pending_.empty()) {
    blank_run_ = 0;
    Consume(Anchor::EndOfFile());
  }
}

void ReadTextBlock(const std::vector<SourceLine>& source, std::size_t begin, std::size_t last,
                   const TextOf& text_of, const Anchor& leading, Anchor within,
                   CommentTracker& tracker, std::vector<std::string>& lines) {
  int held_blanks = 0;
  for (std::size_t i = begin; i <= last && i < source.size(); ++i) {
    const SourceLine& line = source[i];
    switch (line.kind) {
      case LineKind::kBlank:
        ++held_blanks;
        break;
      case LineKind::kComment:
        for (; held_blanks > 0; --held_blanks) {
          tracker.Blank();
        }
        tracker.Comment(line);
        if (!lines.empty()) {
          within.index = lines.size();
          tracker.Consume(within);
        }
        break;
      case LineKind::kText:
        if (lines.empty()) {
          for (; held_blanks > 0; --held_blanks) {
            tracker.Blank();
          }
          tracker.Consume(leading);
        } else {
          within.index = lines.size();
          tracker.Consume(within);
          for (; held_blanks > 0; --held_blanks) {
            lines.emplace_back();
          }
        }
        lines.push_back(text_of(line));
        break;
    }
  }
}

}  // namespace quizconv
