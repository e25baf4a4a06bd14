#include "quizconv/annotations.hpp"

#include <sstream>
#include <utility>

namespace {

using quizconv::Anchor;
using quizconv::AnchorSlot;

Anchor Make(AnchorSlot slot, std::size_t question = 0, std::size_t index = 0) {
  Anchor anchor;
  anchor.slot = slot;
  anchor.question = question;
  anchor.index = index;
  return anchor;
}

bool UsesQuestion(AnchorSlot slot) {
  switch (slot) {
    case AnchorSlot::kBeforeQuestion:
    case AnchorSlot::kBeforePoints:
    case AnchorSlot::kBeforePrompt:
    case AnchorSlot::kWithinPrompt:
    case AnchorSlot::kBeforeAnswer:
    case AnchorSlot::kBeforeFeedback:
      return true;
    default:
      return false;
  }
}

bool UsesIndex(AnchorSlot slot) {
  return slot == AnchorSlot::kWithinDescription || slot == AnchorSlot::kBeforeOption ||
         slot == AnchorSlot::kWithinPrompt || slot == AnchorSlot::kBeforeAnswer;
}

}  // namespace

namespace quizconv {

Anchor Anchor::BeforeTitle() { return Make(AnchorSlot::kBeforeTitle); }

Anchor Anchor::BeforeDescription() { return Make(AnchorSlot::kBeforeDescription); }

Anchor Anchor::WithinDescription(std::size_t line_offset) {
  return Make(AnchorSlot::kWithinDescription, 0, line_offset);
}

Anchor Anchor::BeforeOption(std::size_t option) {
  return Make(AnchorSlot::kBeforeOption, 0, option);
}

Anchor Anchor::BeforeQuestion(std::size_t question) {
  return Make(AnchorSlot::kBeforeQuestion, question);
}

Anchor Anchor::BeforePoints(std::size_t question) {
  return Make(AnchorSlot::kBeforePoints, question);
}

Anchor Anchor::BeforePrompt(std::size_t question) {
  return Make(AnchorSlot::kBeforePrompt, question);
}

Anchor Anchor::WithinPrompt(std::size_t question, std::size_t line_offset) {
  return Make(AnchorSlot::kWithinPrompt, question, line_offset);
}

Anchor Anchor::BeforeAnswer(std::size_t question, std::size_t item) {
  return Make(AnchorSlot::kBeforeAnswer, question, item);
}

Anchor Anchor::BeforeFeedback(std::size_t question) {
  return Make(AnchorSlot::kBeforeFeedback, question);
}

Anchor Anchor::EndOfFile() { return Make(AnchorSlot::kEndOfFile); }

bool Anchor::operator==(const Anchor& other) const {
  if (slot != other.slot) {
    return false;
  }
  if (UsesQuestion(slot) && question != other.question) {
    return false;
  }
  return !UsesIndex(slot) || index == other.index;
}

std::string DescribeAnchor(const Anchor& anchor) {
  std::ostringstream oss;
  switch (anchor.slot) {
    case AnchorSlot::kBeforeTitle:
      oss << "before title";
      break;
    case AnchorSlot::kBeforeDescription:
      oss << "before description";
      break;
    case AnchorSlot::kWithinDescription:
      oss << "description line " << anchor.index;
      break;
    case AnchorSlot::kBeforeOption:
      oss << "before option " << anchor.index;
      break;
    case AnchorSlot::kBeforeQuestion:
      oss << "before question " << anchor.question + 1;
      break;
    case AnchorSlot::kBeforePoints:
      oss << "before points of question " << anchor.question + 1;
      break;
    case AnchorSlot::kBeforePrompt:
      oss << "before prompt of question " << anchor.question + 1;
      break;
    case AnchorSlot::kWithinPrompt:
      oss << "prompt line " << anchor.index << " of question " << anchor.question + 1;
      break;
    case AnchorSlot::kBeforeAnswer:
      oss << "before answer " << anchor.index << " of question " << anchor.question + 1;
      break;
    case AnchorSlot::kBeforeFeedback:
      oss << "before feedback of question " << anchor.question + 1;
      break;
    case AnchorSlot::kEndOfFile:
      oss << "end of file";
      break;
  }
  return oss.str();
}

void Annotations::Add(Annotation annotation) { entries_.push_back(std::move(annotation)); }

std::vector<std::size_t> Annotations::IndicesAt(const Anchor& anchor) const {
  std::vector<std::size_t> indices;
  for (std::size_t i = 0; i < entries_.size(); ++i) {
    if (entries_[i].anchor == anchor) {
      indices.push_back(i);
    }
  }
  return indices;
}

}  // namespace quizconv
