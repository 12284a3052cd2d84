#include "bflow/outline/insertion_point.hpp"

#include <algorithm>

#include "bflow/outline/line_classifier.hpp"

namespace bflow::outline {

namespace {

bool hasListItemIn(const std::vector<std::string>& lines, int begin, int end) {
  for (int i = begin; i < end; ++i) {
    if (classifyLine(lines[i]).isListItem()) {
      return true;
    }
  }
  return false;
}

}  // namespace

int findInsertionLine(const std::vector<std::string>& lines, int section_start, int section_end) {
  const int count = static_cast<int>(lines.size());
  if (section_start < 0 || section_start >= count) {
    return -1;
  }
  const int end = std::clamp(section_end, section_start + 1, count);

  int last_item = -1;
  for (int i = section_start + 1; i < end; ++i) {
    auto info = classifyLine(lines[i]);

    if (info.isBlank()) {
      if (last_item >= 0) {
        return i;
      }
      // heading, blank, future items: keep the future block after the blank
      if (hasListItemIn(lines, i + 1, end)) {
        return i;
      }
      continue;
    }

    if (info.isListItem() || info.indent > 0) {
      last_item = i;
    }
  }

  if (last_item >= 0) {
    return last_item + 1;
  }
  return section_start + 1;
}

}  // namespace bflow::outline
