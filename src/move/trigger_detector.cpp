#include "bflow/move/trigger_detector.hpp"

#include <algorithm>

namespace bflow::move {

ChangedLines diffLines(const std::vector<std::string>& old_lines,
                       const std::vector<std::string>& new_lines) {
  const int old_count = static_cast<int>(old_lines.size());
  const int new_count = static_cast<int>(new_lines.size());
  const int limit = std::min(old_count, new_count);

  int prefix = 0;
  while (prefix < limit && old_lines[prefix] == new_lines[prefix]) {
    ++prefix;
  }

  int suffix = 0;
  while (suffix < limit - prefix &&
         old_lines[old_count - 1 - suffix] == new_lines[new_count - 1 - suffix]) {
    ++suffix;
  }

  return ChangedLines{prefix, old_count - suffix, new_count - suffix};
}

std::optional<int> detectTrigger(std::string_view old_text, std::string_view new_text,
                                 const MoveOptions& options) {
  auto old_lines = outline::splitLines(old_text);
  auto new_lines = outline::splitLines(new_text);
  auto changed = diffLines(old_lines, new_lines);

  for (int i = changed.begin; i < changed.new_end; ++i) {
    auto info = outline::classifyLine(new_lines[i], options.indent_width);
    if (!info.isTask() || !options.isTriggerState(info.marker->state)) {
      continue;
    }

    // Line at the same position of the old window, if the window has one
    int old_line = i;
    if (old_line < changed.old_end) {
      auto previous = outline::classifyLine(old_lines[old_line], options.indent_width);
      if (previous.hasState(info.marker->state)) {
        continue;
      }
    }
    return i;
  }
  return std::nullopt;
}

}  // namespace bflow::move
