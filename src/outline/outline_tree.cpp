#include "bflow/outline/outline_tree.hpp"

#include <algorithm>

namespace bflow::outline {

namespace {

// First non-blank line above line that is indented less than column, when it is a
// list item; -1 when that line is plain text or a heading, or nothing qualifies
int findParent(const std::vector<std::string>& lines, int line, int column, int lower_bound,
               int indent_width) {
  for (int i = line - 1; i > lower_bound && i >= 0; --i) {
    auto info = classifyLine(lines[i], indent_width);
    if (info.isBlank()) continue;
    if (info.isHeading()) break;
    if (info.column < column) {
      return info.isListItem() ? i : -1;
    }
  }
  return -1;
}

}  // namespace

int findRootAncestor(const std::vector<std::string>& lines, int start_line, int section_start,
                     int indent_width) {
  const int count = static_cast<int>(lines.size());
  if (start_line < 0 || start_line >= count) {
    return -1;
  }

  int current = start_line;
  int column = indentColumns(lines[current], indent_width);
  while (column > 0) {
    int parent = findParent(lines, current, column, section_start, indent_width);
    if (parent < 0) break;
    current = parent;
    column = indentColumns(lines[current], indent_width);
  }
  return current;
}

BlockRange collectBlock(const std::vector<std::string>& lines, int root_line, int section_end,
                        int indent_width) {
  const int count = static_cast<int>(lines.size());
  const int end = std::min(section_end, count);
  if (root_line < 0 || root_line >= end) {
    return BlockRange{root_line, root_line};
  }

  const int root_column = indentColumns(lines[root_line], indent_width);
  int block_end = root_line + 1;

  while (block_end < end) {
    auto info = classifyLine(lines[block_end], indent_width);

    if (info.isBlank()) {
      // Keep the blank run only if the subtree continues after it
      int next = block_end + 1;
      while (next < end && isBlank(lines[next])) {
        ++next;
      }
      if (next < end && headingLevel(lines[next]) == 0 &&
          indentColumns(lines[next], indent_width) > root_column) {
        block_end = next + 1;
        continue;
      }
      break;
    }

    if (info.isHeading() || info.column <= root_column) {
      break;
    }
    ++block_end;
  }

  return BlockRange{root_line, block_end};
}

std::optional<BlockRange> resolveBlock(const std::vector<std::string>& lines, int line,
                                       const SectionRange& section, int indent_width) {
  if (!section.contains(line) || line >= static_cast<int>(lines.size())) {
    return std::nullopt;
  }
  int root = findRootAncestor(lines, line, section.heading_line, indent_width);
  if (root < 0) {
    return std::nullopt;
  }
  return collectBlock(lines, root, section.end_line, indent_width);
}

}  // namespace bflow::outline
