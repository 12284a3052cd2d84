#pragma once

#include <optional>
#include <string>
#include <vector>

#include "bflow/outline/line_classifier.hpp"
#include "bflow/outline/section_locator.hpp"

namespace bflow::outline {

/**
 * @brief Half-open line range [start_line, end_line) holding one list item and its subtree
 */
struct BlockRange {
  int start_line = 0;
  int end_line = 0;

  int size() const { return end_line - start_line; }
  bool empty() const { return end_line <= start_line; }
  bool contains(int line) const { return line >= start_line && line < end_line; }
  bool operator==(const BlockRange& other) const = default;
};

/**
 * @brief Walk up from start_line to the topmost list item above it
 *
 * Blank lines are transparent, so a child separated from its parent by a blank
 * line still resolves to the parent. The walk ends at the first less indented
 * line that is not a list item, at a heading, and at section_start. Indentation
 * is compared in columns.
 *
 * @param lines Document lines
 * @param start_line Line inside the tree
 * @param section_start Heading line of the enclosing section (-1 for the whole document)
 * @return Root line (start_line itself when it has no ancestor), -1 when start_line is out of range
 */
int findRootAncestor(const std::vector<std::string>& lines, int start_line, int section_start,
                     int indent_width = kDefaultIndentWidth);

/**
 * @brief Collect the root line and every line of its subtree
 *
 * Every non-blank line of the block is indented further than the root.
 * Blank lines are kept only when a deeper line follows them inside the section;
 * the blank that separates the block from the next sibling is never included.
 *
 * @param lines Document lines
 * @param root_line First line of the block
 * @param section_end Exclusive end of the enclosing section
 */
BlockRange collectBlock(const std::vector<std::string>& lines, int root_line, int section_end,
                        int indent_width = kDefaultIndentWidth);

// findRootAncestor followed by collectBlock inside section; nullopt when line is outside it
std::optional<BlockRange> resolveBlock(const std::vector<std::string>& lines, int line,
                                       const SectionRange& section,
                                       int indent_width = kDefaultIndentWidth);

}  // namespace bflow::outline
