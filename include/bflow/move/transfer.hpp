#pragma once

#include <string>
#include <string_view>
#include <vector>

#include "bflow/common.hpp"
#include "bflow/outline/line_classifier.hpp"
#include "bflow/outline/outline_tree.hpp"

namespace bflow::move {

/**
 * @brief Children of one list item moved into the note its first wikilink names
 *
 * The source keeps the item itself; its link is rewritten to point at the
 * heading the children were filed under in the target.
 */
struct Extraction {
  std::string source_text;
  std::string target_text;
  std::string link_path;                     // note named by the first wikilink
  std::string heading;                       // "### [[source_name]]"
  outline::BlockRange children;              // removed source lines
  std::vector<std::string> extracted_lines;  // heading, dedented children, trailing blank
};

/**
 * @brief Move the subtree below parent_line into the log of a linked note
 *
 * The extraction is filed directly below log_heading in the target, newest
 * first. A target without that heading gets it appended.
 *
 * @param source_text Note holding the item
 * @param parent_line List item carrying a wikilink (0-based)
 * @param source_name Name the target should use to link back, usually the source file stem
 * @param target_text Contents of the linked note
 * @param log_heading Heading of the target section, e.g. "## Log"
 */
Result<Extraction> extractChildren(std::string_view source_text, int parent_line,
                                   std::string_view source_name, std::string_view target_text,
                                   std::string_view log_heading,
                                   int indent_width = outline::kDefaultIndentWidth);

struct Migration {
  std::string source_text;
  std::string target_text;
  std::vector<int> task_lines;      // migrated source lines, ascending
  std::vector<std::string> titles;  // task text without its list prefix
};

/**
 * @brief Copy open or started tasks forward into another note
 *
 * Each task is re-opened and written with its dedented children under
 * target_heading. In the source the task is marked [>] and its children are
 * removed. Selected lines may not nest inside one another.
 */
Result<Migration> migrateTasks(std::string_view source_text, std::vector<int> task_lines,
                               std::string_view target_text, std::string_view target_heading,
                               int indent_width = outline::kDefaultIndentWidth);

}  // namespace bflow::move
