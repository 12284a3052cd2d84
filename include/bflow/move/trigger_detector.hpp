#pragma once

#include <optional>
#include <string_view>

#include "bflow/move/move_planner.hpp"

namespace bflow::move {

// Range of lines that differ between two snapshots: [begin, old_end) in the old text,
// [begin, new_end) in the new text
struct ChangedLines {
  int begin = 0;
  int old_end = 0;
  int new_end = 0;

  bool empty() const { return old_end == begin && new_end == begin; }
};

ChangedLines diffLines(const std::vector<std::string>& old_lines,
                       const std::vector<std::string>& new_lines);

/**
 * @brief Find the line whose task just entered a trigger state
 *
 * Only the changed window is inspected. A line counts when its task is in one
 * of options.trigger_states and the matching old line did not already carry
 * that same state.
 *
 * @return Line index in new_text, or nullopt when the change triggers nothing
 */
std::optional<int> detectTrigger(std::string_view old_text, std::string_view new_text,
                                 const MoveOptions& options = {});

}  // namespace bflow::move
