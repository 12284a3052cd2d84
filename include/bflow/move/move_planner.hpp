#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "bflow/outline/document.hpp"
#include "bflow/outline/line_classifier.hpp"
#include "bflow/outline/outline_tree.hpp"

namespace bflow::move {

struct MoveOptions {
  // Task states that make a line eligible to move
  std::vector<outline::TaskState> trigger_states = {outline::TaskState::kCompleted,
                                                    outline::TaskState::kStarted};
  // Rewrite [<] to [ ] in moved text
  bool reopen_scheduled = true;
  int indent_width = outline::kDefaultIndentWidth;

  bool isTriggerState(outline::TaskState state) const;
};

/**
 * @brief Edit script relocating one block, computed against a single snapshot
 *
 * The deletion and the insertion belong together and must be applied in one
 * transaction; both offsets refer to the original text.
 */
struct MovePlan {
  std::size_t delete_from = 0;
  std::size_t delete_to = 0;
  std::size_t insert_at = 0;
  std::string insert_text;

  outline::BlockRange block;          // source block [s, e)
  int deleted_end_line = 0;           // e plus a consumed blank line, if any
  int insertion_line = 0;             // line before which the block lands
  bool created_destination = false;   // destination heading was synthesized
  std::vector<std::string> moved_lines;

  // Deletion and insertion ordered by offset
  std::vector<outline::TextEdit> edits() const;
};

enum class PlannerState {
  kIdle,
  kValidating,
  kResolving,
  kPlanning,
  kDone,
  kRejected
};

enum class RejectReason {
  kNone,
  kLineOutOfRange,
  kSourceSectionMissing,
  kOutsideSourceSection,
  kNotATask,
  kStateNotEligible,
  kTriggerOutsideBlock,
  kOverlap
};

std::string_view plannerStateToString(PlannerState state);
std::string_view rejectReasonToString(RejectReason reason);

/**
 * @brief Plans the move of a task block from one section to another
 *
 * Every call works on a fresh snapshot; the planner only remembers the outcome
 * of its last call for diagnostics.
 */
class MovePlanner {
 public:
  explicit MovePlanner(MoveOptions options = {});

  /**
   * @brief Plan moving the block around trigger_line to dest_heading
   * @param doc_text Document snapshot
   * @param trigger_line Line of the task whose state changed
   * @param source_heading Heading of the section the task must be in (e.g. "## Todo")
   * @param dest_heading Heading of the destination section (e.g. "## Log"), created when missing
   * @return The edit script, or nullopt when a precondition does not hold
   */
  std::optional<MovePlan> plan(std::string_view doc_text, int trigger_line,
                               std::string_view source_heading, std::string_view dest_heading);

  std::optional<MovePlan> plan(const outline::Document& doc, int trigger_line,
                               std::string_view source_heading, std::string_view dest_heading);

  PlannerState state() const { return state_; }
  RejectReason rejectReason() const { return reason_; }
  const MoveOptions& options() const { return options_; }

 private:
  std::optional<MovePlan> reject(RejectReason reason);

  MoveOptions options_;
  PlannerState state_ = PlannerState::kIdle;
  RejectReason reason_ = RejectReason::kNone;
};

std::optional<MovePlan> planMove(std::string_view doc_text, int trigger_line,
                                 std::string_view source_heading, std::string_view dest_heading,
                                 const MoveOptions& options = {});

// First line in section holding a task in a trigger state, or -1
int findFirstEligibleTask(const std::vector<std::string>& lines,
                          const outline::SectionRange& section, const MoveOptions& options);

struct SweepResult {
  std::optional<std::string> text;   // nullopt when nothing moved
  int moved = 0;
};

/**
 * @brief Move every eligible task block from the source section to the destination
 *
 * Each iteration plans against the text produced by the previous one.
 */
SweepResult sweepCompleted(std::string_view doc_text, std::string_view source_heading,
                           std::string_view dest_heading, const MoveOptions& options = {});

}  // namespace bflow::move
