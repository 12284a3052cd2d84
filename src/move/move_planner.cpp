#include "bflow/move/move_planner.hpp"

#include <algorithm>

#include "bflow/outline/insertion_point.hpp"
#include "bflow/outline/section_locator.hpp"

namespace bflow::move {

using outline::BlockRange;
using outline::Document;
using outline::SectionRange;
using outline::TaskState;
using outline::TextEdit;

bool MoveOptions::isTriggerState(TaskState state) const {
  return std::find(trigger_states.begin(), trigger_states.end(), state) != trigger_states.end();
}

std::vector<TextEdit> MovePlan::edits() const {
  TextEdit deletion{delete_from, delete_to, ""};
  TextEdit insertion{insert_at, insert_at, insert_text};
  if (insert_at <= delete_from) {
    return {insertion, deletion};
  }
  return {deletion, insertion};
}

std::string_view plannerStateToString(PlannerState state) {
  switch (state) {
    case PlannerState::kIdle:
      return "idle";
    case PlannerState::kValidating:
      return "validating";
    case PlannerState::kResolving:
      return "resolving";
    case PlannerState::kPlanning:
      return "planning";
    case PlannerState::kDone:
      return "done";
    case PlannerState::kRejected:
      return "rejected";
  }
  return "unknown";
}

std::string_view rejectReasonToString(RejectReason reason) {
  switch (reason) {
    case RejectReason::kNone:
      return "none";
    case RejectReason::kLineOutOfRange:
      return "line out of range";
    case RejectReason::kSourceSectionMissing:
      return "source section missing";
    case RejectReason::kOutsideSourceSection:
      return "line outside source section";
    case RejectReason::kNotATask:
      return "line is not a task";
    case RejectReason::kStateNotEligible:
      return "task state not eligible";
    case RejectReason::kTriggerOutsideBlock:
      return "task not inside its resolved block";
    case RejectReason::kOverlap:
      return "destination overlaps source";
  }
  return "unknown";
}

MovePlanner::MovePlanner(MoveOptions options) : options_(std::move(options)) {}

std::optional<MovePlan> MovePlanner::reject(RejectReason reason) {
  state_ = PlannerState::kRejected;
  reason_ = reason;
  return std::nullopt;
}

std::optional<MovePlan> MovePlanner::plan(std::string_view doc_text, int trigger_line,
                                          std::string_view source_heading,
                                          std::string_view dest_heading) {
  Document doc{std::string(doc_text)};
  return plan(doc, trigger_line, source_heading, dest_heading);
}

std::optional<MovePlan> MovePlanner::plan(const Document& doc, int trigger_line,
                                          std::string_view source_heading,
                                          std::string_view dest_heading) {
  state_ = PlannerState::kValidating;
  reason_ = RejectReason::kNone;

  const auto& lines = doc.lines();
  const int count = static_cast<int>(doc.lineCount());
  const int width = options_.indent_width;

  if (trigger_line < 0 || trigger_line >= count) {
    return reject(RejectReason::kLineOutOfRange);
  }

  auto source = outline::findSection(lines, source_heading);
  if (!source) {
    return reject(RejectReason::kSourceSectionMissing);
  }
  if (!source->contains(trigger_line)) {
    return reject(RejectReason::kOutsideSourceSection);
  }

  auto info = outline::classifyLine(lines[trigger_line], width);
  if (!info.isTask()) {
    return reject(RejectReason::kNotATask);
  }
  if (!options_.isTriggerState(info.marker->state)) {
    return reject(RejectReason::kStateNotEligible);
  }

  state_ = PlannerState::kResolving;
  int root = outline::findRootAncestor(lines, trigger_line, source->heading_line, width);
  BlockRange block = outline::collectBlock(lines, root, source->end_line, width);
  if (!block.contains(trigger_line)) {
    return reject(RejectReason::kTriggerOutsideBlock);
  }

  state_ = PlannerState::kPlanning;
  auto dest = outline::findSection(lines, dest_heading);
  if (dest && dest->intersects(*source)) {
    return reject(RejectReason::kOverlap);
  }

  MovePlan plan;
  plan.block = block;

  for (int i = block.start_line; i < block.end_line; ++i) {
    const auto& line = lines[i];
    if (options_.reopen_scheduled &&
        outline::classifyLine(line, width).hasState(TaskState::kScheduled)) {
      plan.moved_lines.push_back(*outline::withTaskState(line, TaskState::kOpen));
    } else {
      plan.moved_lines.push_back(line);
    }
  }
  const std::string moved = outline::joinLines(plan.moved_lines, 0, plan.moved_lines.size());

  // One blank after the block goes with it when the block already sits after a
  // gap, unless that blank separates the section from what follows.
  int deleted_end = block.end_line;
  bool after_gap = block.start_line == source->contentStart() ||
                   outline::isBlank(lines[block.start_line - 1]);
  if (after_gap && deleted_end + 1 < source->end_line && outline::isBlank(lines[deleted_end]) &&
      !outline::isBlank(lines[deleted_end + 1])) {
    ++deleted_end;
  }
  plan.deleted_end_line = deleted_end;

  plan.delete_from = doc.lineOffset(block.start_line);
  plan.delete_to = doc.lineOffset(deleted_end);
  if (deleted_end >= count && plan.delete_from > 0) {
    // Last line of a document without a final newline: take the newline before it
    --plan.delete_from;
  }

  // Character immediately before offset once the deletion is applied
  auto precededByNewline = [&](std::size_t offset) {
    std::size_t before = offset;
    if (offset == plan.delete_to && plan.delete_from < plan.delete_to) {
      before = plan.delete_from;
    }
    return before == 0 || doc.text()[before - 1] == '\n';
  };

  if (dest) {
    int insertion = outline::findInsertionLine(lines, dest->heading_line, dest->end_line);
    plan.insertion_line = insertion;
    plan.insert_at = doc.lineOffset(insertion);
    if (insertion >= count) {
      plan.insert_text = (precededByNewline(plan.insert_at) ? "" : "\n") + moved;
    } else {
      plan.insert_text = moved + "\n";
    }
  } else {
    std::string heading = outline::parseTargetHeading(dest_heading).toString();
    plan.created_destination = true;
    plan.insertion_line = count;
    plan.insert_at = doc.size();
    plan.insert_text = (precededByNewline(plan.insert_at) ? "" : "\n") + heading + "\n" + moved;
    if (doc.endsWithNewline()) {
      plan.insert_text += "\n";
    }
  }

  if (plan.insert_at > plan.delete_from && plan.insert_at < plan.delete_to) {
    return reject(RejectReason::kOverlap);
  }

  state_ = PlannerState::kDone;
  return plan;
}

std::optional<MovePlan> planMove(std::string_view doc_text, int trigger_line,
                                 std::string_view source_heading, std::string_view dest_heading,
                                 const MoveOptions& options) {
  MovePlanner planner(options);
  return planner.plan(doc_text, trigger_line, source_heading, dest_heading);
}

int findFirstEligibleTask(const std::vector<std::string>& lines, const SectionRange& section,
                          const MoveOptions& options) {
  const int end = std::min(section.end_line, static_cast<int>(lines.size()));
  for (int i = section.contentStart(); i < end; ++i) {
    auto info = outline::classifyLine(lines[i], options.indent_width);
    if (info.isTask() && options.isTriggerState(info.marker->state)) {
      return i;
    }
  }
  return -1;
}

SweepResult sweepCompleted(std::string_view doc_text, std::string_view source_heading,
                           std::string_view dest_heading, const MoveOptions& options) {
  SweepResult result;
  std::string current(doc_text);
  MovePlanner planner(options);

  // Every move removes at least one line from the source section
  const std::size_t max_moves = outline::splitLines(current).size();
  for (std::size_t i = 0; i < max_moves; ++i) {
    Document doc{current};
    auto source = outline::findSection(doc.lines(), source_heading);
    if (!source) break;

    int line = findFirstEligibleTask(doc.lines(), *source, options);
    if (line < 0) break;

    auto plan = planner.plan(doc, line, source_heading, dest_heading);
    if (!plan) break;

    auto applied = outline::applyEdits(current, plan->edits());
    if (!applied.has_value()) break;

    current = std::move(*applied);
    ++result.moved;
  }

  if (result.moved > 0) {
    result.text = std::move(current);
  }
  return result;
}

}  // namespace bflow::move
