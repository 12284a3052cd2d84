#include "bflow/move/auto_mover.hpp"

#include <spdlog/spdlog.h>

#include "bflow/move/trigger_detector.hpp"

namespace bflow::move {

AutoMover::AutoMover(AutoMoverSettings settings)
    : settings_(std::move(settings)), planner_(settings_.options) {}

bool AutoMover::onDocumentChanged(const DocumentChange& change) {
  if (change.tag && *change.tag == settings_.tag) {
    return false;
  }

  auto line = detectTrigger(change.old_text, change.new_text, settings_.options);
  if (!line) {
    return false;
  }

  spdlog::debug("auto-move: queued trigger at line {}", *line);
  pending_.push_back(*line);
  return true;
}

std::optional<TaggedEdit> AutoMover::runPending(std::string_view current_text) {
  outline::Document doc{std::string(current_text)};

  while (!pending_.empty()) {
    int line = pending_.front();
    pending_.pop_front();

    auto plan = planner_.plan(doc, line, settings_.source_heading, settings_.dest_heading);
    if (!plan) {
      spdlog::debug("auto-move: line {} not moved: {}", line,
                    rejectReasonToString(planner_.rejectReason()));
      continue;
    }

    spdlog::info("auto-move: moved lines {}-{} to '{}'", plan->block.start_line,
                 plan->block.end_line - 1, settings_.dest_heading);
    auto edits = plan->edits();
    return TaggedEdit{std::move(edits), settings_.tag, std::move(*plan)};
  }
  return std::nullopt;
}

}  // namespace bflow::move
