#pragma once

#include <deque>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "bflow/move/move_planner.hpp"

namespace bflow::move {

// Opaque marker attached to edits so their own change notification can be recognized
struct EditTag {
  std::string name;

  bool operator==(const EditTag& other) const = default;
};

// Change notification from the host editor
struct DocumentChange {
  std::string old_text;
  std::string new_text;
  std::optional<EditTag> tag;  // set when the change came from a tagged edit
};

// Edits to apply as one transaction, carrying the tag of the mover that produced them
struct TaggedEdit {
  std::vector<outline::TextEdit> edits;
  EditTag tag;
  MovePlan plan;
};

struct AutoMoverSettings {
  std::string source_heading = "## Todo";
  std::string dest_heading = "## Log";
  MoveOptions options;
  EditTag tag{"bflow.auto-move"};
};

/**
 * @brief Host-side glue between change notifications and the move planner
 *
 * Detection and planning run in different turns of the host's event loop:
 * onDocumentChanged() only records the trigger line, runPending() plans it
 * against whatever text is current by then. Changes carrying this mover's own
 * tag are ignored so an applied move never triggers another one.
 */
class AutoMover {
 public:
  explicit AutoMover(AutoMoverSettings settings = {});

  // Returns true when the change queued a trigger
  bool onDocumentChanged(const DocumentChange& change);

  /**
   * @brief Plan the oldest queued trigger against the current text
   *
   * The trigger is re-validated by the planner; a trigger that no longer holds
   * is dropped and the next one is tried.
   */
  std::optional<TaggedEdit> runPending(std::string_view current_text);

  bool hasPending() const { return !pending_.empty(); }
  std::size_t pendingCount() const { return pending_.size(); }
  void clear() { pending_.clear(); }

  const AutoMoverSettings& settings() const { return settings_; }

 private:
  AutoMoverSettings settings_;
  MovePlanner planner_;
  std::deque<int> pending_;
};

}  // namespace bflow::move
