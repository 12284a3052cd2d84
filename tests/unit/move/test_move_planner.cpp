#include <gtest/gtest.h>

#include "bflow/move/move_planner.hpp"
#include "test_helpers.hpp"

using namespace bflow::move;
using namespace bflow::test;
using bflow::outline::BlockRange;
using bflow::outline::TaskState;

class MovePlannerTest : public ::testing::Test {
 protected:
  MovePlanner planner_;
};

TEST_F(MovePlannerTest, CompletedTaskMovesToEndOfLog) {
  std::string text =
      "## Todo\n"
      "- [ ] Other\n"
      "- [x] Buy groceries\n"
      "\n"
      "## Log\n"
      "- Did something";

  auto plan = planner_.plan(text, 2, "## Todo", "## Log");
  ASSERT_TRUE(plan.has_value());
  EXPECT_EQ(plan->block, (BlockRange{2, 3}));
  EXPECT_FALSE(plan->created_destination);
  EXPECT_EQ(planner_.state(), PlannerState::kDone);
  EXPECT_EQ(planner_.rejectReason(), RejectReason::kNone);

  EXPECT_EQ(applyPlan(text, *plan),
            "## Todo\n"
            "- [ ] Other\n"
            "\n"
            "## Log\n"
            "- Did something\n"
            "- [x] Buy groceries");
}

TEST_F(MovePlannerTest, NestedTriggerMovesWholeRootBlock) {
  std::string text =
      "## Todo\n"
      "- [ ] Parent\n"
      "  - [x] Child\n"
      "  - [ ] Sibling\n"
      "\n"
      "## Log\n";

  auto plan = planner_.plan(text, 2, "## Todo", "## Log");
  ASSERT_TRUE(plan.has_value());
  EXPECT_EQ(plan->block, (BlockRange{1, 4}));

  EXPECT_EQ(applyPlan(text, *plan),
            "## Todo\n"
            "\n"
            "## Log\n"
            "- [ ] Parent\n"
            "  - [x] Child\n"
            "  - [ ] Sibling\n");
}

TEST_F(MovePlannerTest, MissingDestinationIsCreatedAtEnd) {
  std::string text =
      "## Todo\n"
      "- [x] Done\n"
      "- [ ] Open\n";

  auto plan = planner_.plan(text, 1, "## Todo", "## Log");
  ASSERT_TRUE(plan.has_value());
  EXPECT_TRUE(plan->created_destination);

  EXPECT_EQ(applyPlan(text, *plan),
            "## Todo\n"
            "- [ ] Open\n"
            "## Log\n"
            "- [x] Done\n");
}

TEST_F(MovePlannerTest, MissingDestinationWithoutFinalNewline) {
  std::string text = "## Todo\n- [x] A";
  EXPECT_EQ(moveAndApply(text, 1), "## Todo\n## Log\n- [x] A");
}

TEST_F(MovePlannerTest, BareDestinationHeadingAtEndOfFile) {
  std::string text = "## Todo\n- [x] A\n## Log";
  EXPECT_EQ(moveAndApply(text, 1), "## Todo\n## Log\n- [x] A");
}

TEST_F(MovePlannerTest, UpcomingItemsStayAfterBlankLine) {
  std::string text =
      "## Todo\n"
      "- [x] A\n"
      "\n"
      "## Log\n"
      "- old\n"
      "\n"
      "- future\n";

  EXPECT_EQ(moveAndApply(text, 1),
            "## Todo\n"
            "\n"
            "## Log\n"
            "- old\n"
            "- [x] A\n"
            "\n"
            "- future\n");
}

TEST_F(MovePlannerTest, ConsumesOneBlankAfterBlockAtStartOfSection) {
  std::string text =
      "## Todo\n"
      "- [x] A\n"
      "\n"
      "- [ ] B\n"
      "## Log\n";

  auto plan = planner_.plan(text, 1, "## Todo", "## Log");
  ASSERT_TRUE(plan.has_value());
  EXPECT_EQ(plan->deleted_end_line, 3);

  EXPECT_EQ(applyPlan(text, *plan),
            "## Todo\n"
            "- [ ] B\n"
            "## Log\n"
            "- [x] A\n");
}

TEST_F(MovePlannerTest, KeepsBlankWhenBlockFollowsContent) {
  std::string text =
      "## Todo\n"
      "- [ ] B\n"
      "- [x] A\n"
      "\n"
      "- [ ] C\n"
      "## Log\n";

  auto plan = planner_.plan(text, 2, "## Todo", "## Log");
  ASSERT_TRUE(plan.has_value());
  EXPECT_EQ(plan->deleted_end_line, 3);

  EXPECT_EQ(applyPlan(text, *plan),
            "## Todo\n"
            "- [ ] B\n"
            "\n"
            "- [ ] C\n"
            "## Log\n"
            "- [x] A\n");
}

TEST_F(MovePlannerTest, KeepsBlankSeparatingSectionFromNextHeading) {
  std::string text =
      "## Todo\n"
      "- [x] A\n"
      "\n"
      "## Log\n"
      "- b\n";

  auto plan = planner_.plan(text, 1, "## Todo", "## Log");
  ASSERT_TRUE(plan.has_value());
  EXPECT_EQ(plan->deleted_end_line, 2);
  EXPECT_EQ(applyPlan(text, *plan), "## Todo\n\n## Log\n- b\n- [x] A\n");
}

TEST_F(MovePlannerTest, ScheduledChildrenAreReopened) {
  std::string text =
      "## Todo\n"
      "- [x] Parent\n"
      "  - [<] Later\n"
      "## Log\n";

  auto plan = planner_.plan(text, 1, "## Todo", "## Log");
  ASSERT_TRUE(plan.has_value());
  ASSERT_EQ(plan->moved_lines.size(), 2u);
  EXPECT_EQ(plan->moved_lines[1], "  - [ ] Later");

  EXPECT_EQ(applyPlan(text, *plan),
            "## Todo\n"
            "## Log\n"
            "- [x] Parent\n"
            "  - [ ] Later\n");
}

TEST_F(MovePlannerTest, ScheduledKeptWhenReopenDisabled) {
  MoveOptions options;
  options.reopen_scheduled = false;
  std::string text = "## Todo\n- [x] Parent\n  - [<] Later\n## Log\n";

  EXPECT_EQ(moveAndApply(text, 1, "## Todo", "## Log", options),
            "## Todo\n## Log\n- [x] Parent\n  - [<] Later\n");
}

TEST_F(MovePlannerTest, StartedTaskMoves) {
  std::string text = "## Todo\n- [/] Working\n## Log\n";
  EXPECT_EQ(moveAndApply(text, 1), "## Todo\n## Log\n- [/] Working\n");
}

TEST_F(MovePlannerTest, DestinationBeforeSource) {
  std::string text = "## Log\n- x\n## Todo\n- [x] A\n";

  auto plan = planner_.plan(text, 3, "## Todo", "## Log");
  ASSERT_TRUE(plan.has_value());
  auto edits = plan->edits();
  ASSERT_EQ(edits.size(), 2u);
  EXPECT_TRUE(edits[0].isInsertion());
  EXPECT_LE(edits[0].from, edits[1].from);

  EXPECT_EQ(applyPlan(text, *plan), "## Log\n- x\n- [x] A\n## Todo\n");
}

TEST_F(MovePlannerTest, LastLineWithoutFinalNewline) {
  std::string text = "## Log\n- x\n## Todo\n- [x] A";
  // No newline is added at the end of the document
  EXPECT_EQ(moveAndApply(text, 3), "## Log\n- x\n- [x] A\n## Todo");
}

TEST_F(MovePlannerTest, CustomHeadings) {
  std::string text = "### Inbox\n- [x] Reply\n### Done\n- earlier\n";
  EXPECT_EQ(moveAndApply(text, 1, "### Inbox", "### Done"),
            "### Inbox\n### Done\n- earlier\n- [x] Reply\n");
}

TEST_F(MovePlannerTest, CreatedHeadingUsesConfiguredLevel) {
  std::string text = "## Todo\n- [x] A\n";
  EXPECT_EQ(moveAndApply(text, 1, "## Todo", "### Archive"), "## Todo\n### Archive\n- [x] A\n");
}

TEST_F(MovePlannerTest, RejectsLineOutOfRange) {
  std::string text = "## Todo\n- [x] A\n## Log\n";
  EXPECT_FALSE(planner_.plan(text, -1, "## Todo", "## Log").has_value());
  EXPECT_EQ(planner_.rejectReason(), RejectReason::kLineOutOfRange);
  EXPECT_FALSE(planner_.plan(text, 4, "## Todo", "## Log").has_value());
  EXPECT_EQ(planner_.rejectReason(), RejectReason::kLineOutOfRange);
  EXPECT_EQ(planner_.state(), PlannerState::kRejected);
}

TEST_F(MovePlannerTest, RejectsMissingSource) {
  std::string text = "## Inbox\n- [x] A\n## Log\n";
  EXPECT_FALSE(planner_.plan(text, 1, "## Todo", "## Log").has_value());
  EXPECT_EQ(planner_.rejectReason(), RejectReason::kSourceSectionMissing);
}

TEST_F(MovePlannerTest, RejectsLineOutsideSource) {
  std::string text = "## Todo\n- [ ] A\n## Log\n- [x] B\n";
  EXPECT_FALSE(planner_.plan(text, 3, "## Todo", "## Log").has_value());
  EXPECT_EQ(planner_.rejectReason(), RejectReason::kOutsideSourceSection);

  // The heading line itself is outside its section
  EXPECT_FALSE(planner_.plan(text, 0, "## Todo", "## Log").has_value());
  EXPECT_EQ(planner_.rejectReason(), RejectReason::kOutsideSourceSection);
}

TEST_F(MovePlannerTest, RejectsNonTasks) {
  std::string text = "## Todo\n- plain\nprose\n\n## Log\n";
  for (int line : {1, 2, 3}) {
    EXPECT_FALSE(planner_.plan(text, line, "## Todo", "## Log").has_value()) << line;
    EXPECT_EQ(planner_.rejectReason(), RejectReason::kNotATask) << line;
  }
}

TEST_F(MovePlannerTest, RejectsIneligibleStates) {
  std::string text = "## Todo\n- [ ] open\n- [<] scheduled\n- [>] migrated\n- [?] custom\n## Log\n";
  for (int line : {1, 2, 3, 4}) {
    EXPECT_FALSE(planner_.plan(text, line, "## Todo", "## Log").has_value()) << line;
    EXPECT_EQ(planner_.rejectReason(), RejectReason::kStateNotEligible) << line;
  }
}

TEST_F(MovePlannerTest, TriggerStatesAreConfigurable) {
  MoveOptions options;
  options.trigger_states = {TaskState::kCompleted};
  MovePlanner planner(options);

  std::string text = "## Todo\n- [/] Working\n- [x] Done\n## Log\n";
  EXPECT_FALSE(planner.plan(text, 1, "## Todo", "## Log").has_value());
  EXPECT_EQ(planner.rejectReason(), RejectReason::kStateNotEligible);
  EXPECT_TRUE(planner.plan(text, 2, "## Todo", "## Log").has_value());
}

TEST_F(MovePlannerTest, RejectsDestinationEqualToSource) {
  std::string text = "## Todo\n- [x] A\n";
  EXPECT_FALSE(planner_.plan(text, 1, "## Todo", "## Todo").has_value());
  EXPECT_EQ(planner_.rejectReason(), RejectReason::kOverlap);

  // Same heading written differently
  EXPECT_FALSE(planner_.plan(text, 1, "## Todo", "Todo").has_value());
  EXPECT_EQ(planner_.rejectReason(), RejectReason::kOverlap);
}

TEST_F(MovePlannerTest, RejectsDestinationNestedInSource) {
  std::string text = "# Todo\n## Log\n- [x] a";
  EXPECT_FALSE(planner_.plan(text, 2, "# Todo", "## Log").has_value());
  EXPECT_EQ(planner_.rejectReason(), RejectReason::kOverlap);
}

TEST_F(MovePlannerTest, RejectsSourceNestedInDestination) {
  std::string text = "# Log\n- old\n## Todo\n- [x] a\n";
  EXPECT_FALSE(planner_.plan(text, 3, "## Todo", "# Log").has_value());
  EXPECT_EQ(planner_.rejectReason(), RejectReason::kOverlap);
}

TEST_F(MovePlannerTest, SiblingSubsectionsDoNotOverlap) {
  std::string text = "# Day\n## Todo\n- [x] a\n## Log\n";
  EXPECT_EQ(moveAndApply(text, 2), "# Day\n## Todo\n## Log\n- [x] a\n");
}

TEST_F(MovePlannerTest, ChildBelowPlainLineMovesAlone) {
  std::string text =
      "## Todo\n"
      "- [ ] Parent\n"
      "Some note\n"
      "  - [x] Child\n"
      "## Log\n";

  auto plan = planner_.plan(text, 3, "## Todo", "## Log");
  ASSERT_TRUE(plan.has_value());
  EXPECT_EQ(plan->block, (BlockRange{3, 4}));
  EXPECT_TRUE(plan->block.contains(3));

  EXPECT_EQ(applyPlan(text, *plan),
            "## Todo\n"
            "- [ ] Parent\n"
            "Some note\n"
            "## Log\n"
            "  - [x] Child\n");
}

TEST_F(MovePlannerTest, OddIndentChildTravelsWithParent) {
  std::string text = "## Todo\n   - [ ] P\n    - [x] C\n## Log\n";

  auto plan = planner_.plan(text, 2, "## Todo", "## Log");
  ASSERT_TRUE(plan.has_value());
  EXPECT_EQ(plan->block, (BlockRange{1, 3}));
  EXPECT_EQ(applyPlan(text, *plan), "## Todo\n## Log\n   - [ ] P\n    - [x] C\n");
}

TEST_F(MovePlannerTest, RejectionLeavesNoPlan) {
  std::string text = "## Todo\n- [ ] A\n## Log\n";
  auto plan = planMove(text, 1, "## Todo", "## Log");
  EXPECT_FALSE(plan.has_value());
}

TEST_F(MovePlannerTest, ReasonNames) {
  EXPECT_EQ(rejectReasonToString(RejectReason::kNotATask), "line is not a task");
  EXPECT_EQ(rejectReasonToString(RejectReason::kOverlap), "destination overlaps source");
  EXPECT_EQ(rejectReasonToString(RejectReason::kTriggerOutsideBlock),
            "task not inside its resolved block");
  EXPECT_EQ(plannerStateToString(PlannerState::kIdle), "idle");
  EXPECT_EQ(MovePlanner().state(), PlannerState::kIdle);
}

TEST_F(MovePlannerTest, FindFirstEligibleTask) {
  auto lines = linesOf("## Todo\n- [ ] a\n  - [x] b\n- [/] c\n## Log\n- [x] d\n");
  bflow::outline::SectionRange todo{0, 4};
  EXPECT_EQ(findFirstEligibleTask(lines, todo, {}), 2);

  bflow::outline::SectionRange log{4, 7};
  EXPECT_EQ(findFirstEligibleTask(lines, log, {}), 5);

  MoveOptions open_only;
  open_only.trigger_states = {TaskState::kMeeting};
  EXPECT_EQ(findFirstEligibleTask(lines, todo, open_only), -1);
}
