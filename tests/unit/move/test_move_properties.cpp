#include <gtest/gtest.h>

#include <algorithm>

#include "bflow/move/move_planner.hpp"
#include "bflow/outline/section_locator.hpp"
#include "test_helpers.hpp"

using namespace bflow::move;
using namespace bflow::test;
namespace outline = bflow::outline;

namespace {

// Non-blank lines, sorted, for comparing content irrespective of position
std::vector<std::string> contentOf(const std::string& text) {
  std::vector<std::string> out;
  for (auto& line : outline::splitLines(text)) {
    if (!outline::isBlank(line)) {
      out.push_back(line);
    }
  }
  std::sort(out.begin(), out.end());
  return out;
}

struct Fixture {
  const char* name;
  std::string text;
  int line;
};

const std::vector<Fixture>& fixtures() {
  static const std::vector<Fixture> kFixtures = {
      {"flat", "## Todo\n- [ ] a\n- [x] b\n- [ ] c\n\n## Log\n- old\n", 2},
      {"nested", "## Todo\n- [ ] a\n  - [x] b\n    - note\n  - [ ] c\n## Log\n", 2},
      {"gap", "## Todo\n- [x] a\n\n  - child after gap\n\n- [ ] b\n## Log\n", 1},
      {"log first", "# Day\n## Log\n- y\n\n- later\n## Todo\n- [/] a\n  - b", 6},
      {"no log", "Intro\n\n## Todo\n- [x] a\n  - [<] b\n- [ ] c\n", 3},
      {"tabs", "## Todo\n- [ ] a\n\t- [x] b\n\t\t- c\n- [ ] d\n## Log\n", 2},
      {"plain note", "## Todo\n- [ ] a\nnote\n  - [x] b\n## Log\n", 3},
      {"odd spaces", "## Todo\n   - [ ] a\n    - [x] b\n## Log\n", 2},
  };
  return kFixtures;
}

}  // namespace

class MovePropertiesTest : public ::testing::Test {};

TEST_F(MovePropertiesTest, BlockLinesAreDeeperThanRoot) {
  for (const auto& f : fixtures()) {
    auto plan = planMove(f.text, f.line, "## Todo", "## Log");
    ASSERT_TRUE(plan.has_value()) << f.name;

    auto lines = linesOf(f.text);
    int root_column = outline::indentColumns(lines[plan->block.start_line]);
    EXPECT_TRUE(plan->block.contains(f.line)) << f.name;
    for (int i = plan->block.start_line + 1; i < plan->block.end_line; ++i) {
      if (outline::isBlank(lines[i])) continue;
      EXPECT_GT(outline::indentColumns(lines[i]), root_column) << f.name << " line " << i;
    }
  }
}

TEST_F(MovePropertiesTest, ContentIsPreserved) {
  MoveOptions options;
  options.reopen_scheduled = false;
  for (const auto& f : fixtures()) {
    auto after = moveAndApply(f.text, f.line, "## Todo", "## Log", options);
    auto expected = contentOf(f.text);
    if (f.text.find("## Log") == std::string::npos) {
      expected.push_back("## Log");
      std::sort(expected.begin(), expected.end());
    }
    EXPECT_EQ(contentOf(after), expected) << f.name;
  }
}

TEST_F(MovePropertiesTest, MovedBlockIsContiguousInDestination) {
  for (const auto& f : fixtures()) {
    auto plan = planMove(f.text, f.line, "## Todo", "## Log");
    ASSERT_TRUE(plan.has_value()) << f.name;
    auto after = applyPlan(f.text, *plan);

    std::string moved = outline::joinLines(plan->moved_lines, 0, plan->moved_lines.size());
    auto at = after.find(moved);
    ASSERT_NE(at, std::string::npos) << f.name;

    auto lines = linesOf(after);
    auto log = outline::findSection(lines, "## Log");
    ASSERT_TRUE(log.has_value()) << f.name;
    outline::Document doc(after);
    int first = static_cast<int>(doc.lineAt(at));
    EXPECT_TRUE(log->contains(first)) << f.name;
    EXPECT_TRUE(log->contains(first + static_cast<int>(plan->moved_lines.size()) - 1)) << f.name;
  }
}

TEST_F(MovePropertiesTest, NothingLeftToTriggerAfterMove) {
  for (const auto& f : fixtures()) {
    auto after = moveAndApply(f.text, f.line);
    auto lines = linesOf(after);
    auto todo = outline::findSection(lines, "## Todo");
    ASSERT_TRUE(todo.has_value()) << f.name;
    EXPECT_EQ(findFirstEligibleTask(lines, *todo, {}), -1) << f.name;
  }
}

TEST_F(MovePropertiesTest, MovedBlockIsNotMovedAgain) {
  for (const auto& f : fixtures()) {
    auto plan = planMove(f.text, f.line, "## Todo", "## Log");
    ASSERT_TRUE(plan.has_value()) << f.name;
    auto after = applyPlan(f.text, *plan);

    std::string moved = outline::joinLines(plan->moved_lines, 0, plan->moved_lines.size());
    outline::Document doc(after);
    int new_line = static_cast<int>(doc.lineAt(after.find(moved)));

    MovePlanner planner;
    EXPECT_FALSE(planner.plan(doc, new_line, "## Todo", "## Log").has_value()) << f.name;
    EXPECT_EQ(planner.rejectReason(), RejectReason::kOutsideSourceSection) << f.name;
  }
}

TEST_F(MovePropertiesTest, TextOutsideTheEditsIsUntouched) {
  for (const auto& f : fixtures()) {
    auto plan = planMove(f.text, f.line, "## Todo", "## Log");
    ASSERT_TRUE(plan.has_value()) << f.name;
    auto after = applyPlan(f.text, *plan);

    std::size_t first_edit = std::min(plan->delete_from, plan->insert_at);
    EXPECT_EQ(after.substr(0, first_edit), f.text.substr(0, first_edit)) << f.name;

    std::size_t last_edit = std::max(plan->delete_to, plan->insert_at);
    std::size_t tail = f.text.size() - last_edit;
    EXPECT_EQ(after.substr(after.size() - tail), f.text.substr(last_edit)) << f.name;
  }
}
