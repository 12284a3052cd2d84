#include "test_helpers.hpp"

#include <fstream>
#include <random>
#include <sstream>

#include "bflow/outline/document.hpp"

namespace bflow::test {

void TempDirTest::SetUp() {
  temp_dir_ = std::filesystem::temp_directory_path() / "bflow_test";
  temp_dir_ /= randomString(8);
  std::filesystem::create_directories(temp_dir_);
}

void TempDirTest::TearDown() {
  std::error_code ec;
  std::filesystem::remove_all(temp_dir_, ec);
}

std::string applyPlan(const std::string& text, const move::MovePlan& plan) {
  auto result = outline::applyEdits(text, plan.edits());
  EXPECT_TRUE(result.has_value()) << "Edit script rejected: " << result.error().message();
  return result.value_or(text);
}

std::string moveAndApply(const std::string& text, int line, const std::string& source,
                         const std::string& dest, const move::MoveOptions& options) {
  move::MovePlanner planner(options);
  auto plan = planner.plan(text, line, source, dest);
  EXPECT_TRUE(plan.has_value()) << "Move rejected: "
                                << move::rejectReasonToString(planner.rejectReason());
  if (!plan) {
    return text;
  }
  return applyPlan(text, *plan);
}

std::vector<std::string> linesOf(const std::string& text) {
  return outline::splitLines(text);
}

std::string randomString(size_t length) {
  static const char charset[] = "abcdefghijklmnopqrstuvwxyzABCDEFGHIJKLMNOPQRSTUVWXYZ0123456789";
  std::random_device rd;
  std::mt19937 gen(rd());
  std::uniform_int_distribution<> dis(0, sizeof(charset) - 2);

  std::string result;
  result.reserve(length);
  for (size_t i = 0; i < length; ++i) {
    result += charset[dis(gen)];
  }
  return result;
}

std::string readText(const std::filesystem::path& path) {
  std::ifstream file(path, std::ios::binary);
  std::ostringstream ss;
  ss << file.rdbuf();
  return ss.str();
}

}  // namespace bflow::test
