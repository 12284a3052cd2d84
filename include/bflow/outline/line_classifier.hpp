#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace bflow::outline {

// Number of spaces that make up one indentation unit unless configured otherwise
inline constexpr int kDefaultIndentWidth = 2;

/**
 * @brief State carried by a checkbox token such as "[ ]" or "[x]"
 *
 * kCustom covers any marker character the classifier does not know, so that
 * new marker types keep their structural meaning without a classifier change.
 */
enum class TaskState {
  kOpen,       // [ ]
  kCompleted,  // [x] or [X]
  kStarted,    // [/]
  kScheduled,  // [<]  pushed to another note
  kMigrated,   // [>]  copied forward
  kMeeting,    // [o]
  kCustom      // anything else
};

TaskState taskStateFromChar(char symbol);
char taskStateToChar(TaskState state);
std::string_view taskStateToString(TaskState state);
std::optional<TaskState> taskStateFromString(std::string_view name);

struct TaskMarker {
  TaskState state = TaskState::kOpen;
  char symbol = ' ';        // character between the brackets
  std::size_t column = 0;   // offset of '[' within the line
};

enum class LineKind {
  kBlank,
  kPlain,
  kHeading,
  kListItem
};

/**
 * @brief Classification of a single line of outline text
 *
 * Derived from the text alone; holds no reference to the document.
 */
struct LineInfo {
  LineKind kind = LineKind::kBlank;
  std::size_t indent = 0;       // leading whitespace characters
  int column = 0;               // indentation width, a tab counting as indent_width columns
  int depth = 0;                // indentation units (tabs and space groups), for display
  int heading_level = 0;        // 1..6 for headings, 0 otherwise
  char bullet = '\0';           // '-', '*' or '+' for list items
  std::optional<TaskMarker> marker;
  std::string prefix;           // bullet and checkbox (or heading hashes) with trailing spaces
  std::string content;          // text after the prefix

  bool isBlank() const { return kind == LineKind::kBlank; }
  bool isHeading() const { return kind == LineKind::kHeading; }
  bool isListItem() const { return kind == LineKind::kListItem; }
  bool isTask() const { return marker.has_value(); }
  bool hasState(TaskState state) const { return marker && marker->state == state; }
};

// Classify one line. Never throws; malformed markers degrade to plain list items.
LineInfo classifyLine(std::string_view line, int indent_width = kDefaultIndentWidth);

// Leading whitespace characters (spaces and tabs)
std::size_t countIndent(std::string_view line);

// Indentation units: one per tab, one per started group of indent_width spaces
int indentDepth(std::string_view line, int indent_width = kDefaultIndentWidth);

// Indentation width in columns: one per space, indent_width per tab. Nesting compares columns.
int indentColumns(std::string_view line, int indent_width = kDefaultIndentWidth);

bool isBlank(std::string_view line);

// Heading level (1..6) or 0 when the line is not a heading
int headingLevel(std::string_view line);

std::optional<TaskMarker> parseTaskMarker(std::string_view line);

/**
 * @brief Rewrite the checkbox of a task line to another state
 * @return The rewritten line, or nullopt when the line carries no checkbox
 */
std::optional<std::string> withTaskState(std::string_view line, TaskState state);

// "  - [ ] Foo" -> "Foo", "- Bar" -> "Bar", other lines are returned trimmed on the left
std::string stripListPrefix(std::string_view line);

// Remove the minimal common indentation of non-blank lines; blank lines become empty
std::vector<std::string> dedentLines(const std::vector<std::string>& lines);

// Remove up to amount leading whitespace characters from every line
std::vector<std::string> dedentLinesByAmount(const std::vector<std::string>& lines,
                                             std::size_t amount);

}  // namespace bflow::outline
