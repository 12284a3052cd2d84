#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace bflow::outline {

// A configured heading such as "## Log": level 2, title "Log"
struct HeadingSpec {
  int level = 2;
  std::string title;

  std::string toString() const;
};

/**
 * @brief Half-open line range [heading_line, end_line) of one section
 *
 * end_line is the next heading of equal or shallower level, or the line count.
 */
struct SectionRange {
  int heading_line = 0;
  int end_line = 0;

  int contentStart() const { return heading_line + 1; }
  bool contains(int line) const { return line > heading_line && line < end_line; }
  bool isEmpty() const { return end_line <= heading_line + 1; }
  // True when the two ranges share a line, which happens when one section nests in the other
  bool intersects(const SectionRange& other) const {
    return heading_line < other.end_line && other.heading_line < end_line;
  }
  bool operator==(const SectionRange& other) const = default;
};

// "## Log" -> {2, "Log"}; text without leading '#' is taken as a level 2 title
HeadingSpec parseTargetHeading(std::string_view heading);

// First section whose heading matches heading_text exactly (level and trimmed title)
std::optional<SectionRange> findSection(const std::vector<std::string>& lines,
                                        std::string_view heading_text);

// End of the section that starts at heading_line
int findSectionEnd(const std::vector<std::string>& lines, int heading_line);

// Section of the nearest heading above line; nullopt when no heading precedes it
std::optional<SectionRange> findEnclosingSection(const std::vector<std::string>& lines, int line);

}  // namespace bflow::outline
