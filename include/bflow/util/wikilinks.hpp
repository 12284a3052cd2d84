#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace bflow::util {

// One [[...]] occurrence in a line
struct WikilinkMatch {
  std::size_t index = 0;   // offset of the opening "[["
  std::string match_text;  // "[[inner]]"
  std::string inner;       // text between the brackets
};

// "Note#Section|Alias" split into its parts
struct ParsedWikilink {
  std::string link_path;
  std::optional<std::string> section;
  std::optional<std::string> alias;
};

// All wikilinks in line, skipping embeds ("![[...]]")
std::vector<WikilinkMatch> findWikilinkMatches(std::string_view line);

ParsedWikilink parseWikilinkText(std::string_view inner);

/**
 * @brief Replace every wikilink with the text a reader sees
 *
 * "[[Note|Alias]]" -> "Alias", "[[Note#Section]]" -> "Section", "[[Note]]" -> "Note"
 */
std::string stripWikilinksToDisplayText(std::string_view text);

}  // namespace bflow::util
