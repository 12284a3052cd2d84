#include "bflow/util/wikilinks.hpp"

#include <regex>

namespace bflow::util {

namespace {

const std::regex& wikilinkPattern() {
  static const std::regex pattern(R"(\[\[([^\]]+)\]\])");
  return pattern;
}

std::string trim(std::string_view text) {
  auto begin = text.find_first_not_of(" \t");
  if (begin == std::string_view::npos) return {};
  auto end = text.find_last_not_of(" \t");
  return std::string(text.substr(begin, end - begin + 1));
}

}  // namespace

std::vector<WikilinkMatch> findWikilinkMatches(std::string_view line) {
  std::vector<WikilinkMatch> matches;
  std::string text(line);

  auto begin = std::sregex_iterator(text.begin(), text.end(), wikilinkPattern());
  for (auto it = begin; it != std::sregex_iterator(); ++it) {
    auto index = static_cast<std::size_t>(it->position(0));
    if (index > 0 && text[index - 1] == '!') {
      continue;
    }
    matches.push_back(WikilinkMatch{index, it->str(0), it->str(1)});
  }
  return matches;
}

ParsedWikilink parseWikilinkText(std::string_view inner) {
  ParsedWikilink parsed;

  std::string_view left = inner;
  auto pipe = inner.find('|');
  if (pipe != std::string_view::npos) {
    left = inner.substr(0, pipe);
    parsed.alias = std::string(inner.substr(pipe + 1));
  }

  auto hash = left.find('#');
  if (hash != std::string_view::npos) {
    parsed.section = std::string(left.substr(hash + 1));
    left = left.substr(0, hash);
  }
  parsed.link_path = std::string(left);
  return parsed;
}

std::string stripWikilinksToDisplayText(std::string_view text) {
  std::string input(text);
  std::string result;
  std::size_t last = 0;

  auto begin = std::sregex_iterator(input.begin(), input.end(), wikilinkPattern());
  for (auto it = begin; it != std::sregex_iterator(); ++it) {
    auto position = static_cast<std::size_t>(it->position(0));
    result.append(input, last, position - last);

    auto parsed = parseWikilinkText(it->str(1));
    if (parsed.alias && !parsed.alias->empty()) {
      result += trim(*parsed.alias);
    } else if (parsed.section && !trim(*parsed.section).empty()) {
      result += trim(*parsed.section);
    } else {
      result += trim(parsed.link_path);
    }
    last = position + static_cast<std::size_t>(it->length(0));
  }
  result.append(input, last, std::string::npos);
  return result;
}

}  // namespace bflow::util
