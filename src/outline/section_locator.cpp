#include "bflow/outline/section_locator.hpp"

#include "bflow/outline/line_classifier.hpp"

namespace bflow::outline {

namespace {

std::string_view trim(std::string_view text) {
  while (!text.empty() && (text.front() == ' ' || text.front() == '\t')) {
    text.remove_prefix(1);
  }
  while (!text.empty() && (text.back() == ' ' || text.back() == '\t' || text.back() == '\r')) {
    text.remove_suffix(1);
  }
  return text;
}

}  // namespace

std::string HeadingSpec::toString() const {
  return std::string(static_cast<std::size_t>(level), '#') + " " + title;
}

HeadingSpec parseTargetHeading(std::string_view heading) {
  heading = trim(heading);

  HeadingSpec spec;
  std::size_t hashes = 0;
  while (hashes < heading.size() && heading[hashes] == '#') {
    ++hashes;
  }
  if (hashes > 0 && hashes <= 6) {
    spec.level = static_cast<int>(hashes);
    spec.title = std::string(trim(heading.substr(hashes)));
  } else {
    spec.title = std::string(heading);
  }
  return spec;
}

int findSectionEnd(const std::vector<std::string>& lines, int heading_line) {
  const int count = static_cast<int>(lines.size());
  if (heading_line < 0 || heading_line >= count) {
    return count;
  }
  int level = headingLevel(lines[heading_line]);
  if (level == 0) {
    return count;
  }
  for (int i = heading_line + 1; i < count; ++i) {
    int other = headingLevel(lines[i]);
    if (other > 0 && other <= level) {
      return i;
    }
  }
  return count;
}

std::optional<SectionRange> findSection(const std::vector<std::string>& lines,
                                        std::string_view heading_text) {
  auto target = parseTargetHeading(heading_text);
  const int count = static_cast<int>(lines.size());

  for (int i = 0; i < count; ++i) {
    auto info = classifyLine(lines[i]);
    if (!info.isHeading() || info.heading_level != target.level) {
      continue;
    }
    if (trim(info.content) != target.title) {
      continue;
    }
    return SectionRange{i, findSectionEnd(lines, i)};
  }
  return std::nullopt;
}

std::optional<SectionRange> findEnclosingSection(const std::vector<std::string>& lines, int line) {
  const int count = static_cast<int>(lines.size());
  if (line < 0 || line >= count) {
    return std::nullopt;
  }
  for (int i = line - 1; i >= 0; --i) {
    if (headingLevel(lines[i]) > 0) {
      return SectionRange{i, findSectionEnd(lines, i)};
    }
  }
  return std::nullopt;
}

}  // namespace bflow::outline
