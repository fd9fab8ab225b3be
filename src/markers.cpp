#include "cleanroom/markers.hpp"

namespace cleanroom::markers {

namespace {

// Split keeping the terminator on each line, so joining reproduces the input.
std::vector<std::string_view> split_keep_newlines(std::string_view text) {
  std::vector<std::string_view> out;
  std::size_t pos = 0;
  while (pos < text.size()) {
    const std::size_t nl = text.find('\n', pos);
    const std::size_t end = nl == std::string_view::npos ? text.size() : nl + 1;
    out.push_back(text.substr(pos, end - pos));
    pos = end;
  }
  return out;
}

// Index of the line closing a region opened on line `first`, or npos.
std::size_t find_region_end(const std::vector<std::string_view> &lines, std::size_t first,
                            const MarkerPair &pair) {
  const auto start_at = lines[first].find(pair.start);
  if (lines[first].find(pair.end, start_at + pair.start.size()) != std::string_view::npos)
    return first;
  for (std::size_t j = first + 1; j < lines.size(); ++j) {
    if (lines[j].find(pair.end) != std::string_view::npos)
      return j;
  }
  return std::string_view::npos;
}

} // namespace

StripResult strip_regions(std::string_view text, const MarkerPair &pair) {
  StripResult res;
  if (pair.start.empty() || pair.end.empty() ||
      text.find(pair.start) == std::string_view::npos) {
    res.text = std::string(text);
    return res;
  }

  const auto lines = split_keep_newlines(text);
  res.text.reserve(text.size());
  std::size_t i = 0;
  while (i < lines.size()) {
    if (lines[i].find(pair.start) == std::string_view::npos) {
      res.text.append(lines[i]);
      ++i;
      continue;
    }
    const std::size_t end = find_region_end(lines, i, pair);
    if (end == std::string_view::npos) {
      ++res.unmatched_starts;
      res.text.append(lines[i]);
      ++i;
      continue;
    }
    ++res.regions_removed;
    i = end + 1;
  }
  return res;
}

StripResult strip_all(std::string_view text, const std::vector<MarkerPair> &pairs) {
  StripResult total;
  total.text = std::string(text);
  for (const auto &pair : pairs) {
    auto r = strip_regions(total.text, pair);
    total.text = std::move(r.text);
    total.regions_removed += r.regions_removed;
    total.unmatched_starts += r.unmatched_starts;
  }
  return total;
}

} // namespace cleanroom::markers
