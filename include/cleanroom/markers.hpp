#pragma once
#include "cleanroom/config.hpp"

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace cleanroom::markers {

struct StripResult {
  std::string text;
  std::size_t regions_removed = 0;
  std::size_t unmatched_starts = 0; // start lines with no end after them; left in place
};

// Remove every complete marker region, delimiter lines included.
// A region starts at a line containing `start` and ends at the first line at or after it
// that contains `end` (past the start on the same line). Line endings are preserved.
StripResult strip_regions(std::string_view text, const MarkerPair& pair);

// Apply each pair in turn.
StripResult strip_all(std::string_view text, const std::vector<MarkerPair>& pairs);

} // namespace cleanroom::markers
