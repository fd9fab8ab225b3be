#pragma once
#include <cstddef>
#include <string>
#include <string_view>

namespace cleanroom::scrub {

// Replace every non-overlapping occurrence of `find`, scanning left to right.
// Both terms are plain text: no character has pattern meaning, and inserted
// replacement text is never rescanned. Returns the number of replacements.
std::size_t replace_literal(std::string& text, std::string_view find, std::string_view replace);

} // namespace cleanroom::scrub
