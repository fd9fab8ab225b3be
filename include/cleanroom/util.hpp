#pragma once
#include <string>
#include <string_view>

namespace cleanroom {

// Validate 40-char lowercase/uppercase hex
auto looks_hex40(std::string_view str) -> bool;

// String helpers
namespace strutil {
  // Strip trailing CR/LF characters in place
  void rstrip_newlines(std::string& str);

  // Strip leading/trailing spaces, tabs and CR
  auto trim(std::string_view sv) -> std::string;

  // Number of non-overlapping occurrences of `needle` (0 for an empty needle)
  auto count_occurrences(std::string_view haystack, std::string_view needle) -> std::size_t;
}

}
