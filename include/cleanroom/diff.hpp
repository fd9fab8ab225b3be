#pragma once
#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace cleanroom {

class Snapshot; // fwd

namespace diff {

// Unified diff of two line sequences with `context` lines around each hunk and
// "@@ -a,b +c,d @@" headers. Empty string if the sequences are equal.
std::string unified_diff(const std::vector<std::string>& a,
                         const std::vector<std::string>& b,
                         std::string_view path,
                         std::size_t context = 3);

// Split raw text into lines (newlines and CRs dropped).
std::vector<std::string> split_lines(std::string_view text);

} // namespace diff

enum class DiffKind : std::uint8_t { Modified, Deleted };

struct DiffEntry {
  std::string path;
  DiffKind kind;
  std::string text; // unified diff, or a one-line note for binary content
};

struct DiffReport {
  std::vector<DiffEntry> entries; // tracked-file order; unchanged files omitted

  [[nodiscard]] bool empty() const { return entries.empty(); }
};

// Compare each tracked file in `source_root` with its counterpart in the snapshot.
DiffReport render_preview(const std::filesystem::path& source_root,
                          const std::vector<std::string>& tracked_paths,
                          const Snapshot& snapshot);

} // namespace cleanroom
