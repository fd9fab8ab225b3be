#pragma once
#include <filesystem>
#include <string>
#include <vector>

namespace cleanroom {

struct ExclusionNote {
  std::string path;
  bool removed; // false: not present in the snapshot, nothing to do
};

// Disposable working copy of the tracked files, rooted in a fresh temp directory.
// The directory is removed when the Snapshot is destroyed, whatever the exit path.
class Snapshot {
public:
  // Copy every tracked path from `source_root`, then delete each excluded path.
  // Throws ConfigError for an empty tracked set or an exclude path outside the root,
  // IoError if any tracked file cannot be copied (the partial copy is removed).
  static Snapshot create(const std::filesystem::path& source_root,
                         const std::vector<std::string>& tracked_paths,
                         const std::vector<std::string>& exclude_paths);

  Snapshot(const Snapshot&) = delete;
  Snapshot& operator=(const Snapshot&) = delete;
  Snapshot(Snapshot&& other) noexcept;
  Snapshot& operator=(Snapshot&& other) noexcept;
  ~Snapshot();

  [[nodiscard]] const std::filesystem::path& root() const { return root_; }
  [[nodiscard]] std::size_t copied_count() const { return copied_; }
  [[nodiscard]] const std::vector<ExclusionNote>& exclusions() const { return exclusions_; }

  // Regular files and symlinks currently in the snapshot, repo-relative and sorted.
  // The .git directory written by the publisher is never listed.
  [[nodiscard]] std::vector<std::string> files() const;

private:
  explicit Snapshot(std::filesystem::path root);
  void release() noexcept;

  std::filesystem::path root_;
  std::size_t copied_ = 0;
  std::vector<ExclusionNote> exclusions_;
};

// Normalize a repo-relative path; throws ConfigError if absolute or escaping via "..".
std::filesystem::path checked_relative(const std::string& rel);

} // namespace cleanroom
