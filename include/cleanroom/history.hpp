#pragma once
#include "cleanroom/config.hpp"
#include "cleanroom/hash.hpp"

#include <cstdint>
#include <filesystem>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace cleanroom {

struct TreeEntry {
  std::uint32_t mode; // consts::kModeFile, kModeExec, kModeSymlink or kModeTree
  std::string name;   // filename (no '/')
  oid id;             // 20-byte raw SHA-1 of referenced object
};

struct CommitInfo {
  std::string tree_hex;
  std::vector<std::string> parents; // zero or more parents (40-hex each)
  std::string author;               // full author line after "author "
  std::string committer;            // full committer line
  std::string message;              // raw message (may contain newlines)
};

struct RootCommit {
  std::string commit_hex;
  std::string tree_hex;
  std::string branch;
};

// A git directory (".git" of a work tree, or a bare repository) read and written
// through loose objects.
class GitDir {
public:
  explicit GitDir(std::filesystem::path path);

  [[nodiscard]] const std::filesystem::path& path() const { return path_; }
  [[nodiscard]] auto objects_dir() const -> std::filesystem::path;

  // Create objects/, refs/heads/, a minimal config and HEAD -> refs/heads/<branch>.
  // Throws PublishError if a git directory already exists at path().
  void init(std::string_view branch, bool bare) const;

  [[nodiscard]] auto write_blob(std::span<const std::uint8_t> bytes) const -> std::string;
  [[nodiscard]] auto write_tree(const std::vector<TreeEntry>& entries) const -> std::string;
  [[nodiscard]] auto read_tree(std::string_view hex_oid) const -> std::vector<TreeEntry>;
  [[nodiscard]] auto write_commit(std::string_view tree_hex,
                                  const std::vector<std::string>& parent_hexes,
                                  std::string_view author_line, std::string_view committer_line,
                                  std::string_view message) const -> std::string;
  [[nodiscard]] auto read_commit(std::string_view commit_hex) const -> CommitInfo;

  // Every object id reachable from the commit (commit, trees, blobs).
  [[nodiscard]] auto reachable_objects(std::string_view commit_hex) const
      -> std::vector<std::string>;

  // Recursively write the directory `root` (skipping its .git) as tree objects.
  [[nodiscard]] auto write_tree_from_dir(const std::filesystem::path& root) const -> std::string;

private:
  static auto mode_to_ascii_octal(std::uint32_t mode) -> std::string;
  static auto ascii_octal_to_mode(std::string_view str) -> std::uint32_t;

  std::filesystem::path path_;
};

// Start a brand-new history inside the snapshot: init <root>/.git, commit the whole
// tree with NO parent, point refs/heads/<branch> and HEAD at it.
// The result has no relationship to any other repository's commit graph.
RootCommit create_root_history(const std::filesystem::path& snapshot_root,
                               std::string_view branch, const Identity& identity,
                               std::string_view message);

} // namespace cleanroom
