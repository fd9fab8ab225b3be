#pragma once
#include <filesystem>
#include <string>
#include <vector>

namespace cleanroom {

// Paths git currently tracks in `repo_root` (runs `git ls-files -z`).
// Throws ConfigError if `repo_root` is not a git work tree.
std::vector<std::string> list_tracked_files(const std::filesystem::path& repo_root);

// URL of remote `name` as git reports it (`git remote get-url`). Throws ConfigError if unknown.
std::string resolve_remote_url(const std::filesystem::path& repo_root, const std::string& name);

} // namespace cleanroom
