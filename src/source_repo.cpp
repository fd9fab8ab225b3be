#include "cleanroom/source_repo.hpp"

#include "cleanroom/consts.hpp"
#include "cleanroom/errors.hpp"
#include "cleanroom/process.hpp"
#include "cleanroom/util.hpp"

namespace cleanroom {

std::vector<std::string> list_tracked_files(const std::filesystem::path &repo_root) {
  const auto res = process::run({"git", "ls-files", "-z"}, repo_root, false);
  if (res.exit_code != 0) {
    throw ConfigError("git ls-files failed in " + repo_root.string() + " (exit " +
                      std::to_string(res.exit_code) + ")");
  }
  std::vector<std::string> out;
  std::size_t pos = 0;
  while (pos < res.output.size()) {
    const std::size_t nul = res.output.find(consts::kNul, pos);
    const std::size_t end = nul == std::string::npos ? res.output.size() : nul;
    if (end > pos)
      out.push_back(res.output.substr(pos, end - pos));
    pos = end + 1;
  }
  return out;
}

std::string resolve_remote_url(const std::filesystem::path &repo_root, const std::string &name) {
  // git resolves includes, linked worktrees and gitdir files for us
  auto res = process::run({"git", "remote", "get-url", name}, repo_root, false);
  strutil::rstrip_newlines(res.output);
  if (res.exit_code != 0 || res.output.empty()) {
    throw ConfigError("git remote '" + name + "' not found in " + repo_root.string());
  }
  return res.output;
}

} // namespace cleanroom
