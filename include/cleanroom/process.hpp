#pragma once
#include <filesystem>
#include <string>
#include <vector>

namespace cleanroom::process {

struct CommandResult {
  int exit_code = -1;
  std::string output; // stdout, plus stderr when merged
};

// Quote one argument for /bin/sh: wraps in single quotes, escaping embedded ones.
std::string shell_quote(const std::string& arg);

// Run argv[0] with the given arguments in `cwd` and wait for it. With `merge_stderr`
// false the child's stderr goes to ours. Throws Error if the command cannot be started.
CommandResult run(const std::vector<std::string>& argv, const std::filesystem::path& cwd,
                  bool merge_stderr = true);

} // namespace cleanroom::process
