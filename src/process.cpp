#include "cleanroom/process.hpp"

#include "cleanroom/errors.hpp"

#include <array>
#include <cstdio>
#include <sys/wait.h>

namespace cleanroom::process {

std::string shell_quote(const std::string &arg) {
  std::string out = "'";
  for (const char c : arg) {
    if (c == '\'')
      out += "'\\''";
    else
      out.push_back(c);
  }
  out.push_back('\'');
  return out;
}

CommandResult run(const std::vector<std::string> &argv, const std::filesystem::path &cwd,
                  bool merge_stderr) {
  if (argv.empty())
    throw Error("process: empty command line");

  std::string command = "cd " + shell_quote(cwd.string()) + " &&";
  for (const auto &a : argv) {
    command.push_back(' ');
    command += shell_quote(a);
  }
  if (merge_stderr)
    command += " 2>&1";

  FILE *pipe = popen(command.c_str(), "r");
  if (pipe == nullptr) {
    throw Error("failed to execute command: " + argv.front());
  }

  CommandResult res;
  std::array<char, 4096> buffer{};
  std::size_t n = 0;
  while ((n = std::fread(buffer.data(), 1, buffer.size(), pipe)) > 0) {
    res.output.append(buffer.data(), n);
  }

  const int raw_status = pclose(pipe);
  if (raw_status == -1) {
    res.exit_code = -1;
  } else if (WIFEXITED(raw_status)) {
    res.exit_code = WEXITSTATUS(raw_status);
  } else {
    res.exit_code = raw_status;
  }
  return res;
}

} // namespace cleanroom::process
