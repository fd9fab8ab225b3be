#pragma once
#include "cleanroom/config.hpp"

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace cleanroom::cli {

struct Options {
  std::filesystem::path repo_root;
  std::filesystem::path config_path;
};

// Parse `--config <file>` and `--repo <dir>`; prints usage and returns nullopt on bad input.
std::optional<Options> parse_options(int argc, char **argv, const char *cmd);

// Everything the pipeline needs from the environment.
struct Context {
  Options options;
  PublishConfig config;
  std::vector<std::string> tracked;
  std::string remote_url;
};

// Load config, resolve the remote and list tracked files. Throws ConfigError.
Context load_context(const Options &options);

} // namespace cleanroom::cli
