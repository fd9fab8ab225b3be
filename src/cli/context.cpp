#include "cli/context.hpp"

#include "cleanroom/consts.hpp"
#include "cleanroom/source_repo.hpp"

#include <iostream>

namespace cleanroom::cli {

std::optional<Options> parse_options(int argc, char **argv, const char *cmd) {
  Options opts{.repo_root = std::filesystem::current_path(), .config_path = {}};
  for (int i = 1; i < argc; ++i) {
    const std::string a = argv[i];
    if (a == "--config" && i + 1 < argc) {
      opts.config_path = argv[++i];
    } else if (a == "--repo" && i + 1 < argc) {
      opts.repo_root = argv[++i];
    } else {
      std::cerr << cmd << ": unknown argument: " << a << "\n";
      std::cerr << "usage: cleanroom " << cmd << " [--config <file>] [--repo <dir>]\n";
      return std::nullopt;
    }
  }
  opts.repo_root = std::filesystem::absolute(opts.repo_root);
  if (opts.config_path.empty())
    opts.config_path = opts.repo_root / consts::kDefaultConfig;
  return opts;
}

Context load_context(const Options &options) {
  Context ctx{.options = options, .config = load_config(options.config_path), .tracked = {},
              .remote_url = {}};
  ctx.remote_url = resolve_remote_url(options.repo_root, ctx.config.remote);
  ctx.tracked = list_tracked_files(options.repo_root);
  return ctx;
}

} // namespace cleanroom::cli
