#include "cleanroom/errors.hpp"
#include "cleanroom/pipeline.hpp"
#include "cli/command.hpp"
#include "cli/context.hpp"
#include "cli/report.hpp"

#include <iostream>

using namespace cleanroom;

int cmd_preview(int argc, char **argv) {
  const auto opts = cli::parse_options(argc, argv, "preview");
  if (!opts)
    return cli::kExitConfig;

  try {
    const auto ctx = cli::load_context(*opts);
    cli::print_header(std::cout, ctx, "PREVIEW (no push)");

    Pipeline pipeline{ctx.options.repo_root, ctx.config, ctx.tracked};
    const auto res = pipeline.preview();

    cli::print_snapshot(std::cout, res.files_copied, res.exclusions);
    cli::print_transform(std::cout, res.transform);
    cli::print_validation(std::cout, res.validation);
    cli::print_diff(std::cout, res.diff);

    if (!res.validation.passed())
      std::cout << "NOTE: validation would block a live publish; extend the config first.\n";
    std::cout << "=== Preview complete. Run `cleanroom publish` to push. ===\n";
    return cli::kExitOk;
  } catch (const ConfigError &e) {
    std::cerr << "preview: " << e.what() << "\n";
    return cli::kExitConfig;
  } catch (const Error &e) {
    std::cerr << "preview: " << e.what() << "\n";
    return cli::kExitRuntime;
  } catch (const std::filesystem::filesystem_error &e) {
    std::cerr << "preview: " << e.what() << "\n";
    return cli::kExitRuntime;
  }
}
