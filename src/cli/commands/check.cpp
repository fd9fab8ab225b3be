#include "cleanroom/errors.hpp"
#include "cleanroom/pipeline.hpp"
#include "cli/command.hpp"
#include "cli/context.hpp"
#include "cli/report.hpp"

#include <iostream>

using namespace cleanroom;

int cmd_check(int argc, char **argv) {
  const auto opts = cli::parse_options(argc, argv, "check");
  if (!opts)
    return cli::kExitConfig;

  try {
    const auto ctx = cli::load_context(*opts);
    Pipeline pipeline{ctx.options.repo_root, ctx.config, ctx.tracked};
    const auto res = pipeline.preview();

    for (const auto &w : res.transform.warnings())
      std::cout << "warning: " << w << "\n";
    cli::print_validation(std::cout, res.validation);
    return res.validation.passed() ? cli::kExitOk : cli::kExitValidation;
  } catch (const ConfigError &e) {
    std::cerr << "check: " << e.what() << "\n";
    return cli::kExitConfig;
  } catch (const Error &e) {
    std::cerr << "check: " << e.what() << "\n";
    return cli::kExitRuntime;
  } catch (const std::filesystem::filesystem_error &e) {
    std::cerr << "check: " << e.what() << "\n";
    return cli::kExitRuntime;
  }
}
