#include "cleanroom/errors.hpp"
#include "cleanroom/pipeline.hpp"
#include "cleanroom/transport.hpp"
#include "cli/command.hpp"
#include "cli/context.hpp"
#include "cli/report.hpp"

#include <iostream>

using namespace cleanroom;

int cmd_publish(int argc, char **argv) {
  const auto opts = cli::parse_options(argc, argv, "publish");
  if (!opts)
    return cli::kExitConfig;

  try {
    const auto ctx = cli::load_context(*opts);
    cli::print_header(std::cout, ctx, "LIVE (will force-push)");

    const auto transport = make_transport(ctx.remote_url, ctx.options.repo_root);
    Pipeline pipeline{ctx.options.repo_root, ctx.config, ctx.tracked};
    const auto res = pipeline.publish(*transport);

    cli::print_snapshot(std::cout, res.files_copied, res.exclusions);
    cli::print_transform(std::cout, res.transform);
    cli::print_validation(std::cout, res.validation);

    if (res.status == PublishStatus::Rejected) {
      std::cerr << "ERROR: Validation failed - private terms still present after scrubbing.\n";
      std::cerr << "Extend scrub_rules, exclude_paths or markers in " << opts->config_path.string()
                << " to cover these cases. Nothing was pushed.\n";
      return cli::kExitValidation;
    }

    std::cout << "--- Pushing to " << ctx.config.remote << "/" << ctx.config.branch << " ---\n";
    std::cout << "Root commit " << res.commit.commit_hex << " (no parents)\n";
    std::cout << res.push.detail;
    if (!res.push.detail.empty() && res.push.detail.back() != '\n')
      std::cout << "\n";
    std::cout << "\n=== Published successfully to " << ctx.remote_url << " (" << ctx.config.branch
              << ") ===\n";
    return cli::kExitOk;
  } catch (const ConfigError &e) {
    std::cerr << "publish: " << e.what() << "\n";
    return cli::kExitConfig;
  } catch (const Error &e) {
    std::cerr << "publish: " << e.what() << "\n";
    return cli::kExitRuntime;
  } catch (const std::filesystem::filesystem_error &e) {
    std::cerr << "publish: " << e.what() << "\n";
    return cli::kExitRuntime;
  }
}
