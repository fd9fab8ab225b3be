#include "cli/registry.hpp"

#include <iostream>
#include <string>

int main(int argc, char **argv) {
  cleanroom::cli::register_all_commands(); // defined in register_commands.cpp

  if (argc < 2) {
    cleanroom::cli::print_usage();
    return cleanroom::cli::kExitConfig;
  }
  const std::string cmd = argv[1];
  if (cmd == "--help" || cmd == "-h" || cmd == "help") {
    cleanroom::cli::print_usage();
    return cleanroom::cli::kExitOk;
  }

  const auto fn = cleanroom::cli::find_command(cmd);
  if (!fn) {
    std::cerr << "unknown command: " << cmd << "\n";
    cleanroom::cli::print_usage();
    return cleanroom::cli::kExitConfig;
  }
  // Pass everything after the subcommand to the handler
  return fn(argc - 1, argv + 1);
}
