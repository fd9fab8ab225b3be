#include "cli/registry.hpp"

#include <algorithm>
#include <iomanip>
#include <iostream>
#include <vector>

namespace cleanroom::cli {

struct entry {
  std::string name;
  command_fn fn;
  std::string help;
};

// Kept in registration order so usage lists the pipeline steps as they run.
static std::vector<entry> &table() {
  static std::vector<entry> t;
  return t;
}

void register_command(const std::string &name, command_fn fn, const std::string &help) {
  auto &t = table();
  const auto it = std::ranges::find(t, name, &entry::name);
  if (it != t.end()) {
    it->fn = fn;
    it->help = help;
    return;
  }
  t.push_back(entry{.name = name, .fn = fn, .help = help});
}

command_fn find_command(const std::string &name) {
  const auto &t = table();
  const auto it = std::ranges::find(t, name, &entry::name);
  return it == t.end() ? nullptr : it->fn;
}

void print_usage() {
  std::cerr << "usage: cleanroom <command> [--config <file>] [--repo <dir>]\n\n";
  std::cerr << "commands:\n";
  for (const auto &e : table()) {
    std::cerr << "  " << std::left << std::setw(9) << e.name << e.help << "\n";
  }
  std::cerr << "\nexit status: " << kExitOk << " ok, " << kExitValidation
            << " validation failed, " << kExitConfig << " configuration error, "
            << kExitRuntime << " I/O or push failure\n";
}

} // namespace cleanroom::cli
