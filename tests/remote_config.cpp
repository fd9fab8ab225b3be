#include "cleanroom/errors.hpp"
#include "cleanroom/process.hpp"
#include "cleanroom/source_repo.hpp"
#include "cleanroom/transport.hpp"

#include <filesystem>
#include <iostream>
#include <random>
#include <string>
#include <vector>

namespace fs = std::filesystem;

static bool git(const std::vector<std::string> &args, const fs::path &cwd) {
  std::vector<std::string> argv{"git"};
  argv.insert(argv.end(), args.begin(), args.end());
  return cleanroom::process::run(argv, cwd).exit_code == 0;
}

static bool rejects(const fs::path &repo, const std::string &name) {
  try {
    (void)cleanroom::resolve_remote_url(repo, name);
  } catch (const cleanroom::ConfigError &) {
    return true;
  }
  return false;
}

static int run(const fs::path &repo) {
  // Not a repository at all
  if (!rejects(repo, "origin")) {
    std::cerr << "non-repository should be ConfigError\n";
    return 1;
  }

  if (!git({"init", "-q"}, repo) ||
      !git({"remote", "add", "origin", "git@internal.example:team/private.git"}, repo) ||
      !git({"remote", "add", "public", "https://example.org/open/tool.git"}, repo)) {
    std::cerr << "git setup failed\n";
    return 1;
  }
  if (cleanroom::resolve_remote_url(repo, "origin") != "git@internal.example:team/private.git") {
    std::cerr << "origin url wrong\n";
    return 1;
  }
  if (cleanroom::resolve_remote_url(repo, "public") != "https://example.org/open/tool.git") {
    std::cerr << "public url wrong\n";
    return 1;
  }
  if (!rejects(repo, "main")) {
    std::cerr << "unknown remote should be ConfigError\n";
    return 1;
  }

  // .git as a gitdir file, the layout of linked worktrees and submodule checkouts
  {
    const fs::path linked = repo / "linked";
    if (!git({"init", "-q", "--separate-git-dir=" + (repo / "linked-gitdir").string(),
              linked.string()},
             repo) ||
        !git({"remote", "add", "public", "https://example.org/open/linked.git"}, linked)) {
      std::cerr << "git setup failed\n";
      return 1;
    }
    if (!fs::is_regular_file(linked / ".git") ||
        cleanroom::resolve_remote_url(linked, "public") != "https://example.org/open/linked.git") {
      std::cerr << "gitdir-file repository not resolved\n";
      return 1;
    }
  }

  // Transport selection
  fs::create_directories(repo / "mirror.git");
  {
    const auto t = cleanroom::make_transport("https://example.org/open/tool.git", repo);
    if (!dynamic_cast<cleanroom::GitCliTransport *>(t.get()) ||
        t->describe() != "https://example.org/open/tool.git") {
      std::cerr << "network url should go through git\n";
      return 1;
    }
  }
  {
    const auto t = cleanroom::make_transport("file://" + (repo / "mirror.git").string(), repo);
    if (!dynamic_cast<cleanroom::LocalTransport *>(t.get()) ||
        t->describe() != (repo / "mirror.git").string()) {
      std::cerr << "file:// url should be local\n";
      return 1;
    }
  }
  {
    const auto t = cleanroom::make_transport("mirror.git", repo);
    if (!dynamic_cast<cleanroom::LocalTransport *>(t.get())) {
      std::cerr << "relative directory should resolve against the repository\n";
      return 1;
    }
  }
  return 0;
}

int main() {
  const fs::path repo =
      fs::temp_directory_path() / ("cleanroom_remote_" + std::to_string(std::random_device{}()));
  fs::create_directories(repo);
  int rc = 1;
  try {
    rc = run(repo);
  } catch (const std::exception &e) {
    std::cerr << "exception: " << e.what() << "\n";
  }
  std::error_code ec;
  fs::remove_all(repo, ec);
  if (rc == 0)
    std::cout << "OK\n";
  return rc;
}
