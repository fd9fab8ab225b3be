#include "cleanroom/errors.hpp"
#include "cleanroom/fs.hpp"
#include "cleanroom/snapshot.hpp"

#include <filesystem>
#include <fstream>
#include <iostream>
#include <random>
#include <stdlib.h>
#include <string>

namespace fs = std::filesystem;

static void write_file(const fs::path &p, std::string_view s) {
  fs::create_directories(p.parent_path());
  std::ofstream(p, std::ios::binary) << s;
}

static std::string slurp(const fs::path &p) {
  std::ifstream ifs(p, std::ios::binary);
  return std::string{std::istreambuf_iterator<char>(ifs), std::istreambuf_iterator<char>()};
}

static int run(const fs::path &src) {
  write_file(src / "README.md", "hello\n");
  write_file(src / "src/app.cpp", "int main() {}\n");
  write_file(src / "docs/private/plan.md", "Acme Corp plan\n");
  write_file(src / "docs/public.md", "public\n");
  write_file(src / "untracked.txt", "never copied\n");
  const std::string bin("\x89PNG\0\x01\x02", 7);
  write_file(src / "img/logo.png", bin);
  fs::permissions(src / "src/app.cpp", fs::perms::owner_exec, fs::perm_options::add);

  const std::vector<std::string> tracked{"README.md", "src/app.cpp", "docs/private/plan.md",
                                         "docs/public.md", "img/logo.png"};

  fs::path kept_root;
  {
    auto snap = cleanroom::Snapshot::create(src, tracked, {"docs/private", "nope/missing.md"});
    kept_root = snap.root();
    if (!fs::is_directory(kept_root) || kept_root.string().find(src.string()) == 0) {
      std::cerr << "snapshot root should be a fresh temp directory\n";
      return 1;
    }
    if (snap.copied_count() != tracked.size()) {
      std::cerr << "expected every tracked file copied\n";
      return 1;
    }
    // File set = tracked - excluded; untracked files never appear
    const std::vector<std::string> want{"README.md", "docs/public.md", "img/logo.png",
                                        "src/app.cpp"};
    if (snap.files() != want) {
      std::cerr << "unexpected snapshot file set:\n";
      for (const auto &f : snap.files())
        std::cerr << "  " << f << "\n";
      return 1;
    }
    if (fs::exists(kept_root / "docs/private")) {
      std::cerr << "excluded directory still present\n";
      return 1;
    }
    const auto &notes = snap.exclusions();
    if (notes.size() != 2 || !notes[0].removed || notes[1].removed ||
        notes[1].path != "nope/missing.md") {
      std::cerr << "exclusion notes wrong\n";
      return 1;
    }
    // Byte-identical copies, exec bit kept
    if (slurp(kept_root / "img/logo.png") != bin || slurp(kept_root / "README.md") != "hello\n") {
      std::cerr << "copy not byte-identical\n";
      return 1;
    }
    if (!cleanroom::fs::is_executable(kept_root / "src/app.cpp")) {
      std::cerr << "executable bit lost\n";
      return 1;
    }
    // Moving keeps a single owner
    auto moved = std::move(snap);
    if (moved.root() != kept_root || !snap.root().empty()) {
      std::cerr << "move did not transfer ownership\n";
      return 1;
    }
  }
  if (fs::exists(kept_root)) {
    std::cerr << "snapshot directory not removed on scope exit\n";
    return 1;
  }

  // Two snapshots at once never share a root
  {
    auto a = cleanroom::Snapshot::create(src, {"README.md"}, {});
    auto b = cleanroom::Snapshot::create(src, {"README.md"}, {});
    if (a.root() == b.root()) {
      std::cerr << "concurrent snapshots share a root\n";
      return 1;
    }
  }

  // Removed when an exception unwinds through the owner
  try {
    auto snap = cleanroom::Snapshot::create(src, {"README.md"}, {});
    kept_root = snap.root();
    throw std::runtime_error("boom");
  } catch (const std::runtime_error &) {
  }
  if (fs::exists(kept_root)) {
    std::cerr << "snapshot directory leaked through exception\n";
    return 1;
  }

  // Empty tracked set is a configuration error
  {
    bool threw = false;
    try {
      (void)cleanroom::Snapshot::create(src, {}, {});
    } catch (const cleanroom::ConfigError &) {
      threw = true;
    }
    if (!threw) {
      std::cerr << "empty tracked set should be ConfigError\n";
      return 1;
    }
  }

  // Exclude paths must stay inside the root
  for (const std::string bad : {"../etc", "/etc", "docs/../../x"}) {
    bool threw = false;
    try {
      (void)cleanroom::Snapshot::create(src, {"README.md"}, {bad});
    } catch (const cleanroom::ConfigError &) {
      threw = true;
    }
    if (!threw) {
      std::cerr << "exclude path should be rejected: " << bad << "\n";
      return 1;
    }
  }

  // A missing tracked file aborts with IoError and leaves no temp directory behind
  {
    // Private TMPDIR so other runs cannot disturb the count
    const auto tmp = src.parent_path() / (src.filename().string() + "_tmp");
    fs::create_directories(tmp);
    ::setenv("TMPDIR", tmp.c_str(), 1);
    auto count_snapshots = [&] {
      std::size_t n = 0;
      for (const auto &e : fs::directory_iterator(tmp))
        if (e.path().filename().string().rfind("cleanroom-", 0) == 0)
          ++n;
      return n;
    };
    const auto before = count_snapshots();
    bool threw = false;
    try {
      (void)cleanroom::Snapshot::create(src, {"README.md", "gone.txt"}, {});
    } catch (const cleanroom::IoError &) {
      threw = true;
    }
    if (!threw) {
      std::cerr << "missing tracked file should be IoError\n";
      return 1;
    }
    const auto after = count_snapshots();
    ::unsetenv("TMPDIR");
    std::error_code ec;
    fs::remove_all(tmp, ec);
    if (after != before || before != 0) {
      std::cerr << "partial snapshot left behind\n";
      return 1;
    }
  }
  return 0;
}

int main() {
  const fs::path src =
      fs::temp_directory_path() / ("cleanroom_snapshot_" + std::to_string(std::random_device{}()));
  fs::create_directories(src);
  int rc = 1;
  try {
    rc = run(src);
  } catch (const std::exception &e) {
    std::cerr << "exception: " << e.what() << "\n";
  }
  std::error_code ec;
  fs::remove_all(src, ec);
  if (rc == 0)
    std::cout << "OK\n";
  return rc;
}
