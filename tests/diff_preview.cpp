#include "cleanroom/config.hpp"
#include "cleanroom/diff.hpp"
#include "cleanroom/pipeline.hpp"
#include "cleanroom/snapshot.hpp"

#include <filesystem>
#include <fstream>
#include <iostream>
#include <random>
#include <string>

namespace fs = std::filesystem;
using cleanroom::diff::split_lines;
using cleanroom::diff::unified_diff;

static void write_file(const fs::path &p, std::string_view s) {
  fs::create_directories(p.parent_path());
  std::ofstream(p, std::ios::binary) << s;
}

static std::size_t count(std::string_view hay, std::string_view needle) {
  std::size_t n = 0;
  for (auto pos = hay.find(needle); pos != std::string_view::npos;
       pos = hay.find(needle, pos + needle.size()))
    ++n;
  return n;
}

static int diff_basics() {
  const char *A = "line1\nline2\nline3\n";
  const char *B = "line1\nlineZ\nline3\nline4\n";
  auto ud = unified_diff(split_lines(A), split_lines(B), "demo.txt");
  if (ud.find("--- a/demo.txt\n+++ b/demo.txt\n") != 0) {
    std::cerr << "missing headers\n";
    return 1;
  }
  if (ud.find("\n-line2\n") == std::string::npos || ud.find("\n+lineZ\n") == std::string::npos ||
      ud.find("\n+line4\n") == std::string::npos || ud.find("\n line1\n") == std::string::npos) {
    std::cerr << "missing edits:\n" << ud;
    return 1;
  }
  if (ud.find("@@ -1,3 +1,4 @@\n") == std::string::npos) {
    std::cerr << "bad hunk header:\n" << ud;
    return 1;
  }

  if (!unified_diff(split_lines(A), split_lines(A), "same.txt").empty()) {
    std::cerr << "equal inputs should give an empty diff\n";
    return 1;
  }

  // One change in the middle of ten lines: three lines of context either side
  std::vector<std::string> ten, changed;
  for (int i = 1; i <= 10; ++i)
    ten.push_back("l" + std::to_string(i));
  changed = ten;
  changed[4] = "X";
  ud = unified_diff(ten, changed, "ten.txt");
  if (ud.find("@@ -2,7 +2,7 @@\n") == std::string::npos || ud.find(" l1\n") != std::string::npos ||
      ud.find(" l9\n") != std::string::npos) {
    std::cerr << "context window wrong:\n" << ud;
    return 1;
  }

  // Changes far apart land in separate hunks
  std::vector<std::string> twenty, edited;
  for (int i = 1; i <= 20; ++i)
    twenty.push_back("r" + std::to_string(i));
  edited = twenty;
  edited[1] = "first";
  edited[18] = "second";
  ud = unified_diff(twenty, edited, "far.txt");
  if (count(ud, "@@ -") != 2 || ud.find("@@ -1,5 +1,5 @@\n") == std::string::npos ||
      ud.find("@@ -16,5 +16,5 @@\n") == std::string::npos) {
    std::cerr << "expected two hunks:\n" << ud;
    return 1;
  }

  // Empty old side
  ud = unified_diff({}, split_lines("new\n"), "added.txt");
  if (ud.find("@@ -0,0 +1,1 @@\n+new\n") == std::string::npos) {
    std::cerr << "addition to empty file wrong:\n" << ud;
    return 1;
  }
  return 0;
}

static int preview_report(const fs::path &src) {
  write_file(src / "keep.md", "same\n");
  write_file(src / "edit.md", "hello Acme Corp\n");
  write_file(src / "private/plan.md", "secret plan\n");
  const std::string png("\x89PNG\0data", 9);
  write_file(src / "logo.png", png);
  const std::vector<std::string> tracked{"keep.md", "edit.md", "private/plan.md", "logo.png"};

  auto snap = cleanroom::Snapshot::create(src, tracked, {"private"});
  write_file(snap.root() / "edit.md", "hello Example Org\n");
  write_file(snap.root() / "logo.png", std::string("\x89PNG\0other", 10));

  const auto report = cleanroom::render_preview(src, tracked, snap);
  if (report.entries.size() != 3) {
    std::cerr << "expected 3 entries, got " << report.entries.size() << "\n";
    return 1;
  }
  const auto &edit = report.entries[0];
  if (edit.path != "edit.md" || edit.kind != cleanroom::DiffKind::Modified ||
      edit.text.find("-hello Acme Corp\n+hello Example Org\n") == std::string::npos) {
    std::cerr << "edit.md entry wrong:\n" << edit.text;
    return 1;
  }
  const auto &del = report.entries[1];
  if (del.path != "private/plan.md" || del.kind != cleanroom::DiffKind::Deleted) {
    std::cerr << "excluded file should be reported deleted\n";
    return 1;
  }
  const auto &bin = report.entries[2];
  if (bin.text != "Binary files a/logo.png and b/logo.png differ\n") {
    std::cerr << "binary note wrong: " << bin.text;
    return 1;
  }

  // Retargeted symlinks show both targets
  fs::create_symlink("/srv/Acme Corp", src / "share");
  auto linked = cleanroom::Snapshot::create(src, {"share"}, {});
  fs::remove(linked.root() / "share");
  fs::create_symlink("/srv/Example Org", linked.root() / "share");
  const auto link_report = cleanroom::render_preview(src, {"share"}, linked);
  if (link_report.entries.size() != 1 ||
      link_report.entries[0].text != "symlink share: /srv/Acme Corp -> /srv/Example Org\n") {
    std::cerr << "symlink change not reported\n";
    return 1;
  }
  return 0;
}

static int preview_despite_findings(const fs::path &src) {
  write_file(src / "repo/notes.md", "ship it\nask internal-only channel\n");
  write_file(src / "repo/about.md", "Acme Corp\n");
  auto cfg = cleanroom::parse_config(R"({
    "remote": "public", "branch": "main",
    "scrub_rules": [{"find": "Acme Corp", "replace": "Example Org"}],
    "validation_blocklist": ["internal-only"]
  })");
  cleanroom::Pipeline pipeline(src / "repo", cfg, {"notes.md", "about.md"});
  const auto res = pipeline.preview();
  if (res.validation.passed() || res.validation.findings.size() != 1) {
    std::cerr << "preview should carry the validation failure\n";
    return 1;
  }
  if (res.diff.entries.size() != 1 || res.diff.entries[0].path != "about.md") {
    std::cerr << "preview diff incomplete\n";
    return 1;
  }
  if (res.files_copied != 2 || fs::exists(src / "repo/.git")) {
    std::cerr << "preview touched the source repository\n";
    return 1;
  }
  return 0;
}

int main() {
  if (diff_basics() != 0)
    return 1;
  const fs::path src =
      fs::temp_directory_path() / ("cleanroom_diff_" + std::to_string(std::random_device{}()));
  fs::create_directories(src);
  int rc = 1;
  try {
    rc = preview_report(src);
    if (rc == 0)
      rc = preview_despite_findings(src);
  } catch (const std::exception &e) {
    std::cerr << "exception: " << e.what() << "\n";
  }
  std::error_code ec;
  fs::remove_all(src, ec);
  if (rc == 0)
    std::cout << "OK\n";
  return rc;
}
