#include "cleanroom/config.hpp"
#include "cleanroom/snapshot.hpp"
#include "cleanroom/templates.hpp"
#include "cleanroom/transform.hpp"
#include "cleanroom/util.hpp"

#include <filesystem>
#include <fstream>
#include <iostream>
#include <random>
#include <string>

namespace fs = std::filesystem;
using cleanroom::strutil::count_occurrences;

static void write_file(const fs::path &p, std::string_view s) {
  fs::create_directories(p.parent_path());
  std::ofstream(p, std::ios::binary) << s;
}

static std::string slurp(const fs::path &p) {
  std::ifstream ifs(p, std::ios::binary);
  return std::string{std::istreambuf_iterator<char>(ifs), std::istreambuf_iterator<char>()};
}

static bool has_warning(const cleanroom::TransformReport &r, std::string_view needle) {
  for (const auto &w : r.warnings())
    if (w.find(needle) != std::string::npos)
      return true;
  return false;
}

static int run(const fs::path &src) {
  const auto cfg = cleanroom::parse_config(R"({
    "remote": "public", "branch": "main",
    "scrub_rules": [
      {"find": "Acme Corp", "replace": "Example Org"},
      {"find": "Initech", "replace": "Placeholder"}
    ],
    "exclude_paths": ["clients"],
    "reset_to_templates": ["WORKLOG.md", "README.md", "missing/NOTES.md"]
  })");

  write_file(src / "about.md", "Built by Acme Corp.\nSupport: Acme Corp team\n");
  write_file(src / "guide.md", "intro\n"
                               "<!-- BUSINESS:START -->\n"
                               "Pricing for Acme Corp partners\n"
                               "<!-- BUSINESS:END -->\n"
                               "Maintained by Acme Corp\n");
  write_file(src / "WORKLOG.md", "# Work Log\n\n## 2024-05-01\n- called the Globex lead\n");
  write_file(src / "README.md", "# Project\n");
  write_file(src / "clients/acme/contract.md", "Acme Corp contract terms\n");
  write_file(src / "blob.bin", std::string("Acme Corp\0\x01\x02", 12));
  write_file(src / "loose.md", "<!-- BUSINESS:START -->\nnever closed\n");

  const std::vector<std::string> tracked{"about.md",   "guide.md",  "WORKLOG.md",
                                         "README.md",  "blob.bin",  "loose.md",
                                         "clients/acme/contract.md"};

  auto snap = cleanroom::Snapshot::create(src, tracked, cfg.exclude_paths);
  cleanroom::Transformer transformer(cfg, cleanroom::TemplateCatalog::builtin());
  const auto report = transformer.run(snap);

  // Every occurrence replaced, nothing left behind
  {
    const auto about = slurp(snap.root() / "about.md");
    if (count_occurrences(about, "Acme Corp") != 0 || count_occurrences(about, "Example Org") != 2) {
      std::cerr << "about.md not scrubbed:\n" << about;
      return 1;
    }
  }

  // Marker region removed first, the remaining mention scrubbed
  {
    const auto guide = slurp(snap.root() / "guide.md");
    if (guide != "intro\nMaintained by Example Org\n") {
      std::cerr << "guide.md unexpected:\n" << guide;
      return 1;
    }
  }

  // Reset wins even though nothing in the file matched a rule
  {
    const auto want = cleanroom::TemplateCatalog::builtin().find("WORKLOG.md");
    if (!want || slurp(snap.root() / "WORKLOG.md") != *want) {
      std::cerr << "WORKLOG.md not reset to the template\n";
      return 1;
    }
  }

  // Excluded directory leaves no trace
  if (fs::exists(snap.root() / "clients")) {
    std::cerr << "excluded directory still in snapshot\n";
    return 1;
  }
  for (const auto &f : snap.files()) {
    if (f.rfind("clients", 0) == 0) {
      std::cerr << "excluded file listed: " << f << "\n";
      return 1;
    }
  }

  // Binary files are never rewritten
  if (slurp(snap.root() / "blob.bin") != std::string("Acme Corp\0\x01\x02", 12)) {
    std::cerr << "binary file was modified\n";
    return 1;
  }

  // Unmatched start marker left untouched and reported
  if (slurp(snap.root() / "loose.md") != "<!-- BUSINESS:START -->\nnever closed\n" ||
      !has_warning(report, "unmatched start marker left in loose.md")) {
    std::cerr << "unmatched marker handling wrong\n";
    return 1;
  }

  // Per-rule accounting: the binary file counts as matched, not as changed
  if (report.rules.size() != 2 || report.rules[0].files_matched != 3 ||
      report.rules[0].files_changed != 2) {
    std::cerr << "rule report wrong\n";
    return 1;
  }
  if (report.rules[1].files_matched != 0 || !has_warning(report, "'Initech' never matched")) {
    std::cerr << "never-matched rule not reported\n";
    return 1;
  }

  // Reset outcomes: reset, no template, not found
  if (report.resets.size() != 3 || report.resets[0].status != cleanroom::ResetStatus::Reset ||
      report.resets[1].status != cleanroom::ResetStatus::NoTemplate ||
      report.resets[2].status != cleanroom::ResetStatus::NotFound) {
    std::cerr << "reset report wrong\n";
    return 1;
  }
  if (!has_warning(report, "no template defined for README.md") ||
      !has_warning(report, "missing/NOTES.md not found")) {
    std::cerr << "reset warnings missing\n";
    return 1;
  }
  if (slurp(snap.root() / "README.md") != "# Project\n") {
    std::cerr << "README.md should be untouched without a template\n";
    return 1;
  }

  // Same input, same configuration: byte-identical output
  {
    auto again = cleanroom::Snapshot::create(src, tracked, cfg.exclude_paths);
    (void)transformer.run(again);
    if (again.files() != snap.files()) {
      std::cerr << "second run produced a different file set\n";
      return 1;
    }
    for (const auto &f : snap.files()) {
      if (slurp(again.root() / f) != slurp(snap.root() / f)) {
        std::cerr << "second run differs in " << f << "\n";
        return 1;
      }
    }
  }

  // Rules apply in order against the output of earlier rules
  {
    const auto chained = cleanroom::parse_config(R"({
      "remote": "public", "branch": "main",
      "scrub_rules": [
        {"find": "alpha", "replace": "beta"},
        {"find": "beta", "replace": "gamma"}
      ]
    })");
    fs::path src2 = src / "chained";
    write_file(src2 / "x.txt", "alpha beta\n");
    auto s2 = cleanroom::Snapshot::create(src2, {"x.txt"}, {});
    (void)cleanroom::Transformer(chained, cleanroom::TemplateCatalog::builtin()).run(s2);
    if (slurp(s2.root() / "x.txt") != "gamma gamma\n") {
      std::cerr << "rule order not honoured\n";
      return 1;
    }
  }

  // Config templates override the built-in catalog
  {
    const auto custom = cleanroom::parse_config(R"({
      "remote": "public", "branch": "main",
      "scrub_rules": [],
      "reset_to_templates": ["WORKLOG.md"],
      "templates": {"WORKLOG.md": "# Log\n"}
    })");
    auto s3 = cleanroom::Snapshot::create(src, {"WORKLOG.md"}, {});
    (void)cleanroom::Transformer(custom, cleanroom::TemplateCatalog::builtin()).run(s3);
    if (slurp(s3.root() / "WORKLOG.md") != "# Log\n") {
      std::cerr << "config template override ignored\n";
      return 1;
    }
  }
  // Rewrites never touch neighbouring files such as "<name>.tmp"
  {
    const fs::path src4 = src / "neighbours";
    write_file(src4 / "notes.md", "Acme Corp notes\n");
    write_file(src4 / "notes.md.tmp", "scratch kept in the repo\n");
    write_file(src4 / "WORKLOG.md", "# Work Log\n- private\n");
    write_file(src4 / "WORKLOG.md.tmp", "also tracked\n");
    const std::vector<std::string> paths{"notes.md", "notes.md.tmp", "WORKLOG.md",
                                         "WORKLOG.md.tmp"};
    auto s4 = cleanroom::Snapshot::create(src4, paths, {});
    const auto r4 =
        cleanroom::Transformer(cfg, cleanroom::TemplateCatalog::builtin()).run(s4);
    const std::vector<std::string> want{"WORKLOG.md", "WORKLOG.md.tmp", "notes.md",
                                        "notes.md.tmp"};
    if (s4.files() != want) {
      std::cerr << "transform changed the snapshot file set\n";
      return 1;
    }
    if (slurp(s4.root() / "notes.md") != "Example Org notes\n" ||
        slurp(s4.root() / "notes.md.tmp") != "scratch kept in the repo\n" ||
        slurp(s4.root() / "WORKLOG.md.tmp") != "also tracked\n" ||
        r4.resets.empty() || r4.resets[0].status != cleanroom::ResetStatus::Reset) {
      std::cerr << "neighbouring .tmp files were clobbered\n";
      return 1;
    }
  }

  // Symlink targets are published as blobs, so they are scrubbed too
  {
    const fs::path src5 = src / "links";
    write_file(src5 / "doc.md", "plain\n");
    fs::create_symlink("/srv/Acme Corp/share", src5 / "share");
    fs::create_symlink("doc.md", src5 / "alias.md");
    auto s5 = cleanroom::Snapshot::create(src5, {"doc.md", "share", "alias.md"}, {});
    const auto r5 =
        cleanroom::Transformer(cfg, cleanroom::TemplateCatalog::builtin()).run(s5);
    if (!fs::is_symlink(s5.root() / "share") ||
        fs::read_symlink(s5.root() / "share") != fs::path("/srv/Example Org/share")) {
      std::cerr << "symlink target not scrubbed\n";
      return 1;
    }
    if (fs::read_symlink(s5.root() / "alias.md") != fs::path("doc.md")) {
      std::cerr << "unrelated symlink changed\n";
      return 1;
    }
    if (r5.rules[0].files_matched != 1 || r5.rules[0].files_changed != 1) {
      std::cerr << "symlink rewrite not counted\n";
      return 1;
    }
    if (fs::read_symlink(src5 / "share") != fs::path("/srv/Acme Corp/share")) {
      std::cerr << "source symlink modified\n";
      return 1;
    }
  }
  return 0;
}

int main() {
  const fs::path src =
      fs::temp_directory_path() / ("cleanroom_transform_" + std::to_string(std::random_device{}()));
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
