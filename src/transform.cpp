#include "cleanroom/transform.hpp"

#include "cleanroom/errors.hpp"
#include "cleanroom/fs.hpp"
#include "cleanroom/markers.hpp"
#include "cleanroom/scrub.hpp"
#include "cleanroom/snapshot.hpp"

#include <filesystem>

namespace stdfs = std::filesystem;
namespace cfs = cleanroom::fs;

namespace {

struct LoadedFile {
  std::string path; // repo-relative
  std::string content; // file bytes, or the target of a symlink
  bool binary = false;
  bool link = false;
  bool dirty = false;
};

std::vector<LoadedFile> load_files(const cleanroom::Snapshot &snap) {
  std::vector<LoadedFile> out;
  for (auto &rel : snap.files()) {
    const auto abs = snap.root() / rel;
    LoadedFile f;
    std::error_code ec;
    if (stdfs::is_symlink(stdfs::symlink_status(abs, ec))) {
      f.content = stdfs::read_symlink(abs, ec).string();
      if (ec)
        throw cleanroom::IoError("readlink failed: " + abs.string() + ": " + ec.message());
      f.link = true;
    } else {
      f.content = cfs::read_text(abs);
      f.binary = cfs::is_binary(f.content);
    }
    f.path = std::move(rel);
    out.push_back(std::move(f));
  }
  return out;
}

// Recreate a symlink pointing at `target`.
void relink(const stdfs::path &abs, const std::string &target) {
  std::error_code ec;
  stdfs::remove(abs, ec);
  if (!ec)
    stdfs::create_symlink(target, abs, ec);
  if (ec)
    throw cleanroom::IoError("relink failed: " + abs.string() + ": " + ec.message());
}

} // namespace

namespace cleanroom {

std::vector<std::string> TransformReport::warnings() const {
  std::vector<std::string> out;
  for (const auto &m : markers) {
    if (m.unmatched_starts > 0)
      out.push_back("unmatched start marker left in " + m.path);
  }
  for (const auto &r : rules) {
    if (r.files_matched == 0)
      out.push_back("scrub rule '" + r.find + "' never matched");
  }
  for (const auto &r : resets) {
    if (r.status == ResetStatus::NoTemplate)
      out.push_back("no template defined for " + r.path + " - skipped");
    else if (r.status == ResetStatus::NotFound)
      out.push_back(r.path + " not found in tracked files - skipped");
  }
  return out;
}

Transformer::Transformer(const PublishConfig &config, TemplateCatalog catalog)
    : config_(config), catalog_(std::move(catalog)) {
  for (const auto &[name, body] : config_.templates)
    catalog_.set(name, body);
}

TransformReport Transformer::run(const Snapshot &snapshot) const {
  TransformReport report;
  auto files = load_files(snapshot);

  // Pass A: marker regions
  for (auto &f : files) {
    if (f.binary || f.link)
      continue;
    auto res = markers::strip_all(f.content, config_.markers);
    if (res.regions_removed == 0 && res.unmatched_starts == 0)
      continue;
    report.markers.push_back(MarkerFileReport{.path = f.path,
                                              .regions_removed = res.regions_removed,
                                              .unmatched_starts = res.unmatched_starts});
    if (res.regions_removed > 0) {
      f.content = std::move(res.text);
      f.dirty = true;
    }
  }

  // Pass B: scrub rules, strictly in configured order
  for (const auto &rule : config_.scrub_rules) {
    RuleReport rr{.find = rule.find, .replace = rule.replace};
    for (const auto &f : files) {
      if (f.content.find(rule.find) != std::string::npos)
        ++rr.files_matched;
    }
    if (rr.files_matched > 0) {
      for (auto &f : files) {
        if (f.binary)
          continue;
        if (scrub::replace_literal(f.content, rule.find, rule.replace) > 0) {
          f.dirty = true;
          ++rr.files_changed;
        }
      }
    }
    report.rules.push_back(std::move(rr));
  }

  // Link targets are scrubbed like text so the published link carries no private term.
  for (const auto &f : files) {
    if (!f.dirty)
      continue;
    if (f.link)
      relink(snapshot.root() / f.path, f.content);
    else
      cfs::overwrite_text(snapshot.root() / f.path, f.content);
  }

  // Pass C: template reset, authoritative for the files it touches
  for (const auto &rel : config_.reset_to_templates) {
    const auto abs = snapshot.root() / checked_relative(rel);
    ResetReport rr{.path = rel, .status = ResetStatus::NotFound};
    std::error_code ec;
    if (stdfs::is_regular_file(stdfs::symlink_status(abs, ec))) {
      if (const auto body = catalog_.find(abs.filename().string())) {
        cfs::overwrite_text(abs, *body);
        rr.status = ResetStatus::Reset;
      } else {
        rr.status = ResetStatus::NoTemplate;
      }
    }
    report.resets.push_back(std::move(rr));
  }
  return report;
}

} // namespace cleanroom
