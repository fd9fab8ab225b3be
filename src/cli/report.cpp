#include "cli/report.hpp"

#include "cli/context.hpp"

#include <ostream>
#include <string>

namespace cleanroom::cli {

void print_header(std::ostream &os, const Context &ctx, const char *mode) {
  const auto &c = ctx.config;
  os << "=== cleanroom ===\n";
  os << "Remote: " << c.remote << " / " << c.branch << "\n";
  os << "Remote URL: " << ctx.remote_url << "\n";
  os << "Scrub rules: " << c.scrub_rules.size() << "\n";
  os << "Paths to exclude: " << c.exclude_paths.size() << "\n";
  os << "Files to reset: " << c.reset_to_templates.size() << "\n";
  os << "Blocklist terms: " << c.validation_blocklist.size() << "\n";
  os << "Mode: " << mode << "\n\n";
}

void print_snapshot(std::ostream &os, std::size_t copied, const std::vector<ExclusionNote> &notes) {
  os << "--- Copying tracked files ---\n";
  os << "Copied " << copied << " files\n\n";
  if (notes.empty())
    return;
  os << "--- Removing excluded paths ---\n";
  for (const auto &n : notes) {
    if (n.removed)
      os << "  Removed: " << n.path << "\n";
    else
      os << "  Not found (skipping): " << n.path << "\n";
  }
  os << "\n";
}

void print_transform(std::ostream &os, const TransformReport &report) {
  os << "--- Stripping marker regions ---\n";
  std::size_t stripped = 0;
  for (const auto &m : report.markers) {
    if (m.regions_removed == 0)
      continue;
    os << "  Stripped: " << m.path << " (" << m.regions_removed << " regions)\n";
    ++stripped;
  }
  os << "  " << stripped << " files had marker regions stripped\n\n";

  os << "--- Applying scrub rules ---\n";
  for (const auto &r : report.rules) {
    os << "  Rule: '" << r.find << "' -> '" << r.replace << "' ";
    if (r.files_matched == 0)
      os << "(no matches)\n";
    else
      os << "(" << r.files_matched << " files, " << r.files_changed << " rewritten)\n";
  }
  os << "\n";

  if (!report.resets.empty()) {
    os << "--- Resetting template files ---\n";
    for (const auto &r : report.resets) {
      if (r.status == ResetStatus::Reset)
        os << "  Reset: " << r.path << "\n";
    }
    os << "\n";
  }

  const auto warnings = report.warnings();
  if (!warnings.empty()) {
    for (const auto &w : warnings)
      os << "  Warning: " << w << "\n";
    os << "\n";
  }
}

void print_validation(std::ostream &os, const ValidationResult &result) {
  os << "--- Validation pass ---\n";
  if (result.passed()) {
    os << "  All scrub rules, blocklist terms and markers validated - none found\n\n";
    return;
  }
  // Group by term, then file, keeping discovery order.
  const ValidationFinding *prev = nullptr;
  std::string last_file;
  for (const auto &f : result.findings) {
    if (!prev || f.term != prev->term || f.origin != prev->origin) {
      os << "  FAIL: " << to_string(f.origin) << " term '" << f.term << "' found in:\n";
      last_file.clear();
    }
    if (f.file != last_file) {
      os << "    " << f.file << ":\n";
      last_file = f.file;
    }
    os << "      " << f.line_number << ":" << f.line_text << "\n";
    prev = &f;
  }
  if (result.suppressed > 0)
    os << "  (" << result.suppressed << " more matching lines not shown)\n";
  os << "\n";
}

void print_diff(std::ostream &os, const DiffReport &report) {
  os << "=== Diff preview ===\n\n";
  if (report.empty()) {
    os << "(No differences - local files already match sanitized output)\n\n";
    return;
  }
  for (const auto &e : report.entries) {
    os << "--- " << e.path << (e.kind == DiffKind::Deleted ? " (removed) ---\n" : " ---\n");
    os << e.text << "\n";
  }
}

} // namespace cleanroom::cli
