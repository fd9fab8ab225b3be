#include "cleanroom/validate.hpp"

#include "cleanroom/consts.hpp"
#include "cleanroom/errors.hpp"
#include "cleanroom/fs.hpp"

#include <algorithm>
#include <set>

namespace stdfs = std::filesystem;

namespace {

struct ScannedFile {
  std::string path;
  std::string content;
};

struct Term {
  std::string text;
  cleanroom::TermOrigin origin;
};

std::vector<ScannedFile> read_tree(const stdfs::path &root) {
  std::vector<ScannedFile> out;
  for (auto it = stdfs::recursive_directory_iterator(root);
       it != stdfs::recursive_directory_iterator(); ++it) {
    if (it.depth() == 0 && it->path().filename() == stdfs::path(cleanroom::consts::kGitDir)) {
      it.disable_recursion_pending();
      continue;
    }
    // A published symlink is a blob holding its target, so the target text is scanned.
    std::string content;
    if (it->is_symlink()) {
      std::error_code ec;
      content = stdfs::read_symlink(it->path(), ec).string();
      if (ec)
        throw cleanroom::IoError("readlink failed: " + it->path().string() + ": " + ec.message());
    } else if (it->is_regular_file()) {
      content = cleanroom::fs::read_text(it->path());
    } else {
      continue;
    }
    out.push_back(ScannedFile{.path = stdfs::relative(it->path(), root).generic_string(),
                              .content = std::move(content)});
  }
  std::ranges::sort(out, [](const ScannedFile &a, const ScannedFile &b) { return a.path < b.path; });
  return out;
}

std::vector<Term> collect_terms(const cleanroom::PublishConfig &cfg) {
  std::vector<Term> terms;
  std::set<std::pair<std::string, cleanroom::TermOrigin>> seen;
  const auto add = [&](const std::string &t, cleanroom::TermOrigin o) {
    if (!t.empty() && seen.emplace(t, o).second)
      terms.push_back(Term{.text = t, .origin = o});
  };
  for (const auto &r : cfg.scrub_rules)
    add(r.find, cleanroom::TermOrigin::ScrubRule);
  for (const auto &b : cfg.validation_blocklist)
    add(b, cleanroom::TermOrigin::Blocklist);
  for (const auto &m : cfg.markers) {
    add(m.start, cleanroom::TermOrigin::Marker);
    add(m.end, cleanroom::TermOrigin::Marker);
  }
  return terms;
}

// One finding per line on which an occurrence of the term starts.
void scan_file(const ScannedFile &file, const Term &term, cleanroom::ValidationResult &out) {
  const std::string_view text{file.content};
  std::size_t captured = 0;
  std::size_t line_no = 1;
  std::size_t line_start = 0;
  std::size_t scanned = 0; // newlines counted up to here
  std::size_t last_line = 0;
  for (auto pos = text.find(term.text); pos != std::string_view::npos;
       pos = text.find(term.text, pos + term.text.size())) {
    for (; scanned < pos; ++scanned) {
      if (text[scanned] == '\n') {
        ++line_no;
        line_start = scanned + 1;
      }
    }
    if (line_no == last_line)
      continue;
    last_line = line_no;
    if (captured == cleanroom::consts::kMaxFindingsPerFile) {
      ++out.suppressed;
      continue;
    }
    const std::size_t nl = text.find('\n', line_start);
    std::string shown(text.substr(line_start, nl == std::string_view::npos ? std::string_view::npos
                                                                          : nl - line_start));
    while (!shown.empty() && shown.back() == '\r')
      shown.pop_back();
    out.findings.push_back(cleanroom::ValidationFinding{.term = term.text,
                                                        .origin = term.origin,
                                                        .file = file.path,
                                                        .line_number = line_no,
                                                        .line_text = std::move(shown)});
    ++captured;
  }
}

} // namespace

namespace cleanroom {

const char *to_string(TermOrigin origin) {
  switch (origin) {
  case TermOrigin::ScrubRule:
    return "scrub rule";
  case TermOrigin::Blocklist:
    return "blocklist";
  case TermOrigin::Marker:
    return "marker";
  }
  return "unknown";
}

ValidationResult validate(const stdfs::path &snapshot_root, const PublishConfig &config) {
  ValidationResult result;
  const auto files = read_tree(snapshot_root);
  for (const auto &term : collect_terms(config)) {
    for (const auto &file : files)
      scan_file(file, term, result);
  }
  return result;
}

} // namespace cleanroom
