#include "cleanroom/diff.hpp"

#include "cleanroom/errors.hpp"
#include "cleanroom/fs.hpp"
#include "cleanroom/snapshot.hpp"

#include <algorithm>
#include <sstream>

namespace stdfs = std::filesystem;

namespace cleanroom::diff {

std::vector<std::string> split_lines(std::string_view text) {
  std::vector<std::string> out;
  std::string cur;
  for (const char c : text) {
    if (c == '\n') {
      out.push_back(std::move(cur));
      cur.clear();
    } else if (c != '\r') {
      cur.push_back(c);
    }
  }
  if (!cur.empty()) {
    out.push_back(std::move(cur));
  }
  return out;
}

// Past this many edit layers the middle section is emitted as one delete+add block.
static constexpr int kMaxEditLayers = 4096;

// Myers O(ND) diff to produce ops: '=' keep, '-' del, '+' add.
static std::vector<char> myers_diff(const std::vector<std::string> &a,
                                    const std::vector<std::string> &b) {
  // Common prefix and suffix never need the search.
  std::size_t pre = 0;
  while (pre < a.size() && pre < b.size() && a[pre] == b[pre]) ++pre;
  std::size_t suf = 0;
  while (suf < a.size() - pre && suf < b.size() - pre &&
         a[a.size() - 1 - suf] == b[b.size() - 1 - suf]) ++suf;

  const int N = static_cast<int>(a.size() - pre - suf);
  const int M = static_cast<int>(b.size() - pre - suf);
  const auto A = [&](int i) -> const std::string & { return a[pre + i]; };
  const auto B = [&](int i) -> const std::string & { return b[pre + i]; };

  std::vector<char> mid;
  const int MAX = N + M;
  const int OFFSET = MAX + 1;
  std::vector<int> v(2 * MAX + 3, 0);
  // trace[d] holds v[-d..d] as it was before exploring layer d
  std::vector<std::vector<int>> trace;
  bool found = false;

  for (int d = 0; d <= MAX && d <= kMaxEditLayers && !found; ++d) {
    trace.emplace_back(v.begin() + OFFSET - d, v.begin() + OFFSET + d + 1);
    for (int k = -d; k <= d; k += 2) {
      int x;
      if (k == -d || (k != d && v[OFFSET + k - 1] < v[OFFSET + k + 1])) {
        x = v[OFFSET + k + 1];     // down (insertion)
      } else {
        x = v[OFFSET + k - 1] + 1; // right (deletion)
      }
      int y = x - k;
      while (x < N && y < M && A(x) == B(y)) { ++x; ++y; }
      v[OFFSET + k] = x;
      if (x >= N && y >= M) {
        found = true;
        break;
      }
    }
  }

  if (found) {
    std::vector<char> rev_ops;
    int cx = N, cy = M;
    for (int dd = static_cast<int>(trace.size()) - 1; dd > 0; --dd) {
      const auto &vv = trace[dd];
      const auto at = [&](int k) { return vv[k + dd]; };
      const int kk = cx - cy;
      const bool down = kk == -dd || (kk != dd && at(kk - 1) < at(kk + 1));
      const int prev_k = down ? kk + 1 : kk - 1;
      const int px = at(prev_k);
      const int py = px - prev_k;
      // the move lands on (px, py+1) going down, (px+1, py) going right; then a snake
      const int mx = down ? px : px + 1;
      while (cx > mx) { rev_ops.push_back('='); --cx; --cy; }
      rev_ops.push_back(down ? '+' : '-');
      cx = px;
      cy = py;
    }
    while (cx > 0) { rev_ops.push_back('='); --cx; --cy; }
    mid.assign(rev_ops.rbegin(), rev_ops.rend());
  } else {
    mid.assign(static_cast<std::size_t>(N), '-');
    mid.insert(mid.end(), static_cast<std::size_t>(M), '+');
  }

  std::vector<char> ops(pre, '=');
  ops.insert(ops.end(), mid.begin(), mid.end());
  ops.insert(ops.end(), suf, '=');
  return ops;
}

std::string unified_diff(const std::vector<std::string> &a, const std::vector<std::string> &b,
                         std::string_view path, std::size_t context) {
  const auto ops = myers_diff(a, b);
  if (std::ranges::all_of(ops, [](char op) { return op == '='; }))
    return {};

  // Positions (in a and b) before each op, so hunks can be cut anywhere.
  const std::size_t n = ops.size();
  std::vector<std::size_t> pos_a(n + 1, 0), pos_b(n + 1, 0);
  for (std::size_t i = 0; i < n; ++i) {
    pos_a[i + 1] = pos_a[i] + (ops[i] != '+' ? 1 : 0);
    pos_b[i + 1] = pos_b[i] + (ops[i] != '-' ? 1 : 0);
  }

  std::ostringstream out;
  out << "--- a/" << path << "\n";
  out << "+++ b/" << path << "\n";

  std::size_t i = 0;
  while (i < n) {
    if (ops[i] == '=') { ++i; continue; }
    // Hunk spans changes whose gap of unchanged lines is at most 2*context.
    const std::size_t first = i >= context ? i - context : 0;
    std::size_t last = i;
    std::size_t j = i;
    while (j < n) {
      if (ops[j] != '=') { last = j; ++j; continue; }
      std::size_t run = j;
      while (run < n && ops[run] == '=') ++run;
      if (run == n || run - j > 2 * context) break;
      j = run;
    }
    const std::size_t stop = std::min(n, last + 1 + context);

    const std::size_t len_a = pos_a[stop] - pos_a[first];
    const std::size_t len_b = pos_b[stop] - pos_b[first];
    out << "@@ -" << (len_a ? pos_a[first] + 1 : pos_a[first]) << "," << len_a << " +"
        << (len_b ? pos_b[first] + 1 : pos_b[first]) << "," << len_b << " @@\n";
    for (std::size_t k = first; k < stop; ++k) {
      if (ops[k] == '=') out << ' ' << a[pos_a[k]] << "\n";
      else if (ops[k] == '-') out << '-' << a[pos_a[k]] << "\n";
      else out << '+' << b[pos_b[k]] << "\n";
    }
    i = stop;
  }
  return out.str();
}

} // namespace cleanroom::diff

namespace cleanroom {

DiffReport render_preview(const stdfs::path &source_root,
                          const std::vector<std::string> &tracked_paths,
                          const Snapshot &snapshot) {
  DiffReport report;
  for (const auto &rel : tracked_paths) {
    const auto after_path = snapshot.root() / rel;
    std::error_code ec;
    if (!stdfs::exists(stdfs::symlink_status(after_path, ec))) {
      report.entries.push_back(DiffEntry{.path = rel, .kind = DiffKind::Deleted,
                                         .text = "deleted: " + rel + "\n"});
      continue;
    }
    if (stdfs::is_symlink(stdfs::symlink_status(after_path, ec))) {
      std::error_code ec_after;
      const auto before = stdfs::read_symlink(source_root / rel, ec).string();
      const auto after = stdfs::read_symlink(after_path, ec_after).string();
      if (ec || ec_after)
        throw IoError("readlink failed: " + rel);
      if (before != after)
        report.entries.push_back(DiffEntry{.path = rel, .kind = DiffKind::Modified,
                                           .text = "symlink " + rel + ": " + before + " -> " +
                                                   after + "\n"});
      continue;
    }
    const std::string before = fs::read_text(source_root / rel);
    const std::string after = fs::read_text(after_path);
    if (before == after)
      continue;
    std::string text;
    if (fs::is_binary(before) || fs::is_binary(after)) {
      text = "Binary files a/" + rel + " and b/" + rel + " differ\n";
    } else {
      text = diff::unified_diff(diff::split_lines(before), diff::split_lines(after), rel);
      if (text.empty()) // only line endings or a final newline changed
        text = "--- a/" + rel + "\n+++ b/" + rel + "\n(whitespace-only change)\n";
    }
    report.entries.push_back(DiffEntry{.path = rel, .kind = DiffKind::Modified,
                                       .text = std::move(text)});
  }
  return report;
}

} // namespace cleanroom
