#include "cleanroom/history.hpp"

#include "cleanroom/consts.hpp"
#include "cleanroom/errors.hpp"
#include "cleanroom/fs.hpp"
#include "cleanroom/object_store.hpp"
#include "cleanroom/refs.hpp"
#include "cleanroom/time.hpp"
#include "cleanroom/util.hpp"

#include <algorithm>
#include <array>
#include <cstdio>
#include <cstring>
#include <set>

namespace stdfs = std::filesystem;
namespace cfs   = cleanroom::fs;

namespace {

// git orders tree entries as if directory names carried a trailing '/'.
std::string sort_key(const cleanroom::TreeEntry &e) {
  return e.mode == cleanroom::consts::kModeTree ? e.name + "/" : e.name;
}

cleanroom::oid parse_oid(const std::string &hex) {
  cleanroom::oid id{};
  if (!cleanroom::from_hex(hex, id)) {
    throw cleanroom::PublishError("bad object id: " + hex);
  }
  return id;
}

} // namespace

namespace cleanroom {

GitDir::GitDir(stdfs::path path) : path_(std::move(path)) {}

auto GitDir::objects_dir() const -> stdfs::path { return path_ / consts::kObjectsDir; }

void GitDir::init(std::string_view branch, bool bare) const {
  if (cfs::exists(path_)) {
    throw PublishError("a git directory already exists at: " + path_.string());
  }
  std::error_code ec;
  stdfs::create_directories(objects_dir(), ec);
  if (ec) {
    throw PublishError("create objects dir failed: " + ec.message());
  }
  stdfs::create_directories(path_ / consts::kRefsDir / consts::kHeadsDir, ec);
  if (ec) {
    throw PublishError("create refs/heads dir failed: " + ec.message());
  }
  const std::string config = std::string("[core]\n\trepositoryformatversion = 0\n") +
                             "\tfilemode = true\n\tbare = " + (bare ? "true" : "false") + "\n";
  cfs::write_text_atomic(path_ / consts::kConfigFile, config);
  set_HEAD_symbolic(path_, heads_ref(branch));
}

// Modes

auto GitDir::mode_to_ascii_octal(std::uint32_t mode) -> std::string {
  std::array<char, 16> buf{};
  std::snprintf(buf.data(), buf.size(), "%o", mode);
  return {buf.data()};
}

auto GitDir::ascii_octal_to_mode(std::string_view s) -> std::uint32_t {
  std::uint32_t v = 0;
  for (const char c : s) {
    if (c < '0' || c > '7') {
      break;
    }
    v = static_cast<std::uint32_t>((v << 3U) + static_cast<unsigned>(c - '0'));
  }
  return v;
}

// Blobs

auto GitDir::write_blob(std::span<const std::uint8_t> bytes) const -> std::string {
  return ObjectStore{objects_dir()}.write(consts::kTypeBlob, bytes);
}

// Trees (binary)

auto GitDir::write_tree(const std::vector<TreeEntry> &entries_in) const -> std::string {
  auto entries = entries_in;
  std::ranges::sort(entries, [](const TreeEntry &a, const TreeEntry &b) {
    return sort_key(a) < sort_key(b);
  });

  std::string data;
  for (const auto &e : entries) {
    data.append(mode_to_ascii_octal(e.mode));
    data.push_back(consts::kSpace);
    data.append(e.name);
    data.push_back(consts::kNul);
    data.append(reinterpret_cast<const char *>(e.id.data()), consts::kOidRawLen);
  }
  return ObjectStore{objects_dir()}.write(consts::kTypeTree, cfs::as_bytes(data));
}

auto GitDir::read_tree(std::string_view hex_oid) const -> std::vector<TreeEntry> {
  const auto [type, data] = ObjectStore{objects_dir()}.read(hex_oid);
  if (type != consts::kTypeTree) {
    throw PublishError("object is not a tree: " + std::string(hex_oid));
  }

  std::vector<TreeEntry> out;
  auto p = data.begin();
  const auto end = data.end();
  while (p < end) {
    const auto q_space = std::find(p, end, static_cast<std::uint8_t>(consts::kSpace));
    if (q_space == end) {
      throw PublishError("tree parse: expected space");
    }
    const std::uint32_t mode = ascii_octal_to_mode(std::string(p, q_space));

    p = q_space + 1;
    const auto q_nul = std::find(p, end, static_cast<std::uint8_t>(consts::kNul));
    if (q_nul == end) {
      throw PublishError("tree parse: expected NUL");
    }
    std::string name(p, q_nul);
    p = q_nul + 1;

    if (static_cast<std::size_t>(end - p) < consts::kOidRawLen) {
      throw PublishError("tree parse: truncated oid");
    }
    TreeEntry e{.mode = mode, .name = std::move(name), .id = {}};
    std::memcpy(e.id.data(), &(*p), consts::kOidRawLen);
    p += static_cast<std::ptrdiff_t>(consts::kOidRawLen);
    out.push_back(std::move(e));
  }
  return out;
}

auto GitDir::write_tree_from_dir(const stdfs::path &root) const -> std::string {
  const auto build = [&](const auto &self, const stdfs::path &dir) -> std::string {
    std::vector<TreeEntry> entries;
    for (const auto &de : stdfs::directory_iterator(dir)) {
      const auto name = de.path().filename().string();
      if (dir == root && name == consts::kGitDir) {
        continue;
      }
      if (de.is_symlink()) {
        const std::string target = stdfs::read_symlink(de.path()).string();
        entries.push_back(TreeEntry{.mode = consts::kModeSymlink, .name = name,
                                    .id = parse_oid(write_blob(cfs::as_bytes(target)))});
      } else if (de.is_directory()) {
        std::string sub = self(self, de.path());
        if (sub.empty()) {
          continue; // git does not record empty directories
        }
        entries.push_back(TreeEntry{.mode = consts::kModeTree, .name = name,
                                    .id = parse_oid(sub)});
      } else if (de.is_regular_file()) {
        const auto bytes = cfs::read_file(de.path());
        entries.push_back(TreeEntry{
            .mode = cfs::is_executable(de.path()) ? consts::kModeExec : consts::kModeFile,
            .name = name, .id = parse_oid(write_blob(bytes))});
      }
    }
    if (entries.empty() && dir != root) {
      return {};
    }
    return write_tree(entries);
  };
  return build(build, root);
}

// Commits

auto GitDir::write_commit(std::string_view tree_hex, const std::vector<std::string> &parent_hexes,
                          std::string_view author_line, std::string_view committer_line,
                          std::string_view message) const -> std::string {
  std::string txt;
  txt += consts::kTreePrefix;
  txt += tree_hex;
  txt += '\n';
  for (const auto &p : parent_hexes) {
    txt += consts::kParentPrefix;
    txt += p;
    txt += '\n';
  }
  txt += consts::kAuthorPrefix;
  txt += author_line;
  txt += '\n';
  txt += consts::kCommitterPrefix;
  txt += committer_line;
  txt += "\n\n";
  txt += message;
  return ObjectStore{objects_dir()}.write(consts::kTypeCommit, cfs::as_bytes(txt));
}

auto GitDir::read_commit(std::string_view commit_hex) const -> CommitInfo {
  const auto obj = ObjectStore{objects_dir()}.read(commit_hex);
  if (obj.type != consts::kTypeCommit) {
    throw PublishError("object is not a commit: " + std::string(commit_hex));
  }
  const std::string text(obj.data.begin(), obj.data.end());

  CommitInfo info{};
  std::size_t pos = 0;
  for (;;) {
    const std::size_t nl = text.find('\n', pos);
    const std::string line =
        (nl == std::string::npos) ? text.substr(pos) : text.substr(pos, nl - pos);
    if (line.empty()) {
      if (nl != std::string::npos) {
        info.message = text.substr(nl + 1);
      }
      break;
    }
    if (line.starts_with(consts::kTreePrefix)) {
      info.tree_hex = line.substr(consts::kTreePrefix.size(), consts::kOidHexLen);
    } else if (line.starts_with(consts::kParentPrefix)) {
      info.parents.push_back(line.substr(consts::kParentPrefix.size(), consts::kOidHexLen));
    } else if (line.starts_with(consts::kAuthorPrefix)) {
      info.author = line.substr(consts::kAuthorPrefix.size());
    } else if (line.starts_with(consts::kCommitterPrefix)) {
      info.committer = line.substr(consts::kCommitterPrefix.size());
    }
    if (nl == std::string::npos) break;
    pos = nl + 1;
  }
  if (!looks_hex40(info.tree_hex)) {
    throw PublishError("commit " + std::string(commit_hex) + " has no tree");
  }
  return info;
}

auto GitDir::reachable_objects(std::string_view commit_hex) const -> std::vector<std::string> {
  std::set<std::string> seen;
  std::vector<std::string> out;
  std::vector<std::string> commits{std::string(commit_hex)};
  const auto walk_tree = [&](const auto &self, const std::string &tree_hex) -> void {
    if (!seen.insert(tree_hex).second) return;
    out.push_back(tree_hex);
    for (const auto &e : read_tree(tree_hex)) {
      const std::string hex = to_hex(e.id);
      if (e.mode == consts::kModeTree) {
        self(self, hex);
      } else if (seen.insert(hex).second) {
        out.push_back(hex);
      }
    }
  };
  while (!commits.empty()) {
    const auto cur = commits.back();
    commits.pop_back();
    if (!seen.insert(cur).second) continue;
    out.push_back(cur);
    const auto info = read_commit(cur);
    walk_tree(walk_tree, info.tree_hex);
    commits.insert(commits.end(), info.parents.begin(), info.parents.end());
  }
  return out;
}

RootCommit create_root_history(const stdfs::path &snapshot_root, std::string_view branch,
                               const Identity &identity, std::string_view message) {
  const GitDir git{snapshot_root / consts::kGitDir};
  git.init(branch, false);

  const std::string tree_hex = git.write_tree_from_dir(snapshot_root);
  const std::string sig = timeutil::signature_now(identity);
  const std::string commit_hex = git.write_commit(tree_hex, {}, sig, sig, message);
  update_ref(git.path(), heads_ref(branch), commit_hex);

  return RootCommit{.commit_hex = commit_hex, .tree_hex = tree_hex,
                    .branch = std::string(branch)};
}

} // namespace cleanroom
