#include "cleanroom/snapshot.hpp"

#include "cleanroom/consts.hpp"
#include "cleanroom/errors.hpp"

#include <algorithm>
#include <random>

namespace stdfs = std::filesystem;

namespace {

stdfs::path make_temp_root() {
  const auto base = stdfs::temp_directory_path();
  std::random_device rd;
  for (int attempt = 0; attempt < 16; ++attempt) {
    const auto candidate =
        base / (std::string(cleanroom::consts::kTempPrefix) + std::to_string(rd()) +
                std::to_string(rd()));
    std::error_code ec;
    // create_directory returns false if it already exists: another run owns it.
    if (stdfs::create_directory(candidate, ec) && !ec)
      return candidate;
  }
  throw cleanroom::IoError("could not allocate a snapshot directory under " + base.string());
}

void copy_tracked(const stdfs::path &src, const stdfs::path &dst) {
  std::error_code ec;
  const auto st = stdfs::symlink_status(src, ec);
  if (ec || !stdfs::exists(st))
    throw cleanroom::IoError("tracked file missing: " + src.string());

  stdfs::create_directories(dst.parent_path(), ec);
  if (ec)
    throw cleanroom::IoError("mkdir -p failed: " + dst.parent_path().string() + ": " +
                             ec.message());

  if (stdfs::is_symlink(st)) {
    stdfs::copy_symlink(src, dst, ec);
  } else if (stdfs::is_regular_file(st)) {
    stdfs::copy_file(src, dst, stdfs::copy_options::overwrite_existing, ec);
  } else {
    throw cleanroom::IoError("tracked path is not a regular file: " + src.string());
  }
  if (ec)
    throw cleanroom::IoError("copy failed: " + src.string() + ": " + ec.message());
}

} // namespace

namespace cleanroom {

stdfs::path checked_relative(const std::string &rel) {
  const stdfs::path p = stdfs::path(rel).lexically_normal();
  if (rel.empty() || p.is_absolute() || p.empty() || p == ".") {
    throw ConfigError("path must be relative to the repository root: '" + rel + "'");
  }
  if (*p.begin() == "..") {
    throw ConfigError("path escapes the repository root: '" + rel + "'");
  }
  return p;
}

Snapshot::Snapshot(stdfs::path root) : root_(std::move(root)) {}

Snapshot::Snapshot(Snapshot &&other) noexcept
    : root_(std::move(other.root_)), copied_(other.copied_),
      exclusions_(std::move(other.exclusions_)) {
  other.root_.clear();
}

Snapshot &Snapshot::operator=(Snapshot &&other) noexcept {
  if (this != &other) {
    release();
    root_ = std::move(other.root_);
    copied_ = other.copied_;
    exclusions_ = std::move(other.exclusions_);
    other.root_.clear();
  }
  return *this;
}

Snapshot::~Snapshot() { release(); }

void Snapshot::release() noexcept {
  if (root_.empty())
    return;
  std::error_code ec;
  stdfs::remove_all(root_, ec);
  root_.clear();
}

Snapshot Snapshot::create(const stdfs::path &source_root,
                          const std::vector<std::string> &tracked_paths,
                          const std::vector<std::string> &exclude_paths) {
  if (tracked_paths.empty()) {
    throw ConfigError("no tracked files to publish");
  }
  std::vector<stdfs::path> excludes;
  excludes.reserve(exclude_paths.size());
  for (const auto &e : exclude_paths)
    excludes.push_back(checked_relative(e));

  // Owned from here on: any throw below removes the partial copy.
  Snapshot snap{make_temp_root()};

  for (const auto &rel : tracked_paths) {
    const auto p = checked_relative(rel);
    copy_tracked(source_root / p, snap.root_ / p);
    ++snap.copied_;
  }

  for (std::size_t i = 0; i < excludes.size(); ++i) {
    const auto target = snap.root_ / excludes[i];
    std::error_code ec;
    const bool present = stdfs::exists(stdfs::symlink_status(target, ec));
    if (present) {
      stdfs::remove_all(target, ec);
      if (ec)
        throw IoError("remove failed: " + exclude_paths[i] + ": " + ec.message());
    }
    snap.exclusions_.push_back(ExclusionNote{.path = exclude_paths[i], .removed = present});
  }
  return snap;
}

std::vector<std::string> Snapshot::files() const {
  std::vector<std::string> out;
  for (auto it = stdfs::recursive_directory_iterator(root_);
       it != stdfs::recursive_directory_iterator(); ++it) {
    const auto &p = it->path();
    if (it.depth() == 0 && p.filename() == stdfs::path(consts::kGitDir)) {
      it.disable_recursion_pending();
      continue;
    }
    if (!it->is_symlink() && !it->is_regular_file()) {
      continue;
    }
    out.push_back(stdfs::relative(p, root_).generic_string());
  }
  std::ranges::sort(out);
  return out;
}

} // namespace cleanroom
