#include "cleanroom/transport.hpp"

#include "cleanroom/consts.hpp"
#include "cleanroom/errors.hpp"
#include "cleanroom/history.hpp"
#include "cleanroom/object_store.hpp"
#include "cleanroom/process.hpp"
#include "cleanroom/refs.hpp"

namespace stdfs = std::filesystem;

namespace {

constexpr std::string_view kFileScheme = "file://";

// A work tree's .git, or the directory itself when it is a bare repository.
stdfs::path resolve_git_dir(const stdfs::path &p) {
  if (stdfs::is_directory(p / cleanroom::consts::kGitDir))
    return p / cleanroom::consts::kGitDir;
  if (stdfs::exists(p / cleanroom::consts::kHeadFile) &&
      stdfs::is_directory(p / cleanroom::consts::kObjectsDir))
    return p;
  throw cleanroom::PublishError("remote is not a git repository: " + p.string());
}

} // namespace

namespace cleanroom {

LocalTransport::LocalTransport(stdfs::path remote_path) : remote_path_(std::move(remote_path)) {}

std::string LocalTransport::describe() const { return remote_path_.string(); }

PushOutcome LocalTransport::force_push(const stdfs::path &work_root, const std::string &branch) {
  const GitDir local{work_root / consts::kGitDir};
  const GitDir remote{resolve_git_dir(remote_path_)};
  const std::string refname = heads_ref(branch);

  const auto tip = read_ref(local.path(), refname);
  if (!tip) {
    throw PublishError("local branch '" + branch + "' has no commit to push");
  }

  const ObjectStore src{local.objects_dir()};
  const ObjectStore dst{remote.objects_dir()};
  std::size_t copied = 0;
  for (const auto &hex : local.reachable_objects(*tip)) {
    if (dst.contains(hex))
      continue;
    oid id{};
    if (!from_hex(hex, id))
      throw PublishError("bad object id in local history: " + hex);
    const auto to = dst.path_for_oid(id);
    std::error_code ec;
    stdfs::create_directories(to.parent_path(), ec);
    if (!ec)
      stdfs::copy_file(src.path_for_oid(id), to, stdfs::copy_options::skip_existing, ec);
    if (ec) {
      return PushOutcome{.accepted = false,
                         .detail = "copy object " + hex + " failed: " + ec.message()};
    }
    ++copied;
  }

  const auto previous = read_ref(remote.path(), refname);
  update_ref(remote.path(), refname, *tip);

  std::string detail = " + " + (previous ? previous->substr(0, 7) : std::string("(new)")) +
                       "..." + tip->substr(0, 7) + " " + branch + " -> " + branch +
                       " (forced update, " + std::to_string(copied) + " objects)";
  return PushOutcome{.accepted = true, .detail = std::move(detail)};
}

GitCliTransport::GitCliTransport(std::string url) : url_(std::move(url)) {}

std::string GitCliTransport::describe() const { return url_; }

PushOutcome GitCliTransport::force_push(const stdfs::path &work_root, const std::string &branch) {
  const std::string refspec = heads_ref(branch) + ":" + heads_ref(branch);
  const auto res = process::run({"git", "push", "--force", url_, refspec}, work_root);
  return PushOutcome{.accepted = res.exit_code == 0, .detail = res.output};
}

std::unique_ptr<Transport> make_transport(const std::string &url, const stdfs::path &repo_root) {
  if (url.starts_with(kFileScheme)) {
    return std::make_unique<LocalTransport>(stdfs::path(url.substr(kFileScheme.size())));
  }
  std::error_code ec;
  stdfs::path local{url};
  if (local.is_relative())
    local = repo_root / local;
  if (stdfs::is_directory(local, ec)) {
    return std::make_unique<LocalTransport>(local);
  }
  return std::make_unique<GitCliTransport>(url);
}

} // namespace cleanroom
