#include "cleanroom/refs.hpp"

#include "cleanroom/consts.hpp"
#include "cleanroom/fs.hpp"
#include "cleanroom/util.hpp"

namespace cleanroom {

static std::filesystem::path head_file(const std::filesystem::path &git_dir) {
  return git_dir / consts::kHeadFile;
}

std::string heads_ref(std::string_view branch) {
  return std::string(consts::kRefsDir) + "/" + std::string(consts::kHeadsDir) + "/" +
         std::string(branch);
}

std::optional<std::string> read_HEAD(const std::filesystem::path &git_dir) {
  const auto p = head_file(git_dir);
  if (!fs::exists(p)) {
    return std::nullopt;
  }
  std::string s = fs::read_text(p);
  strutil::rstrip_newlines(s);
  return s;
}

void set_HEAD_symbolic(const std::filesystem::path &git_dir, const std::string &refname) {
  fs::write_text_atomic(head_file(git_dir), std::string(consts::kRefPrefix) + refname + "\n");
}

std::optional<std::string> read_ref(const std::filesystem::path &git_dir,
                                    const std::string &refname) {
  const auto p = git_dir / refname;
  if (!fs::exists(p)) {
    return std::nullopt;
  }
  std::string s = fs::read_text(p);
  strutil::rstrip_newlines(s);
  return s;
}

void update_ref(const std::filesystem::path &git_dir, const std::string &refname,
                const std::string &hex_oid) {
  fs::write_text_atomic(git_dir / refname, hex_oid + "\n");
}

} // namespace cleanroom
