#pragma once
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

namespace cleanroom {

// All functions take the git directory itself (".git" of a work tree, or a bare repo).

// "refs/heads/<branch>"
std::string heads_ref(std::string_view branch);

// Raw HEAD contents without the trailing newline; nullopt if HEAD does not exist.
std::optional<std::string> read_HEAD(const std::filesystem::path& git_dir);

// Write symbolic HEAD: "ref: <refname>\n"
void set_HEAD_symbolic(const std::filesystem::path& git_dir, const std::string& refname);

// Read a loose ref file -> 40-hex OID (without trailing newline).
std::optional<std::string> read_ref(const std::filesystem::path& git_dir, const std::string& refname);

// Overwrite/create a ref with the given 40-hex OID. No fast-forward check.
void update_ref(const std::filesystem::path& git_dir, const std::string& refname, const std::string& hex_oid);

} // namespace cleanroom
