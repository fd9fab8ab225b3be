#pragma once
#include <cstddef>
#include <cstdint>
#include <string_view>

namespace cleanroom::consts {

// Directory and file names
inline constexpr std::string_view kGitDir        = ".git";
inline constexpr std::string_view kObjectsDir    = "objects";
inline constexpr std::string_view kRefsDir       = "refs";
inline constexpr std::string_view kHeadsDir      = "heads";
inline constexpr std::string_view kHeadFile      = "HEAD";
inline constexpr std::string_view kConfigFile    = "config";
inline constexpr std::string_view kDefaultConfig = ".cleanroom.json";
inline constexpr std::string_view kTempPrefix    = "cleanroom-";

// Git object type strings
inline constexpr std::string_view kTypeBlob   = "blob";
inline constexpr std::string_view kTypeTree   = "tree";
inline constexpr std::string_view kTypeCommit = "commit";

// File modes (octal)
inline constexpr std::uint32_t kModeFile    = 0100644; // regular file
inline constexpr std::uint32_t kModeExec    = 0100755; // executable file
inline constexpr std::uint32_t kModeSymlink = 0120000; // symbolic link
inline constexpr std::uint32_t kModeTree    = 0040000; // directory entry in tree

// === Object ID sizes ===
inline constexpr std::size_t kOidRawLen = 20;  // 20 bytes (SHA-1)
inline constexpr std::size_t kOidHexLen = 40;  // 40 hex chars (SHA-1)

// === Commit header prefixes ===
inline constexpr std::string_view kTreePrefix      = "tree ";
inline constexpr std::string_view kRefPrefix       = "ref: ";
inline constexpr std::string_view kParentPrefix    = "parent ";
inline constexpr std::string_view kAuthorPrefix    = "author ";
inline constexpr std::string_view kCommitterPrefix = "committer ";

// === Content inspection ===
// Same window git uses to decide whether a blob is binary.
inline constexpr std::size_t kBinaryProbeLen = 8000;

// === Validation ===
inline constexpr std::size_t kMaxFindingsPerFile = 5; // per (term, file)

// === Default marker pair ===
inline constexpr std::string_view kMarkerStart = "<!-- BUSINESS:START -->";
inline constexpr std::string_view kMarkerEnd   = "<!-- BUSINESS:END -->";

// === Commit defaults ===
inline constexpr std::string_view kDefaultAuthorName  = "cleanroom";
inline constexpr std::string_view kDefaultAuthorEmail = "cleanroom@localhost";
inline constexpr std::string_view kDefaultMessage =
    "Publish sanitized snapshot\n\nAutomated by cleanroom publish\n";

// === Diff ===
inline constexpr std::size_t kDiffContext = 3;

// === Common characters ===
inline constexpr char kSpace = ' ';
inline constexpr char kNul   = '\0';
inline constexpr char kLF    = '\n';

} // namespace cleanroom::consts
