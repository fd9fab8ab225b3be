#pragma once
#include <cstdint>
#include <filesystem>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace cleanroom::fs {

bool exists(const std::filesystem::path& p);
void ensure_parent_dir(const std::filesystem::path& p);

// All functions below throw cleanroom::IoError on failure.
std::vector<std::uint8_t> read_file(const std::filesystem::path& p);
std::string read_text(const std::filesystem::path& p);
void write_file_atomic(const std::filesystem::path& p, std::span<const std::uint8_t> data);
void write_text_atomic(const std::filesystem::path& p, std::string_view text);
// Truncate and rewrite an existing file where it stands; no sibling temp file is created,
// so nothing else in the directory can be clobbered. Mode bits are untouched.
void overwrite_text(const std::filesystem::path& p, std::string_view text);

// True if the content looks binary: a NUL within the first kBinaryProbeLen bytes.
bool is_binary(std::string_view content);

bool is_executable(const std::filesystem::path& p);

std::vector<std::uint8_t> z_compress(std::span<const std::uint8_t> data);
std::vector<std::uint8_t> z_decompress(std::span<const std::uint8_t> data);

inline std::span<const std::uint8_t> as_bytes(std::string_view s) {
  return {reinterpret_cast<const std::uint8_t *>(s.data()), s.size()};
}

} // namespace cleanroom::fs
