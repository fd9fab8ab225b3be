#include "cleanroom/fs.hpp"

#include "cleanroom/consts.hpp"
#include "cleanroom/errors.hpp"

#include <algorithm>
#include <fstream>
#include <zlib.h>

namespace cleanroom::fs {

bool exists(const std::filesystem::path &p) {
  std::error_code ec;
  return std::filesystem::exists(p, ec);
}

void ensure_parent_dir(const std::filesystem::path &p) {
  std::error_code ec;
  std::filesystem::create_directories(p.parent_path(), ec);
  if (ec)
    throw IoError("mkdir -p failed: " + p.parent_path().string() + ": " + ec.message());
}

std::vector<std::uint8_t> read_file(const std::filesystem::path &p) {
  std::ifstream ifs(p, std::ios::binary);
  if (!ifs) {
    throw IoError("open for read failed: " + p.string());
  }
  ifs.seekg(0, std::ios::end);
  auto n = static_cast<std::size_t>(ifs.tellg());
  ifs.seekg(0);
  std::vector<std::uint8_t> buf(n);
  if (n)
    ifs.read(reinterpret_cast<char *>(buf.data()), static_cast<std::streamsize>(n));
  if (!ifs)
    throw IoError("read failed: " + p.string());
  return buf;
}

std::string read_text(const std::filesystem::path &p) {
  const auto bytes = read_file(p);
  return {bytes.begin(), bytes.end()};
}

void write_file_atomic(const std::filesystem::path &p, std::span<const std::uint8_t> data) {
  ensure_parent_dir(p);
  auto tmp = p;
  tmp += ".tmp";
  {
    std::ofstream ofs(tmp, std::ios::binary | std::ios::trunc);
    if (!ofs) {
      throw IoError("open temp for write failed: " + tmp.string());
    }
    if (!data.empty()) {
      ofs.write(reinterpret_cast<const char *>(data.data()),
                static_cast<std::streamsize>(data.size()));
    }
    ofs.flush();
    if (!ofs)
      throw IoError("flush temp failed: " + tmp.string());
  }
  // rename() keeps the temp file's default mode; carry over the original permissions.
  std::error_code ec;
  if (std::filesystem::exists(p, ec)) {
    const auto perms = std::filesystem::status(p, ec).permissions();
    if (!ec)
      std::filesystem::permissions(tmp, perms, ec);
  }
  std::filesystem::rename(tmp, p, ec);
  if (ec) {
    std::filesystem::remove(tmp, ec);
    throw IoError("atomic replace failed: " + p.string() + ": " + ec.message());
  }
}

void write_text_atomic(const std::filesystem::path &p, std::string_view text) {
  write_file_atomic(p, as_bytes(text));
}

void overwrite_text(const std::filesystem::path &p, std::string_view text) {
  std::ofstream ofs(p, std::ios::binary | std::ios::trunc);
  if (!ofs) {
    throw IoError("open for write failed: " + p.string());
  }
  ofs.write(text.data(), static_cast<std::streamsize>(text.size()));
  ofs.flush();
  if (!ofs)
    throw IoError("write failed: " + p.string());
}

bool is_binary(std::string_view content) {
  const auto probe = content.substr(0, std::min(content.size(), consts::kBinaryProbeLen));
  return probe.find(consts::kNul) != std::string_view::npos;
}

bool is_executable(const std::filesystem::path &p) {
  std::error_code ec;
  const auto perms = std::filesystem::status(p, ec).permissions();
  if (ec)
    return false;
  return (perms & std::filesystem::perms::owner_exec) != std::filesystem::perms::none;
}

std::vector<std::uint8_t> z_compress(std::span<const std::uint8_t> data) {
  uLongf bound = compressBound(static_cast<uLong>(data.size()));
  std::vector<std::uint8_t> out(bound);
  const int rc = compress2(out.data(), &bound, reinterpret_cast<const Bytef *>(data.data()),
                           static_cast<uLong>(data.size()), Z_BEST_SPEED);
  if (rc != Z_OK)
    throw IoError("zlib compress failed");
  out.resize(bound);
  return out;
}

std::vector<std::uint8_t> z_decompress(std::span<const std::uint8_t> data) {
  std::size_t cap = std::max<std::size_t>(data.size() * 4, 64);
  for (int i = 0; i < 8; ++i) {
    std::vector<std::uint8_t> out(cap);
    auto dest_len = static_cast<uLongf>(out.size());
    const int rc = uncompress(out.data(), &dest_len, reinterpret_cast<const Bytef *>(data.data()),
                              static_cast<uLong>(data.size()));
    if (rc == Z_OK) {
      out.resize(dest_len);
      return out;
    }
    if (rc == Z_BUF_ERROR) {
      cap *= 2;
      continue;
    }
    throw IoError("zlib uncompress failed");
  }
  throw IoError("zlib uncompress overflow");
}

} // namespace cleanroom::fs
