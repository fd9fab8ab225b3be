#pragma once
#include "cleanroom/hash.hpp"

#include <cstdint>
#include <filesystem>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace cleanroom {

struct Object {
  std::string type;                  // "blob" | "tree" | "commit"
  std::vector<std::uint8_t> data;    // payload bytes (no header)
};

// Loose-object store in git's on-disk layout: <objects>/aa/bbbb... zlib-deflated.
class ObjectStore {
public:
  explicit ObjectStore(std::filesystem::path objects_dir)
    : objects_dir_(std::move(objects_dir)) {}

  // Read and inflate object identified by 40-hex; returns type and payload.
  Object read(std::string_view hex_oid) const;

  // Write object with given type/payload unless already present. Returns 40-hex id.
  std::string write(std::string_view type, std::span<const std::uint8_t> payload) const;

  bool contains(std::string_view hex_oid) const;

  std::filesystem::path path_for_oid(const oid& object_id) const;
  const std::filesystem::path& dir() const { return objects_dir_; }

private:
  std::filesystem::path objects_dir_;
};

} // namespace cleanroom
