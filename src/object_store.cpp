#include "cleanroom/object_store.hpp"

#include "cleanroom/errors.hpp"
#include "cleanroom/fs.hpp"

#include <algorithm>

namespace cfs = cleanroom::fs;

namespace cleanroom {

std::filesystem::path ObjectStore::path_for_oid(const oid &object_id) const {
  const std::string hex = to_hex(object_id);
  return objects_dir_ / hex.substr(0, 2) / hex.substr(2);
}

bool ObjectStore::contains(std::string_view hex_oid) const {
  oid id{};
  return from_hex(hex_oid, id) && cfs::exists(path_for_oid(id));
}

Object ObjectStore::read(std::string_view hex_oid) const {
  oid id{};
  if (!from_hex(hex_oid, id)) {
    throw Error("object_store: bad oid hex: " + std::string(hex_oid));
  }
  const auto store = cfs::z_decompress(cfs::read_file(path_for_oid(id)));

  const auto it_space = std::ranges::find(store, static_cast<std::uint8_t>(' '));
  if (it_space == store.end()) {
    throw Error("object_store: invalid header in " + std::string(hex_oid));
  }
  const auto it_nul = std::find(it_space + 1, store.end(), static_cast<std::uint8_t>('\0'));
  if (it_nul == store.end()) {
    throw Error("object_store: invalid header in " + std::string(hex_oid));
  }
  return Object{.type = std::string(store.begin(), it_space),
                .data = {it_nul + 1, store.end()}};
}

std::string ObjectStore::write(std::string_view type, std::span<const std::uint8_t> payload) const {
  const std::string hdr = object_header(type, payload.size());
  std::vector<std::uint8_t> store;
  store.reserve(hdr.size() + payload.size());
  const auto hdr_bytes = cfs::as_bytes(hdr);
  store.insert(store.end(), hdr_bytes.begin(), hdr_bytes.end());
  store.insert(store.end(), payload.begin(), payload.end());

  const oid id = sha1(store);
  const auto path = path_for_oid(id);
  if (!cfs::exists(path)) {
    cfs::write_file_atomic(path, cfs::z_compress(store));
  }
  return to_hex(id);
}

} // namespace cleanroom
