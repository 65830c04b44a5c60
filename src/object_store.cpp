#include "chronolog/object_store.hpp"

#include "chronolog/consts.hpp"
#include "chronolog/fs.hpp"

#include <algorithm>
#include <set>
#include <stdexcept>

namespace cfs = chronolog::fs;

namespace chronolog {

std::filesystem::path ObjectStore::path_for_oid(const oid &object_id) const {
  const std::string hex = to_hex(object_id);
  const std::filesystem::path dir =
      gitdir_ / consts::kObjectsDir / hex.substr(0, consts::kFanoutDirHexLen);
  return dir / hex.substr(consts::kFanoutDirHexLen);
}

const std::vector<PackFile> &ObjectStore::packs() const {
  if (!packs_scanned_) {
    packs_scanned_ = true;
    const auto pack_dir = gitdir_ / consts::kObjectsDir / consts::kPackDir;
    std::error_code ec;
    if (std::filesystem::is_directory(pack_dir, ec)) {
      std::vector<std::filesystem::path> idx_files;
      for (const auto &entry : std::filesystem::directory_iterator(pack_dir, ec)) {
        if (entry.is_regular_file() && entry.path().extension() == ".idx")
          idx_files.push_back(entry.path());
      }
      std::ranges::sort(idx_files);
      for (const auto &p : idx_files)
        packs_.emplace_back(p);
    }
  }
  return packs_;
}

std::optional<Object> ObjectStore::read_loose(const oid &id) const {
  const auto path = path_for_oid(id);
  if (!cfs::is_regular(path))
    return std::nullopt;
  auto store = cfs::z_decompress(cfs::read_file(path));

  auto it_space = std::ranges::find(store, static_cast<std::uint8_t>(' '));
  if (it_space == store.end()) {
    throw std::runtime_error("object_store: invalid header in " + to_hex(id));
  }
  auto it_nul = std::find(it_space + 1, store.end(), static_cast<std::uint8_t>('\0'));
  if (it_nul == store.end()) {
    throw std::runtime_error("object_store: invalid header in " + to_hex(id));
  }
  std::string type(store.begin(), it_space);
  std::size_t payload_off = (it_nul - store.begin()) + 1;
  return Object{.type = std::move(type), .data = {store.begin() + payload_off, store.end()}};
}

std::optional<Object> ObjectStore::read_any(const oid &id) const {
  if (auto loose = read_loose(id))
    return loose;
  const PackFile::BaseLookup external = [this](const oid &base) { return read_any(base); };
  for (const auto &pack : packs()) {
    if (auto obj = pack.read(id, external))
      return obj;
  }
  return std::nullopt;
}

std::optional<Object> ObjectStore::try_read(std::string_view hex_oid) const {
  oid id{};
  if (!from_hex(hex_oid, id)) {
    throw std::runtime_error("object_store: bad oid hex: " + std::string(hex_oid));
  }
  return read_any(id);
}

Object ObjectStore::read(std::string_view hex_oid) const {
  auto obj = try_read(hex_oid);
  if (!obj) {
    throw std::runtime_error("object_store: missing object " + std::string(hex_oid));
  }
  return std::move(*obj);
}

bool ObjectStore::contains(std::string_view hex_oid) const {
  oid id{};
  if (!from_hex(hex_oid, id))
    return false;
  if (cfs::is_regular(path_for_oid(id)))
    return true;
  return std::ranges::any_of(packs(), [&](const PackFile &p) { return p.contains(id); });
}

std::vector<std::string> ObjectStore::match_prefix(std::string_view hex_prefix) const {
  std::set<std::string> found;
  if (hex_prefix.size() < consts::kFanoutDirHexLen)
    return {};

  const auto dir = gitdir_ / consts::kObjectsDir /
                   std::string(hex_prefix.substr(0, consts::kFanoutDirHexLen));
  const auto rest = hex_prefix.substr(consts::kFanoutDirHexLen);
  std::error_code ec;
  if (std::filesystem::is_directory(dir, ec)) {
    for (const auto &entry : std::filesystem::directory_iterator(dir, ec)) {
      const std::string name = entry.path().filename().string();
      if (name.size() + consts::kFanoutDirHexLen == consts::kOidHexLen &&
          name.compare(0, rest.size(), rest) == 0) {
        found.insert(std::string(hex_prefix.substr(0, consts::kFanoutDirHexLen)) + name);
      }
    }
  }

  std::vector<std::string> packed;
  for (const auto &pack : packs())
    pack.match_prefix(hex_prefix, packed);
  found.insert(packed.begin(), packed.end());
  return {found.begin(), found.end()};
}

std::string ObjectStore::write(std::string_view type, std::span<const std::uint8_t> payload) const {
  const std::string hdr = object_header(type, payload.size());
  std::vector<std::uint8_t> store;
  store.reserve(hdr.size() + payload.size());
  store.insert(store.end(), reinterpret_cast<const std::uint8_t *>(hdr.data()),
               reinterpret_cast<const std::uint8_t *>(hdr.data()) + hdr.size());
  store.insert(store.end(), payload.begin(), payload.end());

  const oid store_id = sha1(store);
  const auto path = path_for_oid(store_id);
  if (!cfs::exists(path)) {
    const auto compressed = cfs::z_compress(store);
    cfs::write_file_atomic(path, compressed);
  }
  return to_hex(store_id);
}

} // namespace chronolog
