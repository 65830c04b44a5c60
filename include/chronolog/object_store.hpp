#pragma once
#include "chronolog/hash.hpp"
#include "chronolog/object.hpp"
#include "chronolog/pack.hpp"

#include <filesystem>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace chronolog {

// Loose objects under objects/xx/yyyy... plus every pack in objects/pack.
class ObjectStore {
public:
  explicit ObjectStore(std::filesystem::path gitdir)
    : gitdir_(std::move(gitdir)) {}

  // Read and decompress object identified by 40-hex; throws if absent.
  [[nodiscard]] Object read(std::string_view hex_oid) const;

  // Same as read() but nullopt when the object does not exist.
  [[nodiscard]] std::optional<Object> try_read(std::string_view hex_oid) const;

  [[nodiscard]] bool contains(std::string_view hex_oid) const;

  // Every full id (loose or packed) beginning with `hex_prefix`.
  [[nodiscard]] std::vector<std::string> match_prefix(std::string_view hex_prefix) const;

  // Write a loose object with given type/payload. Returns 40-hex id.
  std::string write(std::string_view type, std::span<const std::uint8_t> payload) const;

  [[nodiscard]] std::filesystem::path path_for_oid(const oid& object_id) const;

private:
  [[nodiscard]] std::optional<Object> read_loose(const oid& id) const;
  [[nodiscard]] std::optional<Object> read_any(const oid& id) const;
  const std::vector<PackFile>& packs() const;

  std::filesystem::path gitdir_;
  mutable std::vector<PackFile> packs_;
  mutable bool packs_scanned_ = false;
};

} // namespace chronolog
