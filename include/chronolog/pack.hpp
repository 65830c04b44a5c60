#pragma once
#include "chronolog/hash.hpp"
#include "chronolog/object.hpp"

#include <cstdint>
#include <filesystem>
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace chronolog {

// One objects/pack/pack-<sha>.{idx,pack} pair. Only version-2 indexes are
// understood (the format git has written by default since 1.5.2).
class PackFile {
public:
  // Looks up REF_DELTA bases that live outside this pack.
  using BaseLookup = std::function<std::optional<Object>(const oid&)>;

  explicit PackFile(std::filesystem::path idx_path);

  [[nodiscard]] bool contains(const oid& id) const;

  // Append every id in this pack starting with `hex_prefix` (lowercase) to `out`.
  void match_prefix(std::string_view hex_prefix, std::vector<std::string>& out) const;

  // nullopt when `id` is not in this pack; throws on a corrupt entry.
  [[nodiscard]] std::optional<Object> read(const oid& id, const BaseLookup& external) const;

private:
  [[nodiscard]] std::optional<std::size_t> find(const oid& id) const;
  [[nodiscard]] oid id_at(std::size_t pos) const;
  [[nodiscard]] std::uint64_t offset_at(std::size_t pos) const;
  [[nodiscard]] Object read_at(std::uint64_t offset, const BaseLookup& external, int depth) const;
  const std::vector<std::uint8_t>& pack_bytes() const;

  std::filesystem::path idx_path_;
  std::filesystem::path pack_path_;
  std::vector<std::uint8_t> idx_;
  std::size_t count_ = 0;

  // The .pack body is loaded on first read; inflated delta bases are memoized.
  mutable std::vector<std::uint8_t> pack_;
  mutable bool pack_loaded_ = false;
  mutable std::map<std::uint64_t, Object> base_cache_;
};

// Rebuild a target buffer from a base and a git delta stream.
std::vector<std::uint8_t> apply_delta(const std::vector<std::uint8_t>& base,
                                      const std::vector<std::uint8_t>& delta);

} // namespace chronolog
