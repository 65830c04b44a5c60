#pragma once

#include <array>
#include <cstdint>
#include <span>
#include <string>
#include <string_view>

namespace chronolog {

// Raw 20-byte SHA-1 object id (binary, not hex)
using oid = std::array<std::uint8_t, 20>;

/**
 * SHA-1 over arbitrary bytes.
 * Object ids hash "<type> <size>\\0" + payload; see object_header().
 */
oid sha1(std::span<const std::uint8_t> data);

inline oid sha1(std::string_view s) {
  return sha1(
      std::span<const std::uint8_t>(reinterpret_cast<const std::uint8_t *>(s.data()), s.size()));
}

/** Binary oid -> 40-char lowercase hex. */
std::string to_hex(const oid &id);

/**
 * 40-char hex -> binary oid.
 * Returns false on bad length or characters; `out` is unspecified then.
 */
bool from_hex(std::string_view hex, oid &out);

// Lowercased copy when `hex` is all hex digits, empty string otherwise.
std::string normalize_hex(std::string_view hex);

// First `len` characters of a hex id (the whole id if shorter).
inline std::string abbrev(std::string_view hex, std::size_t len = 7) {
  return std::string(hex.substr(0, len));
}

/** "<type> <size>\\0", the prefix hashed and stored in front of every object. */
inline std::string object_header(std::string_view type, std::size_t size) {
  std::string s;
  s.reserve(type.size() + 1 + 20 + 1);
  s.append(type);
  s.push_back(' ');
  s.append(std::to_string(size));
  s.push_back('\0');
  return s;
}

} // namespace chronolog
