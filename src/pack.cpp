#include "chronolog/pack.hpp"

#include "chronolog/consts.hpp"
#include "chronolog/fs.hpp"

#include <algorithm>
#include <cstring>
#include <span>
#include <stdexcept>

namespace chronolog {

namespace {

constexpr std::size_t kIdxHeaderLen = 8;
constexpr std::size_t kFanoutLen = 256 * 4;
constexpr std::size_t kPackHeaderLen = 12;
constexpr std::size_t kBaseCacheLimit = 256;
constexpr int kMaxDeltaDepth = 64;

enum PackType : unsigned {
  kPackCommit = 1,
  kPackTree = 2,
  kPackBlob = 3,
  kPackTag = 4,
  kPackOfsDelta = 6,
  kPackRefDelta = 7,
};

std::uint32_t be32(const std::uint8_t *p) {
  return (static_cast<std::uint32_t>(p[0]) << 24) | (static_cast<std::uint32_t>(p[1]) << 16) |
         (static_cast<std::uint32_t>(p[2]) << 8) | static_cast<std::uint32_t>(p[3]);
}

std::uint64_t be64(const std::uint8_t *p) {
  return (static_cast<std::uint64_t>(be32(p)) << 32) | be32(p + 4);
}

std::string_view type_name(unsigned t) {
  switch (t) {
  case kPackCommit:
    return consts::kTypeCommit;
  case kPackTree:
    return consts::kTypeTree;
  case kPackBlob:
    return consts::kTypeBlob;
  case kPackTag:
    return consts::kTypeTag;
  default:
    throw std::runtime_error("pack: unexpected object type " + std::to_string(t));
  }
}

// Little-endian base-128 size used at the head of a delta stream.
std::size_t delta_varint(const std::vector<std::uint8_t> &d, std::size_t &pos) {
  std::size_t value = 0;
  unsigned shift = 0;
  for (;;) {
    if (pos >= d.size())
      throw std::runtime_error("delta: truncated size header");
    const std::uint8_t c = d[pos++];
    value |= static_cast<std::size_t>(c & 0x7F) << shift;
    shift += 7;
    if ((c & 0x80) == 0)
      break;
  }
  return value;
}

} // namespace

PackFile::PackFile(std::filesystem::path idx_path) : idx_path_(std::move(idx_path)) {
  pack_path_ = idx_path_;
  pack_path_.replace_extension(".pack");
  idx_ = fs::read_file(idx_path_);

  if (idx_.size() < kIdxHeaderLen + kFanoutLen) {
    throw std::runtime_error("pack index too short: " + idx_path_.string());
  }
  if (idx_[0] != 0xFF || idx_[1] != 't' || idx_[2] != 'O' || idx_[3] != 'c' ||
      be32(idx_.data() + 4) != 2) {
    throw std::runtime_error("unsupported pack index version: " + idx_path_.string());
  }
  count_ = be32(idx_.data() + kIdxHeaderLen + kFanoutLen - 4);
  const std::size_t need = kIdxHeaderLen + kFanoutLen + count_ * (consts::kOidRawLen + 4 + 4);
  if (idx_.size() < need) {
    throw std::runtime_error("pack index truncated: " + idx_path_.string());
  }
}

oid PackFile::id_at(std::size_t pos) const {
  oid id{};
  const auto *p = idx_.data() + kIdxHeaderLen + kFanoutLen + pos * consts::kOidRawLen;
  std::memcpy(id.data(), p, consts::kOidRawLen);
  return id;
}

std::uint64_t PackFile::offset_at(std::size_t pos) const {
  const std::size_t off32_base =
      kIdxHeaderLen + kFanoutLen + count_ * (consts::kOidRawLen + 4);
  const std::uint32_t off = be32(idx_.data() + off32_base + pos * 4);
  if ((off & 0x80000000U) == 0)
    return off;

  const std::size_t large_base = off32_base + count_ * 4;
  const std::size_t slot = off & 0x7FFFFFFFU;
  if (large_base + (slot + 1) * 8 > idx_.size())
    throw std::runtime_error("pack index: bad 64-bit offset slot");
  return be64(idx_.data() + large_base + slot * 8);
}

std::optional<std::size_t> PackFile::find(const oid &id) const {
  const auto *fanout = idx_.data() + kIdxHeaderLen;
  const std::size_t lo_bound = id[0] == 0 ? 0 : be32(fanout + (id[0] - 1) * 4);
  const std::size_t hi_bound = be32(fanout + id[0] * 4);

  std::size_t lo = lo_bound;
  std::size_t hi = hi_bound;
  while (lo < hi) {
    const std::size_t mid = lo + (hi - lo) / 2;
    const oid probe = id_at(mid);
    const int cmp = std::memcmp(probe.data(), id.data(), consts::kOidRawLen);
    if (cmp == 0)
      return mid;
    if (cmp < 0)
      lo = mid + 1;
    else
      hi = mid;
  }
  return std::nullopt;
}

bool PackFile::contains(const oid &id) const { return find(id).has_value(); }

void PackFile::match_prefix(std::string_view hex_prefix, std::vector<std::string> &out) const {
  // Linear scan inside the fanout bucket of the first byte.
  if (hex_prefix.size() < 2)
    return;
  oid first{};
  std::string padded(hex_prefix);
  padded.resize(consts::kOidHexLen, '0');
  if (!from_hex(padded, first))
    return;

  const auto *fanout = idx_.data() + kIdxHeaderLen;
  const std::size_t lo = first[0] == 0 ? 0 : be32(fanout + (first[0] - 1) * 4);
  const std::size_t hi = be32(fanout + first[0] * 4);
  for (std::size_t i = lo; i < hi; ++i) {
    std::string hex = to_hex(id_at(i));
    if (hex.compare(0, hex_prefix.size(), hex_prefix) == 0)
      out.push_back(std::move(hex));
  }
}

const std::vector<std::uint8_t> &PackFile::pack_bytes() const {
  if (!pack_loaded_) {
    pack_ = fs::read_file(pack_path_);
    if (pack_.size() < kPackHeaderLen + consts::kOidRawLen ||
        std::memcmp(pack_.data(), "PACK", 4) != 0) {
      throw std::runtime_error("not a pack file: " + pack_path_.string());
    }
    const std::uint32_t version = be32(pack_.data() + 4);
    if (version != 2 && version != 3) {
      throw std::runtime_error("unsupported pack version: " + pack_path_.string());
    }
    pack_loaded_ = true;
  }
  return pack_;
}

std::optional<Object> PackFile::read(const oid &id, const BaseLookup &external) const {
  const auto pos = find(id);
  if (!pos)
    return std::nullopt;
  return read_at(offset_at(*pos), external, 0);
}

Object PackFile::read_at(std::uint64_t offset, const BaseLookup &external, int depth) const {
  if (depth > kMaxDeltaDepth) {
    throw std::runtime_error("pack: delta chain too deep in " + pack_path_.string());
  }
  if (const auto it = base_cache_.find(offset); it != base_cache_.end()) {
    return it->second;
  }

  const auto &pack = pack_bytes();
  const std::size_t end = pack.size() - consts::kOidRawLen;
  std::size_t p = static_cast<std::size_t>(offset);
  if (p < kPackHeaderLen || p >= end)
    throw std::runtime_error("pack: object offset out of range");

  // Entry header: 3-bit type, size in 4 + 7n bits.
  std::uint8_t c = pack[p++];
  const unsigned type = (c >> 4) & 0x7;
  std::size_t size = c & 0x0F;
  unsigned shift = 4;
  while ((c & 0x80) != 0) {
    if (p >= end)
      throw std::runtime_error("pack: truncated entry header");
    c = pack[p++];
    size |= static_cast<std::size_t>(c & 0x7F) << shift;
    shift += 7;
  }

  Object result;
  if (type == kPackOfsDelta || type == kPackRefDelta) {
    Object base;
    if (type == kPackOfsDelta) {
      if (p >= end)
        throw std::runtime_error("pack: truncated delta offset");
      c = pack[p++];
      std::uint64_t back = c & 0x7F;
      while ((c & 0x80) != 0) {
        if (p >= end)
          throw std::runtime_error("pack: truncated delta offset");
        c = pack[p++];
        back = ((back + 1) << 7) | (c & 0x7F);
      }
      if (back == 0 || back > offset)
        throw std::runtime_error("pack: bad delta base offset");
      base = read_at(offset - back, external, depth + 1);
    } else {
      if (p + consts::kOidRawLen > end)
        throw std::runtime_error("pack: truncated delta base id");
      oid base_id{};
      std::memcpy(base_id.data(), pack.data() + p, consts::kOidRawLen);
      p += consts::kOidRawLen;
      if (const auto in_pack = find(base_id); in_pack) {
        base = read_at(offset_at(*in_pack), external, depth + 1);
      } else {
        auto ext = external ? external(base_id) : std::nullopt;
        if (!ext)
          throw std::runtime_error("pack: missing delta base " + to_hex(base_id));
        base = std::move(*ext);
      }
    }
    const auto delta = fs::z_inflate_sized(std::span(pack.data() + p, end - p), size);
    result.type = base.type;
    result.data = apply_delta(base.data, delta);
  } else {
    result.type = std::string(type_name(type));
    result.data = fs::z_inflate_sized(std::span(pack.data() + p, end - p), size);
  }

  if (base_cache_.size() >= kBaseCacheLimit)
    base_cache_.clear();
  base_cache_.emplace(offset, result);
  return result;
}

std::vector<std::uint8_t> apply_delta(const std::vector<std::uint8_t> &base,
                                      const std::vector<std::uint8_t> &delta) {
  std::size_t pos = 0;
  const std::size_t src_size = delta_varint(delta, pos);
  const std::size_t dst_size = delta_varint(delta, pos);
  if (src_size != base.size())
    throw std::runtime_error("delta: base size mismatch");

  std::vector<std::uint8_t> out;
  out.reserve(dst_size);
  while (pos < delta.size()) {
    const std::uint8_t op = delta[pos++];
    if ((op & 0x80) != 0) {
      std::size_t copy_off = 0;
      std::size_t copy_len = 0;
      for (unsigned bit = 0; bit < 4; ++bit) {
        if ((op & (1U << bit)) != 0) {
          if (pos >= delta.size())
            throw std::runtime_error("delta: truncated copy offset");
          copy_off |= static_cast<std::size_t>(delta[pos++]) << (8 * bit);
        }
      }
      for (unsigned bit = 0; bit < 3; ++bit) {
        if ((op & (0x10U << bit)) != 0) {
          if (pos >= delta.size())
            throw std::runtime_error("delta: truncated copy length");
          copy_len |= static_cast<std::size_t>(delta[pos++]) << (8 * bit);
        }
      }
      if (copy_len == 0)
        copy_len = 0x10000;
      if (copy_off + copy_len > base.size())
        throw std::runtime_error("delta: copy out of base bounds");
      out.insert(out.end(), base.begin() + static_cast<std::ptrdiff_t>(copy_off),
                 base.begin() + static_cast<std::ptrdiff_t>(copy_off + copy_len));
    } else if (op != 0) {
      if (pos + op > delta.size())
        throw std::runtime_error("delta: truncated insert");
      out.insert(out.end(), delta.begin() + static_cast<std::ptrdiff_t>(pos),
                 delta.begin() + static_cast<std::ptrdiff_t>(pos + op));
      pos += op;
    } else {
      throw std::runtime_error("delta: reserved opcode 0");
    }
  }
  if (out.size() != dst_size)
    throw std::runtime_error("delta: result size mismatch");
  return out;
}

} // namespace chronolog
