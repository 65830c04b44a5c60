#include "chronolog/fs.hpp"
#include "chronolog/hash.hpp"
#include "chronolog/pack.hpp"
#include "chronolog/refs.hpp"
#include "chronolog/repo.hpp"

#include "fixture.hpp"

#include <algorithm>
#include <fstream>
#include <iostream>
#include <string>
#include <vector>

namespace cfs = chronolog::fs;
using chronolog::oid;
using chronolog::test::expect;
using Bytes = std::vector<std::uint8_t>;

namespace {

Bytes bytes_of(std::string_view s) { return {s.begin(), s.end()}; }

void put32(Bytes &out, std::uint32_t v) {
  out.push_back(static_cast<std::uint8_t>(v >> 24));
  out.push_back(static_cast<std::uint8_t>(v >> 16));
  out.push_back(static_cast<std::uint8_t>(v >> 8));
  out.push_back(static_cast<std::uint8_t>(v));
}

oid object_id(std::string_view type, std::string_view body) {
  return chronolog::sha1(chronolog::object_header(type, body.size()) + std::string(body));
}

// Pack entry header: type in bits 4..6 of the first byte, size in 4 + 7n bits.
void put_entry_header(Bytes &out, unsigned type, std::size_t size) {
  std::uint8_t c = static_cast<std::uint8_t>((type << 4) | (size & 0x0F));
  size >>= 4;
  while (size != 0) {
    out.push_back(c | 0x80);
    c = static_cast<std::uint8_t>(size & 0x7F);
    size >>= 7;
  }
  out.push_back(c);
}

// OFS_DELTA negative offset, git's "offset encoding".
void put_ofs(Bytes &out, std::uint64_t ofs) {
  Bytes buf;
  buf.push_back(static_cast<std::uint8_t>(ofs & 0x7F));
  while ((ofs >>= 7) != 0) {
    --ofs;
    buf.push_back(static_cast<std::uint8_t>(0x80 | (ofs & 0x7F)));
  }
  out.insert(out.end(), buf.rbegin(), buf.rend());
}

void put_zlib(Bytes &out, const Bytes &data) {
  const auto z = cfs::z_compress(data);
  out.insert(out.end(), z.begin(), z.end());
}

struct Entry {
  oid id;
  std::uint32_t offset;
};

struct PackBuilder {
  Bytes pack;
  std::vector<Entry> entries;

  PackBuilder() {
    const std::string magic = "PACK";
    pack.insert(pack.end(), magic.begin(), magic.end());
    put32(pack, 2);
    put32(pack, 0); // count, patched in finish()
  }

  std::uint32_t add_whole(unsigned type, std::string_view type_name, std::string_view body) {
    const auto off = static_cast<std::uint32_t>(pack.size());
    put_entry_header(pack, type, body.size());
    put_zlib(pack, bytes_of(body));
    entries.push_back({object_id(type_name, body), off});
    return off;
  }

  void add_ofs_delta(std::uint32_t base_off, const oid &id, const Bytes &delta) {
    const auto off = static_cast<std::uint32_t>(pack.size());
    put_entry_header(pack, 6, delta.size());
    put_ofs(pack, off - base_off);
    put_zlib(pack, delta);
    entries.push_back({id, off});
  }

  void add_ref_delta(const oid &base, const oid &id, const Bytes &delta) {
    const auto off = static_cast<std::uint32_t>(pack.size());
    put_entry_header(pack, 7, delta.size());
    pack.insert(pack.end(), base.begin(), base.end());
    put_zlib(pack, delta);
    entries.push_back({id, off});
  }

  void finish(const std::filesystem::path &dir) {
    const auto n = static_cast<std::uint32_t>(entries.size());
    pack[8] = static_cast<std::uint8_t>(n >> 24);
    pack[9] = static_cast<std::uint8_t>(n >> 16);
    pack[10] = static_cast<std::uint8_t>(n >> 8);
    pack[11] = static_cast<std::uint8_t>(n);
    const oid pack_sum = chronolog::sha1(pack);
    pack.insert(pack.end(), pack_sum.begin(), pack_sum.end());

    std::ranges::sort(entries, [](const Entry &a, const Entry &b) { return a.id < b.id; });
    Bytes idx = {0xFF, 't', 'O', 'c'};
    put32(idx, 2);
    for (unsigned b = 0; b < 256; ++b) {
      const auto upto = std::ranges::count_if(entries, [b](const Entry &e) { return e.id[0] <= b; });
      put32(idx, static_cast<std::uint32_t>(upto));
    }
    for (const auto &e : entries)
      idx.insert(idx.end(), e.id.begin(), e.id.end());
    for (std::size_t i = 0; i < entries.size(); ++i)
      put32(idx, 0); // crc32, unchecked by readers
    for (const auto &e : entries)
      put32(idx, e.offset);
    idx.insert(idx.end(), pack_sum.begin(), pack_sum.end());
    const oid idx_sum = chronolog::sha1(idx);
    idx.insert(idx.end(), idx_sum.begin(), idx_sum.end());

    cfs::write_file_atomic(dir / "pack-test.pack", pack);
    cfs::write_file_atomic(dir / "pack-test.idx", idx);
  }
};

Bytes delta_header(std::size_t src, std::size_t dst) {
  // both sizes below 128: one byte each
  return {static_cast<std::uint8_t>(src), static_cast<std::uint8_t>(dst)};
}

} // namespace

int main() {
  chronolog::test::TempRepo t("pack_read");
  try {
    const auto &writer = t.repo();
    const std::string tree = writer.write_tree({});

    const std::string base_text = "The quick brown fox jumps over the lazy dog.\n";
    const std::string ofs_text = base_text.substr(0, 20) + "cat!\n";
    const std::string loose_text = "loose base\n";
    const std::string ref_text = loose_text + "tail\n";
    const std::string commit_text = "tree " + tree +
                                    "\nauthor A <a@x> 1704110400 +0000\n"
                                    "committer A <a@x> 1704110400 +0000\n\npacked commit\n";

    const std::string loose_hex = writer.write_blob(
        std::span(reinterpret_cast<const std::uint8_t *>(loose_text.data()), loose_text.size()));
    oid loose_id{};
    if (!chronolog::from_hex(loose_hex, loose_id)) {
      std::cerr << "from_hex failed\n";
      return 1;
    }

    PackBuilder b;
    const auto base_off = b.add_whole(3, "blob", base_text);

    Bytes ofs_delta = delta_header(base_text.size(), ofs_text.size());
    ofs_delta.insert(ofs_delta.end(), {0x90, 20, 5});
    ofs_delta.insert(ofs_delta.end(), ofs_text.end() - 5, ofs_text.end());
    const oid ofs_id = object_id("blob", ofs_text);
    b.add_ofs_delta(base_off, ofs_id, ofs_delta);

    Bytes ref_delta = delta_header(loose_text.size(), ref_text.size());
    ref_delta.insert(ref_delta.end(), {0x90, static_cast<std::uint8_t>(loose_text.size()), 5});
    ref_delta.insert(ref_delta.end(), ref_text.end() - 5, ref_text.end());
    const oid ref_id = object_id("blob", ref_text);
    b.add_ref_delta(loose_id, ref_id, ref_delta);

    b.add_whole(1, "commit", commit_text);
    const std::string commit_hex = chronolog::to_hex(object_id("commit", commit_text));
    b.finish(writer.git_dir() / "objects" / "pack");

    std::ofstream(writer.git_dir() / "packed-refs")
        << "# pack-refs with: peeled fully-peeled sorted \n"
        << commit_hex << " refs/tags/v1\n";

    // fresh handle so the pack directory is scanned again
    const chronolog::Repository repo{t.root()};
    const auto &store = repo.store();

    const auto whole = store.read(chronolog::to_hex(object_id("blob", base_text)));
    bool ok = expect(whole.type == "blob" && whole.data == bytes_of(base_text), "whole object");

    const auto ofs = store.read(chronolog::to_hex(ofs_id));
    ok = ok && expect(ofs.type == "blob" && ofs.data == bytes_of(ofs_text), "OFS_DELTA");

    const auto ref = store.read(chronolog::to_hex(ref_id));
    ok = ok && expect(ref.data == bytes_of(ref_text), "REF_DELTA against a loose base");

    ok = ok && expect(store.contains(commit_hex), "packed commit present");
    ok = ok && expect(repo.resolve_revision("v1") == commit_hex, "packed-refs tag");
    ok = ok && expect(repo.resolve_revision(commit_hex.substr(0, 7)) == commit_hex,
                      "abbreviated packed id");
    ok = ok && expect(repo.read_commit(commit_hex).message == "packed commit\n", "commit body");

    const auto tags = chronolog::list_refs(repo.git_dir(), "refs/tags/");
    ok = ok && expect(tags.size() == 1 && tags.begin()->second == commit_hex, "list packed refs");

    bool threw = false;
    try {
      (void)chronolog::apply_delta(bytes_of("abc"), ofs_delta);
    } catch (const std::runtime_error &) {
      threw = true;
    }
    ok = ok && expect(threw, "delta against the wrong base is rejected");
    if (!ok)
      return 1;
  } catch (const std::exception &e) {
    std::cerr << "exception: " << e.what() << "\n";
    return 1;
  }
  std::cout << "pack read OK\n";
  return 0;
}
