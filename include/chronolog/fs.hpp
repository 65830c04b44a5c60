#pragma once
#include <cstdint>
#include <filesystem>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace chronolog::fs {

bool exists(const std::filesystem::path& p);
bool is_regular(const std::filesystem::path& p);
void ensure_parent_dir(const std::filesystem::path& p);

std::vector<std::uint8_t> read_file(const std::filesystem::path& p);
std::string read_text(const std::filesystem::path& p);

// Write to "<p>.tmp" then rename over `p`; readers never observe a partial file.
void write_file_atomic(const std::filesystem::path& p, std::span<const std::uint8_t> data);
void write_text_atomic(const std::filesystem::path& p, std::string_view text);

std::vector<std::uint8_t> z_compress(std::span<const std::uint8_t> data);
std::vector<std::uint8_t> z_decompress(std::span<const std::uint8_t> data);

// Inflate one zlib stream from the front of `data` whose inflated size is known
// (pack entries). Trailing bytes after the stream are ignored.
std::vector<std::uint8_t> z_inflate_sized(std::span<const std::uint8_t> data,
                                          std::size_t inflated_size);

} // namespace chronolog::fs
