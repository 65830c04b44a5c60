#pragma once
#include <string>
#include <string_view>
#include <vector>

namespace chronolog {

// Validate 40-char lowercase/uppercase hex
auto looks_hex40(std::string_view str) -> bool;

// Hex string usable as an abbreviated object id (4..40 chars)
auto looks_hex_prefix(std::string_view str) -> bool;

// String helpers
namespace strutil {
  // Strip trailing CR/LF characters in place
  void rstrip_newlines(std::string& str);

  // Copy without leading/trailing spaces, tabs and CR
  auto trim(std::string_view sv) -> std::string;

  // Split on '\n'; a trailing newline does not produce an empty last element.
  auto split_lines(std::string_view text) -> std::vector<std::string>;

  auto to_lower(std::string_view sv) -> std::string;

  // Number of UTF-8 code points (continuation bytes are not counted)
  auto utf8_length(std::string_view sv) -> std::size_t;
}

}
