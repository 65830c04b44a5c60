// String and hex helpers shared by the repository and rendering layers
#include "chronolog/util.hpp"

#include "chronolog/consts.hpp"

#include <algorithm>
#include <cctype>

namespace chronolog {

namespace {
bool is_hex_char(char c) { return std::isxdigit(static_cast<unsigned char>(c)) != 0; }
} // namespace

bool looks_hex40(std::string_view str) {
  if (str.size() != consts::kOidHexLen) {
    return false;
  }
  return std::ranges::all_of(str, is_hex_char);
}

bool looks_hex_prefix(std::string_view str) {
  if (str.size() < consts::kMinAbbrevLen || str.size() > consts::kOidHexLen) {
    return false;
  }
  return std::ranges::all_of(str, is_hex_char);
}

namespace strutil {

void rstrip_newlines(std::string &s) {
  while (!s.empty()) {
    char c = s.back();
    if (c == '\n' || c == '\r') {
      s.pop_back();
    } else {
      break;
    }
  }
}

std::string trim(std::string_view sv) {
  while (!sv.empty() && (sv.front() == ' ' || sv.front() == '\t'))
    sv.remove_prefix(1);
  while (!sv.empty() && (sv.back() == ' ' || sv.back() == '\t' || sv.back() == '\r'))
    sv.remove_suffix(1);
  return std::string(sv);
}

std::vector<std::string> split_lines(std::string_view text) {
  std::vector<std::string> out;
  std::size_t start = 0;
  while (start < text.size()) {
    const auto nl = text.find('\n', start);
    if (nl == std::string_view::npos) {
      out.emplace_back(text.substr(start));
      break;
    }
    out.emplace_back(text.substr(start, nl - start));
    start = nl + 1;
  }
  return out;
}

std::string to_lower(std::string_view sv) {
  std::string out(sv);
  std::ranges::transform(out, out.begin(),
                         [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return out;
}

std::size_t utf8_length(std::string_view sv) {
  return static_cast<std::size_t>(std::ranges::count_if(
      sv, [](char c) { return (static_cast<unsigned char>(c) & 0xC0U) != 0x80U; }));
}

} // namespace strutil

} // namespace chronolog
