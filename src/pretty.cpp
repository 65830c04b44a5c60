#include "chronolog/pretty.hpp"

#include "chronolog/consts.hpp"
#include "chronolog/hash.hpp"
#include "chronolog/util.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <charconv>
#include <sstream>
#include <system_error>
#include <vector>

namespace chronolog::pretty {

namespace {

struct WrapSpec {
  int width = 0;
  int indent1 = 0;
  int indent2 = 0;
  [[nodiscard]] bool active() const { return width != 0 || indent1 != 0 || indent2 != 0; }
};

bool is_blank(std::string_view line) {
  return strutil::trim(line).empty();
}

std::string join_abbrev(const std::vector<std::string> &ids, bool abbreviate) {
  std::string out;
  for (const auto &id : ids) {
    if (!out.empty())
      out.push_back(' ');
    out += abbreviate ? abbrev(id, consts::kAbbrevLen) : id;
  }
  return out;
}

// "%w(64,4,4)" starting at `pos` (which points at 'w'); returns chars consumed or 0.
std::size_t parse_wrap(std::string_view fmt, std::size_t pos, WrapSpec &out) {
  if (pos + 1 >= fmt.size() || fmt[pos + 1] != '(')
    return 0;
  const auto close = fmt.find(')', pos + 2);
  if (close == std::string_view::npos)
    return 0;
  std::string_view args = fmt.substr(pos + 2, close - pos - 2);
  std::array<int, 3> vals{0, 0, 0};
  for (std::size_t i = 0; i < vals.size() && !args.empty(); ++i) {
    const auto comma = args.find(',');
    std::string trimmed = strutil::trim(args.substr(0, comma));
    if (!trimmed.empty() &&
        std::from_chars(trimmed.data(), trimmed.data() + trimmed.size(), vals[i]).ec !=
            std::errc{})
      return 0;
    args = comma == std::string_view::npos ? std::string_view{} : args.substr(comma + 1);
  }
  out = WrapSpec{vals[0], vals[1], vals[2]};
  return close - pos + 1;
}

// Color placeholders: %Cred %Cgreen %Cblue %Creset %C(...)
std::size_t skip_color(std::string_view fmt, std::size_t pos) {
  const std::string_view rest = fmt.substr(pos + 1);
  if (!rest.empty() && rest.front() == '(') {
    const auto close = rest.find(')');
    return close == std::string_view::npos ? 0 : close + 2;
  }
  for (const std::string_view name : {"red", "green", "blue", "reset"}) {
    if (rest.rfind(name, 0) == 0)
      return name.size() + 1;
  }
  return 0;
}

// Person placeholders %a? / %c?; returns false for an unknown letter.
bool expand_person(char which, const timeutil::Signature &sig, timeutil::DateMode mode,
                   std::string &out) {
  switch (which) {
  case 'n':
  case 'N':
    out += sig.name;
    return true;
  case 'e':
  case 'E':
    out += sig.email;
    return true;
  case 'd':
    out += timeutil::format_date(sig, mode);
    return true;
  case 't':
    out += timeutil::format_date(sig, timeutil::DateMode::Unix);
    return true;
  case 'i':
    out += timeutil::format_date(sig, timeutil::DateMode::Iso);
    return true;
  case 'I':
    out += timeutil::format_date(sig, timeutil::DateMode::IsoStrict);
    return true;
  case 's':
    out += timeutil::format_date(sig, timeutil::DateMode::Short);
    return true;
  case 'D':
    out += timeutil::format_date(sig, timeutil::DateMode::Rfc);
    return true;
  default:
    return false;
  }
}

void flush_segment(std::string &out, std::string &seg, const WrapSpec &spec) {
  if (spec.active())
    out += wrap_text(seg, spec.width, spec.indent1, spec.indent2);
  else
    out += seg;
  seg.clear();
}

} // namespace

std::string subject_of(std::string_view message) {
  std::string out;
  for (const auto &line : strutil::split_lines(message)) {
    if (is_blank(line)) {
      if (out.empty())
        continue;
      break;
    }
    if (!out.empty())
      out.push_back(' ');
    out += strutil::trim(line);
  }
  return out;
}

std::string body_of(std::string_view message) {
  std::size_t pos = 0;
  // skip leading blank lines, then the subject paragraph
  bool in_subject = false;
  while (pos < message.size()) {
    const auto nl = message.find('\n', pos);
    const auto line = message.substr(pos, nl == std::string_view::npos ? nl : nl - pos);
    const bool blank = is_blank(line);
    if (!blank)
      in_subject = true;
    else if (in_subject)
      break;
    if (nl == std::string_view::npos)
      return {};
    pos = nl + 1;
  }
  // skip the blank separator lines
  while (pos < message.size()) {
    const auto nl = message.find('\n', pos);
    const auto line = message.substr(pos, nl == std::string_view::npos ? nl : nl - pos);
    if (!is_blank(line))
      break;
    if (nl == std::string_view::npos)
      return {};
    pos = nl + 1;
  }
  return std::string(message.substr(pos));
}

std::string wrap_text(std::string_view text, int width, int indent1, int indent2) {
  if (text.empty())
    return {};
  const bool trailing_nl = text.back() == '\n';
  const auto lines = strutil::split_lines(text);
  std::vector<std::string> out;

  if (width <= 0) {
    for (const auto &line : lines) {
      const int indent = out.empty() ? indent1 : indent2;
      out.push_back(std::string(static_cast<std::size_t>(std::max(indent, 0)), ' ') + line);
    }
  } else {
    std::string cur;
    std::size_t cur_width = 0;
    const auto flush = [&] {
      if (!cur.empty()) {
        out.push_back(cur);
        cur.clear();
        cur_width = 0;
      }
    };
    for (const auto &line : lines) {
      if (is_blank(line)) {
        flush();
        out.emplace_back();
        continue;
      }
      if (!cur.empty() && std::isalnum(static_cast<unsigned char>(line.front())) == 0)
        flush();

      std::istringstream words(line);
      std::string word;
      while (words >> word) {
        const std::size_t wlen = strutil::utf8_length(word);
        if (cur.empty()) {
          const int indent = out.empty() ? indent1 : indent2;
          cur.assign(static_cast<std::size_t>(std::max(indent, 0)), ' ');
          cur += word;
          cur_width = static_cast<std::size_t>(std::max(indent, 0)) + wlen;
        } else if (cur_width + 1 + wlen <= static_cast<std::size_t>(width)) {
          cur.push_back(' ');
          cur += word;
          cur_width += 1 + wlen;
        } else {
          flush();
          cur.assign(static_cast<std::size_t>(std::max(indent2, 0)), ' ');
          cur += word;
          cur_width = static_cast<std::size_t>(std::max(indent2, 0)) + wlen;
        }
      }
    }
    flush();
  }

  std::string result;
  for (std::size_t i = 0; i < out.size(); ++i) {
    if (i != 0)
      result.push_back('\n');
    result += out[i];
  }
  if (trailing_nl)
    result.push_back('\n');
  return result;
}

std::string format_commit(std::string_view format, std::string_view commit_hex,
                          const Repository::CommitInfo &info, timeutil::DateMode date_mode) {
  std::string out;
  std::string seg;
  WrapSpec wrap;

  std::size_t i = 0;
  while (i < format.size()) {
    const char c = format[i];
    if (c != '%' || i + 1 >= format.size()) {
      seg.push_back(c);
      ++i;
      continue;
    }
    const std::size_t at = i + 1; // first char after '%'
    const char p = format[at];
    std::size_t used = 1;         // chars consumed after '%'
    switch (p) {
    case '%':
      seg.push_back('%');
      break;
    case 'n':
      seg.push_back('\n');
      break;
    case 'H':
      seg += commit_hex;
      break;
    case 'h':
      seg += abbrev(commit_hex, consts::kAbbrevLen);
      break;
    case 'T':
      seg += info.tree_hex;
      break;
    case 't':
      seg += abbrev(info.tree_hex, consts::kAbbrevLen);
      break;
    case 'P':
      seg += join_abbrev(info.parents, false);
      break;
    case 'p':
      seg += join_abbrev(info.parents, true);
      break;
    case 's':
      seg += subject_of(info.message);
      break;
    case 'b':
      seg += body_of(info.message);
      break;
    case 'B':
      seg += info.message;
      break;
    case 'a':
    case 'c': {
      const auto &sig = p == 'a' ? info.author : info.committer;
      if (at + 1 < format.size() && expand_person(format[at + 1], sig, date_mode, seg)) {
        used = 2;
      } else {
        used = 0;
      }
      break;
    }
    case 'x': {
      int byte = 0;
      const char *digits = format.data() + at + 1;
      if (at + 2 < format.size() &&
          std::from_chars(digits, digits + 2, byte, 16).ptr == digits + 2) {
        seg.push_back(static_cast<char>(byte));
        used = 3;
      } else {
        used = 0;
      }
      break;
    }
    case 'w': {
      WrapSpec next;
      used = parse_wrap(format, at, next);
      if (used != 0) {
        flush_segment(out, seg, wrap);
        wrap = next;
      }
      break;
    }
    case 'C':
      used = skip_color(format, at);
      break;
    default:
      used = 0;
      break;
    }

    if (used == 0) {
      // unknown placeholder: emit the '%' literally and keep scanning after it
      seg.push_back('%');
      i = at;
    } else {
      i = at + used;
    }
  }
  flush_segment(out, seg, wrap);
  return out;
}

} // namespace chronolog::pretty
