#include "chronolog/config.hpp"

#include "chronolog/consts.hpp"
#include "chronolog/error.hpp"
#include "chronolog/fs.hpp"
#include "chronolog/repo.hpp"
#include "chronolog/util.hpp"

#include <cctype>
#include <cstdlib>
#include <sstream>
#include <stdexcept>
#include <string_view>

namespace {

class ConfigParser {
public:
  ConfigParser(std::string_view text, std::string_view origin,
               std::map<std::string, std::string> &out)
      : text_(text), origin_(origin), out_(out) {}

  void run() {
    while (pos_ < text_.size()) {
      const char c = text_[pos_];
      if (c == ' ' || c == '\t' || c == '\r' || c == '\n') {
        advance();
      } else if (c == '#' || c == ';') {
        skip_line();
      } else if (c == '[') {
        parse_header();
      } else {
        parse_entry();
      }
    }
  }

private:
  void advance() {
    if (text_[pos_] == '\n')
      ++line_;
    ++pos_;
  }

  [[noreturn]] void fail(std::string_view what) const {
    throw std::runtime_error("bad config line " + std::to_string(line_) + " in " +
                             std::string(origin_) + ": " + std::string(what));
  }

  void skip_line() {
    while (pos_ < text_.size() && text_[pos_] != '\n')
      ++pos_;
  }

  void parse_header() {
    ++pos_; // '['
    std::string name;
    while (pos_ < text_.size()) {
      const char c = text_[pos_];
      if (std::isalnum(static_cast<unsigned char>(c)) != 0 || c == '-' || c == '.') {
        name.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
        ++pos_;
      } else {
        break;
      }
    }
    if (name.empty())
      fail("empty section name");

    if (pos_ < text_.size() && (text_[pos_] == ' ' || text_[pos_] == '\t')) {
      while (pos_ < text_.size() && (text_[pos_] == ' ' || text_[pos_] == '\t'))
        ++pos_;
      if (pos_ >= text_.size() || text_[pos_] != '"')
        fail("expected quoted subsection");
      ++pos_;
      std::string sub;
      while (pos_ < text_.size() && text_[pos_] != '"') {
        if (text_[pos_] == '\n')
          fail("newline in subsection");
        if (text_[pos_] == '\\' && pos_ + 1 < text_.size())
          ++pos_;
        sub.push_back(text_[pos_++]);
      }
      if (pos_ >= text_.size())
        fail("unterminated subsection");
      ++pos_; // closing quote
      name += '.';
      name += sub;
    }
    if (pos_ >= text_.size() || text_[pos_] != ']')
      fail("expected ']'");
    ++pos_;
    section_ = std::move(name);
  }

  void parse_entry() {
    std::string key;
    while (pos_ < text_.size()) {
      const char c = text_[pos_];
      if (std::isalnum(static_cast<unsigned char>(c)) != 0 || c == '-') {
        key.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
        ++pos_;
      } else {
        break;
      }
    }
    if (key.empty())
      fail("expected a key");
    if (section_.empty())
      fail("key outside of any section");

    while (pos_ < text_.size() && (text_[pos_] == ' ' || text_[pos_] == '\t'))
      ++pos_;

    std::string value = "true"; // a bare key is a boolean
    if (pos_ < text_.size() && text_[pos_] == '=') {
      ++pos_;
      value = parse_value();
    } else if (pos_ < text_.size() && text_[pos_] != '\n' && text_[pos_] != '\r' &&
               text_[pos_] != '#' && text_[pos_] != ';') {
      fail("expected '='");
    } else {
      skip_line();
    }
    out_[section_ + "." + key] = std::move(value);
  }

  std::string parse_value() {
    std::string value;
    std::string pending_ws;
    bool quoted = false;
    while (pos_ < text_.size()) {
      const char c = text_[pos_];
      if (c == '\n') {
        if (quoted)
          fail("newline in quoted value");
        break;
      }
      if (!quoted && (c == '#' || c == ';')) {
        skip_line();
        break;
      }
      ++pos_;
      if (c == '\r' && pos_ < text_.size() && text_[pos_] == '\n') {
        continue;
      }
      if (c == '\\') {
        if (pos_ >= text_.size())
          fail("trailing backslash");
        const char esc = text_[pos_++];
        switch (esc) {
        case '\r':
          if (pos_ < text_.size() && text_[pos_] == '\n')
            ++pos_;
          ++line_;
          continue;
        case '\n':
          ++line_;
          continue; // line continuation
        case 'n':
          value += pending_ws + '\n';
          break;
        case 't':
          value += pending_ws + '\t';
          break;
        case 'b':
          value += pending_ws + '\b';
          break;
        case '\\':
        case '"':
          value += pending_ws + esc;
          break;
        default:
          fail("bad escape sequence");
        }
        pending_ws.clear();
        continue;
      }
      if (c == '"') {
        quoted = !quoted;
        continue;
      }
      if (!quoted && (c == ' ' || c == '\t')) {
        if (!value.empty())
          pending_ws.push_back(c);
        continue;
      }
      value += pending_ws;
      pending_ws.clear();
      value.push_back(c);
    }
    if (quoted)
      fail("unterminated quote");
    return value;
  }

  std::string_view text_;
  std::string_view origin_;
  std::map<std::string, std::string> &out_;
  std::string section_;
  std::size_t pos_ = 0;
  std::size_t line_ = 1;
};

// "Section.Sub.Key" -> "section.Sub.key"
std::string canonical_key(std::string_view key) {
  const auto first = key.find('.');
  const auto last = key.rfind('.');
  if (first == std::string_view::npos)
    return chronolog::strutil::to_lower(key);
  std::string out = chronolog::strutil::to_lower(key.substr(0, first));
  out += key.substr(first, last - first);
  out += chronolog::strutil::to_lower(key.substr(last));
  return out;
}

std::optional<std::string> env(const char *name) {
  const char *v = std::getenv(name);
  if (v == nullptr)
    return std::nullopt;
  return std::string(v);
}

} // namespace

namespace chronolog {

void GitConfig::load_file(const std::filesystem::path &path) {
  if (!fs::is_regular(path))
    return;
  load_text(fs::read_text(path), path.string());
}

void GitConfig::load_text(std::string_view text, std::string_view origin) {
  ConfigParser(text, origin, values_).run();
}

std::optional<std::string> GitConfig::get(std::string_view key) const {
  const auto it = values_.find(canonical_key(key));
  if (it == values_.end())
    return std::nullopt;
  return it->second;
}

GitConfig GitConfig::load_for(const Repository &repo) {
  GitConfig cfg;
  cfg.load_file("/etc/gitconfig");

  const auto home = env("HOME");
  if (const auto xdg = env("XDG_CONFIG_HOME"); xdg && !xdg->empty()) {
    cfg.load_file(std::filesystem::path(*xdg) / "git" / "config");
  } else if (home) {
    cfg.load_file(std::filesystem::path(*home) / ".config" / "git" / "config");
  }
  if (home) {
    cfg.load_file(std::filesystem::path(*home) / ".gitconfig");
  }
  cfg.load_file(repo.config_file());
  return cfg;
}

LogOptions parse_log_options(std::string_view opts) {
  LogOptions out;
  std::istringstream iss{std::string(opts)};
  std::string word;
  constexpr std::string_view kDatePrefix = "--date=";
  while (iss >> word) {
    if (word == "--no-merges") {
      out.merges = MergeFilter::NoMerges;
    } else if (word == "--merges") {
      out.merges = MergeFilter::MergesOnly;
    } else if (word == "--first-parent") {
      out.first_parent = true;
    } else if (word.rfind(kDatePrefix, 0) == 0) {
      const auto mode = timeutil::parse_date_mode(std::string_view(word).substr(kDatePrefix.size()));
      if (!mode)
        throw ConfigError("unsupported date format in log options: " + word);
      out.date_mode = *mode;
    } else {
      throw ConfigError("unsupported log option: " + word);
    }
  }
  return out;
}

ChangelogSettings load_settings(const GitConfig &config) {
  ChangelogSettings s;
  s.format = config.get("changelog.format").value_or(std::string(consts::kDefaultFormat));
  s.merge_format =
      config.get("changelog.mergeformat").value_or(std::string(consts::kDefaultMergeFormat));
  std::string opts = config.get("changelog.opts").value_or("");
  s.editor = config.get("core.editor").value_or("");

  if (auto v = env("GIT_CHANGELOG_FORMAT"); v && !v->empty())
    s.format = *v;
  if (auto v = env("GIT_CHANGELOG_MERGEFORMAT"); v && !v->empty())
    s.merge_format = *v;
  if (auto v = env("GIT_CHANGELOG_OPTS"); v)
    opts = *v;

  // Empty formats fall back to the defaults.
  if (s.format.empty())
    s.format = consts::kDefaultFormat;
  if (s.merge_format.empty())
    s.merge_format = consts::kDefaultMergeFormat;

  s.log = parse_log_options(opts);
  return s;
}

} // namespace chronolog
