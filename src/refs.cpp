#include "chronolog/refs.hpp"

#include "chronolog/consts.hpp"
#include "chronolog/fs.hpp"
#include "chronolog/util.hpp"

#include <sstream>
#include <string>
#include <string_view>

namespace chronolog {

namespace {

constexpr int kMaxSymrefDepth = 5;

std::filesystem::path head_file(const std::filesystem::path &gitdir) {
  return gitdir / consts::kHeadFile;
}

std::filesystem::path ref_path(const std::filesystem::path &gitdir, const std::string &refname) {
  return gitdir / refname;
}

void write_line(const std::filesystem::path &p, const std::string &line) {
  fs::write_text_atomic(p, line + "\n");
}

// packed-refs: "<hex> <refname>" lines, "^<hex>" peel lines, "#" header.
std::map<std::string, std::string> packed_refs(const std::filesystem::path &gitdir) {
  std::map<std::string, std::string> out;
  const auto p = gitdir / consts::kPackedRefs;
  if (!fs::is_regular(p))
    return out;
  std::istringstream iss(fs::read_text(p));
  std::string line;
  while (std::getline(iss, line)) {
    strutil::rstrip_newlines(line);
    if (line.empty() || line[0] == '#' || line[0] == '^')
      continue;
    const auto sp = line.find(consts::kSpace);
    if (sp != consts::kOidHexLen)
      continue;
    out[line.substr(sp + 1)] = line.substr(0, sp);
  }
  return out;
}

std::optional<std::string> read_loose_raw(const std::filesystem::path &gitdir,
                                          const std::string &refname) {
  const auto p = ref_path(gitdir, refname);
  if (!fs::is_regular(p))
    return std::nullopt;
  std::string s = fs::read_text(p);
  strutil::rstrip_newlines(s);
  return s;
}

void collect_loose(const std::filesystem::path &gitdir, const std::filesystem::path &dir,
                   std::map<std::string, std::string> &out) {
  std::error_code ec;
  if (!std::filesystem::is_directory(dir, ec))
    return;
  for (const auto &entry : std::filesystem::recursive_directory_iterator(dir, ec)) {
    if (!entry.is_regular_file())
      continue;
    const std::string name = entry.path().lexically_relative(gitdir).generic_string();
    if (auto hex = read_ref(gitdir, name); hex)
      out[name] = *hex;
  }
}

} // namespace

std::string heads_ref(std::string_view branch) {
  return std::string(consts::kHeadsPrefix) + std::string(branch);
}

std::string tags_ref(std::string_view tag) {
  return std::string(consts::kTagsPrefix) + std::string(tag);
}

std::optional<std::string> read_HEAD(const std::filesystem::path &gitdir) {
  const auto p = head_file(gitdir);
  if (!fs::exists(p)) {
    return std::nullopt;
  }
  return fs::read_text(p);
}

HeadState resolve_head(const std::filesystem::path &gitdir) {
  HeadState st;
  auto head = read_HEAD(gitdir);
  if (!head)
    return st;
  strutil::rstrip_newlines(*head);
  if (head->rfind(consts::kRefPrefix, 0) == 0) {
    st.branch = head->substr(consts::kRefPrefix.size());
    if (auto tip = read_ref(gitdir, st.branch); tip)
      st.commit = *tip;
  } else if (looks_hex40(*head)) {
    st.commit = *head;
  }
  return st;
}

void set_HEAD_symbolic(const std::filesystem::path &gitdir, const std::string &refname) {
  write_line(head_file(gitdir), std::string(consts::kRefPrefix) + refname);
}

void set_HEAD_detached(const std::filesystem::path &gitdir, std::string_view hex_oid) {
  write_line(head_file(gitdir), std::string(hex_oid));
}

std::optional<std::string> read_ref(const std::filesystem::path &gitdir,
                                    const std::string &refname) {
  std::string name = refname;
  for (int depth = 0; depth < kMaxSymrefDepth; ++depth) {
    auto raw = read_loose_raw(gitdir, name);
    if (!raw) {
      const auto packed = packed_refs(gitdir);
      const auto it = packed.find(name);
      if (it == packed.end())
        return std::nullopt;
      return it->second;
    }
    if (raw->rfind(consts::kRefPrefix, 0) == 0) {
      name = raw->substr(consts::kRefPrefix.size());
      continue;
    }
    if (!looks_hex40(*raw))
      return std::nullopt;
    return *raw;
  }
  return std::nullopt;
}

void update_ref(const std::filesystem::path &gitdir, const std::string &refname,
                const std::string &hex_oid) {
  write_line(ref_path(gitdir, refname), hex_oid);
}

std::map<std::string, std::string> list_refs(const std::filesystem::path &gitdir,
                                             std::string_view prefix) {
  std::map<std::string, std::string> out;
  for (auto &[name, hex] : packed_refs(gitdir)) {
    if (name.rfind(prefix, 0) == 0)
      out[name] = hex;
  }
  // Loose refs shadow packed entries of the same name.
  std::string dir(prefix);
  while (!dir.empty() && dir.back() == '/')
    dir.pop_back();
  collect_loose(gitdir, gitdir / dir, out);
  return out;
}

} // namespace chronolog
