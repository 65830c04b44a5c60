#pragma once
#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <string_view>

namespace chronolog {

// All functions here take the git directory itself (".git"), not the work tree.

// "refs/heads/<branch>", "refs/tags/<tag>"
std::string heads_ref(std::string_view branch);
std::string tags_ref(std::string_view tag);

// Read HEAD file as raw string (e.g., "ref: refs/heads/master\n" or a 40-hex id).
// Returns std::nullopt if HEAD does not exist yet.
std::optional<std::string> read_HEAD(const std::filesystem::path& gitdir);

struct HeadState {
  std::string branch;   // "refs/heads/<name>", empty when detached
  std::string commit;   // 40-hex tip, empty on an unborn branch
};

// Resolve HEAD through at most one level of symbolic indirection.
HeadState resolve_head(const std::filesystem::path& gitdir);

// Write symbolic HEAD: "ref: <refname>\n"
void set_HEAD_symbolic(const std::filesystem::path& gitdir, const std::string& refname);
void set_HEAD_detached(const std::filesystem::path& gitdir, std::string_view hex_oid);

// Look up a full ref name (e.g. "refs/tags/v1.0") in the loose ref files, then
// in packed-refs. Symbolic refs are followed. Returns the 40-hex id.
std::optional<std::string> read_ref(const std::filesystem::path& gitdir, const std::string& refname);

// Overwrite/create a loose ref with the given 40-hex OID.
void update_ref(const std::filesystem::path& gitdir, const std::string& refname, const std::string& hex_oid);

// Every ref under `prefix` ("refs/tags/", "refs/" ...) mapped to its 40-hex id.
// Loose refs shadow packed ones of the same name.
std::map<std::string, std::string> list_refs(const std::filesystem::path& gitdir,
                                             std::string_view prefix);

} // namespace chronolog
