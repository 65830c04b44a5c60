#pragma once
#include <cstddef>
#include <cstdint>
#include <string_view>

namespace chronolog::consts {

// Directory and file names inside a git dir
inline constexpr std::string_view kGitDir      = ".git";
inline constexpr std::string_view kObjectsDir  = "objects";
inline constexpr std::string_view kPackDir     = "pack";
inline constexpr std::string_view kRefsDir     = "refs";
inline constexpr std::string_view kHeadsDir    = "heads";
inline constexpr std::string_view kTagsDir     = "tags";
inline constexpr std::string_view kHeadFile    = "HEAD";
inline constexpr std::string_view kPackedRefs  = "packed-refs";
inline constexpr std::string_view kConfigFile  = "config";
inline constexpr std::string_view kDefaultBranch = "master";

// Ref namespaces
inline constexpr std::string_view kHeadsPrefix   = "refs/heads/";
inline constexpr std::string_view kTagsPrefix    = "refs/tags/";
inline constexpr std::string_view kRemotesPrefix = "refs/remotes/";

// Git object type strings
inline constexpr std::string_view kTypeBlob    = "blob";
inline constexpr std::string_view kTypeTree    = "tree";
inline constexpr std::string_view kTypeCommit  = "commit";
inline constexpr std::string_view kTypeTag     = "tag";

// Tree entry mode of a regular file (octal)
inline constexpr std::uint32_t kModeFile = 0100644;

// ——— Object ID sizes ———
inline constexpr std::size_t kOidRawLen = 20;  // 20 bytes (SHA-1)
inline constexpr std::size_t kOidHexLen = 40;  // 40 hex chars (SHA-1)
inline constexpr std::size_t kAbbrevLen = 7;   // %h / short ref width
inline constexpr std::size_t kMinAbbrevLen = 4;

// ——— Object store fanout ———
inline constexpr std::size_t kFanoutDirHexLen = 2; // "aa/" + "bbbb..." in .git/objects

// ——— Commit / tag header prefixes ———
inline constexpr std::string_view kTreePrefix      = "tree ";
inline constexpr std::string_view kRefPrefix       = "ref: ";
inline constexpr std::string_view kGitdirPrefix    = "gitdir: ";
inline constexpr std::string_view kParentPrefix    = "parent ";
inline constexpr std::string_view kAuthorPrefix    = "author ";
inline constexpr std::string_view kCommitterPrefix = "committer ";
inline constexpr std::string_view kObjectPrefix    = "object ";
inline constexpr std::string_view kTypePrefix      = "type ";
inline constexpr std::string_view kTagPrefix       = "tag ";
inline constexpr std::string_view kTaggerPrefix    = "tagger ";

// ——— Common characters ———
inline constexpr char kSpace = ' ';
inline constexpr char kNul   = '\0';
inline constexpr char kLF    = '\n';

// ——— Changelog defaults ———
inline constexpr std::string_view kDefaultFormat      = "  * %s";
inline constexpr std::string_view kDefaultMergeFormat = "  * %s%n%w(64,4,4)%b";
inline constexpr std::string_view kDefaultUntaggedTitle = "n.n.n";
inline constexpr std::string_view kDefaultChangelogFile = "History.md";
inline constexpr std::string_view kDecorationTag   = "tag: ";
inline constexpr std::string_view kDecorationHead  = "HEAD";
inline constexpr char kUnderline = '=';

} // namespace chronolog::consts
