#include "cli/options.hpp"

#include "chronolog/error.hpp"

#include <string_view>

namespace chronolog::cli {

namespace {

enum class Flag : unsigned char {
  All,
  List,
  Tag,
  FinalTag,
  StartTag,
  StartCommit,
  NoMerges,
  MergesOnly,
  PruneOld,
  Stdout,
  Help
};

struct Spec {
  char short_name; // '\0' when long-only
  std::string_view long_name;
  Flag flag;
  bool takes_value;
};

constexpr Spec kSpecs[] = {
    {'a', "all", Flag::All, false},
    {'l', "list", Flag::List, false},
    {'t', "tag", Flag::Tag, true},
    {'f', "final-tag", Flag::FinalTag, true},
    {'s', "start-tag", Flag::StartTag, true},
    {'\0', "start-commit", Flag::StartCommit, true},
    {'n', "no-merges", Flag::NoMerges, false},
    {'m', "merges-only", Flag::MergesOnly, false},
    {'p', "prune-old", Flag::PruneOld, false},
    {'x', "stdout", Flag::Stdout, false},
    {'h', "help", Flag::Help, false},
};

const Spec *by_short(char c) {
  for (const auto &s : kSpecs) {
    if (s.short_name != '\0' && s.short_name == c)
      return &s;
  }
  return nullptr;
}

const Spec *by_long(std::string_view name) {
  for (const auto &s : kSpecs) {
    if (s.long_name == name)
      return &s;
  }
  return nullptr;
}

void apply(Options &o, Flag flag, const std::string &value) {
  switch (flag) {
  case Flag::All:
    o.all = true;
    break;
  case Flag::List:
    o.list = true;
    break;
  case Flag::Tag:
    o.untagged_title = value;
    break;
  case Flag::FinalTag:
    o.final_tag = value;
    break;
  case Flag::StartTag:
    o.start_tag = value;
    break;
  case Flag::StartCommit:
    o.start_commit = value;
    break;
  case Flag::NoMerges:
    o.no_merges = true;
    break;
  case Flag::MergesOnly:
    o.merges_only = true;
    break;
  case Flag::PruneOld:
    o.prune_old = true;
    break;
  case Flag::Stdout:
    o.to_stdout = true;
    break;
  case Flag::Help:
    o.help = true;
    break;
  }
}

} // namespace

Options parse_options(const std::vector<std::string> &args) {
  Options o;
  bool only_positional = false;

  const auto positional = [&o](const std::string &arg) {
    if (o.file)
      throw ConfigError("unexpected argument: " + arg);
    o.file = arg;
  };

  for (std::size_t i = 0; i < args.size(); ++i) {
    const std::string &arg = args[i];
    if (only_positional || arg.size() < 2 || arg[0] != '-') {
      positional(arg);
      continue;
    }
    if (arg == "--") {
      only_positional = true;
      continue;
    }

    if (arg.rfind("--", 0) == 0) {
      const auto eq = arg.find('=');
      const std::string name = arg.substr(2, eq == std::string::npos ? eq : eq - 2);
      const Spec *spec = by_long(name);
      if (spec == nullptr)
        throw ConfigError("unknown option: --" + name);
      std::string value;
      if (spec->takes_value) {
        if (eq != std::string::npos)
          value = arg.substr(eq + 1);
        else if (i + 1 < args.size())
          value = args[++i];
        else
          throw ConfigError("option --" + name + " requires a value");
      } else if (eq != std::string::npos) {
        throw ConfigError("option --" + name + " takes no value");
      }
      apply(o, spec->flag, value);
      continue;
    }

    // bundled short flags; a value-taking flag consumes the rest of the bundle
    for (std::size_t j = 1; j < arg.size(); ++j) {
      const Spec *spec = by_short(arg[j]);
      if (spec == nullptr)
        throw ConfigError(std::string("unknown option: -") + arg[j]);
      if (!spec->takes_value) {
        apply(o, spec->flag, {});
        continue;
      }
      std::string value;
      if (j + 1 < arg.size())
        value = arg.substr(j + 1);
      else if (i + 1 < args.size())
        value = args[++i];
      else
        throw ConfigError(std::string("option -") + arg[j] + " requires a value");
      apply(o, spec->flag, value);
      break;
    }
  }

  if (o.no_merges && o.merges_only)
    throw ConfigError("--no-merges and --merges-only are mutually exclusive");
  if (o.start_tag && o.start_commit)
    throw ConfigError("--start-tag and --start-commit are mutually exclusive");
  return o;
}

std::string usage() {
  return "usage: git-changelog [options] [<file>]\n"
         "\n"
         "  -a, --all                 render the whole history as one section\n"
         "  -l, --list                list commits without section headings\n"
         "  -t, --tag <name>          title of the unreleased section (default n.n.n)\n"
         "  -f, --final-tag <tag>     newest tag to include\n"
         "  -s, --start-tag <tag>     oldest tag to include\n"
         "      --start-commit <ref>  oldest commit to include\n"
         "  -n, --no-merges           leave out merge commits\n"
         "  -m, --merges-only         only merge commits, with their bodies\n"
         "  -p, --prune-old           replace the existing changelog instead of appending it\n"
         "  -x, --stdout              write to stdout instead of the changelog file\n"
         "  -h, --help                show this help\n";
}

} // namespace chronolog::cli
