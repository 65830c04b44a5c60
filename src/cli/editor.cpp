#include "cli/editor.hpp"

#include <cerrno>
#include <cstdlib>
#include <stdexcept>
#include <vector>

#include <sys/wait.h>
#include <unistd.h>

namespace chronolog::cli {

namespace {

constexpr const char *kShell = "/bin/sh";
constexpr const char *kFallbackEditor = "vi";

const char *non_empty_env(const char *name) {
  const char *v = std::getenv(name);
  return v != nullptr && *v != '\0' ? v : nullptr;
}

} // namespace

std::string pick_editor(const std::string &core_editor) {
  if (const char *v = non_empty_env("GIT_EDITOR"))
    return v;
  if (!core_editor.empty())
    return core_editor;
  if (const char *v = non_empty_env("VISUAL"))
    return v;
  if (const char *v = non_empty_env("EDITOR"))
    return v;
  return kFallbackEditor;
}

int launch_editor(const std::string &editor, const std::filesystem::path &file) {
  const std::string script = editor + " \"$@\"";
  const std::string path = file.string();

  const pid_t pid = fork();
  if (pid < 0)
    throw std::runtime_error("editor: fork failed");

  if (pid == 0) {
    std::vector<const char *> args = {"sh", "-c", script.c_str(), editor.c_str(), path.c_str(),
                                      nullptr};
    execvp(kShell, const_cast<char *const *>(args.data()));
    _exit(127); // exec failed
  }

  int status = 0;
  while (waitpid(pid, &status, 0) < 0) {
    if (errno != EINTR)
      throw std::runtime_error("editor: waitpid failed");
  }
  if (WIFEXITED(status))
    return WEXITSTATUS(status);
  return 128 + (WIFSIGNALED(status) ? WTERMSIG(status) : 0);
}

} // namespace chronolog::cli
