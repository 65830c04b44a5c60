#pragma once
#include <filesystem>
#include <string>

namespace chronolog::cli {

// GIT_EDITOR, then core.editor, then VISUAL, then EDITOR, then "vi".
std::string pick_editor(const std::string& core_editor);

// Run `editor file` through /bin/sh so editors with arguments work.
// Returns the editor's exit status; failing to start the shell throws.
int launch_editor(const std::string& editor, const std::filesystem::path& file);

} // namespace chronolog::cli
