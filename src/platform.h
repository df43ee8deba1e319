#pragma once

#include <filesystem>
#include <optional>

namespace dbuild::platform {

void atomic_rename(std::filesystem::path const &from, std::filesystem::path const &to);
void touch_file(std::filesystem::path const &path);
bool file_exists(std::filesystem::path const &path);

// DBUILD_HOME, else $XDG_CACHE_HOME/dbuild, else $HOME/.cache/dbuild
std::optional<std::filesystem::path> get_default_work_root();
char const *get_default_work_root_env_vars();

bool is_tty();

}  // namespace dbuild::platform
