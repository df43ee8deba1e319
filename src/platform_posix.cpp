#include "platform.h"

#include <fcntl.h>
#include <unistd.h>

#include <cerrno>
#include <cstdio>
#include <cstdlib>
#include <string>
#include <system_error>

namespace dbuild::platform {

std::optional<std::filesystem::path> get_default_work_root() {
  if (char const *env_root{ std::getenv("DBUILD_HOME") }) {
    return std::filesystem::path{ env_root };
  }

  if (char const *xdg_cache{ std::getenv("XDG_CACHE_HOME") }) {
    return std::filesystem::path{ xdg_cache } / "dbuild";
  }

  if (char const *home{ std::getenv("HOME") }) {
    return std::filesystem::path{ home } / ".cache" / "dbuild";
  }

  return std::nullopt;
}

char const *get_default_work_root_env_vars() {
  return "DBUILD_HOME, XDG_CACHE_HOME or HOME";
}

void atomic_rename(std::filesystem::path const &from, std::filesystem::path const &to) {
  if (::rename(from.c_str(), to.c_str()) != 0) {
    throw std::system_error(errno,
                            std::system_category(),
                            "Failed to rename " + from.string() + " to " + to.string());
  }
}

void touch_file(std::filesystem::path const &path) {
  int const fd{ ::open(path.c_str(), O_CREAT | O_WRONLY, 0644) };
  if (fd == -1) {
    throw std::system_error(errno,
                            std::system_category(),
                            "Failed to touch file: " + path.string());
  }
  ::close(fd);
}

bool file_exists(std::filesystem::path const &path) {
  return std::filesystem::exists(path);
}

bool is_tty() { return ::isatty(::fileno(stderr)) != 0; }

}  // namespace dbuild::platform
