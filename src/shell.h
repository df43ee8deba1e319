#pragma once

#include <atomic>
#include <filesystem>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>

namespace dbuild {

using shell_env_t = std::unordered_map<std::string, std::string>;

struct shell_result {
  int exit_code;
  std::optional<int> signal;
  bool canceled{ false };
};

struct shell_run_cfg {
  std::function<void(std::string_view)> on_stdout_line;
  std::function<void(std::string_view)> on_stderr_line;
  std::optional<std::filesystem::path> cwd;
  shell_env_t env;
  bool strict{ true };  // bash -e -u

  // Polled while the child runs; when set, the child's process group is killed and the
  // result is reported as canceled.
  std::atomic_bool const *cancel{ nullptr };
};

shell_env_t shell_getenv();
shell_result shell_run(std::string_view script, shell_run_cfg const &cfg);

}  // namespace dbuild
