#include "shell.h"

#include "doctest.h"

#include <atomic>
#include <chrono>
#include <csignal>
#include <filesystem>
#include <optional>
#include <string>
#include <thread>
#include <vector>

namespace fs = std::filesystem;

namespace {

std::vector<std::string> run_collect(std::string_view script,
                                     std::optional<fs::path> cwd = std::nullopt,
                                     dbuild::shell_env_t env = dbuild::shell_getenv()) {
  std::vector<std::string> lines;
  dbuild::shell_run_cfg cfg{
    .on_stdout_line = [&](std::string_view line) { lines.emplace_back(line); },
    .cwd = std::move(cwd),
    .env = std::move(env),
  };
  auto const result{ dbuild::shell_run(script, cfg) };
  REQUIRE(result.exit_code == 0);
  REQUIRE(!result.signal);
  return lines;
}

}  // namespace

TEST_CASE("shell_getenv captures PATH from environment") {
  auto const env{ dbuild::shell_getenv() };
  CHECK(env.contains("PATH"));
}

TEST_CASE("shell_run executes multiple lines") {
  auto lines{ run_collect("echo first\nprintf 'second\\n'\n") };
  REQUIRE(lines.size() == 2);
  CHECK(lines[0] == "first");
  CHECK(lines[1] == "second");
}

TEST_CASE("shell_run exposes custom environment variables") {
  auto env{ dbuild::shell_getenv() };
  env["DBUILD_SHELL_TEST"] = "ok";
  auto lines{ run_collect("printf '%s\\n' \"$DBUILD_SHELL_TEST\"", std::nullopt, env) };
  REQUIRE(lines.size() == 1);
  CHECK(lines[0] == "ok");
}

TEST_CASE("shell_run runs in the requested directory") {
  auto const dir{ fs::temp_directory_path() / "dbuild-shell-cwd" };
  fs::create_directories(dir);
  auto lines{ run_collect("pwd", dir) };
  REQUIRE(lines.size() == 1);
  CHECK(fs::equivalent(lines[0], dir));
  fs::remove_all(dir);
}

TEST_CASE("shell_run separates stdout and stderr") {
  std::vector<std::string> out;
  std::vector<std::string> err;
  dbuild::shell_run_cfg cfg{
    .on_stdout_line = [&](std::string_view line) { out.emplace_back(line); },
    .on_stderr_line = [&](std::string_view line) { err.emplace_back(line); },
    .env = dbuild::shell_getenv(),
  };
  auto const result{ dbuild::shell_run("echo out; echo err >&2", cfg) };
  CHECK(result.exit_code == 0);
  REQUIRE(out.size() == 1);
  REQUIRE(err.size() == 1);
  CHECK(out[0] == "out");
  CHECK(err[0] == "err");
}

TEST_CASE("shell_run surfaces non-zero exit codes") {
  dbuild::shell_run_cfg cfg{ .env = dbuild::shell_getenv() };
  auto const result{ dbuild::shell_run("exit 7", cfg) };
  CHECK(result.exit_code == 7);
  CHECK(!result.signal);
  CHECK(!result.canceled);
}

TEST_CASE("shell_run strict mode stops at first failing command") {
  std::vector<std::string> lines;
  dbuild::shell_run_cfg cfg{
    .on_stdout_line = [&](std::string_view line) { lines.emplace_back(line); },
    .env = dbuild::shell_getenv(),
  };
  auto const result{ dbuild::shell_run("false\necho after", cfg) };
  CHECK(result.exit_code != 0);
  CHECK(lines.empty());
}

TEST_CASE("shell_run delivers trailing partial lines") {
  auto lines{ run_collect("printf 'without-newline'") };
  REQUIRE(lines.size() == 1);
  CHECK(lines[0] == "without-newline");
}

TEST_CASE("shell_run handles signal termination") {
  dbuild::shell_run_cfg cfg{ .env = dbuild::shell_getenv() };
  auto const result{ dbuild::shell_run("kill -TERM $$", cfg) };
  CHECK(result.exit_code == (128 + SIGTERM));
  REQUIRE(result.signal.has_value());
  CHECK(*result.signal == SIGTERM);
}

TEST_CASE("shell_run cancel flag kills a long-running child") {
  std::atomic_bool cancel{ false };
  dbuild::shell_run_cfg cfg{ .env = dbuild::shell_getenv(), .cancel = &cancel };

  std::thread canceller{ [&] {
    std::this_thread::sleep_for(std::chrono::milliseconds{ 200 });
    cancel = true;
  } };

  auto const start{ std::chrono::steady_clock::now() };
  auto const result{ dbuild::shell_run("sleep 30", cfg) };
  canceller.join();

  CHECK(result.canceled);
  CHECK(result.exit_code != 0);
  CHECK(std::chrono::steady_clock::now() - start < std::chrono::seconds{ 10 });
}

TEST_CASE("shell_run with cancel already set does not start") {
  std::atomic_bool cancel{ true };
  bool saw_output{ false };
  dbuild::shell_run_cfg cfg{
    .on_stdout_line = [&](std::string_view) { saw_output = true; },
    .env = dbuild::shell_getenv(),
    .cancel = &cancel,
  };
  auto const result{ dbuild::shell_run("echo hi", cfg) };
  CHECK(result.canceled);
  CHECK_FALSE(saw_output);
}

TEST_CASE("shell_run reports missing working directory as child error") {
  dbuild::shell_run_cfg cfg{ .cwd = "/nonexistent/directory/path",
                             .env = dbuild::shell_getenv() };
  auto const result{ dbuild::shell_run("echo hi", cfg) };
  CHECK(result.exit_code == 127);
}
