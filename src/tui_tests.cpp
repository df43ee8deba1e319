#include "tui.h"

#include "doctest.h"

#include <filesystem>
#include <fstream>
#include <stdexcept>
#include <string>
#include <string_view>
#include <system_error>
#include <thread>
#include <vector>

TEST_CASE("tui init can only run once") {
  CHECK_THROWS_AS(dbuild::tui::init(), std::logic_error);
}

TEST_CASE("tui enforces run/shutdown sequencing") {
  auto const handler{ [](std::string_view) {} };
  CHECK_NOTHROW(dbuild::tui::set_output_handler(handler));
  CHECK_NOTHROW(dbuild::tui::run(dbuild::tui::level::TUI_INFO));
  CHECK_NOTHROW(dbuild::tui::shutdown());

  CHECK_NOTHROW(dbuild::tui::run(std::nullopt));
  CHECK_THROWS_AS(dbuild::tui::set_output_handler(handler), std::logic_error);
  CHECK_THROWS_AS(dbuild::tui::run(std::nullopt), std::logic_error);

  CHECK_NOTHROW(dbuild::tui::shutdown());
  CHECK_THROWS_AS(dbuild::tui::shutdown(), std::logic_error);

  CHECK_NOTHROW(dbuild::tui::set_output_handler(handler));
}

namespace {

struct captured_output {
  std::vector<std::string> messages;

  captured_output() {
    dbuild::tui::set_output_handler(
        [this](std::string_view value) { messages.emplace_back(value); });
  }

  ~captured_output() {
    try {
      dbuild::tui::set_output_handler([](std::string_view) {});
    } catch (std::logic_error const &error) {
      FAIL("set_output_handler should not throw during teardown: " << error.what());
    }
  }
};

}  // namespace

TEST_CASE_FIXTURE(captured_output, "tui unstructured logs are raw messages") {
  REQUIRE(messages.empty());

  CHECK_NOTHROW(dbuild::tui::run(std::nullopt));

  dbuild::tui::debug("hello %s", "world");
  dbuild::tui::info("value %d", 42);
  dbuild::tui::warn("three %d", 3);
  dbuild::tui::error("boom");

  CHECK_NOTHROW(dbuild::tui::shutdown());

  REQUIRE(messages.size() == 4);
  CHECK(messages[0] == "hello world\n");
  CHECK(messages[1] == "value 42\n");
  CHECK(messages[2] == "three 3\n");
  CHECK(messages[3] == "boom\n");
}

TEST_CASE_FIXTURE(captured_output, "tui drops messages logged while idle") {
  dbuild::tui::info("nobody is listening");
  CHECK_NOTHROW(dbuild::tui::run(std::nullopt));
  dbuild::tui::info("heard");
  CHECK_NOTHROW(dbuild::tui::shutdown());

  REQUIRE(messages.size() == 1);
  CHECK(messages[0] == "heard\n");
}

TEST_CASE_FIXTURE(captured_output, "tui severity filtering honors threshold") {
  CHECK_NOTHROW(dbuild::tui::run(dbuild::tui::level::TUI_WARN, true));
  dbuild::tui::debug("debug");
  dbuild::tui::info("info");
  dbuild::tui::warn("warn");
  dbuild::tui::error("error");
  CHECK_NOTHROW(dbuild::tui::shutdown());

  REQUIRE(messages.size() == 2);
  CHECK(messages[0].find("WRN") != std::string::npos);
  CHECK(messages[0].find("warn") != std::string::npos);
  CHECK(messages[1].find("ERR") != std::string::npos);
  CHECK(messages[1].find("error") != std::string::npos);
}

TEST_CASE_FIXTURE(captured_output, "tui tag scope prefixes messages on its thread") {
  CHECK_NOTHROW(dbuild::tui::run(std::nullopt));
  {
    dbuild::tui::tag_scope outer{ "lib" };
    dbuild::tui::info("compiling");
    {
      dbuild::tui::tag_scope inner{ "app" };
      dbuild::tui::info("linking");
    }
    std::thread{ [] { dbuild::tui::info("untagged"); } }.join();
    dbuild::tui::info("done");
  }
  dbuild::tui::info("after");
  CHECK_NOTHROW(dbuild::tui::shutdown());

  REQUIRE(messages.size() == 5);
  CHECK(messages[0] == "[lib] compiling\n");
  CHECK(messages[1] == "[app] linking\n");
  CHECK(messages[2] == "untagged\n");
  CHECK(messages[3] == "[lib] done\n");
  CHECK(messages[4] == "after\n");
}

TEST_CASE_FIXTURE(captured_output, "tui counts warnings and errors below the threshold") {
  CHECK_NOTHROW(dbuild::tui::run(dbuild::tui::level::TUI_ERROR));
  dbuild::tui::warn("one");
  dbuild::tui::warn("two");
  dbuild::tui::error("three");
  CHECK(dbuild::tui::warning_count() == 2);
  CHECK(dbuild::tui::error_count() == 1);
  CHECK_NOTHROW(dbuild::tui::shutdown());

  CHECK_NOTHROW(dbuild::tui::run(std::nullopt));
  CHECK(dbuild::tui::warning_count() == 0);
  CHECK_NOTHROW(dbuild::tui::shutdown());
}

TEST_CASE_FIXTURE(captured_output, "tui trace events reach handler") {
  dbuild::tui::configure_trace_outputs(
      { { dbuild::tui::trace_output_type::std_err, std::nullopt } });
  CHECK_NOTHROW(dbuild::tui::run(dbuild::tui::level::TUI_TRACE, false));

  DBUILD_TRACE_BUILD_START(std::string{ "lib" }, std::string{ "u1" });

  CHECK_NOTHROW(dbuild::tui::shutdown());
  REQUIRE_FALSE(messages.empty());
  CHECK(messages[0].find("build_start") != std::string::npos);
  CHECK(messages[0].find("project=lib") != std::string::npos);

  dbuild::tui::configure_trace_outputs({});
}

TEST_CASE("trace file output writes JSONL format") {
  auto const trace_path{ std::filesystem::temp_directory_path() /
                         "dbuild_test_trace.jsonl" };

  std::error_code ec;
  std::filesystem::remove(trace_path, ec);

  dbuild::tui::configure_trace_outputs(
      { { dbuild::tui::trace_output_type::file, trace_path } });
  CHECK(dbuild::tui::g_trace_enabled);

  CHECK_NOTHROW(dbuild::tui::run(dbuild::tui::level::TUI_TRACE, false));

  dbuild::tui::trace(dbuild::trace_events::repository_publish{
      .uuid = "abc",
      .files = 3,
  });
  dbuild::tui::trace(dbuild::trace_events::project_blocked{
      .project = "ext",
      .dependency = "lib",
  });

  CHECK_NOTHROW(dbuild::tui::shutdown());

  REQUIRE(std::filesystem::exists(trace_path));

  std::ifstream file{ trace_path };
  REQUIRE(file.is_open());

  std::vector<std::string> lines;
  std::string line;
  while (std::getline(file, line)) {
    if (!line.empty()) { lines.push_back(line); }
  }
  file.close();

  REQUIRE(lines.size() == 2);
  CHECK(lines[0].find("\"event\":\"repository_publish\"") != std::string::npos);
  CHECK(lines[0].find("\"files\":3") != std::string::npos);
  CHECK(lines[1].find("\"dependency\":\"lib\"") != std::string::npos);

  std::filesystem::remove(trace_path, ec);
  dbuild::tui::configure_trace_outputs({});
}

TEST_CASE("configure_trace_outputs rejects multiple file outputs") {
  auto const path1{ std::filesystem::temp_directory_path() / "dbuild-trace1.jsonl" };
  auto const path2{ std::filesystem::temp_directory_path() / "dbuild-trace2.jsonl" };

  CHECK_THROWS_AS(dbuild::tui::configure_trace_outputs(
                      { { dbuild::tui::trace_output_type::file, path1 },
                        { dbuild::tui::trace_output_type::file, path2 } }),
                  std::logic_error);

  dbuild::tui::configure_trace_outputs({});
}
