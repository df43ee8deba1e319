#include "cli.h"

#include "doctest.h"

#include <filesystem>
#include <string>
#include <variant>
#include <vector>

namespace {

// Helper to convert vector of strings to argc/argv
std::vector<char *> make_argv(std::vector<std::string> &args) {
  std::vector<char *> argv;
  for (auto &arg : args) { argv.push_back(arg.data()); }
  argv.push_back(nullptr);
  return argv;
}

dbuild::cli_args parse(std::vector<std::string> args) {
  auto argv{ make_argv(args) };
  return dbuild::cli_parse(static_cast<int>(args.size()), argv.data());
}

}  // anonymous namespace

TEST_CASE("cli_parse: no arguments") {
  auto const parsed{ parse({ "dbuild" }) };

  // With no arguments, help text returned and no command configuration.
  CHECK_FALSE(parsed.cmd_cfg.has_value());
  CHECK_FALSE(parsed.cli_output.empty());
}

TEST_CASE("cli_parse: cmd_version") {
  SUBCASE("subcommand") {
    auto const parsed{ parse({ "dbuild", "version" }) };
    REQUIRE(parsed.cmd_cfg.has_value());
    CHECK(std::holds_alternative<dbuild::cmd_version::cfg>(*parsed.cmd_cfg));
  }

  SUBCASE("-v flag") {
    auto const parsed{ parse({ "dbuild", "-v" }) };
    REQUIRE(parsed.cmd_cfg.has_value());
    CHECK(std::holds_alternative<dbuild::cmd_version::cfg>(*parsed.cmd_cfg));
  }

  SUBCASE("--version flag") {
    auto const parsed{ parse({ "dbuild", "--version" }) };
    REQUIRE(parsed.cmd_cfg.has_value());
    CHECK(std::holds_alternative<dbuild::cmd_version::cfg>(*parsed.cmd_cfg));
  }
}

TEST_CASE("cli_parse: cmd_build") {
  SUBCASE("defaults") {
    auto const parsed{ parse({ "dbuild", "build" }) };
    REQUIRE(parsed.cmd_cfg.has_value());
    auto const *cfg{ std::get_if<dbuild::cmd_build::cfg>(&*parsed.cmd_cfg) };
    REQUIRE(cfg);
    CHECK_FALSE(cfg->manifest_path.has_value());
    CHECK_FALSE(cfg->work_dir.has_value());
    CHECK_FALSE(cfg->cross_version.has_value());
  }

  SUBCASE("all options") {
    auto const parsed{ parse({ "dbuild",
                               "build",
                               "--manifest",
                               "/path/to/dbuild.lua",
                               "--work-dir",
                               "/tmp/work",
                               "--cross-version",
                               "binary" }) };
    REQUIRE(parsed.cmd_cfg.has_value());
    auto const *cfg{ std::get_if<dbuild::cmd_build::cfg>(&*parsed.cmd_cfg) };
    REQUIRE(cfg);
    REQUIRE(cfg->manifest_path.has_value());
    CHECK(cfg->manifest_path->string() == "/path/to/dbuild.lua");
    REQUIRE(cfg->work_dir.has_value());
    CHECK(cfg->work_dir->string() == "/tmp/work");
    CHECK(cfg->cross_version == std::optional<std::string>{ "binary" });
  }
}

TEST_CASE("cli_parse: cmd_hash") {
  auto const parsed{ parse({ "dbuild", "hash", "--manifest", "m.lua" }) };
  REQUIRE(parsed.cmd_cfg.has_value());
  auto const *cfg{ std::get_if<dbuild::cmd_hash::cfg>(&*parsed.cmd_cfg) };
  REQUIRE(cfg);
  REQUIRE(cfg->manifest_path.has_value());
  CHECK(cfg->manifest_path->string() == "m.lua");
}

TEST_CASE("cli_parse: unknown subcommand") {
  auto const parsed{ parse({ "dbuild", "deploy" }) };
  CHECK_FALSE(parsed.cmd_cfg.has_value());
  CHECK_FALSE(parsed.cli_output.empty());
}

TEST_CASE("cli_parse: verbose flag") {
  auto const parsed{ parse({ "dbuild", "--verbose", "build" }) };

  REQUIRE(parsed.cmd_cfg.has_value());
  REQUIRE(parsed.verbosity.has_value());
  CHECK(parsed.verbosity == dbuild::tui::level::TUI_DEBUG);
  CHECK(parsed.decorated_logging);
}

TEST_CASE("cli_parse: default verbosity") {
  auto const parsed{ parse({ "dbuild", "build" }) };
  CHECK(parsed.verbosity == dbuild::tui::level::TUI_INFO);
  CHECK_FALSE(parsed.decorated_logging);
  CHECK(parsed.trace_outputs.empty());
}

TEST_CASE("cli_parse: trace outputs") {
  SUBCASE("bare flag defaults to stderr") {
    auto const parsed{ parse({ "dbuild", "--trace", "build" }) };
    CHECK(parsed.verbosity == dbuild::tui::level::TUI_TRACE);
    REQUIRE(parsed.trace_outputs.size() == 1);
    CHECK(parsed.trace_outputs[0].type == dbuild::tui::trace_output_type::std_err);
  }

  SUBCASE("stderr and file") {
    auto const parsed{ parse({ "dbuild", "--trace", "stderr,file:/tmp/t.jsonl", "build" }) };
    REQUIRE(parsed.trace_outputs.size() == 2);
    CHECK(parsed.trace_outputs[0].type == dbuild::tui::trace_output_type::std_err);
    CHECK(parsed.trace_outputs[1].type == dbuild::tui::trace_output_type::file);
    REQUIRE(parsed.trace_outputs[1].file_path.has_value());
    CHECK(parsed.trace_outputs[1].file_path->string() == "/tmp/t.jsonl");
    CHECK(parsed.cmd_cfg.has_value());
  }

  SUBCASE("invalid spec") {
    auto const parsed{ parse({ "dbuild", "--trace", "syslog", "build" }) };
    CHECK_FALSE(parsed.cmd_cfg.has_value());
    CHECK(parsed.cli_output == "Invalid trace output spec: syslog");
  }
}

TEST_CASE("cli_parse: jobs") {
  SUBCASE("unset by default") {
    auto const parsed{ parse({ "dbuild", "hash" }) };
    CHECK_FALSE(parsed.jobs.has_value());
  }

  SUBCASE("short and long forms") {
    auto const short_form{ parse({ "dbuild", "-j", "3", "hash" }) };
    REQUIRE(short_form.jobs.has_value());
    CHECK(*short_form.jobs == 3);

    auto const long_form{ parse({ "dbuild", "--jobs", "8", "build" }) };
    REQUIRE(long_form.jobs.has_value());
    CHECK(*long_form.jobs == 8);
  }

  SUBCASE("zero is rejected") {
    auto const parsed{ parse({ "dbuild", "--jobs", "0", "build" }) };
    CHECK_FALSE(parsed.cmd_cfg.has_value());
    CHECK_FALSE(parsed.cli_output.empty());
  }
}
