#include "cli.h"
#include "tui.h"

#include "CLI11.hpp"

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace dbuild {

cli_args cli_parse(int argc, char **argv) {
  CLI::App app{ "dbuild - repeatable multi-project builds" };

  bool verbose{ false };
  app.add_flag(
      "--verbose",
      verbose,
      "Enable decorated verbose logging (prefix stdout/stderr with timestamp and level)");

  std::string trace_spec;
  auto *trace_option{ app.add_option("--trace",
                                     trace_spec,
                                     "Enable trace logging. Provide a comma-separated "
                                     "list: 'stderr' for human-readable stderr and/or "
                                     "'file:<path>' for JSONL file output. Defaults to "
                                     "stderr if no value provided.") };
  trace_option->expected(0, 1);

  std::size_t jobs{ 0 };
  auto *jobs_option{ app.add_option("-j,--jobs",
                                    jobs,
                                    "Maximum number of projects extracted or built "
                                    "concurrently") };
  jobs_option->check(CLI::PositiveNumber);

  bool version_flag{ false };
  app.add_flag("-v,--version",
               version_flag,
               "Show version information (alias for version subcommand)");

  std::optional<cli_args::cmd_cfg_t> cmd_cfg;
  auto const select = [&cmd_cfg](auto cfg) { cmd_cfg = std::move(cfg); };

  cmd_build::register_cli(app, select);
  cmd_hash::register_cli(app, select);
  cmd_version::register_cli(app, select);

  cli_args args{};

  try {
    app.parse(argc, argv);
  } catch (CLI::CallForHelp const &) {
    args.cli_output = app.help();
  } catch (CLI::ParseError const &e) { args.cli_output = std::string(e.what()); }

  // Handle trace logging: --trace defaults to stderr if no value provided
  bool const trace_requested{ trace_option->count() > 0 };
  std::vector<std::string> trace_specs_tokens;

  if (trace_requested) {
    if (trace_spec.empty()) {
      trace_specs_tokens.push_back("stderr");
    } else {
      for (std::string_view sv{ trace_spec }; !sv.empty();) {
        auto const pos{ sv.find(',') };
        auto const token{ sv.substr(0, pos) };
        if (!token.empty()) { trace_specs_tokens.emplace_back(token); }
        sv = (pos == std::string_view::npos) ? std::string_view{} : sv.substr(pos + 1);
      }
    }
  }

  if (!trace_specs_tokens.empty()) {
    args.verbosity = tui::level::TUI_TRACE;
    args.decorated_logging = true;
    for (auto const &spec : trace_specs_tokens) {
      if (spec == "stderr") {
        args.trace_outputs.push_back({ tui::trace_output_type::std_err, std::nullopt });
      } else if (spec.starts_with("file:") && spec.size() > 5) {
        args.trace_outputs.push_back(
            { tui::trace_output_type::file, std::filesystem::path{ spec.substr(5) } });
      } else {
        args.cli_output = "Invalid trace output spec: " + spec;
        args.trace_outputs.clear();
        cmd_cfg.reset();
        break;
      }
    }
  } else if (verbose) {
    args.verbosity = tui::level::TUI_DEBUG;
    args.decorated_logging = true;
  } else {
    args.verbosity = tui::level::TUI_INFO;
    args.decorated_logging = false;
  }

  if (jobs_option->count() > 0) { args.jobs = jobs; }

  if (version_flag) {
    args.cmd_cfg = cmd_version::cfg{};
    return args;
  }

  if (cmd_cfg) {
    args.cmd_cfg = *cmd_cfg;
  } else if (args.cli_output.empty()) {
    args.cli_output = app.help();
  }

  return args;
}

}  // namespace dbuild
