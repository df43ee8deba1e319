#include "cli.h"
#include "errors.h"
#include "source.h"
#include "termination.h"
#include "tui.h"
#include "xml_util.h"

#include "tbb/global_control.h"

#include <cstdlib>
#include <exception>
#include <memory>
#include <variant>

namespace {

constexpr int kExitConfigurationError{ 2 };
constexpr int kExitInterrupted{ 130 };

}  // namespace

int main(int argc, char **argv) {
  dbuild::tui::init();
  dbuild::termination_handler_install();

  auto args{ dbuild::cli_parse(argc, argv) };
  dbuild::tui::configure_trace_outputs(args.trace_outputs);
  dbuild::tui::scope tui_scope{ args.verbosity, args.decorated_logging };

  dbuild::libgit2_scope git_guard;
  dbuild::libxml2_scope xml_guard;

  if (!args.cli_output.empty()) {
    if (!args.cmd_cfg.has_value()) {
      dbuild::tui::error("%s", args.cli_output.c_str());
      return EXIT_FAILURE;
    }
    dbuild::tui::info("%s", args.cli_output.c_str());
  }

  if (!args.cmd_cfg.has_value()) { return EXIT_FAILURE; }

  std::unique_ptr<tbb::global_control> parallelism;
  if (args.jobs) {
    parallelism = std::make_unique<tbb::global_control>(
        tbb::global_control::max_allowed_parallelism, *args.jobs);
  }

  auto cmd{ std::visit([](auto const &cfg) { return dbuild::cmd::create(cfg); },
                       *args.cmd_cfg) };

  bool ok{ false };
  try {
    ok = cmd->execute();
  } catch (dbuild::configuration_error const &ex) {
    dbuild::tui::error("Configuration error: %s", ex.what());
    return kExitConfigurationError;
  } catch (std::exception const &ex) {
    dbuild::tui::error("Execution failed: %s", ex.what());
    return EXIT_FAILURE;
  }

  if (dbuild::termination_requested()) {
    dbuild::tui::error("Interrupted");
    return kExitInterrupted;
  }
  return ok ? EXIT_SUCCESS : EXIT_FAILURE;
}
