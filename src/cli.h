#pragma once

#include "cmds/cmd_build.h"
#include "cmds/cmd_hash.h"
#include "cmds/cmd_version.h"
#include "tui.h"

#include <cstddef>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace dbuild {

struct cli_args {
  using cmd_cfg_t = std::variant<cmd_build::cfg, cmd_hash::cfg, cmd_version::cfg>;

  std::optional<cmd_cfg_t> cmd_cfg;
  std::optional<tui::level> verbosity;
  bool decorated_logging{ false };
  std::vector<tui::trace_output_spec> trace_outputs;
  std::optional<std::size_t> jobs;  // worker pool bound, hardware concurrency if unset
  std::string cli_output;
};

cli_args cli_parse(int argc, char **argv);

}  // namespace dbuild
