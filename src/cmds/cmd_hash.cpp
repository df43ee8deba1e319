#include "cmd_hash.h"

#include "manifest.h"
#include "orchestrator.h"
#include "tui.h"

#include "CLI11.hpp"

#include <memory>

namespace dbuild {

void cmd_hash::register_cli(CLI::App &app, std::function<void(cfg)> on_selected) {
  auto *sub{ app.add_subcommand("hash", "Print the fingerprint of every project") };
  auto cfg_ptr{ std::make_shared<cfg>() };
  sub->add_option("--manifest", cfg_ptr->manifest_path, "Path to dbuild.lua manifest");
  sub->callback(
      [cfg_ptr, on_selected = std::move(on_selected)] { on_selected(*cfg_ptr); });
}

cmd_hash::cmd_hash(cmd_hash::cfg cfg) : cfg_{ std::move(cfg) } {}

bool cmd_hash::execute() {
  auto const m{ manifest::load(manifest::find_manifest_path(cfg_.manifest_path)) };

  for (auto const &[project, hash] : orchestrator_fingerprints(m->build)) {
    tui::print_stdout("%s  %s\n", hash.c_str(), project.c_str());
  }
  return true;
}

}  // namespace dbuild
