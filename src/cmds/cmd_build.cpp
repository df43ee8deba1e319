#include "cmd_build.h"

#include "artifact_repository.h"
#include "build_system.h"
#include "manifest.h"
#include "notifications.h"
#include "orchestrator.h"
#include "platform.h"
#include "termination.h"
#include "tui.h"

#include "CLI11.hpp"

#include <chrono>
#include <memory>
#include <stdexcept>
#include <stop_token>
#include <thread>

namespace dbuild {

void cmd_build::register_cli(CLI::App &app, std::function<void(cfg)> on_selected) {
  auto *sub{ app.add_subcommand("build", "Build every project in the manifest") };
  auto cfg_ptr{ std::make_shared<cfg>() };
  sub->add_option("--manifest", cfg_ptr->manifest_path, "Path to dbuild.lua manifest");
  sub->add_option("--work-dir", cfg_ptr->work_dir, "Work and repository directory");
  sub->add_option("--cross-version",
                  cfg_ptr->cross_version,
                  "Cross-version mode (disabled, full, binary, standard)");
  sub->callback(
      [cfg_ptr, on_selected = std::move(on_selected)] { on_selected(*cfg_ptr); });
}

std::filesystem::path cmd_build_work_dir(std::optional<std::filesystem::path> const &cli) {
  if (cli) { return std::filesystem::absolute(*cli); }
  if (auto const root{ platform::get_default_work_root() }) { return *root; }
  throw std::runtime_error(std::string{ "No work directory: pass --work-dir or set " } +
                           platform::get_default_work_root_env_vars());
}

cmd_build::cmd_build(cmd_build::cfg cfg) : cfg_{ std::move(cfg) } {}

bool cmd_build::execute() {
  auto const manifest_path{ manifest::find_manifest_path(cfg_.manifest_path) };
  auto const m{ manifest::load(manifest_path) };
  if (cfg_.cross_version) { m->build.options.cross_version = *cfg_.cross_version; }

  auto const work_dir{ cmd_build_work_dir(cfg_.work_dir) };
  tui::info("Building %zu projects from %s in %s",
            m->build.projects.size(),
            manifest_path.string().c_str(),
            work_dir.string().c_str());

  auto const systems{ make_default_build_systems() };
  notifier const notify{ make_default_notification_kinds(),
                         m->notifications,
                         m->build.projects };
  artifact_repository repository{ work_dir / "repository" };
  orchestrator orch{ *systems, repository, work_dir };

  // Forwards Ctrl-C to the running builds
  std::jthread const watcher{ [&orch](std::stop_token stop) {
    while (!stop.stop_requested()) {
      if (termination_requested()) {
        orch.cancel();
        return;
      }
      std::this_thread::sleep_for(std::chrono::milliseconds{ 50 });
    }
  } };

  auto const root{ orch.run(m->build) };

  for (auto const &outcome : root.projects) {
    if (outcome_succeeded(outcome)) {
      tui::info("  %s: %s",
                outcome_project(outcome).c_str(),
                outcome_status(outcome).c_str());
    } else {
      tui::error("  %s: %s (%s)",
                 outcome_project(outcome).c_str(),
                 outcome_status(outcome).c_str(),
                 outcome_reason(outcome).c_str());
    }
  }

  notify.notify(root);
  tui::info("%s with %zu warnings and %zu errors",
            root.succeeded() ? "Build succeeded" : "Build failed",
            tui::warning_count(),
            tui::error_count());
  return root.succeeded();
}

}  // namespace dbuild
