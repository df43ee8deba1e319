#pragma once

#include "cmd.h"

#include <filesystem>
#include <functional>
#include <optional>
#include <string>

namespace CLI { class App; }

namespace dbuild {

class cmd_build : public cmd {
 public:
  struct cfg : cmd_cfg<cmd_build> {
    std::optional<std::filesystem::path> manifest_path;
    std::optional<std::filesystem::path> work_dir;
    std::optional<std::string> cross_version;  // overrides OPTIONS.cross_version
  };

  static void register_cli(CLI::App &app, std::function<void(cfg)> on_selected);

  explicit cmd_build(cfg cfg);

  bool execute() override;
  cfg const &get_cfg() const { return cfg_; }

 private:
  cfg cfg_;
};

// --work-dir, else the platform default; throws when neither is available
std::filesystem::path cmd_build_work_dir(std::optional<std::filesystem::path> const &cli);

}  // namespace dbuild
