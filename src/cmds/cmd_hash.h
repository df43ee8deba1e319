#pragma once

#include "cmd.h"

#include <filesystem>
#include <functional>
#include <optional>

namespace CLI { class App; }

namespace dbuild {

// Prints the extraction fingerprint of every project in the manifest
class cmd_hash : public cmd {
 public:
  struct cfg : cmd_cfg<cmd_hash> {
    std::optional<std::filesystem::path> manifest_path;
  };

  static void register_cli(CLI::App &app, std::function<void(cfg)> on_selected);

  explicit cmd_hash(cfg cfg);

  bool execute() override;
  cfg const &get_cfg() const { return cfg_; }

 private:
  cfg cfg_;
};

}  // namespace dbuild
