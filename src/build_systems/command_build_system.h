#pragma once

#include "build_system.h"

#include <string_view>

namespace dbuild {

// Builds a project by running a configured shell script in its checked-out sources.
// The script publishes into $DBUILD_LOCAL_REPO; the modules it produces are declared in
// the configuration, so extraction never runs the build tool.
class command_build_system : public build_system {
 public:
  std::string_view name() const override { return "command"; }

  void validate(project_config const &config,
                build_system_registry const &systems) const override;
  project_config resolve(project_config const &config,
                         std::filesystem::path const &dir,
                         build_env const &env) const override;
  extracted_meta extract_dependencies(extraction_config const &config,
                                      std::filesystem::path const &dir,
                                      build_env const &env) const override;
  build_artifacts_out run_build(repeatable_project_build const &build,
                                std::filesystem::path const &dir,
                                build_input const &input,
                                build_env const &env) const override;
};

}  // namespace dbuild
