#pragma once

#include "build_system.h"

#include <filesystem>
#include <string_view>

namespace dbuild {

// Builds each nested part in isolation through the shared caches, then merges their
// repositories into one: cross-version suffixes are normalized, files renamed and
// POM/ivy descriptors re-pointed at the renamed modules.
class assemble_build_system : public build_system {
 public:
  std::string_view name() const override { return "assemble"; }

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

// Working directory of a part, keyed by the part's name only: the part's content
// changes when it is resolved.
std::filesystem::path assemble_part_dir(std::filesystem::path const &dir,
                                        std::string_view part_name);

// Options a part is extracted and built with: its own entry in `part_options`, or the
// defaults. The assemble re-applies its own suffix to the merged result afterwards.
build_options assemble_part_options(assemble_extra const &extra, std::string_view part_name);

}  // namespace dbuild
