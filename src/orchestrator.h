#pragma once

#include "build_system.h"
#include "model.h"
#include "outcome.h"
#include "util.h"

#include <filesystem>
#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace dbuild {

class artifact_repository;
class build_cache;
class extraction_cache;

// Everything one orchestration run builds
struct build_config {
  std::vector<project_config> projects;
  build_options options;
};

// Drives one run: resolve, extract, order by dependencies, build. Projects build in
// parallel on a tbb flow graph; a project starts once all of its dependencies are good.
class orchestrator : unmovable {
 public:
  orchestrator(build_system_registry const &systems,
               artifact_repository &repository,
               std::filesystem::path work_dir);
  ~orchestrator();

  // Throws configuration_error; runs before any work starts
  void validate(build_config const &config) const;

  // One outcome per configured project, in configuration order. Throws
  // configuration_error for invalid input or conflicting module declarations.
  root_outcome run(build_config const &config);

  // Terminates running builds; pending ones surface as canceled
  void cancel();

  build_env env();
  extraction_cache &extractions();
  build_cache &builds();

 private:
  struct impl;
  std::unique_ptr<impl> m;
};

// Working directory of a top-level project under `work_dir`
std::filesystem::path orchestrator_project_dir(std::filesystem::path const &work_dir,
                                               std::string const &project);

// Extraction fingerprint of every configured project, in configuration order
std::vector<std::pair<std::string, std::string>> orchestrator_fingerprints(
    build_config const &config);

}  // namespace dbuild
