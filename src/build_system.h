#pragma once

#include "model.h"
#include "util.h"

#include <filesystem>
#include <memory>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace dbuild {

class artifact_repository;
class build_cache;
class build_system_registry;
class extraction_cache;

// Collaborators a build system may re-enter while handling a project
struct build_env {
  build_system_registry const &systems;
  extraction_cache &extractions;
  build_cache &builds;
  artifact_repository &repository;
};

// Repository directories prepared by the build cache for one build
struct build_input {
  std::filesystem::path local_repo;  // output: the build publishes here
  std::filesystem::path deps_repo;   // dependency artifacts, already materialized
  std::vector<artifact_location> dependency_artifacts;
};

class build_system : unmovable {
 public:
  virtual ~build_system() = default;

  virtual std::string_view name() const = 0;

  // Rejects configurations this system cannot handle; runs before any work starts.
  virtual void validate(project_config const &config,
                        build_system_registry const &systems) const = 0;

  // Pins floating source references. Idempotent; no build side effects.
  virtual project_config resolve(project_config const &config,
                                 std::filesystem::path const &dir,
                                 build_env const &env) const = 0;

  // Reports produced modules and their dependencies without building.
  virtual extracted_meta extract_dependencies(extraction_config const &config,
                                              std::filesystem::path const &dir,
                                              build_env const &env) const = 0;

  // Builds into input.local_repo and describes what was published there. Throws on
  // failure; callers turn the exception into a failed outcome.
  virtual build_artifacts_out run_build(repeatable_project_build const &build,
                                        std::filesystem::path const &dir,
                                        build_input const &input,
                                        build_env const &env) const = 0;
};

class build_system_registry : unmovable {
 public:
  void add(std::unique_ptr<build_system> system);

  build_system const *find(std::string_view kind) const;

  // Throws configuration_error naming the project when `kind` is not registered
  build_system const &get(std::string_view kind, std::string_view project) const;

  // Recursively checks the build system kind and payload of `config`
  void validate(project_config const &config) const;

  std::vector<std::string> kinds() const;

 private:
  std::unordered_map<std::string, std::unique_ptr<build_system>> systems_;
};

// Registry holding the built-in `command` and `assemble` systems
std::unique_ptr<build_system_registry> make_default_build_systems();

}  // namespace dbuild
