#pragma once

#include "build_system.h"
#include "outcome.h"
#include "util.h"

#include <atomic>
#include <cstddef>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>

namespace dbuild {

// Memoizes builds per repeatable_project_build uuid for one run. A uuid already present
// in the artifact repository is not rebuilt. Every dependency uuid must have been
// published before `build` is called for a dependent.
class build_cache : unmovable {
 public:
  build_cache();
  ~build_cache();

  // Returns build_good or build_bad. `dir` is the project's working directory and
  // receives local-repo/ and deps-repo/.
  build_outcome build(repeatable_project_build const &build,
                      std::filesystem::path const &dir,
                      build_env const &env);

  std::optional<build_good> cached(std::string const &uuid) const;

  // Terminates running builds and refuses new ones; they surface as canceled.
  void cancel();
  bool canceled() const;
  std::atomic_bool const *cancel_flag() const;

  std::size_t builds_run() const;

 private:
  struct impl;
  std::unique_ptr<impl> m;
};

}  // namespace dbuild
