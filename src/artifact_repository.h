#pragma once

#include "model.h"
#include "util.h"

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace dbuild {

// Content-addressed store shared by all builds of a work root:
//   raw/<sha256>              file contents
//   meta/<uuid>/artifacts     index of a build's published artifacts
//   meta/<uuid>/dbuild-complete
// Entries appear atomically: a killed build never leaves a readable partial entry.
class artifact_repository : unmovable {
 public:
  using path = std::filesystem::path;

  explicit artifact_repository(path root);

  path const &root() const { return root_; }

  // Stores every file referenced by `artifacts` (resolved under `local_repo`) and the
  // index for `uuid`. Publishing an existing uuid is a no-op.
  void publish(std::string const &uuid,
               path const &local_repo,
               build_artifacts_out const &artifacts) const;

  std::optional<build_artifacts_out> lookup(std::string const &uuid) const;

  // Rehydrates the files of each uuid into `target_repo` and returns their locations.
  // Throws std::runtime_error if a uuid was never published.
  std::vector<artifact_location> retrieve(std::vector<std::string> const &uuids,
                                          path const &target_repo) const;

  static artifact_sha make_artifact_sha(path const &file, path const &repo_root);

 private:
  path raw_dir() const { return root_ / "raw"; }
  path meta_dir() const { return root_ / "meta"; }
  path tmp_path(std::string const &tag) const;

  path root_;
};

// Index serialization, exposed for tests
std::string artifact_index_write(build_artifacts_out const &artifacts);
build_artifacts_out artifact_index_read(std::string const &text);

}  // namespace dbuild
