#pragma once

#include "model.h"

#include <filesystem>
#include <string_view>
#include <vector>

namespace dbuild {

// Descriptor rewriting for assembled repositories. `available` lists the modules of
// the group with their final cross suffix and version; a dependency on a module not in
// that list is external and keeps its coordinates. Each function rewrites the file in
// place only when something changes, and then refreshes existing checksum side files.
// Both return whether the file changed and throw std::runtime_error on malformed XML.

// POM: sets the project artifactId to `artifact_id` and re-points matching
// <dependency> entries at their final artifactId and version.
bool pom_rewrite(std::filesystem::path const &file,
                 std::string_view artifact_id,
                 std::vector<artifact_location> const &available);

// ivy.xml: sets the info module to `module_name`, renames publications of the same
// module, and re-points matching dependencies and their dependency artifacts.
bool ivy_rewrite(std::filesystem::path const &file,
                 std::string_view module_name,
                 std::vector<artifact_location> const &available);

// Recomputes `<file>.md5` and `<file>.sha1` where they already exist
void refresh_checksum_files(std::filesystem::path const &file);

}  // namespace dbuild
