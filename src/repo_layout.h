#pragma once

#include "model.h"

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

namespace dbuild {

// A file of a local repository, located by its slash-separated relative path:
//   maven           org/dirs/name/version/name<rest>           rest = "-1.0-sources.jar"
//   ivy_descriptor  org/name/version/ivys/<file>               file = "ivy.xml.sha1"
//   ivy             org/name/version/<conf>/name<rest>         conf = "jars", "docs"
struct repo_path {
  enum class layout { maven, ivy_descriptor, ivy };

  layout kind;
  std::string organization;  // dotted
  std::string name;
  std::string version;
  std::string rest;  // maven and ivy: file name after `name`; ivy_descriptor: file name
  std::string conf;  // ivy layouts only

  // Location of the same file after renaming the module to `new_name`
  std::string relocated(std::string_view new_name) const;
};

// Returns nullopt for paths matching neither layout
std::optional<repo_path> repo_path_parse(std::string_view location);

std::filesystem::path maven_module_dir(std::filesystem::path const &repo_root,
                                       module_id const &module,
                                       std::string_view cross_suffix);
std::filesystem::path ivy_module_dir(std::filesystem::path const &repo_root,
                                     module_id const &module,
                                     std::string_view cross_suffix);

// Published name of the module owning a POM, read from its path
// ("org/x/core_2.11/1.0/core_2.11-1.0.pom" -> "core_2.11")
std::optional<std::string> pom_path_module_name(std::string_view location);

// Module name of an ivy descriptor path ("org.x/core_2.11/1.0/ivys/ivy.xml" -> "core_2.11")
std::optional<std::string> ivy_path_module_name(std::string_view location);

}  // namespace dbuild
