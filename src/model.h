#pragma once

#include <map>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace dbuild {

struct project_config;

// Identifies a published module: "organization#name"
struct module_id {
  std::string organization;
  std::string name;

  std::string key() const { return organization + "#" + name; }
  bool operator==(module_id const &) const = default;
};

struct artifact_ref {
  std::string extension{ "jar" };
  std::string classifier;

  bool operator==(artifact_ref const &) const = default;
};

// A module a project would produce, as reported by extraction
struct module_descriptor {
  std::string name;
  std::string organization;
  std::vector<artifact_ref> artifacts;
  std::vector<module_id> dependencies;

  module_id id() const { return { organization, name }; }
};

struct extracted_meta {
  std::string version;
  std::vector<module_descriptor> modules;
  std::vector<std::string> subprojects;
};

// Global options that change what a build produces
struct build_options {
  static constexpr char const *kDefaultCrossVersion{ "disabled" };

  std::string cross_version{ kDefaultCrossVersion };
};

// Which produced modules form the distinguished "core" group during assemble: those
// whose organization matches and whose name starts with `name_prefix`, plus any listed
// in `also`. The core version is read from `version_module`.
struct core_module_rule {
  std::string organization{ "org.scala-lang" };
  std::string name_prefix{ "scala" };
  std::string version_module{ "scala-library" };
  std::vector<module_id> also{ { "org.scala-lang.plugins", "continuations" } };

  bool operator==(core_module_rule const &) const = default;
};

// `command` build system: sources built by an arbitrary shell script that publishes
// into DBUILD_LOCAL_REPO; produced modules are declared statically.
struct command_extra {
  std::string version;
  std::string directory;
  std::string build;
  std::vector<module_descriptor> modules;
  std::vector<std::string> exclude;
};

// `assemble` build system: nested parts built in isolation and merged
struct assemble_extra {
  std::vector<project_config> parts;
  core_module_rule core;
  std::map<std::string, build_options> part_options;  // by part name
};

using backend_extra = std::variant<command_extra, assemble_extra>;

struct notification_config {
  std::string kind;
  std::string send;  // kind-specific destination, e.g. an address
  std::vector<std::string> when{ "always" };
  std::optional<std::string> template_id;
};

struct project_config {
  static constexpr char const *kDefaultSystem{ "command" };

  std::string name;
  std::string system{ kDefaultSystem };
  std::string uri;
  std::optional<std::string> set_version;
  backend_extra extra;
  std::vector<notification_config> notifications;
};

// Exact input of dependency extraction
struct extraction_config {
  project_config project;
  build_options options;
};

struct project_config_and_extracted {
  project_config config;
  extracted_meta extracted;
};

// A project ready to build: configuration plus everything its output depends on
struct repeatable_project_build {
  project_config config;
  std::string version;
  std::vector<std::string> dependency_uuids;
  std::vector<std::string> subprojects;
  build_options options;

  std::string uuid() const;
};

// Published module file. `path` is relative to the local repository root, with '/'.
struct artifact_location {
  module_id module;
  artifact_ref artifact;
  std::string cross_suffix;
  std::string path;
  std::string version;
};

struct artifact_sha {
  std::string sha;       // sha256 hex of the file content
  std::string location;  // repository-relative path, '/' separated
};

struct build_subartifacts_out {
  std::string subproject;
  std::vector<artifact_location> artifacts;
  std::vector<artifact_sha> shas;
};

struct build_artifacts_out {
  std::vector<build_subartifacts_out> results;
};

}  // namespace dbuild
