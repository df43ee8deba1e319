#include "assemble_build_system.h"

#include "artifact_repository.h"
#include "build_cache.h"
#include "cross_version.h"
#include "descriptors.h"
#include "errors.h"
#include "extraction_cache.h"
#include "identity.h"
#include "repo_layout.h"
#include "trace.h"
#include "tui.h"
#include "util.h"

#include <algorithm>
#include <map>
#include <set>
#include <stdexcept>
#include <unordered_map>

namespace dbuild {

namespace {

assemble_extra const &assemble_options(project_config const &config) {
  if (auto const *extra{ std::get_if<assemble_extra>(&config.extra) }) { return *extra; }
  throw internal_error("assemble options have the wrong type in project " + config.name);
}

void check_nil_uri(project_config const &config) {
  if (config.uri != "nil" && !config.uri.starts_with("nil:")) {
    throw configuration_error("The uri of assemble project " + config.name +
                              " must start with \"nil:\"");
  }
}

std::string join(std::vector<std::string> const &items, std::string_view sep) {
  std::string out;
  for (auto const &item : items) {
    if (!out.empty()) { out += sep; }
    out += item;
  }
  return out;
}

std::vector<std::string> repeated_names(std::vector<std::string> const &names) {
  std::map<std::string, int> counts;
  for (auto const &n : names) { ++counts[n]; }

  std::vector<std::string> out;
  for (auto const &[name, count] : counts) {
    if (count > 1) { out.push_back(name); }
  }
  return out;
}

std::vector<std::string> part_names(assemble_extra const &extra) {
  std::vector<std::string> out;
  for (auto const &part : extra.parts) { out.push_back(part.name); }
  return out;
}

struct built_part {
  std::string name;
  std::string uuid;
  build_artifacts_out artifacts;
};

// Step 4: sub-project names produced by more than one part get the part's name
void disambiguate_subprojects(std::vector<built_part> &parts) {
  std::vector<std::string> subs;
  for (auto const &p : parts) {
    for (auto const &r : p.artifacts.results) { subs.push_back(r.subproject); }
  }
  auto const repeated{ repeated_names(subs) };

  for (auto &p : parts) {
    for (auto &r : p.artifacts.results) {
      if (std::ranges::find(repeated, r.subproject) != repeated.end()) {
        r.subproject = p.name + "-" + r.subproject;
      }
    }
  }
}

// Step 6: moves one published file to the path matching its module's new name and
// returns its new location, or the old one when nothing changes.
std::string rename_location(std::filesystem::path const &local_repo,
                            std::string const &location,
                            std::string const &suffix,
                            core_module_rule const &rule) {
  auto const parsed{ repo_path_parse(location) };
  if (!parsed) {
    tui::error("Path cannot be parsed: %s. Continuing...", location.c_str());
    return location;
  }
  if (is_core_module(rule, { parsed->organization, parsed->name })) { return location; }

  auto const new_name{ fix_name(parsed->name) + suffix };
  if (new_name == parsed->name) { return location; }

  auto const new_location{ parsed->relocated(new_name) };
  auto const from{ local_repo / location };
  auto const to{ local_repo / new_location };

  std::error_code ec;
  std::filesystem::create_directories(to.parent_path(), ec);
  if (!ec) { std::filesystem::rename(from, to, ec); }
  if (ec) {
    throw consistency_error("Cannot rename " + location + " to " + new_location + ": " +
                            ec.message());
  }
  DBUILD_TRACE_ARTIFACT_RENAMED(location, new_location);
  return new_location;
}

// Step 7: rewrites every POM and ivy.xml found under the merged repository
void rewrite_descriptors(std::filesystem::path const &local_repo,
                         std::vector<artifact_location> const &available) {
  std::vector<std::filesystem::path> poms;
  std::vector<std::filesystem::path> ivys;
  for (auto const &entry : std::filesystem::recursive_directory_iterator{ local_repo }) {
    if (!entry.is_regular_file()) { continue; }
    auto const filename{ entry.path().filename().string() };
    if (filename.ends_with(".pom")) {
      poms.push_back(entry.path());
    } else if (filename == "ivy.xml") {
      ivys.push_back(entry.path());
    }
  }

  for (auto const &pom : poms) {
    auto const rel{ util_relative_generic(pom, local_repo) };
    if (auto const artifact_id{ pom_path_module_name(rel) }) {
      pom_rewrite(pom, *artifact_id, available);
    } else {
      tui::error("Path cannot be parsed: %s. Continuing...", rel.c_str());
    }
  }

  for (auto const &ivy : ivys) {
    auto const rel{ util_relative_generic(ivy, local_repo) };
    if (auto const module{ ivy_path_module_name(rel) }) {
      ivy_rewrite(ivy, *module, available);
    } else {
      tui::error("Path cannot be parsed: %s. Continuing...", rel.c_str());
    }
  }
}

// Step 8: shas of every file under the module directories of `artifacts`
std::vector<artifact_sha> scan_shas(std::filesystem::path const &local_repo,
                                    std::vector<artifact_location> const &artifacts) {
  std::set<std::filesystem::path> dirs;
  for (auto const &a : artifacts) {
    dirs.insert(maven_module_dir(local_repo, a.module, a.cross_suffix));
    dirs.insert(ivy_module_dir(local_repo, a.module, a.cross_suffix));
  }

  std::vector<artifact_sha> out;
  for (auto const &dir : dirs) {
    if (!std::filesystem::is_directory(dir)) { continue; }
    for (auto const &entry : std::filesystem::recursive_directory_iterator{ dir }) {
      if (!entry.is_regular_file() ||
          entry.path().filename() == "maven-metadata-local.xml") {
        continue;
      }
      out.push_back(artifact_repository::make_artifact_sha(entry.path(), local_repo));
    }
  }
  std::ranges::sort(out, {}, &artifact_sha::location);
  return out;
}

}  // namespace

std::filesystem::path assemble_part_dir(std::filesystem::path const &dir,
                                        std::string_view part_name) {
  return dir / "projects" / project_dir_name(part_name);
}

build_options assemble_part_options(assemble_extra const &extra, std::string_view part_name) {
  auto const it{ extra.part_options.find(std::string{ part_name }) };
  return it == extra.part_options.end() ? build_options{} : it->second;
}

void assemble_build_system::validate(project_config const &config,
                                     build_system_registry const &systems) const {
  auto const *extra{ std::get_if<assemble_extra>(&config.extra) };
  if (!extra) {
    throw configuration_error("Project " + config.name + " has no assemble options");
  }
  check_nil_uri(config);

  if (extra->core.organization.empty() || extra->core.version_module.empty()) {
    throw configuration_error("Project " + config.name +
                              ": core rule needs an organization and a version module");
  }

  if (auto const repeated{ repeated_names(part_names(*extra)) }; !repeated.empty()) {
    throw configuration_error("Project " + config.name +
                              ": these part names appear twice: " + join(repeated, ", "));
  }

  for (auto const &part : extra->parts) { systems.validate(part); }

  for (auto const &[part_name, options] : extra->part_options) {
    if (std::ranges::find(extra->parts, part_name, &project_config::name) ==
        extra->parts.end()) {
      throw configuration_error("Project " + config.name + ": options given for unknown part " +
                                part_name);
    }
    (void)cross_version_parse(options.cross_version);
  }
}

project_config assemble_build_system::resolve(project_config const &config,
                                              std::filesystem::path const &dir,
                                              build_env const &env) const {
  check_nil_uri(config);

  auto extra{ assemble_options(config) };
  for (auto &part : extra.parts) {
    tui::info("Resolving part %s of %s", part.name.c_str(), config.name.c_str());
    auto const part_dir{ assemble_part_dir(dir, part.name) };
    std::filesystem::create_directories(part_dir);
    part = env.systems.get(part.system, part.name).resolve(part, part_dir, env);
  }

  auto resolved{ config };
  resolved.extra = std::move(extra);
  return resolved;
}

extracted_meta assemble_build_system::extract_dependencies(extraction_config const &config,
                                                           std::filesystem::path const &dir,
                                                           build_env const &env) const {
  auto const &extra{ assemble_options(config.project) };
  auto const names{ part_names(extra) };

  if (auto const repeated{ repeated_names(names) }; !repeated.empty()) {
    throw configuration_error("These part names appear twice: " + join(repeated, ", "));
  }

  std::vector<std::string> failed;
  std::vector<project_config_and_extracted> extracted;
  for (auto const &part : extra.parts) {
    auto const outcome{ env.extractions.extract(
        { .project = part, .options = assemble_part_options(extra, part.name) },
        assemble_part_dir(dir, part.name),
        env) };

    if (auto const *bad{ std::get_if<extraction_failed>(&outcome) }) {
      failed.push_back(part.name + " (" + bad->reason + ")");
      continue;
    }
    auto const &ok{ std::get<extraction_ok>(outcome) };
    if (ok.results.empty()) {
      throw internal_error("extraction of part " + part.name + " returned no results");
    }
    extracted.insert(extracted.end(), ok.results.begin(), ok.results.end());
  }

  if (!failed.empty()) {
    throw consistency_error("Parts failed extraction: " + join(failed, ", "));
  }

  // Every module may be provided by one part only
  std::map<std::string, std::vector<std::string>> providers;
  for (auto const &pce : extracted) {
    for (auto const &module : pce.extracted.modules) {
      providers[module.id().key()].push_back(pce.config.name);
    }
  }

  std::vector<std::string> duplicates;
  for (auto const &[module, parts] : providers) {
    if (parts.size() < 2) { continue; }
    auto const message{ module + " is provided by: " + join(parts, ", ") };
    tui::error("%s", message.c_str());
    duplicates.push_back(message);
  }
  if (!duplicates.empty()) {
    throw consistency_error("Duplicate artifacts found in project " + config.project.name +
                            ": " + join(duplicates, "; "));
  }

  extracted_meta meta{ .version = "0.0.0", .subprojects = names };
  for (auto const &pce : extracted) {
    meta.modules.insert(meta.modules.end(),
                        pce.extracted.modules.begin(),
                        pce.extracted.modules.end());
  }
  tui::info("These subprojects will be built: %s", join(names, ", ").c_str());
  return meta;
}

build_artifacts_out assemble_build_system::run_build(repeatable_project_build const &build,
                                                     std::filesystem::path const &dir,
                                                     build_input const &input,
                                                     build_env const &env) const {
  auto const &project{ build.config.name };
  auto const &extra{ assemble_options(build.config) };
  auto const mode{ cross_version_parse(build.options.cross_version) };
  auto const &local_repo{ input.local_repo };

  // In-place file operations follow; start from an empty repository
  std::filesystem::remove_all(local_repo);
  std::filesystem::create_directories(local_repo);

  std::vector<built_part> parts;
  for (auto const &part : extra.parts) {
    DBUILD_TRACE_PART_START(project, part.name);
    tui::info("Building part %s of %s", part.name.c_str(), project.c_str());

    extraction_config const part_extraction{ .project = part,
                                             .options = assemble_part_options(extra,
                                                                              part.name) };
    auto const cached{ env.extractions.cached(part_extraction) };
    if (!cached) {
      throw internal_error("extraction metadata not found for part " + part.name);
    }
    if (cached->results.empty()) {
      throw internal_error("extraction of part " + part.name + " returned no results");
    }
    auto const &pce{ cached->results.front() };

    // No dependencies: a part never sees another part's artifacts
    repeatable_project_build const part_build{ .config = pce.config,
                                               .version = pce.extracted.version,
                                               .dependency_uuids = {},
                                               .subprojects = pce.extracted.subprojects,
                                               .options = part_extraction.options };
    auto const outcome{ env.builds.build(part_build,
                                         assemble_part_dir(dir, part.name),
                                         env) };

    if (std::holds_alternative<build_bad>(outcome)) {
      throw std::runtime_error("Part " + part.name + ": " + outcome_reason(outcome));
    }
    auto const *good{ std::get_if<build_good>(&outcome) };
    if (!good) { throw internal_error("build of part " + part.name + " returned no build"); }

    parts.push_back(
        { .name = part.name, .uuid = part_build.uuid(), .artifacts = good->artifacts });
  }

  disambiguate_subprojects(parts);

  std::vector<artifact_location> built_artifacts;
  for (auto const &p : parts) {
    for (auto const &r : p.artifacts.results) {
      built_artifacts.insert(built_artifacts.end(), r.artifacts.begin(), r.artifacts.end());
    }
  }
  auto const suffix{ cross_suffix(mode, find_core_version(extra.core, built_artifacts),
                                  extra.core) };

  std::vector<std::string> uuids;
  for (auto const &p : parts) { uuids.push_back(p.uuid); }
  tui::info("Retrieving artifacts of %zu parts", uuids.size());
  env.repository.retrieve(uuids, local_repo);

  // Rename: non-core modules take the assemble's suffix
  std::unordered_map<std::string, std::string> moved;
  for (auto &p : parts) {
    for (auto &r : p.artifacts.results) {
      for (auto &sha : r.shas) {
        auto const new_location{
          rename_location(local_repo, sha.location, suffix, extra.core)
        };
        if (new_location != sha.location) { moved[sha.location] = new_location; }
        sha.location = new_location;
      }
      for (auto &a : r.artifacts) {
        if (is_core_module(extra.core, a.module)) { continue; }
        a.cross_suffix = suffix;
        if (auto const it{ moved.find(a.path) }; it != moved.end()) { a.path = it->second; }
      }
    }
  }

  std::vector<artifact_location> available;
  for (auto const &p : parts) {
    for (auto const &r : p.artifacts.results) {
      available.insert(available.end(), r.artifacts.begin(), r.artifacts.end());
    }
  }
  rewrite_descriptors(local_repo, available);

  // Contents and paths changed: one entry per sub-project, under its disambiguated
  // name, with freshly computed shas
  build_artifacts_out out;
  for (auto const &p : parts) {
    for (auto const &r : p.artifacts.results) {
      build_subartifacts_out sub{ .subproject = r.subproject, .artifacts = r.artifacts };
      sub.shas = scan_shas(local_repo, sub.artifacts);
      out.results.push_back(std::move(sub));
    }
  }
  return out;
}

}  // namespace dbuild
