#include "command_build_system.h"

#include "artifact_repository.h"
#include "build_cache.h"
#include "cross_version.h"
#include "errors.h"
#include "repo_layout.h"
#include "shell.h"
#include "source.h"
#include "trace.h"
#include "tui.h"
#include "util.h"

#include <algorithm>
#include <chrono>
#include <set>
#include <stdexcept>

namespace dbuild {

namespace {

constexpr std::size_t kStderrTailLines{ 20 };

command_extra const &command_options(project_config const &config) {
  if (auto const *extra{ std::get_if<command_extra>(&config.extra) }) { return *extra; }
  throw internal_error("command options have the wrong type in project " + config.name);
}

std::vector<module_descriptor> produced_modules(command_extra const &extra) {
  std::vector<module_descriptor> out;
  for (auto const &m : extra.modules) {
    if (std::ranges::find(extra.exclude, m.name) == extra.exclude.end()) {
      out.push_back(m);
    }
  }
  return out;
}

std::string format_build_error(std::string const &project,
                               shell_result const &result,
                               std::string const &stderr_capture) {
  std::string msg{ "[" + project + "] Build script failed" };
  if (result.signal) {
    msg += " (terminated by signal " + std::to_string(*result.signal) + ")";
  } else {
    msg += " (exit code " + std::to_string(result.exit_code) + ")";
  }

  auto const tail{ util_tail_lines(stderr_capture, kStderrTailLines) };
  if (!tail.empty()) { msg += "\n" + tail; }
  return msg;
}

// Module directories under `parent` named `name` plus any cross-version suffix
std::vector<std::filesystem::path> suffixed_dirs(std::filesystem::path const &parent,
                                                 std::string const &name) {
  std::vector<std::filesystem::path> out;
  if (!std::filesystem::is_directory(parent)) { return out; }
  for (auto const &entry : std::filesystem::directory_iterator{ parent }) {
    if (entry.is_directory() && fix_name(entry.path().filename().string()) == name) {
      out.push_back(entry.path());
    }
  }
  std::ranges::sort(out);
  return out;
}

std::string artifact_file_name(std::string const &published_name,
                               std::string const &version,
                               artifact_ref const &ref,
                               bool ivy) {
  auto name{ ivy ? published_name : published_name + "-" + version };
  if (!ref.classifier.empty()) { name += "-" + ref.classifier; }
  return name + "." + ref.extension;
}

// Locates what `module` published at `version` in either repository layout
build_subartifacts_out scan_module(std::filesystem::path const &local_repo,
                                   module_descriptor const &module,
                                   std::string const &version) {
  auto const id{ module.id() };
  build_subartifacts_out sub{ .subproject = module.name };
  std::set<std::string> located;

  auto const collect = [&](std::filesystem::path const &module_dir, bool ivy) {
    auto const published_name{ module_dir.filename().string() };
    auto const version_dir{ module_dir / version };
    if (!std::filesystem::is_directory(version_dir)) { return; }

    for (auto const &ref : module.artifacts) {
      auto const file{ version_dir / (ivy ? ref.extension + "s" : std::string{}) /
                       artifact_file_name(published_name, version, ref, ivy) };
      if (!std::filesystem::is_regular_file(file)) {
        throw std::runtime_error("Module " + id.key() + " did not publish " +
                                 util_relative_generic(file, local_repo));
      }
      sub.artifacts.push_back(
          { .module = id,
            .artifact = ref,
            .cross_suffix = published_name.substr(module.name.size()),
            .path = util_relative_generic(file, local_repo),
            .version = version });
    }

    for (auto const &entry : std::filesystem::recursive_directory_iterator{ version_dir }) {
      if (!entry.is_regular_file()) { continue; }
      auto const location{ util_relative_generic(entry.path(), local_repo) };
      if (located.insert(location).second) {
        sub.shas.push_back(artifact_repository::make_artifact_sha(entry.path(), local_repo));
      }
    }
  };

  for (auto const &d : suffixed_dirs(maven_module_dir(local_repo, id, "").parent_path(),
                                     module.name)) {
    collect(d, false);
  }
  for (auto const &d : suffixed_dirs(ivy_module_dir(local_repo, id, "").parent_path(),
                                     module.name)) {
    collect(d, true);
  }

  if (sub.shas.empty()) {
    throw std::runtime_error("Module " + id.key() + " was not published at version " +
                             version);
  }
  return sub;
}

}  // namespace

void command_build_system::validate(project_config const &config,
                                    build_system_registry const &) const {
  auto const *extra{ std::get_if<command_extra>(&config.extra) };
  if (!extra) {
    throw configuration_error("Project " + config.name + " has no command options");
  }
  (void)source_parse(config.uri);

  if (extra->version.empty() && !config.set_version) {
    throw configuration_error("Project " + config.name + " declares no version");
  }

  std::set<std::string> seen;
  for (auto const &m : extra->modules) {
    if (m.name.empty() || m.organization.empty()) {
      throw configuration_error("Project " + config.name +
                                ": modules need a name and an organization");
    }
    if (!seen.insert(m.id().key()).second) {
      throw configuration_error("Project " + config.name + " declares " + m.id().key() +
                                " twice");
    }
  }
  for (auto const &excluded : extra->exclude) {
    if (std::ranges::none_of(extra->modules,
                             [&](auto const &m) { return m.name == excluded; })) {
      tui::warn("Project %s excludes undeclared module %s",
                config.name.c_str(),
                excluded.c_str());
    }
  }
}

project_config command_build_system::resolve(project_config const &config,
                                             std::filesystem::path const &,
                                             build_env const &) const {
  auto resolved{ config };
  resolved.uri = source_resolve(config.uri);
  return resolved;
}

extracted_meta command_build_system::extract_dependencies(extraction_config const &config,
                                                          std::filesystem::path const &,
                                                          build_env const &) const {
  auto const &extra{ command_options(config.project) };

  extracted_meta meta{ .version = config.project.set_version.value_or(extra.version),
                       .modules = produced_modules(extra) };
  if (meta.version.empty()) {
    throw std::runtime_error("Project " + config.project.name + " has no version");
  }
  // Declaration order carries no meaning; report modules and sub-projects sorted so
  // reordering them in the manifest keeps the build uuid
  std::ranges::sort(meta.modules, {}, [](module_descriptor const &m) { return m.id().key(); });
  for (auto const &m : meta.modules) { meta.subprojects.push_back(m.name); }
  std::ranges::sort(meta.subprojects);
  return meta;
}

build_artifacts_out command_build_system::run_build(repeatable_project_build const &build,
                                                    std::filesystem::path const &dir,
                                                    build_input const &input,
                                                    build_env const &env) const {
  auto const &project{ build.config.name };
  auto const &extra{ command_options(build.config) };

  auto const source_dir{ dir / "source" };
  source_checkout(build.config.uri, source_dir);

  std::string stderr_capture;
  shell_env_t shell_env{ shell_getenv() };
  shell_env["DBUILD_LOCAL_REPO"] = input.local_repo.string();
  shell_env["DBUILD_DEPS_REPO"] = input.deps_repo.string();
  shell_env["DBUILD_VERSION"] = build.version;
  shell_env["DBUILD_CROSS_VERSION"] = build.options.cross_version;
  shell_env["DBUILD_PROJECT"] = project;

  shell_run_cfg const cfg{ .on_stdout_line =
                               [&](std::string_view line) {
                                 tui::info("%.*s",
                                           static_cast<int>(line.size()),
                                           line.data());
                               },
                           .on_stderr_line =
                               [&](std::string_view line) {
                                 stderr_capture += line;
                                 stderr_capture += '\n';
                               },
                           .cwd = source_dir / extra.directory,
                           .env = std::move(shell_env),
                           .cancel = env.builds.cancel_flag() };

  auto const start{ std::chrono::steady_clock::now() };
  shell_result const result{ shell_run(extra.build, cfg) };
  DBUILD_TRACE_SHELL_COMPLETE(
      project,
      result.exit_code,
      std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() -
                                                            start)
          .count());

  if (result.canceled) { throw std::runtime_error("[" + project + "] Build canceled"); }
  if (result.exit_code != 0 || result.signal) {
    throw std::runtime_error(format_build_error(project, result, stderr_capture));
  }

  build_artifacts_out out;
  for (auto const &module : produced_modules(extra)) {
    out.results.push_back(scan_module(input.local_repo, module, build.version));
  }
  return out;
}

}  // namespace dbuild
