#include "orchestrator.h"

#include "artifact_repository.h"
#include "build_cache.h"
#include "cross_version.h"
#include "errors.h"
#include "extraction_cache.h"
#include "identity.h"
#include "trace.h"
#include "tui.h"

#include <tbb/flow_graph.h>
#include <tbb/parallel_for.h>

#include <algorithm>
#include <map>
#include <optional>
#include <set>
#include <stdexcept>
#include <utility>

namespace dbuild {

namespace {

// Per-project state for one run; index i belongs to config.projects[i]
struct project_state {
  project_config resolved;
  std::optional<build_outcome> extraction;
  extracted_meta meta;
  std::vector<std::size_t> dependencies;
  repeatable_project_build build;
  std::optional<build_outcome> outcome;
};

extracted_meta merge_extracted(extraction_ok const &ok) {
  if (ok.results.empty()) {
    throw internal_error("extraction of " + ok.project + " returned no results");
  }
  extracted_meta meta{ .version = ok.results.front().extracted.version };
  for (auto const &r : ok.results) {
    meta.modules.insert(meta.modules.end(),
                        r.extracted.modules.begin(),
                        r.extracted.modules.end());
    meta.subprojects.insert(meta.subprojects.end(),
                            r.extracted.subprojects.begin(),
                            r.extracted.subprojects.end());
  }
  return meta;
}

// Maps every module key to the index of the project producing it
std::map<std::string, std::size_t> module_providers(std::vector<project_state> const &states,
                                                    build_config const &config) {
  std::map<std::string, std::size_t> providers;
  std::vector<std::string> conflicts;
  for (std::size_t i{ 0 }; i < states.size(); ++i) {
    for (auto const &m : states[i].meta.modules) {
      auto const [it, inserted]{ providers.emplace(m.id().key(), i) };
      if (!inserted && it->second != i) {
        conflicts.push_back(m.id().key() + " is provided by: " +
                            config.projects[it->second].name + ", " +
                            config.projects[i].name);
      }
    }
  }
  if (!conflicts.empty()) {
    std::string msg{ "Modules declared by more than one project:" };
    for (auto const &c : conflicts) { msg += "\n  " + c; }
    throw configuration_error(msg);
  }
  return providers;
}

void check_cycles(std::vector<project_state> const &states, build_config const &config) {
  enum class mark { none, visiting, done };
  std::vector<mark> marks(states.size(), mark::none);
  std::vector<std::size_t> path;

  auto const visit = [&](auto const &self, std::size_t i) -> void {
    if (marks[i] == mark::done) { return; }
    if (marks[i] == mark::visiting) {
      auto const start{ std::ranges::find(path, i) };
      std::string cycle;
      for (auto it{ start }; it != path.end(); ++it) {
        cycle += config.projects[*it].name + " -> ";
      }
      throw configuration_error("Dependency cycle: " + cycle + config.projects[i].name);
    }
    marks[i] = mark::visiting;
    path.push_back(i);
    for (auto const d : states[i].dependencies) { self(self, d); }
    path.pop_back();
    marks[i] = mark::done;
  };

  for (std::size_t i{ 0 }; i < states.size(); ++i) { visit(visit, i); }
}

std::vector<std::size_t> topological_order(std::vector<project_state> const &states) {
  std::vector<std::size_t> order;
  std::vector<bool> placed(states.size(), false);

  auto const place = [&](auto const &self, std::size_t i) -> void {
    if (placed[i]) { return; }
    placed[i] = true;
    for (auto const d : states[i].dependencies) { self(self, d); }
    order.push_back(i);
  };

  for (std::size_t i{ 0 }; i < states.size(); ++i) { place(place, i); }
  return order;
}

}  // namespace

struct orchestrator::impl {
  impl(build_system_registry const &systems,
       artifact_repository &repository,
       std::filesystem::path work_dir)
      : systems{ systems }, repository{ repository }, work_dir{ std::move(work_dir) } {}

  build_system_registry const &systems;
  artifact_repository &repository;
  std::filesystem::path work_dir;
  extraction_cache extractions;
  build_cache builds;

  build_env env() { return { systems, extractions, builds, repository }; }

  void resolve_all(build_config const &config, std::vector<project_state> &states);
  void extract_all(build_config const &config, std::vector<project_state> &states);
  void build_all(build_config const &config, std::vector<project_state> &states);
  build_outcome build_one(project_config const &config,
                          std::vector<project_state> const &states,
                          project_state const &state);
};

void orchestrator::impl::resolve_all(build_config const &config,
                                     std::vector<project_state> &states) {
  tbb::parallel_for(std::size_t{ 0 }, states.size(), [&](std::size_t i) {
    auto const &project{ config.projects[i] };
    auto const dir{ orchestrator_project_dir(work_dir, project.name) };
    try {
      std::filesystem::create_directories(dir);
      states[i].resolved = systems.get(project.system, project.name)
                               .resolve(project, dir, env());
      tui::debug("Resolved %s: %s", project.name.c_str(), states[i].resolved.uri.c_str());
    } catch (configuration_error const &) {
      throw;
    } catch (std::runtime_error const &e) {
      tui::error("Project %s could not be resolved: %s", project.name.c_str(), e.what());
      states[i].extraction =
          extraction_failed{ .project = project.name,
                             .reason = std::string{ "resolution failed: " } + e.what() };
    }
  });
}

void orchestrator::impl::extract_all(build_config const &config,
                                     std::vector<project_state> &states) {
  tbb::parallel_for(std::size_t{ 0 }, states.size(), [&](std::size_t i) {
    if (states[i].extraction) { return; }
    auto const &project{ config.projects[i] };
    states[i].extraction =
        extractions.extract({ .project = states[i].resolved, .options = config.options },
                            orchestrator_project_dir(work_dir, project.name),
                            env());
  });

  for (auto &state : states) {
    std::visit(match{
                   [&](extraction_ok const &ok) { state.meta = merge_extracted(ok); },
                   [](extraction_failed const &f) {
                     tui::error("Extraction of %s failed: %s",
                                f.project.c_str(),
                                f.reason.c_str());
                   },
                   [](auto const &) {
                     throw internal_error("extraction cache returned a build outcome");
                   },
               },
               *state.extraction);
  }
}

build_outcome orchestrator::impl::build_one(project_config const &config,
                                            std::vector<project_state> const &states,
                                            project_state const &state) {
  tui::tag_scope const tag{ config.name };
  std::vector<std::string> blocked_by;
  for (auto const d : state.dependencies) {
    if (!std::holds_alternative<build_good>(*states[d].outcome)) {
      blocked_by.push_back(outcome_project(*states[d].outcome));
    }
  }

  if (!blocked_by.empty()) {
    for (auto const &b : blocked_by) { DBUILD_TRACE_PROJECT_BLOCKED(config.name, b); }
    tui::warn("Project %s is blocked by %s",
              config.name.c_str(),
              blocked_by.front().c_str());
    return build_bad{ .project = config.name,
                      .cause = build_bad::kind::blocked,
                      .reason = "blocked by failed dependencies",
                      .blocked_by = std::move(blocked_by) };
  }

  return builds.build(state.build, orchestrator_project_dir(work_dir, config.name), env());
}

void orchestrator::impl::build_all(build_config const &config,
                                   std::vector<project_state> &states) {
  using node_t = tbb::flow::continue_node<tbb::flow::continue_msg>;

  tbb::flow::graph graph;
  std::vector<std::unique_ptr<node_t>> nodes;
  nodes.reserve(states.size());

  for (std::size_t i{ 0 }; i < states.size(); ++i) {
    nodes.push_back(std::make_unique<node_t>(
        graph,
        [this, i, &config, &states](tbb::flow::continue_msg const &) {
          states[i].outcome = build_one(config.projects[i], states, states[i]);
        }));
  }

  for (std::size_t i{ 0 }; i < states.size(); ++i) {
    for (auto const d : states[i].dependencies) {
      tbb::flow::make_edge(*nodes[d], *nodes[i]);
    }
  }

  for (std::size_t i{ 0 }; i < states.size(); ++i) {
    if (states[i].dependencies.empty()) { nodes[i]->try_put(tbb::flow::continue_msg{}); }
  }
  graph.wait_for_all();
}

orchestrator::orchestrator(build_system_registry const &systems,
                           artifact_repository &repository,
                           std::filesystem::path work_dir)
    : m{ std::make_unique<impl>(systems, repository, std::move(work_dir)) } {}

orchestrator::~orchestrator() = default;

void orchestrator::validate(build_config const &config) const {
  (void)cross_version_parse(config.options.cross_version);

  std::set<std::string> names;
  for (auto const &project : config.projects) {
    if (project.name.empty()) { throw configuration_error("Project without a name"); }
    if (!names.insert(project.name).second) {
      throw configuration_error("Project " + project.name + " is declared twice");
    }
    m->systems.validate(project);
  }
}

root_outcome orchestrator::run(build_config const &config) {
  validate(config);

  std::vector<project_state> states(config.projects.size());
  m->resolve_all(config, states);
  m->extract_all(config, states);

  std::vector<std::string> failed;
  for (auto const &state : states) {
    if (std::holds_alternative<extraction_failed>(*state.extraction)) {
      failed.push_back(outcome_project(*state.extraction));
    }
  }

  root_outcome root;
  if (!failed.empty()) {
    for (std::size_t i{ 0 }; i < states.size(); ++i) {
      if (std::holds_alternative<extraction_failed>(*states[i].extraction)) {
        root.projects.push_back(*states[i].extraction);
      } else {
        root.projects.push_back(build_bad{ .project = config.projects[i].name,
                                           .cause = build_bad::kind::blocked,
                                           .reason = "extraction failed",
                                           .blocked_by = failed });
      }
    }
    return root;
  }

  auto const providers{ module_providers(states, config) };
  for (std::size_t i{ 0 }; i < states.size(); ++i) {
    std::set<std::size_t> deps;
    for (auto const &module : states[i].meta.modules) {
      for (auto const &d : module.dependencies) {
        auto const it{ providers.find(d.key()) };
        if (it != providers.end() && it->second != i) { deps.insert(it->second); }
      }
    }
    states[i].dependencies.assign(deps.begin(), deps.end());
  }
  check_cycles(states, config);

  for (auto const i : topological_order(states)) {
    std::vector<std::string> dependency_uuids;
    for (auto const d : states[i].dependencies) {
      dependency_uuids.push_back(states[d].build.uuid());
    }
    std::ranges::sort(dependency_uuids);

    states[i].build = { .config = states[i].resolved,
                        .version = states[i].meta.version,
                        .dependency_uuids = std::move(dependency_uuids),
                        .subprojects = states[i].meta.subprojects,
                        .options = config.options };
    tui::debug("Project %s has build uuid %s",
               config.projects[i].name.c_str(),
               states[i].build.uuid().c_str());
  }

  m->build_all(config, states);

  for (auto &state : states) {
    if (!state.outcome) { throw internal_error("a project was never scheduled"); }
    root.projects.push_back(std::move(*state.outcome));
  }
  return root;
}

void orchestrator::cancel() { m->builds.cancel(); }

build_env orchestrator::env() { return m->env(); }

extraction_cache &orchestrator::extractions() { return m->extractions; }

build_cache &orchestrator::builds() { return m->builds; }

std::filesystem::path orchestrator_project_dir(std::filesystem::path const &work_dir,
                                               std::string const &project) {
  return work_dir / "projects" / project_dir_name(project);
}

std::vector<std::pair<std::string, std::string>> orchestrator_fingerprints(
    build_config const &config) {
  std::vector<std::pair<std::string, std::string>> out;
  for (auto const &project : config.projects) {
    out.emplace_back(project.name,
                     fingerprint(extraction_config{ .project = project,
                                                    .options = config.options }));
  }
  return out;
}

}  // namespace dbuild
