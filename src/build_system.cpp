#include "build_system.h"

#include "build_systems/assemble_build_system.h"
#include "build_systems/command_build_system.h"
#include "errors.h"

#include <algorithm>
#include <stdexcept>

namespace dbuild {

void build_system_registry::add(std::unique_ptr<build_system> system) {
  std::string key{ system->name() };
  if (systems_.contains(key)) {
    throw std::logic_error("Build system registered twice: " + key);
  }
  systems_.emplace(std::move(key), std::move(system));
}

build_system const *build_system_registry::find(std::string_view kind) const {
  auto const it{ systems_.find(std::string{ kind }) };
  return it == systems_.end() ? nullptr : it->second.get();
}

build_system const &build_system_registry::get(std::string_view kind,
                                               std::string_view project) const {
  if (auto const *system{ find(kind) }) { return *system; }

  std::string known;
  for (auto const &k : kinds()) { known += (known.empty() ? "" : ", ") + k; }

  throw configuration_error("Project " + std::string{ project } +
                            ": unknown build system '" + std::string{ kind } +
                            "' (known: " + known + ")");
}

void build_system_registry::validate(project_config const &config) const {
  if (config.name.empty()) {
    throw configuration_error("Project with empty name (system '" + config.system + "')");
  }
  get(config.system, config.name).validate(config, *this);
}

std::vector<std::string> build_system_registry::kinds() const {
  std::vector<std::string> out;
  for (auto const &[kind, _] : systems_) { out.push_back(kind); }
  std::ranges::sort(out);
  return out;
}

std::unique_ptr<build_system_registry> make_default_build_systems() {
  auto registry{ std::make_unique<build_system_registry>() };
  registry->add(std::make_unique<command_build_system>());
  registry->add(std::make_unique<assemble_build_system>());
  return registry;
}

}  // namespace dbuild
