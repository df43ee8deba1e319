#include "identity.h"

#include "blake3_util.h"
#include "util.h"

#include <algorithm>
#include <sstream>
#include <utility>

namespace dbuild {

namespace {

std::string canonical_list(std::vector<std::string> const &items) {
  std::ostringstream oss;
  oss << '{';
  bool first{ true };
  for (auto const &item : items) {
    if (!first) { oss << ','; }
    oss << item;
    first = false;
  }
  oss << '}';
  return oss.str();
}

std::string canonical(module_id const &id) {
  return canonical_table{}
      .set("organization", id.organization)
      .set("name", id.name)
      .str();
}

std::string canonical(artifact_ref const &artifact) {
  return canonical_table{}
      .set_default("extension", artifact.extension, "jar")
      .set("classifier", artifact.classifier)
      .str();
}

std::string canonical(core_module_rule const &rule) {
  std::vector<std::string> also;
  for (auto const &id : rule.also) { also.push_back(canonical(id)); }
  return canonical_table{}
      .set("organization", rule.organization)
      .set("name_prefix", rule.name_prefix)
      .set("version_module", rule.version_module)
      .set_set("also", std::move(also))
      .str();
}

std::string canonical(command_extra const &extra) {
  std::vector<std::string> modules;
  for (auto const &m : extra.modules) { modules.push_back(canonical(m)); }

  std::vector<std::string> exclude;
  for (auto const &e : extra.exclude) { exclude.push_back(canonical_quote(e)); }

  return canonical_table{}
      .set("version", extra.version)
      .set("directory", extra.directory)
      .set("build", extra.build)
      .set_set("modules", std::move(modules))
      .set_set("exclude", std::move(exclude))
      .str();
}

std::string canonical(assemble_extra const &extra) {
  std::vector<std::string> parts;
  for (auto const &p : extra.parts) { parts.push_back(canonical(p)); }

  canonical_table part_options;
  for (auto const &[name, options] : extra.part_options) {
    part_options.set_raw(canonical_quote(name), canonical(options));
  }

  canonical_table table;
  table.set_list("parts", std::move(parts));
  table.set_raw("part_options", part_options.str());
  if (!(extra.core == core_module_rule{})) { table.set_raw("core", canonical(extra.core)); }
  return table.str();
}

}  // namespace

canonical_table &canonical_table::set(std::string key, std::string_view value) {
  if (!value.empty()) { fields_[std::move(key)] = canonical_quote(value); }
  return *this;
}

canonical_table &canonical_table::set_default(std::string key,
                                              std::string_view value,
                                              std::string_view default_value) {
  if (value != default_value) { return set(std::move(key), value); }
  return *this;
}

canonical_table &canonical_table::set_raw(std::string key, std::string canonical) {
  if (canonical != "{}") { fields_[std::move(key)] = std::move(canonical); }
  return *this;
}

canonical_table &canonical_table::set_list(std::string key,
                                           std::vector<std::string> items) {
  if (!items.empty()) { fields_[std::move(key)] = canonical_list(items); }
  return *this;
}

canonical_table &canonical_table::set_set(std::string key, std::vector<std::string> items) {
  std::ranges::sort(items);
  auto const dup{ std::ranges::unique(items) };
  items.erase(dup.begin(), dup.end());
  return set_list(std::move(key), std::move(items));
}

std::string canonical_table::str() const {
  std::ostringstream oss;
  oss << '{';
  bool first{ true };
  for (auto const &[key, value] : fields_) {
    if (!first) { oss << ','; }
    oss << key << '=' << value;
    first = false;
  }
  oss << '}';
  return oss.str();
}

std::string canonical_quote(std::string_view value) {
  std::string result;
  result.reserve(value.size() + 2);
  result += '"';
  for (char c : value) {
    if (c == '"' || c == '\\') { result += '\\'; }
    result += c;
  }
  result += '"';
  return result;
}

std::string canonical(module_descriptor const &module) {
  std::vector<std::string> artifacts;
  for (auto const &a : module.artifacts) { artifacts.push_back(canonical(a)); }

  std::vector<std::string> deps;
  for (auto const &d : module.dependencies) { deps.push_back(canonical(d)); }

  return canonical_table{}
      .set("name", module.name)
      .set("organization", module.organization)
      .set_set("artifacts", std::move(artifacts))
      .set_set("dependencies", std::move(deps))
      .str();
}

std::string canonical(build_options const &options) {
  return canonical_table{}
      .set_default("cross_version",
                   options.cross_version,
                   build_options::kDefaultCrossVersion)
      .str();
}

// Notifications do not influence what gets built and are left out.
std::string canonical(project_config const &config) {
  auto extra{ std::visit([](auto const &e) { return canonical(e); }, config.extra) };

  canonical_table table;
  table.set("name", config.name)
      .set("system", config.system)
      .set("uri", config.uri)
      .set_raw("extra", std::move(extra));
  if (config.set_version) {
    table.set_raw("set_version", canonical_quote(*config.set_version));
  }
  return table.str();
}

std::string canonical(extraction_config const &config) {
  return canonical_table{}
      .set_raw("project", canonical(config.project))
      .set_raw("options", canonical(config.options))
      .str();
}

std::string canonical(repeatable_project_build const &build) {
  std::vector<std::string> deps;
  for (auto const &uuid : build.dependency_uuids) { deps.push_back(canonical_quote(uuid)); }

  std::vector<std::string> subprojects;
  for (auto const &s : build.subprojects) { subprojects.push_back(canonical_quote(s)); }

  return canonical_table{}
      .set_raw("config", canonical(build.config))
      .set("version", build.version)
      .set_set("dependencies", std::move(deps))
      .set_list("subprojects", std::move(subprojects))
      .set_raw("options", canonical(build.options))
      .str();
}

std::string identity_hash(std::string_view canonical_text) {
  return blake3_hex(canonical_text);
}

std::string project_dir_name(std::string_view project_name) {
  return blake3_hex(project_name);
}

std::string repeatable_project_build::uuid() const { return fingerprint(*this); }

}  // namespace dbuild
