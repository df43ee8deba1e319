#include "repo_layout.h"

#include <algorithm>
#include <regex>

namespace dbuild {

namespace {

std::regex const &maven_pattern() {
  static std::regex const re{ R"((.*)/([^/]*)/([^/]*)/\2(-[^/]*))" };
  return re;
}

std::regex const &ivy_descriptor_pattern() {
  static std::regex const re{ R"(([^/]*)/([^/]*)/([^/]*)/(ivys)/([^/]*))" };
  return re;
}

std::regex const &ivy_pattern() {
  static std::regex const re{ R"(([^/]*)/([^/]*)/([^/]*)/([^/]*)/\2([^/]*))" };
  return re;
}

std::string dotted_to_dirs(std::string organization) {
  std::ranges::replace(organization, '.', '/');
  return organization;
}

}  // namespace

std::string repo_path::relocated(std::string_view new_name) const {
  std::string const name_str{ new_name };
  switch (kind) {
    case layout::maven:
      return dotted_to_dirs(organization) + "/" + name_str + "/" + version + "/" +
             name_str + rest;
    case layout::ivy_descriptor:
      return organization + "/" + name_str + "/" + version + "/" + conf + "/" + rest;
    case layout::ivy:
      return organization + "/" + name_str + "/" + version + "/" + conf + "/" + name_str +
             rest;
  }
  return {};
}

std::optional<repo_path> repo_path_parse(std::string_view location) {
  std::string const text{ location };
  std::smatch m;

  if (std::regex_match(text, m, maven_pattern())) {
    auto organization{ m[1].str() };
    std::ranges::replace(organization, '/', '.');
    return repo_path{ .kind = repo_path::layout::maven,
                      .organization = std::move(organization),
                      .name = m[2].str(),
                      .version = m[3].str(),
                      .rest = m[4].str() };
  }
  if (std::regex_match(text, m, ivy_descriptor_pattern())) {
    return repo_path{ .kind = repo_path::layout::ivy_descriptor,
                      .organization = m[1].str(),
                      .name = m[2].str(),
                      .version = m[3].str(),
                      .rest = m[5].str(),
                      .conf = m[4].str() };
  }
  if (std::regex_match(text, m, ivy_pattern())) {
    return repo_path{ .kind = repo_path::layout::ivy,
                      .organization = m[1].str(),
                      .name = m[2].str(),
                      .version = m[3].str(),
                      .rest = m[5].str(),
                      .conf = m[4].str() };
  }
  return std::nullopt;
}

std::filesystem::path maven_module_dir(std::filesystem::path const &repo_root,
                                       module_id const &module,
                                       std::string_view cross_suffix) {
  return repo_root / dotted_to_dirs(module.organization) /
         (module.name + std::string{ cross_suffix });
}

std::filesystem::path ivy_module_dir(std::filesystem::path const &repo_root,
                                     module_id const &module,
                                     std::string_view cross_suffix) {
  return repo_root / module.organization / (module.name + std::string{ cross_suffix });
}

std::optional<std::string> pom_path_module_name(std::string_view location) {
  static std::regex const re{ R"(.*/([^/]*)/([^/]*)/\1-[^/]*\.pom)" };
  std::string const text{ location };
  std::smatch m;
  if (!std::regex_match(text, m, re)) { return std::nullopt; }
  return m[1].str();
}

std::optional<std::string> ivy_path_module_name(std::string_view location) {
  static std::regex const re{ R"([^/]*/([^/]*)/[^/]*/ivys/ivy\.xml)" };
  std::string const text{ location };
  std::smatch m;
  if (!std::regex_match(text, m, re)) { return std::nullopt; }
  return m[1].str();
}

}  // namespace dbuild
