#include "cross_version.h"

#include "errors.h"

#include <regex>

namespace dbuild {

namespace {

struct mode_name {
  cross_version_mode mode;
  std::string_view name;
};

constexpr mode_name kModeNames[]{
  { cross_version_mode::disabled, "disabled" },
  { cross_version_mode::full, "full" },
  { cross_version_mode::binary, "binary" },
  { cross_version_mode::standard, "standard" },
};

}  // namespace

cross_version_mode cross_version_parse(std::string_view text) {
  for (auto const &[mode, name] : kModeNames) {
    if (name == text) { return mode; }
  }
  throw configuration_error("Unrecognized cross-version option \"" + std::string{ text } +
                            "\" (expected disabled, full, binary or standard)");
}

std::string_view cross_version_name(cross_version_mode mode) {
  for (auto const &[m, name] : kModeNames) {
    if (m == mode) { return name; }
  }
  return "unknown";
}

std::string binary_version(std::string_view version) {
  static std::regex const kBinary{ R"((\d+\.\d+)(?:\..+)?)" };

  std::string const text{ version };
  std::smatch match;
  if (!std::regex_match(text, match, kBinary)) {
    throw consistency_error("Cannot extract binary version from string \"" + text + "\"");
  }
  return match[1].str();
}

std::string cross_suffix(cross_version_mode mode,
                         std::optional<std::string> const &core_version,
                         core_module_rule const &rule) {
  if (mode == cross_version_mode::disabled) { return ""; }

  if (!core_version) {
    throw consistency_error("The requested cross-version level is " +
                            std::string{ cross_version_name(mode) } + ", but no " +
                            rule.version_module + " was found among the artifacts");
  }
  auto const &version{ *core_version };

  switch (mode) {
    case cross_version_mode::full: return "_" + version;
    case cross_version_mode::binary: return "_" + binary_version(version);
    case cross_version_mode::standard:
      // A hyphen marks a pre-release; those keep the full version
      return "_" + (version.find('-') != std::string::npos ? version
                                                           : binary_version(version));
    case cross_version_mode::disabled: break;
  }
  return "";
}

std::string fix_name(std::string_view name) {
  static std::regex const kSuffixed{ R"((.+)_\d+\.\d+(?:[.\-][^_]*)?)" };

  std::string const text{ name };
  std::smatch match;
  if (std::regex_match(text, match, kSuffixed)) { return match[1].str(); }
  return text;
}

bool is_core_module(core_module_rule const &rule, module_id const &module) {
  if (module.organization == rule.organization &&
      fix_name(module.name).starts_with(rule.name_prefix)) {
    return true;
  }
  for (auto const &extra : rule.also) {
    if (module.organization == extra.organization && fix_name(module.name) == extra.name) {
      return true;
    }
  }
  return false;
}

std::optional<std::string> find_core_version(
    core_module_rule const &rule,
    std::vector<artifact_location> const &artifacts) {
  for (auto const &a : artifacts) {
    if (a.module.organization == rule.organization && a.module.name == rule.version_module) {
      return a.version;
    }
  }
  return std::nullopt;
}

}  // namespace dbuild
