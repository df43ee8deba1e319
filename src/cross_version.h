#pragma once

#include "model.h"

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace dbuild {

enum class cross_version_mode { disabled, full, binary, standard };

// Throws configuration_error for anything but disabled/full/binary/standard
cross_version_mode cross_version_parse(std::string_view text);
std::string_view cross_version_name(cross_version_mode mode);

// Leading MAJOR.MINOR of a version string: "2.11.0-M5" -> "2.11".
// Throws consistency_error when the string has no such prefix.
std::string binary_version(std::string_view version);

// Suffix appended to non-core module names. `core_version` is the version of the core
// rule's version module, if one was built. Throws consistency_error when the mode needs
// a version and there is none.
std::string cross_suffix(cross_version_mode mode,
                         std::optional<std::string> const &core_version,
                         core_module_rule const &rule);

// Strips a cross-version suffix: "scala-xml_2.11.0-M5" -> "scala-xml"
std::string fix_name(std::string_view name);

bool is_core_module(core_module_rule const &rule, module_id const &module);

std::optional<std::string> find_core_version(core_module_rule const &rule,
                                             std::vector<artifact_location> const &artifacts);

}  // namespace dbuild
