#pragma once

#include <stdexcept>
#include <string>

namespace dbuild {

// Invalid configuration detected before any build work starts: unknown build system,
// malformed cross-version option, duplicate module declarations, unknown notification
// kind, malformed manifest.
struct configuration_error : std::runtime_error {
  using std::runtime_error::runtime_error;
};

// Merged artifact sets that cannot be reconciled (duplicate modules across assemble
// parts, missing core version, unparseable version string).
struct consistency_error : std::runtime_error {
  using std::runtime_error::runtime_error;
};

// Broken caching or ordering invariant. Never converted into outcome data.
struct internal_error : std::logic_error {
  explicit internal_error(std::string const &what)
      : std::logic_error{ "Internal error: " + what } {}
};

}  // namespace dbuild
