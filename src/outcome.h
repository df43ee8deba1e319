#pragma once

#include "model.h"

#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace dbuild {

struct extraction_ok {
  std::string project;
  std::vector<project_config_and_extracted> results;
};

struct extraction_failed {
  std::string project;
  std::string reason;
};

struct build_good {
  std::string project;
  build_artifacts_out artifacts;
};

struct build_bad {
  enum class kind { failed, blocked, canceled };

  std::string project;
  kind cause{ kind::failed };
  std::string reason;
  std::vector<std::string> blocked_by;  // failed dependencies, when cause == blocked

  std::string_view status() const;
};

using build_outcome = std::variant<extraction_ok, extraction_failed, build_good, build_bad>;

std::string const &outcome_project(build_outcome const &outcome);
bool outcome_succeeded(build_outcome const &outcome);
std::string outcome_status(build_outcome const &outcome);
std::string outcome_reason(build_outcome const &outcome);

// Tags matched against notification trigger lists
std::vector<std::string> outcome_when_ids(build_outcome const &outcome);

// One final outcome per configured project, in configuration order
struct root_outcome {
  std::vector<build_outcome> projects;

  bool succeeded() const;
  std::vector<std::string> when_ids() const;
  build_outcome const *find(std::string_view project) const;
};

}  // namespace dbuild
