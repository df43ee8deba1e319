#include "outcome.h"

#include "util.h"

#include <algorithm>

namespace dbuild {

std::string_view build_bad::status() const {
  switch (cause) {
    case kind::failed: return "build failed";
    case kind::blocked: return "blocked";
    case kind::canceled: return "canceled";
  }
  return "unknown";
}

std::string const &outcome_project(build_outcome const &outcome) {
  return std::visit([](auto const &o) -> std::string const & { return o.project; },
                    outcome);
}

bool outcome_succeeded(build_outcome const &outcome) {
  return std::holds_alternative<extraction_ok>(outcome) ||
         std::holds_alternative<build_good>(outcome);
}

std::string outcome_status(build_outcome const &outcome) {
  return std::visit(match{
                        [](extraction_ok const &) { return std::string{ "extracted" }; },
                        [](extraction_failed const &) {
                          return std::string{ "extraction failed" };
                        },
                        [](build_good const &) { return std::string{ "success" }; },
                        [](build_bad const &o) { return std::string{ o.status() }; },
                    },
                    outcome);
}

std::string outcome_reason(build_outcome const &outcome) {
  return std::visit(match{
                        [](extraction_ok const &) { return std::string{}; },
                        [](extraction_failed const &o) { return o.reason; },
                        [](build_good const &) { return std::string{}; },
                        [](build_bad const &o) {
                          if (o.cause != build_bad::kind::blocked) { return o.reason; }
                          std::string out{ "blocked by " };
                          for (std::size_t i{ 0 }; i < o.blocked_by.size(); ++i) {
                            if (i) { out += ", "; }
                            out += o.blocked_by[i];
                          }
                          return out;
                        },
                    },
                    outcome);
}

std::vector<std::string> outcome_when_ids(build_outcome const &outcome) {
  return std::visit(match{
                        [](extraction_ok const &) {
                          return std::vector<std::string>{ "success", "always" };
                        },
                        [](extraction_failed const &) {
                          return std::vector<std::string>{ "failure",
                                                           "extraction",
                                                           "bad",
                                                           "always" };
                        },
                        [](build_good const &) {
                          return std::vector<std::string>{ "success", "good", "always" };
                        },
                        [](build_bad const &o) {
                          if (o.cause == build_bad::kind::blocked) {
                            return std::vector<std::string>{ "failure",
                                                             "dependency",
                                                             "bad",
                                                             "always" };
                          }
                          return std::vector<std::string>{ "failure", "bad", "always" };
                        },
                    },
                    outcome);
}

bool root_outcome::succeeded() const {
  return std::ranges::all_of(projects,
                             [](build_outcome const &o) { return outcome_succeeded(o); });
}

std::vector<std::string> root_outcome::when_ids() const {
  if (succeeded()) { return { "success", "always" }; }
  return { "failure", "always" };
}

build_outcome const *root_outcome::find(std::string_view project) const {
  auto const it{ std::ranges::find_if(projects, [&](build_outcome const &o) {
    return outcome_project(o) == project;
  }) };
  return it == projects.end() ? nullptr : &*it;
}

}  // namespace dbuild
