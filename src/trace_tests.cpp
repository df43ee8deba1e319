#include "trace.h"

#include "doctest.h"

#include <string>

TEST_CASE("trace_event_to_string renders name and fields") {
  dbuild::trace_event_t const event{ dbuild::trace_events::build_complete{
      .project = "lib",
      .uuid = "abc",
      .good = true,
      .duration_ms = 12,
  } };

  CHECK(dbuild::trace_event_name(event) == "build_complete");
  CHECK(dbuild::trace_event_to_string(event) ==
        "build_complete project=lib uuid=abc good=true duration_ms=12");
}

TEST_CASE("trace_event_to_json escapes strings") {
  dbuild::trace_event_t const event{ dbuild::trace_events::artifact_renamed{
      .from = "a\"b",
      .to = "c\nd",
  } };

  auto const json{ dbuild::trace_event_to_json(event) };
  CHECK(json.find("\"event\":\"artifact_renamed\"") != std::string::npos);
  CHECK(json.find("\"from\":\"a\\\"b\"") != std::string::npos);
  CHECK(json.find("\"to\":\"c\\nd\"") != std::string::npos);
  CHECK(json.back() == '}');
}
