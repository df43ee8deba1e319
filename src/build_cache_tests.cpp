#include "build_cache.h"

#include "errors.h"
#include "identity.h"
#include "test_support.h"

#include "doctest.h"

#include <algorithm>
#include <chrono>
#include <thread>
#include <vector>

namespace {

using dbuild::test::fake_config;
using dbuild::test::fake_modules;

dbuild::module_descriptor const kCore{ .name = "core", .organization = "org.x" };

struct build_fixture : dbuild::test::test_env {
  dbuild::repeatable_project_build make_build(std::string const &name,
                                              std::vector<std::string> deps = {}) {
    return { .config = fake_config(name),
             .version = "1.0",
             .dependency_uuids = std::move(deps),
             .subprojects = {},
             .options = {} };
  }

  dbuild::build_outcome build(dbuild::repeatable_project_build const &b) {
    return builds.build(b, root / "projects" / dbuild::project_dir_name(b.config.name), env());
  }
};

}  // namespace

TEST_CASE_FIXTURE(build_fixture, "build_cache builds and publishes") {
  fake->set("lib", fake_modules("1.0", { kCore }));
  auto const b{ make_build("lib") };

  auto const outcome{ build(b) };

  REQUIRE(std::holds_alternative<dbuild::build_good>(outcome));
  auto const &good{ std::get<dbuild::build_good>(outcome) };
  CHECK(good.project == "lib");
  REQUIRE(good.artifacts.results.size() == 1);
  CHECK(good.artifacts.results[0].artifacts[0].path == "org/x/core/1.0/core-1.0.jar");

  auto const published{ repository->lookup(b.uuid()) };
  REQUIRE(published.has_value());
  CHECK(published->results[0].shas.size() == good.artifacts.results[0].shas.size());
  CHECK(builds.cached(b.uuid()).has_value());
}

TEST_CASE_FIXTURE(build_fixture, "build_cache builds once for concurrent requests") {
  auto behavior{ fake_modules("1.0", { kCore }) };
  behavior.delay = std::chrono::milliseconds{ 50 };
  fake->set("lib", behavior);
  auto const b{ make_build("lib") };

  std::vector<dbuild::build_outcome> outcomes(8);
  std::vector<std::thread> threads;
  for (std::size_t i{ 0 }; i < outcomes.size(); ++i) {
    threads.emplace_back([&, i] { outcomes[i] = build(b); });
  }
  for (auto &t : threads) { t.join(); }

  CHECK(fake->builds("lib") == 1);
  CHECK(builds.builds_run() == 1);
  auto const &first{ std::get<dbuild::build_good>(outcomes[0]) };
  for (auto const &o : outcomes) {
    REQUIRE(std::holds_alternative<dbuild::build_good>(o));
    CHECK(std::get<dbuild::build_good>(o).artifacts.results[0].shas[0].sha ==
          first.artifacts.results[0].shas[0].sha);
  }
}

TEST_CASE_FIXTURE(build_fixture, "build_cache reuses artifacts published by an earlier run") {
  fake->set("lib", fake_modules("1.0", { kCore }));
  auto const b{ make_build("lib") };
  REQUIRE(std::holds_alternative<dbuild::build_good>(build(b)));

  dbuild::build_cache next_run;
  auto const outcome{ next_run.build(b,
                                     root / "elsewhere",
                                     { *systems, extractions, next_run, *repository }) };

  REQUIRE(std::holds_alternative<dbuild::build_good>(outcome));
  CHECK(fake->builds("lib") == 1);
  CHECK(next_run.builds_run() == 0);
}

TEST_CASE_FIXTURE(build_fixture, "build_cache failures are data and are not published") {
  auto behavior{ fake_modules("1.0", { kCore }) };
  behavior.build_error = "exit status 2";
  fake->set("lib", behavior);
  auto const b{ make_build("lib") };

  auto const outcome{ build(b) };
  (void)build(b);

  REQUIRE(std::holds_alternative<dbuild::build_bad>(outcome));
  auto const &bad{ std::get<dbuild::build_bad>(outcome) };
  CHECK(bad.cause == dbuild::build_bad::kind::failed);
  CHECK(bad.reason == "exit status 2");
  CHECK(fake->builds("lib") == 1);
  CHECK_FALSE(repository->lookup(b.uuid()).has_value());
  CHECK_FALSE(builds.cached(b.uuid()).has_value());
}

TEST_CASE_FIXTURE(build_fixture, "build_cache materializes dependencies") {
  fake->set("lib", fake_modules("1.0", { kCore }));
  fake->set("app", fake_modules("1.0", { { .name = "app", .organization = "org.x" } }));

  auto const lib{ make_build("lib") };
  REQUIRE(std::holds_alternative<dbuild::build_good>(build(lib)));
  auto const app{ make_build("app", { lib.uuid() }) };
  REQUIRE(std::holds_alternative<dbuild::build_good>(build(app)));

  auto const seen{ fake->seen_dependency_files("app") };
  CHECK(std::ranges::find(seen, "org/x/core/1.0/core-1.0.jar") != seen.end());
  CHECK(std::ranges::find(seen, "org/x/core/1.0/core-1.0.pom.sha1") != seen.end());
}

TEST_CASE_FIXTURE(build_fixture, "build_cache rejects unpublished dependencies") {
  fake->set("app", fake_modules("1.0", {}));
  CHECK_THROWS_AS(build(make_build("app", { "never-built" })), dbuild::internal_error);
}

TEST_CASE_FIXTURE(build_fixture, "build_cache uuid depends on dependency uuids") {
  fake->set("app", fake_modules("1.0", {}));
  fake->set("lib", fake_modules("1.0", { kCore }));
  auto const lib{ make_build("lib") };
  REQUIRE(std::holds_alternative<dbuild::build_good>(build(lib)));

  CHECK(make_build("app").uuid() != make_build("app", { lib.uuid() }).uuid());
}

TEST_CASE_FIXTURE(build_fixture, "build_cache cancel stops a running build") {
  auto behavior{ fake_modules("1.0", { kCore }) };
  behavior.delay = std::chrono::seconds{ 10 };
  fake->set("lib", behavior);
  auto const b{ make_build("lib") };

  dbuild::build_outcome outcome;
  std::thread runner{ [&] { outcome = build(b); } };
  while (fake->builds("lib") == 0) {
    std::this_thread::sleep_for(std::chrono::milliseconds{ 5 });
  }
  builds.cancel();
  runner.join();

  REQUIRE(std::holds_alternative<dbuild::build_bad>(outcome));
  CHECK(std::get<dbuild::build_bad>(outcome).cause == dbuild::build_bad::kind::canceled);
  CHECK_FALSE(repository->lookup(b.uuid()).has_value());
  CHECK(builds.canceled());
}

TEST_CASE_FIXTURE(build_fixture, "build_cache refuses new builds after cancel") {
  fake->set("lib", fake_modules("1.0", { kCore }));
  builds.cancel();

  auto const outcome{ build(make_build("lib")) };

  REQUIRE(std::holds_alternative<dbuild::build_bad>(outcome));
  CHECK(std::get<dbuild::build_bad>(outcome).cause == dbuild::build_bad::kind::canceled);
  CHECK(fake->builds("lib") == 0);
}
