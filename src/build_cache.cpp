#include "build_cache.h"

#include "artifact_repository.h"
#include "errors.h"
#include "single_flight.h"
#include "trace.h"
#include "tui.h"

#include <chrono>
#include <cstdint>
#include <stdexcept>

namespace dbuild {

namespace {

std::int64_t elapsed_ms(std::chrono::steady_clock::time_point start) {
  return std::chrono::duration_cast<std::chrono::milliseconds>(
             std::chrono::steady_clock::now() - start)
      .count();
}

void reset_directory(std::filesystem::path const &dir) {
  std::filesystem::remove_all(dir);
  std::filesystem::create_directories(dir);
}

}  // namespace

struct build_cache::impl {
  single_flight<build_outcome> entries;
  std::atomic_bool cancel{ false };
  std::atomic_size_t builds_run{ 0 };

  build_outcome run(repeatable_project_build const &build,
                    std::string const &uuid,
                    std::filesystem::path const &dir,
                    build_env const &env);
};

build_outcome build_cache::impl::run(repeatable_project_build const &build,
                                     std::string const &uuid,
                                     std::filesystem::path const &dir,
                                     build_env const &env) {
  auto const &project{ build.config.name };

  if (cancel) {
    return build_bad{ .project = project,
                      .cause = build_bad::kind::canceled,
                      .reason = "canceled before start" };
  }

  build_input input{ .local_repo = dir / "local-repo", .deps_repo = dir / "deps-repo" };

  ++builds_run;
  DBUILD_TRACE_BUILD_START(project, uuid);
  tui::info("Building %s (%s)", project.c_str(), uuid.c_str());
  auto const start{ std::chrono::steady_clock::now() };

  try {
    reset_directory(input.local_repo);
    reset_directory(input.deps_repo);
    try {
      input.dependency_artifacts = env.repository.retrieve(build.dependency_uuids,
                                                           input.deps_repo);
    } catch (std::runtime_error const &e) {
      throw internal_error("dependencies of " + project + " are not available: " +
                           e.what());
    }

    auto const &system{ env.systems.get(build.config.system, project) };
    auto artifacts{ system.run_build(build, dir, input, env) };
    if (cancel) { throw std::runtime_error("canceled"); }

    env.repository.publish(uuid, input.local_repo, artifacts);
    DBUILD_TRACE_BUILD_COMPLETE(project, uuid, true, elapsed_ms(start));
    tui::info("Built %s", project.c_str());
    return build_good{ .project = project, .artifacts = std::move(artifacts) };
  } catch (internal_error const &) {
    throw;
  } catch (std::exception const &e) {
    DBUILD_TRACE_BUILD_COMPLETE(project, uuid, false, elapsed_ms(start));
    if (cancel) {
      tui::warn("Build of %s canceled", project.c_str());
      return build_bad{ .project = project,
                        .cause = build_bad::kind::canceled,
                        .reason = "canceled" };
    }
    tui::error("Build of %s failed: %s", project.c_str(), e.what());
    return build_bad{ .project = project, .reason = e.what() };
  }
}

build_cache::build_cache() : m{ std::make_unique<impl>() } {}

build_cache::~build_cache() = default;

build_outcome build_cache::build(repeatable_project_build const &build,
                                 std::filesystem::path const &dir,
                                 build_env const &env) {
  auto const &project{ build.config.name };
  auto const uuid{ build.uuid() };

  bool computed{ false };
  auto outcome{ m->entries.get_or_compute(
      uuid,
      [&]() -> build_outcome {
        if (auto published{ env.repository.lookup(uuid) }) {
          DBUILD_TRACE_BUILD_CACHE_HIT(project, uuid, true);
          tui::info("Reusing published artifacts of %s", project.c_str());
          return build_good{ .project = project, .artifacts = std::move(*published) };
        }
        DBUILD_TRACE_BUILD_CACHE_MISS(project, uuid);
        return m->run(build, uuid, dir, env);
      },
      &computed) };

  if (!computed) { DBUILD_TRACE_BUILD_CACHE_HIT(project, uuid, false); }

  if (!std::holds_alternative<build_good>(outcome) &&
      !std::holds_alternative<build_bad>(outcome)) {
    throw internal_error("build cache for " + project + " holds " +
                         outcome_status(outcome));
  }
  return outcome;
}

std::optional<build_good> build_cache::cached(std::string const &uuid) const {
  auto const outcome{ m->entries.peek(uuid) };
  if (!outcome) { return std::nullopt; }
  if (auto const *good{ std::get_if<build_good>(&*outcome) }) { return *good; }
  return std::nullopt;
}

void build_cache::cancel() { m->cancel = true; }

bool build_cache::canceled() const { return m->cancel; }

std::atomic_bool const *build_cache::cancel_flag() const { return &m->cancel; }

std::size_t build_cache::builds_run() const { return m->builds_run; }

}  // namespace dbuild
