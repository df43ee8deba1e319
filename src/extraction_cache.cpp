#include "extraction_cache.h"

#include "errors.h"
#include "identity.h"
#include "single_flight.h"
#include "trace.h"
#include "tui.h"

#include <atomic>

namespace dbuild {

struct extraction_cache::impl {
  single_flight<build_outcome> entries;
  std::atomic_size_t computations{ 0 };
};

extraction_cache::extraction_cache() : m{ std::make_unique<impl>() } {}

extraction_cache::~extraction_cache() = default;

build_outcome extraction_cache::extract(extraction_config const &config,
                                        std::filesystem::path const &dir,
                                        build_env const &env) {
  auto const &project{ config.project.name };
  auto const key{ fingerprint(config) };

  bool computed{ false };
  auto outcome{ m->entries.get_or_compute(
      key,
      [&]() -> build_outcome {
        ++m->computations;
        DBUILD_TRACE_EXTRACTION_CACHE_MISS(project, key);
        tui::info("Extracting dependencies of %s", project.c_str());

        auto const &system{ env.systems.get(config.project.system, project) };
        try {
          std::filesystem::create_directories(dir);
          auto meta{ system.extract_dependencies(config, dir, env) };
          return extraction_ok{ .project = project,
                                .results = { { config.project, std::move(meta) } } };
        } catch (internal_error const &) {
          throw;
        } catch (std::exception const &e) {
          tui::error("Extraction of %s failed: %s", project.c_str(), e.what());
          return extraction_failed{ .project = project, .reason = e.what() };
        }
      },
      &computed) };

  if (!computed) { DBUILD_TRACE_EXTRACTION_CACHE_HIT(project, key); }

  if (!std::holds_alternative<extraction_ok>(outcome) &&
      !std::holds_alternative<extraction_failed>(outcome)) {
    throw internal_error("extraction cache for " + project + " holds " +
                         outcome_status(outcome));
  }
  return outcome;
}

std::optional<extraction_ok> extraction_cache::cached(
    extraction_config const &config) const {
  auto const outcome{ m->entries.peek(fingerprint(config)) };
  if (!outcome) { return std::nullopt; }
  if (auto const *ok{ std::get_if<extraction_ok>(&*outcome) }) { return *ok; }
  return std::nullopt;
}

std::size_t extraction_cache::computations() const { return m->computations; }

}  // namespace dbuild
