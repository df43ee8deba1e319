#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <variant>

namespace dbuild {

namespace trace_events {

struct extraction_cache_hit {
  std::string project;
  std::string fingerprint;
};

struct extraction_cache_miss {
  std::string project;
  std::string fingerprint;
};

struct build_cache_hit {
  std::string project;
  std::string uuid;
  bool from_repository;
};

struct build_cache_miss {
  std::string project;
  std::string uuid;
};

struct build_start {
  std::string project;
  std::string uuid;
};

struct build_complete {
  std::string project;
  std::string uuid;
  bool good;
  std::int64_t duration_ms;
};

struct part_start {
  std::string assemble;
  std::string part;
};

struct artifact_renamed {
  std::string from;
  std::string to;
};

struct descriptor_rewritten {
  std::string path;
  std::string kind;
  bool changed;
};

struct repository_publish {
  std::string uuid;
  std::int64_t files;
};

struct repository_retrieve {
  std::string uuid;
  std::int64_t files;
};

struct project_blocked {
  std::string project;
  std::string dependency;
};

struct shell_complete {
  std::string project;
  int exit_code;
  std::int64_t duration_ms;
};

}  // namespace trace_events

using trace_event_t = std::variant<trace_events::extraction_cache_hit,
                                   trace_events::extraction_cache_miss,
                                   trace_events::build_cache_hit,
                                   trace_events::build_cache_miss,
                                   trace_events::build_start,
                                   trace_events::build_complete,
                                   trace_events::part_start,
                                   trace_events::artifact_renamed,
                                   trace_events::descriptor_rewritten,
                                   trace_events::repository_publish,
                                   trace_events::repository_retrieve,
                                   trace_events::project_blocked,
                                   trace_events::shell_complete>;

std::string_view trace_event_name(trace_event_t const &event);
std::string trace_event_to_string(trace_event_t const &event);
std::string trace_event_to_json(trace_event_t const &event);

namespace tui {
extern bool g_trace_enabled;
void trace(trace_event_t event);

inline bool trace_enabled() { return g_trace_enabled; }
}  // namespace tui

}  // namespace dbuild

#define DBUILD_TRACE_UNLIKELY [[unlikely]]

#define DBUILD_TRACE_EMIT(event_expr) \
  do { \
    if (::dbuild::tui::g_trace_enabled) DBUILD_TRACE_UNLIKELY { \
        ::dbuild::tui::trace event_expr; \
      } \
  } while (0)

#define DBUILD_TRACE_EXTRACTION_CACHE_HIT(project_value, fingerprint_value) \
  DBUILD_TRACE_EMIT((::dbuild::trace_events::extraction_cache_hit{ \
      .project = (project_value), \
      .fingerprint = (fingerprint_value), \
  }))

#define DBUILD_TRACE_EXTRACTION_CACHE_MISS(project_value, fingerprint_value) \
  DBUILD_TRACE_EMIT((::dbuild::trace_events::extraction_cache_miss{ \
      .project = (project_value), \
      .fingerprint = (fingerprint_value), \
  }))

#define DBUILD_TRACE_BUILD_CACHE_HIT(project_value, uuid_value, from_repository_value) \
  DBUILD_TRACE_EMIT((::dbuild::trace_events::build_cache_hit{ \
      .project = (project_value), \
      .uuid = (uuid_value), \
      .from_repository = (from_repository_value), \
  }))

#define DBUILD_TRACE_BUILD_CACHE_MISS(project_value, uuid_value) \
  DBUILD_TRACE_EMIT((::dbuild::trace_events::build_cache_miss{ \
      .project = (project_value), \
      .uuid = (uuid_value), \
  }))

#define DBUILD_TRACE_BUILD_START(project_value, uuid_value) \
  DBUILD_TRACE_EMIT((::dbuild::trace_events::build_start{ \
      .project = (project_value), \
      .uuid = (uuid_value), \
  }))

#define DBUILD_TRACE_BUILD_COMPLETE(project_value, uuid_value, good_value, duration_value) \
  DBUILD_TRACE_EMIT((::dbuild::trace_events::build_complete{ \
      .project = (project_value), \
      .uuid = (uuid_value), \
      .good = (good_value), \
      .duration_ms = (duration_value), \
  }))

#define DBUILD_TRACE_PART_START(assemble_value, part_value) \
  DBUILD_TRACE_EMIT((::dbuild::trace_events::part_start{ \
      .assemble = (assemble_value), \
      .part = (part_value), \
  }))

#define DBUILD_TRACE_ARTIFACT_RENAMED(from_value, to_value) \
  DBUILD_TRACE_EMIT((::dbuild::trace_events::artifact_renamed{ \
      .from = (from_value), \
      .to = (to_value), \
  }))

#define DBUILD_TRACE_DESCRIPTOR_REWRITTEN(path_value, kind_value, changed_value) \
  DBUILD_TRACE_EMIT((::dbuild::trace_events::descriptor_rewritten{ \
      .path = (path_value), \
      .kind = (kind_value), \
      .changed = (changed_value), \
  }))

#define DBUILD_TRACE_REPOSITORY_PUBLISH(uuid_value, files_value) \
  DBUILD_TRACE_EMIT((::dbuild::trace_events::repository_publish{ \
      .uuid = (uuid_value), \
      .files = (files_value), \
  }))

#define DBUILD_TRACE_REPOSITORY_RETRIEVE(uuid_value, files_value) \
  DBUILD_TRACE_EMIT((::dbuild::trace_events::repository_retrieve{ \
      .uuid = (uuid_value), \
      .files = (files_value), \
  }))

#define DBUILD_TRACE_PROJECT_BLOCKED(project_value, dependency_value) \
  DBUILD_TRACE_EMIT((::dbuild::trace_events::project_blocked{ \
      .project = (project_value), \
      .dependency = (dependency_value), \
  }))

#define DBUILD_TRACE_SHELL_COMPLETE(project_value, exit_code_value, duration_value) \
  DBUILD_TRACE_EMIT((::dbuild::trace_events::shell_complete{ \
      .project = (project_value), \
      .exit_code = (exit_code_value), \
      .duration_ms = (duration_value), \
  }))
