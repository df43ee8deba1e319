#include "trace.h"

#include "util.h"

#include <chrono>
#include <cstdint>
#include <cstdio>
#include <ctime>
#include <sstream>
#include <string>

namespace dbuild {

namespace {

std::string_view bool_string(bool value) { return value ? "true" : "false"; }

std::tm make_utc_tm(std::time_t time) {
  std::tm result{};
  gmtime_r(&time, &result);
  return result;
}

std::string format_timestamp(std::chrono::system_clock::time_point tp) {
  auto const seconds{ std::chrono::time_point_cast<std::chrono::seconds>(tp) };
  auto const millis{
    std::chrono::duration_cast<std::chrono::milliseconds>(tp - seconds).count()
  };

  std::time_t const timestamp{ std::chrono::system_clock::to_time_t(seconds) };
  std::tm const utc_tm{ make_utc_tm(timestamp) };

  char base[32]{};
  if (std::strftime(base, sizeof base, "%Y-%m-%dT%H:%M:%S", &utc_tm) == 0) { return {}; }

  char buffer[64]{};
  int const written{ std::snprintf(buffer,
                                   sizeof buffer,
                                   "%s.%03lldZ",
                                   base,
                                   static_cast<long long>(millis)) };
  if (written <= 0) { return {}; }

  return std::string{ buffer, static_cast<std::size_t>(written) };
}

void append_json_string(std::string &out, std::string_view value) {
  for (char const ch : value) {
    switch (ch) {
      case '\\': out.append("\\\\"); break;
      case '"': out.append("\\\""); break;
      case '\b': out.append("\\b"); break;
      case '\f': out.append("\\f"); break;
      case '\n': out.append("\\n"); break;
      case '\r': out.append("\\r"); break;
      case '\t': out.append("\\t"); break;
      default:
        if (static_cast<unsigned char>(ch) < 0x20) {
          char escape[7]{};
          std::snprintf(escape,
                        sizeof escape,
                        "\\u%04x",
                        static_cast<unsigned int>(static_cast<unsigned char>(ch)));
          out.append(escape);
        } else {
          out.push_back(ch);
        }
        break;
    }
  }
}

void append_kv(std::string &out, char const *key, std::string_view value) {
  out.push_back(',');
  out.push_back('"');
  out.append(key);
  out.append("\":\"");
  append_json_string(out, value);
  out.push_back('"');
}

void append_kv(std::string &out, char const *key, std::int64_t value) {
  out.push_back(',');
  out.push_back('"');
  out.append(key);
  out.append("\":");
  out.append(std::to_string(value));
}

void append_kv(std::string &out, char const *key, bool value) {
  out.push_back(',');
  out.push_back('"');
  out.append(key);
  out.append("\":");
  out.append(value ? "true" : "false");
}

}  // namespace

#define TRACE_NAME(type) \
  [](trace_events::type const &) -> std::string_view { return #type; }

std::string_view trace_event_name(trace_event_t const &event) {
  return std::visit(match{
                        TRACE_NAME(extraction_cache_hit),
                        TRACE_NAME(extraction_cache_miss),
                        TRACE_NAME(build_cache_hit),
                        TRACE_NAME(build_cache_miss),
                        TRACE_NAME(build_start),
                        TRACE_NAME(build_complete),
                        TRACE_NAME(part_start),
                        TRACE_NAME(artifact_renamed),
                        TRACE_NAME(descriptor_rewritten),
                        TRACE_NAME(repository_publish),
                        TRACE_NAME(repository_retrieve),
                        TRACE_NAME(project_blocked),
                        TRACE_NAME(shell_complete),
                    },
                    event);
}

#undef TRACE_NAME

std::string trace_event_to_string(trace_event_t const &event) {
  std::ostringstream oss;
  oss << trace_event_name(event);

  std::visit(match{
                 [&](trace_events::extraction_cache_hit const &value) {
                   oss << " project=" << value.project
                       << " fingerprint=" << value.fingerprint;
                 },
                 [&](trace_events::extraction_cache_miss const &value) {
                   oss << " project=" << value.project
                       << " fingerprint=" << value.fingerprint;
                 },
                 [&](trace_events::build_cache_hit const &value) {
                   oss << " project=" << value.project << " uuid=" << value.uuid
                       << " from_repository=" << bool_string(value.from_repository);
                 },
                 [&](trace_events::build_cache_miss const &value) {
                   oss << " project=" << value.project << " uuid=" << value.uuid;
                 },
                 [&](trace_events::build_start const &value) {
                   oss << " project=" << value.project << " uuid=" << value.uuid;
                 },
                 [&](trace_events::build_complete const &value) {
                   oss << " project=" << value.project << " uuid=" << value.uuid
                       << " good=" << bool_string(value.good)
                       << " duration_ms=" << value.duration_ms;
                 },
                 [&](trace_events::part_start const &value) {
                   oss << " assemble=" << value.assemble << " part=" << value.part;
                 },
                 [&](trace_events::artifact_renamed const &value) {
                   oss << " from=" << value.from << " to=" << value.to;
                 },
                 [&](trace_events::descriptor_rewritten const &value) {
                   oss << " path=" << value.path << " kind=" << value.kind
                       << " changed=" << bool_string(value.changed);
                 },
                 [&](trace_events::repository_publish const &value) {
                   oss << " uuid=" << value.uuid << " files=" << value.files;
                 },
                 [&](trace_events::repository_retrieve const &value) {
                   oss << " uuid=" << value.uuid << " files=" << value.files;
                 },
                 [&](trace_events::project_blocked const &value) {
                   oss << " project=" << value.project
                       << " dependency=" << value.dependency;
                 },
                 [&](trace_events::shell_complete const &value) {
                   oss << " project=" << value.project
                       << " exit_code=" << value.exit_code
                       << " duration_ms=" << value.duration_ms;
                 },
             },
             event);

  return oss.str();
}

std::string trace_event_to_json(trace_event_t const &event) {
  std::string output;
  output.reserve(256);

  output.append("{\"ts\":\"");
  output.append(format_timestamp(std::chrono::system_clock::now()));
  output.append("\",\"event\":\"");
  output.append(trace_event_name(event));
  output.push_back('"');

  std::visit(
      match{
          [&](trace_events::extraction_cache_hit const &value) {
            append_kv(output, "project", value.project);
            append_kv(output, "fingerprint", value.fingerprint);
          },
          [&](trace_events::extraction_cache_miss const &value) {
            append_kv(output, "project", value.project);
            append_kv(output, "fingerprint", value.fingerprint);
          },
          [&](trace_events::build_cache_hit const &value) {
            append_kv(output, "project", value.project);
            append_kv(output, "uuid", value.uuid);
            append_kv(output, "from_repository", value.from_repository);
          },
          [&](trace_events::build_cache_miss const &value) {
            append_kv(output, "project", value.project);
            append_kv(output, "uuid", value.uuid);
          },
          [&](trace_events::build_start const &value) {
            append_kv(output, "project", value.project);
            append_kv(output, "uuid", value.uuid);
          },
          [&](trace_events::build_complete const &value) {
            append_kv(output, "project", value.project);
            append_kv(output, "uuid", value.uuid);
            append_kv(output, "good", value.good);
            append_kv(output, "duration_ms", value.duration_ms);
          },
          [&](trace_events::part_start const &value) {
            append_kv(output, "assemble", value.assemble);
            append_kv(output, "part", value.part);
          },
          [&](trace_events::artifact_renamed const &value) {
            append_kv(output, "from", value.from);
            append_kv(output, "to", value.to);
          },
          [&](trace_events::descriptor_rewritten const &value) {
            append_kv(output, "path", value.path);
            append_kv(output, "kind", value.kind);
            append_kv(output, "changed", value.changed);
          },
          [&](trace_events::repository_publish const &value) {
            append_kv(output, "uuid", value.uuid);
            append_kv(output, "files", value.files);
          },
          [&](trace_events::repository_retrieve const &value) {
            append_kv(output, "uuid", value.uuid);
            append_kv(output, "files", value.files);
          },
          [&](trace_events::project_blocked const &value) {
            append_kv(output, "project", value.project);
            append_kv(output, "dependency", value.dependency);
          },
          [&](trace_events::shell_complete const &value) {
            append_kv(output, "project", value.project);
            append_kv(output, "exit_code", static_cast<std::int64_t>(value.exit_code));
            append_kv(output, "duration_ms", value.duration_ms);
          },
      },
      event);

  output.push_back('}');
  return output;
}

}  // namespace dbuild
