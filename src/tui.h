#pragma once

#include "trace.h"

#include <filesystem>
#include <functional>
#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#if defined(__clang__) || defined(__GNUC__)
#define DBUILD_TUI_PRINTF(idx, first) __attribute__((format(printf, idx, first)))
#else
#define DBUILD_TUI_PRINTF(idx, first)
#endif

namespace dbuild::tui {

enum class level { TUI_TRACE, TUI_DEBUG, TUI_INFO, TUI_WARN, TUI_ERROR };

enum class trace_output_type { std_err, file };

struct trace_output_spec {
  trace_output_type type;
  std::optional<std::filesystem::path> file_path;
};

void init();
void configure_trace_outputs(std::vector<trace_output_spec> outputs);
void set_output_handler(std::function<void(std::string_view)> handler);
void run(std::optional<level> threshold = std::nullopt, bool decorated_logging = false);
void shutdown();

extern bool g_trace_enabled;

void trace(trace_event_t event);
void debug(char const *fmt, ...) DBUILD_TUI_PRINTF(1, 2);
void info(char const *fmt, ...) DBUILD_TUI_PRINTF(1, 2);
void warn(char const *fmt, ...) DBUILD_TUI_PRINTF(1, 2);
void error(char const *fmt, ...) DBUILD_TUI_PRINTF(1, 2);

void print_stdout(char const *fmt, ...) DBUILD_TUI_PRINTF(1, 2);

bool is_tty();

// Warnings and errors logged since the last run().
std::size_t warning_count();
std::size_t error_count();

// Prefixes "[tag] " to every message logged from the current thread while alive.
// Parallel project builds use it to keep interleaved output attributable.
struct tag_scope {
  explicit tag_scope(std::string tag);
  ~tag_scope();

  tag_scope(tag_scope const &) = delete;
  tag_scope &operator=(tag_scope const &) = delete;

 private:
  std::string previous;
};

struct scope {  // raii helper
  explicit scope(std::optional<level> threshold, bool decorated_logging);
  ~scope();

 private:
  bool active{ false };
};

}  // namespace dbuild::tui

#undef DBUILD_TUI_PRINTF
