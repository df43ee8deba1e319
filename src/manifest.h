#pragma once

#include "model.h"
#include "notifications.h"
#include "orchestrator.h"
#include "sol_util.h"
#include "util.h"

#include <filesystem>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace dbuild {

class manifest_decoder;

// Decodes a project's `extra` table for one build system kind
using extra_decoder = std::function<backend_extra(sol::table const &extra,
                                                  std::string const &context,
                                                  manifest_decoder const &decoder)>;

// Turns the Lua tables of a manifest into configuration structures. `extra` payloads
// are decoded by the decoder registered for the project's `system`.
class manifest_decoder : unmovable {
 public:
  manifest_decoder();  // with `command` and `assemble`

  void add(std::string system, extra_decoder decoder);

  // `caller_keys` are further keys accepted in `table` that the caller decodes itself
  project_config project(sol::table const &table,
                         std::string const &context,
                         std::vector<std::string_view> const &caller_keys = {}) const;
  notification_config notification(sol::table const &table,
                                   std::string const &context) const;
  build_options options(sol::table const &table, std::string const &context = "OPTIONS") const;
  notification_options notifications(sol::table const &table) const;

 private:
  std::map<std::string, extra_decoder, std::less<>> decoders_;
};

// "organization#name"; throws configuration_error otherwise
module_id manifest_parse_module_id(std::string_view text, std::string_view context);

// A dbuild.lua script defining PROJECTS, and optionally OPTIONS and NOTIFICATIONS
struct manifest : unmovable {
  std::filesystem::path manifest_path;
  build_config build;
  notification_options notifications;

  manifest() = default;

  // Find manifest path: use provided path if given, otherwise discover from current
  // directory. Returns absolute path or throws if not found
  static std::filesystem::path find_manifest_path(
      std::optional<std::filesystem::path> const &explicit_path);

  // Searches `start` and its parents for dbuild.lua, stopping at a git work tree root
  static std::optional<std::filesystem::path> discover(
      std::filesystem::path const &start = std::filesystem::current_path());

  static std::unique_ptr<manifest> load(std::filesystem::path const &manifest_path);
  static std::unique_ptr<manifest> load(std::string_view script,
                                        std::filesystem::path const &manifest_path);
};

}  // namespace dbuild
