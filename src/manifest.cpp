#include "manifest.h"

#include "errors.h"
#include "tui.h"

#include <stdexcept>

namespace dbuild {

namespace {

constexpr char const *kManifestName{ "dbuild.lua" };

void install_manifest_globals(sol::state &lua) {
#if defined(__APPLE__) && defined(__MACH__)
  lua["DBUILD_PLATFORM"] = "darwin";
#elif defined(__linux__)
  lua["DBUILD_PLATFORM"] = "linux";
#else
  lua["DBUILD_PLATFORM"] = "unknown";
#endif

  auto dbuild_table{ lua.create_table() };
  dbuild_table["debug"] = [](std::string const &msg) { tui::debug("%s", msg.c_str()); };
  dbuild_table["info"] = [](std::string const &msg) { tui::info("%s", msg.c_str()); };
  dbuild_table["warn"] = [](std::string const &msg) { tui::warn("%s", msg.c_str()); };
  dbuild_table["error"] = [](std::string const &msg) { tui::error("%s", msg.c_str()); };
  lua["dbuild"] = dbuild_table;
}

std::vector<module_id> module_id_list(sol::table const &table,
                                      std::string_view key,
                                      std::string const &context) {
  std::vector<module_id> out;
  for (auto const &text : sol_util_get_string_list(table, key, context)) {
    out.push_back(manifest_parse_module_id(text, context));
  }
  return out;
}

artifact_ref decode_artifact(sol::table const &table, std::string const &context) {
  sol_util_check_keys(table, { "ext", "classifier" }, context);
  return { .extension = sol_util_get_or_default<std::string>(table, "ext", "jar", context),
           .classifier =
               sol_util_get_or_default<std::string>(table, "classifier", "", context) };
}

module_descriptor decode_module(sol::table const &table, std::string const &context) {
  sol_util_check_keys(table,
                      { "name", "organization", "artifacts", "dependencies" },
                      context);

  module_descriptor m{
    .name = sol_util_get_required<std::string>(table, "name", context),
    .organization = sol_util_get_required<std::string>(table, "organization", context),
    .artifacts = {},
    .dependencies = module_id_list(table, "dependencies", context),
  };

  auto const module_context{ context + " module " + m.name };
  if (!sol_util_get_optional<sol::table>(table, "artifacts", module_context)) {
    m.artifacts.push_back({});
  }
  for (auto const &a : sol_util_get_table_list(table, "artifacts", module_context)) {
    m.artifacts.push_back(decode_artifact(a, module_context));
  }
  return m;
}

backend_extra decode_command(sol::table const &extra,
                             std::string const &context,
                             manifest_decoder const &) {
  sol_util_check_keys(extra,
                      { "version", "directory", "build", "modules", "exclude" },
                      context);

  command_extra out{
    .version = sol_util_get_or_default<std::string>(extra, "version", "", context),
    .directory = sol_util_get_or_default<std::string>(extra, "directory", "", context),
    .build = sol_util_get_required<std::string>(extra, "build", context),
    .modules = {},
    .exclude = sol_util_get_string_list(extra, "exclude", context),
  };
  for (auto const &m : sol_util_get_table_list(extra, "modules", context)) {
    out.modules.push_back(decode_module(m, context));
  }
  return out;
}

core_module_rule decode_core_rule(sol::table const &table, std::string const &context) {
  sol_util_check_keys(table, { "organization", "prefix", "version_module", "also" }, context);

  core_module_rule const defaults;
  core_module_rule rule{
    .organization = sol_util_get_or_default<std::string>(table,
                                                         "organization",
                                                         defaults.organization,
                                                         context),
    .name_prefix =
        sol_util_get_or_default<std::string>(table, "prefix", defaults.name_prefix, context),
    .version_module = sol_util_get_or_default<std::string>(table,
                                                           "version_module",
                                                           defaults.version_module,
                                                           context),
    .also = defaults.also,
  };
  if (sol_util_get_optional<sol::object>(table, "also", context)) {
    rule.also = module_id_list(table, "also", context);
  }
  return rule;
}

backend_extra decode_assemble(sol::table const &extra,
                              std::string const &context,
                              manifest_decoder const &decoder) {
  sol_util_check_keys(extra, { "parts", "core" }, context);

  assemble_extra out;
  auto const parts{ sol_util_get_table_list(extra, "parts", context) };
  if (parts.empty()) { throw configuration_error(context + ": parts is required"); }
  for (std::size_t i{ 0 }; i < parts.size(); ++i) {
    auto const part_context{ context + " part " + std::to_string(i + 1) };
    out.parts.push_back(decoder.project(parts[i], part_context, { "options" }));
    if (auto const options{
            sol_util_get_optional<sol::table>(parts[i], "options", part_context) }) {
      out.part_options[out.parts.back().name] =
          decoder.options(*options, part_context + " options");
    }
  }
  if (auto const core{ sol_util_get_optional<sol::table>(extra, "core", context) }) {
    out.core = decode_core_rule(*core, context + " core");
  }
  return out;
}

}  // namespace

module_id manifest_parse_module_id(std::string_view text, std::string_view context) {
  auto const hash{ text.find('#') };
  if (hash == std::string_view::npos || hash == 0 || hash + 1 == text.size() ||
      text.find('#', hash + 1) != std::string_view::npos) {
    throw configuration_error(std::string{ context } + ": '" + std::string{ text } +
                              "' is not of the form organization#name");
  }
  return { std::string{ text.substr(0, hash) }, std::string{ text.substr(hash + 1) } };
}

manifest_decoder::manifest_decoder() {
  add("command", decode_command);
  add("assemble", decode_assemble);
}

void manifest_decoder::add(std::string system, extra_decoder decoder) {
  decoders_[std::move(system)] = std::move(decoder);
}

project_config manifest_decoder::project(
    sol::table const &table,
    std::string const &context,
    std::vector<std::string_view> const &caller_keys) const {
  auto const name{ sol_util_get_required<std::string>(table, "name", context) };
  auto const project_context{ "project " + name };
  std::vector<std::string_view> allowed{ "name",  "system",       "uri", "set_version",
                                         "extra", "notifications" };
  allowed.insert(allowed.end(), caller_keys.begin(), caller_keys.end());
  sol_util_check_keys(table, allowed, project_context);

  project_config config{
    .name = name,
    .system = sol_util_get_or_default<std::string>(table,
                                                   "system",
                                                   project_config::kDefaultSystem,
                                                   project_context),
    .uri = {},
    .set_version = sol_util_get_optional<std::string>(table, "set_version", project_context),
    .extra = {},
    .notifications = {},
  };

  // Assemble projects carry no sources of their own
  config.uri = sol_util_get_or_default<std::string>(table,
                                                    "uri",
                                                    config.system == "assemble" ? "nil:" : "",
                                                    project_context);
  if (config.uri.empty()) { throw configuration_error(project_context + ": uri is required"); }

  auto const it{ decoders_.find(config.system) };
  if (it == decoders_.end()) {
    throw configuration_error(project_context + ": unknown build system '" + config.system +
                              "'");
  }
  auto const extra{ sol_util_get_optional<sol::table>(table, "extra", project_context) };
  sol::state_view lua{ table.lua_state() };
  config.extra = it->second(extra ? *extra : lua.create_table(), project_context, *this);

  for (auto const &n : sol_util_get_table_list(table, "notifications", project_context)) {
    config.notifications.push_back(notification(n, project_context));
  }
  return config;
}

notification_config manifest_decoder::notification(sol::table const &table,
                                                   std::string const &context) const {
  auto const notification_context{ context + " notification" };
  sol_util_check_keys(table, { "kind", "send", "when", "template" }, notification_context);

  notification_config n{
    .kind = sol_util_get_required<std::string>(table, "kind", notification_context),
    .send = sol_util_get_or_default<std::string>(table, "send", "", notification_context),
    .when = sol_util_get_string_list(table, "when", notification_context),
    .template_id = sol_util_get_optional<std::string>(table, "template", notification_context),
  };
  if (n.when.empty()) { n.when = notification_config{}.when; }
  return n;
}

build_options manifest_decoder::options(sol::table const &table,
                                        std::string const &context) const {
  sol_util_check_keys(table, { "cross_version" }, context);
  return { .cross_version = sol_util_get_or_default<std::string>(
               table,
               "cross_version",
               build_options::kDefaultCrossVersion,
               context) };
}

notification_options manifest_decoder::notifications(sol::table const &table) const {
  sol_util_check_keys(table, { "templates", "notifications" }, "NOTIFICATIONS");

  notification_options out;
  for (auto const &t : sol_util_get_table_list(table, "templates", "NOTIFICATIONS")) {
    std::string const context{ "NOTIFICATIONS template" };
    sol_util_check_keys(t, { "id", "summary", "short", "long" }, context);
    out.templates.push_back(
        { .id = sol_util_get_required<std::string>(t, "id", context),
          .summary = sol_util_get_required<std::string>(t, "summary", context),
          .short_text = sol_util_get_optional<std::string>(t, "short", context),
          .long_text = sol_util_get_optional<std::string>(t, "long", context) });
  }
  for (auto const &n : sol_util_get_table_list(table, "notifications", "NOTIFICATIONS")) {
    out.notifications.push_back(notification(n, "NOTIFICATIONS"));
  }
  return out;
}

std::optional<std::filesystem::path> manifest::discover(std::filesystem::path const &start) {
  namespace fs = std::filesystem;

  auto cur{ fs::absolute(start) };

  for (;;) {
    auto const manifest_path{ cur / kManifestName };
    if (fs::exists(manifest_path)) { return manifest_path; }

    auto const git_path{ cur / ".git" };
    if (fs::exists(git_path) && fs::is_directory(git_path)) { return std::nullopt; }

    auto const parent{ cur.parent_path() };
    if (parent == cur) { return std::nullopt; }

    cur = parent;
  }
}

std::filesystem::path manifest::find_manifest_path(
    std::optional<std::filesystem::path> const &explicit_path) {
  if (explicit_path) {
    auto const path{ std::filesystem::absolute(*explicit_path) };
    if (!std::filesystem::exists(path)) {
      throw std::runtime_error("manifest not found: " + path.string());
    }
    return path;
  } else {
    if (auto const discovered{ discover() }) { return *discovered; }
    throw std::runtime_error("manifest not found (no dbuild.lua in this directory or its "
                             "parents)");
  }
}

std::unique_ptr<manifest> manifest::load(std::filesystem::path const &manifest_path) {
  tui::debug("Loading manifest from file: %s", manifest_path.string().c_str());
  return load(util_load_text_file(manifest_path), manifest_path);
}

std::unique_ptr<manifest> manifest::load(std::string_view script,
                                         std::filesystem::path const &manifest_path) {
  auto state{ sol_util_make_lua_state() };
  install_manifest_globals(*state);

  if (sol::protected_function_result const result{
          state->safe_script(script, sol::script_pass_on_error, manifest_path.string()) };
      !result.valid()) {
    sol::error err = result;
    throw configuration_error(std::string("Failed to execute manifest script: ") +
                              err.what());
  }

  sol::table globals{ state->globals() };
  auto const projects{ sol_util_get_optional<sol::table>(globals, "PROJECTS", "manifest") };
  if (!projects) {
    throw configuration_error("Manifest must define 'PROJECTS' global as a table");
  }

  manifest_decoder const decoder;
  auto m{ std::make_unique<manifest>() };
  m->manifest_path = manifest_path;

  for (auto const &p : sol_util_get_table_list(globals, "PROJECTS", "manifest")) {
    m->build.projects.push_back(
        decoder.project(p, "PROJECTS entry " + std::to_string(m->build.projects.size() + 1)));
  }
  if (auto const options{ sol_util_get_optional<sol::table>(globals, "OPTIONS", "manifest") }) {
    m->build.options = decoder.options(*options);
  }
  if (auto const notifications{
          sol_util_get_optional<sol::table>(globals, "NOTIFICATIONS", "manifest") }) {
    m->notifications = decoder.notifications(*notifications);
  }

  tui::debug("Manifest %s declares %zu projects",
             manifest_path.string().c_str(),
             m->build.projects.size());
  return m;
}

}  // namespace dbuild
