#include "sol_util.h"

#include <algorithm>

namespace dbuild {

sol_state_ptr sol_util_make_lua_state() {
  auto lua{ std::make_unique<sol::state>() };
  lua->open_libraries(sol::lib::base,
                      sol::lib::string,
                      sol::lib::table,
                      sol::lib::math,
                      sol::lib::os,
                      sol::lib::debug);

  // error() carries a traceback so manifest mistakes point at their line
  lua->script(R"lua(
do
  local orig_error = error
  _G.error = function(message, level)
    level = (level or 1) + 1
    return orig_error(debug.traceback(tostring(message), level), 0)
  end
end
)lua");

  return lua;
}

std::vector<std::string> sol_util_get_string_list(sol::table const &table,
                                                  std::string_view key,
                                                  std::string_view context) {
  sol::optional<sol::object> obj = table[key];
  if (!obj || !obj->valid() || obj->get_type() == sol::type::lua_nil) { return {}; }

  if (obj->get_type() == sol::type::string) { return { obj->as<std::string>() }; }
  if (obj->get_type() != sol::type::table) {
    detail::sol_util_type_error(context, key, "string or a list of strings");
  }

  std::vector<std::string> out;
  auto const list{ obj->as<sol::table>() };
  for (std::size_t i{ 1 }; i <= list.size(); ++i) {
    sol::object const item = list[i];
    if (item.get_type() != sol::type::string) {
      detail::sol_util_type_error(context, key, "list of strings");
    }
    out.push_back(item.as<std::string>());
  }
  return out;
}

std::vector<sol::table> sol_util_get_table_list(sol::table const &table,
                                                std::string_view key,
                                                std::string_view context) {
  auto const list{ sol_util_get_optional<sol::table>(table, key, context) };
  if (!list) { return {}; }

  std::vector<sol::table> out;
  for (std::size_t i{ 1 }; i <= list->size(); ++i) {
    sol::object const item = (*list)[i];
    if (item.get_type() != sol::type::table) {
      detail::sol_util_type_error(context, key, "list of tables");
    }
    out.push_back(item.as<sol::table>());
  }
  return out;
}

void sol_util_check_keys(sol::table const &table,
                         std::vector<std::string_view> const &allowed,
                         std::string_view context) {
  for (auto const &[k, v] : table) {
    if (k.get_type() != sol::type::string) { continue; }
    auto const key{ k.as<std::string>() };
    if (std::ranges::find(allowed, std::string_view{ key }) == allowed.end()) {
      throw configuration_error(std::string{ context } + ": unknown key '" + key + "'");
    }
  }
}

}  // namespace dbuild
