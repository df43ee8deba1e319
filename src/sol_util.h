#pragma once

#include "errors.h"

#include "sol/sol.hpp"

#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <type_traits>
#include <vector>

namespace dbuild {

using sol_state_ptr = std::unique_ptr<sol::state>;
sol_state_ptr sol_util_make_lua_state();  // base, string, table, math, os

namespace detail {

template <typename T>
constexpr std::string_view type_name_for_error() {
  if constexpr (std::is_same_v<T, bool>) {
    return "boolean";
  } else if constexpr (std::is_same_v<T, std::string>) {
    return "string";
  } else if constexpr (std::is_same_v<T, sol::table>) {
    return "table";
  } else if constexpr (std::is_integral_v<T> || std::is_floating_point_v<T>) {
    return "number";
  } else {
    return "value";
  }
}

[[noreturn]] inline void sol_util_type_error(std::string_view context,
                                             std::string_view key,
                                             std::string_view type) {
  throw configuration_error(std::string{ context } + ": " + std::string{ key } +
                            " must be a " + std::string{ type });
}

}  // namespace detail

// Missing and nil keys yield nullopt; a value of another type throws configuration_error.
template <typename T>
std::optional<T> sol_util_get_optional(sol::table const &table,
                                       std::string_view key,
                                       std::string_view context) {
  sol::optional<sol::object> obj = table[key];
  if (!obj || !obj->valid() || obj->get_type() == sol::type::lua_nil) {
    return std::nullopt;
  }

  // Lua numbers convert to strings silently; manifests must say what they mean
  if constexpr (std::is_same_v<T, std::string>) {
    if (obj->get_type() != sol::type::string) {
      detail::sol_util_type_error(context, key, detail::type_name_for_error<T>());
    }
  }
  if (!obj->is<T>()) {
    detail::sol_util_type_error(context, key, detail::type_name_for_error<T>());
  }

  return obj->as<T>();
}

template <typename T>
T sol_util_get_required(sol::table const &table,
                        std::string_view key,
                        std::string_view context) {
  auto value{ sol_util_get_optional<T>(table, key, context) };
  if (!value) {
    throw configuration_error(std::string{ context } + ": " + std::string{ key } +
                              " is required");
  }
  return std::move(*value);
}

template <typename T>
T sol_util_get_or_default(sol::table const &table,
                          std::string_view key,
                          T const &default_value,
                          std::string_view context) {
  auto opt{ sol_util_get_optional<T>(table, key, context) };
  return opt.value_or(default_value);
}

// A string or an array of strings; missing keys yield an empty list.
std::vector<std::string> sol_util_get_string_list(sol::table const &table,
                                                  std::string_view key,
                                                  std::string_view context);

// Array part of `table[key]` as tables; missing keys yield an empty list.
std::vector<sol::table> sol_util_get_table_list(sol::table const &table,
                                                std::string_view key,
                                                std::string_view context);

// Throws configuration_error naming the first string key outside `allowed`.
void sol_util_check_keys(sol::table const &table,
                         std::vector<std::string_view> const &allowed,
                         std::string_view context);

}  // namespace dbuild
