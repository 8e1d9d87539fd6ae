//  AirCast - Local Network Audio Streaming
//  Copyright (C) 2022  Tim Hughey
//
//  This program is free software: you can redistribute it and/or modify
//  it under the terms of the GNU General Public License as published by
//  the Free Software Foundation, either version 3 of the License, or
//  (at your option) any later version.
//
//  This program is distributed in the hope that it will be useful,
//  but WITHOUT ANY WARRANTY; without even the implied warranty of
//  MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
//  GNU General Public License for more details.
//
//  You should have received a copy of the GNU General Public License
//  along with this program.  If not, see <http://www.gnu.org/licenses/>.
//
//  https://www.wisslanding.com

#pragma once

#include "base/conf/toml.hpp"
#include "base/dura_t.hpp"
#include "base/types.hpp"

#include <chrono>
#include <concepts>
#include <fmt/format.h>
#include <type_traits>
#include <utility>

namespace aircast {
namespace conf {

/// @brief Read only view of a single configuration root (e.g. "mdns.browser").
///        The subtable is copied at construction so lookups never touch
///        the master configuration.
class token {
  friend struct fmt::formatter<token>;

public:
  /// @brief Create a default token (does not point to a configuration)
  token() = default;

  /// @brief Create config token populated with the subtable at root
  ///        of the master configuration
  /// @param mid module_id (aka root)
  token(csv mid) noexcept;

  /// @brief Create config token populated with the subtable at root
  ///        of an explicit table
  /// @param mid module_id (aka root)
  /// @param src table to copy from
  token(csv mid, const toml::table &src) noexcept;

  /// @brief Is the configuration provided by this token empty?
  /// @return boolean
  bool empty() const noexcept { return ttable.empty(); }

  /// @brief Direct access to configuration table managed by token
  ///        Use with caution for access to configuration not handled
  ///        by member functions (e.g. arrays)
  /// @return reference to the root subtable
  const toml::table &table() const noexcept { return ttable; }

  /// @brief Retrieve configuration value located at path
  /// @tparam T Desired type of the returned value
  /// @param p Path to value, excluding root (a.k.a. module_id)
  /// @param def_val Default value if no value found at specified path
  ///                Default value is converted to T
  /// @return value of type T at specified path or provided default value
  ///         (also when an integral value is out of range for T)
  template <typename T, typename D> T val(csv p, D &&def_val) const noexcept {
    const auto node = ttable.at_path(p);

    if constexpr (IsDuration<T>) {
      if constexpr (IsDuration<D>) {
        const auto def_count = std::chrono::duration_cast<T>(def_val).count();
        return T(node.value_or(static_cast<int64_t>(def_count)));
      } else {
        return T(node.value_or(static_cast<int64_t>(def_val)));
      }
    } else if constexpr (std::same_as<T, string>) {
      return node.value_or(string(def_val));
    } else if constexpr (std::same_as<T, bool>) {
      return node.value_or(static_cast<bool>(def_val));
    } else if constexpr (std::integral<T>) {
      const auto v = node.value_or(static_cast<int64_t>(def_val));

      // a value T can not hold is rejected in favor of the default
      return std::in_range<T>(v) ? static_cast<T>(v) : static_cast<T>(def_val);
    } else if constexpr (std::floating_point<T>) {
      return static_cast<T>(node.value_or(static_cast<double>(def_val)));
    } else {
      static_assert(AlwaysFalse<T>, "unsupported type");
    }
  }

protected:
  string root;
  toml::table ttable;

public:
  MOD_ID("conf.token");
};

} // namespace conf
} // namespace aircast

template <> struct fmt::formatter<aircast::conf::token> : formatter<std::string_view> {

  template <typename FormatContext>
  auto format(const aircast::conf::token &tok, FormatContext &ctx) const {
    std::string msg;
    auto w = std::back_inserter(msg);

    fmt::format_to(w, "root={}", tok.root);

    if (tok.empty()) {
      fmt::format_to(w, " **ROOT NOT FOUND**");
    } else {
      fmt::format_to(w, " size={}", tok.ttable.size());
    }

    return formatter<std::string_view>::format(msg, ctx);
  }
};
